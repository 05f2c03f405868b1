/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <lowering/vm/runtime.h>
#include <lowering/vm/guard.h>
#include <lowering/vm/arch.h>

using namespace lowering::util;

namespace {

namespace local {

const bool DebugAllocation = false;

}  // namespace local

}  // namespace

namespace lowering {
namespace vm {

namespace {

inline ResolutionGuard* asGuard(object guard)
{
  return static_cast<ResolutionGuard*>(guard);
}

inline uintptr_t& hubWord(Thread* t, object hub, unsigned index)
{
  return fieldAtOffset<uintptr_t>(hub, t->m->layout.hubWordOffset(index));
}

void incompatible(Thread* t, const char* what, const char* name)
{
  throwNew(t, Machine::IncompatibleClassChangeErrorType, 0, what, name);
}

Field* resolveInstanceField(Thread* t, object guard)
{
  Field* field = resolveField(t, asGuard(guard));
  if (field and field->isStatic) {
    incompatible(t, "expected instance field %s", field->name);
    return 0;
  }
  return field;
}

Field* resolveStaticField(Thread* t, object guard)
{
  Field* field = resolveField(t, asGuard(guard));
  if (field) {
    if (not field->isStatic) {
      incompatible(t, "expected static field %s", field->name);
      return 0;
    }
    initialize(t, field->holder);
  }
  return field;
}

Method* resolveInstanceMethod(Thread* t, object guard)
{
  Method* method = resolveMethod(t, asGuard(guard));
  if (method and method->isStatic()) {
    incompatible(t, "expected instance method %s", method->name);
    return 0;
  }
  return method;
}

Type* resolveArrayType(Thread* t, object guard)
{
  Type* type = resolveType(t, asGuard(guard));
  if (type and not type->isArray()) {
    incompatible(t, "%s is not an array type", type->name);
    return 0;
  }
  return type;
}

MemberName* checkMemberName(Thread* t, object memberName)
{
  if (memberName == 0) {
    throwNew(t, Machine::NullPointerExceptionType, 0, "member name");
  }
  return static_cast<MemberName*>(memberName);
}

uintptr_t interfaceEntry(Thread* t, object receiver, Method* method)
{
  object hub = hubOf(receiver);
  unsigned id = method->holder->id;

  unsigned length = hubWord(t, hub, HubMTableLength);
  unsigned start = hubWord(t, hub, HubMTableStartIndex);
  int32_t index = fieldAtOffset<int32_t>(
      hub, t->m->layout.firstElementOffset() + ((id % length) + start) * 4);

  if (hubWord(t, hub, index) != id) {
    incompatible(t,
                 "receiver does not implement %s",
                 method->holder->name);
    return 0;
  }
  return hubWord(t, hub, index + method->interfaceIndex);
}

object makeMultiArray(Thread* t,
                      Type* type,
                      const int32_t* lengths,
                      unsigned depth,
                      unsigned rank)
{
  object array = allocateArray(t, type, lengths[depth]);
  if (array == 0) {
    return 0;
  }

  Type* componentType = type->componentType;
  if (depth + 1 < rank and componentType and componentType->isArray()) {
    for (int32_t i = 0; i < lengths[depth]; ++i) {
      object element = makeMultiArray(t, componentType, lengths, depth + 1, rank);
      if (element == 0) {
        return 0;
      }
      arrayElement<object>(t, array, i) = element;
    }
  }

  return array;
}

object multiArray(Thread* t, Type* type, const int32_t* lengths, unsigned rank)
{
  for (unsigned i = 0; i < rank; ++i) {
    if (lengths[i] < 0) {
      throwNegativeArraySizeException(t, lengths[i]);
      return 0;
    }
  }

  return makeMultiArray(t, type, lengths, 0, rank);
}

void outOfMemory(Thread* t)
{
  t->exception = t->m->outOfMemoryError;
}

void notifyAllocation(Thread* t, int32_t size, object hub, uintptr_t cell)
{
  AllocationListener* listener = t->m->allocationListener;
  if (listener) {
    listener->allocated(
        t, reinterpret_cast<object>(cell), hubType(t, hub), size);
  }
}

}  // namespace

object resolveClassActor(Thread* t, object guard)
{
  return resolveType(t, asGuard(guard));
}

object resolveClassObject(Thread* t, object guard)
{
  Type* type = resolveType(t, asGuard(guard));
  return type ? type->mirror : 0;
}

object resolveHub(Thread* t, object guard)
{
  Type* type = resolveType(t, asGuard(guard));
  return type ? type->hub : 0;
}

object resolveStaticTuple(Thread* t, object guard)
{
  Type* type;
  if (asGuard(guard)->reference()->tag == Reference::FieldReference) {
    Field* field = resolveStaticField(t, guard);
    type = field ? field->holder : 0;
  } else {
    type = resolveType(t, asGuard(guard));
  }

  if (type == 0) {
    return 0;
  }

  initialize(t, type);
  return type->staticTuple;
}

object resolveNew(Thread* t, object guard)
{
  Type* type = resolveType(t, asGuard(guard));
  if (type == 0) {
    return 0;
  }

  if (type->isInterface() or type->isArray() or (type->flags & AbstractFlag)) {
    incompatible(t, "cannot instantiate %s", type->name);
    return 0;
  }

  initialize(t, type);
  return type->hub;
}

object resolveNewArray(Thread* t, object guard)
{
  Type* type = resolveArrayType(t, guard);
  return type ? type->hub : 0;
}

int32_t resolveGetField(Thread* t, object guard)
{
  Field* field = resolveInstanceField(t, guard);
  return field ? field->offset : 0;
}

int32_t resolvePutField(Thread* t, object guard)
{
  Field* field = resolveInstanceField(t, guard);
  return field ? field->offset : 0;
}

int32_t resolveGetStatic(Thread* t, object guard)
{
  Field* field = resolveStaticField(t, guard);
  return field ? field->offset : 0;
}

int32_t resolvePutStatic(Thread* t, object guard)
{
  Field* field = resolveStaticField(t, guard);
  return field ? field->offset : 0;
}

uintptr_t resolveStaticMethod(Thread* t, object guard)
{
  Method* method = resolveMethod(t, asGuard(guard));
  if (method == 0) {
    return 0;
  }

  if (not method->isStatic()) {
    incompatible(t, "expected static method %s", method->name);
    return 0;
  }

  initialize(t, method->holder);
  return method->entry;
}

uintptr_t resolveSpecialMethod(Thread* t, object guard)
{
  Method* method = resolveInstanceMethod(t, guard);
  return method ? method->entry : 0;
}

int32_t resolveVirtualMethod(Thread* t, object guard)
{
  Method* method = resolveInstanceMethod(t, guard);
  if (method == 0) {
    return 0;
  }

  if (method->vtableIndex < 0) {
    incompatible(t, "%s is not virtual", method->name);
    return 0;
  }

  return t->m->layout.vtableOffset(method->vtableIndex);
}

int32_t resolveInterfaceMethod(Thread* t, object guard)
{
  Method* method = resolveInstanceMethod(t, guard);
  return method ? method->interfaceIndex : 0;
}

int32_t resolveInterfaceID(Thread* t, object guard)
{
  Method* method = resolveInstanceMethod(t, guard);
  return method ? method->holder->id : 0;
}

uintptr_t invokeHandle(Thread* t, object method)
{
  MemberName* memberName = checkMemberName(t, method);
  return memberName ? memberName->target->entry : 0;
}

uintptr_t linkToStatic(Thread* t, object memberName)
{
  MemberName* name = checkMemberName(t, memberName);
  if (name == 0) {
    return 0;
  }

  if (not name->target->isStatic()) {
    incompatible(t, "expected static method %s", name->target->name);
    return 0;
  }
  return name->target->entry;
}

uintptr_t linkToSpecial(Thread* t, object memberName)
{
  MemberName* name = checkMemberName(t, memberName);
  return name ? name->target->entry : 0;
}

uintptr_t linkToVirtual(Thread* t, object memberName, object receiver)
{
  MemberName* name = checkMemberName(t, memberName);
  if (name == 0) {
    return 0;
  }

  if (receiver == 0) {
    throwNew(t, Machine::NullPointerExceptionType, 0, "receiver");
    return 0;
  }

  Method* method = name->target;
  if (method->vtableIndex < 0) {
    return method->entry;
  }

  return fieldAtOffset<uintptr_t>(
      hubOf(receiver), t->m->layout.vtableOffset(method->vtableIndex));
}

uintptr_t linkToInterface(Thread* t, object memberName, object receiver)
{
  MemberName* name = checkMemberName(t, memberName);
  if (name == 0) {
    return 0;
  }

  if (receiver == 0) {
    throwNew(t, Machine::NullPointerExceptionType, 0, "receiver");
    return 0;
  }

  return interfaceEntry(t, receiver, name->target);
}

object allocatePrimitiveArray(Thread* t, object hub, int32_t length)
{
  return allocateArray(t, hubType(t, hub), length);
}

object allocateObjectArray(Thread* t, object hub, int32_t length)
{
  return allocateArray(t, hubType(t, hub), length);
}

object allocateObject(Thread* t, object hub)
{
  return allocateTuple(t, hubType(t, hub));
}

object allocateHybrid(Thread* t, object hub)
{
  expect(t, hubType(t, hub)->isHybrid());
  return allocateTuple(t, hubType(t, hub));
}

uintptr_t slowPathAllocate(Thread* t, int32_t size, uintptr_t etla)
{
  uintptr_t* locals = reinterpret_cast<uintptr_t*>(etla);
  expect(t, locals == t->locals);

  if (static_cast<unsigned>(size) >= LargeObjectSizeInBytes) {
    void* cell = t->m->heap->allocateCell(size);
    if (cell == 0) {
      outOfMemory(t);
    }
    return reinterpret_cast<uintptr_t>(cell);
  }

  uintptr_t tlab = reinterpret_cast<uintptr_t>(
      t->m->heap->allocateCell(TlabSizeInBytes));
  if (tlab == 0) {
    outOfMemory(t);
    return 0;
  }

  if (local::DebugAllocation) {
    fprintf(stderr,
            "refill tlab at %p for %d bytes\n",
            reinterpret_cast<void*>(tlab),
            size);
  }

  locals[Thread::TlabMark] = tlab + size;
  locals[Thread::TlabTop] = tlab + TlabSizeInBytes;
  ++t->tlabRefills;

  return tlab;
}

void callProfiler(Thread* t, int32_t size, object hub, uintptr_t cell)
{
  notifyAllocation(t, size, hub, cell);
}

void callProfilerArray(Thread* t, int32_t size, object hub, uintptr_t cell)
{
  notifyAllocation(t, size, hub, cell);
}

uintptr_t flushLog(Thread* t, uintptr_t tail)
{
  uintptr_t start = reinterpret_cast<uintptr_t>(t->log);
  unsigned records = (tail - start) / (TlabLogRecordWords * BytesPerWord);

  atomicAdd(&(t->m->loggedAllocations), records);

  if (local::DebugAllocation) {
    fprintf(stderr, "flushed %u allocation records\n", records);
  }

  return start;
}

object allocateIntArray(Thread* t, int32_t length)
{
  return allocateArray(t, primitiveArrayType(t->m, codegen::IntKind), length);
}

object allocateMultiArray1(Thread* t, object hub, int32_t length1)
{
  int32_t lengths[] = {length1};
  return multiArray(t, hubType(t, hub), lengths, 1);
}

object allocateMultiArray2(Thread* t,
                           object hub,
                           int32_t length1,
                           int32_t length2)
{
  int32_t lengths[] = {length1, length2};
  return multiArray(t, hubType(t, hub), lengths, 2);
}

object allocateMultiArray3(Thread* t,
                           object hub,
                           int32_t length1,
                           int32_t length2,
                           int32_t length3)
{
  int32_t lengths[] = {length1, length2, length3};
  return multiArray(t, hubType(t, hub), lengths, 3);
}

object allocateMultiArrayN(Thread* t, object hub, object lengths)
{
  return multiArray(t,
                    hubType(t, hub),
                    &arrayElement<int32_t>(t, lengths, 0),
                    arrayLength(t, lengths));
}

object allocateUnresolvedMultiArrayN(Thread* t, object guard, object lengths)
{
  Type* type = resolveArrayType(t, guard);
  if (type == 0) {
    return 0;
  }

  return multiArray(
      t, type, &arrayElement<int32_t>(t, lengths, 0), arrayLength(t, lengths));
}

void unresolvedCheckcast(Thread* t, object o, object guard)
{
  if (o == 0) {
    return;
  }

  Type* type = resolveType(t, asGuard(guard));
  if (type and not isAssignableFrom(type, objectType(t, o))) {
    throwClassCastException(t, type->hub, o);
  }
}

bool unresolvedInstanceOf(Thread* t, object o, object guard)
{
  if (o == 0) {
    return false;
  }

  Type* type = resolveType(t, asGuard(guard));
  return type and isAssignableFrom(type, objectType(t, o));
}

void arrayHubStoreCheck(Thread* t, object componentHub, object valueHub)
{
  Type* valueType = hubType(t, valueHub);
  if (not isAssignableFrom(hubType(t, componentHub), valueType)) {
    throwNew(t, Machine::ArrayStoreExceptionType, 0, "%s", valueType->name);
  }
}

void throwClassCastException(Thread* t, object hub, object o)
{
  throwNew(t,
           Machine::ClassCastExceptionType,
           0,
           "%s cannot be cast to %s",
           objectType(t, o)->name,
           hubType(t, hub)->name);
}

void throwArrayIndexOutOfBoundsException(Thread* t,
                                         object array,
                                         int32_t index)
{
  throwNew(t,
           Machine::ArrayIndexOutOfBoundsExceptionType,
           index,
           "index %d, length %d",
           index,
           arrayLength(t, array));
}

void throwNegativeArraySizeException(Thread* t, int32_t length)
{
  throwNew(t, Machine::NegativeArraySizeExceptionType, length, "%d", length);
}

void monitorEnter(Thread* t, object o)
{
  if (o == 0) {
    throwNew(t, Machine::NullPointerExceptionType, 0, "monitor");
    return;
  }

  monitorAcquire(t, o);
}

void monitorExit(Thread* t, object o)
{
  if (o == 0) {
    throwNew(t, Machine::NullPointerExceptionType, 0, "monitor");
    return;
  }

  if (not monitorRelease(t, o)) {
    throwNew(t, Machine::IllegalMonitorStateExceptionType, 0, "not owner");
  }
}

object loadException(Thread* t)
{
  object e = t->caughtException;
  t->caughtException = 0;
  return e;
}

}  // namespace vm
}  // namespace lowering
