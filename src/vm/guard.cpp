/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <lowering/vm/guard.h>

using namespace lowering::util;

namespace {

namespace local {

const bool DebugResolution = false;

}  // namespace local

}  // namespace

namespace lowering {
namespace vm {

namespace {

const char* const tagNames[] = {"class", "field", "method", "interface method"};

Type* findReferencedType(Thread* t, Reference* reference)
{
  Type* type = findType(t->m, reference->className);
  if (type == 0) {
    throwNew(t,
             Machine::NoClassDefFoundErrorType,
             0,
             "%s",
             reference->className);
  }
  return type;
}

void* resolveReference(Thread* t, ResolutionGuard* guard)
{
  Reference* reference = guard->reference();

  Type* type = findReferencedType(t, reference);
  if (type == 0) {
    return 0;
  }

  switch (reference->tag) {
  case Reference::ClassReference:
    if (guard->target == ResolutionGuard::ComponentTarget) {
      return arrayTypeOf(t, type);
    }
    return type;

  case Reference::FieldReference: {
    Field* field = findField(type, reference->memberName);
    if (field == 0) {
      throwNew(t,
               Machine::NoSuchFieldErrorType,
               0,
               "%s.%s",
               reference->className,
               reference->memberName);
    }
    return field;
  }

  case Reference::MethodReference:
  case Reference::InterfaceMethodReference: {
    bool wantInterface = reference->tag == Reference::InterfaceMethodReference;
    if (type->isInterface() != wantInterface) {
      throwNew(t,
               Machine::IncompatibleClassChangeErrorType,
               0,
               "%s is %san interface",
               reference->className,
               wantInterface ? "not " : "");
      return 0;
    }

    Method* method = findMethod(type, reference->memberName);
    if (method == 0) {
      throwNew(t,
               Machine::NoSuchMethodErrorType,
               0,
               "%s.%s",
               reference->className,
               reference->memberName);
    }
    return method;
  }

  default:
    abort(t);
  }
}

}  // namespace

ConstantPool* makeConstantPool(Thread* t,
                               Type* holder,
                               util::Slice<Reference> references)
{
  Machine* m = t->m;
  ACQUIRE_LOCK(m->typeLock);

  Slice<ResolutionGuard*> guards
      = Slice<ResolutionGuard*>::alloc(&m->zone, references.count * 2);
  memset(guards.begin(), 0, guards.count * sizeof(ResolutionGuard*));

  return new (&m->zone)
      ConstantPool(holder, references.clone(&m->zone), guards);
}

ResolutionGuard* makeResolutionGuard(Thread* t,
                                     ConstantPool* pool,
                                     unsigned index,
                                     ResolutionGuard::Target target)
{
  expect(t, index < pool->references.count);
  expect(t,
         target == ResolutionGuard::DeclaredTarget
         or pool->references[index].tag == Reference::ClassReference);

  Machine* m = t->m;
  ACQUIRE_LOCK(m->typeLock);

  ResolutionGuard** slot = &pool->guards[index * 2 + target];
  if (*slot == 0) {
    *slot = new (&m->zone) ResolutionGuard(pool, index, target);
  }
  return *slot;
}

void* resolve(Thread* t, ResolutionGuard* guard)
{
  void* value = guard->value;
  loadMemoryBarrier();
  if (value) {
    return value;
  }

  ACQUIRE_LOCK(t->m->resolveLock);

  // another thread may have won the race
  value = guard->value;
  if (value) {
    return value;
  }

  value = resolveReference(t, guard);

  if (local::DebugResolution) {
    Reference* reference = guard->reference();
    fprintf(stderr,
            "resolve %s %s%s%s: %s\n",
            tagNames[reference->tag],
            reference->className,
            reference->memberName ? "." : "",
            reference->memberName ? reference->memberName : "",
            value ? "ok" : "failed");
  }

  if (value) {
    ++t->m->resolutions;
    storeStoreMemoryBarrier();
    guard->value = value;
  }

  return value;
}

}  // namespace vm
}  // namespace lowering
