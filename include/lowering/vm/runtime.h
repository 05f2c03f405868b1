/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef LOWERING_VM_RUNTIME_H
#define LOWERING_VM_RUNTIME_H

#include <lowering/vm/machine.h>

// Native functions called from generated code.  Each one reports a
// failure by setting t->exception and returning a neutral value.
// Guards are passed as ResolutionGuard pointers and hubs as hub
// objects.

namespace lowering {
namespace vm {

object resolveClassActor(Thread* t, object guard);
object resolveClassObject(Thread* t, object guard);
object resolveHub(Thread* t, object guard);
object resolveStaticTuple(Thread* t, object guard);
object resolveNew(Thread* t, object guard);
object resolveNewArray(Thread* t, object guard);

int32_t resolveGetField(Thread* t, object guard);
int32_t resolvePutField(Thread* t, object guard);
int32_t resolveGetStatic(Thread* t, object guard);
int32_t resolvePutStatic(Thread* t, object guard);

uintptr_t resolveStaticMethod(Thread* t, object guard);
uintptr_t resolveSpecialMethod(Thread* t, object guard);
int32_t resolveVirtualMethod(Thread* t, object guard);
int32_t resolveInterfaceMethod(Thread* t, object guard);
int32_t resolveInterfaceID(Thread* t, object guard);

uintptr_t invokeHandle(Thread* t, object method);
uintptr_t linkToStatic(Thread* t, object memberName);
uintptr_t linkToSpecial(Thread* t, object memberName);
uintptr_t linkToVirtual(Thread* t, object memberName, object receiver);
uintptr_t linkToInterface(Thread* t, object memberName, object receiver);

object allocatePrimitiveArray(Thread* t, object hub, int32_t length);
object allocateObjectArray(Thread* t, object hub, int32_t length);
object allocateObject(Thread* t, object hub);
object allocateHybrid(Thread* t, object hub);

uintptr_t slowPathAllocate(Thread* t, int32_t size, uintptr_t etla);
void callProfiler(Thread* t, int32_t size, object hub, uintptr_t cell);
void callProfilerArray(Thread* t, int32_t size, object hub, uintptr_t cell);
uintptr_t flushLog(Thread* t, uintptr_t tail);

object allocateIntArray(Thread* t, int32_t length);
object allocateMultiArray1(Thread* t, object hub, int32_t length1);
object allocateMultiArray2(Thread* t,
                           object hub,
                           int32_t length1,
                           int32_t length2);
object allocateMultiArray3(Thread* t,
                           object hub,
                           int32_t length1,
                           int32_t length2,
                           int32_t length3);
object allocateMultiArrayN(Thread* t, object hub, object lengths);
object allocateUnresolvedMultiArrayN(Thread* t, object guard, object lengths);

void unresolvedCheckcast(Thread* t, object o, object guard);
bool unresolvedInstanceOf(Thread* t, object o, object guard);
void arrayHubStoreCheck(Thread* t, object componentHub, object valueHub);

void throwClassCastException(Thread* t, object hub, object o);
void throwArrayIndexOutOfBoundsException(Thread* t,
                                         object array,
                                         int32_t index);
void throwNegativeArraySizeException(Thread* t, int32_t length);

void monitorEnter(Thread* t, object o);
void monitorExit(Thread* t, object o);

object loadException(Thread* t);

}  // namespace vm
}  // namespace lowering

#endif  // LOWERING_VM_RUNTIME_H
