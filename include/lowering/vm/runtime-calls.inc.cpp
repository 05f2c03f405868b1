/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

RUNTIME_CALL(resolveClassActor)
RUNTIME_CALL(resolveClassObject)
RUNTIME_CALL(resolveHub)
RUNTIME_CALL(resolveStaticTuple)
RUNTIME_CALL(resolveNew)
RUNTIME_CALL(resolveNewArray)
RUNTIME_CALL(resolveGetField)
RUNTIME_CALL(resolvePutField)
RUNTIME_CALL(resolveGetStatic)
RUNTIME_CALL(resolvePutStatic)
RUNTIME_CALL(resolveStaticMethod)
RUNTIME_CALL(resolveSpecialMethod)
RUNTIME_CALL(resolveVirtualMethod)
RUNTIME_CALL(resolveInterfaceMethod)
RUNTIME_CALL(resolveInterfaceID)
RUNTIME_CALL(invokeHandle)
RUNTIME_CALL(linkToStatic)
RUNTIME_CALL(linkToSpecial)
RUNTIME_CALL(linkToVirtual)
RUNTIME_CALL(linkToInterface)
RUNTIME_CALL(allocatePrimitiveArray)
RUNTIME_CALL(allocateObjectArray)
RUNTIME_CALL(allocateObject)
RUNTIME_CALL(allocateHybrid)
RUNTIME_CALL(slowPathAllocate)
RUNTIME_CALL(callProfiler)
RUNTIME_CALL(callProfilerArray)
RUNTIME_CALL(flushLog)
RUNTIME_CALL(allocateIntArray)
RUNTIME_CALL(allocateMultiArray1)
RUNTIME_CALL(allocateMultiArray2)
RUNTIME_CALL(allocateMultiArray3)
RUNTIME_CALL(allocateMultiArrayN)
RUNTIME_CALL(allocateUnresolvedMultiArrayN)
RUNTIME_CALL(unresolvedCheckcast)
RUNTIME_CALL(unresolvedInstanceOf)
RUNTIME_CALL(arrayHubStoreCheck)
RUNTIME_CALL(throwClassCastException)
RUNTIME_CALL(throwArrayIndexOutOfBoundsException)
RUNTIME_CALL(throwNegativeArraySizeException)
RUNTIME_CALL(monitorEnter)
RUNTIME_CALL(monitorExit)
RUNTIME_CALL(loadException)
