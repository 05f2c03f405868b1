/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <stdio.h>

#include "test-harness.h"
#include "env.h"

using namespace lowering::vm;
using namespace lowering::util;
using namespace lowering::codegen;

namespace {

class CountingListener : public AllocationListener {
 public:
  CountingListener() : count(0), last(0), lastType(0)
  {
  }

  virtual void allocated(Thread*, object o, Type* type, unsigned)
  {
    ++count;
    last = o;
    lastType = type;
  }

  unsigned count;
  object last;
  Type* lastType;
};

Type* definePoint(MachineEnv* env)
{
  FieldSpec fields[] = {FieldSpec("x", IntKind), FieldSpec("y", IntKind)};
  return env->define("Point", 0, Slice<FieldSpec>(fields));
}

}  // namespace

TEST(AllocationTlab)
{
  CodegenEnv env;
  Type* point = definePoint(&env);

  Snippet* s = env.generator.genNewInstance(&env.c, TypeRef::resolved(point));
  assertEqual("new", s->template_->name);

  object first = env.runObject(s);
  assertTrue(first != 0);
  assertTrue(env.heap->contains(first));
  assertTrue(objectType(env.t, first) == point);
  assertEqual<unsigned>(1, env.t->tlabRefills);

  // later allocations bump the same buffer
  object second = env.runObject(s);
  assertTrue(objectType(env.t, second) == point);
  assertEqual<uintptr_t>(reinterpret_cast<uintptr_t>(first) + point->tupleSize,
                         reinterpret_cast<uintptr_t>(second));
  assertEqual<unsigned>(1, env.t->tlabRefills);
  assertEqual<uintptr_t>(reinterpret_cast<uintptr_t>(second) + point->tupleSize,
                         env.t->locals[Thread::TlabMark]);

  unsigned count = TlabSizeInBytes / point->tupleSize;
  for (unsigned i = 0; i < count; ++i) {
    assertTrue(env.runObject(s) != 0);
  }
  assertEqual<unsigned>(2, env.t->tlabRefills);
}

TEST(AllocationThroughRuntime)
{
  CodegenEnv env("tagging");
  Type* point = definePoint(&env);

  unsigned runtimeCalls = env.evaluator.runtimeCalls;
  object o = env.runObject(
      env.generator.genNewInstance(&env.c, TypeRef::resolved(point)));
  assertTrue(o != 0);
  assertTrue(objectType(env.t, o) == point);
  assertEqual<unsigned>(runtimeCalls + 1, env.evaluator.runtimeCalls);
  assertEqual<unsigned>(0, env.t->tlabRefills);

  o = env.runObject(env.generator.genNewArray(&env.c,
                                              CharKind,
                                              Argument::forInt(3),
                                              TypeRef::resolved(0)));
  assertTrue(objectType(env.t, o) == primitiveArrayType(env.m, CharKind));
  assertEqual<int32_t>(3, arrayLength(env.t, o));
}

TEST(AllocationUnresolvedInstance)
{
  CodegenEnv env;
  Type* point = definePoint(&env);
  env.define("Shape", 0, Slice<FieldSpec>(), Slice<MethodSpec>(), AbstractFlag);

  Reference references[] = {Reference(Reference::ClassReference, "Point"),
                            Reference(Reference::ClassReference, "Shape"),
                            Reference(Reference::ClassReference, "Nowhere")};
  ConstantPool* pool
      = makeConstantPool(env.t, point, Slice<Reference>(references));

  Snippet* s = env.generator.genNewInstance(
      &env.c, TypeRef::unresolved(makeResolutionGuard(env.t, pool, 0)));
  assertEqual("new-unresolved", s->template_->name);

  object o = env.runObject(s);
  assertTrue(o != 0);
  assertTrue(objectType(env.t, o) == point);
  assertTrue(point->initialized);

  Evaluator::Result r = env.run(env.generator.genNewInstance(
      &env.c, TypeRef::unresolved(makeResolutionGuard(env.t, pool, 1))));
  assertEqual<unsigned>(Evaluator::Threw, r.outcome);
  assertTrue(env.takeException()
             == env.bootType(Machine::IncompatibleClassChangeErrorType));

  r = env.run(env.generator.genNewInstance(
      &env.c, TypeRef::unresolved(makeResolutionGuard(env.t, pool, 2))));
  assertEqual<unsigned>(Evaluator::Threw, r.outcome);
  assertTrue(env.takeException()
             == env.bootType(Machine::NoClassDefFoundErrorType));
}

TEST(AllocationHybrid)
{
  CodegenEnv env;
  FieldSpec fields[] = {FieldSpec("count", IntKind)};
  Type* hybrid = env.define(
      "Hybrid", 0, Slice<FieldSpec>(fields), Slice<MethodSpec>(), HybridFlag);

  Snippet* s = env.generator.genNewInstance(&env.c, TypeRef::resolved(hybrid));
  assertEqual("newhybrid", s->template_->name);

  object o = env.runObject(s);
  assertTrue(objectType(env.t, o) == hybrid);
  assertEqual<int32_t>(HubFirstWordIndex, arrayLength(env.t, o));
}

TEST(AllocationArrays)
{
  CodegenEnv env;
  Type* point = definePoint(&env);

  Snippet* s = env.generator.genNewArray(
      &env.c, IntKind, Argument::forVariable(0, IntKind), TypeRef::resolved(0));
  assertEqual("newarray-int", s->template_->name);

  int64_t length[] = {5};
  object ints = asObject(env.run(s, Slice<int64_t>(length)).value);
  assertTrue(objectType(env.t, ints) == primitiveArrayType(env.m, IntKind));
  assertEqual<int32_t>(5, arrayLength(env.t, ints));
  for (unsigned i = 0; i < 5; ++i) {
    assertEqual<int32_t>(0, arrayElement<int32_t>(env.t, ints, i));
  }

  length[0] = 0;
  object empty = asObject(env.run(s, Slice<int64_t>(length)).value);
  assertEqual<int32_t>(0, arrayLength(env.t, empty));

  length[0] = -4;
  Evaluator::Result r = env.run(s, Slice<int64_t>(length));
  assertEqual<unsigned>(Evaluator::Threw, r.outcome);
  object e = env.t->exception;
  assertTrue(env.takeException()
             == env.bootType(Machine::NegativeArraySizeExceptionType));
  assertEqual<int32_t>(-4, throwableDetail(env.t, e));

  object points = env.runObject(env.generator.genNewArray(
      &env.c, ObjectKind, Argument::forInt(2), TypeRef::resolved(point)));
  assertTrue(objectType(env.t, points) == arrayTypeOf(env.t, point));
  assertEqual<int32_t>(2, arrayLength(env.t, points));

  // arrays past the large object threshold come from the runtime
  unsigned runtimeCalls = env.evaluator.runtimeCalls;
  unsigned refills = env.t->tlabRefills;
  object large = env.runObject(env.generator.genNewArray(
      &env.c, LongKind, Argument::forInt(4096), TypeRef::resolved(0)));
  assertEqual<int32_t>(4096, arrayLength(env.t, large));
  assertEqual<unsigned>(runtimeCalls + 1, env.evaluator.runtimeCalls);
  assertEqual<unsigned>(refills, env.t->tlabRefills);

  r = env.run(env.generator.genNewArray(
      &env.c, ByteKind, Argument::forInt(0x7ffffff0), TypeRef::resolved(0)));
  assertEqual<unsigned>(Evaluator::Threw, r.outcome);
  assertTrue(env.t->exception == env.m->outOfMemoryError);
  env.takeException();
}

TEST(AllocationUnresolvedArrays)
{
  CodegenEnv env;
  Type* point = definePoint(&env);

  Reference references[] = {Reference(Reference::ClassReference, "Point"),
                            Reference(Reference::ClassReference, "[J")};
  ConstantPool* pool
      = makeConstantPool(env.t, point, Slice<Reference>(references));

  Snippet* s = env.generator.genNewArray(
      &env.c,
      ObjectKind,
      Argument::forInt(3),
      TypeRef::unresolved(makeResolutionGuard(
          env.t, pool, 0, ResolutionGuard::ComponentTarget)));
  assertEqual("newarray-object-unresolved", s->template_->name);

  object points = env.runObject(s);
  assertTrue(objectType(env.t, points) == arrayTypeOf(env.t, point));
  assertEqual<int32_t>(3, arrayLength(env.t, points));

  object longs = env.runObject(env.generator.genNewArray(
      &env.c,
      LongKind,
      Argument::forInt(2),
      TypeRef::unresolved(makeResolutionGuard(env.t, pool, 1))));
  assertTrue(objectType(env.t, longs) == primitiveArrayType(env.m, LongKind));

  // the length is checked before the guard is resolved
  Reference missing[] = {Reference(Reference::ClassReference, "[LNowhere;")};
  ConstantPool* missingPool
      = makeConstantPool(env.t, point, Slice<Reference>(missing));
  unsigned resolutions = env.m->resolutions;
  Evaluator::Result negative = env.run(env.generator.genNewArray(
      &env.c,
      IntKind,
      Argument::forInt(-1),
      TypeRef::unresolved(makeResolutionGuard(env.t, missingPool, 0))));
  assertEqual<unsigned>(Evaluator::Threw, negative.outcome);
  assertTrue(env.takeException()
             == env.bootType(Machine::NegativeArraySizeExceptionType));
  assertEqual<unsigned>(resolutions, env.m->resolutions);

  // the guard names a class, not an array type
  Evaluator::Result r = env.run(env.generator.genNewArray(
      &env.c,
      ObjectKind,
      Argument::forInt(1),
      TypeRef::unresolved(makeResolutionGuard(env.t, pool, 0))));
  assertEqual<unsigned>(Evaluator::Threw, r.outcome);
  assertTrue(env.takeException()
             == env.bootType(Machine::IncompatibleClassChangeErrorType));
}

TEST(AllocationMultiArrays)
{
  CodegenEnv env;
  Type* ints = primitiveArrayType(env.m, IntKind);
  Type* matrix = arrayTypeOf(env.t, ints);

  Argument lengths[] = {Argument::forInt(3), Argument::forInt(4)};
  Snippet* s = env.generator.genNewMultiArray(
      &env.c, Slice<Argument>(lengths), TypeRef::resolved(matrix));
  assertEqual("newmultiarray-2", s->template_->name);

  object o = env.runObject(s);
  assertTrue(objectType(env.t, o) == matrix);
  assertEqual<int32_t>(3, arrayLength(env.t, o));
  for (unsigned i = 0; i < 3; ++i) {
    object row = arrayElement<object>(env.t, o, i);
    assertTrue(objectType(env.t, row) == ints);
    assertEqual<int32_t>(4, arrayLength(env.t, row));
  }

  // higher ranks pass their lengths in an int array
  Type* type = ints;
  for (unsigned i = 1; i < 5; ++i) {
    type = arrayTypeOf(env.t, type);
  }
  Argument five[] = {Argument::forInt(1),
                     Argument::forInt(1),
                     Argument::forInt(2),
                     Argument::forInt(1),
                     Argument::forInt(3)};
  o = env.runObject(env.generator.genNewMultiArray(
      &env.c, Slice<Argument>(five), TypeRef::resolved(type)));
  assertTrue(objectType(env.t, o) == type);
  object inner = arrayElement<object>(
      env.t,
      arrayElement<object>(
          env.t,
          arrayElement<object>(
              env.t, arrayElement<object>(env.t, o, 0), 0),
          1),
      0);
  assertTrue(objectType(env.t, inner) == ints);
  assertEqual<int32_t>(3, arrayLength(env.t, inner));

  Argument emptyRows[] = {Argument::forInt(2), Argument::forInt(0)};
  o = env.runObject(env.generator.genNewMultiArray(
      &env.c, Slice<Argument>(emptyRows), TypeRef::resolved(matrix)));
  assertEqual<int32_t>(2, arrayLength(env.t, o));
  assertEqual<int32_t>(0, arrayLength(env.t, arrayElement<object>(env.t, o, 1)));

  Argument noRows[] = {Argument::forInt(0), Argument::forInt(7)};
  o = env.runObject(env.generator.genNewMultiArray(
      &env.c, Slice<Argument>(noRows), TypeRef::resolved(matrix)));
  assertTrue(objectType(env.t, o) == matrix);
  assertEqual<int32_t>(0, arrayLength(env.t, o));

  Argument negative[] = {Argument::forInt(2), Argument::forInt(-1)};
  Evaluator::Result r = env.run(env.generator.genNewMultiArray(
      &env.c, Slice<Argument>(negative), TypeRef::resolved(matrix)));
  assertEqual<unsigned>(Evaluator::Threw, r.outcome);
  assertTrue(env.takeException()
             == env.bootType(Machine::NegativeArraySizeExceptionType));

  Reference references[] = {Reference(Reference::ClassReference, "[[I")};
  ConstantPool* pool
      = makeConstantPool(env.t, matrix, Slice<Reference>(references));
  s = env.generator.genNewMultiArray(
      &env.c,
      Slice<Argument>(lengths),
      TypeRef::unresolved(makeResolutionGuard(env.t, pool, 0)));
  assertEqual("newmultiarray-2-unresolved", s->template_->name);
  o = env.runObject(s);
  assertTrue(objectType(env.t, o) == matrix);
  assertEqual<int32_t>(4, arrayLength(env.t, arrayElement<object>(env.t, o, 2)));
}

TEST(AllocationLog)
{
  CodegenEnv env("tlab", TemplateGenerator::Options(), true);
  Type* point = definePoint(&env);

  Snippet* s = env.generator.genNewInstance(&env.c, TypeRef::resolved(point));
  object first = env.runObject(s);

  uintptr_t* log = env.t->log;
  assertEqual<uintptr_t>(reinterpret_cast<uintptr_t>(first), log[1]);
  assertEqual<int32_t>(point->tupleSize, *reinterpret_cast<int32_t*>(log + 2));
  assertEqual<uintptr_t>(reinterpret_cast<uintptr_t>(log + TlabLogRecordWords),
                         env.t->locals[Thread::TlabLogTail]);

  for (unsigned i = 1; i < TlabLogRecords; ++i) {
    env.runObject(s);
  }
  assertEqual<unsigned>(0, env.m->loggedAllocations);

  // the next record finds the buffer full and flushes it first
  object flushed = env.runObject(s);
  assertEqual<unsigned>(TlabLogRecords, env.m->loggedAllocations);
  assertEqual<uintptr_t>(reinterpret_cast<uintptr_t>(flushed), log[1]);
}

TEST(AllocationLogCardTable)
{
  CodegenEnv env("cards", TemplateGenerator::Options(), true);
  Type* point = definePoint(&env);

  assertTrue(env.scheme->logsAllocations());

  object o = env.runObject(
      env.generator.genNewInstance(&env.c, TypeRef::resolved(point)));

  uintptr_t* log = env.t->log;
  assertEqual<uintptr_t>(reinterpret_cast<uintptr_t>(o), log[1]);
  assertEqual<uintptr_t>(reinterpret_cast<uintptr_t>(log + TlabLogRecordWords),
                         env.t->locals[Thread::TlabLogTail]);
}

TEST(AllocationProfiler)
{
  CodegenEnv env;
  Type* point = definePoint(&env);
  CountingListener listener;
  env.m->allocationListener = &listener;

  Snippet* s = env.generator.genNewInstance(&env.c, TypeRef::resolved(point));
  env.runObject(s);
  assertEqual<unsigned>(0, listener.count);

  env.t->locals[Thread::ProfilerMark] = 1;
  object o = env.runObject(s);
  assertEqual<unsigned>(1, listener.count);
  assertTrue(listener.last == o);
  assertTrue(listener.lastType == point);

  object a = env.runObject(env.generator.genNewArray(
      &env.c, IntKind, Argument::forInt(2), TypeRef::resolved(0)));
  assertEqual<unsigned>(2, listener.count);
  assertTrue(listener.last == a);
  assertTrue(listener.lastType == primitiveArrayType(env.m, IntKind));

  env.m->allocationListener = 0;
}
