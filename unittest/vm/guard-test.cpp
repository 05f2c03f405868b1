/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <stdio.h>

#include <lowering/vm/guard.h>
#include <lowering/vm/arch.h>

#include "test-harness.h"
#include "env.h"

using namespace lowering::vm;
using namespace lowering::util;
using namespace lowering::codegen;

namespace {

class Resolver : public System::Runnable {
 public:
  Resolver(Machine* m, ResolutionGuard* guard)
      : m(m), guard(guard), thread(0), value(0), mismatches(0)
  {
  }

  virtual void attach(System::Thread* t)
  {
    thread = t;
  }

  virtual void run()
  {
    Thread* t = makeThread(m);
    for (unsigned i = 0; i < 1000; ++i) {
      void* v = resolve(t, guard);
      if (value == 0) {
        value = v;
      } else if (v != value) {
        ++mismatches;
      }
    }
    t->dispose();
  }

  Machine* m;
  ResolutionGuard* guard;
  System::Thread* thread;
  void* value;
  unsigned mismatches;
};

class Adder : public System::Runnable {
 public:
  Adder(uint32_t* counter) : counter(counter), thread(0)
  {
  }

  virtual void attach(System::Thread* t)
  {
    thread = t;
  }

  virtual void run()
  {
    for (unsigned i = 0; i < 10000; ++i) {
      atomicAdd(counter, 3);
    }
  }

  uint32_t* counter;
  System::Thread* thread;
};

}  // namespace

TEST(GuardResolvesClassOnce)
{
  MachineEnv env;
  Type* point = env.define("Point");

  Reference references[] = {Reference(Reference::ClassReference, "Point")};
  ConstantPool* pool
      = makeConstantPool(env.t, point, Slice<Reference>(references));

  ResolutionGuard* guard = makeResolutionGuard(env.t, pool, 0);
  assertTrue(guard == makeResolutionGuard(env.t, pool, 0));
  assertFalse(guard->resolved());

  unsigned resolutions = env.m->resolutions;
  assertTrue(resolveType(env.t, guard) == point);
  assertTrue(guard->resolved());
  assertTrue(resolveType(env.t, guard) == point);
  assertEqual<unsigned>(resolutions + 1, env.m->resolutions);

  ResolutionGuard* component = makeResolutionGuard(
      env.t, pool, 0, ResolutionGuard::ComponentTarget);
  assertTrue(component != guard);
  Type* array = resolveType(env.t, component);
  assertTrue(array == arrayTypeOf(env.t, point));
  assertTrue(array->componentType == point);
  assertEqual("[LPoint;", array->name);
}

TEST(GuardResolvesMembers)
{
  MachineEnv env;

  FieldSpec fields[]
      = {FieldSpec("x", IntKind), FieldSpec("count", LongKind, true)};
  MethodSpec methods[]
      = {MethodSpec("length"), MethodSpec("origin", StaticMethod)};
  Type* point = env.define(
      "Point", 0, Slice<FieldSpec>(fields), Slice<MethodSpec>(methods));

  MethodSpec shapeMethods[] = {MethodSpec("area")};
  Type* shape = env.define("Shape",
                           0,
                           Slice<FieldSpec>(),
                           Slice<MethodSpec>(shapeMethods),
                           InterfaceFlag | AbstractFlag);

  Reference references[]
      = {Reference(Reference::FieldReference, "Point", "x"),
         Reference(Reference::FieldReference, "Point", "count"),
         Reference(Reference::MethodReference, "Point", "length"),
         Reference(Reference::InterfaceMethodReference, "Shape", "area")};
  ConstantPool* pool
      = makeConstantPool(env.t, point, Slice<Reference>(references));

  Field* x = resolveField(env.t, makeResolutionGuard(env.t, pool, 0));
  assertTrue(x == findField(point, "x"));
  assertEqual<unsigned>(env.m->layout.headerSize(), x->offset);

  Field* count = resolveField(env.t, makeResolutionGuard(env.t, pool, 1));
  assertTrue(count != 0);
  assertTrue(count->isStatic);

  Method* length = resolveMethod(env.t, makeResolutionGuard(env.t, pool, 2));
  assertTrue(length == findMethod(point, "length"));
  assertEqual<int32_t>(HubFirstWordIndex, length->vtableIndex);

  Method* area = resolveMethod(env.t, makeResolutionGuard(env.t, pool, 3));
  assertTrue(area == findMethod(shape, "area"));
  assertEqual<unsigned>(1, area->interfaceIndex);

  assertTrue(env.t->exception == 0);
}

TEST(GuardLinkageErrors)
{
  MachineEnv env;

  FieldSpec fields[] = {FieldSpec("x", IntKind)};
  MethodSpec methods[] = {MethodSpec("length")};
  Type* point = env.define(
      "Point", 0, Slice<FieldSpec>(fields), Slice<MethodSpec>(methods));

  Reference references[]
      = {Reference(Reference::ClassReference, "Missing"),
         Reference(Reference::FieldReference, "Point", "y"),
         Reference(Reference::MethodReference, "Point", "width"),
         Reference(Reference::InterfaceMethodReference, "Point", "length")};
  ConstantPool* pool
      = makeConstantPool(env.t, point, Slice<Reference>(references));

  ResolutionGuard* missing = makeResolutionGuard(env.t, pool, 0);
  assertTrue(resolve(env.t, missing) == 0);
  assertTrue(env.takeException()
             == env.bootType(Machine::NoClassDefFoundErrorType));
  assertFalse(missing->resolved());

  assertTrue(resolve(env.t, makeResolutionGuard(env.t, pool, 1)) == 0);
  assertTrue(env.takeException()
             == env.bootType(Machine::NoSuchFieldErrorType));

  assertTrue(resolve(env.t, makeResolutionGuard(env.t, pool, 2)) == 0);
  assertTrue(env.takeException()
             == env.bootType(Machine::NoSuchMethodErrorType));

  assertTrue(resolve(env.t, makeResolutionGuard(env.t, pool, 3)) == 0);
  assertTrue(env.takeException()
             == env.bootType(Machine::IncompatibleClassChangeErrorType));

  // failures are not cached, so a later definition is picked up
  Type* type = env.define("Missing");
  assertTrue(resolveType(env.t, missing) == type);
  assertTrue(env.t->exception == 0);
}

TEST(GuardConcurrentResolution)
{
  MachineEnv env;
  Type* point = env.define("Point");

  Reference references[] = {Reference(Reference::ClassReference, "Point")};
  ConstantPool* pool
      = makeConstantPool(env.t, point, Slice<Reference>(references));
  ResolutionGuard* guard = makeResolutionGuard(
      env.t, pool, 0, ResolutionGuard::ComponentTarget);

  unsigned resolutions = env.m->resolutions;

  const unsigned ThreadCount = 8;
  Resolver* resolvers[ThreadCount];
  for (unsigned i = 0; i < ThreadCount; ++i) {
    resolvers[i] = new (allocate(env.s, sizeof(Resolver)))
        Resolver(env.m, guard);
    assertTrue(env.s->success(env.s->start(resolvers[i])));
  }

  for (unsigned i = 0; i < ThreadCount; ++i) {
    resolvers[i]->thread->join();
    resolvers[i]->thread->dispose();
  }

  Type* array = arrayTypeOf(env.t, point);
  for (unsigned i = 0; i < ThreadCount; ++i) {
    assertTrue(resolvers[i]->value == array);
    assertEqual<unsigned>(0, resolvers[i]->mismatches);
    env.s->free(resolvers[i]);
  }

  assertEqual<unsigned>(resolutions + 1, env.m->resolutions);
}

TEST(GuardAtomics)
{
  MachineEnv env;

  uintptr_t word = 7;
  assertFalse(atomicCompareAndSwap(&word, 8, 9));
  assertEqual<uintptr_t>(7, word);
  assertTrue(atomicCompareAndSwap(&word, 7, 9));
  assertEqual<uintptr_t>(9, word);

  uint32_t counter = 0;
  const unsigned ThreadCount = 4;
  Adder* adders[ThreadCount];
  for (unsigned i = 0; i < ThreadCount; ++i) {
    adders[i] = new (allocate(env.s, sizeof(Adder))) Adder(&counter);
    assertTrue(env.s->success(env.s->start(adders[i])));
  }

  for (unsigned i = 0; i < ThreadCount; ++i) {
    adders[i]->thread->join();
    adders[i]->thread->dispose();
    env.s->free(adders[i]);
  }

  assertEqual<uint32_t>(ThreadCount * 10000 * 3, counter);
}
