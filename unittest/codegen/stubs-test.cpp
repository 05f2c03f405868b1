/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <stdio.h>

#include <lowering/codegen/stubs.h>

#include "test-harness.h"
#include "env.h"

using namespace lowering::codegen;
using namespace lowering::util;

TEST(RuntimeCallBindings)
{
  const RuntimeCall* call = findRuntimeCall("allocateMultiArray2");
  assertTrue(call != 0);
  assertEqual<unsigned>(3, call->parameterCount);
  assertEqual<unsigned>(ObjectKind, call->resultKind);
  assertEqual<unsigned>(ObjectKind, call->parameterKinds[0]);
  assertEqual<unsigned>(IntKind, call->parameterKinds[2]);
  assertEqual<unsigned>(VoidKind, call->parameterKinds[3]);

  call = findRuntimeCall("monitorExit");
  assertTrue(call != 0);
  assertEqual<unsigned>(VoidKind, call->resultKind);

  assertTrue(findRuntimeCall("noSuchCall") == 0);

  for (unsigned i = 0; i < runtimeCallCount(); ++i) {
    assertTrue(findRuntimeCall(runtimeCallAt(i)->name) == runtimeCallAt(i));
  }
  assertTrue(runtimeCallAt(runtimeCallCount()) == 0);
}

TEST(RuntimeCallCompatibility)
{
  const RuntimeCall* call = findRuntimeCall("resolveGetField");

  Operand guard(Operand::Parameter, ObjectKind, "guard", 0);
  Operand length(Operand::Parameter, IntKind, "length", 1);
  Operand flag(Operand::Parameter, BooleanKind, "flag", 2);

  assertTrue(compatible(call, IntKind, operands(&guard)));
  // narrow kinds travel as ints
  assertTrue(compatible(call, ShortKind, operands(&guard)));
  assertFalse(compatible(call, LongKind, operands(&guard)));
  assertFalse(compatible(call, VoidKind, operands(&guard)));
  assertFalse(compatible(call, IntKind, operands(&length)));
  assertFalse(compatible(call, IntKind, operands(&guard, &length)));

  call = findRuntimeCall("throwNegativeArraySizeException");
  assertTrue(compatible(call, VoidKind, operands(&length)));
  assertTrue(compatible(call, VoidKind, operands(&flag)));
  assertFalse(compatible(call, IntKind, operands(&length)));
}

TEST(StubRegistry)
{
  CodegenEnv env;
  StubRegistry* stubs = env.generator.stubs();

  unsigned count = stubs->size();
  assertTrue(count > 0);
  assertTrue(count <= runtimeCallCount());

  Template* stub = stubs->find("resolveHub");
  assertTrue(stub != 0);
  assertTrue(stub->isStub());
  assertEqual("stub-resolveHub", stub->name);
  assertEqual<unsigned>(ObjectKind, stub->resultKind());
  assertEqual<unsigned>(1, stub->parameters.count);
  assertTrue(stub == env.generator.find("stub-resolveHub"));

  // every stub is built once, however many templates call it
  for (unsigned i = 0; i < count; ++i) {
    Template* s = stubs->stubAt(i);
    assertTrue(s != 0);
    assertTrue(stubs->find(s->name + strlen("stub-")) == s);
  }
  assertTrue(stubs->stubAt(count) == 0);

  assertTrue(stubs->find("noSuchCall") == 0);
  assertTrue(env.generator.find("stub-noSuchCall") == 0);

  env.generator.makeTemplates();
  assertEqual<unsigned>(count, stubs->size());
}

TEST(StubExecution)
{
  CodegenEnv env;
  Template* stub = env.generator.find("stub-throwNegativeArraySizeException");
  assertTrue(stub != 0);

  int64_t parameters[] = {-3};
  Evaluator::Result r = env.evaluator.run(stub, parameters);
  assertEqual<unsigned>(Evaluator::Threw, r.outcome);
  assertTrue(env.bootType(lowering::vm::Machine::NegativeArraySizeExceptionType)
             == env.takeException());
  assertEqual<unsigned>(1, env.evaluator.runtimeCalls);
}
