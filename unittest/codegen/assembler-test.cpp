/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <stdio.h>
#include <string.h>

#include "test-harness.h"
#include "env.h"

#include <lowering/codegen/assembler.h>
#include <lowering/codegen/stubs.h>

using namespace lowering::vm;
using namespace lowering::util;
using namespace lowering::codegen;

class AssemblerEnv : public MachineEnv {
 public:
  SystemAllocator allocator;
  Zone zone;
  TemplateAssembler a;
  Evaluator evaluator;

  AssemblerEnv()
      : allocator(s),
        zone(&allocator, 4096),
        a(s, &allocator, &zone, arch, false),
        evaluator(arch, t)
  {
  }

  int64_t eval(Template* tmpl, int64_t x, int64_t y)
  {
    int64_t parameters[] = {x, y};
    return evaluator.run(tmpl, parameters).value;
  }
};

TEST(AssemblerTemplate)
{
  AssemblerEnv env;
  TemplateAssembler* a = &env.a;

  Operand* result = a->restart(IntKind);
  Operand* x = a->createInputParameter("x", IntKind);
  Operand* y = a->createConstantInputParameter("y", IntKind);
  a->add(result, x, y);
  Template* t = a->finishTemplate("sum");

  assertEqual("sum", t->name);
  assertEqual<unsigned>(IntKind, t->resultKind());
  assertEqual<unsigned>(2, t->parameters.count);
  assertTrue(t->parameters[0] == x);
  assertTrue(t->parameters[1] == y);
  assertEqual<unsigned>(1, t->fastPath.count);
  assertEqual<unsigned>(0, t->slowPath.count);
  assertEqual<unsigned>(0, t->flags);
  assertFalse(t->isStub());

  assertEqual<int64_t>(42, env.eval(t, 40, 2));
  assertEqual<int64_t>(-1, env.eval(t, 1, -2));

  a->restart();
  Template* empty = a->finishTemplate("empty");
  assertEqual<unsigned>(VoidKind, empty->resultKind());
  assertEqual<unsigned>(0, empty->operands.count);
}

TEST(AssemblerLabels)
{
  AssemblerEnv env;
  TemplateAssembler* a = &env.a;

  Operand* result = a->restart(IntKind);
  Operand* x = a->createInputParameter("x", IntKind);
  Operand* y = a->createInputParameter("y", IntKind);
  Label* second = a->createInlineLabel("second");
  Label* done = a->createInlineLabel("done");

  a->jlt(second, x, y);
  a->mov(result, x);
  a->jmp(done);
  a->bindInline(second);
  a->mov(result, y);
  a->bindInline(done);

  Template* t = a->finishTemplate("max");
  assertEqual<unsigned>(Template::HasControlFlow, t->flags);
  assertEqual<unsigned>(2, t->labels.count);
  assertFalse(second->slowPath);
  assertEqual<unsigned>(3, second->position);
  assertEqual<unsigned>(4, done->position);

  assertEqual<int64_t>(9, env.eval(t, 3, 9));
  assertEqual<int64_t>(9, env.eval(t, 9, 3));
  assertEqual<int64_t>(-3, env.eval(t, -3, -7));
}

TEST(AssemblerSlowPath)
{
  AssemblerEnv env;
  TemplateAssembler* a = &env.a;

  Operand* result = a->restart(IntKind);
  Operand* x = a->createInputParameter("x", IntKind);
  Label* negative = a->createOutOfLineLabel("negative");
  Label* done = a->createInlineLabel("done");

  a->jlt(negative, x, a->i(0));
  a->mov(result, x);

  a->bindOutOfLine(negative);
  a->sub(result, a->i(0), x);
  a->jmp(done);

  a->bindInline(done);

  Template* t = a->finishTemplate("abs");
  assertEqual<unsigned>(2, t->fastPath.count);
  assertEqual<unsigned>(2, t->slowPath.count);
  assertTrue(negative->slowPath);
  assertEqual<unsigned>(0, negative->position);
  assertFalse(done->slowPath);
  assertEqual<unsigned>(2, done->position);

  assertEqual<int64_t>(5, env.eval(t, 5, 0));
  assertEqual<int64_t>(5, env.eval(t, -5, 0));
}

TEST(AssemblerSuccessors)
{
  AssemblerEnv env;
  TemplateAssembler* a = &env.a;

  a->restart();
  Operand* x = a->createInputParameter("x", IntKind);
  Label* isTrue = a->trueSuccessor();
  assertTrue(a->trueSuccessor() == isTrue);

  a->jeq(isTrue, x, a->i(0));
  a->jmp(a->falseSuccessor());

  Template* t = a->finishTemplate("iszero");
  assertEqual<unsigned>(2, t->labels.count);

  int64_t parameters[] = {0};
  assertEqual<unsigned>(Evaluator::TrueSuccessor,
                        env.evaluator.run(t, parameters).outcome);
  parameters[0] = 4;
  assertEqual<unsigned>(Evaluator::FalseSuccessor,
                        env.evaluator.run(t, parameters).outcome);
}

TEST(AssemblerCalls)
{
  AssemblerEnv env;
  TemplateAssembler* a = &env.a;
  const RuntimeCall* call = findRuntimeCall("loadException");
  assertTrue(call != 0);

  Operand* result = a->restart(ObjectKind);
  a->callRuntime(call, result, Slice<Operand*>());
  Template* stub = a->finishStub("stub-load");
  assertTrue(stub->isStub());
  assertEqual<unsigned>(Template::IsStub | Template::HasRuntimeCall,
                        stub->flags);

  result = a->restart(ObjectKind);
  a->safepoint();
  a->callStub(stub, result, Slice<Operand*>());
  Template* t = a->finishTemplate("load");
  assertEqual<unsigned>(Template::HasStubCall | Template::HasSafepoint,
                        t->flags);

  object e = makeThrowable(
      env.t, Machine::NullPointerExceptionType, 0, "caught");
  env.t->caughtException = e;
  unsigned safepoints = env.t->safepoints;

  Evaluator::Result r = env.evaluator.run(t, 0);
  assertEqual<unsigned>(Evaluator::Normal, r.outcome);
  assertTrue(asObject(r.value) == e);
  assertTrue(env.t->caughtException == 0);
  assertEqual<unsigned>(1, env.evaluator.stubCalls);
  assertEqual<unsigned>(1, env.evaluator.runtimeCalls);
  assertEqual<unsigned>(safepoints + 1, env.t->safepoints);
}

TEST(AssemblerDeoptimize)
{
  AssemblerEnv env;
  TemplateAssembler* a = &env.a;

  a->restart();
  Operand* x = a->createInputParameter("x", IntKind);
  Label* bail = a->createOutOfLineLabel("bail");
  a->jneq(bail, x, a->i(1));
  a->bindOutOfLine(bail);
  a->deoptimize();
  Template* t = a->finishTemplate("expectone");

  int64_t parameters[] = {1};
  assertEqual<unsigned>(Evaluator::Normal,
                        env.evaluator.run(t, parameters).outcome);
  parameters[0] = 2;
  assertEqual<unsigned>(Evaluator::Deoptimized,
                        env.evaluator.run(t, parameters).outcome);
}

TEST(AssemblerCopy)
{
  AssemblerEnv env;
  TemplateAssembler* a = &env.a;

  Operand* result = a->restart(IntKind);
  Operand* x = a->createInputParameter("x", IntKind);

  Zone zone(&env.allocator, 1024);
  TemplateAssembler* copy = a->copy(&zone);
  assertTrue(copy->arch == a->arch);
  assertEqual<unsigned>(a->wordKind(), copy->wordKind());

  // building in the copy leaves the template in progress here alone
  Operand* r = copy->restart(LongKind);
  copy->mov(r, copy->l(7));
  Template* seven = copy->finishTemplate("seven");
  assertEqual<int64_t>(7, env.evaluator.run(seven, 0).value);

  a->add(result, x, a->i(1));
  Template* t = a->finishTemplate("increment");
  assertEqual<unsigned>(1, t->parameters.count);
  assertEqual<unsigned>(3, t->operands.count);
  assertEqual<int64_t>(8, env.eval(t, 7, 0));

  copy->dispose();
  zone.dispose();
}

TEST(TemplatePrint)
{
  AssemblerEnv env;
  TemplateAssembler* a = &env.a;

  Operand* result = a->restart(IntKind);
  Operand* x = a->createInputParameter("x", IntKind);
  a->add(result, x, a->i(1));
  Template* t = a->finishTemplate("increment");

  FILE* out = tmpfile();
  assertTrue(out != 0);
  t->print(out);
  rewind(out);

  char line[256];
  assertTrue(fgets(line, sizeof(line), out) != 0);
  assertEqual("template increment -> int result\n", line);
  fclose(out);
}
