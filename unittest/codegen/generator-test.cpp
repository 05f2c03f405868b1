/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <string.h>

#include "test-harness.h"
#include "env.h"

using namespace lowering::vm;
using namespace lowering::util;
using namespace lowering::codegen;

namespace {

class PauseCounter : public SafepointListener {
 public:
  PauseCounter() : pauses(0)
  {
  }

  virtual void atSafepoint(Thread*)
  {
    ++pauses;
  }

  unsigned pauses;
};

Type* defineWorker(MachineEnv* env)
{
  FieldSpec fields[] = {FieldSpec("jobs", IntKind, true)};
  MethodSpec methods[] = {MethodSpec("run"),
                          MethodSpec("main", StaticMethod | EntryPointMethod)};
  return env->define(
      "Worker", 0, Slice<FieldSpec>(fields), Slice<MethodSpec>(methods));
}

class Compiler : public System::Runnable {
 public:
  Compiler(TemplateGenerator* generator, Machine* m, Type* type)
      : generator(generator), m(m), type(type), thread(0), failures(0)
  {
  }

  virtual void attach(System::Thread* t)
  {
    thread = t;
  }

  virtual void run()
  {
    Thread* t = makeThread(m);
    {
      Compilation c(generator, t);
      Evaluator evaluator(generator->arch, t);
      Method* method = findMethod(type, "run");

      for (unsigned i = 0; i < 200; ++i) {
        if (evaluator.run(generator->genPrologue(&c, method)).outcome
            != Evaluator::Normal) {
          ++failures;
        }

        Evaluator::Result r = evaluator.run(
            generator->genNewInstance(&c, TypeRef::resolved(type)));
        if (r.outcome != Evaluator::Normal
            or objectType(t, asObject(r.value)) != type) {
          ++failures;
        }

        if (evaluator.run(generator->genEpilogue(&c, method)).outcome
            != Evaluator::Normal) {
          ++failures;
        }
      }

      if (t->frameDepth != 0) {
        ++failures;
      }
    }
    t->dispose();
  }

  TemplateGenerator* generator;
  Machine* m;
  Type* type;
  System::Thread* thread;
  unsigned failures;
};

}  // namespace

TEST(GeneratorCatalog)
{
  CodegenEnv env;

  Slice<Template*> templates = env.generator.makeTemplates();
  Slice<Template*> again = env.generator.makeTemplates();
  assertTrue(templates.count > 0);
  assertEqual<unsigned>(templates.count, again.count);
  assertTrue(templates.items == again.items);

  for (unsigned i = 0; i < templates.count; ++i) {
    assertFalse(templates[i]->isStub());
    assertTrue(env.generator.find(templates[i]->name) == templates[i]);
    for (unsigned j = i + 1; j < templates.count; ++j) {
      assertFalse(strcmp(templates[i]->name, templates[j]->name) == 0);
    }
  }

  TemplateGenerator* g = &env.generator;
  assertTrue(g->find("checkcast-leaf")
             == g->lookup(TemplateGenerator::CheckCast,
                          VoidKind,
                          true,
                          TemplateGenerator::LeafFlag));
  assertTrue(g->find("newmultiarray-6-unresolved")
             == g->lookup(TemplateGenerator::NewMultiArray, VoidKind, false, 6));
  assertTrue(g->find("getstatic-double")
             == g->lookup(TemplateGenerator::GetStatic, DoubleKind, true, 0));
  assertTrue(g->find("no-such-template") == 0);
  assertTrue(g->find("stub-noSuchCall") == 0);

  assertTrue(g->lookup(TemplateGenerator::NewMultiArray, VoidKind, true, 0)
             == 0);
  assertTrue(g->lookup(TemplateGenerator::NewMultiArray,
                       VoidKind,
                       true,
                       MaxMultiArrayRank + 1) == 0);
  assertTrue(g->lookup(TemplateGenerator::GetField, VoidKind, true, 0) == 0);
  assertTrue(g->lookup(TemplateGenerator::NewArray, VoidKind, false, 0) == 0);
  assertTrue(g->lookup(TemplateGenerator::NewHybrid, VoidKind, false, 0) == 0);
  assertTrue(g->lookup(TemplateGenerator::TypeAssert, VoidKind, false, 0)
             == 0);
  assertTrue(g->lookup(TemplateGenerator::ResolveClass,
                       VoidKind,
                       false,
                       TemplateGenerator::RepresentationCount) == 0);
}

TEST(GeneratorPrologue)
{
  CodegenEnv env;
  Type* worker = defineWorker(&env);
  Method* run = findMethod(worker, "run");
  Method* main = findMethod(worker, "main");

  unsigned safepoints = env.t->safepoints;
  Snippet* prologue = env.generator.genPrologue(&env.c, run);
  assertEqual("prologue", prologue->template_->name);
  assertEqual<unsigned>(Evaluator::Normal, env.run(prologue).outcome);
  assertEqual<unsigned>(1, env.t->frameDepth);
  assertEqual<unsigned>(safepoints + 1, env.t->safepoints);

  Snippet* epilogue = env.generator.genEpilogue(&env.c, run);
  assertEqual("epilogue", epilogue->template_->name);
  assertEqual<unsigned>(Evaluator::Normal, env.run(epilogue).outcome);
  assertEqual<unsigned>(0, env.t->frameDepth);
  assertEqual<unsigned>(safepoints + 2, env.t->safepoints);

  // prologues are built per compilation and never enter the catalog
  assertTrue(env.generator.find("prologue") == 0);

  env.t->frameDepth = StackLimit - 1;
  Evaluator::Result r = env.run(prologue);
  assertEqual<unsigned>(Evaluator::Threw, r.outcome);
  object e = env.t->exception;
  assertTrue(env.takeException()
             == env.bootType(Machine::StackOverflowErrorType));
  assertEqual<int32_t>(StackLimit, throwableDetail(env.t, e));

  // entry points are called by the VM and skip the check
  env.t->frameDepth = StackLimit;
  r = env.run(env.generator.genPrologue(&env.c, main));
  assertEqual<unsigned>(Evaluator::Normal, r.outcome);
  assertEqual<unsigned>(StackLimit + 1, env.t->frameDepth);
  env.t->frameDepth = 0;
}

TEST(GeneratorProfilerMarks)
{
  TemplateGenerator::Options options;
  options.profilerEntryPoint = "run";
  options.profilerExitPoint = "run";

  CodegenEnv env("tlab", options);
  Type* worker = defineWorker(&env);
  Method* run = findMethod(worker, "run");
  Method* main = findMethod(worker, "main");

  env.run(env.generator.genPrologue(&env.c, main));
  assertEqual<uintptr_t>(0, env.t->locals[Thread::ProfilerMark]);

  env.run(env.generator.genPrologue(&env.c, run));
  assertEqual<uintptr_t>(1, env.t->locals[Thread::ProfilerMark]);

  env.run(env.generator.genEpilogue(&env.c, main));
  assertEqual<uintptr_t>(1, env.t->locals[Thread::ProfilerMark]);

  env.run(env.generator.genEpilogue(&env.c, run));
  assertEqual<uintptr_t>(0, env.t->locals[Thread::ProfilerMark]);
  assertEqual<unsigned>(0, env.t->frameDepth);
}

TEST(GeneratorSafepoint)
{
  CodegenEnv env;
  PauseCounter counter;
  env.m->safepointListener = &counter;

  Snippet* s = env.generator.genSafepoint(&env.c);
  assertEqual("safepoint", s->template_->name);
  assertTrue((s->template_->flags & Template::HasSafepoint) != 0);

  unsigned safepoints = env.t->safepoints;
  env.run(s);
  assertEqual<unsigned>(safepoints + 1, env.t->safepoints);
  assertEqual<unsigned>(0, counter.pauses);

  env.m->pauseRequested = true;
  env.run(s);
  env.run(s);
  assertEqual<unsigned>(2, counter.pauses);
  assertEqual<unsigned>(safepoints + 3, env.t->safepoints);

  env.m->pauseRequested = false;
  env.m->safepointListener = 0;
}

TEST(GeneratorExceptionObject)
{
  CodegenEnv env;
  object e = makeThrowable(
      env.t, Machine::ArrayStoreExceptionType, 0, "landing pad");

  Snippet* s = env.generator.genExceptionObject(&env.c);
  assertEqual("exceptionobject", s->template_->name);

  env.t->caughtException = e;
  assertTrue(env.runObject(s) == e);
  assertTrue(env.t->caughtException == 0);
  assertEqual("landing pad", throwableMessage(env.t, e));

  assertTrue(env.runObject(s) == 0);
}

TEST(GeneratorResolveClass)
{
  CodegenEnv env;
  Type* worker = defineWorker(&env);
  TemplateGenerator* g = &env.generator;

  Snippet* s = g->genResolveClass(
      &env.c, TypeRef::resolved(worker), TemplateGenerator::ObjectHub);
  assertEqual("constant-object", s->template_->name);
  assertTrue(env.runObject(s) == worker->hub);

  s = g->genResolveClass(
      &env.c, TypeRef::resolved(worker), TemplateGenerator::StaticFields);
  assertTrue(env.runObject(s) == worker->staticTuple);

  s = g->genResolveClass(
      &env.c, TypeRef::resolved(worker), TemplateGenerator::TypeInfo);
  assertTrue(env.runObject(s) == static_cast<object>(worker));

  s = g->genResolveClass(
      &env.c, TypeRef::resolved(worker), TemplateGenerator::JavaClass);
  assertTrue(env.runObject(s) == worker->mirror);
  assertTrue(worker->mirror != 0);
  assertFalse(worker->initialized);

  Reference references[] = {Reference(Reference::ClassReference, "Worker"),
                            Reference(Reference::ClassReference, "Idler")};
  ConstantPool* pool
      = makeConstantPool(env.t, worker, Slice<Reference>(references));
  TypeRef unresolved = TypeRef::unresolved(makeResolutionGuard(env.t, pool, 0));

  s = g->genResolveClass(&env.c, unresolved, TemplateGenerator::ObjectHub);
  assertEqual("resolveclass-hub", s->template_->name);
  assertTrue(env.runObject(s) == worker->hub);
  assertFalse(worker->initialized);

  s = g->genResolveClass(&env.c, unresolved, TemplateGenerator::TypeInfo);
  assertEqual("resolveclass-type", s->template_->name);
  assertTrue(env.runObject(s) == static_cast<object>(worker));

  s = g->genResolveClass(&env.c, unresolved, TemplateGenerator::JavaClass);
  assertEqual("resolveclass-class", s->template_->name);
  assertTrue(env.runObject(s) == worker->mirror);

  s = g->genResolveClass(&env.c, unresolved, TemplateGenerator::StaticFields);
  assertEqual("resolveclass-statics", s->template_->name);
  assertTrue(env.runObject(s) == worker->staticTuple);
  assertTrue(worker->initialized);

  Evaluator::Result r = env.run(g->genResolveClass(
      &env.c,
      TypeRef::unresolved(makeResolutionGuard(env.t, pool, 1)),
      TemplateGenerator::ObjectHub));
  assertEqual<unsigned>(Evaluator::Threw, r.outcome);
  assertTrue(env.takeException()
             == env.bootType(Machine::NoClassDefFoundErrorType));
}

TEST(GeneratorMonitors)
{
  CodegenEnv env;
  Type* worker = defineWorker(&env);
  object lock = allocateTuple(env.t, worker);
  Argument o = Argument::forVariable(0, ObjectKind);
  int64_t values[] = {static_cast<int64_t>(reinterpret_cast<uintptr_t>(lock))};

  Snippet* enter = env.generator.genMonitorEnter(&env.c, o);
  Snippet* exit = env.generator.genMonitorExit(&env.c, o);
  assertEqual("monitorenter", enter->template_->name);
  assertEqual("monitorexit", exit->template_->name);

  assertEqual<unsigned>(Evaluator::Normal,
                        env.run(enter, Slice<int64_t>(values)).outcome);
  assertEqual<unsigned>(Evaluator::Normal,
                        env.run(enter, Slice<int64_t>(values)).outcome);
  assertTrue(holdsMonitor(env.t, lock));

  // a thread which does not own the monitor may not exit it
  Thread* other = makeThread(env.m);
  {
    Evaluator evaluator(env.arch, other);
    assertEqual<unsigned>(Evaluator::Threw,
                          evaluator.run(exit, Slice<int64_t>(values)).outcome);
    assertTrue(objectType(other, other->exception)
               == env.bootType(Machine::IllegalMonitorStateExceptionType));
    other->exception = 0;
  }
  other->dispose();

  assertEqual<unsigned>(Evaluator::Normal,
                        env.run(exit, Slice<int64_t>(values)).outcome);
  assertTrue(holdsMonitor(env.t, lock));
  assertEqual<unsigned>(Evaluator::Normal,
                        env.run(exit, Slice<int64_t>(values)).outcome);
  assertFalse(holdsMonitor(env.t, lock));

  assertEqual<unsigned>(Evaluator::Threw,
                        env.run(exit, Slice<int64_t>(values)).outcome);
  assertTrue(env.takeException()
             == env.bootType(Machine::IllegalMonitorStateExceptionType));

  values[0] = 0;
  assertEqual<unsigned>(Evaluator::Threw,
                        env.run(enter, Slice<int64_t>(values)).outcome);
  assertTrue(env.takeException()
             == env.bootType(Machine::NullPointerExceptionType));
  assertEqual<unsigned>(Evaluator::Threw,
                        env.run(exit, Slice<int64_t>(values)).outcome);
  assertTrue(env.takeException()
             == env.bootType(Machine::NullPointerExceptionType));
}

TEST(GeneratorConcurrentCompilations)
{
  CodegenEnv env;
  Type* worker = defineWorker(&env);

  const unsigned ThreadCount = 4;
  Compiler* compilers[ThreadCount];
  for (unsigned i = 0; i < ThreadCount; ++i) {
    compilers[i] = new (allocate(env.s, sizeof(Compiler)))
        Compiler(&env.generator, env.m, worker);
    assertTrue(env.s->success(env.s->start(compilers[i])));
  }

  for (unsigned i = 0; i < ThreadCount; ++i) {
    compilers[i]->thread->join();
    compilers[i]->thread->dispose();
    assertEqual<unsigned>(0, compilers[i]->failures);
    env.s->free(compilers[i]);
  }
}

TEST(GeneratorInlineStubs)
{
  TemplateGenerator::Options options;
  options.useOutOfLineStubs = false;

  CodegenEnv env("tlab", options);
  Type* worker = defineWorker(&env);

  Template* t = env.generator.find("new");
  assertTrue(t != 0);

  Snippet* s = env.generator.genNewInstance(&env.c, TypeRef::resolved(worker));
  object first = env.runObject(s);
  object second = env.runObject(s);
  assertTrue(objectType(env.t, first) == worker);
  assertTrue(objectType(env.t, second) == worker);
  assertEqual<unsigned>(1, env.t->tlabRefills);
}
