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

class Zoo {
 public:
  Zoo(MachineEnv* env)
  {
    MethodSpec petMethods[] = {MethodSpec("name"), MethodSpec("play")};
    pet = env->define("Pet",
                      0,
                      Slice<FieldSpec>(),
                      Slice<MethodSpec>(petMethods),
                      InterfaceFlag | AbstractFlag);

    MethodSpec animalMethods[] = {MethodSpec("speak"),
                                  MethodSpec("<init>", ConstructorMethod),
                                  MethodSpec("secret", PrivateMethod),
                                  MethodSpec("create", StaticMethod)};
    animal = env->define(
        "Animal", 0, Slice<FieldSpec>(), Slice<MethodSpec>(animalMethods));

    MethodSpec dogMethods[] = {MethodSpec("speak"),
                               MethodSpec("fetch"),
                               MethodSpec("play"),
                               MethodSpec("name")};
    Type* interfaces[] = {pet};
    dog = env->define("Dog",
                      animal,
                      Slice<FieldSpec>(),
                      Slice<MethodSpec>(dogMethods),
                      FinalFlag,
                      Slice<Type*>(interfaces));

    anAnimal = allocateTuple(env->t, animal);
    aDog = allocateTuple(env->t, dog);

    Reference references[]
        = {Reference(Reference::MethodReference, "Animal", "create"),
           Reference(Reference::MethodReference, "Animal", "secret"),
           Reference(Reference::MethodReference, "Animal", "speak"),
           Reference(Reference::InterfaceMethodReference, "Pet", "play"),
           Reference(Reference::MethodReference, "Animal", "missing")};
    pool = makeConstantPool(env->t, dog, Slice<Reference>(references));
  }

  uintptr_t entry(Type* type, const char* name)
  {
    for (unsigned i = 0; i < type->methods.count; ++i) {
      if (strcmp(type->methods[i]->name, name) == 0) {
        return type->methods[i]->entry;
      }
    }
    return 0;
  }

  Type* pet;
  Type* animal;
  Type* dog;
  object anAnimal;
  object aDog;
  ConstantPool* pool;
};

int64_t word(uintptr_t v)
{
  return static_cast<int64_t>(v);
}

const unsigned CapabilityCount = 7;
const unsigned ImplementedCount = 5;

const char* const capabilityNames[] = {"Capability0",
                                       "Capability1",
                                       "Capability2",
                                       "Capability3",
                                       "Capability4",
                                       "Capability5",
                                       "Capability6"};

const char* const actionNames[]
    = {"act0", "act1", "act2", "act3", "act4", "act5", "act6"};

// Seven consecutively numbered interfaces and a class implementing the
// first five.  The class's own id is then congruent to the first
// interface's modulo its seven supertypes, so its mtable has to grow.
class Robot {
 public:
  Robot(MachineEnv* env)
  {
    for (unsigned i = 0; i < CapabilityCount; ++i) {
      MethodSpec methods[] = {MethodSpec(actionNames[i])};
      capabilities[i] = env->define(capabilityNames[i],
                                    0,
                                    Slice<FieldSpec>(),
                                    Slice<MethodSpec>(methods),
                                    InterfaceFlag | AbstractFlag);
    }

    MethodSpec methods[] = {MethodSpec("act0"),
                            MethodSpec("act1"),
                            MethodSpec("act2"),
                            MethodSpec("act3"),
                            MethodSpec("act4")};
    robot = env->define("Robot",
                        0,
                        Slice<FieldSpec>(),
                        Slice<MethodSpec>(methods),
                        0,
                        Slice<Type*>(capabilities, ImplementedCount));

    aRobot = allocateTuple(env->t, robot);
  }

  uintptr_t mtableLength(Machine* m)
  {
    return fieldAtOffset<uintptr_t>(robot->hub, m->layout.mTableLengthOffset());
  }

  Type* capabilities[CapabilityCount];
  Type* robot;
  object aRobot;
};

}  // namespace

TEST(DispatchStatic)
{
  CodegenEnv env;
  Zoo zoo(&env);

  Method* create = findMethod(zoo.animal, "create");
  Snippet* s = env.generator.genInvokeStatic(&env.c, MethodRef::resolved(create));
  assertEqual("invokestatic", s->template_->name);
  assertEqual<int64_t>(word(create->entry), env.run(s).value);

  assertFalse(zoo.animal->initialized);
  ResolutionGuard* guard = makeResolutionGuard(env.t, zoo.pool, 0);
  Evaluator::Result r
      = env.run(env.generator.genInvokeStatic(&env.c, MethodRef::unresolved(guard)));
  assertEqual<unsigned>(Evaluator::Normal, r.outcome);
  assertEqual<int64_t>(word(create->entry), r.value);
  assertTrue(zoo.animal->initialized);

  // an instance method named by an invokestatic site
  r = env.run(env.generator.genInvokeStatic(
      &env.c, MethodRef::unresolved(makeResolutionGuard(env.t, zoo.pool, 2))));
  assertEqual<unsigned>(Evaluator::Threw, r.outcome);
  assertTrue(env.takeException()
             == env.bootType(Machine::IncompatibleClassChangeErrorType));

  r = env.run(env.generator.genInvokeStatic(
      &env.c, MethodRef::unresolved(makeResolutionGuard(env.t, zoo.pool, 4))));
  assertEqual<unsigned>(Evaluator::Threw, r.outcome);
  assertTrue(env.takeException()
             == env.bootType(Machine::NoSuchMethodErrorType));
}

TEST(DispatchSpecial)
{
  CodegenEnv env;
  Zoo zoo(&env);
  TemplateGenerator* g = &env.generator;

  Method* secret = findMethod(zoo.animal, "secret");
  assertEqual<int32_t>(-1, secret->vtableIndex);

  Snippet* s = g->genInvokeSpecial(
      &env.c, Site(), Argument::forObject(zoo.aDog), MethodRef::resolved(secret));
  assertEqual("invokespecial", s->template_->name);
  assertEqual<int64_t>(word(secret->entry), env.run(s).value);

  Evaluator::Result r = env.run(g->genInvokeSpecial(
      &env.c, Site(), Argument::forObject(0), MethodRef::resolved(secret)));
  assertEqual<unsigned>(Evaluator::Threw, r.outcome);
  assertTrue(env.takeException()
             == env.bootType(Machine::NullPointerExceptionType));

  s = g->genInvokeSpecial(&env.c,
                          Site(Site::NonNull),
                          Argument::forObject(zoo.aDog),
                          MethodRef::resolved(secret));
  assertEqual("invokespecial-nonnull", s->template_->name);
  assertEqual<int64_t>(word(secret->entry), env.run(s).value);

  ResolutionGuard* guard = makeResolutionGuard(env.t, zoo.pool, 1);
  s = g->genInvokeSpecial(&env.c,
                          Site(Site::NonNull),
                          Argument::forObject(zoo.aDog),
                          MethodRef::unresolved(guard));
  assertEqual("invokespecial-unresolved", s->template_->name);
  assertEqual<int64_t>(word(secret->entry), env.run(s).value);

  // a virtual call to a method without a vtable slot is bound directly
  s = g->genInvokeVirtual(
      &env.c, Argument::forObject(zoo.aDog), MethodRef::resolved(secret));
  assertEqual("invokespecial", s->template_->name);
}

TEST(DispatchVirtual)
{
  CodegenEnv env;
  Zoo zoo(&env);
  TemplateGenerator* g = &env.generator;

  Method* speak = findMethod(zoo.animal, "speak");
  assertTrue(speak->holder == zoo.animal);
  assertEqual<int32_t>(speak->vtableIndex, findMethod(zoo.dog, "speak")->vtableIndex);

  Snippet* s = g->genInvokeVirtual(
      &env.c, Argument::forVariable(0, ObjectKind), MethodRef::resolved(speak));
  assertEqual("invokevirtual", s->template_->name);

  int64_t receiver[] = {word(reinterpret_cast<uintptr_t>(zoo.aDog))};
  assertEqual<int64_t>(word(zoo.entry(zoo.dog, "speak")),
                       env.run(s, Slice<int64_t>(receiver)).value);

  receiver[0] = word(reinterpret_cast<uintptr_t>(zoo.anAnimal));
  assertEqual<int64_t>(word(zoo.entry(zoo.animal, "speak")),
                       env.run(s, Slice<int64_t>(receiver)).value);

  receiver[0] = 0;
  assertEqual<unsigned>(Evaluator::Threw,
                        env.run(s, Slice<int64_t>(receiver)).outcome);
  assertTrue(env.takeException()
             == env.bootType(Machine::NullPointerExceptionType));

  ResolutionGuard* guard = makeResolutionGuard(env.t, zoo.pool, 2);
  Evaluator::Result r = env.run(g->genInvokeVirtual(
      &env.c, Argument::forObject(zoo.aDog), MethodRef::unresolved(guard)));
  assertEqual<unsigned>(Evaluator::Normal, r.outcome);
  assertEqual<int64_t>(word(zoo.entry(zoo.dog, "speak")), r.value);

  // private methods have no vtable slot to dispatch through
  r = env.run(g->genInvokeVirtual(
      &env.c,
      Argument::forObject(zoo.aDog),
      MethodRef::unresolved(makeResolutionGuard(env.t, zoo.pool, 1))));
  assertEqual<unsigned>(Evaluator::Threw, r.outcome);
  assertTrue(env.takeException()
             == env.bootType(Machine::IncompatibleClassChangeErrorType));
}

TEST(DispatchInterface)
{
  CodegenEnv env;
  Zoo zoo(&env);
  TemplateGenerator* g = &env.generator;

  Method* play = findMethod(zoo.pet, "play");
  assertEqual<unsigned>(2, play->interfaceIndex);

  Snippet* s = g->genInvokeInterface(
      &env.c, Argument::forObject(zoo.aDog), MethodRef::resolved(play));
  assertEqual("invokeinterface", s->template_->name);
  assertEqual<int64_t>(word(zoo.entry(zoo.dog, "play")), env.run(s).value);

  Evaluator::Result r = env.run(g->genInvokeInterface(
      &env.c, Argument::forObject(zoo.aDog), MethodRef::resolved(findMethod(zoo.pet, "name"))));
  assertEqual<int64_t>(word(zoo.entry(zoo.dog, "name")), r.value);

  ResolutionGuard* guard = makeResolutionGuard(env.t, zoo.pool, 3);
  s = g->genInvokeInterface(
      &env.c, Argument::forObject(zoo.aDog), MethodRef::unresolved(guard));
  assertEqual("invokeinterface-unresolved", s->template_->name);
  assertEqual<int64_t>(word(zoo.entry(zoo.dog, "play")), env.run(s).value);

  r = env.run(g->genInvokeInterface(
      &env.c, Argument::forObject(0), MethodRef::resolved(play)));
  assertEqual<unsigned>(Evaluator::Threw, r.outcome);
  assertTrue(env.takeException()
             == env.bootType(Machine::NullPointerExceptionType));
}

TEST(DispatchInterfaceCollisions)
{
  CodegenEnv env;
  Zoo zoo(&env);
  Robot r(&env);

  assertEqual<unsigned>(ImplementedCount + 2, r.robot->supertypes.count);
  assertTrue(r.mtableLength(env.m) > r.robot->supertypes.count);

  for (unsigned i = 0; i < ImplementedCount; ++i) {
    Method* action = findMethod(r.capabilities[i], actionNames[i]);
    Evaluator::Result result = env.run(env.generator.genInvokeInterface(
        &env.c, Argument::forObject(r.aRobot), MethodRef::resolved(action)));
    assertEqual<unsigned>(Evaluator::Normal, result.outcome);
    assertEqual<int64_t>(word(zoo.entry(r.robot, actionNames[i])),
                         result.value);
  }

  // a dog sees none of the capabilities but still reaches Pet.play
  Evaluator::Result result = env.run(env.generator.genInvokeInterface(
      &env.c,
      Argument::forObject(zoo.aDog),
      MethodRef::resolved(findMethod(zoo.pet, "play"))));
  assertEqual<int64_t>(word(zoo.entry(zoo.dog, "play")), result.value);
}

TEST(DispatchMethodHandles)
{
  CodegenEnv env;
  Zoo zoo(&env);
  TemplateGenerator* g = &env.generator;

  MemberName* create = makeMemberName(env.t, findMethod(zoo.animal, "create"));
  MemberName* secret = makeMemberName(env.t, findMethod(zoo.animal, "secret"));
  MemberName* speak = makeMemberName(env.t, findMethod(zoo.animal, "speak"));
  MemberName* play = makeMemberName(env.t, findMethod(zoo.pet, "play"));

  Evaluator::Result r
      = env.run(g->genInvokeHandle(&env.c, Argument::forObject(secret)));
  assertEqual<int64_t>(word(secret->target->entry), r.value);

  Snippet* s = g->genLinkToStatic(&env.c, Argument::forObject(create));
  assertEqual("linkto-static", s->template_->name);
  assertEqual<int64_t>(word(create->target->entry), env.run(s).value);

  r = env.run(g->genLinkToStatic(&env.c, Argument::forObject(speak)));
  assertEqual<unsigned>(Evaluator::Threw, r.outcome);
  assertTrue(env.takeException()
             == env.bootType(Machine::IncompatibleClassChangeErrorType));

  s = g->genLinkToSpecial(&env.c, Argument::forObject(secret));
  assertEqual("linkto-special", s->template_->name);
  assertEqual<int64_t>(word(secret->target->entry), env.run(s).value);

  s = g->genLinkToVirtual(
      &env.c, Argument::forObject(speak), Argument::forObject(zoo.aDog));
  assertEqual("linkto-virtual", s->template_->name);
  assertEqual<int64_t>(word(zoo.entry(zoo.dog, "speak")), env.run(s).value);

  s = g->genLinkToInterface(
      &env.c, Argument::forObject(play), Argument::forObject(zoo.aDog));
  assertEqual("linkto-interface", s->template_->name);
  assertEqual<int64_t>(word(zoo.entry(zoo.dog, "play")), env.run(s).value);

  r = env.run(g->genLinkToInterface(
      &env.c, Argument::forObject(play), Argument::forObject(zoo.anAnimal)));
  assertEqual<unsigned>(Evaluator::Threw, r.outcome);
  assertTrue(env.takeException()
             == env.bootType(Machine::IncompatibleClassChangeErrorType));

  r = env.run(g->genLinkToVirtual(
      &env.c, Argument::forObject(0), Argument::forObject(zoo.aDog)));
  assertEqual<unsigned>(Evaluator::Threw, r.outcome);
  assertTrue(env.takeException()
             == env.bootType(Machine::NullPointerExceptionType));
}
