/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include "test-harness.h"
#include "env.h"

using namespace lowering::vm;
using namespace lowering::util;
using namespace lowering::codegen;

namespace {

int64_t word(object o)
{
  return static_cast<int64_t>(reinterpret_cast<uintptr_t>(o));
}

class Family {
 public:
  Family(MachineEnv* env) : env(env)
  {
    pet = env->define(
        "Pet", 0, Slice<FieldSpec>(), Slice<MethodSpec>(), InterfaceFlag);
    animal = env->define("Animal");

    Type* interfaces[] = {pet};
    dog = env->define("Dog",
                      animal,
                      Slice<FieldSpec>(),
                      Slice<MethodSpec>(),
                      FinalFlag,
                      Slice<Type*>(interfaces));
    cat = env->define("Cat", animal);

    aDog = allocateTuple(env->t, dog);
    aCat = allocateTuple(env->t, cat);
    dogs = allocateArray(env->t, arrayTypeOf(env->t, dog), 2);
    animals = allocateArray(env->t, arrayTypeOf(env->t, animal), 2);
    ints = allocateArray(env->t, primitiveArrayType(env->m, IntKind), 2);
  }

  MachineEnv* env;
  Type* pet;
  Type* animal;
  Type* dog;
  Type* cat;
  object aDog;
  object aCat;
  object dogs;
  object animals;
  object ints;
};

Evaluator::Outcome check(CodegenEnv* env,
                         Snippet* s,
                         object o)
{
  int64_t values[] = {word(o)};
  return env->run(s, Slice<int64_t>(values)).outcome;
}

}  // namespace

TEST(TypeCheckCast)
{
  CodegenEnv env;
  Family f(&env);
  Argument o = Argument::forVariable(0, ObjectKind);

  Snippet* s
      = env.generator.genCheckCast(&env.c, Site(), o, TypeRef::resolved(f.animal));
  assertEqual("checkcast", s->template_->name);
  assertEqual<unsigned>(Evaluator::Normal, check(&env, s, f.aDog));
  assertEqual<unsigned>(Evaluator::Normal, check(&env, s, f.aCat));
  assertEqual<unsigned>(Evaluator::Normal, check(&env, s, 0));
  assertEqual<unsigned>(Evaluator::Threw, check(&env, s, f.ints));
  assertTrue(env.takeException()
             == env.bootType(Machine::ClassCastExceptionType));

  s = env.generator.genCheckCast(&env.c, Site(), o, TypeRef::resolved(f.dog));
  assertEqual("checkcast-leaf", s->template_->name);
  assertEqual<unsigned>(Evaluator::Normal, check(&env, s, f.aDog));
  assertEqual<unsigned>(Evaluator::Normal, check(&env, s, 0));
  assertEqual<unsigned>(Evaluator::Threw, check(&env, s, f.aCat));
  assertTrue(env.takeException()
             == env.bootType(Machine::ClassCastExceptionType));

  s = env.generator.genCheckCast(
      &env.c, Site(Site::NonNull), o, TypeRef::resolved(f.dog));
  assertEqual("checkcast-leaf-nonnull", s->template_->name);
  assertEqual<unsigned>(Evaluator::Normal, check(&env, s, f.aDog));

  s = env.generator.genCheckCast(
      &env.c, Site(Site::NonNull), o, TypeRef::resolved(f.pet));
  assertEqual("checkcast-nonnull", s->template_->name);
  assertEqual<unsigned>(Evaluator::Normal, check(&env, s, f.aDog));
  assertEqual<unsigned>(Evaluator::Threw, check(&env, s, f.aCat));
  env.takeException();
}

TEST(TypeInstanceOf)
{
  CodegenEnv env;
  Family f(&env);
  Argument o = Argument::forVariable(0, ObjectKind);

  Snippet* s = env.generator.genInstanceOf(
      &env.c, Site(), o, TypeRef::resolved(f.animal));
  assertEqual("instanceof", s->template_->name);
  assertEqual<unsigned>(Evaluator::TrueSuccessor, check(&env, s, f.aDog));
  assertEqual<unsigned>(Evaluator::TrueSuccessor, check(&env, s, f.aCat));
  assertEqual<unsigned>(Evaluator::FalseSuccessor, check(&env, s, 0));
  assertEqual<unsigned>(Evaluator::FalseSuccessor, check(&env, s, f.dogs));

  s = env.generator.genInstanceOf(&env.c, Site(), o, TypeRef::resolved(f.dog));
  assertEqual("instanceof-leaf", s->template_->name);
  assertEqual<unsigned>(Evaluator::TrueSuccessor, check(&env, s, f.aDog));
  assertEqual<unsigned>(Evaluator::FalseSuccessor, check(&env, s, f.aCat));
  assertEqual<unsigned>(Evaluator::FalseSuccessor, check(&env, s, 0));

  s = env.generator.genInstanceOf(
      &env.c, Site(Site::NonNull), o, TypeRef::resolved(f.pet));
  assertEqual("instanceof-nonnull", s->template_->name);
  assertEqual<unsigned>(Evaluator::TrueSuccessor, check(&env, s, f.aDog));
  assertEqual<unsigned>(Evaluator::FalseSuccessor, check(&env, s, f.aCat));

  s = env.generator.genInstanceOf(&env.c,
                                  Site(),
                                  o,
                                  TypeRef::resolved(
                                      env.bootType(Machine::ObjectType)));
  assertEqual<unsigned>(Evaluator::TrueSuccessor, check(&env, s, f.ints));
  assertEqual<unsigned>(Evaluator::TrueSuccessor, check(&env, s, f.aCat));
}

TEST(TypeInterfaceCollisions)
{
  CodegenEnv env;
  Argument o = Argument::forVariable(0, ObjectKind);

  const char* const names[]
      = {"Trait0", "Trait1", "Trait2", "Trait3", "Trait4", "Trait5", "Trait6"};
  const unsigned TraitCount = sizeof(names) / sizeof(names[0]);
  const unsigned ImplementedCount = 5;

  Type* traits[TraitCount];
  for (unsigned i = 0; i < TraitCount; ++i) {
    traits[i] = env.define(
        names[i], 0, Slice<FieldSpec>(), Slice<MethodSpec>(), InterfaceFlag);
  }

  // numbered right after the traits, so its id shares a slot with the
  // first trait's unless the mtable is longer than the supertype count
  Type* widget = env.define("Widget",
                            0,
                            Slice<FieldSpec>(),
                            Slice<MethodSpec>(),
                            0,
                            Slice<Type*>(traits, ImplementedCount));
  object aWidget = allocateTuple(env.t, widget);
  object anObject = allocateTuple(env.t, env.bootType(Machine::ObjectType));

  assertEqual<unsigned>(ImplementedCount + 2, widget->supertypes.count);
  assertTrue(fieldAtOffset<uintptr_t>(widget->hub,
                                      env.m->layout.mTableLengthOffset())
             > widget->supertypes.count);

  for (unsigned i = 0; i < TraitCount; ++i) {
    Snippet* s = env.generator.genInstanceOf(
        &env.c, Site(), o, TypeRef::resolved(traits[i]));
    assertEqual<unsigned>(i < ImplementedCount ? Evaluator::TrueSuccessor
                                               : Evaluator::FalseSuccessor,
                          check(&env, s, aWidget));
    assertEqual<unsigned>(Evaluator::FalseSuccessor,
                          check(&env, s, anObject));
  }

  Snippet* s = env.generator.genInstanceOf(
      &env.c, Site(), o, TypeRef::resolved(widget));
  assertEqual<unsigned>(Evaluator::TrueSuccessor, check(&env, s, aWidget));
  assertEqual<unsigned>(Evaluator::FalseSuccessor, check(&env, s, anObject));

  s = env.generator.genCheckCast(
      &env.c, Site(), o, TypeRef::resolved(traits[TraitCount - 1]));
  assertEqual<unsigned>(Evaluator::Threw, check(&env, s, aWidget));
  assertTrue(env.takeException()
             == env.bootType(Machine::ClassCastExceptionType));
}

TEST(TypeArrayCovariance)
{
  CodegenEnv env;
  Family f(&env);
  Argument o = Argument::forVariable(0, ObjectKind);

  Snippet* s = env.generator.genInstanceOf(
      &env.c, Site(), o, TypeRef::resolved(arrayTypeOf(env.t, f.animal)));
  assertEqual<unsigned>(Evaluator::TrueSuccessor, check(&env, s, f.dogs));
  assertEqual<unsigned>(Evaluator::TrueSuccessor, check(&env, s, f.animals));
  assertEqual<unsigned>(Evaluator::FalseSuccessor, check(&env, s, f.ints));

  s = env.generator.genInstanceOf(
      &env.c, Site(), o, TypeRef::resolved(arrayTypeOf(env.t, f.dog)));
  // arrays of a final class are not leaves
  assertEqual("instanceof", s->template_->name);
  assertEqual<unsigned>(Evaluator::FalseSuccessor, check(&env, s, f.animals));

  s = env.generator.genInstanceOf(
      &env.c, Site(), o, TypeRef::resolved(arrayTypeOf(env.t, f.pet)));
  assertEqual<unsigned>(Evaluator::TrueSuccessor, check(&env, s, f.dogs));

  s = env.generator.genInstanceOf(
      &env.c, Site(), o, TypeRef::resolved(env.bootType(Machine::CloneableType)));
  assertEqual<unsigned>(Evaluator::TrueSuccessor, check(&env, s, f.ints));
  assertEqual<unsigned>(Evaluator::TrueSuccessor, check(&env, s, f.dogs));
  assertEqual<unsigned>(Evaluator::FalseSuccessor, check(&env, s, f.aDog));

  s = env.generator.genCheckCast(
      &env.c, Site(), o, TypeRef::resolved(arrayTypeOf(env.t, f.animal)));
  assertEqual<unsigned>(Evaluator::Normal, check(&env, s, f.dogs));
  assertEqual<unsigned>(Evaluator::Threw, check(&env, s, f.ints));
  assertTrue(env.takeException()
             == env.bootType(Machine::ClassCastExceptionType));
}

TEST(TypeMaterializedInstanceOf)
{
  CodegenEnv env;
  Family f(&env);
  Argument o = Argument::forVariable(0, ObjectKind);

  Snippet* s = env.generator.genMaterializeInstanceOf(&env.c,
                                                      Site(),
                                                      o,
                                                      TypeRef::resolved(f.pet),
                                                      Argument::forInt(7),
                                                      Argument::forInt(3));
  assertEqual("instanceof-materialized", s->template_->name);

  int64_t values[] = {word(f.aDog)};
  assertEqual<int64_t>(7, env.run(s, Slice<int64_t>(values)).value);
  values[0] = word(f.aCat);
  assertEqual<int64_t>(3, env.run(s, Slice<int64_t>(values)).value);
  values[0] = 0;
  assertEqual<int64_t>(3, env.run(s, Slice<int64_t>(values)).value);

  s = env.generator.genMaterializeInstanceOf(&env.c,
                                             Site(Site::NonNull),
                                             o,
                                             TypeRef::resolved(f.dog),
                                             Argument::forInt(1),
                                             Argument::forInt(0));
  assertEqual("instanceof-materialized-leaf-nonnull", s->template_->name);
  values[0] = word(f.aDog);
  assertEqual<int64_t>(1, env.run(s, Slice<int64_t>(values)).value);
  values[0] = word(f.aCat);
  assertEqual<int64_t>(0, env.run(s, Slice<int64_t>(values)).value);
}

TEST(TypeUnresolved)
{
  CodegenEnv env;
  Family f(&env);
  Argument o = Argument::forVariable(0, ObjectKind);

  Reference references[] = {Reference(Reference::ClassReference, "Animal"),
                            Reference(Reference::ClassReference, "Dog"),
                            Reference(Reference::ClassReference, "Horse")};
  ConstantPool* pool
      = makeConstantPool(env.t, f.animal, Slice<Reference>(references));
  ResolutionGuard* animal = makeResolutionGuard(env.t, pool, 0);
  ResolutionGuard* dog = makeResolutionGuard(env.t, pool, 1);
  ResolutionGuard* horse = makeResolutionGuard(env.t, pool, 2);

  Snippet* s = env.generator.genCheckCast(
      &env.c, Site(), o, TypeRef::unresolved(dog));
  assertEqual("checkcast-unresolved", s->template_->name);

  // null passes without resolving anything
  unsigned resolutions = env.m->resolutions;
  assertEqual<unsigned>(Evaluator::Normal, check(&env, s, 0));
  assertEqual<unsigned>(resolutions, env.m->resolutions);

  assertEqual<unsigned>(Evaluator::Normal, check(&env, s, f.aDog));
  assertEqual<unsigned>(resolutions + 1, env.m->resolutions);
  assertEqual<unsigned>(Evaluator::Threw, check(&env, s, f.aCat));
  assertTrue(env.takeException()
             == env.bootType(Machine::ClassCastExceptionType));
  assertEqual<unsigned>(resolutions + 1, env.m->resolutions);

  s = env.generator.genCheckCast(&env.c, Site(), o, TypeRef::unresolved(horse));
  assertEqual<unsigned>(Evaluator::Threw, check(&env, s, f.aCat));
  assertTrue(env.takeException()
             == env.bootType(Machine::NoClassDefFoundErrorType));

  s = env.generator.genInstanceOf(
      &env.c, Site(), o, TypeRef::unresolved(animal));
  assertEqual("instanceof-unresolved", s->template_->name);
  assertEqual<unsigned>(Evaluator::TrueSuccessor, check(&env, s, f.aCat));
  assertEqual<unsigned>(Evaluator::FalseSuccessor, check(&env, s, f.ints));
  assertEqual<unsigned>(Evaluator::FalseSuccessor, check(&env, s, 0));

  s = env.generator.genMaterializeInstanceOf(&env.c,
                                             Site(),
                                             o,
                                             TypeRef::unresolved(dog),
                                             Argument::forInt(5),
                                             Argument::forInt(9));
  assertEqual("instanceof-materialized-unresolved", s->template_->name);
  int64_t values[] = {word(f.aDog)};
  assertEqual<int64_t>(5, env.run(s, Slice<int64_t>(values)).value);
  values[0] = word(f.aCat);
  assertEqual<int64_t>(9, env.run(s, Slice<int64_t>(values)).value);
}

TEST(TypeAssert)
{
  CodegenEnv env;
  Family f(&env);
  Argument o = Argument::forVariable(0, ObjectKind);

  Snippet* s
      = env.generator.genTypeAssert(&env.c, o, TypeRef::resolved(f.animal));
  assertEqual("typeassert", s->template_->name);

  object anAnimal = allocateTuple(env.t, f.animal);
  assertEqual<unsigned>(Evaluator::Normal, check(&env, s, anAnimal));

  // a subtype is still a mismatch since the hub must match exactly
  assertEqual<unsigned>(Evaluator::Deoptimized, check(&env, s, f.aDog));
  assertTrue(env.t->exception == 0);
}
