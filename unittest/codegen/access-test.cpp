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

Type* definePoint(MachineEnv* env)
{
  FieldSpec fields[] = {FieldSpec("flag", BooleanKind),
                        FieldSpec("b", ByteKind),
                        FieldSpec("c", CharKind),
                        FieldSpec("i", IntKind),
                        FieldSpec("l", LongKind),
                        FieldSpec("d", DoubleKind),
                        FieldSpec("next", ObjectKind),
                        FieldSpec("total", IntKind, true),
                        FieldSpec("origin", ObjectKind, true)};
  return env->define("Point", 0, Slice<FieldSpec>(fields));
}

}  // namespace

TEST(AccessInstanceFields)
{
  CodegenEnv env;
  Type* point = definePoint(&env);
  object o = allocateTuple(env.t, point);
  object other = allocateTuple(env.t, point);

  TemplateGenerator* g = &env.generator;
  Compilation* c = &env.c;
  Site site;

  Field* i = findField(point, "i");
  Evaluator::Result r = env.run(g->genPutField(c,
                                               site,
                                               Argument::forObject(o),
                                               FieldRef::resolved(i),
                                               Argument::forInt(42)));
  assertEqual<unsigned>(Evaluator::Normal, r.outcome);
  assertEqual<int32_t>(42, fieldAtOffset<int32_t>(o, i->offset));

  r = env.run(
      g->genGetField(c, site, Argument::forObject(o), FieldRef::resolved(i)));
  assertEqual<unsigned>(Evaluator::Normal, r.outcome);
  assertEqual<int64_t>(42, r.value);

  // narrow loads widen by the field's signedness
  Field* b = findField(point, "b");
  fieldAtOffset<int8_t>(o, b->offset) = -2;
  r = env.run(
      g->genGetField(c, site, Argument::forObject(o), FieldRef::resolved(b)));
  assertEqual<int64_t>(-2, r.value);

  Field* ch = findField(point, "c");
  fieldAtOffset<uint16_t>(o, ch->offset) = 0xfffe;
  r = env.run(
      g->genGetField(c, site, Argument::forObject(o), FieldRef::resolved(ch)));
  assertEqual<int64_t>(0xfffe, r.value);

  Field* l = findField(point, "l");
  env.run(g->genPutField(c,
                         site,
                         Argument::forObject(o),
                         FieldRef::resolved(l),
                         Argument::forLong(0x123456789LL)));
  assertEqual<int64_t>(0x123456789LL, fieldAtOffset<int64_t>(o, l->offset));

  Field* next = findField(point, "next");
  env.run(g->genPutField(c,
                         site,
                         Argument::forObject(o),
                         FieldRef::resolved(next),
                         Argument::forObject(other)));
  assertTrue(fieldAtOffset<object>(o, next->offset) == other);
  assertTrue(env.runObject(g->genGetField(c,
                                          site,
                                          Argument::forObject(o),
                                          FieldRef::resolved(next)))
             == other);
}

TEST(AccessVariableArguments)
{
  CodegenEnv env;
  Type* point = definePoint(&env);
  object o = allocateTuple(env.t, point);
  Field* i = findField(point, "i");

  Snippet* put = env.generator.genPutField(&env.c,
                                           Site(),
                                           Argument::forVariable(0, ObjectKind),
                                           FieldRef::resolved(i),
                                           Argument::forVariable(1, IntKind));
  assertEqual("putfield-int", put->template_->name);

  int64_t variables[] = {static_cast<int64_t>(reinterpret_cast<uintptr_t>(o)),
                         -7};
  Evaluator::Result r = env.run(put, Slice<int64_t>(variables));
  assertEqual<unsigned>(Evaluator::Normal, r.outcome);
  assertEqual<int32_t>(-7, fieldAtOffset<int32_t>(o, i->offset));
}

TEST(AccessNullReceiver)
{
  CodegenEnv env;
  Type* point = definePoint(&env);
  Field* i = findField(point, "i");

  Evaluator::Result r = env.run(env.generator.genGetField(
      &env.c, Site(), Argument::forObject(0), FieldRef::resolved(i)));
  assertEqual<unsigned>(Evaluator::Threw, r.outcome);
  assertTrue(env.takeException()
             == env.bootType(Machine::NullPointerExceptionType));
}

TEST(AccessStaticFields)
{
  CodegenEnv env;
  Type* point = definePoint(&env);
  object o = allocateTuple(env.t, point);

  Field* total = findField(point, "total");
  Evaluator::Result r
      = env.run(env.generator.genPutStatic(&env.c,
                                           Site(),
                                           Argument::forObject(point->staticTuple),
                                           FieldRef::resolved(total),
                                           Argument::forInt(9)));
  assertEqual<unsigned>(Evaluator::Normal, r.outcome);
  assertEqual<int32_t>(9, fieldAtOffset<int32_t>(point->staticTuple, total->offset));

  r = env.run(env.generator.genGetStatic(&env.c,
                                         Site(),
                                         Argument::forObject(point->staticTuple),
                                         FieldRef::resolved(total)));
  assertEqual<int64_t>(9, r.value);

  Field* origin = findField(point, "origin");
  env.run(env.generator.genPutStatic(&env.c,
                                     Site(),
                                     Argument::forObject(point->staticTuple),
                                     FieldRef::resolved(origin),
                                     Argument::forObject(o)));
  assertTrue(fieldAtOffset<object>(point->staticTuple, origin->offset) == o);
}

TEST(AccessUnresolvedFields)
{
  CodegenEnv env;
  Type* point = definePoint(&env);
  object o = allocateTuple(env.t, point);

  Reference references[]
      = {Reference(Reference::FieldReference, "Point", "i"),
         Reference(Reference::FieldReference, "Point", "total"),
         Reference(Reference::FieldReference, "Point", "missing")};
  ConstantPool* pool
      = makeConstantPool(env.t, point, Slice<Reference>(references));
  ResolutionGuard* i = makeResolutionGuard(env.t, pool, 0);
  ResolutionGuard* total = makeResolutionGuard(env.t, pool, 1);
  ResolutionGuard* missing = makeResolutionGuard(env.t, pool, 2);

  Snippet* put = env.generator.genPutField(&env.c,
                                           Site(),
                                           Argument::forObject(o),
                                           FieldRef::unresolved(i, IntKind),
                                           Argument::forInt(5));
  assertEqual("putfield-int-unresolved", put->template_->name);
  assertEqual<unsigned>(Evaluator::Normal, env.run(put).outcome);
  assertEqual<int32_t>(5, fieldAtOffset<int32_t>(o, findField(point, "i")->offset));
  assertTrue(i->resolved());

  // the same site runs again against the cached resolution
  unsigned resolutions = env.m->resolutions;
  Evaluator::Result r = env.run(env.generator.genGetField(
      &env.c, Site(), Argument::forObject(o), FieldRef::unresolved(i, IntKind)));
  assertEqual<int64_t>(5, r.value);
  assertEqual<unsigned>(resolutions, env.m->resolutions);

  unsigned initializations = env.m->initializations;
  env.run(env.generator.genPutStatic(&env.c,
                                     Site(),
                                     Argument::forObject(0),
                                     FieldRef::unresolved(total, IntKind),
                                     Argument::forInt(11)));
  assertTrue(point->initialized);
  assertTrue(env.m->initializations > initializations);
  r = env.run(env.generator.genGetStatic(&env.c,
                                         Site(),
                                         Argument::forObject(0),
                                         FieldRef::unresolved(total, IntKind)));
  assertEqual<int64_t>(11, r.value);

  // an instance access to a static field is a linkage error
  r = env.run(env.generator.genGetField(
      &env.c, Site(), Argument::forObject(o), FieldRef::unresolved(total, IntKind)));
  assertEqual<unsigned>(Evaluator::Threw, r.outcome);
  assertTrue(env.takeException()
             == env.bootType(Machine::IncompatibleClassChangeErrorType));

  r = env.run(env.generator.genGetField(
      &env.c, Site(), Argument::forObject(o), FieldRef::unresolved(missing, IntKind)));
  assertEqual<unsigned>(Evaluator::Threw, r.outcome);
  assertTrue(env.takeException() == env.bootType(Machine::NoSuchFieldErrorType));
  assertFalse(missing->resolved());
}

TEST(AccessArrays)
{
  CodegenEnv env;
  TemplateGenerator* g = &env.generator;
  Compilation* c = &env.c;

  object ints = allocateArray(env.t, primitiveArrayType(env.m, IntKind), 4);
  Site checked;
  Site unchecked(0);

  Evaluator::Result r = env.run(g->genArrayStore(c,
                                                 checked,
                                                 IntKind,
                                                 Argument::forObject(ints),
                                                 Argument::forInt(3),
                                                 Argument::forInt(77)));
  assertEqual<unsigned>(Evaluator::Normal, r.outcome);
  assertEqual<int32_t>(77, arrayElement<int32_t>(env.t, ints, 3));

  Snippet* load = g->genArrayLoad(
      c, unchecked, IntKind, Argument::forObject(ints), Argument::forInt(3));
  assertEqual("arrayload-int", load->template_->name);
  assertEqual<int64_t>(77, env.run(load).value);

  r = env.run(g->genArrayLength(c, Argument::forObject(ints)));
  assertEqual<int64_t>(4, r.value);

  object shorts = allocateArray(env.t, primitiveArrayType(env.m, ShortKind), 2);
  arrayElement<int16_t>(env.t, shorts, 1) = -300;
  r = env.run(g->genArrayLoad(
      c, checked, ShortKind, Argument::forObject(shorts), Argument::forInt(1)));
  assertEqual<int64_t>(-300, r.value);

  object longs = allocateArray(env.t, primitiveArrayType(env.m, LongKind), 2);
  env.run(g->genArrayStore(c,
                           checked,
                           LongKind,
                           Argument::forObject(longs),
                           Argument::forInt(1),
                           Argument::forLong(-1LL << 40)));
  assertEqual<int64_t>(-1LL << 40, arrayElement<int64_t>(env.t, longs, 1));
}

TEST(AccessArrayBounds)
{
  CodegenEnv env;
  TemplateGenerator* g = &env.generator;
  object ints = allocateArray(env.t, primitiveArrayType(env.m, IntKind), 4);

  const int32_t indexes[] = {4, -1, 0x7fffffff};
  for (unsigned i = 0; i < sizeof(indexes) / sizeof(indexes[0]); ++i) {
    Evaluator::Result r = env.run(g->genArrayLoad(&env.c,
                                                  Site(),
                                                  IntKind,
                                                  Argument::forObject(ints),
                                                  Argument::forInt(indexes[i])));
    assertEqual<unsigned>(Evaluator::Threw, r.outcome);
    object e = env.t->exception;
    assertTrue(env.takeException()
               == env.bootType(Machine::ArrayIndexOutOfBoundsExceptionType));
    assertEqual<int32_t>(indexes[i], throwableDetail(env.t, e));
  }

  Evaluator::Result r = env.run(g->genArrayStore(&env.c,
                                                 Site(),
                                                 IntKind,
                                                 Argument::forObject(ints),
                                                 Argument::forInt(4),
                                                 Argument::forInt(1)));
  assertEqual<unsigned>(Evaluator::Threw, r.outcome);
  assertTrue(env.takeException()
             == env.bootType(Machine::ArrayIndexOutOfBoundsExceptionType));

  r = env.run(g->genArrayLength(&env.c, Argument::forObject(0)));
  assertEqual<unsigned>(Evaluator::Threw, r.outcome);
  assertTrue(env.takeException()
             == env.bootType(Machine::NullPointerExceptionType));

  r = env.run(g->genArrayLoad(&env.c,
                              Site(),
                              IntKind,
                              Argument::forObject(0),
                              Argument::forInt(0)));
  assertEqual<unsigned>(Evaluator::Threw, r.outcome);
  assertTrue(env.takeException()
             == env.bootType(Machine::NullPointerExceptionType));
}

TEST(AccessArrayStoreCheck)
{
  CodegenEnv env;
  TemplateGenerator* g = &env.generator;

  Type* shape = env.define("Shape");
  Type* circle = env.define("Circle", shape);
  Type* other = env.define("Other");

  object shapes = allocateArray(env.t, arrayTypeOf(env.t, shape), 3);
  object aCircle = allocateTuple(env.t, circle);
  object aShape = allocateTuple(env.t, shape);
  object anOther = allocateTuple(env.t, other);

  Snippet* store = g->genArrayStore(&env.c,
                                    Site(),
                                    ObjectKind,
                                    Argument::forObject(shapes),
                                    Argument::forInt(0),
                                    Argument::forObject(aShape));
  assertEqual("arraystore-object-bounds-storecheck", store->template_->name);
  assertEqual<unsigned>(Evaluator::Normal, env.run(store).outcome);
  assertTrue(arrayElement<object>(env.t, shapes, 0) == aShape);

  // a subtype takes the out-of-line check and passes
  unsigned runtimeCalls = env.evaluator.runtimeCalls;
  assertEqual<unsigned>(Evaluator::Normal,
                        env.run(g->genArrayStore(&env.c,
                                                 Site(),
                                                 ObjectKind,
                                                 Argument::forObject(shapes),
                                                 Argument::forInt(1),
                                                 Argument::forObject(aCircle)))
                            .outcome);
  assertTrue(arrayElement<object>(env.t, shapes, 1) == aCircle);
  assertEqual<unsigned>(runtimeCalls + 1, env.evaluator.runtimeCalls);

  assertEqual<unsigned>(Evaluator::Normal,
                        env.run(g->genArrayStore(&env.c,
                                                 Site(),
                                                 ObjectKind,
                                                 Argument::forObject(shapes),
                                                 Argument::forInt(0),
                                                 Argument::forObject(0)))
                            .outcome);
  assertTrue(arrayElement<object>(env.t, shapes, 0) == 0);

  Evaluator::Result r = env.run(g->genArrayStore(&env.c,
                                                 Site(),
                                                 ObjectKind,
                                                 Argument::forObject(shapes),
                                                 Argument::forInt(2),
                                                 Argument::forObject(anOther)));
  assertEqual<unsigned>(Evaluator::Threw, r.outcome);
  assertTrue(env.takeException()
             == env.bootType(Machine::ArrayStoreExceptionType));
  assertTrue(arrayElement<object>(env.t, shapes, 2) == 0);

  Snippet* unchecked = g->genArrayStore(&env.c,
                                        Site(Site::BoundsCheck),
                                        ObjectKind,
                                        Argument::forObject(shapes),
                                        Argument::forInt(2),
                                        Argument::forObject(aShape));
  assertEqual("arraystore-object-bounds", unchecked->template_->name);

  Snippet* nullInto = g->genArrayStore(&env.c,
                                       Site(Site::StoreCheck),
                                       ObjectKind,
                                       Argument::forObject(0),
                                       Argument::forInt(0),
                                       Argument::forObject(0));
  assertEqual("arraystore-object-storecheck", nullInto->template_->name);
  r = env.run(nullInto);
  assertEqual<unsigned>(Evaluator::Threw, r.outcome);
  assertTrue(env.takeException()
             == env.bootType(Machine::NullPointerExceptionType));

  r = env.run(g->genArrayStore(&env.c,
                               Site(Site::StoreCheck),
                               ObjectKind,
                               Argument::forObject(0),
                               Argument::forInt(0),
                               Argument::forObject(aShape)));
  assertEqual<unsigned>(Evaluator::Threw, r.outcome);
  assertTrue(env.takeException()
             == env.bootType(Machine::NullPointerExceptionType));
}

TEST(AccessCardMarking)
{
  CodegenEnv env("cards");
  Type* point = definePoint(&env);
  object o = allocateTuple(env.t, point);
  object other = allocateTuple(env.t, point);
  object array = allocateArray(env.t, arrayTypeOf(env.t, point), 2);

  env.heap->clearCards();
  assertFalse(env.heap->dirty(o));

  env.run(env.generator.genPutField(&env.c,
                                    Site(),
                                    Argument::forObject(o),
                                    FieldRef::resolved(findField(point, "i")),
                                    Argument::forInt(1)));
  assertFalse(env.heap->dirty(o));

  env.run(env.generator.genPutField(&env.c,
                                    Site(),
                                    Argument::forObject(o),
                                    FieldRef::resolved(findField(point, "next")),
                                    Argument::forObject(other)));
  assertTrue(env.heap->dirty(o));

  env.heap->clearCards();
  env.run(env.generator.genArrayStore(&env.c,
                                      Site(),
                                      ObjectKind,
                                      Argument::forObject(array),
                                      Argument::forInt(1),
                                      Argument::forObject(other)));
  assertTrue(env.heap->dirty(array));
}
