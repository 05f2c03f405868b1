/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <lowering/codegen/generator.h>
#include <lowering/vm/machine.h>

using namespace lowering::util;
using namespace lowering::vm;

namespace {

const char* typeCheckName(lowering::vm::Zone* zone,
                          const char* operation,
                          bool leaf,
                          bool nonNull)
{
  return zone->format(
      "%s%s%s", operation, leaf ? "-leaf" : "", nonNull ? "-nonnull" : "");
}

}  // namespace

namespace lowering {
namespace codegen {

void TemplateGenerator::buildTypeCheckTemplates()
{
  for (unsigned leaf = 0; leaf < 2; ++leaf) {
    for (unsigned nonNull = 0; nonNull < 2; ++nonNull) {
      checkCastTemplates[leaf][nonNull] = buildCheckCast(leaf, nonNull);
      instanceOfTemplates[leaf][nonNull] = buildInstanceOf(leaf, nonNull);
      materializeInstanceOfTemplates[leaf][nonNull]
          = buildMaterializeInstanceOf(leaf, nonNull);
    }
  }

  unresolvedCheckCastTemplate = buildUnresolvedCheckCast();
  unresolvedInstanceOfTemplate = buildUnresolvedInstanceOf();
  unresolvedMaterializeInstanceOfTemplate
      = buildUnresolvedMaterializeInstanceOf();
  typeAssertTemplate = buildTypeAssert();
}

// Looks typeId up in the hub's mtable and branches to failure unless
// the hub word it names holds typeId.  Falls through to success (or
// jumps to it if one is given) otherwise.
void TemplateGenerator::probeSupertype(TemplateAssembler* a,
                                       Operand* hub,
                                       Operand* typeId,
                                       Label* success,
                                       Label* failure)
{
  Operand* slot = a->createTemp("slot", IntKind);
  Operand* entry = a->createTemp("entry", a->wordKind());

  mtableSlot(a, hub, typeId, slot);
  a->pload(a->wordKind(),
           entry,
           hub,
           slot,
           layout.firstElementOffset(),
           layout.wordSize,
           false);
  a->jneq(failure, entry, typeId);
  if (success) {
    a->jmp(success);
  }
}

Template* TemplateGenerator::buildCheckCast(bool leaf, bool nonNull)
{
  TemplateAssembler* a = &assembler;

  a->restart();
  Operand* object = a->createInputParameter("object", ObjectKind);
  Operand* hub = a->createConstantInputParameter("hub", ObjectKind);
  Operand* typeId
      = leaf ? 0 : a->createConstantInputParameter("typeId", a->wordKind());
  Operand* objectHub = a->createTemp("objectHub", ObjectKind);

  Label* pass = a->createInlineLabel("pass");
  Label* fail = a->createOutOfLineLabel("fail");

  if (not nonNull) {
    a->jeq(pass, object, a->o(0));
  }

  a->pload(ObjectKind, objectHub, object, a->i(layout.hubOffset()), false);

  if (leaf) {
    a->jneq(fail, objectHub, hub);
  } else {
    a->jeq(pass, objectHub, hub);
    probeSupertype(a, objectHub, typeId, 0, fail);
  }

  a->bindInline(pass);

  a->bindOutOfLine(fail);
  callRuntimeThroughStub(
      a, "throwClassCastException", 0, operands(hub, object));
  a->shouldNotReachHere();

  return finish(a, 0, typeCheckName(&zone, "checkcast", leaf, nonNull));
}

Template* TemplateGenerator::buildInstanceOf(bool leaf, bool nonNull)
{
  TemplateAssembler* a = &assembler;

  a->restart();
  Operand* object = a->createInputParameter("object", ObjectKind);
  Operand* hub = a->createConstantInputParameter("hub", ObjectKind);
  Operand* typeId
      = leaf ? 0 : a->createConstantInputParameter("typeId", a->wordKind());
  Operand* objectHub = a->createTemp("objectHub", ObjectKind);

  Label* isTrue = a->trueSuccessor();
  Label* isFalse = a->falseSuccessor();

  if (not nonNull) {
    a->jeq(isFalse, object, a->o(0));
  }

  a->pload(ObjectKind, objectHub, object, a->i(layout.hubOffset()), false);
  a->jeq(isTrue, objectHub, hub);

  if (leaf) {
    a->jmp(isFalse);
  } else {
    probeSupertype(a, objectHub, typeId, isTrue, isFalse);
  }

  return finish(a, 0, typeCheckName(&zone, "instanceof", leaf, nonNull));
}

Template* TemplateGenerator::buildMaterializeInstanceOf(bool leaf,
                                                        bool nonNull)
{
  TemplateAssembler* a = &assembler;

  Operand* result = a->restart(IntKind);
  Operand* object = a->createInputParameter("object", ObjectKind);
  Operand* hub = a->createConstantInputParameter("hub", ObjectKind);
  Operand* typeId
      = leaf ? 0 : a->createConstantInputParameter("typeId", a->wordKind());
  Operand* trueValue = a->createConstantInputParameter("trueValue", IntKind);
  Operand* falseValue = a->createConstantInputParameter("falseValue", IntKind);
  Operand* objectHub = a->createTemp("objectHub", ObjectKind);

  Label* isTrue = a->createInlineLabel("isTrue");
  Label* isFalse = a->createInlineLabel("isFalse");
  Label* done = a->createInlineLabel("done");

  if (not nonNull) {
    a->jeq(isFalse, object, a->o(0));
  }

  a->pload(ObjectKind, objectHub, object, a->i(layout.hubOffset()), false);
  a->jeq(isTrue, objectHub, hub);

  if (leaf) {
    a->jmp(isFalse);
  } else {
    probeSupertype(a, objectHub, typeId, isTrue, isFalse);
  }

  a->bindInline(isTrue);
  a->mov(result, trueValue);
  a->jmp(done);

  a->bindInline(isFalse);
  a->mov(result, falseValue);

  a->bindInline(done);

  return finish(
      a, result, typeCheckName(&zone, "instanceof-materialized", leaf, nonNull));
}

Template* TemplateGenerator::buildUnresolvedCheckCast()
{
  TemplateAssembler* a = &assembler;

  a->restart();
  Operand* object = a->createInputParameter("object", ObjectKind);
  Operand* guard = a->createConstantInputParameter("guard", ObjectKind);

  callRuntimeThroughStub(a, "unresolvedCheckcast", 0, operands(object, guard));

  return finish(a, 0, "checkcast-unresolved");
}

Template* TemplateGenerator::buildUnresolvedInstanceOf()
{
  TemplateAssembler* a = &assembler;

  a->restart();
  Operand* object = a->createInputParameter("object", ObjectKind);
  Operand* guard = a->createConstantInputParameter("guard", ObjectKind);
  Operand* r = a->createTemp("r", BooleanKind);

  callRuntimeThroughStub(a, "unresolvedInstanceOf", r, operands(object, guard));
  a->jneq(a->trueSuccessor(), r, a->b(false));
  a->jmp(a->falseSuccessor());

  return finish(a, 0, "instanceof-unresolved");
}

Template* TemplateGenerator::buildUnresolvedMaterializeInstanceOf()
{
  TemplateAssembler* a = &assembler;

  Operand* result = a->restart(IntKind);
  Operand* object = a->createInputParameter("object", ObjectKind);
  Operand* guard = a->createConstantInputParameter("guard", ObjectKind);
  Operand* trueValue = a->createConstantInputParameter("trueValue", IntKind);
  Operand* falseValue = a->createConstantInputParameter("falseValue", IntKind);
  Operand* r = a->createTemp("r", BooleanKind);

  Label* isTrue = a->createInlineLabel("isTrue");
  Label* done = a->createInlineLabel("done");

  callRuntimeThroughStub(a, "unresolvedInstanceOf", r, operands(object, guard));
  a->jneq(isTrue, r, a->b(false));
  a->mov(result, falseValue);
  a->jmp(done);

  a->bindInline(isTrue);
  a->mov(result, trueValue);

  a->bindInline(done);

  return finish(a, result, "instanceof-materialized-unresolved");
}

Template* TemplateGenerator::buildTypeAssert()
{
  TemplateAssembler* a = &assembler;

  a->restart();
  Operand* object = a->createInputParameter("object", ObjectKind);
  Operand* hub = a->createConstantInputParameter("hub", ObjectKind);
  Operand* objectHub = a->createTemp("objectHub", ObjectKind);

  Label* mismatch = a->createOutOfLineLabel("mismatch");

  a->pload(ObjectKind, objectHub, object, a->i(layout.hubOffset()), true);
  a->jneq(mismatch, objectHub, hub);

  a->bindOutOfLine(mismatch);
  a->deoptimize();

  return finish(a, 0, "typeassert");
}

Snippet* TemplateGenerator::genCheckCast(Compilation* c,
                                         Site site,
                                         Argument object,
                                         TypeRef type)
{
  if (type.tag == TypeRef::Unresolved) {
    return snippet(c,
                   require(CheckCast, VoidKind, false, 0),
                   arguments(object, guardArgument(type.guard)));
  }

  bool leaf = type.type->isLeaf();
  unsigned flags = (leaf ? LeafFlag : 0)
                   | (site.isNonNull() ? NonNullFlag : 0);
  Template* t = require(CheckCast, VoidKind, true, flags);

  if (leaf) {
    return snippet(c, t, arguments(object, hubArgument(type.type)));
  } else {
    return snippet(c,
                   t,
                   arguments(object,
                             hubArgument(type.type),
                             Argument::forWord(type.type->id)));
  }
}

Snippet* TemplateGenerator::genInstanceOf(Compilation* c,
                                          Site site,
                                          Argument object,
                                          TypeRef type)
{
  if (type.tag == TypeRef::Unresolved) {
    return snippet(c,
                   require(InstanceOf, VoidKind, false, 0),
                   arguments(object, guardArgument(type.guard)));
  }

  bool leaf = type.type->isLeaf();
  unsigned flags = (leaf ? LeafFlag : 0)
                   | (site.isNonNull() ? NonNullFlag : 0);
  Template* t = require(InstanceOf, VoidKind, true, flags);

  if (leaf) {
    return snippet(c, t, arguments(object, hubArgument(type.type)));
  } else {
    return snippet(c,
                   t,
                   arguments(object,
                             hubArgument(type.type),
                             Argument::forWord(type.type->id)));
  }
}

Snippet* TemplateGenerator::genMaterializeInstanceOf(Compilation* c,
                                                     Site site,
                                                     Argument object,
                                                     TypeRef type,
                                                     Argument trueValue,
                                                     Argument falseValue)
{
  if (type.tag == TypeRef::Unresolved) {
    return snippet(
        c,
        require(MaterializeInstanceOf, VoidKind, false, 0),
        arguments(object, guardArgument(type.guard), trueValue, falseValue));
  }

  bool leaf = type.type->isLeaf();
  unsigned flags = (leaf ? LeafFlag : 0)
                   | (site.isNonNull() ? NonNullFlag : 0);
  Template* t = require(MaterializeInstanceOf, VoidKind, true, flags);

  if (leaf) {
    return snippet(
        c,
        t,
        arguments(object, hubArgument(type.type), trueValue, falseValue));
  } else {
    return snippet(c,
                   t,
                   arguments(object,
                             hubArgument(type.type),
                             Argument::forWord(type.type->id),
                             trueValue,
                             falseValue));
  }
}

Snippet* TemplateGenerator::genTypeAssert(Compilation* c,
                                          Argument object,
                                          TypeRef type)
{
  if (type.tag == TypeRef::Unresolved) {
    fprintf(stderr, "type assertion against an unresolved type\n");
    abort(s);
  }

  return snippet(c,
                 require(TypeAssert, VoidKind, true, 0),
                 arguments(object, hubArgument(type.type)));
}

}  // namespace codegen
}  // namespace lowering
