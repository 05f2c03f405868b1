/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <lowering/codegen/generator.h>
#include <lowering/codegen/heap-scheme.h>
#include <lowering/vm/machine.h>

using namespace lowering::util;
using namespace lowering::vm;

namespace lowering {
namespace codegen {

void TemplateGenerator::buildAccessTemplates()
{
  for (unsigned k = 0; k < ElementKindCount; ++k) {
    Kind kind = static_cast<Kind>(k);

    getFieldTemplates[kind] = buildGetField(kind);
    putFieldTemplates[kind] = buildPutField(kind);
    getStaticTemplates[kind] = buildGetStatic(kind);
    putStaticTemplates[kind] = buildPutStatic(kind);

    for (unsigned b = 0; b < 2; ++b) {
      arrayLoadTemplates[kind][b] = buildArrayLoad(kind, b);
      arrayStoreTemplates[kind][b][0] = buildArrayStore(kind, b, false);
      arrayStoreTemplates[kind][b][1]
          = kind == ObjectKind ? buildArrayStore(kind, b, true)
                               : arrayStoreTemplates[kind][b][0];
    }
  }

  arrayLengthTemplate = buildArrayLength();
}

TemplatePair TemplateGenerator::buildGetField(Kind kind)
{
  TemplateAssembler* a = &assembler;
  TemplatePair pair;

  {
    Operand* result = a->restart(stackKind(kind));
    Operand* object = a->createInputParameter("object", ObjectKind);
    Operand* offset = a->createConstantInputParameter("offset", IntKind);

    a->pload(kind, result, object, offset, true);

    pair.resolved
        = finish(a, result, zone.format("getfield-%s", kindName(kind)));
  }

  {
    Operand* result = a->restart(stackKind(kind));
    Operand* object = a->createInputParameter("object", ObjectKind);
    Operand* guard = a->createConstantInputParameter("guard", ObjectKind);
    Operand* offset = a->createTemp("offset", IntKind);

    callRuntimeThroughStub(a, "resolveGetField", offset, operands(guard));
    a->pload(kind, result, object, offset, true);

    pair.unresolved = finish(
        a, result, zone.format("getfield-%s-unresolved", kindName(kind)));
  }

  return pair;
}

TemplatePair TemplateGenerator::buildPutField(Kind kind)
{
  TemplateAssembler* a = &assembler;
  TemplatePair pair;

  {
    a->restart();
    Operand* object = a->createInputParameter("object", ObjectKind);
    Operand* offset = a->createConstantInputParameter("offset", IntKind);
    Operand* value = a->createInputParameter("value", stackKind(kind));

    if (kind == ObjectKind) {
      barrier(a, HeapScheme::TuplePreBarrier, object, 0);
    }
    a->pstore(kind, object, offset, value, true);
    if (kind == ObjectKind) {
      barrier(a, HeapScheme::TuplePostBarrier, object, 0);
    }

    pair.resolved = finish(a, 0, zone.format("putfield-%s", kindName(kind)));
  }

  {
    a->restart();
    Operand* object = a->createInputParameter("object", ObjectKind);
    Operand* guard = a->createConstantInputParameter("guard", ObjectKind);
    Operand* value = a->createInputParameter("value", stackKind(kind));
    Operand* offset = a->createTemp("offset", IntKind);

    callRuntimeThroughStub(a, "resolvePutField", offset, operands(guard));

    if (kind == ObjectKind) {
      barrier(a, HeapScheme::TuplePreBarrier, object, 0);
    }
    a->pstore(kind, object, offset, value, true);
    if (kind == ObjectKind) {
      barrier(a, HeapScheme::TuplePostBarrier, object, 0);
    }

    pair.unresolved = finish(
        a, 0, zone.format("putfield-%s-unresolved", kindName(kind)));
  }

  return pair;
}

TemplatePair TemplateGenerator::buildGetStatic(Kind kind)
{
  TemplateAssembler* a = &assembler;
  TemplatePair pair;

  {
    Operand* result = a->restart(stackKind(kind));
    Operand* tuple = a->createInputParameter("staticTuple", ObjectKind);
    Operand* offset = a->createConstantInputParameter("offset", IntKind);

    a->pload(kind, result, tuple, offset, false);

    pair.resolved
        = finish(a, result, zone.format("getstatic-%s", kindName(kind)));
  }

  {
    Operand* result = a->restart(stackKind(kind));
    Operand* guard = a->createConstantInputParameter("guard", ObjectKind);
    Operand* tuple = a->createTemp("staticTuple", ObjectKind);
    Operand* offset = a->createTemp("offset", IntKind);

    callRuntimeThroughStub(a, "resolveStaticTuple", tuple, operands(guard));
    callRuntimeThroughStub(a, "resolveGetStatic", offset, operands(guard));
    a->pload(kind, result, tuple, offset, false);

    pair.unresolved = finish(
        a, result, zone.format("getstatic-%s-unresolved", kindName(kind)));
  }

  return pair;
}

TemplatePair TemplateGenerator::buildPutStatic(Kind kind)
{
  TemplateAssembler* a = &assembler;
  TemplatePair pair;

  {
    a->restart();
    Operand* tuple = a->createInputParameter("staticTuple", ObjectKind);
    Operand* offset = a->createConstantInputParameter("offset", IntKind);
    Operand* value = a->createInputParameter("value", stackKind(kind));

    if (kind == ObjectKind) {
      barrier(a, HeapScheme::TuplePreBarrier, tuple, 0);
    }
    a->pstore(kind, tuple, offset, value, false);
    if (kind == ObjectKind) {
      barrier(a, HeapScheme::TuplePostBarrier, tuple, 0);
    }

    pair.resolved = finish(a, 0, zone.format("putstatic-%s", kindName(kind)));
  }

  {
    a->restart();
    Operand* guard = a->createConstantInputParameter("guard", ObjectKind);
    Operand* value = a->createInputParameter("value", stackKind(kind));
    Operand* tuple = a->createTemp("staticTuple", ObjectKind);
    Operand* offset = a->createTemp("offset", IntKind);

    callRuntimeThroughStub(a, "resolveStaticTuple", tuple, operands(guard));
    callRuntimeThroughStub(a, "resolvePutStatic", offset, operands(guard));

    if (kind == ObjectKind) {
      barrier(a, HeapScheme::TuplePreBarrier, tuple, 0);
    }
    a->pstore(kind, tuple, offset, value, false);
    if (kind == ObjectKind) {
      barrier(a, HeapScheme::TuplePostBarrier, tuple, 0);
    }

    pair.unresolved = finish(
        a, 0, zone.format("putstatic-%s-unresolved", kindName(kind)));
  }

  return pair;
}

Template* TemplateGenerator::buildArrayLoad(Kind kind, bool boundsCheck)
{
  TemplateAssembler* a = &assembler;

  Operand* result = a->restart(stackKind(kind));
  Operand* array = a->createInputParameter("array", ObjectKind);
  Operand* index = a->createInputParameter("index", IntKind);

  Label* outOfBounds = 0;
  if (boundsCheck) {
    outOfBounds = a->createOutOfLineLabel("outOfBounds");

    Operand* length = a->createTemp("length", IntKind);
    a->pload(IntKind, length, array, a->i(layout.arrayLengthOffset()), true);
    a->jugteq(outOfBounds, index, length);
  }

  a->pload(kind,
           result,
           array,
           index,
           layout.firstElementOffset(),
           kindSize(kind, layout.wordSize),
           not boundsCheck);

  if (boundsCheck) {
    a->bindOutOfLine(outOfBounds);
    callRuntimeThroughStub(a,
                           "throwArrayIndexOutOfBoundsException",
                           0,
                           operands(array, index));
    a->shouldNotReachHere();
  }

  return finish(a,
                result,
                zone.format("arrayload-%s%s",
                            kindName(kind),
                            boundsCheck ? "-bounds" : ""));
}

Template* TemplateGenerator::buildArrayStore(Kind kind,
                                             bool boundsCheck,
                                             bool storeCheck)
{
  TemplateAssembler* a = &assembler;

  a->restart();
  Operand* array = a->createInputParameter("array", ObjectKind);
  Operand* index = a->createInputParameter("index", IntKind);
  Operand* value = a->createInputParameter("value", stackKind(kind));

  Label* outOfBounds = 0;
  if (boundsCheck) {
    outOfBounds = a->createOutOfLineLabel("outOfBounds");

    Operand* length = a->createTemp("length", IntKind);
    a->pload(IntKind, length, array, a->i(layout.arrayLengthOffset()), true);
    a->jugteq(outOfBounds, index, length);
  }

  Label* checkAssignable = 0;
  Label* store = 0;
  Operand* componentHub = 0;
  Operand* valueHub = 0;
  if (storeCheck) {
    checkAssignable = a->createOutOfLineLabel("checkAssignable");
    store = a->createInlineLabel("store");

    // null is assignable to every reference array; without a bounds
    // check the store below is what traps on a null array
    a->jeq(store, value, a->o(0));

    Operand* arrayHub = a->createTemp("arrayHub", ObjectKind);
    componentHub = a->createTemp("componentHub", ObjectKind);
    valueHub = a->createTemp("valueHub", ObjectKind);

    a->pload(ObjectKind,
             arrayHub,
             array,
             a->i(layout.hubOffset()),
             not boundsCheck);
    a->pload(ObjectKind,
             componentHub,
             arrayHub,
             a->i(layout.componentHubOffset()),
             false);
    a->pload(ObjectKind, valueHub, value, a->i(layout.hubOffset()), false);
    a->jneq(checkAssignable, componentHub, valueHub);

    a->bindInline(store);
  }

  if (kind == ObjectKind) {
    barrier(a, HeapScheme::ArrayPreBarrier, array, index);
  }

  a->pstore(kind,
            array,
            index,
            value,
            layout.firstElementOffset(),
            kindSize(kind, layout.wordSize),
            not boundsCheck);

  if (kind == ObjectKind) {
    barrier(a, HeapScheme::ArrayPostBarrier, array, index);
  }

  if (boundsCheck) {
    a->bindOutOfLine(outOfBounds);
    callRuntimeThroughStub(a,
                           "throwArrayIndexOutOfBoundsException",
                           0,
                           operands(array, index));
    a->shouldNotReachHere();
  }

  if (storeCheck) {
    a->bindOutOfLine(checkAssignable);
    callRuntimeThroughStub(
        a, "arrayHubStoreCheck", 0, operands(componentHub, valueHub));
    a->jmp(store);
  }

  return finish(a,
                0,
                zone.format("arraystore-%s%s%s",
                            kindName(kind),
                            boundsCheck ? "-bounds" : "",
                            storeCheck ? "-storecheck" : ""));
}

Template* TemplateGenerator::buildArrayLength()
{
  TemplateAssembler* a = &assembler;

  Operand* result = a->restart(IntKind);
  Operand* array = a->createInputParameter("array", ObjectKind);

  a->pload(IntKind, result, array, a->i(layout.arrayLengthOffset()), true);

  return finish(a, result, "arraylength");
}

Snippet* TemplateGenerator::genGetField(Compilation* c,
                                        Site,
                                        Argument receiver,
                                        FieldRef field)
{
  if (field.tag == FieldRef::Resolved) {
    return snippet(c,
                   require(GetField, field.kind, true, 0),
                   arguments(receiver, Argument::forInt(field.field->offset)));
  } else {
    return snippet(c,
                   require(GetField, field.kind, false, 0),
                   arguments(receiver, guardArgument(field.guard)));
  }
}

Snippet* TemplateGenerator::genPutField(Compilation* c,
                                        Site,
                                        Argument receiver,
                                        FieldRef field,
                                        Argument value)
{
  if (field.tag == FieldRef::Resolved) {
    return snippet(
        c,
        require(PutField, field.kind, true, 0),
        arguments(receiver, Argument::forInt(field.field->offset), value));
  } else {
    return snippet(c,
                   require(PutField, field.kind, false, 0),
                   arguments(receiver, guardArgument(field.guard), value));
  }
}

Snippet* TemplateGenerator::genGetStatic(Compilation* c,
                                         Site,
                                         Argument staticTuple,
                                         FieldRef field)
{
  if (field.tag == FieldRef::Resolved) {
    return snippet(
        c,
        require(GetStatic, field.kind, true, 0),
        arguments(staticTuple, Argument::forInt(field.field->offset)));
  } else {
    return snippet(c,
                   require(GetStatic, field.kind, false, 0),
                   arguments(guardArgument(field.guard)));
  }
}

Snippet* TemplateGenerator::genPutStatic(Compilation* c,
                                         Site,
                                         Argument staticTuple,
                                         FieldRef field,
                                         Argument value)
{
  if (field.tag == FieldRef::Resolved) {
    return snippet(
        c,
        require(PutStatic, field.kind, true, 0),
        arguments(staticTuple, Argument::forInt(field.field->offset), value));
  } else {
    return snippet(c,
                   require(PutStatic, field.kind, false, 0),
                   arguments(guardArgument(field.guard), value));
  }
}

Snippet* TemplateGenerator::genArrayLoad(Compilation* c,
                                         Site site,
                                         Kind kind,
                                         Argument array,
                                         Argument index)
{
  unsigned flags = site.requiresBoundsCheck() ? BoundsCheckFlag : 0;
  return snippet(
      c, require(ArrayLoad, kind, true, flags), arguments(array, index));
}

Snippet* TemplateGenerator::genArrayStore(Compilation* c,
                                          Site site,
                                          Kind kind,
                                          Argument array,
                                          Argument index,
                                          Argument value)
{
  unsigned flags = (site.requiresBoundsCheck() ? BoundsCheckFlag : 0)
                   | (site.requiresStoreCheck() ? StoreCheckFlag : 0);
  return snippet(c,
                 require(ArrayStore, kind, true, flags),
                 arguments(array, index, value));
}

Snippet* TemplateGenerator::genArrayLength(Compilation* c, Argument array)
{
  return snippet(c, require(ArrayLength, IntKind, true, 0), arguments(array));
}

}  // namespace codegen
}  // namespace lowering
