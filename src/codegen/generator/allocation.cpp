/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <lowering/codegen/generator.h>
#include <lowering/codegen/architecture.h>
#include <lowering/codegen/heap-scheme.h>
#include <lowering/vm/machine.h>

using namespace lowering::util;
using namespace lowering::vm;

namespace {

const char* arrayAllocator(lowering::codegen::Kind kind)
{
  return kind == lowering::codegen::ObjectKind ? "allocateObjectArray"
                                               : "allocatePrimitiveArray";
}

const char* multiArrayAllocators[]
    = {0, "allocateMultiArray1", "allocateMultiArray2", "allocateMultiArray3"};

}  // namespace

namespace lowering {
namespace codegen {

void TemplateGenerator::buildAllocationTemplates()
{
  newInstanceTemplates = buildNewInstance();
  newHybridTemplate = buildNewHybrid();

  for (unsigned k = 0; k < ElementKindCount; ++k) {
    newArrayTemplates[k] = buildNewArray(static_cast<Kind>(k));
  }

  for (unsigned rank = 1; rank <= MaxMultiArrayRank; ++rank) {
    newMultiArrayTemplates[rank] = buildNewMultiArray(rank);
  }
}

// Bumps the thread's allocation mark by size, refilling the buffer
// through the runtime when it would pass the top.
void TemplateGenerator::tlabAllocate(TemplateAssembler* a,
                                     Operand* size,
                                     Operand* cell,
                                     Operand* etla)
{
  Operand* newMark = a->createTemp("newMark", a->wordKind());
  Operand* top = a->createTemp("top", a->wordKind());

  a->pload(a->wordKind(), cell, etla, a->i(scheme->tlabMarkOffset()), false);
  a->add(newMark, cell, size);
  a->pload(a->wordKind(), top, etla, a->i(scheme->tlabTopOffset()), false);

  Label* allocated = a->createInlineLabel("allocated");

  if (options.useOutOfLineStubs) {
    Label* refill = a->createOutOfLineLabel("refill");

    a->jgt(refill, newMark, top);
    a->pstore(
        a->wordKind(), etla, a->i(scheme->tlabMarkOffset()), newMark, false);

    a->bindOutOfLine(refill);
    callRuntimeThroughStub(a, "slowPathAllocate", cell, operands(size, etla));
    a->jmp(allocated);
  } else {
    Label* fits = a->createInlineLabel("fits");

    a->jlteq(fits, newMark, top);
    callRuntimeThroughStub(a, "slowPathAllocate", cell, operands(size, etla));
    a->jmp(allocated);

    a->bindInline(fits);
    a->pstore(
        a->wordKind(), etla, a->i(scheme->tlabMarkOffset()), newMark, false);
  }

  a->bindInline(allocated);

  if (scheme->logsAllocations()) {
    tlabLog(a, etla, cell, size);
  }
}

// Appends a [site, cell, size] record to the thread's allocation log,
// flushing it first if the tail has reached the end marker.
void TemplateGenerator::tlabLog(TemplateAssembler* a,
                                Operand* etla,
                                Operand* cell,
                                Operand* size)
{
  Operand* tail = a->createTemp("logTail", a->wordKind());
  Operand* marker = a->createTemp("logMarker", a->wordKind());
  Operand* site = a->createTemp("site", a->wordKind());
  unsigned w = layout.wordSize;

  a->pload(a->wordKind(), tail, etla, a->i(scheme->tlabLogTailOffset()), false);
  a->pload(a->wordKind(), marker, tail, false);

  Label* room = a->createInlineLabel("room");
  a->jneq(room, marker, tail);
  callRuntimeThroughStub(a, "flushLog", tail, operands(tail));
  a->bindInline(room);

  a->here(site);
  a->pstore(a->wordKind(), tail, a->i(0), site, false);
  a->pstore(a->wordKind(), tail, a->i(w), cell, false);
  a->pstore(IntKind, tail, a->i(2 * w), size, false);

  a->add(tail, tail, a->i(TlabLogRecordWords * w));
  a->pstore(a->wordKind(), etla, a->i(scheme->tlabLogTailOffset()), tail, false);
}

void TemplateGenerator::formatCell(TemplateAssembler* a,
                                   Operand* result,
                                   Operand* cell,
                                   Operand* hub,
                                   Operand* length,
                                   Operand* size,
                                   Operand* etla,
                                   const char* profiler)
{
  a->pstore(ObjectKind, cell, a->i(layout.hubOffset()), hub, false);
  if (length) {
    a->pstore(IntKind, cell, a->i(layout.arrayLengthOffset()), length, false);
  }
  a->mov(result, cell);

  if (profiler) {
    Operand* mark = a->createTemp("profilerMark", a->wordKind());
    Label* unprofiled = a->createInlineLabel("unprofiled");

    a->pload(
        a->wordKind(), mark, etla, a->i(scheme->profilerMarkOffset()), false);
    a->jeq(unprofiled, mark, a->w(0));
    callRuntimeThroughStub(a, profiler, 0, operands(size, hub, cell));
    a->bindInline(unprofiled);
  }
}

void TemplateGenerator::allocateArray(TemplateAssembler* a,
                                      Kind kind,
                                      Operand* result,
                                      Operand* hub,
                                      Operand* length)
{
  if (not scheme->usesTlab()) {
    callRuntimeThroughStub(
        a, arrayAllocator(kind), result, operands(hub, length));
    return;
  }

  unsigned elementSize = kindSize(kind, layout.wordSize);

  Label* large = a->createOutOfLineLabel("largeArray");
  Label* allocated = a->createInlineLabel("arrayAllocated");

  a->jgt(large,
         length,
         a->i((LargeObjectSizeInBytes - layout.headerSize()) / elementSize));

  Operand* size = a->createTemp("size", IntKind);
  arch->alignArraySize(a,
                       length,
                       size,
                       elementSize,
                       layout.headerSize(),
                       scheme->objectAlignment());

  Operand* etla = loadEnabledLocals(a);
  Operand* cell = a->createTemp("cell", a->wordKind());
  tlabAllocate(a, size, cell, etla);
  formatCell(a, result, cell, hub, length, size, etla, "callProfilerArray");

  a->bindOutOfLine(large);
  callRuntimeThroughStub(a, arrayAllocator(kind), result, operands(hub, length));
  a->jmp(allocated);

  a->bindInline(allocated);
}

TemplatePair TemplateGenerator::buildNewInstance()
{
  TemplateAssembler* a = &assembler;
  TemplatePair pair;

  {
    Operand* result = a->restart(ObjectKind);
    Operand* hub = a->createConstantInputParameter("hub", ObjectKind);
    Operand* size = a->createConstantInputParameter("size", IntKind);

    if (scheme->usesTlab()) {
      Operand* etla = loadEnabledLocals(a);
      Operand* cell = a->createTemp("cell", a->wordKind());
      tlabAllocate(a, size, cell, etla);
      formatCell(a, result, cell, hub, 0, size, etla, "callProfiler");
    } else {
      callRuntimeThroughStub(a, "allocateObject", result, operands(hub));
    }

    pair.resolved = finish(a, result, "new");
  }

  {
    Operand* result = a->restart(ObjectKind);
    Operand* guard = a->createConstantInputParameter("guard", ObjectKind);
    Operand* hub = a->createTemp("hub", ObjectKind);

    callRuntimeThroughStub(a, "resolveNew", hub, operands(guard));

    if (scheme->usesTlab()) {
      Operand* tupleSize = a->createTemp("tupleSize", a->wordKind());
      Operand* size = a->createTemp("size", IntKind);

      a->pload(
          a->wordKind(), tupleSize, hub, a->i(layout.tupleSizeOffset()), false);
      a->mov(size, tupleSize);

      Operand* etla = loadEnabledLocals(a);
      Operand* cell = a->createTemp("cell", a->wordKind());
      tlabAllocate(a, size, cell, etla);
      formatCell(a, result, cell, hub, 0, size, etla, "callProfiler");
    } else {
      callRuntimeThroughStub(a, "allocateObject", result, operands(hub));
    }

    pair.unresolved = finish(a, result, "new-unresolved");
  }

  return pair;
}

// A hybrid is a tuple whose misc word holds the index of its first
// variable word, so it is laid out like an array from that point on.
Template* TemplateGenerator::buildNewHybrid()
{
  TemplateAssembler* a = &assembler;

  Operand* result = a->restart(ObjectKind);
  Operand* hub = a->createConstantInputParameter("hub", ObjectKind);
  Operand* size = a->createConstantInputParameter("size", IntKind);

  if (scheme->usesTlab()) {
    Operand* etla = loadEnabledLocals(a);
    Operand* cell = a->createTemp("cell", a->wordKind());
    tlabAllocate(a, size, cell, etla);
    formatCell(a,
               result,
               cell,
               hub,
               a->i(HubFirstWordIndex),
               size,
               etla,
               "callProfiler");
  } else {
    callRuntimeThroughStub(a, "allocateHybrid", result, operands(hub));
  }

  return finish(a, result, "newhybrid");
}

TemplatePair TemplateGenerator::buildNewArray(Kind kind)
{
  TemplateAssembler* a = &assembler;
  TemplatePair pair;

  {
    Operand* result = a->restart(ObjectKind);
    Operand* hub = a->createConstantInputParameter("hub", ObjectKind);
    Operand* length = a->createInputParameter("length", IntKind);

    Label* negative = a->createOutOfLineLabel("negativeLength");
    a->jlt(negative, length, a->i(0));

    allocateArray(a, kind, result, hub, length);

    a->bindOutOfLine(negative);
    callRuntimeThroughStub(
        a, "throwNegativeArraySizeException", 0, operands(length));
    a->shouldNotReachHere();

    pair.resolved
        = finish(a, result, zone.format("newarray-%s", kindName(kind)));
  }

  {
    Operand* result = a->restart(ObjectKind);
    Operand* guard = a->createConstantInputParameter("guard", ObjectKind);
    Operand* length = a->createInputParameter("length", IntKind);
    Operand* hub = a->createTemp("hub", ObjectKind);

    Label* negative = a->createOutOfLineLabel("negativeLength");
    a->jlt(negative, length, a->i(0));

    callRuntimeThroughStub(a, "resolveNewArray", hub, operands(guard));
    allocateArray(a, kind, result, hub, length);

    a->bindOutOfLine(negative);
    callRuntimeThroughStub(
        a, "throwNegativeArraySizeException", 0, operands(length));
    a->shouldNotReachHere();

    pair.unresolved = finish(
        a, result, zone.format("newarray-%s-unresolved", kindName(kind)));
  }

  return pair;
}

TemplatePair TemplateGenerator::buildNewMultiArray(unsigned rank)
{
  TemplateAssembler* a = &assembler;
  TemplatePair pair;

  for (unsigned resolved = 0; resolved < 2; ++resolved) {
    Operand* result = a->restart(ObjectKind);
    Operand* type = resolved
                        ? a->createConstantInputParameter("hub", ObjectKind)
                        : a->createConstantInputParameter("guard", ObjectKind);

    Operand* lengths[MaxMultiArrayRank];
    Label* negative[MaxMultiArrayRank];
    for (unsigned k = 0; k < rank; ++k) {
      lengths[k] = a->createInputParameter(zone.format("length%u", k + 1),
                                           IntKind);
      negative[k]
          = a->createOutOfLineLabel(zone.format("negativeLength%u", k + 1));
      a->jlt(negative[k], lengths[k], a->i(0));
    }

    if (resolved and rank < SmallMultiArrayRank) {
      Operand* arguments[SmallMultiArrayRank];
      arguments[0] = type;
      for (unsigned k = 0; k < rank; ++k) {
        arguments[k + 1] = lengths[k];
      }

      callRuntimeThroughStub(a,
                             multiArrayAllocators[rank],
                             result,
                             Slice<Operand*>(arguments, rank + 1));
    } else {
      Operand* lengthArray = a->createTemp("lengths", ObjectKind);

      callRuntimeThroughStub(
          a, "allocateIntArray", lengthArray, operands(a->i(rank)));
      for (unsigned k = 0; k < rank; ++k) {
        a->pstore(IntKind,
                  lengthArray,
                  a->i(layout.firstElementOffset() + k * 4),
                  lengths[k],
                  false);
      }

      callRuntimeThroughStub(
          a,
          resolved ? "allocateMultiArrayN" : "allocateUnresolvedMultiArrayN",
          result,
          operands(type, lengthArray));
    }

    for (unsigned k = 0; k < rank; ++k) {
      a->bindOutOfLine(negative[k]);
      callRuntimeThroughStub(
          a, "throwNegativeArraySizeException", 0, operands(lengths[k]));
      a->shouldNotReachHere();
    }

    if (resolved) {
      pair.resolved
          = finish(a, result, zone.format("newmultiarray-%u", rank));
    } else {
      pair.unresolved
          = finish(a, result, zone.format("newmultiarray-%u-unresolved", rank));
    }
  }

  return pair;
}

Snippet* TemplateGenerator::genNewInstance(Compilation* c, TypeRef type)
{
  if (type.tag == TypeRef::Resolved) {
    Type* t = type.type;
    return snippet(
        c,
        require(t->isHybrid() ? NewHybrid : NewInstance, VoidKind, true, 0),
        arguments(hubArgument(t), Argument::forInt(t->tupleSize)));
  } else {
    return snippet(c,
                   require(NewInstance, VoidKind, false, 0),
                   arguments(guardArgument(type.guard)));
  }
}

Snippet* TemplateGenerator::genNewArray(Compilation* c,
                                        Kind elementKind,
                                        Argument length,
                                        TypeRef componentType)
{
  if (componentType.tag == TypeRef::Unresolved) {
    return snippet(c,
                   require(NewArray, elementKind, false, 0),
                   arguments(guardArgument(componentType.guard), length));
  }

  Type* arrayType = elementKind == ObjectKind
                        ? arrayTypeOf(c->t, componentType.type)
                        : primitiveArrayType(m, elementKind);

  return snippet(c,
                 require(NewArray, elementKind, true, 0),
                 arguments(hubArgument(arrayType), length));
}

Snippet* TemplateGenerator::genNewMultiArray(Compilation* c,
                                             Slice<Argument> lengths,
                                             TypeRef arrayType)
{
  unsigned rank = lengths.count;
  if (rank == 0 or rank > MaxMultiArrayRank) {
    fprintf(stderr, "unsupported multi-array rank %u\n", rank);
    abort(s);
  }

  bool resolved = arrayType.tag == TypeRef::Resolved;

  Slice<Argument> args = Slice<Argument>::alloc(&(c->zone), rank + 1);
  args[0] = resolved ? hubArgument(arrayType.type)
                     : guardArgument(arrayType.guard);
  for (unsigned k = 0; k < rank; ++k) {
    args[k + 1] = lengths[k];
  }

  return snippet(c, require(NewMultiArray, VoidKind, resolved, rank), args);
}

}  // namespace codegen
}  // namespace lowering
