/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef LOWERING_CODEGEN_HEAP_SCHEME_H
#define LOWERING_CODEGEN_HEAP_SCHEME_H

#include <lowering/common.h>

namespace lowering {
namespace codegen {

class TemplateAssembler;
class Operand;

class BarrierGenerator {
 public:
  // index is null for tuple writes
  virtual void generate(TemplateAssembler* a, Operand* object, Operand* index)
      = 0;
};

// What the active memory manager asks of generated code: how to
// allocate, and what to emit around reference writes.
class HeapScheme {
 public:
  enum BarrierPosition {
    TuplePreBarrier,
    TuplePostBarrier,
    ArrayPreBarrier,
    ArrayPostBarrier
  };

  virtual const char* name() = 0;

  // inline bump-pointer allocation from a thread-local buffer
  virtual bool usesTlab() = 0;

  virtual bool logsAllocations() = 0;

  virtual unsigned objectAlignment() = 0;

  // never null; schemes without a barrier at a position return a
  // generator which emits nothing
  virtual BarrierGenerator* barrierGenerator(BarrierPosition position) = 0;

  // offsets from the latch register and from the enabled thread locals
  virtual unsigned enabledLocalsOffset() = 0;
  virtual unsigned tlabMarkOffset() = 0;
  virtual unsigned tlabTopOffset() = 0;
  virtual unsigned tlabLogTailOffset() = 0;
  virtual unsigned profilerMarkOffset() = 0;

  virtual void dispose() = 0;
};

}  // namespace codegen
}  // namespace lowering

#endif  // LOWERING_CODEGEN_HEAP_SCHEME_H
