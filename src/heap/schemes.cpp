/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <lowering/heap/heap.h>
#include <lowering/codegen/heap-scheme.h>
#include <lowering/codegen/assembler.h>
#include <lowering/vm/machine.h>

using namespace lowering::codegen;

namespace lowering {
namespace vm {

namespace {

class NullBarrier : public BarrierGenerator {
 public:
  virtual void generate(TemplateAssembler*, Operand*, Operand*)
  {
  }
};

// marks the card holding the written object; the index of an array
// store does not matter since the whole array is rescanned
class CardMarkingBarrier : public BarrierGenerator {
 public:
  CardMarkingBarrier(Heap* heap) : heap(heap)
  {
  }

  virtual void generate(TemplateAssembler* a, Operand* object, Operand*)
  {
    Operand* card = a->createTemp("card", a->wordKind());
    a->sub(card, object, a->w(heap->start()));
    a->shr(card, card, a->i(CardShift));
    a->pstore(ByteKind,
              a->w(reinterpret_cast<uintptr_t>(heap->cardTable())),
              card,
              a->i(1),
              0,
              1,
              false);
  }

  Heap* heap;
};

class MyScheme : public HeapScheme {
 public:
  MyScheme(System* system,
           const char* name,
           bool tlab,
           bool logs,
           BarrierGenerator* postBarrier)
      : system(system),
        name_(name),
        tlab(tlab),
        logs(logs),
        postBarrier(postBarrier ? postBarrier : &nullBarrier)
  {
  }

  virtual const char* name()
  {
    return name_;
  }

  virtual bool usesTlab()
  {
    return tlab;
  }

  virtual bool logsAllocations()
  {
    return logs;
  }

  virtual unsigned objectAlignment()
  {
    return BytesPerWord;
  }

  virtual BarrierGenerator* barrierGenerator(BarrierPosition position)
  {
    switch (position) {
    case TuplePostBarrier:
    case ArrayPostBarrier:
      return postBarrier;

    default:
      return &nullBarrier;
    }
  }

  virtual unsigned enabledLocalsOffset()
  {
    return Thread::localOffset(Thread::EnabledLocals);
  }

  virtual unsigned tlabMarkOffset()
  {
    return Thread::localOffset(Thread::TlabMark);
  }

  virtual unsigned tlabTopOffset()
  {
    return Thread::localOffset(Thread::TlabTop);
  }

  virtual unsigned tlabLogTailOffset()
  {
    return Thread::localOffset(Thread::TlabLogTail);
  }

  virtual unsigned profilerMarkOffset()
  {
    return Thread::localOffset(Thread::ProfilerMark);
  }

  virtual void dispose()
  {
    system->free(this);
  }

  System* system;
  const char* name_;
  bool tlab;
  bool logs;
  NullBarrier nullBarrier;
  BarrierGenerator* postBarrier;
};

class CardTableScheme : public MyScheme {
 public:
  CardTableScheme(System* system, Heap* heap, bool logAllocations)
      : MyScheme(system, "cards", true, logAllocations, 0), cardBarrier(heap)
  {
    postBarrier = &cardBarrier;
  }

  CardMarkingBarrier cardBarrier;
};

}  // namespace

HeapScheme* makeTlabScheme(System* system, bool logAllocations)
{
  return new (vm::allocate(system, sizeof(MyScheme)))
      MyScheme(system, "tlab", true, logAllocations, 0);
}

HeapScheme* makeCardTableScheme(System* system,
                                Heap* heap,
                                bool logAllocations)
{
  return new (vm::allocate(system, sizeof(CardTableScheme)))
      CardTableScheme(system, heap, logAllocations);
}

HeapScheme* makeTaggingScheme(System* system)
{
  return new (vm::allocate(system, sizeof(MyScheme)))
      MyScheme(system, "tagging", false, false, 0);
}

}  // namespace vm
}  // namespace lowering
