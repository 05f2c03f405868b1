/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef LOWERING_HEAP_HEAP_H
#define LOWERING_HEAP_HEAP_H

#include <lowering/system/system.h>
#include <lowering/util/allocator.h>

namespace lowering {

namespace codegen {
class HeapScheme;
}

namespace vm {

// one card covers 2^CardShift bytes of object space
const unsigned CardShift = 9;

// The managed object space plus bookkeeping memory.  Allocating through
// the Allocator interface draws on the system heap; allocateCell carves
// zeroed cells from the object space under a global lock.
class Heap : public util::Allocator {
 public:
  // returns null when the object space is exhausted
  virtual void* allocateCell(unsigned sizeInBytes) = 0;

  virtual bool contains(const void* p) = 0;
  virtual uintptr_t start() = 0;
  virtual unsigned remaining() = 0;
  virtual unsigned limit() = 0;

  virtual uint8_t* cardTable() = 0;
  virtual bool dirty(const void* p) = 0;
  virtual void clearCards() = 0;

  virtual void dispose() = 0;
};

Heap* makeHeap(System* system, unsigned limit);

// bump-pointer allocation, no barriers
codegen::HeapScheme* makeTlabScheme(System* system, bool logAllocations);

// bump-pointer allocation, card marking after reference writes
codegen::HeapScheme* makeCardTableScheme(System* system,
                                         Heap* heap,
                                         bool logAllocations);

// every allocation calls into the runtime, no barriers
codegen::HeapScheme* makeTaggingScheme(System* system);

}  // namespace vm
}  // namespace lowering

#endif  // LOWERING_HEAP_HEAP_H
