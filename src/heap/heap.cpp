/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <lowering/heap/heap.h>
#include <lowering/util/math.h>

using namespace lowering::util;

namespace {

namespace local {

const bool DebugAllocation = false;

}  // namespace local

}  // namespace

namespace lowering {
namespace vm {

namespace {

class MyHeap : public Heap {
 public:
  MyHeap(System* system, unsigned limit)
      : system(system),
        space(static_cast<uint8_t*>(vm::allocate(system, limit))),
        limit_(limit),
        position(0),
        cardCount(ceilingDivide(limit, 1 << CardShift)),
        cards(static_cast<uint8_t*>(vm::allocate(system, cardCount))),
        lock(0)
  {
    memset(space, 0, limit_);
    memset(cards, 0, cardCount);

    if (not system->success(system->make(&lock))) {
      system->abort();
    }
  }

  virtual void* tryAllocate(size_t size)
  {
    return system->tryAllocate(size);
  }

  virtual void* allocate(size_t size)
  {
    return vm::allocate(system, size);
  }

  virtual void free(const void* p, size_t)
  {
    system->free(p);
  }

  virtual void* allocateCell(unsigned sizeInBytes)
  {
    if (sizeInBytes > limit_) {
      return 0;
    }

    unsigned size = pad(sizeInBytes);

    ACQUIRE_LOCK(lock);

    if (size > limit_ - position) {
      if (local::DebugAllocation) {
        fprintf(stderr,
                "heap exhausted: %u requested, %u remaining\n",
                size,
                limit_ - position);
      }
      return 0;
    }

    void* p = space + position;
    position += size;

    if (local::DebugAllocation) {
      fprintf(stderr, "allocated %u bytes at %p\n", size, p);
    }

    return p;
  }

  virtual bool contains(const void* p)
  {
    return static_cast<const uint8_t*>(p) >= space
           and static_cast<const uint8_t*>(p) < space + limit_;
  }

  virtual uintptr_t start()
  {
    return reinterpret_cast<uintptr_t>(space);
  }

  virtual unsigned remaining()
  {
    ACQUIRE_LOCK(lock);
    return limit_ - position;
  }

  virtual unsigned limit()
  {
    return limit_;
  }

  virtual uint8_t* cardTable()
  {
    return cards;
  }

  virtual bool dirty(const void* p)
  {
    expect(system, contains(p));
    return cards[(static_cast<const uint8_t*>(p) - space) >> CardShift] != 0;
  }

  virtual void clearCards()
  {
    memset(cards, 0, cardCount);
  }

  virtual void dispose()
  {
    lock->dispose();
    system->free(cards);
    system->free(space);
    system->free(this);
  }

  System* system;
  uint8_t* space;
  unsigned limit_;
  unsigned position;
  unsigned cardCount;
  uint8_t* cards;
  System::Mutex* lock;
};

}  // namespace

Heap* makeHeap(System* system, unsigned limit)
{
  return new (vm::allocate(system, sizeof(MyHeap))) MyHeap(system, limit);
}

}  // namespace vm
}  // namespace lowering
