/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef LOWERING_ZONE_H
#define LOWERING_ZONE_H

#include <lowering/system/system.h>
#include <lowering/util/allocator.h>
#include <lowering/util/math.h>

namespace lowering {
namespace vm {

class Zone : public util::AllocOnly {
 public:
  class Segment {
   public:
    Segment(Segment* next, unsigned size) : next(next), size(size), position(0)
    {
    }

    Segment* next;
    uintptr_t size;
    uintptr_t position;
    uint8_t data[0];
  };

  Zone(util::Allocator* allocator, size_t minimumFootprint)
      : allocator(allocator),
        segment(0),
        minimumFootprint(minimumFootprint < sizeof(Segment)
                             ? 0
                             : minimumFootprint - sizeof(Segment))
  {
  }

  ~Zone()
  {
    dispose();
  }

  void dispose()
  {
    for (Segment* seg = segment, *next; seg; seg = next) {
      next = seg->next;
      allocator->free(seg, sizeof(Segment) + seg->size);
    }

    segment = 0;
  }

  virtual void* allocate(size_t size)
  {
    size = pad(size);
    void* p = tryAllocate(size);
    if (p) {
      return p;
    } else {
      ensure(size);
      void* r = segment->data + segment->position;
      segment->position += size;
      return r;
    }
  }

  // copies a nul-terminated string into the zone
  const char* copy(const char* s)
  {
    size_t length = strlen(s);
    char* r = static_cast<char*>(allocate(length + 1));
    memcpy(r, s, length + 1);
    return r;
  }

  const char* format(const char* fmt, ...)
  {
    char buffer[256];
    va_list a;
    va_start(a, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, a);
    va_end(a);
    return copy(buffer);
  }

 private:
  static unsigned padToPage(unsigned size)
  {
    return (size + (LikelyPageSizeInBytes - 1)) & ~(LikelyPageSizeInBytes - 1);
  }

  bool tryEnsure(unsigned space)
  {
    if (segment == 0 or segment->position + space > segment->size) {
      unsigned size = padToPage(
          util::max(space,
                    util::max(minimumFootprint,
                              segment == 0 ? 0 : segment->size * 2))
          + sizeof(Segment));

      void* p = allocator->tryAllocate(size);
      if (p == 0) {
        size = padToPage(space + sizeof(Segment));
        p = allocator->tryAllocate(size);
        if (p == 0) {
          return false;
        }
      }

      segment = new (p) Segment(segment, size - sizeof(Segment));
    }
    return true;
  }

  void ensure(unsigned space)
  {
    if (segment == 0 or segment->position + space > segment->size) {
      unsigned size = padToPage(space + sizeof(Segment));

      segment = new (allocator->allocate(size))
          Segment(segment, size - sizeof(Segment));
    }
  }

  void* tryAllocate(size_t size)
  {
    size = pad(size);
    if (tryEnsure(size)) {
      void* r = segment->data + segment->position;
      segment->position += size;
      return r;
    } else {
      return 0;
    }
  }

  util::Allocator* allocator;
  Segment* segment;
  unsigned minimumFootprint;
};

}  // namespace vm
}  // namespace lowering

#endif  // LOWERING_ZONE_H
