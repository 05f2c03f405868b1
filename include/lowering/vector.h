/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef LOWERING_VECTOR_H
#define LOWERING_VECTOR_H

#include <lowering/common.h>
#include <lowering/util/math.h>
#include <lowering/util/abort.h>
#include <lowering/util/slice.h>
#include <lowering/util/allocator.h>

#undef max
#undef min

namespace lowering {
namespace vm {

class Vector {
 public:
  Vector(util::Aborter* a, util::Alloc* allocator, size_t minimumCapacity)
      : a(a),
        allocator(allocator),
        data(0, 0),
        position(0),
        minimumCapacity(minimumCapacity)
  {
  }

  ~Vector()
  {
    dispose();
  }

  void dispose()
  {
    if (data.items and minimumCapacity > 0) {
      allocator->free(data.items, data.count);
      data.items = 0;
      data.count = 0;
    }
    position = 0;
  }

  void ensure(size_t space)
  {
    if (position + space > data.count) {
      assertT(a, minimumCapacity > 0);

      size_t newCapacity = util::max(
          position + space, util::max(minimumCapacity, data.count * 2));
      util::Slice<uint8_t> newData
          = util::Slice<uint8_t>::alloc(allocator, newCapacity);
      if (data.begin()) {
        memcpy(newData.begin(), data.begin(), position);
        allocator->free(data.items, data.count);
      }
      data = newData;
    }
  }

  void get(size_t offset, void* dst, size_t size)
  {
    assertT(a, offset + size <= position);
    memcpy(dst, data.begin() + offset, size);
  }

  void* allocate(size_t size)
  {
    ensure(size);
    void* r = data.begin() + position;
    position += size;
    return r;
  }

  void* append(const void* p, size_t size)
  {
    void* r = allocate(size);
    memcpy(r, p, size);
    return r;
  }

  void appendAddress(void* v)
  {
    append(&v, BytesPerWord);
  }

  void* getAddress(size_t offset)
  {
    void* v;
    get(offset, &v, BytesPerWord);
    return v;
  }

  size_t length()
  {
    return position;
  }

  template <class T>
  T* peek(size_t offset)
  {
    assertT(a, offset + sizeof(T) <= position);
    return reinterpret_cast<T*>(data.begin() + offset);
  }

  util::Aborter* a;
  util::Alloc* allocator;
  util::Slice<uint8_t> data;
  size_t position;
  size_t minimumCapacity;
};

}  // namespace vm
}  // namespace lowering

#endif  // LOWERING_VECTOR_H
