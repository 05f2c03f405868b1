/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef LOWERING_UTIL_SLICE_H
#define LOWERING_UTIL_SLICE_H

#include <string.h>

#include "allocator.h"
#include "math.h"
#include "cpp.h"

namespace lowering {
namespace util {

template <class T>
class Slice {
 public:
  T* items;
  size_t count;

  inline Slice() : items(0), count(0)
  {
  }

  inline Slice(T* items, size_t count) : items(items), count(count)
  {
  }

  inline Slice(const Slice<typename NonConst<T>::Type>& copy)
      : items(copy.items), count(copy.count)
  {
  }

  template <size_t N>
  inline Slice(T (&array)[N]) : items(array), count(N)
  {
  }

  inline T& operator[](size_t index)
  {
    return items[index];
  }

  inline T* begin()
  {
    return items;
  }

  inline T* end()
  {
    return items + count;
  }

  inline Slice<T> subslice(size_t begin, size_t count)
  {
    return Slice<T>(this->begin() + begin, count);
  }

  static Slice<T> alloc(AllocOnly* a, size_t count)
  {
    return Slice<T>((T*)a->allocate(sizeof(T) * count), count);
  }

  Slice<T> clone(AllocOnly* a, size_t newCount)
  {
    T* newItems = (T*)a->allocate(newCount * sizeof(T));
    if (count) {
      memcpy(newItems, items, min(count, newCount) * sizeof(T));
    }
    return Slice<T>(newItems, newCount);
  }

  Slice<T> clone(AllocOnly* a)
  {
    return clone(a, count);
  }
};

}  // namespace util
}  // namespace lowering

#endif  // LOWERING_UTIL_SLICE_H
