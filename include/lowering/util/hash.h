/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef LOWERING_UTIL_HASH_H
#define LOWERING_UTIL_HASH_H

#include <stdint.h>

namespace lowering {
namespace util {

inline uint32_t hash(const char* s)
{
  uint32_t h = 0;
  for (unsigned i = 0; s[i]; ++i) {
    h = (h * 31) + s[i];
  }
  return h;
}

inline uint32_t hash(const void* p)
{
  uintptr_t v = reinterpret_cast<uintptr_t>(p);
  return static_cast<uint32_t>(v >> 3) ^ static_cast<uint32_t>(static_cast<uint64_t>(v) >> 32);
}

}  // namespace util
}  // namespace lowering

#endif  // LOWERING_UTIL_HASH_H
