/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef LOWERING_COMMON_H
#define LOWERING_COMMON_H

#ifndef __STDC_CONSTANT_MACROS
#define __STDC_CONSTANT_MACROS
#endif

#ifndef __STDC_FORMAT_MACROS
#define __STDC_FORMAT_MACROS
#endif

#include <new>
#include <stdlib.h>
#include <stdarg.h>
#include <stddef.h>
#include <string.h>
#include <stdio.h>
#include <stdint.h>
#include <inttypes.h>

#ifdef UNUSED
#undef UNUSED
#endif

#define LIKELY(v) __builtin_expect((v) != 0, true)
#define UNLIKELY(v) __builtin_expect((v) != 0, false)

#define UNUSED __attribute__((unused))

#define NO_RETURN __attribute__((noreturn))

#define LOWERING_EXPORT \
  __attribute__((visibility("default"))) __attribute__((used))

#ifdef __i386__
#define ARCH_x86_32
#elif defined __x86_64__
#define ARCH_x86_64
#elif defined __arm__
#define ARCH_arm
#elif defined __aarch64__
#define ARCH_arm64
#else
#error "unsupported architecture"
#endif

#if (!defined __BYTE_ORDER__) || (__BYTE_ORDER__ != __ORDER_LITTLE_ENDIAN__)
#error "unsupported byte order"
#endif

#define LLD PRId64
#define ULD PRIu64
#define LD PRIdPTR
#define LX PRIxPTR

#define MACRO_XY(X, Y) X##Y
#define MACRO_MakeNameXY(FX, LINE) MACRO_XY(FX, LINE)
#define MAKE_NAME(FX) MACRO_MakeNameXY(FX, __LINE__)

#define RESOURCE(type, name, release)            \
  class MAKE_NAME(Resource_) {                   \
   public:                                       \
    MAKE_NAME(Resource_)(type name) : name(name) \
    {                                            \
    }                                            \
    ~MAKE_NAME(Resource_)()                      \
    {                                            \
      release;                                   \
    }                                            \
                                                 \
   private:                                      \
    type name;                                   \
  } MAKE_NAME(resource_)(name);

namespace lowering {
namespace vm {

inline int vsnprintf(char* dst, size_t size, const char* format, va_list a)
{
  return ::vsnprintf(dst, size, format, a);
}

inline int snprintf(char* dst, size_t size, const char* format, ...)
{
  va_list a;
  va_start(a, format);
  int r = vsnprintf(dst, size, format, a);
  va_end(a);
  return r;
}

const unsigned BytesPerWord = sizeof(uintptr_t);
const unsigned BitsPerWord = BytesPerWord * 8;

const unsigned LikelyPageSizeInBytes = 4 * 1024;

inline unsigned pad(unsigned n, unsigned alignment)
{
  return (n + (alignment - 1)) & ~(alignment - 1);
}

inline unsigned pad(unsigned n)
{
  return pad(n, BytesPerWord);
}

inline uintptr_t padWord(uintptr_t n, uintptr_t alignment)
{
  return (n + (alignment - 1)) & ~(alignment - 1);
}

inline bool fitsInInt32(int64_t v)
{
  return v == static_cast<int32_t>(v);
}

template <class T>
inline T& fieldAtOffset(void* p, unsigned offset)
{
  return *reinterpret_cast<T*>(static_cast<uint8_t*>(p) + offset);
}

inline uint32_t floatToBits(float f)
{
  uint32_t bits;
  memcpy(&bits, &f, 4);
  return bits;
}

inline uint64_t doubleToBits(double d)
{
  uint64_t bits;
  memcpy(&bits, &d, 8);
  return bits;
}

inline double bitsToDouble(uint64_t bits)
{
  double d;
  memcpy(&d, &bits, 8);
  return d;
}

inline float bitsToFloat(uint32_t bits)
{
  float f;
  memcpy(&f, &bits, 4);
  return f;
}

template <class T>
inline void* voidPointer(T function)
{
  void* p;
  memcpy(&p, &function, sizeof(void*));
  return p;
}

}  // namespace vm
}  // namespace lowering

#endif  // LOWERING_COMMON_H
