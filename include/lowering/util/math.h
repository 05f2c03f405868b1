/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef LOWERING_UTIL_MATH_H
#define LOWERING_UTIL_MATH_H

#undef max
#undef min

namespace lowering {
namespace util {

inline unsigned max(unsigned a, unsigned b)
{
  return (a > b ? a : b);
}

inline unsigned min(unsigned a, unsigned b)
{
  return (a < b ? a : b);
}

inline unsigned ceilingDivide(unsigned n, unsigned d)
{
  return (n + d - 1) / d;
}

inline unsigned log(unsigned n)
{
  unsigned r = 0;
  for (unsigned i = 1; i < n; ++r)
    i <<= 1;
  return r;
}

}  // namespace util
}  // namespace lowering

#endif  // LOWERING_UTIL_MATH_H
