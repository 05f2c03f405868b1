/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef LOWERING_UTIL_CPP_H
#define LOWERING_UTIL_CPP_H

namespace lowering {
namespace util {

template <class T>
struct NonConst;

template <class T>
struct NonConst<const T> {
  typedef T Type;
};

template <class T>
struct NonConst {
  typedef T Type;
};

template <class... Ts>
struct ArgumentCount;

template <class T, class... Ts>
struct ArgumentCount<T, Ts...> {
  enum { Result = 1 + ArgumentCount<Ts...>::Result };
};

template <>
struct ArgumentCount<> {
  enum { Result = 0 };
};

}  // namespace util
}  // namespace lowering

#endif  // LOWERING_UTIL_CPP_H
