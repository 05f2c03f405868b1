/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef LOWERING_CODEGEN_KIND_H
#define LOWERING_CODEGEN_KIND_H

#include <lowering/common.h>

namespace lowering {
namespace codegen {

// The value kinds a template is specialized over.  The order matches
// the primitive array type table kept by the machine.
enum Kind {
  BooleanKind,
  ByteKind,
  ShortKind,
  CharKind,
  IntKind,
  LongKind,
  FloatKind,
  DoubleKind,
  ObjectKind,
  VoidKind
};

const unsigned KindCount = VoidKind + 1;

// kinds which may be the element type of an array
const unsigned ElementKindCount = ObjectKind + 1;

const char* kindName(Kind kind);

char kindTypeChar(Kind kind);

// size in bytes of a value of the given kind when stored in memory;
// references occupy one target word
unsigned kindSize(Kind kind, unsigned wordSize);

inline unsigned kindAlignment(Kind kind, unsigned wordSize)
{
  return kindSize(kind, wordSize);
}

inline bool isPrimitive(Kind kind)
{
  return kind < ObjectKind;
}

// kinds narrower than an int are carried in int-sized operands
inline Kind stackKind(Kind kind)
{
  switch (kind) {
  case BooleanKind:
  case ByteKind:
  case ShortKind:
  case CharKind:
    return IntKind;
  default:
    return kind;
  }
}

inline Kind wordKind(unsigned wordSize)
{
  return wordSize == 8 ? LongKind : IntKind;
}

// maps a C++ type used by runtime calls to the kind which carries it
template <class T>
struct KindOf;

template <>
struct KindOf<void> {
  static const Kind Value = VoidKind;
};

template <>
struct KindOf<bool> {
  static const Kind Value = BooleanKind;
};

template <>
struct KindOf<int32_t> {
  static const Kind Value = IntKind;
};

template <>
struct KindOf<int64_t> {
  static const Kind Value = LongKind;
};

template <>
struct KindOf<uintptr_t> {
  static const Kind Value = sizeof(uintptr_t) == 8 ? LongKind : IntKind;
};

template <>
struct KindOf<void*> {
  static const Kind Value = ObjectKind;
};

}  // namespace codegen
}  // namespace lowering

#endif  // LOWERING_CODEGEN_KIND_H
