/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <lowering/codegen/kind.h>

namespace lowering {
namespace codegen {

namespace {

class KindInfo {
 public:
  const char* name;
  char typeChar;
  unsigned size;
};

const KindInfo kinds[] = {{"boolean", 'Z', 1},
                          {"byte", 'B', 1},
                          {"short", 'S', 2},
                          {"char", 'C', 2},
                          {"int", 'I', 4},
                          {"long", 'J', 8},
                          {"float", 'F', 4},
                          {"double", 'D', 8},
                          {"object", 'L', 0},
                          {"void", 'V', 0}};

}  // namespace

const char* kindName(Kind kind)
{
  return kinds[kind].name;
}

char kindTypeChar(Kind kind)
{
  return kinds[kind].typeChar;
}

unsigned kindSize(Kind kind, unsigned wordSize)
{
  return kind == ObjectKind ? wordSize : kinds[kind].size;
}

}  // namespace codegen
}  // namespace lowering
