/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <stdio.h>

#include <lowering/common.h>
#include <lowering/codegen/kind.h>

#include "test-harness.h"

using namespace lowering::codegen;

TEST(KindNames)
{
  assertEqual("boolean", kindName(BooleanKind));
  assertEqual("int", kindName(IntKind));
  assertEqual("object", kindName(ObjectKind));
  assertEqual("void", kindName(VoidKind));

  assertEqual<int32_t>('J', kindTypeChar(LongKind));
  assertEqual<int32_t>('L', kindTypeChar(ObjectKind));
}

TEST(KindSizes)
{
  assertEqual<unsigned>(1, kindSize(BooleanKind, 8));
  assertEqual<unsigned>(2, kindSize(CharKind, 8));
  assertEqual<unsigned>(4, kindSize(FloatKind, 8));
  assertEqual<unsigned>(8, kindSize(DoubleKind, 4));
  assertEqual<unsigned>(4, kindSize(ObjectKind, 4));
  assertEqual<unsigned>(8, kindSize(ObjectKind, 8));
  assertEqual<unsigned>(0, kindSize(VoidKind, 8));
}

TEST(KindWidening)
{
  assertEqual<unsigned>(IntKind, stackKind(BooleanKind));
  assertEqual<unsigned>(IntKind, stackKind(ByteKind));
  assertEqual<unsigned>(IntKind, stackKind(ShortKind));
  assertEqual<unsigned>(IntKind, stackKind(CharKind));
  assertEqual<unsigned>(LongKind, stackKind(LongKind));
  assertEqual<unsigned>(FloatKind, stackKind(FloatKind));
  assertEqual<unsigned>(ObjectKind, stackKind(ObjectKind));

  assertEqual<unsigned>(IntKind, wordKind(4));
  assertEqual<unsigned>(LongKind, wordKind(8));

  assertTrue(isPrimitive(DoubleKind));
  assertFalse(isPrimitive(ObjectKind));

  assertEqual<unsigned>(wordKind(sizeof(uintptr_t)), KindOf<uintptr_t>::Value);
  assertEqual<unsigned>(ObjectKind, KindOf<void*>::Value);
}
