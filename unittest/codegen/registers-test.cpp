/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <stdio.h>

#include <lowering/system/system.h>
#include <lowering/codegen/registers.h>
#include <lowering/codegen/architecture.h>
#include <lowering/codegen/targets.h>

#include "test-harness.h"

using namespace lowering::codegen;
using namespace lowering::vm;

TEST(RegisterIterator)
{
  BoundedRegisterMask regs(0x55);
  assertEqual<unsigned>(0, regs.start);
  assertEqual<unsigned>(7, regs.limit);

  for(int i = 0; i < 64; i++) {
    assertEqual<unsigned>(i, BoundedRegisterMask(static_cast<uint64_t>(1) << i).start);
    assertEqual<unsigned>(i + 1, BoundedRegisterMask(static_cast<uint64_t>(1) << i).limit);
  }

  auto it = regs.begin();
  auto end = regs.end();

  assertTrue(it != end);
  assertEqual<unsigned>(6, (*it).index());
  ++it;
  assertTrue(it != end);
  assertEqual<unsigned>(4, (*it).index());
  ++it;
  assertTrue(it != end);
  assertEqual<unsigned>(2, (*it).index());
  ++it;
  assertTrue(it != end);
  assertEqual<unsigned>(0, (*it).index());
  ++it;
  assertFalse(it != end);
}

TEST(RegisterMaskWithout)
{
  RegisterMask all(0xff);
  RegisterMask reserved = Register(1) | Register(6);
  RegisterMask rest = all.without(reserved);

  assertEqual<uint64_t>(0xbd, static_cast<uint64_t>(rest));
  assertFalse(rest.contains(Register(1)));
  assertTrue(rest.contains(Register(2)));
  assertEqual<uint64_t>(0x7f, static_cast<uint64_t>(all.excluding(Register(7))));
}

TEST(RegisterFileReserved)
{
  const char* const names[] = {"x86_64", "arm"};

  System* s = makeSystem();
  for (unsigned i = 0; i < sizeof(names) / sizeof(names[0]); ++i) {
    Architecture* arch = makeArchitecture(s, names[i]);
    assertTrue(arch != 0);
    arch->acquire();

    const RegisterFile* file = arch->registerFile();
    assertTrue(file->isReserved(arch->latch()));
    assertTrue(file->isReserved(arch->scratch()));
    assertFalse(file->allocatableRegisters.contains(arch->latch()));
    assertFalse(file->allocatableRegisters.contains(arch->scratch()));

    for (Register r : file->allocatableRegisters) {
      assertTrue(file->generalRegisters.contains(r));
      assertFalse(file->isReserved(r));
    }

    arch->release();
  }

  assertTrue(makeArchitecture(s, "sparc") == 0);
  s->dispose();
}
