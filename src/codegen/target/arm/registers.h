/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef LOWERING_CODEGEN_TARGET_ARM_REGISTERS_H
#define LOWERING_CODEGEN_TARGET_ARM_REGISTERS_H

#include <lowering/codegen/registers.h>

namespace lowering {
namespace codegen {
namespace arm {

#if defined ARCH_arm64 || (!defined ARCH_arm && __SIZEOF_POINTER__ == 8)
constexpr Register LatchRegister(26);
constexpr Register ScratchRegister(16);
constexpr Register StackRegister(31);
constexpr Register LinkRegister(30);

const int N_GPRS = 32;
const int N_FPRS = 32;
const RegisterMask GPR_MASK = 0xffffffff;
const RegisterMask FPR_MASK = 0xffffffff00000000;

#else
constexpr Register LatchRegister(10);
constexpr Register ScratchRegister(8);
constexpr Register StackRegister(13);
constexpr Register LinkRegister(14);

const int N_GPRS = 16;
const int N_FPRS = 16;
const RegisterMask GPR_MASK = 0xffff;
const RegisterMask FPR_MASK = 0xffff0000;
#endif

}  // namespace arm
}  // namespace codegen
}  // namespace lowering

#endif  // LOWERING_CODEGEN_TARGET_ARM_REGISTERS_H
