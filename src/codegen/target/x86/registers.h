/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef LOWERING_CODEGEN_TARGET_X86_REGISTERS_H
#define LOWERING_CODEGEN_TARGET_X86_REGISTERS_H

#include <lowering/codegen/registers.h>

namespace lowering {
namespace codegen {
namespace x86 {

constexpr Register rax((int)0);
constexpr Register rcx(1);
constexpr Register rdx(2);
constexpr Register rbx(3);
constexpr Register rsp(4);
constexpr Register rbp(5);
constexpr Register rsi(6);
constexpr Register rdi(7);
constexpr Register r8(8);
constexpr Register r9(9);
constexpr Register r10(10);
constexpr Register r11(11);
constexpr Register r12(12);
constexpr Register r13(13);
constexpr Register r14(14);
constexpr Register r15(15);

constexpr RegisterMask GeneralRegisterMask = vm::BytesPerWord == 4 ? 0x000000ff
                                                                   : 0x0000ffff;

constexpr RegisterMask FloatRegisterMask = vm::BytesPerWord == 4 ? 0x00ff0000
                                                                 : 0xffff0000;

// the thread locals pointer lives in a callee-saved register
constexpr Register LatchRegister = vm::BytesPerWord == 4 ? rdi : r14;

constexpr Register ScratchRegister = vm::BytesPerWord == 4 ? rcx : r11;

}  // namespace x86
}  // namespace codegen
}  // namespace lowering

#endif  // LOWERING_CODEGEN_TARGET_X86_REGISTERS_H
