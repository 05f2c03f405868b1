/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <lowering/system/system.h>
#include <lowering/codegen/architecture.h>
#include <lowering/codegen/assembler.h>
#include <lowering/codegen/targets.h>

#include "registers.h"

using namespace lowering::vm;

namespace lowering {
namespace codegen {
namespace x86 {

const char* const registerNames64[] = {
    "rax", "rcx", "rdx", "rbx", "rsp", "rbp", "rsi", "rdi",
    "r8",  "r9",  "r10", "r11", "r12", "r13", "r14", "r15",
    "xmm0", "xmm1", "xmm2", "xmm3", "xmm4", "xmm5", "xmm6", "xmm7",
    "xmm8", "xmm9", "xmm10", "xmm11", "xmm12", "xmm13", "xmm14", "xmm15"};

const char* const registerNames32[] = {
    "eax", "ecx", "edx", "ebx", "esp", "ebp", "esi", "edi"};

class MyArchitecture : public Architecture {
 public:
  MyArchitecture(System* system)
      : s(system),
        referenceCount(0),
        myRegisterFile(GeneralRegisterMask,
                       FloatRegisterMask,
                       LatchRegister | ScratchRegister | rsp)
  {
  }

  virtual const char* name()
  {
    return BytesPerWord == 8 ? "x86_64" : "x86";
  }

  virtual unsigned wordSize()
  {
    return BytesPerWord;
  }

  virtual const RegisterFile* registerFile()
  {
    return &myRegisterFile;
  }

  virtual Register latch()
  {
    return LatchRegister;
  }

  virtual Register scratch()
  {
    return ScratchRegister;
  }

  virtual const char* registerName(Register reg)
  {
    int index = reg.index();
    if (index < 0) {
      return "none";
    } else if (BytesPerWord == 8) {
      return index < 32 ? registerNames64[index] : "?";
    } else if (index < 8) {
      return registerNames32[index];
    } else if (index >= 16 and index < 24) {
      return registerNames64[index];
    } else {
      return "?";
    }
  }

  // a single lea covers the whole computation when every element is
  // already a multiple of the object alignment
  virtual void alignArraySize(TemplateAssembler* a,
                              Operand* length,
                              Operand* arraySize,
                              unsigned elementSize,
                              unsigned headerSize,
                              unsigned objectAlignment)
  {
    int mask = objectAlignment - 1;
    if (elementSize == objectAlignment and (headerSize & mask) == 0) {
      a->mov(arraySize, a->i(headerSize));
      a->lea(arraySize, arraySize, length, 0, elementSize);
    } else {
      a->mov(arraySize, a->i(headerSize + mask));
      a->lea(arraySize, arraySize, length, 0, elementSize);
      a->and_(arraySize, arraySize, a->i(~mask));
    }
  }

  virtual void acquire()
  {
    ++referenceCount;
  }

  virtual void release()
  {
    if (--referenceCount == 0) {
      s->free(this);
    }
  }

  System* s;
  unsigned referenceCount;
  const RegisterFile myRegisterFile;
};

}  // namespace x86

Architecture* makeArchitectureX86(System* system)
{
  return new (allocate(system, sizeof(x86::MyArchitecture)))
      x86::MyArchitecture(system);
}

}  // namespace codegen
}  // namespace lowering
