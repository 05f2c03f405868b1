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
namespace arm {

class MyArchitecture : public Architecture {
 public:
  MyArchitecture(System* system)
      : s(system), referenceCount(0), myRegisterFile(
            GPR_MASK,
            FPR_MASK,
            LatchRegister | ScratchRegister | StackRegister | LinkRegister)
  {
    for (int i = 0; i < N_GPRS; ++i) {
      vm::snprintf(names[i], sizeof(names[i]), "%c%d", BytesPerWord == 8 ? 'x' : 'r', i);
    }
    for (int i = 0; i < N_FPRS; ++i) {
      vm::snprintf(names[N_GPRS + i], sizeof(names[i]), "%c%d", BytesPerWord == 8 ? 'v' : 'd', i);
    }
    vm::snprintf(names[StackRegister.index()], sizeof(names[0]), "sp");
    vm::snprintf(names[LinkRegister.index()], sizeof(names[0]), "lr");
  }

  virtual const char* name()
  {
    return BytesPerWord == 8 ? "arm64" : "arm";
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
    if (index < 0 or index >= N_GPRS + N_FPRS) {
      return "none";
    }
    return names[index];
  }

  // there is no scaled add with an immediate mask here, so the rounding
  // step is skipped when the unrounded size is already aligned
  virtual void alignArraySize(TemplateAssembler* a,
                              Operand* length,
                              Operand* arraySize,
                              unsigned elementSize,
                              unsigned headerSize,
                              unsigned objectAlignment)
  {
    int mask = objectAlignment - 1;

    Operand* remainder
        = a->createRegisterTemp("remainder", IntKind, ScratchRegister);
    Label* aligned = a->createInlineLabel("aligned");

    a->mov(arraySize, a->i(headerSize));
    a->lea(arraySize, arraySize, length, 0, elementSize);
    a->and_(remainder, arraySize, a->i(mask));
    a->jeq(aligned, remainder, a->i(0));
    a->add(arraySize, arraySize, a->i(mask));
    a->and_(arraySize, arraySize, a->i(~mask));
    a->bindInline(aligned);
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
  char names[N_GPRS + N_FPRS][8];
};

}  // namespace arm

Architecture* makeArchitectureArm(System* system)
{
  return new (allocate(system, sizeof(arm::MyArchitecture)))
      arm::MyArchitecture(system);
}

}  // namespace codegen
}  // namespace lowering
