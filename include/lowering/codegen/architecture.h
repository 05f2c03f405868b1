/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef LOWERING_CODEGEN_ARCHITECTURE_H
#define LOWERING_CODEGEN_ARCHITECTURE_H

#include <lowering/codegen/registers.h>
#include <lowering/codegen/kind.h>

namespace lowering {
namespace codegen {

class TemplateAssembler;
class Operand;

// The parts of template generation which differ between instruction
// set families.  One instance is selected when a catalog is built.
class Architecture {
 public:
  virtual const char* name() = 0;

  virtual unsigned wordSize() = 0;

  virtual const RegisterFile* registerFile() = 0;

  // holds the address of the current thread's locals; loading through
  // it is the safepoint poll
  virtual Register latch() = 0;

  virtual Register scratch() = 0;

  virtual const char* registerName(Register reg) = 0;

  // emits arraySize = align(headerSize + length * elementSize,
  // objectAlignment)
  virtual void alignArraySize(TemplateAssembler* a,
                              Operand* length,
                              Operand* arraySize,
                              unsigned elementSize,
                              unsigned headerSize,
                              unsigned objectAlignment) = 0;

  virtual void acquire() = 0;
  virtual void release() = 0;
};

}  // namespace codegen
}  // namespace lowering

#endif  // LOWERING_CODEGEN_ARCHITECTURE_H
