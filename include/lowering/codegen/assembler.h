/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef LOWERING_CODEGEN_ASSEMBLER_H
#define LOWERING_CODEGEN_ASSEMBLER_H

#include <lowering/system/system.h>
#include <lowering/zone.h>
#include <lowering/vector.h>
#include <lowering/util/cpp.h>
#include <lowering/codegen/template.h>

namespace lowering {
namespace codegen {

class Architecture;

template <size_t Count>
class Operands {
 public:
  Operand* operands[Count + 1];

  template <class... Ts>
  Operands(Ts... ts)
      : operands{ts...}
  {
  }

  operator util::Slice<Operand*>()
  {
    return util::Slice<Operand*>(&operands[0], Count);
  }
};

template <class... Ts>
inline Operands<util::ArgumentCount<Ts...>::Result> operands(Ts... ts)
{
  return Operands<util::ArgumentCount<Ts...>::Result>(ts...);
}

// Records the operands, labels and instructions of one template at a
// time.  A TemplateAssembler is single-threaded; concurrent
// compilations each work on their own copy().
class TemplateAssembler {
 public:
  TemplateAssembler(vm::System* s,
                    util::Allocator* allocator,
                    vm::Zone* zone,
                    Architecture* arch,
                    bool printTemplates);

  ~TemplateAssembler();

  unsigned wordSize();

  Kind wordKind();

  // starts a new template, returning its result operand (or null for
  // templates which produce no value)
  Operand* restart(Kind resultKind);

  Operand* restart()
  {
    return restart(VoidKind);
  }

  Operand* createInputParameter(const char* name, Kind kind);
  Operand* createConstantInputParameter(const char* name, Kind kind);
  Operand* createTemp(const char* name, Kind kind);
  Operand* createRegisterTemp(const char* name, Kind kind, Register reg);

  Operand* i(int32_t v);
  Operand* l(int64_t v);
  Operand* w(int64_t v);
  Operand* b(bool v);
  Operand* o(const void* p);

  Label* createInlineLabel(const char* name);
  Label* createOutOfLineLabel(const char* name);
  Label* trueSuccessor();
  Label* falseSuccessor();

  void bindInline(Label* label);
  void bindOutOfLine(Label* label);

  void mov(Operand* result, Operand* a);
  void add(Operand* result, Operand* a, Operand* b);
  void sub(Operand* result, Operand* a, Operand* b);
  void mod(Operand* result, Operand* a, Operand* b);
  void and_(Operand* result, Operand* a, Operand* b);
  void shr(Operand* result, Operand* a, Operand* b);
  void lea(Operand* result,
           Operand* base,
           Operand* index,
           int displacement,
           unsigned scale);

  void pload(Kind kind, Operand* result, Operand* pointer, bool canTrap);
  void pload(Kind kind,
             Operand* result,
             Operand* pointer,
             Operand* offset,
             bool canTrap);
  void pload(Kind kind,
             Operand* result,
             Operand* pointer,
             Operand* index,
             int displacement,
             unsigned scale,
             bool canTrap);

  void pstore(Kind kind, Operand* pointer, Operand* value, bool canTrap);
  void pstore(Kind kind,
              Operand* pointer,
              Operand* offset,
              Operand* value,
              bool canTrap);
  void pstore(Kind kind,
              Operand* pointer,
              Operand* index,
              Operand* value,
              int displacement,
              unsigned scale,
              bool canTrap);

  void jmp(Label* label);
  void jeq(Label* label, Operand* a, Operand* b);
  void jneq(Label* label, Operand* a, Operand* b);
  void jgt(Label* label, Operand* a, Operand* b);
  void jgteq(Label* label, Operand* a, Operand* b);
  void jlt(Label* label, Operand* a, Operand* b);
  void jlteq(Label* label, Operand* a, Operand* b);
  void jugteq(Label* label, Operand* a, Operand* b);

  void callStub(Template* stub, Operand* result, util::Slice<Operand*> arguments);
  void callRuntime(const RuntimeCall* call,
                   Operand* result,
                   util::Slice<Operand*> arguments);

  void nullCheck(Operand* pointer);
  void safepoint();
  void here(Operand* result);
  void pushFrame();
  void popFrame();
  void stackOverflowCheck();
  void deoptimize();
  void shouldNotReachHere();

  Template* finishTemplate(Operand* result, const char* name);
  Template* finishTemplate(const char* name);
  Template* finishStub(const char* name);

  // a fresh assembler for the same target whose templates are
  // allocated in the given zone
  TemplateAssembler* copy(vm::Zone* zone);

  void dispose();

  vm::System* s;
  util::Allocator* allocator;
  vm::Zone* zone;
  Architecture* arch;
  bool printTemplates;

 private:
  Operand* operand(Operand::Type type, Kind kind, const char* name);
  Label* label(Label::Type type, const char* name);
  Instruction* append(Operation op, Kind kind);
  void branch(Operation op, Label* label, Operand* a, Operand* b);
  void bind(Label* label, bool slowPath);
  Template* finish(Operand* result, const char* name, unsigned flags);
  void reset();

  vm::Vector operandList;
  vm::Vector labelList;
  vm::Vector fastPath;
  vm::Vector slowPath;
  Operand* resultOperand;
  Label* trueLabel;
  Label* falseLabel;
  unsigned parameterCount;
  unsigned flags;
  bool outOfLine;
};

}  // namespace codegen
}  // namespace lowering

#endif  // LOWERING_CODEGEN_ASSEMBLER_H
