/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <lowering/codegen/assembler.h>
#include <lowering/codegen/architecture.h>
#include <lowering/codegen/stubs.h>

using namespace lowering::util;

namespace lowering {
namespace codegen {

TemplateAssembler::TemplateAssembler(vm::System* s,
                                     util::Allocator* allocator,
                                     vm::Zone* zone,
                                     Architecture* arch,
                                     bool printTemplates)
    : s(s),
      allocator(allocator),
      zone(zone),
      arch(arch),
      printTemplates(printTemplates),
      operandList(s, allocator, 32 * vm::BytesPerWord),
      labelList(s, allocator, 8 * vm::BytesPerWord),
      fastPath(s, allocator, 16 * sizeof(Instruction)),
      slowPath(s, allocator, 8 * sizeof(Instruction)),
      resultOperand(0),
      trueLabel(0),
      falseLabel(0),
      parameterCount(0),
      flags(0),
      outOfLine(false)
{
}

TemplateAssembler::~TemplateAssembler()
{
  dispose();
}

void TemplateAssembler::dispose()
{
  operandList.dispose();
  labelList.dispose();
  fastPath.dispose();
  slowPath.dispose();
}

unsigned TemplateAssembler::wordSize()
{
  return arch->wordSize();
}

Kind TemplateAssembler::wordKind()
{
  return codegen::wordKind(arch->wordSize());
}

void TemplateAssembler::reset()
{
  operandList.position = 0;
  labelList.position = 0;
  fastPath.position = 0;
  slowPath.position = 0;
  resultOperand = 0;
  trueLabel = 0;
  falseLabel = 0;
  parameterCount = 0;
  flags = 0;
  outOfLine = false;
}

Operand* TemplateAssembler::restart(Kind resultKind)
{
  reset();
  if (resultKind != VoidKind) {
    resultOperand = operand(Operand::Result, resultKind, "result");
  }
  return resultOperand;
}

Operand* TemplateAssembler::operand(Operand::Type type,
                                    Kind kind,
                                    const char* name)
{
  unsigned index = operandList.length() / vm::BytesPerWord;
  Operand* o = new (zone) Operand(type, kind, name, index);
  operandList.appendAddress(o);
  return o;
}

Operand* TemplateAssembler::createInputParameter(const char* name, Kind kind)
{
  Operand* o = operand(Operand::Parameter, kind, name);
  o->parameterIndex = parameterCount++;
  return o;
}

Operand* TemplateAssembler::createConstantInputParameter(const char* name,
                                                         Kind kind)
{
  Operand* o = operand(Operand::ConstantParameter, kind, name);
  o->parameterIndex = parameterCount++;
  return o;
}

Operand* TemplateAssembler::createTemp(const char* name, Kind kind)
{
  return operand(Operand::Temp, kind, name);
}

Operand* TemplateAssembler::createRegisterTemp(const char* name,
                                               Kind kind,
                                               Register reg)
{
  Operand* o = operand(Operand::RegisterTemp, kind, name);
  o->register_ = reg;
  return o;
}

Operand* TemplateAssembler::i(int32_t v)
{
  Operand* o = operand(Operand::Constant, IntKind, "int");
  o->value = v;
  return o;
}

Operand* TemplateAssembler::l(int64_t v)
{
  Operand* o = operand(Operand::Constant, LongKind, "long");
  o->value = v;
  return o;
}

Operand* TemplateAssembler::w(int64_t v)
{
  Operand* o = operand(Operand::Constant, wordKind(), "word");
  o->value = v;
  return o;
}

Operand* TemplateAssembler::b(bool v)
{
  Operand* o = operand(Operand::Constant, BooleanKind, "boolean");
  o->value = v ? 1 : 0;
  return o;
}

Operand* TemplateAssembler::o(const void* p)
{
  Operand* o = operand(Operand::Constant, ObjectKind, "object");
  o->value = static_cast<int64_t>(reinterpret_cast<uintptr_t>(p));
  return o;
}

Label* TemplateAssembler::label(Label::Type type, const char* name)
{
  unsigned index = labelList.length() / vm::BytesPerWord;
  Label* l = new (zone) Label(type, name, index);
  labelList.appendAddress(l);
  return l;
}

Label* TemplateAssembler::createInlineLabel(const char* name)
{
  return label(Label::Inline, name);
}

Label* TemplateAssembler::createOutOfLineLabel(const char* name)
{
  return label(Label::OutOfLine, name);
}

Label* TemplateAssembler::trueSuccessor()
{
  if (trueLabel == 0) {
    trueLabel = label(Label::TrueSuccessor, "true");
  }
  return trueLabel;
}

Label* TemplateAssembler::falseSuccessor()
{
  if (falseLabel == 0) {
    falseLabel = label(Label::FalseSuccessor, "false");
  }
  return falseLabel;
}

void TemplateAssembler::bind(Label* label, bool slow)
{
  expect(s, not label->bound);

  label->bound = true;
  label->slowPath = slow;
  label->position = (slow ? slowPath.length() : fastPath.length())
                    / sizeof(Instruction);
  outOfLine = slow;
}

void TemplateAssembler::bindInline(Label* label)
{
  expect(s, label->type == Label::Inline);
  bind(label, false);
}

void TemplateAssembler::bindOutOfLine(Label* label)
{
  expect(s, label->type == Label::OutOfLine);
  bind(label, true);
}

Instruction* TemplateAssembler::append(Operation op, Kind kind)
{
  // code following an out-of-line label belongs to the slow path until
  // the next inline label is bound
  vm::Vector* path = outOfLine ? &slowPath : &fastPath;

  Instruction instruction(op, kind);
  return static_cast<Instruction*>(
      path->append(&instruction, sizeof(Instruction)));
}

void TemplateAssembler::mov(Operand* result, Operand* a)
{
  Instruction* i = append(Mov, result->kind);
  i->result = result;
  i->x = a;
}

void TemplateAssembler::add(Operand* result, Operand* a, Operand* b)
{
  Instruction* i = append(Add, result->kind);
  i->result = result;
  i->x = a;
  i->y = b;
}

void TemplateAssembler::sub(Operand* result, Operand* a, Operand* b)
{
  Instruction* i = append(Sub, result->kind);
  i->result = result;
  i->x = a;
  i->y = b;
}

void TemplateAssembler::mod(Operand* result, Operand* a, Operand* b)
{
  Instruction* i = append(Mod, result->kind);
  i->result = result;
  i->x = a;
  i->y = b;
}

void TemplateAssembler::and_(Operand* result, Operand* a, Operand* b)
{
  Instruction* i = append(And, result->kind);
  i->result = result;
  i->x = a;
  i->y = b;
}

void TemplateAssembler::shr(Operand* result, Operand* a, Operand* b)
{
  Instruction* i = append(Shr, result->kind);
  i->result = result;
  i->x = a;
  i->y = b;
}

void TemplateAssembler::lea(Operand* result,
                            Operand* base,
                            Operand* index,
                            int displacement,
                            unsigned scale)
{
  Instruction* i = append(Lea, result->kind);
  i->result = result;
  i->x = base;
  i->y = index;
  i->displacement = displacement;
  i->scale = scale;
}

void TemplateAssembler::pload(Kind kind,
                              Operand* result,
                              Operand* pointer,
                              bool canTrap)
{
  pload(kind, result, pointer, 0, 0, 1, canTrap);
}

void TemplateAssembler::pload(Kind kind,
                              Operand* result,
                              Operand* pointer,
                              Operand* offset,
                              bool canTrap)
{
  pload(kind, result, pointer, offset, 0, 1, canTrap);
}

void TemplateAssembler::pload(Kind kind,
                              Operand* result,
                              Operand* pointer,
                              Operand* index,
                              int displacement,
                              unsigned scale,
                              bool canTrap)
{
  Instruction* i = append(PointerLoad, kind);
  i->result = result;
  i->x = pointer;
  i->y = index;
  i->displacement = displacement;
  i->scale = scale;
  i->canTrap = canTrap;
}

void TemplateAssembler::pstore(Kind kind,
                               Operand* pointer,
                               Operand* value,
                               bool canTrap)
{
  pstore(kind, pointer, 0, value, 0, 1, canTrap);
}

void TemplateAssembler::pstore(Kind kind,
                               Operand* pointer,
                               Operand* offset,
                               Operand* value,
                               bool canTrap)
{
  pstore(kind, pointer, offset, value, 0, 1, canTrap);
}

void TemplateAssembler::pstore(Kind kind,
                               Operand* pointer,
                               Operand* index,
                               Operand* value,
                               int displacement,
                               unsigned scale,
                               bool canTrap)
{
  Instruction* i = append(PointerStore, kind);
  i->x = pointer;
  i->y = index;
  i->z = value;
  i->displacement = displacement;
  i->scale = scale;
  i->canTrap = canTrap;
}

void TemplateAssembler::branch(Operation op,
                               Label* label,
                               Operand* a,
                               Operand* b)
{
  Instruction* i = append(op, a ? a->kind : VoidKind);
  i->label = label;
  i->x = a;
  i->y = b;
  flags |= Template::HasControlFlow;
}

void TemplateAssembler::jmp(Label* label)
{
  branch(Jmp, label, 0, 0);
}

void TemplateAssembler::jeq(Label* label, Operand* a, Operand* b)
{
  branch(Jeq, label, a, b);
}

void TemplateAssembler::jneq(Label* label, Operand* a, Operand* b)
{
  branch(Jneq, label, a, b);
}

void TemplateAssembler::jgt(Label* label, Operand* a, Operand* b)
{
  branch(Jgt, label, a, b);
}

void TemplateAssembler::jgteq(Label* label, Operand* a, Operand* b)
{
  branch(Jgteq, label, a, b);
}

void TemplateAssembler::jlt(Label* label, Operand* a, Operand* b)
{
  branch(Jlt, label, a, b);
}

void TemplateAssembler::jlteq(Label* label, Operand* a, Operand* b)
{
  branch(Jlteq, label, a, b);
}

void TemplateAssembler::jugteq(Label* label, Operand* a, Operand* b)
{
  branch(Jugteq, label, a, b);
}

void TemplateAssembler::callStub(Template* stub,
                                 Operand* result,
                                 util::Slice<Operand*> arguments)
{
  expect(s, stub->isStub());
  expect(s, arguments.count == stub->parameters.count);

  Instruction* i = append(CallStub, result ? result->kind : VoidKind);
  i->result = result;
  i->stub = stub;
  i->arguments = arguments.clone(zone);
  flags |= Template::HasStubCall;
}

void TemplateAssembler::callRuntime(const RuntimeCall* call,
                                    Operand* result,
                                    util::Slice<Operand*> arguments)
{
  expect(s, arguments.count == call->parameterCount);

  Instruction* i = append(CallRuntime, result ? result->kind : VoidKind);
  i->result = result;
  i->call = call;
  i->arguments = arguments.clone(zone);
  flags |= Template::HasRuntimeCall;
}

void TemplateAssembler::nullCheck(Operand* pointer)
{
  Instruction* i = append(NullCheck, ObjectKind);
  i->x = pointer;
  i->canTrap = true;
}

void TemplateAssembler::safepoint()
{
  append(Safepoint, VoidKind);
  flags |= Template::HasSafepoint;
}

void TemplateAssembler::here(Operand* result)
{
  Instruction* i = append(Here, result->kind);
  i->result = result;
}

void TemplateAssembler::pushFrame()
{
  append(PushFrame, VoidKind);
}

void TemplateAssembler::popFrame()
{
  append(PopFrame, VoidKind);
}

void TemplateAssembler::stackOverflowCheck()
{
  append(StackOverflowCheck, VoidKind);
}

void TemplateAssembler::deoptimize()
{
  append(Deoptimize, VoidKind);
}

void TemplateAssembler::shouldNotReachHere()
{
  append(ShouldNotReachHere, VoidKind);
}

Template* TemplateAssembler::finish(Operand* result,
                                    const char* name,
                                    unsigned extraFlags)
{
  unsigned operandCount = operandList.length() / vm::BytesPerWord;
  unsigned labelCount = labelList.length() / vm::BytesPerWord;

  Slice<Operand*> operands = Slice<Operand*>::alloc(zone, operandCount);
  Slice<Operand*> parameters = Slice<Operand*>::alloc(zone, parameterCount);
  for (unsigned i = 0; i < operandCount; ++i) {
    Operand* o = static_cast<Operand*>(
        operandList.getAddress(i * vm::BytesPerWord));
    operands[i] = o;
    if (o->isParameter()) {
      parameters[o->parameterIndex] = o;
    }
  }

  Slice<Label*> labels = Slice<Label*>::alloc(zone, labelCount);
  for (unsigned i = 0; i < labelCount; ++i) {
    Label* l = static_cast<Label*>(labelList.getAddress(i * vm::BytesPerWord));
    if ((l->type == Label::Inline or l->type == Label::OutOfLine)
        and not l->bound) {
      fprintf(stderr, "label %s of %s was never bound\n", l->name, name);
      abort(s);
    }
    labels[i] = l;
  }

  Slice<Instruction> fast(fastPath.data.items
                              ? reinterpret_cast<Instruction*>(
                                    fastPath.data.items)
                              : 0,
                          fastPath.length() / sizeof(Instruction));
  Slice<Instruction> slow(slowPath.data.items
                              ? reinterpret_cast<Instruction*>(
                                    slowPath.data.items)
                              : 0,
                          slowPath.length() / sizeof(Instruction));

  Template* t = new (zone) Template(zone->copy(name),
                                    result,
                                    parameters,
                                    operands,
                                    labels,
                                    fast.clone(zone),
                                    slow.clone(zone),
                                    flags | extraFlags);

  if (printTemplates) {
    t->print(stderr);
  }

  reset();

  return t;
}

Template* TemplateAssembler::finishTemplate(Operand* result, const char* name)
{
  return finish(result, name, 0);
}

Template* TemplateAssembler::finishTemplate(const char* name)
{
  return finish(resultOperand, name, 0);
}

Template* TemplateAssembler::finishStub(const char* name)
{
  return finish(resultOperand, name, Template::IsStub);
}

TemplateAssembler* TemplateAssembler::copy(vm::Zone* zone)
{
  return new (zone)
      TemplateAssembler(s, allocator, zone, arch, printTemplates);
}

}  // namespace codegen
}  // namespace lowering
