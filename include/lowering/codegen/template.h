/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef LOWERING_CODEGEN_TEMPLATE_H
#define LOWERING_CODEGEN_TEMPLATE_H

#include <lowering/common.h>
#include <lowering/util/slice.h>
#include <lowering/codegen/kind.h>
#include <lowering/codegen/registers.h>

namespace lowering {
namespace codegen {

class Template;
class RuntimeCall;

class Operand {
 public:
  enum Type {
    Result,
    Parameter,
    ConstantParameter,
    Temp,
    RegisterTemp,
    Constant
  };

  Operand(Type type, Kind kind, const char* name, unsigned index)
      : type(type),
        kind(kind),
        name(name),
        index(index),
        parameterIndex(-1),
        register_(NoRegister),
        value(0)
  {
  }

  bool isParameter() const
  {
    return type == Parameter or type == ConstantParameter;
  }

  Type type;
  Kind kind;
  const char* name;
  // position in the owning template's operand table
  unsigned index;
  int parameterIndex;
  Register register_;
  int64_t value;
};

class Label {
 public:
  enum Type { Inline, OutOfLine, TrueSuccessor, FalseSuccessor };

  Label(Type type, const char* name, unsigned index)
      : type(type),
        name(name),
        index(index),
        bound(false),
        slowPath(false),
        position(0)
  {
  }

  Type type;
  const char* name;
  unsigned index;
  bool bound;
  bool slowPath;
  unsigned position;
};

enum Operation {
#define TEMPLATE_OP(x) x,
#include "template-ops.inc.cpp"
#undef TEMPLATE_OP
};

const unsigned OperationCount = ShouldNotReachHere + 1;

const char* operationName(Operation op);

inline bool isBranch(Operation op)
{
  return op >= Jmp and op <= Jugteq;
}

// One instruction of a template.  Memory operations address
// x + (y * scale) + displacement, where y may be absent; stores take
// their value from z.
class Instruction {
 public:
  Instruction(Operation op, Kind kind)
      : op(op),
        kind(kind),
        result(0),
        x(0),
        y(0),
        z(0),
        label(0),
        displacement(0),
        scale(1),
        canTrap(false),
        stub(0),
        call(0),
        arguments(0, 0)
  {
  }

  Operation op;
  Kind kind;
  Operand* result;
  Operand* x;
  Operand* y;
  Operand* z;
  Label* label;
  int displacement;
  unsigned scale;
  bool canTrap;
  Template* stub;
  const RuntimeCall* call;
  util::Slice<Operand*> arguments;
};

class Template {
 public:
  enum Flag {
    HasStubCall = 1 << 0,
    HasRuntimeCall = 1 << 1,
    HasControlFlow = 1 << 2,
    HasSafepoint = 1 << 3,
    IsStub = 1 << 4
  };

  Template(const char* name,
           Operand* result,
           util::Slice<Operand*> parameters,
           util::Slice<Operand*> operands,
           util::Slice<Label*> labels,
           util::Slice<Instruction> fastPath,
           util::Slice<Instruction> slowPath,
           unsigned flags)
      : name(name),
        result(result),
        parameters(parameters),
        operands(operands),
        labels(labels),
        fastPath(fastPath),
        slowPath(slowPath),
        flags(flags)
  {
  }

  bool isStub() const
  {
    return (flags & IsStub) != 0;
  }

  Kind resultKind() const
  {
    return result ? result->kind : VoidKind;
  }

  void print(FILE* out);

  const char* name;
  Operand* result;
  util::Slice<Operand*> parameters;
  util::Slice<Operand*> operands;
  util::Slice<Label*> labels;
  util::Slice<Instruction> fastPath;
  util::Slice<Instruction> slowPath;
  unsigned flags;
};

// A resolved and an unresolved template for the same operation.
class TemplatePair {
 public:
  TemplatePair() : resolved(0), unresolved(0)
  {
  }

  TemplatePair(Template* resolved, Template* unresolved)
      : resolved(resolved), unresolved(unresolved)
  {
  }

  Template* resolved;
  Template* unresolved;
};

// A value supplied for one template parameter at a call site.
class Argument {
 public:
  enum Type { Constant, Reference, Variable };

  static Argument forInt(int32_t v)
  {
    return Argument(Constant, IntKind, v);
  }

  static Argument forLong(int64_t v)
  {
    return Argument(Constant, LongKind, v);
  }

  static Argument forBoolean(bool v)
  {
    return Argument(Constant, BooleanKind, v ? 1 : 0);
  }

  static Argument forWord(uintptr_t v)
  {
    return Argument(Constant, KindOf<uintptr_t>::Value, static_cast<int64_t>(v));
  }

  static Argument forObject(const void* p)
  {
    return Argument(
        Reference, ObjectKind, static_cast<int64_t>(reinterpret_cast<uintptr_t>(p)));
  }

  // a value known only when the instantiated code runs, held in the
  // caller's variable slot of the given index
  static Argument forVariable(unsigned index, Kind kind)
  {
    Argument a(Variable, kind, 0);
    a.variable = index;
    return a;
  }

  bool isConstant() const
  {
    return type != Variable;
  }

  Type type;
  Kind kind;
  int64_t value;
  unsigned variable;

 private:
  Argument(Type type, Kind kind, int64_t value)
      : type(type), kind(kind), value(value), variable(0)
  {
  }
};

// A template bound to the operands of one call site.  Snippets belong
// to a single compilation and are never shared.
class Snippet {
 public:
  Snippet(Template* template_, util::Slice<Argument> arguments)
      : template_(template_), arguments(arguments)
  {
  }

  void print(FILE* out);

  Template* template_;
  util::Slice<Argument> arguments;
};

}  // namespace codegen
}  // namespace lowering

#endif  // LOWERING_CODEGEN_TEMPLATE_H
