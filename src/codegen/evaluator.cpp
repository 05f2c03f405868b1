/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <lowering/codegen/evaluator.h>
#include <lowering/codegen/architecture.h>
#include <lowering/codegen/stubs.h>
#include <lowering/vm/machine.h>
#include <lowering/util/runtime-array.h>

using namespace lowering::util;
using namespace lowering::vm;

namespace {

namespace local {

const bool DebugEvaluator = false;

}  // namespace local

using lowering::codegen::Kind;

// the canonical value of an operand slot of the given kind: narrow
// kinds are carried as sign-extended ints, references as unsigned
// addresses
int64_t normalize(Kind kind, int64_t v)
{
  switch (kind) {
  case lowering::codegen::BooleanKind:
  case lowering::codegen::ByteKind:
  case lowering::codegen::ShortKind:
  case lowering::codegen::CharKind:
  case lowering::codegen::IntKind:
  case lowering::codegen::FloatKind:
    return static_cast<int32_t>(v);

  case lowering::codegen::ObjectKind:
    return static_cast<int64_t>(static_cast<uintptr_t>(v));

  default:
    return v;
  }
}

int64_t load(Kind kind, uintptr_t address)
{
  switch (kind) {
  case lowering::codegen::BooleanKind:
    return *reinterpret_cast<uint8_t*>(address);

  case lowering::codegen::ByteKind:
    return *reinterpret_cast<int8_t*>(address);

  case lowering::codegen::ShortKind:
    return *reinterpret_cast<int16_t*>(address);

  case lowering::codegen::CharKind:
    return *reinterpret_cast<uint16_t*>(address);

  case lowering::codegen::IntKind:
  case lowering::codegen::FloatKind:
    return *reinterpret_cast<int32_t*>(address);

  case lowering::codegen::LongKind:
  case lowering::codegen::DoubleKind:
    return *reinterpret_cast<int64_t*>(address);

  case lowering::codegen::ObjectKind:
    return static_cast<int64_t>(*reinterpret_cast<uintptr_t*>(address));

  default:
    ::abort();
  }
}

void store(Kind kind, uintptr_t address, int64_t v)
{
  switch (kind) {
  case lowering::codegen::BooleanKind:
  case lowering::codegen::ByteKind:
    *reinterpret_cast<int8_t*>(address) = static_cast<int8_t>(v);
    break;

  case lowering::codegen::ShortKind:
  case lowering::codegen::CharKind:
    *reinterpret_cast<int16_t*>(address) = static_cast<int16_t>(v);
    break;

  case lowering::codegen::IntKind:
  case lowering::codegen::FloatKind:
    *reinterpret_cast<int32_t*>(address) = static_cast<int32_t>(v);
    break;

  case lowering::codegen::LongKind:
  case lowering::codegen::DoubleKind:
    *reinterpret_cast<int64_t*>(address) = v;
    break;

  case lowering::codegen::ObjectKind:
    *reinterpret_cast<uintptr_t*>(address) = static_cast<uintptr_t>(v);
    break;

  default:
    ::abort();
  }
}

bool isIntKind(Kind kind)
{
  return lowering::codegen::stackKind(kind) == lowering::codegen::IntKind
         or kind == lowering::codegen::FloatKind;
}

}  // namespace

namespace lowering {
namespace codegen {

Evaluator::Evaluator(Architecture* arch, vm::Thread* t)
    : arch(arch), t(t), instructions(0), stubCalls(0), runtimeCalls(0)
{
}

Evaluator::Result Evaluator::run(Snippet* snippet, Slice<int64_t> variables)
{
  unsigned count = snippet->arguments.count;
  RUNTIME_ARRAY(int64_t, parameters, count);

  for (unsigned i = 0; i < count; ++i) {
    Argument& a = snippet->arguments[i];
    if (a.type == Argument::Variable) {
      expect(t, a.variable < variables.count);
      RUNTIME_ARRAY_BODY(parameters)[i] = normalize(a.kind,
                                                    variables[a.variable]);
    } else {
      RUNTIME_ARRAY_BODY(parameters)[i] = normalize(a.kind, a.value);
    }
  }

  if (local::DebugEvaluator) {
    fprintf(stderr, "run %s\n", snippet->template_->name);
  }

  return run(snippet->template_, RUNTIME_ARRAY_BODY(parameters));
}

Evaluator::Result Evaluator::run(Template* tmpl, const int64_t* parameters)
{
  unsigned count = tmpl->operands.count;
  RUNTIME_ARRAY(int64_t, slots, count);
  int64_t* v = RUNTIME_ARRAY_BODY(slots);

  for (unsigned i = 0; i < count; ++i) {
    Operand* o = tmpl->operands[i];
    switch (o->type) {
    case Operand::Constant:
      v[i] = normalize(o->kind, o->value);
      break;

    case Operand::Parameter:
    case Operand::ConstantParameter:
      v[i] = normalize(o->kind, parameters[o->parameterIndex]);
      break;

    case Operand::RegisterTemp:
      v[i] = o->register_ == arch->latch()
                 ? static_cast<int64_t>(reinterpret_cast<uintptr_t>(t->locals))
                 : 0;
      break;

    default:
      v[i] = 0;
      break;
    }
  }

  Slice<Instruction> path = tmpl->fastPath;
  bool slow = false;
  unsigned pc = 0;

  while (true) {
    if (pc == path.count) {
      if (slow) {
        fprintf(stderr, "fell off the end of the slow path of %s\n", tmpl->name);
        abort(t);
      }

      return Result(Normal, tmpl->result ? v[tmpl->result->index] : 0);
    }

    Instruction* i = &path[pc++];
    ++instructions;

    switch (i->op) {
    case Mov:
      v[i->result->index] = normalize(i->kind, v[i->x->index]);
      break;

    case Add:
      v[i->result->index]
          = normalize(i->kind, v[i->x->index] + v[i->y->index]);
      break;

    case Sub:
      v[i->result->index]
          = normalize(i->kind, v[i->x->index] - v[i->y->index]);
      break;

    case Mod: {
      int64_t divisor = v[i->y->index];
      expect(t, divisor != 0);
      v[i->result->index] = normalize(i->kind, v[i->x->index] % divisor);
    } break;

    case And:
      v[i->result->index]
          = normalize(i->kind, v[i->x->index] & v[i->y->index]);
      break;

    case Shr: {
      unsigned shift = static_cast<unsigned>(v[i->y->index]);
      int64_t r = isIntKind(i->kind)
                      ? static_cast<uint32_t>(v[i->x->index]) >> (shift & 31)
                      : static_cast<int64_t>(
                            static_cast<uint64_t>(v[i->x->index])
                            >> (shift & 63));
      v[i->result->index] = normalize(i->kind, r);
    } break;

    case Lea:
      v[i->result->index] = normalize(
          i->kind,
          v[i->x->index] + (i->y ? v[i->y->index] * i->scale : 0)
              + i->displacement);
      break;

    case PointerLoad:
    case PointerStore: {
      int64_t base = v[i->x->index];
      if (base == 0) {
        if (i->canTrap) {
          throwNew(t, Machine::NullPointerExceptionType, 0, "%s", tmpl->name);
          return Result(Threw, 0);
        }

        fprintf(stderr, "unchecked null access in %s\n", tmpl->name);
        abort(t);
      }

      uintptr_t address = static_cast<uintptr_t>(
          base + (i->y ? v[i->y->index] * i->scale : 0) + i->displacement);

      if (i->op == PointerLoad) {
        v[i->result->index]
            = normalize(i->result->kind, load(i->kind, address));
      } else {
        store(i->kind, address, v[i->z->index]);
      }
    } break;

    case Jmp:
    case Jeq:
    case Jneq:
    case Jgt:
    case Jgteq:
    case Jlt:
    case Jlteq:
    case Jugteq: {
      bool taken;
      if (i->op == Jmp) {
        taken = true;
      } else {
        int64_t a = v[i->x->index];
        int64_t b = v[i->y->index];
        switch (i->op) {
        case Jeq:
          taken = a == b;
          break;
        case Jneq:
          taken = a != b;
          break;
        case Jgt:
          taken = a > b;
          break;
        case Jgteq:
          taken = a >= b;
          break;
        case Jlt:
          taken = a < b;
          break;
        case Jlteq:
          taken = a <= b;
          break;
        default:
          taken = isIntKind(i->kind) ? static_cast<uint32_t>(a)
                                           >= static_cast<uint32_t>(b)
                                     : static_cast<uint64_t>(a)
                                           >= static_cast<uint64_t>(b);
          break;
        }
      }

      if (taken) {
        Label* l = i->label;
        switch (l->type) {
        case Label::TrueSuccessor:
          return Result(TrueSuccessor, 0);

        case Label::FalseSuccessor:
          return Result(FalseSuccessor, 0);

        default:
          slow = l->slowPath;
          path = slow ? tmpl->slowPath : tmpl->fastPath;
          pc = l->position;
          break;
        }
      }
    } break;

    case CallStub: {
      unsigned argumentCount = i->arguments.count;
      RUNTIME_ARRAY(int64_t, arguments, argumentCount);
      for (unsigned j = 0; j < argumentCount; ++j) {
        RUNTIME_ARRAY_BODY(arguments)[j] = v[i->arguments[j]->index];
      }

      ++stubCalls;
      Result r = run(i->stub, RUNTIME_ARRAY_BODY(arguments));
      if (r.outcome != Normal) {
        return r;
      }

      if (i->result) {
        v[i->result->index] = normalize(i->result->kind, r.value);
      }
    } break;

    case CallRuntime: {
      uint64_t arguments[MaxRuntimeCallParameters];
      for (unsigned j = 0; j < i->arguments.count; ++j) {
        arguments[j] = static_cast<uint64_t>(v[i->arguments[j]->index]);
      }

      ++runtimeCalls;
      uint64_t r = i->call->invoke(t, arguments);
      if (t->exception) {
        return Result(Threw, 0);
      }

      if (i->result) {
        v[i->result->index]
            = normalize(i->result->kind, static_cast<int64_t>(r));
      }
    } break;

    case NullCheck:
      if (v[i->x->index] == 0) {
        throwNew(t, Machine::NullPointerExceptionType, 0, "%s", tmpl->name);
        return Result(Threw, 0);
      }
      break;

    case Safepoint:
      safepointPoll(t);
      break;

    case Here:
      v[i->result->index] = normalize(
          i->result->kind,
          static_cast<int64_t>(reinterpret_cast<uintptr_t>(i)));
      break;

    case PushFrame:
      ++t->frameDepth;
      break;

    case PopFrame:
      expect(t, t->frameDepth > 0);
      --t->frameDepth;
      break;

    case StackOverflowCheck:
      if (t->frameDepth >= StackLimit) {
        throwNew(t,
                 Machine::StackOverflowErrorType,
                 t->frameDepth,
                 "%u frames",
                 t->frameDepth);
        return Result(Threw, 0);
      }
      break;

    case Deoptimize:
      return Result(Deoptimized, 0);

    case ShouldNotReachHere:
      fprintf(stderr, "reached the unreachable in %s\n", tmpl->name);
      abort(t);

    default:
      abort(t);
    }
  }
}

}  // namespace codegen
}  // namespace lowering
