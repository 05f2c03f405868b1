/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <lowering/codegen/template.h>
#include <lowering/codegen/stubs.h>

namespace lowering {
namespace codegen {

namespace {

const char* operationNames[] = {
#define TEMPLATE_OP(x) #x,
#include <lowering/codegen/template-ops.inc.cpp>
#undef TEMPLATE_OP
};

const char* operandTypeName(Operand::Type type)
{
  switch (type) {
  case Operand::Result:
    return "result";
  case Operand::Parameter:
    return "param";
  case Operand::ConstantParameter:
    return "const-param";
  case Operand::Temp:
    return "temp";
  case Operand::RegisterTemp:
    return "reg-temp";
  case Operand::Constant:
    return "constant";
  default:
    return "?";
  }
}

void printOperand(FILE* out, Operand* o)
{
  if (o == 0) {
    fprintf(out, "-");
  } else if (o->type == Operand::Constant) {
    fprintf(out, "%" LLD, o->value);
  } else {
    fprintf(out, "%s", o->name);
  }
}

void printLabel(FILE* out, Label* l)
{
  switch (l->type) {
  case Label::TrueSuccessor:
    fprintf(out, "<true>");
    break;
  case Label::FalseSuccessor:
    fprintf(out, "<false>");
    break;
  default:
    fprintf(out, "%s", l->name);
  }
}

void printInstruction(FILE* out, Instruction* i)
{
  fprintf(out, "    %s", operationName(i->op));
  if (i->op == PointerLoad or i->op == PointerStore) {
    fprintf(out, "<%s>", kindName(i->kind));
  }
  fprintf(out, " ");

  switch (i->op) {
  case PointerLoad:
    printOperand(out, i->result);
    fprintf(out, " <- [");
    printOperand(out, i->x);
    if (i->y) {
      fprintf(out, " + ");
      printOperand(out, i->y);
      if (i->scale != 1) {
        fprintf(out, " * %u", i->scale);
      }
    }
    if (i->displacement) {
      fprintf(out, " + %d", i->displacement);
    }
    fprintf(out, "]%s", i->canTrap ? " (trap)" : "");
    break;

  case PointerStore:
  case Lea:
    if (i->op == Lea) {
      printOperand(out, i->result);
      fprintf(out, " <- ");
    }
    fprintf(out, "[");
    printOperand(out, i->x);
    if (i->y) {
      fprintf(out, " + ");
      printOperand(out, i->y);
      if (i->scale != 1) {
        fprintf(out, " * %u", i->scale);
      }
    }
    if (i->displacement) {
      fprintf(out, " + %d", i->displacement);
    }
    fprintf(out, "]");
    if (i->op == PointerStore) {
      fprintf(out, " <- ");
      printOperand(out, i->z);
      fprintf(out, "%s", i->canTrap ? " (trap)" : "");
    }
    break;

  case CallStub:
  case CallRuntime:
    printOperand(out, i->result);
    fprintf(out,
            " <- %s(",
            i->op == CallStub ? i->stub->name : i->call->name);
    for (unsigned j = 0; j < i->arguments.count; ++j) {
      if (j) {
        fprintf(out, ", ");
      }
      printOperand(out, i->arguments[j]);
    }
    fprintf(out, ")");
    break;

  default:
    if (i->label) {
      printLabel(out, i->label);
      if (i->x) {
        fprintf(out, ", ");
      }
    } else if (i->result) {
      printOperand(out, i->result);
      if (i->x) {
        fprintf(out, " <- ");
      }
    }
    if (i->x) {
      printOperand(out, i->x);
    }
    if (i->y) {
      fprintf(out, ", ");
      printOperand(out, i->y);
    }
    break;
  }

  fprintf(out, "\n");
}

void printPath(FILE* out, Template* t, util::Slice<Instruction> path, bool slow)
{
  for (unsigned p = 0; p <= path.count; ++p) {
    for (unsigned l = 0; l < t->labels.count; ++l) {
      Label* label = t->labels[l];
      if (label->bound and label->slowPath == slow and label->position == p) {
        fprintf(out, "  %s:\n", label->name);
      }
    }
    if (p < path.count) {
      printInstruction(out, &path[p]);
    }
  }
}

}  // namespace

const char* operationName(Operation op)
{
  return operationNames[op];
}

void Template::print(FILE* out)
{
  fprintf(out, "%s %s", isStub() ? "stub" : "template", name);
  if (result) {
    fprintf(out, " -> %s %s", kindName(result->kind), result->name);
  }
  fprintf(out, "\n");

  for (unsigned i = 0; i < operands.count; ++i) {
    Operand* o = operands[i];
    if (o->type != Operand::Constant and o->type != Operand::Result) {
      fprintf(out,
              "  %s %s %s\n",
              operandTypeName(o->type),
              kindName(o->kind),
              o->name);
    }
  }

  printPath(out, this, fastPath, false);
  if (slowPath.count) {
    fprintf(out, "  -- out of line --\n");
    printPath(out, this, slowPath, true);
  }
}

void Snippet::print(FILE* out)
{
  fprintf(out, "%s(", template_->name);
  for (unsigned i = 0; i < arguments.count; ++i) {
    if (i) {
      fprintf(out, ", ");
    }
    Argument* a = &arguments[i];
    switch (a->type) {
    case Argument::Variable:
      fprintf(out, "v%u", a->variable);
      break;
    case Argument::Reference:
      fprintf(out, "@%" PRIx64, static_cast<uint64_t>(a->value));
      break;
    default:
      fprintf(out, "%" LLD, a->value);
      break;
    }
  }
  fprintf(out, ")\n");
}

}  // namespace codegen
}  // namespace lowering
