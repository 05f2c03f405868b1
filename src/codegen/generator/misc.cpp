/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <lowering/codegen/generator.h>
#include <lowering/codegen/heap-scheme.h>
#include <lowering/vm/machine.h>

using namespace lowering::util;
using namespace lowering::vm;

namespace {

struct ClassResolver {
  const char* templateName;
  const char* runtimeName;
};

// indexed by TemplateGenerator::Representation
const ClassResolver classResolvers[]
    = {{"resolveclass-hub", "resolveHub"},
       {"resolveclass-statics", "resolveStaticTuple"},
       {"resolveclass-type", "resolveClassActor"},
       {"resolveclass-class", "resolveClassObject"}};

bool matches(const char* pattern, const char* name)
{
  return pattern and strcmp(pattern, name) == 0;
}

}  // namespace

namespace lowering {
namespace codegen {

void TemplateGenerator::buildMiscTemplates()
{
  TemplateAssembler* a = &assembler;

  {
    a->restart();
    Operand* object = a->createInputParameter("object", ObjectKind);
    callRuntimeThroughStub(a, "monitorEnter", 0, operands(object));
    monitorEnterTemplate = finish(a, 0, "monitorenter");
  }

  {
    a->restart();
    Operand* object = a->createInputParameter("object", ObjectKind);
    callRuntimeThroughStub(a, "monitorExit", 0, operands(object));
    monitorExitTemplate = finish(a, 0, "monitorexit");
  }

  {
    a->restart();
    emitSafepoint(a);
    safepointTemplate = finish(a, 0, "safepoint");
  }

  {
    Operand* result = a->restart(ObjectKind);
    emitSafepoint(a);
    callRuntimeThroughStub(a, "loadException", result, Slice<Operand*>());
    exceptionObjectTemplate = finish(a, result, "exceptionobject");
  }

  for (unsigned i = 0; i < RepresentationCount; ++i) {
    Operand* result = a->restart(ObjectKind);
    Operand* guard = a->createConstantInputParameter("guard", ObjectKind);
    callRuntimeThroughStub(
        a, classResolvers[i].runtimeName, result, operands(guard));
    resolveClassTemplates[i]
        = finish(a, result, classResolvers[i].templateName);
  }

  {
    Operand* result = a->restart(ObjectKind);
    Operand* value = a->createConstantInputParameter("value", ObjectKind);
    a->mov(result, value);
    constantTemplate = finish(a, result, "constant-object");
  }
}

Snippet* TemplateGenerator::genPrologue(Compilation* c, vm::Method* method)
{
  TemplateAssembler* a = c->assembler();

  a->restart();
  a->pushFrame();
  if ((method->flags & EntryPointMethod) == 0) {
    a->stackOverflowCheck();
  }
  emitSafepoint(a);

  if (matches(options.profilerEntryPoint, method->name)) {
    Operand* etla = loadEnabledLocals(a);
    a->pstore(
        a->wordKind(), etla, a->i(scheme->profilerMarkOffset()), a->w(1), false);
  }

  return snippet(c, a->finishTemplate("prologue"), Slice<Argument>());
}

Snippet* TemplateGenerator::genEpilogue(Compilation* c, vm::Method* method)
{
  TemplateAssembler* a = c->assembler();

  a->restart();
  emitSafepoint(a);
  a->popFrame();

  if (matches(options.profilerExitPoint, method->name)) {
    Operand* etla = loadEnabledLocals(a);
    a->pstore(
        a->wordKind(), etla, a->i(scheme->profilerMarkOffset()), a->w(0), false);
  }

  return snippet(c, a->finishTemplate("epilogue"), Slice<Argument>());
}

Snippet* TemplateGenerator::genSafepoint(Compilation* c)
{
  return snippet(
      c, require(Safepoint, VoidKind, true, 0), Slice<Argument>());
}

Snippet* TemplateGenerator::genExceptionObject(Compilation* c)
{
  return snippet(
      c, require(ExceptionObject, VoidKind, true, 0), Slice<Argument>());
}

Snippet* TemplateGenerator::genResolveClass(Compilation* c,
                                            TypeRef type,
                                            Representation representation)
{
  if (type.tag == TypeRef::Unresolved) {
    return snippet(c,
                   require(ResolveClass, VoidKind, false, representation),
                   arguments(guardArgument(type.guard)));
  }

  const void* value = 0;
  switch (representation) {
  case ObjectHub:
    value = type.type->hub;
    break;

  case StaticFields:
    value = type.type->staticTuple;
    break;

  case TypeInfo:
    value = type.type;
    break;

  case JavaClass:
    value = type.type->mirror;
    break;

  default:
    abort(s);
  }

  return snippet(c,
                 require(ResolveClass, VoidKind, true, representation),
                 arguments(Argument::forObject(value)));
}

Snippet* TemplateGenerator::genMonitorEnter(Compilation* c, Argument object)
{
  return snippet(
      c, require(MonitorEnter, VoidKind, true, 0), arguments(object));
}

Snippet* TemplateGenerator::genMonitorExit(Compilation* c, Argument object)
{
  return snippet(
      c, require(MonitorExit, VoidKind, true, 0), arguments(object));
}

}  // namespace codegen
}  // namespace lowering
