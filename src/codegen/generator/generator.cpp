/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <lowering/codegen/generator.h>
#include <lowering/codegen/architecture.h>
#include <lowering/codegen/heap-scheme.h>
#include <lowering/vm/machine.h>
#include <lowering/vm/guard.h>

using namespace lowering::util;
using namespace lowering::vm;

namespace {

namespace local {

const bool DebugTemplates = false;

}  // namespace local

}  // namespace

namespace lowering {
namespace codegen {

FieldRef FieldRef::resolved(vm::Field* field)
{
  return FieldRef(Resolved, field->kind, field, 0);
}

Compilation::Compilation(TemplateGenerator* generator, vm::Thread* t)
    : generator(generator),
      t(t),
      zone(&(generator->allocator), 16 * 1024),
      assembler_(0)
{
}

Compilation::~Compilation()
{
  if (assembler_) {
    assembler_->dispose();
  }
  zone.dispose();
}

TemplateAssembler* Compilation::assembler()
{
  if (assembler_ == 0) {
    assembler_ = generator->assembler.copy(&zone);
  }
  return assembler_;
}

TemplateGenerator::TemplateGenerator(vm::System* s,
                                     vm::Machine* m,
                                     Architecture* arch,
                                     HeapScheme* scheme,
                                     const Options& options)
    : s(s),
      m(m),
      arch(arch),
      scheme(scheme),
      options(options),
      layout(arch->wordSize()),
      allocator(s),
      zone(&allocator, 64 * 1024),
      assembler(s, &allocator, &zone, arch, options.printTemplates),
      stubRegistry(s, assembler.copy(&zone)),
      templates(s, &allocator, 128 * BytesPerWord),
      built(false),
      arrayLengthTemplate(0),
      invokeSpecialNonNullTemplate(0),
      invokeHandleTemplate(0),
      linkToStaticTemplate(0),
      linkToSpecialTemplate(0),
      linkToVirtualTemplate(0),
      linkToInterfaceTemplate(0),
      newHybridTemplate(0),
      unresolvedCheckCastTemplate(0),
      unresolvedInstanceOfTemplate(0),
      unresolvedMaterializeInstanceOfTemplate(0),
      typeAssertTemplate(0),
      monitorEnterTemplate(0),
      monitorExitTemplate(0),
      safepointTemplate(0),
      exceptionObjectTemplate(0),
      constantTemplate(0)
{
  memset(arrayLoadTemplates, 0, sizeof(arrayLoadTemplates));
  memset(arrayStoreTemplates, 0, sizeof(arrayStoreTemplates));
  memset(checkCastTemplates, 0, sizeof(checkCastTemplates));
  memset(instanceOfTemplates, 0, sizeof(instanceOfTemplates));
  memset(materializeInstanceOfTemplates,
         0,
         sizeof(materializeInstanceOfTemplates));
  memset(resolveClassTemplates, 0, sizeof(resolveClassTemplates));

  arch->acquire();
}

TemplateGenerator::~TemplateGenerator()
{
  stubRegistry.assembler->dispose();
  templates.dispose();
  assembler.dispose();
  zone.dispose();
  arch->release();
}

Slice<Template*> TemplateGenerator::makeTemplates()
{
  if (not built) {
    buildAccessTemplates();
    buildDispatchTemplates();
    buildAllocationTemplates();
    buildTypeCheckTemplates();
    buildMiscTemplates();
    built = true;

    if (local::DebugTemplates) {
      fprintf(stderr,
              "built %u templates and %u stubs for %s with %s\n",
              static_cast<unsigned>(templates.length() / BytesPerWord),
              stubRegistry.size(),
              arch->name(),
              scheme->name());
    }
  }

  return Slice<Template*>(
      templates.length() ? reinterpret_cast<Template**>(templates.data.begin())
                         : 0,
      templates.length() / BytesPerWord);
}

Template* TemplateGenerator::lookup(Operation op,
                                    Kind kind,
                                    bool resolved,
                                    unsigned flags)
{
  expect(s, built);

  bool boundsCheck = (flags & BoundsCheckFlag) != 0;
  bool storeCheck = (flags & StoreCheckFlag) != 0;
  bool nonNull = (flags & NonNullFlag) != 0;
  bool leaf = (flags & LeafFlag) != 0;

  switch (op) {
  case GetField:
  case PutField:
  case GetStatic:
  case PutStatic:
  case ArrayLoad:
  case ArrayStore:
  case NewArray:
    if (kind >= ElementKindCount) {
      return 0;
    }
    break;

  default:
    break;
  }

  switch (op) {
  case GetField:
    return resolved ? getFieldTemplates[kind].resolved
                    : getFieldTemplates[kind].unresolved;

  case PutField:
    return resolved ? putFieldTemplates[kind].resolved
                    : putFieldTemplates[kind].unresolved;

  case GetStatic:
    return resolved ? getStaticTemplates[kind].resolved
                    : getStaticTemplates[kind].unresolved;

  case PutStatic:
    return resolved ? putStaticTemplates[kind].resolved
                    : putStaticTemplates[kind].unresolved;

  case ArrayLoad:
    return arrayLoadTemplates[kind][boundsCheck];

  case ArrayStore:
    return arrayStoreTemplates[kind][boundsCheck][storeCheck];

  case ArrayLength:
    return arrayLengthTemplate;

  case NewInstance:
    return resolved ? newInstanceTemplates.resolved
                    : newInstanceTemplates.unresolved;

  case NewHybrid:
    return resolved ? newHybridTemplate : 0;

  case NewArray:
    return resolved ? newArrayTemplates[kind].resolved
                    : newArrayTemplates[kind].unresolved;

  case NewMultiArray:
    if (flags == 0 or flags > MaxMultiArrayRank) {
      return 0;
    }
    return resolved ? newMultiArrayTemplates[flags].resolved
                    : newMultiArrayTemplates[flags].unresolved;

  case InvokeStatic:
    return resolved ? invokeStaticTemplates.resolved
                    : invokeStaticTemplates.unresolved;

  case InvokeSpecial:
    if (resolved) {
      return nonNull ? invokeSpecialNonNullTemplate
                     : invokeSpecialTemplates.resolved;
    }
    return invokeSpecialTemplates.unresolved;

  case InvokeVirtual:
    return resolved ? invokeVirtualTemplates.resolved
                    : invokeVirtualTemplates.unresolved;

  case InvokeInterface:
    return resolved ? invokeInterfaceTemplates.resolved
                    : invokeInterfaceTemplates.unresolved;

  case InvokeHandle:
    return invokeHandleTemplate;

  case LinkToStatic:
    return linkToStaticTemplate;

  case LinkToSpecial:
    return linkToSpecialTemplate;

  case LinkToVirtual:
    return linkToVirtualTemplate;

  case LinkToInterface:
    return linkToInterfaceTemplate;

  case CheckCast:
    return resolved ? checkCastTemplates[leaf][nonNull]
                    : unresolvedCheckCastTemplate;

  case InstanceOf:
    return resolved ? instanceOfTemplates[leaf][nonNull]
                    : unresolvedInstanceOfTemplate;

  case MaterializeInstanceOf:
    return resolved ? materializeInstanceOfTemplates[leaf][nonNull]
                    : unresolvedMaterializeInstanceOfTemplate;

  case TypeAssert:
    return resolved ? typeAssertTemplate : 0;

  case MonitorEnter:
    return monitorEnterTemplate;

  case MonitorExit:
    return monitorExitTemplate;

  case Safepoint:
    return safepointTemplate;

  case ExceptionObject:
    return exceptionObjectTemplate;

  case ResolveClass:
    if (flags >= RepresentationCount) {
      return 0;
    }
    return resolved ? constantTemplate : resolveClassTemplates[flags];

  default:
    return 0;
  }
}

Template* TemplateGenerator::find(const char* name)
{
  unsigned count = templates.length() / BytesPerWord;
  for (unsigned i = 0; i < count; ++i) {
    Template* t = static_cast<Template*>(templates.getAddress(i * BytesPerWord));
    if (strcmp(t->name, name) == 0) {
      return t;
    }
  }

  const char* prefix = "stub-";
  if (strncmp(name, prefix, strlen(prefix)) == 0) {
    return stubRegistry.find(name + strlen(prefix));
  }

  return 0;
}

void TemplateGenerator::callRuntimeThroughStub(TemplateAssembler* a,
                                               const char* name,
                                               Operand* result,
                                               Slice<Operand*> arguments)
{
  Template* stub = stubRegistry.stubFor(
      name, result ? result->kind : VoidKind, arguments);
  a->callStub(stub, result, arguments);
}

void TemplateGenerator::barrier(TemplateAssembler* a,
                                unsigned position,
                                Operand* object,
                                Operand* index)
{
  scheme->barrierGenerator(static_cast<HeapScheme::BarrierPosition>(position))
      ->generate(a, object, index);
}

Template* TemplateGenerator::finish(Template* t)
{
  templates.appendAddress(t);
  return t;
}

Template* TemplateGenerator::finish(TemplateAssembler* a,
                                    Operand* result,
                                    const char* name)
{
  return finish(a->finishTemplate(result, name));
}

Operand* TemplateGenerator::loadEnabledLocals(TemplateAssembler* a)
{
  Operand* latch
      = a->createRegisterTemp("latch", a->wordKind(), arch->latch());
  Operand* etla = a->createTemp("etla", a->wordKind());
  a->pload(a->wordKind(),
           etla,
           latch,
           a->i(scheme->enabledLocalsOffset()),
           false);
  return etla;
}

void TemplateGenerator::emitSafepoint(TemplateAssembler* a)
{
  Operand* latch
      = a->createRegisterTemp("latch", a->wordKind(), arch->latch());
  Operand* poll = a->createTemp("poll", a->wordKind());
  a->pload(a->wordKind(),
           poll,
           latch,
           a->i(Thread::localOffset(Thread::SafepointLatch)),
           false);
  a->safepoint();
}

void TemplateGenerator::mtableSlot(TemplateAssembler* a,
                                   Operand* hub,
                                   Operand* id,
                                   Operand* slot)
{
  Operand* length = a->createTemp("mtableLength", a->wordKind());
  Operand* start = a->createTemp("mtableStart", a->wordKind());

  a->pload(
      a->wordKind(), length, hub, a->i(layout.mTableLengthOffset()), false);
  a->pload(a->wordKind(),
           start,
           hub,
           a->i(layout.mTableStartIndexOffset()),
           false);
  a->mod(slot, id, length);
  a->add(slot, slot, start);
  a->pload(IntKind, slot, hub, slot, layout.firstElementOffset(), 4, false);
}

Template* TemplateGenerator::require(Operation op,
                                     Kind kind,
                                     bool resolved,
                                     unsigned flags)
{
  Template* t = lookup(op, kind, resolved, flags);
  if (t == 0) {
    fprintf(stderr,
            "no %s template for operation %d, kind %s, flags %u\n",
            resolved ? "resolved" : "unresolved",
            op,
            kindName(kind),
            flags);
    abort(s);
  }
  return t;
}

Snippet* TemplateGenerator::snippet(Compilation* c,
                                    Template* t,
                                    Slice<Argument> arguments)
{
  if (arguments.count != t->parameters.count) {
    fprintf(stderr,
            "%s takes %u arguments, %u given\n",
            t->name,
            static_cast<unsigned>(t->parameters.count),
            static_cast<unsigned>(arguments.count));
    abort(s);
  }

  for (unsigned i = 0; i < arguments.count; ++i) {
    Operand* p = t->parameters[i];
    if (stackKind(p->kind) != stackKind(arguments[i].kind)) {
      fprintf(stderr,
              "argument %u of %s is %s, expected %s\n",
              i,
              t->name,
              kindName(arguments[i].kind),
              kindName(p->kind));
      abort(s);
    }

    if (p->type == Operand::ConstantParameter
        and not arguments[i].isConstant()) {
      fprintf(stderr, "argument %u of %s must be a constant\n", i, t->name);
      abort(s);
    }
  }

  Snippet* result = new (&(c->zone)) Snippet(t, arguments.clone(&(c->zone)));

  if (local::DebugTemplates) {
    result->print(stderr);
  }

  return result;
}

Argument TemplateGenerator::guardArgument(vm::ResolutionGuard* guard)
{
  return Argument::forObject(guard);
}

Argument TemplateGenerator::hubArgument(vm::Type* type)
{
  return Argument::forObject(type->hub);
}

}  // namespace codegen
}  // namespace lowering
