/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <lowering/codegen/generator.h>
#include <lowering/vm/machine.h>

using namespace lowering::util;
using namespace lowering::vm;

namespace lowering {
namespace codegen {

void TemplateGenerator::buildDispatchTemplates()
{
  invokeStaticTemplates = buildInvokeStatic();
  invokeSpecialTemplates = buildInvokeSpecial(true);
  invokeSpecialNonNullTemplate = buildInvokeSpecial(false).resolved;
  invokeVirtualTemplates = buildInvokeVirtual();
  invokeInterfaceTemplates = buildInvokeInterface();
  invokeHandleTemplate = buildInvokeHandle();
  linkToStaticTemplate = buildLinkTo("linkToStatic", false);
  linkToSpecialTemplate = buildLinkTo("linkToSpecial", false);
  linkToVirtualTemplate = buildLinkTo("linkToVirtual", true);
  linkToInterfaceTemplate = buildLinkTo("linkToInterface", true);
}

TemplatePair TemplateGenerator::buildInvokeStatic()
{
  TemplateAssembler* a = &assembler;
  TemplatePair pair;

  {
    Operand* result = a->restart(a->wordKind());
    Operand* entry = a->createConstantInputParameter("entry", a->wordKind());

    a->mov(result, entry);

    pair.resolved = finish(a, result, "invokestatic");
  }

  {
    Operand* result = a->restart(a->wordKind());
    Operand* guard = a->createConstantInputParameter("guard", ObjectKind);

    callRuntimeThroughStub(a, "resolveStaticMethod", result, operands(guard));

    pair.unresolved = finish(a, result, "invokestatic-unresolved");
  }

  return pair;
}

// The unresolved variant is built only alongside the null-checking
// one; a receiver known to be non-null is only ever a resolved site.
TemplatePair TemplateGenerator::buildInvokeSpecial(bool nullCheck)
{
  TemplateAssembler* a = &assembler;
  TemplatePair pair;

  {
    Operand* result = a->restart(a->wordKind());
    Operand* receiver = a->createInputParameter("receiver", ObjectKind);
    Operand* entry = a->createConstantInputParameter("entry", a->wordKind());

    if (nullCheck) {
      a->nullCheck(receiver);
    }
    a->mov(result, entry);

    pair.resolved = finish(
        a, result, nullCheck ? "invokespecial" : "invokespecial-nonnull");
  }

  if (nullCheck) {
    Operand* result = a->restart(a->wordKind());
    Operand* receiver = a->createInputParameter("receiver", ObjectKind);
    Operand* guard = a->createConstantInputParameter("guard", ObjectKind);

    callRuntimeThroughStub(a, "resolveSpecialMethod", result, operands(guard));
    a->nullCheck(receiver);

    pair.unresolved = finish(a, result, "invokespecial-unresolved");
  }

  return pair;
}

TemplatePair TemplateGenerator::buildInvokeVirtual()
{
  TemplateAssembler* a = &assembler;
  TemplatePair pair;

  {
    Operand* result = a->restart(a->wordKind());
    Operand* receiver = a->createInputParameter("receiver", ObjectKind);
    Operand* offset = a->createConstantInputParameter("offset", IntKind);
    Operand* hub = a->createTemp("hub", ObjectKind);

    a->pload(ObjectKind, hub, receiver, a->i(layout.hubOffset()), true);
    a->pload(a->wordKind(), result, hub, offset, false);

    pair.resolved = finish(a, result, "invokevirtual");
  }

  {
    Operand* result = a->restart(a->wordKind());
    Operand* receiver = a->createInputParameter("receiver", ObjectKind);
    Operand* guard = a->createConstantInputParameter("guard", ObjectKind);
    Operand* offset = a->createTemp("offset", IntKind);
    Operand* hub = a->createTemp("hub", ObjectKind);

    callRuntimeThroughStub(a, "resolveVirtualMethod", offset, operands(guard));
    a->pload(ObjectKind, hub, receiver, a->i(layout.hubOffset()), true);
    a->pload(a->wordKind(), result, hub, offset, false);

    pair.unresolved = finish(a, result, "invokevirtual-unresolved");
  }

  return pair;
}

TemplatePair TemplateGenerator::buildInvokeInterface()
{
  TemplateAssembler* a = &assembler;
  TemplatePair pair;

  {
    Operand* result = a->restart(a->wordKind());
    Operand* receiver = a->createInputParameter("receiver", ObjectKind);
    Operand* interfaceId
        = a->createConstantInputParameter("interfaceId", IntKind);
    Operand* methodIndex
        = a->createConstantInputParameter("methodIndex", IntKind);
    Operand* hub = a->createTemp("hub", ObjectKind);
    Operand* slot = a->createTemp("slot", IntKind);

    a->pload(ObjectKind, hub, receiver, a->i(layout.hubOffset()), true);
    mtableSlot(a, hub, interfaceId, slot);
    a->add(slot, slot, methodIndex);
    a->pload(a->wordKind(),
             result,
             hub,
             slot,
             layout.firstElementOffset(),
             layout.wordSize,
             false);

    pair.resolved = finish(a, result, "invokeinterface");
  }

  {
    Operand* result = a->restart(a->wordKind());
    Operand* receiver = a->createInputParameter("receiver", ObjectKind);
    Operand* guard = a->createConstantInputParameter("guard", ObjectKind);
    Operand* interfaceId = a->createTemp("interfaceId", IntKind);
    Operand* methodIndex = a->createTemp("methodIndex", IntKind);
    Operand* hub = a->createTemp("hub", ObjectKind);
    Operand* slot = a->createTemp("slot", IntKind);

    callRuntimeThroughStub(
        a, "resolveInterfaceID", interfaceId, operands(guard));
    callRuntimeThroughStub(
        a, "resolveInterfaceMethod", methodIndex, operands(guard));

    a->pload(ObjectKind, hub, receiver, a->i(layout.hubOffset()), true);
    mtableSlot(a, hub, interfaceId, slot);
    a->add(slot, slot, methodIndex);
    a->pload(a->wordKind(),
             result,
             hub,
             slot,
             layout.firstElementOffset(),
             layout.wordSize,
             false);

    pair.unresolved = finish(a, result, "invokeinterface-unresolved");
  }

  return pair;
}

Template* TemplateGenerator::buildInvokeHandle()
{
  TemplateAssembler* a = &assembler;

  Operand* result = a->restart(a->wordKind());
  Operand* method = a->createInputParameter("method", ObjectKind);

  callRuntimeThroughStub(a, "invokeHandle", result, operands(method));

  return finish(a, result, "invokehandle");
}

Template* TemplateGenerator::buildLinkTo(const char* name, bool withReceiver)
{
  TemplateAssembler* a = &assembler;

  Operand* result = a->restart(a->wordKind());
  Operand* memberName = a->createInputParameter("memberName", ObjectKind);

  if (withReceiver) {
    Operand* receiver = a->createInputParameter("receiver", ObjectKind);
    callRuntimeThroughStub(a, name, result, operands(memberName, receiver));
  } else {
    callRuntimeThroughStub(a, name, result, operands(memberName));
  }

  // "linkToVirtual" becomes "linkto-virtual"
  char buffer[64];
  unsigned j = 0;
  for (const char* p = name; *p and j < sizeof(buffer) - 2; ++p) {
    if (*p >= 'A' and *p <= 'Z') {
      if (p - name == 6) {
        buffer[j++] = '-';
      }
      buffer[j++] = *p - 'A' + 'a';
    } else {
      buffer[j++] = *p;
    }
  }
  buffer[j] = 0;

  return finish(a, result, buffer);
}

Snippet* TemplateGenerator::genInvokeStatic(Compilation* c, MethodRef method)
{
  if (method.tag == MethodRef::Resolved) {
    return snippet(c,
                   require(InvokeStatic, VoidKind, true, 0),
                   arguments(Argument::forWord(method.method->entry)));
  } else {
    return snippet(c,
                   require(InvokeStatic, VoidKind, false, 0),
                   arguments(guardArgument(method.guard)));
  }
}

Snippet* TemplateGenerator::genInvokeSpecial(Compilation* c,
                                             Site site,
                                             Argument receiver,
                                             MethodRef method)
{
  if (method.tag == MethodRef::Resolved) {
    return snippet(
        c,
        require(InvokeSpecial,
                VoidKind,
                true,
                site.isNonNull() ? NonNullFlag : 0),
        arguments(receiver, Argument::forWord(method.method->entry)));
  } else {
    return snippet(c,
                   require(InvokeSpecial, VoidKind, false, 0),
                   arguments(receiver, guardArgument(method.guard)));
  }
}

Snippet* TemplateGenerator::genInvokeVirtual(Compilation* c,
                                             Argument receiver,
                                             MethodRef method)
{
  if (method.tag == MethodRef::Resolved) {
    if (method.method->vtableIndex < 0) {
      // methods without a vtable slot are bound directly
      return genInvokeSpecial(c, Site(), receiver, method);
    }

    return snippet(c,
                   require(InvokeVirtual, VoidKind, true, 0),
                   arguments(receiver,
                             Argument::forInt(layout.vtableOffset(
                                 method.method->vtableIndex))));
  } else {
    return snippet(c,
                   require(InvokeVirtual, VoidKind, false, 0),
                   arguments(receiver, guardArgument(method.guard)));
  }
}

Snippet* TemplateGenerator::genInvokeInterface(Compilation* c,
                                               Argument receiver,
                                               MethodRef method)
{
  if (method.tag == MethodRef::Resolved) {
    return snippet(
        c,
        require(InvokeInterface, VoidKind, true, 0),
        arguments(receiver,
                  Argument::forInt(method.method->holder->id),
                  Argument::forInt(method.method->interfaceIndex)));
  } else {
    return snippet(c,
                   require(InvokeInterface, VoidKind, false, 0),
                   arguments(receiver, guardArgument(method.guard)));
  }
}

Snippet* TemplateGenerator::genInvokeHandle(Compilation* c, Argument method)
{
  return snippet(
      c, require(InvokeHandle, VoidKind, true, 0), arguments(method));
}

Snippet* TemplateGenerator::genLinkToStatic(Compilation* c,
                                            Argument memberName)
{
  return snippet(
      c, require(LinkToStatic, VoidKind, true, 0), arguments(memberName));
}

Snippet* TemplateGenerator::genLinkToSpecial(Compilation* c,
                                             Argument memberName)
{
  return snippet(
      c, require(LinkToSpecial, VoidKind, true, 0), arguments(memberName));
}

Snippet* TemplateGenerator::genLinkToVirtual(Compilation* c,
                                             Argument memberName,
                                             Argument receiver)
{
  return snippet(c,
                 require(LinkToVirtual, VoidKind, true, 0),
                 arguments(memberName, receiver));
}

Snippet* TemplateGenerator::genLinkToInterface(Compilation* c,
                                               Argument memberName,
                                               Argument receiver)
{
  return snippet(c,
                 require(LinkToInterface, VoidKind, true, 0),
                 arguments(memberName, receiver));
}

}  // namespace codegen
}  // namespace lowering
