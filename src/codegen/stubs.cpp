/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <lowering/codegen/stubs.h>
#include <lowering/codegen/assembler.h>
#include <lowering/util/hash.h>
#include <lowering/vm/runtime.h>

using namespace lowering::util;

namespace {

namespace local {

const bool DebugStubs = false;

}  // namespace local

}  // namespace

namespace lowering {
namespace codegen {

namespace {

#define RUNTIME_CALL(name) \
  bindRuntimeCall<decltype(&vm::name), &vm::name>(#name),

const RuntimeCall runtimeCalls[] = {
#include <lowering/vm/runtime-calls.inc.cpp>
};

#undef RUNTIME_CALL

const unsigned RuntimeCallCount = sizeof(runtimeCalls)
                                  / sizeof(RuntimeCall);

}  // namespace

const RuntimeCall* findRuntimeCall(const char* name)
{
  for (unsigned i = 0; i < RuntimeCallCount; ++i) {
    if (strcmp(runtimeCalls[i].name, name) == 0) {
      return runtimeCalls + i;
    }
  }
  return 0;
}

unsigned runtimeCallCount()
{
  return RuntimeCallCount;
}

const RuntimeCall* runtimeCallAt(unsigned index)
{
  return index < RuntimeCallCount ? runtimeCalls + index : 0;
}

bool compatible(const RuntimeCall* call,
                Kind resultKind,
                util::Slice<Operand*> arguments)
{
  if (resultKind == VoidKind or call->resultKind == VoidKind) {
    if (resultKind != call->resultKind) {
      return false;
    }
  } else if (stackKind(resultKind) != stackKind(call->resultKind)) {
    return false;
  }

  if (arguments.count != call->parameterCount) {
    return false;
  }

  for (unsigned i = 0; i < arguments.count; ++i) {
    if (stackKind(arguments[i]->kind) != stackKind(call->parameterKinds[i])) {
      return false;
    }
  }

  return true;
}

StubRegistry::StubRegistry(vm::System* s, TemplateAssembler* assembler)
    : s(s), assembler(assembler), first(0), last(&first), count(0)
{
  memset(buckets, 0, sizeof(buckets));
}

Template* StubRegistry::find(const char* name)
{
  for (Entry* e = buckets[hash(name) & (BucketCount - 1)]; e; e = e->next) {
    if (strcmp(e->call->name, name) == 0) {
      return e->stub;
    }
  }
  return 0;
}

Template* StubRegistry::stubFor(const char* name,
                                Kind resultKind,
                                util::Slice<Operand*> arguments)
{
  const RuntimeCall* call = findRuntimeCall(name);
  if (call == 0) {
    fprintf(stderr, "no runtime call named %s\n", name);
    abort(s);
  }

  if (not compatible(call, resultKind, arguments)) {
    fprintf(stderr,
            "call to %s does not match its binding (%u arguments given, "
            "%u expected)\n",
            name,
            static_cast<unsigned>(arguments.count),
            call->parameterCount);
    abort(s);
  }

  Template* stub = find(name);
  if (stub) {
    return stub;
  }

  if (local::DebugStubs) {
    fprintf(stderr, "building stub for %s\n", name);
  }

  Operand* result = assembler->restart(call->resultKind);

  Operand* parameters[MaxRuntimeCallParameters];
  for (unsigned i = 0; i < call->parameterCount; ++i) {
    parameters[i] = assembler->createInputParameter(
        assembler->zone->format("p%u", i), call->parameterKinds[i]);
  }

  assembler->callRuntime(
      call, result, Slice<Operand*>(parameters, call->parameterCount));

  stub = assembler->finishStub(assembler->zone->format("stub-%s", name));

  unsigned index = hash(name) & (BucketCount - 1);
  Entry* e = new (assembler->zone) Entry(call, stub, buckets[index]);
  buckets[index] = e;
  *last = e;
  last = &(e->link);
  ++count;

  return stub;
}

Template* StubRegistry::stubAt(unsigned index)
{
  Entry* e = first;
  for (unsigned i = 0; e and i < index; ++i) {
    e = e->link;
  }
  return e ? e->stub : 0;
}

}  // namespace codegen
}  // namespace lowering
