/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef TEST_ENV_H
#define TEST_ENV_H

#include <lowering/common.h>
#include <lowering/system/system.h>
#include <lowering/heap/heap.h>
#include <lowering/vm/machine.h>
#include <lowering/vm/guard.h>
#include <lowering/codegen/architecture.h>
#include <lowering/codegen/heap-scheme.h>
#include <lowering/codegen/targets.h>
#include <lowering/codegen/generator.h>
#include <lowering/codegen/evaluator.h>

// A machine with one attached thread, a native architecture and a heap
// scheme, torn down in reverse order.
class MachineEnv {
 public:
  lowering::vm::System* s;
  lowering::vm::Heap* heap;
  lowering::vm::Machine* m;
  lowering::vm::Thread* t;
  lowering::codegen::Architecture* arch;
  lowering::codegen::HeapScheme* scheme;

  MachineEnv(const char* schemeName = "tlab",
             bool logAllocations = false,
             unsigned heapSize = 4 * 1024 * 1024)
      : s(lowering::vm::makeSystem()),
        heap(lowering::vm::makeHeap(s, heapSize)),
        m(lowering::vm::makeMachine(s, heap)),
        t(lowering::vm::makeThread(m)),
        arch(lowering::codegen::makeArchitectureNative(s)),
        scheme(makeScheme(schemeName, logAllocations))
  {
    arch->acquire();
  }

  ~MachineEnv()
  {
    scheme->dispose();
    t->dispose();
    arch->release();
    m->dispose();
    heap->dispose();
    s->dispose();
  }

  lowering::vm::Type* define(
      const char* name,
      lowering::vm::Type* super = 0,
      lowering::util::Slice<lowering::vm::FieldSpec> fields
      = lowering::util::Slice<lowering::vm::FieldSpec>(),
      lowering::util::Slice<lowering::vm::MethodSpec> methods
      = lowering::util::Slice<lowering::vm::MethodSpec>(),
      unsigned flags = 0,
      lowering::util::Slice<lowering::vm::Type*> interfaces
      = lowering::util::Slice<lowering::vm::Type*>())
  {
    return lowering::vm::defineType(
        t, name, flags, super, interfaces, fields, methods);
  }

  // the pending exception's type, clearing it
  lowering::vm::Type* takeException()
  {
    lowering::vm::object e = t->exception;
    t->exception = 0;
    return e ? lowering::vm::objectType(t, e) : 0;
  }

  lowering::vm::Type* bootType(lowering::vm::Machine::BootType type)
  {
    return m->types[type];
  }

 private:
  lowering::codegen::HeapScheme* makeScheme(const char* name,
                                            bool logAllocations)
  {
    if (strcmp(name, "cards") == 0) {
      return lowering::vm::makeCardTableScheme(s, heap, logAllocations);
    } else if (strcmp(name, "tagging") == 0) {
      return lowering::vm::makeTaggingScheme(s);
    } else {
      return lowering::vm::makeTlabScheme(s, logAllocations);
    }
  }
};

// Adds a built template catalog, one compilation and an evaluator.
class CodegenEnv : public MachineEnv {
 public:
  lowering::codegen::TemplateGenerator generator;
  lowering::codegen::Compilation c;
  lowering::codegen::Evaluator evaluator;

  CodegenEnv(const char* schemeName = "tlab",
             const lowering::codegen::TemplateGenerator::Options& options
             = lowering::codegen::TemplateGenerator::Options(),
             bool logAllocations = false)
      : MachineEnv(schemeName, logAllocations),
        generator(s, m, arch, scheme, options),
        c(&generator, t),
        evaluator(arch, t)
  {
    generator.makeTemplates();
  }

  lowering::codegen::Evaluator::Result run(lowering::codegen::Snippet* snippet)
  {
    return evaluator.run(snippet);
  }

  lowering::codegen::Evaluator::Result run(
      lowering::codegen::Snippet* snippet,
      lowering::util::Slice<int64_t> variables)
  {
    return evaluator.run(snippet, variables);
  }

  // runs a snippet which produces a reference
  lowering::vm::object runObject(lowering::codegen::Snippet* snippet)
  {
    lowering::codegen::Evaluator::Result r = evaluator.run(snippet);
    return r.outcome == lowering::codegen::Evaluator::Normal
               ? reinterpret_cast<lowering::vm::object>(
                     static_cast<uintptr_t>(r.value))
               : 0;
  }
};

inline lowering::vm::object asObject(int64_t value)
{
  return reinterpret_cast<lowering::vm::object>(static_cast<uintptr_t>(value));
}

#endif  // TEST_ENV_H
