/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <lowering/system/system.h>

#include <lowering/util/arg-parser.h>

#include <lowering/codegen/architecture.h>
#include <lowering/codegen/generator.h>
#include <lowering/codegen/heap-scheme.h>
#include <lowering/codegen/targets.h>

#include <lowering/heap/heap.h>
#include <lowering/vm/machine.h>

using namespace lowering::vm;
using namespace lowering::codegen;
using namespace lowering::util;

namespace {

const char* const architectures[] = {"native", "x86_64", "arm", 0};
const char* const heapSchemes[] = {"tlab", "cards", "tagging", 0};

class BasicEnv {
 public:
  System* s;
  Heap* heap;
  Machine* m;
  Architecture* arch;
  HeapScheme* scheme;

  BasicEnv(const char* archName, const char* schemeName, bool logAllocations)
      : s(makeSystem()),
        heap(makeHeap(s, 4 * 1024 * 1024)),
        m(makeMachine(s, heap)),
        arch(makeArchitecture(s, archName)),
        scheme(makeScheme(schemeName, logAllocations))
  {
    expect(s, arch != 0);
    arch->acquire();
  }

  ~BasicEnv()
  {
    scheme->dispose();
    arch->release();
    m->dispose();
    heap->dispose();
    s->dispose();
  }

 private:
  HeapScheme* makeScheme(const char* name, bool logAllocations)
  {
    if (strcmp(name, "cards") == 0) {
      return makeCardTableScheme(s, heap, logAllocations);
    } else if (strcmp(name, "tagging") == 0) {
      return makeTaggingScheme(s);
    } else {
      return makeTlabScheme(s, logAllocations);
    }
  }
};

class AuditArguments {
 public:
  const char* arch;
  const char* heap;
  const char* template_;
  bool inlineStubs;
  bool logAllocations;

  AuditArguments(int argc, char** argv)
  {
    ArgParser parser;
    Arg archArg(parser, "arch", "<architecture>", architectures, "native");
    Arg heapArg(parser, "heap", "<heap scheme>", heapSchemes, "tlab");
    Arg templateArg(parser, false, "template", "<template name>");
    Arg inlineArg(parser, false, "inline-stubs", 0);
    Arg logArg(parser, false, "log-allocations", 0);

    if (not parser.parse(argc, argv)) {
      parser.printUsage(argv[0]);
      exit(1);
    }

    arch = archArg.value;
    heap = heapArg.value;
    template_ = templateArg.value;
    inlineStubs = inlineArg.isSet();
    logAllocations = logArg.isSet();

    // only schemes with thread-local buffers keep an allocation log
    if (logAllocations and strcmp(heap, "tagging") == 0) {
      fprintf(stderr, "-log-allocations needs a tlab heap scheme\n");
      parser.printUsage(argv[0]);
      exit(1);
    }
  }
};

}  // namespace

int main(int argc, char** argv)
{
  AuditArguments args(argc, argv);

  BasicEnv env(args.arch, args.heap, args.logAllocations);

  TemplateGenerator::Options options;
  options.useOutOfLineStubs = not args.inlineStubs;

  TemplateGenerator generator(env.s, env.m, env.arch, env.scheme, options);
  Slice<Template*> templates = generator.makeTemplates();

  if (args.template_) {
    Template* t = generator.find(args.template_);
    if (t == 0) {
      fprintf(stderr, "no template named %s\n", args.template_);
      return 1;
    }
    t->print(stdout);
    return 0;
  }

  for (unsigned i = 0; i < templates.count; ++i) {
    templates[i]->print(stdout);
  }

  StubRegistry* stubs = generator.stubs();
  for (unsigned i = 0; i < stubs->size(); ++i) {
    stubs->stubAt(i)->print(stdout);
  }

  printf("%u templates and %u stubs for %s with the %s heap scheme\n",
         static_cast<unsigned>(templates.count),
         stubs->size(),
         env.arch->name(),
         env.scheme->name());

  return 0;
}
