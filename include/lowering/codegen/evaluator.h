/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef LOWERING_CODEGEN_EVALUATOR_H
#define LOWERING_CODEGEN_EVALUATOR_H

#include <lowering/codegen/template.h>
#include <lowering/util/slice.h>

namespace lowering {

namespace vm {
class Thread;
}

namespace codegen {

class Architecture;

// Executes snippets directly against process memory on behalf of a VM
// thread.  Used to check that templates do what they claim without a
// machine-code backend.
class Evaluator {
 public:
  enum Outcome {
    Normal,
    // t->exception holds the pending throwable
    Threw,
    Deoptimized,
    TrueSuccessor,
    FalseSuccessor
  };

  class Result {
   public:
    Result(Outcome outcome, int64_t value) : outcome(outcome), value(value)
    {
    }

    Outcome outcome;
    int64_t value;
  };

  Evaluator(Architecture* arch, vm::Thread* t);

  // variables supplies the values of the snippet's variable arguments
  Result run(Snippet* snippet, util::Slice<int64_t> variables);

  Result run(Snippet* snippet)
  {
    return run(snippet, util::Slice<int64_t>(0, 0));
  }

  // runs a template with its parameters already bound, as a stub call
  Result run(Template* t, const int64_t* parameters);

  Architecture* arch;
  vm::Thread* t;
  unsigned instructions;
  unsigned stubCalls;
  unsigned runtimeCalls;
};

}  // namespace codegen
}  // namespace lowering

#endif  // LOWERING_CODEGEN_EVALUATOR_H
