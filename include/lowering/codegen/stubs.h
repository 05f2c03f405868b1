/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef LOWERING_CODEGEN_STUBS_H
#define LOWERING_CODEGEN_STUBS_H

#include <lowering/system/system.h>
#include <lowering/zone.h>
#include <lowering/codegen/template.h>

namespace lowering {

namespace vm {
class Thread;
}

namespace codegen {

class TemplateAssembler;

const unsigned MaxRuntimeCallParameters = 4;

typedef uint64_t (*RuntimeCallInvoker)(vm::Thread* t, const uint64_t* arguments);

// A native function reachable from generated code, together with the
// kinds it takes and returns.
class RuntimeCall {
 public:
  const char* name;
  RuntimeCallInvoker invoker;
  Kind resultKind;
  unsigned parameterCount;
  Kind parameterKinds[MaxRuntimeCallParameters];

  uint64_t invoke(vm::Thread* t, const uint64_t* arguments) const
  {
    return invoker(t, arguments);
  }
};

template <class T>
inline T fromBits(uint64_t v);

template <>
inline int32_t fromBits<int32_t>(uint64_t v)
{
  return static_cast<int32_t>(v);
}

template <>
inline int64_t fromBits<int64_t>(uint64_t v)
{
  return static_cast<int64_t>(v);
}

template <>
inline uintptr_t fromBits<uintptr_t>(uint64_t v)
{
  return static_cast<uintptr_t>(v);
}

template <>
inline bool fromBits<bool>(uint64_t v)
{
  return v != 0;
}

template <>
inline void* fromBits<void*>(uint64_t v)
{
  return reinterpret_cast<void*>(static_cast<uintptr_t>(v));
}

inline uint64_t toBits(int32_t v)
{
  return static_cast<uint64_t>(static_cast<int64_t>(v));
}

inline uint64_t toBits(int64_t v)
{
  return static_cast<uint64_t>(v);
}

inline uint64_t toBits(uintptr_t v)
{
  return v;
}

inline uint64_t toBits(bool v)
{
  return v ? 1 : 0;
}

inline uint64_t toBits(void* v)
{
  return reinterpret_cast<uintptr_t>(v);
}

template <class F, F function>
struct Invoker;

template <class R, R (*function)(vm::Thread*)>
struct Invoker<R (*)(vm::Thread*), function> {
  static uint64_t invoke(vm::Thread* t, const uint64_t*)
  {
    return toBits(function(t));
  }
};

template <class R, class A, R (*function)(vm::Thread*, A)>
struct Invoker<R (*)(vm::Thread*, A), function> {
  static uint64_t invoke(vm::Thread* t, const uint64_t* a)
  {
    return toBits(function(t, fromBits<A>(a[0])));
  }
};

template <class R, class A, class B, R (*function)(vm::Thread*, A, B)>
struct Invoker<R (*)(vm::Thread*, A, B), function> {
  static uint64_t invoke(vm::Thread* t, const uint64_t* a)
  {
    return toBits(function(t, fromBits<A>(a[0]), fromBits<B>(a[1])));
  }
};

template <class R,
          class A,
          class B,
          class C,
          R (*function)(vm::Thread*, A, B, C)>
struct Invoker<R (*)(vm::Thread*, A, B, C), function> {
  static uint64_t invoke(vm::Thread* t, const uint64_t* a)
  {
    return toBits(function(
        t, fromBits<A>(a[0]), fromBits<B>(a[1]), fromBits<C>(a[2])));
  }
};

template <class R,
          class A,
          class B,
          class C,
          class D,
          R (*function)(vm::Thread*, A, B, C, D)>
struct Invoker<R (*)(vm::Thread*, A, B, C, D), function> {
  static uint64_t invoke(vm::Thread* t, const uint64_t* a)
  {
    return toBits(function(t,
                           fromBits<A>(a[0]),
                           fromBits<B>(a[1]),
                           fromBits<C>(a[2]),
                           fromBits<D>(a[3])));
  }
};

template <class A, void (*function)(vm::Thread*, A)>
struct Invoker<void (*)(vm::Thread*, A), function> {
  static uint64_t invoke(vm::Thread* t, const uint64_t* a)
  {
    function(t, fromBits<A>(a[0]));
    return 0;
  }
};

template <class A, class B, void (*function)(vm::Thread*, A, B)>
struct Invoker<void (*)(vm::Thread*, A, B), function> {
  static uint64_t invoke(vm::Thread* t, const uint64_t* a)
  {
    function(t, fromBits<A>(a[0]), fromBits<B>(a[1]));
    return 0;
  }
};

template <class A, class B, class C, void (*function)(vm::Thread*, A, B, C)>
struct Invoker<void (*)(vm::Thread*, A, B, C), function> {
  static uint64_t invoke(vm::Thread* t, const uint64_t* a)
  {
    function(t, fromBits<A>(a[0]), fromBits<B>(a[1]), fromBits<C>(a[2]));
    return 0;
  }
};

template <class F>
struct Signature;

template <class R, class... Ps>
struct Signature<R (*)(vm::Thread*, Ps...)> {
  static const unsigned Arity = sizeof...(Ps);

  static RuntimeCall make(const char* name, RuntimeCallInvoker invoker)
  {
    const Kind kinds[] = {KindOf<Ps>::Value..., VoidKind};

    RuntimeCall call;
    call.name = name;
    call.invoker = invoker;
    call.resultKind = KindOf<R>::Value;
    call.parameterCount = sizeof...(Ps);
    for (unsigned i = 0; i < MaxRuntimeCallParameters; ++i) {
      call.parameterKinds[i] = i < sizeof...(Ps) ? kinds[i] : VoidKind;
    }
    return call;
  }
};

template <class F, F function>
inline RuntimeCall bindRuntimeCall(const char* name)
{
  static_assert(Signature<F>::Arity <= MaxRuntimeCallParameters,
                "too many runtime call parameters");
  return Signature<F>::make(name, Invoker<F, function>::invoke);
}

// the binding table; returns null for an unknown name
const RuntimeCall* findRuntimeCall(const char* name);

unsigned runtimeCallCount();

const RuntimeCall* runtimeCallAt(unsigned index);

// true if a call with the given result and argument kinds may be
// routed to the binding
bool compatible(const RuntimeCall* call,
                Kind resultKind,
                util::Slice<Operand*> arguments);

// Builds one stub template per runtime call on first use and hands out
// the same stub on every later request.
class StubRegistry {
 public:
  StubRegistry(vm::System* s, TemplateAssembler* assembler);

  // aborts if the name is unbound or the kinds do not match the binding
  Template* stubFor(const char* name,
                    Kind resultKind,
                    util::Slice<Operand*> arguments);

  // null if no stub has been built for the name
  Template* find(const char* name);

  unsigned size()
  {
    return count;
  }

  Template* stubAt(unsigned index);

  vm::System* s;
  TemplateAssembler* assembler;

 private:
  class Entry {
   public:
    Entry(const RuntimeCall* call, Template* stub, Entry* next)
        : call(call), stub(stub), next(next), link(0)
    {
    }

    const RuntimeCall* call;
    Template* stub;
    Entry* next;
    // creation order
    Entry* link;
  };

  static const unsigned BucketCount = 64;

  Entry* buckets[BucketCount];
  Entry* first;
  Entry** last;
  unsigned count;
};

}  // namespace codegen
}  // namespace lowering

#endif  // LOWERING_CODEGEN_STUBS_H
