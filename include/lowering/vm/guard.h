/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef LOWERING_VM_GUARD_H
#define LOWERING_VM_GUARD_H

#include <lowering/vm/machine.h>
#include <lowering/vm/arch.h>

namespace lowering {
namespace vm {

class ResolutionGuard;

// A symbolic reference as it appears in a class's constant pool.
class Reference {
 public:
  enum Tag {
    ClassReference,
    FieldReference,
    MethodReference,
    InterfaceMethodReference
  };

  Reference(Tag tag, const char* className, const char* memberName = 0)
      : tag(tag), className(className), memberName(memberName)
  {
  }

  Tag tag;
  const char* className;
  const char* memberName;
};

class ConstantPool {
 public:
  ConstantPool(Type* holder,
               util::Slice<Reference> references,
               util::Slice<ResolutionGuard*> guards)
      : holder(holder), references(references), guards(guards)
  {
  }

  Type* holder;
  util::Slice<Reference> references;
  util::Slice<ResolutionGuard*> guards;
};

// A constant-pool entry plus the value it resolves to.  The value is
// installed at most once and never changes afterwards.
class ResolutionGuard {
 public:
  enum Target {
    // the referenced class, field or method itself
    DeclaredTarget,
    // the array type whose component is the referenced class
    ComponentTarget
  };

  ResolutionGuard(ConstantPool* pool, unsigned index, Target target)
      : pool(pool), index(index), target(target), value(0)
  {
  }

  Reference* reference()
  {
    return &pool->references[index];
  }

  bool resolved()
  {
    void* v = value;
    loadMemoryBarrier();
    return v != 0;
  }

  ConstantPool* pool;
  unsigned index;
  Target target;
  void* value;
};

ConstantPool* makeConstantPool(Thread* t,
                               Type* holder,
                               util::Slice<Reference> references);

// one guard per pool entry and target, created on first request
ResolutionGuard* makeResolutionGuard(Thread* t,
                                     ConstantPool* pool,
                                     unsigned index,
                                     ResolutionGuard::Target target
                                     = ResolutionGuard::DeclaredTarget);

// Resolves the guard's reference if that has not happened yet and
// returns the cached value.  On a linkage failure, t->exception is set,
// null is returned and nothing is cached.
void* resolve(Thread* t, ResolutionGuard* guard);

inline Type* resolveType(Thread* t, ResolutionGuard* guard)
{
  return static_cast<Type*>(resolve(t, guard));
}

inline Field* resolveField(Thread* t, ResolutionGuard* guard)
{
  return static_cast<Field*>(resolve(t, guard));
}

inline Method* resolveMethod(Thread* t, ResolutionGuard* guard)
{
  return static_cast<Method*>(resolve(t, guard));
}

}  // namespace vm
}  // namespace lowering

#endif  // LOWERING_VM_GUARD_H
