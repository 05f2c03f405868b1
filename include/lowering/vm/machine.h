/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef LOWERING_VM_MACHINE_H
#define LOWERING_VM_MACHINE_H

#include <lowering/common.h>
#include <lowering/system/system.h>
#include <lowering/heap/heap.h>
#include <lowering/zone.h>
#include <lowering/util/slice.h>
#include <lowering/codegen/kind.h>
#include <lowering/vm/layout.h>

namespace lowering {
namespace vm {

class Machine;
class Thread;
class Type;
class MonitorRecord;

const unsigned TlabSizeInBytes = 16 * 1024;

// allocations at least this large bypass the thread-local buffer
const unsigned LargeObjectSizeInBytes = TlabSizeInBytes / 4;

// each allocation log record is [site, cell, size]
const unsigned TlabLogRecordWords = 3;
const unsigned TlabLogRecords = 64;

const unsigned StackLimit = 1024;

enum TypeFlag {
  FinalFlag = 1 << 0,
  InterfaceFlag = 1 << 1,
  ArrayFlag = 1 << 2,
  HybridFlag = 1 << 3,
  AbstractFlag = 1 << 4
};

enum MethodFlag {
  StaticMethod = 1 << 0,
  PrivateMethod = 1 << 1,
  ConstructorMethod = 1 << 2,
  AbstractMethod = 1 << 3,
  // called directly by the VM; prologues skip the stack check
  EntryPointMethod = 1 << 4
};

class Field {
 public:
  Field(Type* holder, const char* name, codegen::Kind kind, bool isStatic)
      : holder(holder), name(name), kind(kind), isStatic(isStatic), offset(0)
  {
  }

  Type* holder;
  const char* name;
  codegen::Kind kind;
  bool isStatic;
  unsigned offset;
};

class Method {
 public:
  Method(Type* holder, const char* name, unsigned flags)
      : holder(holder),
        name(name),
        flags(flags),
        vtableIndex(-1),
        interfaceIndex(0),
        entry(0)
  {
  }

  bool isStatic() const
  {
    return (flags & StaticMethod) != 0;
  }

  // methods bound at the call site rather than through the vtable
  bool isSpecial() const
  {
    return (flags & (PrivateMethod | ConstructorMethod)) != 0;
  }

  Type* holder;
  const char* name;
  unsigned flags;
  // word index of the method's slot in its holder's hub, or -1
  int vtableIndex;
  // 1-based position among an interface's methods, or 0
  unsigned interfaceIndex;
  uintptr_t entry;
};

// Resolved method-handle target used by the link-to-* calls.
class MemberName {
 public:
  MemberName(Method* target) : target(target)
  {
  }

  Method* target;
};

class Type {
 public:
  Type(const char* name, unsigned id, unsigned flags, Type* super)
      : name(name),
        id(id),
        flags(flags),
        super(super),
        interfaces(0, 0),
        componentType(0),
        elementKind(codegen::VoidKind),
        fields(0, 0),
        methods(0, 0),
        vtable(0, 0),
        supertypes(0, 0),
        hub(0),
        staticTuple(0),
        mirror(0),
        tupleSize(0),
        staticTupleSize(0),
        arrayType(0),
        initialized(false),
        next(0)
  {
  }

  bool isInterface() const
  {
    return (flags & InterfaceFlag) != 0;
  }

  bool isArray() const
  {
    return (flags & ArrayFlag) != 0;
  }

  bool isHybrid() const
  {
    return (flags & HybridFlag) != 0;
  }

  bool isFinal() const
  {
    return (flags & FinalFlag) != 0;
  }

  // a type whose instances all share exactly one hub, so that a type
  // test reduces to a hub comparison
  bool isLeaf() const
  {
    return isFinal() and not isArray();
  }

  const char* name;
  unsigned id;
  unsigned flags;
  Type* super;
  util::Slice<Type*> interfaces;
  Type* componentType;
  codegen::Kind elementKind;
  util::Slice<Field*> fields;
  util::Slice<Method*> methods;
  util::Slice<Method*> vtable;
  // every type this one may be assigned to, itself included
  util::Slice<Type*> supertypes;
  object hub;
  object staticTuple;
  object mirror;
  unsigned tupleSize;
  unsigned staticTupleSize;
  Type* arrayType;
  bool initialized;
  Type* next;
};

class FieldSpec {
 public:
  FieldSpec(const char* name, codegen::Kind kind, bool isStatic = false)
      : name(name), kind(kind), isStatic(isStatic)
  {
  }

  const char* name;
  codegen::Kind kind;
  bool isStatic;
};

class MethodSpec {
 public:
  MethodSpec(const char* name, unsigned flags = 0) : name(name), flags(flags)
  {
  }

  const char* name;
  unsigned flags;
};

// Notified of allocations at sites compiled with the sampling hook.
class AllocationListener {
 public:
  virtual void allocated(Thread* t, object o, Type* type, unsigned size) = 0;
};

class SafepointListener {
 public:
  virtual void atSafepoint(Thread* t) = 0;
};

class Machine {
 public:
  enum BootType {
    ObjectType,
    ClassType,
    CloneableType,
    ThrowableType,
    NullPointerExceptionType,
    ArrayIndexOutOfBoundsExceptionType,
    ArrayStoreExceptionType,
    NegativeArraySizeExceptionType,
    ClassCastExceptionType,
    IllegalMonitorStateExceptionType,
    NoClassDefFoundErrorType,
    NoSuchFieldErrorType,
    NoSuchMethodErrorType,
    IncompatibleClassChangeErrorType,
    OutOfMemoryErrorType,
    StackOverflowErrorType,
    BootTypeCount
  };

  Machine(System* system, Heap* heap);

  void dispose();

  System* system;
  Heap* heap;
  Zone zone;
  Layout layout;
  System::Mutex* typeLock;
  System::Mutex* resolveLock;
  System::Mutex* monitorLock;
  Type* types[BootTypeCount];
  Type* primitiveArrayTypes[codegen::ElementKindCount];
  Type* typeList;
  unsigned nextTypeId;
  unsigned typeCount;
  uintptr_t nextEntry;
  MonitorRecord* monitors;
  // thrown when the heap cannot hold another throwable
  object outOfMemoryError;
  AllocationListener* allocationListener;
  SafepointListener* safepointListener;
  volatile bool pauseRequested;
  unsigned resolutions;
  unsigned initializations;
  unsigned loggedAllocations;
};

class Thread {
 public:
  // The word block the latch register points to.  SafepointLatch
  // holds the address of the enabled locals, which is the block
  // itself.
  enum Local {
    SafepointLatch,
    EnabledLocals,
    TlabMark,
    TlabTop,
    TlabLogTail,
    ProfilerMark,
    LocalCount
  };

  Thread(Machine* m);

  void dispose();

  static unsigned localOffset(Local local)
  {
    return local * BytesPerWord;
  }

  Machine* m;
  uintptr_t locals[LocalCount];
  object exception;
  object caughtException;
  uintptr_t* log;
  unsigned frameDepth;
  unsigned safepoints;
  unsigned tlabRefills;
};

inline util::Aborter* getAborter(Thread* t)
{
  return t->m->system;
}

inline util::Aborter* getAborter(Machine* m)
{
  return m->system;
}

Machine* makeMachine(System* system, Heap* heap);

Thread* makeThread(Machine* m);

// defines and prepares a class or interface; aborts if the name is
// already taken
Type* defineType(Thread* t,
                 const char* name,
                 unsigned flags,
                 Type* super,
                 util::Slice<Type*> interfaces,
                 util::Slice<FieldSpec> fields,
                 util::Slice<MethodSpec> methods);

// null if no type of that name has been defined
Type* findType(Machine* m, const char* name);

Type* arrayTypeOf(Thread* t, Type* componentType);

// the "default hub" for arrays of a kind
Type* primitiveArrayType(Machine* m, codegen::Kind kind);

Field* findField(Type* type, const char* name);

Method* findMethod(Type* type, const char* name);

MemberName* makeMemberName(Thread* t, Method* target);

bool isAssignableFrom(Type* a, Type* b);

void initialize(Thread* t, Type* type);

inline object hubOf(object o)
{
  return fieldAtOffset<object>(o, 0);
}

inline Type* hubType(Thread* t, object hub)
{
  return fieldAtOffset<Type*>(hub, t->m->layout.typeOffset());
}

inline Type* objectType(Thread* t, object o)
{
  return hubType(t, hubOf(o));
}

inline int32_t arrayLength(Thread* t, object array)
{
  return fieldAtOffset<int32_t>(array, t->m->layout.arrayLengthOffset());
}

template <class T>
inline T& arrayElement(Thread* t, object array, unsigned index)
{
  return fieldAtOffset<T>(array,
                          t->m->layout.firstElementOffset() + index * sizeof(T));
}

// size in bytes of an array of the given type and length, padded to
// the object alignment
unsigned arraySize(Thread* t, Type* type, unsigned length);

// allocation outside generated code; sets t->exception and returns
// null on failure
object allocateTuple(Thread* t, Type* type);
object allocateArray(Thread* t, Type* type, int32_t length);

object makeThrowable(Thread* t,
                     Machine::BootType type,
                     int32_t detail,
                     const char* message);

void throwNew(Thread* t,
              Machine::BootType type,
              int32_t detail,
              const char* format,
              ...);

int32_t throwableDetail(Thread* t, object throwable);

const char* throwableMessage(Thread* t, object throwable);

inline bool isInstanceOf(Thread* t, object o, Machine::BootType type)
{
  return o and objectType(t, o) == t->m->types[type];
}

// the cooperative pause check emitted at safepoints
void safepointPoll(Thread* t);

// reentrant; spins while another thread owns the monitor
void monitorAcquire(Thread* t, object o);

// false if t does not own the monitor
bool monitorRelease(Thread* t, object o);

bool holdsMonitor(Thread* t, object o);

}  // namespace vm
}  // namespace lowering

#endif  // LOWERING_VM_MACHINE_H
