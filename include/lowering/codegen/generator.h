/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef LOWERING_CODEGEN_GENERATOR_H
#define LOWERING_CODEGEN_GENERATOR_H

#include <lowering/system/system.h>
#include <lowering/zone.h>
#include <lowering/vector.h>
#include <lowering/codegen/template.h>
#include <lowering/codegen/assembler.h>
#include <lowering/codegen/stubs.h>
#include <lowering/vm/layout.h>

namespace lowering {

namespace vm {
class Machine;
class Thread;
class Type;
class Field;
class Method;
class ResolutionGuard;
}

namespace codegen {

class Architecture;
class HeapScheme;
class BarrierGenerator;

// ranks below this get a template which allocates every dimension
// with one specialized runtime call
const unsigned SmallMultiArrayRank = 4;
const unsigned MaxMultiArrayRank = 6;

// Flags describing what a call site needs checked.
class Site {
 public:
  enum Flag { BoundsCheck = 1 << 0, StoreCheck = 1 << 1, NonNull = 1 << 2 };

  static const unsigned Checked = BoundsCheck | StoreCheck;

  explicit Site(unsigned flags = Checked) : flags(flags)
  {
  }

  bool requiresBoundsCheck() const
  {
    return (flags & BoundsCheck) != 0;
  }

  bool requiresStoreCheck() const
  {
    return (flags & StoreCheck) != 0;
  }

  bool isNonNull() const
  {
    return (flags & NonNull) != 0;
  }

  unsigned flags;
};

class TypeRef {
 public:
  enum Tag { Resolved, Unresolved };

  static TypeRef resolved(vm::Type* type)
  {
    return TypeRef(Resolved, type, 0);
  }

  static TypeRef unresolved(vm::ResolutionGuard* guard)
  {
    return TypeRef(Unresolved, 0, guard);
  }

  Tag tag;
  vm::Type* type;
  vm::ResolutionGuard* guard;

 private:
  TypeRef(Tag tag, vm::Type* type, vm::ResolutionGuard* guard)
      : tag(tag), type(type), guard(guard)
  {
  }
};

class FieldRef {
 public:
  enum Tag { Resolved, Unresolved };

  static FieldRef resolved(vm::Field* field);

  // the kind comes from the symbolic reference's signature
  static FieldRef unresolved(vm::ResolutionGuard* guard, Kind kind)
  {
    return FieldRef(Unresolved, kind, 0, guard);
  }

  Tag tag;
  Kind kind;
  vm::Field* field;
  vm::ResolutionGuard* guard;

 private:
  FieldRef(Tag tag, Kind kind, vm::Field* field, vm::ResolutionGuard* guard)
      : tag(tag), kind(kind), field(field), guard(guard)
  {
  }
};

class MethodRef {
 public:
  enum Tag { Resolved, Unresolved };

  static MethodRef resolved(vm::Method* method)
  {
    return MethodRef(Resolved, method, 0);
  }

  static MethodRef unresolved(vm::ResolutionGuard* guard)
  {
    return MethodRef(Unresolved, 0, guard);
  }

  Tag tag;
  vm::Method* method;
  vm::ResolutionGuard* guard;

 private:
  MethodRef(Tag tag, vm::Method* method, vm::ResolutionGuard* guard)
      : tag(tag), method(method), guard(guard)
  {
  }
};

template <size_t Count>
class Arguments {
 public:
  Argument arguments[Count + 1];

  template <class... Ts>
  Arguments(Ts... ts)
      : arguments{ts..., Argument::forInt(0)}
  {
  }

  operator util::Slice<Argument>()
  {
    return util::Slice<Argument>(&arguments[0], Count);
  }
};

template <class... Ts>
inline Arguments<util::ArgumentCount<Ts...>::Result> arguments(Ts... ts)
{
  return Arguments<util::ArgumentCount<Ts...>::Result>(ts...);
}

class TemplateGenerator;

// State private to one compilation: the zone its snippets live in and
// its own working copy of the assembler.
class Compilation {
 public:
  Compilation(TemplateGenerator* generator, vm::Thread* t);
  ~Compilation();

  TemplateAssembler* assembler();

  TemplateGenerator* generator;
  vm::Thread* t;
  vm::Zone zone;

 private:
  TemplateAssembler* assembler_;
};

// Builds the template catalog once and hands out snippets for call
// sites.  After makeTemplates returns, the catalog is read-only and may
// be used by any number of compilations at once.
class TemplateGenerator {
 public:
  enum Operation {
    GetField,
    PutField,
    GetStatic,
    PutStatic,
    ArrayLoad,
    ArrayStore,
    ArrayLength,
    NewInstance,
    NewHybrid,
    NewArray,
    NewMultiArray,
    InvokeStatic,
    InvokeSpecial,
    InvokeVirtual,
    InvokeInterface,
    InvokeHandle,
    LinkToStatic,
    LinkToSpecial,
    LinkToVirtual,
    LinkToInterface,
    CheckCast,
    InstanceOf,
    MaterializeInstanceOf,
    TypeAssert,
    MonitorEnter,
    MonitorExit,
    Safepoint,
    ExceptionObject,
    ResolveClass
  };

  // operation-specific lookup flags; NewMultiArray passes the rank
  // and ResolveClass the representation instead
  enum LookupFlag {
    BoundsCheckFlag = 1 << 0,
    StoreCheckFlag = 1 << 1,
    NonNullFlag = 1 << 2,
    LeafFlag = 1 << 3
  };

  enum Representation { ObjectHub, StaticFields, TypeInfo, JavaClass };

  static const unsigned RepresentationCount = JavaClass + 1;

  class Options {
   public:
    Options()
        : printTemplates(false),
          useOutOfLineStubs(true),
          profilerEntryPoint(0),
          profilerExitPoint(0)
    {
    }

    bool printTemplates;
    // place allocation slow paths out of line
    bool useOutOfLineStubs;
    // methods whose prologue (epilogue) sets (clears) the thread's
    // profiler mark
    const char* profilerEntryPoint;
    const char* profilerExitPoint;
  };

  TemplateGenerator(vm::System* s,
                    vm::Machine* m,
                    Architecture* arch,
                    HeapScheme* scheme,
                    const Options& options);

  ~TemplateGenerator();

  // builds every template on the first call; later calls return the
  // same list without rebuilding
  util::Slice<Template*> makeTemplates();

  Template* lookup(Operation op, Kind kind, bool resolved, unsigned flags);

  // searches the catalog and the stub registry by template name
  Template* find(const char* name);

  StubRegistry* stubs()
  {
    return &stubRegistry;
  }

  Snippet* genPrologue(Compilation* c, vm::Method* method);
  Snippet* genEpilogue(Compilation* c, vm::Method* method);
  Snippet* genSafepoint(Compilation* c);
  Snippet* genExceptionObject(Compilation* c);
  Snippet* genResolveClass(Compilation* c,
                           TypeRef type,
                           Representation representation);

  Snippet* genGetField(Compilation* c,
                       Site site,
                       Argument receiver,
                       FieldRef field);
  Snippet* genPutField(Compilation* c,
                       Site site,
                       Argument receiver,
                       FieldRef field,
                       Argument value);
  Snippet* genGetStatic(Compilation* c,
                        Site site,
                        Argument staticTuple,
                        FieldRef field);
  Snippet* genPutStatic(Compilation* c,
                        Site site,
                        Argument staticTuple,
                        FieldRef field,
                        Argument value);
  Snippet* genArrayLoad(Compilation* c,
                        Site site,
                        Kind kind,
                        Argument array,
                        Argument index);
  Snippet* genArrayStore(Compilation* c,
                         Site site,
                         Kind kind,
                         Argument array,
                         Argument index,
                         Argument value);
  Snippet* genArrayLength(Compilation* c, Argument array);

  Snippet* genInvokeStatic(Compilation* c, MethodRef method);
  Snippet* genInvokeSpecial(Compilation* c,
                            Site site,
                            Argument receiver,
                            MethodRef method);
  Snippet* genInvokeVirtual(Compilation* c, Argument receiver, MethodRef method);
  Snippet* genInvokeInterface(Compilation* c,
                              Argument receiver,
                              MethodRef method);
  Snippet* genInvokeHandle(Compilation* c, Argument method);
  Snippet* genLinkToStatic(Compilation* c, Argument memberName);
  Snippet* genLinkToSpecial(Compilation* c, Argument memberName);
  Snippet* genLinkToVirtual(Compilation* c,
                            Argument memberName,
                            Argument receiver);
  Snippet* genLinkToInterface(Compilation* c,
                              Argument memberName,
                              Argument receiver);

  Snippet* genNewInstance(Compilation* c, TypeRef type);
  Snippet* genNewArray(Compilation* c,
                       Kind elementKind,
                       Argument length,
                       TypeRef componentType);
  Snippet* genNewMultiArray(Compilation* c,
                            util::Slice<Argument> lengths,
                            TypeRef arrayType);

  Snippet* genCheckCast(Compilation* c,
                        Site site,
                        Argument object,
                        TypeRef type);
  Snippet* genInstanceOf(Compilation* c,
                         Site site,
                         Argument object,
                         TypeRef type);
  Snippet* genMaterializeInstanceOf(Compilation* c,
                                    Site site,
                                    Argument object,
                                    TypeRef type,
                                    Argument trueValue,
                                    Argument falseValue);
  Snippet* genTypeAssert(Compilation* c, Argument object, TypeRef type);

  Snippet* genMonitorEnter(Compilation* c, Argument object);
  Snippet* genMonitorExit(Compilation* c, Argument object);

  vm::System* s;
  vm::Machine* m;
  Architecture* arch;
  HeapScheme* scheme;
  Options options;
  vm::Layout layout;
  vm::SystemAllocator allocator;
  vm::Zone zone;
  TemplateAssembler assembler;

 private:
  friend class Compilation;

  // building
  void callRuntimeThroughStub(TemplateAssembler* a,
                              const char* name,
                              Operand* result,
                              util::Slice<Operand*> arguments);
  void barrier(TemplateAssembler* a,
               unsigned position,
               Operand* object,
               Operand* index);
  Template* finish(Template* t);
  Template* finish(TemplateAssembler* a, Operand* result, const char* name);
  void emitSafepoint(TemplateAssembler* a);
  Operand* loadEnabledLocals(TemplateAssembler* a);
  // slot = mtable[id mod length], the hub word index holding id
  void mtableSlot(TemplateAssembler* a, Operand* hub, Operand* id, Operand* slot);

  void buildAccessTemplates();
  TemplatePair buildGetField(Kind kind);
  TemplatePair buildPutField(Kind kind);
  TemplatePair buildGetStatic(Kind kind);
  TemplatePair buildPutStatic(Kind kind);
  Template* buildArrayLoad(Kind kind, bool boundsCheck);
  Template* buildArrayStore(Kind kind, bool boundsCheck, bool storeCheck);
  Template* buildArrayLength();

  void buildDispatchTemplates();
  TemplatePair buildInvokeStatic();
  TemplatePair buildInvokeSpecial(bool nullCheck);
  TemplatePair buildInvokeVirtual();
  TemplatePair buildInvokeInterface();
  Template* buildInvokeHandle();
  Template* buildLinkTo(const char* name, bool withReceiver);

  void buildAllocationTemplates();
  TemplatePair buildNewInstance();
  Template* buildNewHybrid();
  TemplatePair buildNewArray(Kind kind);
  TemplatePair buildNewMultiArray(unsigned rank);
  void tlabAllocate(TemplateAssembler* a,
                    Operand* size,
                    Operand* cell,
                    Operand* etla);
  void tlabLog(TemplateAssembler* a,
               Operand* etla,
               Operand* cell,
               Operand* size);
  void formatCell(TemplateAssembler* a,
                  Operand* result,
                  Operand* cell,
                  Operand* hub,
                  Operand* length,
                  Operand* size,
                  Operand* etla,
                  const char* profiler);
  void allocateArray(TemplateAssembler* a,
                     Kind kind,
                     Operand* result,
                     Operand* hub,
                     Operand* length);

  void buildTypeCheckTemplates();
  Template* buildCheckCast(bool leaf, bool nonNull);
  Template* buildInstanceOf(bool leaf, bool nonNull);
  Template* buildMaterializeInstanceOf(bool leaf, bool nonNull);
  Template* buildUnresolvedCheckCast();
  Template* buildUnresolvedInstanceOf();
  Template* buildUnresolvedMaterializeInstanceOf();
  Template* buildTypeAssert();
  void probeSupertype(TemplateAssembler* a,
                      Operand* hub,
                      Operand* typeId,
                      Label* success,
                      Label* failure);

  void buildMiscTemplates();

  // instantiation
  Template* require(Operation op, Kind kind, bool resolved, unsigned flags);
  Snippet* snippet(Compilation* c, Template* t, util::Slice<Argument> arguments);
  Argument guardArgument(vm::ResolutionGuard* guard);
  Argument hubArgument(vm::Type* type);

  StubRegistry stubRegistry;
  vm::Vector templates;
  bool built;

  TemplatePair getFieldTemplates[KindCount];
  TemplatePair putFieldTemplates[KindCount];
  TemplatePair getStaticTemplates[KindCount];
  TemplatePair putStaticTemplates[KindCount];
  Template* arrayLoadTemplates[KindCount][2];
  Template* arrayStoreTemplates[KindCount][2][2];
  Template* arrayLengthTemplate;

  TemplatePair invokeStaticTemplates;
  TemplatePair invokeSpecialTemplates;
  Template* invokeSpecialNonNullTemplate;
  TemplatePair invokeVirtualTemplates;
  TemplatePair invokeInterfaceTemplates;
  Template* invokeHandleTemplate;
  Template* linkToStaticTemplate;
  Template* linkToSpecialTemplate;
  Template* linkToVirtualTemplate;
  Template* linkToInterfaceTemplate;

  TemplatePair newInstanceTemplates;
  Template* newHybridTemplate;
  TemplatePair newArrayTemplates[KindCount];
  TemplatePair newMultiArrayTemplates[MaxMultiArrayRank + 1];

  Template* checkCastTemplates[2][2];
  Template* instanceOfTemplates[2][2];
  Template* materializeInstanceOfTemplates[2][2];
  Template* unresolvedCheckCastTemplate;
  Template* unresolvedInstanceOfTemplate;
  Template* unresolvedMaterializeInstanceOfTemplate;
  Template* typeAssertTemplate;

  Template* monitorEnterTemplate;
  Template* monitorExitTemplate;
  Template* safepointTemplate;
  Template* exceptionObjectTemplate;
  Template* resolveClassTemplates[RepresentationCount];
  Template* constantTemplate;
};

}  // namespace codegen
}  // namespace lowering

#endif  // LOWERING_CODEGEN_GENERATOR_H
