/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <lowering/vm/machine.h>
#include <lowering/vector.h>

using namespace lowering::util;
using namespace lowering::codegen;

namespace {

namespace local {

const bool DebugTypes = false;
const bool DebugExceptions = false;

}  // namespace local

}  // namespace

namespace lowering {
namespace vm {

class MonitorRecord {
 public:
  MonitorRecord(object o, MonitorRecord* next)
      : o(o), owner(0), depth(0), next(next)
  {
  }

  object o;
  Thread* owner;
  unsigned depth;
  MonitorRecord* next;
};

namespace {

const char* const primitiveArrayNames[] = {"[Z", "[B", "[S", "[C",
                                           "[I", "[J", "[F", "[D"};

const uintptr_t FirstEntry = 0x10000;
const uintptr_t EntrySpacing = 16;

// Every lowercase helper below expects m->typeLock to be held.

Type* findTypeLocked(Machine* m, const char* name)
{
  for (Type* type = m->typeList; type; type = type->next) {
    if (strcmp(type->name, name) == 0) {
      return type;
    }
  }
  return 0;
}

void addSupertype(Vector* list, Type* type)
{
  unsigned count = list->length() / BytesPerWord;
  for (unsigned i = 0; i < count; ++i) {
    if (list->getAddress(i * BytesPerWord) == type) {
      return;
    }
  }
  list->appendAddress(type);
}

void addSupertypes(Vector* list, Type* type)
{
  for (unsigned i = 0; i < type->supertypes.count; ++i) {
    addSupertype(list, type->supertypes[i]);
  }
}

Slice<Type*> toSlice(Machine* m, Vector* list)
{
  unsigned count = list->length() / BytesPerWord;
  Slice<Type*> slice = Slice<Type*>::alloc(&m->zone, count);
  for (unsigned i = 0; i < count; ++i) {
    slice[i] = static_cast<Type*>(list->getAddress(i * BytesPerWord));
  }
  return slice;
}

unsigned interfaceMethodCount(Type* type)
{
  unsigned count = 0;
  for (unsigned i = 0; i < type->methods.count; ++i) {
    if (type->methods[i]->interfaceIndex) {
      ++count;
    }
  }
  return count;
}

Method* interfaceMethodAt(Type* type, unsigned interfaceIndex)
{
  for (unsigned i = 0; i < type->methods.count; ++i) {
    if (type->methods[i]->interfaceIndex == interfaceIndex) {
      return type->methods[i];
    }
  }
  return 0;
}

Method* implementationOf(Type* type, const char* name)
{
  for (unsigned i = 0; i < type->vtable.count; ++i) {
    if (strcmp(type->vtable[i]->name, name) == 0) {
      return type->vtable[i];
    }
  }
  return 0;
}

// the smallest table length, no less than the number of supertypes,
// under which no two supertype ids share a slot
unsigned mtableLength(Type* type)
{
  unsigned length = max(type->supertypes.count, 1);
  while (true) {
    bool collision = false;
    for (unsigned i = 0; i < type->supertypes.count and not collision; ++i) {
      for (unsigned j = i + 1; j < type->supertypes.count; ++j) {
        if (type->supertypes[i]->id % length
            == type->supertypes[j]->id % length) {
          collision = true;
          break;
        }
      }
    }

    if (not collision) {
      return length;
    }
    ++length;
  }
}

uintptr_t& hubWord(Machine* m, object hub, unsigned index)
{
  return fieldAtOffset<uintptr_t>(hub, m->layout.hubWordOffset(index));
}

object makeHub(Machine* m, Type* type)
{
  unsigned length = mtableLength(type);

  unsigned itableWords = 1;
  for (unsigned i = 0; i < type->supertypes.count; ++i) {
    Type* s = type->supertypes[i];
    itableWords += 1 + (s->isInterface() ? interfaceMethodCount(s) : 0);
  }

  unsigned bodyWords = HubFirstWordIndex + type->vtable.count + itableWords;
  unsigned mtableWords = ceilingDivide(length * 4, BytesPerWord);
  unsigned size = m->layout.headerSize()
                  + (bodyWords + mtableWords) * BytesPerWord;

  object hub = m->zone.allocate(size);
  memset(hub, 0, size);

  fieldAtOffset<uintptr_t>(hub, m->layout.arrayLengthOffset())
      = bodyWords + mtableWords;

  hubWord(m, hub, HubComponentHub) = reinterpret_cast<uintptr_t>(
      type->componentType ? type->componentType->hub : 0);
  hubWord(m, hub, HubTupleSize) = type->tupleSize;
  hubWord(m, hub, HubMTableStartIndex) = bodyWords * (BytesPerWord / 4);
  hubWord(m, hub, HubMTableLength) = length;
  hubWord(m, hub, HubType) = reinterpret_cast<uintptr_t>(type);

  for (unsigned i = 0; i < type->vtable.count; ++i) {
    hubWord(m, hub, HubFirstWordIndex + i) = type->vtable[i]->entry;
  }

  unsigned sentinel = HubFirstWordIndex + type->vtable.count;
  hubWord(m, hub, sentinel) = 0;

  int32_t* mtable = &fieldAtOffset<int32_t>(
      hub, m->layout.hubWordOffset(bodyWords));
  for (unsigned i = 0; i < length; ++i) {
    mtable[i] = sentinel;
  }

  unsigned index = sentinel + 1;
  for (unsigned i = 0; i < type->supertypes.count; ++i) {
    Type* s = type->supertypes[i];
    mtable[s->id % length] = index;
    hubWord(m, hub, index++) = s->id;

    if (s->isInterface()) {
      unsigned count = interfaceMethodCount(s);
      for (unsigned j = 1; j <= count; ++j) {
        Method* method = implementationOf(type, interfaceMethodAt(s, j)->name);
        hubWord(m, hub, index++) = method ? method->entry : 0;
      }
    }
  }

  if (local::DebugTypes) {
    fprintf(stderr,
            "hub for %s: id %u, %u supertypes, mtable length %u\n",
            type->name,
            type->id,
            static_cast<unsigned>(type->supertypes.count),
            length);
  }

  return hub;
}

object allocateStaticCell(Machine* m, unsigned size, object hub)
{
  object o = m->heap->allocateCell(size);
  if (o == 0) {
    fprintf(stderr, "heap too small for type metadata\n");
    abort(m);
  }
  fieldAtOffset<object>(o, m->layout.hubOffset()) = hub;
  return o;
}

void makeMirror(Machine* m, Type* type)
{
  Type* classType = m->types[Machine::ClassType];
  type->mirror = allocateStaticCell(m, classType->tupleSize, classType->hub);
  fieldAtOffset<Type*>(type->mirror, findField(classType, "vmType")->offset)
      = type;
}

void registerType(Machine* m, Type* type)
{
  type->next = m->typeList;
  m->typeList = type;
  ++m->typeCount;

  if (m->types[Machine::ClassType]) {
    makeMirror(m, type);
  }
}

Type* arrayTypeOfLocked(Machine* m, Type* componentType);

Type* makeArrayType(Machine* m,
                    const char* name,
                    Type* componentType,
                    Kind elementKind)
{
  Type* objectType = m->types[Machine::ObjectType];

  Type* type = new (&m->zone)
      Type(m->zone.copy(name), m->nextTypeId++, ArrayFlag, objectType);
  type->componentType = componentType;
  type->elementKind = elementKind;
  type->tupleSize = kindSize(elementKind, BytesPerWord);
  type->vtable = objectType->vtable;

  Vector list(m->system, m->heap, 8 * BytesPerWord);
  addSupertype(&list, type);
  addSupertype(&list, objectType);
  addSupertype(&list, m->types[Machine::CloneableType]);
  if (componentType) {
    for (unsigned i = 0; i < componentType->supertypes.count; ++i) {
      Type* s = componentType->supertypes[i];
      if (s != componentType) {
        addSupertypes(&list, arrayTypeOfLocked(m, s));
      }
    }
  }
  type->supertypes = toSlice(m, &list);

  type->hub = makeHub(m, type);
  registerType(m, type);

  return type;
}

Type* arrayTypeOfLocked(Machine* m, Type* componentType)
{
  if (componentType->arrayType == 0) {
    const char* name = componentType->isArray()
                           ? m->zone.format("[%s", componentType->name)
                           : m->zone.format("[L%s;", componentType->name);

    componentType->arrayType = makeArrayType(m, name, componentType, ObjectKind);
  }
  return componentType->arrayType;
}

unsigned layoutFields(Machine* m,
                      Type* type,
                      Slice<FieldSpec> specs,
                      unsigned* staticSize)
{
  unsigned size = type->super ? type->super->tupleSize
                              : m->layout.headerSize();
  *staticSize = m->layout.headerSize();

  type->fields = Slice<Field*>::alloc(&m->zone, specs.count);
  for (unsigned i = 0; i < specs.count; ++i) {
    Field* field = new (&m->zone) Field(
        type, m->zone.copy(specs[i].name), specs[i].kind, specs[i].isStatic);

    unsigned fieldSize = kindSize(field->kind, BytesPerWord);
    unsigned* current = field->isStatic ? staticSize : &size;
    field->offset = pad(*current, fieldSize);
    *current = field->offset + fieldSize;

    type->fields[i] = field;
  }

  *staticSize = pad(*staticSize);
  return pad(size);
}

void layoutMethods(Machine* m, Type* type, Slice<MethodSpec> specs)
{
  type->methods = Slice<Method*>::alloc(&m->zone, specs.count);

  Vector vtable(m->system, m->heap, 8 * BytesPerWord);
  if (type->super and not type->isInterface()) {
    for (unsigned i = 0; i < type->super->vtable.count; ++i) {
      vtable.appendAddress(type->super->vtable[i]);
    }
  }

  unsigned interfaceIndex = 0;
  for (unsigned i = 0; i < specs.count; ++i) {
    Method* method = new (&m->zone)
        Method(type, m->zone.copy(specs[i].name), specs[i].flags);
    method->entry = (m->nextEntry += EntrySpacing);
    type->methods[i] = method;

    if (method->isStatic()) {
      continue;
    }

    if (type->isInterface()) {
      method->interfaceIndex = ++interfaceIndex;
    } else if (not method->isSpecial()) {
      unsigned count = vtable.length() / BytesPerWord;
      unsigned slot = count;
      for (unsigned j = 0; j < count; ++j) {
        Method* inherited
            = static_cast<Method*>(vtable.getAddress(j * BytesPerWord));
        if (strcmp(inherited->name, method->name) == 0) {
          slot = j;
          break;
        }
      }

      if (slot == count) {
        vtable.appendAddress(method);
      } else {
        memcpy(vtable.data.begin() + slot * BytesPerWord,
               &method,
               BytesPerWord);
      }
      method->vtableIndex = HubFirstWordIndex + slot;
    }
  }

  unsigned count = vtable.length() / BytesPerWord;
  type->vtable = Slice<Method*>::alloc(&m->zone, count);
  for (unsigned i = 0; i < count; ++i) {
    type->vtable[i] = static_cast<Method*>(vtable.getAddress(i * BytesPerWord));
  }
}

void initializeLocked(Machine* m, Type* type)
{
  if (not type->initialized) {
    if (type->super) {
      initializeLocked(m, type->super);
    }
    type->initialized = true;
    ++m->initializations;
  }
}

object allocateCell(Thread* t, unsigned size, Type* type)
{
  object o = t->m->heap->allocateCell(size);
  if (o == 0) {
    if (t->m->outOfMemoryError == 0) {
      fprintf(stderr, "heap exhausted during startup\n");
      abort(t);
    }
    t->exception = t->m->outOfMemoryError;
    return 0;
  }

  fieldAtOffset<object>(o, t->m->layout.hubOffset()) = type->hub;

  if (t->locals[Thread::ProfilerMark] and t->m->allocationListener) {
    t->m->allocationListener->allocated(t, o, type, size);
  }

  return o;
}

Type* defineBootType(Thread* t,
                     Machine::BootType bootType,
                     const char* name,
                     unsigned flags,
                     Type* super,
                     Slice<FieldSpec> fields = Slice<FieldSpec>())
{
  Type* type = defineType(
      t, name, flags, super, Slice<Type*>(), fields, Slice<MethodSpec>());
  t->m->types[bootType] = type;
  return type;
}

}  // namespace

Machine::Machine(System* system, Heap* heap)
    : system(system),
      heap(heap),
      zone(heap, 64 * 1024),
      layout(BytesPerWord),
      typeLock(0),
      resolveLock(0),
      monitorLock(0),
      typeList(0),
      nextTypeId(1),
      typeCount(0),
      nextEntry(FirstEntry),
      monitors(0),
      outOfMemoryError(0),
      allocationListener(0),
      safepointListener(0),
      pauseRequested(false),
      resolutions(0),
      initializations(0),
      loggedAllocations(0)
{
  memset(types, 0, sizeof(types));
  memset(primitiveArrayTypes, 0, sizeof(primitiveArrayTypes));

  if (not system->success(system->make(&typeLock))
      or not system->success(system->make(&resolveLock))
      or not system->success(system->make(&monitorLock))) {
    system->abort();
  }
}

void Machine::dispose()
{
  for (MonitorRecord* r = monitors; r;) {
    MonitorRecord* next = r->next;
    system->free(r);
    r = next;
  }

  typeLock->dispose();
  resolveLock->dispose();
  monitorLock->dispose();
  zone.dispose();
  system->free(this);
}

Thread::Thread(Machine* m)
    : m(m),
      exception(0),
      caughtException(0),
      log(0),
      frameDepth(0),
      safepoints(0),
      tlabRefills(0)
{
  memset(locals, 0, sizeof(locals));
  locals[SafepointLatch] = reinterpret_cast<uintptr_t>(locals);
  locals[EnabledLocals] = reinterpret_cast<uintptr_t>(locals);

  // the word after the last record holds its own address, which marks
  // the end of the buffer
  unsigned words = TlabLogRecords * TlabLogRecordWords + 1;
  log = static_cast<uintptr_t*>(allocate(m->system, words * BytesPerWord));
  memset(log, 0, words * BytesPerWord);
  log[words - 1] = reinterpret_cast<uintptr_t>(log + words - 1);
  locals[TlabLogTail] = reinterpret_cast<uintptr_t>(log);
}

void Thread::dispose()
{
  System* s = m->system;
  s->free(log);
  s->free(this);
}

Machine* makeMachine(System* system, Heap* heap)
{
  Machine* m = new (allocate(system, sizeof(Machine))) Machine(system, heap);
  Thread* t = makeThread(m);

  Type* root = defineBootType(t, Machine::ObjectType, "java/lang/Object", 0, 0);

  FieldSpec classFields[] = {FieldSpec("vmType", wordKind(BytesPerWord))};
  defineBootType(t,
                 Machine::ClassType,
                 "java/lang/Class",
                 FinalFlag,
                 root,
                 Slice<FieldSpec>(classFields));

  defineBootType(t,
                 Machine::CloneableType,
                 "java/lang/Cloneable",
                 InterfaceFlag | AbstractFlag,
                 0);

  FieldSpec throwableFields[]
      = {FieldSpec("detail", IntKind), FieldSpec("message", ObjectKind)};
  Type* throwable = defineBootType(t,
                                   Machine::ThrowableType,
                                   "java/lang/Throwable",
                                   0,
                                   root,
                                   Slice<FieldSpec>(throwableFields));

  const char* const throwableNames[] = {
      "java/lang/NullPointerException",
      "java/lang/ArrayIndexOutOfBoundsException",
      "java/lang/ArrayStoreException",
      "java/lang/NegativeArraySizeException",
      "java/lang/ClassCastException",
      "java/lang/IllegalMonitorStateException",
      "java/lang/NoClassDefFoundError",
      "java/lang/NoSuchFieldError",
      "java/lang/NoSuchMethodError",
      "java/lang/IncompatibleClassChangeError",
      "java/lang/OutOfMemoryError",
      "java/lang/StackOverflowError"};

  for (unsigned i = Machine::NullPointerExceptionType;
       i < Machine::BootTypeCount;
       ++i) {
    defineBootType(t,
                   static_cast<Machine::BootType>(i),
                   throwableNames[i - Machine::NullPointerExceptionType],
                   0,
                   throwable);
  }

  {
    ACQUIRE_LOCK(m->typeLock);

    for (unsigned kind = BooleanKind; kind < ObjectKind; ++kind) {
      m->primitiveArrayTypes[kind] = makeArrayType(
          m, primitiveArrayNames[kind], 0, static_cast<Kind>(kind));
    }
    m->primitiveArrayTypes[ObjectKind] = arrayTypeOfLocked(m, root);

    // types defined before Class get their mirrors now
    for (Type* type = m->typeList; type; type = type->next) {
      if (type->mirror == 0) {
        makeMirror(m, type);
      }
    }
  }

  m->outOfMemoryError = makeThrowable(
      t, Machine::OutOfMemoryErrorType, 0, "object space exhausted");
  expect(m, m->outOfMemoryError != 0);

  t->dispose();

  return m;
}

Thread* makeThread(Machine* m)
{
  return new (allocate(m->system, sizeof(Thread))) Thread(m);
}

Type* defineType(Thread* t,
                 const char* name,
                 unsigned flags,
                 Type* super,
                 Slice<Type*> interfaces,
                 Slice<FieldSpec> fields,
                 Slice<MethodSpec> methods)
{
  Machine* m = t->m;
  ACQUIRE_LOCK(m->typeLock);

  if (findTypeLocked(m, name)) {
    fprintf(stderr, "type %s is already defined\n", name);
    abort(t);
  }

  bool isInterface = (flags & InterfaceFlag) != 0;
  if (isInterface) {
    super = 0;
  } else if (super == 0) {
    super = m->types[Machine::ObjectType];
  }

  Type* type = new (&m->zone)
      Type(m->zone.copy(name), m->nextTypeId++, flags, super);
  type->interfaces = interfaces.clone(&m->zone);

  type->tupleSize = layoutFields(m, type, fields, &(type->staticTupleSize));
  layoutMethods(m, type, methods);

  Vector list(m->system, m->heap, 8 * BytesPerWord);
  addSupertype(&list, type);
  if (super) {
    addSupertypes(&list, super);
  } else if (isInterface and m->types[Machine::ObjectType]) {
    addSupertype(&list, m->types[Machine::ObjectType]);
  }
  for (unsigned i = 0; i < interfaces.count; ++i) {
    expect(t, interfaces[i]->isInterface());
    addSupertypes(&list, interfaces[i]);
  }
  type->supertypes = toSlice(m, &list);

  type->hub = makeHub(m, type);
  type->staticTuple = allocateStaticCell(m, type->staticTupleSize, type->hub);

  registerType(m, type);

  if (local::DebugTypes) {
    fprintf(stderr,
            "defined %s as id %u with tuple size %u\n",
            type->name,
            type->id,
            type->tupleSize);
  }

  return type;
}

Type* findType(Machine* m, const char* name)
{
  ACQUIRE_LOCK(m->typeLock);
  return findTypeLocked(m, name);
}

Type* arrayTypeOf(Thread* t, Type* componentType)
{
  ACQUIRE_LOCK(t->m->typeLock);
  return arrayTypeOfLocked(t->m, componentType);
}

Type* primitiveArrayType(Machine* m, Kind kind)
{
  expect(m, kind < ElementKindCount);
  return m->primitiveArrayTypes[kind];
}

Field* findField(Type* type, const char* name)
{
  for (Type* c = type; c; c = c->super) {
    for (unsigned i = 0; i < c->fields.count; ++i) {
      if (strcmp(c->fields[i]->name, name) == 0) {
        return c->fields[i];
      }
    }
  }
  return 0;
}

Method* findMethod(Type* type, const char* name)
{
  for (unsigned i = 0; i < type->supertypes.count; ++i) {
    Type* c = type->supertypes[i];
    for (unsigned j = 0; j < c->methods.count; ++j) {
      if (strcmp(c->methods[j]->name, name) == 0) {
        return c->methods[j];
      }
    }
  }
  return 0;
}

MemberName* makeMemberName(Thread* t, Method* target)
{
  ACQUIRE_LOCK(t->m->typeLock);
  return new (&(t->m->zone)) MemberName(target);
}

bool isAssignableFrom(Type* a, Type* b)
{
  for (unsigned i = 0; i < b->supertypes.count; ++i) {
    if (b->supertypes[i] == a) {
      return true;
    }
  }
  return false;
}

void initialize(Thread* t, Type* type)
{
  ACQUIRE_LOCK(t->m->typeLock);
  initializeLocked(t->m, type);
}

unsigned arraySize(Thread* t, Type* type, unsigned length)
{
  uint64_t size = t->m->layout.headerSize()
                  + static_cast<uint64_t>(length)
                    * kindSize(type->elementKind, BytesPerWord);
  if (size > 0x7fffffff) {
    return 0xffffffff;
  }
  return pad(static_cast<unsigned>(size));
}

object allocateTuple(Thread* t, Type* type)
{
  object o = allocateCell(t, type->tupleSize, type);
  if (o and type->isHybrid()) {
    fieldAtOffset<int32_t>(o, t->m->layout.arrayLengthOffset())
        = HubFirstWordIndex;
  }
  return o;
}

object allocateArray(Thread* t, Type* type, int32_t length)
{
  if (length < 0) {
    throwNew(t,
             Machine::NegativeArraySizeExceptionType,
             length,
             "%d",
             length);
    return 0;
  }

  object array = allocateCell(t, arraySize(t, type, length), type);
  if (array) {
    fieldAtOffset<int32_t>(array, t->m->layout.arrayLengthOffset()) = length;
  }
  return array;
}

object makeThrowable(Thread* t,
                     Machine::BootType type,
                     int32_t detail,
                     const char* message)
{
  Type* throwableType = t->m->types[type];
  object o = allocateTuple(t, throwableType);
  if (o == 0) {
    return 0;
  }

  fieldAtOffset<int32_t>(o, findField(throwableType, "detail")->offset)
      = detail;

  if (message) {
    unsigned length = strlen(message);
    object bytes
        = allocateArray(t, primitiveArrayType(t->m, ByteKind), length + 1);
    if (bytes == 0) {
      return 0;
    }
    memcpy(&arrayElement<char>(t, bytes, 0), message, length + 1);
    fieldAtOffset<object>(o, findField(throwableType, "message")->offset)
        = bytes;
  }

  return o;
}

void throwNew(Thread* t,
              Machine::BootType type,
              int32_t detail,
              const char* format,
              ...)
{
  char buffer[256];
  va_list a;
  va_start(a, format);
  vm::vsnprintf(buffer, sizeof(buffer), format, a);
  va_end(a);

  if (local::DebugExceptions) {
    fprintf(stderr, "throw %s: %s\n", t->m->types[type]->name, buffer);
  }

  object o = makeThrowable(t, type, detail, buffer);
  if (o) {
    t->exception = o;
  }
}

int32_t throwableDetail(Thread* t, object throwable)
{
  return fieldAtOffset<int32_t>(
      throwable,
      findField(t->m->types[Machine::ThrowableType], "detail")->offset);
}

const char* throwableMessage(Thread* t, object throwable)
{
  object message = fieldAtOffset<object>(
      throwable,
      findField(t->m->types[Machine::ThrowableType], "message")->offset);
  return message ? &arrayElement<char>(t, message, 0) : "";
}

void safepointPoll(Thread* t)
{
  ++t->safepoints;
  if (t->m->pauseRequested and t->m->safepointListener) {
    t->m->safepointListener->atSafepoint(t);
  }
}

void monitorAcquire(Thread* t, object o)
{
  Machine* m = t->m;
  while (true) {
    {
      ACQUIRE_LOCK(m->monitorLock);

      MonitorRecord* r = m->monitors;
      while (r and r->o != o) {
        r = r->next;
      }

      if (r == 0) {
        r = new (allocate(m->system, sizeof(MonitorRecord)))
            MonitorRecord(o, m->monitors);
        m->monitors = r;
      }

      if (r->owner == 0 or r->owner == t) {
        r->owner = t;
        ++r->depth;
        return;
      }
    }

    m->system->yield();
  }
}

bool monitorRelease(Thread* t, object o)
{
  ACQUIRE_LOCK(t->m->monitorLock);

  for (MonitorRecord* r = t->m->monitors; r; r = r->next) {
    if (r->o == o) {
      if (r->owner != t) {
        return false;
      }
      if (--r->depth == 0) {
        r->owner = 0;
      }
      return true;
    }
  }
  return false;
}

bool holdsMonitor(Thread* t, object o)
{
  ACQUIRE_LOCK(t->m->monitorLock);

  for (MonitorRecord* r = t->m->monitors; r; r = r->next) {
    if (r->o == o) {
      return r->owner == t;
    }
  }
  return false;
}

}  // namespace vm
}  // namespace lowering
