/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef LOWERING_SYSTEM_SYSTEM_H
#define LOWERING_SYSTEM_SYSTEM_H

#include <lowering/common.h>
#include <lowering/util/allocator.h>
#include <lowering/util/abort.h>

namespace lowering {
namespace vm {

class System : public util::Aborter {
 public:
  typedef intptr_t Status;

  class Thread {
   public:
    virtual void join() = 0;
    virtual void dispose() = 0;
  };

  class Runnable {
   public:
    virtual void attach(Thread*) = 0;
    virtual void run() = 0;
  };

  class Mutex {
   public:
    virtual void acquire() = 0;
    virtual void release() = 0;
    virtual void dispose() = 0;
  };

  class MutexResource {
   public:
    MutexResource(System::Mutex* m) : m(m)
    {
      m->acquire();
    }

    ~MutexResource()
    {
      m->release();
    }

   private:
    System::Mutex* m;
  };

  virtual bool success(Status) = 0;
  virtual void* tryAllocate(size_t sizeInBytes) = 0;
  virtual void free(const void* p) = 0;
  virtual Status start(Runnable*) = 0;
  virtual Status make(Mutex**) = 0;
  virtual int64_t now() = 0;
  virtual void yield() = 0;
  virtual void dispose() = 0;
};

inline void* allocate(System* s, size_t size)
{
  void* p = s->tryAllocate(size);
  if (p == 0)
    s->abort();
  return p;
}

#define ACQUIRE_LOCK(m) \
  System::MutexResource MAKE_NAME(mutexResource_)(m)

inline util::Aborter* getAborter(System* s)
{
  return s;
}

// Allocator backed directly by the system heap, for zones and other
// build-phase storage.
class SystemAllocator : public util::Allocator {
 public:
  SystemAllocator(System* s) : s(s)
  {
  }

  virtual void* tryAllocate(size_t size)
  {
    return s->tryAllocate(size);
  }

  virtual void* allocate(size_t size)
  {
    return vm::allocate(s, size);
  }

  virtual void free(const void* p, size_t)
  {
    s->free(p);
  }

  System* s;
};

LOWERING_EXPORT System* makeSystem();

}  // namespace vm
}  // namespace lowering

#endif  // LOWERING_SYSTEM_SYSTEM_H
