/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include "sys/types.h"
#include "sys/time.h"
#include "time.h"
#include "pthread.h"
#include "sched.h"

#include <lowering/system/system.h>

#define ACQUIRE(x) ::MutexResource MAKE_NAME(mutexResource_)(x)

using namespace lowering::vm;
using namespace lowering::util;

namespace {

class MutexResource {
 public:
  MutexResource(pthread_mutex_t& m) : m(&m)
  {
    pthread_mutex_lock(&m);
  }

  ~MutexResource()
  {
    pthread_mutex_unlock(m);
  }

 private:
  pthread_mutex_t* m;
};

const bool Verbose = false;

void* run(void* r)
{
  static_cast<System::Runnable*>(r)->run();
  return 0;
}

class MySystem : public System {
 public:
  class Thread : public System::Thread {
   public:
    Thread(System* s, System::Runnable* r) : s(s), r(r), joined(false)
    {
      pthread_mutex_init(&mutex, 0);
    }

    virtual void join()
    {
      {
        ACQUIRE(mutex);
        expect(s, not joined);
        joined = true;
      }

      int rv UNUSED = pthread_join(thread, 0);
      expect(s, rv == 0);
    }

    virtual void dispose()
    {
      pthread_mutex_destroy(&mutex);
      ::free(this);
    }

    pthread_t thread;
    pthread_mutex_t mutex;
    System* s;
    System::Runnable* r;
    bool joined;
  };

  class Mutex : public System::Mutex {
   public:
    Mutex(System* s) : s(s)
    {
      pthread_mutex_init(&mutex, 0);
    }

    virtual void acquire()
    {
      pthread_mutex_lock(&mutex);
    }

    virtual void release()
    {
      pthread_mutex_unlock(&mutex);
    }

    virtual void dispose()
    {
      pthread_mutex_destroy(&mutex);
      ::free(this);
    }

    System* s;
    pthread_mutex_t mutex;
  };

  virtual void* tryAllocate(size_t sizeInBytes)
  {
    return malloc(sizeInBytes);
  }

  virtual void free(const void* p)
  {
    if (p)
      ::free(const_cast<void*>(p));
  }

  virtual bool success(Status s)
  {
    return s == 0;
  }

  virtual Status start(Runnable* r)
  {
    Thread* t = new (allocate(this, sizeof(Thread))) Thread(this, r);
    r->attach(t);
    int rv UNUSED = pthread_create(&(t->thread), 0, run, r);
    expect(this, rv == 0);

    if (Verbose) {
      fprintf(stderr, "started thread %p\n", t);
    }
    return 0;
  }

  virtual Status make(System::Mutex** m)
  {
    *m = new (allocate(this, sizeof(Mutex))) Mutex(this);
    return 0;
  }

  virtual int64_t now()
  {
    timeval tv = {0, 0};
    gettimeofday(&tv, 0);
    return (static_cast<int64_t>(tv.tv_sec) * 1000)
           + (static_cast<int64_t>(tv.tv_usec) / 1000);
  }

  virtual void yield()
  {
    sched_yield();
  }

  virtual void abort()
  {
    fflush(stdout);
    fflush(stderr);
    ::abort();
  }

  virtual void dispose()
  {
    ::free(this);
  }
};

}  // namespace

namespace lowering {
namespace vm {

LOWERING_EXPORT System* makeSystem()
{
  return new (malloc(sizeof(MySystem))) MySystem();
}

}  // namespace vm
}  // namespace lowering
