/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef LOWERING_VM_ARCH_H
#define LOWERING_VM_ARCH_H

#include <lowering/common.h>

namespace lowering {
namespace vm {

inline void compileTimeMemoryBarrier()
{
  __asm__ __volatile__("" : : : "memory");
}

#if (defined ARCH_x86_32) || (defined ARCH_x86_64)

inline void programOrderMemoryBarrier()
{
  compileTimeMemoryBarrier();
}

inline void storeStoreMemoryBarrier()
{
  programOrderMemoryBarrier();
}

inline void storeLoadMemoryBarrier()
{
#ifdef ARCH_x86_32
  __asm__ __volatile__("lock; addl $0,0(%%esp)" : : : "memory");
#else
  __asm__ __volatile__("mfence" : : : "memory");
#endif
}

inline void loadMemoryBarrier()
{
  programOrderMemoryBarrier();
}

#else

// DMB SY everywhere for now
inline void memoryBarrier()
{
  __sync_synchronize();
}

inline void storeStoreMemoryBarrier()
{
  memoryBarrier();
}

inline void storeLoadMemoryBarrier()
{
  memoryBarrier();
}

inline void loadMemoryBarrier()
{
  memoryBarrier();
}

#endif

inline bool atomicCompareAndSwap32(uint32_t* p, uint32_t old, uint32_t new_)
{
  return __sync_bool_compare_and_swap(p, old, new_);
}

inline bool atomicCompareAndSwap64(uint64_t* p, uint64_t old, uint64_t new_)
{
  return __sync_bool_compare_and_swap(p, old, new_);
}

inline bool atomicCompareAndSwap(uintptr_t* p, uintptr_t old, uintptr_t new_)
{
#if (defined ARCH_x86_64) || (defined ARCH_arm64)
  return atomicCompareAndSwap64(reinterpret_cast<uint64_t*>(p), old, new_);
#else
  return atomicCompareAndSwap32(reinterpret_cast<uint32_t*>(p), old, new_);
#endif
}

inline void atomicAdd(uint32_t* p, uint32_t v)
{
  for (uint32_t old = *p; not atomicCompareAndSwap32(p, old, old + v);
       old = *p) {
  }
}

}  // namespace vm
}  // namespace lowering

#endif  // LOWERING_VM_ARCH_H
