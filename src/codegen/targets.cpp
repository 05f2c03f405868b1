/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <lowering/common.h>
#include <lowering/system/system.h>
#include <lowering/codegen/targets.h>

namespace lowering {
namespace codegen {

Architecture* makeArchitectureNative(vm::System* system)
{
#if (defined ARCH_x86_32) || (defined ARCH_x86_64)
  return makeArchitectureX86(system);
#elif (defined ARCH_arm) || (defined ARCH_arm64)
  return makeArchitectureArm(system);
#else
#error "Unsupported codegen target"
#endif
}

Architecture* makeArchitecture(vm::System* system, const char* name)
{
  if (name == 0 or strcmp(name, "native") == 0) {
    return makeArchitectureNative(system);
  } else if (strcmp(name, "x86") == 0 or strcmp(name, "x86_64") == 0
             or strcmp(name, "i386") == 0) {
    return makeArchitectureX86(system);
  } else if (strcmp(name, "arm") == 0 or strcmp(name, "arm64") == 0
             or strcmp(name, "aarch64") == 0) {
    return makeArchitectureArm(system);
  } else {
    return 0;
  }
}

}  // namespace codegen
}  // namespace lowering
