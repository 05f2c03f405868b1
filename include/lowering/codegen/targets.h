/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef LOWERING_CODEGEN_TARGETS_H
#define LOWERING_CODEGEN_TARGETS_H

namespace lowering {

namespace vm {
class System;
}

namespace codegen {

class Architecture;

Architecture* makeArchitectureNative(vm::System* system);

Architecture* makeArchitectureX86(vm::System* system);
Architecture* makeArchitectureArm(vm::System* system);

// returns null if the name matches no supported family
Architecture* makeArchitecture(vm::System* system, const char* name);

}  // namespace codegen
}  // namespace lowering

#endif  // LOWERING_CODEGEN_TARGETS_H
