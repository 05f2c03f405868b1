/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

TEMPLATE_OP(Mov)
TEMPLATE_OP(Add)
TEMPLATE_OP(Sub)
TEMPLATE_OP(Mod)
TEMPLATE_OP(And)
TEMPLATE_OP(Shr)
TEMPLATE_OP(Lea)
TEMPLATE_OP(PointerLoad)
TEMPLATE_OP(PointerStore)
TEMPLATE_OP(Jmp)
TEMPLATE_OP(Jeq)
TEMPLATE_OP(Jneq)
TEMPLATE_OP(Jgt)
TEMPLATE_OP(Jgteq)
TEMPLATE_OP(Jlt)
TEMPLATE_OP(Jlteq)
TEMPLATE_OP(Jugteq)
TEMPLATE_OP(CallStub)
TEMPLATE_OP(CallRuntime)
TEMPLATE_OP(NullCheck)
TEMPLATE_OP(Safepoint)
TEMPLATE_OP(Here)
TEMPLATE_OP(PushFrame)
TEMPLATE_OP(PopFrame)
TEMPLATE_OP(StackOverflowCheck)
TEMPLATE_OP(Deoptimize)
TEMPLATE_OP(ShouldNotReachHere)
