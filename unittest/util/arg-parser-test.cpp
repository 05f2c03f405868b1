/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <stdio.h>

#include <lowering/common.h>
#include <lowering/util/arg-parser.h>

#include "test-harness.h"

using namespace lowering::util;

namespace {

const char* const heaps[] = {"tlab", "cards", "tagging", 0};

}  // namespace

TEST(ArgParser)
{
  {
    ArgParser parser;
    Arg arg1(parser, false, "arg1", "<value>");
    Arg required2(parser, true, "required2", "<value>");
    const char* args[]
        = {"myExecutable", "-arg1", "myValue1", "-required2", "myRequired2", 0};
    assertTrue(parser.parse(sizeof(args) / sizeof(char*) - 1, args));
    assertEqual("myValue1", arg1.value);
    assertEqual("myRequired2", required2.value);
  }

  {
    ArgParser parser;
    Arg arg1(parser, false, "arg1", "<value>");
    Arg required2(parser, true, "required2", "<value>");
    const char* args[] = {"myExecutable", "-arg1", "myValue1", "-required2", 0};
    assertFalse(parser.parse(sizeof(args) / sizeof(char*) - 1, args));
  }

  {
    ArgParser parser;
    Arg arg1(parser, false, "arg1", "<value>");
    Arg required2(parser, true, "required2", "<value>");
    const char* args[] = {"myExecutable", "-arg1", "myValue1", 0};
    assertFalse(parser.parse(sizeof(args) / sizeof(char*) - 1, args));
  }

  {
    ArgParser parser;
    Arg arg1(parser, false, "arg1", "<value>");
    const char* args[] = {"myExecutable", "-arg1", "a", "-arg1", "b", 0};
    assertFalse(parser.parse(sizeof(args) / sizeof(char*) - 1, args));
  }

  {
    ArgParser parser;
    Arg arg1(parser, false, "arg1", "<value>");
    const char* args[] = {"myExecutable", "-unknown", "a", 0};
    assertFalse(parser.parse(sizeof(args) / sizeof(char*) - 1, args));
  }
}

TEST(ArgParserSwitches)
{
  ArgParser parser;
  Arg verbose(parser, false, "verbose", 0);
  Arg quiet(parser, false, "quiet", 0);
  const char* args[] = {"myExecutable", "-verbose", 0};
  assertTrue(parser.parse(sizeof(args) / sizeof(char*) - 1, args));
  assertTrue(verbose.isSet());
  assertEqual("true", verbose.value);
  assertFalse(quiet.isSet());
}

TEST(ArgParserChoices)
{
  {
    ArgParser parser;
    Arg heap(parser, "heap", "<scheme>", heaps, "tlab");
    const char* args[] = {"myExecutable", "-heap", "cards", 0};
    assertTrue(parser.parse(sizeof(args) / sizeof(char*) - 1, args));
    assertEqual("cards", heap.value);
  }

  {
    ArgParser parser;
    Arg heap(parser, "heap", "<scheme>", heaps, "tlab");
    const char* args[] = {"myExecutable", 0};
    assertTrue(parser.parse(sizeof(args) / sizeof(char*) - 1, args));
    assertEqual("tlab", heap.value);
  }

  {
    ArgParser parser;
    Arg heap(parser, "heap", "<scheme>", heaps, "tlab");
    const char* args[] = {"myExecutable", "-heap", "generational", 0};
    assertFalse(parser.parse(sizeof(args) / sizeof(char*) - 1, args));
  }

  {
    ArgParser parser;
    Arg heap(parser, "heap", "<scheme>", heaps, "tlab");
    Arg any(parser, false, "any", "<value>");
    assertTrue(heap.accepts("tagging"));
    assertFalse(heap.accepts("Tagging"));
    assertTrue(any.accepts("whatever"));
  }
}
