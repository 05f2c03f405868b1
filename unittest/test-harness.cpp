/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <stdio.h>

#include "test-harness.h"

Test* Test::first = 0;
Test** Test::last = &first;

Test::Test(const char* name) : next(0), failures(0), runs(0), name(name)
{
  *last = this;
  last = &next;
}

bool Test::runAll(const char* filter)
{
  int failures = 0;
  int runs = 0;
  for (Test* t = Test::first; t; t = t->next) {
    if (filter and strncmp(t->name, filter, strlen(filter)) != 0) {
      continue;
    }

    printf("%32s: ", t->name);
    fflush(stdout);
    t->run();
    failures += t->failures;
    runs += t->runs;
    if (t->failures > 0) {
      printf("failure\n");
    } else {
      printf("success\n");
    }
  }
  printf("%d assertions, %d failed\n", runs, failures);
  return failures == 0;
}

int main(int argc, char** argv)
{
  if (Test::runAll(argc > 1 ? argv[1] : 0)) {
    return 0;
  }
  return 1;
}
