/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#include <stdio.h>
#include <string.h>

#include <lowering/common.h>
#include <lowering/util/arg-parser.h>

namespace lowering {
namespace util {

Arg::Arg(ArgParser& parser, bool required, const char* name, const char* desc)
    : next(0),
      required(required),
      name(name),
      desc(desc),
      choices(0),
      defaultValue(0),
      value(0)
{
  *parser.last = this;
  parser.last = &next;
}

Arg::Arg(ArgParser& parser,
         const char* name,
         const char* desc,
         const char* const* choices,
         const char* defaultValue)
    : next(0),
      required(false),
      name(name),
      desc(desc),
      choices(choices),
      defaultValue(defaultValue),
      value(0)
{
  *parser.last = this;
  parser.last = &next;
}

bool Arg::accepts(const char* v) const
{
  if (choices == 0) {
    return true;
  }

  for (const char* const* c = choices; *c; ++c) {
    if (strcmp(*c, v) == 0) {
      return true;
    }
  }
  return false;
}

ArgParser::ArgParser() : first(0), last(&first)
{
}

Arg* ArgParser::find(const char* name)
{
  for (Arg* arg = first; arg; arg = arg->next) {
    if (strcmp(arg->name, name) == 0) {
      return arg;
    }
  }
  return 0;
}

bool ArgParser::parse(int ac, const char* const* av)
{
  Arg* state = 0;

  for (int i = 1; i < ac; i++) {
    if (state) {
      if (state->value) {
        fprintf(stderr,
                "duplicate parameter %s: '%s' and '%s'\n",
                state->name,
                state->value,
                av[i]);
        return false;
      }
      if (not state->accepts(av[i])) {
        fprintf(stderr, "unsupported %s '%s'\n", state->name, av[i]);
        return false;
      }
      state->value = av[i];
      state = 0;
    } else {
      if (av[i][0] != '-') {
        fprintf(stderr, "expected -parameter\n");
        return false;
      }

      Arg* arg = find(&av[i][1]);
      if (arg == 0) {
        fprintf(stderr, "unrecognized parameter %s\n", av[i]);
        return false;
      }

      if (arg->desc == 0) {
        arg->value = "true";
      } else {
        state = arg;
      }
    }
  }

  if (state) {
    fprintf(stderr, "expected argument after -%s\n", state->name);
    return false;
  }

  for (Arg* arg = first; arg; arg = arg->next) {
    if (arg->required and arg->value == 0) {
      fprintf(stderr, "expected value for %s\n", arg->name);
      return false;
    }
    if (arg->value == 0) {
      arg->value = arg->defaultValue;
    }
  }

  return true;
}

void ArgParser::printUsage(const char* exe)
{
  fprintf(stderr, "usage:\n%s \\\n", exe);
  for (Arg* arg = first; arg; arg = arg->next) {
    const char* lineEnd = arg->next ? " \\" : "";
    if (arg->required) {
      fprintf(stderr, "  -%s\t%s%s\n", arg->name, arg->desc, lineEnd);
    } else if (arg->choices) {
      fprintf(stderr, "  [-%s\t", arg->name);
      for (const char* const* c = arg->choices; *c; ++c) {
        fprintf(stderr, "%s%s", c == arg->choices ? "" : "|", *c);
      }
      fprintf(stderr, "]%s\n", lineEnd);
    } else if (arg->desc) {
      fprintf(stderr, "  [-%s\t%s]%s\n", arg->name, arg->desc, lineEnd);
    } else {
      fprintf(stderr, "  [-%s]%s\n", arg->name, lineEnd);
    }
  }
}

}  // namespace util
}  // namespace lowering
