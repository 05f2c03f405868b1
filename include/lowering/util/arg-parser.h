/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef LOWERING_UTIL_ARG_PARSER_H
#define LOWERING_UTIL_ARG_PARSER_H

namespace lowering {
namespace util {

class Arg;

// Parses "-name value" pairs and bare "-name" switches into the Args
// registered with it, in registration order.
class ArgParser {
 public:
  ArgParser();

  bool parse(int ac, const char* const* av);
  void printUsage(const char* exe);

 private:
  friend class Arg;

  Arg* find(const char* name);

  Arg* first;
  Arg** last;
};

class Arg {
 public:
  Arg* next;
  bool required;
  const char* name;
  // null for a switch, which takes no value
  const char* desc;
  // null-terminated list of accepted values, or null for any
  const char* const* choices;
  // used when the argument is absent
  const char* defaultValue;

  const char* value;

  Arg(ArgParser& parser, bool required, const char* name, const char* desc);

  Arg(ArgParser& parser,
      const char* name,
      const char* desc,
      const char* const* choices,
      const char* defaultValue);

  bool isSet() const
  {
    return value != 0;
  }

  bool accepts(const char* v) const;
};

}  // namespace util
}  // namespace lowering

#endif  // LOWERING_UTIL_ARG_PARSER_H
