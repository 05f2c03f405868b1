/* Copyright (c) 2008-2015, Avian Contributors

   Permission to use, copy, modify, and/or distribute this software
   for any purpose with or without fee is hereby granted, provided
   that the above copyright notice and this permission notice appear
   in all copies.

   There is NO WARRANTY for this software.  See license.txt for
   details. */

#ifndef LOWERING_VM_LAYOUT_H
#define LOWERING_VM_LAYOUT_H

#include <lowering/common.h>

namespace lowering {
namespace vm {

typedef void* object;

// Words of a hub's body, following the two-word array header.  The
// vtable starts at HubFirstWordIndex, followed by the itable and then
// the mtable (an int array).
enum HubWord {
  HubComponentHub,
  HubTupleSize,
  HubMTableStartIndex,
  HubMTableLength,
  HubType,
  HubFirstWordIndex
};

// Object layout for a given word size: every object starts with its
// hub, followed by a misc word which arrays (and hybrids) use for
// their length.
class Layout {
 public:
  explicit Layout(unsigned wordSize) : wordSize(wordSize)
  {
  }

  unsigned hubOffset() const
  {
    return 0;
  }

  unsigned arrayLengthOffset() const
  {
    return wordSize;
  }

  unsigned headerSize() const
  {
    return 2 * wordSize;
  }

  unsigned firstElementOffset() const
  {
    return headerSize();
  }

  unsigned hubWordOffset(unsigned index) const
  {
    return headerSize() + index * wordSize;
  }

  unsigned componentHubOffset() const
  {
    return hubWordOffset(HubComponentHub);
  }

  unsigned tupleSizeOffset() const
  {
    return hubWordOffset(HubTupleSize);
  }

  unsigned mTableStartIndexOffset() const
  {
    return hubWordOffset(HubMTableStartIndex);
  }

  unsigned mTableLengthOffset() const
  {
    return hubWordOffset(HubMTableLength);
  }

  unsigned typeOffset() const
  {
    return hubWordOffset(HubType);
  }

  // byte offset from a hub of the vtable entry with the given word index
  unsigned vtableOffset(unsigned vtableIndex) const
  {
    return vtableIndex * wordSize + headerSize();
  }

  unsigned wordSize;
};

}  // namespace vm
}  // namespace lowering

#endif  // LOWERING_VM_LAYOUT_H
