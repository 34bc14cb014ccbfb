// Copyright (c) 2013-2014 Sandstorm Development Group, Inc. and contributors
// Licensed under the MIT License:
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#pragma once

#include <kj/common.h>
#include <kj/string.h>
#include <inttypes.h>

namespace plank {

#define PLANK_VERSION_MAJOR 0
#define PLANK_VERSION_MINOR 3
#define PLANK_VERSION_MICRO 0

#define PLANK_VERSION \
  (PLANK_VERSION_MAJOR * 1000000 + PLANK_VERSION_MINOR * 1000 + PLANK_VERSION_MICRO)

typedef unsigned int uint;
typedef kj::byte byte;

typedef uint32_t uoffset_t;
// Unsigned offset used for forward references between objects.  Stored at some position P, it
// points at P + value.

typedef int32_t soffset_t;
// Signed offset stored at the start of every table.  The table's vtable lives at
// tablePosition - value.

typedef uint16_t voffset_t;
// Offsets and sizes inside a vtable.

static constexpr uint FILE_IDENTIFIER_LENGTH = 4;
// A buffer may carry a four-byte identifier right after the root offset.

static constexpr uint MAX_ALIGNMENT = 32;

inline constexpr voffset_t slotToVoffset(uint slot) {
  // Byte position within the vtable of the entry for the given field slot.  The first two
  // entries of every vtable hold the vtable's own size and the table's inline size.
  return static_cast<voffset_t>((slot + 2) * sizeof(voffset_t));
}

inline constexpr uint paddingBytes(size_t bufferSize, size_t alignment) {
  // Bytes of padding needed so that an object written at the front of a backward-growing buffer
  // of the given size ends up aligned.  `alignment` must be a power of two.
  return static_cast<uint>((~bufferSize + 1) & (alignment - 1));
}

template <typename T>
class Offset {
  // Position of an object already written to a BufferBuilder, measured in bytes from the *end*
  // of the buffer.  Positions measured from the end stay valid while the buffer keeps growing
  // toward lower addresses.  The type parameter only exists to catch mixups at compile time.

public:
  inline constexpr Offset(): value(0) {}
  inline explicit constexpr Offset(uoffset_t value): value(value) {}

  inline uoffset_t get() const { return value; }
  inline bool isNull() const { return value == 0; }

  template <typename U>
  inline Offset<U> cast() const { return Offset<U>(value); }

private:
  uoffset_t value;
};

struct String;
// Tag type for Offset<String>.

template <typename T>
struct Vector;
// Tag type for Offset<Vector<T>>.

}  // namespace plank
