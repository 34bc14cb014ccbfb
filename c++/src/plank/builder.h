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

#include "common.h"
#include "endian.h"
#include <kj/array.h>
#include <kj/vector.h>
#include <kj/debug.h>
#include <type_traits>
#include <unordered_map>

namespace plank {

struct BuilderOptions {
  // Options controlling how buffers are built.

  size_t initialCapacity = 1024;
  // Bytes allocated up front.  The buffer doubles whenever it runs out of room.

  bool forceDefaults = false;
  // Write scalar fields even when they equal their declared default.  Normally such fields are
  // left out of the table entirely (their vtable entry is zero) and readers substitute the
  // default.

  bool dedupVtables = true;
  // Share a single vtable among all tables that have exactly the same vtable bytes.
};

class BufferBuilder {
  // Builds a FlatBuffers-format buffer.
  //
  // The buffer grows from its high end toward its low end: every new object is placed in front
  // of everything written so far, so objects written earlier sit at higher addresses and can be
  // referred to with forward offsets.  Positions are therefore reported as distances from the
  // end of the buffer (see Offset<T>), which stay valid across reallocation.
  //
  // Objects must be written children-first: strings, vectors and sub-tables before the table
  // that refers to them, and the root table last.  Only one table or vector may be under
  // construction at a time.

public:
  explicit BufferBuilder(BuilderOptions options = BuilderOptions());
  KJ_DISALLOW_COPY(BufferBuilder);
  ~BufferBuilder() noexcept(false);

  inline uoffset_t getSize() const { return used; }
  // Number of bytes written so far.

  void clear();
  // Discard everything, keeping the allocated space.

  // ---------------------------------------------------------------------------------------------
  // Strings and vectors

  Offset<String> createString(kj::StringPtr text);
  // Wire layout: u32 byte count, the bytes, one NUL (not counted), padding.

  template <typename T>
  Offset<Vector<T>> createVector(kj::ArrayPtr<const T> elements);
  // Vector of scalars or enums.

  template <typename T>
  Offset<Vector<T>> createVectorOfStructs(kj::ArrayPtr<const T> elements);
  // Vector of fixed-layout structs, stored inline and tightly packed.

  template <typename T>
  Offset<Vector<Offset<T>>> createVectorOfOffsets(kj::ArrayPtr<const Offset<T>> elements);
  // Vector of strings, tables or vectors, stored as forward offsets.

  Offset<Vector<Offset<String>>> createVectorOfStrings(kj::ArrayPtr<const kj::StringPtr> strings);

  void startVector(size_t count, size_t elementSize, size_t alignment);
  uoffset_t endVector(size_t count);
  // Low-level vector construction.  Between the two calls, push exactly `count` elements of
  // `elementSize` bytes each, *last element first*.

  // ---------------------------------------------------------------------------------------------
  // Tables
  //
  // Fields are identified by the position of their entry within the vtable (see slotToVoffset()).

  uoffset_t startTable();

  template <typename T>
  void addScalar(voffset_t field, T value, T defaultValue);
  // Writes the field unless it equals `defaultValue` (and forceDefaults is off).

  template <typename T>
  void addOffset(voffset_t field, Offset<T> target);
  // Writes a forward reference to an object written earlier.  A null offset writes nothing.

  template <typename T>
  void addStruct(voffset_t field, const T& value);
  // Copies a fixed-layout struct inline into the table.

  uoffset_t endTable(uoffset_t start);
  // Writes the table's vtable (or reuses an identical existing one) and returns the table's
  // position.

  void requireField(uoffset_t table, voffset_t field, kj::StringPtr fieldName);
  // Throws if the given field of a finished table is absent.

  // ---------------------------------------------------------------------------------------------
  // Finishing

  template <typename T>
  inline void finish(Offset<T> root, kj::Maybe<kj::StringPtr> fileIdentifier = nullptr) {
    finishImpl(root.get(), fileIdentifier);
  }
  // Writes the root offset (and optional 4-byte file identifier) at the start of the buffer.

  kj::ArrayPtr<const byte> getBuffer() const;
  // The finished buffer.  Valid until the builder is modified or destroyed.

  kj::Array<byte> releaseBuffer();
  // Copies the finished buffer out and resets the builder.

  // ---------------------------------------------------------------------------------------------
  // Primitives used by the methods above and by generated code.

  void pad(size_t count);
  void align(size_t alignment);
  void preAlign(size_t length, size_t alignment);
  // Pad so that after `length` more bytes are written the front is aligned.

  void pushBytes(kj::ArrayPtr<const byte> bytes);

  template <typename T>
  uoffset_t pushScalar(T value);

  uoffset_t pushOffset(uoffset_t target);
  // Pushes a uoffset referring to the object at position `target`.

private:
  struct FieldLocation {
    uoffset_t position;
    voffset_t field;
  };

  BuilderOptions options;
  kj::Array<byte> buffer;
  size_t used = 0;
  size_t minAlign = 1;
  bool nested = false;
  bool finished = false;

  kj::Vector<FieldLocation> fieldLocations;
  voffset_t maxVoffset = 0;
  // Fields of the table under construction.

  std::unordered_multimap<uint64_t, uoffset_t> vtables;
  // Content-addressed cache of vtables written so far: hash of the vtable bytes to the vtable's
  // position.  Hash hits are confirmed by comparing bytes.

  inline byte* front() { return buffer.end() - used; }
  inline byte* at(uoffset_t position) { return buffer.end() - position; }
  inline const byte* at(uoffset_t position) const { return buffer.end() - position; }

  void reserve(size_t bytes);
  byte* allocate(size_t bytes);
  void trackField(voffset_t field, uoffset_t position);
  void requireNotNested();
  void finishImpl(uoffset_t root, kj::Maybe<kj::StringPtr> fileIdentifier);
};

// =======================================================================================
// inline implementation details

namespace _ {  // private

template <typename T>
inline bool sameScalar(T a, T b) { return a == b; }
inline bool sameScalar(float a, float b) { return a == b || (a != a && b != b); }
inline bool sameScalar(double a, double b) { return a == b || (a != a && b != b); }
// NaN defaults compare equal to NaN values.

}  // namespace _ (private)

template <typename T>
uoffset_t BufferBuilder::pushScalar(T value) {
  static_assert(std::is_arithmetic<T>::value || std::is_enum<T>::value, "not a scalar");
  align(sizeof(T));
  storeWire<T>(allocate(sizeof(T)), value);
  return getSize();
}

template <typename T>
void BufferBuilder::addScalar(voffset_t field, T value, T defaultValue) {
  if (!options.forceDefaults && _::sameScalar(value, defaultValue)) return;
  trackField(field, pushScalar(value));
}

template <typename T>
void BufferBuilder::addOffset(voffset_t field, Offset<T> target) {
  if (target.isNull()) return;
  trackField(field, pushOffset(target.get()));
}

template <typename T>
void BufferBuilder::addStruct(voffset_t field, const T& value) {
  static_assert(std::is_trivially_copyable<T>::value, "structs must be trivially copyable");
  align(alignof(T));
  pushBytes(kj::arrayPtr(reinterpret_cast<const byte*>(&value), sizeof(T)));
  trackField(field, getSize());
}

template <typename T>
Offset<Vector<T>> BufferBuilder::createVector(kj::ArrayPtr<const T> elements) {
  static_assert(std::is_arithmetic<T>::value || std::is_enum<T>::value,
                "use createVectorOfStructs() or createVectorOfOffsets()");
  startVector(elements.size(), sizeof(T), sizeof(T));
  for (size_t i = elements.size(); i > 0; --i) {
    pushScalar<T>(elements[i - 1]);
  }
  return Offset<Vector<T>>(endVector(elements.size()));
}

template <typename T>
Offset<Vector<T>> BufferBuilder::createVectorOfStructs(kj::ArrayPtr<const T> elements) {
  static_assert(std::is_trivially_copyable<T>::value, "structs must be trivially copyable");
  startVector(elements.size(), sizeof(T), alignof(T));
  pushBytes(kj::arrayPtr(reinterpret_cast<const byte*>(elements.begin()),
                         elements.size() * sizeof(T)));
  return Offset<Vector<T>>(endVector(elements.size()));
}

template <typename T>
Offset<Vector<Offset<T>>> BufferBuilder::createVectorOfOffsets(
    kj::ArrayPtr<const Offset<T>> elements) {
  startVector(elements.size(), sizeof(uoffset_t), sizeof(uoffset_t));
  for (size_t i = elements.size(); i > 0; --i) {
    KJ_REQUIRE(!elements[i - 1].isNull(), "vectors can't contain null offsets", i - 1);
    pushOffset(elements[i - 1].get());
  }
  return Offset<Vector<Offset<T>>>(endVector(elements.size()));
}

}  // namespace plank
