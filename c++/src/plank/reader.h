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
#include <kj/debug.h>
#include <type_traits>

namespace plank {

template <typename T>
class VectorReader;

class TableReader {
  // Zero-copy view of one table inside a buffer.  All reads are bounds-checked against the
  // buffer; a malformed buffer results in an exception rather than a wild read.
  //
  // A default-constructed TableReader is a "null" table in which every field is absent, so
  // every accessor returns its default.  Generated code hands these out for absent sub-tables.

public:
  TableReader() = default;
  TableReader(kj::ArrayPtr<const byte> buffer, uoffset_t position);
  // `position` is the byte offset of the table (i.e. of its soffset) within `buffer`.

  inline bool isNull() const { return buffer == nullptr; }

  voffset_t getFieldOffset(voffset_t field) const;
  // Byte offset of the field within the table, or zero if the field is absent.

  inline bool hasField(voffset_t field) const { return getFieldOffset(field) != 0; }

  template <typename T>
  T getScalar(voffset_t field, T defaultValue) const;

  template <typename T>
  T getStruct(voffset_t field) const;
  // Copies out a fixed-layout struct.  Absent structs read as all zeros.

  kj::StringPtr getString(voffset_t field) const;
  // Absent strings read as "".

  TableReader getTable(voffset_t field) const;
  // Absent tables read as a null TableReader.

  template <typename T>
  VectorReader<T> getVector(voffset_t field) const;

  inline kj::ArrayPtr<const byte> getBuffer() const { return buffer; }
  inline uoffset_t getPosition() const { return position; }

private:
  kj::ArrayPtr<const byte> buffer;
  uoffset_t position = 0;
  uoffset_t vtable = 0;
  voffset_t vtableSize = 0;
  voffset_t tableSize = 0;

  uoffset_t fieldPosition(voffset_t offsetInTable, size_t size) const;
  // Position within the buffer of a field found at the given offset, checked against the
  // table's inline size.
  uoffset_t followField(voffset_t offsetInTable) const;
  // Follows the uoffset stored in a field.
};

namespace _ {  // private

uoffset_t followOffset(kj::ArrayPtr<const byte> buffer, uoffset_t position);
// Reads the uoffset at `position` and returns the position it refers to.

kj::StringPtr readString(kj::ArrayPtr<const byte> buffer, uoffset_t position);
// Reads the string object at `position`.

enum class ElementKind: uint8_t {
  SCALAR,
  STRING,
  TABLE,
  STRUCT
};

template <typename T>
struct ElementKindOf {
  static constexpr ElementKind value =
      std::is_arithmetic<T>::value || std::is_enum<T>::value ? ElementKind::SCALAR :
      std::is_constructible<T, TableReader>::value ? ElementKind::TABLE :
      ElementKind::STRUCT;
};

template <>
struct ElementKindOf<kj::StringPtr> {
  static constexpr ElementKind value = ElementKind::STRING;
};

template <typename T, ElementKind kind = ElementKindOf<T>::value>
struct Element;

template <typename T>
struct Element<T, ElementKind::SCALAR> {
  static constexpr size_t SIZE = sizeof(T);
  static inline T read(kj::ArrayPtr<const byte> buffer, uoffset_t position) {
    return loadWire<T>(buffer.begin() + position);
  }
};

template <>
struct Element<kj::StringPtr, ElementKind::STRING> {
  static constexpr size_t SIZE = sizeof(uoffset_t);
  static inline kj::StringPtr read(kj::ArrayPtr<const byte> buffer, uoffset_t position) {
    return readString(buffer, followOffset(buffer, position));
  }
};

template <typename T>
struct Element<T, ElementKind::TABLE> {
  static constexpr size_t SIZE = sizeof(uoffset_t);
  static inline T read(kj::ArrayPtr<const byte> buffer, uoffset_t position) {
    return T(TableReader(buffer, followOffset(buffer, position)));
  }
};

template <typename T>
struct Element<T, ElementKind::STRUCT> {
  static_assert(std::is_trivially_copyable<T>::value, "structs must be trivially copyable");
  static constexpr size_t SIZE = sizeof(T);
  static inline T read(kj::ArrayPtr<const byte> buffer, uoffset_t position) {
    T result;
    memcpy(&result, buffer.begin() + position, sizeof(T));
    return result;
  }
};

template <typename Container, typename Element>
class IndexingIterator {
public:
  IndexingIterator() = default;

  inline Element operator*() const { return (*container)[index]; }
  inline IndexingIterator& operator++() { ++index; return *this; }
  inline IndexingIterator operator++(int) { IndexingIterator other = *this; ++index; return other; }

  inline bool operator==(const IndexingIterator& other) const { return index == other.index; }
  inline bool operator!=(const IndexingIterator& other) const { return index != other.index; }

private:
  const Container* container;
  uint index;

  friend Container;
  inline IndexingIterator(const Container* container, uint index)
      : container(container), index(index) {}
};

}  // namespace _ (private)

template <typename T>
class VectorReader {
  // Zero-copy view of a vector.  `T` is a scalar or enum type, kj::StringPtr for vectors of
  // strings, a generated `Foo::Reader` for vectors of tables, or a generated struct class.

public:
  VectorReader() = default;
  VectorReader(kj::ArrayPtr<const byte> buffer, uoffset_t position)
      : buffer(buffer), start(position + sizeof(uoffset_t)) {
    KJ_REQUIRE(uint64_t(position) + sizeof(uoffset_t) <= buffer.size(),
               "vector out of bounds") { return; }
    uint32_t declared = loadWire<uint32_t>(buffer.begin() + position);
    KJ_REQUIRE(uint64_t(start) + uint64_t(declared) * _::Element<T>::SIZE <= buffer.size(),
               "vector elements out of bounds", declared) { return; }
    count = declared;
  }

  inline uint size() const { return count; }

  inline T operator[](uint index) const {
    KJ_REQUIRE(index < count, "vector index out of range", index, count);
    return _::Element<T>::read(buffer, start + index * _::Element<T>::SIZE);
  }

  typedef _::IndexingIterator<VectorReader<T>, T> Iterator;
  inline Iterator begin() const { return Iterator(this, 0); }
  inline Iterator end() const { return Iterator(this, count); }

private:
  kj::ArrayPtr<const byte> buffer;
  uoffset_t start = 0;
  uint count = 0;
};

TableReader readRoot(kj::ArrayPtr<const byte> buffer);
// Returns the root table of a finished buffer.

bool bufferHasIdentifier(kj::ArrayPtr<const byte> buffer, kj::StringPtr identifier);
// Checks the four bytes following the root offset.

// =======================================================================================
// inline implementation details

template <typename T>
T TableReader::getScalar(voffset_t field, T defaultValue) const {
  voffset_t offset = getFieldOffset(field);
  if (offset == 0) return defaultValue;
  return loadWire<T>(buffer.begin() + fieldPosition(offset, sizeof(T)));
}

template <typename T>
T TableReader::getStruct(voffset_t field) const {
  static_assert(std::is_trivially_copyable<T>::value, "structs must be trivially copyable");
  voffset_t offset = getFieldOffset(field);
  if (offset == 0) return T();
  T result;
  memcpy(&result, buffer.begin() + fieldPosition(offset, sizeof(T)), sizeof(T));
  return result;
}

template <typename T>
VectorReader<T> TableReader::getVector(voffset_t field) const {
  voffset_t offset = getFieldOffset(field);
  if (offset == 0) return VectorReader<T>();
  return VectorReader<T>(buffer, followField(offset));
}

}  // namespace plank
