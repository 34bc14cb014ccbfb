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

#include "builder.h"
#include <string.h>

namespace plank {

namespace {

static constexpr size_t MAX_BUFFER_SIZE = 0x7fffffff;
// Offsets are 32-bit and soffsets signed, so buffers are limited to 2GB.

uint64_t hashBytes(const byte* bytes, size_t size) {
  // FNV-1a.
  uint64_t hash = 14695981039346656037ull;
  for (size_t i = 0; i < size; i++) {
    hash ^= bytes[i];
    hash *= 1099511628211ull;
  }
  return hash;
}

}  // namespace

BufferBuilder::BufferBuilder(BuilderOptions options)
    : options(options), buffer(kj::heapArray<byte>(kj::max(options.initialCapacity, size_t(64)))) {}

BufferBuilder::~BufferBuilder() noexcept(false) {}

void BufferBuilder::clear() {
  used = 0;
  minAlign = 1;
  nested = false;
  finished = false;
  fieldLocations.clear();
  maxVoffset = 0;
  vtables.clear();
}

void BufferBuilder::reserve(size_t bytes) {
  if (buffer.size() - used >= bytes) return;

  KJ_REQUIRE(used + bytes <= MAX_BUFFER_SIZE, "buffer would exceed 2GB", used, bytes);
  size_t newSize = kj::max(buffer.size() * 2, used + bytes);
  newSize = kj::min(newSize, MAX_BUFFER_SIZE);

  auto newBuffer = kj::heapArray<byte>(newSize);
  memcpy(newBuffer.end() - used, buffer.end() - used, used);
  buffer = kj::mv(newBuffer);
}

byte* BufferBuilder::allocate(size_t bytes) {
  reserve(bytes);
  used += bytes;
  return front();
}

void BufferBuilder::pad(size_t count) {
  if (count == 0) return;
  memset(allocate(count), 0, count);
}

void BufferBuilder::align(size_t alignment) {
  if (alignment > minAlign) minAlign = alignment;
  pad(paddingBytes(used, alignment));
}

void BufferBuilder::preAlign(size_t length, size_t alignment) {
  if (alignment > minAlign) minAlign = alignment;
  pad(paddingBytes(used + length, alignment));
}

void BufferBuilder::pushBytes(kj::ArrayPtr<const byte> bytes) {
  if (bytes.size() == 0) return;
  memcpy(allocate(bytes.size()), bytes.begin(), bytes.size());
}

uoffset_t BufferBuilder::pushOffset(uoffset_t target) {
  align(sizeof(uoffset_t));
  KJ_REQUIRE(target <= getSize(), "offset refers to an object that hasn't been written yet");
  // The stored value is the distance from the offset field itself (which will sit at position
  // getSize() + 4) forward to the target.
  return pushScalar<uoffset_t>(getSize() - target + sizeof(uoffset_t));
}

void BufferBuilder::requireNotNested() {
  KJ_REQUIRE(!nested, "can't create an object while a table or vector is under construction");
  KJ_REQUIRE(!finished, "buffer was already finished; call clear() to reuse the builder");
}

void BufferBuilder::trackField(voffset_t field, uoffset_t position) {
  KJ_REQUIRE(nested, "fields can only be added between startTable() and endTable()");
  KJ_REQUIRE(field >= slotToVoffset(0) && field % sizeof(voffset_t) == 0,
             "not a valid vtable field position", field);
  fieldLocations.add(FieldLocation { position, field });
  if (field > maxVoffset) maxVoffset = field;
}

// -----------------------------------------------------------------------------

Offset<String> BufferBuilder::createString(kj::StringPtr text) {
  requireNotNested();
  preAlign(text.size() + 1, sizeof(uoffset_t));
  pad(1);
  pushBytes(kj::arrayPtr(reinterpret_cast<const byte*>(text.begin()), text.size()));
  pushScalar<uoffset_t>(text.size());
  return Offset<String>(getSize());
}

Offset<Vector<Offset<String>>> BufferBuilder::createVectorOfStrings(
    kj::ArrayPtr<const kj::StringPtr> strings) {
  auto offsets = kj::heapArrayBuilder<Offset<String>>(strings.size());
  for (auto& s: strings) {
    offsets.add(createString(s));
  }
  return createVectorOfOffsets<String>(offsets.asPtr());
}

void BufferBuilder::startVector(size_t count, size_t elementSize, size_t alignment) {
  requireNotNested();
  nested = true;
  preAlign(count * elementSize, sizeof(uoffset_t));
  preAlign(count * elementSize, alignment);
}

uoffset_t BufferBuilder::endVector(size_t count) {
  KJ_REQUIRE(nested, "endVector() without startVector()");
  nested = false;
  return pushScalar<uoffset_t>(count);
}

// -----------------------------------------------------------------------------

uoffset_t BufferBuilder::startTable() {
  requireNotNested();
  nested = true;
  return getSize();
}

uoffset_t BufferBuilder::endTable(uoffset_t start) {
  KJ_REQUIRE(nested, "endTable() without startTable()");

  // Placeholder for the soffset to the vtable; filled in once we know where the vtable lives.
  uoffset_t table = pushScalar<soffset_t>(0);

  voffset_t vtableSize = maxVoffset + sizeof(voffset_t);
  if (vtableSize < slotToVoffset(0)) vtableSize = slotToVoffset(0);
  uoffset_t tableSize = table - start;
  KJ_REQUIRE(tableSize <= 0xffff, "table too large", tableSize);

  byte* vtable = allocate(vtableSize);
  memset(vtable, 0, vtableSize);
  storeWire<voffset_t>(vtable, vtableSize);
  storeWire<voffset_t>(vtable + sizeof(voffset_t), tableSize);
  for (auto& location: fieldLocations) {
    storeWire<voffset_t>(vtable + location.field, table - location.position);
  }
  fieldLocations.clear();
  maxVoffset = 0;

  uoffset_t vtablePosition = getSize();
  if (options.dedupVtables) {
    uint64_t hash = hashBytes(vtable, vtableSize);
    bool shared = false;
    auto range = vtables.equal_range(hash);
    for (auto iter = range.first; iter != range.second; ++iter) {
      const byte* existing = at(iter->second);
      if (loadWire<voffset_t>(existing) == vtableSize &&
          memcmp(existing, vtable, vtableSize) == 0) {
        vtablePosition = iter->second;
        used = table;  // drop the vtable we just wrote
        shared = true;
        break;
      }
    }
    if (!shared) {
      vtables.insert(std::make_pair(hash, vtablePosition));
    }
  }

  storeWire<soffset_t>(at(table),
      static_cast<soffset_t>(vtablePosition) - static_cast<soffset_t>(table));
  nested = false;
  return table;
}

void BufferBuilder::requireField(uoffset_t table, voffset_t field, kj::StringPtr fieldName) {
  const byte* tablePtr = at(table);
  const byte* vtable = tablePtr - loadWire<soffset_t>(tablePtr);
  voffset_t vtableSize = loadWire<voffset_t>(vtable);
  KJ_REQUIRE(field < vtableSize && loadWire<voffset_t>(vtable + field) != 0,
             "required field was not set", fieldName);
}

// -----------------------------------------------------------------------------

void BufferBuilder::finishImpl(uoffset_t root, kj::Maybe<kj::StringPtr> fileIdentifier) {
  requireNotNested();
  vtables.clear();

  size_t identifierSize = fileIdentifier == nullptr ? 0 : FILE_IDENTIFIER_LENGTH;
  preAlign(sizeof(uoffset_t) + identifierSize, minAlign);
  KJ_IF_MAYBE(identifier, fileIdentifier) {
    KJ_REQUIRE(identifier->size() == FILE_IDENTIFIER_LENGTH,
               "file identifiers must be exactly four bytes", *identifier);
    pushBytes(kj::arrayPtr(reinterpret_cast<const byte*>(identifier->begin()),
                           FILE_IDENTIFIER_LENGTH));
  }
  pushOffset(root);
  finished = true;
}

kj::ArrayPtr<const byte> BufferBuilder::getBuffer() const {
  KJ_REQUIRE(finished, "finish() must be called first");
  return kj::arrayPtr(buffer.end() - used, used);
}

kj::Array<byte> BufferBuilder::releaseBuffer() {
  auto result = kj::heapArray<byte>(getBuffer());
  clear();
  return result;
}

}  // namespace plank
