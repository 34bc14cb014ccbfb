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

#include "reader.h"

namespace plank {

namespace _ {  // private

uoffset_t followOffset(kj::ArrayPtr<const byte> buffer, uoffset_t position) {
  KJ_REQUIRE(uint64_t(position) + sizeof(uoffset_t) <= buffer.size(),
             "offset out of bounds", position, buffer.size());
  uint64_t target = uint64_t(position) + loadWire<uoffset_t>(buffer.begin() + position);
  KJ_REQUIRE(target < buffer.size(), "offset points outside of buffer", target, buffer.size());
  return static_cast<uoffset_t>(target);
}

kj::StringPtr readString(kj::ArrayPtr<const byte> buffer, uoffset_t position) {
  KJ_REQUIRE(uint64_t(position) + sizeof(uoffset_t) <= buffer.size(),
             "string out of bounds", position);
  uint32_t length = loadWire<uint32_t>(buffer.begin() + position);
  uint64_t end = uint64_t(position) + sizeof(uoffset_t) + length;
  KJ_REQUIRE(end < buffer.size(), "string out of bounds", position, length);
  KJ_REQUIRE(buffer[end] == 0, "string is not NUL-terminated", position);
  return kj::StringPtr(reinterpret_cast<const char*>(buffer.begin() + position + 4), length);
}

}  // namespace _ (private)

TableReader::TableReader(kj::ArrayPtr<const byte> buffer, uoffset_t position)
    : buffer(buffer), position(position) {
  KJ_REQUIRE(uint64_t(position) + sizeof(soffset_t) <= buffer.size(),
             "table out of bounds", position, buffer.size());
  int64_t vtablePos = int64_t(position) - loadWire<soffset_t>(buffer.begin() + position);
  KJ_REQUIRE(vtablePos >= 0 && uint64_t(vtablePos) + 2 * sizeof(voffset_t) <= buffer.size(),
             "vtable out of bounds", position, vtablePos);
  vtable = static_cast<uoffset_t>(vtablePos);

  vtableSize = loadWire<voffset_t>(buffer.begin() + vtable);
  KJ_REQUIRE(vtableSize >= 2 * sizeof(voffset_t) && vtableSize % sizeof(voffset_t) == 0 &&
             uint64_t(vtable) + vtableSize <= buffer.size(),
             "malformed vtable", vtable, vtableSize);

  tableSize = loadWire<voffset_t>(buffer.begin() + vtable + sizeof(voffset_t));
  KJ_REQUIRE(tableSize >= sizeof(soffset_t) && uint64_t(position) + tableSize <= buffer.size(),
             "malformed table size", position, tableSize);
}

voffset_t TableReader::getFieldOffset(voffset_t field) const {
  if (field >= vtableSize) {
    // Either a null table, or the table was written with an older schema that had fewer fields.
    return 0;
  }
  return loadWire<voffset_t>(buffer.begin() + vtable + field);
}

uoffset_t TableReader::fieldPosition(voffset_t offsetInTable, size_t size) const {
  KJ_REQUIRE(offsetInTable >= sizeof(soffset_t) && offsetInTable + size <= tableSize,
             "field lies outside its table", offsetInTable, size, tableSize);
  return position + offsetInTable;
}

uoffset_t TableReader::followField(voffset_t offsetInTable) const {
  return _::followOffset(buffer, fieldPosition(offsetInTable, sizeof(uoffset_t)));
}

kj::StringPtr TableReader::getString(voffset_t field) const {
  voffset_t offset = getFieldOffset(field);
  if (offset == 0) return "";
  return _::readString(buffer, followField(offset));
}

TableReader TableReader::getTable(voffset_t field) const {
  voffset_t offset = getFieldOffset(field);
  if (offset == 0) return TableReader();
  return TableReader(buffer, followField(offset));
}

// -----------------------------------------------------------------------------

TableReader readRoot(kj::ArrayPtr<const byte> buffer) {
  KJ_REQUIRE(buffer.size() >= sizeof(uoffset_t), "buffer too small to contain a root offset",
             buffer.size());
  return TableReader(buffer, _::followOffset(buffer, 0));
}

bool bufferHasIdentifier(kj::ArrayPtr<const byte> buffer, kj::StringPtr identifier) {
  KJ_REQUIRE(identifier.size() == FILE_IDENTIFIER_LENGTH,
             "file identifiers must be exactly four bytes", identifier);
  if (buffer.size() < sizeof(uoffset_t) + FILE_IDENTIFIER_LENGTH) return false;
  return memcmp(buffer.begin() + sizeof(uoffset_t), identifier.begin(),
                FILE_IDENTIFIER_LENGTH) == 0;
}

}  // namespace plank
