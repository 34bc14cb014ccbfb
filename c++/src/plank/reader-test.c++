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
#include "builder.h"
#include <kj/test.h>

namespace plank {
namespace {

struct TestBuffer {
  // A table with a string in slot 0, an int32 vector in slot 1 and an int32 in slot 2, plus the
  // positions of each object so tests can corrupt them.

  kj::Array<byte> bytes;
  size_t stringAt;
  size_t vectorAt;
  size_t tableAt;

  TestBuffer() {
    BufferBuilder builder;
    auto text = builder.createString("abc");
    int32_t numbers[] = { 10, 20, 30 };
    auto vector = builder.createVector<int32_t>(kj::arrayPtr(numbers, 3));
    auto start = builder.startTable();
    builder.addOffset(slotToVoffset(0), text);
    builder.addOffset(slotToVoffset(1), vector);
    builder.addScalar<int32_t>(slotToVoffset(2), 42, 0);
    auto table = builder.endTable(start);
    builder.finish(Offset<void>(table));

    bytes = kj::heapArray<byte>(builder.getBuffer());
    stringAt = bytes.size() - text.get();
    vectorAt = bytes.size() - vector.get();
    tableAt = bytes.size() - table;
  }

  void store32(size_t at, uint32_t value) {
    storeWire<uint32_t>(bytes.begin() + at, value);
  }

  TableReader root() const { return readRoot(bytes); }
};

KJ_TEST("reading a well-formed buffer") {
  TestBuffer buffer;
  auto root = buffer.root();
  KJ_EXPECT(!root.isNull());
  KJ_EXPECT(root.getPosition() == buffer.tableAt);
  KJ_EXPECT(root.getString(slotToVoffset(0)) == "abc");
  auto vector = root.getVector<int32_t>(slotToVoffset(1));
  KJ_ASSERT(vector.size() == 3);
  int32_t sum = 0;
  for (auto n: vector) sum += n;
  KJ_EXPECT(sum == 60);
  KJ_EXPECT(root.getScalar<int32_t>(slotToVoffset(2), 0) == 42);
}

KJ_TEST("fields beyond the vtable read as defaults") {
  // A buffer written with an older schema that had fewer fields.
  TestBuffer buffer;
  auto root = buffer.root();
  KJ_EXPECT(!root.hasField(slotToVoffset(3)));
  KJ_EXPECT(root.getScalar<int16_t>(slotToVoffset(40), 7) == 7);
  KJ_EXPECT(root.getString(slotToVoffset(3)) == "");
  KJ_EXPECT(root.getTable(slotToVoffset(3)).isNull());
  KJ_EXPECT(root.getVector<int32_t>(slotToVoffset(3)).size() == 0);
}

KJ_TEST("null table reads as all defaults") {
  TableReader table;
  KJ_EXPECT(table.isNull());
  KJ_EXPECT(!table.hasField(slotToVoffset(0)));
  KJ_EXPECT(table.getScalar<double>(slotToVoffset(0), 1.5) == 1.5);
  KJ_EXPECT(table.getString(slotToVoffset(0)) == "");
  KJ_EXPECT(table.getTable(slotToVoffset(0)).isNull());
}

KJ_TEST("truncated buffers are rejected") {
  byte tiny[2] = { 0, 0 };
  KJ_EXPECT_THROW_MESSAGE("buffer too small", readRoot(kj::arrayPtr(tiny, 2)));

  byte pointsAway[8] = { 100, 0, 0, 0, 0, 0, 0, 0 };
  KJ_EXPECT_THROW_MESSAGE("offset points outside of buffer",
                          readRoot(kj::arrayPtr(pointsAway, 8)));

  TestBuffer buffer;
  KJ_EXPECT_THROW_MESSAGE("out of bounds", readRoot(buffer.bytes.slice(0, buffer.tableAt + 2)));
}

KJ_TEST("corrupt vtable reference is rejected") {
  TestBuffer buffer;
  buffer.store32(buffer.tableAt, 0x7fff0000);
  KJ_EXPECT_THROW_MESSAGE("vtable out of bounds", buffer.root());
}

KJ_TEST("corrupt field offset is rejected") {
  TestBuffer buffer;
  auto root = buffer.root();
  size_t vtableAt = buffer.tableAt - loadWire<soffset_t>(buffer.bytes.begin() + buffer.tableAt);
  KJ_ASSERT(loadWire<voffset_t>(buffer.bytes.begin() + vtableAt) == slotToVoffset(3));

  // Point field 2 past the end of the table.
  storeWire<voffset_t>(buffer.bytes.begin() + vtableAt + slotToVoffset(2), 0x1000);
  KJ_EXPECT(root.hasField(slotToVoffset(2)));
  KJ_EXPECT_THROW_MESSAGE("field lies outside its table",
                          root.getScalar<int32_t>(slotToVoffset(2), 0));
}

KJ_TEST("corrupt string is rejected") {
  {
    TestBuffer buffer;
    buffer.store32(buffer.stringAt, 0x10000);
    KJ_EXPECT_THROW_MESSAGE("string out of bounds",
                            buffer.root().getString(slotToVoffset(0)));
  }
  {
    TestBuffer buffer;
    buffer.bytes[buffer.stringAt + 4 + 3] = 'x';
    KJ_EXPECT_THROW_MESSAGE("not NUL-terminated", buffer.root().getString(slotToVoffset(0)));
  }
}

KJ_TEST("corrupt vector is rejected") {
  TestBuffer buffer;
  buffer.store32(buffer.vectorAt, 0x40000000);
  KJ_EXPECT_THROW_MESSAGE("vector elements out of bounds",
                          buffer.root().getVector<int32_t>(slotToVoffset(1)));

  TestBuffer fine;
  auto vector = fine.root().getVector<int32_t>(slotToVoffset(1));
  KJ_EXPECT_THROW_MESSAGE("vector index out of range", vector[3]);
}

KJ_TEST("file identifier check never reads past the buffer") {
  byte shortBuffer[6] = { 8, 0, 0, 0, 'M', 'O' };
  KJ_EXPECT(!bufferHasIdentifier(kj::arrayPtr(shortBuffer, 6), "MONS"));
}

}  // namespace
}  // namespace plank
