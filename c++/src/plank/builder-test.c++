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
#include "reader.h"
#include <kj/test.h>

namespace plank {
namespace {

kj::Array<const byte> bytes(std::initializer_list<byte> list) {
  return kj::heapArray<byte>(list);
}

KJ_TEST("smallest table is laid out exactly") {
  BufferBuilder builder;
  auto start = builder.startTable();
  builder.addScalar<int16_t>(slotToVoffset(0), 7, 0);
  auto table = builder.endTable(start);
  builder.finish(Offset<void>(table));

  auto expected = bytes({
    12, 0, 0, 0,          // root offset
    0, 0,                 // padding
    6, 0, 8, 0, 6, 0,     // vtable: its size, table size, field 0 at +6
    6, 0, 0, 0,           // table: soffset back to the vtable
    0, 0,                 // padding
    7, 0                  // field 0
  });
  KJ_EXPECT(builder.getBuffer() == expected.asPtr(), builder.getBuffer());
}

KJ_TEST("strings are length-prefixed and NUL-terminated") {
  BufferBuilder builder;
  auto text = builder.createString("hi");
  auto start = builder.startTable();
  builder.addOffset(slotToVoffset(0), text);
  auto table = builder.endTable(start);
  builder.finish(Offset<void>(table));

  auto buffer = builder.getBuffer();
  size_t stringAt = buffer.size() - text.get();
  KJ_ASSERT(stringAt % 4 == 0);
  KJ_EXPECT(buffer.slice(stringAt, stringAt + 7) == bytes({2, 0, 0, 0, 'h', 'i', 0}).asPtr());

  KJ_EXPECT(readRoot(buffer).getString(slotToVoffset(0)) == "hi");
}

KJ_TEST("identical vtables are shared") {
  auto build = [](bool dedup) {
    BuilderOptions options;
    options.dedupVtables = dedup;
    BufferBuilder builder(options);

    Offset<void> last;
    for (int i = 0; i < 2; i++) {
      auto start = builder.startTable();
      builder.addScalar<int32_t>(slotToVoffset(0), 100 + i, 0);
      builder.addScalar<int32_t>(slotToVoffset(1), 200 + i, 0);
      last = Offset<void>(builder.endTable(start));
    }
    auto size = builder.getSize();
    builder.finish(last);
    auto root = readRoot(builder.getBuffer());
    KJ_EXPECT(root.getScalar<int32_t>(slotToVoffset(0), 0) == 101);
    KJ_EXPECT(root.getScalar<int32_t>(slotToVoffset(1), 0) == 201);
    return size;
  };

  // Two 12-byte tables, and either one 8-byte vtable or two.
  KJ_EXPECT(build(true) == 32);
  KJ_EXPECT(build(false) == 40);
}

KJ_TEST("fields equal to their default are left out") {
  for (bool force: { false, true }) {
    BuilderOptions options;
    options.forceDefaults = force;
    BufferBuilder builder(options);

    auto start = builder.startTable();
    builder.addScalar<int16_t>(slotToVoffset(0), 150, 150);
    builder.addScalar<double>(slotToVoffset(1), 0.5, 0.0);
    builder.addScalar<float>(slotToVoffset(2), kj::nan(), kj::nan());
    builder.finish(Offset<void>(builder.endTable(start)));

    auto root = readRoot(builder.getBuffer());
    KJ_EXPECT(root.hasField(slotToVoffset(0)) == force);
    KJ_EXPECT(root.hasField(slotToVoffset(1)));
    KJ_EXPECT(root.hasField(slotToVoffset(2)) == force);
    KJ_EXPECT(root.getScalar<int16_t>(slotToVoffset(0), 150) == 150);
    KJ_EXPECT(root.getScalar<double>(slotToVoffset(1), 0.0) == 0.5);
  }
}

KJ_TEST("vectors") {
  BufferBuilder builder;
  int32_t numbers[] = { 1, -2, 3 };
  auto numberVector = builder.createVector<int32_t>(kj::arrayPtr(numbers, 3));
  kj::StringPtr words[] = { "one", "", "three" };
  auto wordVector = builder.createVectorOfStrings(kj::arrayPtr(words, 3));
  auto empty = builder.createVector<uint8_t>(nullptr);

  auto start = builder.startTable();
  builder.addOffset(slotToVoffset(0), numberVector);
  builder.addOffset(slotToVoffset(1), wordVector);
  builder.addOffset(slotToVoffset(2), empty);
  builder.finish(Offset<void>(builder.endTable(start)));

  auto root = readRoot(builder.getBuffer());

  auto readNumbers = root.getVector<int32_t>(slotToVoffset(0));
  KJ_ASSERT(readNumbers.size() == 3);
  KJ_EXPECT(readNumbers[0] == 1);
  KJ_EXPECT(readNumbers[1] == -2);
  KJ_EXPECT(readNumbers[2] == 3);

  auto readWords = root.getVector<kj::StringPtr>(slotToVoffset(1));
  KJ_EXPECT(kj::strArray(readWords, ",") == "one,,three");

  KJ_EXPECT(root.hasField(slotToVoffset(2)));
  KJ_EXPECT(root.getVector<uint8_t>(slotToVoffset(2)).size() == 0);
  KJ_EXPECT(root.getVector<uint8_t>(slotToVoffset(3)).size() == 0);
}

KJ_TEST("buffer grows past its initial capacity") {
  BuilderOptions options;
  options.initialCapacity = 16;
  BufferBuilder builder(options);

  auto longText = kj::heapString(5000);
  for (size_t i = 0; i < longText.size(); i++) {
    longText[i] = 'a' + i % 26;
  }

  auto first = builder.createString("first");
  auto second = builder.createString(longText);
  auto start = builder.startTable();
  builder.addOffset(slotToVoffset(0), first);
  builder.addOffset(slotToVoffset(1), second);
  builder.finish(Offset<void>(builder.endTable(start)));

  auto root = readRoot(builder.getBuffer());
  KJ_EXPECT(root.getString(slotToVoffset(0)) == "first");
  KJ_EXPECT(root.getString(slotToVoffset(1)) == longText);
}

KJ_TEST("file identifier follows the root offset") {
  BufferBuilder builder;
  auto start = builder.startTable();
  builder.finish(Offset<void>(builder.endTable(start)), kj::StringPtr("MONS"));

  auto buffer = builder.getBuffer();
  KJ_EXPECT(bufferHasIdentifier(buffer, "MONS"));
  KJ_EXPECT(!bufferHasIdentifier(buffer, "NOPE"));
  KJ_EXPECT(!readRoot(buffer).hasField(slotToVoffset(0)));

  BufferBuilder other;
  KJ_EXPECT_THROW_MESSAGE("exactly four bytes",
      other.finish(Offset<void>(other.endTable(other.startTable())), kj::StringPtr("TOOLONG")));
}

KJ_TEST("required fields") {
  BufferBuilder builder;
  auto name = builder.createString("x");
  auto start = builder.startTable();
  builder.addOffset(slotToVoffset(1), name);
  auto table = builder.endTable(start);

  builder.requireField(table, slotToVoffset(1), "name");
  KJ_EXPECT_THROW_MESSAGE("required field was not set",
      builder.requireField(table, slotToVoffset(0), "id"));
  KJ_EXPECT_THROW_MESSAGE("required field was not set",
      builder.requireField(table, slotToVoffset(7), "beyondVtable"));
}

KJ_TEST("misuse is detected") {
  BufferBuilder builder;
  builder.startTable();
  KJ_EXPECT_THROW_MESSAGE("under construction", builder.createString("nested"));

  BufferBuilder unfinished;
  KJ_EXPECT_THROW_MESSAGE("finish() must be called first", unfinished.getBuffer());

  BufferBuilder twice;
  twice.finish(Offset<void>(twice.endTable(twice.startTable())));
  KJ_EXPECT_THROW_MESSAGE("already finished", twice.createString("late"));
}

KJ_TEST("releaseBuffer() resets the builder") {
  BufferBuilder builder;
  auto start = builder.startTable();
  builder.addScalar<uint8_t>(slotToVoffset(0), 1, 0);
  builder.finish(Offset<void>(builder.endTable(start)));
  kj::Array<const byte> first = builder.releaseBuffer();
  KJ_EXPECT(builder.getSize() == 0);

  start = builder.startTable();
  builder.addScalar<uint8_t>(slotToVoffset(0), 1, 0);
  builder.finish(Offset<void>(builder.endTable(start)));
  KJ_EXPECT(builder.getBuffer() == first.asPtr());
}

}  // namespace
}  // namespace plank
