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

#include "builder.h"
#include "reader.h"
#include <kj/array.h>

namespace plank {

template <typename RootType>
class Message {
  // A finished buffer whose root is a `RootType` table, together with ownership of its bytes.
  // This is the unit exchanged by RPC calls.
  //
  // The root offset and root table header are checked on construction; fields are checked
  // lazily as they are read.

public:
  explicit Message(kj::Array<const byte> bytes): bytes(kj::mv(bytes)) {
    readRoot(this->bytes);
  }
  Message(Message&&) = default;
  Message& operator=(Message&&) = default;
  KJ_DISALLOW_COPY(Message);

  inline typename RootType::Reader getRoot() const {
    return typename RootType::Reader(readRoot(bytes));
  }

  inline kj::ArrayPtr<const byte> getBytes() const { return bytes; }
  inline kj::Array<const byte> releaseBytes() { return kj::mv(bytes); }

private:
  kj::Array<const byte> bytes;
};

template <typename RootType>
Message<RootType> finishMessage(BufferBuilder& builder, Offset<RootType> root,
                                kj::Maybe<kj::StringPtr> fileIdentifier = nullptr) {
  // Finishes the builder with the given root and moves the result into a Message.  The builder is
  // left empty, ready to build another buffer.
  builder.finish(root, fileIdentifier);
  return Message<RootType>(builder.releaseBuffer());
}

}  // namespace plank
