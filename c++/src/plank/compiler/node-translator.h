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

#include "resolver.h"
#include "ir.h"
#include <kj/memory.h>

namespace plank {
namespace compiler {

class NodeTranslator {
  // Checks every declaration of a compilation against the semantic rules of the language and
  // builds the CompiledSchema: types resolved to DeclIds, struct layouts computed, table slots
  // assigned, defaults converted to values.
  //
  // Errors are reported to the ErrorReporter of the module they occur in.  Checking continues
  // after an error so that one run reports everything it can.

public:
  NodeTranslator(const Resolver& resolver, kj::ArrayPtr<const ParsedModule> modules);
  KJ_DISALLOW_COPY(NodeTranslator);
  ~NodeTranslator() noexcept(false);

  kj::Maybe<kj::Own<CompiledSchema>> translate();
  // Returns null if any error was reported.  May only be called once.

private:
  class Impl;
  kj::Own<Impl> impl;
};

uint64_t alignUp(uint64_t offset, uint alignment);
// `alignment` must be a power of two.

}  // namespace compiler
}  // namespace plank
