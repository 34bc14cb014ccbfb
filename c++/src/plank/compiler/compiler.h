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

#include "grammar.h"
#include "ir.h"
#include "error-reporter.h"
#include <kj/memory.h>
#include <kj/vector.h>

namespace plank {
namespace compiler {

class Module: public ErrorReporter {
public:
  virtual kj::StringPtr getSourceName() = 0;
  // The name of the module file relative to the source tree.  Used to decide where to output
  // generated code and as the argument of `#include` in generated headers.  Unique among the
  // modules of one compilation.

  virtual kj::Maybe<Schema> loadContent() = 0;
  // Reads, lexes and parses the module.  Returns null if there were errors, which have been
  // reported to this module.

  virtual kj::Maybe<Module&> importRelative(kj::StringPtr includePath) = 0;
  // Find another module, relative to this one.  Including the same logical module twice should
  // produce the exact same object, comparable by identity.  These objects are owned by some
  // outside pool that outlives the Compiler instance.
};

class Compiler {
  // Loads a set of modules along with everything they include, then cross-links and checks all
  // of them together.

public:
  Compiler();
  ~Compiler() noexcept(false);
  KJ_DISALLOW_COPY(Compiler);

  void add(Module& module);
  // Add a module that was named explicitly, as opposed to one reached through `include`.  Code is
  // generated only for these.  Adding the same module twice has no effect.

  kj::Maybe<kj::Own<CompiledSchema>> compile();
  // Loads all added modules and, transitively, their includes; then resolves and checks every
  // declaration.  Returns null if any error was reported to any module.  After this returns, the
  // module indices in the result follow canonical order (sorted by source name).

  kj::ArrayPtr<Module* const> getRequestedModules() const;

private:
  kj::Vector<Module*> requested;
};

}  // namespace compiler
}  // namespace plank
