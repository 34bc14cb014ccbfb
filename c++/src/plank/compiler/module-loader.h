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

#include "compiler.h"
#include "error-reporter.h"
#include <kj/filesystem.h>

namespace plank {
namespace compiler {

class ModuleLoader {
  // Finds schema files and hands them to the Compiler as Modules.
  //
  // A module's source name is its path relative to the directory it was found in, e.g.
  // "game/monster.fbs".  Source names identify modules: loading a name that is already loaded
  // yields the same Module, so a file reached through several includes is compiled once.
  //
  // `include "x.fbs";` is looked up relative to the including file's directory first, then
  // relative to each import path in the order they were added.  The first hit wins.
  //
  // Errors found in a module are reported to the GlobalErrorReporter with the module's source
  // name and line/column positions.

public:
  explicit ModuleLoader(GlobalErrorReporter& errorReporter);
  KJ_DISALLOW_COPY(ModuleLoader);
  ~ModuleLoader() noexcept(false);

  void addImportPath(const kj::ReadableDirectory& dir);
  // `dir` must outlive the loader.

  kj::Maybe<Module&> loadModule(const kj::ReadableDirectory& dir, kj::PathPtr path);
  // Loads `path` from `dir` under the source name `path`.  Null if there's no such file.  The
  // file isn't read until the Compiler asks for its content.

private:
  class Impl;
  kj::Own<Impl> impl;

  class ModuleImpl;
};

}  // namespace compiler
}  // namespace plank
