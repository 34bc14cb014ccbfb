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

#include "ir.h"
#include "error-reporter.h"
#include <kj/filesystem.h>
#include <kj/one-of.h>

namespace plank {
namespace compiler {

enum class Target: uint8_t {
  CPP,
  // One header per module, `foo.fbs` -> `foo.fbs.h`, over the plank runtime library.

  FBS
  // Canonical schema text: fully-qualified type names, explicit ids, normalized defaults.
};

kj::Maybe<Target> parseTarget(kj::StringPtr name);
// "c++" (or "cpp") and "fbs".

kj::StringPtr KJ_STRINGIFY(Target target);

struct GeneratedFile {
  Target target;
  kj::String path;
  // Relative to the output directory.
  kj::String content;
};

kj::String generateCppHeader(const CompiledSchema& schema, const ModuleInfo& module);
kj::String cppHeaderPath(kj::StringPtr sourceName);

kj::String generateCanonicalSchema(const CompiledSchema& schema, const ModuleInfo& module);

GeneratedFile generate(const CompiledSchema& schema, const ModuleInfo& module, Target target);

kj::OneOf<kj::Array<GeneratedFile>, kj::Array<Diagnostic>> compileAndGenerate(
    const kj::ReadableDirectory& sourceDir, kj::ArrayPtr<const kj::Path> sources,
    kj::ArrayPtr<const kj::ReadableDirectory* const> importPaths,
    kj::ArrayPtr<const Target> targets);
// Compiles the given source files (relative to `sourceDir`) together with everything they
// include, then runs each target over each of the given files.  If any error is found in any
// file, returns every error found and generates nothing.  A missing source file is one such
// error.

// Name mangling shared by the generators.

kj::String toTitleCase(kj::StringPtr name);
// "mana_points" -> "ManaPoints", "hp" -> "Hp".

kj::String toLowerCamelCase(kj::StringPtr name);
// "mana_points" -> "manaPoints", "SayHello" -> "sayHello".

kj::String toUpperCase(kj::StringPtr name);
// "manaPoints" -> "MANA_POINTS", "mana_points" -> "MANA_POINTS".

}  // namespace compiler
}  // namespace plank
