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

#include "codegen.h"
#include "compiler.h"
#include "module-loader.h"
#include <kj/debug.h>
#include <kj/vector.h>

namespace plank {
namespace compiler {

kj::Maybe<Target> parseTarget(kj::StringPtr name) {
  if (name == "c++" || name == "cpp") return Target::CPP;
  if (name == "fbs") return Target::FBS;
  return nullptr;
}

kj::StringPtr KJ_STRINGIFY(Target target) {
  switch (target) {
    case Target::CPP: return "c++";
    case Target::FBS: return "fbs";
  }
  KJ_UNREACHABLE;
}

GeneratedFile generate(const CompiledSchema& schema, const ModuleInfo& module, Target target) {
  switch (target) {
    case Target::CPP:
      return GeneratedFile {
        target, cppHeaderPath(module.sourceName), generateCppHeader(schema, module)
      };
    case Target::FBS:
      return GeneratedFile {
        target, kj::heapString(module.sourceName), generateCanonicalSchema(schema, module)
      };
  }
  KJ_UNREACHABLE;
}

kj::OneOf<kj::Array<GeneratedFile>, kj::Array<Diagnostic>> compileAndGenerate(
    const kj::ReadableDirectory& sourceDir, kj::ArrayPtr<const kj::Path> sources,
    kj::ArrayPtr<const kj::ReadableDirectory* const> importPaths,
    kj::ArrayPtr<const Target> targets) {
  DiagnosticCollector diagnostics;
  ModuleLoader loader(diagnostics);
  for (auto dir: importPaths) {
    loader.addImportPath(*dir);
  }

  Compiler compiler;
  for (auto& source: sources) {
    KJ_IF_MAYBE(module, loader.loadModule(sourceDir, source)) {
      compiler.add(*module);
    } else {
      // Reported like any other error, so that the remaining files are still checked.
      Error error { 0, 0, kj::str("no such file"), {} };
      error.detail.init<SemanticError>(
          SemanticError { SemanticError::Kind::FILE_NOT_FOUND, nullptr });
      GlobalErrorReporter::SourcePos start { 0, 0, 0 };
      diagnostics.addError(source.toString(), start, start, kj::mv(error));
    }
  }

  auto compiled = compiler.compile();
  if (diagnostics.hadErrors()) {
    return diagnostics.releaseDiagnostics();
  }

  auto& schema = *KJ_ASSERT_NONNULL(compiled, "compilation failed without reporting an error");
  kj::Vector<GeneratedFile> files;
  for (auto module: compiler.getRequestedModules()) {
    auto& info = KJ_ASSERT_NONNULL(schema.findModule(module->getSourceName()));
    for (auto target: targets) {
      files.add(generate(schema, info, target));
    }
  }
  return files.releaseAsArray();
}

// =======================================================================================

kj::String toTitleCase(kj::StringPtr name) {
  kj::Vector<char> result(name.size() + 1);
  bool upperNext = true;
  for (char c: name) {
    if (c == '_' && result.size() > 0) {
      upperNext = true;
    } else if (upperNext && 'a' <= c && c <= 'z') {
      result.add(c - 'a' + 'A');
      upperNext = false;
    } else {
      result.add(c);
      upperNext = false;
    }
  }
  result.add('\0');
  return kj::String(result.releaseAsArray());
}

kj::String toLowerCamelCase(kj::StringPtr name) {
  kj::String result = toTitleCase(name);
  if (result.size() > 0 && 'A' <= result[0] && result[0] <= 'Z') {
    result[0] = result[0] - 'A' + 'a';
  }
  return kj::mv(result);
}

kj::String toUpperCase(kj::StringPtr name) {
  kj::Vector<char> result(name.size() + 4);

  char previous = '\0';
  for (char c: name) {
    if ('a' <= c && c <= 'z') {
      result.add(c - 'a' + 'A');
    } else if ('A' <= c && c <= 'Z' &&
               (('a' <= previous && previous <= 'z') || ('0' <= previous && previous <= '9'))) {
      result.add('_');
      result.add(c);
    } else {
      result.add(c);
    }
    previous = c;
  }

  result.add('\0');

  return kj::String(result.releaseAsArray());
}

}  // namespace compiler
}  // namespace plank
