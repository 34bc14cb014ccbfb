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

#include "module-loader.h"
#include "lexer.h"
#include "parser.h"
#include <kj/vector.h>
#include <kj/debug.h>
#include <map>

namespace plank {
namespace compiler {

class ModuleLoader::Impl {
public:
  Impl(GlobalErrorReporter& errorReporter)
      : errorReporter(errorReporter) {}

  void addImportPath(const kj::ReadableDirectory& dir) {
    searchPath.add(&dir);
  }

  kj::Maybe<Module&> loadModule(const kj::ReadableDirectory& dir, kj::PathPtr path);
  kj::Maybe<Module&> loadModuleFromSearchPath(kj::PathPtr path);
  GlobalErrorReporter& getErrorReporter() { return errorReporter; }

private:
  GlobalErrorReporter& errorReporter;
  kj::Vector<const kj::ReadableDirectory*> searchPath;
  std::map<kj::StringPtr, kj::Own<Module>> modules;
  // Keyed by source name; the key points into the module.
};

class ModuleLoader::ModuleImpl final: public Module {
public:
  ModuleImpl(ModuleLoader::Impl& loader, kj::Own<const kj::ReadableFile> file,
             const kj::ReadableDirectory& sourceDir, kj::Path pathParam)
      : loader(loader), file(kj::mv(file)), sourceDir(sourceDir), path(kj::mv(pathParam)),
        sourceNameStr(path.toString()) {
    KJ_REQUIRE(path.size() > 0);
  }

  kj::StringPtr getSourceName() override {
    return sourceNameStr;
  }

  kj::Maybe<Schema> loadContent() override {
    content = file->readAllText();

    lineBreaks = nullptr;  // In case loadContent() is called multiple times.
    lineBreaks = kj::heap<LineBreakTable>(content);

    kj::Vector<Token> tokens;
    if (!lex(content, tokens, *this)) {
      return nullptr;
    }
    return parseFile(tokens, content.size(), *this);
  }

  kj::Maybe<Module&> importRelative(kj::StringPtr includePath) override {
    kj::Maybe<kj::Path> relative;
    KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
      relative = path.parent().eval(includePath);
    })) {
      // The path escapes the source directory; only the search path can satisfy it.
      KJ_LOG(INFO, "include path leaves its directory", includePath, exception->getDescription());
    }

    KJ_IF_MAYBE(p, relative) {
      KJ_IF_MAYBE(module, loader.loadModule(sourceDir, *p)) {
        return *module;
      }
    }

    kj::Maybe<kj::Path> searchRelative;
    KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
      searchRelative = kj::Path::parse(includePath);
    })) {
      KJ_LOG(INFO, "include path isn't a valid relative path", includePath,
             exception->getDescription());
      return nullptr;
    }
    return loader.loadModuleFromSearchPath(KJ_ASSERT_NONNULL(searchRelative));
  }

  void addError(Error&& error) override {
    auto& lines = *KJ_REQUIRE_NONNULL(lineBreaks,
        "Can't report errors until loadContent() is called.");

    auto start = lines.toSourcePos(error.startByte);
    auto end = lines.toSourcePos(error.endByte);
    loader.getErrorReporter().addError(sourceNameStr, start, end, kj::mv(error));
  }

  bool hadErrors() override {
    return loader.getErrorReporter().hadErrors();
  }

private:
  ModuleLoader::Impl& loader;
  kj::Own<const kj::ReadableFile> file;
  const kj::ReadableDirectory& sourceDir;
  kj::Path path;
  kj::String sourceNameStr;

  kj::String content;
  kj::Maybe<kj::Own<LineBreakTable>> lineBreaks;
};

// =======================================================================================

kj::Maybe<Module&> ModuleLoader::Impl::loadModule(
    const kj::ReadableDirectory& dir, kj::PathPtr path) {
  auto name = path.toString();
  auto iter = modules.find(name);
  if (iter != modules.end()) {
    // Return existing file.
    return *iter->second;
  }

  KJ_IF_MAYBE(file, dir.tryOpenFile(path)) {
    auto module = kj::heap<ModuleImpl>(*this, kj::mv(*file), dir, path.clone());
    auto& result = *module;
    modules.insert(std::make_pair(result.getSourceName(), kj::mv(module)));
    return result;
  } else {
    // No such file.
    return nullptr;
  }
}

kj::Maybe<Module&> ModuleLoader::Impl::loadModuleFromSearchPath(kj::PathPtr path) {
  for (auto candidate: searchPath) {
    KJ_IF_MAYBE(module, loadModule(*candidate, path)) {
      return *module;
    }
  }
  return nullptr;
}

// =======================================================================================

ModuleLoader::ModuleLoader(GlobalErrorReporter& errorReporter)
    : impl(kj::heap<Impl>(errorReporter)) {}
ModuleLoader::~ModuleLoader() noexcept(false) {}

void ModuleLoader::addImportPath(const kj::ReadableDirectory& dir) {
  impl->addImportPath(dir);
}

kj::Maybe<Module&> ModuleLoader::loadModule(const kj::ReadableDirectory& dir, kj::PathPtr path) {
  return impl->loadModule(dir, path);
}

}  // namespace compiler
}  // namespace plank
