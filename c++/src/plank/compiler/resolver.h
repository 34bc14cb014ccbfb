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
#include <kj/vector.h>
#include <map>

namespace plank {
namespace compiler {

struct ParsedModule {
  // One successfully parsed file of a compilation.

  kj::StringPtr sourceName;
  ErrorReporter& errorReporter;
  Schema schema;
  kj::Array<uint> includes;
  // Indices of the directly included modules.
};

class Resolver {
  // The symbol table: maps fully-qualified names to declarations across all modules of a
  // compilation, and resolves type references written relative to a namespace.

public:
  explicit Resolver(kj::ArrayPtr<const ParsedModule> modules);
  // Enters every declaration of every module, reporting DUPLICATE_DECLARATION at each repeated
  // name.  `modules` must be in canonical order (sorted by source name); DeclIds follow that
  // order, so neither ids nor diagnostics depend on the order in which files were loaded.
  KJ_DISALLOW_COPY(Resolver);

  struct Entry {
    const Declaration& decl;
    uint module;
    kj::String fullName;
  };

  inline kj::ArrayPtr<const Entry> getEntries() const { return entries; }
  // Indexed by DeclId.  Duplicates get ids too but can't be found by name.

  inline bool hadDuplicates() const { return duplicates; }

  kj::Maybe<DeclId> lookup(kj::StringPtr fullName) const;

  kj::Maybe<DeclId> resolve(kj::ArrayPtr<const kj::String> scope, kj::StringPtr name,
                            uint32_t startByte, uint32_t endByte,
                            ErrorReporter& errorReporter) const;
  // Resolves `name` as written inside namespace `scope` = n1.n2...nk.  Tries n1...nk.name, then
  // each shorter prefix of the namespace, then `name` exactly as written, and takes the first
  // that exists.  When a dotted `name` exists both inside the namespace chain and as written, and
  // the two are different declarations, the reference is ambiguous.  Reports UNRESOLVED_TYPE or
  // AMBIGUOUS_TYPE and returns null on failure.

  inline kj::Maybe<DeclId> resolve(kj::ArrayPtr<const kj::String> scope, const TypeExpr& type,
                                   ErrorReporter& errorReporter) const {
    return resolve(scope, type.name, type.startByte, type.endByte, errorReporter);
  }

private:
  kj::ArrayPtr<const ParsedModule> modules;
  kj::Vector<Entry> entries;
  std::map<kj::StringPtr, DeclId> byName;
  bool duplicates = false;
};

}  // namespace compiler
}  // namespace plank
