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

#include "resolver.h"
#include <kj/debug.h>

namespace plank {
namespace compiler {

Resolver::Resolver(kj::ArrayPtr<const ParsedModule> modules): modules(modules) {
  for (uint i = 0; i < modules.size(); i++) {
    auto& module = modules[i];
    if (i > 0) {
      KJ_REQUIRE(modules[i - 1].sourceName < module.sourceName,
                 "modules must be sorted by source name", modules[i - 1].sourceName,
                 module.sourceName);
    }

    for (auto& statement: module.schema.statements) {
      if (!statement.is<Declaration>()) continue;
      auto& decl = statement.get<Declaration>();

      kj::String fullName = decl.namespacePath.size() == 0
          ? kj::heapString(decl.name)
          : kj::str(joinPath(decl.namespacePath), '.', decl.name);

      DeclId id = entries.size();
      auto& entry = entries.add(Entry { decl, i, kj::mv(fullName) });

      auto insertResult = byName.insert(std::make_pair(kj::StringPtr(entry.fullName), id));
      if (!insertResult.second) {
        auto& previous = entries[insertResult.first->second];
        duplicates = true;
        module.errorReporter.addSemanticError(decl.nameStartByte, decl.nameEndByte,
            SemanticError::Kind::DUPLICATE_DECLARATION,
            kj::str("'", entry.fullName, "' is already declared in ",
                    modules[previous.module].sourceName));
      }
    }
  }
}

kj::Maybe<DeclId> Resolver::lookup(kj::StringPtr fullName) const {
  auto iter = byName.find(fullName);
  if (iter == byName.end()) {
    return nullptr;
  } else {
    return iter->second;
  }
}

kj::Maybe<DeclId> Resolver::resolve(kj::ArrayPtr<const kj::String> scope, kj::StringPtr name,
                                    uint32_t startByte, uint32_t endByte,
                                    ErrorReporter& errorReporter) const {
  kj::Maybe<DeclId> chainMatch;
  kj::String chainName;
  for (size_t i = scope.size(); i > 0; i--) {
    auto candidate = kj::str(joinPath(scope.slice(0, i)), '.', name);
    KJ_IF_MAYBE(id, lookup(candidate)) {
      chainMatch = *id;
      chainName = kj::mv(candidate);
      break;
    }
  }

  kj::Maybe<DeclId> literalMatch = lookup(name);

  KJ_IF_MAYBE(chainId, chainMatch) {
    KJ_IF_MAYBE(literalId, literalMatch) {
      if (*literalId != *chainId && name.findFirst('.') != nullptr) {
        errorReporter.addSemanticError(startByte, endByte, SemanticError::Kind::AMBIGUOUS_TYPE,
            kj::str("'", name, "' is ambiguous: it could mean '", chainName, "' or '", name,
                    "'"));
        return nullptr;
      }
    }
    return *chainId;
  }

  KJ_IF_MAYBE(literalId, literalMatch) {
    return *literalId;
  }

  errorReporter.addSemanticError(startByte, endByte, SemanticError::Kind::UNRESOLVED_TYPE,
      kj::str("unknown type '", name, "'"));
  return nullptr;
}

}  // namespace compiler
}  // namespace plank
