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

#include "compiler.h"
#include "resolver.h"
#include "node-translator.h"
#include <kj/debug.h>
#include <algorithm>
#include <unordered_map>

namespace plank {
namespace compiler {

namespace {

struct LoadedModule {
  Module* module;
  kj::Maybe<Schema> schema;
  kj::Vector<Module*> includes;
};

}  // namespace

Compiler::Compiler() {}
Compiler::~Compiler() noexcept(false) {}

void Compiler::add(Module& module) {
  for (auto existing: requested) {
    if (existing == &module) return;
  }
  requested.add(&module);
}

kj::ArrayPtr<Module* const> Compiler::getRequestedModules() const {
  return requested.asPtr();
}

kj::Maybe<kj::Own<CompiledSchema>> Compiler::compile() {
  // Load everything reachable, breadth first.
  std::unordered_map<Module*, uint> discovered;
  kj::Vector<LoadedModule> loaded;
  auto enqueue = [&](Module& module) {
    if (discovered.insert(std::make_pair(&module, loaded.size())).second) {
      loaded.add(LoadedModule { &module, nullptr, {} });
    }
  };
  for (auto module: requested) {
    enqueue(*module);
  }

  bool failed = false;
  for (size_t i = 0; i < loaded.size(); i++) {
    Module& module = *loaded[i].module;
    auto schema = module.loadContent();

    KJ_IF_MAYBE(s, schema) {
      for (auto& statement: s->statements) {
        if (!statement.is<Include>()) continue;
        auto& include = statement.get<Include>();

        KJ_IF_MAYBE(target, module.importRelative(include.path)) {
          auto& includes = loaded[i].includes;
          if (std::find(includes.begin(), includes.end(), target) != includes.end()) {
            KJ_LOG(WARNING, "file included more than once", module.getSourceName(), include.path);
            continue;
          }
          includes.add(target);
          enqueue(*target);
        } else {
          module.addErrorOn(include, SemanticError::Kind::UNRESOLVED_INCLUDE,
                            kj::str("can't find included file \"", include.path, "\""));
          failed = true;
        }
      }
    } else {
      failed = true;
    }

    // `enqueue()` may have grown `loaded`, so index again rather than holding a reference.
    loaded[i].schema = kj::mv(schema);
  }

  if (failed) return nullptr;

  // Canonical order.
  kj::Vector<uint> order(loaded.size());
  for (uint i = 0; i < loaded.size(); i++) order.add(i);
  std::sort(order.begin(), order.end(), [&](uint a, uint b) {
    return loaded[a].module->getSourceName() < loaded[b].module->getSourceName();
  });

  kj::Vector<uint> canonicalIndex(loaded.size());
  canonicalIndex.resize(loaded.size());
  for (uint i = 0; i < order.size(); i++) {
    canonicalIndex[order[i]] = i;
    if (i > 0) {
      KJ_REQUIRE(loaded[order[i - 1]].module->getSourceName() !=
                 loaded[order[i]].module->getSourceName(),
                 "two different modules have the same source name",
                 loaded[order[i]].module->getSourceName());
    }
  }

  kj::Vector<ParsedModule> parsed(loaded.size());
  for (uint i: order) {
    auto& entry = loaded[i];
    auto includes = KJ_MAP(include, entry.includes) {
      return canonicalIndex[discovered.at(include)];
    };
    parsed.add(ParsedModule {
      entry.module->getSourceName(), *entry.module,
      kj::mv(KJ_ASSERT_NONNULL(entry.schema)), kj::mv(includes)
    });
  }

  KJ_LOG(INFO, "checking schema", parsed.size());

  Resolver resolver(parsed);
  NodeTranslator translator(resolver, parsed);
  auto result = translator.translate();

  if (resolver.hadDuplicates()) return nullptr;
  return kj::mv(result);
}

}  // namespace compiler
}  // namespace plank
