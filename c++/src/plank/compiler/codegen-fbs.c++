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

// Prints a module back as schema text in canonical form.  Compiling the output again yields the
// same layout as the input: every table field carries its id, every name is fully qualified and
// defaults are written in normalized form.

#include "codegen.h"
#include "pretty-print.h"
#include <kj/debug.h>
#include <kj/string-tree.h>
#include <kj/vector.h>

namespace plank {
namespace compiler {

namespace {

kj::StringTree genDocs(kj::StringPtr indent, kj::ArrayPtr<const kj::String> docs) {
  return kj::StringTree(KJ_MAP(line, docs) {
    if (line.size() == 0) {
      return kj::strTree(indent, "///\n");
    } else {
      return kj::strTree(indent, "/// ", line, "\n");
    }
  }, "");
}

kj::String integerText(ScalarKind kind, uint64_t bits) {
  if (isSigned(kind)) {
    return kj::str(static_cast<int64_t>(bits));
  } else {
    return kj::str(bits);
  }
}

uint bitPosition(uint64_t flag) {
  uint result = 0;
  while (flag > 1) {
    flag >>= 1;
    ++result;
  }
  return result;
}

class FbsGenerator {
public:
  FbsGenerator(const CompiledSchema& schema, const ModuleInfo& module)
      : schema(schema), module(module) {}

  kj::String generate() {
    kj::Vector<kj::StringTree> parts;

    for (auto index: module.includes) {
      parts.add(kj::strTree(
          "include \"", escapeString(schema.getModules()[index].sourceName), "\";\n"));
    }
    if (module.includes.size() > 0) parts.add(kj::strTree("\n"));

    bool first = true;
    kj::ArrayPtr<const kj::String> currentNamespace;
    for (auto id: module.decls) {
      auto& decl = schema.getDecl(id);
      if (first || !sameNamespace(currentNamespace, decl.namespacePath)) {
        currentNamespace = decl.namespacePath;
        if (currentNamespace.size() == 0) {
          parts.add(kj::strTree("namespace;\n\n"));
        } else {
          parts.add(kj::strTree("namespace ", kj::strArray(currentNamespace, "."), ";\n\n"));
        }
        first = false;
      }
      parts.add(genDecl(decl));
    }

    KJ_IF_MAYBE(root, module.rootType) {
      parts.add(kj::strTree("root_type ", schema.getDecl(*root).fullName, ";\n"));
    }
    KJ_IF_MAYBE(id, module.fileIdentifier) {
      parts.add(kj::strTree("file_identifier \"", escapeString(*id), "\";\n"));
    }
    KJ_IF_MAYBE(ext, module.fileExtension) {
      parts.add(kj::strTree("file_extension \"", escapeString(*ext), "\";\n"));
    }

    return kj::StringTree(parts.releaseAsArray(), "").flatten();
  }

private:
  const CompiledSchema& schema;
  const ModuleInfo& module;

  static bool sameNamespace(kj::ArrayPtr<const kj::String> a, kj::ArrayPtr<const kj::String> b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
      if (a[i] != b[i]) return false;
    }
    return true;
  }

  kj::StringTree genDecl(const DeclInfo& decl) {
    switch (decl.getKind()) {
      case DeclInfo::ENUM: return genEnum(decl);
      case DeclInfo::UNION: return genUnion(decl);
      case DeclInfo::STRUCT: return genStruct(decl);
      case DeclInfo::TABLE: return genTable(decl);
      case DeclInfo::RPC_SERVICE: return genService(decl);
    }
    KJ_UNREACHABLE;
  }

  kj::StringTree genEnum(const DeclInfo& decl) {
    auto& info = decl.body.get<EnumInfo>();
    return kj::strTree(
        genDocs("", decl.docs),
        "enum ", decl.name, ": ", info.underlying,
        info.bitFlags ? " (bit_flags)" : "", " {\n",
        kj::StringTree(KJ_MAP(variant, info.variants) {
          auto value = info.bitFlags ? kj::str(bitPosition(variant.value))
                                     : integerText(info.underlying, variant.value);
          return kj::strTree(genDocs("  ", variant.docs), "  ", variant.name, " = ", value);
        }, ",\n"),
        "\n}\n\n");
  }

  kj::StringTree genUnion(const DeclInfo& decl) {
    auto& info = decl.body.get<UnionInfo>();
    return kj::strTree(
        genDocs("", decl.docs),
        "union ", decl.name, " {\n",
        kj::StringTree(KJ_MAP(variant, info.variants) {
          return kj::strTree(genDocs("  ", variant.docs), "  ", variant.name, ": ",
                             schema.getDecl(variant.table).fullName);
        }, ",\n"),
        "\n}\n\n");
  }

  kj::StringTree genStruct(const DeclInfo& decl) {
    auto& info = decl.body.get<StructInfo>();
    uint natural = 1;
    for (auto& field: info.fields) {
      natural = kj::max(natural, field.alignment);
    }

    kj::StringTree attributes;
    if (info.alignment > natural) {
      attributes = kj::strTree(" (force_align: ", info.alignment, ")");
    }

    return kj::strTree(
        genDocs("", decl.docs),
        "struct ", decl.name, kj::mv(attributes), " {\n",
        KJ_MAP(field, info.fields) {
          return kj::strTree(genDocs("  ", field.docs),
                             "  ", field.name, ": ", schema.typeName(field.type), ";\n");
        },
        "}\n\n");
  }

  kj::String defaultText(const TableFieldInfo& field) {
    // Empty if the default is the zero value, which is implied.
    auto& value = field.defaultValue;
    switch (value.which) {
      case Value::NONE:
        return nullptr;
      case Value::BOOLEAN:
        return value.boolean ? kj::str("true") : nullptr;
      case Value::INTEGER:
        if (value.integer == 0) return nullptr;
        if (field.type.which == Type::NAMED) {
          auto& info = schema.getEnum(field.type.decl);
          KJ_IF_MAYBE(variant, info.findByValue(value.integer)) {
            return kj::heapString(variant->name);
          }
          return integerText(info.underlying, value.integer);
        }
        return integerText(field.type.scalar, value.integer);
      case Value::FLOAT:
        if (value.floating == 0 && !kj::isNaN(value.floating)) return nullptr;
        if (kj::isNaN(value.floating)) return kj::str("nan");
        if (value.floating == kj::inf()) return kj::str("inf");
        if (value.floating == -kj::inf()) return kj::str("-inf");
        return floatToString(value.floating);
    }
    KJ_UNREACHABLE;
  }

  kj::StringTree genTable(const DeclInfo& decl) {
    auto& info = decl.body.get<TableInfo>();
    return kj::strTree(
        genDocs("", decl.docs),
        "table ", decl.name, " {\n",
        KJ_MAP(field, info.fields) {
          kj::Vector<kj::String> attributes;
          attributes.add(kj::str("id: ", field.slot));
          if (field.required) attributes.add(kj::str("required"));
          if (field.key) attributes.add(kj::str("key"));
          if (field.deprecated) attributes.add(kj::str("deprecated"));

          auto defaultValue = defaultText(field);
          return kj::strTree(
              genDocs("  ", field.docs),
              "  ", field.name, ": ", schema.typeName(field.type),
              defaultValue.size() > 0 ? kj::strTree(" = ", defaultValue) : kj::strTree(),
              " (", kj::strArray(attributes, ", "), ");\n");
        },
        "}\n\n");
  }

  kj::StringTree genService(const DeclInfo& decl) {
    auto& info = decl.body.get<ServiceInfo>();
    return kj::strTree(
        genDocs("", decl.docs),
        "rpc_service ", decl.name, " {\n",
        KJ_MAP(method, info.methods) {
          kj::StringTree attributes;
          if (method.streaming != Streaming::NONE) {
            attributes = kj::strTree(" (streaming: \"", method.streaming, "\")");
          }
          return kj::strTree(
              genDocs("  ", method.docs),
              "  ", method.name, "(", schema.getDecl(method.request).fullName, "): ",
              schema.getDecl(method.response).fullName, kj::mv(attributes), ";\n");
        },
        "}\n\n");
  }
};

}  // namespace

kj::String generateCanonicalSchema(const CompiledSchema& schema, const ModuleInfo& module) {
  return FbsGenerator(schema, module).generate();
}

}  // namespace compiler
}  // namespace plank
