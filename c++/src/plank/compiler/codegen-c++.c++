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

// Generates one C++ header per schema file.  The header is all inline code over the plank
// runtime library: nothing needs to be compiled separately and nothing is registered at startup.

#include "codegen.h"
#include "pretty-print.h"
#include <kj/debug.h>
#include <kj/string-tree.h>
#include <kj/vector.h>
#include <algorithm>
#include <functional>
#include <set>

namespace plank {
namespace compiler {

namespace {

static const char* FILE_HEADER =
    "// Generated by plankc from ";

kj::StringPtr scalarCppType(ScalarKind kind) {
  switch (kind) {
    case ScalarKind::BOOL: return "bool";
    case ScalarKind::INT8: return "int8_t";
    case ScalarKind::UINT8: return "uint8_t";
    case ScalarKind::INT16: return "int16_t";
    case ScalarKind::UINT16: return "uint16_t";
    case ScalarKind::INT32: return "int32_t";
    case ScalarKind::UINT32: return "uint32_t";
    case ScalarKind::INT64: return "int64_t";
    case ScalarKind::UINT64: return "uint64_t";
    case ScalarKind::FLOAT32: return "float";
    case ScalarKind::FLOAT64: return "double";
  }
  KJ_UNREACHABLE;
}

kj::String integerLiteral(ScalarKind kind, uint64_t bits) {
  if (isSigned(kind)) {
    if (bits == uint64_t(1) << 63) {
      // Not expressible as a literal: the magnitude doesn't fit in a signed long long.
      return kj::str("(-9223372036854775807ll - 1)");
    }
    int64_t value = static_cast<int64_t>(bits);
    return kind == ScalarKind::INT64 ? kj::str(value, "ll") : kj::str(value);
  } else {
    return kind == ScalarKind::UINT64 ? kj::str(bits, "ull") : kj::str(bits, "u");
  }
}

kj::String safeIdentifier(kj::StringPtr identifier) {
  // Schema identifiers that are C++ keywords get an underscore appended.

  static const std::set<kj::StringPtr> keywords({
    "alignas", "alignof", "and", "and_eq", "asm", "auto", "bitand", "bitor", "bool", "break",
    "case", "catch", "char", "char8_t", "char16_t", "char32_t", "class", "compl", "concept",
    "const", "consteval", "constexpr", "constinit", "const_cast", "continue", "co_await",
    "co_return", "co_yield", "decltype", "default", "delete", "do", "double", "dynamic_cast",
    "else", "enum", "explicit", "export", "extern", "false", "float", "for", "friend", "goto",
    "if", "inline", "int", "long", "mutable", "namespace", "new", "noexcept", "not", "not_eq",
    "nullptr", "operator", "or", "or_eq", "private", "protected", "public", "register",
    "reinterpret_cast", "requires", "return", "short", "signed", "sizeof", "static",
    "static_assert", "static_cast", "struct", "switch", "template", "this", "thread_local",
    "throw", "true", "try", "typedef", "typeid", "typename", "union", "unsigned", "using",
    "virtual", "void", "volatile", "wchar_t", "while", "xor", "xor_eq"
  });

  if (keywords.count(identifier) > 0) {
    return kj::str(identifier, '_');
  } else {
    return kj::heapString(identifier);
  }
}

kj::String safeMethodName(kj::StringPtr name) {
  // Also steers clear of the members every generated Client and Server already has.
  auto result = safeIdentifier(toLowerCamelCase(name));
  if (result == "channel" || result == "dispatch" || result == "getServiceName") {
    result = kj::str(result, '_');
  }
  return result;
}

kj::String floatLiteral(ScalarKind kind, double value) {
  bool isFloat32 = kind == ScalarKind::FLOAT32;
  kj::StringPtr cast = isFloat32 ? "" : "static_cast<double>";
  if (value != value) {
    return kj::str(cast, "(kj::nan())");
  } else if (value == kj::inf()) {
    return kj::str(cast, "(kj::inf())");
  } else if (value == -kj::inf()) {
    return kj::str(cast, "(-kj::inf())");
  }
  auto text = floatToString(value);
  return isFloat32 ? kj::str(text, 'f') : kj::mv(text);
}

kj::String cppStringLiteral(kj::StringPtr text) {
  // Octal escapes, unlike hex ones, can't swallow the character that follows.
  kj::Vector<char> result(text.size() + 3);
  result.add('"');
  for (char c: text) {
    uint8_t b = static_cast<uint8_t>(c);
    if (c == '"' || c == '\\') {
      result.add('\\');
      result.add(c);
    } else if (b < 0x20 || b >= 0x7f) {
      result.add('\\');
      result.add('0' + (b >> 6));
      result.add('0' + ((b >> 3) & 7));
      result.add('0' + (b & 7));
    } else {
      result.add(c);
    }
  }
  result.add('"');
  result.add('\0');
  return kj::String(result.releaseAsArray());
}

kj::StringTree genDocs(kj::StringPtr indent, kj::ArrayPtr<const kj::String> docs) {
  return kj::StringTree(KJ_MAP(line, docs) {
    if (line.size() == 0) {
      return kj::strTree(indent, "//\n");
    } else {
      return kj::strTree(indent, "// ", line, "\n");
    }
  }, "");
}

bool samePath(kj::ArrayPtr<const kj::String> a, kj::ArrayPtr<const kj::String> b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); i++) {
    if (a[i] != b[i]) return false;
  }
  return true;
}

struct NamespacedText {
  kj::ArrayPtr<const kj::String> namespacePath;
  kj::StringTree text;
};

kj::StringTree inNamespaces(kj::Vector<NamespacedText>& items) {
  // Concatenates the texts, opening and closing C++ namespaces only where the schema namespace
  // changes between consecutive items.
  kj::Vector<kj::StringTree> out;
  kj::ArrayPtr<const kj::String> current;

  auto close = [&]() {
    for (size_t i = current.size(); i > 0; i--) {
      out.add(kj::strTree("}  // namespace ", current[i - 1], "\n"));
    }
    if (current.size() > 0) out.add(kj::strTree("\n"));
  };

  bool first = true;
  for (auto& item: items) {
    if (first || !samePath(current, item.namespacePath)) {
      if (!first) close();
      current = item.namespacePath;
      for (auto& part: current) {
        out.add(kj::strTree("namespace ", part, " {\n"));
      }
      if (current.size() > 0) out.add(kj::strTree("\n"));
      first = false;
    }
    out.add(kj::mv(item.text));
  }
  if (!first) close();

  return kj::StringTree(out.releaseAsArray(), "");
}

enum class FieldKind {
  SCALAR,
  ENUM,
  STRING,
  VECTOR,
  STRUCT,
  TABLE,
  UNION
};

// =======================================================================================

class CppGenerator {
public:
  CppGenerator(const CompiledSchema& schema, const ModuleInfo& module)
      : schema(schema), module(module),
        moduleIndex(&module - schema.getModules().begin()) {}

  kj::String generate() {
    kj::Vector<NamespacedText> enums;
    kj::Vector<NamespacedText> structs;
    kj::Vector<NamespacedText> tableOuters;
    kj::Vector<NamespacedText> tableClasses;
    kj::Vector<NamespacedText> services;
    kj::Vector<NamespacedText> inlineDefs;
    bool haveServices = false;

    for (auto id: module.decls) {
      auto& decl = schema.getDecl(id);
      switch (decl.getKind()) {
        case DeclInfo::ENUM:
          enums.add(NamespacedText { decl.namespacePath, genEnum(decl) });
          break;
        case DeclInfo::UNION:
          enums.add(NamespacedText { decl.namespacePath, genUnionEnum(decl) });
          break;
        case DeclInfo::STRUCT:
          break;
        case DeclInfo::TABLE: {
          auto text = genTable(decl);
          tableOuters.add(NamespacedText { decl.namespacePath, kj::mv(text.outer) });
          tableClasses.add(NamespacedText { decl.namespacePath, kj::mv(text.classes) });
          inlineDefs.add(NamespacedText { decl.namespacePath, kj::mv(text.inlineDefs) });
          break;
        }
        case DeclInfo::RPC_SERVICE: {
          auto text = genService(decl);
          services.add(NamespacedText { decl.namespacePath, kj::mv(text.decls) });
          inlineDefs.add(NamespacedText { decl.namespacePath, kj::mv(text.inlineDefs) });
          haveServices = true;
          break;
        }
      }
    }

    for (auto id: structOrder()) {
      auto& decl = schema.getDecl(id);
      structs.add(NamespacedText { decl.namespacePath, genStruct(decl) });
    }

    KJ_IF_MAYBE(root, module.rootType) {
      auto& decl = schema.getDecl(*root);
      inlineDefs.add(NamespacedText { decl.namespacePath, genRootFunctions(decl) });
    }

    kj::Vector<kj::StringTree> includes;
    for (auto index: referencedModules()) {
      includes.add(kj::strTree(
          "#include ", cppStringLiteral(cppHeaderPath(schema.getModules()[index].sourceName)),
          "\n"));
    }

    return kj::strTree(
        FILE_HEADER, module.sourceName, ".  DO NOT EDIT.\n"
        "\n"
        "#pragma once\n"
        "\n"
        "#include <plank/generated-header-support.h>\n",
        haveServices ? "#include <plank/rpc.h>\n" : "",
        kj::StringTree(includes.releaseAsArray(), ""),
        "\n"
        "#if PLANK_VERSION != ", PLANK_VERSION, "\n"
        "#error \"Version mismatch between generated code and library headers.  You must "
            "use the same version of the plank compiler and library.\"\n"
        "#endif\n"
        "\n",
        inNamespaces(enums),
        inNamespaces(structs),
        inNamespaces(tableOuters),
        inNamespaces(tableClasses),
        inNamespaces(services),
        "// =======================================================================================\n"
        "\n",
        inNamespaces(inlineDefs)).flatten();
  }

private:
  const CompiledSchema& schema;
  const ModuleInfo& module;
  uint moduleIndex;

  kj::String qualifiedName(DeclId id) {
    auto& decl = schema.getDecl(id);
    if (decl.namespacePath.size() == 0) {
      return kj::str("::", decl.name);
    }
    return kj::str("::", kj::strArray(decl.namespacePath, "::"), "::", decl.name);
  }

  FieldKind fieldKind(const Type& type) {
    switch (type.which) {
      case Type::SCALAR: return FieldKind::SCALAR;
      case Type::STRING: return FieldKind::STRING;
      case Type::VECTOR: return FieldKind::VECTOR;
      case Type::NAMED:
        switch (schema.getDecl(type.decl).getKind()) {
          case DeclInfo::ENUM: return FieldKind::ENUM;
          case DeclInfo::STRUCT: return FieldKind::STRUCT;
          case DeclInfo::TABLE: return FieldKind::TABLE;
          case DeclInfo::UNION: return FieldKind::UNION;
          case DeclInfo::RPC_SERVICE: break;
        }
        break;
    }
    KJ_FAIL_ASSERT("field type can't be stored", schema.typeName(type));
  }

  kj::String readerType(const Type& type) {
    // The type a Reader getter returns, and the element type of VectorReader.
    switch (fieldKind(type)) {
      case FieldKind::SCALAR: return kj::heapString(scalarCppType(type.scalar));
      case FieldKind::ENUM: return qualifiedName(type.decl);
      case FieldKind::STRING: return kj::str("kj::StringPtr");
      case FieldKind::VECTOR: return kj::str("::plank::VectorReader<", readerType(*type.element), ">");
      case FieldKind::STRUCT: return qualifiedName(type.decl);
      case FieldKind::TABLE: return kj::str(qualifiedName(type.decl), "::Reader");
      case FieldKind::UNION: break;
    }
    KJ_FAIL_ASSERT("unions have no single reader type");
  }

  kj::String offsetElementType(const Type& type) {
    // Element type of ::plank::Vector<> on the building side.
    switch (fieldKind(type)) {
      case FieldKind::SCALAR: return kj::heapString(scalarCppType(type.scalar));
      case FieldKind::ENUM: return qualifiedName(type.decl);
      case FieldKind::STRING: return kj::str("::plank::Offset<::plank::String>");
      case FieldKind::STRUCT: return qualifiedName(type.decl);
      case FieldKind::TABLE: return kj::str("::plank::Offset<", qualifiedName(type.decl), ">");
      case FieldKind::VECTOR:
      case FieldKind::UNION:
        break;
    }
    KJ_FAIL_ASSERT("not a valid vector element", schema.typeName(type));
  }

  kj::String offsetType(const Type& type) {
    switch (fieldKind(type)) {
      case FieldKind::STRING: return kj::str("::plank::Offset<::plank::String>");
      case FieldKind::VECTOR:
        return kj::str("::plank::Offset<::plank::Vector<", offsetElementType(*type.element), ">>");
      case FieldKind::TABLE: return kj::str("::plank::Offset<", qualifiedName(type.decl), ">");
      case FieldKind::UNION: return kj::str("::plank::Offset<void>");
      case FieldKind::SCALAR:
      case FieldKind::ENUM:
      case FieldKind::STRUCT:
        break;
    }
    KJ_FAIL_ASSERT("not stored as an offset", schema.typeName(type));
  }

  ScalarKind underlyingKind(const Type& type) {
    return type.which == Type::SCALAR ? type.scalar : schema.getEnum(type.decl).underlying;
  }

  kj::String scalarDefault(const Type& type, const Value& value) {
    // The default as a value of the wire type (the enum's underlying type for enums).
    ScalarKind kind = underlyingKind(type);
    switch (value.which) {
      case Value::BOOLEAN: return kj::str(value.boolean ? "true" : "false");
      case Value::INTEGER: return integerLiteral(kind, value.integer);
      case Value::FLOAT: return floatLiteral(kind, value.floating);
      case Value::NONE: break;
    }
    KJ_FAIL_ASSERT("scalar field without a default value");
  }

  kj::String enumValueExpr(DeclId enumId, uint64_t value) {
    auto& info = schema.getEnum(enumId);
    KJ_IF_MAYBE(variant, info.findByValue(value)) {
      return kj::str(qualifiedName(enumId), "::", safeIdentifier(variant->name));
    } else {
      return kj::str("static_cast<", qualifiedName(enumId), ">(",
                     integerLiteral(info.underlying, value), ")");
    }
  }

  uint inlineSize(const Type& type) {
    switch (fieldKind(type)) {
      case FieldKind::SCALAR:
      case FieldKind::ENUM:
        return scalarSize(underlyingKind(type));
      case FieldKind::STRUCT:
        return schema.getStruct(type.decl).size;
      case FieldKind::STRING:
      case FieldKind::VECTOR:
      case FieldKind::TABLE:
      case FieldKind::UNION:
        return sizeof(uoffset_t);
    }
    KJ_UNREACHABLE;
  }

  // ---------------------------------------------------------------------------------------------

  kj::Array<uint> referencedModules() {
    // Modules whose headers this one needs: everything included, plus the home of every type
    // referenced here, since lookup sees all modules of a compilation.
    std::set<uint> result(module.includes.begin(), module.includes.end());

    auto addType = [&](const Type& type) {
      const Type* t = &type;
      while (t->which == Type::VECTOR) t = t->element.get();
      if (t->which == Type::NAMED) result.insert(schema.getDecl(t->decl).module);
    };

    for (auto id: module.decls) {
      auto& decl = schema.getDecl(id);
      switch (decl.getKind()) {
        case DeclInfo::ENUM:
          break;
        case DeclInfo::UNION:
          for (auto& variant: decl.body.get<UnionInfo>().variants) {
            result.insert(schema.getDecl(variant.table).module);
          }
          break;
        case DeclInfo::STRUCT:
          for (auto& field: decl.body.get<StructInfo>().fields) addType(field.type);
          break;
        case DeclInfo::TABLE:
          for (auto& field: decl.body.get<TableInfo>().fields) addType(field.type);
          break;
        case DeclInfo::RPC_SERVICE:
          for (auto& method: decl.body.get<ServiceInfo>().methods) {
            result.insert(schema.getDecl(method.request).module);
            result.insert(schema.getDecl(method.response).module);
          }
          break;
      }
    }
    KJ_IF_MAYBE(root, module.rootType) {
      result.insert(schema.getDecl(*root).module);
    }

    result.erase(moduleIndex);
    return KJ_MAP(index, result) { return index; };
  }

  kj::Array<DeclId> structOrder() {
    // Structs of this module, each after the structs it contains.
    kj::Vector<DeclId> order;
    std::set<DeclId> visited;

    std::function<void(DeclId)> visit = [&](DeclId id) {
      if (!visited.insert(id).second) return;
      for (auto& field: schema.getStruct(id).fields) {
        if (field.type.which == Type::NAMED &&
            schema.getDecl(field.type.decl).getKind() == DeclInfo::STRUCT &&
            schema.getDecl(field.type.decl).module == moduleIndex) {
          visit(field.type.decl);
        }
      }
      order.add(id);
    };

    for (auto id: module.decls) {
      if (schema.getDecl(id).getKind() == DeclInfo::STRUCT) visit(id);
    }
    return order.releaseAsArray();
  }

  // ---------------------------------------------------------------------------------------------
  // Enums and union discriminants

  kj::StringTree genEnumHelpers(kj::StringPtr name, kj::StringPtr underlying,
                                kj::ArrayPtr<const kj::StringPtr> names,
                                kj::ArrayPtr<const kj::String> values,
                                kj::Maybe<kj::StringPtr> flagMask) {
    kj::StringTree checks;
    KJ_IF_MAYBE(mask, flagMask) {
      checks = kj::strTree(
          "  if ((value & ~", *mask, ") != 0) return nullptr;\n"
          "  return static_cast<", name, ">(value);\n");
    } else {
      kj::Vector<kj::StringTree> cases;
      for (auto& value: values) {
        cases.add(kj::strTree("    case ", value, ":\n"));
      }
      checks = kj::strTree(
          "  switch (value) {\n",
          kj::StringTree(cases.releaseAsArray(), ""),
          "      return static_cast<", name, ">(value);\n"
          "    default:\n"
          "      return nullptr;\n"
          "  }\n");
    }

    return kj::strTree(
        "inline kj::StringPtr KJ_STRINGIFY(", name, " value) {\n"
        "  switch (value) {\n",
        KJ_MAP(n, names) {
          return kj::strTree("    case ", name, "::", safeIdentifier(n),
                             ": return \"", n, "\";\n");
        },
        "  }\n"
        "  return \"(unknown)\";\n"
        "}\n"
        "\n"
        "inline kj::Maybe<", name, "> tryGet", name, "(", underlying, " value) {\n",
        kj::mv(checks),
        "}\n"
        "\n");
  }

  kj::StringTree genEnum(const DeclInfo& decl) {
    auto& info = decl.body.get<EnumInfo>();
    auto underlying = scalarCppType(info.underlying);

    auto names = KJ_MAP(v, info.variants) { return kj::StringPtr(v.name); };
    auto values = KJ_MAP(v, info.variants) { return integerLiteral(info.underlying, v.value); };

    kj::Maybe<kj::String> mask;
    kj::StringTree operators;
    if (info.bitFlags) {
      uint64_t bits = 0;
      for (auto& v: info.variants) bits |= v.value;
      mask = integerLiteral(info.underlying, bits);
      operators = kj::strTree(
          "inline ", decl.name, " operator|(", decl.name, " a, ", decl.name, " b) {\n"
          "  return static_cast<", decl.name, ">(static_cast<", underlying, ">(a) | "
              "static_cast<", underlying, ">(b));\n"
          "}\n"
          "inline ", decl.name, " operator&(", decl.name, " a, ", decl.name, " b) {\n"
          "  return static_cast<", decl.name, ">(static_cast<", underlying, ">(a) & "
              "static_cast<", underlying, ">(b));\n"
          "}\n"
          "\n");
    }

    kj::Maybe<kj::StringPtr> maskPtr;
    KJ_IF_MAYBE(m, mask) maskPtr = kj::StringPtr(*m);

    return kj::strTree(
        genDocs("", decl.docs),
        "enum class ", decl.name, ": ", underlying, " {\n",
        KJ_MAP(v, info.variants) {
          return kj::strTree(genDocs("  ", v.docs),
                             "  ", safeIdentifier(v.name), " = ",
                             integerLiteral(info.underlying, v.value), ",\n");
        },
        "};\n"
        "\n",
        kj::mv(operators),
        genEnumHelpers(decl.name, underlying, names, values, maskPtr));
  }

  kj::StringTree genUnionEnum(const DeclInfo& decl) {
    auto& info = decl.body.get<UnionInfo>();

    kj::Vector<kj::StringPtr> names;
    kj::Vector<kj::String> values;
    names.add("NONE");
    values.add(kj::str("0u"));
    for (auto& variant: info.variants) {
      names.add(variant.name);
      values.add(kj::str(variant.tag, "u"));
    }

    return kj::strTree(
        genDocs("", decl.docs),
        "enum class ", decl.name, ": uint8_t {\n"
        "  NONE = 0,\n",
        KJ_MAP(v, info.variants) {
          return kj::strTree(genDocs("  ", v.docs),
                             "  ", safeIdentifier(v.name), " = ", v.tag, ",\n");
        },
        "};\n"
        "\n",
        genEnumHelpers(decl.name, "uint8_t", names, values, nullptr));
  }

  // ---------------------------------------------------------------------------------------------
  // Structs

  kj::StringTree genStruct(const DeclInfo& decl) {
    auto& info = decl.body.get<StructInfo>();

    kj::Vector<kj::StringTree> members;
    kj::Vector<kj::StringTree> accessors;
    kj::Vector<kj::StringTree> params;
    kj::Vector<kj::StringTree> inits;
    kj::Vector<kj::StringTree> sets;

    for (uint i = 0; i < info.fields.size(); i++) {
      auto& field = info.fields[i];
      auto titleCase = toTitleCase(field.name);
      auto member = kj::str(toLowerCamelCase(field.name), '_');
      auto paramName = safeIdentifier(toLowerCamelCase(field.name));

      switch (fieldKind(field.type)) {
        case FieldKind::SCALAR: {
          auto type = scalarCppType(field.type.scalar);
          members.add(kj::strTree("  ::plank::WireValue<", type, "> ", member, ";\n"));
          accessors.add(kj::strTree(
              genDocs("  ", field.docs),
              "  inline ", type, " get", titleCase, "() const { return ", member, ".get(); }\n"
              "  inline void set", titleCase, "(", type, " value) { ", member, ".set(value); }\n"));
          params.add(kj::strTree(type, " ", paramName));
          break;
        }
        case FieldKind::ENUM: {
          auto type = qualifiedName(field.type.decl);
          auto underlying = scalarCppType(schema.getEnum(field.type.decl).underlying);
          members.add(kj::strTree("  ::plank::WireValue<", underlying, "> ", member, ";\n"));
          accessors.add(kj::strTree(
              genDocs("  ", field.docs),
              "  inline ", type, " get", titleCase, "() const {\n"
              "    return static_cast<", type, ">(", member, ".get());\n"
              "  }\n"
              "  inline void set", titleCase, "(", type, " value) {\n"
              "    ", member, ".set(static_cast<", underlying, ">(value));\n"
              "  }\n"));
          params.add(kj::strTree(type, " ", paramName));
          break;
        }
        case FieldKind::STRUCT: {
          auto type = qualifiedName(field.type.decl);
          members.add(kj::strTree("  ", type, " ", member, ";\n"));
          accessors.add(kj::strTree(
              genDocs("  ", field.docs),
              "  inline const ", type, "& get", titleCase, "() const { return ", member, "; }\n"
              "  inline ", type, "& get", titleCase, "() { return ", member, "; }\n"
              "  inline void set", titleCase, "(const ", type, "& value) { ", member,
                  " = value; }\n"));
          params.add(kj::strTree("const ", type, "& ", paramName));
          break;
        }
        case FieldKind::STRING:
        case FieldKind::VECTOR:
        case FieldKind::TABLE:
        case FieldKind::UNION:
          KJ_FAIL_ASSERT("struct field can't have this type", schema.typeName(field.type));
      }
      inits.add(kj::strTree(member, "()"));
      sets.add(kj::strTree("    set", titleCase, "(", paramName, ");\n"));

      if (field.paddingAfter > 0) {
        // Field members only have underscores at either end.
        auto padding = kj::str("padding_", i);
        members.add(kj::strTree("  uint8_t ", padding, "[", field.paddingAfter, "];\n"));
        inits.add(kj::strTree(padding, "()"));
      }
    }

    return kj::strTree(
        genDocs("", decl.docs),
        "struct alignas(", info.alignment, ") ", decl.name, " {\n"
        "  // Fixed-layout struct, stored inline.  The in-memory image is the wire image.\n"
        "\n"
        "  inline ", decl.name, "(): ", kj::StringTree(inits.releaseAsArray(), ", "), " {}\n"
        "  inline ", decl.name, "(", kj::StringTree(params.releaseAsArray(), ", "), "): ",
            decl.name, "() {\n",
        kj::StringTree(sets.releaseAsArray(), ""),
        "  }\n"
        "\n",
        kj::StringTree(accessors.releaseAsArray(), ""),
        "\n"
        "private:\n",
        kj::StringTree(members.releaseAsArray(), ""),
        "};\n"
        "static_assert(sizeof(", decl.name, ") == ", info.size, ",\n"
        "              \"struct ", decl.fullName, " has the wrong size\");\n"
        "static_assert(alignof(", decl.name, ") == ", info.alignment, ",\n"
        "              \"struct ", decl.fullName, " has the wrong alignment\");\n"
        "\n");
  }

  // ---------------------------------------------------------------------------------------------
  // Tables

  struct TableText {
    kj::StringTree outer;
    kj::StringTree classes;
    kj::StringTree inlineDefs;
  };

  struct FieldText {
    kj::StringTree constants;
    kj::StringTree readerDecls;
    kj::StringTree readerDefs;
    kj::StringTree builderDecls;
    kj::StringTree builderDefs;
    kj::StringTree argsMembers;
    kj::StringTree requireChecks;
  };

  struct CreateStep {
    // One call made by T::create(), ordered by inline size so that large fields are written
    // first and padding is minimized.
    uint size;
    kj::StringTree text;
  };

  FieldText genTableField(kj::StringPtr scope, const TableFieldInfo& field,
                          kj::Vector<CreateStep>& createSteps) {
    auto titleCase = toTitleCase(field.name);
    auto upperCase = toUpperCase(field.name);
    auto lowerCamel = toLowerCamelCase(field.name);
    auto argName = safeIdentifier(lowerCamel);
    auto vt = kj::str("VT_", upperCase);

    FieldText result;
    result.constants = kj::strTree(
        "  static constexpr ::plank::voffset_t ", vt, " = ", slotToVoffset(field.slot), ";\n");

    FieldKind kind = fieldKind(field.type);
    if (kind == FieldKind::UNION) {
      result.constants = kj::strTree(
          "  static constexpr ::plank::voffset_t ", vt, "_TYPE = ",
              slotToVoffset(field.typeSlot), ";\n",
          kj::mv(result.constants));
    }

    if (field.deprecated) {
      // Keeps its slot; no accessors.
      return result;
    }

    result.readerDecls = kj::strTree(
        genDocs("  ", field.docs),
        "  inline bool has", titleCase, "() const;\n");
    result.readerDefs = kj::strTree(
        "inline bool ", scope, "::Reader::has", titleCase, "() const {\n"
        "  return table.hasField(", vt, ");\n"
        "}\n");

    switch (kind) {
      case FieldKind::SCALAR:
      case FieldKind::ENUM: {
        auto wireType = scalarCppType(underlyingKind(field.type));
        auto defaultValue = scalarDefault(field.type, field.defaultValue);
        kj::String type;
        kj::String readExpr;
        kj::String writeExpr;
        kj::String argDefault;
        if (kind == FieldKind::ENUM) {
          type = qualifiedName(field.type.decl);
          readExpr = kj::str("static_cast<", type, ">(table.getScalar<", wireType, ">(", vt, ", ",
                             defaultValue, "))");
          writeExpr = kj::str("static_cast<", wireType, ">(value)");
          argDefault = enumValueExpr(field.type.decl, field.defaultValue.integer);
        } else {
          type = kj::heapString(wireType);
          readExpr = kj::str("table.getScalar<", wireType, ">(", vt, ", ", defaultValue, ")");
          writeExpr = kj::str("value");
          argDefault = kj::heapString(defaultValue);
        }

        result.readerDecls = kj::strTree(kj::mv(result.readerDecls),
            "  inline ", type, " get", titleCase, "() const;\n");
        result.readerDefs = kj::strTree(kj::mv(result.readerDefs),
            "inline ", type, " ", scope, "::Reader::get", titleCase, "() const {\n"
            "  return ", readExpr, ";\n"
            "}\n");
        result.builderDecls = kj::strTree(
            "  inline void set", titleCase, "(", type, " value);\n");
        result.builderDefs = kj::strTree(
            "inline void ", scope, "::Builder::set", titleCase, "(", type, " value) {\n"
            "  builder.addScalar<", wireType, ">(", vt, ", ", writeExpr, ", ", defaultValue, ");\n"
            "}\n");
        result.argsMembers = kj::strTree("  ", type, " ", argName, " = ", argDefault, ";\n");
        createSteps.add(CreateStep { inlineSize(field.type),
            kj::strTree("  result.set", titleCase, "(args.", argName, ");\n") });
        break;
      }

      case FieldKind::STRUCT: {
        auto type = qualifiedName(field.type.decl);
        result.readerDecls = kj::strTree(kj::mv(result.readerDecls),
            "  inline ", type, " get", titleCase, "() const;\n");
        result.readerDefs = kj::strTree(kj::mv(result.readerDefs),
            "inline ", type, " ", scope, "::Reader::get", titleCase, "() const {\n"
            "  return table.getStruct<", type, ">(", vt, ");\n"
            "}\n");
        result.builderDecls = kj::strTree(
            "  inline void set", titleCase, "(const ", type, "& value);\n");
        result.builderDefs = kj::strTree(
            "inline void ", scope, "::Builder::set", titleCase, "(const ", type, "& value) {\n"
            "  builder.addStruct(", vt, ", value);\n"
            "}\n");
        result.argsMembers = kj::strTree("  kj::Maybe<", type, "> ", argName, ";\n");
        createSteps.add(CreateStep { inlineSize(field.type), kj::strTree(
            "  KJ_IF_MAYBE(value, args.", argName, ") {\n"
            "    result.set", titleCase, "(*value);\n"
            "  }\n") });
        break;
      }

      case FieldKind::STRING:
      case FieldKind::VECTOR:
      case FieldKind::TABLE: {
        auto type = readerType(field.type);
        kj::String readExpr;
        if (kind == FieldKind::STRING) {
          readExpr = kj::str("table.getString(", vt, ")");
        } else if (kind == FieldKind::VECTOR) {
          readExpr = kj::str("table.getVector<", readerType(*field.type.element), ">(", vt, ")");
        } else {
          readExpr = kj::str(type, "(table.getTable(", vt, "))");
        }
        auto offset = offsetType(field.type);

        result.readerDecls = kj::strTree(kj::mv(result.readerDecls),
            "  inline ", type, " get", titleCase, "() const;\n");
        result.readerDefs = kj::strTree(kj::mv(result.readerDefs),
            "inline ", type, " ", scope, "::Reader::get", titleCase, "() const {\n"
            "  return ", readExpr, ";\n"
            "}\n");
        result.builderDecls = kj::strTree(
            "  inline void set", titleCase, "(", offset, " value);\n");
        result.builderDefs = kj::strTree(
            "inline void ", scope, "::Builder::set", titleCase, "(", offset, " value) {\n"
            "  builder.addOffset(", vt, ", value);\n"
            "}\n");
        result.argsMembers = kj::strTree("  ", offset, " ", argName, ";\n");
        createSteps.add(CreateStep { inlineSize(field.type),
            kj::strTree("  result.set", titleCase, "(args.", argName, ");\n") });
        break;
      }

      case FieldKind::UNION: {
        auto unionName = qualifiedName(field.type.decl);
        auto& unionInfo = schema.getUnion(field.type.decl);

        result.readerDecls = kj::strTree(kj::mv(result.readerDecls),
            "  inline ", unionName, " get", titleCase, "Type() const;\n",
            KJ_MAP(variant, unionInfo.variants) {
              return kj::strTree(
                  "  inline kj::Maybe<", qualifiedName(variant.table), "::Reader> get", titleCase,
                      "As", toTitleCase(variant.name), "() const;\n");
            });
        result.readerDefs = kj::strTree(kj::mv(result.readerDefs),
            "inline ", unionName, " ", scope, "::Reader::get", titleCase, "Type() const {\n"
            "  return static_cast<", unionName, ">(table.getScalar<uint8_t>(", vt, "_TYPE, 0));\n"
            "}\n",
            KJ_MAP(variant, unionInfo.variants) {
              auto table = qualifiedName(variant.table);
              return kj::strTree(
                  "inline kj::Maybe<", table, "::Reader> ", scope, "::Reader::get", titleCase,
                      "As", toTitleCase(variant.name), "() const {\n"
                  "  if (get", titleCase, "Type() != ", unionName, "::", safeIdentifier(variant.name),
                      ") {\n"
                  "    return nullptr;\n"
                  "  }\n"
                  "  return ", table, "::Reader(table.getTable(", vt, "));\n"
                  "}\n");
            });

        result.builderDecls = kj::strTree(
            "  inline void set", titleCase, "Type(", unionName, " value);\n"
            "  inline void set", titleCase, "(::plank::Offset<void> value);\n",
            KJ_MAP(variant, unionInfo.variants) {
              return kj::strTree(
                  "  inline void set", titleCase, "As", toTitleCase(variant.name),
                      "(::plank::Offset<", qualifiedName(variant.table), "> value);\n");
            });
        result.builderDefs = kj::strTree(
            "inline void ", scope, "::Builder::set", titleCase, "Type(", unionName, " value) {\n"
            "  builder.addScalar<uint8_t>(", vt, "_TYPE, static_cast<uint8_t>(value), 0);\n"
            "}\n"
            "inline void ", scope, "::Builder::set", titleCase, "(::plank::Offset<void> value) {\n"
            "  builder.addOffset(", vt, ", value);\n"
            "}\n",
            KJ_MAP(variant, unionInfo.variants) {
              return kj::strTree(
                  "inline void ", scope, "::Builder::set", titleCase, "As",
                      toTitleCase(variant.name), "(\n"
                  "    ::plank::Offset<", qualifiedName(variant.table), "> value) {\n"
                  "  set", titleCase, "Type(", unionName, "::", safeIdentifier(variant.name),
                      ");\n"
                  "  set", titleCase, "(value.cast<void>());\n"
                  "}\n");
            });

        result.argsMembers = kj::strTree(
            "  ", unionName, " ", lowerCamel, "Type = ", unionName, "::NONE;\n"
            "  ::plank::Offset<void> ", argName, ";\n");
        createSteps.add(CreateStep { sizeof(uoffset_t),
            kj::strTree("  result.set", titleCase, "(args.", argName, ");\n") });
        createSteps.add(CreateStep { 1,
            kj::strTree("  result.set", titleCase, "Type(args.", lowerCamel, "Type);\n") });
        break;
      }
    }

    if (field.required) {
      result.requireChecks = kj::strTree(
          "  builder.requireField(end, ", vt, ", \"", field.name, "\");\n");
    }

    return result;
  }

  TableText genTable(const DeclInfo& decl) {
    auto& info = decl.body.get<TableInfo>();
    auto scope = qualifiedName(decl.id);

    kj::Vector<CreateStep> createSteps;
    auto fields = KJ_MAP(field, info.fields) {
      return genTableField(scope, field, createSteps);
    };

    std::stable_sort(createSteps.begin(), createSteps.end(),
        [](const CreateStep& a, const CreateStep& b) { return a.size > b.size; });

    kj::StringTree keyDecl;
    kj::StringTree keyDef;
    KJ_IF_MAYBE(keyIndex, info.keyField) {
      auto& keyField = info.fields[*keyIndex];
      auto keyType = keyField.type.which == Type::STRING
          ? kj::str("kj::StringPtr") : kj::heapString(scalarCppType(keyField.type.scalar));
      keyDecl = kj::strTree(
          "\n"
          "  static kj::Maybe<Reader> lookupByKey(::plank::VectorReader<Reader> vector,\n"
          "                                       ", keyType, " key);\n"
          "  // Binary search by `", keyField.name, "`.  The vector must be sorted by it.\n");
      keyDef = kj::strTree(
          "inline kj::Maybe<", scope, "::Reader> ", scope, "::lookupByKey(\n"
          "    ::plank::VectorReader<Reader> vector, ", keyType, " key) {\n"
          "  return ::plank::_::lookupByKey(vector, key, [](Reader element) {\n"
          "    return element.get", toTitleCase(keyField.name), "();\n"
          "  });\n"
          "}\n");
    }

    TableText result;
    result.outer = kj::strTree(
        genDocs("", decl.docs),
        "struct ", decl.name, " {\n"
        "  ", decl.name, "() = delete;\n"
        "\n"
        "  class Reader;\n"
        "  class Builder;\n"
        "  struct Args;\n"
        "\n",
        KJ_MAP(f, fields) { return kj::mv(f.constants); },
        "\n"
        "  static ::plank::Offset<", decl.name, "> create(::plank::BufferBuilder& builder, "
            "const Args& args);\n",
        kj::mv(keyDecl),
        "};\n"
        "\n");

    result.classes = kj::strTree(
        "class ", decl.name, "::Reader {\n"
        "public:\n"
        "  Reader() = default;\n"
        "  inline explicit Reader(::plank::TableReader table): table(table) {}\n"
        "\n"
        "  inline bool isNull() const { return table.isNull(); }\n"
        "  inline ::plank::TableReader getTable() const { return table; }\n"
        "\n",
        KJ_MAP(f, fields) { return kj::mv(f.readerDecls); },
        "\n"
        "private:\n"
        "  ::plank::TableReader table;\n"
        "};\n"
        "\n"
        "class ", decl.name, "::Builder {\n"
        "public:\n"
        "  inline explicit Builder(::plank::BufferBuilder& builder)\n"
        "      : builder(builder), start(builder.startTable()) {}\n"
        "  KJ_DISALLOW_COPY(Builder);\n"
        "\n",
        KJ_MAP(f, fields) { return kj::mv(f.builderDecls); },
        "\n"
        "  inline ::plank::Offset<", decl.name, "> finish();\n"
        "  // Writes the table.  Throws if a required field wasn't set.\n"
        "\n"
        "private:\n"
        "  ::plank::BufferBuilder& builder;\n"
        "  ::plank::uoffset_t start;\n"
        "};\n"
        "\n"
        "struct ", decl.name, "::Args {\n",
        KJ_MAP(f, fields) { return kj::mv(f.argsMembers); },
        "};\n"
        "\n");

    result.inlineDefs = kj::strTree(
        KJ_MAP(f, fields) { return kj::mv(f.readerDefs); },
        KJ_MAP(f, fields) { return kj::mv(f.builderDefs); },
        "inline ::plank::Offset<", scope, "> ", scope, "::Builder::finish() {\n"
        "  auto end = builder.endTable(start);\n",
        KJ_MAP(f, fields) { return kj::mv(f.requireChecks); },
        "  return ::plank::Offset<", scope, ">(end);\n"
        "}\n"
        "inline ::plank::Offset<", scope, "> ", scope, "::create(\n"
        "    ::plank::BufferBuilder& builder, const Args& args) {\n"
        "  Builder result(builder);\n",
        KJ_MAP(step, createSteps) { return kj::mv(step.text); },
        "  return result.finish();\n"
        "}\n",
        kj::mv(keyDef),
        "\n");

    return result;
  }

  kj::StringTree genRootFunctions(const DeclInfo& decl) {
    auto name = qualifiedName(decl.id);
    auto upperCase = toUpperCase(decl.name);

    kj::StringTree identifier;
    kj::StringPtr finishArgs = "root";
    kj::String hasIdentifier;
    KJ_IF_MAYBE(id, module.fileIdentifier) {
      identifier = kj::strTree(
          "static constexpr char ", upperCase, "_IDENTIFIER[] = ", cppStringLiteral(*id), ";\n"
          "\n"
          "inline bool ", toLowerCamelCase(decl.name), "BufferHasIdentifier(\n"
          "    kj::ArrayPtr<const ::plank::byte> bytes) {\n"
          "  return ::plank::bufferHasIdentifier(bytes, ", upperCase, "_IDENTIFIER);\n"
          "}\n"
          "\n");
      hasIdentifier = kj::str("root, kj::StringPtr(", upperCase, "_IDENTIFIER)");
      finishArgs = hasIdentifier;
    }

    kj::StringTree extension;
    KJ_IF_MAYBE(ext, module.fileExtension) {
      extension = kj::strTree(
          "static constexpr char ", upperCase, "_EXTENSION[] = ", cppStringLiteral(*ext), ";\n"
          "\n");
    }

    return kj::strTree(
        kj::mv(identifier),
        kj::mv(extension),
        "inline ", name, "::Reader read", decl.name, "(kj::ArrayPtr<const ::plank::byte> bytes) {\n"
        "  return ", name, "::Reader(::plank::readRoot(bytes));\n"
        "}\n"
        "\n"
        "inline void finish", decl.name, "Buffer(\n"
        "    ::plank::BufferBuilder& builder, ::plank::Offset<", name, "> root) {\n"
        "  builder.finish(", finishArgs, ");\n"
        "}\n"
        "\n");
  }

  // ---------------------------------------------------------------------------------------------
  // RPC services

  struct ServiceText {
    kj::StringTree decls;
    kj::StringTree inlineDefs;
  };

  ServiceText genService(const DeclInfo& decl) {
    auto& info = decl.body.get<ServiceInfo>();
    auto scope = qualifiedName(decl.id);

    kj::Vector<kj::StringTree> clientDecls;
    kj::Vector<kj::StringTree> clientDefs;
    kj::Vector<kj::StringTree> serverDecls;
    kj::Vector<kj::StringTree> serverDefs;
    kj::Vector<kj::StringTree> dispatchCases;

    for (auto& method: info.methods) {
      auto methodName = safeMethodName(method.name);
      auto request = qualifiedName(method.request);
      auto response = qualifiedName(method.response);
      auto requestMessage = kj::str("::plank::Message<", request, ">");
      auto responseMessage = kj::str("::plank::Message<", response, ">");
      auto unimplemented = kj::strTree(
          "  return KJ_EXCEPTION(UNIMPLEMENTED, \"method not implemented\", \"",
              decl.fullName, "\", \"", method.name, "\");\n");

      kj::String clientReturn;
      kj::String clientParams;
      kj::String callExpr;
      kj::String serverReturn;
      kj::String serverParams;
      kj::StringTree serveExpr;

      switch (method.streaming) {
        case Streaming::NONE:
          clientReturn = kj::str("kj::Promise<", responseMessage, ">");
          clientParams = kj::str(requestMessage, "&& request");
          callExpr = kj::str("::plank::rpc::callUnary<", response, ">(\n"
              "      channel, \"", decl.fullName, "\", \"", method.name, "\", kj::mv(request))");
          serverReturn = kj::str("kj::Promise<", responseMessage, ">");
          serverParams = kj::str(requestMessage, "&& request");
          serveExpr = kj::strTree(
              "::plank::rpc::serveUnary<", request, ", ", response, ">(call,\n"
              "        [this](", requestMessage, "&& request) {\n"
              "      return ", methodName, "(kj::mv(request));\n"
              "    })");
          break;
        case Streaming::SERVER:
          clientReturn = kj::str("::plank::rpc::ResponseStream<", response, ">");
          clientParams = kj::str(requestMessage, "&& request");
          callExpr = kj::str("::plank::rpc::callServerStreaming<", response, ">(\n"
              "      channel, \"", decl.fullName, "\", \"", method.name, "\", kj::mv(request))");
          serverReturn = kj::str("kj::Promise<void>");
          serverParams = kj::str(requestMessage, "&& request,\n"
              "      ::plank::rpc::StreamWriter<", response, ">& responses");
          serveExpr = kj::strTree(
              "::plank::rpc::serveServerStreaming<", request, ", ", response, ">(call,\n"
              "        [this](", requestMessage, "&& request,\n"
              "               ::plank::rpc::StreamWriter<", response, ">& responses) {\n"
              "      return ", methodName, "(kj::mv(request), responses);\n"
              "    })");
          break;
        case Streaming::CLIENT:
          clientReturn = kj::str("::plank::rpc::RequestStream<", request, ", ", response, ">");
          clientParams = kj::str("");
          callExpr = kj::str("::plank::rpc::callClientStreaming<", request, ", ", response, ">(\n"
              "      channel, \"", decl.fullName, "\", \"", method.name, "\")");
          serverReturn = kj::str("kj::Promise<", responseMessage, ">");
          serverParams = kj::str("::plank::rpc::StreamReader<", request, ">& requests");
          serveExpr = kj::strTree(
              "::plank::rpc::serveClientStreaming<", request, ", ", response, ">(call,\n"
              "        [this](::plank::rpc::StreamReader<", request, ">& requests) {\n"
              "      return ", methodName, "(requests);\n"
              "    })");
          break;
        case Streaming::BIDI:
          clientReturn = kj::str("::plank::rpc::BidiStream<", request, ", ", response, ">");
          clientParams = kj::str("");
          callExpr = kj::str("::plank::rpc::callBidiStreaming<", request, ", ", response, ">(\n"
              "      channel, \"", decl.fullName, "\", \"", method.name, "\")");
          serverReturn = kj::str("kj::Promise<void>");
          serverParams = kj::str("::plank::rpc::StreamReader<", request, ">& requests,\n"
              "      ::plank::rpc::StreamWriter<", response, ">& responses");
          serveExpr = kj::strTree(
              "::plank::rpc::serveBidiStreaming<", request, ", ", response, ">(call,\n"
              "        [this](::plank::rpc::StreamReader<", request, ">& requests,\n"
              "               ::plank::rpc::StreamWriter<", response, ">& responses) {\n"
              "      return ", methodName, "(requests, responses);\n"
              "    })");
          break;
      }

      clientDecls.add(kj::strTree(
          genDocs("  ", method.docs),
          "  inline ", clientReturn, " ", methodName, "(", clientParams, ");\n"));
      clientDefs.add(kj::strTree(
          "inline ", clientReturn, " ", scope, "::Client::", methodName, "(", clientParams, ") {\n"
          "  return ", callExpr, ";\n"
          "}\n"));

      serverDecls.add(kj::strTree(
          genDocs("  ", method.docs),
          "  virtual ", serverReturn, " ", methodName, "(", serverParams, ");\n"));
      serverDefs.add(kj::strTree(
          "inline ", serverReturn, " ", scope, "::Server::", methodName, "(", serverParams, ") {\n",
          kj::mv(unimplemented),
          "}\n"));

      dispatchCases.add(kj::strTree(
          "  if (method == \"", method.name, "\") {\n"
          "    return ", kj::mv(serveExpr), ";\n"
          "  }\n"));
    }

    ServiceText result;
    result.decls = kj::strTree(
        genDocs("", decl.docs),
        "struct ", decl.name, " {\n"
        "  ", decl.name, "() = delete;\n"
        "\n"
        "  class Client;\n"
        "  class Server;\n"
        "};\n"
        "\n"
        "class ", decl.name, "::Client {\n"
        "public:\n"
        "  inline explicit Client(::plank::rpc::Channel& channel): channel(channel) {}\n"
        "\n",
        kj::StringTree(clientDecls.releaseAsArray(), ""),
        "\n"
        "private:\n"
        "  ::plank::rpc::Channel& channel;\n"
        "};\n"
        "\n"
        "class ", decl.name, "::Server: public ::plank::rpc::Service {\n"
        "  // Implement the methods you support; the others fail with UNIMPLEMENTED.\n"
        "\n"
        "public:\n"
        "  kj::StringPtr getServiceName() override { return \"", decl.fullName, "\"; }\n"
        "  kj::Maybe<kj::Promise<void>> dispatch(\n"
        "      kj::StringPtr method, ::plank::rpc::ServerCall& call) override;\n"
        "\n"
        "protected:\n",
        kj::StringTree(serverDecls.releaseAsArray(), ""),
        "};\n"
        "\n");

    result.inlineDefs = kj::strTree(
        kj::StringTree(clientDefs.releaseAsArray(), ""),
        kj::StringTree(serverDefs.releaseAsArray(), ""),
        "inline kj::Maybe<kj::Promise<void>> ", scope, "::Server::dispatch(\n"
        "    kj::StringPtr method, ::plank::rpc::ServerCall& call) {\n",
        kj::StringTree(dispatchCases.releaseAsArray(), ""),
        "  return nullptr;\n"
        "}\n"
        "\n");

    return result;
  }
};

}  // namespace

kj::String cppHeaderPath(kj::StringPtr sourceName) {
  return kj::str(sourceName, ".h");
}

kj::String generateCppHeader(const CompiledSchema& schema, const ModuleInfo& module) {
  return CppGenerator(schema, module).generate();
}

}  // namespace compiler
}  // namespace plank
