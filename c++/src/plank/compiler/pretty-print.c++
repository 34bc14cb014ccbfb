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

#include "pretty-print.h"
#include <kj/debug.h>
#include <kj/vector.h>
#include <math.h>

namespace plank {
namespace compiler {

namespace {

struct Indent {
  uint amount;
  Indent() = default;
  inline Indent(int amount): amount(amount) {}

  Indent next() {
    return Indent(amount + 2);
  }

  struct Iterator {
    uint i;
    Iterator() = default;
    inline Iterator(uint i): i(i) {}
    inline char operator*() const { return ' '; }
    inline Iterator& operator++() { ++i; return *this; }
    inline Iterator operator++(int) { Iterator result = *this; ++i; return result; }
    inline bool operator==(const Iterator& other) const { return i == other.i; }
    inline bool operator!=(const Iterator& other) const { return i != other.i; }
  };

  inline size_t size() const { return amount; }

  inline Iterator begin() const { return Iterator(0); }
  inline Iterator end() const { return Iterator(amount); }
};

inline Indent KJ_STRINGIFY(const Indent& indent) { return indent; }

kj::StringTree genDocs(Indent indent, kj::ArrayPtr<const kj::String> docs) {
  return kj::StringTree(KJ_MAP(line, docs) {
    if (line.size() == 0) {
      return kj::strTree(indent, "///\n");
    } else {
      return kj::strTree(indent, "/// ", line, "\n");
    }
  }, "");
}

kj::StringTree genAttributes(kj::ArrayPtr<const Attribute> attributes) {
  if (attributes.size() == 0) return kj::strTree();
  return kj::strTree(" (", kj::StringTree(KJ_MAP(attribute, attributes) {
    KJ_IF_MAYBE(value, attribute.value) {
      return kj::strTree(attribute.name, ": ", literalToString(*value));
    } else {
      return kj::strTree(attribute.name);
    }
  }, ", "), ")");
}

kj::StringTree genField(Indent indent, const Field& field) {
  kj::StringTree defaultValue;
  KJ_IF_MAYBE(value, field.defaultValue) {
    defaultValue = kj::strTree(" = ", literalToString(*value));
  }
  return kj::strTree(
      genDocs(indent, field.docs),
      indent, field.name, ":", typeExprToString(field.type), kj::mv(defaultValue),
      genAttributes(field.attributes), ";\n");
}

kj::StringTree genDeclaration(Indent indent, const Declaration& decl) {
  auto header = [&](kj::StringPtr keyword) {
    return kj::strTree(genDocs(indent, decl.docs), indent, keyword, " ", decl.name);
  };

  if (decl.body.is<TableDecl>() || decl.body.is<StructDecl>()) {
    bool isTable = decl.body.is<TableDecl>();
    auto& fields = isTable ? decl.body.get<TableDecl>().fields : decl.body.get<StructDecl>().fields;
    return kj::strTree(
        header(isTable ? "table" : "struct"), genAttributes(decl.attributes), " {\n",
        KJ_MAP(field, fields) { return genField(indent.next(), field); },
        indent, "}\n");
  } else if (decl.body.is<EnumDecl>()) {
    auto& enumDecl = decl.body.get<EnumDecl>();
    return kj::strTree(
        header("enum"), ":", typeExprToString(enumDecl.underlyingType),
        genAttributes(decl.attributes), " {\n",
        KJ_MAP(value, enumDecl.values) {
          kj::StringTree assigned;
          KJ_IF_MAYBE(v, value.value) {
            assigned = kj::strTree(" = ", literalToString(*v));
          }
          return kj::strTree(genDocs(indent.next(), value.docs), indent.next(), value.name,
                             kj::mv(assigned), genAttributes(value.attributes), ",\n");
        },
        indent, "}\n");
  } else if (decl.body.is<UnionDecl>()) {
    return kj::strTree(
        header("union"), genAttributes(decl.attributes), " {\n",
        KJ_MAP(variant, decl.body.get<UnionDecl>().variants) {
          kj::StringTree alias;
          KJ_IF_MAYBE(a, variant.alias) {
            alias = kj::strTree(*a, ": ");
          }
          return kj::strTree(genDocs(indent.next(), variant.docs), indent.next(), kj::mv(alias),
                             variant.type.name, genAttributes(variant.attributes), ",\n");
        },
        indent, "}\n");
  } else if (decl.body.is<RpcServiceDecl>()) {
    return kj::strTree(
        header("rpc_service"), genAttributes(decl.attributes), " {\n",
        KJ_MAP(method, decl.body.get<RpcServiceDecl>().methods) {
          return kj::strTree(genDocs(indent.next(), method.docs), indent.next(), method.name,
                             "(", method.request.name, "):", method.response.name,
                             genAttributes(method.attributes), ";\n");
        },
        indent, "}\n");
  }
  KJ_UNREACHABLE;
}

kj::StringTree genStatement(const Statement& statement) {
  if (statement.is<Include>()) {
    return kj::strTree("include ", escapeString(statement.get<Include>().path), ";\n");
  } else if (statement.is<NamespaceDirective>()) {
    auto& path = statement.get<NamespaceDirective>().path;
    if (path.size() == 0) return kj::strTree("\nnamespace;\n");
    return kj::strTree("\nnamespace ", joinPath(path), ";\n");
  } else if (statement.is<Declaration>()) {
    return kj::strTree("\n", genDeclaration(Indent(0), statement.get<Declaration>()));
  } else if (statement.is<RootType>()) {
    return kj::strTree("\nroot_type ", statement.get<RootType>().name, ";\n");
  } else if (statement.is<FileIdentifier>()) {
    return kj::strTree("file_identifier ", escapeString(statement.get<FileIdentifier>().value),
                       ";\n");
  } else if (statement.is<FileExtension>()) {
    return kj::strTree("file_extension ", escapeString(statement.get<FileExtension>().value),
                       ";\n");
  } else if (statement.is<AttributeDecl>()) {
    return kj::strTree("attribute ", escapeString(statement.get<AttributeDecl>().name), ";\n");
  }
  KJ_UNREACHABLE;
}

}  // namespace

kj::String escapeString(kj::StringPtr text) {
  kj::Vector<char> escaped(text.size() + 2);
  escaped.add('\"');
  for (char c: text) {
    switch (c) {
      case '\n': escaped.addAll(kj::StringPtr("\\n")); break;
      case '\r': escaped.addAll(kj::StringPtr("\\r")); break;
      case '\t': escaped.addAll(kj::StringPtr("\\t")); break;
      case '\\': escaped.addAll(kj::StringPtr("\\\\")); break;
      case '\"': escaped.addAll(kj::StringPtr("\\\"")); break;
      default:
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
          const char HEX[] = "0123456789abcdef";
          escaped.add('\\');
          escaped.add('x');
          escaped.add(HEX[static_cast<unsigned char>(c) >> 4]);
          escaped.add(HEX[static_cast<unsigned char>(c) & 0x0f]);
        } else {
          escaped.add(c);
        }
        break;
    }
  }
  escaped.add('\"');
  return kj::heapString(escaped.begin(), escaped.size());
}

kj::String floatToString(double value) {
  if (isnan(value)) return kj::str("nan");
  if (isinf(value)) return kj::str(value < 0 ? "-inf" : "inf");

  kj::String text = kj::str(value);
  for (char c: text) {
    if (c == '.' || c == 'e' || c == 'E') return text;
  }
  return kj::str(text, ".0");
}

kj::String literalToString(const Literal& literal) {
  switch (literal.which) {
    case Literal::INTEGER:
      return kj::str(literal.negative && literal.integer != 0 ? "-" : "", literal.integer);
    case Literal::FLOAT:
      if (isnan(literal.floating)) return kj::str("nan");
      return kj::str(literal.negative ? "-" : "", floatToString(literal.floating));
    case Literal::BOOLEAN:
      return kj::str(literal.boolean ? "true" : "false");
    case Literal::STRING:
      return escapeString(literal.text);
    case Literal::IDENTIFIER:
      return kj::heapString(literal.text);
  }
  KJ_UNREACHABLE;
}

kj::String typeExprToString(const TypeExpr& type) {
  switch (type.which) {
    case TypeExpr::SCALAR: return kj::str(type.scalar);
    case TypeExpr::STRING: return kj::str("string");
    case TypeExpr::VECTOR: return kj::str("[", typeExprToString(*type.element), "]");
    case TypeExpr::NAMED: return kj::heapString(type.name);
  }
  KJ_UNREACHABLE;
}

kj::String prettyPrint(const Schema& schema) {
  return kj::StringTree(KJ_MAP(statement, schema.statements) {
    return genStatement(statement);
  }, "").flatten();
}

}  // namespace compiler
}  // namespace plank
