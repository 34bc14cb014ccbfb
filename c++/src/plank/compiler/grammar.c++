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

#include "grammar.h"
#include <kj/debug.h>
#include <math.h>

namespace plank {
namespace compiler {

namespace {

struct ScalarName {
  const char* name;
  ScalarKind kind;
};

static const ScalarName SCALAR_NAMES[] = {
  { "bool", ScalarKind::BOOL },
  { "byte", ScalarKind::INT8 },
  { "int8", ScalarKind::INT8 },
  { "ubyte", ScalarKind::UINT8 },
  { "uint8", ScalarKind::UINT8 },
  { "short", ScalarKind::INT16 },
  { "int16", ScalarKind::INT16 },
  { "ushort", ScalarKind::UINT16 },
  { "uint16", ScalarKind::UINT16 },
  { "int", ScalarKind::INT32 },
  { "int32", ScalarKind::INT32 },
  { "uint", ScalarKind::UINT32 },
  { "uint32", ScalarKind::UINT32 },
  { "long", ScalarKind::INT64 },
  { "int64", ScalarKind::INT64 },
  { "ulong", ScalarKind::UINT64 },
  { "uint64", ScalarKind::UINT64 },
  { "float", ScalarKind::FLOAT32 },
  { "float32", ScalarKind::FLOAT32 },
  { "double", ScalarKind::FLOAT64 },
  { "float64", ScalarKind::FLOAT64 },
};

template <typename T>
bool arraysEqual(kj::ArrayPtr<const T> a, kj::ArrayPtr<const T> b,
                 bool (*equal)(const T&, const T&)) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); i++) {
    if (!equal(a[i], b[i])) return false;
  }
  return true;
}

bool stringsEqual(const kj::String& a, const kj::String& b) { return a == b; }

bool pathsEqual(kj::ArrayPtr<const kj::String> a, kj::ArrayPtr<const kj::String> b) {
  return arraysEqual(a, b, &stringsEqual);
}

template <typename T>
bool maybesEqual(const kj::Maybe<T>& a, const kj::Maybe<T>& b) {
  KJ_IF_MAYBE(x, a) {
    KJ_IF_MAYBE(y, b) {
      return *x == *y;
    } else {
      return false;
    }
  } else {
    return b == nullptr;
  }
}

bool maybeStringsEqual(const kj::Maybe<kj::String>& a, const kj::Maybe<kj::String>& b) {
  KJ_IF_MAYBE(x, a) {
    KJ_IF_MAYBE(y, b) {
      return *x == *y;
    } else {
      return false;
    }
  } else {
    return b == nullptr;
  }
}

bool attributeEqual(const Attribute& a, const Attribute& b) { return a == b; }

bool attributesEqual(kj::ArrayPtr<const Attribute> a, kj::ArrayPtr<const Attribute> b) {
  return arraysEqual(a, b, &attributeEqual);
}

bool fieldEqual(const Field& a, const Field& b) {
  return pathsEqual(a.docs, b.docs) && a.name == b.name && a.type == b.type &&
         maybesEqual(a.defaultValue, b.defaultValue) &&
         attributesEqual(a.attributes, b.attributes);
}

bool enumValueEqual(const EnumValue& a, const EnumValue& b) {
  return pathsEqual(a.docs, b.docs) && a.name == b.name && maybesEqual(a.value, b.value) &&
         attributesEqual(a.attributes, b.attributes);
}

bool variantEqual(const UnionVariant& a, const UnionVariant& b) {
  return pathsEqual(a.docs, b.docs) && maybeStringsEqual(a.alias, b.alias) &&
         a.type == b.type && attributesEqual(a.attributes, b.attributes);
}

bool methodEqual(const RpcMethod& a, const RpcMethod& b) {
  return pathsEqual(a.docs, b.docs) && a.name == b.name && a.request == b.request &&
         a.response == b.response && attributesEqual(a.attributes, b.attributes);
}

bool bodyEqual(const kj::OneOf<EnumDecl, UnionDecl, StructDecl, TableDecl, RpcServiceDecl>& a,
               const kj::OneOf<EnumDecl, UnionDecl, StructDecl, TableDecl, RpcServiceDecl>& b) {
  if (a.is<EnumDecl>()) {
    if (!b.is<EnumDecl>()) return false;
    auto& x = a.get<EnumDecl>();
    auto& y = b.get<EnumDecl>();
    return x.underlyingType == y.underlyingType &&
           arraysEqual<EnumValue>(x.values, y.values, &enumValueEqual);
  } else if (a.is<UnionDecl>()) {
    if (!b.is<UnionDecl>()) return false;
    return arraysEqual<UnionVariant>(a.get<UnionDecl>().variants, b.get<UnionDecl>().variants,
                                     &variantEqual);
  } else if (a.is<StructDecl>()) {
    if (!b.is<StructDecl>()) return false;
    return arraysEqual<Field>(a.get<StructDecl>().fields, b.get<StructDecl>().fields,
                              &fieldEqual);
  } else if (a.is<TableDecl>()) {
    if (!b.is<TableDecl>()) return false;
    return arraysEqual<Field>(a.get<TableDecl>().fields, b.get<TableDecl>().fields,
                              &fieldEqual);
  } else if (a.is<RpcServiceDecl>()) {
    if (!b.is<RpcServiceDecl>()) return false;
    return arraysEqual<RpcMethod>(a.get<RpcServiceDecl>().methods,
                                  b.get<RpcServiceDecl>().methods, &methodEqual);
  }
  KJ_UNREACHABLE;
}

bool statementEqual(const Statement& a, const Statement& b) {
  if (a.is<Include>()) {
    return b.is<Include>() && a.get<Include>().path == b.get<Include>().path;
  } else if (a.is<NamespaceDirective>()) {
    return b.is<NamespaceDirective>() &&
           pathsEqual(a.get<NamespaceDirective>().path, b.get<NamespaceDirective>().path);
  } else if (a.is<Declaration>()) {
    return b.is<Declaration>() && a.get<Declaration>() == b.get<Declaration>();
  } else if (a.is<RootType>()) {
    return b.is<RootType>() && a.get<RootType>().name == b.get<RootType>().name;
  } else if (a.is<FileIdentifier>()) {
    return b.is<FileIdentifier>() &&
           a.get<FileIdentifier>().value == b.get<FileIdentifier>().value;
  } else if (a.is<FileExtension>()) {
    return b.is<FileExtension>() &&
           a.get<FileExtension>().value == b.get<FileExtension>().value;
  } else if (a.is<AttributeDecl>()) {
    return b.is<AttributeDecl>() && a.get<AttributeDecl>().name == b.get<AttributeDecl>().name;
  }
  KJ_UNREACHABLE;
}

}  // namespace

kj::Maybe<ScalarKind> scalarKindFromName(kj::StringPtr name) {
  for (auto& entry: SCALAR_NAMES) {
    if (name == entry.name) return entry.kind;
  }
  return nullptr;
}

kj::StringPtr KJ_STRINGIFY(ScalarKind kind) {
  switch (kind) {
    case ScalarKind::BOOL: return "bool";
    case ScalarKind::INT8: return "int8";
    case ScalarKind::UINT8: return "uint8";
    case ScalarKind::INT16: return "int16";
    case ScalarKind::UINT16: return "uint16";
    case ScalarKind::INT32: return "int32";
    case ScalarKind::UINT32: return "uint32";
    case ScalarKind::INT64: return "int64";
    case ScalarKind::UINT64: return "uint64";
    case ScalarKind::FLOAT32: return "float32";
    case ScalarKind::FLOAT64: return "float64";
  }
  KJ_UNREACHABLE;
}

uint scalarSize(ScalarKind kind) {
  switch (kind) {
    case ScalarKind::BOOL:
    case ScalarKind::INT8:
    case ScalarKind::UINT8:
      return 1;
    case ScalarKind::INT16:
    case ScalarKind::UINT16:
      return 2;
    case ScalarKind::INT32:
    case ScalarKind::UINT32:
    case ScalarKind::FLOAT32:
      return 4;
    case ScalarKind::INT64:
    case ScalarKind::UINT64:
    case ScalarKind::FLOAT64:
      return 8;
  }
  KJ_UNREACHABLE;
}

bool isInteger(ScalarKind kind) {
  return kind != ScalarKind::BOOL && !isFloat(kind);
}

bool isSigned(ScalarKind kind) {
  switch (kind) {
    case ScalarKind::INT8:
    case ScalarKind::INT16:
    case ScalarKind::INT32:
    case ScalarKind::INT64:
    case ScalarKind::FLOAT32:
    case ScalarKind::FLOAT64:
      return true;
    default:
      return false;
  }
}

bool isFloat(ScalarKind kind) {
  return kind == ScalarKind::FLOAT32 || kind == ScalarKind::FLOAT64;
}

bool operator==(const Literal& a, const Literal& b) {
  if (a.which != b.which) return false;
  switch (a.which) {
    case Literal::INTEGER:
      // -0 and 0 are the same number.
      return a.integer == b.integer && (a.negative == b.negative || a.integer == 0);
    case Literal::FLOAT:
      if (isnan(a.floating)) return isnan(b.floating);
      return a.negative == b.negative && a.floating == b.floating;
    case Literal::BOOLEAN:
      return a.boolean == b.boolean;
    case Literal::STRING:
    case Literal::IDENTIFIER:
      return a.text == b.text;
  }
  KJ_UNREACHABLE;
}

bool operator==(const TypeExpr& a, const TypeExpr& b) {
  if (a.which != b.which) return false;
  switch (a.which) {
    case TypeExpr::SCALAR: return a.scalar == b.scalar;
    case TypeExpr::STRING: return true;
    case TypeExpr::VECTOR: return *a.element == *b.element;
    case TypeExpr::NAMED: return a.name == b.name;
  }
  KJ_UNREACHABLE;
}

bool operator==(const Attribute& a, const Attribute& b) {
  return a.name == b.name && maybesEqual(a.value, b.value);
}

bool operator==(const Declaration& a, const Declaration& b) {
  return a.name == b.name && pathsEqual(a.namespacePath, b.namespacePath) &&
         pathsEqual(a.docs, b.docs) && attributesEqual(a.attributes, b.attributes) &&
         bodyEqual(a.body, b.body);
}

bool operator==(const Schema& a, const Schema& b) {
  return arraysEqual<Statement>(a.statements, b.statements, &statementEqual);
}

kj::String joinPath(kj::ArrayPtr<const kj::String> parts) {
  return kj::strArray(parts, ".");
}

kj::Maybe<const Attribute&> findAttribute(kj::ArrayPtr<const Attribute> attributes,
                                          kj::StringPtr name) {
  for (auto& attribute: attributes) {
    if (attribute.name == name) return attribute;
  }
  return nullptr;
}

}  // namespace compiler
}  // namespace plank
