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

#include "../common.h"
#include <kj/string.h>
#include <kj/array.h>
#include <kj/memory.h>
#include <kj/one-of.h>

namespace plank {
namespace compiler {

// Syntax tree of one schema file, as produced by the parser.  Nodes are built once and never
// modified.  Every node records the byte span of the text it came from so that later stages can
// report errors against it.  Names are kept exactly as written; nothing here is resolved.

enum class ScalarKind: uint8_t {
  BOOL,
  INT8,
  UINT8,
  INT16,
  UINT16,
  INT32,
  UINT32,
  INT64,
  UINT64,
  FLOAT32,
  FLOAT64
};

kj::Maybe<ScalarKind> scalarKindFromName(kj::StringPtr name);
// Accepts both spellings, e.g. "short" and "int16".

kj::StringPtr KJ_STRINGIFY(ScalarKind kind);
// The sized spelling, e.g. "int16".

uint scalarSize(ScalarKind kind);
bool isInteger(ScalarKind kind);
bool isSigned(ScalarKind kind);
bool isFloat(ScalarKind kind);

struct Literal {
  enum Which: uint8_t {
    INTEGER,
    FLOAT,       // including nan and inf
    BOOLEAN,
    STRING,
    IDENTIFIER   // an enum variant name, possibly dotted
  };

  Which which;
  bool negative = false;
  uint64_t integer = 0;
  double floating = 0;
  // Magnitudes; the sign is in `negative`.
  bool boolean = false;
  kj::String text;

  uint32_t startByte = 0;
  uint32_t endByte = 0;
};

struct TypeExpr {
  enum Which: uint8_t {
    SCALAR,
    STRING,
    VECTOR,
    NAMED
  };

  Which which;
  ScalarKind scalar = ScalarKind::BOOL;
  kj::String name;
  // For NAMED, the (possibly dotted) name as written.
  kj::Own<TypeExpr> element;
  // For VECTOR.

  uint32_t startByte = 0;
  uint32_t endByte = 0;
};

struct Attribute {
  kj::String name;
  kj::Maybe<Literal> value;

  uint32_t startByte = 0;
  uint32_t endByte = 0;
};

struct Field {
  kj::Array<kj::String> docs;
  kj::String name;
  TypeExpr type;
  kj::Maybe<Literal> defaultValue;
  kj::Array<Attribute> attributes;

  uint32_t startByte = 0;
  uint32_t endByte = 0;
};

struct EnumValue {
  kj::Array<kj::String> docs;
  kj::String name;
  kj::Maybe<Literal> value;
  kj::Array<Attribute> attributes;

  uint32_t startByte = 0;
  uint32_t endByte = 0;
};

struct UnionVariant {
  kj::Array<kj::String> docs;
  kj::Maybe<kj::String> alias;
  // `Alias: Type` form.  Without an alias the variant is named after its type.
  TypeExpr type;
  kj::Array<Attribute> attributes;

  uint32_t startByte = 0;
  uint32_t endByte = 0;
};

struct RpcMethod {
  kj::Array<kj::String> docs;
  kj::String name;
  TypeExpr request;
  TypeExpr response;
  kj::Array<Attribute> attributes;

  uint32_t startByte = 0;
  uint32_t endByte = 0;
};

struct EnumDecl {
  TypeExpr underlyingType;
  kj::Array<EnumValue> values;
};

struct UnionDecl {
  kj::Array<UnionVariant> variants;
};

struct StructDecl {
  kj::Array<Field> fields;
};

struct TableDecl {
  kj::Array<Field> fields;
};

struct RpcServiceDecl {
  kj::Array<RpcMethod> methods;
};

struct Declaration {
  kj::String name;
  kj::Array<kj::String> namespacePath;
  // The namespace in effect where the declaration appears, captured by the parser.
  kj::Array<kj::String> docs;
  kj::Array<Attribute> attributes;

  kj::OneOf<EnumDecl, UnionDecl, StructDecl, TableDecl, RpcServiceDecl> body;

  uint32_t nameStartByte = 0;
  uint32_t nameEndByte = 0;
  uint32_t startByte = 0;
  uint32_t endByte = 0;
};

struct Include {
  kj::String path;
  uint32_t startByte = 0;
  uint32_t endByte = 0;
};

struct NamespaceDirective {
  kj::Array<kj::String> path;
  // Empty for `namespace;`, which returns to the root namespace.
  uint32_t startByte = 0;
  uint32_t endByte = 0;
};

struct RootType {
  kj::String name;
  uint32_t startByte = 0;
  uint32_t endByte = 0;
};

struct FileIdentifier {
  kj::String value;
  uint32_t startByte = 0;
  uint32_t endByte = 0;
};

struct FileExtension {
  kj::String value;
  uint32_t startByte = 0;
  uint32_t endByte = 0;
};

struct AttributeDecl {
  kj::String name;
  uint32_t startByte = 0;
  uint32_t endByte = 0;
};

typedef kj::OneOf<Include, NamespaceDirective, Declaration, RootType, FileIdentifier,
                  FileExtension, AttributeDecl> Statement;

struct Schema {
  kj::Array<Statement> statements;
};

// Structural equality, ignoring source positions.
bool operator==(const Literal& a, const Literal& b);
bool operator==(const TypeExpr& a, const TypeExpr& b);
bool operator==(const Attribute& a, const Attribute& b);
bool operator==(const Declaration& a, const Declaration& b);
bool operator==(const Schema& a, const Schema& b);

inline bool operator!=(const Schema& a, const Schema& b) { return !(a == b); }

kj::String joinPath(kj::ArrayPtr<const kj::String> parts);
// "a.b.c"

kj::Maybe<const Attribute&> findAttribute(kj::ArrayPtr<const Attribute> attributes,
                                          kj::StringPtr name);

}  // namespace compiler
}  // namespace plank
