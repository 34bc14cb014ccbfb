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
#include <kj/string.h>
#include <kj/array.h>
#include <kj/memory.h>
#include <kj/one-of.h>

namespace plank {
namespace compiler {

// Fully resolved and validated form of a compilation: every declaration of every module, with
// references turned into DeclIds and all layout decisions made.  Built once by NodeTranslator
// and never modified.  Code generators read nothing else.

typedef uint DeclId;
// Index into CompiledSchema::decls.  Assigned in canonical order: modules sorted by source name,
// declarations in source order.

struct Type {
  enum Which: uint8_t {
    SCALAR,
    STRING,
    VECTOR,
    NAMED
  };

  Which which = SCALAR;
  ScalarKind scalar = ScalarKind::BOOL;
  DeclId decl = 0;
  // For NAMED.
  kj::Own<Type> element;
  // For VECTOR.

  Type clone() const;
};

struct Value {
  // Default value of a table field.

  enum Which: uint8_t {
    NONE,      // non-scalar fields
    BOOLEAN,
    INTEGER,   // integer and enum fields
    FLOAT
  };

  Which which = NONE;
  bool boolean = false;
  uint64_t integer = 0;
  // Two's complement bits; interpret according to the field's type.
  double floating = 0;
};

struct EnumVariantInfo {
  kj::String name;
  uint64_t value;
  // Two's complement bits of the stored value.  For bit_flags enums this is the flag itself,
  // i.e. `1 << position`.
  kj::Array<kj::String> docs;
};

struct EnumInfo {
  ScalarKind underlying;
  bool bitFlags = false;
  kj::Array<EnumVariantInfo> variants;

  kj::Maybe<const EnumVariantInfo&> findByValue(uint64_t value) const;
  kj::Maybe<const EnumVariantInfo&> findByName(kj::StringPtr name) const;
};

struct UnionVariantInfo {
  kj::String name;
  uint8_t tag;
  // Discriminant value: 1 for the first variant.  0 means no value.
  DeclId table;
  kj::Array<kj::String> docs;
};

struct UnionInfo {
  kj::Array<UnionVariantInfo> variants;
};

struct StructFieldInfo {
  kj::String name;
  Type type;
  uint offset;
  uint size;
  uint alignment;
  uint paddingAfter;
  // Bytes between the end of this field and the next field (or the end of the struct).
  kj::Array<kj::String> docs;
};

struct StructInfo {
  kj::Array<StructFieldInfo> fields;
  uint size = 0;
  uint alignment = 1;
};

struct TableFieldInfo {
  kj::String name;
  Type type;
  uint slot;
  uint typeSlot = 0;
  // For union fields, the slot of the discriminant.  `slot` holds the value.
  Value defaultValue;
  bool required = false;
  bool deprecated = false;
  bool key = false;
  kj::Array<kj::String> docs;
};

struct TableInfo {
  kj::Array<TableFieldInfo> fields;
  kj::Maybe<uint> keyField;
  // Index into `fields`.
  uint slotCount = 0;
};

enum class Streaming: uint8_t {
  NONE,
  SERVER,
  CLIENT,
  BIDI
};

kj::StringPtr KJ_STRINGIFY(Streaming streaming);

struct RpcMethodInfo {
  kj::String name;
  DeclId request;
  DeclId response;
  Streaming streaming = Streaming::NONE;
  kj::Array<kj::String> docs;
};

struct ServiceInfo {
  kj::Array<RpcMethodInfo> methods;
};

struct DeclInfo {
  enum Kind: uint8_t {
    ENUM,
    UNION,
    STRUCT,
    TABLE,
    RPC_SERVICE
  };

  DeclId id;
  kj::String name;
  kj::Array<kj::String> namespacePath;
  kj::String fullName;
  uint module;
  // Index into CompiledSchema::modules.
  kj::Array<kj::String> docs;

  kj::OneOf<EnumInfo, UnionInfo, StructInfo, TableInfo, ServiceInfo> body;

  Kind getKind() const;
};

struct ModuleInfo {
  kj::String sourceName;
  kj::Array<uint> includes;
  // Directly included modules.
  kj::Array<DeclId> decls;
  kj::Maybe<DeclId> rootType;
  kj::Maybe<kj::String> fileIdentifier;
  kj::Maybe<kj::String> fileExtension;
};

class CompiledSchema {
public:
  CompiledSchema(kj::Array<DeclInfo> decls, kj::Array<ModuleInfo> modules)
      : decls(kj::mv(decls)), modules(kj::mv(modules)) {}
  KJ_DISALLOW_COPY(CompiledSchema);

  inline kj::ArrayPtr<const DeclInfo> getDecls() const { return decls; }
  inline kj::ArrayPtr<const ModuleInfo> getModules() const { return modules; }

  const DeclInfo& getDecl(DeclId id) const;
  kj::Maybe<const DeclInfo&> findDecl(kj::StringPtr fullName) const;
  kj::Maybe<const ModuleInfo&> findModule(kj::StringPtr sourceName) const;

  inline const EnumInfo& getEnum(DeclId id) const { return getDecl(id).body.get<EnumInfo>(); }
  inline const UnionInfo& getUnion(DeclId id) const { return getDecl(id).body.get<UnionInfo>(); }
  inline const StructInfo& getStruct(DeclId id) const {
    return getDecl(id).body.get<StructInfo>();
  }
  inline const TableInfo& getTable(DeclId id) const { return getDecl(id).body.get<TableInfo>(); }

  bool isScalarLike(const Type& type) const;
  // Scalars and enums: the types stored inline as a single number.

  kj::String typeName(const Type& type) const;
  // Schema spelling with fully-qualified names, e.g. "[example.Monster]".

private:
  kj::Array<DeclInfo> decls;
  kj::Array<ModuleInfo> modules;
};

}  // namespace compiler
}  // namespace plank
