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

#include "ir.h"
#include <kj/debug.h>

namespace plank {
namespace compiler {

Type Type::clone() const {
  Type result;
  result.which = which;
  result.scalar = scalar;
  result.decl = decl;
  if (which == VECTOR) {
    result.element = kj::heap<Type>(element->clone());
  }
  return result;
}

kj::Maybe<const EnumVariantInfo&> EnumInfo::findByValue(uint64_t value) const {
  for (auto& variant: variants) {
    if (variant.value == value) return variant;
  }
  return nullptr;
}

kj::Maybe<const EnumVariantInfo&> EnumInfo::findByName(kj::StringPtr name) const {
  for (auto& variant: variants) {
    if (variant.name == name) return variant;
  }
  return nullptr;
}

kj::StringPtr KJ_STRINGIFY(Streaming streaming) {
  switch (streaming) {
    case Streaming::NONE: return "none";
    case Streaming::SERVER: return "server";
    case Streaming::CLIENT: return "client";
    case Streaming::BIDI: return "bidi";
  }
  KJ_UNREACHABLE;
}

DeclInfo::Kind DeclInfo::getKind() const {
  if (body.is<EnumInfo>()) return ENUM;
  if (body.is<UnionInfo>()) return UNION;
  if (body.is<StructInfo>()) return STRUCT;
  if (body.is<TableInfo>()) return TABLE;
  if (body.is<ServiceInfo>()) return RPC_SERVICE;
  KJ_UNREACHABLE;
}

const DeclInfo& CompiledSchema::getDecl(DeclId id) const {
  KJ_REQUIRE(id < decls.size(), "no such declaration", id);
  return decls[id];
}

kj::Maybe<const DeclInfo&> CompiledSchema::findDecl(kj::StringPtr fullName) const {
  for (auto& decl: decls) {
    if (decl.fullName == fullName) return decl;
  }
  return nullptr;
}

kj::Maybe<const ModuleInfo&> CompiledSchema::findModule(kj::StringPtr sourceName) const {
  for (auto& module: modules) {
    if (module.sourceName == sourceName) return module;
  }
  return nullptr;
}

bool CompiledSchema::isScalarLike(const Type& type) const {
  return type.which == Type::SCALAR ||
      (type.which == Type::NAMED && getDecl(type.decl).getKind() == DeclInfo::ENUM);
}

kj::String CompiledSchema::typeName(const Type& type) const {
  switch (type.which) {
    case Type::SCALAR: return kj::str(type.scalar);
    case Type::STRING: return kj::str("string");
    case Type::VECTOR: return kj::str("[", typeName(*type.element), "]");
    case Type::NAMED: return kj::heapString(getDecl(type.decl).fullName);
  }
  KJ_UNREACHABLE;
}

}  // namespace compiler
}  // namespace plank
