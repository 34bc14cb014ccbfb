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

#include "node-translator.h"
#include "codegen.h"
#include "pretty-print.h"
#include <kj/debug.h>
#include <kj/vector.h>
#include <cfloat>
#include <cmath>
#include <map>

namespace plank {
namespace compiler {

uint64_t alignUp(uint64_t offset, uint alignment) {
  return (offset + alignment - 1) & ~uint64_t(alignment - 1);
}

namespace {

enum class Placement: uint8_t {
  TABLE,
  STRUCT,
  ENUM,
  ENUM_VALUE,
  UNION,
  UNION_VARIANT,
  TABLE_FIELD,
  STRUCT_FIELD,
  RPC_SERVICE,
  RPC_METHOD
};

kj::StringPtr placementName(Placement placement) {
  switch (placement) {
    case Placement::TABLE: return "tables";
    case Placement::STRUCT: return "structs";
    case Placement::ENUM: return "enums";
    case Placement::ENUM_VALUE: return "enum values";
    case Placement::UNION: return "unions";
    case Placement::UNION_VARIANT: return "union variants";
    case Placement::TABLE_FIELD: return "table fields";
    case Placement::STRUCT_FIELD: return "struct fields";
    case Placement::RPC_SERVICE: return "rpc services";
    case Placement::RPC_METHOD: return "rpc methods";
  }
  KJ_UNREACHABLE;
}

struct BuiltinAttribute {
  const char* name;
  Placement placement;
};

static const BuiltinAttribute BUILTIN_ATTRIBUTES[] = {
  { "id", Placement::TABLE_FIELD },
  { "deprecated", Placement::TABLE_FIELD },
  { "required", Placement::TABLE_FIELD },
  { "key", Placement::TABLE_FIELD },
  { "force_align", Placement::STRUCT },
  { "bit_flags", Placement::ENUM },
  { "streaming", Placement::RPC_METHOD },
};

kj::StringPtr kindName(DeclInfo::Kind kind) {
  switch (kind) {
    case DeclInfo::ENUM: return "an enum";
    case DeclInfo::UNION: return "a union";
    case DeclInfo::STRUCT: return "a struct";
    case DeclInfo::TABLE: return "a table";
    case DeclInfo::RPC_SERVICE: return "an rpc_service";
  }
  KJ_UNREACHABLE;
}

bool fitsInteger(ScalarKind kind, bool negative, uint64_t magnitude) {
  uint bits = scalarSize(kind) * 8;
  if (negative && magnitude != 0) {
    return isSigned(kind) && magnitude <= (uint64_t(1) << (bits - 1));
  } else if (isSigned(kind)) {
    return magnitude <= (uint64_t(1) << (bits - 1)) - 1;
  } else {
    return bits == 64 || magnitude <= (uint64_t(1) << bits) - 1;
  }
}

inline uint64_t toBits(bool negative, uint64_t magnitude) {
  return negative ? ~magnitude + 1 : magnitude;
}

inline bool signedLess(bool aNegative, uint64_t a, bool bNegative, uint64_t b) {
  // Compares two sign-magnitude numbers.  Zero must not be marked negative.
  if (aNegative != bNegative) return aNegative;
  return aNegative ? a > b : a < b;
}

kj::String numberToString(bool negative, uint64_t magnitude) {
  return kj::str(negative ? "-" : "", magnitude);
}

kj::String defaultVariantName(kj::StringPtr typeName) {
  // A union variant without an alias is named after its type, dots becoming underscores.
  auto result = kj::heapString(typeName);
  for (auto& c: result) {
    if (c == '.') c = '_';
  }
  return result;
}

kj::StringPtr lastComponent(kj::StringPtr name) {
  KJ_IF_MAYBE(pos, name.findLast('.')) {
    return name.slice(*pos + 1);
  } else {
    return name;
  }
}

kj::Array<kj::String> copyStrings(kj::ArrayPtr<const kj::String> strings) {
  return KJ_MAP(s, strings) { return kj::heapString(s); };
}

class NameSet {
  // Detects duplicate member names within one declaration.  A mangled set also catches names
  // that generated accessors can't tell apart: "foo_bar" and "fooBar" are both "FooBar".

public:
  explicit NameSet(bool mangled = false): mangled(mangled) {}

  kj::Maybe<kj::StringPtr> add(kj::StringPtr name) {
    // Returns the earlier name this one clashes with, or null if the name is new.
    auto key = mangled ? toTitleCase(name) : kj::heapString(name);
    for (auto& entry: entries) {
      if (entry.key == key) return kj::StringPtr(entry.name);
    }
    entries.add(Entry { kj::heapString(name), kj::mv(key) });
    return nullptr;
  }

private:
  struct Entry {
    kj::String name;
    kj::String key;
  };

  bool mangled;
  kj::Vector<Entry> entries;
};

kj::String clashMessage(kj::StringPtr what, kj::StringPtr name, kj::StringPtr existing) {
  if (name == existing) {
    return kj::str("duplicate ", what, " '", name, "'");
  } else {
    return kj::str(what, " '", name, "' has the same name as '", existing,
                   "' in generated code");
  }
}

}  // namespace

class NodeTranslator::Impl {
public:
  Impl(const Resolver& resolver, kj::ArrayPtr<const ParsedModule> modules)
      : resolver(resolver), modules(modules), entries(resolver.getEntries()) {
    for (size_t i = 0; i < entries.size(); i++) {
      structStates.add(StructState::UNVISITED);
      structInfos.add();
    }
  }

  kj::Maybe<kj::Own<CompiledSchema>> translate() {
    collectAttributeDecls();

    for (DeclId id = 0; id < entries.size(); id++) {
      auto& entry = entries[id];
      auto& info = decls.add();
      info.id = id;
      info.name = kj::heapString(entry.decl.name);
      info.namespacePath = copyStrings(entry.decl.namespacePath);
      info.fullName = kj::heapString(entry.fullName);
      info.module = entry.module;
      info.docs = copyStrings(entry.decl.docs);
    }

    // Enums first, since table defaults refer to them.  Then struct layouts, which depend on
    // each other.  Everything else only refers to declarations by id.
    for (DeclId id = 0; id < entries.size(); id++) {
      if (astKind(id) == DeclInfo::ENUM) {
        decls[id].body.init<EnumInfo>(translateEnum(id));
      }
    }
    for (DeclId id = 0; id < entries.size(); id++) {
      if (astKind(id) == DeclInfo::STRUCT) {
        getStructInfo(id);
      }
    }
    for (DeclId id = 0; id < entries.size(); id++) {
      switch (astKind(id)) {
        case DeclInfo::ENUM:
          break;
        case DeclInfo::STRUCT:
          KJ_IF_MAYBE(info, structInfos[id]) {
            decls[id].body.init<StructInfo>(kj::mv(*info));
          } else {
            decls[id].body.init<StructInfo>();
          }
          break;
        case DeclInfo::UNION:
          decls[id].body.init<UnionInfo>(translateUnion(id));
          break;
        case DeclInfo::TABLE:
          decls[id].body.init<TableInfo>(translateTable(id));
          break;
        case DeclInfo::RPC_SERVICE:
          decls[id].body.init<ServiceInfo>(translateService(id));
          break;
      }
    }

    auto moduleInfos = translateModules();

    if (failed) return nullptr;
    return kj::heap<CompiledSchema>(decls.releaseAsArray(), kj::mv(moduleInfos));
  }

private:
  const Resolver& resolver;
  kj::ArrayPtr<const ParsedModule> modules;
  kj::ArrayPtr<const Resolver::Entry> entries;
  bool failed = false;

  kj::Vector<DeclInfo> decls;
  kj::Vector<kj::StringPtr> declaredAttributes;

  enum class StructState: uint8_t {
    UNVISITED,
    IN_PROGRESS,
    DONE,
    FAILED
  };
  kj::Vector<StructState> structStates;
  kj::Vector<kj::Maybe<StructInfo>> structInfos;
  kj::Vector<DeclId> structStack;
  // Structs whose layout is being computed, outermost first.

  // ---------------------------------------------------------------------------------------------

  ErrorReporter& reporterFor(DeclId id) {
    return modules[entries[id].module].errorReporter;
  }

  template <typename Node>
  void error(ErrorReporter& reporter, const Node& node, SemanticError::Kind kind,
             kj::String message) {
    failed = true;
    reporter.addErrorOn(node, kind, kj::mv(message));
  }

  void errorAtName(DeclId id, SemanticError::Kind kind, kj::String message) {
    failed = true;
    auto& decl = entries[id].decl;
    reporterFor(id).addSemanticError(decl.nameStartByte, decl.nameEndByte, kind, kj::mv(message));
  }

  DeclInfo::Kind astKind(DeclId id) {
    auto& body = entries[id].decl.body;
    if (body.is<EnumDecl>()) return DeclInfo::ENUM;
    if (body.is<UnionDecl>()) return DeclInfo::UNION;
    if (body.is<StructDecl>()) return DeclInfo::STRUCT;
    if (body.is<TableDecl>()) return DeclInfo::TABLE;
    if (body.is<RpcServiceDecl>()) return DeclInfo::RPC_SERVICE;
    KJ_UNREACHABLE;
  }

  kj::Maybe<DeclId> resolve(kj::ArrayPtr<const kj::String> scope, const TypeExpr& type,
                            ErrorReporter& reporter) {
    auto result = resolver.resolve(scope, type, reporter);
    if (result == nullptr) failed = true;
    return result;
  }

  // ---------------------------------------------------------------------------------------------
  // Attributes

  void collectAttributeDecls() {
    for (auto& module: modules) {
      for (auto& statement: module.schema.statements) {
        if (statement.is<AttributeDecl>()) {
          declaredAttributes.add(statement.get<AttributeDecl>().name);
        }
      }
    }
  }

  bool isDeclaredAttribute(kj::StringPtr name) {
    for (auto& declared: declaredAttributes) {
      if (declared == name) return true;
    }
    return false;
  }

  void checkAttributes(ErrorReporter& reporter, kj::ArrayPtr<const Attribute> attributes,
                       Placement placement) {
    NameSet seen;
    for (auto& attribute: attributes) {
      if (seen.add(attribute.name) != nullptr) {
        error(reporter, attribute, SemanticError::Kind::DUPLICATE_MEMBER,
              kj::str("attribute '", attribute.name, "' given twice"));
      }

      bool builtin = false;
      for (auto& candidate: BUILTIN_ATTRIBUTES) {
        if (attribute.name == candidate.name) {
          builtin = true;
          if (candidate.placement != placement) {
            error(reporter, attribute, SemanticError::Kind::MISPLACED_ATTRIBUTE,
                  kj::str("'", attribute.name, "' can only be used on ",
                          placementName(candidate.placement), ", not on ",
                          placementName(placement)));
          }
          break;
        }
      }

      if (!builtin && !isDeclaredAttribute(attribute.name)) {
        error(reporter, attribute, SemanticError::Kind::UNKNOWN_ATTRIBUTE,
              kj::str("unknown attribute '", attribute.name, "'; declare it with `attribute \"",
                      attribute.name, "\";`"));
      }
    }
  }

  // ---------------------------------------------------------------------------------------------
  // Types

  kj::Maybe<Type> translateType(kj::ArrayPtr<const kj::String> scope, const TypeExpr& expr,
                                ErrorReporter& reporter) {
    Type result;
    switch (expr.which) {
      case TypeExpr::SCALAR:
        result.which = Type::SCALAR;
        result.scalar = expr.scalar;
        return kj::mv(result);

      case TypeExpr::STRING:
        result.which = Type::STRING;
        return kj::mv(result);

      case TypeExpr::VECTOR:
        KJ_IF_MAYBE(element, translateType(scope, *expr.element, reporter)) {
          if (element->which == Type::VECTOR) {
            error(reporter, expr, SemanticError::Kind::INVALID_FIELD_TYPE,
                  kj::str("vectors of vectors are not supported; wrap the inner vector in a table"));
            return nullptr;
          }
          if (element->which == Type::NAMED && astKind(element->decl) == DeclInfo::UNION) {
            error(reporter, expr, SemanticError::Kind::INVALID_FIELD_TYPE,
                  kj::str("vectors of unions are not supported"));
            return nullptr;
          }
          result.which = Type::VECTOR;
          result.element = kj::heap<Type>(kj::mv(*element));
          return kj::mv(result);
        } else {
          return nullptr;
        }

      case TypeExpr::NAMED:
        KJ_IF_MAYBE(id, resolve(scope, expr, reporter)) {
          if (astKind(*id) == DeclInfo::RPC_SERVICE) {
            error(reporter, expr, SemanticError::Kind::INVALID_FIELD_TYPE,
                  kj::str("'", entries[*id].fullName, "' is an rpc_service, not a data type"));
            return nullptr;
          }
          result.which = Type::NAMED;
          result.decl = *id;
          return kj::mv(result);
        } else {
          return nullptr;
        }
    }
    KJ_UNREACHABLE;
  }

  ScalarKind enumUnderlying(DeclId id) {
    // Read straight from the syntax tree so that struct layout doesn't depend on the order in
    // which enums are translated.  A bad underlying type has been reported by translateEnum().
    auto& underlying = entries[id].decl.body.get<EnumDecl>().underlyingType;
    if (underlying.which == TypeExpr::SCALAR && isInteger(underlying.scalar)) {
      return underlying.scalar;
    }
    return ScalarKind::INT32;
  }

  // ---------------------------------------------------------------------------------------------
  // Enums

  EnumInfo translateEnum(DeclId id) {
    auto& decl = entries[id].decl;
    auto& enumDecl = decl.body.get<EnumDecl>();
    auto& reporter = reporterFor(id);

    checkAttributes(reporter, decl.attributes, Placement::ENUM);

    EnumInfo result;
    result.underlying = ScalarKind::INT32;
    if (enumDecl.underlyingType.which == TypeExpr::SCALAR &&
        isInteger(enumDecl.underlyingType.scalar)) {
      result.underlying = enumDecl.underlyingType.scalar;
    } else {
      error(reporter, enumDecl.underlyingType, SemanticError::Kind::INVALID_DECLARATION,
            kj::str("the underlying type of an enum must be an integer type, not '",
                    typeExprToString(enumDecl.underlyingType), "'"));
    }

    result.bitFlags = findAttribute(decl.attributes, "bit_flags") != nullptr;
    if (result.bitFlags && isSigned(result.underlying)) {
      error(reporter, enumDecl.underlyingType, SemanticError::Kind::INVALID_DECLARATION,
            kj::str("bit_flags enums must have an unsigned underlying type"));
    }

    if (enumDecl.values.size() == 0) {
      errorAtName(id, SemanticError::Kind::INVALID_DECLARATION,
                  kj::str("enum '", entries[id].fullName, "' has no values"));
    }

    uint bits = scalarSize(result.underlying) * 8;
    bool negative = false;
    uint64_t magnitude = 0;
    bool havePrevious = false;
    bool previousNegative = false;
    uint64_t previousMagnitude = 0;

    NameSet names;
    kj::Vector<EnumVariantInfo> variants(enumDecl.values.size());
    for (auto& value: enumDecl.values) {
      checkAttributes(reporter, value.attributes, Placement::ENUM_VALUE);
      if (names.add(value.name) != nullptr) {
        error(reporter, value, SemanticError::Kind::DUPLICATE_MEMBER,
              kj::str("duplicate enum value '", value.name, "'"));
      }

      KJ_IF_MAYBE(literal, value.value) {
        negative = literal->negative && literal->integer != 0;
        magnitude = literal->integer;
      } else if (havePrevious) {
        if (previousNegative) {
          magnitude = previousMagnitude - 1;
          negative = magnitude != 0;
        } else if (previousMagnitude == UINT64_MAX) {
          error(reporter, value, SemanticError::Kind::INVALID_ENUM_VALUE,
                kj::str("enum value '", value.name, "' overflows"));
        } else {
          magnitude = previousMagnitude + 1;
          negative = false;
        }
      } else {
        negative = false;
        magnitude = 0;
      }

      if (havePrevious && !signedLess(previousNegative, previousMagnitude, negative, magnitude)) {
        error(reporter, value, SemanticError::Kind::INVALID_ENUM_VALUE,
              kj::str("enum values must be strictly ascending, but '", value.name, "' = ",
                      numberToString(negative, magnitude), " follows ",
                      numberToString(previousNegative, previousMagnitude)));
      }

      uint64_t stored = 0;
      if (result.bitFlags) {
        if (negative || magnitude >= bits) {
          error(reporter, value, SemanticError::Kind::INVALID_ENUM_VALUE,
                kj::str("bit position ", numberToString(negative, magnitude), " of '", value.name,
                        "' doesn't fit in ", result.underlying));
        } else {
          stored = uint64_t(1) << magnitude;
        }
      } else if (!fitsInteger(result.underlying, negative, magnitude)) {
        error(reporter, value, SemanticError::Kind::INVALID_ENUM_VALUE,
              kj::str("value ", numberToString(negative, magnitude), " of '", value.name,
                      "' doesn't fit in ", result.underlying));
      } else {
        stored = toBits(negative, magnitude);
      }

      variants.add(EnumVariantInfo { kj::heapString(value.name), stored,
                                     copyStrings(value.docs) });

      havePrevious = true;
      previousNegative = negative;
      previousMagnitude = magnitude;
    }

    result.variants = variants.releaseAsArray();
    return result;
  }

  // ---------------------------------------------------------------------------------------------
  // Structs

  kj::Maybe<const StructInfo&> getStructInfo(DeclId id) {
    switch (structStates[id]) {
      case StructState::DONE:
        return KJ_ASSERT_NONNULL(structInfos[id]);
      case StructState::FAILED:
        return nullptr;
      case StructState::IN_PROGRESS:
        reportCycle(id);
        return nullptr;
      case StructState::UNVISITED:
        break;
    }

    structStates[id] = StructState::IN_PROGRESS;
    structStack.add(id);
    auto result = translateStruct(id);
    structStack.removeLast();

    KJ_IF_MAYBE(info, result) {
      structInfos[id] = kj::mv(*info);
      structStates[id] = StructState::DONE;
      return KJ_ASSERT_NONNULL(structInfos[id]);
    } else {
      structStates[id] = StructState::FAILED;
      return nullptr;
    }
  }

  void reportCycle(DeclId id) {
    size_t start = 0;
    while (structStack[start] != id) ++start;

    kj::Vector<kj::String> path;
    for (size_t i = start; i < structStack.size(); i++) {
      path.add(kj::heapString(entries[structStack[i]].fullName));
    }
    path.add(kj::heapString(entries[id].fullName));

    auto& decl = entries[id].decl;
    Error error {
      decl.nameStartByte, decl.nameEndByte,
      kj::str("struct '", entries[id].fullName, "' contains itself: ", kj::strArray(path, " -> ")),
      {}
    };
    error.detail.init<SemanticError>(
        SemanticError { SemanticError::Kind::STRUCT_CYCLE, path.releaseAsArray() });

    failed = true;
    reporterFor(id).addError(kj::mv(error));
  }

  kj::Maybe<StructInfo> translateStruct(DeclId id) {
    auto& decl = entries[id].decl;
    auto& fields = decl.body.get<StructDecl>().fields;
    auto& reporter = reporterFor(id);
    bool ok = true;

    checkAttributes(reporter, decl.attributes, Placement::STRUCT);

    if (fields.size() == 0) {
      errorAtName(id, SemanticError::Kind::INVALID_DECLARATION,
                  kj::str("struct '", entries[id].fullName, "' has no fields"));
      ok = false;
    }

    NameSet names(true);
    kj::Vector<StructFieldInfo> infos(fields.size());
    uint64_t offset = 0;
    uint alignment = 1;

    for (auto& field: fields) {
      checkAttributes(reporter, field.attributes, Placement::STRUCT_FIELD);
      KJ_IF_MAYBE(existing, names.add(field.name)) {
        error(reporter, field, SemanticError::Kind::DUPLICATE_MEMBER,
              clashMessage("field", field.name, *existing));
      }
      KJ_IF_MAYBE(value, field.defaultValue) {
        error(reporter, *value, SemanticError::Kind::INVALID_DEFAULT_FOR_TYPE,
              kj::str("struct fields can't have default values"));
      }

      uint size;
      uint fieldAlignment;
      KJ_IF_MAYBE(type, translateType(decl.namespacePath, field.type, reporter)) {
        if (type->which == Type::SCALAR) {
          size = fieldAlignment = scalarSize(type->scalar);
        } else if (type->which == Type::NAMED && astKind(type->decl) == DeclInfo::ENUM) {
          size = fieldAlignment = scalarSize(enumUnderlying(type->decl));
        } else if (type->which == Type::NAMED && astKind(type->decl) == DeclInfo::STRUCT) {
          KJ_IF_MAYBE(inner, getStructInfo(type->decl)) {
            size = inner->size;
            fieldAlignment = inner->alignment;
          } else {
            ok = false;
            continue;
          }
        } else {
          error(reporter, field.type, SemanticError::Kind::INVALID_FIELD_TYPE,
                kj::str("struct fields must be scalars, enums or structs; field '", field.name,
                        "' has type '", typeExprToString(field.type), "'"));
          ok = false;
          continue;
        }

        offset = alignUp(offset, fieldAlignment);
        if (infos.size() > 0) {
          auto& previous = infos.back();
          previous.paddingAfter = offset - (previous.offset + previous.size);
        }
        infos.add(StructFieldInfo {
          kj::heapString(field.name), kj::mv(*type), static_cast<uint>(offset), size,
          fieldAlignment, 0, copyStrings(field.docs)
        });
        offset += size;
        alignment = kj::max(alignment, fieldAlignment);
      } else {
        ok = false;
      }
    }

    KJ_IF_MAYBE(attribute, findAttribute(decl.attributes, "force_align")) {
      bool valid = false;
      KJ_IF_MAYBE(value, attribute->value) {
        if (value->which == Literal::INTEGER && !value->negative &&
            value->integer >= alignment && value->integer <= MAX_ALIGNMENT &&
            (value->integer & (value->integer - 1)) == 0) {
          alignment = value->integer;
          valid = true;
        }
      }
      if (!valid) {
        error(reporter, *attribute, SemanticError::Kind::UNKNOWN_ATTRIBUTE_VALUE,
              kj::str("force_align must be a power of two between the struct's natural "
                      "alignment (", alignment, ") and ", MAX_ALIGNMENT));
        ok = false;
      }
    }

    uint64_t size = alignUp(offset, alignment);
    if (infos.size() > 0) {
      auto& last = infos.back();
      last.paddingAfter = size - (last.offset + last.size);
    }

    if (!ok) return nullptr;

    StructInfo result;
    result.fields = infos.releaseAsArray();
    result.size = size;
    result.alignment = alignment;
    return kj::mv(result);
  }

  // ---------------------------------------------------------------------------------------------
  // Unions

  UnionInfo translateUnion(DeclId id) {
    auto& decl = entries[id].decl;
    auto& unionDecl = decl.body.get<UnionDecl>();
    auto& reporter = reporterFor(id);

    checkAttributes(reporter, decl.attributes, Placement::UNION);

    if (unionDecl.variants.size() > 255) {
      errorAtName(id, SemanticError::Kind::INVALID_DECLARATION,
                  kj::str("a union can have at most 255 variants"));
    }

    NameSet names(true);
    kj::Vector<UnionVariantInfo> variants(unionDecl.variants.size());
    for (uint i = 0; i < unionDecl.variants.size(); i++) {
      auto& variant = unionDecl.variants[i];
      checkAttributes(reporter, variant.attributes, Placement::UNION_VARIANT);

      kj::String name;
      KJ_IF_MAYBE(alias, variant.alias) {
        name = kj::heapString(*alias);
      } else {
        name = defaultVariantName(variant.type.name);
      }

      if (name == "NONE") {
        error(reporter, variant, SemanticError::Kind::DUPLICATE_MEMBER,
              kj::str("'NONE' is reserved for the empty value of every union"));
      } else KJ_IF_MAYBE(existing, names.add(name)) {
        error(reporter, variant, SemanticError::Kind::DUPLICATE_MEMBER,
              kj::str(clashMessage("union variant", name, *existing),
                      "; give one of them an alias"));
      }

      DeclId table = 0;
      KJ_IF_MAYBE(target, resolve(decl.namespacePath, variant.type, reporter)) {
        if (astKind(*target) == DeclInfo::TABLE) {
          table = *target;
        } else {
          error(reporter, variant.type, SemanticError::Kind::NON_TABLE_UNION_MEMBER,
                kj::str("union variants must be tables, but '", entries[*target].fullName,
                        "' is ", kindName(astKind(*target))));
        }
      }

      variants.add(UnionVariantInfo {
        kj::heapString(name), static_cast<uint8_t>(i + 1), table, copyStrings(variant.docs)
      });
    }

    return UnionInfo { variants.releaseAsArray() };
  }

  // ---------------------------------------------------------------------------------------------
  // Tables

  Value translateDefault(ErrorReporter& reporter, const Field& field, const Type& type) {
    Value result;
    bool isEnum = type.which == Type::NAMED && astKind(type.decl) == DeclInfo::ENUM;

    if (type.which != Type::SCALAR && !isEnum) {
      KJ_IF_MAYBE(literal, field.defaultValue) {
        error(reporter, *literal, SemanticError::Kind::INVALID_DEFAULT_FOR_TYPE,
              kj::str("only scalar and enum fields can have default values"));
      }
      return result;
    }

    if (isEnum) {
      auto& enumInfo = decls[type.decl].body.get<EnumInfo>();
      auto& enumName = entries[type.decl].fullName;
      result.which = Value::INTEGER;
      KJ_IF_MAYBE(literal, field.defaultValue) {
        if (literal->which == Literal::IDENTIFIER) {
          KJ_IF_MAYBE(variant, enumInfo.findByName(lastComponent(literal->text))) {
            result.integer = variant->value;
          } else {
            error(reporter, *literal, SemanticError::Kind::INVALID_DEFAULT_FOR_TYPE,
                  kj::str("'", literal->text, "' is not a value of enum '", enumName, "'"));
          }
        } else if (literal->which == Literal::INTEGER) {
          if (!fitsInteger(enumInfo.underlying, literal->negative, literal->integer)) {
            error(reporter, *literal, SemanticError::Kind::INVALID_DEFAULT_FOR_TYPE,
                  kj::str("default value doesn't fit in ", enumInfo.underlying));
          } else {
            result.integer = toBits(literal->negative, literal->integer);
            if (!enumInfo.bitFlags && enumInfo.findByValue(result.integer) == nullptr) {
              error(reporter, *literal, SemanticError::Kind::INVALID_DEFAULT_FOR_TYPE,
                    kj::str(literalToString(*literal), " is not a value of enum '", enumName,
                            "'"));
            }
          }
        } else {
          error(reporter, *literal, SemanticError::Kind::INVALID_DEFAULT_FOR_TYPE,
                kj::str("expected a value of enum '", enumName, "'"));
        }
      } else if (!enumInfo.bitFlags && enumInfo.variants.size() > 0 &&
                 enumInfo.findByValue(0) == nullptr) {
        error(reporter, field, SemanticError::Kind::INVALID_DEFAULT_FOR_TYPE,
              kj::str("enum '", enumName, "' has no value 0, so field '", field.name,
                      "' needs an explicit default"));
      }
      return result;
    }

    ScalarKind kind = type.scalar;
    if (kind == ScalarKind::BOOL) {
      result.which = Value::BOOLEAN;
    } else if (isFloat(kind)) {
      result.which = Value::FLOAT;
    } else {
      result.which = Value::INTEGER;
    }

    KJ_IF_MAYBE(literal, field.defaultValue) {
      auto invalid = [&]() {
        error(reporter, *literal, SemanticError::Kind::INVALID_DEFAULT_FOR_TYPE,
              kj::str("'", literalToString(*literal), "' is not a valid ", kind, " value"));
      };

      switch (result.which) {
        case Value::BOOLEAN:
          if (literal->which == Literal::BOOLEAN) {
            result.boolean = literal->boolean;
          } else if (literal->which == Literal::INTEGER && !literal->negative &&
                     literal->integer <= 1) {
            result.boolean = literal->integer == 1;
          } else {
            invalid();
          }
          break;
        case Value::FLOAT:
          if (literal->which == Literal::INTEGER) {
            result.floating = static_cast<double>(literal->integer);
          } else if (literal->which == Literal::FLOAT) {
            result.floating = literal->floating;
          } else {
            invalid();
            break;
          }
          if (literal->negative) result.floating = -result.floating;
          if (kind == ScalarKind::FLOAT32 && std::isfinite(result.floating) &&
              std::fabs(result.floating) > FLT_MAX) {
            invalid();
          }
          break;
        case Value::INTEGER:
          if (literal->which == Literal::INTEGER &&
              fitsInteger(kind, literal->negative, literal->integer)) {
            result.integer = toBits(literal->negative, literal->integer);
          } else {
            invalid();
          }
          break;
        case Value::NONE:
          KJ_UNREACHABLE;
      }
    }

    return result;
  }

  TableInfo translateTable(DeclId id) {
    auto& decl = entries[id].decl;
    auto& fields = decl.body.get<TableDecl>().fields;
    auto& reporter = reporterFor(id);

    checkAttributes(reporter, decl.attributes, Placement::TABLE);

    TableInfo result;
    NameSet names(true);
    kj::Vector<TableFieldInfo> infos(fields.size());
    kj::Vector<bool> isUnion(fields.size());

    for (uint i = 0; i < fields.size(); i++) {
      auto& field = fields[i];
      checkAttributes(reporter, field.attributes, Placement::TABLE_FIELD);

      TableFieldInfo info;
      info.name = kj::heapString(field.name);
      info.docs = copyStrings(field.docs);
      info.deprecated = findAttribute(field.attributes, "deprecated") != nullptr;

      bool validType = false;
      bool fieldIsUnion = false;
      KJ_IF_MAYBE(type, translateType(decl.namespacePath, field.type, reporter)) {
        info.type = kj::mv(*type);
        info.defaultValue = translateDefault(reporter, field, info.type);
        fieldIsUnion = info.type.which == Type::NAMED &&
                       astKind(info.type.decl) == DeclInfo::UNION;
        validType = true;
      }

      KJ_IF_MAYBE(existing, names.add(field.name)) {
        error(reporter, field, SemanticError::Kind::DUPLICATE_MEMBER,
              clashMessage("field", field.name, *existing));
      }
      if (fieldIsUnion) {
        auto typeFieldName = kj::str(field.name, "_type");
        if (names.add(typeFieldName) != nullptr) {
          error(reporter, field, SemanticError::Kind::DUPLICATE_MEMBER,
                kj::str("union field '", field.name, "' needs the name '", typeFieldName,
                        "' for its discriminant, but it is already taken"));
        }
      }

      KJ_IF_MAYBE(attribute, findAttribute(field.attributes, "required")) {
        bool scalarLike = info.type.which == Type::SCALAR ||
            (info.type.which == Type::NAMED && astKind(info.type.decl) == DeclInfo::ENUM);
        if (validType && scalarLike) {
          error(reporter, *attribute, SemanticError::Kind::MISPLACED_ATTRIBUTE,
                kj::str("scalar field '", field.name, "' can't be required; it always has a "
                        "value"));
        } else {
          info.required = true;
        }
      }

      KJ_IF_MAYBE(attribute, findAttribute(field.attributes, "key")) {
        if (validType && info.type.which != Type::SCALAR && info.type.which != Type::STRING) {
          error(reporter, *attribute, SemanticError::Kind::MISPLACED_ATTRIBUTE,
                kj::str("key fields must be scalars or strings"));
        } else KJ_IF_MAYBE(existing, result.keyField) {
          error(reporter, *attribute, SemanticError::Kind::MISPLACED_ATTRIBUTE,
                kj::str("table already has a key field, '", infos[*existing].name, "'"));
        } else {
          info.key = true;
          result.keyField = i;
        }
      }

      infos.add(kj::mv(info));
      isUnion.add(fieldIsUnion);
    }

    assignSlots(id, fields, infos, isUnion, result);
    result.fields = infos.releaseAsArray();
    return result;
  }

  void assignSlots(DeclId id, kj::ArrayPtr<const Field> fields,
                   kj::Vector<TableFieldInfo>& infos, kj::ArrayPtr<const bool> isUnion,
                   TableInfo& result) {
    auto& reporter = reporterFor(id);

    uint explicitCount = 0;
    for (auto& field: fields) {
      if (findAttribute(field.attributes, "id") != nullptr) ++explicitCount;
    }

    if (explicitCount == 0) {
      uint slot = 0;
      for (uint i = 0; i < infos.size(); i++) {
        if (isUnion[i]) infos[i].typeSlot = slot++;
        infos[i].slot = slot++;
      }
      result.slotCount = slot;
      return;
    }

    if (explicitCount < fields.size()) {
      errorAtName(id, SemanticError::Kind::DUPLICATE_OR_GAPPED_FIELD_ID,
                  kj::str("either all fields of '", entries[id].fullName,
                          "' must have an 'id' attribute or none of them"));
      return;
    }

    // Largest slot whose vtable entry is still addressable with a 16-bit offset.
    static constexpr uint64_t MAX_SLOT = 0xfffe / sizeof(voffset_t) - 2;

    std::map<uint, kj::String> owners;
    auto claim = [&](uint slot, kj::String owner, const Field& field) {
      auto insertResult = owners.insert(std::make_pair(slot, kj::heapString(owner)));
      if (!insertResult.second) {
        error(reporter, field, SemanticError::Kind::DUPLICATE_OR_GAPPED_FIELD_ID,
              kj::str("id ", slot, " is used by both '", insertResult.first->second, "' and '",
                      owner, "'"));
      }
    };

    for (uint i = 0; i < fields.size(); i++) {
      auto& field = fields[i];
      auto& attribute = KJ_ASSERT_NONNULL(findAttribute(field.attributes, "id"));

      uint64_t value = 0;
      bool valid = false;
      KJ_IF_MAYBE(literal, attribute.value) {
        if (literal->which == Literal::INTEGER && !(literal->negative && literal->integer != 0) &&
            literal->integer <= MAX_SLOT) {
          value = literal->integer;
          valid = true;
        }
      }
      if (!valid) {
        error(reporter, attribute, SemanticError::Kind::UNKNOWN_ATTRIBUTE_VALUE,
              kj::str("'id' must be an integer between 0 and ", MAX_SLOT));
        continue;
      }

      if (isUnion[i]) {
        if (value == 0) {
          error(reporter, attribute, SemanticError::Kind::DUPLICATE_OR_GAPPED_FIELD_ID,
                kj::str("union field '", field.name, "' needs an id of at least 1; its "
                        "discriminant uses the id before it"));
          continue;
        }
        infos[i].typeSlot = value - 1;
        claim(value - 1, kj::str(field.name, "_type"), field);
      }
      infos[i].slot = value;
      claim(value, kj::heapString(field.name), field);
    }

    uint next = 0;
    for (auto& entry: owners) {
      if (entry.first != next) {
        errorAtName(id, SemanticError::Kind::DUPLICATE_OR_GAPPED_FIELD_ID,
                    kj::str("field ids of '", entries[id].fullName,
                            "' must be contiguous from 0, but id ", next, " is missing"));
        break;
      }
      ++next;
    }
    result.slotCount = next;
    if (!owners.empty()) {
      result.slotCount = kj::max(result.slotCount, owners.rbegin()->first + 1);
    }
  }

  // ---------------------------------------------------------------------------------------------
  // RPC services

  ServiceInfo translateService(DeclId id) {
    auto& decl = entries[id].decl;
    auto& service = decl.body.get<RpcServiceDecl>();
    auto& reporter = reporterFor(id);

    checkAttributes(reporter, decl.attributes, Placement::RPC_SERVICE);

    NameSet names(true);
    kj::Vector<RpcMethodInfo> methods(service.methods.size());
    for (auto& method: service.methods) {
      checkAttributes(reporter, method.attributes, Placement::RPC_METHOD);
      KJ_IF_MAYBE(existing, names.add(method.name)) {
        error(reporter, method, SemanticError::Kind::DUPLICATE_MEMBER,
              clashMessage("method", method.name, *existing));
      }

      RpcMethodInfo info;
      info.name = kj::heapString(method.name);
      info.docs = copyStrings(method.docs);
      info.request = resolveMessageType(decl.namespacePath, method.request, "request", reporter);
      info.response = resolveMessageType(decl.namespacePath, method.response, "response",
                                         reporter);

      KJ_IF_MAYBE(attribute, findAttribute(method.attributes, "streaming")) {
        bool valid = false;
        KJ_IF_MAYBE(value, attribute->value) {
          if (value->which == Literal::STRING) {
            if (value->text == "none") {
              info.streaming = Streaming::NONE;
              valid = true;
            } else if (value->text == "server") {
              info.streaming = Streaming::SERVER;
              valid = true;
            } else if (value->text == "client") {
              info.streaming = Streaming::CLIENT;
              valid = true;
            } else if (value->text == "bidi") {
              info.streaming = Streaming::BIDI;
              valid = true;
            }
          }
        }
        if (!valid) {
          kj::String given = attribute->value == nullptr ? kj::str("nothing")
              : literalToString(KJ_ASSERT_NONNULL(attribute->value));
          error(reporter, *attribute, SemanticError::Kind::UNKNOWN_ATTRIBUTE_VALUE,
                kj::str("unknown streaming mode ", given,
                        "; expected \"none\", \"server\", \"client\" or \"bidi\""));
        }
      }

      methods.add(kj::mv(info));
    }

    return ServiceInfo { methods.releaseAsArray() };
  }

  DeclId resolveMessageType(kj::ArrayPtr<const kj::String> scope, const TypeExpr& type,
                            kj::StringPtr role, ErrorReporter& reporter) {
    KJ_IF_MAYBE(target, resolve(scope, type, reporter)) {
      if (astKind(*target) == DeclInfo::TABLE) {
        return *target;
      }
      error(reporter, type, SemanticError::Kind::NON_TABLE_RPC_TYPE,
            kj::str("rpc ", role, " types must be tables, but '", entries[*target].fullName,
                    "' is ", kindName(astKind(*target))));
    }
    return 0;
  }

  // ---------------------------------------------------------------------------------------------
  // Modules

  kj::Array<ModuleInfo> translateModules() {
    kj::Vector<ModuleInfo> result(modules.size());

    for (uint i = 0; i < modules.size(); i++) {
      auto& module = modules[i];
      auto& reporter = module.errorReporter;
      ModuleInfo info;
      info.sourceName = kj::heapString(module.sourceName);
      info.includes = kj::heapArray(module.includes.asPtr());

      kj::Vector<DeclId> moduleDecls;
      for (DeclId id = 0; id < entries.size(); id++) {
        if (entries[id].module == i) moduleDecls.add(id);
      }
      info.decls = moduleDecls.releaseAsArray();

      kj::ArrayPtr<const kj::String> scope;
      for (auto& statement: module.schema.statements) {
        if (statement.is<NamespaceDirective>()) {
          scope = statement.get<NamespaceDirective>().path;
        } else if (statement.is<RootType>()) {
          auto& rootType = statement.get<RootType>();
          if (info.rootType != nullptr) {
            error(reporter, rootType, SemanticError::Kind::INVALID_DECLARATION,
                  kj::str("a file can only have one root_type"));
            continue;
          }
          KJ_IF_MAYBE(target, resolver.resolve(scope, rootType.name, rootType.startByte,
                                               rootType.endByte, reporter)) {
            if (astKind(*target) == DeclInfo::TABLE) {
              info.rootType = *target;
            } else {
              error(reporter, rootType, SemanticError::Kind::INVALID_DECLARATION,
                    kj::str("root_type must be a table, but '", entries[*target].fullName,
                            "' is ", kindName(astKind(*target))));
            }
          } else {
            failed = true;
          }
        } else if (statement.is<FileIdentifier>()) {
          auto& identifier = statement.get<FileIdentifier>();
          if (info.fileIdentifier != nullptr) {
            error(reporter, identifier, SemanticError::Kind::INVALID_DECLARATION,
                  kj::str("a file can only have one file_identifier"));
          } else if (identifier.value.size() != FILE_IDENTIFIER_LENGTH) {
            error(reporter, identifier, SemanticError::Kind::INVALID_DECLARATION,
                  kj::str("file_identifier must be exactly ", FILE_IDENTIFIER_LENGTH,
                          " bytes long"));
          } else {
            info.fileIdentifier = kj::heapString(identifier.value);
          }
        } else if (statement.is<FileExtension>()) {
          auto& extension = statement.get<FileExtension>();
          if (info.fileExtension != nullptr) {
            error(reporter, extension, SemanticError::Kind::INVALID_DECLARATION,
                  kj::str("a file can only have one file_extension"));
          } else {
            info.fileExtension = kj::heapString(extension.value);
          }
        }
      }

      if (info.fileIdentifier != nullptr && info.rootType == nullptr) {
        KJ_LOG(WARNING, "file_identifier has no effect without a root_type", module.sourceName);
      }

      result.add(kj::mv(info));
    }

    return result.releaseAsArray();
  }
};

NodeTranslator::NodeTranslator(const Resolver& resolver, kj::ArrayPtr<const ParsedModule> modules)
    : impl(kj::heap<Impl>(resolver, modules)) {}
NodeTranslator::~NodeTranslator() noexcept(false) {}

kj::Maybe<kj::Own<CompiledSchema>> NodeTranslator::translate() {
  return impl->translate();
}

}  // namespace compiler
}  // namespace plank
