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
#include "module-loader.h"
#include <kj/test.h>
#include <kj/filesystem.h>
#include <kj/time.h>
#include <kj/vector.h>

namespace plank {
namespace compiler {
namespace {

class TestCompilation {
  // Compiles schema files kept in an in-memory directory.

public:
  TestCompilation()
      : dir(kj::newInMemoryDirectory(kj::nullClock())),
        loader(diagnostics) {}

  void addFile(kj::StringPtr path, kj::StringPtr content) {
    dir->openFile(kj::Path::parse(path), kj::WriteMode::CREATE | kj::WriteMode::CREATE_PARENT)
        ->writeAll(content);
  }

  kj::Maybe<kj::Own<CompiledSchema>> compile(kj::ArrayPtr<const kj::StringPtr> sources) {
    Compiler compiler;
    for (auto source: sources) {
      compiler.add(KJ_ASSERT_NONNULL(loader.loadModule(*dir, kj::Path::parse(source))));
    }
    return compiler.compile();
  }

  kj::Maybe<kj::Own<CompiledSchema>> compile(kj::StringPtr source) {
    kj::StringPtr sources[] = { source };
    return compile(kj::arrayPtr(sources, 1));
  }

  kj::Own<CompiledSchema> compileOrFail(kj::StringPtr text) {
    addFile("test.fbs", text);
    auto result = compile("test.fbs");
    for (auto& diagnostic: diagnostics.getDiagnostics()) {
      KJ_FAIL_EXPECT("unexpected error", diagnostic);
    }
    return kj::mv(KJ_ASSERT_NONNULL(result));
  }

  kj::Array<SemanticError::Kind> compileWithErrors(kj::StringPtr text) {
    // Returns the kinds of the semantic errors reported, in order.
    addFile("test.fbs", text);
    KJ_EXPECT(compile("test.fbs") == nullptr);
    return semanticErrorKinds();
  }

  kj::Array<SemanticError::Kind> semanticErrorKinds() {
    kj::Vector<SemanticError::Kind> result;
    for (auto& diagnostic: diagnostics.getDiagnostics()) {
      KJ_ASSERT(diagnostic.error.detail.is<SemanticError>(), diagnostic);
      result.add(diagnostic.error.detail.get<SemanticError>().kind);
    }
    return result.releaseAsArray();
  }

  DiagnosticCollector diagnostics;
  kj::Own<const kj::Directory> dir;
  ModuleLoader loader;
};

bool contains(kj::ArrayPtr<const SemanticError::Kind> kinds, SemanticError::Kind kind) {
  for (auto k: kinds) {
    if (k == kind) return true;
  }
  return false;
}

const TableFieldInfo& findField(const TableInfo& table, kj::StringPtr name) {
  for (auto& field: table.fields) {
    if (field.name == name) return field;
  }
  KJ_FAIL_ASSERT("no such field", name);
}

// =======================================================================================

KJ_TEST("enum values count up from zero") {
  TestCompilation test;
  auto schema = test.compileOrFail(
      "enum Foo: int32 { a, b, c }\n"
      "enum Sparse: short { x = -5, y, z = 10 }\n"
      "enum Abilities: ubyte (bit_flags) { Fly, Swim, Climb = 7 }\n");

  auto& foo = schema->getEnum(KJ_ASSERT_NONNULL(schema->findDecl("Foo")).id);
  KJ_EXPECT(foo.underlying == ScalarKind::INT32);
  KJ_ASSERT(foo.variants.size() == 3);
  KJ_EXPECT(foo.variants[0].value == 0);
  KJ_EXPECT(foo.variants[1].value == 1);
  KJ_EXPECT(foo.variants[2].value == 2);

  auto& sparse = schema->getEnum(KJ_ASSERT_NONNULL(schema->findDecl("Sparse")).id);
  KJ_EXPECT(static_cast<int64_t>(sparse.variants[0].value) == -5);
  KJ_EXPECT(static_cast<int64_t>(sparse.variants[1].value) == -4);
  KJ_EXPECT(sparse.variants[2].value == 10);

  auto& abilities = schema->getEnum(KJ_ASSERT_NONNULL(schema->findDecl("Abilities")).id);
  KJ_EXPECT(abilities.bitFlags);
  KJ_EXPECT(abilities.variants[0].value == 1);
  KJ_EXPECT(abilities.variants[1].value == 2);
  KJ_EXPECT(abilities.variants[2].value == 128);
}

KJ_TEST("enum errors") {
  {
    TestCompilation test;
    auto kinds = test.compileWithErrors("enum E: ubyte { a = 256 }\n");
    KJ_EXPECT(kinds.size() == 1 && kinds[0] == SemanticError::Kind::INVALID_ENUM_VALUE);
  }
  {
    TestCompilation test;
    auto kinds = test.compileWithErrors("enum E: int { a = 2, b = 1 }\n");
    KJ_EXPECT(kinds.size() == 1 && kinds[0] == SemanticError::Kind::INVALID_ENUM_VALUE);
  }
  {
    TestCompilation test;
    auto kinds = test.compileWithErrors("enum E: float { a }\n");
    KJ_EXPECT(kinds.size() == 1 && kinds[0] == SemanticError::Kind::INVALID_DECLARATION);
  }
}

KJ_TEST("struct layout follows natural alignment") {
  TestCompilation test;
  auto schema = test.compileOrFail(
      "namespace layout;\n"
      "enum Color: byte { Red, Green }\n"
      "struct Vec3 { x: float; y: float; z: float; }\n"
      "struct Padded { a: byte; b: int; c: short; }\n"
      "struct Placement { pos: Vec3; color: Color; visible: bool; }\n"
      "struct Aligned (force_align: 16) { v: long; }\n"
      "struct Wide { a: bool; b: double; }\n");

  auto& vec3 = schema->getStruct(KJ_ASSERT_NONNULL(schema->findDecl("layout.Vec3")).id);
  KJ_EXPECT(vec3.size == 12);
  KJ_EXPECT(vec3.alignment == 4);

  auto& padded = schema->getStruct(KJ_ASSERT_NONNULL(schema->findDecl("layout.Padded")).id);
  KJ_EXPECT(padded.size == 12);
  KJ_EXPECT(padded.alignment == 4);
  KJ_ASSERT(padded.fields.size() == 3);
  KJ_EXPECT(padded.fields[0].offset == 0);
  KJ_EXPECT(padded.fields[0].paddingAfter == 3);
  KJ_EXPECT(padded.fields[1].offset == 4);
  KJ_EXPECT(padded.fields[1].paddingAfter == 0);
  KJ_EXPECT(padded.fields[2].offset == 8);
  KJ_EXPECT(padded.fields[2].paddingAfter == 2);

  auto& placement = schema->getStruct(
      KJ_ASSERT_NONNULL(schema->findDecl("layout.Placement")).id);
  KJ_EXPECT(placement.size == 16);
  KJ_EXPECT(placement.alignment == 4);
  KJ_EXPECT(placement.fields[1].offset == 12);
  KJ_EXPECT(placement.fields[2].offset == 13);
  KJ_EXPECT(placement.fields[2].paddingAfter == 2);

  auto& aligned = schema->getStruct(KJ_ASSERT_NONNULL(schema->findDecl("layout.Aligned")).id);
  KJ_EXPECT(aligned.size == 16);
  KJ_EXPECT(aligned.alignment == 16);
  KJ_EXPECT(aligned.fields[0].paddingAfter == 8);

  auto& wide = schema->getStruct(KJ_ASSERT_NONNULL(schema->findDecl("layout.Wide")).id);
  KJ_EXPECT(wide.size == 16);
  KJ_EXPECT(wide.fields[1].offset == 8);
}

KJ_TEST("struct layout doesn't depend on declaration order") {
  TestCompilation test1;
  auto before = test1.compileOrFail(
      "struct Inner { a: short; b: long; }\n"
      "struct Outer { flag: bool; inner: Inner; }\n");
  TestCompilation test2;
  auto after = test2.compileOrFail(
      "struct Outer { flag: bool; inner: Inner; }\n"
      "struct Inner { a: short; b: long; }\n");

  auto& a = before->getStruct(KJ_ASSERT_NONNULL(before->findDecl("Outer")).id);
  auto& b = after->getStruct(KJ_ASSERT_NONNULL(after->findDecl("Outer")).id);
  KJ_EXPECT(a.size == 24);
  KJ_EXPECT(b.size == a.size);
  KJ_EXPECT(b.alignment == a.alignment);
  KJ_EXPECT(b.fields[1].offset == 8);
}

KJ_TEST("struct containing itself is rejected with the cycle path") {
  {
    TestCompilation test;
    auto kinds = test.compileWithErrors(
        "namespace game;\n"
        "struct Node { value: int; next: Node; }\n");
    KJ_ASSERT(kinds.size() == 1);
    KJ_EXPECT(kinds[0] == SemanticError::Kind::STRUCT_CYCLE);
    auto& error = test.diagnostics.getDiagnostics()[0].error;
    auto path = kj::strArray(error.detail.get<SemanticError>().cyclePath, " -> ");
    KJ_EXPECT(path == "game.Node -> game.Node", path);
  }

  {
    TestCompilation test;
    auto kinds = test.compileWithErrors(
        "struct A { b: B; }\n"
        "struct B { c: C; }\n"
        "struct C { x: int; a: A; }\n"
        "struct D { a: A; }\n");
    // Reported once for the cycle, not again for every struct that touches it.
    KJ_ASSERT(kinds.size() == 1);
    KJ_EXPECT(kinds[0] == SemanticError::Kind::STRUCT_CYCLE);
    auto& error = test.diagnostics.getDiagnostics()[0].error;
    auto path = kj::strArray(error.detail.get<SemanticError>().cyclePath, " -> ");
    KJ_EXPECT(path == "A -> B -> C -> A", path);
    KJ_EXPECT(error.message.endsWith("A -> B -> C -> A"), error.message);
  }
}

KJ_TEST("implicit table slots") {
  TestCompilation test;
  auto schema = test.compileOrFail(
      "table X {}\n"
      "table Y {}\n"
      "union U { X, Other: Y }\n"
      "table T { a: int; u: U; b: string; c: [X]; }\n");

  auto& t = schema->getTable(KJ_ASSERT_NONNULL(schema->findDecl("T")).id);
  KJ_EXPECT(t.slotCount == 5);
  KJ_EXPECT(findField(t, "a").slot == 0);
  KJ_EXPECT(findField(t, "u").typeSlot == 1);
  KJ_EXPECT(findField(t, "u").slot == 2);
  KJ_EXPECT(findField(t, "b").slot == 3);
  KJ_EXPECT(findField(t, "c").slot == 4);

  auto& u = schema->getUnion(KJ_ASSERT_NONNULL(schema->findDecl("U")).id);
  KJ_ASSERT(u.variants.size() == 2);
  KJ_EXPECT(u.variants[0].name == "X");
  KJ_EXPECT(u.variants[0].tag == 1);
  KJ_EXPECT(u.variants[1].name == "Other");
  KJ_EXPECT(u.variants[1].tag == 2);
}

KJ_TEST("explicit table slots") {
  TestCompilation test;
  auto schema = test.compileOrFail(
      "table X {}\n"
      "union U { X }\n"
      "table T {\n"
      "  b: int (id: 2);\n"
      "  a: string (id: 0);\n"
      "  choice: U (id: 4);\n"
      "  c: long = -1 (id: 1);\n"
      "}\n");

  auto& t = schema->getTable(KJ_ASSERT_NONNULL(schema->findDecl("T")).id);
  KJ_EXPECT(findField(t, "a").slot == 0);
  KJ_EXPECT(findField(t, "c").slot == 1);
  KJ_EXPECT(findField(t, "b").slot == 2);
  KJ_EXPECT(findField(t, "choice").typeSlot == 3);
  KJ_EXPECT(findField(t, "choice").slot == 4);
  KJ_EXPECT(static_cast<int64_t>(findField(t, "c").defaultValue.integer) == -1);
}

KJ_TEST("field id errors") {
  {
    TestCompilation test;
    auto kinds = test.compileWithErrors("table T { a: int (id: 0); b: int (id: 2); }\n");
    KJ_EXPECT(contains(kinds, SemanticError::Kind::DUPLICATE_OR_GAPPED_FIELD_ID));
  }
  {
    TestCompilation test;
    auto kinds = test.compileWithErrors("table T { a: int (id: 0); b: int (id: 0); }\n");
    KJ_EXPECT(contains(kinds, SemanticError::Kind::DUPLICATE_OR_GAPPED_FIELD_ID));
  }
  {
    TestCompilation test;
    auto kinds = test.compileWithErrors("table T { a: int (id: 0); b: int; }\n");
    KJ_EXPECT(contains(kinds, SemanticError::Kind::DUPLICATE_OR_GAPPED_FIELD_ID));
  }
}

KJ_TEST("defaults") {
  TestCompilation test;
  auto schema = test.compileOrFail(
      "enum Color: byte { Red, Green, Blue = 8 }\n"
      "table T {\n"
      "  hp: short = 100;\n"
      "  color: Color = Blue;\n"
      "  numeric: Color = 1;\n"
      "  ratio: double = 0.5;\n"
      "  whole: float = 3;\n"
      "  edge: float = -3.4e38;\n"
      "  huge: double = 1e300;\n"
      "  flag: bool = true;\n"
      "  nothing: int;\n"
      "  name: string;\n"
      "}\n");

  auto& t = schema->getTable(KJ_ASSERT_NONNULL(schema->findDecl("T")).id);
  KJ_EXPECT(findField(t, "hp").defaultValue.integer == 100);
  KJ_EXPECT(findField(t, "color").defaultValue.integer == 8);
  KJ_EXPECT(findField(t, "numeric").defaultValue.integer == 1);
  KJ_EXPECT(findField(t, "ratio").defaultValue.floating == 0.5);
  KJ_EXPECT(findField(t, "whole").defaultValue.floating == 3);
  KJ_EXPECT(findField(t, "edge").defaultValue.floating == -3.4e38);
  KJ_EXPECT(findField(t, "huge").defaultValue.floating == 1e300);
  KJ_EXPECT(findField(t, "flag").defaultValue.boolean);
  KJ_EXPECT(findField(t, "nothing").defaultValue.which == Value::INTEGER);
  KJ_EXPECT(findField(t, "nothing").defaultValue.integer == 0);
  KJ_EXPECT(findField(t, "name").defaultValue.which == Value::NONE);
}

KJ_TEST("invalid defaults") {
  TestCompilation test;
  auto kinds = test.compileWithErrors(
      "enum NoZero: ubyte { One = 1, Two }\n"
      "table T {\n"
      "  small: byte = 200;\n"
      "  unsigned: uint = -1;\n"
      "  flag: bool = 2;\n"
      "  name: string = \"x\";\n"
      "  e: NoZero;\n"
      "  f: NoZero = Three;\n"
      "  big: float = 1e40;\n"
      "  tiny: float32 = -1e39;\n"
      "}\n");
  KJ_EXPECT(kinds.size() == 8, kinds.size());
  for (auto kind: kinds) {
    KJ_EXPECT(kind == SemanticError::Kind::INVALID_DEFAULT_FOR_TYPE, kind);
  }
}

KJ_TEST("name resolution searches enclosing namespaces") {
  TestCompilation test;
  auto schema = test.compileOrFail(
      "namespace a;\n"
      "table Shared {}\n"
      "namespace a.b.c;\n"
      "table User { shared: Shared; local: c.Deep; full: a.b.Mid; }\n"
      "table Deep {}\n"
      "namespace a.b;\n"
      "table Mid {}\n");

  auto& user = schema->getTable(KJ_ASSERT_NONNULL(schema->findDecl("a.b.c.User")).id);
  KJ_EXPECT(schema->getDecl(findField(user, "shared").type.decl).fullName == "a.Shared");
  KJ_EXPECT(schema->getDecl(findField(user, "local").type.decl).fullName == "a.b.c.Deep");
  KJ_EXPECT(schema->getDecl(findField(user, "full").type.decl).fullName == "a.b.Mid");
}

KJ_TEST("unresolved and ambiguous types") {
  {
    TestCompilation test;
    auto kinds = test.compileWithErrors("table T { x: Nope; }\n");
    KJ_ASSERT(kinds.size() == 1);
    KJ_EXPECT(kinds[0] == SemanticError::Kind::UNRESOLVED_TYPE);
    KJ_EXPECT(test.diagnostics.getDiagnostics()[0].error.message == "unknown type 'Nope'");
  }
  {
    // From namespace `a`, `b.T` could be `a.b.T` or the top-level `b.T`.
    TestCompilation test;
    auto kinds = test.compileWithErrors(
        "namespace a.b;\n"
        "table T {}\n"
        "namespace b;\n"
        "table T {}\n"
        "namespace a;\n"
        "table X { t: b.T; }\n");
    KJ_ASSERT(kinds.size() == 1);
    KJ_EXPECT(kinds[0] == SemanticError::Kind::AMBIGUOUS_TYPE);
  }
}

KJ_TEST("duplicate declarations across modules") {
  TestCompilation test;
  test.addFile("a.fbs", "include \"b.fbs\";\nnamespace x;\ntable T {}\n");
  test.addFile("b.fbs", "namespace x;\ntable T { a: int; }\n");
  KJ_EXPECT(test.compile("a.fbs") == nullptr);

  auto diagnostics = test.diagnostics.getDiagnostics();
  KJ_ASSERT(diagnostics.size() == 1);
  KJ_EXPECT(diagnostics[0].error.isSemantic(SemanticError::Kind::DUPLICATE_DECLARATION));
  // Modules are ordered by name, so the copy in b.fbs is the duplicate.
  KJ_EXPECT(diagnostics[0].file == "b.fbs");
  KJ_EXPECT(diagnostics[0].start.line == 1);
}

KJ_TEST("declaration ids don't depend on load order") {
  auto build = [](bool reverse) {
    TestCompilation test;
    test.addFile("a.fbs", "namespace x;\ntable A {}\ntable B {}\n");
    test.addFile("b.fbs", "namespace x;\ntable C { a: A; }\n");
    kj::StringPtr forward[] = { "a.fbs", "b.fbs" };
    kj::StringPtr backward[] = { "b.fbs", "a.fbs" };
    auto result = test.compile(reverse ? kj::arrayPtr(backward, 2) : kj::arrayPtr(forward, 2));
    return kj::mv(KJ_ASSERT_NONNULL(result));
  };

  auto first = build(false);
  auto second = build(true);
  for (auto name: { "x.A", "x.B", "x.C" }) {
    KJ_EXPECT(KJ_ASSERT_NONNULL(first->findDecl(name)).id ==
              KJ_ASSERT_NONNULL(second->findDecl(name)).id, name);
  }
  KJ_EXPECT(first->getModules()[0].sourceName == "a.fbs");
  KJ_EXPECT(second->getModules()[0].sourceName == "a.fbs");
}

KJ_TEST("includes resolve relative to the file, then the import path") {
  TestCompilation test;
  auto lib = kj::newInMemoryDirectory(kj::nullClock());
  lib->openFile(kj::Path({"common", "types.fbs"}),
                kj::WriteMode::CREATE | kj::WriteMode::CREATE_PARENT)
      ->writeAll("namespace common;\ntable Point { x: int; }\n");
  test.loader.addImportPath(*lib);

  test.addFile("app/sibling.fbs", "namespace app;\ntable Sibling {}\n");
  test.addFile("app/main.fbs",
      "include \"sibling.fbs\";\n"
      "include \"common/types.fbs\";\n"
      "namespace app;\n"
      "table Main { p: common.Point; s: Sibling; }\n");

  auto result = test.compile("app/main.fbs");
  auto& schema = KJ_ASSERT_NONNULL(result);
  KJ_EXPECT(schema->getModules().size() == 3);
  auto& main = KJ_ASSERT_NONNULL(schema->findModule("app/main.fbs"));
  KJ_EXPECT(main.includes.size() == 2);
  KJ_EXPECT(schema->findModule("app/sibling.fbs") != nullptr);
  KJ_EXPECT(schema->findModule("common/types.fbs") != nullptr);
}

KJ_TEST("unresolved include") {
  TestCompilation test;
  auto kinds = test.compileWithErrors("include \"missing.fbs\";\ntable T {}\n");
  KJ_ASSERT(kinds.size() == 1);
  KJ_EXPECT(kinds[0] == SemanticError::Kind::UNRESOLVED_INCLUDE);
}

KJ_TEST("every semantic error of a compilation is reported together") {
  TestCompilation test;
  auto kinds = test.compileWithErrors(
      "struct Loop { next: Loop; }\n"
      "table T {\n"
      "  x: Missing;\n"
      "  y: int = \"text\";\n"
      "  z: int (bogus);\n"
      "  v: [[int]];\n"
      "}\n"
      "struct S { x: int; }\n"
      "rpc_service Svc {\n"
      "  Call(S): T;\n"
      "  Other(T): T (streaming: \"sideways\");\n"
      "}\n"
      "root_type S;\n");

  KJ_EXPECT(contains(kinds, SemanticError::Kind::STRUCT_CYCLE));
  KJ_EXPECT(contains(kinds, SemanticError::Kind::UNRESOLVED_TYPE));
  KJ_EXPECT(contains(kinds, SemanticError::Kind::INVALID_DEFAULT_FOR_TYPE));
  KJ_EXPECT(contains(kinds, SemanticError::Kind::UNKNOWN_ATTRIBUTE));
  KJ_EXPECT(contains(kinds, SemanticError::Kind::INVALID_FIELD_TYPE));
  KJ_EXPECT(contains(kinds, SemanticError::Kind::NON_TABLE_RPC_TYPE));
  KJ_EXPECT(contains(kinds, SemanticError::Kind::UNKNOWN_ATTRIBUTE_VALUE));
  KJ_EXPECT(contains(kinds, SemanticError::Kind::INVALID_DECLARATION));
}

KJ_TEST("attributes") {
  {
    TestCompilation test;
    test.compileOrFail(
        "attribute \"priority\";\n"
        "table T { a: int (priority: 3); }\n");
  }
  {
    TestCompilation test;
    auto kinds = test.compileWithErrors("table T (bit_flags) { a: int; }\n");
    KJ_ASSERT(kinds.size() == 1);
    KJ_EXPECT(kinds[0] == SemanticError::Kind::MISPLACED_ATTRIBUTE);
  }
  {
    TestCompilation test;
    auto kinds = test.compileWithErrors("table T { a: int (required); }\n");
    KJ_ASSERT(kinds.size() == 1);
    KJ_EXPECT(kinds[0] == SemanticError::Kind::MISPLACED_ATTRIBUTE);
  }
  {
    TestCompilation test;
    auto kinds = test.compileWithErrors("table T { a: int (key); b: string (key); }\n");
    KJ_ASSERT(kinds.size() == 1);
    KJ_EXPECT(kinds[0] == SemanticError::Kind::MISPLACED_ATTRIBUTE);
  }
}

KJ_TEST("module-level statements") {
  {
    TestCompilation test;
    auto schema = test.compileOrFail(
        "namespace m;\n"
        "table Root {}\n"
        "root_type Root;\n"
        "file_identifier \"ROOT\";\n"
        "file_extension \"rt\";\n");
    auto& module = schema->getModules()[0];
    KJ_EXPECT(schema->getDecl(KJ_ASSERT_NONNULL(module.rootType)).fullName == "m.Root");
    KJ_EXPECT(KJ_ASSERT_NONNULL(module.fileIdentifier) == "ROOT");
    KJ_EXPECT(KJ_ASSERT_NONNULL(module.fileExtension) == "rt");
  }
  {
    TestCompilation test;
    auto kinds = test.compileWithErrors(
        "table Root {}\n"
        "root_type Root;\n"
        "file_identifier \"TOOLONG\";\n");
    KJ_ASSERT(kinds.size() == 1);
    KJ_EXPECT(kinds[0] == SemanticError::Kind::INVALID_DECLARATION);
  }
}

KJ_TEST("member names that clash in generated code") {
  TestCompilation test;
  auto kinds = test.compileWithErrors(
      "table X {}\n"
      "union U { X, x: X }\n"
      "struct S { max_hp: int; maxHp: int; }\n"
      "table T { max_hp: int; maxHp: int; u: U; uType: int; }\n"
      "table Req {}\n"
      "rpc_service Svc {\n"
      "  SayHello(Req): Req;\n"
      "  say_hello(Req): Req;\n"
      "}\n");
  KJ_EXPECT(kinds.size() == 5, kinds.size());
  for (auto kind: kinds) {
    KJ_EXPECT(kind == SemanticError::Kind::DUPLICATE_MEMBER, kind);
  }

  uint fieldClashes = 0;
  bool discriminantClash = false;
  for (auto& diagnostic: test.diagnostics.getDiagnostics()) {
    auto& message = diagnostic.error.message;
    if (message == "field 'maxHp' has the same name as 'max_hp' in generated code") {
      ++fieldClashes;
    } else if (message == "field 'uType' has the same name as 'u_type' in generated code") {
      discriminantClash = true;
    }
  }
  KJ_EXPECT(fieldClashes == 2);
  KJ_EXPECT(discriminantClash);
}

KJ_TEST("union variants named after namespaced types") {
  TestCompilation test;
  auto schema = test.compileOrFail(
      "namespace a;\n"
      "table X {}\n"
      "namespace b;\n"
      "table X {}\n"
      "union U { a.X, b.X }\n");

  auto& u = schema->getUnion(KJ_ASSERT_NONNULL(schema->findDecl("b.U")).id);
  KJ_ASSERT(u.variants.size() == 2);
  KJ_EXPECT(u.variants[0].name == "a_X");
  KJ_EXPECT(u.variants[1].name == "b_X");
}

KJ_TEST("union and rpc checks") {
  {
    TestCompilation test;
    auto kinds = test.compileWithErrors(
        "struct S { x: int; }\n"
        "union U { S }\n");
    KJ_ASSERT(kinds.size() == 1);
    KJ_EXPECT(kinds[0] == SemanticError::Kind::NON_TABLE_UNION_MEMBER);
  }
  {
    TestCompilation test;
    auto schema = test.compileOrFail(
        "table Req {}\n"
        "table Resp {}\n"
        "rpc_service Svc {\n"
        "  A(Req): Resp;\n"
        "  B(Req): Resp (streaming: \"server\");\n"
        "  C(Req): Resp (streaming: \"client\");\n"
        "  D(Req): Resp (streaming: \"bidi\");\n"
        "}\n");
    auto& decl = KJ_ASSERT_NONNULL(schema->findDecl("Svc"));
    auto& methods = decl.body.get<ServiceInfo>().methods;
    KJ_ASSERT(methods.size() == 4);
    KJ_EXPECT(methods[0].streaming == Streaming::NONE);
    KJ_EXPECT(methods[1].streaming == Streaming::SERVER);
    KJ_EXPECT(methods[2].streaming == Streaming::CLIENT);
    KJ_EXPECT(methods[3].streaming == Streaming::BIDI);
  }
}

}  // namespace
}  // namespace compiler
}  // namespace plank
