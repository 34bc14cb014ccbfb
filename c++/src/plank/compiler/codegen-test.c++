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

#include "codegen.h"
#include "compiler.h"
#include "module-loader.h"
#include <kj/test.h>
#include <kj/filesystem.h>
#include <kj/time.h>
#include <string.h>

namespace plank {
namespace compiler {
namespace {

static const char GAME_SCHEMA[] =
    "namespace ex.game;\n"
    "\n"
    "/// Team colors.\n"
    "enum Color: byte { Red, Green, Blue = 8 }\n"
    "enum Perks: ubyte (bit_flags) { Fast, Strong }\n"
    "struct Vec2 { x: float; y: float; }\n"
    "struct Cell { occupied: bool; pos: Vec2; }\n"
    "table Item { name: string (key); weight: short = 3; }\n"
    "table Spell { power: int; }\n"
    "union Gear { Item, Magic: Spell }\n"
    "table Hero {\n"
    "  pos: Vec2;\n"
    "  /// Hit points.\n"
    "  hp: short = 100;\n"
    "  items: [Item];\n"
    "  color: Color = Blue;\n"
    "  old: int (deprecated);\n"
    "  gear: Gear;\n"
    "  ratio: double = 0.5;\n"
    "  perks: Perks;\n"
    "  level: ulong = 18446744073709551615;\n"
    "  name: string (required);\n"
    "}\n"
    "root_type Hero;\n"
    "file_identifier \"HERO\";\n"
    "file_extension \"hro\";\n";

class TestSchema {
public:
  TestSchema(): dir(kj::newInMemoryDirectory(kj::nullClock())), loader(diagnostics) {}

  void addFile(kj::StringPtr path, kj::StringPtr content) {
    dir->openFile(kj::Path::parse(path), kj::WriteMode::CREATE | kj::WriteMode::CREATE_PARENT)
        ->writeAll(content);
  }

  const CompiledSchema& compile(kj::StringPtr path) {
    Compiler compiler;
    compiler.add(KJ_ASSERT_NONNULL(loader.loadModule(*dir, kj::Path::parse(path))));
    auto result = compiler.compile();
    for (auto& diagnostic: diagnostics.getDiagnostics()) {
      KJ_FAIL_ASSERT("unexpected error", diagnostic);
    }
    schema = kj::mv(KJ_ASSERT_NONNULL(result));
    return *schema;
  }

  DiagnosticCollector diagnostics;
  kj::Own<const kj::Directory> dir;
  ModuleLoader loader;
  kj::Own<CompiledSchema> schema;
};

bool contains(kj::StringPtr text, kj::StringPtr snippet) {
  for (size_t i = 0; i + snippet.size() <= text.size(); i++) {
    if (memcmp(text.begin() + i, snippet.begin(), snippet.size()) == 0) return true;
  }
  return false;
}

void expectContains(kj::StringPtr text, kj::StringPtr snippet) {
  KJ_EXPECT(contains(text, snippet), snippet);
}

void expectNotContains(kj::StringPtr text, kj::StringPtr snippet) {
  KJ_EXPECT(!contains(text, snippet), snippet);
}

KJ_TEST("identifier case conversion") {
  KJ_EXPECT(toTitleCase("num_greetings") == "NumGreetings");
  KJ_EXPECT(toTitleCase("hp") == "Hp");
  KJ_EXPECT(toTitleCase("SayHello") == "SayHello");
  KJ_EXPECT(toLowerCamelCase("num_greetings") == "numGreetings");
  KJ_EXPECT(toLowerCamelCase("SayManyHellos") == "sayManyHellos");
  KJ_EXPECT(toUpperCase("hp") == "HP");
  KJ_EXPECT(toUpperCase("num_greetings") == "NUM_GREETINGS");
  KJ_EXPECT(toUpperCase("numGreetings") == "NUM_GREETINGS");
  KJ_EXPECT(toUpperCase("Vec3") == "VEC3");
}

KJ_TEST("output targets") {
  KJ_EXPECT(KJ_ASSERT_NONNULL(parseTarget("c++")) == Target::CPP);
  KJ_EXPECT(KJ_ASSERT_NONNULL(parseTarget("fbs")) == Target::FBS);
  KJ_EXPECT(parseTarget("rust") == nullptr);
  KJ_EXPECT(kj::str(Target::CPP) == "c++");
}

KJ_TEST("C++ header for enums, structs and tables") {
  TestSchema test;
  test.addFile("game.fbs", GAME_SCHEMA);
  auto& schema = test.compile("game.fbs");
  auto header = generateCppHeader(schema, schema.getModules()[0]);

  expectContains(header, "// Generated by plankc from game.fbs.  DO NOT EDIT.\n");
  expectContains(header, "#pragma once\n");
  expectContains(header, "#include <plank/generated-header-support.h>\n");
  expectNotContains(header, "#include <plank/rpc.h>");
  expectContains(header, "namespace ex {\nnamespace game {\n");
  expectContains(header, "}  // namespace game\n}  // namespace ex\n");

  // Enums.
  expectContains(header,
      "// Team colors.\n"
      "enum class Color: int8_t {\n"
      "  Red = 0,\n"
      "  Green = 1,\n"
      "  Blue = 8,\n"
      "};\n");
  expectContains(header,
      "enum class Perks: uint8_t {\n"
      "  Fast = 1u,\n"
      "  Strong = 2u,\n"
      "};\n");
  expectContains(header, "inline Perks operator|(Perks a, Perks b) {\n");
  expectContains(header,
      "enum class Gear: uint8_t {\n"
      "  NONE = 0,\n"
      "  Item = 1,\n"
      "  Magic = 2,\n"
      "};\n");

  // Structs.
  expectContains(header, "struct alignas(4) Vec2 {\n");
  expectContains(header, "static_assert(sizeof(Vec2) == 8,\n");
  expectContains(header, "static_assert(sizeof(Cell) == 12,\n");
  expectContains(header, "uint8_t padding_0[3];\n");

  // Tables.
  expectContains(header, "  static constexpr ::plank::voffset_t VT_POS = 4;\n");
  expectContains(header, "  static constexpr ::plank::voffset_t VT_HP = 6;\n");
  expectContains(header, "  static constexpr ::plank::voffset_t VT_OLD = 12;\n");
  expectContains(header, "  static constexpr ::plank::voffset_t VT_GEAR_TYPE = 14;\n");
  expectContains(header, "  static constexpr ::plank::voffset_t VT_GEAR = 16;\n");
  expectContains(header, "  static constexpr ::plank::voffset_t VT_LEVEL = 22;\n");
  expectContains(header, "  // Hit points.\n");
  expectContains(header, "table.getScalar<int16_t>(VT_HP, 100)");
  expectContains(header, "table.getScalar<double>(VT_RATIO, 0.5)");
  expectContains(header, "table.getScalar<uint64_t>(VT_LEVEL, 18446744073709551615ull)");
  expectContains(header, "static_cast<int8_t>(value)");
  expectContains(header, "::ex::game::Color color = ::ex::game::Color::Blue;\n");
  expectContains(header, "inline ::ex::game::Hero::Reader readHero(");

  // Deprecated fields keep their slot but lose their accessors.
  expectNotContains(header, "getOld");
  expectNotContains(header, "setOld");
  expectNotContains(header, "hasOld");

  // Root type.
  expectContains(header, "static constexpr char HERO_IDENTIFIER[] = \"HERO\";\n");
  expectContains(header, "static constexpr char HERO_EXTENSION[] = \"hro\";\n");
  expectContains(header, "  builder.finish(root, kj::StringPtr(HERO_IDENTIFIER));\n");
}

KJ_TEST("C++ keywords used as schema names") {
  TestSchema test;
  test.addFile("kw.fbs",
      "namespace kw;\n"
      "enum Mode: byte { default, new, Plain }\n"
      "struct Slot { padding0: bool; class: int; }\n"
      "table Box { class: int; delete: string; mode: Mode; }\n"
      "union Any { register: Box }\n"
      "table Holder { any: Any; }\n"
      "rpc_service Ops {\n"
      "  delete(Box): Box;\n"
      "  dispatch(Box): Box;\n"
      "}\n");
  auto& schema = test.compile("kw.fbs");
  auto header = generateCppHeader(schema, schema.getModules()[0]);

  expectContains(header,
      "enum class Mode: int8_t {\n"
      "  default_ = 0,\n"
      "  new_ = 1,\n"
      "  Plain = 2,\n"
      "};\n");
  expectContains(header, "    case Mode::default_: return \"default\";\n");
  expectContains(header, "::kw::Mode mode = ::kw::Mode::default_;\n");

  // The struct's own field and its padding don't collide.
  expectContains(header, "inline Slot(bool padding0, int32_t class_): Slot() {\n");
  expectContains(header, "  ::plank::WireValue<bool> padding0_;\n");
  expectContains(header, "  uint8_t padding_0[3];\n");
  expectContains(header, "  ::plank::WireValue<int32_t> class_;\n");

  expectContains(header, "  int32_t class_ = 0;\n");
  expectContains(header, " delete_;\n");
  expectContains(header, "  result.setClass(args.class_);\n");
  expectContains(header, "  result.setDelete(args.delete_);\n");

  expectContains(header, "  register_ = 1,\n");
  expectContains(header, "  setAnyType(::kw::Any::register_);\n");
  expectContains(header, "getAnyAsRegister() const");

  expectContains(header, " delete_(::plank::Message<::kw::Box>&& request)");
  expectContains(header, " dispatch_(::plank::Message<::kw::Box>&& request)");
  expectContains(header, "  if (method == \"delete\") {\n");
  expectNotContains(header, " delete(");
}

KJ_TEST("C++ header for services") {
  TestSchema test;
  test.addFile("echo.fbs",
      "namespace svc;\n"
      "table Request { text: string; }\n"
      "table Reply { text: string; }\n"
      "rpc_service Echo {\n"
      "  Say(Request): Reply;\n"
      "  Repeat(Request): Reply (streaming: \"server\");\n"
      "  Gather(Request): Reply (streaming: \"client\");\n"
      "  Talk(Request): Reply (streaming: \"bidi\");\n"
      "}\n");
  auto& schema = test.compile("echo.fbs");
  auto header = generateCppHeader(schema, schema.getModules()[0]);

  expectContains(header, "#include <plank/rpc.h>\n");
  expectContains(header, "class Echo::Client {\n");
  expectContains(header, "class Echo::Server: public ::plank::rpc::Service {\n");
  expectContains(header,
      "  inline kj::Promise<::plank::Message<::svc::Reply>> say("
          "::plank::Message<::svc::Request>&& request);\n");
  expectContains(header,
      "::plank::rpc::callServerStreaming<::svc::Reply>(\n"
      "      channel, \"svc.Echo\", \"Repeat\", kj::mv(request))");
  expectContains(header,
      "::plank::rpc::callClientStreaming<::svc::Request, ::svc::Reply>(\n"
      "      channel, \"svc.Echo\", \"Gather\")");
  expectContains(header, "::plank::rpc::callBidiStreaming<::svc::Request, ::svc::Reply>(");
  expectContains(header, "kj::StringPtr getServiceName() override { return \"svc.Echo\"; }\n");
  expectContains(header, "  if (method == \"Talk\") {\n");
  expectContains(header, "KJ_EXCEPTION(UNIMPLEMENTED, \"method not implemented\", \"svc.Echo\"");
}

KJ_TEST("C++ header includes the headers of referenced modules") {
  TestSchema test;
  test.addFile("shapes/point.fbs", "namespace shapes;\nstruct Point { x: int; y: int; }\n");
  test.addFile("shapes/unused.fbs", "namespace shapes;\ntable Unused {}\n");
  test.addFile("shapes/line.fbs",
      "include \"point.fbs\";\n"
      "include \"unused.fbs\";\n"
      "namespace shapes;\n"
      "struct Line { a: Point; b: Point; }\n");
  auto& schema = test.compile("shapes/line.fbs");
  auto& module = KJ_ASSERT_NONNULL(schema.findModule("shapes/line.fbs"));
  auto header = generateCppHeader(schema, module);

  expectContains(header, "#include \"shapes/point.fbs.h\"\n");
  expectContains(header, "#include \"shapes/unused.fbs.h\"\n");
  expectNotContains(header, "#include \"shapes/line.fbs.h\"");
  expectContains(header, "  ::shapes::Point a_;\n");
  KJ_EXPECT(cppHeaderPath("shapes/line.fbs") == "shapes/line.fbs.h");
}

KJ_TEST("canonical schema compiles back to the same layout") {
  TestSchema first;
  first.addFile("game.fbs", GAME_SCHEMA);
  auto& original = first.compile("game.fbs");
  auto canonical = generateCanonicalSchema(original, original.getModules()[0]);

  expectContains(canonical, "namespace ex.game;\n");
  expectContains(canonical, "  Magic: ex.game.Spell");
  expectContains(canonical, "  hp: int16 = 100 (id: 1);\n");
  expectContains(canonical, "  color: ex.game.Color = Blue (id: 3);\n");
  expectContains(canonical, "  old: int32 (id: 4, deprecated);\n");
  expectContains(canonical, "  gear: ex.game.Gear (id: 6);\n");
  expectContains(canonical, "  name: string (id: 10, required);\n");
  expectContains(canonical, "root_type ex.game.Hero;\n");

  TestSchema second;
  second.addFile("game.fbs", canonical);
  auto& reparsed = second.compile("game.fbs");

  KJ_ASSERT(reparsed.getDecls().size() == original.getDecls().size());
  for (auto& decl: original.getDecls()) {
    auto& other = KJ_ASSERT_NONNULL(reparsed.findDecl(decl.fullName));
    KJ_ASSERT(other.getKind() == decl.getKind(), decl.fullName);

    switch (decl.getKind()) {
      case DeclInfo::ENUM: {
        auto& a = decl.body.get<EnumInfo>();
        auto& b = other.body.get<EnumInfo>();
        KJ_EXPECT(a.underlying == b.underlying);
        KJ_ASSERT(a.variants.size() == b.variants.size());
        for (auto i: kj::indices(a.variants)) {
          KJ_EXPECT(a.variants[i].value == b.variants[i].value, decl.fullName, i);
        }
        break;
      }
      case DeclInfo::STRUCT: {
        auto& a = decl.body.get<StructInfo>();
        auto& b = other.body.get<StructInfo>();
        KJ_EXPECT(a.size == b.size && a.alignment == b.alignment, decl.fullName);
        for (auto i: kj::indices(a.fields)) {
          KJ_EXPECT(a.fields[i].offset == b.fields[i].offset, decl.fullName, i);
        }
        break;
      }
      case DeclInfo::TABLE: {
        auto& a = decl.body.get<TableInfo>();
        auto& b = other.body.get<TableInfo>();
        KJ_EXPECT(a.slotCount == b.slotCount);
        KJ_ASSERT(a.fields.size() == b.fields.size());
        for (auto i: kj::indices(a.fields)) {
          KJ_EXPECT(a.fields[i].slot == b.fields[i].slot, decl.fullName, i);
          KJ_EXPECT(a.fields[i].typeSlot == b.fields[i].typeSlot, decl.fullName, i);
          KJ_EXPECT(a.fields[i].defaultValue.integer == b.fields[i].defaultValue.integer);
          KJ_EXPECT(a.fields[i].defaultValue.floating == b.fields[i].defaultValue.floating);
          KJ_EXPECT(a.fields[i].required == b.fields[i].required);
          KJ_EXPECT(a.fields[i].deprecated == b.fields[i].deprecated);
        }
        break;
      }
      case DeclInfo::UNION:
      case DeclInfo::RPC_SERVICE:
        break;
    }
  }

  // Canonical form is a fixed point.
  KJ_EXPECT(generateCanonicalSchema(reparsed, reparsed.getModules()[0]) == canonical);
}

KJ_TEST("compileAndGenerate writes nothing when any file has errors") {
  auto dir = kj::newInMemoryDirectory(kj::nullClock());
  dir->openFile(kj::Path("good.fbs"), kj::WriteMode::CREATE)
      ->writeAll("table Good { a: int; }\n");
  dir->openFile(kj::Path("bad.fbs"), kj::WriteMode::CREATE)
      ->writeAll("table Bad { a: Missing; }\n");

  Target targets[] = { Target::CPP, Target::FBS };

  {
    kj::Path sources[] = { kj::Path("good.fbs") };
    auto result = compileAndGenerate(*dir, kj::arrayPtr(sources, 1), nullptr,
                                     kj::arrayPtr(targets, 2));
    KJ_ASSERT(result.is<kj::Array<GeneratedFile>>());
    auto& files = result.get<kj::Array<GeneratedFile>>();
    KJ_ASSERT(files.size() == 2);
    KJ_EXPECT(files[0].target == Target::CPP);
    KJ_EXPECT(files[0].path == "good.fbs.h");
    KJ_EXPECT(files[1].target == Target::FBS);
    KJ_EXPECT(files[1].path == "good.fbs");
  }

  {
    kj::Path sources[] = { kj::Path("good.fbs"), kj::Path("bad.fbs") };
    auto result = compileAndGenerate(*dir, kj::arrayPtr(sources, 2), nullptr,
                                     kj::arrayPtr(targets, 2));
    KJ_ASSERT(result.is<kj::Array<Diagnostic>>());
    auto& diagnostics = result.get<kj::Array<Diagnostic>>();
    KJ_ASSERT(diagnostics.size() == 1);
    KJ_EXPECT(diagnostics[0].file == "bad.fbs");
    KJ_EXPECT(kj::str(diagnostics[0]) == "bad.fbs:1:16: error: unknown type 'Missing'",
              diagnostics[0]);
  }
}

KJ_TEST("compileAndGenerate reports a missing source file") {
  auto dir = kj::newInMemoryDirectory(kj::nullClock());
  dir->openFile(kj::Path("bad.fbs"), kj::WriteMode::CREATE)
      ->writeAll("table Bad { a: Missing; }\n");

  Target targets[] = { Target::CPP };
  kj::Path sources[] = { kj::Path("gone.fbs"), kj::Path("bad.fbs") };
  auto result = compileAndGenerate(*dir, kj::arrayPtr(sources, 2), nullptr,
                                   kj::arrayPtr(targets, 1));
  KJ_ASSERT(result.is<kj::Array<Diagnostic>>());
  auto& diagnostics = result.get<kj::Array<Diagnostic>>();
  KJ_ASSERT(diagnostics.size() == 2);
  KJ_EXPECT(diagnostics[0].error.isSemantic(SemanticError::Kind::FILE_NOT_FOUND));
  KJ_EXPECT(kj::str(diagnostics[0]) == "gone.fbs:1:1: error: no such file", diagnostics[0]);
  KJ_EXPECT(diagnostics[1].file == "bad.fbs");
}

}  // namespace
}  // namespace compiler
}  // namespace plank
