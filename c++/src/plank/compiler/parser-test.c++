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

#include "parser.h"
#include "pretty-print.h"
#include <kj/test.h>
#include <kj/vector.h>

namespace plank {
namespace compiler {
namespace {

class TestErrorReporter: public ErrorReporter {
public:
  void addError(Error&& error) override {
    errors.add(kj::mv(error));
  }

  bool hadErrors() override {
    return errors.size() > 0;
  }

  kj::Vector<Error> errors;
};

Schema parseOrFail(kj::StringPtr text) {
  TestErrorReporter errorReporter;
  auto result = parseSchemaText(text, errorReporter);
  for (auto& error: errorReporter.errors) {
    KJ_FAIL_EXPECT("unexpected parse error", error.startByte, error.message);
  }
  return kj::mv(KJ_ASSERT_NONNULL(result));
}

static const char MONSTER_SCHEMA[] =
    "// example IDL file\n"
    "include \"other.fbs\";\n"
    "attribute \"priority\";\n"
    "namespace MyGame.Sample;\n"
    "\n"
    "/// The colors.\n"
    "enum Color: byte { Red = 0, Green, Blue = 2, }\n"
    "enum Flags: ubyte (bit_flags) { A, B }\n"
    "union Equipment { Weapon, Armor: MyGame.Sample.Shield }\n"
    "struct Vec3 (force_align: 16) {\n"
    "  x: float;\n"
    "  y: float;\n"
    "  z: float;\n"
    "}\n"
    "\n"
    "table Monster {\n"
    "  /// Position.\n"
    "  ///\n"
    "  /// Never null.\n"
    "  pos: Vec3;\n"
    "  mana: short = 150;\n"
    "  hp: short = -100;\n"
    "  name: string (required, priority: 1);\n"
    "  friendly: bool = false (deprecated);\n"
    "  inventory: [ubyte];\n"
    "  color: Color = Blue;\n"
    "  weapons: [Weapon];\n"
    "  equipped: Equipment;\n"
    "  path: [Vec3];\n"
    "  ratio: double = 1.5e10;\n"
    "  neg_inf: float = -inf;\n"
    "  undefined: float = nan;\n"
    "}\n"
    "\n"
    "namespace;\n"
    "table Weapon { name: string; damage: short; }\n"
    "rpc_service Greeter {\n"
    "  SayHello(HelloRequest): HelloReply;\n"
    "  SayManyHellos(ManyHellosRequest): HelloReply (streaming: \"server\");\n"
    "}\n"
    "\n"
    "root_type MyGame.Sample.Monster;\n"
    "file_identifier \"MONS\";\n"
    "file_extension \"mon\";\n";

KJ_TEST("parser builds the syntax tree") {
  auto schema = parseOrFail(MONSTER_SCHEMA);
  KJ_ASSERT(schema.statements.size() == 14);

  KJ_EXPECT(schema.statements[0].get<Include>().path == "other.fbs");
  KJ_EXPECT(schema.statements[1].get<AttributeDecl>().name == "priority");
  KJ_EXPECT(kj::strArray(schema.statements[2].get<NamespaceDirective>().path, ".") ==
            "MyGame.Sample");

  {
    auto& decl = schema.statements[3].get<Declaration>();
    KJ_EXPECT(decl.name == "Color");
    KJ_EXPECT(kj::strArray(decl.namespacePath, ".") == "MyGame.Sample");
    KJ_ASSERT(decl.docs.size() == 1);
    KJ_EXPECT(decl.docs[0] == "The colors.");
    auto& body = decl.body.get<EnumDecl>();
    KJ_EXPECT(body.underlyingType.scalar == ScalarKind::INT8);
    KJ_ASSERT(body.values.size() == 3);
    KJ_EXPECT(body.values[1].name == "Green");
    KJ_EXPECT(body.values[1].value == nullptr);
    KJ_EXPECT(KJ_ASSERT_NONNULL(body.values[2].value).integer == 2);
  }

  {
    auto& decl = schema.statements[5].get<Declaration>();
    auto& body = decl.body.get<UnionDecl>();
    KJ_ASSERT(body.variants.size() == 2);
    KJ_EXPECT(body.variants[0].alias == nullptr);
    KJ_EXPECT(body.variants[0].type.name == "Weapon");
    KJ_EXPECT(KJ_ASSERT_NONNULL(body.variants[1].alias) == "Armor");
    KJ_EXPECT(body.variants[1].type.name == "MyGame.Sample.Shield");
  }

  {
    auto& decl = schema.statements[7].get<Declaration>();
    KJ_EXPECT(decl.name == "Monster");
    auto& fields = decl.body.get<TableDecl>().fields;
    KJ_ASSERT(fields.size() == 13);

    KJ_ASSERT(fields[0].docs.size() == 3);
    KJ_EXPECT(fields[0].docs[1] == "");
    KJ_EXPECT(fields[0].type.which == TypeExpr::NAMED);

    auto& hp = KJ_ASSERT_NONNULL(fields[2].defaultValue);
    KJ_EXPECT(hp.which == Literal::INTEGER);
    KJ_EXPECT(hp.negative);
    KJ_EXPECT(hp.integer == 100);

    KJ_EXPECT(findAttribute(fields[3].attributes, "required") != nullptr);
    auto& priority = KJ_ASSERT_NONNULL(findAttribute(fields[3].attributes, "priority"));
    KJ_EXPECT(KJ_ASSERT_NONNULL(priority.value).integer == 1);

    KJ_EXPECT(fields[5].type.which == TypeExpr::VECTOR);
    KJ_EXPECT(fields[5].type.element->scalar == ScalarKind::UINT8);

    KJ_EXPECT(KJ_ASSERT_NONNULL(fields[6].defaultValue).which == Literal::IDENTIFIER);

    auto& negInf = KJ_ASSERT_NONNULL(fields[11].defaultValue);
    KJ_EXPECT(negInf.which == Literal::FLOAT);
    KJ_EXPECT(negInf.negative);
    KJ_EXPECT(negInf.floating == kj::inf());
  }

  {
    // `namespace;` returns to the root namespace.
    auto& decl = schema.statements[9].get<Declaration>();
    KJ_EXPECT(decl.name == "Weapon");
    KJ_EXPECT(decl.namespacePath.size() == 0);
  }

  {
    auto& methods = schema.statements[10].get<Declaration>().body.get<RpcServiceDecl>().methods;
    KJ_ASSERT(methods.size() == 2);
    KJ_EXPECT(methods[1].name == "SayManyHellos");
    KJ_EXPECT(methods[1].request.name == "ManyHellosRequest");
    auto& streaming = KJ_ASSERT_NONNULL(findAttribute(methods[1].attributes, "streaming"));
    KJ_EXPECT(KJ_ASSERT_NONNULL(streaming.value).text == "server");
  }

  KJ_EXPECT(schema.statements[11].get<RootType>().name == "MyGame.Sample.Monster");
  KJ_EXPECT(schema.statements[12].get<FileIdentifier>().value == "MONS");
  KJ_EXPECT(schema.statements[13].get<FileExtension>().value == "mon");
}

KJ_TEST("pretty-printed schema parses back to the same tree") {
  auto schema = parseOrFail(MONSTER_SCHEMA);
  auto printed = prettyPrint(schema);
  auto reparsed = parseOrFail(printed);
  KJ_EXPECT(reparsed == schema, printed);

  // Printing is a fixed point after one pass.
  KJ_EXPECT(prettyPrint(reparsed) == printed);
}

KJ_TEST("parser reports several field errors in one pass") {
  TestErrorReporter errorReporter;
  auto result = parseSchemaText(kj::StringPtr(
      "table T {\n"
      "  a: int\n"
      "  b int;\n"
      "  c: [int;\n"
      "  d: int;\n"
      "}\n"
      "table U { x: int; }\n"), errorReporter);

  KJ_EXPECT(result == nullptr);
  KJ_ASSERT(errorReporter.errors.size() >= 2, errorReporter.errors.size());

  auto& first = errorReporter.errors[0].detail.get<ParseError>();
  KJ_EXPECT(first.expected == "';'", first.expected);
  KJ_EXPECT(first.found == "identifier 'b'", first.found);

  for (auto& error: errorReporter.errors) {
    KJ_EXPECT(error.detail.is<ParseError>());
  }
}

KJ_TEST("parser error at end of file") {
  TestErrorReporter errorReporter;
  kj::StringPtr text = "table T { a: int;";
  auto result = parseSchemaText(text, errorReporter);
  KJ_EXPECT(result == nullptr);
  KJ_ASSERT(errorReporter.errors.size() == 1);
  KJ_EXPECT(errorReporter.errors[0].startByte == text.size());
  KJ_EXPECT(errorReporter.errors[0].detail.get<ParseError>().found == "end of file");
}

KJ_TEST("parser recovers at top-level statements") {
  TestErrorReporter errorReporter;
  auto result = parseSchemaText(kj::StringPtr(
      "root_type ;\n"
      "table T { a: int; }\n"
      "file_identifier 42;\n"), errorReporter);
  KJ_EXPECT(result == nullptr);
  KJ_ASSERT(errorReporter.errors.size() == 2);
  KJ_EXPECT(errorReporter.errors[0].detail.get<ParseError>().expected == "identifier");
  KJ_EXPECT(errorReporter.errors[1].detail.get<ParseError>().expected == "string literal");
}

}  // namespace
}  // namespace compiler
}  // namespace plank
