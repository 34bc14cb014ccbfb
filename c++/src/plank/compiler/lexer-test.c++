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

#include "lexer.h"
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

kj::String doLex(kj::StringPtr text) {
  // Lexes the text and stringifies the tokens in a compact form, e.g. "id:foo@0-3 p:;@3-4".
  TestErrorReporter errorReporter;
  kj::Vector<Token> tokens;
  KJ_EXPECT(lex(text, tokens, errorReporter));
  KJ_EXPECT(errorReporter.errors.size() == 0);

  return kj::strArray(KJ_MAP(token, tokens) {
    kj::StringPtr tag;
    switch (token.type) {
      case Token::IDENTIFIER: tag = "id"; break;
      case Token::KEYWORD: tag = "kw"; break;
      case Token::INTEGER_LITERAL: tag = "int"; break;
      case Token::FLOAT_LITERAL: tag = "float"; break;
      case Token::STRING_LITERAL: tag = "str"; break;
      case Token::PUNCTUATION: tag = "p"; break;
      case Token::DOC_COMMENT: tag = "doc"; break;
    }
    return kj::str(tag, ':', token.text, '@', token.startByte, '-', token.endByte);
  }, " ");
}

KJ_TEST("lexer splits identifiers, keywords and punctuation") {
  KJ_EXPECT(doLex("table Monster {") == "kw:table@0-5 id:Monster@6-13 p:{@14-15");
  KJ_EXPECT(doLex("hp:short=100;") ==
      "id:hp@0-2 p::@2-3 id:short@3-8 p:=@8-9 int:100@9-12 p:;@12-13");
  KJ_EXPECT(doLex("a.b.c") == "id:a@0-1 p:.@1-2 id:b@2-3 p:.@3-4 id:c@4-5");
  KJ_EXPECT(doLex("[ubyte]") == "p:[@0-1 id:ubyte@1-6 p:]@6-7");
  KJ_EXPECT(doLex("rpc_service file_identifier file_extension attribute") ==
      "kw:rpc_service@0-11 kw:file_identifier@12-27 kw:file_extension@28-42 "
      "kw:attribute@43-52");
}

KJ_TEST("lexer separates doc comments from ordinary comments") {
  KJ_EXPECT(doLex("foo // comment\n bar") == "id:foo@0-3 id:bar@16-19");
  KJ_EXPECT(doLex("/// Hello.\nfoo") == "doc:Hello.@0-11 id:foo@11-14");
  KJ_EXPECT(doLex("///no space\n") == "doc:no space@0-12");
  KJ_EXPECT(doLex("//// not a doc comment\nfoo") == "id:foo@23-26");
  KJ_EXPECT(doLex("a /* block\n comment */ b") == "id:a@0-1 id:b@23-24");
  KJ_EXPECT(doLex("///") == "doc:@0-3");
}

KJ_TEST("lexer numbers") {
  TestErrorReporter errorReporter;
  kj::Vector<Token> tokens;
  KJ_ASSERT(lex(kj::StringPtr("123 0x1F 2.75 6e4 1.5e-3 18446744073709551615 7."),
                tokens, errorReporter));
  KJ_ASSERT(tokens.size() == 7);

  KJ_EXPECT(tokens[0].type == Token::INTEGER_LITERAL);
  KJ_EXPECT(tokens[0].integerValue == 123);
  KJ_EXPECT(tokens[1].type == Token::INTEGER_LITERAL);
  KJ_EXPECT(tokens[1].integerValue == 31);
  KJ_EXPECT(tokens[1].text == "0x1F");
  KJ_EXPECT(tokens[2].type == Token::FLOAT_LITERAL);
  KJ_EXPECT(tokens[2].floatValue == 2.75);
  KJ_EXPECT(tokens[3].type == Token::FLOAT_LITERAL);
  KJ_EXPECT(tokens[3].floatValue == 60000);
  KJ_EXPECT(tokens[4].floatValue == 1.5e-3);
  KJ_EXPECT(tokens[5].integerValue == 18446744073709551615ull);
  KJ_EXPECT(tokens[6].type == Token::FLOAT_LITERAL);
  KJ_EXPECT(tokens[6].floatValue == 7);
}

KJ_TEST("lexer strings") {
  KJ_EXPECT(doLex("\"MONS\"") == "str:MONS@0-6");
  KJ_EXPECT(doLex("  \"foo\\x20\" x") == "str:foo @2-11 id:x@12-13");

  TestErrorReporter errorReporter;
  kj::Vector<Token> tokens;
  KJ_ASSERT(lex(kj::StringPtr("\"a\\\"b\\n\""), tokens, errorReporter));
  KJ_ASSERT(tokens.size() == 1);
  KJ_EXPECT(tokens[0].text == "a\"b\n");
}

KJ_TEST("lexer skips a byte order mark") {
  KJ_EXPECT(doLex("\xef\xbb\xbftable") == "kw:table@3-8");
}

KJ_TEST("lexer errors") {
  {
    TestErrorReporter errorReporter;
    kj::Vector<Token> tokens;
    KJ_EXPECT(!lex(kj::StringPtr("table \"oops"), tokens, errorReporter));
    KJ_ASSERT(errorReporter.errors.size() == 1);
    auto& error = errorReporter.errors[0];
    KJ_EXPECT(error.startByte == 6);
    KJ_EXPECT(error.detail.get<LexError>().kind == LexError::Kind::UNTERMINATED_STRING);
  }

  {
    TestErrorReporter errorReporter;
    kj::Vector<Token> tokens;
    KJ_EXPECT(!lex(kj::StringPtr("a $ b"), tokens, errorReporter));
    KJ_ASSERT(errorReporter.errors.size() == 1);
    auto& error = errorReporter.errors[0];
    KJ_EXPECT(error.startByte == 2);
    KJ_EXPECT(error.detail.get<LexError>().kind == LexError::Kind::UNEXPECTED_CHARACTER);
    KJ_EXPECT(error.message == "unexpected character '$'", error.message);
  }

  {
    TestErrorReporter errorReporter;
    kj::Vector<Token> tokens;
    KJ_EXPECT(!lex(kj::StringPtr("a /* never closed"), tokens, errorReporter));
    KJ_ASSERT(errorReporter.errors.size() == 1);
    KJ_EXPECT(errorReporter.errors[0].detail.get<LexError>().kind ==
              LexError::Kind::UNTERMINATED_COMMENT);
  }
}

}  // namespace
}  // namespace compiler
}  // namespace plank
