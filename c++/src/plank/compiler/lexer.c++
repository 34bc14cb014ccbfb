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
#include <kj/parse/char.h>
#include <kj/debug.h>
#include <stdlib.h>

namespace plank {
namespace compiler {

namespace p = kj::parse;

static const char* const KEYWORDS[] = {
  "attribute", "enum", "file_extension", "file_identifier", "include", "namespace",
  "root_type", "rpc_service", "struct", "table", "union"
};

bool isKeyword(kj::StringPtr name) {
  for (auto keyword: KEYWORDS) {
    if (name == keyword) return true;
  }
  return false;
}

kj::String describeToken(const Token& token) {
  switch (token.type) {
    case Token::IDENTIFIER: return kj::str("identifier '", token.text, "'");
    case Token::KEYWORD: return kj::str("keyword '", token.text, "'");
    case Token::INTEGER_LITERAL: return kj::str("integer ", token.text);
    case Token::FLOAT_LITERAL: return kj::str("number ", token.text);
    case Token::STRING_LITERAL: return kj::str("string \"", token.text, "\"");
    case Token::PUNCTUATION: return kj::str("'", token.text, "'");
    case Token::DOC_COMMENT: return kj::str("doc comment");
  }
  KJ_UNREACHABLE;
}

bool lex(kj::ArrayPtr<const char> input, kj::Vector<Token>& result,
         ErrorReporter& errorReporter) {
  Lexer lexer(errorReporter);

  Lexer::ParserInput parserInput(input.begin(), input.end());
  kj::Maybe<kj::Array<Token>> parseOutput = lexer.getParsers().tokenSequence(parserInput);

  KJ_IF_MAYBE(output, parseOutput) {
    for (auto& token: *output) {
      result.add(kj::mv(token));
    }
  }

  if (parserInput.atEnd()) {
    return true;
  }

  // tokenSequence stops at the first character that doesn't begin a valid token.  Figure out
  // what went wrong there.
  uint32_t position = parserInput.getPosition();
  kj::ArrayPtr<const char> rest = input.slice(position, input.size());
  if (rest[0] == '\"') {
    errorReporter.addLexError(position, LexError::Kind::UNTERMINATED_STRING,
        kj::str("unterminated string literal"));
  } else if (rest.size() >= 2 && rest[0] == '/' && rest[1] == '*') {
    errorReporter.addLexError(position, LexError::Kind::UNTERMINATED_COMMENT,
        kj::str("unterminated block comment"));
  } else if (static_cast<unsigned char>(rest[0]) < 0x20 ||
             static_cast<unsigned char>(rest[0]) >= 0x7f) {
    errorReporter.addLexError(position, LexError::Kind::UNEXPECTED_CHARACTER,
        kj::str("unexpected character 0x", kj::hex(static_cast<unsigned char>(rest[0]))));
  } else {
    errorReporter.addLexError(position, LexError::Kind::UNEXPECTED_CHARACTER,
        kj::str("unexpected character '", rest[0], "'"));
  }
  return false;
}

namespace {

typedef p::Span<uint32_t> Location;

Token makeToken(Token::Type type, const Location& loc, kj::String text) {
  Token result;
  result.type = type;
  result.text = kj::mv(text);
  result.startByte = loc.begin();
  result.endByte = loc.end();
  return result;
}

uint64_t parseDigits(kj::ArrayPtr<const char> digits, uint base) {
  // Saturates on overflow; range checks against the field type happen later anyway.
  uint64_t result = 0;
  for (char c: digits) {
    uint digit = c <= '9' ? c - '0' : (c | 0x20) - 'a' + 10;
    if (result > (UINT64_MAX - digit) / base) return UINT64_MAX;
    result = result * base + digit;
  }
  return result;
}

constexpr auto lineEnd = p::sequence(p::discard(p::optional(p::exactChar<'\r'>())),
                                     p::oneOf(p::exactChar<'\n'>(), p::endOfInput));

constexpr auto docCommentStart =
    p::sequence(p::exactChar<'/'>(), p::exactChar<'/'>(), p::exactChar<'/'>(),
                p::notLookingAt(p::exactChar<'/'>()));
// "///" starts a doc comment, but "////" is an ordinary comment.

constexpr auto discardLineComment =
    p::sequence(p::notLookingAt(docCommentStart), p::exactChar<'/'>(), p::exactChar<'/'>(),
                p::discard(p::many(p::discard(p::anyOfChars("\n").invert()))),
                p::oneOf(p::exactChar<'\n'>(), p::endOfInput));

constexpr auto discardBlockComment =
    p::sequence(p::exactChar<'/'>(), p::exactChar<'*'>(),
                p::discard(p::many(p::sequence(
                    p::notLookingAt(p::sequence(p::exactChar<'*'>(), p::exactChar<'/'>())),
                    p::discard(p::anyOfChars("").invert())))),
                p::exactChar<'*'>(), p::exactChar<'/'>());

constexpr auto utf8Bom =
    p::sequence(p::exactChar<'\xef'>(), p::exactChar<'\xbb'>(), p::exactChar<'\xbf'>());

constexpr auto bomsAndWhitespace =
    p::sequence(p::discardWhitespace,
                p::discard(p::many(p::sequence(utf8Bom, p::discardWhitespace))));

constexpr auto commentsAndWhitespace =
    p::sequence(bomsAndWhitespace,
                p::discard(p::many(p::sequence(p::oneOf(discardLineComment, discardBlockComment),
                                               bomsAndWhitespace))));

constexpr auto numberEnd = p::notLookingAt(p::nameChar.orAny("."));

constexpr auto hexInteger =
    p::sequence(p::exactChar<'0'>(), p::discard(p::anyOfChars("xX")), p::oneOrMore(p::hexDigit),
                numberEnd);
constexpr auto decimalInteger = p::sequence(p::oneOrMore(p::digit), numberEnd);

constexpr auto floatLiteral = p::sequence(
    p::oneOrMore(p::digit),
    p::optional(p::sequence(p::exactChar<'.'>(), p::many(p::digit))),
    p::optional(p::sequence(p::discard(p::anyOfChars("eE")), p::optional(p::anyOfChars("+-")),
                            p::oneOrMore(p::digit))),
    numberEnd);

}  // namespace

Lexer::Lexer(ErrorReporter& errorReporter) {
  auto& token = arena.copy(p::oneOf(
      p::transformWithLocation(
          p::sequence(docCommentStart, p::discard(p::optional(p::exactChar<' '>())),
                      p::charsToString(p::many(p::anyOfChars("\r\n").invert())), lineEnd),
          [](Location loc, kj::String text) -> Token {
            return makeToken(Token::DOC_COMMENT, loc, kj::mv(text));
          }),
      p::transformWithLocation(p::identifier,
          [](Location loc, kj::String name) -> Token {
            return makeToken(isKeyword(name) ? Token::KEYWORD : Token::IDENTIFIER,
                             loc, kj::mv(name));
          }),
      p::transformWithLocation(p::doubleQuotedString,
          [](Location loc, kj::String text) -> Token {
            return makeToken(Token::STRING_LITERAL, loc, kj::mv(text));
          }),
      p::transformWithLocation(hexInteger,
          [](Location loc, kj::Array<char> digits) -> Token {
            Token result = makeToken(Token::INTEGER_LITERAL, loc, kj::str("0x", digits));
            result.integerValue = parseDigits(digits, 16);
            return result;
          }),
      p::transformWithLocation(decimalInteger,
          [](Location loc, kj::Array<char> digits) -> Token {
            Token result = makeToken(Token::INTEGER_LITERAL, loc, kj::str(digits));
            result.integerValue = parseDigits(digits, 10);
            return result;
          }),
      p::transformWithLocation(floatLiteral,
          [](Location loc, kj::Array<char> digits, kj::Maybe<kj::Array<char>> fraction,
             kj::Maybe<kj::Tuple<kj::Maybe<char>, kj::Array<char>>> exponent) -> Token {
            kj::String text = kj::str(digits);
            KJ_IF_MAYBE(f, fraction) {
              text = kj::str(text, '.', *f);
            }
            KJ_IF_MAYBE(e, exponent) {
              KJ_IF_MAYBE(sign, kj::get<0>(*e)) {
                text = kj::str(text, 'e', *sign, kj::get<1>(*e));
              } else {
                text = kj::str(text, 'e', kj::get<1>(*e));
              }
            }
            double value = strtod(text.cStr(), nullptr);
            Token result = makeToken(Token::FLOAT_LITERAL, loc, kj::mv(text));
            result.floatValue = value;
            return result;
          }),
      p::transformWithLocation(p::anyOfChars("{}()[];:,=.+-"),
          [](Location loc, char c) -> Token {
            return makeToken(Token::PUNCTUATION, loc, kj::heapString(&c, 1));
          })));

  parsers.tokenSequence = arena.copy(p::sequence(
      commentsAndWhitespace, p::many(p::sequence(token, commentsAndWhitespace))));

  parsers.token = token;
  parsers.emptySpace = commentsAndWhitespace;
}

Lexer::~Lexer() noexcept(false) {}

}  // namespace compiler
}  // namespace plank
