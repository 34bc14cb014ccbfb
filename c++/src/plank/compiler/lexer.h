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

#include <kj/parse/common.h>
#include <kj/arena.h>
#include <kj/vector.h>
#include "error-reporter.h"

namespace plank {
namespace compiler {

struct Token {
  enum Type: uint8_t {
    IDENTIFIER,
    KEYWORD,
    INTEGER_LITERAL,
    FLOAT_LITERAL,
    STRING_LITERAL,
    PUNCTUATION,
    DOC_COMMENT
  };

  Type type;

  kj::String text;
  // Identifier or keyword name, decoded string literal, punctuation character, or the text of a
  // doc comment line (without the leading "///" and at most one space).  For numeric literals,
  // the literal as written.

  uint64_t integerValue = 0;
  double floatValue = 0;

  uint32_t startByte;
  uint32_t endByte;

  inline bool isPunctuation(char c) const {
    return type == PUNCTUATION && text.size() == 1 && text[0] == c;
  }
  inline bool isKeyword(kj::StringPtr name) const { return type == KEYWORD && text == name; }
  inline bool isIdentifier(kj::StringPtr name) const {
    return type == IDENTIFIER && text == name;
  }
};

kj::String describeToken(const Token& token);
// e.g. "identifier 'foo'", "'{'", "integer 12".  Used in parse errors.

bool lex(kj::ArrayPtr<const char> input, kj::Vector<Token>& result,
         ErrorReporter& errorReporter);
// Lex the given source code, appending tokens to `result`.  Returns true if there were no errors.
// On failure exactly one LexError is reported, at the first character that couldn't be lexed.

bool isKeyword(kj::StringPtr name);

class Lexer {
  // Advanced lexer interface.  This interface exposes the inner parsers so that you can embed them
  // into your own parsers.

public:
  Lexer(ErrorReporter& errorReporter);
  ~Lexer() noexcept(false);

  class ParserInput: public kj::parse::IteratorInput<char, const char*> {
    // Like IteratorInput<char, const char*> except that positions are measured as byte offsets
    // rather than pointers.

  public:
    ParserInput(const char* begin, const char* end)
      : IteratorInput<char, const char*>(begin, end), begin(begin) {}
    explicit ParserInput(ParserInput& parent)
      : IteratorInput<char, const char*>(parent), begin(parent.begin) {}

    inline uint32_t getBest() {
      return IteratorInput<char, const char*>::getBest() - begin;
    }
    inline uint32_t getPosition() {
      return IteratorInput<char, const char*>::getPosition() - begin;
    }

  private:
    const char* begin;
  };

  template <typename Output>
  using Parser = kj::parse::ParserRef<ParserInput, Output>;

  struct Parsers {
    Parser<kj::Tuple<>> emptySpace;
    Parser<Token> token;
    Parser<kj::Array<Token>> tokenSequence;
  };

  const Parsers& getParsers() { return parsers; }

private:
  kj::Arena arena;
  Parsers parsers;
};

}  // namespace compiler
}  // namespace plank
