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
#include "lexer.h"
#include "error-reporter.h"

namespace plank {
namespace compiler {

kj::Maybe<Schema> parseFile(kj::ArrayPtr<const Token> tokens, uint32_t sourceSize,
                            ErrorReporter& errorReporter);
// Builds the syntax tree for one file.  Returns null if any error was reported, in which case
// as many errors as could be found were reported: a bad member of a table, struct, enum, union
// or service is skipped up to the next `;`, `,` or `}`, and a bad top-level statement is skipped
// up to the next statement.
//
// `sourceSize` is where "end of file" errors are reported.

kj::Maybe<Schema> parseSchemaText(kj::ArrayPtr<const char> text, ErrorReporter& errorReporter);
// Lexes then parses.  A lex error stops before parsing.

}  // namespace compiler
}  // namespace plank
