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
#include <kj/string-tree.h>

namespace plank {
namespace compiler {

kj::String prettyPrint(const Schema& schema);
// Formats a syntax tree as schema text.  Parsing the result gives back an equal tree, so this
// also serves as the formatter behind `plankc format`.

kj::String literalToString(const Literal& literal);
kj::String typeExprToString(const TypeExpr& type);

kj::String escapeString(kj::StringPtr text);
// Double-quoted, with C escapes, in a form the lexer reads back.

kj::String floatToString(double value);
// Always contains a '.' or an exponent so that it reads back as a float; nan and inf are
// spelled out.

}  // namespace compiler
}  // namespace plank
