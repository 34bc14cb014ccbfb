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

#include "error-reporter.h"
#include <kj/debug.h>

namespace plank {
namespace compiler {

namespace {

template <typename T>
static size_t findLargestElementBefore(const kj::Vector<T>& vec, const T& key) {
  KJ_REQUIRE(vec.size() > 0 && vec[0] <= key);

  size_t lower = 0;
  size_t upper = vec.size();

  while (upper - lower > 1) {
    size_t mid = (lower + upper) / 2;
    if (vec[mid] > key) {
      upper = mid;
    } else {
      lower = mid;
    }
  }

  return lower;
}

}  // namespace

kj::StringPtr KJ_STRINGIFY(LexError::Kind kind) {
  switch (kind) {
    case LexError::Kind::UNEXPECTED_CHARACTER: return "unexpected character";
    case LexError::Kind::UNTERMINATED_STRING: return "unterminated string";
    case LexError::Kind::UNTERMINATED_COMMENT: return "unterminated comment";
  }
  KJ_UNREACHABLE;
}

kj::StringPtr KJ_STRINGIFY(SemanticError::Kind kind) {
  switch (kind) {
    case SemanticError::Kind::UNRESOLVED_TYPE: return "unresolved type";
    case SemanticError::Kind::AMBIGUOUS_TYPE: return "ambiguous type";
    case SemanticError::Kind::DUPLICATE_DECLARATION: return "duplicate declaration";
    case SemanticError::Kind::DUPLICATE_MEMBER: return "duplicate member";
    case SemanticError::Kind::STRUCT_CYCLE: return "struct cycle";
    case SemanticError::Kind::INVALID_DEFAULT_FOR_TYPE: return "invalid default for type";
    case SemanticError::Kind::NON_TABLE_RPC_TYPE: return "non-table RPC type";
    case SemanticError::Kind::NON_TABLE_UNION_MEMBER: return "non-table union member";
    case SemanticError::Kind::UNKNOWN_ATTRIBUTE: return "unknown attribute";
    case SemanticError::Kind::UNKNOWN_ATTRIBUTE_VALUE: return "unknown attribute value";
    case SemanticError::Kind::MISPLACED_ATTRIBUTE: return "misplaced attribute";
    case SemanticError::Kind::DUPLICATE_OR_GAPPED_FIELD_ID: return "duplicate or gapped field id";
    case SemanticError::Kind::INVALID_FIELD_TYPE: return "invalid field type";
    case SemanticError::Kind::INVALID_ENUM_VALUE: return "invalid enum value";
    case SemanticError::Kind::INVALID_DECLARATION: return "invalid declaration";
    case SemanticError::Kind::UNRESOLVED_INCLUDE: return "unresolved include";
    case SemanticError::Kind::FILE_NOT_FOUND: return "file not found";
  }
  KJ_UNREACHABLE;
}

void ErrorReporter::addLexError(uint32_t position, LexError::Kind kind, kj::String message) {
  Error error { position, position + 1, kj::mv(message), {} };
  error.detail.init<LexError>(LexError { kind });
  addError(kj::mv(error));
}

void ErrorReporter::addParseError(uint32_t startByte, uint32_t endByte,
                                  kj::StringPtr expected, kj::StringPtr found) {
  Error error { startByte, endByte, kj::str("expected ", expected, " but found ", found), {} };
  error.detail.init<ParseError>(ParseError { kj::heapString(expected), kj::heapString(found) });
  addError(kj::mv(error));
}

void ErrorReporter::addSemanticError(uint32_t startByte, uint32_t endByte,
                                     SemanticError::Kind kind, kj::String message) {
  Error error { startByte, endByte, kj::mv(message), {} };
  error.detail.init<SemanticError>(SemanticError { kind, nullptr });
  addError(kj::mv(error));
}

// -----------------------------------------------------------------------------

kj::String KJ_STRINGIFY(const Diagnostic& diagnostic) {
  return kj::str(diagnostic.file, ':', diagnostic.start.line + 1, ':',
                 diagnostic.start.column + 1, ": error: ", diagnostic.error.message);
}

void DiagnosticCollector::addError(kj::StringPtr file, SourcePos start, SourcePos end,
                                   Error&& error) {
  diagnostics.add(Diagnostic { kj::heapString(file), start, end, kj::mv(error) });
}

bool DiagnosticCollector::hadErrors() {
  return diagnostics.size() > 0;
}

kj::Array<Diagnostic> DiagnosticCollector::releaseDiagnostics() {
  return diagnostics.releaseAsArray();
}

// -----------------------------------------------------------------------------

LineBreakTable::LineBreakTable(kj::ArrayPtr<const char> content)
    : lineBreaks(content.size() / 40) {
  lineBreaks.add(0);
  for (const char* pos = content.begin(); pos < content.end(); ++pos) {
    if (*pos == '\n') {
      lineBreaks.add(pos + 1 - content.begin());
    }
  }
}

GlobalErrorReporter::SourcePos LineBreakTable::toSourcePos(uint32_t byteOffset) const {
  uint line = findLargestElementBefore(lineBreaks, byteOffset);
  uint col = byteOffset - lineBreaks[line];
  return GlobalErrorReporter::SourcePos { byteOffset, line, col };
}

}  // namespace compiler
}  // namespace plank
