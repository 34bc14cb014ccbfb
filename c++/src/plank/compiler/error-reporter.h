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

#include "../common.h"
#include <kj/string.h>
#include <kj/exception.h>
#include <kj/vector.h>
#include <kj/one-of.h>

namespace plank {
namespace compiler {

struct LexError {
  enum class Kind: uint8_t {
    UNEXPECTED_CHARACTER,
    UNTERMINATED_STRING,
    UNTERMINATED_COMMENT
  };

  Kind kind;
};

struct ParseError {
  kj::String expected;
  // What the grammar allowed at this point, e.g. "':'" or "a type".

  kj::String found;
  // Description of the token actually present, e.g. "identifier 'foo'" or "end of file".
};

struct SemanticError {
  enum class Kind: uint8_t {
    UNRESOLVED_TYPE,
    AMBIGUOUS_TYPE,
    DUPLICATE_DECLARATION,
    DUPLICATE_MEMBER,
    STRUCT_CYCLE,
    INVALID_DEFAULT_FOR_TYPE,
    NON_TABLE_RPC_TYPE,
    NON_TABLE_UNION_MEMBER,
    UNKNOWN_ATTRIBUTE,
    UNKNOWN_ATTRIBUTE_VALUE,
    MISPLACED_ATTRIBUTE,
    DUPLICATE_OR_GAPPED_FIELD_ID,
    INVALID_FIELD_TYPE,
    INVALID_ENUM_VALUE,
    INVALID_DECLARATION,
    UNRESOLVED_INCLUDE,
    FILE_NOT_FOUND
    // A source file named on the command line doesn't exist.
  };

  Kind kind;

  kj::Array<kj::String> cyclePath;
  // For STRUCT_CYCLE: fully-qualified names along the cycle, first name repeated at the end.
};

kj::StringPtr KJ_STRINGIFY(LexError::Kind kind);
kj::StringPtr KJ_STRINGIFY(SemanticError::Kind kind);

struct Error {
  // One diagnostic within a single source file.

  uint32_t startByte;
  uint32_t endByte;
  // Span of the erroneous text.  May be empty when only the starting point is known.

  kj::String message;
  // Human-readable description.

  kj::OneOf<LexError, ParseError, SemanticError> detail;

  inline bool isSemantic(SemanticError::Kind kind) const {
    return detail.is<SemanticError>() && detail.get<SemanticError>().kind == kind;
  }
};

class ErrorReporter {
  // Callback for reporting errors within a particular file.

public:
  virtual void addError(Error&& error) = 0;

  virtual bool hadErrors() = 0;
  // Return true if any errors have been reported, globally.  Later stages use this to avoid
  // piling up errors that are consequences of earlier ones.

  void addLexError(uint32_t position, LexError::Kind kind, kj::String message);
  void addParseError(uint32_t startByte, uint32_t endByte,
                     kj::StringPtr expected, kj::StringPtr found);
  void addSemanticError(uint32_t startByte, uint32_t endByte,
                        SemanticError::Kind kind, kj::String message);

  template <typename T>
  inline void addErrorOn(const T& node, SemanticError::Kind kind, kj::String message) {
    // Works for any `T` with `startByte` and `endByte` members, which all AST nodes have.
    addSemanticError(node.startByte, node.endByte, kind, kj::mv(message));
  }
};

class GlobalErrorReporter {
  // Callback for reporting errors in any file.

public:
  struct SourcePos {
    uint byte;
    uint line;
    uint column;
    // Zero-based.
  };

  virtual void addError(kj::StringPtr file, SourcePos start, SourcePos end, Error&& error) = 0;
  // Report an error at the given location in the given file.

  virtual bool hadErrors() = 0;
};

struct Diagnostic {
  kj::String file;
  GlobalErrorReporter::SourcePos start;
  GlobalErrorReporter::SourcePos end;
  Error error;
};

kj::String KJ_STRINGIFY(const Diagnostic& diagnostic);
// "file:line:column: error: message", one-based like compilers print them.

class DiagnosticCollector final: public GlobalErrorReporter {
  // Keeps every reported error, in the order reported.

public:
  void addError(kj::StringPtr file, SourcePos start, SourcePos end, Error&& error) override;
  bool hadErrors() override;

  inline kj::ArrayPtr<const Diagnostic> getDiagnostics() const { return diagnostics; }
  kj::Array<Diagnostic> releaseDiagnostics();

private:
  kj::Vector<Diagnostic> diagnostics;
};

class LineBreakTable {
public:
  LineBreakTable(kj::ArrayPtr<const char> content);

  GlobalErrorReporter::SourcePos toSourcePos(uint32_t byteOffset) const;

private:
  kj::Vector<uint> lineBreaks;
  // Byte offsets of the first byte in each source line.  The first element is always zero.
};

}  // namespace compiler
}  // namespace plank
