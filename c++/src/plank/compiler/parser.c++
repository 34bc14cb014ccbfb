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
#include <kj/debug.h>
#include <kj/vector.h>

namespace plank {
namespace compiler {

namespace {

class SchemaParser {
  // Recursive descent over the token stream.  Each parseX() method either returns the node, or
  // reports one error and returns null, leaving the cursor wherever the problem was found; the
  // caller decides how far to skip.

public:
  SchemaParser(kj::ArrayPtr<const Token> tokens, uint32_t sourceSize,
               ErrorReporter& errorReporter)
      : tokens(tokens), sourceSize(sourceSize), errorReporter(errorReporter) {}

  kj::Maybe<Schema> parseSchema() {
    kj::Vector<Statement> statements;

    for (;;) {
      auto docs = takeDocs();
      KJ_IF_MAYBE(token, peek()) {
        size_t startPos = pos;
        if (!parseStatement(*token, kj::mv(docs), statements)) {
          skipStatement(startPos);
        }
      } else {
        break;
      }
    }

    if (failed) return nullptr;
    return Schema { statements.releaseAsArray() };
  }

private:
  kj::ArrayPtr<const Token> tokens;
  uint32_t sourceSize;
  ErrorReporter& errorReporter;

  size_t pos = 0;
  uint32_t lastEnd = 0;
  bool failed = false;

  kj::Array<kj::String> currentNamespace = nullptr;
  // Namespace of the most recent `namespace` directive.  Copied into each declaration.

  // ---------------------------------------------------------------------------------------------
  // Token cursor
  //
  // Doc comments are only meaningful right before a declaration or member, where takeDocs()
  // collects them.  Everywhere else they're skipped like ordinary comments.

  kj::Maybe<const Token&> peek() {
    while (pos < tokens.size() && tokens[pos].type == Token::DOC_COMMENT) ++pos;
    if (pos == tokens.size()) return nullptr;
    return tokens[pos];
  }

  void advance() {
    KJ_IF_MAYBE(token, peek()) {
      lastEnd = token->endByte;
      ++pos;
    }
  }

  uint32_t currentStart() {
    KJ_IF_MAYBE(token, peek()) {
      return token->startByte;
    } else {
      return sourceSize;
    }
  }

  kj::Array<kj::String> takeDocs() {
    kj::Vector<kj::String> docs;
    while (pos < tokens.size() && tokens[pos].type == Token::DOC_COMMENT) {
      docs.add(kj::heapString(tokens[pos].text));
      ++pos;
    }
    return docs.releaseAsArray();
  }

  bool lookingAtPunctuation(char c) {
    KJ_IF_MAYBE(token, peek()) {
      return token->isPunctuation(c);
    } else {
      return false;
    }
  }

  bool tryPunctuation(char c) {
    if (lookingAtPunctuation(c)) {
      advance();
      return true;
    }
    return false;
  }

  bool expectPunctuation(char c) {
    if (tryPunctuation(c)) return true;
    char quoted[] = { '\'', c, '\'', '\0' };
    expected(quoted);
    return false;
  }

  void expected(kj::StringPtr what) {
    failed = true;
    KJ_IF_MAYBE(token, peek()) {
      errorReporter.addParseError(token->startByte, token->endByte, what, describeToken(*token));
    } else {
      errorReporter.addParseError(sourceSize, sourceSize, what, "end of file");
    }
  }

  // ---------------------------------------------------------------------------------------------
  // Recovery

  void skipStatement(size_t startPos) {
    // Skip to where the next top-level statement begins: just past a `;` or a balanced `{...}`
    // at nesting depth zero, or at a statement keyword.  Always makes progress.
    uint depth = 0;
    bool first = true;
    for (;;) {
      KJ_IF_MAYBE(token, peek()) {
        if (depth == 0 && token->type == Token::KEYWORD && !(first && pos == startPos)) {
          return;
        }
        first = false;
        if (token->isPunctuation('{')) {
          ++depth;
        } else if (token->isPunctuation('}')) {
          advance();
          if (depth <= 1) return;
          --depth;
          continue;
        } else if (depth == 0 && token->isPunctuation(';')) {
          advance();
          return;
        }
        advance();
      } else {
        return;
      }
    }
  }

  void skipMember(char separator) {
    // Skip past the next `separator` or up to (not past) the closing `}` of the body.
    for (;;) {
      KJ_IF_MAYBE(token, peek()) {
        if (token->isPunctuation('}')) return;
        advance();
        if (token->isPunctuation(separator)) return;
      } else {
        return;
      }
    }
  }

  // ---------------------------------------------------------------------------------------------
  // Terminals

  kj::Maybe<kj::String> parseIdentifier() {
    KJ_IF_MAYBE(token, peek()) {
      if (token->type == Token::IDENTIFIER) {
        advance();
        return kj::heapString(token->text);
      }
    }
    expected("identifier");
    return nullptr;
  }

  kj::Maybe<kj::String> parseDottedName() {
    kj::Vector<kj::String> parts;
    KJ_IF_MAYBE(first, parseIdentifier()) {
      parts.add(kj::mv(*first));
    } else {
      return nullptr;
    }
    while (tryPunctuation('.')) {
      KJ_IF_MAYBE(part, parseIdentifier()) {
        parts.add(kj::mv(*part));
      } else {
        return nullptr;
      }
    }
    return joinPath(parts);
  }

  kj::Maybe<kj::String> parseStringLiteral() {
    KJ_IF_MAYBE(token, peek()) {
      if (token->type == Token::STRING_LITERAL) {
        advance();
        return kj::heapString(token->text);
      }
    }
    expected("string literal");
    return nullptr;
  }

  kj::Maybe<Literal> parseLiteral() {
    Literal result;
    result.which = Literal::INTEGER;
    result.startByte = currentStart();

    bool signed_ = false;
    if (tryPunctuation('-')) {
      result.negative = true;
      signed_ = true;
    } else if (tryPunctuation('+')) {
      signed_ = true;
    }

    KJ_IF_MAYBE(t, peek()) {
      const Token& token = *t;
      switch (token.type) {
        case Token::INTEGER_LITERAL:
          result.which = Literal::INTEGER;
          result.integer = token.integerValue;
          advance();
          break;
        case Token::FLOAT_LITERAL:
          result.which = Literal::FLOAT;
          result.floating = token.floatValue;
          advance();
          break;
        case Token::STRING_LITERAL:
          if (signed_) {
            expected("number");
            return nullptr;
          }
          result.which = Literal::STRING;
          result.text = kj::heapString(token.text);
          advance();
          break;
        case Token::IDENTIFIER:
          if (token.text == "nan") {
            result.which = Literal::FLOAT;
            result.floating = kj::nan();
            advance();
          } else if (token.text == "inf" || token.text == "infinity") {
            result.which = Literal::FLOAT;
            result.floating = kj::inf();
            advance();
          } else if (signed_) {
            expected("number");
            return nullptr;
          } else if (token.text == "true" || token.text == "false") {
            result.which = Literal::BOOLEAN;
            result.boolean = token.text == "true";
            advance();
          } else {
            result.which = Literal::IDENTIFIER;
            KJ_IF_MAYBE(name, parseDottedName()) {
              result.text = kj::mv(*name);
            } else {
              return nullptr;
            }
          }
          break;
        default:
          expected("literal");
          return nullptr;
      }
    } else {
      expected("literal");
      return nullptr;
    }

    result.endByte = lastEnd;
    return kj::mv(result);
  }

  kj::Maybe<TypeExpr> parseType() {
    TypeExpr result;
    result.startByte = currentStart();

    if (tryPunctuation('[')) {
      KJ_IF_MAYBE(element, parseType()) {
        result.which = TypeExpr::VECTOR;
        result.element = kj::heap<TypeExpr>(kj::mv(*element));
      } else {
        return nullptr;
      }
      if (!expectPunctuation(']')) return nullptr;
    } else {
      KJ_IF_MAYBE(token, peek()) {
        if (token->type != Token::IDENTIFIER) {
          expected("type");
          return nullptr;
        }
      }
      KJ_IF_MAYBE(name, parseDottedName()) {
        if (*name == "string") {
          result.which = TypeExpr::STRING;
        } else KJ_IF_MAYBE(kind, scalarKindFromName(*name)) {
          result.which = TypeExpr::SCALAR;
          result.scalar = *kind;
        } else {
          result.which = TypeExpr::NAMED;
          result.name = kj::mv(*name);
        }
      } else {
        return nullptr;
      }
    }

    result.endByte = lastEnd;
    return kj::mv(result);
  }

  kj::Maybe<kj::Array<Attribute>> parseMetadata() {
    // Optional `(name, name: value, ...)`.
    kj::Vector<Attribute> attributes;
    if (!tryPunctuation('(')) return attributes.releaseAsArray();

    while (!tryPunctuation(')')) {
      Attribute attribute;
      attribute.startByte = currentStart();
      KJ_IF_MAYBE(name, parseIdentifier()) {
        attribute.name = kj::mv(*name);
      } else {
        return nullptr;
      }
      if (tryPunctuation(':')) {
        KJ_IF_MAYBE(value, parseLiteral()) {
          attribute.value = kj::mv(*value);
        } else {
          return nullptr;
        }
      }
      attribute.endByte = lastEnd;
      attributes.add(kj::mv(attribute));

      if (!tryPunctuation(',')) {
        if (!expectPunctuation(')')) return nullptr;
        break;
      }
    }
    return attributes.releaseAsArray();
  }

  // ---------------------------------------------------------------------------------------------
  // Members

  kj::Maybe<Field> parseField(kj::Array<kj::String> docs) {
    Field field;
    field.docs = kj::mv(docs);
    field.startByte = currentStart();

    KJ_IF_MAYBE(name, parseIdentifier()) {
      field.name = kj::mv(*name);
    } else {
      return nullptr;
    }
    if (!expectPunctuation(':')) return nullptr;
    KJ_IF_MAYBE(type, parseType()) {
      field.type = kj::mv(*type);
    } else {
      return nullptr;
    }
    if (tryPunctuation('=')) {
      KJ_IF_MAYBE(value, parseLiteral()) {
        field.defaultValue = kj::mv(*value);
      } else {
        return nullptr;
      }
    }
    KJ_IF_MAYBE(attributes, parseMetadata()) {
      field.attributes = kj::mv(*attributes);
    } else {
      return nullptr;
    }
    if (!expectPunctuation(';')) return nullptr;

    field.endByte = lastEnd;
    return kj::mv(field);
  }

  kj::Maybe<EnumValue> parseEnumValue(kj::Array<kj::String> docs) {
    EnumValue value;
    value.docs = kj::mv(docs);
    value.startByte = currentStart();

    KJ_IF_MAYBE(name, parseIdentifier()) {
      value.name = kj::mv(*name);
    } else {
      return nullptr;
    }
    if (tryPunctuation('=')) {
      Literal literal;
      literal.which = Literal::INTEGER;
      literal.startByte = currentStart();
      if (tryPunctuation('-')) {
        literal.negative = true;
      } else {
        tryPunctuation('+');
      }
      KJ_IF_MAYBE(token, peek()) {
        if (token->type == Token::INTEGER_LITERAL) {
          literal.integer = token->integerValue;
          advance();
        } else {
          expected("integer");
          return nullptr;
        }
      } else {
        expected("integer");
        return nullptr;
      }
      literal.endByte = lastEnd;
      value.value = kj::mv(literal);
    }
    KJ_IF_MAYBE(attributes, parseMetadata()) {
      value.attributes = kj::mv(*attributes);
    } else {
      return nullptr;
    }

    value.endByte = lastEnd;
    return kj::mv(value);
  }

  kj::Maybe<UnionVariant> parseUnionVariant(kj::Array<kj::String> docs) {
    UnionVariant variant;
    variant.docs = kj::mv(docs);
    variant.startByte = currentStart();

    uint32_t nameStart = currentStart();
    kj::String name;
    KJ_IF_MAYBE(n, parseDottedName()) {
      name = kj::mv(*n);
    } else {
      return nullptr;
    }
    uint32_t nameEnd = lastEnd;

    if (tryPunctuation(':')) {
      // `Alias: Type`
      if (name.findFirst('.') != nullptr) {
        failed = true;
        errorReporter.addParseError(nameStart, nameEnd, "variant name",
                                    kj::str("dotted name '", name, "'"));
        return nullptr;
      }
      variant.alias = kj::mv(name);
      nameStart = currentStart();
      KJ_IF_MAYBE(n, parseDottedName()) {
        name = kj::mv(*n);
      } else {
        return nullptr;
      }
      nameEnd = lastEnd;
    }

    variant.type.which = TypeExpr::NAMED;
    variant.type.name = kj::mv(name);
    variant.type.startByte = nameStart;
    variant.type.endByte = nameEnd;

    KJ_IF_MAYBE(attributes, parseMetadata()) {
      variant.attributes = kj::mv(*attributes);
    } else {
      return nullptr;
    }

    variant.endByte = lastEnd;
    return kj::mv(variant);
  }

  kj::Maybe<TypeExpr> parseNamedType() {
    TypeExpr result;
    result.which = TypeExpr::NAMED;
    result.startByte = currentStart();
    KJ_IF_MAYBE(name, parseDottedName()) {
      result.name = kj::mv(*name);
    } else {
      return nullptr;
    }
    result.endByte = lastEnd;
    return kj::mv(result);
  }

  kj::Maybe<RpcMethod> parseRpcMethod(kj::Array<kj::String> docs) {
    RpcMethod method;
    method.docs = kj::mv(docs);
    method.startByte = currentStart();

    KJ_IF_MAYBE(name, parseIdentifier()) {
      method.name = kj::mv(*name);
    } else {
      return nullptr;
    }
    if (!expectPunctuation('(')) return nullptr;
    KJ_IF_MAYBE(request, parseNamedType()) {
      method.request = kj::mv(*request);
    } else {
      return nullptr;
    }
    if (!expectPunctuation(')')) return nullptr;
    if (!expectPunctuation(':')) return nullptr;
    KJ_IF_MAYBE(response, parseNamedType()) {
      method.response = kj::mv(*response);
    } else {
      return nullptr;
    }
    KJ_IF_MAYBE(attributes, parseMetadata()) {
      method.attributes = kj::mv(*attributes);
    } else {
      return nullptr;
    }
    if (!expectPunctuation(';')) return nullptr;

    method.endByte = lastEnd;
    return kj::mv(method);
  }

  template <typename Member, typename ParseMember>
  kj::Array<Member> parseBody(char separator, ParseMember&& parseMember) {
    // Parses members until the closing `}`, which is consumed.  With `separator` == ',' the
    // members are comma-separated (trailing comma allowed); with ';' each member consumes its
    // own terminator.
    kj::Vector<Member> members;
    for (;;) {
      auto docs = takeDocs();
      if (tryPunctuation('}')) break;
      if (peek() == nullptr) {
        expectPunctuation('}');
        break;
      }

      KJ_IF_MAYBE(member, parseMember(kj::mv(docs))) {
        members.add(kj::mv(*member));
        if (separator == ',') {
          if (!tryPunctuation(',') && !lookingAtPunctuation('}')) {
            expected("',' or '}'");
            skipMember(',');
          }
        }
      } else {
        skipMember(separator);
      }
    }
    return members.releaseAsArray();
  }

  // ---------------------------------------------------------------------------------------------
  // Statements

  bool parseStatement(const Token& token, kj::Array<kj::String> docs,
                      kj::Vector<Statement>& statements) {
    if (token.type != Token::KEYWORD) {
      expected("declaration");
      return false;
    }

    uint32_t startByte = token.startByte;
    kj::StringPtr keyword = token.text;

    if (keyword == "table" || keyword == "struct" || keyword == "enum" ||
        keyword == "union" || keyword == "rpc_service") {
      KJ_IF_MAYBE(decl, parseDeclaration(kj::mv(docs))) {
        statements.add().init<Declaration>(kj::mv(*decl));
        return true;
      } else {
        return false;
      }
    }

    advance();

    if (keyword == "namespace") {
      NamespaceDirective directive;
      directive.startByte = startByte;
      kj::Vector<kj::String> path;
      if (!lookingAtPunctuation(';')) {
        KJ_IF_MAYBE(first, parseIdentifier()) {
          path.add(kj::mv(*first));
        } else {
          return false;
        }
        while (tryPunctuation('.')) {
          KJ_IF_MAYBE(part, parseIdentifier()) {
            path.add(kj::mv(*part));
          } else {
            return false;
          }
        }
      }
      if (!expectPunctuation(';')) return false;
      directive.endByte = lastEnd;
      directive.path = path.releaseAsArray();
      currentNamespace = KJ_MAP(part, directive.path) { return kj::heapString(part); };
      statements.add().init<NamespaceDirective>(kj::mv(directive));
    } else if (keyword == "include") {
      Include include;
      include.startByte = startByte;
      KJ_IF_MAYBE(path, parseStringLiteral()) {
        include.path = kj::mv(*path);
      } else {
        return false;
      }
      if (!expectPunctuation(';')) return false;
      include.endByte = lastEnd;
      statements.add().init<Include>(kj::mv(include));
    } else if (keyword == "root_type") {
      RootType rootType;
      rootType.startByte = startByte;
      KJ_IF_MAYBE(name, parseDottedName()) {
        rootType.name = kj::mv(*name);
      } else {
        return false;
      }
      if (!expectPunctuation(';')) return false;
      rootType.endByte = lastEnd;
      statements.add().init<RootType>(kj::mv(rootType));
    } else if (keyword == "file_identifier") {
      FileIdentifier identifier;
      identifier.startByte = startByte;
      KJ_IF_MAYBE(value, parseStringLiteral()) {
        identifier.value = kj::mv(*value);
      } else {
        return false;
      }
      if (!expectPunctuation(';')) return false;
      identifier.endByte = lastEnd;
      statements.add().init<FileIdentifier>(kj::mv(identifier));
    } else if (keyword == "file_extension") {
      FileExtension extension;
      extension.startByte = startByte;
      KJ_IF_MAYBE(value, parseStringLiteral()) {
        extension.value = kj::mv(*value);
      } else {
        return false;
      }
      if (!expectPunctuation(';')) return false;
      extension.endByte = lastEnd;
      statements.add().init<FileExtension>(kj::mv(extension));
    } else if (keyword == "attribute") {
      AttributeDecl attribute;
      attribute.startByte = startByte;
      KJ_IF_MAYBE(t, peek()) {
        if (t->type == Token::STRING_LITERAL) {
          attribute.name = kj::heapString(t->text);
          advance();
        } else KJ_IF_MAYBE(name, parseIdentifier()) {
          attribute.name = kj::mv(*name);
        } else {
          return false;
        }
      } else {
        expected("attribute name");
        return false;
      }
      if (!expectPunctuation(';')) return false;
      attribute.endByte = lastEnd;
      statements.add().init<AttributeDecl>(kj::mv(attribute));
    } else {
      KJ_FAIL_ASSERT("keyword not handled", keyword);
    }

    return true;
  }

  kj::Maybe<Declaration> parseDeclaration(kj::Array<kj::String> docs) {
    Declaration decl;
    decl.docs = kj::mv(docs);
    decl.namespacePath = KJ_MAP(part, currentNamespace) { return kj::heapString(part); };
    decl.startByte = currentStart();

    kj::String keyword;
    KJ_IF_MAYBE(token, peek()) {
      keyword = kj::heapString(token->text);
      advance();
    }

    decl.nameStartByte = currentStart();
    KJ_IF_MAYBE(name, parseIdentifier()) {
      decl.name = kj::mv(*name);
    } else {
      return nullptr;
    }
    decl.nameEndByte = lastEnd;

    kj::Maybe<TypeExpr> underlyingType;
    if (keyword == "enum") {
      if (!expectPunctuation(':')) return nullptr;
      KJ_IF_MAYBE(type, parseType()) {
        underlyingType = kj::mv(*type);
      } else {
        return nullptr;
      }
    }

    KJ_IF_MAYBE(attributes, parseMetadata()) {
      decl.attributes = kj::mv(*attributes);
    } else {
      return nullptr;
    }

    if (!expectPunctuation('{')) return nullptr;

    if (keyword == "table") {
      decl.body.init<TableDecl>(TableDecl {
        parseBody<Field>(';', [this](kj::Array<kj::String>&& docs) {
          return parseField(kj::mv(docs));
        })
      });
    } else if (keyword == "struct") {
      decl.body.init<StructDecl>(StructDecl {
        parseBody<Field>(';', [this](kj::Array<kj::String>&& docs) {
          return parseField(kj::mv(docs));
        })
      });
    } else if (keyword == "enum") {
      auto values = parseBody<EnumValue>(',', [this](kj::Array<kj::String>&& docs) {
        return parseEnumValue(kj::mv(docs));
      });
      decl.body.init<EnumDecl>(EnumDecl {
        kj::mv(KJ_ASSERT_NONNULL(underlyingType)), kj::mv(values)
      });
    } else if (keyword == "union") {
      decl.body.init<UnionDecl>(UnionDecl {
        parseBody<UnionVariant>(',', [this](kj::Array<kj::String>&& docs) {
          return parseUnionVariant(kj::mv(docs));
        })
      });
    } else if (keyword == "rpc_service") {
      decl.body.init<RpcServiceDecl>(RpcServiceDecl {
        parseBody<RpcMethod>(';', [this](kj::Array<kj::String>&& docs) {
          return parseRpcMethod(kj::mv(docs));
        })
      });
    } else {
      KJ_FAIL_ASSERT("not a declaration keyword", keyword);
    }

    decl.endByte = lastEnd;
    return kj::mv(decl);
  }
};

}  // namespace

kj::Maybe<Schema> parseFile(kj::ArrayPtr<const Token> tokens, uint32_t sourceSize,
                            ErrorReporter& errorReporter) {
  SchemaParser parser(tokens, sourceSize, errorReporter);
  return parser.parseSchema();
}

kj::Maybe<Schema> parseSchemaText(kj::ArrayPtr<const char> text, ErrorReporter& errorReporter) {
  kj::Vector<Token> tokens;
  if (!lex(text, tokens, errorReporter)) {
    return nullptr;
  }
  return parseFile(tokens, text.size(), errorReporter);
}

}  // namespace compiler
}  // namespace plank
