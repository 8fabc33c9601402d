#ifndef BPLUS_TOKEN_H
#define BPLUS_TOKEN_H

#include "llvm/ADT/StringRef.h"
#include <string>
#include <utility>

namespace bplus {
//===----------------------------------------------------------------------===//
// Token
//===----------------------------------------------------------------------===//
// Each token produced by the lexer carries its kind, the exact lexeme and the
// line on which it begins. Keywords get a kind of their own.
enum class TokenKind {
  Start,
  End,
  Newline,

  // primary
  Identifier,
  Number,

  // symbols
  Operator,
  Paren,

  // keywords
  Let,
  For,
  If,
  Else,
  While,
  Print,
  Read,
  Goto
};

/// getTokenKindName - Upper-case spelling of a kind, e.g. "IDENTIFIER".
llvm::StringRef getTokenKindName(TokenKind Kind);

struct Token {
  std::string Symbol;
  TokenKind Kind;
  unsigned Line;

  Token(std::string Symbol, TokenKind Kind, unsigned Line)
      : Symbol(std::move(Symbol)), Kind(Kind), Line(Line) {}

  bool is(TokenKind K) const { return Kind == K; }
  bool is(llvm::StringRef S) const { return Symbol == S; }
  bool isKeyword() const { return Kind >= TokenKind::Let; }
};

} // end namespace bplus

#endif // BPLUS_TOKEN_H
