#ifndef BPLUS_LEXER_H
#define BPLUS_LEXER_H

#include "bplus/token.h"
#include "llvm/ADT/StringRef.h"
#include <string>
#include <vector>

namespace bplus {
//===----------------------------------------------------------------------===//
// Lexer
//===----------------------------------------------------------------------===//
// The lexer scans the whole program text once, left to right, with a single
// character of lookahead. The returned sequence always starts with a Start
// token and ends with an End token. Characters that belong to no token class
// are dropped without a diagnostic.
class Lexer {
public:
  explicit Lexer(llvm::StringRef Source) : Source(Source) {}

  std::vector<Token> lex();

private:
  llvm::StringRef Source;
  size_t Loc = 0;
  unsigned LineNumber = 1;
  std::vector<Token> Tokens;

  char current() const { return Loc < Source.size() ? Source[Loc] : '\0'; }
  char lookahead() const {
    return Loc + 1 < Source.size() ? Source[Loc + 1] : '\0';
  }
  void advance() { ++Loc; }
  bool atEnd() const { return Loc >= Source.size(); }

  void token(std::string Symbol, TokenKind Kind) {
    Tokens.emplace_back(std::move(Symbol), Kind, LineNumber);
  }

  void skipComment();
  void lexNewline();
  void lexIdentifierOrKeyword();
  void lexNumber();
  void lexSymbol();
};

/// lex - Convenience wrapper around Lexer::lex.
std::vector<Token> lex(llvm::StringRef Source);

} // end namespace bplus

#endif // BPLUS_LEXER_H
