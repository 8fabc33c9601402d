#include "bplus/lexer.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/ErrorHandling.h"
#include <optional>

using namespace bplus;

llvm::StringRef bplus::getTokenKindName(TokenKind Kind) {
  switch (Kind) {
  case TokenKind::Start:      return "START";
  case TokenKind::End:        return "END";
  case TokenKind::Newline:    return "NEWLINE";
  case TokenKind::Identifier: return "IDENTIFIER";
  case TokenKind::Number:     return "NUMBER";
  case TokenKind::Operator:   return "OPERATOR";
  case TokenKind::Paren:      return "PAREN";
  case TokenKind::Let:        return "LET";
  case TokenKind::For:        return "FOR";
  case TokenKind::If:         return "IF";
  case TokenKind::Else:       return "ELSE";
  case TokenKind::While:      return "WHILE";
  case TokenKind::Print:      return "PRINT";
  case TokenKind::Read:       return "READ";
  case TokenKind::Goto:       return "GOTO";
  }
  llvm_unreachable("unknown token kind");
}

static bool isNewline(char C) { return C == '\r' || C == '\n'; }

static std::optional<TokenKind> getKeyword(llvm::StringRef Lower) {
  return llvm::StringSwitch<std::optional<TokenKind>>(Lower)
      .Case("let", TokenKind::Let)
      .Case("for", TokenKind::For)
      .Case("if", TokenKind::If)
      .Case("else", TokenKind::Else)
      .Case("while", TokenKind::While)
      .Case("print", TokenKind::Print)
      .Case("read", TokenKind::Read)
      .Case("goto", TokenKind::Goto)
      .Default(std::nullopt);
}

static bool isMultiCharOperator(llvm::StringRef S) {
  return llvm::StringSwitch<bool>(S)
      .Cases(">=", "<=", "==", "..", true)
      .Default(false);
}

static std::optional<TokenKind> getSymbolKind(char C) {
  switch (C) {
  case '+': case '-': case '*': case '/': case '%':
  case '>': case '<': case '=': case ':': case '!':
    return TokenKind::Operator;
  case '{': case '}': case '(': case ')':
    return TokenKind::Paren;
  default:
    return std::nullopt;
  }
}

// A comment runs to the end of the line. The terminators that end it are
// swallowed as well, so a comment never produces a Newline token.
void Lexer::skipComment() {
  while (!atEnd() && !isNewline(current()))
    advance();
  while (isNewline(current())) {
    if (current() == '\r' && lookahead() == '\n')
      advance();
    advance();
    ++LineNumber;
  }
}

// "\r", "\n" and "\r\n" each count as one line terminator.
void Lexer::lexNewline() {
  if (current() == '\r' && lookahead() == '\n')
    advance();
  advance();
  token("newline", TokenKind::Newline);
  ++LineNumber;
}

// identifier: [a-zA-Z][a-zA-Z0-9]*
void Lexer::lexIdentifierOrKeyword() {
  size_t Begin = Loc;
  while (llvm::isAlnum(current()))
    advance();

  llvm::StringRef Ident = Source.slice(Begin, Loc);
  std::string Lower = Ident.lower();
  if (auto Kind = getKeyword(Lower))
    token(Lower, *Kind);
  else
    token(Ident.str(), TokenKind::Identifier);
}

// number: [0-9]+
void Lexer::lexNumber() {
  size_t Begin = Loc;
  while (llvm::isDigit(current()))
    advance();
  token(Source.slice(Begin, Loc).str(), TokenKind::Number);
}

// Symbols are matched greedily: the two-character window first, then the
// current character alone. Anything unrecognised is skipped.
void Lexer::lexSymbol() {
  llvm::StringRef Window = Source.substr(Loc, 2);
  if (Window.size() == 2 && isMultiCharOperator(Window)) {
    token(Window.str(), TokenKind::Operator);
    advance();
    advance();
    return;
  }

  char C = current();
  advance();
  if (auto Kind = getSymbolKind(C))
    token(std::string(1, C), *Kind);
}

std::vector<Token> Lexer::lex() {
  Loc = 0;
  LineNumber = 1;
  Tokens.clear();
  token("start", TokenKind::Start);

  while (!atEnd()) {
    char C = current();
    if (C == '/' && lookahead() == '/')
      skipComment();
    else if (C == ' ' || C == '\t')
      advance();
    else if (isNewline(C))
      lexNewline();
    else if (llvm::isAlpha(C))
      lexIdentifierOrKeyword();
    else if (llvm::isDigit(C))
      lexNumber();
    else
      lexSymbol();
  }

  token("end", TokenKind::End);
  return std::move(Tokens);
}

std::vector<Token> bplus::lex(llvm::StringRef Source) {
  return Lexer(Source).lex();
}
