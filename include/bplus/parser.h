#ifndef BPLUS_PARSER_H
#define BPLUS_PARSER_H

#include <memory>
#include <vector>

#include "bplus/ast.h"
#include "bplus/symbol_table.h"
#include "bplus/token.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace bplus {

/// Parser - Recursive descent over statements and blocks, precedence climbing
/// for expressions. Every failure is returned as a ParseError.
class Parser {
public:
  explicit Parser(const std::vector<Token> &Tokens);

  /// parse - Parse the whole token sequence into a program.
  llvm::Expected<std::unique_ptr<ProgramAST>> parse();

private:
  const std::vector<Token> &Tokens;
  size_t Loc = 0;

  // Variables defined so far. Labels are not tracked here.
  SymbolTable Variables;

  const Token &cur() const { return Tokens[Loc]; }
  void advance();

  /// accept - If the current token has the given kind (or symbol), consume
  /// it and return true.
  bool accept(TokenKind Kind);
  bool accept(llvm::StringRef Symbol);

  /// peekPastSeparators - The first token after any run of newlines, without
  /// consuming anything.
  const Token &peekPastSeparators() const;

  // Binary operator precedence, -1 if the token is not a binary operator.
  int getTokPrecedence() const;

  llvm::Expected<std::unique_ptr<ExprAST>> parseAtom();
  llvm::Expected<std::unique_ptr<ExprAST>> parseExpression(int MinPrec = 1);

  llvm::Expected<std::unique_ptr<StmtAST>> parseStatement();
  llvm::Expected<std::unique_ptr<StmtAST>> parseStatementBody();
  llvm::Expected<std::unique_ptr<StmtAST>> parseLet();
  llvm::Expected<std::unique_ptr<StmtAST>> parseAssignmentOrLabel();
  llvm::Expected<std::unique_ptr<StmtAST>> parseConditional();
  llvm::Expected<std::unique_ptr<StmtAST>> parseFor();
  llvm::Expected<std::unique_ptr<StmtAST>> parseWhile();
  llvm::Expected<std::unique_ptr<StmtAST>> parsePrint();
  llvm::Expected<std::unique_ptr<StmtAST>> parseGoto();

  llvm::Expected<StmtList> parseBlock();

  /// skipSeparators - Consume a run of newlines and return its length.
  unsigned skipSeparators();
};

/// parse - Convenience wrapper around Parser::parse.
llvm::Expected<std::unique_ptr<ProgramAST>>
parse(const std::vector<Token> &Tokens);

} // end namespace bplus

#endif // BPLUS_PARSER_H
