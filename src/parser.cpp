#include "bplus/parser.h"
#include "bplus/log.h"
#include "llvm/ADT/StringSwitch.h"
#include <limits>

using namespace bplus;

Parser::Parser(const std::vector<Token> &Tokens) : Tokens(Tokens) {}

// The cursor stops at the End token; the lexer always emits one.
void Parser::advance() {
  if (Loc + 1 < Tokens.size())
    ++Loc;
}

bool Parser::accept(TokenKind Kind) {
  if (!cur().is(Kind))
    return false;
  advance();
  return true;
}

bool Parser::accept(llvm::StringRef Symbol) {
  if (!cur().is(Symbol))
    return false;
  advance();
  return true;
}

const Token &Parser::peekPastSeparators() const {
  size_t I = Loc;
  while (Tokens[I].is(TokenKind::Newline) && I + 1 < Tokens.size())
    ++I;
  return Tokens[I];
}

unsigned Parser::skipSeparators() {
  unsigned NumSeparators = 0;
  while (accept(TokenKind::Newline))
    ++NumSeparators;
  return NumSeparators;
}

/// 1 is the lowest precedence. Operators outside this table (":", "=",
/// "..", "%") end an expression.
int Parser::getTokPrecedence() const {
  if (!cur().is(TokenKind::Operator))
    return -1;
  return llvm::StringSwitch<int>(cur().Symbol)
      .Cases("==", ">", "<", ">=", "<=", 3)
      .Cases("+", "-", 4)
      .Cases("*", "/", 5)
      .Default(-1);
}

static const int UnaryPrecedence = 6;

static bool isUnaryOp(llvm::StringRef Op) {
  return Op == "+" || Op == "-" || Op == "!";
}

/// atom
///   ::= '(' expression ')'
///   ::= unaryop expression
///   ::= number
///   ::= identifier
llvm::Expected<std::unique_ptr<ExprAST>> Parser::parseAtom() {
  // Brackets are their own subexpression; precedence starts over inside.
  if (accept("(")) {
    auto Inner = parseExpression(1);
    if (!Inner)
      return Inner.takeError();
    if (!accept(")"))
      return logError(cur(), "Unmatched '(', expected ')'");
    return Inner;
  }

  const Token &Tok = cur();
  switch (Tok.Kind) {
  case TokenKind::Operator: {
    if (!isUnaryOp(Tok.Symbol))
      return logError(Tok, "Expected unary prefix operator.");
    std::string Op = Tok.Symbol;
    unsigned Line = Tok.Line;
    advance();
    auto Operand = parseExpression(UnaryPrecedence);
    if (!Operand)
      return Operand.takeError();
    return std::make_unique<UnaryExprAST>(Op, std::move(*Operand), Line);
  }
  case TokenKind::Number: {
    // Values are C ints in the generated program.
    uint64_t Value;
    if (llvm::StringRef(Tok.Symbol).getAsInteger(10, Value) ||
        Value > uint64_t(std::numeric_limits<int>::max()))
      return logError(Tok, "Number " + Tok.Symbol + " is out of range.");
    auto Result = std::make_unique<NumberExprAST>(Tok.Symbol, Tok.Line);
    advance();
    return std::move(Result);
  }
  case TokenKind::Identifier: {
    if (!Variables.isDefined(Tok.Symbol))
      return logError(Tok, "The identifier '" + Tok.Symbol +
                               "' is not defined.");
    auto Result = std::make_unique<VariableExprAST>(Tok.Symbol, Tok.Line);
    advance();
    return std::move(Result);
  }
  default:
    return logError(Tok, "Expected expression.");
  }
}

/// expression
///   ::= atom (binop atom)*
///
/// Precedence climbing: keep folding operators into the left-hand side while
/// they bind at least as tightly as MinPrec. The right operand is parsed with
/// a threshold one above the operator's own, which makes every operator left
/// associative.
llvm::Expected<std::unique_ptr<ExprAST>>
Parser::parseExpression(int MinPrec) {
  auto Atom = parseAtom();
  if (!Atom)
    return Atom.takeError();
  std::unique_ptr<ExprAST> LHS = std::move(*Atom);

  while (true) {
    int TokPrec = getTokPrecedence();
    if (TokPrec < MinPrec)
      return std::move(LHS);

    std::string Op = cur().Symbol;
    unsigned Line = cur().Line;
    advance(); // eat binop

    auto RHS = parseExpression(TokPrec + 1);
    if (!RHS)
      return RHS.takeError();

    LHS = std::make_unique<BinaryExprAST>(Op, std::move(LHS),
                                          std::move(*RHS), Line);
  }
}

/// let ::= 'let' identifier '=' expression
llvm::Expected<std::unique_ptr<StmtAST>> Parser::parseLet() {
  unsigned Line = cur().Line;
  advance(); // eat let

  if (!cur().is(TokenKind::Identifier))
    return logError(cur(), "Expected identifier");
  Token Name = cur();
  advance();

  if (!accept("="))
    return logError(cur(), "Expected =");

  auto RHS = parseExpression();
  if (!RHS)
    return RHS.takeError();

  if (!Variables.define(Name.Symbol))
    return logError(Name, "Variable " + Name.Symbol + " is already defined");

  return std::make_unique<AssignmentAST>(Name.Symbol, std::move(*RHS), Line);
}

/// assignment ::= identifier '=' expression
/// label      ::= identifier ':'
llvm::Expected<std::unique_ptr<StmtAST>> Parser::parseAssignmentOrLabel() {
  Token Name = cur();
  advance();

  if (accept("=")) {
    if (!Variables.isDefined(Name.Symbol))
      return logError(Name, "The identifier '" + Name.Symbol +
                                "' is not defined.");
    auto RHS = parseExpression();
    if (!RHS)
      return RHS.takeError();
    return std::make_unique<AssignmentAST>(Name.Symbol, std::move(*RHS),
                                           Name.Line);
  }

  if (accept(":"))
    return std::make_unique<LabelAST>(Name.Symbol, Name.Line);

  return logError(cur(), "Unexpected " + cur().Symbol);
}

/// conditional
///   ::= 'if' expression block ('else' 'if' expression block)*
///       ('else' block)?
llvm::Expected<std::unique_ptr<StmtAST>> Parser::parseConditional() {
  unsigned Line = cur().Line;
  advance(); // eat if

  std::vector<std::unique_ptr<ExprAST>> Conditions;
  std::vector<StmtList> Bodies;

  auto Cond = parseExpression();
  if (!Cond)
    return Cond.takeError();
  auto Body = parseBlock();
  if (!Body)
    return Body.takeError();
  Conditions.push_back(std::move(*Cond));
  Bodies.push_back(std::move(*Body));

  // Newlines between '}' and 'else' are only eaten when an else follows, so
  // the separator after the whole statement is still checked.
  while (peekPastSeparators().is(TokenKind::Else)) {
    skipSeparators();
    unsigned ElseLine = cur().Line;
    advance(); // eat else

    if (accept(TokenKind::If)) {
      auto ElseIfCond = parseExpression();
      if (!ElseIfCond)
        return ElseIfCond.takeError();
      auto ElseIfBody = parseBlock();
      if (!ElseIfBody)
        return ElseIfBody.takeError();
      Conditions.push_back(std::move(*ElseIfCond));
      Bodies.push_back(std::move(*ElseIfBody));
      continue;
    }

    // The terminating else is unconditional.
    auto ElseBody = parseBlock();
    if (!ElseBody)
      return ElseBody.takeError();
    Conditions.push_back(std::make_unique<NumberExprAST>("1", ElseLine));
    Bodies.push_back(std::move(*ElseBody));
    break;
  }

  return std::make_unique<ConditionalAST>(std::move(Conditions),
                                          std::move(Bodies), Line);
}

/// for ::= 'for' identifier '='? expression '..' expression block
llvm::Expected<std::unique_ptr<StmtAST>> Parser::parseFor() {
  unsigned Line = cur().Line;
  advance(); // eat for

  if (!cur().is(TokenKind::Identifier))
    return logError(cur(), "Expected identifier");
  std::string Name = cur().Symbol;
  // The loop variable is defined by the loop itself if it is new.
  Variables.define(Name);
  advance();

  accept("=");

  auto Start = parseExpression();
  if (!Start)
    return Start.takeError();
  if (!accept(".."))
    return logError(cur(), "Expected '..'");
  auto End = parseExpression();
  if (!End)
    return End.takeError();

  auto Body = parseBlock();
  if (!Body)
    return Body.takeError();

  return std::make_unique<ForAST>(Name, std::move(*Start), std::move(*End),
                                  std::move(*Body), Line);
}

/// while ::= 'while' expression block
llvm::Expected<std::unique_ptr<StmtAST>> Parser::parseWhile() {
  unsigned Line = cur().Line;
  advance(); // eat while

  auto Cond = parseExpression();
  if (!Cond)
    return Cond.takeError();
  auto Body = parseBlock();
  if (!Body)
    return Body.takeError();

  return std::make_unique<WhileAST>(std::move(*Cond), std::move(*Body), Line);
}

/// print ::= 'print' expression
llvm::Expected<std::unique_ptr<StmtAST>> Parser::parsePrint() {
  unsigned Line = cur().Line;
  advance(); // eat print

  auto Child = parseExpression();
  if (!Child)
    return Child.takeError();
  return std::make_unique<PrintAST>(std::move(*Child), Line);
}

/// goto ::= 'goto' identifier
llvm::Expected<std::unique_ptr<StmtAST>> Parser::parseGoto() {
  unsigned Line = cur().Line;
  advance(); // eat goto

  if (!cur().is(TokenKind::Identifier))
    return logError(cur(), "Expected label name");
  std::string Name = cur().Symbol;
  advance();
  return std::make_unique<GotoAST>(Name, Line);
}

/// statement ::= let | assignment | label | conditional | for | while
///             | print | read | goto
llvm::Expected<std::unique_ptr<StmtAST>> Parser::parseStatementBody() {
  switch (cur().Kind) {
  case TokenKind::Let:        return parseLet();
  case TokenKind::Identifier: return parseAssignmentOrLabel();
  case TokenKind::If:         return parseConditional();
  case TokenKind::For:        return parseFor();
  case TokenKind::While:      return parseWhile();
  case TokenKind::Print:      return parsePrint();
  case TokenKind::Read: {
    auto Result = std::make_unique<ReadAST>(cur().Line);
    advance();
    return std::move(Result);
  }
  case TokenKind::Goto:       return parseGoto();
  default:
    return logError(cur(), "Unexpected " + cur().Symbol);
  }
}

/// Statements are separated by one or more newlines. None is needed before
/// the end of the program or the '}' closing a block.
llvm::Expected<std::unique_ptr<StmtAST>> Parser::parseStatement() {
  auto S = parseStatementBody();
  if (!S)
    return S.takeError();

  if (skipSeparators() == 0 && !cur().is(TokenKind::End) && !cur().is("}"))
    return logError(cur(), "Expected statement separator before '" +
                               cur().Symbol + "'");
  return S;
}

/// block ::= newline* '{' newline* statement* '}'
llvm::Expected<StmtList> Parser::parseBlock() {
  skipSeparators();
  if (!accept("{"))
    return logError(cur(), "Expected {");
  skipSeparators();

  StmtList Statements;
  while (!accept("}")) {
    if (cur().is(TokenKind::End))
      return logError(cur(), "Expected }");
    auto S = parseStatement();
    if (!S)
      return S.takeError();
    Statements.push_back(std::move(*S));
  }
  return std::move(Statements);
}

/// program ::= 'start' newline* statement* 'end'
llvm::Expected<std::unique_ptr<ProgramAST>> Parser::parse() {
  if (Tokens.empty() || !Tokens.back().is(TokenKind::End))
    return logError(Token("end", TokenKind::End, 1),
                    "Token stream is not terminated");

  Loc = 0;
  Variables = SymbolTable();

  accept(TokenKind::Start);
  skipSeparators();

  StmtList Statements;
  while (!accept(TokenKind::End)) {
    auto S = parseStatement();
    if (!S)
      return S.takeError();
    Statements.push_back(std::move(*S));
  }
  return std::make_unique<ProgramAST>(std::move(Statements));
}

llvm::Expected<std::unique_ptr<ProgramAST>>
bplus::parse(const std::vector<Token> &Tokens) {
  return Parser(Tokens).parse();
}
