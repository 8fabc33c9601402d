#include "bplus/lexer.h"
#include "gtest/gtest.h"

#include <string>
#include <vector>

using namespace bplus;

namespace {

std::vector<TokenKind> kinds(const std::vector<Token> &Tokens) {
  std::vector<TokenKind> Result;
  for (const Token &Tok : Tokens)
    Result.push_back(Tok.Kind);
  return Result;
}

std::vector<std::string> symbols(const std::vector<Token> &Tokens) {
  std::vector<std::string> Result;
  for (const Token &Tok : Tokens)
    Result.push_back(Tok.Symbol);
  return Result;
}

TEST(LexerTest, EmptySourceIsBracketedByStartAndEnd) {
  auto Tokens = lex("");
  ASSERT_EQ(2u, Tokens.size());
  EXPECT_EQ(TokenKind::Start, Tokens[0].Kind);
  EXPECT_EQ("start", Tokens[0].Symbol);
  EXPECT_EQ(TokenKind::End, Tokens[1].Kind);
  EXPECT_EQ("end", Tokens[1].Symbol);
  EXPECT_EQ(1u, Tokens[1].Line);
}

TEST(LexerTest, LetAndPrint) {
  auto Tokens = lex("let x = 10\nprint x");
  std::vector<TokenKind> Expected = {
      TokenKind::Start,  TokenKind::Let,      TokenKind::Identifier,
      TokenKind::Operator, TokenKind::Number, TokenKind::Newline,
      TokenKind::Print,  TokenKind::Identifier, TokenKind::End};
  EXPECT_EQ(Expected, kinds(Tokens));

  std::vector<std::string> ExpectedSymbols = {
      "start", "let", "x", "=", "10", "newline", "print", "x", "end"};
  EXPECT_EQ(ExpectedSymbols, symbols(Tokens));
}

TEST(LexerTest, TracksLineNumbers) {
  auto Tokens = lex("let a = 1\n\nprint a\n");
  // start let a = 1 newline newline print a newline end
  ASSERT_EQ(11u, Tokens.size());
  EXPECT_EQ(1u, Tokens[1].Line);
  EXPECT_EQ(1u, Tokens[5].Line); // first newline belongs to line 1
  EXPECT_EQ(2u, Tokens[6].Line);
  EXPECT_EQ(3u, Tokens[7].Line); // print
  EXPECT_EQ(4u, Tokens[10].Line); // end
}

TEST(LexerTest, KeywordsAreCaseInsensitive) {
  auto Tokens = lex("LET Foo = 1\nWhile Print READ goto For If Else");
  EXPECT_EQ(TokenKind::Let, Tokens[1].Kind);
  EXPECT_EQ("let", Tokens[1].Symbol);
  EXPECT_EQ(TokenKind::Identifier, Tokens[2].Kind);
  EXPECT_EQ("Foo", Tokens[2].Symbol);

  std::vector<TokenKind> Expected = {
      TokenKind::While, TokenKind::Print, TokenKind::Read, TokenKind::Goto,
      TokenKind::For,   TokenKind::If,    TokenKind::Else};
  std::vector<TokenKind> All = kinds(Tokens);
  std::vector<TokenKind> Actual(All.begin() + 6, All.end() - 1);
  EXPECT_EQ(Expected, Actual);
  EXPECT_EQ("while", Tokens[6].Symbol);
}

TEST(LexerTest, IdentifiersMayContainDigits) {
  auto Tokens = lex("x1y2 12ab");
  std::vector<TokenKind> Expected = {TokenKind::Start, TokenKind::Identifier,
                                     TokenKind::Number, TokenKind::Identifier,
                                     TokenKind::End};
  EXPECT_EQ(Expected, kinds(Tokens));
  EXPECT_EQ("x1y2", Tokens[1].Symbol);
  EXPECT_EQ("12", Tokens[2].Symbol);
  EXPECT_EQ("ab", Tokens[3].Symbol);
}

TEST(LexerTest, MultiCharacterOperatorsAreGreedy) {
  auto Tokens = lex("a>=b..c==d<=e>f=g");
  std::vector<std::string> Expected = {"start", "a", ">=", "b", "..", "c",
                                       "==",    "d", "<=", "e", ">",  "f",
                                       "=",     "g", "end"};
  EXPECT_EQ(Expected, symbols(Tokens));
  EXPECT_EQ(TokenKind::Operator, Tokens[2].Kind);
  EXPECT_EQ(TokenKind::Operator, Tokens[4].Kind);
}

TEST(LexerTest, RangeBetweenNumbers) {
  auto Tokens = lex("0..3");
  std::vector<TokenKind> Expected = {TokenKind::Start, TokenKind::Number,
                                     TokenKind::Operator, TokenKind::Number,
                                     TokenKind::End};
  EXPECT_EQ(Expected, kinds(Tokens));
  EXPECT_EQ("..", Tokens[2].Symbol);
}

TEST(LexerTest, ParensAndOperators) {
  auto Tokens = lex("{ ( ) } + - * / % : !");
  for (size_t I = 1; I <= 4; ++I)
    EXPECT_EQ(TokenKind::Paren, Tokens[I].Kind) << Tokens[I].Symbol;
  for (size_t I = 5; I <= 11; ++I)
    EXPECT_EQ(TokenKind::Operator, Tokens[I].Kind) << Tokens[I].Symbol;
}

TEST(LexerTest, CommentsProduceNoTokens) {
  auto Tokens = lex("// header\nprint 1 // trailing\nprint 2");
  std::vector<TokenKind> Expected = {TokenKind::Start, TokenKind::Print,
                                     TokenKind::Number, TokenKind::Print,
                                     TokenKind::Number, TokenKind::End};
  EXPECT_EQ(Expected, kinds(Tokens));
  // Lines still advance across the swallowed terminators.
  EXPECT_EQ(2u, Tokens[1].Line);
  EXPECT_EQ(3u, Tokens[3].Line);
}

TEST(LexerTest, CommentAtEndOfInput) {
  auto Tokens = lex("print 1 // no newline");
  std::vector<TokenKind> Expected = {TokenKind::Start, TokenKind::Print,
                                     TokenKind::Number, TokenKind::End};
  EXPECT_EQ(Expected, kinds(Tokens));
}

TEST(LexerTest, SingleSlashIsDivision) {
  auto Tokens = lex("6 / 2");
  EXPECT_EQ("/", Tokens[2].Symbol);
  EXPECT_EQ(TokenKind::Operator, Tokens[2].Kind);
}

TEST(LexerTest, CarriageReturnsAreLineTerminators) {
  auto Tokens = lex("a\r\nb\rc");
  std::vector<TokenKind> Expected = {
      TokenKind::Start,   TokenKind::Identifier, TokenKind::Newline,
      TokenKind::Identifier, TokenKind::Newline, TokenKind::Identifier,
      TokenKind::End};
  EXPECT_EQ(Expected, kinds(Tokens));
  EXPECT_EQ(2u, Tokens[3].Line);
  EXPECT_EQ(3u, Tokens[5].Line);
}

// Characters outside every token class are dropped without a diagnostic.
// Making the lexer stricter must be a deliberate change to this test.
TEST(LexerTest, UnrecognizedCharactersAreSilentlyDropped) {
  auto Tokens = lex("let x = 1 @ # $ ; \" ' ?");
  std::vector<std::string> Expected = {"start", "let", "x", "=", "1", "end"};
  EXPECT_EQ(Expected, symbols(Tokens));

  // A lone dot is not an operator either.
  auto Decimal = lex("1.5");
  std::vector<std::string> ExpectedDecimal = {"start", "1", "5", "end"};
  EXPECT_EQ(ExpectedDecimal, symbols(Decimal));
}

TEST(LexerTest, RelexingReconstructedTextIsIdempotent) {
  auto First = lex("x + 42*(y-3) >= z..w == (a/b) < c");

  std::string Text;
  for (const Token &Tok : First) {
    if (Tok.is(TokenKind::Start) || Tok.is(TokenKind::End))
      continue;
    Text += Tok.Symbol;
    Text += ' ';
  }

  auto Second = lex(Text);
  EXPECT_EQ(kinds(First), kinds(Second));
  EXPECT_EQ(symbols(First), symbols(Second));
}

TEST(LexerTest, TokenKindNames) {
  EXPECT_EQ("IDENTIFIER", getTokenKindName(TokenKind::Identifier).str());
  EXPECT_EQ("GOTO", getTokenKindName(TokenKind::Goto).str());
  EXPECT_EQ("NEWLINE", getTokenKindName(TokenKind::Newline).str());
}

} // end anonymous namespace
