#include "bplus/log.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Format.h"

namespace bplus {

char ParseError::ID = 0;

void ParseError::log(llvm::raw_ostream &OS) const {
  OS << "line " << Tok.Line << ": " << Message;
}

std::error_code ParseError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}

llvm::Error logError(const Token &Tok, const llvm::Twine &Message) {
  return llvm::make_error<ParseError>(Tok, Message.str());
}

void printError(const Token &Tok, llvm::StringRef Message,
                llvm::StringRef Source, llvm::raw_ostream &OS) {
  llvm::SmallVector<llvm::StringRef, 32> Lines;
  Source.split(Lines, '\n');

  // Lines are 1-based; anything out of range prints as empty.
  auto getLine = [&](long N) -> llvm::StringRef {
    if (N < 1 || N > static_cast<long>(Lines.size()))
      return "";
    return Lines[N - 1];
  };

  long N = Tok.Line;
  OS << "Error on line " << Tok.Line << ":\n";
  OS << "          " << getLine(N - 1) << "\n";
  OS << "   --->   " << getLine(N) << "\n";
  OS << "          " << getLine(N + 1) << "\n";
  OS << Message << "\n";
}

void dumpTokens(const std::vector<Token> &Tokens, llvm::raw_ostream &OS) {
  for (const Token &Tok : Tokens) {
    OS << llvm::format("%4u  ", Tok.Line)
       << llvm::left_justify(getTokenKindName(Tok.Kind), 10) << "  ";
    if (Tok.is(TokenKind::Newline))
      OS << "\\n";
    else
      OS << Tok.Symbol;
    OS << "\n";
  }
}

} // end namespace bplus
