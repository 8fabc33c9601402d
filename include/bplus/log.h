#ifndef BPLUS_LOG_H
#define BPLUS_LOG_H

#include "bplus/token.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"
#include <string>
#include <vector>

namespace bplus {

/// ParseError - A syntax or definedness error, carrying the token it was
/// reported on.
class ParseError : public llvm::ErrorInfo<ParseError> {
public:
  static char ID;

  ParseError(Token Tok, std::string Message)
      : Tok(std::move(Tok)), Message(std::move(Message)) {}

  const Token &getToken() const { return Tok; }
  llvm::StringRef getMessage() const { return Message; }

  void log(llvm::raw_ostream &OS) const override;
  std::error_code convertToErrorCode() const override;

private:
  Token Tok;
  std::string Message;
};

// logError - Little helper for building parse errors.
llvm::Error logError(const Token &Tok, const llvm::Twine &Message);

/// printError - Print a compiler error: the offending line, marked, between
/// its neighbours, followed by the message.
void printError(const Token &Tok, llvm::StringRef Message,
                llvm::StringRef Source, llvm::raw_ostream &OS);

/// dumpTokens - Debug trace of a token sequence, one token per line.
void dumpTokens(const std::vector<Token> &Tokens, llvm::raw_ostream &OS);

} // end namespace bplus

#endif // BPLUS_LOG_H
