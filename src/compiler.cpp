#include "bplus/compiler.h"
#include "bplus/ast.h"
#include "bplus/codegen_ctx.h"
#include "bplus/lexer.h"
#include "bplus/log.h"
#include "bplus/parser.h"

using namespace bplus;

// Windows line endings become Unix ones, so error reports and line numbers
// agree.
static std::string normalizeLineEndings(llvm::StringRef Source) {
  std::string Result;
  Result.reserve(Source.size());
  for (size_t I = 0, E = Source.size(); I != E; ++I) {
    if (Source[I] == '\r' && I + 1 != E && Source[I + 1] == '\n')
      continue;
    Result += Source[I];
  }
  return Result;
}

static llvm::Expected<std::string>
compileNormalized(const std::string &Program, const CompileOptions &Opts) {
  llvm::raw_ostream &Log = Opts.Log ? *Opts.Log : llvm::errs();

  std::vector<Token> Tokens = lex(Program);
  if (Opts.Debug)
    dumpTokens(Tokens, Log);

  auto AST = parse(Tokens);
  if (!AST)
    return AST.takeError();
  if (Opts.Debug)
    (*AST)->dump(Log);

  return generate(**AST);
}

llvm::Expected<std::string> bplus::compileToC(llvm::StringRef Source,
                                              const CompileOptions &Opts) {
  return compileNormalized(normalizeLineEndings(Source), Opts);
}

std::optional<std::string> bplus::compile(llvm::StringRef Source,
                                          const CompileOptions &Opts) {
  llvm::raw_ostream &Errs = Opts.Errs ? *Opts.Errs : llvm::errs();
  std::string Program = normalizeLineEndings(Source);

  auto Output = compileNormalized(Program, Opts);
  if (Output)
    return std::move(*Output);

  // Errors in the expected format are printed as proper compiler errors;
  // the report quotes the normalized text the token lines refer to.
  llvm::handleAllErrors(
      Output.takeError(),
      [&](const ParseError &PE) {
        printError(PE.getToken(), PE.getMessage(), Program, Errs);
      },
      [&](const llvm::ErrorInfoBase &EIB) {
        Errs << "error: " << EIB.message() << "\n";
      });
  return std::nullopt;
}
