#ifndef BPLUS_COMPILER_H
#define BPLUS_COMPILER_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"
#include <optional>
#include <string>

namespace bplus {

/// CompileOptions - Per-call configuration. Nothing is kept between calls.
struct CompileOptions {
  /// Trace the token list and the AST to Log.
  bool Debug = false;
  /// Sink for the debug trace; llvm::errs() when null.
  llvm::raw_ostream *Log = nullptr;
  /// Where compile() reports errors; llvm::errs() when null.
  llvm::raw_ostream *Errs = nullptr;
};

/// compileToC - Translate B+ source to C. A syntax error comes back as a
/// ParseError.
llvm::Expected<std::string> compileToC(llvm::StringRef Source,
                                       const CompileOptions &Opts = {});

/// compile - Translate B+ source to C, printing a formatted report and
/// returning nothing if the program is rejected.
std::optional<std::string> compile(llvm::StringRef Source,
                                   const CompileOptions &Opts = {});

} // end namespace bplus

#endif // BPLUS_COMPILER_H
