#include "bplus/compiler.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Program.h"
#include "llvm/Support/WithColor.h"
#include "llvm/Support/raw_ostream.h"

using namespace llvm;

static cl::opt<std::string> InputFilename(cl::Positional,
                                          cl::desc("<input file>"),
                                          cl::init("test.bp"));

static cl::opt<std::string> OutputFilename("o", cl::desc("Output C file"),
                                           cl::value_desc("filename"),
                                           cl::init("out.c"));

static cl::opt<bool> DebugDump("debug-dump",
                               cl::desc("Print the tokens and the AST"));

static cl::opt<bool>
    RunProgram("run", cl::desc("Compile the generated C and run the binary"));

static cl::opt<std::string> CCompiler("cc",
                                      cl::desc("C compiler used by -run"),
                                      cl::value_desc("program"),
                                      cl::init("cc"));

static cl::opt<std::string> ExeFilename("exe",
                                        cl::desc("Executable built by -run"),
                                        cl::value_desc("filename"),
                                        cl::init("out"));

static int writeOutput(StringRef Code) {
  std::error_code EC;
  raw_fd_ostream Dest(OutputFilename, EC, sys::fs::OF_Text);
  if (EC) {
    WithColor::error() << "could not open '" << OutputFilename
                       << "': " << EC.message() << "\n";
    return 1;
  }
  Dest << Code;
  return 0;
}

// Invoke the C compiler on the generated file, then the binary it built.
static int compileAndRun() {
  auto CC = sys::findProgramByName(CCompiler);
  if (!CC) {
    WithColor::error() << "cannot find C compiler '" << CCompiler
                       << "': " << CC.getError().message() << "\n";
    return 1;
  }

  SmallString<128> Exe(ExeFilename);
  if (std::error_code EC = sys::fs::make_absolute(Exe)) {
    WithColor::error() << "invalid path '" << ExeFilename
                       << "': " << EC.message() << "\n";
    return 1;
  }

  std::string ErrMsg;
  SmallVector<StringRef, 4> CCArgs = {*CC, "-o", Exe, OutputFilename};
  int RC = sys::ExecuteAndWait(*CC, CCArgs, {}, {}, 0, 0, &ErrMsg);
  if (RC != 0) {
    WithColor::error() << CCompiler << " failed";
    if (!ErrMsg.empty())
      errs() << ": " << ErrMsg;
    errs() << "\n";
    return 1;
  }

  SmallVector<StringRef, 1> RunArgs = {Exe};
  RC = sys::ExecuteAndWait(Exe, RunArgs, {}, {}, 0, 0, &ErrMsg);
  if (RC < 0) {
    WithColor::error() << "could not run '" << Exe << "': " << ErrMsg << "\n";
    return 1;
  }
  return RC;
}

int main(int argc, char **argv) {
  InitLLVM X(argc, argv);
  cl::ParseCommandLineOptions(argc, argv, "B+ to C compiler\n");

  if (RunProgram && OutputFilename == "-") {
    WithColor::error() << "-run needs an output file, not stdout\n";
    return 1;
  }

  auto BufOrErr = MemoryBuffer::getFileOrSTDIN(InputFilename);
  if (std::error_code EC = BufOrErr.getError()) {
    WithColor::error() << "could not read '" << InputFilename
                       << "': " << EC.message() << "\n";
    return 1;
  }

  bplus::CompileOptions Opts;
  Opts.Debug = DebugDump;

  // If there were no errors during compilation, write out the generated code.
  auto Code = bplus::compile((*BufOrErr)->getBuffer(), Opts);
  if (!Code)
    return 1;

  if (int RC = writeOutput(*Code))
    return RC;

  if (RunProgram)
    return compileAndRun();
  return 0;
}
