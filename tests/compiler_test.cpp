#include "bplus/compiler.h"
#include "bplus/log.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Program.h"
#include "llvm/Support/raw_ostream.h"
#include "gtest/gtest.h"

#include <string>

using namespace bplus;

namespace {

TEST(CompilerTest, CompilesValidProgram) {
  std::string Errors;
  llvm::raw_string_ostream ErrOS(Errors);
  CompileOptions Opts;
  Opts.Errs = &ErrOS;

  auto Output = compile("let x = 1\nprint x\n", Opts);
  ASSERT_TRUE(Output.has_value());
  EXPECT_NE(std::string::npos, Output->find("int main() {"));
  EXPECT_NE(std::string::npos, Output->find("printf(\"%i\\n\", x);"));
  EXPECT_TRUE(ErrOS.str().empty());
}

TEST(CompilerTest, WindowsLineEndingsMatchUnixOnes) {
  auto Unix = compile("let x = 1\nprint x\n");
  auto Windows = compile("let x = 1\r\nprint x\r\n");
  ASSERT_TRUE(Unix && Windows);
  EXPECT_EQ(*Unix, *Windows);
}

TEST(CompilerTest, ReportsErrorWithSurroundingLines) {
  std::string Errors;
  llvm::raw_string_ostream ErrOS(Errors);
  CompileOptions Opts;
  Opts.Errs = &ErrOS;

  auto Output = compile("let x = 1\nx = y\nprint x\n", Opts);
  EXPECT_FALSE(Output.has_value());
  EXPECT_EQ("Error on line 2:\n"
            "          let x = 1\n"
            "   --->   x = y\n"
            "          print x\n"
            "The identifier 'y' is not defined.\n",
            ErrOS.str());
}

TEST(CompilerTest, ReportOnFirstLineHasEmptyNeighbour) {
  std::string Errors;
  llvm::raw_string_ostream ErrOS(Errors);
  CompileOptions Opts;
  Opts.Errs = &ErrOS;

  EXPECT_FALSE(compile("let x = 1 let y = 2", Opts));
  EXPECT_EQ("Error on line 1:\n"
            "          \n"
            "   --->   let x = 1 let y = 2\n"
            "          \n"
            "Expected statement separator before 'let'\n",
            ErrOS.str());
}

TEST(CompilerTest, ReportQuotesNormalizedSource) {
  std::string Errors;
  llvm::raw_string_ostream ErrOS(Errors);
  CompileOptions Opts;
  Opts.Errs = &ErrOS;

  EXPECT_FALSE(compile("print 1\r\nprint (1 + 2", Opts));
  EXPECT_NE(std::string::npos, ErrOS.str().find("   --->   print (1 + 2\n"));
  EXPECT_NE(std::string::npos,
            ErrOS.str().find("Unmatched '(', expected ')'"));
}

TEST(CompilerTest, TypedErrorChannel) {
  auto Output = compileToC("let x = 1\nlet x = 2");
  ASSERT_FALSE(Output);

  std::string Message;
  unsigned Line = 0;
  llvm::handleAllErrors(Output.takeError(), [&](const ParseError &PE) {
    Message = PE.getMessage().str();
    Line = PE.getToken().Line;
  });
  EXPECT_EQ("Variable x is already defined", Message);
  EXPECT_EQ(2u, Line);
}

TEST(CompilerTest, DebugTraceGoesToLogSink) {
  std::string Log;
  llvm::raw_string_ostream LogOS(Log);
  CompileOptions Opts;
  Opts.Debug = true;
  Opts.Log = &LogOS;

  auto Output = compileToC("let x = 1\nprint x", Opts);
  ASSERT_TRUE(bool(Output));
  LogOS.flush();
  EXPECT_NE(std::string::npos, Log.find("IDENTIFIER"));
  EXPECT_NE(std::string::npos, Log.find("NEWLINE"));
  EXPECT_NE(std::string::npos, Log.find("Program"));
  EXPECT_NE(std::string::npos, Log.find("Assignment x (line 1)"));
  EXPECT_NE(std::string::npos, Log.find("Print (line 2)"));
}

TEST(CompilerTest, NoTraceWithoutDebug) {
  std::string Log;
  llvm::raw_string_ostream LogOS(Log);
  CompileOptions Opts;
  Opts.Log = &LogOS;

  auto Output = compileToC("print 1", Opts);
  ASSERT_TRUE(bool(Output));
  EXPECT_TRUE(LogOS.str().empty());
}

TEST(CompilerTest, CompilationsAreIndependent) {
  // Nothing defined by one compilation leaks into the next.
  ASSERT_TRUE(compile("let x = 1"));
  std::string Errors;
  llvm::raw_string_ostream ErrOS(Errors);
  CompileOptions Opts;
  Opts.Errs = &ErrOS;
  EXPECT_FALSE(compile("print x", Opts));
  ASSERT_TRUE(compile("let x = 2"));
}

// Compiles the generated C with the system compiler and runs it.
class EndToEndTest : public ::testing::Test {
protected:
  std::string CC;
  std::string Shell;

  void SetUp() override {
    auto CCOrErr = llvm::sys::findProgramByName("cc");
    auto ShOrErr = llvm::sys::findProgramByName("sh");
    if (!CCOrErr || !ShOrErr)
      GTEST_SKIP() << "no C compiler or shell on PATH";
    CC = *CCOrErr;
    Shell = *ShOrErr;
  }

  std::string run(llvm::StringRef Source) {
    auto Code = compileToC(Source);
    if (!Code) {
      ADD_FAILURE() << llvm::toString(Code.takeError());
      return "";
    }

    llvm::SmallString<128> CPath, ExePath, OutPath;
    if (llvm::sys::fs::createTemporaryFile("bplus", "c", CPath) ||
        llvm::sys::fs::createTemporaryFile("bplus", "exe", ExePath) ||
        llvm::sys::fs::createTemporaryFile("bplus", "out", OutPath)) {
      ADD_FAILURE() << "could not create temporary files";
      return "";
    }

    {
      std::error_code EC;
      llvm::raw_fd_ostream OS(CPath, EC, llvm::sys::fs::OF_Text);
      if (EC) {
        ADD_FAILURE() << EC.message();
        return "";
      }
      OS << *Code;
    }

    std::string Output;
    llvm::StringRef CCArgs[] = {CC, "-o", ExePath, CPath};
    if (llvm::sys::ExecuteAndWait(CC, CCArgs) != 0) {
      ADD_FAILURE() << "C compiler rejected:\n" << *Code;
    } else {
      std::string Command = "'" + ExePath.str().str() + "' > '" +
                            OutPath.str().str() + "'";
      llvm::StringRef ShArgs[] = {Shell, "-c", Command};
      EXPECT_EQ(0, llvm::sys::ExecuteAndWait(Shell, ShArgs));
      if (auto Buf = llvm::MemoryBuffer::getFile(OutPath))
        Output = (*Buf)->getBuffer().str();
    }

    EXPECT_FALSE(llvm::sys::fs::remove(CPath));
    EXPECT_FALSE(llvm::sys::fs::remove(ExePath));
    EXPECT_FALSE(llvm::sys::fs::remove(OutPath));
    return Output;
  }
};

TEST_F(EndToEndTest, MultiplicationBindsTighter) {
  EXPECT_EQ("14\n", run("print 2 + 3 * 4"));
}

TEST_F(EndToEndTest, SubtractionAssociatesLeft) {
  EXPECT_EQ("5\n", run("print 10 - 3 - 2"));
}

TEST_F(EndToEndTest, ConditionalChainRunsOneBranch) {
  EXPECT_EQ("1\n",
            run("if 1 { print 1 } else if 0 { print 2 } else { print 3 }"));
  EXPECT_EQ("3\n",
            run("if 0 { print 1 } else if 0 { print 2 } else { print 3 }"));
}

TEST_F(EndToEndTest, ForLoopExcludesUpperBound) {
  EXPECT_EQ("0\n1\n2\n", run("for i = 0..3 { print i }"));
}

TEST_F(EndToEndTest, WhileLoopAndGoto) {
  EXPECT_EQ("3\n2\n1\n", run("let n = 3\n"
                             "while n > 0 {\n"
                             "  print n\n"
                             "  n = n - 1\n"
                             "}"));
  EXPECT_EQ("0\n1\n2\n", run("let i = 0\n"
                             "loop:\n"
                             "print i\n"
                             "i = i + 1\n"
                             "if i < 3 {\n"
                             "  goto loop\n"
                             "}"));
}

TEST_F(EndToEndTest, VariableBoundInLoopOutlivesIt) {
  EXPECT_EQ("7\n", run("for i = 0..1 {\n"
                       "  let last = 7\n"
                       "}\n"
                       "print last"));
}

TEST_F(EndToEndTest, UnaryOperators) {
  EXPECT_EQ("-5\n1\n0\n", run("print -(2 + 3)\nprint !0\nprint !7"));
}

TEST_F(EndToEndTest, LeadingZerosAreDecimal) {
  EXPECT_EQ("10\n9\n", run("print 010\nprint 09"));
}

TEST_F(EndToEndTest, VariablesMayShareNamesWithC) {
  EXPECT_EQ("1\n3\n", run("let printf = 1\n"
                           "let int = printf + 2\n"
                           "print printf\n"
                           "print int"));
}

} // end anonymous namespace
