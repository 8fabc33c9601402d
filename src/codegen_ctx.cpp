#include "bplus/codegen_ctx.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/raw_ostream.h"

using namespace bplus;

static bool isReservedInC(llvm::StringRef Name) {
    return llvm::StringSwitch<bool>(Name)
        .Cases("auto", "break", "case", "char", "const", "continue", true)
        .Cases("default", "do", "double", "else", "enum", "extern", true)
        .Cases("float", "for", "goto", "if", "inline", "int", "long", true)
        .Cases("register", "restrict", "return", "short", "signed", true)
        .Cases("sizeof", "static", "struct", "switch", "typedef", true)
        .Cases("union", "unsigned", "void", "volatile", "while", true)
        .Cases("bool", "true", "false", "asm", "typeof", true)
        // Names the generated program itself refers to.
        .Cases("main", "printf", "stdio", "NULL", "EOF", true)
        .Default(false);
}

std::string CodegenContext::getCName(llvm::StringRef Name) {
    if (isReservedInC(Name))
        return ("bp_" + Name).str();
    return Name.str();
}

std::string CodegenContext::finish() const {
    std::string Output;
    llvm::raw_string_ostream OS(Output);

    OS << "#include <stdio.h>\n"
       << "\n"
       << "int main() {\n";
    for (const auto &Line : declarations)
        OS << "\t" << Line << "\n";
    for (const auto &Line : body)
        OS << Line << "\n";
    OS << "\treturn 0;\n"
       << "}\n";

    return OS.str();
}

std::string bplus::generate(const ProgramAST &Program) {
    CodegenContext ctx;
    Program.codegen(ctx);
    return ctx.finish();
}
