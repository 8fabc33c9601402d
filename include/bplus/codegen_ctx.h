#ifndef BPLUS_CODEGEN_CONTEXT_H
#define BPLUS_CODEGEN_CONTEXT_H

#include "bplus/ast.h"
#include "bplus/symbol_table.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include <string>
#include <vector>

namespace bplus {

/// CodegenContext - Everything the AST walk writes into while emitting C.
/// One context per compilation.
class CodegenContext {
public:
    SymbolTable declared;                   // variables already declared in the output text.
                                            // Separate from the parser's table on purpose.
    std::vector<std::string> declarations;  // "int x;" lines, hoisted to the top of main so that
                                            // the flat namespace of the source stays valid C.
    std::vector<std::string> body;          // statement lines, already indented.
    unsigned depth = 1;                     // current nesting level inside main().

    /// declare - Emit a declaration for Name unless one was emitted before.
    void declare(llvm::StringRef Name) {
        if (declared.define(Name))
            declarations.push_back("int " + getCName(Name) + ";");
    }

    /// getCName - The C spelling of a B+ variable or label. Names that are C
    /// keywords or clash with main/printf get a "bp_" prefix; B+ names never
    /// contain '_', so a prefixed name cannot collide with a user's.
    static std::string getCName(llvm::StringRef Name);

    void emit(const llvm::Twine &Line) {
        body.push_back(std::string(depth, '\t') + Line.str());
    }

    /// emitBlock - Emit a nested statement list one level deeper.
    void emitBlock(const StmtList &Statements) {
        ++depth;
        for (const auto &S : Statements)
            S->codegen(*this);
        --depth;
    }

    /// finish - Wrap everything in the fixed prologue and epilogue.
    std::string finish() const;
};

/// generate - Emit the C translation of a program.
std::string generate(const ProgramAST &Program);

} // end namespace bplus

#endif // BPLUS_CODEGEN_CONTEXT_H
