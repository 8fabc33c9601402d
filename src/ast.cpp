#include <memory>
#include <string>

#include "bplus/ast.h"
#include "bplus/codegen_ctx.h"
#include "llvm/ADT/StringSwitch.h"

using namespace bplus;

/// getCOperator - The C spelling of a B+ operator. Every operator the parser
/// accepts has a direct analogue, so unknown spellings pass through as-is.
static llvm::StringRef getCOperator(llvm::StringRef Op) {
  return llvm::StringSwitch<llvm::StringRef>(Op)
      .Case("+", "+")
      .Case("-", "-")
      .Case("*", "*")
      .Case("/", "/")
      .Case("!", "!")
      .Case("==", "==")
      .Case(">", ">")
      .Case("<", "<")
      .Case(">=", ">=")
      .Case("<=", "<=")
      .Default(Op);
}

static llvm::raw_ostream &indent(llvm::raw_ostream &OS, unsigned Indent) {
  return OS.indent(Indent * 2);
}

static void dumpBody(const StmtList &Body, llvm::raw_ostream &OS,
                     unsigned Indent) {
  for (const auto &S : Body)
    S->dump(OS, Indent);
}

//===----------------------------------------------------------------------===//
// Expressions
//===----------------------------------------------------------------------===//

// B+ literals are always decimal; a leading zero would make C read octal.
std::string NumberExprAST::codegen(CodegenContext &Ctx) const {
  llvm::StringRef Digits = llvm::StringRef(Symbol).ltrim('0');
  return Digits.empty() ? "0" : Digits.str();
}

std::string VariableExprAST::codegen(CodegenContext &Ctx) const {
  return CodegenContext::getCName(Symbol);
}

std::string UnaryExprAST::codegen(CodegenContext &Ctx) const {
  std::string OperandC = Operand->codegen(Ctx);
  return "(" + getCOperator(Opcode).str() + OperandC + ")";
}

std::string BinaryExprAST::codegen(CodegenContext &Ctx) const {
  // Recursively emit the left-hand side, then the right-hand side.
  std::string L = LHS->codegen(Ctx);
  std::string R = RHS->codegen(Ctx);
  return "(" + L + " " + getCOperator(Op).str() + " " + R + ")";
}

void NumberExprAST::dump(llvm::raw_ostream &OS, unsigned Indent) const {
  indent(OS, Indent) << "Number " << Symbol << "\n";
}

void VariableExprAST::dump(llvm::raw_ostream &OS, unsigned Indent) const {
  indent(OS, Indent) << "Identifier " << Symbol << "\n";
}

void UnaryExprAST::dump(llvm::raw_ostream &OS, unsigned Indent) const {
  indent(OS, Indent) << "Unary " << Opcode << "\n";
  Operand->dump(OS, Indent + 1);
}

void BinaryExprAST::dump(llvm::raw_ostream &OS, unsigned Indent) const {
  indent(OS, Indent) << "Binary " << Op << "\n";
  LHS->dump(OS, Indent + 1);
  RHS->dump(OS, Indent + 1);
}

//===----------------------------------------------------------------------===//
// Statements
//===----------------------------------------------------------------------===//

void AssignmentAST::codegen(CodegenContext &Ctx) const {
  Ctx.declare(Name);
  std::string Value = RHS->codegen(Ctx);
  Ctx.emit(CodegenContext::getCName(Name) + " = " + Value + ";");
}

void LabelAST::codegen(CodegenContext &Ctx) const {
  // The empty statement keeps a label legal right before a closing brace.
  Ctx.emit(CodegenContext::getCName(Name) + ":;");
}

void GotoAST::codegen(CodegenContext &Ctx) const {
  Ctx.emit("goto " + CodegenContext::getCName(Name) + ";");
}

void ConditionalAST::codegen(CodegenContext &Ctx) const {
  // A trailing else arrives as "else if (1)", so every branch after the
  // first is generated the same way.
  for (size_t I = 0, E = Conditions.size(); I != E; ++I) {
    std::string Cond = Conditions[I]->codegen(Ctx);
    Ctx.emit((I == 0 ? "if (" : "else if (") + Cond + ") {");
    Ctx.emitBlock(Bodies[I]);
    Ctx.emit("}");
  }
}

void ForAST::codegen(CodegenContext &Ctx) const {
  Ctx.declare(Name);
  std::string Var = CodegenContext::getCName(Name);

  // Start and end are the values to loop between, end excluded.
  std::string StartC = Start->codegen(Ctx);
  std::string EndC = End->codegen(Ctx);
  Ctx.emit("for (" + Var + " = " + StartC + "; " + Var + " < " + EndC +
           "; " + Var + "++) {");
  Ctx.emitBlock(Body);
  Ctx.emit("}");
}

void WhileAST::codegen(CodegenContext &Ctx) const {
  std::string Cond = Condition->codegen(Ctx);
  Ctx.emit("while (" + Cond + ") {");
  Ctx.emitBlock(Body);
  Ctx.emit("}");
}

void PrintAST::codegen(CodegenContext &Ctx) const {
  std::string Value = Child->codegen(Ctx);
  Ctx.emit("printf(\"%i\\n\", " + Value + ");");
}

// read has no operand to store into, so there is nothing to emit.
void ReadAST::codegen(CodegenContext &Ctx) const {}

void AssignmentAST::dump(llvm::raw_ostream &OS, unsigned Indent) const {
  indent(OS, Indent) << "Assignment " << Name << " (line " << getLine()
                     << ")\n";
  RHS->dump(OS, Indent + 1);
}

void LabelAST::dump(llvm::raw_ostream &OS, unsigned Indent) const {
  indent(OS, Indent) << "Label " << Name << " (line " << getLine() << ")\n";
}

void GotoAST::dump(llvm::raw_ostream &OS, unsigned Indent) const {
  indent(OS, Indent) << "Goto " << Name << " (line " << getLine() << ")\n";
}

void ConditionalAST::dump(llvm::raw_ostream &OS, unsigned Indent) const {
  indent(OS, Indent) << "Conditional (line " << getLine() << ")\n";
  for (size_t I = 0, E = Conditions.size(); I != E; ++I) {
    indent(OS, Indent + 1) << (I == 0 ? "if" : "else if") << "\n";
    Conditions[I]->dump(OS, Indent + 2);
    indent(OS, Indent + 1) << "then\n";
    dumpBody(Bodies[I], OS, Indent + 2);
  }
}

void ForAST::dump(llvm::raw_ostream &OS, unsigned Indent) const {
  indent(OS, Indent) << "For " << Name << " (line " << getLine() << ")\n";
  Start->dump(OS, Indent + 1);
  End->dump(OS, Indent + 1);
  dumpBody(Body, OS, Indent + 1);
}

void WhileAST::dump(llvm::raw_ostream &OS, unsigned Indent) const {
  indent(OS, Indent) << "While (line " << getLine() << ")\n";
  Condition->dump(OS, Indent + 1);
  dumpBody(Body, OS, Indent + 1);
}

void PrintAST::dump(llvm::raw_ostream &OS, unsigned Indent) const {
  indent(OS, Indent) << "Print (line " << getLine() << ")\n";
  Child->dump(OS, Indent + 1);
}

void ReadAST::dump(llvm::raw_ostream &OS, unsigned Indent) const {
  indent(OS, Indent) << "Read (line " << getLine() << ")\n";
}

//===----------------------------------------------------------------------===//
// Program
//===----------------------------------------------------------------------===//

void ProgramAST::codegen(CodegenContext &Ctx) const {
  for (const auto &S : Statements)
    S->codegen(Ctx);
}

void ProgramAST::dump(llvm::raw_ostream &OS) const {
  OS << "Program\n";
  dumpBody(Statements, OS, 1);
}
