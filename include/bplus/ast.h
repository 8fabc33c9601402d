#ifndef BPLUS_AST_H
#define BPLUS_AST_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace bplus {

class CodegenContext;

//===----------------------------------------------------------------------===//
// Abstract Syntax Tree (aka Parse Tree)
//===----------------------------------------------------------------------===//
// Nodes are built once by the parser and never modified. Children are owned by
// their parent. Both hierarchies are closed and carry a kind so that they can
// be inspected with llvm::isa / llvm::dyn_cast.

/// ExprAST - Base class for all expression nodes.
class ExprAST {
public:
  enum ExprKind { EK_Number, EK_Variable, EK_Unary, EK_Binary };

  ExprAST(ExprKind Kind, unsigned Line) : Kind(Kind), Line(Line) {}
  virtual ~ExprAST() = default;

  ExprKind getKind() const { return Kind; }
  unsigned getLine() const { return Line; }

  /// codegen - Return the C text of this expression.
  virtual std::string codegen(CodegenContext &Ctx) const = 0;
  virtual void dump(llvm::raw_ostream &OS, unsigned Indent = 0) const = 0;

private:
  const ExprKind Kind;
  unsigned Line;
};

/// NumberExprAST - Expression class for integer literals like "42".
class NumberExprAST : public ExprAST {
  std::string Symbol;

public:
  NumberExprAST(std::string Symbol, unsigned Line)
      : ExprAST(EK_Number, Line), Symbol(std::move(Symbol)) {}

  llvm::StringRef getSymbol() const { return Symbol; }
  std::string codegen(CodegenContext &Ctx) const override;
  void dump(llvm::raw_ostream &OS, unsigned Indent = 0) const override;

  static bool classof(const ExprAST *E) { return E->getKind() == EK_Number; }
};

/// VariableExprAST - Expression class for referencing a variable, like "a".
class VariableExprAST : public ExprAST {
  std::string Symbol;

public:
  VariableExprAST(std::string Symbol, unsigned Line)
      : ExprAST(EK_Variable, Line), Symbol(std::move(Symbol)) {}

  llvm::StringRef getSymbol() const { return Symbol; }
  std::string codegen(CodegenContext &Ctx) const override;
  void dump(llvm::raw_ostream &OS, unsigned Indent = 0) const override;

  static bool classof(const ExprAST *E) { return E->getKind() == EK_Variable; }
};

/// UnaryExprAST - Expression class for a prefix operator.
class UnaryExprAST : public ExprAST {
  std::string Opcode;
  std::unique_ptr<ExprAST> Operand;

public:
  UnaryExprAST(std::string Opcode, std::unique_ptr<ExprAST> Operand,
               unsigned Line)
      : ExprAST(EK_Unary, Line), Opcode(std::move(Opcode)),
        Operand(std::move(Operand)) {}

  llvm::StringRef getOpcode() const { return Opcode; }
  const ExprAST &getOperand() const { return *Operand; }
  std::string codegen(CodegenContext &Ctx) const override;
  void dump(llvm::raw_ostream &OS, unsigned Indent = 0) const override;

  static bool classof(const ExprAST *E) { return E->getKind() == EK_Unary; }
};

/// BinaryExprAST - Expression class for a binary operator.
class BinaryExprAST : public ExprAST {
  std::string Op;
  std::unique_ptr<ExprAST> LHS, RHS;

public:
  BinaryExprAST(std::string Op, std::unique_ptr<ExprAST> LHS,
                std::unique_ptr<ExprAST> RHS, unsigned Line)
      : ExprAST(EK_Binary, Line), Op(std::move(Op)), LHS(std::move(LHS)),
        RHS(std::move(RHS)) {}

  llvm::StringRef getOp() const { return Op; }
  const ExprAST &getLHS() const { return *LHS; }
  const ExprAST &getRHS() const { return *RHS; }
  std::string codegen(CodegenContext &Ctx) const override;
  void dump(llvm::raw_ostream &OS, unsigned Indent = 0) const override;

  static bool classof(const ExprAST *E) { return E->getKind() == EK_Binary; }
};

/// StmtAST - Base class for all statement nodes.
class StmtAST {
public:
  enum StmtKind {
    SK_Assignment,
    SK_Label,
    SK_Goto,
    SK_Conditional,
    SK_For,
    SK_While,
    SK_Print,
    SK_Read
  };

  StmtAST(StmtKind Kind, unsigned Line) : Kind(Kind), Line(Line) {}
  virtual ~StmtAST() = default;

  StmtKind getKind() const { return Kind; }
  unsigned getLine() const { return Line; }

  /// codegen - Append the C lines of this statement to the context.
  virtual void codegen(CodegenContext &Ctx) const = 0;
  virtual void dump(llvm::raw_ostream &OS, unsigned Indent = 0) const = 0;

private:
  const StmtKind Kind;
  unsigned Line;
};

using StmtList = std::vector<std::unique_ptr<StmtAST>>;

/// AssignmentAST - "let x = expr" or "x = expr".
class AssignmentAST : public StmtAST {
  std::string Name;
  std::unique_ptr<ExprAST> RHS;

public:
  AssignmentAST(std::string Name, std::unique_ptr<ExprAST> RHS, unsigned Line)
      : StmtAST(SK_Assignment, Line), Name(std::move(Name)),
        RHS(std::move(RHS)) {}

  llvm::StringRef getName() const { return Name; }
  const ExprAST &getRHS() const { return *RHS; }
  void codegen(CodegenContext &Ctx) const override;
  void dump(llvm::raw_ostream &OS, unsigned Indent = 0) const override;

  static bool classof(const StmtAST *S) { return S->getKind() == SK_Assignment; }
};

/// LabelAST - "name:".
class LabelAST : public StmtAST {
  std::string Name;

public:
  LabelAST(std::string Name, unsigned Line)
      : StmtAST(SK_Label, Line), Name(std::move(Name)) {}

  llvm::StringRef getName() const { return Name; }
  void codegen(CodegenContext &Ctx) const override;
  void dump(llvm::raw_ostream &OS, unsigned Indent = 0) const override;

  static bool classof(const StmtAST *S) { return S->getKind() == SK_Label; }
};

/// GotoAST - "goto name".
class GotoAST : public StmtAST {
  std::string Name;

public:
  GotoAST(std::string Name, unsigned Line)
      : StmtAST(SK_Goto, Line), Name(std::move(Name)) {}

  llvm::StringRef getName() const { return Name; }
  void codegen(CodegenContext &Ctx) const override;
  void dump(llvm::raw_ostream &OS, unsigned Indent = 0) const override;

  static bool classof(const StmtAST *S) { return S->getKind() == SK_Goto; }
};

/// ConditionalAST - An if / else if / else chain. Conditions and bodies are
/// parallel; a trailing "else" is stored with the condition "1".
class ConditionalAST : public StmtAST {
  std::vector<std::unique_ptr<ExprAST>> Conditions;
  std::vector<StmtList> Bodies;

public:
  ConditionalAST(std::vector<std::unique_ptr<ExprAST>> Conditions,
                 std::vector<StmtList> Bodies, unsigned Line)
      : StmtAST(SK_Conditional, Line), Conditions(std::move(Conditions)),
        Bodies(std::move(Bodies)) {}

  size_t getNumBranches() const { return Conditions.size(); }
  const ExprAST &getCondition(size_t I) const { return *Conditions[I]; }
  const StmtList &getBody(size_t I) const { return Bodies[I]; }
  void codegen(CodegenContext &Ctx) const override;
  void dump(llvm::raw_ostream &OS, unsigned Indent = 0) const override;

  static bool classof(const StmtAST *S) { return S->getKind() == SK_Conditional; }
};

/// ForAST - "for i = start..end { body }", counting up, end excluded.
class ForAST : public StmtAST {
  std::string Name;
  std::unique_ptr<ExprAST> Start, End;
  StmtList Body;

public:
  ForAST(std::string Name, std::unique_ptr<ExprAST> Start,
         std::unique_ptr<ExprAST> End, StmtList Body, unsigned Line)
      : StmtAST(SK_For, Line), Name(std::move(Name)), Start(std::move(Start)),
        End(std::move(End)), Body(std::move(Body)) {}

  llvm::StringRef getName() const { return Name; }
  const ExprAST &getStart() const { return *Start; }
  const ExprAST &getEnd() const { return *End; }
  const StmtList &getBody() const { return Body; }
  void codegen(CodegenContext &Ctx) const override;
  void dump(llvm::raw_ostream &OS, unsigned Indent = 0) const override;

  static bool classof(const StmtAST *S) { return S->getKind() == SK_For; }
};

/// WhileAST - "while cond { body }".
class WhileAST : public StmtAST {
  std::unique_ptr<ExprAST> Condition;
  StmtList Body;

public:
  WhileAST(std::unique_ptr<ExprAST> Condition, StmtList Body, unsigned Line)
      : StmtAST(SK_While, Line), Condition(std::move(Condition)),
        Body(std::move(Body)) {}

  const ExprAST &getCondition() const { return *Condition; }
  const StmtList &getBody() const { return Body; }
  void codegen(CodegenContext &Ctx) const override;
  void dump(llvm::raw_ostream &OS, unsigned Indent = 0) const override;

  static bool classof(const StmtAST *S) { return S->getKind() == SK_While; }
};

/// PrintAST - "print expr".
class PrintAST : public StmtAST {
  std::unique_ptr<ExprAST> Child;

public:
  PrintAST(std::unique_ptr<ExprAST> Child, unsigned Line)
      : StmtAST(SK_Print, Line), Child(std::move(Child)) {}

  const ExprAST &getChild() const { return *Child; }
  void codegen(CodegenContext &Ctx) const override;
  void dump(llvm::raw_ostream &OS, unsigned Indent = 0) const override;

  static bool classof(const StmtAST *S) { return S->getKind() == SK_Print; }
};

/// ReadAST - "read".
class ReadAST : public StmtAST {
public:
  explicit ReadAST(unsigned Line) : StmtAST(SK_Read, Line) {}

  void codegen(CodegenContext &Ctx) const override;
  void dump(llvm::raw_ostream &OS, unsigned Indent = 0) const override;

  static bool classof(const StmtAST *S) { return S->getKind() == SK_Read; }
};

/// ProgramAST - The root: every top-level statement in source order.
class ProgramAST {
  StmtList Statements;

public:
  explicit ProgramAST(StmtList Statements)
      : Statements(std::move(Statements)) {}

  const StmtList &getStatements() const { return Statements; }
  void codegen(CodegenContext &Ctx) const;
  void dump(llvm::raw_ostream &OS) const;
};

} // end namespace bplus

#endif // BPLUS_AST_H
