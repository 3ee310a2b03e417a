#ifndef DECLCACHE_AST_EXPR_H
#define DECLCACHE_AST_EXPR_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "ast/type.h"
#include "compiler_session.h"

class ASTDumper;
class NamedDecl;
class ValueDecl;
class FunctionDecl;

/// QualifiedNameRef - A possibly qualified name as written: [::] a :: b :: c.
struct QualifiedNameRef {
  bool Global = false;
  std::vector<std::string> Qualifiers;
  std::string Name;
  SourceLocation Loc;

  bool isQualified() const { return Global || !Qualifiers.empty(); }
  std::string getAsString() const;
};

/// ExprAST - Base class for all expression nodes. Semantic analysis fills in
/// the type and value category after parsing.
class ExprAST {
protected:
  QualType Ty;
  bool LValue = false;
  SourceLocation Loc;

public:
  virtual ~ExprAST() = default;
  virtual void dump(ASTDumper &D) const = 0;

  QualType getType() const { return Ty; }
  void setType(QualType T) { Ty = T; }
  bool isLValue() const { return LValue; }
  void setLValue(bool V) { LValue = V; }

  SourceLocation getSourceLocation() const { return Loc; }
  void setSourceLocation(SourceLocation L) { Loc = L; }
};

/// IntegerLiteralExprAST - Expression class for integer literals like "42".
class IntegerLiteralExprAST : public ExprAST {
  uint64_t Value;

public:
  explicit IntegerLiteralExprAST(uint64_t Value) : Value(Value) {}

  void dump(ASTDumper &D) const override;
  uint64_t getValue() const { return Value; }
};

/// BoolExprAST - Expression class for boolean literals (true/false).
class BoolExprAST : public ExprAST {
  bool Value;

public:
  explicit BoolExprAST(bool Value) : Value(Value) {}

  void dump(ASTDumper &D) const override;
  bool getValue() const { return Value; }
};

/// NullptrExprAST - Expression class for nullptr.
class NullptrExprAST : public ExprAST {
public:
  void dump(ASTDumper &D) const override;
};

/// ThisExprAST - Expression class for 'this' inside member functions.
class ThisExprAST : public ExprAST {
public:
  void dump(ASTDumper &D) const override;
};

/// DeclRefExprAST - A reference to a named declaration. Function names may
/// stay overloaded until the enclosing call picks a candidate.
class DeclRefExprAST : public ExprAST {
  QualifiedNameRef Name;
  NamedDecl *Referenced = nullptr;
  std::vector<FunctionDecl *> Candidates;

public:
  explicit DeclRefExprAST(QualifiedNameRef Name) : Name(std::move(Name)) {}

  void dump(ASTDumper &D) const override;
  const QualifiedNameRef &getNameRef() const { return Name; }

  NamedDecl *getDecl() const { return Referenced; }
  void setDecl(NamedDecl *ND) { Referenced = ND; }
  const std::vector<FunctionDecl *> &getCandidates() const { return Candidates; }
  void setCandidates(std::vector<FunctionDecl *> C) { Candidates = std::move(C); }
};

/// MemberAccessExprAST - "obj.member" or "ptr->member".
class MemberAccessExprAST : public ExprAST {
  std::unique_ptr<ExprAST> Base;
  std::string MemberName;
  bool IsArrow;
  ValueDecl *Member = nullptr;
  std::vector<FunctionDecl *> Candidates;

public:
  MemberAccessExprAST(std::unique_ptr<ExprAST> Base, std::string MemberName,
                      bool IsArrow)
      : Base(std::move(Base)), MemberName(std::move(MemberName)),
        IsArrow(IsArrow) {}

  void dump(ASTDumper &D) const override;
  ExprAST *getBase() const { return Base.get(); }
  const std::string &getMemberName() const { return MemberName; }
  bool isArrow() const { return IsArrow; }

  ValueDecl *getMemberDecl() const { return Member; }
  void setMemberDecl(ValueDecl *VD) { Member = VD; }
  const std::vector<FunctionDecl *> &getCandidates() const { return Candidates; }
  void setCandidates(std::vector<FunctionDecl *> C) { Candidates = std::move(C); }
};

/// CallExprAST - Expression class for function and member function calls.
class CallExprAST : public ExprAST {
  std::unique_ptr<ExprAST> Callee;
  std::vector<std::unique_ptr<ExprAST>> Args;
  FunctionDecl *Target = nullptr;

public:
  CallExprAST(std::unique_ptr<ExprAST> Callee,
              std::vector<std::unique_ptr<ExprAST>> Args)
      : Callee(std::move(Callee)), Args(std::move(Args)) {}

  void dump(ASTDumper &D) const override;
  ExprAST *getCallee() const { return Callee.get(); }
  const std::vector<std::unique_ptr<ExprAST>> &getArgs() const { return Args; }

  FunctionDecl *getTarget() const { return Target; }
  void setTarget(FunctionDecl *FD) { Target = FD; }
};

/// ArrayIndexExprAST - Expression class for subscripts like "arr[i]".
class ArrayIndexExprAST : public ExprAST {
  std::unique_ptr<ExprAST> Array;
  std::unique_ptr<ExprAST> Index;

public:
  ArrayIndexExprAST(std::unique_ptr<ExprAST> Array, std::unique_ptr<ExprAST> Index)
      : Array(std::move(Array)), Index(std::move(Index)) {}

  void dump(ASTDumper &D) const override;
  ExprAST *getArray() const { return Array.get(); }
  ExprAST *getIndex() const { return Index.get(); }
};

/// UnaryExprAST - Prefix operators - ! & *.
class UnaryExprAST : public ExprAST {
  std::string Op;
  std::unique_ptr<ExprAST> Operand;

public:
  UnaryExprAST(std::string Op, std::unique_ptr<ExprAST> Operand)
      : Op(std::move(Op)), Operand(std::move(Operand)) {}

  void dump(ASTDumper &D) const override;
  const std::string &getOp() const { return Op; }
  ExprAST *getOperand() const { return Operand.get(); }
};

/// BinaryExprAST - Expression class for a binary operator, including '='.
class BinaryExprAST : public ExprAST {
  std::string Op;
  std::unique_ptr<ExprAST> LHS, RHS;

public:
  BinaryExprAST(std::string Op, std::unique_ptr<ExprAST> LHS,
                std::unique_ptr<ExprAST> RHS)
      : Op(std::move(Op)), LHS(std::move(LHS)), RHS(std::move(RHS)) {}

  void dump(ASTDumper &D) const override;
  const std::string &getOp() const { return Op; }
  ExprAST *getLHS() const { return LHS.get(); }
  ExprAST *getRHS() const { return RHS.get(); }
};

/// SizeofExprAST - sizeof(type) or sizeof expr.
class SizeofExprAST : public ExprAST {
  QualType ArgType;
  std::unique_ptr<ExprAST> ArgExpr;
  uint64_t Value = 0;

public:
  explicit SizeofExprAST(QualType T) : ArgType(T) {}
  explicit SizeofExprAST(std::unique_ptr<ExprAST> E) : ArgExpr(std::move(E)) {}

  void dump(ASTDumper &D) const override;
  bool isArgumentType() const { return ArgExpr == nullptr; }
  QualType getArgumentType() const { return ArgType; }
  ExprAST *getArgumentExpr() const { return ArgExpr.get(); }

  uint64_t getValue() const { return Value; }
  void setValue(uint64_t V) { Value = V; }
};

/// ParenExprAST - A parenthesized expression.
class ParenExprAST : public ExprAST {
  std::unique_ptr<ExprAST> SubExpr;

public:
  explicit ParenExprAST(std::unique_ptr<ExprAST> SubExpr)
      : SubExpr(std::move(SubExpr)) {}

  void dump(ASTDumper &D) const override;
  ExprAST *getSubExpr() const { return SubExpr.get(); }
};

#endif // DECLCACHE_AST_EXPR_H
