#ifndef DECLCACHE_AST_STMT_H
#define DECLCACHE_AST_STMT_H

#include <memory>
#include <vector>

#include "ast/expr.h"

class VarDecl;

/// StmtAST - Base class for all statement nodes.
class StmtAST {
  SourceLocation Loc;

public:
  virtual ~StmtAST() = default;
  virtual void dump(ASTDumper &D) const = 0;

  SourceLocation getSourceLocation() const { return Loc; }
  void setSourceLocation(SourceLocation L) { Loc = L; }
};

/// BlockStmtAST - Statement class for statement blocks.
class BlockStmtAST : public StmtAST {
  std::vector<std::unique_ptr<StmtAST>> Statements;

public:
  explicit BlockStmtAST(std::vector<std::unique_ptr<StmtAST>> Statements)
      : Statements(std::move(Statements)) {}

  void dump(ASTDumper &D) const override;
  const std::vector<std::unique_ptr<StmtAST>> &getStatements() const {
    return Statements;
  }
};

/// DeclStmtAST - Local variable declarations.
class DeclStmtAST : public StmtAST {
  std::vector<VarDecl *> Decls;

public:
  explicit DeclStmtAST(std::vector<VarDecl *> Decls) : Decls(std::move(Decls)) {}

  void dump(ASTDumper &D) const override;
  const std::vector<VarDecl *> &getDecls() const { return Decls; }
};

/// ReturnStmtAST - Statement class for return statements.
class ReturnStmtAST : public StmtAST {
  std::unique_ptr<ExprAST> ReturnValue;

public:
  explicit ReturnStmtAST(std::unique_ptr<ExprAST> ReturnValue)
      : ReturnValue(std::move(ReturnValue)) {}

  void dump(ASTDumper &D) const override;
  ExprAST *getReturnValue() const { return ReturnValue.get(); }
};

/// ExpressionStmtAST - An expression evaluated for its effects.
class ExpressionStmtAST : public StmtAST {
  std::unique_ptr<ExprAST> Expression;

public:
  explicit ExpressionStmtAST(std::unique_ptr<ExprAST> Expression)
      : Expression(std::move(Expression)) {}

  void dump(ASTDumper &D) const override;
  ExprAST *getExpression() const { return Expression.get(); }
};

/// IfStmtAST - Statement class for if/else.
class IfStmtAST : public StmtAST {
  std::unique_ptr<ExprAST> Condition;
  std::unique_ptr<StmtAST> ThenBranch;
  std::unique_ptr<StmtAST> ElseBranch;

public:
  IfStmtAST(std::unique_ptr<ExprAST> Condition, std::unique_ptr<StmtAST> ThenBranch,
            std::unique_ptr<StmtAST> ElseBranch)
      : Condition(std::move(Condition)), ThenBranch(std::move(ThenBranch)),
        ElseBranch(std::move(ElseBranch)) {}

  void dump(ASTDumper &D) const override;
  ExprAST *getCondition() const { return Condition.get(); }
  StmtAST *getThenBranch() const { return ThenBranch.get(); }
  StmtAST *getElseBranch() const { return ElseBranch.get(); }
};

/// WhileStmtAST - Statement class for while loops.
class WhileStmtAST : public StmtAST {
  std::unique_ptr<ExprAST> Condition;
  std::unique_ptr<StmtAST> Body;

public:
  WhileStmtAST(std::unique_ptr<ExprAST> Condition, std::unique_ptr<StmtAST> Body)
      : Condition(std::move(Condition)), Body(std::move(Body)) {}

  void dump(ASTDumper &D) const override;
  ExprAST *getCondition() const { return Condition.get(); }
  StmtAST *getBody() const { return Body.get(); }
};

#endif // DECLCACHE_AST_STMT_H
