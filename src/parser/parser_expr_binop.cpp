#include "parser/parser_internal.h"

/// binoprhs
///   ::= (binop unary)*
std::unique_ptr<ExprAST> ParseBinOpRHS(int ExprPrec, std::unique_ptr<ExprAST> LHS) {
  // If this is a binop, find its precedence.
  while (true) {
    int TokPrec = GetTokPrecedence();

    // If this is a binop that binds at least as tightly as the current binop,
    // consume it, otherwise we are done.
    if (TokPrec < ExprPrec)
      return LHS;

    std::string Op = GetBinaryOperatorSpelling(CurTok);
    SourceLocation OpLoc = CurLoc;
    getNextToken(); // eat binop

    // Parse the unary expression after the binary operator.
    auto RHS = ParseUnaryExpr();
    if (!RHS)
      return nullptr;

    // Assignment is right-associative; everything else groups to the left
    // unless the next operator binds more tightly.
    int NextPrec = GetTokPrecedence();
    if (Op == "=") {
      RHS = ParseBinOpRHS(TokPrec, std::move(RHS));
    } else if (TokPrec < NextPrec) {
      RHS = ParseBinOpRHS(TokPrec + 1, std::move(RHS));
    }
    if (!RHS)
      return nullptr;

    LHS = withLocation(
        std::make_unique<BinaryExprAST>(Op, std::move(LHS), std::move(RHS)), OpLoc);
  }
}

/// expression
///   ::= unary binoprhs
std::unique_ptr<ExprAST> ParseExpression() {
  auto LHS = ParseUnaryExpr();
  if (!LHS)
    return nullptr;
  return ParseBinOpRHS(0, std::move(LHS));
}

std::unique_ptr<ExprAST> ParseExpressionStartingWith(std::unique_ptr<ExprAST> LHS) {
  LHS = ParsePostfixSuffixes(std::move(LHS));
  if (!LHS)
    return nullptr;
  return ParseBinOpRHS(0, std::move(LHS));
}
