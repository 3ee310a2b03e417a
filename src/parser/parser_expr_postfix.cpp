#include "parser/parser_internal.h"

/// callargs ::= '(' (expression (',' expression)*)? ')'
static bool ParseCallArguments(std::vector<std::unique_ptr<ExprAST>> &Args) {
  getNextToken(); // eat '('
  if (CurTok == ')') {
    getNextToken(); // eat ')'
    return true;
  }

  while (true) {
    auto Arg = ParseExpression();
    if (!Arg)
      return false;
    Args.push_back(std::move(Arg));

    if (CurTok == ')')
      break;
    if (CurTok != ',')
      return LogErrorD("expected ')' or ',' in argument list");
    getNextToken(); // eat ','
  }
  getNextToken(); // eat ')'
  return true;
}

/// postfix ::= primary ( callargs | '[' expression ']'
///                     | '.' identifier | '->' identifier )*
std::unique_ptr<ExprAST> ParsePostfixSuffixes(std::unique_ptr<ExprAST> LHS) {
  while (LHS) {
    SourceLocation Loc = LHS->getSourceLocation();

    if (CurTok == '(') {
      std::vector<std::unique_ptr<ExprAST>> Args;
      if (!ParseCallArguments(Args))
        return nullptr;
      LHS = withLocation(std::make_unique<CallExprAST>(std::move(LHS), std::move(Args)),
                         Loc);
      continue;
    }

    if (CurTok == '[') {
      getNextToken(); // eat '['
      auto Index = ParseExpression();
      if (!Index)
        return nullptr;
      if (CurTok != ']')
        return LogError("expected ']' after subscript");
      getNextToken(); // eat ']'
      LHS = withLocation(
          std::make_unique<ArrayIndexExprAST>(std::move(LHS), std::move(Index)), Loc);
      continue;
    }

    if (CurTok == '.' || CurTok == tok_arrow) {
      bool IsArrow = CurTok == tok_arrow;
      getNextToken(); // eat '.' / '->'
      if (CurTok != tok_identifier)
        return LogError("expected member name");
      std::string Member = IdentifierStr;
      SourceLocation MemberLoc = CurLoc;
      getNextToken(); // eat identifier
      LHS = withLocation(
          std::make_unique<MemberAccessExprAST>(std::move(LHS), std::move(Member),
                                                IsArrow),
          MemberLoc);
      continue;
    }

    break;
  }
  return LHS;
}

/// unary
///   ::= postfix
///   ::= ('-' | '!' | '&' | '*') unary
///   ::= sizeofexpr
std::unique_ptr<ExprAST> ParseUnaryExpr() {
  if (CurTok == tok_sizeof)
    return ParseSizeofExpr();

  if (CurTok == '-' || CurTok == '!' || CurTok == '&' || CurTok == '*') {
    std::string Op(1, static_cast<char>(CurTok));
    SourceLocation Loc = CurLoc;
    getNextToken(); // eat the operator
    auto Operand = ParseUnaryExpr();
    if (!Operand)
      return nullptr;
    return withLocation(std::make_unique<UnaryExprAST>(Op, std::move(Operand)), Loc);
  }

  return ParsePostfixSuffixes(ParsePrimary());
}
