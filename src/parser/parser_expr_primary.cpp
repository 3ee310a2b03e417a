#include "parser/parser_internal.h"

/// numberexpr ::= number
std::unique_ptr<ExprAST> ParseNumberExpr() {
  SourceLocation Loc = CurLoc;
  auto Result = std::make_unique<IntegerLiteralExprAST>(IntegerVal);
  getNextToken(); // consume the number
  return withLocation(std::move(Result), Loc);
}

/// parenexpr ::= '(' expression ')'
std::unique_ptr<ExprAST> ParseParenExpr() {
  SourceLocation Loc = CurLoc;
  getNextToken(); // eat '('
  auto V = ParseExpression();
  if (!V)
    return nullptr;

  if (CurTok != ')')
    return LogError("expected ')'");
  getNextToken(); // eat ')'
  return withLocation(std::make_unique<ParenExprAST>(std::move(V)), Loc);
}

/// identifierexpr ::= qualifiedname
std::unique_ptr<ExprAST> ParseIdentifierExpr() {
  QualifiedNameRef Name;
  if (!ParseQualifiedName(Name))
    return nullptr;
  SourceLocation Loc = Name.Loc;
  return withLocation(std::make_unique<DeclRefExprAST>(std::move(Name)), Loc);
}

/// sizeofexpr ::= 'sizeof' '(' typename arraybounds ')'
///              | 'sizeof' unaryexpr
std::unique_ptr<ExprAST> ParseSizeofExpr() {
  SourceLocation Loc = CurLoc;
  getNextToken(); // eat 'sizeof'

  if (CurTok != '(') {
    auto Operand = ParseUnaryExpr();
    if (!Operand)
      return nullptr;
    return withLocation(std::make_unique<SizeofExprAST>(std::move(Operand)), Loc);
  }

  SourceLocation ParenLoc = CurLoc;
  getNextToken(); // eat '('

  QualType T;
  std::unique_ptr<ExprAST> Inner;
  if (IsTypeSpecifierStart()) {
    T = ParseTypeName();
    if (T.isNull())
      return nullptr;
  } else if (CurTok == tok_identifier || CurTok == tok_scope) {
    QualifiedNameRef Name;
    if (!ParseQualifiedName(Name))
      return nullptr;
    if (Actions.getTypeName(Name)) {
      T = ParseTypeFromName(Name, false);
      if (T.isNull())
        return nullptr;
      T = ParsePointerDeclarator(T);
      if (T.isNull())
        return nullptr;
    } else {
      auto Ref = withLocation(std::make_unique<DeclRefExprAST>(Name), Name.Loc);
      Inner = ParseExpressionStartingWith(std::move(Ref));
      if (!Inner)
        return nullptr;
    }
  } else {
    Inner = ParseExpression();
    if (!Inner)
      return nullptr;
  }

  if (!T.isNull() && !ParseArrayBounds(T))
    return nullptr;
  if (CurTok != ')')
    return LogError("expected ')' after sizeof operand");
  getNextToken(); // eat ')'

  if (!T.isNull())
    return withLocation(std::make_unique<SizeofExprAST>(T), Loc);
  auto Operand = withLocation(std::make_unique<ParenExprAST>(std::move(Inner)), ParenLoc);
  return withLocation(std::make_unique<SizeofExprAST>(std::move(Operand)), Loc);
}

/// primary
///   ::= identifierexpr
///   ::= numberexpr
///   ::= parenexpr
///   ::= 'true' | 'false' | 'nullptr' | 'this'
std::unique_ptr<ExprAST> ParsePrimary() {
  SourceLocation Loc = CurLoc;
  switch (CurTok) {
    case tok_identifier:
    case tok_scope:
      return ParseIdentifierExpr();
    case tok_number:
      return ParseNumberExpr();
    case '(':
      return ParseParenExpr();
    case tok_true:
    case tok_false: {
      auto Result = std::make_unique<BoolExprAST>(CurTok == tok_true);
      getNextToken(); // eat 'true' / 'false'
      return withLocation(std::move(Result), Loc);
    }
    case tok_nullptr:
      getNextToken(); // eat 'nullptr'
      return withLocation(std::make_unique<NullptrExprAST>(), Loc);
    case tok_this:
      getNextToken(); // eat 'this'
      return withLocation(std::make_unique<ThisExprAST>(), Loc);
    default:
      return LogError("expected expression");
  }
}
