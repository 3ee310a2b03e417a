#include "parser/parser_internal.h"

/// block ::= '{' statement* '}'
std::unique_ptr<BlockStmtAST> ParseBlock(bool NewScope) {
  SourceLocation Loc = CurLoc;
  if (CurTok != '{') {
    LogError("expected '{'");
    return nullptr;
  }
  getNextToken(); // eat '{'

  // A function body shares the scope that holds its parameters.
  std::unique_ptr<LocalScope> Scope;
  if (NewScope)
    Scope = std::make_unique<LocalScope>();

  std::vector<std::unique_ptr<StmtAST>> Statements;
  while (CurTok != '}' && CurTok != tok_eof) {
    auto Statement = ParseStatement();
    if (!Statement) {
      RecoverAfterDeclarationError();
      continue;
    }
    Statements.push_back(std::move(Statement));
  }

  if (CurTok != '}') {
    LogError("expected '}' at end of block");
    return nullptr;
  }
  getNextToken(); // eat '}'

  return withLocation(std::make_unique<BlockStmtAST>(std::move(Statements)), Loc);
}

/// returnstmt ::= 'return' expression? ';'
std::unique_ptr<ReturnStmtAST> ParseReturnStatement() {
  SourceLocation Loc = CurLoc;
  getNextToken(); // eat 'return'

  std::unique_ptr<ExprAST> ReturnValue;
  if (CurTok != ';') {
    ReturnValue = ParseExpression();
    if (!ReturnValue)
      return nullptr;
  }
  if (!ExpectToken(';', "after return statement"))
    return nullptr;

  Actions.checkReturnStmt(Loc, ReturnValue.get());
  return withLocation(std::make_unique<ReturnStmtAST>(std::move(ReturnValue)), Loc);
}

static std::unique_ptr<ExprAST> ParseParenCondition(const char *Keyword) {
  if (CurTok != '(')
    return LogError(std::string("expected '(' after '") + Keyword + "'");
  getNextToken(); // eat '('

  auto Cond = ParseExpression();
  if (!Cond)
    return nullptr;
  if (!ExpectToken(')', "after condition"))
    return nullptr;

  Actions.checkCondition(Cond.get());
  return Cond;
}

/// ifstmt ::= 'if' '(' expression ')' statement ('else' statement)?
std::unique_ptr<IfStmtAST> ParseIfStatement() {
  SourceLocation Loc = CurLoc;
  getNextToken(); // eat 'if'

  auto Cond = ParseParenCondition("if");
  if (!Cond)
    return nullptr;

  std::unique_ptr<StmtAST> Then;
  {
    LocalScope Scope;
    Then = ParseStatement();
  }
  if (!Then)
    return nullptr;

  std::unique_ptr<StmtAST> Else;
  if (CurTok == tok_else) {
    getNextToken(); // eat 'else'
    LocalScope Scope;
    Else = ParseStatement();
    if (!Else)
      return nullptr;
  }

  return withLocation(std::make_unique<IfStmtAST>(std::move(Cond), std::move(Then),
                                                  std::move(Else)),
                      Loc);
}

/// whilestmt ::= 'while' '(' expression ')' statement
std::unique_ptr<WhileStmtAST> ParseWhileStatement() {
  SourceLocation Loc = CurLoc;
  getNextToken(); // eat 'while'

  auto Cond = ParseParenCondition("while");
  if (!Cond)
    return nullptr;

  LocalScope Scope;
  auto Body = ParseStatement();
  if (!Body)
    return nullptr;

  return withLocation(std::make_unique<WhileStmtAST>(std::move(Cond), std::move(Body)),
                      Loc);
}

/// localdecl ::= declarator ('=' expression)? (',' declarator ('=' expression)?)* ';'
std::unique_ptr<DeclStmtAST> ParseLocalDeclaration(QualType Base, StorageClass SC) {
  SourceLocation Loc = CurLoc;
  std::vector<VarDecl *> Decls;

  while (true) {
    QualType T = ParsePointerDeclarator(Base);
    if (T.isNull())
      return nullptr;
    if (CurTok != tok_identifier) {
      LogError("expected identifier in declaration");
      return nullptr;
    }
    std::string Name = IdentifierStr;
    SourceLocation NameLoc = CurLoc;
    getNextToken(); // eat identifier

    if (CurTok == '(') {
      LogError("function declarations are not allowed in a block");
      return nullptr;
    }
    if (!ParseArrayBounds(T))
      return nullptr;

    std::unique_ptr<ExprAST> Init;
    if (CurTok == '=') {
      getNextToken(); // eat '='
      Init = ParseExpression();
      if (!Init)
        return nullptr;
    }

    if (VarDecl *VD = Actions.actOnVariable(NameLoc, Name, T, SC, std::move(Init)))
      Decls.push_back(VD);

    if (CurTok != ',')
      break;
    getNextToken(); // eat ','
  }

  if (!ExpectToken(';', "after declaration"))
    return nullptr;
  return withLocation(std::make_unique<DeclStmtAST>(std::move(Decls)), Loc);
}

static std::unique_ptr<StmtAST> FinishExpressionStatement(std::unique_ptr<ExprAST> E,
                                                          SourceLocation Loc) {
  if (!E)
    return nullptr;
  if (!ExpectToken(';', "after expression"))
    return nullptr;

  Actions.checkExpression(E.get());
  return withLocation(std::make_unique<ExpressionStmtAST>(std::move(E)), Loc);
}

/// statement ::= block | returnstmt | ifstmt | whilestmt | localdecl
///             | expression ';' | ';'
std::unique_ptr<StmtAST> ParseStatement() {
  SourceLocation Loc = CurLoc;

  switch (CurTok) {
    case '{':
      return ParseBlock();
    case tok_return:
      return ParseReturnStatement();
    case tok_if:
      return ParseIfStatement();
    case tok_while:
      return ParseWhileStatement();
    case ';':
      getNextToken(); // eat ';'
      return withLocation(
          std::make_unique<BlockStmtAST>(std::vector<std::unique_ptr<StmtAST>>()),
          Loc);
    case tok_static: {
      getNextToken(); // eat 'static'
      QualType T = ParseTypeSpecifier();
      if (T.isNull())
        return nullptr;
      return ParseLocalDeclaration(T, StorageClass::Static);
    }
    case tok_namespace:
    case tok_enum:
    case tok_typedef:
    case tok_using:
      return LogErrorS("local type and namespace declarations are not supported");
    case tok_identifier:
    case tok_scope: {
      // A name starts a declaration only if it names a type.
      QualifiedNameRef Name;
      if (!ParseQualifiedName(Name))
        return nullptr;
      if (Actions.getTypeName(Name)) {
        QualType T = ParseTypeFromName(Name, false);
        if (T.isNull())
          return nullptr;
        return ParseLocalDeclaration(T, StorageClass::None);
      }
      auto Ref = withLocation(std::make_unique<DeclRefExprAST>(Name), Name.Loc);
      return FinishExpressionStatement(ParseExpressionStartingWith(std::move(Ref)),
                                       Loc);
    }
    default:
      break;
  }

  if (IsTypeSpecifierStart()) {
    QualType T = ParseTypeSpecifier();
    if (T.isNull())
      return nullptr;
    return ParseLocalDeclaration(T, StorageClass::None);
  }
  return FinishExpressionStatement(ParseExpression(), Loc);
}
