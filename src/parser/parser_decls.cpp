#include "parser/parser_internal.h"

static bool ParseDeclarationInContext(AccessSpecifier Access, bool InRecord) {
  switch (CurTok) {
    case ';':
      getNextToken(); // eat stray ';'
      return true;
    case tok_namespace:
      if (InRecord)
        return LogErrorD("namespaces can only be defined in global or "
                         "namespace scope");
      return ParseNamespaceDefinition();
    case tok_struct:
    case tok_class:
      return ParseRecordDeclaration(Access);
    case tok_enum:
      return ParseEnumDeclaration(Access);
    case tok_typedef:
      return ParseTypedefDeclaration();
    case tok_using:
      return ParseAliasDeclaration();
    default:
      return ParseSimpleDeclaration(Access);
  }
}

/// externaldecl ::= namespacedef | recorddecl | enumdecl | typedefdecl
///                | aliasdecl | simpledecl | ';'
bool ParseExternalDeclaration() {
  return ParseDeclarationInContext(AccessSpecifier::None, false);
}

bool ParseMemberDeclaration(AccessSpecifier Access) {
  return ParseDeclarationInContext(Access, true);
}

/// namespacedef ::= 'namespace' identifier '{' externaldecl* '}'
bool ParseNamespaceDefinition() {
  getNextToken(); // eat 'namespace'

  if (CurTok != tok_identifier)
    return LogErrorD("expected namespace name",
                     "Anonymous namespaces are not supported.");
  std::string Name = IdentifierStr;
  SourceLocation Loc = CurLoc;
  getNextToken(); // eat identifier

  if (!ExpectToken('{', "after namespace name"))
    return false;

  Actions.actOnStartNamespace(Loc, Name);
  while (CurTok != '}' && CurTok != tok_eof) {
    if (!ParseExternalDeclaration())
      RecoverAfterDeclarationError();
  }
  Actions.actOnFinishNamespace();

  if (CurTok != '}')
    return LogErrorD("expected '}' at end of namespace '" + Name + "'");
  getNextToken(); // eat '}'
  return true;
}

/// baseclause ::= ':' basespecifier (',' basespecifier)*
/// basespecifier ::= accessspecifier? qualifiedname
static bool ParseBaseClause(RecordDecl *RD) {
  getNextToken(); // eat ':'
  do {
    AccessSpecifier Access = AccessSpecifier::None;
    if (IsAccessSpecifierToken(CurTok)) {
      Access = GetAccessSpecifier(CurTok);
      getNextToken(); // eat access specifier
    }

    QualifiedNameRef BaseName;
    if (!ParseQualifiedName(BaseName))
      return false;
    QualType BaseType = ParseTypeFromName(BaseName, false);
    if (!BaseType.isNull())
      Actions.actOnBaseSpecifier(RD, BaseName.Loc, BaseType, Access);
  } while (CurTok == ',' && getNextToken());
  return true;
}

/// recorddef ::= baseclause? '{' (accessspecifier ':' | memberdecl)* '}' ';'
static bool ParseRecordDefinition(TagKind Tag, const QualifiedNameRef &Name,
                                  AccessSpecifier Access) {
  RecordDecl *RD = Actions.actOnStartRecordDefinition(Name.Loc, Tag, Name.Name);
  if (Access != AccessSpecifier::None)
    RD->setAccess(Access);

  bool Valid = true;
  if (CurTok == ':')
    Valid = ParseBaseClause(RD);
  if (Valid && CurTok != '{')
    Valid = LogErrorD("expected '{' after class head");
  if (!Valid) {
    Actions.actOnFinishRecordDefinition(RD);
    return false;
  }
  getNextToken(); // eat '{'

  AccessSpecifier Current = RD->getDefaultAccess();
  while (CurTok != '}' && CurTok != tok_eof) {
    if (IsAccessSpecifierToken(CurTok)) {
      Current = GetAccessSpecifier(CurTok);
      getNextToken(); // eat access specifier
      if (!ExpectToken(':', "after access specifier"))
        RecoverAfterDeclarationError();
      continue;
    }
    if (!ParseMemberDeclaration(Current))
      RecoverAfterDeclarationError();
  }
  Actions.actOnFinishRecordDefinition(RD);

  if (CurTok != '}')
    return LogErrorD("expected '}' at end of definition of '" + Name.Name + "'");
  getNextToken(); // eat '}'
  return ExpectToken(';', "after class");
}

/// recorddecl ::= ('struct' | 'class') identifier ';'
///              | ('struct' | 'class') identifier recorddef
///              | ('struct' | 'class') qualifiedname 'const'? declarator...
bool ParseRecordDeclaration(AccessSpecifier Access) {
  TagKind Tag = CurTok == tok_class ? TagKind::Class : TagKind::Struct;
  getNextToken(); // eat 'struct' / 'class'

  QualifiedNameRef Name;
  if (!ParseQualifiedName(Name))
    return false;

  if (!Name.isQualified()) {
    if (CurTok == ';') {
      getNextToken(); // eat ';'
      RecordDecl *RD = Actions.actOnTagDeclaration(Name.Loc, Tag, Name.Name);
      if (RD && Access != AccessSpecifier::None && !RD->hasDefinition())
        RD->setAccess(Access);
      return true;
    }
    if (CurTok == '{' || CurTok == ':')
      return ParseRecordDefinition(Tag, Name, Access);
  }

  // An elaborated type specifier starting a variable, field or function.
  RecordDecl *RD = Actions.actOnElaboratedTypeName(Name.Loc, Tag, Name);
  if (!RD)
    return false;
  QualType T = Actions.getASTContext().getRecordType(RD);
  if (CurTok == tok_const) {
    getNextToken(); // eat 'const'
    T = T.withConst();
  }
  return ParseDeclarationWithType(T, StorageClass::None, false, Access);
}

/// enumdecl ::= 'enum' ('class' | 'struct')? identifier? (':' typename)?
///              '{' (enumerator (',' enumerator)* ','?)? '}' ';'
/// enumerator ::= identifier ('=' expression)?
bool ParseEnumDeclaration(AccessSpecifier Access) {
  SourceLocation Loc = CurLoc;
  getNextToken(); // eat 'enum'

  bool Scoped = false;
  if (CurTok == tok_class || CurTok == tok_struct) {
    Scoped = true;
    getNextToken(); // eat 'class' / 'struct'
  }

  std::string Name;
  if (CurTok == tok_identifier) {
    Name = IdentifierStr;
    Loc = CurLoc;
    getNextToken(); // eat identifier
  } else if (Scoped) {
    return LogErrorD("scoped enumeration requires a name");
  }

  QualType Underlying;
  if (CurTok == ':') {
    getNextToken(); // eat ':'
    Underlying = ParseTypeSpecifier();
    if (Underlying.isNull())
      return false;
  }

  if (CurTok != '{')
    return LogErrorD("expected '{' in enum declaration",
                     "Opaque enum declarations are not supported.");
  getNextToken(); // eat '{'

  EnumDecl *ED = Actions.actOnStartEnum(Loc, Name, Scoped, Underlying);
  if (Access != AccessSpecifier::None)
    ED->setAccess(Access);

  while (CurTok != '}') {
    if (CurTok != tok_identifier) {
      Actions.actOnFinishEnum(ED);
      return LogErrorD("expected identifier in enumerator list");
    }
    std::string ConstName = IdentifierStr;
    SourceLocation ConstLoc = CurLoc;
    getNextToken(); // eat identifier

    std::unique_ptr<ExprAST> Init;
    if (CurTok == '=') {
      getNextToken(); // eat '='
      Init = ParseExpression();
      if (!Init) {
        Actions.actOnFinishEnum(ED);
        return false;
      }
    }
    Actions.actOnEnumConstant(ED, ConstLoc, ConstName, std::move(Init));

    if (CurTok == ',') {
      getNextToken(); // eat ','
      continue;
    }
    if (CurTok != '}') {
      Actions.actOnFinishEnum(ED);
      return LogErrorD("expected '}' or ',' in enumerator list");
    }
  }
  getNextToken(); // eat '}'
  Actions.actOnFinishEnum(ED);
  return ExpectToken(';', "after enum");
}

/// typedefdecl ::= 'typedef' typespecifier declarator (',' declarator)* ';'
/// declarator ::= pointerdeclarator identifier arraybounds
bool ParseTypedefDeclaration() {
  getNextToken(); // eat 'typedef'

  QualType Base = ParseTypeSpecifier();
  if (Base.isNull())
    return false;

  do {
    QualType T = ParsePointerDeclarator(Base);
    if (T.isNull())
      return false;
    if (CurTok != tok_identifier)
      return LogErrorD("expected identifier in typedef");
    std::string Name = IdentifierStr;
    SourceLocation Loc = CurLoc;
    getNextToken(); // eat identifier
    if (!ParseArrayBounds(T))
      return false;
    Actions.actOnTypedef(Loc, Name, T, /*IsAlias=*/false);
  } while (CurTok == ',' && getNextToken());

  return ExpectToken(';', "after typedef");
}

/// aliasdecl ::= 'using' identifier '=' typename ';'
bool ParseAliasDeclaration() {
  getNextToken(); // eat 'using'

  if (CurTok == tok_namespace)
    return LogErrorD("using directives are not supported");
  if (CurTok != tok_identifier)
    return LogErrorD("expected identifier after 'using'");
  std::string Name = IdentifierStr;
  SourceLocation Loc = CurLoc;
  getNextToken(); // eat identifier

  if (!ExpectToken('=', "in alias declaration"))
    return false;
  QualType T = ParseTypeName();
  if (T.isNull())
    return false;
  if (!ParseArrayBounds(T))
    return false;

  Actions.actOnTypedef(Loc, Name, T, /*IsAlias=*/true);
  return ExpectToken(';', "after alias declaration");
}

/// simpledecl ::= declspecifier* typespecifier declarator (',' declarator)* ';'
///              | declspecifier* typespecifier functiondecl
/// declspecifier ::= 'static' | 'extern' | 'inline'
bool ParseSimpleDeclaration(AccessSpecifier Access) {
  StorageClass SC = StorageClass::None;
  bool IsInline = false;
  while (CurTok == tok_static || CurTok == tok_extern || CurTok == tok_inline) {
    if (CurTok == tok_inline) {
      IsInline = true;
    } else {
      StorageClass Next =
          CurTok == tok_static ? StorageClass::Static : StorageClass::Extern;
      if (SC != StorageClass::None && SC != Next)
        return LogErrorD("cannot combine with previous storage class specifier");
      SC = Next;
    }
    getNextToken(); // eat specifier
  }

  if (!IsTypeSpecifierStart() && CurTok != tok_identifier && CurTok != tok_scope)
    return LogErrorD("expected declaration");

  QualType Base = ParseTypeSpecifier();
  if (Base.isNull())
    return false;
  return ParseDeclarationWithType(Base, SC, IsInline, Access);
}

/// paramdecl ::= typename identifier? arraybounds
static bool ParseParameterList(std::vector<analysis::ParamInfo> &Params) {
  getNextToken(); // eat '('
  if (CurTok == ')') {
    getNextToken(); // eat ')'
    return true;
  }

  do {
    analysis::ParamInfo Param;
    Param.Loc = CurLoc;
    Param.Type = ParseTypeName();
    if (Param.Type.isNull())
      return false;

    // 'f(void)' declares no parameters.
    if (Params.empty() && CurTok == ')' && Param.Type->isVoidType() &&
        !Param.Type.isConstQualified())
      break;

    if (CurTok == tok_identifier) {
      Param.Name = IdentifierStr;
      Param.Loc = CurLoc;
      getNextToken(); // eat identifier
    }
    if (!ParseArrayBounds(Param.Type))
      return false;
    // Array parameters are adjusted to pointers.
    if (const auto *AT = llvm::dyn_cast<ConstantArrayType>(
            Param.Type.getCanonicalType().getTypePtr()))
      Param.Type = Actions.getASTContext().getPointerType(AT->getElementType());
    Params.push_back(std::move(Param));
  } while (CurTok == ',' && getNextToken());

  return ExpectToken(')', "after parameter list");
}

/// functiondecl ::= '(' paramlist ')' 'const'? (';' | block)
static bool ParseFunctionDeclaration(QualType ReturnType, const std::string &Name,
                                     SourceLocation NameLoc, StorageClass SC,
                                     bool IsInline, AccessSpecifier Access) {
  std::vector<analysis::ParamInfo> Params;
  if (!ParseParameterList(Params))
    return false;

  bool IsConst = false;
  if (CurTok == tok_const) {
    IsConst = true;
    getNextToken(); // eat 'const'
  }

  FunctionDecl *FD = Actions.actOnFunctionDeclarator(
      NameLoc, Name, ReturnType, Params, SC, IsInline, IsConst, Access);

  if (CurTok == ';') {
    getNextToken(); // eat ';'
    return true;
  }
  if (CurTok != '{')
    return LogErrorD("expected ';' or function body after function declarator");

  if (!FD) {
    // Already diagnosed; skip the body.
    RecoverAfterDeclarationError();
    return true;
  }

  FunctionDecl *Definition = Actions.actOnStartFunctionBody(NameLoc, FD, Params);
  auto Body = ParseBlock(/*NewScope=*/false);
  const bool Parsed = Body != nullptr;
  Actions.actOnFinishFunctionBody(Definition, std::move(Body));
  return Parsed;
}

/// ParseDeclarationWithType - Parse the declarators following a type at
/// namespace or class scope.
bool ParseDeclarationWithType(QualType Base, StorageClass SC, bool IsInline,
                              AccessSpecifier Access) {
  const bool InRecord = Actions.getCurContext()->isRecord();
  if (CurTok == ';')
    return LogErrorD("declaration does not declare anything");

  while (true) {
    QualType T = ParsePointerDeclarator(Base);
    if (T.isNull())
      return false;
    if (CurTok != tok_identifier)
      return LogErrorD("expected identifier in declaration");
    std::string Name = IdentifierStr;
    SourceLocation NameLoc = CurLoc;
    getNextToken(); // eat identifier

    if (CurTok == tok_scope)
      return LogErrorD("out-of-line member definitions are not supported",
                       "Define the member function inside its class.");
    if (CurTok == '(')
      return ParseFunctionDeclaration(T, Name, NameLoc, SC, IsInline, Access);

    if (IsInline)
      return LogErrorD("'inline' can only appear on functions");
    if (!ParseArrayBounds(T))
      return false;

    std::unique_ptr<ExprAST> Init;
    if (CurTok == '=') {
      getNextToken(); // eat '='
      Init = ParseExpression();
      if (!Init)
        return false;
    }

    if (InRecord && SC == StorageClass::None) {
      if (Init)
        reportCompilerErrorAt(NameLoc, "default member initializers are not "
                                       "supported");
      Actions.actOnField(NameLoc, Name, T, Access);
    } else {
      Actions.actOnVariable(NameLoc, Name, T, SC, std::move(Init));
    }

    if (CurTok != ',')
      break;
    getNextToken(); // eat ','
  }

  return ExpectToken(';', "after declaration");
}
