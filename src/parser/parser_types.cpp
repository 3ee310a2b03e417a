#include "parser/parser_internal.h"

namespace {

struct BuiltinSpecifiers {
  unsigned Void = 0, Bool = 0, Char = 0, Short = 0, Int = 0, Long = 0;
  unsigned Signed = 0, Unsigned = 0, Float = 0, Double = 0;

  unsigned count() const {
    return Void + Bool + Char + Short + Int + Long + Signed + Unsigned + Float +
           Double;
  }
};

/// Map a set of builtin keywords to one builtin type. Returns false for
/// combinations such as 'unsigned double' or 'short long'.
bool resolveBuiltinKind(const BuiltinSpecifiers &S, BuiltinKind &Kind) {
  if (S.Signed && S.Unsigned)
    return false;
  const bool IsUnsigned = S.Unsigned != 0;
  const bool HasSign = S.Signed || S.Unsigned;

  if (S.Void || S.Bool || S.Float) {
    if (S.count() != 1)
      return false;
    Kind = S.Void ? BuiltinKind::Void
                  : S.Bool ? BuiltinKind::Bool : BuiltinKind::Float;
    return true;
  }
  if (S.Double) {
    if (S.count() != 1)
      return false;
    Kind = BuiltinKind::Double;
    return true;
  }
  if (S.Char) {
    if (S.Char > 1 || S.Short || S.Int || S.Long)
      return false;
    Kind = !HasSign ? BuiltinKind::Char
                    : IsUnsigned ? BuiltinKind::UChar : BuiltinKind::SChar;
    return true;
  }
  if (S.Int > 1 || S.Short > 1 || S.Long > 2 || (S.Short && S.Long))
    return false;
  if (S.Short)
    Kind = IsUnsigned ? BuiltinKind::UShort : BuiltinKind::Short;
  else if (S.Long == 2)
    Kind = IsUnsigned ? BuiltinKind::ULongLong : BuiltinKind::LongLong;
  else if (S.Long == 1)
    Kind = IsUnsigned ? BuiltinKind::ULong : BuiltinKind::Long;
  else
    Kind = IsUnsigned ? BuiltinKind::UInt : BuiltinKind::Int;
  return true;
}

} // namespace

/// IsTypeSpecifierStart - True for tokens that can only begin a type.
/// Identifiers are decided by name lookup at the call site.
bool IsTypeSpecifierStart() {
  return CurTok == tok_const || CurTok == tok_struct || CurTok == tok_class ||
         IsBuiltinTypeToken(CurTok);
}

/// qualifiedname ::= '::'? identifier ('::' identifier)*
bool ParseQualifiedName(QualifiedNameRef &Name) {
  Name = QualifiedNameRef();
  Name.Loc = CurLoc;
  if (CurTok == tok_scope) {
    Name.Global = true;
    getNextToken(); // eat '::'
  }

  if (CurTok != tok_identifier)
    return LogErrorD("expected identifier");
  Name.Name = IdentifierStr;
  getNextToken(); // eat identifier

  while (CurTok == tok_scope) {
    getNextToken(); // eat '::'
    if (CurTok != tok_identifier)
      return LogErrorD("expected identifier after '::'");
    Name.Qualifiers.push_back(std::move(Name.Name));
    Name.Name = IdentifierStr;
    getNextToken(); // eat identifier
  }
  return true;
}

/// ParseTypeFromName - The type named by an already parsed name, followed by
/// an optional trailing 'const'.
QualType ParseTypeFromName(const QualifiedNameRef &Name, bool LeadingConst) {
  TypeDecl *TD = Actions.getTypeName(Name);
  if (!TD) {
    // Run the diagnosing lookup so a bad qualifier gets its own message.
    if (Name.isQualified() && !Actions.lookupNestedNameSpecifier(Name, true))
      return QualType();
    reportCompilerErrorAt(Name.Loc, "unknown type name '" + Name.getAsString() + "'");
    return QualType();
  }

  QualType T = Actions.getASTContext().getTypeDeclType(TD);
  if (CurTok == tok_const) {
    LeadingConst = true;
    getNextToken(); // eat 'const'
  }
  return LeadingConst ? T.withConst() : T;
}

/// typespecifier ::= 'const'? (builtin+ | ('struct'|'class') qualifiedname
///                                 | qualifiedname) 'const'?
QualType ParseTypeSpecifier() {
  bool IsConst = false;
  if (CurTok == tok_const) {
    IsConst = true;
    getNextToken(); // eat 'const'
  }

  ASTContext &Ctx = Actions.getASTContext();
  QualType T;

  if (CurTok == tok_struct || CurTok == tok_class) {
    TagKind Tag = CurTok == tok_class ? TagKind::Class : TagKind::Struct;
    getNextToken(); // eat 'struct' / 'class'
    QualifiedNameRef Name;
    if (!ParseQualifiedName(Name))
      return QualType();
    RecordDecl *RD = Actions.actOnElaboratedTypeName(Name.Loc, Tag, Name);
    if (!RD)
      return QualType();
    T = Ctx.getRecordType(RD);
  } else if (IsBuiltinTypeToken(CurTok)) {
    SourceLocation Loc = CurLoc;
    BuiltinSpecifiers Specs;
    while (IsBuiltinTypeToken(CurTok) || CurTok == tok_const) {
      switch (CurTok) {
        case tok_void: ++Specs.Void; break;
        case tok_bool: ++Specs.Bool; break;
        case tok_char: ++Specs.Char; break;
        case tok_short: ++Specs.Short; break;
        case tok_int: ++Specs.Int; break;
        case tok_long: ++Specs.Long; break;
        case tok_signed: ++Specs.Signed; break;
        case tok_unsigned: ++Specs.Unsigned; break;
        case tok_float: ++Specs.Float; break;
        case tok_double: ++Specs.Double; break;
        case tok_const: IsConst = true; break;
      }
      getNextToken();
    }
    BuiltinKind Kind;
    if (!resolveBuiltinKind(Specs, Kind)) {
      reportCompilerErrorAt(Loc, "invalid combination of type specifiers");
      return QualType();
    }
    T = Ctx.getBuiltinType(Kind);
  } else if (CurTok == tok_identifier || CurTok == tok_scope) {
    QualifiedNameRef Name;
    if (!ParseQualifiedName(Name))
      return QualType();
    return ParseTypeFromName(Name, IsConst);
  } else {
    LogError("expected a type");
    return QualType();
  }

  if (CurTok == tok_const) {
    IsConst = true;
    getNextToken(); // eat 'const'
  }
  return IsConst ? T.withConst() : T;
}

/// pointerdeclarator ::= ('*' 'const'?)* '&'?
QualType ParsePointerDeclarator(QualType Base) {
  ASTContext &Ctx = Actions.getASTContext();
  QualType T = Base;
  while (CurTok == '*') {
    getNextToken(); // eat '*'
    T = Ctx.getPointerType(T);
    if (CurTok == tok_const) {
      getNextToken(); // eat 'const'
      T = T.withConst();
    }
  }

  if (CurTok == '&') {
    getNextToken(); // eat '&'
    if (T->isVoidType()) {
      LogError("cannot form a reference to 'void'");
      return QualType();
    }
    T = Ctx.getLValueReferenceType(T);
    if (CurTok == '&' || CurTok == tok_and) {
      LogError("rvalue and nested references are not supported");
      return QualType();
    }
  }
  return T;
}

/// typename ::= typespecifier pointerdeclarator
QualType ParseTypeName() {
  QualType T = ParseTypeSpecifier();
  if (T.isNull())
    return T;
  return ParsePointerDeclarator(T);
}

/// arraybounds ::= ('[' expression ']')*
bool ParseArrayBounds(QualType &T) {
  std::vector<uint64_t> Bounds;
  while (CurTok == '[') {
    getNextToken(); // eat '['
    auto Size = ParseExpression();
    if (!Size)
      return false;
    if (!ExpectToken(']', "after array bound"))
      return false;
    uint64_t Bound = 0;
    if (!Actions.actOnArrayBound(Size.get(), Bound))
      return false;
    Bounds.push_back(Bound);
  }

  if (Bounds.empty())
    return true;
  if (T->isReferenceType()) {
    LogError("arrays of references are not supported");
    return false;
  }
  // int a[2][3] is an array of two arrays of three ints.
  ASTContext &Ctx = Actions.getASTContext();
  for (auto It = Bounds.rbegin(); It != Bounds.rend(); ++It)
    T = Ctx.getConstantArrayType(T, *It);
  return true;
}
