// This file implements declaration building and name lookup for the parser.

#include "analysis/semantics.h"

#include "ast/ast_context.h"

namespace analysis {

SemanticAnalysis::SemanticAnalysis(ASTContext &Ctx)
    : Ctx(Ctx), Trigger(Ctx), Layouts(Trigger),
      CurContext(Ctx.getTranslationUnitDecl()) {}

SemanticAnalysis::~SemanticAnalysis() = default;

void SemanticAnalysis::popDeclContext() {
  if (DeclContext *Parent = CurContext->getParent())
    CurContext = Parent;
}

void SemanticAnalysis::pushScope() { Scopes.emplace_back(); }

void SemanticAnalysis::popScope() {
  if (!Scopes.empty())
    Scopes.pop_back();
}

std::string SemanticAnalysis::describeContext(const DeclContext *DC) const {
  if (DC->isTranslationUnit())
    return "the global namespace";
  const auto *ND = llvm::cast<NamedDecl>(Decl::castFromDeclContext(DC));
  if (DC->isNamespace())
    return "namespace '" + ND->getQualifiedNameAsString() + "'";
  return "'" + ND->getQualifiedNameAsString() + "'";
}

void SemanticAnalysis::notePrevious(const NamedDecl *Previous, bool IsDefinition) {
  SourceLocation Loc = Previous->getLocation();
  if (const auto *RD = llvm::dyn_cast<RecordDecl>(Previous))
    Loc = RD->getDefinitionLoc();
  reportCompilerNote(Loc, IsDefinition ? "previous definition is here"
                                       : "previous declaration is here");
}

bool SemanticAnalysis::requireValueType(SourceLocation Loc, QualType T,
                                        CompletenessReason Reason) {
  if (T.isNull())
    return false;
  if (T->isReferenceType())
    return true;
  return Trigger.requireCompleteType(Loc, T, Reason);
}

// Lookup ---------------------------------------------------------------------

DeclContext::lookup_result SemanticAnalysis::lookupInRecord(RecordDecl *RD,
                                                            llvm::StringRef Name) {
  DeclContext::lookup_result Result = RD->noloadLookup(Name);
  if (!Result.empty())
    return Result;
  for (const CXXBaseSpecifier &Base : RD->bases()) {
    RecordDecl *BaseDecl = Base.BaseType->getAsRecordDecl();
    if (!BaseDecl || !Trigger.completeRecord(BaseDecl, CompletenessReason::MemberAccess))
      continue;
    Result = lookupInRecord(BaseDecl, Name);
    if (!Result.empty())
      return Result;
  }
  return Result;
}

DeclContext::lookup_result SemanticAnalysis::lookupQualified(DeclContext *DC,
                                                             llvm::StringRef Name) {
  if (DC->isRecord())
    return lookupInRecord(llvm::cast<RecordDecl>(Decl::castFromDeclContext(DC)),
                          Name);
  return DC->lookup(Name);
}

DeclContext::lookup_result SemanticAnalysis::lookupUnqualified(llvm::StringRef Name) {
  for (auto It = Scopes.rbegin(); It != Scopes.rend(); ++It) {
    auto Found = It->find(Name);
    if (Found != It->end()) {
      DeclContext::lookup_result Result;
      Result.push_back(Found->second);
      return Result;
    }
  }

  for (DeclContext *DC = CurContext; DC; DC = DC->getParent()) {
    DeclContext::lookup_result Result;
    if (DC->isFunctionOrMethod())
      Result = DC->noloadLookup(Name);
    else
      Result = lookupQualified(DC, Name);
    if (!Result.empty())
      return Result;
  }
  return DeclContext::lookup_result();
}

DeclContext *SemanticAnalysis::lookupNestedNameSpecifier(const QualifiedNameRef &Name,
                                                         bool Diagnose) {
  DeclContext *DC = Name.Global ? Ctx.getTranslationUnitDecl() : nullptr;
  for (const std::string &Qualifier : Name.Qualifiers) {
    DeclContext::lookup_result Found =
        DC ? lookupQualified(DC, Qualifier) : lookupUnqualified(Qualifier);

    DeclContext *Next = nullptr;
    for (NamedDecl *ND : Found) {
      if (llvm::isa<NamespaceDecl>(ND) || llvm::isa<RecordDecl>(ND) ||
          llvm::isa<EnumDecl>(ND)) {
        Next = Decl::castToDeclContext(ND);
        break;
      }
      if (const auto *TD = llvm::dyn_cast<TypedefNameDecl>(ND)) {
        QualType Underlying = TD->getUnderlyingType();
        if (RecordDecl *RD = Underlying->getAsRecordDecl())
          Next = RD;
        else if (EnumDecl *ED = Underlying->getAsEnumDecl())
          Next = ED;
        if (Next)
          break;
      }
    }

    if (!Next) {
      if (Diagnose) {
        if (!Found.empty())
          reportCompilerErrorAt(Name.Loc, "'" + Qualifier +
                                              "' is not a class, namespace, or "
                                              "enumeration");
        else if (DC)
          reportCompilerErrorAt(Name.Loc, "no member named '" + Qualifier +
                                              "' in " + describeContext(DC));
        else
          reportCompilerErrorAt(Name.Loc,
                                "use of undeclared identifier '" + Qualifier + "'");
      }
      return nullptr;
    }

    if (Next->isRecord()) {
      auto *RD = llvm::cast<RecordDecl>(Decl::castFromDeclContext(Next));
      bool Complete =
          Diagnose ? Trigger.requireCompleteType(Name.Loc, Ctx.getRecordType(RD),
                                                 CompletenessReason::QualifiedLookup)
                   : Trigger.completeRecord(RD, CompletenessReason::QualifiedLookup);
      if (!Complete)
        return nullptr;
    }
    DC = Next;
  }
  return DC;
}

TypeDecl *SemanticAnalysis::getTypeName(const QualifiedNameRef &Name) {
  DeclContext::lookup_result Found;
  if (Name.isQualified()) {
    DeclContext *DC = lookupNestedNameSpecifier(Name, /*Diagnose=*/false);
    if (!DC)
      return nullptr;
    Found = lookupQualified(DC, Name.Name);
  } else {
    Found = lookupUnqualified(Name.Name);
  }
  if (Found.empty())
    return nullptr;
  return llvm::dyn_cast<TypeDecl>(Found.front());
}

// Namespaces -----------------------------------------------------------------

NamespaceDecl *SemanticAnalysis::actOnStartNamespace(SourceLocation Loc,
                                                     llvm::StringRef Name) {
  NamespaceDecl *NS = nullptr;
  for (NamedDecl *ND : CurContext->lookup(Name)) {
    if ((NS = llvm::dyn_cast<NamespaceDecl>(ND)))
      break;
    reportCompilerErrorAt(Loc, "redefinition of '" + Name.str() +
                                   "' as different kind of symbol");
    notePrevious(ND, false);
    break;
  }

  if (!NS) {
    NS = Ctx.create<NamespaceDecl>(CurContext, Loc, Name);
    CurContext->addDecl(NS);
  }
  pushDeclContext(NS);
  return NS;
}

void SemanticAnalysis::actOnFinishNamespace() { popDeclContext(); }

// Records --------------------------------------------------------------------

static RecordDecl *findRecord(const DeclContext::lookup_result &Found) {
  for (NamedDecl *ND : Found) {
    if (auto *RD = llvm::dyn_cast<RecordDecl>(ND))
      return RD;
  }
  return nullptr;
}

RecordDecl *SemanticAnalysis::actOnTagDeclaration(SourceLocation Loc, TagKind Tag,
                                                  llvm::StringRef Name) {
  DeclContext::lookup_result Found = CurContext->lookup(Name);
  if (RecordDecl *Existing = findRecord(Found))
    return Existing;
  if (!Found.empty()) {
    reportCompilerErrorAt(Loc, "redefinition of '" + Name.str() +
                                   "' as different kind of symbol");
    notePrevious(Found.front(), false);
    return nullptr;
  }

  auto *RD = Ctx.create<RecordDecl>(CurContext, Loc, Name, Tag);
  if (CurContext->isRecord())
    RD->setAccess(llvm::cast<RecordDecl>(Decl::castFromDeclContext(CurContext))
                      ->getDefaultAccess());
  CurContext->addDecl(RD);
  return RD;
}

RecordDecl *SemanticAnalysis::actOnElaboratedTypeName(SourceLocation Loc,
                                                      TagKind Tag,
                                                      const QualifiedNameRef &Name) {
  DeclContext::lookup_result Found;
  if (Name.isQualified()) {
    DeclContext *DC = lookupNestedNameSpecifier(Name, /*Diagnose=*/true);
    if (!DC)
      return nullptr;
    Found = lookupQualified(DC, Name.Name);
    if (Found.empty()) {
      reportCompilerErrorAt(Loc, "no struct named '" + Name.Name + "' in " +
                                     describeContext(DC));
      return nullptr;
    }
  } else {
    Found = lookupUnqualified(Name.Name);
  }

  if (RecordDecl *RD = findRecord(Found))
    return RD;
  if (!Found.empty()) {
    reportCompilerErrorAt(Loc, "use of '" + Name.Name +
                                   "' with tag type that does not match "
                                   "previous declaration");
    return nullptr;
  }

  // An unknown elaborated name declares the record in the nearest namespace.
  DeclContext *DC = CurContext->getEnclosingNamespaceContext();
  auto *RD = Ctx.create<RecordDecl>(DC, Loc, Name.Name, Tag);
  DC->addDecl(RD);
  return RD;
}

RecordDecl *SemanticAnalysis::actOnStartRecordDefinition(SourceLocation Loc,
                                                         TagKind Tag,
                                                         llvm::StringRef Name) {
  DeclContext::lookup_result Found = CurContext->lookup(Name);
  RecordDecl *RD = findRecord(Found);

  if (RD && RD->hasDefinition()) {
    reportCompilerErrorAt(Loc, "redefinition of '" + Name.str() + "'");
    notePrevious(RD, true);
    RD = nullptr;
  } else if (!RD && !Found.empty()) {
    reportCompilerErrorAt(Loc, "redefinition of '" + Name.str() +
                                   "' as different kind of symbol");
    notePrevious(Found.front(), false);
  } else if (!RD) {
    RD = Ctx.create<RecordDecl>(CurContext, Loc, Name, Tag);
    if (CurContext->isRecord())
      RD->setAccess(llvm::cast<RecordDecl>(Decl::castFromDeclContext(CurContext))
                        ->getDefaultAccess());
    CurContext->addDecl(RD);
  }

  // The body of a rejected definition is still parsed into a detached record.
  if (!RD)
    RD = Ctx.create<RecordDecl>(CurContext, Loc, Name, Tag);

  if (RD->getTagKind() != Tag && !RD->hasDefinition())
    RD->setTagKind(Tag);
  RD->startDefinition(Loc);
  pushDeclContext(RD);
  return RD;
}

void SemanticAnalysis::actOnBaseSpecifier(RecordDecl *RD, SourceLocation Loc,
                                          QualType BaseType,
                                          AccessSpecifier Access) {
  RecordDecl *BaseDecl = BaseType.isNull() ? nullptr : BaseType->getAsRecordDecl();
  if (!BaseDecl) {
    reportCompilerErrorAt(Loc, "base specifier must name a class");
    return;
  }
  if (BaseDecl == RD) {
    reportCompilerErrorAt(Loc, "base class has incomplete type '" +
                                   BaseType.getAsString() + "'");
    return;
  }
  if (!Trigger.requireCompleteType(Loc, BaseType, CompletenessReason::BaseClass))
    return;

  for (const CXXBaseSpecifier &Existing : RD->bases()) {
    if (Existing.BaseType->getAsRecordDecl() == BaseDecl) {
      reportCompilerErrorAt(Loc, "base class '" + BaseType.getAsString() +
                                     "' specified more than once as a direct "
                                     "base class");
      return;
    }
  }

  CXXBaseSpecifier Base;
  Base.BaseType = BaseType.withoutConst();
  Base.Access = Access == AccessSpecifier::None ? RD->getDefaultAccess() : Access;
  Base.Loc = Loc;
  RD->addBase(Base);
}

void SemanticAnalysis::actOnFinishRecordDefinition(RecordDecl *RD) {
  RD->completeDefinition();
  popDeclContext();
  Layouts.getRecordLayout(RD);
}

// Enumerations ---------------------------------------------------------------

EnumDecl *SemanticAnalysis::actOnStartEnum(SourceLocation Loc, llvm::StringRef Name,
                                           bool Scoped, QualType Underlying) {
  if (!Underlying.isNull() && !Underlying->isIntegerType()) {
    reportCompilerErrorAt(Loc, "non-integral type '" + Underlying.getAsString() +
                                   "' is an invalid underlying type");
    Underlying = QualType();
  }
  if (Underlying.isNull())
    Underlying = Ctx.getBuiltinType(BuiltinKind::Int);

  bool Visible = true;
  if (!Name.empty()) {
    DeclContext::lookup_result Found = CurContext->lookup(Name);
    if (!Found.empty()) {
      Visible = false;
      if (llvm::isa<EnumDecl>(Found.front())) {
        reportCompilerErrorAt(Loc, "redefinition of '" + Name.str() + "'");
        notePrevious(Found.front(), true);
      } else {
        reportCompilerErrorAt(Loc, "redefinition of '" + Name.str() +
                                       "' as different kind of symbol");
        notePrevious(Found.front(), false);
      }
    }
  }

  auto *ED = Ctx.create<EnumDecl>(CurContext, Loc, Name, Scoped);
  ED->setIntegerType(Underlying);
  if (CurContext->isRecord())
    ED->setAccess(llvm::cast<RecordDecl>(Decl::castFromDeclContext(CurContext))
                      ->getDefaultAccess());
  if (Visible)
    CurContext->addDecl(ED);
  pushDeclContext(ED);
  return ED;
}

EnumConstantDecl *SemanticAnalysis::actOnEnumConstant(EnumDecl *ED,
                                                      SourceLocation Loc,
                                                      llvm::StringRef Name,
                                                      std::unique_ptr<ExprAST> Init) {
  int64_t Value = 0;
  std::vector<EnumConstantDecl *> Previous = ED->enumerators();
  if (!Previous.empty())
    Value = Previous.back()->getInitVal() + 1;

  if (Init) {
    int64_t Evaluated = 0;
    if (checkExpression(Init.get())) {
      if (evaluateIntegerConstant(Init.get(), Evaluated))
        Value = Evaluated;
      else
        reportCompilerErrorAt(Init->getSourceLocation(),
                              "expression is not an integral constant expression");
    }
  }

  for (EnumConstantDecl *Existing : Previous) {
    if (Existing->getName() == Name) {
      reportCompilerErrorAt(Loc, "redefinition of enumerator '" + Name.str() + "'");
      notePrevious(Existing, true);
      return nullptr;
    }
  }

  // Inside the braces an enumerator has the underlying type.
  auto *ECD = Ctx.create<EnumConstantDecl>(ED, Loc, Name, ED->getIntegerType(), Value);
  ECD->setAccess(ED->getAccess());
  ECD->setInitExpr(std::move(Init));
  ED->addDecl(ECD);
  return ECD;
}

void SemanticAnalysis::actOnFinishEnum(EnumDecl *ED) {
  QualType EnumTy = Ctx.getEnumType(ED);
  for (EnumConstantDecl *ECD : ED->enumerators())
    ECD->setType(EnumTy);
  ED->setComplete(true);
  popDeclContext();
}

// Typedefs -------------------------------------------------------------------

TypedefNameDecl *SemanticAnalysis::actOnTypedef(SourceLocation Loc,
                                                llvm::StringRef Name, QualType T,
                                                bool IsAlias) {
  DeclContext::lookup_result Found = CurContext->lookup(Name);
  if (!Found.empty()) {
    auto *Existing = llvm::dyn_cast<TypedefNameDecl>(Found.front());
    if (!Existing) {
      reportCompilerErrorAt(Loc, "redefinition of '" + Name.str() +
                                     "' as different kind of symbol");
      notePrevious(Found.front(), false);
      return nullptr;
    }
    if (!Ctx.hasSameType(Existing->getUnderlyingType(), T)) {
      reportCompilerErrorAt(Loc, std::string(IsAlias ? "type alias" : "typedef") +
                                     " redefinition with different types ('" +
                                     T.getAsString() + "' vs '" +
                                     Existing->getUnderlyingType().getAsString() +
                                     "')");
      notePrevious(Existing, true);
    }
    return Existing;
  }

  TypedefNameDecl *TD;
  if (IsAlias)
    TD = Ctx.create<TypeAliasDecl>(CurContext, Loc, Name, T);
  else
    TD = Ctx.create<TypedefDecl>(CurContext, Loc, Name, T);
  if (CurContext->isRecord())
    TD->setAccess(llvm::cast<RecordDecl>(Decl::castFromDeclContext(CurContext))
                      ->getDefaultAccess());
  CurContext->addDecl(TD);
  return TD;
}

// Fields and variables -------------------------------------------------------

FieldDecl *SemanticAnalysis::actOnField(SourceLocation Loc, llvm::StringRef Name,
                                        QualType T, AccessSpecifier Access) {
  auto *RD = llvm::cast<RecordDecl>(Decl::castFromDeclContext(CurContext));
  for (NamedDecl *Existing : RD->noloadLookup(Name)) {
    reportCompilerErrorAt(Loc, "duplicate member '" + Name.str() + "'");
    notePrevious(Existing, false);
    return nullptr;
  }

  if (T->isReferenceType()) {
    reportCompilerErrorAt(Loc, "reference members are not supported");
    return nullptr;
  }
  if (!Trigger.requireCompleteType(Loc, T, CompletenessReason::Field))
    return nullptr;

  auto *FD = Ctx.create<FieldDecl>(RD, Loc, Name, T);
  FD->setAccess(Access);
  RD->addDecl(FD);
  return FD;
}

VarDecl *SemanticAnalysis::actOnVariable(SourceLocation Loc, llvm::StringRef Name,
                                         QualType T, StorageClass SC,
                                         std::unique_ptr<ExprAST> Init) {
  if (CurContext->isRecord()) {
    reportCompilerErrorAt(Loc, "static data members are not supported");
    return nullptr;
  }

  const bool IsLocal = CurContext->isFunctionOrMethod();
  const bool IsDefinition = SC != StorageClass::Extern || Init;
  if (Init && !checkExpression(Init.get()))
    Init.reset();

  if (T->isReferenceType() && !Init && SC != StorageClass::Extern) {
    reportCompilerErrorAt(Loc, "declaration of reference variable '" + Name.str() +
                                   "' requires an initializer");
    return nullptr;
  }
  if (IsDefinition && !requireValueType(Loc, T, CompletenessReason::Variable))
    return nullptr;
  if (IsDefinition && !Init && T.getCanonicalType().isConstQualified() &&
      !T->isRecordType()) {
    reportCompilerErrorAt(Loc, "default initialization of an object of const type '" +
                                   T.getAsString() + "'");
    return nullptr;
  }
  if (Init && !checkInitialization(T, Init.get(), InitKind::Variable))
    Init.reset();

  int64_t ConstantValue = 0;
  const bool HasConstant = Init && T.getCanonicalType().isConstQualified() &&
                           T->isIntegerType() &&
                           evaluateIntegerConstant(Init.get(), ConstantValue);

  if (IsLocal) {
    llvm::StringMap<NamedDecl *> &Scope = Scopes.back();
    auto Existing = Scope.find(Name);
    if (Existing != Scope.end()) {
      reportCompilerErrorAt(Loc, "redefinition of '" + Name.str() + "'");
      notePrevious(Existing->second, true);
      return nullptr;
    }
    // Locals live in the scope stack, not in the function's context.
    auto *VD = Ctx.create<VarDecl>(CurContext, Loc, Name, T, SC);
    VD->setInit(std::move(Init));
    if (HasConstant)
      VD->setConstantValue(ConstantValue);
    Scope[Name] = VD;
    return VD;
  }

  DeclContext::lookup_result Found = CurContext->lookup(Name);
  if (!Found.empty()) {
    auto *Existing = llvm::dyn_cast<VarDecl>(Found.front());
    if (!Existing) {
      reportCompilerErrorAt(Loc, "redefinition of '" + Name.str() +
                                     "' as different kind of symbol");
      notePrevious(Found.front(), false);
      return nullptr;
    }
    if (!Ctx.hasSameType(Existing->getType(), T)) {
      reportCompilerErrorAt(Loc, "redefinition of '" + Name.str() +
                                     "' with a different type: '" +
                                     T.getAsString() + "' vs '" +
                                     Existing->getType().getAsString() + "'");
      notePrevious(Existing, false);
      return nullptr;
    }
    if (IsDefinition && Existing->isThisDeclarationADefinition() &&
        (Init || Existing->hasInit() ||
         Existing->getStorageClass() != StorageClass::Extern)) {
      reportCompilerErrorAt(Loc, "redefinition of '" + Name.str() + "'");
      notePrevious(Existing, true);
      return nullptr;
    }
    if (IsDefinition) {
      Existing->setStorageClass(SC);
      if (Init)
        Existing->setInit(std::move(Init));
      if (HasConstant)
        Existing->setConstantValue(ConstantValue);
    }
    return Existing;
  }

  auto *VD = Ctx.create<VarDecl>(CurContext, Loc, Name, T, SC);
  VD->setInit(std::move(Init));
  if (HasConstant)
    VD->setConstantValue(ConstantValue);
  CurContext->addDecl(VD);
  return VD;
}

// Functions ------------------------------------------------------------------

FunctionDecl *SemanticAnalysis::actOnFunctionDeclarator(
    SourceLocation Loc, llvm::StringRef Name, QualType ReturnType,
    const std::vector<ParamInfo> &Params, StorageClass SC, bool IsInline,
    bool IsConst, AccessSpecifier Access) {
  const bool IsMethod = CurContext->isRecord();
  if (IsConst && (!IsMethod || SC == StorageClass::Static)) {
    reportCompilerErrorAt(Loc, IsMethod ? "static member function cannot have "
                                          "'const' qualifier"
                                        : "non-member function cannot have "
                                          "'const' qualifier");
    IsConst = false;
  }
  if (ReturnType->isArrayType()) {
    reportCompilerErrorAt(Loc, "function cannot return array type '" +
                                   ReturnType.getAsString() + "'");
    return nullptr;
  }

  std::vector<QualType> ParamTypes;
  for (const ParamInfo &Param : Params)
    ParamTypes.push_back(Param.Type);
  const std::string Signature = FunctionDecl::formatSignature(ParamTypes, IsConst);

  DeclContext::lookup_result Found =
      IsMethod ? CurContext->noloadLookup(Name) : CurContext->lookup(Name);
  for (NamedDecl *ND : Found) {
    auto *Existing = llvm::dyn_cast<FunctionDecl>(ND);
    if (!Existing) {
      reportCompilerErrorAt(Loc, "redefinition of '" + Name.str() +
                                     "' as different kind of symbol");
      notePrevious(ND, false);
      return nullptr;
    }
    if (Existing->getSignatureString() != Signature)
      continue;
    if (IsMethod) {
      reportCompilerErrorAt(Loc, "class member cannot be redeclared");
      notePrevious(Existing, false);
      return nullptr;
    }
    if (!Ctx.hasSameType(Existing->getReturnType(), ReturnType)) {
      reportCompilerErrorAt(Loc, "functions that differ only in their return "
                                 "type cannot be overloaded");
      notePrevious(Existing, false);
      return nullptr;
    }
    if (IsInline)
      Existing->setInlineSpecified(true);
    return Existing;
  }

  FunctionDecl *FD;
  if (IsMethod) {
    auto *RD = llvm::cast<RecordDecl>(Decl::castFromDeclContext(CurContext));
    FD = Ctx.create<CXXMethodDecl>(RD, Loc, Name, ReturnType,
                                   SC == StorageClass::Static, IsConst);
    FD->setAccess(Access);
  } else {
    FD = Ctx.create<FunctionDecl>(CurContext, Loc, Name, ReturnType, SC);
  }
  FD->setInlineSpecified(IsInline);

  std::vector<ParmVarDecl *> ParamDecls;
  for (const ParamInfo &Param : Params)
    ParamDecls.push_back(
        Ctx.create<ParmVarDecl>(FD, Param.Loc, Param.Name, Param.Type));
  FD->setParams(ParamDecls);
  CurContext->addDecl(FD);
  return FD;
}

FunctionDecl *SemanticAnalysis::actOnStartFunctionBody(
    SourceLocation Loc, FunctionDecl *FD, const std::vector<ParamInfo> &Params) {
  if (FD->isDefined()) {
    reportCompilerErrorAt(Loc, "redefinition of '" + FD->getName().str() + "'");
    notePrevious(FD, true);
    FD = Ctx.create<FunctionDecl>(FD->getDeclContext(), Loc, FD->getName(),
                                  FD->getReturnType(), FD->getStorageClass());
  }

  // The defining declarator's parameter names are the ones the body sees.
  std::vector<ParmVarDecl *> ParamDecls;
  for (const ParamInfo &Param : Params)
    ParamDecls.push_back(
        Ctx.create<ParmVarDecl>(FD, Param.Loc, Param.Name, Param.Type));
  FD->setParams(ParamDecls);

  if (!FD->getReturnType()->isReferenceType())
    Trigger.requireCompleteType(FD->getLocation(), FD->getReturnType(),
                                CompletenessReason::ReturnType);
  for (const ParmVarDecl *Param : ParamDecls)
    requireValueType(Param->getLocation(), Param->getType(),
                     CompletenessReason::Parameter);

  pushDeclContext(FD);
  pushScope();
  CurFunction = FD;
  return FD;
}

void SemanticAnalysis::actOnFinishFunctionBody(FunctionDecl *FD,
                                               std::unique_ptr<BlockStmtAST> Body) {
  popScope();
  popDeclContext();
  CurFunction = nullptr;
  if (Body)
    FD->setBody(std::move(Body));
}

bool SemanticAnalysis::actOnArrayBound(ExprAST *Size, uint64_t &Result) {
  if (!checkExpression(Size))
    return false;
  int64_t Value = 0;
  if (!evaluateIntegerConstant(Size, Value)) {
    reportCompilerErrorAt(Size->getSourceLocation(),
                          "array size is not an integral constant expression");
    return false;
  }
  if (Value < 0) {
    reportCompilerErrorAt(Size->getSourceLocation(), "array size is negative");
    return false;
  }
  Result = static_cast<uint64_t>(Value);
  return true;
}

// Statements -----------------------------------------------------------------

bool SemanticAnalysis::checkReturnStmt(SourceLocation Loc, ExprAST *Value) {
  if (!CurFunction)
    return false;
  QualType ReturnType = CurFunction->getReturnType();
  const std::string Name = CurFunction->getName().str();

  if (!Value) {
    if (!ReturnType->isVoidType()) {
      reportCompilerErrorAt(Loc, "non-void function '" + Name +
                                     "' should return a value");
      return false;
    }
    return true;
  }

  if (!checkExpression(Value))
    return false;
  if (ReturnType->isVoidType()) {
    if (Value->getType().isNull() || !Value->getType()->isVoidType()) {
      reportCompilerErrorAt(Loc, "void function '" + Name +
                                     "' should not return a value");
      return false;
    }
    return true;
  }
  return checkInitialization(ReturnType, Value, InitKind::Return);
}

bool SemanticAnalysis::checkCondition(ExprAST *Cond) {
  if (!checkExpression(Cond))
    return false;
  QualType T = Cond->getType();
  const EnumDecl *ED = T.isNull() ? nullptr : T->getAsEnumDecl();
  if (T.isNull() || !T->isScalarType() || (ED && ED->isScoped())) {
    reportCompilerErrorAt(Cond->getSourceLocation(),
                          "value of type '" + T.getAsString() +
                              "' is not contextually convertible to 'bool'");
    return false;
  }
  return true;
}

} // namespace analysis
