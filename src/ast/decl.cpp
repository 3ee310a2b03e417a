// This file implements declaration nodes and declaration-context lookup.

#include "ast/decl.h"

#include <algorithm>

#include "ast/ast_context.h"
#include "ast/expr.h"
#include "ast/stmt.h"

const char *getAccessSpelling(AccessSpecifier AS) {
  switch (AS) {
    case AccessSpecifier::Public:
      return "public";
    case AccessSpecifier::Protected:
      return "protected";
    case AccessSpecifier::Private:
      return "private";
    case AccessSpecifier::None:
      break;
  }
  return "";
}

// Decl -----------------------------------------------------------------------

Decl::~Decl() = default;

const char *Decl::getKindName(Kind K) {
  switch (K) {
    case TranslationUnit:
      return "TranslationUnit";
    case Namespace:
      return "Namespace";
    case CXXRecord:
      return "CXXRecord";
    case Enum:
      return "Enum";
    case Typedef:
      return "Typedef";
    case TypeAlias:
      return "TypeAlias";
    case Function:
      return "Function";
    case CXXMethod:
      return "CXXMethod";
    case Field:
      return "Field";
    case EnumConstant:
      return "EnumConstant";
    case Var:
      return "Var";
    case ParmVar:
      return "ParmVar";
  }
  return "<unknown>";
}

TranslationUnitDecl *Decl::getTranslationUnitDecl() {
  Decl *D = this;
  while (DeclContext *Parent = D->getDeclContext())
    D = castFromDeclContext(Parent);
  return llvm::cast<TranslationUnitDecl>(D);
}

ASTContext &Decl::getASTContext() const {
  return const_cast<Decl *>(this)->getTranslationUnitDecl()->getASTContext();
}

DeclContext *Decl::castToDeclContext(const Decl *D) {
  Decl *Mutable = const_cast<Decl *>(D);
  switch (D->getKind()) {
    case TranslationUnit:
      return static_cast<TranslationUnitDecl *>(Mutable);
    case Namespace:
      return static_cast<NamespaceDecl *>(Mutable);
    case CXXRecord:
      return static_cast<RecordDecl *>(Mutable);
    case Enum:
      return static_cast<EnumDecl *>(Mutable);
    case Function:
    case CXXMethod:
      return static_cast<FunctionDecl *>(Mutable);
    default:
      return nullptr;
  }
}

Decl *Decl::castFromDeclContext(const DeclContext *DC) {
  DeclContext *Mutable = const_cast<DeclContext *>(DC);
  switch (DC->getDeclKind()) {
    case TranslationUnit:
      return static_cast<TranslationUnitDecl *>(Mutable);
    case Namespace:
      return static_cast<NamespaceDecl *>(Mutable);
    case CXXRecord:
      return static_cast<RecordDecl *>(Mutable);
    case Enum:
      return static_cast<EnumDecl *>(Mutable);
    case Function:
    case CXXMethod:
      return static_cast<FunctionDecl *>(Mutable);
    default:
      return nullptr;
  }
}

// DeclContext ----------------------------------------------------------------

bool DeclContext::classof(const Decl *D) {
  return Decl::castToDeclContext(D) != nullptr;
}

DeclContext *DeclContext::getParent() const {
  return Decl::castFromDeclContext(this)->getDeclContext();
}

DeclContext *DeclContext::getEnclosingNamespaceContext() {
  DeclContext *DC = this;
  while (!DC->isFileContext())
    DC = DC->getParent();
  return DC;
}

void DeclContext::addHiddenDecl(Decl *D) { Decls.push_back(D); }

void DeclContext::addDecl(Decl *D) {
  addHiddenDecl(D);
  auto *ND = llvm::dyn_cast<NamedDecl>(D);
  if (!ND || ND->isAnonymous())
    return;
  makeDeclVisibleInContext(ND);

  // Enumerators of an unscoped enumeration are also members of the
  // enclosing scope.
  if (isEnum() && !static_cast<EnumDecl *>(this)->isScoped()) {
    if (DeclContext *Parent = getParent())
      Parent->makeDeclVisibleInContext(ND);
  }
}

void DeclContext::makeDeclVisibleInContext(NamedDecl *ND) {
  lookup_result &Entries = Lookups[ND->getName()];
  for (NamedDecl *Existing : Entries) {
    if (Existing == ND)
      return;
  }
  Entries.push_back(ND);
}

void DeclContext::removeDecl(Decl *D) {
  Decls.erase(std::remove(Decls.begin(), Decls.end(), D), Decls.end());
  auto *ND = llvm::dyn_cast<NamedDecl>(D);
  if (!ND)
    return;
  auto It = Lookups.find(ND->getName());
  if (It == Lookups.end())
    return;
  lookup_result &Entries = It->second;
  Entries.erase(std::remove(Entries.begin(), Entries.end(), ND), Entries.end());
  if (Entries.empty())
    Lookups.erase(It);
}

DeclContext::lookup_result DeclContext::lookup(llvm::StringRef Name) {
  if (hasExternalVisibleStorage() && !Name.empty()) {
    ASTContext &Ctx = Decl::castFromDeclContext(this)->getASTContext();
    if (ExternalDeclSource *Source = Ctx.getExternalSource()) {
      if (ExternalLookupsDone.insert(Name).second)
        Source->findExternalVisibleDeclsByName(this, Name);
    }
  }
  return noloadLookup(Name);
}

DeclContext::lookup_result DeclContext::noloadLookup(llvm::StringRef Name) const {
  auto It = Lookups.find(Name);
  if (It == Lookups.end())
    return lookup_result();
  return It->second;
}

// NamedDecl ------------------------------------------------------------------

std::string NamedDecl::getQualifiedNameAsString() const {
  std::vector<llvm::StringRef> Components;
  for (DeclContext *DC = getDeclContext(); DC && !DC->isTranslationUnit();
       DC = DC->getParent()) {
    if (DC->isEnum() && !static_cast<EnumDecl *>(DC)->isScoped())
      continue;
    auto *ND = llvm::cast<NamedDecl>(Decl::castFromDeclContext(DC));
    Components.push_back(ND->isAnonymous() ? "(anonymous)" : ND->getName());
  }

  std::string Result;
  for (auto It = Components.rbegin(); It != Components.rend(); ++It) {
    Result += It->str();
    Result += "::";
  }
  Result += isAnonymous() ? "(anonymous)" : Name;
  return Result;
}

// RecordDecl -----------------------------------------------------------------

bool RecordDecl::isDerivedFrom(const RecordDecl *Base) const {
  for (const CXXBaseSpecifier &Spec : Bases) {
    const RecordDecl *Direct = Spec.BaseType->getAsRecordDecl();
    if (!Direct)
      continue;
    if (Direct == Base || Direct->isDerivedFrom(Base))
      return true;
  }
  return false;
}

std::vector<FieldDecl *> RecordDecl::fields() const {
  std::vector<FieldDecl *> Result;
  for (Decl *D : decls()) {
    if (auto *FD = llvm::dyn_cast<FieldDecl>(D))
      Result.push_back(FD);
  }
  return Result;
}

std::vector<CXXMethodDecl *> RecordDecl::methods() const {
  std::vector<CXXMethodDecl *> Result;
  for (Decl *D : decls()) {
    if (auto *MD = llvm::dyn_cast<CXXMethodDecl>(D))
      Result.push_back(MD);
  }
  return Result;
}

// EnumDecl -------------------------------------------------------------------

std::vector<EnumConstantDecl *> EnumDecl::enumerators() const {
  std::vector<EnumConstantDecl *> Result;
  for (Decl *D : decls()) {
    if (auto *ECD = llvm::dyn_cast<EnumConstantDecl>(D))
      Result.push_back(ECD);
  }
  return Result;
}

// FieldDecl ------------------------------------------------------------------

RecordDecl *FieldDecl::getParent() const {
  return llvm::cast<RecordDecl>(Decl::castFromDeclContext(getDeclContext()));
}

unsigned FieldDecl::getFieldIndex() const {
  unsigned Index = 0;
  for (FieldDecl *FD : getParent()->fields()) {
    if (FD == this)
      return Index;
    ++Index;
  }
  return Index;
}

// EnumConstantDecl -----------------------------------------------------------

EnumConstantDecl::EnumConstantDecl(DeclContext *DC, SourceLocation L,
                                   llvm::StringRef N, QualType T, int64_t V)
    : ValueDecl(EnumConstant, DC, L, N, T), Value(V) {}

EnumConstantDecl::~EnumConstantDecl() = default;

void EnumConstantDecl::setInitExpr(std::unique_ptr<ExprAST> E) {
  Init = std::move(E);
}

// VarDecl --------------------------------------------------------------------

VarDecl::VarDecl(Kind K, DeclContext *DC, SourceLocation L, llvm::StringRef N,
                 QualType T, StorageClass SC)
    : ValueDecl(K, DC, L, N, T), SC(SC) {}

VarDecl::VarDecl(DeclContext *DC, SourceLocation L, llvm::StringRef N,
                 QualType T, StorageClass SC)
    : VarDecl(Var, DC, L, N, T, SC) {}

VarDecl::~VarDecl() = default;

bool VarDecl::isLocalVarDecl() const {
  return getKind() == Var && getDeclContext() &&
         getDeclContext()->isFunctionOrMethod();
}

bool VarDecl::isFileVarDecl() const {
  return getKind() == Var && getDeclContext() && getDeclContext()->isFileContext();
}

void VarDecl::setInit(std::unique_ptr<ExprAST> E) { Init = std::move(E); }

// FunctionDecl ---------------------------------------------------------------

FunctionDecl::FunctionDecl(Kind K, DeclContext *DC, SourceLocation L,
                           llvm::StringRef N, QualType Ret, StorageClass SC)
    : NamedDecl(K, DC, L, N), DeclContext(K), ReturnType(Ret), SC(SC) {}

FunctionDecl::FunctionDecl(DeclContext *DC, SourceLocation L, llvm::StringRef N,
                           QualType Ret, StorageClass SC)
    : FunctionDecl(Function, DC, L, N, Ret, SC) {}

FunctionDecl::~FunctionDecl() = default;

void FunctionDecl::setParams(llvm::ArrayRef<ParmVarDecl *> NewParams) {
  for (ParmVarDecl *Old : Params)
    removeDecl(Old);
  Params.assign(NewParams.begin(), NewParams.end());
  for (ParmVarDecl *Param : Params)
    addDecl(Param);
}

void FunctionDecl::setBody(std::unique_ptr<BlockStmtAST> B) { Body = std::move(B); }

std::string FunctionDecl::formatSignature(llvm::ArrayRef<QualType> ParamTypes,
                                          bool IsConst) {
  std::string Result = "(";
  for (unsigned I = 0; I < ParamTypes.size(); ++I) {
    if (I)
      Result += ", ";
    Result += ParamTypes[I].getCanonicalType().getAsString();
  }
  Result += ")";
  if (IsConst)
    Result += " const";
  return Result;
}

std::string FunctionDecl::getSignatureString() const {
  std::vector<QualType> ParamTypes;
  for (const ParmVarDecl *Param : Params)
    ParamTypes.push_back(Param->getType());
  const auto *MD = llvm::dyn_cast<CXXMethodDecl>(this);
  return formatSignature(ParamTypes, MD && MD->isConst());
}

std::string FunctionDecl::getTypeString() const {
  std::string Result = ReturnType.getAsString() + " (";
  for (unsigned I = 0; I < Params.size(); ++I) {
    if (I)
      Result += ", ";
    Result += Params[I]->getType().getAsString();
  }
  Result += ")";
  if (const auto *MD = llvm::dyn_cast<CXXMethodDecl>(this)) {
    if (MD->isConst())
      Result += " const";
  }
  return Result;
}

// CXXMethodDecl --------------------------------------------------------------

CXXMethodDecl::CXXMethodDecl(RecordDecl *RD, SourceLocation L, llvm::StringRef N,
                             QualType Ret, bool IsStatic, bool IsConst)
    : FunctionDecl(CXXMethod, RD, L, N, Ret,
                   IsStatic ? StorageClass::Static : StorageClass::None),
      Static(IsStatic), Const(IsConst) {}

RecordDecl *CXXMethodDecl::getParent() const {
  return llvm::cast<RecordDecl>(Decl::castFromDeclContext(getDeclContext()));
}
