#ifndef DECLCACHE_AST_DECL_H
#define DECLCACHE_AST_DECL_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "ast/type.h"
#include "compiler_session.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/Casting.h"

class ASTContext;
class DeclContext;
class NamedDecl;
class TranslationUnitDecl;
class ExprAST;
class BlockStmtAST;

enum class AccessSpecifier : uint8_t { None, Public, Protected, Private };
enum class StorageClass : uint8_t { None, Static, Extern };
enum class TagKind : uint8_t { Struct, Class };

const char *getAccessSpelling(AccessSpecifier AS);

/// Decl - Base of every declaration node. Declarations are owned by the
/// ASTContext and referenced by raw pointer everywhere else.
class Decl {
public:
  enum Kind : uint8_t {
    TranslationUnit,
    Namespace,
    CXXRecord,
    Enum,
    Typedef,
    TypeAlias,
    Function,
    CXXMethod,
    Field,
    EnumConstant,
    Var,
    ParmVar,

    firstNamed = Namespace,
    lastNamed = ParmVar,
    firstType = CXXRecord,
    lastType = TypeAlias,
    firstTypedefName = Typedef,
    lastTypedefName = TypeAlias,
    firstFunction = Function,
    lastFunction = CXXMethod,
    firstValue = Field,
    lastValue = ParmVar,
    firstVar = Var,
    lastVar = ParmVar
  };

private:
  Kind DK;
  AccessSpecifier Access = AccessSpecifier::None;
  DeclContext *DC;
  SourceLocation Loc;
  // 0 for declarations written in the main unit, otherwise 1 + the index of
  // the declaration store that provided it.
  unsigned OwningStore = 0;
  uint32_t StoreID = 0;

protected:
  Decl(Kind K, DeclContext *DC, SourceLocation L) : DK(K), DC(DC), Loc(L) {}

public:
  Decl(const Decl &) = delete;
  Decl &operator=(const Decl &) = delete;
  virtual ~Decl();

  Kind getKind() const { return DK; }
  const char *getDeclKindName() const { return getKindName(DK); }
  static const char *getKindName(Kind K);

  DeclContext *getDeclContext() const { return DC; }
  SourceLocation getLocation() const { return Loc; }

  AccessSpecifier getAccess() const { return Access; }
  void setAccess(AccessSpecifier AS) { Access = AS; }

  bool isFromStore() const { return OwningStore != 0; }
  unsigned getOwningStoreIndex() const { return OwningStore - 1; }
  uint32_t getStoreID() const { return StoreID; }
  void setOwningStore(unsigned StoreIndex, uint32_t ID) {
    OwningStore = StoreIndex + 1;
    StoreID = ID;
  }

  TranslationUnitDecl *getTranslationUnitDecl();
  ASTContext &getASTContext() const;

  static DeclContext *castToDeclContext(const Decl *D);
  static Decl *castFromDeclContext(const DeclContext *DC);
};

/// DeclContext - Mixin for declarations that contain other declarations.
/// Keeps lexical order and a by-name table. Translation unit, namespace and
/// enum contexts consult the external declaration source the first time a
/// name misses.
class DeclContext {
public:
  using lookup_result = llvm::SmallVector<NamedDecl *, 2>;

private:
  Decl::Kind DeclKind;
  std::vector<Decl *> Decls;
  llvm::StringMap<lookup_result> Lookups;
  llvm::StringSet<> ExternalLookupsDone;

protected:
  explicit DeclContext(Decl::Kind K) : DeclKind(K) {}

public:
  Decl::Kind getDeclKind() const { return DeclKind; }
  DeclContext *getParent() const;
  /// Nearest enclosing namespace or translation unit.
  DeclContext *getEnclosingNamespaceContext();

  bool isTranslationUnit() const { return DeclKind == Decl::TranslationUnit; }
  bool isNamespace() const { return DeclKind == Decl::Namespace; }
  bool isRecord() const { return DeclKind == Decl::CXXRecord; }
  bool isEnum() const { return DeclKind == Decl::Enum; }
  bool isFunctionOrMethod() const {
    return DeclKind >= Decl::firstFunction && DeclKind <= Decl::lastFunction;
  }
  bool isFileContext() const { return isTranslationUnit() || isNamespace(); }

  bool hasExternalVisibleStorage() const { return isFileContext() || isEnum(); }

  const std::vector<Decl *> &decls() const { return Decls; }
  bool decls_empty() const { return Decls.empty(); }

  /// Append to lexical order and make the declaration visible by name.
  void addDecl(Decl *D);
  /// Append to lexical order only.
  void addHiddenDecl(Decl *D);
  void makeDeclVisibleInContext(NamedDecl *ND);
  void removeDecl(Decl *D);

  /// Name lookup that may deserialize declarations.
  lookup_result lookup(llvm::StringRef Name);
  /// Name lookup restricted to what is already in memory.
  lookup_result noloadLookup(llvm::StringRef Name) const;

  bool hasCompletedExternalLookup(llvm::StringRef Name) const {
    return ExternalLookupsDone.count(Name) != 0;
  }

  static bool classof(const Decl *D);
};

class TranslationUnitDecl : public Decl, public DeclContext {
  ASTContext &Ctx;

public:
  explicit TranslationUnitDecl(ASTContext &Ctx)
      : Decl(TranslationUnit, nullptr, SourceLocation()),
        DeclContext(TranslationUnit), Ctx(Ctx) {}

  ASTContext &getASTContext() const { return Ctx; }

  static bool classof(const Decl *D) { return D->getKind() == TranslationUnit; }
};

/// NamedDecl - A declaration with a name. An empty name marks an anonymous
/// enum.
class NamedDecl : public Decl {
  std::string Name;
  uint64_t ODRHash = 0;
  bool HasODRHash = false;

protected:
  NamedDecl(Kind K, DeclContext *DC, SourceLocation L, llvm::StringRef N)
      : Decl(K, DC, L), Name(N.str()) {}

public:
  llvm::StringRef getName() const { return Name; }
  bool isAnonymous() const { return Name.empty(); }

  /// ns::S::member style name. Unscoped enums do not contribute a component.
  std::string getQualifiedNameAsString() const;

  bool hasODRHash() const { return HasODRHash; }
  uint64_t getODRHash() const { return ODRHash; }
  void setODRHash(uint64_t H) {
    ODRHash = H;
    HasODRHash = true;
  }

  static bool classof(const Decl *D) {
    return D->getKind() >= firstNamed && D->getKind() <= lastNamed;
  }
};

class NamespaceDecl : public NamedDecl, public DeclContext {
public:
  NamespaceDecl(DeclContext *DC, SourceLocation L, llvm::StringRef N)
      : NamedDecl(Namespace, DC, L, N), DeclContext(Namespace) {}

  static bool classof(const Decl *D) { return D->getKind() == Namespace; }
};

class TypeDecl : public NamedDecl {
  mutable const Type *TypeForDecl = nullptr;
  friend class ASTContext;

protected:
  TypeDecl(Kind K, DeclContext *DC, SourceLocation L, llvm::StringRef N)
      : NamedDecl(K, DC, L, N) {}

public:
  const Type *getTypeForDecl() const { return TypeForDecl; }

  static bool classof(const Decl *D) {
    return D->getKind() >= firstType && D->getKind() <= lastType;
  }
};

struct CXXBaseSpecifier {
  QualType BaseType;
  AccessSpecifier Access = AccessSpecifier::Public;
  SourceLocation Loc;
};

class FieldDecl;
class CXXMethodDecl;

/// RecordDecl - struct or class. One object represents every declaration of
/// the entity, so a forward declaration seen first later becomes the
/// definition.
class RecordDecl : public TypeDecl, public DeclContext {
  TagKind Tag;
  bool CompleteDefinition = false;
  bool BeingDefined = false;
  // A declaration store holds a definition whose members are not loaded yet.
  bool ExternalDefinitionPending = false;
  SourceLocation DefinitionLoc;
  std::vector<CXXBaseSpecifier> Bases;

public:
  RecordDecl(DeclContext *DC, SourceLocation L, llvm::StringRef N, TagKind TK)
      : TypeDecl(CXXRecord, DC, L, N), DeclContext(CXXRecord), Tag(TK) {}

  TagKind getTagKind() const { return Tag; }
  void setTagKind(TagKind TK) { Tag = TK; }
  const char *getKindName() const {
    return Tag == TagKind::Class ? "class" : "struct";
  }
  AccessSpecifier getDefaultAccess() const {
    return Tag == TagKind::Class ? AccessSpecifier::Private
                                 : AccessSpecifier::Public;
  }

  bool isCompleteDefinition() const { return CompleteDefinition; }
  bool isBeingDefined() const { return BeingDefined; }
  bool hasExternalDefinitionPending() const { return ExternalDefinitionPending; }
  void setExternalDefinitionPending(bool V) { ExternalDefinitionPending = V; }
  /// True when some definition exists, loaded or not.
  bool hasDefinition() const {
    return CompleteDefinition || BeingDefined || ExternalDefinitionPending;
  }

  SourceLocation getDefinitionLoc() const {
    return DefinitionLoc.isValid() ? DefinitionLoc : getLocation();
  }
  void startDefinition(SourceLocation L) {
    BeingDefined = true;
    DefinitionLoc = L;
  }
  void completeDefinition() {
    BeingDefined = false;
    ExternalDefinitionPending = false;
    CompleteDefinition = true;
  }

  llvm::ArrayRef<CXXBaseSpecifier> bases() const { return Bases; }
  void addBase(const CXXBaseSpecifier &B) { Bases.push_back(B); }
  bool isDerivedFrom(const RecordDecl *Base) const;

  std::vector<FieldDecl *> fields() const;
  std::vector<CXXMethodDecl *> methods() const;

  static bool classof(const Decl *D) { return D->getKind() == CXXRecord; }
};

class EnumConstantDecl;

class EnumDecl : public TypeDecl, public DeclContext {
  bool Scoped;
  bool Complete = false;
  QualType IntegerType;

public:
  EnumDecl(DeclContext *DC, SourceLocation L, llvm::StringRef N, bool Scoped)
      : TypeDecl(Enum, DC, L, N), DeclContext(Enum), Scoped(Scoped) {}

  bool isScoped() const { return Scoped; }
  bool isComplete() const { return Complete; }
  void setComplete(bool V) { Complete = V; }

  QualType getIntegerType() const { return IntegerType; }
  void setIntegerType(QualType T) { IntegerType = T; }

  std::vector<EnumConstantDecl *> enumerators() const;

  static bool classof(const Decl *D) { return D->getKind() == Enum; }
};

class TypedefNameDecl : public TypeDecl {
  QualType UnderlyingType;

protected:
  TypedefNameDecl(Kind K, DeclContext *DC, SourceLocation L, llvm::StringRef N,
                  QualType T)
      : TypeDecl(K, DC, L, N), UnderlyingType(T) {}

public:
  QualType getUnderlyingType() const { return UnderlyingType; }

  static bool classof(const Decl *D) {
    return D->getKind() >= firstTypedefName && D->getKind() <= lastTypedefName;
  }
};

class TypedefDecl : public TypedefNameDecl {
public:
  TypedefDecl(DeclContext *DC, SourceLocation L, llvm::StringRef N, QualType T)
      : TypedefNameDecl(Typedef, DC, L, N, T) {}

  static bool classof(const Decl *D) { return D->getKind() == Typedef; }
};

class TypeAliasDecl : public TypedefNameDecl {
public:
  TypeAliasDecl(DeclContext *DC, SourceLocation L, llvm::StringRef N, QualType T)
      : TypedefNameDecl(TypeAlias, DC, L, N, T) {}

  static bool classof(const Decl *D) { return D->getKind() == TypeAlias; }
};

/// ValueDecl - Declarations with a type: fields, enumerators and variables.
class ValueDecl : public NamedDecl {
  QualType DeclType;

protected:
  ValueDecl(Kind K, DeclContext *DC, SourceLocation L, llvm::StringRef N,
            QualType T)
      : NamedDecl(K, DC, L, N), DeclType(T) {}

public:
  QualType getType() const { return DeclType; }
  void setType(QualType T) { DeclType = T; }

  static bool classof(const Decl *D) {
    return D->getKind() >= firstValue && D->getKind() <= lastValue;
  }
};

class FieldDecl : public ValueDecl {
public:
  FieldDecl(DeclContext *DC, SourceLocation L, llvm::StringRef N, QualType T)
      : ValueDecl(Field, DC, L, N, T) {}

  RecordDecl *getParent() const;
  unsigned getFieldIndex() const;

  static bool classof(const Decl *D) { return D->getKind() == Field; }
};

class EnumConstantDecl : public ValueDecl {
  int64_t Value = 0;
  std::unique_ptr<ExprAST> Init;

public:
  EnumConstantDecl(DeclContext *DC, SourceLocation L, llvm::StringRef N,
                   QualType T, int64_t V);
  ~EnumConstantDecl() override;

  int64_t getInitVal() const { return Value; }
  void setInitVal(int64_t V) { Value = V; }
  const ExprAST *getInitExpr() const { return Init.get(); }
  void setInitExpr(std::unique_ptr<ExprAST> E);

  static bool classof(const Decl *D) { return D->getKind() == EnumConstant; }
};

class VarDecl : public ValueDecl {
  StorageClass SC;
  std::unique_ptr<ExprAST> Init;
  bool HasStoredInit = false;
  bool HasConstantValue = false;
  int64_t ConstantValue = 0;

protected:
  VarDecl(Kind K, DeclContext *DC, SourceLocation L, llvm::StringRef N,
          QualType T, StorageClass SC);

public:
  VarDecl(DeclContext *DC, SourceLocation L, llvm::StringRef N, QualType T,
          StorageClass SC);
  ~VarDecl() override;

  StorageClass getStorageClass() const { return SC; }
  void setStorageClass(StorageClass S) { SC = S; }

  bool isLocalVarDecl() const;
  bool isFileVarDecl() const;

  const ExprAST *getInit() const { return Init.get(); }
  ExprAST *getInit() { return Init.get(); }
  void setInit(std::unique_ptr<ExprAST> E);
  /// Declarations read from a store remember that an initializer existed.
  void setHasStoredInit(bool V) { HasStoredInit = V; }
  bool hasInit() const { return Init != nullptr || HasStoredInit; }

  /// The folded initializer of a const integer variable. Stored variables
  /// keep only this value.
  bool hasConstantValue() const { return HasConstantValue; }
  int64_t getConstantValue() const { return ConstantValue; }
  void setConstantValue(int64_t V) {
    HasConstantValue = true;
    ConstantValue = V;
  }

  bool isThisDeclarationADefinition() const {
    return SC != StorageClass::Extern || hasInit();
  }

  static bool classof(const Decl *D) {
    return D->getKind() >= firstVar && D->getKind() <= lastVar;
  }
};

class ParmVarDecl : public VarDecl {
public:
  ParmVarDecl(DeclContext *DC, SourceLocation L, llvm::StringRef N, QualType T)
      : VarDecl(ParmVar, DC, L, N, T, StorageClass::None) {}

  static bool classof(const Decl *D) { return D->getKind() == ParmVar; }
};

class FunctionDecl : public NamedDecl, public DeclContext {
  QualType ReturnType;
  StorageClass SC;
  bool Inline = false;
  bool HasStoredBody = false;
  std::vector<ParmVarDecl *> Params;
  std::unique_ptr<BlockStmtAST> Body;

protected:
  FunctionDecl(Kind K, DeclContext *DC, SourceLocation L, llvm::StringRef N,
               QualType Ret, StorageClass SC);

public:
  FunctionDecl(DeclContext *DC, SourceLocation L, llvm::StringRef N,
               QualType Ret, StorageClass SC);
  ~FunctionDecl() override;

  QualType getReturnType() const { return ReturnType; }
  StorageClass getStorageClass() const { return SC; }
  bool isInlineSpecified() const { return Inline; }
  void setInlineSpecified(bool V) { Inline = V; }

  llvm::ArrayRef<ParmVarDecl *> parameters() const { return Params; }
  unsigned getNumParams() const { return static_cast<unsigned>(Params.size()); }
  ParmVarDecl *getParamDecl(unsigned I) const { return Params[I]; }
  /// Replace the parameter list; the new parameters become the visible ones.
  void setParams(llvm::ArrayRef<ParmVarDecl *> NewParams);

  const BlockStmtAST *getBody() const { return Body.get(); }
  void setBody(std::unique_ptr<BlockStmtAST> B);
  void setHasStoredBody(bool V) { HasStoredBody = V; }
  bool isDefined() const { return Body != nullptr || HasStoredBody; }

  /// Parameter types (and method qualifiers) used to tell overloads apart.
  std::string getSignatureString() const;
  static std::string formatSignature(llvm::ArrayRef<QualType> ParamTypes,
                                     bool IsConst);
  /// 'int (int, const ns::S &) const'
  std::string getTypeString() const;

  static bool classof(const Decl *D) {
    return D->getKind() >= firstFunction && D->getKind() <= lastFunction;
  }
};

class CXXMethodDecl : public FunctionDecl {
  bool Static;
  bool Const;

public:
  CXXMethodDecl(RecordDecl *RD, SourceLocation L, llvm::StringRef N,
                QualType Ret, bool IsStatic, bool IsConst);

  bool isStatic() const { return Static; }
  bool isConst() const { return Const; }
  RecordDecl *getParent() const;

  static bool classof(const Decl *D) { return D->getKind() == CXXMethod; }
};

#endif // DECLCACHE_AST_DECL_H
