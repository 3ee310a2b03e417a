// This file implements LazyDeclLoader, which materializes stored declarations
// on demand and merges entities shared between stores.

#include "serialization/lazy_loader.h"

#include <cstdio>

#include "ast/ast_context.h"
#include "ast/decl.h"
#include "file_manager.h"
#include "serialization/deserialization_listener.h"
#include "serialization/lookup_table.h"
#include "serialization/odr_hash.h"

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Format.h"

namespace serialization {

static llvm::Error makeError(const llvm::Twine &Message) {
  return llvm::createStringError(llvm::inconvertibleErrorCode(), Message);
}

static AccessSpecifier toAccess(uint64_t V) {
  if (V > static_cast<uint64_t>(AccessSpecifier::Private))
    return AccessSpecifier::None;
  return static_cast<AccessSpecifier>(V);
}

static StorageClass toStorageClass(uint64_t V) {
  if (V > static_cast<uint64_t>(StorageClass::Extern))
    return StorageClass::None;
  return static_cast<StorageClass>(V);
}

void DumpDeserializedDeclsListener::declRead(DeclID, const Decl *D) {
  OS << "PCH DECL: " << D->getDeclKindName() << " - ";
  if (const auto *ND = llvm::dyn_cast<NamedDecl>(D))
    OS << ND->getQualifiedNameAsString();
  OS << '\n';
}

LazyDeclLoader::LazyDeclLoader(ASTContext &Ctx, FileManager &Files)
    : Ctx(Ctx), Files(Files) {}

LazyDeclLoader::~LazyDeclLoader() = default;

void LazyDeclLoader::reportError(llvm::Error Err) {
  reportCompilerError(llvm::toString(std::move(Err)));
}

// Attaching stores -------------------------------------------------------------

llvm::Error LazyDeclLoader::loadStoreFile(llvm::StringRef Path,
                                          StoreKind ExpectedKind) {
  llvm::Expected<std::unique_ptr<DeclStore>> StoreOrErr = DeclStore::open(Path);
  if (!StoreOrErr)
    return StoreOrErr.takeError();

  std::unique_ptr<DeclStore> Store = std::move(*StoreOrErr);
  if (Store->getKind() != ExpectedKind) {
    if (ExpectedKind == StoreKind::PCH)
      return makeError("'" + Path + "' is a module file, not a precompiled header");
    return makeError("'" + Path + "' is a precompiled header, not a module file");
  }
  return attachStore(std::move(Store));
}

llvm::Error LazyDeclLoader::attachStore(std::unique_ptr<DeclStore> Store) {
  for (const StoreState &Attached : Stores) {
    const DeclStore &Other = *Attached.Store;
    if (!Store->isModule() && !Other.isModule())
      return makeError("only one precompiled header may be included");
    if (Store->isModule() && Other.isModule() &&
        !Store->getModuleName().empty() &&
        Store->getModuleName() == Other.getModuleName())
      return makeError("module '" + Store->getModuleName() +
                       "' is already loaded from '" + Other.getFileName() + "'");
  }

  if (ValidateInputFiles) {
    if (llvm::Error Err = Store->validateInputFiles(Files))
      return Err;
  }

  if (!Store->isModule())
    importPreprocessorState(*Store);

  if (DebugTrace)
    fprintf(stderr, "[serialization] attached %s '%s' (%u declarations)\n",
            Store->getKindDescription(), Store->getFileName().str().c_str(),
            Store->getNumDecls());

  StoreState State;
  State.DeclsLoaded.assign(Store->getNumDecls(), nullptr);
  State.Store = std::move(Store);
  Stores.push_back(std::move(State));
  return llvm::Error::success();
}

void LazyDeclLoader::importPreprocessorState(const DeclStore &Store) {
  LexerContext &Lex = currentLexer();
  for (const std::string &Name : Store.getDefinedMacros())
    Lex.definedMacros.insert(Name);
  // A once-only file counts as entered, so a later #include skips it.
  for (unsigned Index : Store.getOnceOnlyInputFiles()) {
    llvm::StringRef Path = Store.getInputFilePath(Index);
    if (Path.empty())
      continue;
    FileEntry *File = Files.getFile(Files.getOrCreateNamedFile(Path.str()));
    File->pragmaOnce = true;
    File->entered = true;
  }
}

// Reading declarations ---------------------------------------------------------

Decl *LazyDeclLoader::getDeclIfLoaded(unsigned StoreIndex, DeclID ID) const {
  if (StoreIndex >= Stores.size() || ID == TranslationUnitID ||
      ID > Stores[StoreIndex].DeclsLoaded.size())
    return nullptr;
  return Stores[StoreIndex].DeclsLoaded[ID - 1];
}

llvm::Expected<Decl *> LazyDeclLoader::getDecl(unsigned StoreIndex, DeclID ID) {
  if (ID == TranslationUnitID)
    return Ctx.getTranslationUnitDecl();

  StoreState &State = Stores[StoreIndex];
  if (ID > State.DeclsLoaded.size())
    return makeError("invalid declaration ID " + llvm::Twine(ID) + " in '" +
                     State.Store->getFileName() + "'");
  if (Decl *D = State.DeclsLoaded[ID - 1])
    return D;

  DeserializingScope Scope(*this);
  return readDecl(StoreIndex, ID);
}

llvm::Expected<DeclContext *> LazyDeclLoader::getDeclContext(unsigned StoreIndex,
                                                            DeclID ID) {
  llvm::Expected<Decl *> MaybeDecl = getDecl(StoreIndex, ID);
  if (!MaybeDecl)
    return MaybeDecl.takeError();
  DeclContext *DC = *MaybeDecl ? Decl::castToDeclContext(*MaybeDecl) : nullptr;
  if (!DC)
    return makeError("declaration " + llvm::Twine(ID) + " in '" +
                     Stores[StoreIndex].Store->getFileName() +
                     "' is not a declaration context");
  return DC;
}

LazyDeclLoader::DeclHeader LazyDeclLoader::readDeclHeader(unsigned StoreIndex,
                                                          RecordReader &Reader) {
  DeclHeader Header;
  Header.ParentID = static_cast<DeclID>(Reader.readInt());
  unsigned FileIndex = static_cast<unsigned>(Reader.readInt());
  Header.Loc.line = Reader.readInt();
  Header.Loc.column = Reader.readInt();
  llvm::StringRef Path = Stores[StoreIndex].Store->getInputFilePath(FileIndex);
  if (!Path.empty())
    Header.Loc.file = Files.getOrCreateNamedFile(Path.str());
  Header.Access = toAccess(Reader.readInt());
  Header.Name = Reader.readString();
  return Header;
}

llvm::Expected<QualType> LazyDeclLoader::readType(unsigned StoreIndex,
                                                  RecordReader &Reader) {
  auto Code = static_cast<TypeCode>(Reader.readInt());
  bool IsConst = Reader.readBool();

  QualType Result;
  switch (Code) {
    case TypeCode::Null:
      return QualType();
    case TypeCode::Builtin: {
      uint64_t Kind = Reader.readInt();
      if (Kind > static_cast<uint64_t>(BuiltinKind::NullPtr))
        return makeError("unknown builtin type " + llvm::Twine(Kind));
      Result = Ctx.getBuiltinType(static_cast<BuiltinKind>(Kind));
      break;
    }
    case TypeCode::Pointer:
    case TypeCode::LValueReference: {
      llvm::Expected<QualType> Pointee = readType(StoreIndex, Reader);
      if (!Pointee)
        return Pointee.takeError();
      Result = Code == TypeCode::Pointer ? Ctx.getPointerType(*Pointee)
                                         : Ctx.getLValueReferenceType(*Pointee);
      break;
    }
    case TypeCode::ConstantArray: {
      uint64_t Size = Reader.readInt();
      llvm::Expected<QualType> Element = readType(StoreIndex, Reader);
      if (!Element)
        return Element.takeError();
      Result = Ctx.getConstantArrayType(*Element, Size);
      break;
    }
    case TypeCode::Record:
    case TypeCode::Enum:
    case TypeCode::Typedef: {
      // Only the declaration itself is read here; a record's members wait
      // until something needs the record to be complete.
      DeclID ID = static_cast<DeclID>(Reader.readInt());
      llvm::Expected<Decl *> D = getDecl(StoreIndex, ID);
      if (!D)
        return D.takeError();
      const auto *TD = llvm::dyn_cast_or_null<TypeDecl>(*D);
      if (!TD)
        return makeError("type refers to declaration " + llvm::Twine(ID) +
                         ", which does not declare a type");
      Result = Ctx.getTypeDeclType(TD);
      break;
    }
    default:
      return makeError("unknown type code " +
                       llvm::Twine(static_cast<unsigned>(Code)));
  }
  return IsConst ? Result.withConst() : Result;
}

llvm::Error LazyDeclLoader::readParams(unsigned StoreIndex,
                                       llvm::ArrayRef<DeclID> IDs,
                                       std::vector<StoredParam> &Params) {
  DeclStore &Store = *Stores[StoreIndex].Store;
  llvm::SmallVector<uint64_t, 32> Record;
  for (DeclID ParamID : IDs) {
    llvm::Expected<unsigned> Code = Store.readDeclRecord(ParamID, Record);
    if (!Code)
      return Code.takeError();
    if (*Code != DECL_PARM_VAR)
      return makeError("declaration " + llvm::Twine(ParamID) + " in '" +
                       Store.getFileName() + "' is not a parameter");

    RecordReader Reader(Record);
    StoredParam Param;
    Param.ID = ParamID;
    Param.Header = readDeclHeader(StoreIndex, Reader);
    llvm::Expected<QualType> Type = readType(StoreIndex, Reader);
    if (!Type)
      return Type.takeError();
    if (Reader.isMalformed())
      return makeError("malformed parameter record in '" + Store.getFileName() +
                       "'");
    Param.Type = *Type;
    Params.push_back(std::move(Param));
  }
  return llvm::Error::success();
}

bool LazyDeclLoader::ownsMembersOf(const Decl *Parent, unsigned StoreIndex,
                                   DeclID ParentID) const {
  const DeclContext *DC = Decl::castToDeclContext(Parent);
  if (!DC || DC->isFileContext())
    return true;
  return Parent->isFromStore() && Parent->getOwningStoreIndex() == StoreIndex &&
         Parent->getStoreID() == ParentID;
}

// A store whose copy of a record or enum lost to another store's copy maps
// its members by name onto the surviving declaration.
Decl *LazyDeclLoader::findMemberFromOtherStore(DeclContext *DC, unsigned Code,
                                               llvm::StringRef Name,
                                               const std::string &Signature) {
  Decl *Owner = Decl::castFromDeclContext(DC);
  if (auto *RD = llvm::dyn_cast<RecordDecl>(Owner)) {
    if (RD->hasExternalDefinitionPending())
      completeRecordDefinition(RD);
  }

  for (Decl *Member : DC->decls()) {
    auto *ND = llvm::dyn_cast<NamedDecl>(Member);
    if (!ND || ND->getName() != Name)
      continue;
    switch (Code) {
      case DECL_FIELD:
        if (llvm::isa<FieldDecl>(ND))
          return ND;
        break;
      case DECL_ENUM_CONSTANT:
        if (llvm::isa<EnumConstantDecl>(ND))
          return ND;
        break;
      case DECL_CXX_METHOD:
        if (auto *MD = llvm::dyn_cast<CXXMethodDecl>(ND)) {
          if (MD->getSignatureString() == Signature)
            return MD;
        }
        break;
      default:
        break;
    }
  }
  return nullptr;
}

void LazyDeclLoader::registerDecl(unsigned StoreIndex, DeclID ID, Decl *D,
                                  bool IsNew) {
  StoreState &State = Stores[StoreIndex];
  if (!State.DeclsLoaded[ID - 1]) {
    State.DeclsLoaded[ID - 1] = D;
    ++State.NumDeclsLoaded;
  }
  if (IsNew)
    PendingNotifications.emplace_back(ID, D);

  if (DebugTrace) {
    const auto *ND = llvm::dyn_cast<NamedDecl>(D);
    fprintf(stderr, "[serialization] %s %s '%s' (ID %u of '%s')\n",
            IsNew ? "read" : "merged", D->getDeclKindName(),
            ND ? ND->getQualifiedNameAsString().c_str() : "",
            static_cast<unsigned>(ID),
            State.Store->getFileName().str().c_str());
  }
}

std::string LazyDeclLoader::getProviderName(const Decl *D) const {
  if (D->isFromStore() && D->getOwningStoreIndex() < Stores.size())
    return Stores[D->getOwningStoreIndex()].Store->getFileName().str();
  return Files.getPath(D->getLocation().file);
}

void LazyDeclLoader::diagnoseODRMismatch(const NamedDecl *Existing,
                                         unsigned StoreIndex,
                                         SourceLocation NewLoc) {
  reportCompilerErrorAt(NewLoc, "'" + Existing->getQualifiedNameAsString() +
                                    "' has different definitions in different "
                                    "precompiled files");
  reportCompilerNote(Existing->getLocation(),
                     "definition in '" + getProviderName(Existing) + "'");
  reportCompilerNote(NewLoc, "definition in '" +
                                 Stores[StoreIndex].Store->getFileName().str() +
                                 "'");
}

llvm::Expected<Decl *> LazyDeclLoader::readDecl(unsigned StoreIndex, DeclID ID) {
  StoreState &State = Stores[StoreIndex];
  DeclStore &Store = *State.Store;

  llvm::SmallVector<uint64_t, 64> Record;
  llvm::Expected<unsigned> MaybeCode = Store.readDeclRecord(ID, Record);
  if (!MaybeCode)
    return MaybeCode.takeError();
  const unsigned Code = *MaybeCode;

  RecordReader Reader(Record);
  DeclHeader Header = readDeclHeader(StoreIndex, Reader);

  // The parent comes first, so "ns::S" is announced after "ns".
  llvm::Expected<DeclContext *> MaybeDC = getDeclContext(StoreIndex, Header.ParentID);
  if (!MaybeDC)
    return MaybeDC.takeError();
  DeclContext *DC = *MaybeDC;
  Decl *Parent = Decl::castFromDeclContext(DC);

  // Reading the parent reads the enumerators and parameters it owns.
  if (Decl *D = State.DeclsLoaded[ID - 1])
    return D;

  const bool OwnsParent = ownsMembersOf(Parent, StoreIndex, Header.ParentID);
  auto malformed = [&]() {
    return makeError("malformed declaration record " + llvm::Twine(ID) +
                     " in '" + Store.getFileName() + "'");
  };

  switch (Code) {
    case DECL_NAMESPACE: {
      NamespaceDecl *NS = nullptr;
      for (NamedDecl *ND : DC->noloadLookup(Header.Name)) {
        if ((NS = llvm::dyn_cast<NamespaceDecl>(ND)))
          break;
      }
      if (NS) {
        registerDecl(StoreIndex, ID, NS, false);
        return NS;
      }
      NS = Ctx.create<NamespaceDecl>(DC, Header.Loc, Header.Name);
      NS->setOwningStore(StoreIndex, ID);
      DC->addDecl(NS);
      registerDecl(StoreIndex, ID, NS, true);
      return NS;
    }

    case DECL_CXX_RECORD: {
      uint64_t Hash = Reader.readInt();
      TagKind Tag = Reader.readInt() ? TagKind::Class : TagKind::Struct;
      bool IsDefinition = Reader.readBool();
      if (Reader.isMalformed())
        return malformed();

      RecordDecl *Existing = nullptr;
      for (NamedDecl *ND : DC->noloadLookup(Header.Name)) {
        if ((Existing = llvm::dyn_cast<RecordDecl>(ND)))
          break;
      }
      if (Existing) {
        if (IsDefinition) {
          if (!Existing->hasDefinition()) {
            // A forward declaration picks up this store's definition.
            Existing->setTagKind(Tag);
            Existing->setOwningStore(StoreIndex, ID);
            Existing->setODRHash(Hash);
            Existing->setExternalDefinitionPending(true);
          } else if (getOrComputeODRHash(Existing) != Hash) {
            diagnoseODRMismatch(Existing, StoreIndex, Header.Loc);
          }
        }
        registerDecl(StoreIndex, ID, Existing, false);
        return Existing;
      }

      auto *RD = Ctx.create<RecordDecl>(DC, Header.Loc, Header.Name, Tag);
      RD->setOwningStore(StoreIndex, ID);
      RD->setAccess(Header.Access);
      if (IsDefinition) {
        RD->setODRHash(Hash);
        RD->setExternalDefinitionPending(true);
      }
      DC->addDecl(RD);
      registerDecl(StoreIndex, ID, RD, true);
      return RD;
    }

    case DECL_ENUM: {
      uint64_t Hash = Reader.readInt();
      bool Scoped = Reader.readBool();
      llvm::Expected<QualType> Underlying = readType(StoreIndex, Reader);
      if (!Underlying)
        return Underlying.takeError();
      uint64_t NumConstants = Reader.readInt();
      std::vector<DeclID> ConstantIDs;
      for (uint64_t I = 0; I < NumConstants && !Reader.isMalformed(); ++I)
        ConstantIDs.push_back(static_cast<DeclID>(Reader.readInt()));
      if (Reader.isMalformed())
        return malformed();

      EnumDecl *Existing = nullptr;
      if (!Header.Name.empty()) {
        for (NamedDecl *ND : DC->noloadLookup(Header.Name)) {
          if ((Existing = llvm::dyn_cast<EnumDecl>(ND)))
            break;
        }
      }
      if (Existing) {
        if (getOrComputeODRHash(Existing) != Hash)
          diagnoseODRMismatch(Existing, StoreIndex, Header.Loc);
        registerDecl(StoreIndex, ID, Existing, false);
        return Existing;
      }

      auto *ED = Ctx.create<EnumDecl>(DC, Header.Loc, Header.Name, Scoped);
      ED->setIntegerType(*Underlying);
      ED->setOwningStore(StoreIndex, ID);
      ED->setAccess(Header.Access);
      ED->setODRHash(Hash);
      DC->addDecl(ED);
      registerDecl(StoreIndex, ID, ED, true);
      for (DeclID ConstantID : ConstantIDs) {
        llvm::Expected<Decl *> Constant = getDecl(StoreIndex, ConstantID);
        if (!Constant)
          return Constant.takeError();
      }
      ED->setComplete(true);
      return ED;
    }

    case DECL_ENUM_CONSTANT: {
      auto Value = static_cast<int64_t>(Reader.readInt());
      auto *ED = llvm::dyn_cast<EnumDecl>(Parent);
      if (!ED || Reader.isMalformed())
        return malformed();
      if (!OwnsParent) {
        Decl *Match = findMemberFromOtherStore(DC, Code, Header.Name, "");
        if (Match)
          registerDecl(StoreIndex, ID, Match, false);
        return Match;
      }
      auto *ECD = Ctx.create<EnumConstantDecl>(DC, Header.Loc, Header.Name,
                                               Ctx.getEnumType(ED), Value);
      ECD->setOwningStore(StoreIndex, ID);
      ECD->setAccess(Header.Access);
      ED->addDecl(ECD);
      registerDecl(StoreIndex, ID, ECD, true);
      return ECD;
    }

    case DECL_TYPEDEF:
    case DECL_TYPE_ALIAS: {
      uint64_t Hash = Reader.readInt();
      llvm::Expected<QualType> Underlying = readType(StoreIndex, Reader);
      if (!Underlying)
        return Underlying.takeError();
      if (Reader.isMalformed())
        return malformed();

      for (NamedDecl *ND : DC->noloadLookup(Header.Name)) {
        auto *Existing = llvm::dyn_cast<TypedefNameDecl>(ND);
        if (!Existing)
          continue;
        if (!Ctx.hasSameType(Existing->getUnderlyingType(), *Underlying))
          diagnoseODRMismatch(Existing, StoreIndex, Header.Loc);
        registerDecl(StoreIndex, ID, Existing, false);
        return Existing;
      }

      TypedefNameDecl *TD;
      if (Code == DECL_TYPEDEF)
        TD = Ctx.create<TypedefDecl>(DC, Header.Loc, Header.Name, *Underlying);
      else
        TD = Ctx.create<TypeAliasDecl>(DC, Header.Loc, Header.Name, *Underlying);
      TD->setOwningStore(StoreIndex, ID);
      TD->setAccess(Header.Access);
      TD->setODRHash(Hash);
      DC->addDecl(TD);
      registerDecl(StoreIndex, ID, TD, true);
      return TD;
    }

    case DECL_FIELD: {
      auto *RD = llvm::dyn_cast<RecordDecl>(Parent);
      if (!RD)
        return malformed();
      if (!OwnsParent) {
        Decl *Match = findMemberFromOtherStore(DC, Code, Header.Name, "");
        if (Match)
          registerDecl(StoreIndex, ID, Match, false);
        return Match;
      }
      llvm::Expected<QualType> Type = readType(StoreIndex, Reader);
      if (!Type)
        return Type.takeError();
      if (Reader.isMalformed())
        return malformed();
      auto *FD = Ctx.create<FieldDecl>(DC, Header.Loc, Header.Name, *Type);
      FD->setOwningStore(StoreIndex, ID);
      FD->setAccess(Header.Access);
      RD->addDecl(FD);
      registerDecl(StoreIndex, ID, FD, true);
      return FD;
    }

    case DECL_VAR: {
      uint64_t Hash = Reader.readInt();
      llvm::Expected<QualType> Type = readType(StoreIndex, Reader);
      if (!Type)
        return Type.takeError();
      StorageClass SC = toStorageClass(Reader.readInt());
      bool HasInit = Reader.readBool();
      bool HasConstant = Reader.readBool();
      auto Constant = static_cast<int64_t>(Reader.readInt());
      if (Reader.isMalformed())
        return malformed();
      const bool IsDefinition = SC != StorageClass::Extern || HasInit;

      for (NamedDecl *ND : DC->noloadLookup(Header.Name)) {
        auto *Existing = llvm::dyn_cast<VarDecl>(ND);
        if (!Existing || Existing->getKind() != Decl::Var)
          continue;
        if (Existing->isThisDeclarationADefinition() && IsDefinition) {
          if (getOrComputeODRHash(Existing) != Hash)
            diagnoseODRMismatch(Existing, StoreIndex, Header.Loc);
        } else if (IsDefinition) {
          Existing->setStorageClass(SC);
          Existing->setHasStoredInit(HasInit);
          if (HasConstant)
            Existing->setConstantValue(Constant);
          Existing->setODRHash(Hash);
        }
        registerDecl(StoreIndex, ID, Existing, false);
        return Existing;
      }

      auto *VD = Ctx.create<VarDecl>(DC, Header.Loc, Header.Name, *Type, SC);
      VD->setHasStoredInit(HasInit);
      if (HasConstant)
        VD->setConstantValue(Constant);
      VD->setOwningStore(StoreIndex, ID);
      VD->setAccess(Header.Access);
      VD->setODRHash(Hash);
      DC->addDecl(VD);
      registerDecl(StoreIndex, ID, VD, true);
      return VD;
    }

    case DECL_FUNCTION:
    case DECL_CXX_METHOD:
      return readFunction(StoreIndex, ID, Code, DC, Header, Reader);

    case DECL_PARM_VAR:
      // Parameters are read together with their function.
      return makeError("parameter " + llvm::Twine(ID) + " in '" +
                       Store.getFileName() + "' has no function");

    default:
      return makeError("unknown declaration record code " + llvm::Twine(Code) +
                       " in '" + Store.getFileName() + "'");
  }
}

llvm::Expected<Decl *>
LazyDeclLoader::readFunction(unsigned StoreIndex, DeclID ID, unsigned Code,
                             DeclContext *DC, const DeclHeader &Header,
                             RecordReader &Reader) {
  uint64_t Hash = Reader.readInt();
  llvm::Expected<QualType> ReturnType = readType(StoreIndex, Reader);
  if (!ReturnType)
    return ReturnType.takeError();
  StorageClass SC = toStorageClass(Reader.readInt());
  bool Inline = Reader.readBool();
  bool HasBody = Reader.readBool();
  uint64_t NumParams = Reader.readInt();
  std::vector<DeclID> ParamIDs;
  for (uint64_t I = 0; I < NumParams && !Reader.isMalformed(); ++I)
    ParamIDs.push_back(static_cast<DeclID>(Reader.readInt()));
  bool IsStatic = false;
  bool IsConst = false;
  if (Code == DECL_CXX_METHOD) {
    IsStatic = Reader.readBool();
    IsConst = Reader.readBool();
  }

  Decl *Parent = Decl::castFromDeclContext(DC);
  auto *ParentRecord = llvm::dyn_cast<RecordDecl>(Parent);
  if (Reader.isMalformed() || (Code == DECL_CXX_METHOD && !ParentRecord))
    return makeError("malformed function record " + llvm::Twine(ID) + " in '" +
                     Stores[StoreIndex].Store->getFileName() + "'");

  // Overloads are told apart by parameter types, so read those first.
  std::vector<StoredParam> Params;
  if (llvm::Error Err = readParams(StoreIndex, ParamIDs, Params))
    return std::move(Err);
  std::vector<QualType> ParamTypes;
  for (const StoredParam &Param : Params)
    ParamTypes.push_back(Param.Type);
  const std::string Signature = FunctionDecl::formatSignature(ParamTypes, IsConst);

  FunctionDecl *Existing = nullptr;
  if (Code == DECL_CXX_METHOD) {
    if (!ownsMembersOf(Parent, StoreIndex, Header.ParentID)) {
      Existing = llvm::cast_or_null<FunctionDecl>(
          findMemberFromOtherStore(DC, Code, Header.Name, Signature));
      if (!Existing)
        return nullptr;
    }
  } else {
    for (NamedDecl *ND : DC->noloadLookup(Header.Name)) {
      auto *FD = llvm::dyn_cast<FunctionDecl>(ND);
      if (FD && FD->getSignatureString() == Signature) {
        Existing = FD;
        break;
      }
    }
  }

  if (Existing) {
    if (HasBody && !Existing->isDefined()) {
      Existing->setHasStoredBody(true);
      Existing->setODRHash(Hash);
    } else if (HasBody && Code == DECL_FUNCTION &&
               getOrComputeODRHash(Existing) != Hash) {
      diagnoseODRMismatch(Existing, StoreIndex, Header.Loc);
    }
    registerDecl(StoreIndex, ID, Existing, false);
    for (unsigned I = 0; I < Params.size() && I < Existing->getNumParams(); ++I)
      registerDecl(StoreIndex, Params[I].ID, Existing->getParamDecl(I), false);
    return Existing;
  }

  FunctionDecl *FD;
  if (Code == DECL_CXX_METHOD)
    FD = Ctx.create<CXXMethodDecl>(ParentRecord, Header.Loc, Header.Name,
                                   *ReturnType, IsStatic, IsConst);
  else
    FD = Ctx.create<FunctionDecl>(DC, Header.Loc, Header.Name, *ReturnType, SC);
  FD->setInlineSpecified(Inline);
  FD->setHasStoredBody(HasBody);
  FD->setODRHash(Hash);
  FD->setOwningStore(StoreIndex, ID);
  FD->setAccess(Header.Access);
  DC->addDecl(FD);
  registerDecl(StoreIndex, ID, FD, true);

  std::vector<ParmVarDecl *> ParamDecls;
  for (const StoredParam &Param : Params) {
    auto *PVD = Ctx.create<ParmVarDecl>(FD, Param.Header.Loc, Param.Header.Name,
                                        Param.Type);
    PVD->setOwningStore(StoreIndex, Param.ID);
    ParamDecls.push_back(PVD);
  }
  FD->setParams(ParamDecls);
  for (ParmVarDecl *PVD : ParamDecls)
    registerDecl(StoreIndex, PVD->getStoreID(), PVD, true);
  return FD;
}

// ExternalDeclSource -----------------------------------------------------------

bool LazyDeclLoader::findExternalVisibleDeclsByName(DeclContext *DC,
                                                    llvm::StringRef Name) {
  if (Stores.empty())
    return false;

  DeserializingScope Scope(*this);
  ++NumExternalLookups;
  const std::string Key = getLookupKey(DC, Name);
  bool Found = false;
  for (unsigned I = 0; I < Stores.size(); ++I) {
    for (DeclID ID : Stores[I].Store->lookup(Key)) {
      llvm::Expected<Decl *> D = getDecl(I, ID);
      if (!D) {
        reportError(D.takeError());
        continue;
      }
      if (*D)
        Found = true;
    }
  }

  if (DebugTrace && Found)
    fprintf(stderr, "[serialization] lookup '%s' found stored declarations\n",
            Key.c_str());
  return Found;
}

void LazyDeclLoader::completeRecordDefinition(RecordDecl *RD) {
  if (!RD->hasExternalDefinitionPending() || !RD->isFromStore())
    return;

  const unsigned StoreIndex = RD->getOwningStoreIndex();
  const DeclID ID = RD->getStoreID();
  DeclStore &Store = *Stores[StoreIndex].Store;
  DeserializingScope Scope(*this);

  RD->setExternalDefinitionPending(false);

  llvm::SmallVector<uint64_t, 64> Record;
  llvm::Expected<unsigned> Code = Store.readDeclRecord(ID, Record);
  if (!Code) {
    reportError(Code.takeError());
    return;
  }
  if (*Code != DECL_CXX_RECORD) {
    reportError(makeError("declaration " + llvm::Twine(ID) + " in '" +
                          Store.getFileName() + "' is not a record"));
    return;
  }

  RecordReader Reader(Record);
  DeclHeader Header = readDeclHeader(StoreIndex, Reader);
  Reader.readInt(); // ODR hash
  Reader.readInt(); // tag kind
  Reader.readBool(); // is definition

  RD->startDefinition(Header.Loc);
  uint64_t NumBases = Reader.readInt();
  for (uint64_t I = 0; I < NumBases && !Reader.isMalformed(); ++I) {
    llvm::Expected<QualType> BaseType = readType(StoreIndex, Reader);
    if (!BaseType) {
      reportError(BaseType.takeError());
      break;
    }
    CXXBaseSpecifier Base;
    Base.BaseType = *BaseType;
    Base.Access = toAccess(Reader.readInt());
    Base.Loc = Header.Loc;
    RD->addBase(Base);
  }

  uint64_t NumMembers = Reader.readInt();
  for (uint64_t I = 0; I < NumMembers && !Reader.isMalformed(); ++I) {
    llvm::Expected<Decl *> Member =
        getDecl(StoreIndex, static_cast<DeclID>(Reader.readInt()));
    if (!Member)
      reportError(Member.takeError());
  }
  if (Reader.isMalformed())
    reportError(makeError("malformed record definition " + llvm::Twine(ID) +
                          " in '" + Store.getFileName() + "'"));

  RD->completeDefinition();
  ++NumRecordCompletions;
  if (DebugTrace)
    fprintf(stderr, "[serialization] completed definition of '%s' from '%s'\n",
            RD->getQualifiedNameAsString().c_str(),
            Store.getFileName().str().c_str());
}

void LazyDeclLoader::loadAllDeclarations() {
  DeserializingScope Scope(*this);
  for (unsigned I = 0; I < Stores.size(); ++I) {
    for (DeclID ID = 1; ID <= Stores[I].DeclsLoaded.size(); ++ID) {
      llvm::Expected<Decl *> D = getDecl(I, ID);
      if (!D)
        reportError(D.takeError());
    }
  }

  bool Progress = true;
  while (Progress) {
    Progress = false;
    for (StoreState &State : Stores) {
      for (Decl *D : State.DeclsLoaded) {
        auto *RD = llvm::dyn_cast_or_null<RecordDecl>(D);
        if (RD && RD->hasExternalDefinitionPending()) {
          completeRecordDefinition(RD);
          Progress = true;
        }
      }
    }
  }
}

void LazyDeclLoader::finishPendingActions() {
  while (!PendingNotifications.empty()) {
    std::vector<std::pair<DeclID, Decl *>> Pending;
    Pending.swap(PendingNotifications);
    for (const auto &Entry : Pending) {
      for (DeserializationListener *Listener : Listeners)
        Listener->declRead(Entry.first, Entry.second);
    }
  }
}

void LazyDeclLoader::printStatistics(llvm::raw_ostream &OS) {
  OS << "*** Declaration store statistics:\n";
  for (const StoreState &State : Stores) {
    const DeclStore &Store = *State.Store;
    unsigned Total = Store.getNumDecls();
    double Percent = Total ? State.NumDeclsLoaded * 100.0 / Total : 0.0;
    OS << "  " << Store.getFileName() << " (" << Store.getKindDescription()
       << "):\n";
    OS << llvm::format("    %u/%u declarations read (%f%%)\n",
                       State.NumDeclsLoaded, Total, Percent);
    OS << llvm::format("    %u/%u lookup table probes hit\n",
                       Store.getNumLookupHits(), Store.getNumLookupProbes());
  }
  OS << llvm::format("  %u external name lookups\n", NumExternalLookups);
  OS << llvm::format("  %u record definitions completed\n", NumRecordCompletions);
}

} // namespace serialization
