// This file implements DeclStoreWriter, which serializes a parsed unit into a
// declaration store.

#include "serialization/decl_store_writer.h"

#include <cstdio>
#include <set>
#include <string>

#include "ast/ast_context.h"
#include "ast/decl.h"
#include "compiler_session.h"
#include "file_manager.h"
#include "serialization/lookup_table.h"
#include "serialization/odr_hash.h"

#include "llvm/Bitstream/BitstreamWriter.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Endian.h"
#include "llvm/Support/EndianStream.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/OnDiskHashTable.h"
#include "llvm/Support/raw_ostream.h"

namespace serialization {

DeclStoreWriter::DeclStoreWriter(ASTContext &Ctx, FileManager &Files,
                                 StoreKind Kind, std::string ModuleName)
    : Ctx(Ctx), Files(Files), Kind(Kind), ModuleName(std::move(ModuleName)) {}

// Declarations get IDs in a pre-order walk, so a parent always has a smaller
// ID than its children.
void DeclStoreWriter::collectDecls(const DeclContext *DC) {
  for (const Decl *D : DC->decls()) {
    if (DeclIDs.count(D))
      continue;
    DeclsToEmit.push_back(D);
    DeclID ID = static_cast<DeclID>(DeclsToEmit.size());
    DeclIDs[D] = ID;
    if (DC->isTranslationUnit())
      TopLevelDecls.push_back(ID);
    if (const DeclContext *Inner = Decl::castToDeclContext(D))
      collectDecls(Inner);
  }
}

void DeclStoreWriter::addLookupEntry(const std::string &Key, DeclID ID) {
  std::vector<DeclID> &IDs = LookupEntries[Key];
  for (DeclID Existing : IDs) {
    if (Existing == ID)
      return;
  }
  IDs.push_back(ID);
}

void DeclStoreWriter::buildLookupEntries() {
  for (const Decl *D : DeclsToEmit) {
    const auto *ND = llvm::dyn_cast<NamedDecl>(D);
    if (!ND || ND->isAnonymous())
      continue;
    const DeclContext *DC = D->getDeclContext();
    // Record members and parameters are reached through their owner.
    if (!DC->isFileContext() && !DC->isEnum())
      continue;

    DeclID ID = DeclIDs.lookup(D);
    addLookupEntry(getLookupKey(DC, ND->getName()), ID);
    if (DC->isEnum() && !static_cast<const EnumDecl *>(DC)->isScoped())
      addLookupEntry(getLookupKey(DC->getParent(), ND->getName()), ID);
  }
}

DeclID DeclStoreWriter::getDeclID(const Decl *D) const {
  if (!D || llvm::isa<TranslationUnitDecl>(D))
    return TranslationUnitID;
  return DeclIDs.lookup(D);
}

void DeclStoreWriter::addString(llvm::StringRef Str, RecordData &Record) {
  Record.push_back(Str.size());
  Record.append(Str.begin(), Str.end());
}

void DeclStoreWriter::addSourceLocation(SourceLocation Loc, RecordData &Record) {
  auto It = FileIndices.find(Loc.file);
  Record.push_back(It == FileIndices.end() ? 0 : It->second);
  Record.push_back(Loc.line);
  Record.push_back(Loc.column);
}

void DeclStoreWriter::addType(QualType T, RecordData &Record) {
  if (T.isNull()) {
    Record.push_back(static_cast<uint64_t>(TypeCode::Null));
    Record.push_back(0);
    return;
  }

  const Type *Ty = T.getTypePtr();
  switch (Ty->getTypeClass()) {
    case Type::Builtin:
      Record.push_back(static_cast<uint64_t>(TypeCode::Builtin));
      Record.push_back(T.isConstQualified());
      Record.push_back(static_cast<uint64_t>(llvm::cast<BuiltinType>(Ty)->getKind()));
      return;
    case Type::Pointer:
      Record.push_back(static_cast<uint64_t>(TypeCode::Pointer));
      Record.push_back(T.isConstQualified());
      addType(llvm::cast<PointerType>(Ty)->getPointee(), Record);
      return;
    case Type::LValueReference:
      Record.push_back(static_cast<uint64_t>(TypeCode::LValueReference));
      Record.push_back(T.isConstQualified());
      addType(llvm::cast<LValueReferenceType>(Ty)->getPointee(), Record);
      return;
    case Type::ConstantArray: {
      const auto *Array = llvm::cast<ConstantArrayType>(Ty);
      Record.push_back(static_cast<uint64_t>(TypeCode::ConstantArray));
      Record.push_back(T.isConstQualified());
      Record.push_back(Array->getSize());
      addType(Array->getElementType(), Record);
      return;
    }
    case Type::Record:
      Record.push_back(static_cast<uint64_t>(TypeCode::Record));
      Record.push_back(T.isConstQualified());
      Record.push_back(getDeclID(llvm::cast<RecordType>(Ty)->getDecl()));
      return;
    case Type::Enum:
      Record.push_back(static_cast<uint64_t>(TypeCode::Enum));
      Record.push_back(T.isConstQualified());
      Record.push_back(getDeclID(llvm::cast<EnumType>(Ty)->getDecl()));
      return;
    case Type::Typedef:
      Record.push_back(static_cast<uint64_t>(TypeCode::Typedef));
      Record.push_back(T.isConstQualified());
      Record.push_back(getDeclID(llvm::cast<TypedefType>(Ty)->getDecl()));
      return;
  }
}

unsigned DeclStoreWriter::writeDecl(const Decl *D, RecordData &Record) {
  const auto *ND = llvm::cast<NamedDecl>(D);
  Record.push_back(getDeclID(Decl::castFromDeclContext(D->getDeclContext())));
  addSourceLocation(D->getLocation(), Record);
  Record.push_back(static_cast<uint64_t>(D->getAccess()));
  addString(ND->getName(), Record);

  switch (D->getKind()) {
    case Decl::Namespace:
      return DECL_NAMESPACE;

    case Decl::CXXRecord: {
      const auto *RD = llvm::cast<RecordDecl>(D);
      Record.push_back(getOrComputeODRHash(RD));
      Record.push_back(static_cast<uint64_t>(RD->getTagKind()));
      Record.push_back(RD->isCompleteDefinition());
      Record.push_back(RD->bases().size());
      for (const CXXBaseSpecifier &Base : RD->bases()) {
        addType(Base.BaseType, Record);
        Record.push_back(static_cast<uint64_t>(Base.Access));
      }
      RecordData Members;
      for (const Decl *Member : RD->decls())
        Members.push_back(getDeclID(Member));
      Record.push_back(Members.size());
      Record.append(Members.begin(), Members.end());
      return DECL_CXX_RECORD;
    }

    case Decl::Enum: {
      const auto *ED = llvm::cast<EnumDecl>(D);
      Record.push_back(getOrComputeODRHash(ED));
      Record.push_back(ED->isScoped());
      addType(ED->getIntegerType(), Record);
      std::vector<EnumConstantDecl *> Constants = ED->enumerators();
      Record.push_back(Constants.size());
      for (const EnumConstantDecl *ECD : Constants)
        Record.push_back(getDeclID(ECD));
      return DECL_ENUM;
    }

    case Decl::EnumConstant:
      // Values are stored as two's complement.
      Record.push_back(
          static_cast<uint64_t>(llvm::cast<EnumConstantDecl>(D)->getInitVal()));
      return DECL_ENUM_CONSTANT;

    case Decl::Typedef:
    case Decl::TypeAlias:
      Record.push_back(getOrComputeODRHash(ND));
      addType(llvm::cast<TypedefNameDecl>(D)->getUnderlyingType(), Record);
      return D->getKind() == Decl::Typedef ? DECL_TYPEDEF : DECL_TYPE_ALIAS;

    case Decl::Field:
      addType(llvm::cast<FieldDecl>(D)->getType(), Record);
      return DECL_FIELD;

    case Decl::Var: {
      const auto *VD = llvm::cast<VarDecl>(D);
      Record.push_back(getOrComputeODRHash(VD));
      addType(VD->getType(), Record);
      Record.push_back(static_cast<uint64_t>(VD->getStorageClass()));
      Record.push_back(VD->hasInit());
      Record.push_back(VD->hasConstantValue());
      Record.push_back(static_cast<uint64_t>(VD->getConstantValue()));
      return DECL_VAR;
    }

    case Decl::ParmVar:
      addType(llvm::cast<ParmVarDecl>(D)->getType(), Record);
      return DECL_PARM_VAR;

    case Decl::Function:
    case Decl::CXXMethod: {
      const auto *FD = llvm::cast<FunctionDecl>(D);
      Record.push_back(getOrComputeODRHash(FD));
      addType(FD->getReturnType(), Record);
      Record.push_back(static_cast<uint64_t>(FD->getStorageClass()));
      Record.push_back(FD->isInlineSpecified());
      Record.push_back(FD->isDefined());
      Record.push_back(FD->getNumParams());
      for (const ParmVarDecl *Param : FD->parameters())
        Record.push_back(getDeclID(Param));
      if (const auto *MD = llvm::dyn_cast<CXXMethodDecl>(FD)) {
        Record.push_back(MD->isStatic());
        Record.push_back(MD->isConst());
        return DECL_CXX_METHOD;
      }
      return DECL_FUNCTION;
    }

    case Decl::TranslationUnit:
      break;
  }
  return 0;
}

void DeclStoreWriter::writeControlBlock(llvm::BitstreamWriter &Stream,
                                        llvm::StringRef OriginalFile) {
  Stream.EnterSubblock(CONTROL_BLOCK_ID, 3);

  RecordData Record;
  Record.push_back(VersionMajor);
  Record.push_back(VersionMinor);
  Record.push_back(static_cast<uint64_t>(Kind));
  Stream.EmitRecord(METADATA, Record);

  if (!ModuleName.empty()) {
    Record.clear();
    Record.append(ModuleName.begin(), ModuleName.end());
    Stream.EmitRecord(MODULE_NAME, Record);
  }

  Record.clear();
  Record.append(OriginalFile.begin(), OriginalFile.end());
  Stream.EmitRecord(ORIGINAL_FILE, Record);

  for (const auto &Entry : FileIndices) {
    const FileEntry *File = Files.getFile(Entry.first);
    if (!File)
      continue;
    Record.clear();
    Record.push_back(File->size);
    Record.push_back(File->contentHash);
    Record.append(File->path.begin(), File->path.end());
    Stream.EmitRecord(INPUT_FILE, Record);
  }

  // Preprocessor state at the end of the prefix, so that a unit using the
  // store skips guarded and once-only headers it includes again.
  Record.clear();
  RecordData OnceOnly;
  for (const auto &Entry : FileIndices) {
    const FileEntry *File = Files.getFile(Entry.first);
    if (File && File->pragmaOnce)
      OnceOnly.push_back(Entry.second);
  }
  Record.push_back(OnceOnly.size());
  Record.append(OnceOnly.begin(), OnceOnly.end());
  const std::set<std::string> &Macros = currentLexer().definedMacros;
  Record.push_back(Macros.size());
  for (const std::string &Name : Macros)
    addString(Name, Record);
  Stream.EmitRecord(PP_STATE, Record);

  Stream.ExitBlock();
}

void DeclStoreWriter::writeDeclsBlock(llvm::BitstreamWriter &Stream,
                                      std::vector<uint64_t> &Offsets) {
  Stream.EnterSubblock(DECLS_BLOCK_ID, 3);
  RecordData Record;
  for (const Decl *D : DeclsToEmit) {
    Record.clear();
    Offsets.push_back(Stream.GetCurrentBitNo());
    unsigned Code = writeDecl(D, Record);
    Stream.EmitRecord(Code, Record);
  }
  Stream.ExitBlock();
}

void DeclStoreWriter::writeASTBlock(llvm::BitstreamWriter &Stream) {
  using namespace llvm;

  Stream.EnterSubblock(AST_BLOCK_ID, 3);

  std::vector<uint64_t> Offsets;
  writeDeclsBlock(Stream, Offsets);

  {
    auto Abbrev = std::make_shared<BitCodeAbbrev>();
    Abbrev->Add(BitCodeAbbrevOp(DECL_OFFSETS));
    Abbrev->Add(BitCodeAbbrevOp(BitCodeAbbrevOp::VBR, 6)); // # of declarations
    Abbrev->Add(BitCodeAbbrevOp(BitCodeAbbrevOp::Blob));
    unsigned AbbrevID = Stream.EmitAbbrev(std::move(Abbrev));

    SmallString<256> Blob;
    raw_svector_ostream Out(Blob);
    support::endian::Writer LE(Out, support::little);
    for (uint64_t Offset : Offsets)
      LE.write<uint64_t>(Offset);

    uint64_t Vals[] = {DECL_OFFSETS, Offsets.size()};
    Stream.EmitRecordWithBlob(AbbrevID, Vals, Blob);
  }

  {
    // The generator keeps references into LookupEntries until Emit.
    OnDiskChainedHashTableGenerator<LookupTableWriterTrait> Generator;
    for (const auto &Entry : LookupEntries)
      Generator.insert(Entry.first, Entry.second);

    SmallString<4096> Table;
    uint32_t BucketOffset;
    {
      raw_svector_ostream Out(Table);
      // Make sure that no bucket is at offset 0.
      support::endian::write<uint32_t>(Out, 0, support::little);
      BucketOffset = Generator.Emit(Out);
    }

    auto Abbrev = std::make_shared<BitCodeAbbrev>();
    Abbrev->Add(BitCodeAbbrevOp(LOOKUP_TABLE));
    Abbrev->Add(BitCodeAbbrevOp(BitCodeAbbrevOp::Fixed, 32)); // bucket offset
    Abbrev->Add(BitCodeAbbrevOp(BitCodeAbbrevOp::Blob));
    unsigned AbbrevID = Stream.EmitAbbrev(std::move(Abbrev));

    uint64_t Vals[] = {LOOKUP_TABLE, BucketOffset};
    Stream.EmitRecordWithBlob(AbbrevID, Vals, Table);
  }

  RecordData Record(TopLevelDecls.begin(), TopLevelDecls.end());
  Stream.EmitRecord(TU_DECLS, Record);

  Stream.ExitBlock();
}

llvm::Error DeclStoreWriter::emit(llvm::SmallVectorImpl<char> &Buffer,
                                  llvm::StringRef OriginalFile) {
  if (Ctx.getExternalSource())
    return llvm::createStringError(
        llvm::inconvertibleErrorCode(),
        "cannot build a precompiled file while other precompiled files are "
        "attached");

  DeclsToEmit.clear();
  DeclIDs.clear();
  TopLevelDecls.clear();
  LookupEntries.clear();
  FileIndices.clear();

  unsigned Index = 0;
  for (unsigned FileID : Files.enteredFiles())
    FileIndices[FileID] = ++Index;

  collectDecls(Ctx.getTranslationUnitDecl());
  buildLookupEntries();

  llvm::BitstreamWriter Stream(Buffer);
  for (char C : StoreSignature)
    Stream.Emit(static_cast<unsigned char>(C), 8);
  writeControlBlock(Stream, OriginalFile);
  writeASTBlock(Stream);

  if (DebugTrace)
    fprintf(stderr, "[serialization] wrote %u declarations, %zu lookup keys\n",
            getNumDeclsWritten(), LookupEntries.size());
  return llvm::Error::success();
}

llvm::Error DeclStoreWriter::writeToFile(llvm::StringRef Path,
                                         llvm::StringRef OriginalFile) {
  llvm::SmallVector<char, 0> Buffer;
  if (llvm::Error Err = emit(Buffer, OriginalFile))
    return Err;

  std::error_code EC;
  llvm::raw_fd_ostream OS(Path, EC, llvm::sys::fs::OF_None);
  if (EC)
    return llvm::createStringError(EC, "unable to open output file '" +
                                           Path.str() + "': " + EC.message());
  OS.write(Buffer.data(), Buffer.size());
  OS.close();
  if (OS.has_error()) {
    EC = OS.error();
    OS.clear_error();
    return llvm::createStringError(EC, "unable to write '" + Path.str() +
                                           "': " + EC.message());
  }
  return llvm::Error::success();
}

} // namespace serialization
