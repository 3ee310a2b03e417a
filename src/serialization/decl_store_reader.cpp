// This file implements DeclStore, the read side of a declaration store.

#include "serialization/decl_store_reader.h"

#include <algorithm>

#include "file_manager.h"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/Endian.h"

namespace serialization {

static llvm::Error makeError(const llvm::Twine &Message) {
  return llvm::createStringError(llvm::inconvertibleErrorCode(), Message);
}

static std::string charsToString(llvm::ArrayRef<uint64_t> Values) {
  std::string Result;
  Result.reserve(Values.size());
  for (uint64_t C : Values)
    Result += static_cast<char>(C);
  return Result;
}

std::string RecordReader::readString() {
  uint64_t Length = readInt();
  if (Length > Record.size() - std::min<std::size_t>(Idx, Record.size())) {
    Malformed = true;
    Idx = static_cast<unsigned>(Record.size());
    return std::string();
  }
  std::string Result = charsToString(Record.slice(Idx, Length));
  Idx += static_cast<unsigned>(Length);
  return Result;
}

DeclStore::DeclStore(std::unique_ptr<llvm::MemoryBuffer> Buf)
    : Buffer(std::move(Buf)), FileName(Buffer->getBufferIdentifier().str()),
      Stream(Buffer->getMemBufferRef()) {}

llvm::Expected<std::unique_ptr<DeclStore>> DeclStore::open(llvm::StringRef Path) {
  llvm::ErrorOr<std::unique_ptr<llvm::MemoryBuffer>> BufferOrErr =
      llvm::MemoryBuffer::getFile(Path, /*IsText=*/false,
                                  /*RequiresNullTerminator=*/false);
  if (!BufferOrErr)
    return makeError("unable to read precompiled file '" + Path + "': " +
                     BufferOrErr.getError().message());
  return create(std::move(*BufferOrErr));
}

llvm::Expected<std::unique_ptr<DeclStore>>
DeclStore::create(std::unique_ptr<llvm::MemoryBuffer> Buffer) {
  std::unique_ptr<DeclStore> Store(new DeclStore(std::move(Buffer)));
  if (llvm::Error Err = Store->readStore())
    return std::move(Err);
  return std::move(Store);
}

const char *DeclStore::getKindDescription() const {
  return isModule() ? "module file" : "precompiled header";
}

llvm::StringRef DeclStore::getInputFilePath(unsigned Index) const {
  if (Index == 0 || Index > InputFiles.size())
    return llvm::StringRef();
  return InputFiles[Index - 1].Path;
}

llvm::Error DeclStore::readStore() {
  for (char SignatureChar : StoreSignature) {
    llvm::Expected<llvm::SimpleBitstreamCursor::word_t> Byte = Stream.Read(8);
    if (!Byte)
      return Byte.takeError();
    if (*Byte != static_cast<unsigned char>(SignatureChar))
      return makeError("'" + FileName + "' is not a declaration store");
  }

  bool SawControlBlock = false;
  bool SawASTBlock = false;
  while (!Stream.AtEndOfStream()) {
    llvm::Expected<llvm::BitstreamEntry> MaybeEntry = Stream.advance();
    if (!MaybeEntry)
      return MaybeEntry.takeError();
    llvm::BitstreamEntry Entry = MaybeEntry.get();
    if (Entry.Kind != llvm::BitstreamEntry::SubBlock)
      return makeError("malformed block record in '" + FileName + "'");

    switch (Entry.ID) {
      case CONTROL_BLOCK_ID:
        if (llvm::Error Err = readControlBlock())
          return Err;
        SawControlBlock = true;
        break;
      case AST_BLOCK_ID:
        if (!SawControlBlock)
          return makeError("'" + FileName + "' has no control block");
        if (llvm::Error Err = readASTBlock())
          return Err;
        SawASTBlock = true;
        break;
      default:
        if (llvm::Error Err = Stream.SkipBlock())
          return Err;
        break;
    }
  }

  if (!SawASTBlock)
    return makeError("'" + FileName + "' has no declarations block");
  return llvm::Error::success();
}

llvm::Error DeclStore::readControlBlock() {
  if (llvm::Error Err = Stream.EnterSubBlock(CONTROL_BLOCK_ID))
    return Err;

  llvm::SmallVector<uint64_t, 64> Record;
  while (true) {
    llvm::Expected<llvm::BitstreamEntry> MaybeEntry = Stream.advance();
    if (!MaybeEntry)
      return MaybeEntry.takeError();
    llvm::BitstreamEntry Entry = MaybeEntry.get();

    switch (Entry.Kind) {
      case llvm::BitstreamEntry::Error:
        return makeError("malformed control block in '" + FileName + "'");
      case llvm::BitstreamEntry::EndBlock:
        return llvm::Error::success();
      case llvm::BitstreamEntry::SubBlock:
        if (llvm::Error Err = Stream.SkipBlock())
          return Err;
        continue;
      case llvm::BitstreamEntry::Record:
        break;
    }

    Record.clear();
    llvm::Expected<unsigned> MaybeCode = Stream.readRecord(Entry.ID, Record);
    if (!MaybeCode)
      return MaybeCode.takeError();

    switch (*MaybeCode) {
      case METADATA:
        if (Record.size() < 3)
          return makeError("malformed metadata record in '" + FileName + "'");
        if (Record[0] != VersionMajor)
          return makeError("'" + FileName + "' uses store format version " +
                           llvm::Twine(Record[0]) + ", expected version " +
                           llvm::Twine(VersionMajor));
        if (Record[2] > static_cast<uint64_t>(StoreKind::Module))
          return makeError("'" + FileName + "' has an unknown store kind");
        Kind = static_cast<StoreKind>(Record[2]);
        break;
      case MODULE_NAME:
        ModuleName = charsToString(Record);
        break;
      case ORIGINAL_FILE:
        OriginalFile = charsToString(Record);
        break;
      case INPUT_FILE: {
        if (Record.size() < 2)
          return makeError("malformed input file record in '" + FileName + "'");
        InputFileInfo Info;
        Info.Size = Record[0];
        Info.ContentHash = Record[1];
        Info.Path = charsToString(llvm::makeArrayRef(Record).drop_front(2));
        InputFiles.push_back(std::move(Info));
        break;
      }
      case PP_STATE: {
        RecordReader Reader(Record);
        uint64_t NumOnceOnly = Reader.readInt();
        for (uint64_t I = 0; I != NumOnceOnly && !Reader.isMalformed(); ++I)
          OnceOnlyInputFiles.push_back(static_cast<unsigned>(Reader.readInt()));
        uint64_t NumMacros = Reader.readInt();
        for (uint64_t I = 0; I != NumMacros && !Reader.isMalformed(); ++I)
          DefinedMacros.push_back(Reader.readString());
        if (Reader.isMalformed())
          return makeError("malformed preprocessor state in '" + FileName + "'");
        break;
      }
      default:
        break;
    }
  }
}

llvm::Error DeclStore::readASTBlock() {
  if (llvm::Error Err = Stream.EnterSubBlock(AST_BLOCK_ID))
    return Err;

  llvm::SmallVector<uint64_t, 64> Record;
  bool SawDecls = false;
  while (true) {
    llvm::Expected<llvm::BitstreamEntry> MaybeEntry = Stream.advance();
    if (!MaybeEntry)
      return MaybeEntry.takeError();
    llvm::BitstreamEntry Entry = MaybeEntry.get();

    switch (Entry.Kind) {
      case llvm::BitstreamEntry::Error:
        return makeError("malformed declarations block in '" + FileName + "'");
      case llvm::BitstreamEntry::EndBlock:
        if (!SawDecls || !LookupTable)
          return makeError("incomplete declarations block in '" + FileName + "'");
        return llvm::Error::success();
      case llvm::BitstreamEntry::SubBlock:
        if (Entry.ID == DECLS_BLOCK_ID) {
          // Keep a cursor at the start of the block and skip it here;
          // records are read on demand.
          DeclsCursor = Stream;
          if (llvm::Error Err = Stream.SkipBlock())
            return Err;
          if (llvm::Error Err = DeclsCursor.EnterSubBlock(DECLS_BLOCK_ID))
            return Err;
          SawDecls = true;
        } else if (llvm::Error Err = Stream.SkipBlock()) {
          return Err;
        }
        continue;
      case llvm::BitstreamEntry::Record:
        break;
    }

    Record.clear();
    llvm::StringRef Blob;
    llvm::Expected<unsigned> MaybeCode = Stream.readRecord(Entry.ID, Record, &Blob);
    if (!MaybeCode)
      return MaybeCode.takeError();

    switch (*MaybeCode) {
      case DECL_OFFSETS: {
        if (Record.empty() || Blob.size() != Record[0] * 8)
          return makeError("malformed declaration offsets in '" + FileName + "'");
        const unsigned char *Data = Blob.bytes_begin();
        DeclOffsets.clear();
        for (uint64_t I = 0; I < Record[0]; ++I)
          DeclOffsets.push_back(
              llvm::support::endian::readNext<uint64_t, llvm::support::little,
                                              llvm::support::unaligned>(Data));
        break;
      }
      case LOOKUP_TABLE:
        if (Record.empty() || Record[0] == 0 || Record[0] >= Blob.size())
          return makeError("malformed lookup table in '" + FileName + "'");
        LookupTable.reset(OnDiskLookupTable::Create(
            Blob.bytes_begin() + Record[0], Blob.bytes_begin()));
        break;
      case TU_DECLS:
        TopLevelDecls.assign(Record.begin(), Record.end());
        break;
      default:
        break;
    }
  }
}

std::vector<DeclID> DeclStore::lookup(llvm::StringRef QualifiedName) {
  ++NumLookupProbes;
  if (!LookupTable)
    return {};
  auto It = LookupTable->find(QualifiedName);
  if (It == LookupTable->end())
    return {};
  ++NumLookupHits;
  return *It;
}

llvm::Expected<unsigned>
DeclStore::readDeclRecord(DeclID ID, llvm::SmallVectorImpl<uint64_t> &Record) {
  if (ID == TranslationUnitID || ID > DeclOffsets.size())
    return makeError("invalid declaration ID " + llvm::Twine(ID) + " in '" +
                     FileName + "'");

  if (llvm::Error Err = DeclsCursor.JumpToBit(DeclOffsets[ID - 1]))
    return std::move(Err);
  llvm::Expected<unsigned> MaybeAbbrev = DeclsCursor.ReadCode();
  if (!MaybeAbbrev)
    return MaybeAbbrev.takeError();
  if (*MaybeAbbrev != llvm::bitc::UNABBREV_RECORD)
    return makeError("malformed declaration record " + llvm::Twine(ID) +
                     " in '" + FileName + "'");

  Record.clear();
  return DeclsCursor.readRecord(*MaybeAbbrev, Record);
}

llvm::Error DeclStore::validateInputFiles(const FileManager &Files) const {
  for (const InputFileInfo &Input : InputFiles) {
    uint64_t Size = 0;
    uint64_t Hash = 0;
    if (!Files.probeFile(Input.Path, Size, Hash) || Size != Input.Size ||
        Hash != Input.ContentHash)
      return makeError("file '" + Input.Path +
                       "' has been modified since the " + getKindDescription() +
                       " '" + FileName + "' was built");
  }
  return llvm::Error::success();
}

} // namespace serialization
