#ifndef DECLCACHE_SERIALIZATION_DECL_STORE_READER_H
#define DECLCACHE_SERIALIZATION_DECL_STORE_READER_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "serialization/decl_store_format.h"
#include "serialization/lookup_table.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Bitstream/BitstreamReader.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/MemoryBuffer.h"

class FileManager;

namespace serialization {

/// One INPUT_FILE record: a file that was textually included when the store
/// was built.
struct InputFileInfo {
  std::string Path;
  uint64_t Size = 0;
  uint64_t ContentHash = 0;
};

/// RecordReader - Sequential cursor over the values of one record.
/// Reading past the end yields zeros and marks the record malformed.
class RecordReader {
  llvm::ArrayRef<uint64_t> Record;
  unsigned Idx = 0;
  bool Malformed = false;

public:
  explicit RecordReader(llvm::ArrayRef<uint64_t> Record) : Record(Record) {}

  uint64_t readInt() {
    if (Idx >= Record.size()) {
      Malformed = true;
      return 0;
    }
    return Record[Idx++];
  }
  bool readBool() { return readInt() != 0; }
  std::string readString();

  bool isMalformed() const { return Malformed; }
  bool atEnd() const { return Idx >= Record.size(); }
};

/// DeclStore - A declaration store opened for reading. Only the control
/// block, the offsets and the lookup table are decoded up front; individual
/// declaration records are read on request.
class DeclStore {
public:
  /// Open the store at Path.
  static llvm::Expected<std::unique_ptr<DeclStore>> open(llvm::StringRef Path);
  /// Read a store held in memory. Name is used in diagnostics.
  static llvm::Expected<std::unique_ptr<DeclStore>>
  create(std::unique_ptr<llvm::MemoryBuffer> Buffer);

  llvm::StringRef getFileName() const { return FileName; }
  StoreKind getKind() const { return Kind; }
  bool isModule() const { return Kind == StoreKind::Module; }
  /// "precompiled header" or "module file", for diagnostics.
  const char *getKindDescription() const;
  llvm::StringRef getModuleName() const { return ModuleName; }
  llvm::StringRef getOriginalFile() const { return OriginalFile; }
  const std::vector<InputFileInfo> &inputFiles() const { return InputFiles; }
  /// Path of the INPUT_FILE with the given 1-based index, or "" for 0.
  llvm::StringRef getInputFilePath(unsigned Index) const;

  /// Macros defined at the end of the stored prefix.
  const std::vector<std::string> &getDefinedMacros() const { return DefinedMacros; }
  /// 1-based INPUT_FILE indices of files marked '#pragma once'.
  const std::vector<unsigned> &getOnceOnlyInputFiles() const {
    return OnceOnlyInputFiles;
  }

  unsigned getNumDecls() const { return static_cast<unsigned>(DeclOffsets.size()); }
  llvm::ArrayRef<DeclID> getTopLevelDecls() const { return TopLevelDecls; }

  /// IDs of the declarations stored under a qualified name.
  std::vector<DeclID> lookup(llvm::StringRef QualifiedName);
  unsigned getNumLookupProbes() const { return NumLookupProbes; }
  unsigned getNumLookupHits() const { return NumLookupHits; }

  /// Read the record of declaration ID into Record and return its code.
  llvm::Expected<unsigned> readDeclRecord(DeclID ID,
                                          llvm::SmallVectorImpl<uint64_t> &Record);

  /// Compare every input file against the file system.
  llvm::Error validateInputFiles(const FileManager &Files) const;

private:
  explicit DeclStore(std::unique_ptr<llvm::MemoryBuffer> Buffer);

  llvm::Error readStore();
  llvm::Error readControlBlock();
  llvm::Error readASTBlock();

  std::unique_ptr<llvm::MemoryBuffer> Buffer;
  std::string FileName;
  llvm::BitstreamCursor Stream;
  // Positioned inside DECLS_BLOCK; jumped around with JumpToBit.
  llvm::BitstreamCursor DeclsCursor;

  StoreKind Kind = StoreKind::PCH;
  std::string ModuleName;
  std::string OriginalFile;
  std::vector<InputFileInfo> InputFiles;
  std::vector<std::string> DefinedMacros;
  std::vector<unsigned> OnceOnlyInputFiles;

  std::vector<uint64_t> DeclOffsets;
  std::vector<DeclID> TopLevelDecls;
  std::unique_ptr<OnDiskLookupTable> LookupTable;

  unsigned NumLookupProbes = 0;
  unsigned NumLookupHits = 0;
};

} // namespace serialization

#endif // DECLCACHE_SERIALIZATION_DECL_STORE_READER_H
