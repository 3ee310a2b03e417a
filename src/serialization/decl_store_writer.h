#ifndef DECLCACHE_SERIALIZATION_DECL_STORE_WRITER_H
#define DECLCACHE_SERIALIZATION_DECL_STORE_WRITER_H

#include <map>
#include <string>
#include <vector>

#include "serialization/decl_store_format.h"

#include "llvm/ADT/DenseMap.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

class ASTContext;
class Decl;
class DeclContext;
class FileManager;
class QualType;
struct SourceLocation;

namespace llvm {
class BitstreamWriter;
}

namespace serialization {

/// DeclStoreWriter - Serializes every declaration of a parsed unit into a
/// declaration store (a precompiled header or a precompiled module).
class DeclStoreWriter {
public:
  using RecordData = llvm::SmallVector<uint64_t, 64>;

  DeclStoreWriter(ASTContext &Ctx, FileManager &Files, StoreKind Kind,
                  std::string ModuleName = std::string());

  /// Write the store into Buffer. OriginalFile names the main input.
  llvm::Error emit(llvm::SmallVectorImpl<char> &Buffer,
                   llvm::StringRef OriginalFile);

  /// Emit and write the result to Path.
  llvm::Error writeToFile(llvm::StringRef Path, llvm::StringRef OriginalFile);

  /// Print "[serialization]" trace lines to stderr.
  void setDebugTrace(bool Enabled) { DebugTrace = Enabled; }

  unsigned getNumDeclsWritten() const {
    return static_cast<unsigned>(DeclsToEmit.size());
  }

private:
  ASTContext &Ctx;
  FileManager &Files;
  StoreKind Kind;
  std::string ModuleName;
  bool DebugTrace = false;

  std::vector<const Decl *> DeclsToEmit;
  llvm::DenseMap<const Decl *, DeclID> DeclIDs;
  std::vector<DeclID> TopLevelDecls;
  std::map<unsigned, unsigned> FileIndices;
  std::map<std::string, std::vector<DeclID>> LookupEntries;

  void collectDecls(const DeclContext *DC);
  void addLookupEntry(const std::string &Key, DeclID ID);
  void buildLookupEntries();

  DeclID getDeclID(const Decl *D) const;
  void addString(llvm::StringRef Str, RecordData &Record);
  void addSourceLocation(SourceLocation Loc, RecordData &Record);
  void addType(QualType T, RecordData &Record);
  unsigned writeDecl(const Decl *D, RecordData &Record);

  void writeControlBlock(llvm::BitstreamWriter &Stream,
                         llvm::StringRef OriginalFile);
  void writeDeclsBlock(llvm::BitstreamWriter &Stream,
                       std::vector<uint64_t> &Offsets);
  void writeASTBlock(llvm::BitstreamWriter &Stream);
};

} // namespace serialization

#endif // DECLCACHE_SERIALIZATION_DECL_STORE_WRITER_H
