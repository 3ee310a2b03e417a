#ifndef DECLCACHE_SERIALIZATION_LAZY_LOADER_H
#define DECLCACHE_SERIALIZATION_LAZY_LOADER_H

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "ast/decl.h"
#include "ast/external_source.h"
#include "ast/type.h"
#include "compiler_session.h"
#include "serialization/decl_store_format.h"
#include "serialization/decl_store_reader.h"
#include "serialization/deserialization_listener.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

class ASTContext;
class Decl;
class DeclContext;
class FileManager;
class NamedDecl;
class RecordDecl;

namespace serialization {

/// LazyDeclLoader - The external declaration source backed by attached
/// declaration stores (at most one precompiled header and any number of
/// module files).
///
/// Nothing is read when a store is attached beyond its control block, offsets
/// and lookup table. Name lookup into the translation unit, a namespace or an
/// enum asks for the qualified name; every hit is materialized together with
/// its parent context, the declarations named by its type, and its
/// parameters or enumerators. Record members and bases are only read by
/// completeRecordDefinition().
///
/// Entities provided by more than one store are merged into one declaration
/// when their structural hashes agree or one side is only a declaration;
/// otherwise the conflict is diagnosed and the first definition wins.
class LazyDeclLoader : public ExternalDeclSource {
public:
  LazyDeclLoader(ASTContext &Ctx, FileManager &Files);
  ~LazyDeclLoader() override;

  LazyDeclLoader(const LazyDeclLoader &) = delete;
  LazyDeclLoader &operator=(const LazyDeclLoader &) = delete;

  /// Open the store at Path, check it is of the expected kind and attach it.
  llvm::Error loadStoreFile(llvm::StringRef Path, StoreKind ExpectedKind);
  /// Attach an already opened store.
  llvm::Error attachStore(std::unique_ptr<DeclStore> Store);

  void setValidateInputFiles(bool V) { ValidateInputFiles = V; }
  void setDebugTrace(bool V) { DebugTrace = V; }
  void addDeserializationListener(DeserializationListener *L) {
    Listeners.push_back(L);
  }
  /// Attach a listener that lives as long as the loader.
  void addDeserializationListener(std::unique_ptr<DeserializationListener> L) {
    Listeners.push_back(L.get());
    OwnedListeners.push_back(std::move(L));
  }

  bool findExternalVisibleDeclsByName(DeclContext *DC,
                                      llvm::StringRef Name) override;
  void completeRecordDefinition(RecordDecl *RD) override;
  void printStatistics(llvm::raw_ostream &OS) override;

  /// Read every stored declaration and complete every record.
  void loadAllDeclarations();

  unsigned getNumStores() const { return static_cast<unsigned>(Stores.size()); }
  DeclStore &getStore(unsigned Index) { return *Stores[Index].Store; }
  unsigned getNumDeclsLoaded(unsigned StoreIndex) const {
    return Stores[StoreIndex].NumDeclsLoaded;
  }
  unsigned getNumRecordCompletions() const { return NumRecordCompletions; }
  /// The in-memory declaration for a stored ID, or null if not read yet.
  Decl *getDeclIfLoaded(unsigned StoreIndex, DeclID ID) const;

private:
  struct StoreState {
    std::unique_ptr<DeclStore> Store;
    // Indexed by ID - 1.
    std::vector<Decl *> DeclsLoaded;
    unsigned NumDeclsLoaded = 0;
  };

  /// The fixed part at the start of every declaration record.
  struct DeclHeader {
    DeclID ParentID = TranslationUnitID;
    SourceLocation Loc;
    AccessSpecifier Access = AccessSpecifier::None;
    std::string Name;
  };

  struct StoredParam {
    DeclID ID = 0;
    DeclHeader Header;
    QualType Type;
  };

  /// Counts nested reads; listeners run when the outermost read finishes.
  class DeserializingScope {
    LazyDeclLoader &Loader;

  public:
    explicit DeserializingScope(LazyDeclLoader &L) : Loader(L) {
      ++Loader.NumCurrentElementsDeserializing;
    }
    ~DeserializingScope() {
      if (--Loader.NumCurrentElementsDeserializing == 0)
        Loader.finishPendingActions();
    }
  };

  ASTContext &Ctx;
  FileManager &Files;
  std::vector<StoreState> Stores;
  std::vector<DeserializationListener *> Listeners;
  std::vector<std::unique_ptr<DeserializationListener>> OwnedListeners;
  std::vector<std::pair<DeclID, Decl *>> PendingNotifications;
  unsigned NumCurrentElementsDeserializing = 0;
  unsigned NumRecordCompletions = 0;
  unsigned NumExternalLookups = 0;
  bool ValidateInputFiles = true;
  bool DebugTrace = false;

  llvm::Expected<Decl *> getDecl(unsigned StoreIndex, DeclID ID);
  llvm::Expected<DeclContext *> getDeclContext(unsigned StoreIndex, DeclID ID);
  llvm::Expected<Decl *> readDecl(unsigned StoreIndex, DeclID ID);
  llvm::Expected<QualType> readType(unsigned StoreIndex, RecordReader &Reader);
  DeclHeader readDeclHeader(unsigned StoreIndex, RecordReader &Reader);
  llvm::Error readParams(unsigned StoreIndex, llvm::ArrayRef<DeclID> IDs,
                         std::vector<StoredParam> &Params);

  llvm::Expected<Decl *> readFunction(unsigned StoreIndex, DeclID ID,
                                      unsigned Code, DeclContext *DC,
                                      const DeclHeader &Header,
                                      RecordReader &Reader);
  Decl *findMemberFromOtherStore(DeclContext *DC, unsigned Code,
                                 llvm::StringRef Name,
                                 const std::string &Signature);

  void registerDecl(unsigned StoreIndex, DeclID ID, Decl *D, bool IsNew);
  void diagnoseODRMismatch(const NamedDecl *Existing, unsigned StoreIndex,
                           SourceLocation NewLoc);
  std::string getProviderName(const Decl *D) const;
  bool ownsMembersOf(const Decl *Parent, unsigned StoreIndex,
                     DeclID ParentID) const;

  /// Seed the lexer with the macros and once-only files of a precompiled
  /// header.
  void importPreprocessorState(const DeclStore &Store);

  void finishPendingActions();
  void reportError(llvm::Error Err);
};

} // namespace serialization

#endif // DECLCACHE_SERIALIZATION_LAZY_LOADER_H
