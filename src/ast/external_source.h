#ifndef DECLCACHE_AST_EXTERNAL_SOURCE_H
#define DECLCACHE_AST_EXTERNAL_SOURCE_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

class DeclContext;
class RecordDecl;

/// ExternalDeclSource - Supplies declarations that were not parsed in this
/// unit. The AST asks for them by name and when a record must be complete.
class ExternalDeclSource {
public:
  virtual ~ExternalDeclSource() = default;

  /// Materialize every external declaration named Name that is visible in
  /// DC and add it to DC. Returns true if anything was found.
  virtual bool findExternalVisibleDeclsByName(DeclContext *DC,
                                              llvm::StringRef Name) = 0;

  /// Load the members and bases of a record whose definition is external.
  virtual void completeRecordDefinition(RecordDecl *RD) = 0;

  virtual void printStatistics(llvm::raw_ostream &OS) {}
};

#endif // DECLCACHE_AST_EXTERNAL_SOURCE_H
