#ifndef DECLCACHE_SERIALIZATION_DESERIALIZATION_LISTENER_H
#define DECLCACHE_SERIALIZATION_DESERIALIZATION_LISTENER_H

#include "serialization/decl_store_format.h"

#include "llvm/Support/raw_ostream.h"

class Decl;

namespace serialization {

/// DeserializationListener - Notified once for every declaration the lazy
/// loader creates. Declarations merged into an existing one are not
/// reported again.
class DeserializationListener {
public:
  virtual ~DeserializationListener() = default;

  /// D is fully initialized when this is called. ID is local to the store
  /// that provided D.
  virtual void declRead(DeclID ID, const Decl *D) = 0;
};

/// Prints "PCH DECL: <Kind> - <QualifiedName>" for -dump-deserialized-decls.
class DumpDeserializedDeclsListener : public DeserializationListener {
  llvm::raw_ostream &OS;

public:
  explicit DumpDeserializedDeclsListener(llvm::raw_ostream &OS) : OS(OS) {}

  void declRead(DeclID ID, const Decl *D) override;
};

} // namespace serialization

#endif // DECLCACHE_SERIALIZATION_DESERIALIZATION_LISTENER_H
