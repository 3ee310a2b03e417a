#include "serialization/lookup_table.h"

#include "ast/decl.h"

namespace serialization {

std::string getLookupKey(const DeclContext *DC, llvm::StringRef Name) {
  if (!DC || DC->isTranslationUnit())
    return Name.str();
  const auto *Owner = llvm::cast<NamedDecl>(Decl::castFromDeclContext(DC));
  return Owner->getQualifiedNameAsString() + "::" + Name.str();
}

} // namespace serialization
