#ifndef DECLCACHE_AST_AST_CONTEXT_H
#define DECLCACHE_AST_AST_CONTEXT_H

#include <cstdint>
#include <map>
#include <memory>
#include <tuple>
#include <utility>
#include <vector>

#include "ast/decl.h"
#include "ast/external_source.h"
#include "ast/type.h"

/// ASTContext - Owns every declaration and type of one compilation and
/// uniques types.
class ASTContext {
  std::vector<std::unique_ptr<Decl>> Decls;
  std::vector<std::unique_ptr<Type>> Types;
  TranslationUnitDecl *TUDecl = nullptr;
  ExternalDeclSource *ExternalSource = nullptr;

  std::vector<const BuiltinType *> BuiltinTypes;
  std::map<std::pair<const Type *, bool>, const PointerType *> PointerTypes;
  std::map<std::pair<const Type *, bool>, const LValueReferenceType *>
      ReferenceTypes;
  std::map<std::tuple<const Type *, bool, uint64_t>, const ConstantArrayType *>
      ArrayTypes;

  template <typename T, typename... Args> const T *makeType(Args &&...args) {
    auto Ty = std::make_unique<T>(std::forward<Args>(args)...);
    const T *Raw = Ty.get();
    Types.push_back(std::move(Ty));
    return Raw;
  }

public:
  ASTContext();
  ~ASTContext();

  ASTContext(const ASTContext &) = delete;
  ASTContext &operator=(const ASTContext &) = delete;

  TranslationUnitDecl *getTranslationUnitDecl() const { return TUDecl; }

  /// Allocate a declaration owned by this context.
  template <typename T, typename... Args> T *create(Args &&...args) {
    auto D = std::make_unique<T>(std::forward<Args>(args)...);
    T *Raw = D.get();
    Decls.push_back(std::move(D));
    return Raw;
  }
  std::size_t getNumDecls() const { return Decls.size(); }

  ExternalDeclSource *getExternalSource() const { return ExternalSource; }
  void setExternalSource(ExternalDeclSource *Source) { ExternalSource = Source; }

  QualType getBuiltinType(BuiltinKind K) const;
  QualType getPointerType(QualType Pointee);
  QualType getLValueReferenceType(QualType Pointee);
  QualType getConstantArrayType(QualType Element, uint64_t Size);
  QualType getRecordType(const RecordDecl *RD);
  QualType getEnumType(const EnumDecl *ED);
  QualType getTypedefType(const TypedefNameDecl *TD);
  QualType getTypeDeclType(const TypeDecl *TD);

  /// Same type after removing typedef sugar and top-level const.
  bool hasSameUnqualifiedType(QualType A, QualType B) const;
  bool hasSameType(QualType A, QualType B) const;
};

#endif // DECLCACHE_AST_AST_CONTEXT_H
