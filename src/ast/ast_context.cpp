// This file implements the ASTContext: declaration ownership and type uniquing.

#include "ast/ast_context.h"

ASTContext::ASTContext() {
  TUDecl = create<TranslationUnitDecl>(*this);

  constexpr unsigned NumBuiltins = static_cast<unsigned>(BuiltinKind::NullPtr) + 1;
  BuiltinTypes.reserve(NumBuiltins);
  for (unsigned I = 0; I < NumBuiltins; ++I)
    BuiltinTypes.push_back(makeType<BuiltinType>(static_cast<BuiltinKind>(I)));
}

ASTContext::~ASTContext() = default;

QualType ASTContext::getBuiltinType(BuiltinKind K) const {
  return QualType(BuiltinTypes[static_cast<unsigned>(K)]);
}

QualType ASTContext::getPointerType(QualType Pointee) {
  auto Key = std::make_pair(Pointee.getTypePtr(), Pointee.isConstQualified());
  auto It = PointerTypes.find(Key);
  if (It != PointerTypes.end())
    return QualType(It->second);

  QualType Canonical;
  QualType CanonPointee = Pointee.getCanonicalType();
  if (CanonPointee != Pointee)
    Canonical = getPointerType(CanonPointee);

  const PointerType *Ty = makeType<PointerType>(Pointee, Canonical);
  PointerTypes[Key] = Ty;
  return QualType(Ty);
}

QualType ASTContext::getLValueReferenceType(QualType Pointee) {
  // A reference to a reference collapses.
  if (const auto *Ref =
          llvm::dyn_cast<LValueReferenceType>(Pointee.getTypePtr()))
    return QualType(Ref);

  auto Key = std::make_pair(Pointee.getTypePtr(), Pointee.isConstQualified());
  auto It = ReferenceTypes.find(Key);
  if (It != ReferenceTypes.end())
    return QualType(It->second);

  QualType Canonical;
  QualType CanonPointee = Pointee.getCanonicalType();
  if (CanonPointee != Pointee)
    Canonical = getLValueReferenceType(CanonPointee);

  const LValueReferenceType *Ty =
      makeType<LValueReferenceType>(Pointee, Canonical);
  ReferenceTypes[Key] = Ty;
  return QualType(Ty);
}

QualType ASTContext::getConstantArrayType(QualType Element, uint64_t Size) {
  auto Key = std::make_tuple(Element.getTypePtr(), Element.isConstQualified(), Size);
  auto It = ArrayTypes.find(Key);
  if (It != ArrayTypes.end())
    return QualType(It->second);

  QualType Canonical;
  QualType CanonElement = Element.getCanonicalType();
  if (CanonElement != Element)
    Canonical = getConstantArrayType(CanonElement, Size);

  const ConstantArrayType *Ty =
      makeType<ConstantArrayType>(Element, Size, Canonical);
  ArrayTypes[Key] = Ty;
  return QualType(Ty);
}

QualType ASTContext::getRecordType(const RecordDecl *RD) {
  if (!RD->TypeForDecl)
    RD->TypeForDecl = makeType<RecordType>(const_cast<RecordDecl *>(RD));
  return QualType(RD->TypeForDecl);
}

QualType ASTContext::getEnumType(const EnumDecl *ED) {
  if (!ED->TypeForDecl)
    ED->TypeForDecl = makeType<EnumType>(const_cast<EnumDecl *>(ED));
  return QualType(ED->TypeForDecl);
}

QualType ASTContext::getTypedefType(const TypedefNameDecl *TD) {
  if (!TD->TypeForDecl)
    TD->TypeForDecl = makeType<TypedefType>(
        const_cast<TypedefNameDecl *>(TD), TD->getUnderlyingType().getCanonicalType());
  return QualType(TD->TypeForDecl);
}

QualType ASTContext::getTypeDeclType(const TypeDecl *TD) {
  if (const auto *RD = llvm::dyn_cast<RecordDecl>(TD))
    return getRecordType(RD);
  if (const auto *ED = llvm::dyn_cast<EnumDecl>(TD))
    return getEnumType(ED);
  return getTypedefType(llvm::cast<TypedefNameDecl>(TD));
}

bool ASTContext::hasSameUnqualifiedType(QualType A, QualType B) const {
  return A.getCanonicalType().getTypePtr() == B.getCanonicalType().getTypePtr();
}

bool ASTContext::hasSameType(QualType A, QualType B) const {
  return A.getCanonicalType() == B.getCanonicalType();
}
