#include "analysis/record_layout.h"

#include <algorithm>

#include "ast/decl.h"

#include "llvm/Support/MathExtras.h"

namespace analysis {

static TypeSizeInfo getBuiltinInfo(BuiltinKind K) {
  switch (K) {
    case BuiltinKind::Void:
      return {0, 1};
    case BuiltinKind::Bool:
    case BuiltinKind::Char:
    case BuiltinKind::SChar:
    case BuiltinKind::UChar:
      return {1, 1};
    case BuiltinKind::Short:
    case BuiltinKind::UShort:
      return {2, 2};
    case BuiltinKind::Int:
    case BuiltinKind::UInt:
    case BuiltinKind::Float:
      return {4, 4};
    case BuiltinKind::Long:
    case BuiltinKind::ULong:
    case BuiltinKind::LongLong:
    case BuiltinKind::ULongLong:
    case BuiltinKind::Double:
    case BuiltinKind::NullPtr:
      return {8, 8};
  }
  return {0, 1};
}

std::optional<TypeSizeInfo> RecordLayoutContext::getTypeInfo(QualType T) {
  if (T.isNull())
    return std::nullopt;
  const Type *Ty = T.getCanonicalType().getTypePtr();

  switch (Ty->getTypeClass()) {
    case Type::Builtin:
      return getBuiltinInfo(llvm::cast<BuiltinType>(Ty)->getKind());
    case Type::Pointer:
    case Type::LValueReference:
      return TypeSizeInfo{8, 8};
    case Type::ConstantArray: {
      const auto *AT = llvm::cast<ConstantArrayType>(Ty);
      std::optional<TypeSizeInfo> Element = getTypeInfo(AT->getElementType());
      if (!Element)
        return std::nullopt;
      return TypeSizeInfo{Element->Size * AT->getSize(), Element->Align};
    }
    case Type::Enum: {
      const EnumDecl *ED = llvm::cast<EnumType>(Ty)->getDecl();
      if (!ED->isComplete())
        return std::nullopt;
      if (ED->getIntegerType().isNull())
        return TypeSizeInfo{4, 4};
      return getTypeInfo(ED->getIntegerType());
    }
    case Type::Record: {
      const ASTRecordLayout *Layout =
          getRecordLayout(llvm::cast<RecordType>(Ty)->getDecl());
      if (!Layout)
        return std::nullopt;
      return TypeSizeInfo{Layout->getSize(), Layout->getAlignment()};
    }
    case Type::Typedef:
      break;
  }
  return std::nullopt;
}

const ASTRecordLayout *RecordLayoutContext::getRecordLayout(const RecordDecl *RD) {
  auto It = Layouts.find(RD);
  if (It != Layouts.end())
    return It->second.get();

  auto *Mutable = const_cast<RecordDecl *>(RD);
  if (!Trigger.completeRecord(Mutable, CompletenessReason::Sizeof))
    return nullptr;

  uint64_t Offset = 0;
  uint64_t Alignment = 1;
  std::vector<uint64_t> BaseOffsets;
  for (const CXXBaseSpecifier &Base : RD->bases()) {
    const RecordDecl *BaseDecl = Base.BaseType->getAsRecordDecl();
    const ASTRecordLayout *BaseLayout = BaseDecl ? getRecordLayout(BaseDecl) : nullptr;
    if (!BaseLayout)
      return nullptr;
    Offset = llvm::alignTo(Offset, BaseLayout->getAlignment());
    BaseOffsets.push_back(Offset);
    // An empty base shares its address with what follows. Every record here
    // is POD, so a non-empty base keeps its tail padding.
    if (!BaseLayout->isEmpty())
      Offset += BaseLayout->getSize();
    Alignment = std::max(Alignment, BaseLayout->getAlignment());
  }

  std::vector<uint64_t> FieldOffsets;
  for (const FieldDecl *FD : RD->fields()) {
    std::optional<TypeSizeInfo> Info = getTypeInfo(FD->getType());
    if (!Info)
      return nullptr;
    Offset = llvm::alignTo(Offset, Info->Align);
    FieldOffsets.push_back(Offset);
    Offset += Info->Size;
    Alignment = std::max(Alignment, Info->Align);
  }

  const uint64_t DataSize = Offset;
  uint64_t Size = llvm::alignTo(Offset, Alignment);
  if (Size == 0)
    Size = 1;

  auto Layout = std::make_unique<ASTRecordLayout>(Size, Alignment, DataSize);
  Layout->BaseOffsets = std::move(BaseOffsets);
  Layout->FieldOffsets = std::move(FieldOffsets);
  const ASTRecordLayout *Result = Layout.get();
  Layouts[RD] = std::move(Layout);
  return Result;
}

} // namespace analysis
