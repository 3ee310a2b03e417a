#include "ast/type.h"

#include "ast/decl.h"

QualType QualType::getCanonicalType() const {
  if (!Ptr)
    return QualType();
  QualType Canon = Ptr->getCanonicalTypeInternal();
  return QualType(Canon.getTypePtr(), Const || Canon.isConstQualified());
}

std::string QualType::getAsString() const {
  if (!Ptr)
    return "<null type>";

  std::string Result;
  switch (Ptr->getTypeClass()) {
    case Type::Builtin:
      Result = llvm::cast<BuiltinType>(Ptr)->getName();
      break;
    case Type::Record:
      Result = llvm::cast<RecordType>(Ptr)->getDecl()->getQualifiedNameAsString();
      break;
    case Type::Enum:
      Result = llvm::cast<EnumType>(Ptr)->getDecl()->getQualifiedNameAsString();
      break;
    case Type::Typedef:
      Result = llvm::cast<TypedefType>(Ptr)->getDecl()->getQualifiedNameAsString();
      break;
    case Type::Pointer: {
      Result = llvm::cast<PointerType>(Ptr)->getPointee().getAsString() + " *";
      if (Const)
        Result += "const";
      return Result;
    }
    case Type::LValueReference:
      return llvm::cast<LValueReferenceType>(Ptr)->getPointee().getAsString() + " &";
    case Type::ConstantArray: {
      const auto *Array = llvm::cast<ConstantArrayType>(Ptr);
      QualType Element = Array->getElementType();
      if (Const)
        Element = Element.withConst();
      return Element.getAsString() + " [" + std::to_string(Array->getSize()) + "]";
    }
  }

  if (Const)
    Result = "const " + Result;
  return Result;
}

const char *Type::getTypeClassName() const {
  switch (TC) {
    case Builtin:
      return "Builtin";
    case Pointer:
      return "Pointer";
    case LValueReference:
      return "LValueReference";
    case ConstantArray:
      return "ConstantArray";
    case Record:
      return "Record";
    case Enum:
      return "Enum";
    case Typedef:
      return "Typedef";
  }
  return "<unknown>";
}

static const Type *canonicalOf(const Type *T) {
  return T->getCanonicalTypeInternal().getTypePtr();
}

bool Type::isVoidType() const {
  if (const auto *BT = llvm::dyn_cast<BuiltinType>(canonicalOf(this)))
    return BT->getKind() == BuiltinKind::Void;
  return false;
}

bool Type::isBooleanType() const {
  if (const auto *BT = llvm::dyn_cast<BuiltinType>(canonicalOf(this)))
    return BT->getKind() == BuiltinKind::Bool;
  return false;
}

bool Type::isIntegerType() const {
  const Type *Canon = canonicalOf(this);
  if (const auto *BT = llvm::dyn_cast<BuiltinType>(Canon))
    return BT->isInteger();
  return llvm::isa<EnumType>(Canon);
}

bool Type::isFloatingType() const {
  if (const auto *BT = llvm::dyn_cast<BuiltinType>(canonicalOf(this)))
    return BT->isFloatingPoint();
  return false;
}

bool Type::isArithmeticType() const {
  const Type *Canon = canonicalOf(this);
  if (const auto *BT = llvm::dyn_cast<BuiltinType>(Canon))
    return BT->isInteger() || BT->isFloatingPoint();
  // Scoped enumerations do not take part in arithmetic.
  if (const auto *ET = llvm::dyn_cast<EnumType>(Canon))
    return !ET->getDecl()->isScoped();
  return false;
}

bool Type::isNullPtrType() const {
  if (const auto *BT = llvm::dyn_cast<BuiltinType>(canonicalOf(this)))
    return BT->getKind() == BuiltinKind::NullPtr;
  return false;
}

bool Type::isPointerType() const { return llvm::isa<PointerType>(canonicalOf(this)); }

bool Type::isReferenceType() const {
  return llvm::isa<LValueReferenceType>(canonicalOf(this));
}

bool Type::isArrayType() const {
  return llvm::isa<ConstantArrayType>(canonicalOf(this));
}

bool Type::isRecordType() const { return llvm::isa<RecordType>(canonicalOf(this)); }

bool Type::isEnumeralType() const { return llvm::isa<EnumType>(canonicalOf(this)); }

bool Type::isScalarType() const {
  return isArithmeticType() || isPointerType() || isNullPtrType() ||
         isEnumeralType();
}

RecordDecl *Type::getAsRecordDecl() const {
  if (const auto *RT = llvm::dyn_cast<RecordType>(canonicalOf(this)))
    return RT->getDecl();
  return nullptr;
}

EnumDecl *Type::getAsEnumDecl() const {
  if (const auto *ET = llvm::dyn_cast<EnumType>(canonicalOf(this)))
    return ET->getDecl();
  return nullptr;
}

QualType Type::getPointeeType() const {
  const Type *Canon = canonicalOf(this);
  if (const auto *PT = llvm::dyn_cast<PointerType>(Canon))
    return PT->getPointee();
  if (const auto *RT = llvm::dyn_cast<LValueReferenceType>(Canon))
    return RT->getPointee();
  return QualType();
}

const char *BuiltinType::getName() const {
  switch (Kind) {
    case BuiltinKind::Void:
      return "void";
    case BuiltinKind::Bool:
      return "bool";
    case BuiltinKind::Char:
      return "char";
    case BuiltinKind::SChar:
      return "signed char";
    case BuiltinKind::UChar:
      return "unsigned char";
    case BuiltinKind::Short:
      return "short";
    case BuiltinKind::UShort:
      return "unsigned short";
    case BuiltinKind::Int:
      return "int";
    case BuiltinKind::UInt:
      return "unsigned int";
    case BuiltinKind::Long:
      return "long";
    case BuiltinKind::ULong:
      return "unsigned long";
    case BuiltinKind::LongLong:
      return "long long";
    case BuiltinKind::ULongLong:
      return "unsigned long long";
    case BuiltinKind::Float:
      return "float";
    case BuiltinKind::Double:
      return "double";
    case BuiltinKind::NullPtr:
      return "std::nullptr_t";
  }
  return "<unknown builtin>";
}

bool BuiltinType::isSignedInteger() const {
  switch (Kind) {
    case BuiltinKind::Char:
    case BuiltinKind::SChar:
    case BuiltinKind::Short:
    case BuiltinKind::Int:
    case BuiltinKind::Long:
    case BuiltinKind::LongLong:
      return true;
    default:
      return false;
  }
}
