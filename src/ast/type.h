#ifndef DECLCACHE_AST_TYPE_H
#define DECLCACHE_AST_TYPE_H

#include <cstdint>
#include <string>

#include "llvm/Support/Casting.h"

class Type;
class RecordDecl;
class EnumDecl;
class TypedefNameDecl;

enum class BuiltinKind : uint8_t {
  Void,
  Bool,
  Char,
  SChar,
  UChar,
  Short,
  UShort,
  Int,
  UInt,
  Long,
  ULong,
  LongLong,
  ULongLong,
  Float,
  Double,
  NullPtr
};

/// QualType - A type pointer plus the const qualifier applied at this level.
class QualType {
  const Type *Ptr = nullptr;
  bool Const = false;

public:
  QualType() = default;
  QualType(const Type *T, bool IsConst = false) : Ptr(T), Const(IsConst) {}

  const Type *getTypePtr() const { return Ptr; }
  const Type *operator->() const { return Ptr; }
  const Type &operator*() const { return *Ptr; }

  bool isNull() const { return Ptr == nullptr; }
  bool isConstQualified() const { return Const; }

  QualType withConst() const { return QualType(Ptr, true); }
  QualType withoutConst() const { return QualType(Ptr, false); }

  /// Strip typedef sugar. A const on any typedef in the chain is kept.
  QualType getCanonicalType() const;

  std::string getAsString() const;

  bool operator==(const QualType &Other) const {
    return Ptr == Other.Ptr && Const == Other.Const;
  }
  bool operator!=(const QualType &Other) const { return !(*this == Other); }
};

class Type {
public:
  enum TypeClass : uint8_t {
    Builtin,
    Pointer,
    LValueReference,
    ConstantArray,
    Record,
    Enum,
    Typedef
  };

private:
  TypeClass TC;
  QualType CanonicalType;

protected:
  Type(TypeClass TC, QualType Canonical)
      : TC(TC), CanonicalType(Canonical.isNull() ? QualType(this) : Canonical) {}

public:
  Type(const Type &) = delete;
  Type &operator=(const Type &) = delete;
  virtual ~Type() = default;

  TypeClass getTypeClass() const { return TC; }
  const char *getTypeClassName() const;

  bool isCanonicalUnqualified() const { return CanonicalType.getTypePtr() == this; }
  QualType getCanonicalTypeInternal() const { return CanonicalType; }

  // Predicates below look through typedefs.
  bool isVoidType() const;
  bool isBooleanType() const;
  bool isIntegerType() const;      // integral builtins and enums
  bool isFloatingType() const;
  bool isArithmeticType() const;
  bool isNullPtrType() const;
  bool isPointerType() const;
  bool isReferenceType() const;
  bool isArrayType() const;
  bool isRecordType() const;
  bool isEnumeralType() const;
  bool isScalarType() const;

  RecordDecl *getAsRecordDecl() const;
  EnumDecl *getAsEnumDecl() const;
  /// For pointers and references, the referenced type.
  QualType getPointeeType() const;
};

class BuiltinType : public Type {
  BuiltinKind Kind;

public:
  explicit BuiltinType(BuiltinKind K) : Type(Builtin, QualType()), Kind(K) {}

  BuiltinKind getKind() const { return Kind; }
  const char *getName() const;

  bool isInteger() const {
    return Kind >= BuiltinKind::Bool && Kind <= BuiltinKind::ULongLong;
  }
  bool isSignedInteger() const;
  bool isFloatingPoint() const {
    return Kind == BuiltinKind::Float || Kind == BuiltinKind::Double;
  }

  static bool classof(const Type *T) { return T->getTypeClass() == Builtin; }
};

class PointerType : public Type {
  QualType Pointee;

public:
  PointerType(QualType Pointee, QualType Canonical)
      : Type(Pointer, Canonical), Pointee(Pointee) {}

  QualType getPointee() const { return Pointee; }

  static bool classof(const Type *T) { return T->getTypeClass() == Pointer; }
};

class LValueReferenceType : public Type {
  QualType Pointee;

public:
  LValueReferenceType(QualType Pointee, QualType Canonical)
      : Type(LValueReference, Canonical), Pointee(Pointee) {}

  QualType getPointee() const { return Pointee; }

  static bool classof(const Type *T) {
    return T->getTypeClass() == LValueReference;
  }
};

class ConstantArrayType : public Type {
  QualType Element;
  uint64_t Size;

public:
  ConstantArrayType(QualType Element, uint64_t Size, QualType Canonical)
      : Type(ConstantArray, Canonical), Element(Element), Size(Size) {}

  QualType getElementType() const { return Element; }
  uint64_t getSize() const { return Size; }

  static bool classof(const Type *T) {
    return T->getTypeClass() == ConstantArray;
  }
};

class RecordType : public Type {
  RecordDecl *Decl;

public:
  explicit RecordType(RecordDecl *D) : Type(Record, QualType()), Decl(D) {}

  RecordDecl *getDecl() const { return Decl; }

  static bool classof(const Type *T) { return T->getTypeClass() == Record; }
};

class EnumType : public Type {
  EnumDecl *Decl;

public:
  explicit EnumType(EnumDecl *D) : Type(Enum, QualType()), Decl(D) {}

  EnumDecl *getDecl() const { return Decl; }

  static bool classof(const Type *T) { return T->getTypeClass() == Enum; }
};

class TypedefType : public Type {
  TypedefNameDecl *Decl;

public:
  TypedefType(TypedefNameDecl *D, QualType Canonical)
      : Type(Typedef, Canonical), Decl(D) {}

  TypedefNameDecl *getDecl() const { return Decl; }

  static bool classof(const Type *T) { return T->getTypeClass() == Typedef; }
};

#endif // DECLCACHE_AST_TYPE_H
