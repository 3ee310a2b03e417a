// Expression checking: types, value categories, conversions and overload
// resolution for the expressions the parser builds.

#include "analysis/semantics.h"

#include <limits>

#include "ast/ast_context.h"

namespace analysis {

namespace {

QualType getNonReferenceType(QualType T) {
  if (!T.isNull() && T->isReferenceType())
    return T->getPointeeType();
  return T;
}

bool isConstType(QualType T) {
  return !T.isNull() && T.getCanonicalType().isConstQualified();
}

bool isScopedEnumType(QualType T) {
  const EnumDecl *ED = T.isNull() ? nullptr : T->getAsEnumDecl();
  return ED && ED->isScoped();
}

bool isNullPointerConstant(const ExprAST *E) {
  if (const auto *Paren = dynamic_cast<const ParenExprAST *>(E))
    return isNullPointerConstant(Paren->getSubExpr());
  if (dynamic_cast<const NullptrExprAST *>(E))
    return true;
  const auto *Lit = dynamic_cast<const IntegerLiteralExprAST *>(E);
  return Lit && Lit->getValue() == 0;
}

unsigned getIntegerRank(BuiltinKind K) {
  switch (K) {
    case BuiltinKind::Int:
    case BuiltinKind::UInt:
      return 1;
    case BuiltinKind::Long:
    case BuiltinKind::ULong:
      return 2;
    case BuiltinKind::LongLong:
    case BuiltinKind::ULongLong:
      return 3;
    default:
      return 0;
  }
}

bool isUnsignedKind(BuiltinKind K) {
  return K == BuiltinKind::UInt || K == BuiltinKind::ULong ||
         K == BuiltinKind::ULongLong;
}

BuiltinKind getUnsignedKind(BuiltinKind K) {
  switch (K) {
    case BuiltinKind::Int:
      return BuiltinKind::UInt;
    case BuiltinKind::Long:
      return BuiltinKind::ULong;
    case BuiltinKind::LongLong:
      return BuiltinKind::ULongLong;
    default:
      return K;
  }
}

} // namespace

QualType SemanticAnalysis::getPromotedType(QualType T) {
  QualType Canon = T.getCanonicalType().withoutConst();
  if (const EnumDecl *ED = Canon->getAsEnumDecl()) {
    QualType Underlying = ED->getIntegerType();
    return Underlying.isNull() ? Ctx.getBuiltinType(BuiltinKind::Int)
                               : getPromotedType(Underlying);
  }
  const auto *BT = llvm::dyn_cast<BuiltinType>(Canon.getTypePtr());
  if (BT && BT->isInteger() && getIntegerRank(BT->getKind()) == 0)
    return Ctx.getBuiltinType(BuiltinKind::Int);
  return Canon;
}

QualType SemanticAnalysis::getArithmeticResultType(QualType LHS, QualType RHS) {
  QualType L = getPromotedType(LHS);
  QualType R = getPromotedType(RHS);
  const auto *LB = llvm::cast<BuiltinType>(L.getTypePtr());
  const auto *RB = llvm::cast<BuiltinType>(R.getTypePtr());

  if (LB->getKind() == BuiltinKind::Double || RB->getKind() == BuiltinKind::Double)
    return Ctx.getBuiltinType(BuiltinKind::Double);
  if (LB->isFloatingPoint() || RB->isFloatingPoint())
    return Ctx.getBuiltinType(BuiltinKind::Float);
  if (LB->getKind() == RB->getKind())
    return L;

  const bool LUnsigned = isUnsignedKind(LB->getKind());
  const bool RUnsigned = isUnsignedKind(RB->getKind());
  const unsigned LRank = getIntegerRank(LB->getKind());
  const unsigned RRank = getIntegerRank(RB->getKind());
  if (LUnsigned == RUnsigned)
    return LRank >= RRank ? L : R;

  BuiltinKind Unsigned = LUnsigned ? LB->getKind() : RB->getKind();
  BuiltinKind Signed = LUnsigned ? RB->getKind() : LB->getKind();
  if (getIntegerRank(Unsigned) >= getIntegerRank(Signed))
    return Ctx.getBuiltinType(Unsigned);
  // long can hold every unsigned int; long long cannot hold unsigned long.
  if (getIntegerRank(Signed) == 2 && getIntegerRank(Unsigned) == 1)
    return Ctx.getBuiltinType(Signed);
  return Ctx.getBuiltinType(getUnsignedKind(Signed));
}

// Entry point ----------------------------------------------------------------

bool SemanticAnalysis::checkExpression(ExprAST *E) {
  if (!E)
    return false;

  if (auto *Lit = dynamic_cast<IntegerLiteralExprAST *>(E)) {
    uint64_t V = Lit->getValue();
    BuiltinKind K = BuiltinKind::ULong;
    if (V <= static_cast<uint64_t>(std::numeric_limits<int32_t>::max()))
      K = BuiltinKind::Int;
    else if (V <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
      K = BuiltinKind::Long;
    Lit->setType(Ctx.getBuiltinType(K));
    return true;
  }
  if (dynamic_cast<BoolExprAST *>(E)) {
    E->setType(Ctx.getBuiltinType(BuiltinKind::Bool));
    return true;
  }
  if (dynamic_cast<NullptrExprAST *>(E)) {
    E->setType(Ctx.getBuiltinType(BuiltinKind::NullPtr));
    return true;
  }
  if (dynamic_cast<ThisExprAST *>(E)) {
    auto *MD = llvm::dyn_cast_or_null<CXXMethodDecl>(CurFunction);
    if (!MD || MD->isStatic()) {
      reportCompilerErrorAt(E->getSourceLocation(),
                            "invalid use of 'this' outside of a non-static "
                            "member function");
      return false;
    }
    QualType RecordTy = Ctx.getRecordType(MD->getParent());
    if (MD->isConst())
      RecordTy = RecordTy.withConst();
    E->setType(Ctx.getPointerType(RecordTy));
    return true;
  }
  if (auto *Ref = dynamic_cast<DeclRefExprAST *>(E))
    return checkDeclRef(Ref, /*AllowOverloadSet=*/false);
  if (auto *Member = dynamic_cast<MemberAccessExprAST *>(E))
    return checkMemberAccess(Member, /*AllowOverloadSet=*/false);
  if (auto *Call = dynamic_cast<CallExprAST *>(E))
    return checkCall(Call);
  if (auto *Subscript = dynamic_cast<ArrayIndexExprAST *>(E))
    return checkArraySubscript(Subscript);
  if (auto *Unary = dynamic_cast<UnaryExprAST *>(E))
    return checkUnary(Unary);
  if (auto *Binary = dynamic_cast<BinaryExprAST *>(E))
    return checkBinary(Binary);
  if (auto *Sizeof = dynamic_cast<SizeofExprAST *>(E))
    return checkSizeof(Sizeof);
  if (auto *Paren = dynamic_cast<ParenExprAST *>(E)) {
    if (!checkExpression(Paren->getSubExpr()))
      return false;
    Paren->setType(Paren->getSubExpr()->getType());
    Paren->setLValue(Paren->getSubExpr()->isLValue());
    return true;
  }

  reportCompilerErrorAt(E->getSourceLocation(), "unsupported expression");
  return false;
}

// Names ----------------------------------------------------------------------

static std::vector<FunctionDecl *>
collectFunctions(const DeclContext::lookup_result &Found) {
  std::vector<FunctionDecl *> Functions;
  for (NamedDecl *ND : Found) {
    if (auto *FD = llvm::dyn_cast<FunctionDecl>(ND))
      Functions.push_back(FD);
  }
  return Functions;
}

bool SemanticAnalysis::checkDeclRef(DeclRefExprAST *E, bool AllowOverloadSet) {
  const QualifiedNameRef &Name = E->getNameRef();
  const SourceLocation Loc = E->getSourceLocation();

  DeclContext::lookup_result Found;
  if (Name.isQualified()) {
    DeclContext *DC = lookupNestedNameSpecifier(Name, /*Diagnose=*/true);
    if (!DC)
      return false;
    Found = lookupQualified(DC, Name.Name);
    if (Found.empty()) {
      reportCompilerErrorAt(Loc, "no member named '" + Name.Name + "' in " +
                                     describeContext(DC));
      return false;
    }
  } else {
    Found = lookupUnqualified(Name.Name);
    if (Found.empty()) {
      reportCompilerErrorAt(Loc, "use of undeclared identifier '" + Name.Name + "'");
      return false;
    }
  }

  NamedDecl *ND = Found.front();
  if (llvm::isa<FunctionDecl>(ND)) {
    std::vector<FunctionDecl *> Functions = collectFunctions(Found);
    if (!AllowOverloadSet) {
      reportCompilerErrorAt(Loc, "reference to function '" + Name.getAsString() +
                                     "' must be called");
      return false;
    }
    E->setCandidates(std::move(Functions));
    return true;
  }

  if (auto *Field = llvm::dyn_cast<FieldDecl>(ND)) {
    auto *MD = llvm::dyn_cast_or_null<CXXMethodDecl>(CurFunction);
    RecordDecl *FieldParent = Field->getParent();
    if (MD && MD->isStatic()) {
      reportCompilerErrorAt(Loc, "invalid use of member '" + Name.Name +
                                     "' in static member function");
      return false;
    }
    if (!MD || (MD->getParent() != FieldParent &&
                !MD->getParent()->isDerivedFrom(FieldParent))) {
      reportCompilerErrorAt(Loc, "invalid use of non-static data member '" +
                                     Name.Name + "'");
      return false;
    }
    QualType T = Field->getType();
    if (MD->isConst())
      T = T.withConst();
    E->setDecl(Field);
    E->setType(T);
    E->setLValue(true);
    return true;
  }

  if (auto *VD = llvm::dyn_cast<VarDecl>(ND)) {
    E->setDecl(VD);
    E->setType(getNonReferenceType(VD->getType()));
    E->setLValue(true);
    return true;
  }

  if (auto *ECD = llvm::dyn_cast<EnumConstantDecl>(ND)) {
    E->setDecl(ECD);
    E->setType(ECD->getType());
    return true;
  }

  reportCompilerErrorAt(Loc, "'" + Name.getAsString() + "' does not refer to a value");
  reportCompilerNote(ND->getLocation(), "declared here");
  return false;
}

bool SemanticAnalysis::checkMemberAccess(MemberAccessExprAST *E,
                                         bool AllowOverloadSet) {
  ExprAST *Base = E->getBase();
  if (!checkExpression(Base))
    return false;

  const SourceLocation Loc = E->getSourceLocation();
  QualType BaseType = Base->getType();
  QualType ObjectType = BaseType;
  if (E->isArrow()) {
    if (!BaseType->isPointerType()) {
      reportCompilerErrorAt(Loc, "member reference type '" + BaseType.getAsString() +
                                     "' is not a pointer");
      return false;
    }
    ObjectType = BaseType->getPointeeType();
  } else if (BaseType->isPointerType()) {
    reportCompilerErrorAt(Loc, "member reference type '" + BaseType.getAsString() +
                                   "' is a pointer; did you mean to use '->'?");
    return false;
  }

  RecordDecl *RD = ObjectType->getAsRecordDecl();
  if (!RD) {
    reportCompilerErrorAt(Loc, "member reference base type '" +
                                   ObjectType.getAsString() +
                                   "' is not a structure or union");
    return false;
  }
  if (!Trigger.requireCompleteType(Loc, ObjectType, CompletenessReason::MemberAccess))
    return false;

  const std::string &MemberName = E->getMemberName();
  DeclContext::lookup_result Found = lookupInRecord(RD, MemberName);
  if (Found.empty()) {
    reportCompilerErrorAt(Loc, "no member named '" + MemberName + "' in '" +
                                   RD->getQualifiedNameAsString() + "'");
    return false;
  }

  NamedDecl *ND = Found.front();
  if (llvm::isa<FunctionDecl>(ND)) {
    if (!AllowOverloadSet) {
      reportCompilerErrorAt(Loc, "reference to non-static member function must "
                                 "be called");
      return false;
    }
    E->setCandidates(collectFunctions(Found));
    return true;
  }

  if (auto *Field = llvm::dyn_cast<FieldDecl>(ND)) {
    QualType T = Field->getType();
    if (isConstType(ObjectType))
      T = T.withConst();
    E->setMemberDecl(Field);
    E->setType(T);
    E->setLValue(E->isArrow() || Base->isLValue());
    return true;
  }

  if (auto *ECD = llvm::dyn_cast<EnumConstantDecl>(ND)) {
    E->setMemberDecl(ECD);
    E->setType(ECD->getType());
    return true;
  }

  reportCompilerErrorAt(Loc, "'" + MemberName + "' does not refer to a value");
  return false;
}

// Calls ----------------------------------------------------------------------

FunctionDecl *SemanticAnalysis::resolveOverload(
    const std::vector<FunctionDecl *> &Candidates, const std::string &Name,
    const std::vector<std::unique_ptr<ExprAST>> &Args, SourceLocation Loc) {
  // Overloads are told apart by the number of arguments only.
  std::vector<FunctionDecl *> Viable;
  for (FunctionDecl *FD : Candidates) {
    if (FD->getNumParams() == Args.size())
      Viable.push_back(FD);
  }

  if (Viable.size() == 1)
    return Viable.front();

  if (Viable.empty()) {
    reportCompilerErrorAt(Loc, "no matching function for call to '" + Name + "'");
    for (FunctionDecl *FD : Candidates)
      reportCompilerNote(FD->getLocation(),
                         "candidate function not viable: requires " +
                             std::to_string(FD->getNumParams()) + " argument" +
                             (FD->getNumParams() == 1 ? "" : "s") + ", but " +
                             std::to_string(Args.size()) +
                             (Args.size() == 1 ? " was" : " were") + " provided");
    return nullptr;
  }

  reportCompilerErrorAt(Loc, "call to '" + Name + "' is ambiguous");
  for (FunctionDecl *FD : Viable)
    reportCompilerNote(FD->getLocation(), "candidate function");
  return nullptr;
}

bool SemanticAnalysis::checkCall(CallExprAST *E) {
  ExprAST *Callee = E->getCallee();
  const SourceLocation Loc = E->getSourceLocation();

  std::vector<FunctionDecl *> Candidates;
  std::string Name;
  // The object the call is made on: explicit for 'a.f()', implicit for a
  // bare 'f()' inside a member function.
  bool HasObject = false;
  bool ObjectIsConst = false;

  if (auto *Ref = dynamic_cast<DeclRefExprAST *>(Callee)) {
    if (!checkDeclRef(Ref, /*AllowOverloadSet=*/true))
      return false;
    Candidates = Ref->getCandidates();
    Name = Ref->getNameRef().getAsString();
    if (auto *MD = llvm::dyn_cast_or_null<CXXMethodDecl>(CurFunction)) {
      HasObject = !MD->isStatic();
      ObjectIsConst = MD->isConst();
    }
  } else if (auto *Member = dynamic_cast<MemberAccessExprAST *>(Callee)) {
    if (!checkMemberAccess(Member, /*AllowOverloadSet=*/true))
      return false;
    Candidates = Member->getCandidates();
    Name = Member->getMemberName();
    HasObject = true;
    QualType ObjectType = Member->getBase()->getType();
    if (Member->isArrow())
      ObjectType = ObjectType->getPointeeType();
    ObjectIsConst = isConstType(ObjectType);
  } else if (!checkExpression(Callee)) {
    return false;
  }

  if (Candidates.empty()) {
    reportCompilerErrorAt(Loc, "called object type '" +
                                   Callee->getType().getAsString() +
                                   "' is not a function or function pointer");
    return false;
  }

  bool ArgsValid = true;
  for (const std::unique_ptr<ExprAST> &Arg : E->getArgs())
    ArgsValid &= checkExpression(Arg.get());
  if (!ArgsValid)
    return false;

  FunctionDecl *Target = resolveOverload(Candidates, Name, E->getArgs(), Loc);
  if (!Target)
    return false;

  if (auto *MD = llvm::dyn_cast<CXXMethodDecl>(Target)) {
    if (!MD->isStatic()) {
      if (!HasObject) {
        reportCompilerErrorAt(Loc, "call to non-static member function without "
                                   "an object argument");
        return false;
      }
      if (ObjectIsConst && !MD->isConst()) {
        reportCompilerErrorAt(Loc, "'this' argument to member function '" + Name +
                                       "' has type 'const " +
                                       MD->getParent()->getQualifiedNameAsString() +
                                       "', but function is not marked const");
        reportCompilerNote(MD->getLocation(), "'" + Name + "' declared here");
        return false;
      }
    }
  }

  for (unsigned I = 0, N = Target->getNumParams(); I != N; ++I) {
    if (!checkInitialization(Target->getParamDecl(I)->getType(),
                             E->getArgs()[I].get(), InitKind::Parameter))
      return false;
  }

  QualType ReturnType = Target->getReturnType();
  if (!ReturnType->isReferenceType() &&
      !Trigger.requireCompleteType(Loc, ReturnType, CompletenessReason::CallReturn))
    return false;

  E->setTarget(Target);
  E->setType(getNonReferenceType(ReturnType));
  E->setLValue(ReturnType->isReferenceType());
  return true;
}

// Operators ------------------------------------------------------------------

bool SemanticAnalysis::checkArraySubscript(ArrayIndexExprAST *E) {
  bool Valid = checkExpression(E->getArray());
  Valid &= checkExpression(E->getIndex());
  if (!Valid)
    return false;

  const SourceLocation Loc = E->getSourceLocation();
  QualType BaseType = E->getArray()->getType();
  QualType ElementType;
  if (const auto *AT =
          llvm::dyn_cast<ConstantArrayType>(BaseType.getCanonicalType().getTypePtr())) {
    ElementType = AT->getElementType();
    if (isConstType(BaseType))
      ElementType = ElementType.withConst();
  } else if (BaseType->isPointerType()) {
    ElementType = BaseType->getPointeeType();
    if (!Trigger.requireCompleteType(Loc, ElementType, CompletenessReason::Subscript))
      return false;
  } else {
    reportCompilerErrorAt(Loc, "subscripted value is not an array or pointer");
    return false;
  }

  QualType IndexType = E->getIndex()->getType();
  if (!IndexType->isIntegerType() || isScopedEnumType(IndexType)) {
    reportCompilerErrorAt(E->getIndex()->getSourceLocation(),
                          "array subscript is not an integer");
    return false;
  }

  E->setType(ElementType);
  E->setLValue(true);
  return true;
}

bool SemanticAnalysis::checkUnary(UnaryExprAST *E) {
  ExprAST *Operand = E->getOperand();
  if (!checkExpression(Operand))
    return false;

  const std::string &Op = E->getOp();
  const SourceLocation Loc = E->getSourceLocation();
  QualType T = Operand->getType();

  if (Op == "-") {
    if (!T->isArithmeticType()) {
      reportCompilerErrorAt(Loc, "invalid argument type '" + T.getAsString() +
                                     "' to unary expression");
      return false;
    }
    E->setType(getPromotedType(T));
    return true;
  }

  if (Op == "!") {
    if (!T->isScalarType() || isScopedEnumType(T)) {
      reportCompilerErrorAt(Loc, "invalid argument type '" + T.getAsString() +
                                     "' to unary expression");
      return false;
    }
    E->setType(Ctx.getBuiltinType(BuiltinKind::Bool));
    return true;
  }

  if (Op == "&") {
    if (!Operand->isLValue()) {
      reportCompilerErrorAt(Loc, "cannot take the address of an rvalue of type '" +
                                     T.getAsString() + "'");
      return false;
    }
    E->setType(Ctx.getPointerType(T));
    return true;
  }

  if (Op == "*") {
    if (!T->isPointerType()) {
      reportCompilerErrorAt(Loc, "indirection requires pointer operand ('" +
                                     T.getAsString() + "' invalid)");
      return false;
    }
    QualType Pointee = T->getPointeeType();
    if (Pointee->isVoidType()) {
      reportCompilerErrorAt(Loc, "indirection not permitted on operand of type '" +
                                     T.getAsString() + "'");
      return false;
    }
    E->setType(Pointee);
    E->setLValue(true);
    return true;
  }

  reportCompilerErrorAt(Loc, "unknown unary operator '" + Op + "'");
  return false;
}

bool SemanticAnalysis::checkBinary(BinaryExprAST *E) {
  ExprAST *LHS = E->getLHS();
  ExprAST *RHS = E->getRHS();
  bool Valid = checkExpression(LHS);
  Valid &= checkExpression(RHS);
  if (!Valid)
    return false;

  const std::string &Op = E->getOp();
  const SourceLocation Loc = E->getSourceLocation();
  QualType L = LHS->getType();
  QualType R = RHS->getType();

  auto invalidOperands = [&]() {
    reportCompilerErrorAt(Loc, "invalid operands to binary expression ('" +
                                   L.getAsString() + "' and '" + R.getAsString() +
                                   "')");
    return false;
  };
  // Arrays decay to pointers to their first element.
  auto decay = [&](QualType T) {
    if (const auto *AT =
            llvm::dyn_cast<ConstantArrayType>(T.getCanonicalType().getTypePtr()))
      return Ctx.getPointerType(isConstType(T) ? AT->getElementType().withConst()
                                               : AT->getElementType());
    return T;
  };

  if (Op == "=") {
    if (!LHS->isLValue()) {
      reportCompilerErrorAt(Loc, "expression is not assignable");
      return false;
    }
    if (L->isArrayType()) {
      reportCompilerErrorAt(Loc, "array type '" + L.getAsString() +
                                     "' is not assignable");
      return false;
    }
    if (isConstType(L)) {
      reportCompilerErrorAt(Loc, "read-only variable is not assignable");
      return false;
    }
    if (!checkInitialization(L, RHS, InitKind::Assignment))
      return false;
    E->setType(L);
    E->setLValue(true);
    return true;
  }

  if (Op == "&&" || Op == "||") {
    if (!L->isScalarType() || !R->isScalarType() || isScopedEnumType(L) ||
        isScopedEnumType(R))
      return invalidOperands();
    E->setType(Ctx.getBuiltinType(BuiltinKind::Bool));
    return true;
  }

  const bool IsEquality = Op == "==" || Op == "!=";
  const bool IsRelational = Op == "<" || Op == ">" || Op == "<=" || Op == ">=";
  if (IsEquality || IsRelational) {
    QualType DL = decay(L), DR = decay(R);
    bool Comparable = false;
    if (DL->isArithmeticType() && DR->isArithmeticType())
      Comparable = true;
    else if (isScopedEnumType(DL) || isScopedEnumType(DR))
      Comparable = Ctx.hasSameUnqualifiedType(DL, DR);
    else if (DL->isPointerType() && DR->isPointerType())
      Comparable = isImplicitlyConvertible(DR, DL, RHS) ||
                   isImplicitlyConvertible(DL, DR, LHS);
    else if (DL->isPointerType() || DR->isPointerType())
      Comparable = (DL->isPointerType() && isNullPointerConstant(RHS)) ||
                   (DR->isPointerType() && isNullPointerConstant(LHS));
    else if (DL->isNullPtrType() && DR->isNullPtrType())
      Comparable = IsEquality;
    if (!Comparable)
      return invalidOperands();
    E->setType(Ctx.getBuiltinType(BuiltinKind::Bool));
    return true;
  }

  if (Op == "+" || Op == "-") {
    QualType DL = decay(L), DR = decay(R);
    if (DL->isArithmeticType() && DR->isArithmeticType()) {
      E->setType(getArithmeticResultType(DL, DR));
      return true;
    }
    if (DL->isPointerType() && DR->isIntegerType() && !isScopedEnumType(DR)) {
      E->setType(DL);
      return true;
    }
    if (Op == "+" && DR->isPointerType() && DL->isIntegerType() &&
        !isScopedEnumType(DL)) {
      E->setType(DR);
      return true;
    }
    if (Op == "-" && DL->isPointerType() && DR->isPointerType() &&
        Ctx.hasSameUnqualifiedType(DL->getPointeeType(), DR->getPointeeType())) {
      E->setType(Ctx.getBuiltinType(BuiltinKind::Long));
      return true;
    }
    return invalidOperands();
  }

  if (Op == "*" || Op == "/" || Op == "%") {
    if (!L->isArithmeticType() || !R->isArithmeticType())
      return invalidOperands();
    if (Op == "%" && (!L->isIntegerType() || !R->isIntegerType()))
      return invalidOperands();
    E->setType(getArithmeticResultType(L, R));
    return true;
  }

  reportCompilerErrorAt(Loc, "unknown binary operator '" + Op + "'");
  return false;
}

bool SemanticAnalysis::checkSizeof(SizeofExprAST *E) {
  QualType T;
  if (E->isArgumentType()) {
    T = getNonReferenceType(E->getArgumentType());
  } else {
    if (!checkExpression(E->getArgumentExpr()))
      return false;
    T = E->getArgumentExpr()->getType();
  }

  const SourceLocation Loc = E->getSourceLocation();
  if (!Trigger.requireCompleteType(Loc, T, CompletenessReason::Sizeof))
    return false;
  std::optional<TypeSizeInfo> Info = Layouts.getTypeInfo(T);
  if (!Info || T->isVoidType()) {
    reportCompilerErrorAt(Loc, "invalid application of 'sizeof' to an incomplete "
                               "type '" + T.getAsString() + "'");
    return false;
  }
  E->setValue(Info->Size);
  E->setType(Ctx.getBuiltinType(BuiltinKind::ULong));
  return true;
}

// Conversions ----------------------------------------------------------------

bool SemanticAnalysis::isImplicitlyConvertible(QualType From, QualType To,
                                               const ExprAST *E) {
  if (From.isNull() || To.isNull())
    return false;
  From = getNonReferenceType(From);
  To = getNonReferenceType(To);
  if (Ctx.hasSameUnqualifiedType(From, To))
    return true;

  if (To->isBooleanType())
    return (From->isScalarType() && !isScopedEnumType(From)) || From->isArrayType();

  if (To->isEnumeralType())
    return false;
  if (To->isArithmeticType())
    return From->isArithmeticType();

  if (To->isPointerType()) {
    if (From->isNullPtrType() || (E && isNullPointerConstant(E) && From->isIntegerType()))
      return true;
    QualType FromPointee;
    if (const auto *AT =
            llvm::dyn_cast<ConstantArrayType>(From.getCanonicalType().getTypePtr()))
      FromPointee = isConstType(From) ? AT->getElementType().withConst()
                                      : AT->getElementType();
    else if (From->isPointerType())
      FromPointee = From->getPointeeType();
    else
      return false;

    QualType ToPointee = To->getPointeeType();
    if (isConstType(FromPointee) && !isConstType(ToPointee))
      return false;
    if (Ctx.hasSameUnqualifiedType(FromPointee, ToPointee))
      return true;
    if (ToPointee->isVoidType())
      return true;
    const RecordDecl *FromRD = FromPointee->getAsRecordDecl();
    const RecordDecl *ToRD = ToPointee->getAsRecordDecl();
    return FromRD && ToRD && FromRD->isDerivedFrom(ToRD);
  }

  if (To->isRecordType()) {
    const RecordDecl *FromRD = From->getAsRecordDecl();
    return FromRD && FromRD->isDerivedFrom(To->getAsRecordDecl());
  }
  return false;
}

bool SemanticAnalysis::checkInitialization(QualType To, ExprAST *From,
                                           InitKind Kind) {
  QualType FromType = From->getType();
  if (FromType.isNull() || To.isNull())
    return false;
  const SourceLocation Loc = From->getSourceLocation();

  if (To->isReferenceType()) {
    QualType Pointee = To->getPointeeType();
    const bool PointeeConst = isConstType(Pointee);
    const RecordDecl *FromRD = FromType->getAsRecordDecl();
    const RecordDecl *ToRD = Pointee->getAsRecordDecl();
    const bool Related = Ctx.hasSameUnqualifiedType(FromType, Pointee) ||
                         (FromRD && ToRD && FromRD->isDerivedFrom(ToRD));

    if (From->isLValue() && Related) {
      if (isConstType(FromType) && !PointeeConst) {
        reportCompilerErrorAt(Loc, "binding reference of type '" +
                                       Pointee.getAsString() + "' to value of type '" +
                                       FromType.getAsString() +
                                       "' drops 'const' qualifier");
        return false;
      }
      return true;
    }
    if (!PointeeConst) {
      reportCompilerErrorAt(Loc, From->isLValue()
                                     ? "non-const lvalue reference to type '" +
                                           Pointee.getAsString() +
                                           "' cannot bind to a value of unrelated "
                                           "type '" + FromType.getAsString() + "'"
                                     : "non-const lvalue reference to type '" +
                                           Pointee.getAsString() +
                                           "' cannot bind to a temporary of type '" +
                                           FromType.getAsString() + "'");
      return false;
    }
    To = Pointee;
  }

  if (isImplicitlyConvertible(FromType, To, From))
    return true;

  const std::string ToStr = To.getAsString();
  const std::string FromStr = FromType.getAsString();
  switch (Kind) {
    case InitKind::Variable:
      reportCompilerErrorAt(Loc, "cannot initialize a variable of type '" + ToStr +
                                     "' with a value of type '" + FromStr + "'");
      break;
    case InitKind::Parameter:
      reportCompilerErrorAt(Loc, "cannot initialize a parameter of type '" + ToStr +
                                     "' with a value of type '" + FromStr + "'");
      break;
    case InitKind::Return:
      reportCompilerErrorAt(Loc, "cannot initialize return object of type '" + ToStr +
                                     "' with a value of type '" + FromStr + "'");
      break;
    case InitKind::Assignment:
      reportCompilerErrorAt(Loc, "assigning to '" + ToStr +
                                     "' from incompatible type '" + FromStr + "'");
      break;
  }
  return false;
}

// Constant folding -----------------------------------------------------------

bool SemanticAnalysis::evaluateIntegerConstant(const ExprAST *E, int64_t &Result) {
  if (!E)
    return false;
  if (const auto *Lit = dynamic_cast<const IntegerLiteralExprAST *>(E)) {
    Result = static_cast<int64_t>(Lit->getValue());
    return true;
  }
  if (const auto *B = dynamic_cast<const BoolExprAST *>(E)) {
    Result = B->getValue() ? 1 : 0;
    return true;
  }
  if (const auto *Paren = dynamic_cast<const ParenExprAST *>(E))
    return evaluateIntegerConstant(Paren->getSubExpr(), Result);
  if (const auto *Sizeof = dynamic_cast<const SizeofExprAST *>(E)) {
    if (Sizeof->getType().isNull())
      return false;
    Result = static_cast<int64_t>(Sizeof->getValue());
    return true;
  }
  if (const auto *Ref = dynamic_cast<const DeclRefExprAST *>(E)) {
    const NamedDecl *ND = Ref->getDecl();
    if (const auto *ECD = llvm::dyn_cast_or_null<EnumConstantDecl>(ND)) {
      Result = ECD->getInitVal();
      return true;
    }
    // A const integer variable with a constant initializer folds too.
    if (const auto *VD = llvm::dyn_cast_or_null<VarDecl>(ND)) {
      if (!isConstType(VD->getType()) || !VD->getType()->isIntegerType())
        return false;
      if (VD->hasConstantValue()) {
        Result = VD->getConstantValue();
        return true;
      }
      return VD->getInit() && evaluateIntegerConstant(VD->getInit(), Result);
    }
    return false;
  }
  if (const auto *Member = dynamic_cast<const MemberAccessExprAST *>(E)) {
    if (const auto *ECD =
            llvm::dyn_cast_or_null<EnumConstantDecl>(Member->getMemberDecl())) {
      Result = ECD->getInitVal();
      return true;
    }
    return false;
  }
  if (const auto *Unary = dynamic_cast<const UnaryExprAST *>(E)) {
    int64_t V = 0;
    if (!evaluateIntegerConstant(Unary->getOperand(), V))
      return false;
    if (Unary->getOp() == "-") {
      Result = -V;
      return true;
    }
    if (Unary->getOp() == "!") {
      Result = V == 0;
      return true;
    }
    return false;
  }
  if (const auto *Binary = dynamic_cast<const BinaryExprAST *>(E)) {
    int64_t L = 0, R = 0;
    if (!evaluateIntegerConstant(Binary->getLHS(), L) ||
        !evaluateIntegerConstant(Binary->getRHS(), R))
      return false;
    const std::string &Op = Binary->getOp();
    if (Op == "+")
      Result = L + R;
    else if (Op == "-")
      Result = L - R;
    else if (Op == "*")
      Result = L * R;
    else if (Op == "/" || Op == "%") {
      if (R == 0)
        return false;
      Result = Op == "/" ? L / R : L % R;
    } else if (Op == "==")
      Result = L == R;
    else if (Op == "!=")
      Result = L != R;
    else if (Op == "<")
      Result = L < R;
    else if (Op == ">")
      Result = L > R;
    else if (Op == "<=")
      Result = L <= R;
    else if (Op == ">=")
      Result = L >= R;
    else if (Op == "&&")
      Result = L && R;
    else if (Op == "||")
      Result = L || R;
    else
      return false;
    return true;
  }
  return false;
}

} // namespace analysis
