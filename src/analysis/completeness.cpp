#include "analysis/completeness.h"

#include "ast/ast_context.h"
#include "ast/decl.h"

namespace analysis {

static std::string describeIncomplete(CompletenessReason Reason,
                                      const std::string &TypeName) {
  switch (Reason) {
    case CompletenessReason::Variable:
    case CompletenessReason::Parameter:
      return "variable has incomplete type '" + TypeName + "'";
    case CompletenessReason::Field:
      return "field has incomplete type '" + TypeName + "'";
    case CompletenessReason::BaseClass:
      return "base class has incomplete type '" + TypeName + "'";
    case CompletenessReason::MemberAccess:
      return "member access into incomplete type '" + TypeName + "'";
    case CompletenessReason::QualifiedLookup:
      return "incomplete type '" + TypeName + "' named in nested name specifier";
    case CompletenessReason::Sizeof:
      return "invalid application of 'sizeof' to an incomplete type '" +
             TypeName + "'";
    case CompletenessReason::Subscript:
      return "subscript of pointer to incomplete type '" + TypeName + "'";
    case CompletenessReason::ReturnType:
      return "incomplete result type '" + TypeName + "' in function definition";
    case CompletenessReason::CallReturn:
      return "calling function with incomplete return type '" + TypeName + "'";
  }
  return "incomplete type '" + TypeName + "'";
}

bool CompletenessTrigger::completeRecord(RecordDecl *RD,
                                         CompletenessReason Reason) {
  if (RD->isCompleteDefinition())
    return true;
  // Members declared so far are visible inside the class body.
  if (RD->isBeingDefined())
    return Reason == CompletenessReason::MemberAccess ||
           Reason == CompletenessReason::QualifiedLookup;
  if (RD->hasExternalDefinitionPending()) {
    if (ExternalDeclSource *Source = Ctx.getExternalSource()) {
      ++NumExternalCompletions;
      Source->completeRecordDefinition(RD);
    }
  }
  return RD->isCompleteDefinition();
}

bool CompletenessTrigger::completeType(QualType T, CompletenessReason Reason) {
  if (T.isNull())
    return false;
  const Type *Ty = T.getCanonicalType().getTypePtr();

  if (const auto *AT = llvm::dyn_cast<ConstantArrayType>(Ty))
    return completeType(AT->getElementType(), Reason);
  if (const auto *RT = llvm::dyn_cast<RecordType>(Ty))
    return completeRecord(RT->getDecl(), Reason);
  if (const auto *ET = llvm::dyn_cast<EnumType>(Ty))
    return ET->getDecl()->isComplete();
  if (Ty->isVoidType())
    return Reason == CompletenessReason::ReturnType ||
           Reason == CompletenessReason::CallReturn;
  return true;
}

bool CompletenessTrigger::requireCompleteType(SourceLocation Loc, QualType T,
                                              CompletenessReason Reason) {
  if (completeType(T, Reason))
    return true;

  reportCompilerErrorAt(Loc, describeIncomplete(Reason, T.getAsString()));

  QualType Element = T.getCanonicalType();
  while (const auto *AT = llvm::dyn_cast<ConstantArrayType>(Element.getTypePtr()))
    Element = AT->getElementType().getCanonicalType();
  if (const RecordDecl *RD = Element->getAsRecordDecl()) {
    if (!RD->isBeingDefined())
      reportCompilerNote(RD->getLocation(), "forward declaration of '" +
                                                RD->getQualifiedNameAsString() +
                                                "'");
    else
      reportCompilerNote(RD->getLocation(), "definition of '" +
                                                RD->getQualifiedNameAsString() +
                                                "' is not complete until the "
                                                "closing '}'");
  }
  return false;
}

} // namespace analysis
