#ifndef DECLCACHE_ANALYSIS_COMPLETENESS_H
#define DECLCACHE_ANALYSIS_COMPLETENESS_H

#include <cstdint>

#include "ast/type.h"
#include "compiler_session.h"

class ASTContext;
class RecordDecl;

namespace analysis {

/// Why a complete type is required. Each reason has its own diagnostic.
enum class CompletenessReason : uint8_t {
  Variable,
  Field,
  BaseClass,
  MemberAccess,
  QualifiedLookup,
  Sizeof,
  Subscript,
  Parameter,
  ReturnType,
  CallReturn
};

/// CompletenessTrigger - Decides when a type has to be complete and asks the
/// external source for a record's definition at that point.
///
/// Pointers, references and function declarations never come through here;
/// semantic analysis only calls requireCompleteType() where an object of the
/// type is created, inspected or measured.
class CompletenessTrigger {
public:
  explicit CompletenessTrigger(ASTContext &Ctx) : Ctx(Ctx) {}

  /// Complete T if possible and report an error at Loc when it stays
  /// incomplete.
  bool requireCompleteType(SourceLocation Loc, QualType T,
                           CompletenessReason Reason);

  /// Complete T if possible without diagnosing.
  bool completeType(QualType T, CompletenessReason Reason);
  bool completeRecord(RecordDecl *RD, CompletenessReason Reason);

  unsigned getNumExternalCompletions() const { return NumExternalCompletions; }

private:
  ASTContext &Ctx;
  unsigned NumExternalCompletions = 0;
};

} // namespace analysis

#endif // DECLCACHE_ANALYSIS_COMPLETENESS_H
