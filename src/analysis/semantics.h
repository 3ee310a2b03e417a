#ifndef DECLCACHE_ANALYSIS_SEMANTICS_H
#define DECLCACHE_ANALYSIS_SEMANTICS_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "analysis/completeness.h"
#include "analysis/record_layout.h"
#include "ast/decl.h"
#include "ast/expr.h"
#include "ast/stmt.h"

#include "llvm/ADT/StringMap.h"

class ASTContext;

namespace analysis {

/// One parameter as written in a function declarator.
struct ParamInfo {
  std::string Name;
  QualType Type;
  SourceLocation Loc;
};

enum class InitKind : uint8_t { Variable, Parameter, Return, Assignment };

/// SemanticAnalysis - Builds declarations for the parser and checks
/// statements and expressions as they are parsed. Every name lookup goes
/// through the declaration contexts, so names provided by an attached
/// declaration store are loaded the first time they are looked up here.
class SemanticAnalysis {
public:
  explicit SemanticAnalysis(ASTContext &Ctx);
  ~SemanticAnalysis();

  SemanticAnalysis(const SemanticAnalysis &) = delete;
  SemanticAnalysis &operator=(const SemanticAnalysis &) = delete;

  ASTContext &getASTContext() { return Ctx; }
  CompletenessTrigger &getCompletenessTrigger() { return Trigger; }
  RecordLayoutContext &getLayoutContext() { return Layouts; }

  // Contexts and local scopes ------------------------------------------------

  DeclContext *getCurContext() const { return CurContext; }
  FunctionDecl *getCurFunctionDecl() const { return CurFunction; }
  void pushDeclContext(DeclContext *DC) { CurContext = DC; }
  void popDeclContext();
  void pushScope();
  void popScope();

  // Lookup -------------------------------------------------------------------

  DeclContext::lookup_result lookupUnqualified(llvm::StringRef Name);
  DeclContext::lookup_result lookupQualified(DeclContext *DC, llvm::StringRef Name);
  DeclContext::lookup_result lookupInRecord(RecordDecl *RD, llvm::StringRef Name);
  /// The context named by the qualifiers of Name, or null. Qualified lookup
  /// into a record needs the record's definition.
  DeclContext *lookupNestedNameSpecifier(const QualifiedNameRef &Name,
                                         bool Diagnose);
  /// The type declaration Name refers to, or null. Never diagnoses.
  TypeDecl *getTypeName(const QualifiedNameRef &Name);

  // Declarations -------------------------------------------------------------

  NamespaceDecl *actOnStartNamespace(SourceLocation Loc, llvm::StringRef Name);
  void actOnFinishNamespace();

  /// 'struct S;'
  RecordDecl *actOnTagDeclaration(SourceLocation Loc, TagKind Tag,
                                  llvm::StringRef Name);
  /// 'struct S' used as a type; declares S when nothing is visible.
  RecordDecl *actOnElaboratedTypeName(SourceLocation Loc, TagKind Tag,
                                      const QualifiedNameRef &Name);
  RecordDecl *actOnStartRecordDefinition(SourceLocation Loc, TagKind Tag,
                                         llvm::StringRef Name);
  void actOnBaseSpecifier(RecordDecl *RD, SourceLocation Loc, QualType BaseType,
                          AccessSpecifier Access);
  void actOnFinishRecordDefinition(RecordDecl *RD);

  EnumDecl *actOnStartEnum(SourceLocation Loc, llvm::StringRef Name, bool Scoped,
                           QualType Underlying);
  EnumConstantDecl *actOnEnumConstant(EnumDecl *ED, SourceLocation Loc,
                                      llvm::StringRef Name,
                                      std::unique_ptr<ExprAST> Init);
  void actOnFinishEnum(EnumDecl *ED);

  TypedefNameDecl *actOnTypedef(SourceLocation Loc, llvm::StringRef Name,
                                QualType T, bool IsAlias);
  FieldDecl *actOnField(SourceLocation Loc, llvm::StringRef Name, QualType T,
                        AccessSpecifier Access);
  VarDecl *actOnVariable(SourceLocation Loc, llvm::StringRef Name, QualType T,
                         StorageClass SC, std::unique_ptr<ExprAST> Init);

  FunctionDecl *actOnFunctionDeclarator(SourceLocation Loc, llvm::StringRef Name,
                                        QualType ReturnType,
                                        const std::vector<ParamInfo> &Params,
                                        StorageClass SC, bool IsInline,
                                        bool IsConst, AccessSpecifier Access);
  /// Returns the function whose body is about to be parsed. A redefinition
  /// is diagnosed and gets a detached function so its body is still checked.
  FunctionDecl *actOnStartFunctionBody(SourceLocation Loc, FunctionDecl *FD,
                                       const std::vector<ParamInfo> &Params);
  void actOnFinishFunctionBody(FunctionDecl *FD,
                               std::unique_ptr<BlockStmtAST> Body);

  /// Evaluate an array bound; false (after a diagnostic) if it is not a
  /// non-negative integral constant.
  bool actOnArrayBound(ExprAST *Size, uint64_t &Result);

  // Statements ---------------------------------------------------------------

  bool checkReturnStmt(SourceLocation Loc, ExprAST *Value);
  bool checkCondition(ExprAST *Cond);

  // Expressions (sema_expr.cpp) ---------------------------------------------

  bool checkExpression(ExprAST *E);
  bool checkInitialization(QualType To, ExprAST *From, InitKind Kind);
  bool isImplicitlyConvertible(QualType From, QualType To, const ExprAST *E);
  bool evaluateIntegerConstant(const ExprAST *E, int64_t &Result);

private:
  ASTContext &Ctx;
  CompletenessTrigger Trigger;
  RecordLayoutContext Layouts;
  DeclContext *CurContext;
  FunctionDecl *CurFunction = nullptr;
  std::vector<llvm::StringMap<NamedDecl *>> Scopes;

  std::string describeContext(const DeclContext *DC) const;
  void notePrevious(const NamedDecl *Previous, bool IsDefinition);
  bool requireValueType(SourceLocation Loc, QualType T, CompletenessReason Reason);

  bool checkDeclRef(DeclRefExprAST *E, bool AllowOverloadSet);
  bool checkMemberAccess(MemberAccessExprAST *E, bool AllowOverloadSet);
  bool checkCall(CallExprAST *E);
  bool checkArraySubscript(ArrayIndexExprAST *E);
  bool checkUnary(UnaryExprAST *E);
  bool checkBinary(BinaryExprAST *E);
  bool checkSizeof(SizeofExprAST *E);
  FunctionDecl *resolveOverload(const std::vector<FunctionDecl *> &Candidates,
                                const std::string &Name,
                                const std::vector<std::unique_ptr<ExprAST>> &Args,
                                SourceLocation Loc);
  QualType getArithmeticResultType(QualType LHS, QualType RHS);
  QualType getPromotedType(QualType T);
};

} // namespace analysis

#endif // DECLCACHE_ANALYSIS_SEMANTICS_H
