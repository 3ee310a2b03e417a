#ifndef DECLCACHE_AST_AST_DUMPER_H
#define DECLCACHE_AST_AST_DUMPER_H

#include <functional>
#include <string>
#include <vector>

#include "llvm/Support/raw_ostream.h"

class Decl;
class DeclContext;
class ExprAST;
class StmtAST;
class QualType;

/// ASTDumper - Prints declarations, statements and expressions as an
/// indented tree:
///
///   TranslationUnitDecl
///   |-NamespaceDecl ns
///   | `-CXXRecordDecl struct S definition
///   `-VarDecl s 'ns::S'
class ASTDumper {
public:
  using ChildDumper = std::function<void()>;

  explicit ASTDumper(llvm::raw_ostream &OS) : OS(OS) {}

  void dumpDecl(const Decl *D);
  void dumpStmt(const StmtAST *S);
  void dumpExpr(const ExprAST *E);

  /// Print the tree connectors for each child in turn.
  void dumpChildren(const std::vector<ChildDumper> &Children);

  llvm::raw_ostream &os() { return OS; }
  void printType(QualType T);
  /// Finish the current node line; used by every node's dump().
  void endLine() { OS << '\n'; }

private:
  llvm::raw_ostream &OS;
  std::string Prefix;

  void dumpDeclContextChildren(const Decl *D, const DeclContext *DC,
                               std::vector<ChildDumper> &Children);
};

#endif // DECLCACHE_AST_AST_DUMPER_H
