// This file implements the tree dumper behind -ast-dump and the per-node dump() overrides.

#include "ast/ast_dumper.h"

#include "ast/ast_context.h"
#include "ast/decl.h"
#include "ast/expr.h"
#include "ast/stmt.h"

void ASTDumper::dumpChildren(const std::vector<ChildDumper> &Children) {
  for (std::size_t I = 0; I < Children.size(); ++I) {
    const bool IsLast = I + 1 == Children.size();
    OS << Prefix << (IsLast ? "`-" : "|-");
    std::string Saved = Prefix;
    Prefix += IsLast ? "  " : "| ";
    Children[I]();
    Prefix = std::move(Saved);
  }
}

void ASTDumper::printType(QualType T) {
  if (T.isNull())
    return;
  OS << " '" << T.getAsString() << "'";
  QualType Canon = T.getCanonicalType();
  if (Canon != T && Canon.getAsString() != T.getAsString())
    OS << ":'" << Canon.getAsString() << "'";
}

static const char *getStorageClassSpelling(StorageClass SC) {
  switch (SC) {
    case StorageClass::Static:
      return " static";
    case StorageClass::Extern:
      return " extern";
    case StorageClass::None:
      break;
  }
  return "";
}

void ASTDumper::dumpDeclContextChildren(const Decl *D, const DeclContext *DC,
                                        std::vector<ChildDumper> &Children) {
  for (const Decl *Child : DC->decls()) {
    // Parameters are printed by their function.
    if (llvm::isa<ParmVarDecl>(Child))
      continue;
    Children.push_back([this, Child] { dumpDecl(Child); });
  }

  bool Undeserialized = false;
  if (const auto *RD = llvm::dyn_cast<RecordDecl>(D))
    Undeserialized = RD->hasExternalDefinitionPending();
  else if (DC->isFileContext() && D->getASTContext().getExternalSource())
    Undeserialized = llvm::isa<TranslationUnitDecl>(D) || D->isFromStore();
  if (Undeserialized)
    Children.push_back([this] { OS << "<undeserialized declarations>\n"; });
}

void ASTDumper::dumpDecl(const Decl *D) {
  if (!D) {
    OS << "<<<NULL>>>\n";
    return;
  }

  OS << D->getDeclKindName() << "Decl";
  const auto *ND = llvm::dyn_cast<NamedDecl>(D);
  std::vector<ChildDumper> Children;

  switch (D->getKind()) {
    case Decl::TranslationUnit:
      break;
    case Decl::Namespace:
      OS << ' ' << ND->getName();
      break;
    case Decl::CXXRecord: {
      const auto *RD = llvm::cast<RecordDecl>(D);
      OS << ' ' << RD->getKindName() << ' ' << RD->getName();
      if (RD->isCompleteDefinition() || RD->isBeingDefined())
        OS << " definition";
      for (const CXXBaseSpecifier &Base : RD->bases()) {
        Children.push_back([this, Base] {
          OS << getAccessSpelling(Base.Access);
          printType(Base.BaseType);
          endLine();
        });
      }
      break;
    }
    case Decl::Enum: {
      const auto *ED = llvm::cast<EnumDecl>(D);
      if (ED->isScoped())
        OS << " class";
      if (!ED->isAnonymous())
        OS << ' ' << ED->getName();
      printType(ED->getIntegerType());
      break;
    }
    case Decl::EnumConstant: {
      const auto *ECD = llvm::cast<EnumConstantDecl>(D);
      OS << ' ' << ECD->getName();
      printType(ECD->getType());
      OS << ' ' << ECD->getInitVal();
      break;
    }
    case Decl::Typedef:
    case Decl::TypeAlias:
      OS << ' ' << ND->getName();
      printType(llvm::cast<TypedefNameDecl>(D)->getUnderlyingType());
      break;
    case Decl::Field:
      OS << ' ' << ND->getName();
      printType(llvm::cast<FieldDecl>(D)->getType());
      break;
    case Decl::Var:
    case Decl::ParmVar: {
      const auto *VD = llvm::cast<VarDecl>(D);
      OS << ' ' << VD->getName();
      printType(VD->getType());
      OS << getStorageClassSpelling(VD->getStorageClass());
      if (const ExprAST *Init = VD->getInit()) {
        OS << " cinit";
        Children.push_back([this, Init] { dumpExpr(Init); });
      } else if (VD->hasInit()) {
        OS << " cinit";
      }
      break;
    }
    case Decl::Function:
    case Decl::CXXMethod: {
      const auto *FD = llvm::cast<FunctionDecl>(D);
      OS << ' ' << FD->getName() << " '" << FD->getTypeString() << "'";
      OS << getStorageClassSpelling(FD->getStorageClass());
      if (FD->isInlineSpecified())
        OS << " inline";
      for (const ParmVarDecl *Param : FD->parameters())
        Children.push_back([this, Param] { dumpDecl(Param); });
      break;
    }
  }

  if (D->getAccess() != AccessSpecifier::None &&
      D->getKind() != Decl::CXXRecord) {
    if (const auto *Parent = llvm::dyn_cast_or_null<RecordDecl>(
            Decl::castFromDeclContext(D->getDeclContext()))) {
      if (D->getAccess() != Parent->getDefaultAccess())
        OS << ' ' << getAccessSpelling(D->getAccess());
    }
  }
  if (D->isFromStore())
    OS << " imported";
  endLine();

  if (const auto *FD = llvm::dyn_cast<FunctionDecl>(D)) {
    if (const BlockStmtAST *Body = FD->getBody())
      Children.push_back([this, Body] { dumpStmt(Body); });
    else if (FD->isDefined())
      Children.push_back([this] { OS << "<undeserialized body>\n"; });
  } else if (const DeclContext *DC = Decl::castToDeclContext(D)) {
    dumpDeclContextChildren(D, DC, Children);
  }

  dumpChildren(Children);
}

void ASTDumper::dumpStmt(const StmtAST *S) {
  if (!S) {
    OS << "<<<NULL>>>\n";
    return;
  }
  S->dump(*this);
}

void ASTDumper::dumpExpr(const ExprAST *E) {
  if (!E) {
    OS << "<<<NULL>>>\n";
    return;
  }
  E->dump(*this);
}

// Statements -----------------------------------------------------------------

void BlockStmtAST::dump(ASTDumper &D) const {
  D.os() << "CompoundStmt";
  D.endLine();
  std::vector<ASTDumper::ChildDumper> Children;
  for (const auto &Stmt : Statements) {
    const StmtAST *Child = Stmt.get();
    Children.push_back([&D, Child] { D.dumpStmt(Child); });
  }
  D.dumpChildren(Children);
}

void DeclStmtAST::dump(ASTDumper &D) const {
  D.os() << "DeclStmt";
  D.endLine();
  std::vector<ASTDumper::ChildDumper> Children;
  for (const VarDecl *VD : Decls)
    Children.push_back([&D, VD] { D.dumpDecl(VD); });
  D.dumpChildren(Children);
}

void ReturnStmtAST::dump(ASTDumper &D) const {
  D.os() << "ReturnStmt";
  D.endLine();
  if (ReturnValue)
    D.dumpChildren({[&D, this] { D.dumpExpr(ReturnValue.get()); }});
}

void ExpressionStmtAST::dump(ASTDumper &D) const { D.dumpExpr(Expression.get()); }

void IfStmtAST::dump(ASTDumper &D) const {
  D.os() << "IfStmt";
  if (ElseBranch)
    D.os() << " has_else";
  D.endLine();
  std::vector<ASTDumper::ChildDumper> Children;
  Children.push_back([&D, this] { D.dumpExpr(Condition.get()); });
  Children.push_back([&D, this] { D.dumpStmt(ThenBranch.get()); });
  if (ElseBranch)
    Children.push_back([&D, this] { D.dumpStmt(ElseBranch.get()); });
  D.dumpChildren(Children);
}

void WhileStmtAST::dump(ASTDumper &D) const {
  D.os() << "WhileStmt";
  D.endLine();
  D.dumpChildren({[&D, this] { D.dumpExpr(Condition.get()); },
                  [&D, this] { D.dumpStmt(Body.get()); }});
}

// Expressions ----------------------------------------------------------------

static void printValueCategory(ASTDumper &D, const ExprAST &E) {
  D.printType(E.getType());
  if (E.isLValue())
    D.os() << " lvalue";
}

void IntegerLiteralExprAST::dump(ASTDumper &D) const {
  D.os() << "IntegerLiteral";
  D.printType(Ty);
  D.os() << ' ' << Value;
  D.endLine();
}

void BoolExprAST::dump(ASTDumper &D) const {
  D.os() << "CXXBoolLiteralExpr";
  D.printType(Ty);
  D.os() << (Value ? " true" : " false");
  D.endLine();
}

void NullptrExprAST::dump(ASTDumper &D) const {
  D.os() << "CXXNullPtrLiteralExpr";
  D.printType(Ty);
  D.endLine();
}

void ThisExprAST::dump(ASTDumper &D) const {
  D.os() << "CXXThisExpr";
  D.printType(Ty);
  D.os() << " this";
  D.endLine();
}

void DeclRefExprAST::dump(ASTDumper &D) const {
  D.os() << "DeclRefExpr";
  printValueCategory(D, *this);
  if (Referenced)
    D.os() << ' ' << Referenced->getDeclKindName() << " '"
           << Referenced->getQualifiedNameAsString() << "'";
  else
    D.os() << " '" << Name.getAsString() << "'";
  D.endLine();
}

void MemberAccessExprAST::dump(ASTDumper &D) const {
  D.os() << "MemberExpr";
  printValueCategory(D, *this);
  D.os() << ' ' << (IsArrow ? "->" : ".") << MemberName;
  D.endLine();
  D.dumpChildren({[&D, this] { D.dumpExpr(Base.get()); }});
}

void CallExprAST::dump(ASTDumper &D) const {
  D.os() << (dynamic_cast<const MemberAccessExprAST *>(Callee.get())
                 ? "CXXMemberCallExpr"
                 : "CallExpr");
  printValueCategory(D, *this);
  D.endLine();
  std::vector<ASTDumper::ChildDumper> Children;
  Children.push_back([&D, this] { D.dumpExpr(Callee.get()); });
  for (const auto &Arg : Args) {
    const ExprAST *Child = Arg.get();
    Children.push_back([&D, Child] { D.dumpExpr(Child); });
  }
  D.dumpChildren(Children);
}

void ArrayIndexExprAST::dump(ASTDumper &D) const {
  D.os() << "ArraySubscriptExpr";
  printValueCategory(D, *this);
  D.endLine();
  D.dumpChildren({[&D, this] { D.dumpExpr(Array.get()); },
                  [&D, this] { D.dumpExpr(Index.get()); }});
}

void UnaryExprAST::dump(ASTDumper &D) const {
  D.os() << "UnaryOperator";
  printValueCategory(D, *this);
  D.os() << " prefix '" << Op << "'";
  D.endLine();
  D.dumpChildren({[&D, this] { D.dumpExpr(Operand.get()); }});
}

void BinaryExprAST::dump(ASTDumper &D) const {
  D.os() << "BinaryOperator";
  printValueCategory(D, *this);
  D.os() << " '" << Op << "'";
  D.endLine();
  D.dumpChildren({[&D, this] { D.dumpExpr(LHS.get()); },
                  [&D, this] { D.dumpExpr(RHS.get()); }});
}

void SizeofExprAST::dump(ASTDumper &D) const {
  D.os() << "UnaryExprOrTypeTraitExpr";
  D.printType(Ty);
  D.os() << " sizeof";
  if (isArgumentType()) {
    D.printType(ArgType);
    D.endLine();
    return;
  }
  D.endLine();
  D.dumpChildren({[&D, this] { D.dumpExpr(ArgExpr.get()); }});
}

void ParenExprAST::dump(ASTDumper &D) const {
  D.os() << "ParenExpr";
  printValueCategory(D, *this);
  D.endLine();
  D.dumpChildren({[&D, this] { D.dumpExpr(SubExpr.get()); }});
}
