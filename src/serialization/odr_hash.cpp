#include "serialization/odr_hash.h"

#include "ast/ast_dumper.h"
#include "ast/decl.h"
#include "ast/stmt.h"

#include "llvm/Support/raw_ostream.h"
#include "llvm/Support/xxhash.h"

namespace serialization {

static void addType(llvm::raw_ostream &OS, QualType T) {
  OS << '\'' << T.getCanonicalType().getAsString() << '\'';
}

static void addFunction(llvm::raw_ostream &OS, const FunctionDecl *FD) {
  OS << FD->getName() << ' ';
  addType(OS, FD->getReturnType());
  OS << ' ' << FD->getSignatureString() << ' '
     << static_cast<unsigned>(FD->getStorageClass())
     << (FD->isInlineSpecified() ? " inline" : "");
  if (const auto *MD = llvm::dyn_cast<CXXMethodDecl>(FD))
    OS << (MD->isStatic() ? " static" : "") << ' '
       << getAccessSpelling(MD->getAccess());
  if (const BlockStmtAST *Body = FD->getBody()) {
    OS << " {\n";
    ASTDumper Dumper(OS);
    Dumper.dumpStmt(Body);
    OS << '}';
  } else if (FD->isDefined()) {
    OS << " {}";
  }
  OS << '\n';
}

std::string getODRString(const NamedDecl *D) {
  std::string Result;
  llvm::raw_string_ostream OS(Result);
  OS << D->getDeclKindName() << ' ' << D->getQualifiedNameAsString() << '\n';

  switch (D->getKind()) {
    case Decl::CXXRecord: {
      const auto *RD = llvm::cast<RecordDecl>(D);
      OS << RD->getKindName() << '\n';
      for (const CXXBaseSpecifier &Base : RD->bases()) {
        OS << "base " << getAccessSpelling(Base.Access) << ' ';
        addType(OS, Base.BaseType);
        OS << '\n';
      }
      for (const Decl *Member : RD->decls()) {
        if (const auto *Field = llvm::dyn_cast<FieldDecl>(Member)) {
          OS << "field " << Field->getName() << ' ';
          addType(OS, Field->getType());
          OS << ' ' << getAccessSpelling(Field->getAccess()) << '\n';
        } else if (const auto *MD = llvm::dyn_cast<CXXMethodDecl>(Member)) {
          OS << "method ";
          addFunction(OS, MD);
        }
      }
      break;
    }
    case Decl::Enum: {
      const auto *ED = llvm::cast<EnumDecl>(D);
      OS << (ED->isScoped() ? "scoped " : "") << "underlying ";
      addType(OS, ED->getIntegerType());
      OS << '\n';
      for (const EnumConstantDecl *ECD : ED->enumerators())
        OS << ECD->getName() << " = " << ECD->getInitVal() << '\n';
      break;
    }
    case Decl::Typedef:
    case Decl::TypeAlias:
      addType(OS, llvm::cast<TypedefNameDecl>(D)->getUnderlyingType());
      break;
    case Decl::Var: {
      const auto *VD = llvm::cast<VarDecl>(D);
      addType(OS, VD->getType());
      OS << ' ' << static_cast<unsigned>(VD->getStorageClass())
         << (VD->hasInit() ? " init" : "");
      if (const ExprAST *Init = VD->getInit()) {
        OS << '\n';
        ASTDumper Dumper(OS);
        Dumper.dumpExpr(Init);
      }
      break;
    }
    case Decl::Function:
    case Decl::CXXMethod:
      addFunction(OS, llvm::cast<FunctionDecl>(D));
      break;
    default:
      break;
  }
  return OS.str();
}

uint64_t computeODRHash(const NamedDecl *D) {
  return llvm::xxHash64(getODRString(D));
}

uint64_t getOrComputeODRHash(const NamedDecl *D) {
  if (D->hasODRHash())
    return D->getODRHash();
  return computeODRHash(D);
}

} // namespace serialization
