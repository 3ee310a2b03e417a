#include "toplevel.h"
#include "parser.h"
#include "lexer.h"
#include "compiler_session.h"

#define CurTok (currentParser().curTok)

// Each handler parses one declaration at translation-unit scope and skips
// past it if parsing failed.

void HandleNamespaceDefinition() {
  if (!ParseNamespaceDefinition())
    RecoverAfterDeclarationError();
}

void HandleRecordDeclaration() {
  if (!ParseRecordDeclaration(AccessSpecifier::None))
    RecoverAfterDeclarationError();
}

void HandleEnumDeclaration() {
  if (!ParseEnumDeclaration(AccessSpecifier::None))
    RecoverAfterDeclarationError();
}

void HandleTypedefDeclaration() {
  if (!ParseTypedefDeclaration())
    RecoverAfterDeclarationError();
}

void HandleAliasDeclaration() {
  if (!ParseAliasDeclaration())
    RecoverAfterDeclarationError();
}

void HandleDeclaration() {
  if (!ParseSimpleDeclaration(AccessSpecifier::None))
    RecoverAfterDeclarationError();
}

/// top ::= namespacedef | recorddecl | enumdecl | typedefdecl | aliasdecl
///       | simpledecl | ';'
void MainLoop() {
  while (true) {
    switch (CurTok) {
    case tok_eof:
      return;
    case ';': // ignore top-level semicolons.
      getNextToken();
      break;
    case '}':
      reportCompilerError("extraneous closing brace ('}')");
      getNextToken();
      break;
    case tok_error:
      // The lexer already reported it.
      getNextToken();
      break;
    case tok_namespace:
      HandleNamespaceDefinition();
      break;
    case tok_struct:
    case tok_class:
      HandleRecordDeclaration();
      break;
    case tok_enum:
      HandleEnumDeclaration();
      break;
    case tok_typedef:
      HandleTypedefDeclaration();
      break;
    case tok_using:
      HandleAliasDeclaration();
      break;
    default:
      HandleDeclaration();
      break;
    }
  }
}

#undef CurTok
