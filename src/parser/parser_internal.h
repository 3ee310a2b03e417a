#ifndef DECLCACHE_PARSER_INTERNAL_H
#define DECLCACHE_PARSER_INTERNAL_H

#include "analysis/semantics.h"
#include "ast/ast_context.h"
#include "compiler_session.h"
#include "lexer.h"
#include "parser.h"
#include <string>
#include <vector>

#define CurTok (currentParser().curTok)
#define CurLoc (currentParser().currentTokenLocation)
#define BinopPrecedence (currentParser().binopPrecedence)

#define IdentifierStr (currentLexer().identifierStr)
#define IntegerVal (currentLexer().integerValue)

#define Actions (currentAnalysis())

template <typename T>
std::unique_ptr<T> withLocation(std::unique_ptr<T> node, SourceLocation loc) {
  if (node)
    node->setSourceLocation(loc);
  return node;
}

/// Pushes a block scope for local declarations and pops it on exit.
class LocalScope {
public:
  LocalScope() { Actions.pushScope(); }
  ~LocalScope() { Actions.popScope(); }

  LocalScope(const LocalScope &) = delete;
  LocalScope &operator=(const LocalScope &) = delete;
};

bool IsBuiltinTypeToken(int Tok);
bool IsAccessSpecifierToken(int Tok);
AccessSpecifier GetAccessSpecifier(int Tok);

#endif // DECLCACHE_PARSER_INTERNAL_H
