#ifndef PARSER_H
#define PARSER_H

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "ast/decl.h"
#include "ast/expr.h"
#include "ast/stmt.h"
#include "compiler_session.h"

// Helper functions
void initializeOperatorPrecedence(ParserContext &parser);
int getNextToken();
int GetTokPrecedence();
std::string GetBinaryOperatorSpelling(int Tok);

// Error handling
std::unique_ptr<ExprAST> LogError(const std::string &Str, std::string_view hint = {});
std::unique_ptr<StmtAST> LogErrorS(const std::string &Str, std::string_view hint = {});
bool LogErrorD(const std::string &Str, std::string_view hint = {});
bool ExpectToken(int Tok, const char *Context);
void RecoverAfterDeclarationError();

// Type parsing
bool IsTypeSpecifierStart();
QualType ParseTypeSpecifier();
QualType ParseTypeFromName(const QualifiedNameRef &Name, bool LeadingConst);
QualType ParsePointerDeclarator(QualType Base);
QualType ParseTypeName();
bool ParseArrayBounds(QualType &T);
bool ParseQualifiedName(QualifiedNameRef &Name);

// Declaration parsing
bool ParseExternalDeclaration();
bool ParseMemberDeclaration(AccessSpecifier Access);
bool ParseNamespaceDefinition();
bool ParseRecordDeclaration(AccessSpecifier Access);
bool ParseEnumDeclaration(AccessSpecifier Access);
bool ParseTypedefDeclaration();
bool ParseAliasDeclaration();
bool ParseSimpleDeclaration(AccessSpecifier Access);
bool ParseDeclarationWithType(QualType Base, StorageClass SC, bool IsInline,
                              AccessSpecifier Access);

// Statement parsing functions
std::unique_ptr<StmtAST> ParseStatement();
std::unique_ptr<BlockStmtAST> ParseBlock(bool NewScope = true);
std::unique_ptr<ReturnStmtAST> ParseReturnStatement();
std::unique_ptr<IfStmtAST> ParseIfStatement();
std::unique_ptr<WhileStmtAST> ParseWhileStatement();
std::unique_ptr<DeclStmtAST> ParseLocalDeclaration(QualType Base, StorageClass SC);

// Expression parsing functions
std::unique_ptr<ExprAST> ParseNumberExpr();
std::unique_ptr<ExprAST> ParseParenExpr();
std::unique_ptr<ExprAST> ParseIdentifierExpr();
std::unique_ptr<ExprAST> ParseSizeofExpr();
std::unique_ptr<ExprAST> ParsePrimary();
std::unique_ptr<ExprAST> ParsePostfixSuffixes(std::unique_ptr<ExprAST> LHS);
std::unique_ptr<ExprAST> ParseUnaryExpr();
std::unique_ptr<ExprAST> ParseBinOpRHS(int ExprPrec, std::unique_ptr<ExprAST> LHS);
std::unique_ptr<ExprAST> ParseExpression();
/// Continue an expression whose leading name was already consumed.
std::unique_ptr<ExprAST> ParseExpressionStartingWith(std::unique_ptr<ExprAST> LHS);

#endif // PARSER_H
