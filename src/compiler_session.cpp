// This file implements compiler session management, wiring per-thread lexer, parser, AST and loader state.

#include "compiler_session.h"

#include <cctype>
#include <cstdio>
#include <sstream>
#include <utility>
#include <vector>

#include "analysis/semantics.h"
#include "ast/ast_context.h"
#include "lexer.h"
#include "parser.h"
#include "serialization/lazy_loader.h"

namespace {
thread_local std::vector<CompilerSession *> SessionStack;
}

// LexerContext ----------------------------------------------------------------

void LexerContext::reset() {
  identifierStr.clear();
  integerValue = 0;
  lastChar = ' ';
  atLineStart = true;
  includeStack.clear();
  definedMacros.clear();
  lastCharLine = 0;
  lastCharColumn = 0;
  lastCharFile = 0;
  tokenLocation = {};
}

bool LexerContext::enterFile(unsigned fileID) {
  FileEntry *entry = currentCompilerSession().files().getFile(fileID);
  if (!entry || !entry->isLoaded())
    return false;
  entry->entered = true;

  IncludeFrame frame;
  frame.fileID = fileID;
  llvm::StringRef contents = entry->contents();
  frame.contents = std::string_view(contents.data(), contents.size());
  includeStack.push_back(std::move(frame));
  atLineStart = true;
  return true;
}

int LexerContext::consumeChar() {
  while (!includeStack.empty()) {
    IncludeFrame &frame = includeStack.back();
    if (frame.cursor < frame.contents.size()) {
      int ch = static_cast<unsigned char>(frame.contents[frame.cursor++]);
      lastCharFile = frame.fileID;
      lastCharLine = frame.line;
      lastCharColumn = frame.column;
      if (ch == '\n') {
        ++frame.line;
        frame.column = 1;
      } else {
        ++frame.column;
      }
      return ch;
    }

    if (includeStack.size() == 1)
      return EOF;

    if (!frame.conditionals.empty()) {
      SourceLocation loc{frame.fileID, frame.line, frame.column};
      reportCompilerErrorAt(loc, "unterminated conditional directive");
    }
    includeStack.pop_back();
    // Returning to the includer behaves like the end of a line.
    return '\n';
  }
  return EOF;
}

int LexerContext::peekChar() const {
  if (includeStack.empty())
    return EOF;
  const IncludeFrame &frame = includeStack.back();
  if (frame.cursor >= frame.contents.size())
    return EOF;
  return static_cast<unsigned char>(frame.contents[frame.cursor]);
}

void LexerContext::setTokenStart() {
  tokenLocation = {lastCharFile, lastCharLine, lastCharColumn};
}

SourceLocation LexerContext::tokenStart() const { return tokenLocation; }

unsigned LexerContext::currentFileID() const {
  return includeStack.empty() ? 0 : includeStack.back().fileID;
}

bool LexerContext::isSkipping() const {
  if (includeStack.empty())
    return false;
  const auto &conditionals = includeStack.back().conditionals;
  return !conditionals.empty() && conditionals.back() != ConditionalState::Active;
}

static SourceLocation bestErrorLocation() {
  ParserContext &parser = currentParser();
  if (parser.currentTokenLocation.isValid())
    return parser.currentTokenLocation;
  SourceLocation lexerLoc = currentLexer().tokenStart();
  if (lexerLoc.isValid())
    return lexerLoc;
  if (parser.previousTokenLocation.isValid())
    return parser.previousTokenLocation;
  return {};
}

std::string describeTokenForDiagnostics(int token) {
  const LexerContext &lex = currentLexer();

  auto makeKeyword = [](const char *word) {
    return std::string("keyword '") + word + "'";
  };

  auto makeOperator = [](const char *op) {
    return std::string("operator '") + op + "'";
  };

  switch (token) {
    case tok_eof:
      return "end of file";
    case tok_identifier:
      if (!lex.identifierStr.empty())
        return "identifier '" + lex.identifierStr + "'";
      return "identifier";
    case tok_number:
      return "numeric literal '" + std::to_string(lex.integerValue) + "'";
    case tok_namespace:
      return makeKeyword("namespace");
    case tok_struct:
      return makeKeyword("struct");
    case tok_class:
      return makeKeyword("class");
    case tok_enum:
      return makeKeyword("enum");
    case tok_typedef:
      return makeKeyword("typedef");
    case tok_using:
      return makeKeyword("using");
    case tok_const:
      return makeKeyword("const");
    case tok_static:
      return makeKeyword("static");
    case tok_extern:
      return makeKeyword("extern");
    case tok_inline:
      return makeKeyword("inline");
    case tok_public:
      return makeKeyword("public");
    case tok_private:
      return makeKeyword("private");
    case tok_protected:
      return makeKeyword("protected");
    case tok_return:
      return makeKeyword("return");
    case tok_if:
      return makeKeyword("if");
    case tok_else:
      return makeKeyword("else");
    case tok_while:
      return makeKeyword("while");
    case tok_void:
      return makeKeyword("void");
    case tok_bool:
      return makeKeyword("bool");
    case tok_char:
      return makeKeyword("char");
    case tok_short:
      return makeKeyword("short");
    case tok_int:
      return makeKeyword("int");
    case tok_long:
      return makeKeyword("long");
    case tok_signed:
      return makeKeyword("signed");
    case tok_unsigned:
      return makeKeyword("unsigned");
    case tok_float:
      return makeKeyword("float");
    case tok_double:
      return makeKeyword("double");
    case tok_true:
      return makeKeyword("true");
    case tok_false:
      return makeKeyword("false");
    case tok_nullptr:
      return makeKeyword("nullptr");
    case tok_this:
      return makeKeyword("this");
    case tok_sizeof:
      return makeKeyword("sizeof");
    case tok_scope:
      return "'::'";
    case tok_arrow:
      return makeOperator("->");
    case tok_eq:
      return makeOperator("==");
    case tok_ne:
      return makeOperator("!=");
    case tok_le:
      return makeOperator("<=");
    case tok_ge:
      return makeOperator(">=");
    case tok_and:
      return makeOperator("&&");
    case tok_or:
      return makeOperator("||");
    case tok_error:
      return "";
  }

  if (token >= 0 && token < 128 && std::isprint(token)) {
    return std::string("symbol '") + static_cast<char>(token) + "'";
  }

  return "token #" + std::to_string(token);
}

std::string formatSourceLocation(SourceLocation loc) {
  if (!loc.isValid())
    return "<unknown>";
  std::ostringstream oss;
  oss << currentCompilerSession().files().getPath(loc.file) << ":" << loc.line
      << ":" << loc.column;
  return oss.str();
}

static void emitDiagnostic(const char *severity, SourceLocation loc,
                           const std::string &message, std::string_view hint,
                           bool describeToken) {
  std::ostringstream oss;
  oss << severity;
  if (loc.isValid())
    oss << " at " << formatSourceLocation(loc);
  oss << ": " << message;

  if (describeToken) {
    const std::string tokenDescription =
        describeTokenForDiagnostics(currentParser().curTok);
    if (!tokenDescription.empty())
      oss << " (near " << tokenDescription << ")";
  }

  std::string formatted = oss.str();
  fprintf(stderr, "%s\n", formatted.c_str());

  if (!hint.empty()) {
    fprintf(stderr, "  hint: %.*s\n", static_cast<int>(hint.size()), hint.data());
  }
}

void reportCompilerError(const std::string &message, std::string_view hint) {
  ParserContext &parser = currentParser();
  emitDiagnostic("Error", bestErrorLocation(), message, hint, true);
  parser.hadError = true;
  ++parser.errorCount;
}

void reportCompilerErrorAt(SourceLocation loc, const std::string &message,
                           std::string_view hint) {
  ParserContext &parser = currentParser();
  emitDiagnostic("Error", loc, message, hint, false);
  parser.hadError = true;
  ++parser.errorCount;
}

void reportCompilerWarning(const std::string &message, std::string_view hint) {
  emitDiagnostic("Warning", bestErrorLocation(), message, hint, false);
  ++currentParser().warningCount;
}

void reportCompilerNote(SourceLocation loc, const std::string &message) {
  if (loc.isValid())
    fprintf(stderr, "  note at %s: %s\n", formatSourceLocation(loc).c_str(),
            message.c_str());
  else
    fprintf(stderr, "  note: %s\n", message.c_str());
}

// ParserContext ----------------------------------------------------------------

void ParserContext::reset() {
  curTok = 0;
  hadError = false;
  errorCount = 0;
  warningCount = 0;
  currentTokenLocation = {};
  previousTokenLocation = {};
}

// CompilerSession --------------------------------------------------------------

CompilerSession::CompilerSession() = default;
CompilerSession::~CompilerSession() = default;

LexerContext &CompilerSession::lexer() { return lexerState; }
ParserContext &CompilerSession::parser() { return parserState; }
FileManager &CompilerSession::files() { return fileState; }
FrontendOptions &CompilerSession::options() { return optionState; }

ASTContext &CompilerSession::astContext() {
  if (!astState)
    astState = std::make_unique<ASTContext>();
  return *astState;
}

analysis::SemanticAnalysis &CompilerSession::analysis() {
  if (!analysisState)
    analysisState = std::make_unique<analysis::SemanticAnalysis>(astContext());
  return *analysisState;
}

serialization::LazyDeclLoader &CompilerSession::loader() {
  if (!loaderState) {
    loaderState = std::make_unique<serialization::LazyDeclLoader>(
        astContext(), fileState);
    astContext().setExternalSource(loaderState.get());
  }
  return *loaderState;
}

void CompilerSession::resetAll() {
  lexerState.reset();
  parserState.reset();
  initializeOperatorPrecedence(parserState);
  // Semantic state and loaders point into the AST, so drop them first.
  analysisState.reset();
  if (astState)
    astState->setExternalSource(nullptr);
  loaderState.reset();
  astState.reset();
  fileState.reset();
}

// Session stack helpers --------------------------------------------------------

void pushCompilerSession(CompilerSession &session) {
  SessionStack.push_back(&session);
}

void popCompilerSession() {
  if (SessionStack.empty())
    throw std::runtime_error("No active compiler session to pop");
  SessionStack.pop_back();
}

CompilerSession &currentCompilerSession() {
  if (SessionStack.empty())
    throw std::runtime_error("No active compiler session");
  return *SessionStack.back();
}

bool hasCompilerSession() { return !SessionStack.empty(); }

LexerContext &currentLexer() {
  return currentCompilerSession().lexer();
}

ParserContext &currentParser() {
  return currentCompilerSession().parser();
}

ASTContext &currentASTContext() {
  return currentCompilerSession().astContext();
}

analysis::SemanticAnalysis &currentAnalysis() {
  return currentCompilerSession().analysis();
}
