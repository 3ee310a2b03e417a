#ifndef DECLCACHE_COMPILER_SESSION_H
#define DECLCACHE_COMPILER_SESSION_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "file_manager.h"
#include "lexer.h"

class ASTContext;

namespace analysis {
class SemanticAnalysis;
}

namespace serialization {
class LazyDeclLoader;
}

struct SourceLocation {
  unsigned file = 0;
  std::size_t line = 0;
  std::size_t column = 0;

  constexpr bool isValid() const noexcept { return line != 0; }
};

enum class FrontendMode {
  SyntaxOnly,
  EmitPCH,
  EmitModule
};

/// FrontendOptions collects everything the driver decides before a unit is
/// parsed.
struct FrontendOptions {
  FrontendMode mode = FrontendMode::SyntaxOnly;
  std::string inputFile;
  std::string outputFile;
  std::string moduleName;
  std::string languageStandard = "c++17";
  std::string includePCH;
  std::vector<std::string> moduleFiles;
  bool dumpDeserializedDecls = false;
  bool astDump = false;
  bool printStats = false;
  bool validateInputFiles = true;
  bool lazyLoad = true;
  bool serializationDebug = false;
};

/// LexerContext holds all mutable lexer state for a compilation unit,
/// including the stack of textually included files.
struct LexerContext {
  enum class ConditionalState : uint8_t {
    Active,        // emitting tokens
    Skipping,      // inside a false branch, waiting for #else/#endif
    Done           // a branch was taken, skip the remaining ones
  };

  struct IncludeFrame {
    unsigned fileID = 0;
    std::string_view contents;
    std::size_t cursor = 0;
    std::size_t line = 1;
    std::size_t column = 1;
    std::vector<ConditionalState> conditionals;
  };

  std::string identifierStr;
  uint64_t integerValue = 0;
  int lastChar = ' ';
  bool atLineStart = true;

  std::vector<IncludeFrame> includeStack;
  std::set<std::string> definedMacros;

  std::size_t lastCharLine = 0;
  std::size_t lastCharColumn = 0;
  unsigned lastCharFile = 0;
  SourceLocation tokenLocation{};

  void reset();
  bool enterFile(unsigned fileID);
  int consumeChar();
  int peekChar() const;
  void setTokenStart();
  SourceLocation tokenStart() const;
  unsigned currentFileID() const;
  bool isSkipping() const;
};

/// ParserContext wraps the parser's per-run state.
struct ParserContext {
  int curTok = 0;
  std::map<std::string, int> binopPrecedence;
  bool hadError = false;
  unsigned errorCount = 0;
  unsigned warningCount = 0;
  SourceLocation currentTokenLocation{};
  SourceLocation previousTokenLocation{};

  void reset();
};

/// CompilerSession groups the lexer, parser, AST and semantic state of a
/// single compilation unit, together with the declaration stores attached to
/// it.
class CompilerSession {
public:
  CompilerSession();
  ~CompilerSession();

  CompilerSession(const CompilerSession &) = delete;
  CompilerSession &operator=(const CompilerSession &) = delete;

  LexerContext &lexer();
  ParserContext &parser();
  FileManager &files();
  FrontendOptions &options();
  ASTContext &astContext();
  analysis::SemanticAnalysis &analysis();
  serialization::LazyDeclLoader &loader();
  bool hasLoader() const { return loaderState != nullptr; }

  void resetAll();

private:
  LexerContext lexerState;
  ParserContext parserState;
  FileManager fileState;
  FrontendOptions optionState;
  std::unique_ptr<ASTContext> astState;
  std::unique_ptr<analysis::SemanticAnalysis> analysisState;
  std::unique_ptr<serialization::LazyDeclLoader> loaderState;
};

/// Session stack management -------------------------------------------------

void pushCompilerSession(CompilerSession &session);
void popCompilerSession();
CompilerSession &currentCompilerSession();
bool hasCompilerSession();

LexerContext &currentLexer();
ParserContext &currentParser();
ASTContext &currentASTContext();
analysis::SemanticAnalysis &currentAnalysis();

/// RAII helper that keeps a session active for the lifetime of a scope.
class ScopedCompilerSession {
public:
  explicit ScopedCompilerSession(CompilerSession &session) {
    pushCompilerSession(session);
  }
  ~ScopedCompilerSession() { popCompilerSession(); }

  ScopedCompilerSession(const ScopedCompilerSession &) = delete;
  ScopedCompilerSession &operator=(const ScopedCompilerSession &) = delete;
};

std::string describeTokenForDiagnostics(int token);
std::string formatSourceLocation(SourceLocation loc);
void reportCompilerError(const std::string &message, std::string_view hint = {});
void reportCompilerErrorAt(SourceLocation loc, const std::string &message,
                           std::string_view hint = {});
void reportCompilerWarning(const std::string &message, std::string_view hint = {});
void reportCompilerNote(SourceLocation loc, const std::string &message);

#endif // DECLCACHE_COMPILER_SESSION_H
