#include "lexer.h"
#include <cctype>
#include <cstdio>
#include <cstdint>
#include <string>

#include "compiler_session.h"
#include "llvm/ADT/StringRef.h"

namespace {

using ConditionalState = LexerContext::ConditionalState;

int advanceChar() {
  LexerContext &lex = currentLexer();
  lex.lastChar = lex.consumeChar();
  return lex.lastChar;
}

bool isHorizontalSpace(int ch) {
  return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\f' || ch == '\v';
}

void skipHorizontalSpace() {
  while (isHorizontalSpace(currentLexer().lastChar))
    advanceChar();
}

/// Consume the remainder of the current line and return it without the
/// trailing newline.
std::string readRestOfLine() {
  std::string text;
  LexerContext &lex = currentLexer();
  std::size_t depth = lex.includeStack.size();
  while (lex.lastChar != '\n' && lex.lastChar != EOF &&
         lex.includeStack.size() == depth) {
    text += static_cast<char>(lex.lastChar);
    advanceChar();
  }
  return llvm::StringRef(text).trim().str();
}

std::string readDirectiveWord() {
  std::string word;
  LexerContext &lex = currentLexer();
  while (std::isalnum(lex.lastChar) || lex.lastChar == '_') {
    word += static_cast<char>(lex.lastChar);
    advanceChar();
  }
  return word;
}

SourceLocation lastCharLocation() {
  const LexerContext &lex = currentLexer();
  return {lex.lastCharFile, lex.lastCharLine, lex.lastCharColumn};
}

void handleInclude(SourceLocation directiveLoc) {
  LexerContext &lex = currentLexer();
  skipHorizontalSpace();

  int open = lex.lastChar;
  if (open != '"' && open != '<') {
    readRestOfLine();
    reportCompilerErrorAt(directiveLoc,
                          "expected \"FILENAME\" or <FILENAME> after #include");
    return;
  }
  const int close = open == '"' ? '"' : '>';
  std::string spelling;
  advanceChar();
  while (lex.lastChar != close && lex.lastChar != '\n' && lex.lastChar != EOF) {
    spelling += static_cast<char>(lex.lastChar);
    advanceChar();
  }
  if (lex.lastChar != close) {
    reportCompilerErrorAt(directiveLoc, "missing terminating character in #include");
    return;
  }
  advanceChar();
  std::string trailing = readRestOfLine();
  if (!trailing.empty() && trailing.rfind("//", 0) != 0)
    reportCompilerWarning("extra tokens at end of #include directive");

  if (spelling.empty()) {
    reportCompilerErrorAt(directiveLoc, "empty filename in #include");
    return;
  }

  FileManager &files = currentCompilerSession().files();
  unsigned fileID = files.resolveInclude(spelling, open == '<', lex.currentFileID());
  if (!fileID) {
    reportCompilerErrorAt(directiveLoc, "'" + spelling + "' file not found");
    return;
  }

  const FileEntry *entry = files.getFile(fileID);
  if (entry->pragmaOnce && entry->entered)
    return;

  if (lex.includeStack.size() >= 200) {
    reportCompilerErrorAt(directiveLoc, "#include nested too deeply");
    return;
  }

  // The newline that ends the directive has not been consumed yet; the next
  // character comes from the included file.
  lex.enterFile(fileID);
  lex.lastChar = '\n';
}

void handleConditional(const std::string &directive, SourceLocation loc) {
  LexerContext &lex = currentLexer();
  auto &conditionals = lex.includeStack.back().conditionals;

  if (directive == "ifdef" || directive == "ifndef") {
    skipHorizontalSpace();
    std::string name = readDirectiveWord();
    readRestOfLine();
    if (lex.isSkipping()) {
      conditionals.push_back(ConditionalState::Done);
      return;
    }
    if (name.empty()) {
      reportCompilerErrorAt(loc, "macro name missing in #" + directive);
      conditionals.push_back(ConditionalState::Done);
      return;
    }
    bool defined = lex.definedMacros.count(name) != 0;
    bool take = directive == "ifdef" ? defined : !defined;
    conditionals.push_back(take ? ConditionalState::Active
                                : ConditionalState::Skipping);
    return;
  }

  if (directive == "if" || directive == "elif") {
    readRestOfLine();
    if (!lex.isSkipping())
      reportCompilerErrorAt(loc, "#" + directive +
                                     " expressions are not supported; use "
                                     "#ifdef or #ifndef");
    if (directive == "if")
      conditionals.push_back(ConditionalState::Done);
    else if (!conditionals.empty())
      conditionals.back() = ConditionalState::Done;
    return;
  }

  readRestOfLine();
  if (conditionals.empty()) {
    reportCompilerErrorAt(loc, "#" + directive + " without #if");
    return;
  }

  if (directive == "else") {
    if (conditionals.back() == ConditionalState::Active)
      conditionals.back() = ConditionalState::Done;
    else if (conditionals.back() == ConditionalState::Skipping)
      conditionals.back() = ConditionalState::Active;
    return;
  }

  // #endif
  conditionals.pop_back();
}

/// Process one directive line; lastChar is the character after '#'.
void handleDirective() {
  LexerContext &lex = currentLexer();
  SourceLocation loc = lastCharLocation();
  advanceChar(); // eat '#'
  skipHorizontalSpace();

  if (lex.lastChar == '\n' || lex.lastChar == EOF)
    return; // null directive

  std::string directive = readDirectiveWord();

  if (directive == "ifdef" || directive == "ifndef" || directive == "if" ||
      directive == "elif" || directive == "else" || directive == "endif") {
    handleConditional(directive, loc);
    return;
  }

  if (lex.isSkipping()) {
    readRestOfLine();
    return;
  }

  if (directive == "include") {
    handleInclude(loc);
    return;
  }

  if (directive == "define" || directive == "undef") {
    skipHorizontalSpace();
    std::string name = readDirectiveWord();
    std::string replacement = readRestOfLine();
    if (name.empty()) {
      reportCompilerErrorAt(loc, "macro name missing in #" + directive);
      return;
    }
    if (directive == "undef") {
      lex.definedMacros.erase(name);
      return;
    }
    lex.definedMacros.insert(name);
    if (!replacement.empty() && replacement.rfind("//", 0) != 0)
      reportCompilerWarning("replacement list of macro '" + name +
                            "' is ignored; macros are not expanded");
    return;
  }

  if (directive == "pragma") {
    skipHorizontalSpace();
    std::string pragma = readDirectiveWord();
    readRestOfLine();
    if (pragma == "once") {
      if (FileEntry *entry =
              currentCompilerSession().files().getFile(lex.currentFileID()))
        entry->pragmaOnce = true;
    }
    return;
  }

  if (directive == "error") {
    std::string message = readRestOfLine();
    reportCompilerErrorAt(loc, "#error " + message);
    return;
  }

  readRestOfLine();
  reportCompilerErrorAt(loc, "invalid preprocessing directive '#" + directive + "'");
}

/// Skip whitespace, comments and directives, including inactive conditional
/// regions. Returns false when a comment runs off the end of input.
bool skipTrivia() {
  LexerContext &lex = currentLexer();
  while (true) {
    if (lex.lastChar == '\n') {
      lex.atLineStart = true;
      advanceChar();
      continue;
    }
    if (isHorizontalSpace(lex.lastChar)) {
      advanceChar();
      continue;
    }
    if (lex.lastChar == '#' && lex.atLineStart) {
      handleDirective();
      continue;
    }
    if (lex.lastChar == '/' && lex.peekChar() == '/') {
      while (lex.lastChar != '\n' && lex.lastChar != EOF)
        advanceChar();
      continue;
    }
    if (lex.lastChar == '/' && lex.peekChar() == '*') {
      SourceLocation start = lastCharLocation();
      advanceChar();
      advanceChar();
      bool closed = false;
      while (lex.lastChar != EOF) {
        if (lex.lastChar == '*' && lex.peekChar() == '/') {
          advanceChar();
          advanceChar();
          closed = true;
          break;
        }
        advanceChar();
      }
      if (!closed) {
        reportCompilerErrorAt(start, "unterminated /* comment");
        return false;
      }
      continue;
    }
    if (lex.lastChar != EOF && lex.isSkipping()) {
      lex.atLineStart = false;
      advanceChar();
      continue;
    }
    return true;
  }
}

int lexNumber() {
  LexerContext &lex = currentLexer();
  std::string digits;
  unsigned radix = 10;

  if (lex.lastChar == '0' && (lex.peekChar() == 'x' || lex.peekChar() == 'X')) {
    radix = 16;
    advanceChar();
    advanceChar();
    while (std::isxdigit(lex.lastChar)) {
      digits += static_cast<char>(lex.lastChar);
      advanceChar();
    }
    if (digits.empty()) {
      reportCompilerError("hexadecimal literal is missing digits");
      return tok_error;
    }
  } else {
    while (std::isdigit(lex.lastChar)) {
      digits += static_cast<char>(lex.lastChar);
      advanceChar();
    }
    if (digits.size() > 1 && digits[0] == '0')
      radix = 8;
  }

  // Integer suffixes carry no meaning for this front end.
  while (lex.lastChar == 'u' || lex.lastChar == 'U' || lex.lastChar == 'l' ||
         lex.lastChar == 'L')
    advanceChar();

  if (std::isalnum(lex.lastChar) || lex.lastChar == '_' || lex.lastChar == '.') {
    reportCompilerError("invalid digit '" + std::string(1, static_cast<char>(lex.lastChar)) +
                        "' in integer literal");
    while (std::isalnum(lex.lastChar) || lex.lastChar == '_' || lex.lastChar == '.')
      advanceChar();
    return tok_error;
  }

  uint64_t value = 0;
  if (llvm::StringRef(digits).getAsInteger(radix, value)) {
    reportCompilerError("integer literal '" + digits + "' is too large");
    return tok_error;
  }
  lex.integerValue = value;
  return tok_number;
}

int classifyIdentifier(const std::string &word) {
  static const std::pair<const char *, int> keywords[] = {
      {"namespace", tok_namespace}, {"struct", tok_struct},
      {"class", tok_class},         {"enum", tok_enum},
      {"typedef", tok_typedef},     {"using", tok_using},
      {"const", tok_const},         {"static", tok_static},
      {"extern", tok_extern},       {"inline", tok_inline},
      {"public", tok_public},       {"private", tok_private},
      {"protected", tok_protected}, {"return", tok_return},
      {"if", tok_if},               {"else", tok_else},
      {"while", tok_while},         {"void", tok_void},
      {"bool", tok_bool},           {"char", tok_char},
      {"short", tok_short},         {"int", tok_int},
      {"long", tok_long},           {"signed", tok_signed},
      {"unsigned", tok_unsigned},   {"float", tok_float},
      {"double", tok_double},       {"true", tok_true},
      {"false", tok_false},         {"nullptr", tok_nullptr},
      {"this", tok_this},           {"sizeof", tok_sizeof},
  };
  for (const auto &entry : keywords) {
    if (word == entry.first)
      return entry.second;
  }
  return tok_identifier;
}

} // namespace

/// gettok - Return the next token from the active lexer input.
int gettok() {
  LexerContext &lex = currentLexer();

  if (!skipTrivia())
    return tok_eof;

  lex.setTokenStart();
  lex.atLineStart = false;

  if (lex.lastChar == EOF) {
    const auto &conditionals = lex.includeStack.empty()
                                   ? std::vector<ConditionalState>{}
                                   : lex.includeStack.back().conditionals;
    if (!conditionals.empty()) {
      reportCompilerErrorAt(lex.tokenStart(), "unterminated conditional directive");
      lex.includeStack.back().conditionals.clear();
    }
    return tok_eof;
  }

  if (std::isalpha(lex.lastChar) || lex.lastChar == '_') { // identifier: [a-zA-Z_][a-zA-Z0-9_]*
    lex.identifierStr = static_cast<char>(lex.lastChar);
    while (std::isalnum(advanceChar()) || lex.lastChar == '_')
      lex.identifierStr += static_cast<char>(lex.lastChar);
    return classifyIdentifier(lex.identifierStr);
  }

  if (std::isdigit(lex.lastChar))
    return lexNumber();

  int thisChar = lex.lastChar;
  int nextChar = lex.peekChar();

  auto twoCharToken = [&](int token) {
    advanceChar();
    advanceChar();
    return token;
  };

  switch (thisChar) {
    case ':':
      if (nextChar == ':')
        return twoCharToken(tok_scope);
      break;
    case '-':
      if (nextChar == '>')
        return twoCharToken(tok_arrow);
      break;
    case '=':
      if (nextChar == '=')
        return twoCharToken(tok_eq);
      break;
    case '!':
      if (nextChar == '=')
        return twoCharToken(tok_ne);
      break;
    case '<':
      if (nextChar == '=')
        return twoCharToken(tok_le);
      break;
    case '>':
      if (nextChar == '=')
        return twoCharToken(tok_ge);
      break;
    case '&':
      if (nextChar == '&')
        return twoCharToken(tok_and);
      break;
    case '|':
      if (nextChar == '|')
        return twoCharToken(tok_or);
      break;
    case '"':
    case '\'':
      reportCompilerError("string and character literals are not supported");
      advanceChar();
      return tok_error;
    default:
      break;
  }

  // Otherwise, just return the character as its ascii value.
  advanceChar();
  return thisChar;
}
