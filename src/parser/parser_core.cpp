#include "parser/parser_internal.h"

/// initializeOperatorPrecedence - Install the standard binary operators.
/// 1 is the lowest precedence.
void initializeOperatorPrecedence(ParserContext &parser) {
  parser.binopPrecedence.clear();
  parser.binopPrecedence["="] = 2;
  parser.binopPrecedence["||"] = 5;
  parser.binopPrecedence["&&"] = 6;
  parser.binopPrecedence["=="] = 10;
  parser.binopPrecedence["!="] = 10;
  parser.binopPrecedence["<"] = 20;
  parser.binopPrecedence[">"] = 20;
  parser.binopPrecedence["<="] = 20;
  parser.binopPrecedence[">="] = 20;
  parser.binopPrecedence["+"] = 30;
  parser.binopPrecedence["-"] = 30;
  parser.binopPrecedence["*"] = 40;
  parser.binopPrecedence["/"] = 40;
  parser.binopPrecedence["%"] = 40;
}

/// CurTok/getNextToken - Provide a simple token buffer.  CurTok is the current
/// token the parser is looking at.  getNextToken reads another token from the
/// lexer and updates CurTok with its results.
int getNextToken() {
  ParserContext &parser = currentParser();
  parser.previousTokenLocation = parser.currentTokenLocation;
  parser.curTok = gettok();
  parser.currentTokenLocation = currentLexer().tokenStart();
  return parser.curTok;
}

std::string GetBinaryOperatorSpelling(int Tok) {
  switch (Tok) {
    case tok_eq:
      return "==";
    case tok_ne:
      return "!=";
    case tok_le:
      return "<=";
    case tok_ge:
      return ">=";
    case tok_and:
      return "&&";
    case tok_or:
      return "||";
    default:
      break;
  }
  if (Tok > 0 && Tok < 128)
    return std::string(1, static_cast<char>(Tok));
  return std::string();
}

/// GetTokPrecedence - Get the precedence of the pending binary operator token.
int GetTokPrecedence() {
  std::string Op = GetBinaryOperatorSpelling(CurTok);
  if (Op.empty())
    return -1;

  auto It = BinopPrecedence.find(Op);
  if (It == BinopPrecedence.end() || It->second <= 0)
    return -1;
  return It->second;
}

/// LogError* - These are little helper functions for error handling.
std::unique_ptr<ExprAST> LogError(const std::string &Str, std::string_view hint) {
  reportCompilerError(Str, hint);
  return nullptr;
}

std::unique_ptr<StmtAST> LogErrorS(const std::string &Str, std::string_view hint) {
  LogError(Str, hint);
  return nullptr;
}

bool LogErrorD(const std::string &Str, std::string_view hint) {
  LogError(Str, hint);
  return false;
}

/// ExpectToken - Consume Tok or report "expected 'X' <context>".
bool ExpectToken(int Tok, const char *Context) {
  if (CurTok == Tok) {
    getNextToken();
    return true;
  }
  std::string Spelling = GetBinaryOperatorSpelling(Tok);
  return LogErrorD("expected '" + Spelling + "' " + Context);
}

/// RecoverAfterDeclarationError - Skip to the end of the broken declaration:
/// past the next ';' or past a balanced '{...}' block. A '}' that closes an
/// enclosing scope is left for the caller.
void RecoverAfterDeclarationError() {
  int Depth = 0;
  while (CurTok != tok_eof) {
    if (CurTok == '{') {
      ++Depth;
    } else if (CurTok == '}') {
      if (Depth == 0)
        return;
      if (--Depth == 0) {
        getNextToken(); // eat '}'
        if (CurTok == ';')
          getNextToken();
        return;
      }
    } else if (CurTok == ';' && Depth == 0) {
      getNextToken(); // eat ';'
      return;
    }
    getNextToken();
  }
}

bool IsBuiltinTypeToken(int Tok) {
  switch (Tok) {
    case tok_void:
    case tok_bool:
    case tok_char:
    case tok_short:
    case tok_int:
    case tok_long:
    case tok_signed:
    case tok_unsigned:
    case tok_float:
    case tok_double:
      return true;
    default:
      return false;
  }
}

bool IsAccessSpecifierToken(int Tok) {
  return Tok == tok_public || Tok == tok_private || Tok == tok_protected;
}

AccessSpecifier GetAccessSpecifier(int Tok) {
  switch (Tok) {
    case tok_public:
      return AccessSpecifier::Public;
    case tok_private:
      return AccessSpecifier::Private;
    case tok_protected:
      return AccessSpecifier::Protected;
    default:
      return AccessSpecifier::None;
  }
}
