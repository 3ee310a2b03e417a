#include <string>
#include <vector>

#include "lexer.h"
#include "test_helpers.h"

static std::vector<int> lexAll(TestSession &unit, const std::string &path) {
  unsigned fileID = unit.get().files().loadFile(path);
  REQUIRE(fileID != 0);
  REQUIRE(unit.get().lexer().enterFile(fileID));

  std::vector<int> tokens;
  for (int tok = gettok(); tok != tok_eof; tok = gettok())
    tokens.push_back(tok);
  return tokens;
}

TEST_CASE("Keywords, identifiers and punctuation", "[lexer]") {
  TestSession unit;
  unit.addFile("main.cpp", "namespace ns { struct S; } ::ns::S *p = nullptr;\n"
                           "p->x == 1 && q != 2 || r <= 3 >= 4;");

  std::vector<int> expected = {
      tok_namespace, tok_identifier, '{', tok_struct, tok_identifier, ';', '}',
      tok_scope, tok_identifier, tok_scope, tok_identifier, '*', tok_identifier,
      '=', tok_nullptr, ';', tok_identifier, tok_arrow, tok_identifier, tok_eq,
      tok_number, tok_and, tok_identifier, tok_ne, tok_number, tok_or,
      tok_identifier, tok_le, tok_number, tok_ge, tok_number, ';'};
  REQUIRE(lexAll(unit, "main.cpp") == expected);
  REQUIRE_FALSE(unit.hadError());
}

TEST_CASE("Integer literals in every radix", "[lexer]") {
  TestSession unit;
  unit.addFile("main.cpp", "0x1F 017 42u 7UL");
  unsigned fileID = unit.get().files().loadFile("main.cpp");
  REQUIRE(unit.get().lexer().enterFile(fileID));

  std::vector<uint64_t> values;
  for (int tok = gettok(); tok != tok_eof; tok = gettok()) {
    REQUIRE(tok == tok_number);
    values.push_back(unit.get().lexer().integerValue);
  }
  REQUIRE(values == std::vector<uint64_t>{31, 15, 42, 7});
}

TEST_CASE("Malformed literals are diagnosed", "[lexer]") {
  TestSession unit;
  unit.addFile("main.cpp", "12ab x \"");
  std::vector<int> tokens = lexAll(unit, "main.cpp");
  REQUIRE(tokens == std::vector<int>{tok_error, tok_identifier, tok_error});
  REQUIRE(unit.errorCount() == 2);
}

TEST_CASE("Comments are skipped", "[lexer]") {
  TestSession unit;
  unit.addFile("main.cpp", "int // trailing\n/* block\n comment */ x;");
  REQUIRE(lexAll(unit, "main.cpp") == std::vector<int>{tok_int, tok_identifier, ';'});
}

TEST_CASE("Included files are lexed in place", "[lexer][preprocessor]") {
  TestSession unit;
  unit.addFile("include/a.h", "#pragma once\nint a;\n");
  unit.addFile("main.cpp", "#include \"include/a.h\"\n#include \"include/a.h\"\nchar b;\n");

  REQUIRE(lexAll(unit, "main.cpp") ==
          std::vector<int>{tok_int, tok_identifier, ';', tok_char, tok_identifier, ';'});
  REQUIRE_FALSE(unit.hadError());
  REQUIRE(unit.get().files().enteredFiles().size() == 2);
}

TEST_CASE("Angled includes use the search path", "[lexer][preprocessor]") {
  TestSession unit;
  unit.get().files().includePaths().push_back("sdk");
  unit.addFile("sdk/types.h", "long t;\n");
  unit.addFile("main.cpp", "#include <types.h>\n");

  REQUIRE(lexAll(unit, "main.cpp") == std::vector<int>{tok_long, tok_identifier, ';'});
}

TEST_CASE("A missing include is an error", "[lexer][preprocessor]") {
  TestSession unit;
  unit.addFile("main.cpp", "#include \"missing.h\"\nint x;\n");
  lexAll(unit, "main.cpp");
  REQUIRE(unit.hadError());
}

TEST_CASE("Conditional directives select a branch", "[lexer][preprocessor]") {
  TestSession unit;
  unit.addFile("main.cpp", "#define USE_INT\n"
                           "#ifdef USE_INT\nint\n#else\nchar\n#endif\n"
                           "#ifndef USE_INT\nshort\n#else\nlong\n#endif\n"
                           "#undef USE_INT\n"
                           "#ifdef USE_INT\ndouble\n#endif\n");

  REQUIRE(lexAll(unit, "main.cpp") == std::vector<int>{tok_int, tok_long});
  REQUIRE_FALSE(unit.hadError());
}

TEST_CASE("Unterminated conditionals and unknown directives", "[lexer][preprocessor]") {
  TestSession unit;
  unit.addFile("main.cpp", "#ifdef X\nint y;\n");
  lexAll(unit, "main.cpp");
  REQUIRE(unit.errorCount() == 1);

  TestSession other;
  other.addFile("main.cpp", "#frobnicate\nint y;\n");
  REQUIRE(lexAll(other, "main.cpp") == std::vector<int>{tok_int, tok_identifier, ';'});
  REQUIRE(other.errorCount() == 1);
}
