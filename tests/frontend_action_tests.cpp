#include <string>

#include "ast/ast_dumper.h"
#include "test_helpers.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

namespace {

const char *kHeader = R"(
namespace ns {
  struct Inner { int v; };
  struct S { int a; Inner in; };
  int helper(int x);
}
)";

/// A scratch directory that is removed with everything in it.
class ScratchDir {
  llvm::SmallString<128> root;

public:
  ScratchDir() {
    std::error_code ec = llvm::sys::fs::createUniqueDirectory("declcache", root);
    REQUIRE_FALSE(ec);
  }
  ~ScratchDir() { llvm::sys::fs::remove_directories(root); }

  std::string path(llvm::StringRef name) const {
    llvm::SmallString<128> result(root);
    llvm::sys::path::append(result, name);
    return std::string(result.str());
  }

  std::string write(llvm::StringRef name, llvm::StringRef contents) const {
    std::string file = path(name);
    std::error_code ec;
    llvm::raw_fd_ostream os(file, ec, llvm::sys::fs::OF_Text);
    REQUIRE_FALSE(ec);
    os << contents;
    return file;
  }
};

bool emitStore(const std::string &input, const std::string &output, FrontendMode mode,
               const std::string &moduleName = std::string()) {
  TestSession emitter;
  FrontendOptions &opts = emitter.get().options();
  opts.inputFile = input;
  opts.outputFile = output;
  opts.mode = mode;
  opts.moduleName = moduleName;
  return runFrontendAction(emitter.get());
}

} // namespace

TEST_CASE("A precompiled header is emitted and included", "[frontend]") {
  ScratchDir dir;
  std::string header = dir.write("lib.h", kHeader);
  std::string pch = dir.path("lib.pch");
  REQUIRE(emitStore(header, pch, FrontendMode::EmitPCH));
  REQUIRE(llvm::sys::fs::exists(pch));

  TestSession unit;
  FrontendOptions &opts = unit.get().options();
  opts.includePCH = pch;
  opts.inputFile = "main.cpp";
  unit.addFile("main.cpp", "int use() { ns::S s; return s.a; }");
  REQUIRE(runFrontendAction(unit.get()));

  serialization::LazyDeclLoader &loader = unit.loader();
  REQUIRE(loader.getNumStores() == 1);
  REQUIRE(loader.getStore(0).getOriginalFile() == header);
  REQUIRE(loader.getNumDeclsLoaded(0) == 5);
  REQUIRE(loader.getNumDeclsLoaded(0) < loader.getStore(0).getNumDecls());
}

TEST_CASE("Eager loading reads the whole store up front", "[frontend]") {
  ScratchDir dir;
  std::string header = dir.write("lib.h", kHeader);
  std::string pch = dir.path("lib.pch");
  REQUIRE(emitStore(header, pch, FrontendMode::EmitPCH));

  TestSession unit;
  FrontendOptions &opts = unit.get().options();
  opts.includePCH = pch;
  opts.lazyLoad = false;
  opts.inputFile = "main.cpp";
  unit.addFile("main.cpp", "int unrelated;");
  REQUIRE(runFrontendAction(unit.get()));
  REQUIRE(unit.loader().getNumDeclsLoaded(0) == unit.loader().getStore(0).getNumDecls());
}

TEST_CASE("Module files are attached by kind", "[frontend]") {
  ScratchDir dir;
  std::string header = dir.write("lib.h", kHeader);
  std::string pcm = dir.path("lib.pcm");
  std::string pch = dir.path("lib.pch");
  REQUIRE(emitStore(header, pcm, FrontendMode::EmitModule, "Lib"));
  REQUIRE(emitStore(header, pch, FrontendMode::EmitPCH));

  SECTION("as a module") {
    TestSession unit;
    FrontendOptions &opts = unit.get().options();
    opts.moduleFiles.push_back(pcm);
    opts.inputFile = "main.cpp";
    unit.addFile("main.cpp", "int call() { return ns::helper(1); }");
    REQUIRE(runFrontendAction(unit.get()));
    REQUIRE(unit.loader().getStore(0).getModuleName() == "Lib");
  }
  SECTION("a module named after its input file") {
    std::string unnamed = dir.path("unnamed.pcm");
    REQUIRE(emitStore(header, unnamed, FrontendMode::EmitModule));
    auto store = serialization::DeclStore::open(unnamed);
    REQUIRE(static_cast<bool>(store));
    REQUIRE((*store)->getModuleName() == "lib");
  }
  SECTION("a module named as a precompiled header") {
    TestSession unit;
    FrontendOptions &opts = unit.get().options();
    opts.includePCH = pcm;
    opts.inputFile = "main.cpp";
    unit.addFile("main.cpp", "int x;");
    REQUIRE_FALSE(runFrontendAction(unit.get()));
    REQUIRE(unit.errorCount() == 1);
  }
  SECTION("a precompiled header named as a module") {
    TestSession unit;
    FrontendOptions &opts = unit.get().options();
    opts.moduleFiles.push_back(pch);
    opts.inputFile = "main.cpp";
    unit.addFile("main.cpp", "int x;");
    REQUIRE_FALSE(runFrontendAction(unit.get()));
  }
  SECTION("a header and a module together") {
    TestSession unit;
    FrontendOptions &opts = unit.get().options();
    opts.includePCH = pch;
    opts.moduleFiles.push_back(pcm);
    opts.inputFile = "main.cpp";
    unit.addFile("main.cpp", "ns::S value;");
    REQUIRE(runFrontendAction(unit.get()));
    REQUIRE(unit.loader().getNumStores() == 2);
  }
}

TEST_CASE("A changed header invalidates its store", "[frontend]") {
  ScratchDir dir;
  std::string header = dir.write("lib.h", kHeader);
  std::string pch = dir.path("lib.pch");
  REQUIRE(emitStore(header, pch, FrontendMode::EmitPCH));
  dir.write("lib.h", "namespace ns { struct S { long a; }; }");

  SECTION("validated") {
    TestSession unit;
    FrontendOptions &opts = unit.get().options();
    opts.includePCH = pch;
    opts.inputFile = "main.cpp";
    unit.addFile("main.cpp", "int x;");
    REQUIRE_FALSE(runFrontendAction(unit.get()));
    REQUIRE(unit.loader().getNumStores() == 0);
  }
  SECTION("not validated") {
    TestSession unit;
    FrontendOptions &opts = unit.get().options();
    opts.includePCH = pch;
    opts.validateInputFiles = false;
    opts.inputFile = "main.cpp";
    unit.addFile("main.cpp", "ns::S *p;");
    REQUIRE(runFrontendAction(unit.get()));
  }
}

TEST_CASE("Emitting reports configuration errors", "[frontend]") {
  ScratchDir dir;
  std::string header = dir.write("lib.h", kHeader);

  SECTION("no output file") {
    REQUIRE_FALSE(emitStore(header, "", FrontendMode::EmitPCH));
  }
  SECTION("unwritable output") {
    REQUIRE_FALSE(emitStore(header, dir.path("missing/dir/lib.pch"), FrontendMode::EmitPCH));
  }
  SECTION("missing input") {
    REQUIRE_FALSE(emitStore(dir.path("nothing.h"), dir.path("x.pch"), FrontendMode::EmitPCH));
  }
  SECTION("a store is already attached") {
    std::string pch = dir.path("lib.pch");
    REQUIRE(emitStore(header, pch, FrontendMode::EmitPCH));

    TestSession unit;
    FrontendOptions &opts = unit.get().options();
    opts.includePCH = pch;
    opts.mode = FrontendMode::EmitPCH;
    opts.outputFile = dir.path("again.pch");
    opts.inputFile = "main.h";
    unit.addFile("main.h", "ns::S *p;");
    REQUIRE_FALSE(runFrontendAction(unit.get()));
    REQUIRE_FALSE(llvm::sys::fs::exists(dir.path("again.pch")));
  }
}

TEST_CASE("Parse errors stop the store from being written", "[frontend]") {
  ScratchDir dir;
  std::string header = dir.write("bad.h", "struct Broken { int v };");
  REQUIRE_FALSE(emitStore(header, dir.path("bad.pch"), FrontendMode::EmitPCH));
  REQUIRE_FALSE(llvm::sys::fs::exists(dir.path("bad.pch")));
}

TEST_CASE("Statistics describe the session", "[frontend]") {
  SECTION("without stores") {
    TestSession unit;
    REQUIRE(unit.parse("main.cpp", "int x;"));
    std::string text;
    llvm::raw_string_ostream os(text);
    printFrontendStatistics(unit.get(), os);
    os.flush();
    REQUIRE(text.find("*** Frontend statistics:") != std::string::npos);
    REQUIRE(text.find("0 errors, 0 warnings") != std::string::npos);
    REQUIRE(text.find("no declaration stores attached") != std::string::npos);
  }
  SECTION("with a store") {
    TestSession unit;
    unit.addFile("lib.h", kHeader);
    REQUIRE(unit.attach(buildStore({{"lib.h", kHeader}}, "lib.h"), "lib.pch"));
    REQUIRE(unit.parse("main.cpp", "ns::S s;"));
    std::string text;
    llvm::raw_string_ostream os(text);
    printFrontendStatistics(unit.get(), os);
    os.flush();
    REQUIRE(text.find("1 record definitions completed on demand") != std::string::npos);
    REQUIRE(text.find("*** Declaration store statistics:") != std::string::npos);
  }
}

TEST_CASE("The AST dump marks imported declarations", "[frontend]") {
  TestSession unit;
  unit.addFile("lib.h", kHeader);
  REQUIRE(unit.attach(buildStore({{"lib.h", kHeader}}, "lib.h"), "lib.pch"));
  REQUIRE(unit.parse("main.cpp", "ns::S s; int local;"));

  std::string text;
  llvm::raw_string_ostream os(text);
  ASTDumper dumper(os);
  dumper.dumpDecl(unit.context().getTranslationUnitDecl());
  os.flush();

  REQUIRE(text.find("TranslationUnitDecl") == 0);
  REQUIRE(text.find("NamespaceDecl ns imported") != std::string::npos);
  REQUIRE(text.find("CXXRecordDecl struct S definition imported") != std::string::npos);
  REQUIRE(text.find("VarDecl local 'int'") != std::string::npos);
  // Declarations that were never read do not appear.
  REQUIRE(text.find("helper") == std::string::npos);
}

TEST_CASE("Headers already in a precompiled header are not parsed again", "[frontend]") {
  ScratchDir dir;
  dir.write("g.h", "#ifndef G_H\n#define G_H\nstruct G { int a; };\n#endif\n");
  dir.write("p.h", "#pragma once\nstruct P { int b; };\n");
  std::string prefix = dir.write("prefix.h", "#include \"g.h\"\n#include \"p.h\"\n");
  std::string pch = dir.path("prefix.pch");
  REQUIRE(emitStore(prefix, pch, FrontendMode::EmitPCH));

  std::string mainFile = dir.write("main.cpp", R"(#include "g.h"
#include "p.h"
int sum(G g, P p) { return g.a + p.b; }
)");

  SECTION("with the precompiled header") {
    TestSession unit;
    FrontendOptions &opts = unit.get().options();
    opts.includePCH = pch;
    opts.inputFile = mainFile;
    REQUIRE(runFrontendAction(unit.get()));
    REQUIRE(unit.errorCount() == 0);

    auto *G = llvm::cast<RecordDecl>(unit.lookupLoaded("G").front());
    auto *P = llvm::cast<RecordDecl>(unit.lookupLoaded("P").front());
    REQUIRE(G->isFromStore());
    REQUIRE(P->isFromStore());
  }
  SECTION("as a module file the headers are parsed") {
    std::string pcm = dir.path("prefix.pcm");
    REQUIRE(emitStore(prefix, pcm, FrontendMode::EmitModule, "Prefix"));
    TestSession unit;
    FrontendOptions &opts = unit.get().options();
    opts.moduleFiles.push_back(pcm);
    opts.inputFile = mainFile;
    REQUIRE_FALSE(runFrontendAction(unit.get()));
  }
}
