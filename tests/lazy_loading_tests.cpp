#include <string>
#include <vector>

#include "serialization/lazy_loader.h"
#include "test_helpers.h"

#include "llvm/Support/raw_ostream.h"

namespace {

const char *kHeader = R"(
namespace ns {
  struct Inner { int v; };
  struct S { int a; Inner in; };
  struct Unused { int u; };
  int helper(int x);
  enum Mode { Fast, Slow };
}
int global_counter;
struct Counter {
  int value;
  int get() const { return value; }
  static int make(int seed);
};
)";

const std::string &headerStore() {
  static const std::string store = buildStore({{"decls.h", kHeader}}, "decls.h");
  return store;
}

struct LoadedUnit {
  TestSession unit;
  RecordingListener listener;

  LoadedUnit() {
    unit.addFile("decls.h", kHeader);
    REQUIRE(unit.attach(headerStore(), "decls.pch"));
    unit.loader().addDeserializationListener(&listener);
  }
};

} // namespace

TEST_CASE("Only the declarations a use needs are read", "[lazy]") {
  LoadedUnit loaded;
  REQUIRE(loaded.unit.parse("main.cpp", "int use() { ns::S s; return s.a; }"));

  std::vector<std::string> expected = {
      "Namespace - ns",
      "CXXRecord - ns::S",
      "Field - ns::S::a",
      "CXXRecord - ns::Inner",
      "Field - ns::S::in",
  };
  REQUIRE(loaded.listener.reads == expected);

  serialization::LazyDeclLoader &loader = loaded.unit.loader();
  REQUIRE(loader.getNumDeclsLoaded(0) == 5);
  REQUIRE(loader.getNumDeclsLoaded(0) < loader.getStore(0).getNumDecls());
  REQUIRE(loader.getNumRecordCompletions() == 1);
}

TEST_CASE("Nothing is read before a name is looked up", "[lazy]") {
  LoadedUnit loaded;
  REQUIRE(loaded.unit.parse("main.cpp", "int unrelated(int v) { return v + 1; }"));
  REQUIRE(loaded.listener.reads.empty());
  REQUIRE(loaded.unit.loader().getNumDeclsLoaded(0) == 0);
  REQUIRE(loaded.unit.lookupLoaded("ns").empty());
}

TEST_CASE("Functions are read with their parameters", "[lazy]") {
  LoadedUnit loaded;
  REQUIRE(loaded.unit.parse("main.cpp", "int call() { return ns::helper(2); }"));

  REQUIRE(loaded.listener.sawRead("Function - ns::helper"));
  REQUIRE(loaded.listener.sawRead("ParmVar - ns::helper::x"));
  REQUIRE_FALSE(loaded.listener.sawRead("CXXRecord - ns::S"));

  auto *NS = llvm::cast<NamespaceDecl>(loaded.unit.lookupLoaded("ns").front());
  auto *Helper = llvm::cast<FunctionDecl>(NS->noloadLookup("helper").front());
  REQUIRE(Helper->isFromStore());
  REQUIRE(Helper->getNumParams() == 1);
  REQUIRE(Helper->getTypeString() == "int (int)");
  REQUIRE_FALSE(Helper->isDefined());
}

TEST_CASE("An enumerator brings in its enum", "[lazy]") {
  LoadedUnit loaded;
  REQUIRE(loaded.unit.parse("main.cpp", "int speed = ns::Slow;"));

  std::vector<std::string> expected = {
      "Namespace - ns",
      "Enum - ns::Mode",
      "EnumConstant - ns::Fast",
      "EnumConstant - ns::Slow",
  };
  REQUIRE(loaded.listener.reads == expected);
}

TEST_CASE("Stored methods are callable without their bodies", "[lazy]") {
  LoadedUnit loaded;
  REQUIRE(loaded.unit.parse("main.cpp", R"(
    int total(const Counter &c) { return c.get() + Counter::make(global_counter); }
  )"));

  REQUIRE(loaded.listener.sawRead("CXXMethod - Counter::get"));
  REQUIRE(loaded.listener.sawRead("CXXMethod - Counter::make"));
  REQUIRE(loaded.listener.sawRead("Var - global_counter"));

  auto *RD = llvm::cast<RecordDecl>(loaded.unit.lookupLoaded("Counter").front());
  CXXMethodDecl *Get = RD->methods()[0];
  REQUIRE(Get->isConst());
  REQUIRE(Get->isDefined());
  REQUIRE(Get->getBody() == nullptr);
  REQUIRE(RD->methods()[1]->isStatic());
}

TEST_CASE("A reopened namespace merges with the stored one", "[lazy]") {
  LoadedUnit loaded;
  REQUIRE(loaded.unit.parse("main.cpp", R"(
    namespace ns { int local; }
    int both() { return ns::local + ns::helper(ns::local); }
  )"));

  REQUIRE(loaded.unit.lookupLoaded("ns").size() == 1);
  auto *NS = llvm::cast<NamespaceDecl>(loaded.unit.lookupLoaded("ns").front());
  REQUIRE(NS->isFromStore());
  REQUIRE(NS->noloadLookup("local").size() == 1);
}

TEST_CASE("Local declarations conflict with stored ones", "[lazy]") {
  auto expectError = [](const char *source) {
    LoadedUnit loaded;
    INFO(source);
    REQUIRE_FALSE(loaded.unit.parse("main.cpp", source));
  };

  expectError("namespace ns { struct S { int a; }; }");
  expectError("int global_counter = 3;");
  expectError("struct Counter;  int Counter;");
  expectError("namespace ns { long helper(int y); }");
}

TEST_CASE("Eager loading reads every declaration", "[lazy]") {
  LoadedUnit loaded;
  serialization::LazyDeclLoader &loader = loaded.unit.loader();
  loader.loadAllDeclarations();

  REQUIRE(loader.getNumDeclsLoaded(0) == loader.getStore(0).getNumDecls());
  // Inner, S, Unused and Counter.
  REQUIRE(loader.getNumRecordCompletions() == 4);
  REQUIRE(loaded.listener.reads.size() == loader.getStore(0).getNumDecls());

  for (serialization::DeclID ID = 1; ID <= loader.getStore(0).getNumDecls(); ++ID)
    REQUIRE(loader.getDeclIfLoaded(0, ID) != nullptr);

  auto *NS = llvm::cast<NamespaceDecl>(loaded.unit.lookupLoaded("ns").front());
  auto *Unused = llvm::cast<RecordDecl>(NS->noloadLookup("Unused").front());
  REQUIRE(Unused->isCompleteDefinition());
  REQUIRE(Unused->fields().size() == 1);

  // Later lookups find what is already in memory.
  REQUIRE(loaded.unit.parse("main.cpp", "ns::Unused u; int n = u.u;"));
  REQUIRE(loader.getNumRecordCompletions() == 4);
}

TEST_CASE("Loaded declarations are cached by ID", "[lazy]") {
  LoadedUnit loaded;
  serialization::LazyDeclLoader &loader = loaded.unit.loader();
  std::vector<serialization::DeclID> ids = loader.getStore(0).lookup("ns::S");
  REQUIRE(ids.size() == 1);
  REQUIRE(loader.getDeclIfLoaded(0, ids.front()) == nullptr);

  REQUIRE(loaded.unit.parse("main.cpp", "ns::S *p;"));
  Decl *S = loader.getDeclIfLoaded(0, ids.front());
  REQUIRE(S != nullptr);
  REQUIRE(S->getStoreID() == ids.front());
  REQUIRE(S->getOwningStoreIndex() == 0);
  REQUIRE(loader.getDeclIfLoaded(0, 0) == nullptr);
  REQUIRE(loader.getDeclIfLoaded(3, ids.front()) == nullptr);
}

TEST_CASE("Statistics report how much of a store was read", "[lazy]") {
  LoadedUnit loaded;
  REQUIRE(loaded.unit.parse("main.cpp", "ns::S *p;"));

  std::string text;
  llvm::raw_string_ostream os(text);
  loaded.unit.loader().printStatistics(os);
  os.flush();

  REQUIRE(text.find("*** Declaration store statistics:") != std::string::npos);
  REQUIRE(text.find("decls.pch (precompiled header):") != std::string::npos);
  REQUIRE(text.find("2/") != std::string::npos);
  REQUIRE(text.find("0 record definitions completed") != std::string::npos);
}

TEST_CASE("Stored integer constants keep their values", "[lazy]") {
  const char *header = R"(
const int N = 4;
struct Block { int a[N]; };
const long Twice = N * 2;
int Mutable = 7;
)";
  TestSession unit;
  unit.addFile("consts.h", header);
  REQUIRE(unit.attach(buildStore({{"consts.h", header}}, "consts.h"), "consts.pch"));

  REQUIRE(unit.parse("main.cpp", R"(
    int arr[N];
    char wide[Twice + sizeof(Block)];
    enum Slots { Last = N - 1 };
  )"));

  auto *N = llvm::cast<VarDecl>(unit.lookupLoaded("N").front());
  REQUIRE(N->isFromStore());
  REQUIRE(N->getInit() == nullptr);
  REQUIRE(N->hasConstantValue());
  REQUIRE(N->getConstantValue() == 4);

  auto *Arr = llvm::cast<VarDecl>(unit.lookupLoaded("arr").front());
  REQUIRE(Arr->getType().getAsString() == "int [4]");
  auto *Wide = llvm::cast<VarDecl>(unit.lookupLoaded("wide").front());
  REQUIRE(Wide->getType().getAsString() == "char [24]");
  auto *Slots = llvm::cast<EnumDecl>(unit.lookupLoaded("Slots").front());
  REQUIRE(Slots->enumerators().front()->getInitVal() == 3);

  // Only const integer variables fold.
  TestSession other;
  other.addFile("consts.h", header);
  REQUIRE(other.attach(buildStore({{"consts.h", header}}, "consts.h"), "consts.pch"));
  REQUIRE_FALSE(other.parse("main.cpp", "int bad[Mutable];"));
}
