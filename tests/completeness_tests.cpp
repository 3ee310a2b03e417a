#include <string>

#include "analysis/completeness.h"
#include "test_helpers.h"

namespace {

const char *kLibrary = R"(
namespace ns {
  struct Inner { int v; };
  struct S { int a; Inner in; };
  struct Base { int b; };
  struct Holder { typedef long value_type; value_type stored; };
  struct Opaque;
}
)";

const std::string &libraryStore() {
  static const std::string store = buildStore({{"lib.h", kLibrary}}, "lib.h");
  return store;
}

// A session with the library store attached and its header unchanged on disk.
void attachLibrary(TestSession &unit) {
  unit.addFile("lib.h", kLibrary);
  REQUIRE(unit.attach(libraryStore(), "lib.pch"));
}

RecordDecl *storedRecord(TestSession &unit, llvm::StringRef name) {
  auto *NS = llvm::cast<NamespaceDecl>(unit.lookupLoaded("ns").front());
  DeclContext::lookup_result found = NS->noloadLookup(name);
  if (found.empty())
    return nullptr;
  return llvm::dyn_cast<RecordDecl>(found.front());
}

unsigned externalCompletions(TestSession &unit) {
  return unit.get().analysis().getCompletenessTrigger().getNumExternalCompletions();
}

} // namespace

TEST_CASE("Naming a stored record does not complete it", "[completeness]") {
  TestSession unit;
  attachLibrary(unit);
  REQUIRE(unit.parse("main.cpp", R"(
    ns::S *p;
    extern ns::S e;
    void take(ns::S s);
    ns::S give();
    const ns::S &ref(const ns::S &s);
    typedef ns::S Alias;
  )"));

  RecordDecl *S = storedRecord(unit, "S");
  REQUIRE(S != nullptr);
  REQUIRE(S->isFromStore());
  REQUIRE(S->hasExternalDefinitionPending());
  REQUIRE_FALSE(S->isCompleteDefinition());
  REQUIRE(externalCompletions(unit) == 0);
  REQUIRE(unit.loader().getNumRecordCompletions() == 0);
}

TEST_CASE("A variable of record type completes only that record", "[completeness]") {
  TestSession unit;
  attachLibrary(unit);
  RecordingListener listener;
  unit.loader().addDeserializationListener(&listener);

  REQUIRE(unit.parse("main.cpp", "ns::S s;"));

  RecordDecl *S = storedRecord(unit, "S");
  REQUIRE(S->isCompleteDefinition());
  REQUIRE(S->fields().size() == 2);
  REQUIRE(listener.sawRead("Field - ns::S::a"));
  REQUIRE(listener.sawRead("Field - ns::S::in"));

  // The field's type is only named, so its members stay in the store.
  RecordDecl *Inner = storedRecord(unit, "Inner");
  REQUIRE(Inner != nullptr);
  REQUIRE(Inner->hasExternalDefinitionPending());
  REQUIRE_FALSE(listener.sawRead("Field - ns::Inner::v"));
  REQUIRE(externalCompletions(unit) == 1);
}

TEST_CASE("sizeof completes records transitively", "[completeness]") {
  TestSession unit;
  attachLibrary(unit);
  REQUIRE(unit.parse("main.cpp", "int bytes[sizeof(ns::S)];"));

  REQUIRE(storedRecord(unit, "S")->isCompleteDefinition());
  REQUIRE(storedRecord(unit, "Inner")->isCompleteDefinition());

  auto *Bytes = llvm::cast<VarDecl>(unit.lookupLoaded("bytes").front());
  REQUIRE(Bytes->getType().getAsString() == "int [8]");
}

TEST_CASE("Uses that need a definition complete stored records", "[completeness]") {
  SECTION("member access through a pointer") {
    TestSession unit;
    attachLibrary(unit);
    REQUIRE(unit.parse("main.cpp", "int get(ns::S *p) { return p->a; }"));
    REQUIRE(storedRecord(unit, "S")->isCompleteDefinition());
  }
  SECTION("base class") {
    TestSession unit;
    attachLibrary(unit);
    REQUIRE(unit.parse("main.cpp", "struct D : ns::Base { int d; };"));
    REQUIRE(storedRecord(unit, "Base")->isCompleteDefinition());
  }
  SECTION("field of a local record") {
    TestSession unit;
    attachLibrary(unit);
    REQUIRE(unit.parse("main.cpp", "struct Wrapper { ns::S s; };"));
    REQUIRE(storedRecord(unit, "S")->isCompleteDefinition());
    // Laying out Wrapper needs the size of every nested member.
    REQUIRE(storedRecord(unit, "Inner")->isCompleteDefinition());
  }
  SECTION("parameter of a function definition") {
    TestSession unit;
    attachLibrary(unit);
    REQUIRE(unit.parse("main.cpp", "int first(ns::S s) { return s.a; }"));
    REQUIRE(storedRecord(unit, "S")->isCompleteDefinition());
  }
  SECTION("result of a function definition") {
    TestSession unit;
    attachLibrary(unit);
    REQUIRE(unit.parse("main.cpp", "ns::Base make(ns::Base *from) { return *from; }"));
    REQUIRE(storedRecord(unit, "Base")->isCompleteDefinition());
  }
  SECTION("nested name specifier") {
    TestSession unit;
    attachLibrary(unit);
    REQUIRE(unit.parse("main.cpp", "ns::Holder::value_type count;"));
    REQUIRE(storedRecord(unit, "Holder")->isCompleteDefinition());
    auto *Count = llvm::cast<VarDecl>(unit.lookupLoaded("count").front());
    REQUIRE(Count->getType().getCanonicalType().getAsString() == "long");
  }
}

TEST_CASE("A record is completed from its store once", "[completeness]") {
  TestSession unit;
  attachLibrary(unit);
  REQUIRE(unit.parse("main.cpp", R"(
    ns::S one;
    ns::S two;
    int sum(ns::S *p) { return p->a + one.a + two.a; }
  )"));
  REQUIRE(externalCompletions(unit) == 1);
  REQUIRE(unit.loader().getNumRecordCompletions() == 1);
}

TEST_CASE("A stored forward declaration stays incomplete", "[completeness]") {
  auto expectError = [](const char *source) {
    TestSession unit;
    attachLibrary(unit);
    INFO(source);
    REQUIRE_FALSE(unit.parse("main.cpp", source));
    REQUIRE(storedRecord(unit, "Opaque")->hasDefinition() == false);
  };

  expectError("ns::Opaque o;");
  expectError("struct H { ns::Opaque o; };");
  expectError("struct H : ns::Opaque { int h; };");
  expectError("int f(ns::Opaque *p) { return p->x; }");
  expectError("int n = sizeof(ns::Opaque);");
  expectError("int f(ns::Opaque *p) { return p[1].x; }");
  expectError("ns::Opaque make(ns::Opaque *p) { return *p; }");
  expectError("void f(ns::Opaque o) {}");
}

TEST_CASE("Pointers to a stored forward declaration are fine", "[completeness]") {
  TestSession unit;
  attachLibrary(unit);
  REQUIRE(unit.parse("main.cpp", R"(
    ns::Opaque *handle;
    extern ns::Opaque shared;
    ns::Opaque *next(ns::Opaque *p) { return p; }
    void consume(ns::Opaque o);
  )"));
}

TEST_CASE("Local incomplete types are diagnosed", "[completeness]") {
  auto expectError = [](const char *source) {
    TestSession unit;
    INFO(source);
    REQUIRE_FALSE(unit.parse("main.cpp", source));
  };

  expectError("struct Fwd; Fwd f;");
  expectError("struct Self { Self inner; };");
  expectError("struct Fwd; int n = sizeof(Fwd);");
  expectError("struct Fwd; int f(Fwd *p) { return p->x; }");
  expectError("struct Fwd; struct D : Fwd { int d; };");
  expectError("void nothing; ");
  expectError("struct Fwd; Fwd arr[2];");
}

TEST_CASE("Members are visible inside the record being defined", "[completeness]") {
  TestSession unit;
  REQUIRE(unit.parse("main.cpp", R"(
    struct List {
      int size;
      List *next;
      int following() const { return next->size + size; }
    };
  )"));
}
