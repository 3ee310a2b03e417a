#include <string>

#include "test_helpers.h"

TEST_CASE("Namespaces are reopened and merged", "[sema]") {
  TestSession unit;
  REQUIRE(unit.parse("main.cpp", R"(
    namespace ns { struct A { int x; }; }
    namespace ns { A a; }
    namespace ns { namespace inner { int depth; } }
  )"));

  auto found = unit.lookupLoaded("ns");
  REQUIRE(found.size() == 1);
  auto *NS = llvm::dyn_cast<NamespaceDecl>(found.front());
  REQUIRE(NS != nullptr);
  REQUIRE(NS->noloadLookup("A").size() == 1);
  REQUIRE(NS->noloadLookup("a").size() == 1);

  auto inner = NS->noloadLookup("inner");
  REQUIRE(inner.size() == 1);
  auto *Depth = llvm::cast<NamespaceDecl>(inner.front())->noloadLookup("depth").front();
  REQUIRE(Depth->getQualifiedNameAsString() == "ns::inner::depth");
}

TEST_CASE("Records collect fields, methods and bases", "[sema]") {
  TestSession unit;
  REQUIRE(unit.parse("main.cpp", R"(
    struct Base { int b; };
    class Derived : public Base {
      int hidden;
    public:
      int get() const { return hidden + b; }
      static int make(int seed);
      int values[4];
    };
  )"));

  auto *RD = llvm::dyn_cast<RecordDecl>(unit.lookupLoaded("Derived").front());
  REQUIRE(RD != nullptr);
  REQUIRE(RD->isCompleteDefinition());
  REQUIRE(RD->getTagKind() == TagKind::Class);
  REQUIRE(RD->bases().size() == 1);
  REQUIRE(RD->bases()[0].Access == AccessSpecifier::Public);

  std::vector<FieldDecl *> fields = RD->fields();
  REQUIRE(fields.size() == 2);
  REQUIRE(fields[0]->getName() == "hidden");
  REQUIRE(fields[0]->getAccess() == AccessSpecifier::Private);
  REQUIRE(fields[1]->getAccess() == AccessSpecifier::Public);
  REQUIRE(fields[1]->getType().getAsString() == "int [4]");

  std::vector<CXXMethodDecl *> methods = RD->methods();
  REQUIRE(methods.size() == 2);
  REQUIRE(methods[0]->isConst());
  REQUIRE(methods[0]->isDefined());
  REQUIRE(methods[1]->isStatic());
  REQUIRE_FALSE(methods[1]->isDefined());
  REQUIRE(methods[1]->getTypeString() == "int (int)");
}

TEST_CASE("Enumerators take implicit and explicit values", "[sema]") {
  TestSession unit;
  REQUIRE(unit.parse("main.cpp", R"(
    enum Color { Red, Green = 5, Blue };
    enum class Mode : unsigned char { Off = Green - 5, On };
    int pick = Blue;
  )"));

  auto *Color = llvm::cast<EnumDecl>(unit.lookupLoaded("Color").front());
  std::vector<EnumConstantDecl *> colors = Color->enumerators();
  REQUIRE(colors.size() == 3);
  REQUIRE(colors[0]->getInitVal() == 0);
  REQUIRE(colors[1]->getInitVal() == 5);
  REQUIRE(colors[2]->getInitVal() == 6);
  // Unscoped enumerators are visible in the enclosing scope.
  REQUIRE(unit.lookupLoaded("Blue").size() == 1);

  auto *Mode = llvm::cast<EnumDecl>(unit.lookupLoaded("Mode").front());
  REQUIRE(Mode->isScoped());
  REQUIRE(Mode->getIntegerType().getAsString() == "unsigned char");
  REQUIRE(Mode->enumerators()[1]->getInitVal() == 1);
  REQUIRE(unit.lookupLoaded("On").empty());
}

TEST_CASE("Typedefs and aliases name the same type", "[sema]") {
  TestSession unit;
  REQUIRE(unit.parse("main.cpp", R"(
    namespace ns { struct S { int v; }; }
    typedef ns::S Alias;
    using Other = ns::S;
    typedef ns::S Alias;
    Other o;
    int f(Alias *p) { return p->v; }
    int g() { return sizeof(Alias); }
  )"));

  auto *TD = llvm::cast<TypedefNameDecl>(unit.lookupLoaded("Alias").front());
  auto *TA = llvm::cast<TypedefNameDecl>(unit.lookupLoaded("Other").front());
  REQUIRE(unit.context().hasSameType(TD->getUnderlyingType(), TA->getUnderlyingType()));
}

TEST_CASE("Redefinitions are rejected", "[sema]") {
  auto expectError = [](const char *source) {
    TestSession unit;
    INFO(source);
    REQUIRE_FALSE(unit.parse("main.cpp", source));
  };

  expectError("struct S { int a; }; struct S { int a; };");
  expectError("int x; struct x;");
  expectError("typedef int T; typedef long T;");
  expectError("int v = 1; int v = 2;");
  expectError("int v; long v;");
  expectError("enum E { A, A };");
  expectError("struct R { int m; int m; };");
  expectError("int f(int a) { return a; } int f(int b) { return b; }");
  expectError("int f(int); long f(int);");
  expectError("struct M { void m(); void m(); };");
  expectError("namespace n {} int n;");
}

TEST_CASE("Valid redeclarations are merged", "[sema]") {
  TestSession unit;
  REQUIRE(unit.parse("main.cpp", R"(
    extern int counter;
    int counter = 3;
    struct Fwd;
    struct Fwd;
    struct Fwd { int x; };
    int twice(int v);
    int twice(int v) { return v * 2; }
    int twice(long v, long w);
  )"));

  REQUIRE(unit.lookupLoaded("counter").size() == 1);
  auto *Counter = llvm::cast<VarDecl>(unit.lookupLoaded("counter").front());
  REQUIRE(Counter->hasInit());
  REQUIRE(unit.lookupLoaded("Fwd").size() == 1);
  REQUIRE(unit.lookupLoaded("twice").size() == 2);
}

TEST_CASE("Expressions are type checked", "[sema]") {
  auto expectError = [](const char *source) {
    TestSession unit;
    INFO(source);
    REQUIRE_FALSE(unit.parse("main.cpp", source));
  };

  expectError("int f() { return undeclared; }");
  expectError("struct S { int a; }; int f(S s) { return s.b; }");
  expectError("struct S { int a; }; int f(S *s) { return s.a; }");
  expectError("struct S { int a; }; int f(S s) { return s->a; }");
  expectError("int g(int); int f() { return g(); }");
  expectError("int g(int); int g(long); int f() { return g(1, 2); }");
  expectError("int f(const int c) { c = 2; return c; }");
  expectError("struct S { int a; }; int f(S s) { if (s) return 1; return 0; }");
  expectError("void f() { return 1; }");
  expectError("int f() { return; }");
  expectError("int f() { return this; }");
  expectError("struct S { int v; static int get() { return v; } };");
  expectError("struct S { void m(); }; void f(const S &s) { s.m(); }");
  expectError("int arr[-1];");
  expectError("int n; int arr[n];");
  expectError("int *p = 1;");
}

TEST_CASE("Well-formed function bodies", "[sema]") {
  TestSession unit;
  REQUIRE(unit.parse("main.cpp", R"(
    namespace geo {
      struct Point { int x; int y; };
      int dot(const Point &a, const Point &b) { return a.x * b.x + a.y * b.y; }
    }
    struct Node {
      int value;
      Node *next;
      int sum() const {
        int total = 0;
        const Node *cur = this;
        while (cur != nullptr) {
          total = total + cur->value;
          cur = cur->next;
        }
        return total;
      }
    };
    bool positive(int v) { return v > 0 && !(v == 0); }
    int pick(int a) { if (positive(a)) return a; else return -a; }
    int first(int *items) { return items[0] + sizeof(geo::Point) + sizeof items; }
    int use() {
      geo::Point p;
      p.x = 1;
      Node n;
      n.next = &n;
      return geo::dot(p, p) + n.sum() + pick(p.y);
    }
  )"));
  REQUIRE(unit.errorCount() == 0);
}

TEST_CASE("Array bounds fold constant expressions", "[sema]") {
  TestSession unit;
  REQUIRE(unit.parse("main.cpp", R"(
    enum { Width = 4 };
    const int Height = 3;
    struct Grid { char cells[Width * Height + 1]; };
    int raw[sizeof(Grid)];
  )"));

  auto *Raw = llvm::cast<VarDecl>(unit.lookupLoaded("raw").front());
  REQUIRE(Raw->getType().getAsString() == "int [13]");
}

TEST_CASE("Parse errors recover at the next declaration", "[sema][parser]") {
  TestSession unit;
  REQUIRE_FALSE(unit.parse("main.cpp", R"(
    int broken = ;
    struct Ok { int v; };
    int also broken;
    int fine;
  )"));

  REQUIRE(unit.lookupLoaded("Ok").size() == 1);
  REQUIRE(unit.lookupLoaded("fine").size() == 1);
  REQUIRE(unit.errorCount() >= 2);
}

TEST_CASE("Unsupported constructs are diagnosed", "[sema][parser]") {
  auto expectError = [](const char *source) {
    TestSession unit;
    INFO(source);
    REQUIRE_FALSE(unit.parse("main.cpp", source));
  };

  expectError("using namespace std;");
  expectError("struct S { static int count; };");
  expectError("struct S { int v = 0; };");
  expectError("struct S { void m(); }; void S::m() {}");
  expectError("struct S { int &r; };");
  expectError("}");
}
