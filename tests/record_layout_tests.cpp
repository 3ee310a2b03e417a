#include <optional>

#include "analysis/record_layout.h"
#include "test_helpers.h"

namespace {

const analysis::ASTRecordLayout *layoutOf(TestSession &unit, llvm::StringRef name) {
  auto *RD = llvm::cast<RecordDecl>(unit.lookupLoaded(name).front());
  return unit.get().analysis().getLayoutContext().getRecordLayout(RD);
}

} // namespace

TEST_CASE("Fields are placed at their natural alignment", "[layout]") {
  TestSession unit;
  REQUIRE(unit.parse("main.cpp", R"(
    struct A { char c; int i; };
    struct D { char x; double d; short s; };
    struct P { bool flag; int *ptr; };
  )"));

  const analysis::ASTRecordLayout *A = layoutOf(unit, "A");
  REQUIRE(A != nullptr);
  REQUIRE(A->getSize() == 8);
  REQUIRE(A->getAlignment() == 4);
  REQUIRE(A->getFieldCount() == 2);
  REQUIRE(A->getFieldOffset(0) == 0);
  REQUIRE(A->getFieldOffset(1) == 4);

  const analysis::ASTRecordLayout *D = layoutOf(unit, "D");
  REQUIRE(D->getFieldOffset(1) == 8);
  REQUIRE(D->getFieldOffset(2) == 16);
  REQUIRE(D->getDataSize() == 18);
  REQUIRE(D->getSize() == 24);

  const analysis::ASTRecordLayout *P = layoutOf(unit, "P");
  REQUIRE(P->getFieldOffset(1) == 8);
  REQUIRE(P->getSize() == 16);
}

TEST_CASE("Nested records and arrays", "[layout]") {
  TestSession unit;
  REQUIRE(unit.parse("main.cpp", R"(
    struct A { char c; int i; };
    struct C { A a; char tail[3]; };
    struct Grid { short cells[2][3]; };
  )"));

  const analysis::ASTRecordLayout *C = layoutOf(unit, "C");
  REQUIRE(C->getFieldOffset(1) == 8);
  REQUIRE(C->getDataSize() == 11);
  REQUIRE(C->getSize() == 12);
  REQUIRE(C->getAlignment() == 4);

  const analysis::ASTRecordLayout *Grid = layoutOf(unit, "Grid");
  REQUIRE(Grid->getSize() == 12);
  REQUIRE(Grid->getAlignment() == 2);
}

TEST_CASE("Empty records and empty bases", "[layout]") {
  TestSession unit;
  REQUIRE(unit.parse("main.cpp", R"(
    struct Empty {};
    struct B : Empty { long l; char c; };
    struct Base { int b; };
    struct Derived : Base { char d; };
  )"));

  const analysis::ASTRecordLayout *Empty = layoutOf(unit, "Empty");
  REQUIRE(Empty->isEmpty());
  REQUIRE(Empty->getSize() == 1);

  const analysis::ASTRecordLayout *B = layoutOf(unit, "B");
  REQUIRE(B->getBaseOffset(0) == 0);
  REQUIRE(B->getFieldOffset(0) == 0);
  REQUIRE(B->getFieldOffset(1) == 8);
  REQUIRE(B->getSize() == 16);

  const analysis::ASTRecordLayout *Derived = layoutOf(unit, "Derived");
  REQUIRE(Derived->getBaseOffset(0) == 0);
  REQUIRE(Derived->getFieldOffset(0) == 4);
  REQUIRE(Derived->getSize() == 8);
}

TEST_CASE("A base keeps its tail padding", "[layout]") {
  TestSession unit;
  REQUIRE(unit.parse("main.cpp", R"(
    struct Padded { int i; char c; };
    struct Child : Padded { char d; };
    struct Grandchild : Child { short s; };
    char bytes[sizeof(Child)];
  )"));

  const analysis::ASTRecordLayout *Padded = layoutOf(unit, "Padded");
  REQUIRE(Padded->getDataSize() == 5);
  REQUIRE(Padded->getSize() == 8);

  const analysis::ASTRecordLayout *Child = layoutOf(unit, "Child");
  REQUIRE(Child->getBaseOffset(0) == 0);
  REQUIRE(Child->getFieldOffset(0) == 8);
  REQUIRE(Child->getSize() == 12);
  REQUIRE(Child->getAlignment() == 4);

  const analysis::ASTRecordLayout *Grandchild = layoutOf(unit, "Grandchild");
  REQUIRE(Grandchild->getFieldOffset(0) == 12);
  REQUIRE(Grandchild->getSize() == 16);

  auto *Bytes = llvm::cast<VarDecl>(unit.lookupLoaded("bytes").front());
  REQUIRE(Bytes->getType().getAsString() == "char [12]");
}

TEST_CASE("Incomplete records have no layout", "[layout]") {
  TestSession unit;
  REQUIRE(unit.parse("main.cpp", "struct Fwd; Fwd *p;"));
  REQUIRE(layoutOf(unit, "Fwd") == nullptr);

  std::optional<analysis::TypeSizeInfo> Info =
      unit.get().analysis().getLayoutContext().getTypeInfo(
          unit.context().getPointerType(
              unit.context().getRecordType(
                  llvm::cast<RecordDecl>(unit.lookupLoaded("Fwd").front()))));
  REQUIRE(Info.has_value());
  REQUIRE(Info->Size == 8);
}

TEST_CASE("Stored records are laid out like local ones", "[layout][serialization]") {
  const char *header = "struct Pair { char tag; long value; };";
  std::string store = buildStore({{"pair.h", header}}, "pair.h");

  TestSession unit;
  unit.addFile("pair.h", header);
  REQUIRE(unit.attach(store, "pair.pch"));
  REQUIRE(unit.parse("main.cpp", "int size = sizeof(Pair);"));

  const analysis::ASTRecordLayout *Pair = layoutOf(unit, "Pair");
  REQUIRE(Pair != nullptr);
  REQUIRE(Pair->getFieldOffset(1) == 8);
  REQUIRE(Pair->getSize() == 16);
}
