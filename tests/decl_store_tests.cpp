#include <map>
#include <string>
#include <vector>

#include "test_helpers.h"

using serialization::DeclStore;
using serialization::StoreKind;

namespace {

const std::map<std::string, std::string> kShapes = {
    {"shapes.h", R"(
#pragma once
namespace geo {
  struct Point { int x; int y; };
  enum Color { Red, Green };
  int area(int w, int h);
}
)"},
    {"shapes_all.h", R"(
#include "shapes.h"
#include "shapes.h"
typedef geo::Point Pt;
)"},
};

std::unique_ptr<DeclStore> openStore(const std::string &bytes, const std::string &name) {
  auto storeOrErr =
      DeclStore::create(llvm::MemoryBuffer::getMemBufferCopy(bytes, name));
  if (!storeOrErr) {
    FAIL(llvm::toString(storeOrErr.takeError()));
    return nullptr;
  }
  return std::move(*storeOrErr);
}

std::string attachError(TestSession &unit, const std::string &bytes,
                        const std::string &name) {
  llvm::Error err = unit.loader().attachStore(openStore(bytes, name));
  return err ? llvm::toString(std::move(err)) : std::string();
}

} // namespace

TEST_CASE("A precompiled header records its control block", "[serialization]") {
  std::unique_ptr<DeclStore> store =
      openStore(buildStore(kShapes, "shapes_all.h"), "shapes.pch");

  REQUIRE(store->getFileName() == "shapes.pch");
  REQUIRE(store->getKind() == StoreKind::PCH);
  REQUIRE_FALSE(store->isModule());
  REQUIRE(std::string(store->getKindDescription()) == "precompiled header");
  REQUIRE(store->getModuleName().empty());
  REQUIRE(store->getOriginalFile() == "shapes_all.h");

  // Each file counts once even when it is included twice.
  REQUIRE(store->inputFiles().size() == 2);
  REQUIRE(store->inputFiles()[0].Path == "shapes_all.h");
  REQUIRE(store->inputFiles()[1].Path == "shapes.h");
  REQUIRE(store->getInputFilePath(2) == "shapes.h");
  REQUIRE(store->getInputFilePath(0).empty());
}

TEST_CASE("A module file carries its name", "[serialization]") {
  std::unique_ptr<DeclStore> store = openStore(
      buildStore(kShapes, "shapes_all.h", StoreKind::Module, "Geometry"), "geo.pcm");

  REQUIRE(store->isModule());
  REQUIRE(store->getModuleName() == "Geometry");
  REQUIRE(std::string(store->getKindDescription()) == "module file");
}

TEST_CASE("Every declaration gets an ID", "[serialization]") {
  std::unique_ptr<DeclStore> store =
      openStore(buildStore(kShapes, "shapes_all.h"), "shapes.pch");

  // geo, Point, x, y, Color, Red, Green, area, w, h, Pt
  REQUIRE(store->getNumDecls() == 11);
  REQUIRE(store->getTopLevelDecls().size() == 2);

  llvm::SmallVector<uint64_t, 64> record;
  llvm::Expected<unsigned> code = store->readDeclRecord(store->getTopLevelDecls()[0], record);
  REQUIRE(static_cast<bool>(code));
  REQUIRE(*code == serialization::DECL_NAMESPACE);

  llvm::Expected<unsigned> invalid = store->readDeclRecord(99, record);
  REQUIRE_FALSE(static_cast<bool>(invalid));
  llvm::consumeError(invalid.takeError());
}

TEST_CASE("The lookup table maps qualified names", "[serialization]") {
  std::unique_ptr<DeclStore> store =
      openStore(buildStore(kShapes, "shapes_all.h"), "shapes.pch");

  REQUIRE(store->lookup("geo").size() == 1);
  REQUIRE(store->lookup("geo::Point").size() == 1);
  REQUIRE(store->lookup("geo::area").size() == 1);
  REQUIRE(store->lookup("Pt").size() == 1);
  // Unscoped enumerators are found through the enum and its parent.
  REQUIRE(store->lookup("geo::Color::Red").size() == 1);
  REQUIRE(store->lookup("geo::Red") == store->lookup("geo::Color::Red"));

  // Members and parameters are reached through their owner.
  REQUIRE(store->lookup("geo::Point::x").empty());
  REQUIRE(store->lookup("geo::area::w").empty());
  REQUIRE(store->lookup("Point").empty());
  REQUIRE(store->lookup("missing").empty());

  REQUIRE(store->getNumLookupProbes() == 11);
  REQUIRE(store->getNumLookupHits() == 7);
}

TEST_CASE("Overloads share a lookup entry", "[serialization]") {
  std::unique_ptr<DeclStore> store = openStore(
      buildStore({{"math.h", "int twice(int v); long twice(long v);"}}, "math.h"),
      "math.pch");
  REQUIRE(store->lookup("twice").size() == 2);
}

TEST_CASE("Lookup keys longer than 64 KiB survive", "[serialization]") {
  const std::string name(70000, 'n');
  const std::string source = "namespace " + name + " { int inside; }";
  std::unique_ptr<DeclStore> store =
      openStore(buildStore({{"long.h", source}}, "long.h"), "long.pch");

  REQUIRE(store->lookup(name).size() == 1);
  REQUIRE(store->lookup(name + "::inside").size() == 1);
  REQUIRE(store->lookup(name.substr(0, 4464)).empty());
}

TEST_CASE("Input files are validated when a store is attached", "[serialization]") {
  std::string bytes = buildStore(kShapes, "shapes_all.h");

  SECTION("unchanged files") {
    TestSession unit;
    unit.addFiles(kShapes);
    REQUIRE(attachError(unit, bytes, "shapes.pch").empty());
    REQUIRE(unit.loader().getNumStores() == 1);
  }
  SECTION("modified file") {
    TestSession unit;
    unit.addFiles(kShapes);
    unit.addFile("shapes.h", "namespace geo { struct Point { long x; }; }");
    std::string message = attachError(unit, bytes, "shapes.pch");
    REQUIRE(message == "file 'shapes.h' has been modified since the precompiled "
                       "header 'shapes.pch' was built");
    REQUIRE(unit.loader().getNumStores() == 0);
  }
  SECTION("missing file") {
    TestSession unit;
    unit.addFile("shapes_all.h", kShapes.at("shapes_all.h"));
    REQUIRE_FALSE(attachError(unit, bytes, "shapes.pch").empty());
  }
  SECTION("validation disabled") {
    TestSession unit;
    unit.loader().setValidateInputFiles(false);
    REQUIRE(attachError(unit, bytes, "shapes.pch").empty());
  }
}

TEST_CASE("Files that are not stores are rejected", "[serialization]") {
  auto storeOrErr = DeclStore::create(
      llvm::MemoryBuffer::getMemBufferCopy("NOTASTORE1234567", "bogus.pch"));
  REQUIRE_FALSE(static_cast<bool>(storeOrErr));
  REQUIRE(llvm::toString(storeOrErr.takeError()) ==
          "'bogus.pch' is not a declaration store");

  std::string bytes = buildStore(kShapes, "shapes_all.h");
  auto truncated = DeclStore::create(llvm::MemoryBuffer::getMemBufferCopy(
      llvm::StringRef(bytes).take_front(bytes.size() / 2), "short.pch"));
  REQUIRE_FALSE(static_cast<bool>(truncated));
  llvm::consumeError(truncated.takeError());

  auto missing = DeclStore::open("/nonexistent/declcache/missing.pch");
  REQUIRE_FALSE(static_cast<bool>(missing));
  REQUIRE(llvm::toString(missing.takeError()).find("unable to read precompiled file") == 0);
}

TEST_CASE("A store cannot be built while stores are attached", "[serialization]") {
  TestSession unit;
  unit.addFiles(kShapes);
  REQUIRE(attachError(unit, buildStore(kShapes, "shapes_all.h"), "shapes.pch").empty());
  REQUIRE(unit.parse("main.cpp", "geo::Point origin;"));

  serialization::DeclStoreWriter writer(unit.context(), unit.get().files(),
                                        StoreKind::PCH);
  llvm::SmallString<256> buffer;
  llvm::Error err = writer.emit(buffer, "main.cpp");
  REQUIRE(static_cast<bool>(err));
  llvm::consumeError(std::move(err));
}

TEST_CASE("A precompiled header records preprocessor state", "[serialization]") {
  std::unique_ptr<DeclStore> shapes =
      openStore(buildStore(kShapes, "shapes_all.h"), "shapes.pch");
  REQUIRE(shapes->getDefinedMacros().empty());
  REQUIRE(shapes->getOnceOnlyInputFiles() == std::vector<unsigned>{2});
  REQUIRE(shapes->getInputFilePath(2) == "shapes.h");

  const char *guarded = "#ifndef GUARD_H\n#define GUARD_H\n#define TEMP\n#undef TEMP\n"
                        "int g;\n#endif\n";
  std::unique_ptr<DeclStore> store =
      openStore(buildStore({{"guard.h", guarded}}, "guard.h"), "guard.pch");
  REQUIRE(store->getDefinedMacros() == std::vector<std::string>{"GUARD_H"});
  REQUIRE(store->getOnceOnlyInputFiles().empty());

  TestSession unit;
  unit.addFile("guard.h", guarded);
  REQUIRE(attachError(unit, buildStore({{"guard.h", guarded}}, "guard.h"), "guard.pch")
              .empty());
  REQUIRE(unit.get().lexer().definedMacros.count("GUARD_H") == 1);
  REQUIRE(unit.parse("main.cpp", "#include \"guard.h\"\n#ifndef GUARD_H\nint g;\n#endif\n"));
}
