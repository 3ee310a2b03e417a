#include <algorithm>
#include <string>

#include "test_helpers.h"

using serialization::StoreKind;

namespace {

const char *kModuleA = R"(
struct Shared {
  int v;
  int get() const { return v; }
};
inline int twice(int x) { return x * 2; }
namespace util { int onlyA(int a); }
struct Fwd;
)";

const char *kModuleB = R"(
struct Shared {
  int v;
  int get() const { return v; }
};
inline int twice(int x) { return x * 2; }
namespace util { int onlyB(long b); }
struct Fwd { int f; };
)";

const char *kConflictingRecord = "struct Shared { long v; };";
const char *kConflictingFunction = "inline int twice(int x) { return x + x; }";

std::string moduleStore(const char *name, const char *header, const char *source) {
  return buildStore({{header, source}}, header, StoreKind::Module, name);
}

struct MergeUnit {
  TestSession unit;
  RecordingListener listener;

  MergeUnit() {
    unit.addFile("a.h", kModuleA);
    unit.addFile("b.h", kModuleB);
    unit.addFile("c.h", kConflictingRecord);
    unit.addFile("d.h", kConflictingFunction);
    unit.loader().addDeserializationListener(&listener);
  }

  unsigned countReads(const std::string &line) const {
    return static_cast<unsigned>(
        std::count(listener.reads.begin(), listener.reads.end(), line));
  }
};

} // namespace

TEST_CASE("Identical definitions from two modules merge", "[modules]") {
  MergeUnit merge;
  REQUIRE(merge.unit.attach(moduleStore("A", "a.h", kModuleA), "a.pcm"));
  REQUIRE(merge.unit.attach(moduleStore("B", "b.h", kModuleB), "b.pcm"));

  REQUIRE(merge.unit.parse("main.cpp", R"(
    int use() {
      Shared s;
      return s.get() + twice(s.v) + util::onlyA(1) + util::onlyB(2);
    }
  )"));
  REQUIRE(merge.unit.errorCount() == 0);

  REQUIRE(merge.unit.lookupLoaded("Shared").size() == 1);
  REQUIRE(merge.unit.lookupLoaded("twice").size() == 1);
  REQUIRE(merge.countReads("CXXRecord - Shared") == 1);
  REQUIRE(merge.countReads("Function - twice") == 1);
  REQUIRE(merge.countReads("Namespace - util") == 1);

  auto *Shared = llvm::cast<RecordDecl>(merge.unit.lookupLoaded("Shared").front());
  REQUIRE(Shared->getOwningStoreIndex() == 0);
  REQUIRE(Shared->fields().size() == 1);

  auto *Util = llvm::cast<NamespaceDecl>(merge.unit.lookupLoaded("util").front());
  REQUIRE(Util->noloadLookup("onlyA").size() == 1);
  REQUIRE(Util->noloadLookup("onlyB").size() == 1);

  // The second module's copies map onto the first one's declarations.
  REQUIRE(merge.unit.loader().getNumDeclsLoaded(1) > 0);
}

TEST_CASE("A forward declaration picks up another module's definition", "[modules]") {
  MergeUnit merge;
  REQUIRE(merge.unit.attach(moduleStore("A", "a.h", kModuleA), "a.pcm"));
  REQUIRE(merge.unit.attach(moduleStore("B", "b.h", kModuleB), "b.pcm"));

  REQUIRE(merge.unit.parse("main.cpp", "Fwd f; int value = f.f;"));

  auto *Fwd = llvm::cast<RecordDecl>(merge.unit.lookupLoaded("Fwd").front());
  REQUIRE(merge.unit.lookupLoaded("Fwd").size() == 1);
  REQUIRE(Fwd->isCompleteDefinition());
  REQUIRE(Fwd->getOwningStoreIndex() == 1);
  REQUIRE(merge.listener.sawRead("Field - Fwd::f"));
}

TEST_CASE("Different definitions of one record are diagnosed", "[modules]") {
  MergeUnit merge;
  REQUIRE(merge.unit.attach(moduleStore("A", "a.h", kModuleA), "a.pcm"));
  REQUIRE(merge.unit.attach(moduleStore("C", "c.h", kConflictingRecord), "c.pcm"));

  REQUIRE_FALSE(merge.unit.parse("main.cpp", "Shared *p;"));
  REQUIRE(merge.unit.errorCount() >= 1);

  // The first definition is kept.
  REQUIRE(merge.unit.lookupLoaded("Shared").size() == 1);
  auto *Shared = llvm::cast<RecordDecl>(merge.unit.lookupLoaded("Shared").front());
  REQUIRE(Shared->getOwningStoreIndex() == 0);
}

TEST_CASE("Different bodies of one inline function are diagnosed", "[modules]") {
  MergeUnit merge;
  REQUIRE(merge.unit.attach(moduleStore("A", "a.h", kModuleA), "a.pcm"));
  REQUIRE(merge.unit.attach(moduleStore("D", "d.h", kConflictingFunction), "d.pcm"));

  REQUIRE_FALSE(merge.unit.parse("main.cpp", "int n = twice(1);"));
  REQUIRE(merge.unit.lookupLoaded("twice").size() == 1);
}

TEST_CASE("Eager loading merges across modules", "[modules][lazy]") {
  MergeUnit merge;
  REQUIRE(merge.unit.attach(moduleStore("A", "a.h", kModuleA), "a.pcm"));
  REQUIRE(merge.unit.attach(moduleStore("B", "b.h", kModuleB), "b.pcm"));

  serialization::LazyDeclLoader &loader = merge.unit.loader();
  loader.loadAllDeclarations();
  REQUIRE_FALSE(merge.unit.hadError());

  REQUIRE(loader.getNumDeclsLoaded(0) == loader.getStore(0).getNumDecls());
  REQUIRE(loader.getNumDeclsLoaded(1) == loader.getStore(1).getNumDecls());
  REQUIRE(merge.countReads("CXXRecord - Shared") == 1);
  REQUIRE(merge.countReads("Field - Shared::v") == 1);
  REQUIRE(merge.countReads("CXXMethod - Shared::get") == 1);

  auto *Fwd = llvm::cast<RecordDecl>(merge.unit.lookupLoaded("Fwd").front());
  REQUIRE(Fwd->isCompleteDefinition());
}

TEST_CASE("Only one precompiled header may be attached", "[modules]") {
  TestSession unit;
  unit.addFile("a.h", kModuleA);
  unit.addFile("b.h", kModuleB);
  REQUIRE(unit.attach(buildStore({{"a.h", kModuleA}}, "a.h"), "a.pch"));

  auto second = serialization::DeclStore::create(llvm::MemoryBuffer::getMemBufferCopy(
      buildStore({{"b.h", kModuleB}}, "b.h"), "b.pch"));
  REQUIRE(static_cast<bool>(second));
  llvm::Error err = unit.loader().attachStore(std::move(*second));
  REQUIRE(static_cast<bool>(err));
  REQUIRE(llvm::toString(std::move(err)) == "only one precompiled header may be included");

  // Modules may still join the header.
  REQUIRE(unit.attach(moduleStore("B", "b.h", kModuleB), "b.pcm"));
  REQUIRE(unit.loader().getNumStores() == 2);
}

TEST_CASE("A module name may only be loaded once", "[modules]") {
  TestSession unit;
  unit.addFile("a.h", kModuleA);
  REQUIRE(unit.attach(moduleStore("A", "a.h", kModuleA), "a.pcm"));

  auto again = serialization::DeclStore::create(llvm::MemoryBuffer::getMemBufferCopy(
      moduleStore("A", "a.h", kModuleA), "copy.pcm"));
  REQUIRE(static_cast<bool>(again));
  llvm::Error err = unit.loader().attachStore(std::move(*again));
  REQUIRE(static_cast<bool>(err));
  REQUIRE(llvm::toString(std::move(err)) == "module 'A' is already loaded from 'a.pcm'");
}

TEST_CASE("Source definitions cannot replace module definitions", "[modules]") {
  MergeUnit merge;
  REQUIRE(merge.unit.attach(moduleStore("A", "a.h", kModuleA), "a.pcm"));
  REQUIRE_FALSE(merge.unit.parse("main.cpp", "struct Shared { int v; };"));
}

TEST_CASE("A source definition completes a module's forward declaration", "[modules]") {
  MergeUnit merge;
  REQUIRE(merge.unit.attach(moduleStore("A", "a.h", kModuleA), "a.pcm"));
  REQUIRE(merge.unit.parse("main.cpp", "struct Fwd { char c; }; int n = sizeof(Fwd);"));

  REQUIRE(merge.unit.lookupLoaded("Fwd").size() == 1);
  auto *Fwd = llvm::cast<RecordDecl>(merge.unit.lookupLoaded("Fwd").front());
  REQUIRE(Fwd->isCompleteDefinition());
  REQUIRE(Fwd->fields().size() == 1);
}
