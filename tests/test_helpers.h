#ifndef DECLCACHE_TESTS_TEST_HELPERS_H
#define DECLCACHE_TESTS_TEST_HELPERS_H

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "analysis/semantics.h"
#include "ast/ast_context.h"
#include "ast/decl.h"
#include "compiler_session.h"
#include "frontend_action.h"
#include "serialization/decl_store_reader.h"
#include "serialization/decl_store_writer.h"
#include "serialization/deserialization_listener.h"
#include "serialization/lazy_loader.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Casting.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/MemoryBuffer.h"

#include "catch2/catch.hpp"

/// A compiler session that is the current one for the lifetime of the
/// fixture. Sources are virtual files, so nothing touches the disk.
class TestSession {
  CompilerSession session;
  ScopedCompilerSession active;

public:
  TestSession() : active(session) { session.resetAll(); }

  CompilerSession &get() { return session; }
  ASTContext &context() { return session.astContext(); }
  serialization::LazyDeclLoader &loader() { return session.loader(); }

  void addFile(const std::string &path, const std::string &contents) {
    session.files().addVirtualFile(path, contents);
  }
  void addFiles(const std::map<std::string, std::string> &files) {
    for (const auto &entry : files)
      addFile(entry.first, entry.second);
  }

  /// Parse path as the main file, with contents registered under it.
  bool parse(const std::string &path, const std::string &contents) {
    addFile(path, contents);
    session.options().inputFile = path;
    return parseMainFile(session);
  }

  unsigned errorCount() { return session.parser().errorCount; }
  bool hadError() { return session.parser().hadError; }

  /// Attach a store built by buildStore() under the given file name.
  bool attach(const std::string &bytes, const std::string &name) {
    auto buffer = llvm::MemoryBuffer::getMemBufferCopy(bytes, name);
    auto storeOrErr = serialization::DeclStore::create(std::move(buffer));
    if (!storeOrErr) {
      UNSCOPED_INFO(llvm::toString(storeOrErr.takeError()));
      return false;
    }
    if (llvm::Error err = loader().attachStore(std::move(*storeOrErr))) {
      UNSCOPED_INFO(llvm::toString(std::move(err)));
      return false;
    }
    return true;
  }

  /// Declarations already in memory under a name in the translation unit.
  DeclContext::lookup_result lookupLoaded(llvm::StringRef name) {
    return context().getTranslationUnitDecl()->noloadLookup(name);
  }
};

/// Parse mainPath (with every file in files available) in a fresh session
/// and return the serialized declaration store.
inline std::string buildStore(const std::map<std::string, std::string> &files,
                              const std::string &mainPath,
                              serialization::StoreKind kind =
                                  serialization::StoreKind::PCH,
                              const std::string &moduleName = std::string()) {
  TestSession unit;
  unit.addFiles(files);
  unit.get().options().inputFile = mainPath;
  REQUIRE(parseMainFile(unit.get()));

  serialization::DeclStoreWriter writer(unit.context(), unit.get().files(), kind,
                                        moduleName);
  llvm::SmallString<4096> buffer;
  llvm::Error err = writer.emit(buffer, mainPath);
  if (err) {
    FAIL(llvm::toString(std::move(err)));
  }
  return std::string(buffer.str());
}

/// Collects "<Kind> - <QualifiedName>" for every declaration the loader
/// creates.
class RecordingListener : public serialization::DeserializationListener {
public:
  std::vector<std::string> reads;

  void declRead(serialization::DeclID, const Decl *D) override {
    std::string line = D->getDeclKindName();
    line += " - ";
    if (const auto *ND = llvm::dyn_cast<NamedDecl>(D))
      line += ND->getQualifiedNameAsString();
    reads.push_back(line);
  }

  bool sawRead(const std::string &line) const {
    for (const std::string &read : reads) {
      if (read == line)
        return true;
    }
    return false;
  }
};

#endif // DECLCACHE_TESTS_TEST_HELPERS_H
