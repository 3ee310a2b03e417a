#ifndef DECLCACHE_FILE_MANAGER_H
#define DECLCACHE_FILE_MANAGER_H

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/MemoryBuffer.h"

/// FileEntry describes one file the front end has seen, either read from disk
/// (or a virtual overlay) or only named by a loaded declaration store.
struct FileEntry {
  unsigned id = 0;
  std::string path;
  std::unique_ptr<llvm::MemoryBuffer> buffer;
  uint64_t size = 0;
  uint64_t contentHash = 0;
  bool entered = false;      // lexed as part of the current unit
  bool pragmaOnce = false;

  bool isLoaded() const { return buffer != nullptr; }
  llvm::StringRef contents() const {
    return buffer ? buffer->getBuffer() : llvm::StringRef();
  }
};

/// FileManager owns source buffers for a compilation session. File id 0 is
/// reserved for "no file".
class FileManager {
public:
  FileManager();

  void reset();

  /// Register in-memory contents for a path; later lookups of that path never
  /// touch the file system.
  void addVirtualFile(const std::string &path, std::string contents);

  /// Load a file (virtual overlay first, then disk). Returns 0 on failure.
  unsigned loadFile(const std::string &path);

  /// Resolve an #include spelling relative to the including file and the
  /// search path. Returns 0 when nothing matches.
  unsigned resolveInclude(llvm::StringRef spelling, bool angled,
                          unsigned includerID);

  /// Register a path known only by name (e.g. from a stored location).
  unsigned getOrCreateNamedFile(const std::string &path);

  /// Stat the file at path and hash its contents without registering it.
  bool probeFile(const std::string &path, uint64_t &size,
                 uint64_t &contentHash) const;

  FileEntry *getFile(unsigned id);
  const FileEntry *getFile(unsigned id) const;
  std::string getPath(unsigned id) const;

  std::vector<std::string> &includePaths() { return searchPaths; }

  /// Files lexed for the current unit, in the order they were entered.
  std::vector<unsigned> enteredFiles() const;

  static uint64_t hashContents(llvm::StringRef contents);

private:
  std::vector<std::unique_ptr<FileEntry>> entries;
  std::map<std::string, unsigned> pathToID;
  std::map<std::string, std::string> virtualFiles;
  std::vector<std::string> searchPaths;

  unsigned addEntry(const std::string &path);
};

#endif // DECLCACHE_FILE_MANAGER_H
