// This file implements the file manager that loads sources, overlays virtual files, and resolves #include spellings.

#include "file_manager.h"

#include <utility>

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MD5.h"
#include "llvm/Support/Path.h"

namespace {

std::string normalizePath(llvm::StringRef path) {
  llvm::SmallString<256> normalized(path);
  llvm::sys::path::remove_dots(normalized, /*remove_dot_dot=*/true);
  return std::string(normalized.str());
}

} // namespace

FileManager::FileManager() { reset(); }

void FileManager::reset() {
  entries.clear();
  pathToID.clear();
  // Slot 0 stays empty so a zero id can mean "no file".
  entries.push_back(nullptr);
}

void FileManager::addVirtualFile(const std::string &path, std::string contents) {
  virtualFiles[normalizePath(path)] = std::move(contents);
}

unsigned FileManager::addEntry(const std::string &path) {
  auto entry = std::make_unique<FileEntry>();
  entry->id = static_cast<unsigned>(entries.size());
  entry->path = path;
  unsigned id = entry->id;
  entries.push_back(std::move(entry));
  pathToID[path] = id;
  return id;
}

unsigned FileManager::getOrCreateNamedFile(const std::string &path) {
  std::string key = normalizePath(path);
  auto it = pathToID.find(key);
  if (it != pathToID.end())
    return it->second;
  return addEntry(key);
}

unsigned FileManager::loadFile(const std::string &path) {
  std::string key = normalizePath(path);
  unsigned id = 0;
  auto it = pathToID.find(key);
  if (it != pathToID.end()) {
    id = it->second;
    if (entries[id]->isLoaded())
      return id;
  }

  std::unique_ptr<llvm::MemoryBuffer> buffer;
  auto virtualIt = virtualFiles.find(key);
  if (virtualIt != virtualFiles.end()) {
    buffer = llvm::MemoryBuffer::getMemBufferCopy(virtualIt->second, key);
  } else {
    auto bufferOrErr = llvm::MemoryBuffer::getFile(key);
    if (!bufferOrErr)
      return 0;
    buffer = std::move(*bufferOrErr);
  }

  if (!id)
    id = addEntry(key);
  FileEntry &entry = *entries[id];
  entry.size = buffer->getBufferSize();
  entry.contentHash = hashContents(buffer->getBuffer());
  entry.buffer = std::move(buffer);
  return id;
}

unsigned FileManager::resolveInclude(llvm::StringRef spelling, bool angled,
                                     unsigned includerID) {
  if (llvm::sys::path::is_absolute(spelling))
    return loadFile(spelling.str());

  std::vector<std::string> candidates;
  if (!angled) {
    if (const FileEntry *includer = getFile(includerID)) {
      llvm::SmallString<256> local(llvm::sys::path::parent_path(includer->path));
      llvm::sys::path::append(local, spelling);
      candidates.push_back(std::string(local.str()));
    } else {
      candidates.push_back(spelling.str());
    }
  }
  for (const auto &dir : searchPaths) {
    llvm::SmallString<256> candidate(dir);
    llvm::sys::path::append(candidate, spelling);
    candidates.push_back(std::string(candidate.str()));
  }

  for (const auto &candidate : candidates) {
    std::string key = normalizePath(candidate);
    if (!virtualFiles.count(key) && !llvm::sys::fs::exists(key))
      continue;
    if (unsigned id = loadFile(key))
      return id;
  }
  return 0;
}

bool FileManager::probeFile(const std::string &path, uint64_t &size,
                            uint64_t &contentHash) const {
  std::string key = normalizePath(path);
  auto virtualIt = virtualFiles.find(key);
  if (virtualIt != virtualFiles.end()) {
    size = virtualIt->second.size();
    contentHash = hashContents(virtualIt->second);
    return true;
  }

  auto bufferOrErr = llvm::MemoryBuffer::getFile(key);
  if (!bufferOrErr)
    return false;
  size = (*bufferOrErr)->getBufferSize();
  contentHash = hashContents((*bufferOrErr)->getBuffer());
  return true;
}

FileEntry *FileManager::getFile(unsigned id) {
  if (id == 0 || id >= entries.size())
    return nullptr;
  return entries[id].get();
}

const FileEntry *FileManager::getFile(unsigned id) const {
  if (id == 0 || id >= entries.size())
    return nullptr;
  return entries[id].get();
}

std::string FileManager::getPath(unsigned id) const {
  if (const FileEntry *entry = getFile(id))
    return entry->path;
  return "<unknown>";
}

std::vector<unsigned> FileManager::enteredFiles() const {
  std::vector<unsigned> result;
  for (const auto &entry : entries) {
    if (entry && entry->entered)
      result.push_back(entry->id);
  }
  return result;
}

uint64_t FileManager::hashContents(llvm::StringRef contents) {
  return llvm::MD5Hash(contents);
}
