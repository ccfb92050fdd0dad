#pragma once

#include <cstddef>
#include <filesystem>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "mdvault/common.hpp"
#include "mdvault/core/note.hpp"

namespace mdvault::index {

// Name -> note map and reverse link graph for one vault directory.
//
// Built lazily on first access and rebuilt from disk on refresh(); there is
// no incremental update. A lookup that misses triggers exactly one silent
// rebuild before reporting kNoteNotFound, so files added behind our back
// are picked up.
class VaultIndex {
 public:
  // Fails with kVaultNotConfigured if root is missing or not a directory
  static Result<VaultIndex> open(const std::filesystem::path& root);

  const std::filesystem::path& root() const noexcept { return root_; }

  // Notes in scan order (relative path, lexicographic)
  Result<std::vector<core::Note>> listNotes();

  Result<core::Note> getNote(const std::string& name);

  // Lookup against the current snapshot only, no rescan
  Result<bool> hasNote(const std::string& name);

  Result<std::filesystem::path> resolvePath(const std::string& name);

  // Names of notes linking to name, in scan order; empty if none. name
  // need not exist as a note.
  Result<std::vector<std::string>> getIncomingLinks(const std::string& name);

  Result<std::vector<std::string>> getOutgoingLinks(const std::string& name);

  // Every tag used by any note
  Result<std::set<std::string>> allTags();

  // Drop everything and rescan the directory
  Result<void> refresh();

  // Number of full scans performed so far
  size_t rebuildCount() const noexcept { return rebuild_count_; }

 private:
  explicit VaultIndex(std::filesystem::path root);

  Result<void> ensureLoaded();
  Result<void> rebuild();
  const core::Note* find(const std::string& name) const;

  std::filesystem::path root_;
  bool loaded_ = false;
  std::vector<core::Note> notes_;
  std::unordered_map<std::string, size_t> positions_;
  std::unordered_map<std::string, std::vector<std::string>> incoming_;
  size_t rebuild_count_ = 0;
};

}  // namespace mdvault::index
