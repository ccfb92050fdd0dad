#include "mdvault/index/vault_index.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "mdvault/util/filesystem.hpp"

namespace mdvault::index {

VaultIndex::VaultIndex(std::filesystem::path root) : root_(std::move(root)) {}

Result<VaultIndex> VaultIndex::open(const std::filesystem::path& root) {
  std::error_code ec;
  if (root.empty() || !std::filesystem::is_directory(root, ec)) {
    return std::unexpected(makeError(ErrorCode::kVaultNotConfigured,
                                     "Vault path does not exist or is not a directory: " +
                                         root.string()));
  }
  return VaultIndex(root);
}

Result<void> VaultIndex::ensureLoaded() {
  if (loaded_) {
    return {};
  }
  return rebuild();
}

Result<void> VaultIndex::rebuild() {
  notes_.clear();
  positions_.clear();
  incoming_.clear();
  loaded_ = false;

  auto files = util::FileSystem::listMarkdownFiles(root_);
  if (!files.has_value()) {
    return std::unexpected(files.error());
  }

  for (const auto& path : *files) {
    auto raw = util::FileSystem::readFile(path);
    if (!raw.has_value()) {
      return std::unexpected(raw.error());
    }

    auto note = core::Note::parse(path, *raw);
    auto existing = positions_.find(note.name());
    if (existing != positions_.end()) {
      // Same stem in two folders: the later file wins, the slot stays
      spdlog::warn("Duplicate note name '{}': {} shadows {}", note.name(), path.string(),
                   notes_[existing->second].path().string());
      notes_[existing->second] = std::move(note);
    } else {
      positions_.emplace(note.name(), notes_.size());
      notes_.push_back(std::move(note));
    }
  }

  for (const auto& note : notes_) {
    for (const auto& target : note.outgoingLinks()) {
      auto& sources = incoming_[target];
      if (std::find(sources.begin(), sources.end(), note.name()) == sources.end()) {
        sources.push_back(note.name());
      }
    }
  }

  loaded_ = true;
  ++rebuild_count_;
  spdlog::debug("Indexed {} notes under {}", notes_.size(), root_.string());
  return {};
}

const core::Note* VaultIndex::find(const std::string& name) const {
  auto it = positions_.find(name);
  if (it == positions_.end()) {
    return nullptr;
  }
  return &notes_[it->second];
}

Result<std::vector<core::Note>> VaultIndex::listNotes() {
  auto loaded = ensureLoaded();
  if (!loaded.has_value()) {
    return std::unexpected(loaded.error());
  }
  return notes_;
}

Result<core::Note> VaultIndex::getNote(const std::string& name) {
  auto loaded = ensureLoaded();
  if (!loaded.has_value()) {
    return std::unexpected(loaded.error());
  }

  if (const auto* note = find(name)) {
    return *note;
  }

  spdlog::debug("Note '{}' not in index, rescanning", name);
  auto rebuilt = rebuild();
  if (!rebuilt.has_value()) {
    return std::unexpected(rebuilt.error());
  }

  if (const auto* note = find(name)) {
    return *note;
  }
  return std::unexpected(makeError(ErrorCode::kNoteNotFound, "Note '" + name + "' not found"));
}

Result<bool> VaultIndex::hasNote(const std::string& name) {
  auto loaded = ensureLoaded();
  if (!loaded.has_value()) {
    return std::unexpected(loaded.error());
  }
  return find(name) != nullptr;
}

Result<std::filesystem::path> VaultIndex::resolvePath(const std::string& name) {
  auto note = getNote(name);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }
  return note->path();
}

Result<std::vector<std::string>> VaultIndex::getIncomingLinks(const std::string& name) {
  auto loaded = ensureLoaded();
  if (!loaded.has_value()) {
    return std::unexpected(loaded.error());
  }

  auto it = incoming_.find(name);
  if (it == incoming_.end()) {
    return std::vector<std::string>{};
  }
  return it->second;
}

Result<std::vector<std::string>> VaultIndex::getOutgoingLinks(const std::string& name) {
  auto note = getNote(name);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }
  return note->outgoingLinks();
}

Result<std::set<std::string>> VaultIndex::allTags() {
  auto loaded = ensureLoaded();
  if (!loaded.has_value()) {
    return std::unexpected(loaded.error());
  }

  std::set<std::string> tags;
  for (const auto& note : notes_) {
    for (const auto& tag : note.tags()) {
      if (!tag.empty()) {
        tags.insert(tag);
      }
    }
  }
  return tags;
}

Result<void> VaultIndex::refresh() {
  return rebuild();
}

}  // namespace mdvault::index
