#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "mdvault/common.hpp"

namespace mdvault::util {

// Atomic file replacement: write to a sibling temp file, fsync, rename
class AtomicFileWriter {
 public:
  explicit AtomicFileWriter(const std::filesystem::path& target_path);
  ~AtomicFileWriter();

  // Non-copyable, movable
  AtomicFileWriter(const AtomicFileWriter&) = delete;
  AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;
  AtomicFileWriter(AtomicFileWriter&&) = default;
  AtomicFileWriter& operator=(AtomicFileWriter&&) = default;

  // Write content to temporary file
  Result<void> write(const std::string& content);

  // Commit the changes (rename temp to target)
  Result<void> commit();

  // Cancel the operation (removes temp file)
  void cancel();

 private:
  std::filesystem::path target_path_;
  std::filesystem::path temp_path_;
  bool committed_;
  bool cancelled_;

  void cleanup();
};

// Filesystem utilities
class FileSystem {
 public:
  // Atomic write with fsync and rename
  static Result<void> writeFileAtomic(const std::filesystem::path& path,
                                      const std::string& content);

  // Read file bytes unchanged
  static Result<std::string> readFile(const std::filesystem::path& path);

  // Read UTF-8 text: leading byte-order marks stripped, CRLF folded to LF
  static Result<std::string> readText(const std::filesystem::path& path);

  // Normalize text the same way readText does
  static std::string normalizeText(std::string content);

  // Create directory (and parents)
  static Result<void> createDirectories(const std::filesystem::path& path);

  // Move file (same filesystem); replaces an existing target
  static Result<void> moveFile(const std::filesystem::path& from,
                               const std::filesystem::path& to);

  // Recursively list *.md files below root, skipping any path with a
  // segment that starts with '.'. Sorted by relative path.
  static Result<std::vector<std::filesystem::path>> listMarkdownFiles(
      const std::filesystem::path& root);

  // True if any segment of the relative path starts with '.'
  static bool isHiddenPath(const std::filesystem::path& relative);
};

}  // namespace mdvault::util
