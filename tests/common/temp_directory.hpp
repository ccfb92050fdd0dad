#pragma once

#include <filesystem>
#include <string>

namespace mdvault::test {

// Scratch directory under the system temp dir, removed on destruction.
// Relative names may contain subdirectories.
class TempDirectory {
 public:
  TempDirectory();
  ~TempDirectory();

  TempDirectory(const TempDirectory&) = delete;
  TempDirectory& operator=(const TempDirectory&) = delete;

  const std::filesystem::path& path() const { return path_; }

  std::filesystem::path createSubdir(const std::string& name);

  // Write bytes as-is; parent directories are created as needed
  std::filesystem::path createFile(const std::string& name, const std::string& content = "");

  // Bytes of path()/name, empty if the file is missing
  std::string readFile(const std::string& name) const;

  bool exists(const std::string& name) const;

  void cleanup();

 private:
  std::filesystem::path path_;
};

}  // namespace mdvault::test
