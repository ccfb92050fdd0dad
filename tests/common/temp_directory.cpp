#include "temp_directory.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

#include "test_helpers.hpp"

namespace mdvault::test {

TempDirectory::TempDirectory() {
  auto base = std::filesystem::temp_directory_path() / "mdvault_test";
  do {
    path_ = base / ("vault_" + randomString(10));
  } while (std::filesystem::exists(path_));
  std::filesystem::create_directories(path_);
}

TempDirectory::~TempDirectory() {
  cleanup();
}

void TempDirectory::cleanup() {
  if (path_.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  path_.clear();
}

std::filesystem::path TempDirectory::createSubdir(const std::string& name) {
  auto subdir = path_ / name;
  std::filesystem::create_directories(subdir);
  return subdir;
}

std::filesystem::path TempDirectory::createFile(const std::string& name, const std::string& content) {
  auto file_path = path_ / name;
  std::filesystem::create_directories(file_path.parent_path());
  std::ofstream(file_path, std::ios::binary) << content;
  return file_path;
}

std::string TempDirectory::readFile(const std::string& name) const {
  std::ifstream file(path_ / name, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

bool TempDirectory::exists(const std::string& name) const {
  return std::filesystem::exists(path_ / name);
}

}  // namespace mdvault::test
