#include "mdvault/util/filesystem.hpp"

#include <algorithm>
#include <fstream>
#include <random>

#include <fcntl.h>
#include <unistd.h>

namespace mdvault::util {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

}  // namespace

// AtomicFileWriter implementation
AtomicFileWriter::AtomicFileWriter(const std::filesystem::path& target_path)
    : target_path_(target_path), committed_(false), cancelled_(false) {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(100000, 999999);

  // The suffix keeps the temp file out of *.md scans
  temp_path_ = target_path_;
  temp_path_ += ".tmp." + std::to_string(dis(gen));
}

AtomicFileWriter::~AtomicFileWriter() {
  if (!committed_ && !cancelled_) {
    cleanup();
  }
}

Result<void> AtomicFileWriter::write(const std::string& content) {
  if (committed_ || cancelled_) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Writer already used"));
  }

  std::ofstream file(temp_path_, std::ios::binary);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot create temporary file: " + temp_path_.string()));
  }

  file.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!file) {
    cleanup();
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Failed to write to temporary file"));
  }

  file.close();
  if (!file) {
    cleanup();
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Failed to close temporary file"));
  }

  return {};
}

Result<void> AtomicFileWriter::commit() {
  if (committed_) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Already committed"));
  }
  if (cancelled_) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Operation cancelled"));
  }

  auto parent = target_path_.parent_path();
  if (!parent.empty() && !std::filesystem::exists(parent)) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      cleanup();
      return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                       "Cannot create parent directory: " + ec.message()));
    }
  }

  int fd = open(temp_path_.c_str(), O_RDONLY);
  if (fd >= 0) {
    fsync(fd);
    close(fd);
  }

  std::error_code ec;
  std::filesystem::rename(temp_path_, target_path_, ec);
  if (ec) {
    cleanup();
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Atomic rename failed: " + ec.message()));
  }

  // Sync parent directory so the rename is durable
  if (!parent.empty()) {
    int dir_fd = open(parent.c_str(), O_RDONLY);
    if (dir_fd >= 0) {
      fsync(dir_fd);
      close(dir_fd);
    }
  }

  committed_ = true;
  return {};
}

void AtomicFileWriter::cancel() {
  if (!committed_) {
    cancelled_ = true;
    cleanup();
  }
}

void AtomicFileWriter::cleanup() {
  std::error_code ec;
  std::filesystem::remove(temp_path_, ec);
}

// FileSystem implementation
Result<void> FileSystem::writeFileAtomic(const std::filesystem::path& path,
                                         const std::string& content) {
  AtomicFileWriter writer(path);

  auto write_result = writer.write(content);
  if (!write_result.has_value()) {
    return write_result;
  }

  return writer.commit();
}

Result<std::string> FileSystem::readFile(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                     "Cannot open file: " + path.string()));
  }

  file.seekg(0, std::ios::end);
  auto size = file.tellg();
  if (size < 0) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Cannot get file size: " + path.string()));
  }

  file.seekg(0, std::ios::beg);

  std::string content(static_cast<size_t>(size), '\0');
  file.read(content.data(), size);

  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Read failed: " + path.string()));
  }

  return content;
}

Result<std::string> FileSystem::readText(const std::filesystem::path& path) {
  auto content = readFile(path);
  if (!content.has_value()) {
    return content;
  }
  return normalizeText(std::move(*content));
}

std::string FileSystem::normalizeText(std::string content) {
  size_t bom_end = 0;
  while (content.compare(bom_end, kUtf8Bom.size(), kUtf8Bom) == 0) {
    bom_end += kUtf8Bom.size();
  }
  if (bom_end > 0) {
    content.erase(0, bom_end);
  }

  std::string normalized;
  normalized.reserve(content.size());
  for (size_t i = 0; i < content.size(); ++i) {
    if (content[i] == '\r' && i + 1 < content.size() && content[i + 1] == '\n') {
      continue;
    }
    normalized.push_back(content[i]);
  }
  return normalized;
}

Result<void> FileSystem::createDirectories(const std::filesystem::path& path) {
  std::error_code ec;

  if (!std::filesystem::create_directories(path, ec) && ec) {
    return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                     "Cannot create directories: " + ec.message()));
  }

  return {};
}

Result<void> FileSystem::moveFile(const std::filesystem::path& from,
                                  const std::filesystem::path& to) {
  std::error_code ec;
  std::filesystem::rename(from, to, ec);

  if (ec) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Move failed: " + ec.message()));
  }

  return {};
}

bool FileSystem::isHiddenPath(const std::filesystem::path& relative) {
  for (const auto& part : relative) {
    auto segment = part.string();
    if (!segment.empty() && segment.front() == '.' && segment != "." && segment != "..") {
      return true;
    }
  }
  return false;
}

Result<std::vector<std::filesystem::path>> FileSystem::listMarkdownFiles(
    const std::filesystem::path& root) {
  std::vector<std::filesystem::path> results;
  std::error_code ec;

  std::filesystem::recursive_directory_iterator it(root, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Cannot list directory: " + ec.message()));
  }

  for (auto end = std::filesystem::recursive_directory_iterator(); it != end; it.increment(ec)) {
    if (ec) {
      return std::unexpected(makeError(ErrorCode::kFileReadError,
                                       "Cannot list directory: " + ec.message()));
    }

    auto relative = it->path().lexically_relative(root);
    if (isHiddenPath(relative)) {
      if (it->is_directory(ec)) {
        it.disable_recursion_pending();
      }
      continue;
    }

    if (it->is_regular_file(ec) && it->path().extension() == ".md") {
      results.push_back(it->path());
    }
  }

  std::sort(results.begin(), results.end(),
            [&root](const auto& a, const auto& b) {
              return a.lexically_relative(root) < b.lexically_relative(root);
            });

  return results;
}

}  // namespace mdvault::util
