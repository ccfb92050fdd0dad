#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "mdvault/common.hpp"

namespace mdvault::util {

struct LogSettings {
  std::string level = "info";        // trace, debug, info, warn, error, off
  std::filesystem::path file;        // empty = Xdg::logFile()
  size_t max_size_mb = 5;
  size_t max_files = 3;
  bool console_verbose = false;      // console sink at debug instead of warn
  bool console_quiet = false;        // console sink at error only
};

// Process-wide spdlog setup: rotating file sink plus stderr sink
class Logging {
 public:
  // Installs the "mdvault" logger as spdlog's default. Falls back to
  // console-only output if the log file cannot be opened.
  static void initialize(const LogSettings& settings);

  // Parse a level name; unknown names are an error
  static Result<int> parseLevel(const std::string& name);
};

}  // namespace mdvault::util
