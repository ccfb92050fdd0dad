#include "mdvault/util/logging.hpp"

#include <memory>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "mdvault/util/xdg.hpp"

namespace mdvault::util {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";

}  // namespace

Result<int> Logging::parseLevel(const std::string& name) {
  auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to "off"
  if (level == spdlog::level::off && name != "off") {
    return makeErrorResult<int>(ErrorCode::kConfigError, "Unknown log level: " + name);
  }
  return static_cast<int>(level);
}

void Logging::initialize(const LogSettings& settings) {
  auto level = spdlog::level::info;
  if (auto parsed = parseLevel(settings.level); parsed.has_value()) {
    level = static_cast<spdlog::level::level_enum>(*parsed);
  }

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  if (settings.console_verbose) {
    console_sink->set_level(spdlog::level::debug);
  } else if (settings.console_quiet) {
    console_sink->set_level(spdlog::level::err);
  } else {
    console_sink->set_level(spdlog::level::warn);
  }

  std::vector<spdlog::sink_ptr> sinks = {console_sink};
  std::string file_error;

  auto log_file = settings.file.empty() ? Xdg::logFile() : settings.file;
  try {
    std::filesystem::create_directories(log_file.parent_path());
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file.string(), settings.max_size_mb * 1024 * 1024, settings.max_files);
    sinks.push_back(file_sink);
  } catch (const std::exception& e) {
    file_error = e.what();
  }

  auto logger = std::make_shared<spdlog::logger>("mdvault", sinks.begin(), sinks.end());
  logger->set_pattern(kPattern);
  logger->set_level(settings.console_verbose ? spdlog::level::debug : level);
  spdlog::set_default_logger(logger);

  if (!file_error.empty()) {
    spdlog::warn("Failed to setup file logging at {}: {}", log_file.string(), file_error);
  }
}

}  // namespace mdvault::util
