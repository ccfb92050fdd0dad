#include "mdvault/config/config.hpp"

#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <sstream>

#include <toml++/toml.hpp>

#include "mdvault/util/filesystem.hpp"
#include "mdvault/util/logging.hpp"
#include "mdvault/util/xdg.hpp"

namespace mdvault::config {

namespace {

Result<size_t> parseSize(const std::string& key, const std::string& value) {
  try {
    size_t consumed = 0;
    auto parsed = std::stoul(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument(value);
    }
    return static_cast<size_t>(parsed);
  } catch (const std::exception&) {
    return makeErrorResult<size_t>(ErrorCode::kConfigError,
                                   "Invalid number for " + key + ": " + value);
  }
}

Result<bool> parseBool(const std::string& key, const std::string& value) {
  if (value == "true") return true;
  if (value == "false") return false;
  return makeErrorResult<bool>(ErrorCode::kConfigError,
                               "Invalid boolean for " + key + ": " + value);
}

}  // namespace

Config::Config() = default;

Result<void> Config::load(const std::filesystem::path& config_path) {
  config_path_ = config_path;

  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    if (auto value = config_data["vault_path"].value<std::string>()) {
      vault_path = *value;
    }

    if (auto logging_table = config_data["logging"].as_table()) {
      if (auto value = (*logging_table)["level"].value<std::string>()) {
        logging.level = *value;
      }
      if (auto value = (*logging_table)["file"].value<std::string>()) {
        logging.file = *value;
      }
      if (auto value = (*logging_table)["max_size_mb"].value<int64_t>()) {
        logging.max_size_mb = static_cast<size_t>(*value);
      }
      if (auto value = (*logging_table)["max_files"].value<int64_t>()) {
        logging.max_files = static_cast<size_t>(*value);
      }
    }

    if (auto tags_table = config_data["tags"].as_table()) {
      if (auto value = (*tags_table)["enforce_existing"].value<bool>()) {
        tags.enforce_existing = *value;
      }
    }

    return validate();

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what())));
  }
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;

  if (save_path.empty()) {
    save_path = defaultConfigPath();
  }

  try {
    toml::table config_data;

    if (!vault_path.empty()) config_data.insert_or_assign("vault_path", vault_path);

    auto logging_table = toml::table{};
    logging_table.insert_or_assign("level", logging.level);
    if (!logging.file.empty()) logging_table.insert_or_assign("file", logging.file);
    logging_table.insert_or_assign("max_size_mb", static_cast<int64_t>(logging.max_size_mb));
    logging_table.insert_or_assign("max_files", static_cast<int64_t>(logging.max_files));
    config_data.insert_or_assign("logging", logging_table);

    auto tags_table = toml::table{};
    tags_table.insert_or_assign("enforce_existing", tags.enforce_existing);
    config_data.insert_or_assign("tags", tags_table);

    std::stringstream ss;
    ss << config_data;
    auto write_result = util::FileSystem::writeFileAtomic(save_path, ss.str());
    if (!write_result.has_value()) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       "Cannot write config file: " + write_result.error().message()));
    }

    return {};

  } catch (const std::exception& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config save error: " + std::string(e.what())));
  }
}

Result<std::string> Config::get(const std::string& key) const {
  auto path = splitPath(key);
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  if (path.size() == 1 && path[0] == "vault_path") return vault_path;
  if (path.size() == 2 && path[0] == "logging") {
    if (path[1] == "level") return logging.level;
    if (path[1] == "file") return logging.file;
    if (path[1] == "max_size_mb") return std::to_string(logging.max_size_mb);
    if (path[1] == "max_files") return std::to_string(logging.max_files);
  }
  if (path.size() == 2 && path[0] == "tags" && path[1] == "enforce_existing") {
    return std::string(tags.enforce_existing ? "true" : "false");
  }

  return std::unexpected(makeError(ErrorCode::kConfigError, "Unknown config key: " + key));
}

Result<void> Config::set(const std::string& key, const std::string& value) {
  auto path = splitPath(key);
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  if (path.size() == 1 && path[0] == "vault_path") {
    vault_path = value;
    return {};
  }
  if (path.size() == 2 && path[0] == "logging") {
    if (path[1] == "level") {
      auto level = util::Logging::parseLevel(value);
      if (!level.has_value()) {
        return std::unexpected(level.error());
      }
      logging.level = value;
      return {};
    }
    if (path[1] == "file") {
      logging.file = value;
      return {};
    }
    if (path[1] == "max_size_mb" || path[1] == "max_files") {
      auto size = parseSize(key, value);
      if (!size.has_value()) {
        return std::unexpected(size.error());
      }
      (path[1] == "max_size_mb" ? logging.max_size_mb : logging.max_files) = *size;
      return {};
    }
  }
  if (path.size() == 2 && path[0] == "tags" && path[1] == "enforce_existing") {
    auto flag = parseBool(key, value);
    if (!flag.has_value()) {
      return std::unexpected(flag.error());
    }
    tags.enforce_existing = *flag;
    return {};
  }

  return std::unexpected(makeError(ErrorCode::kConfigError, "Unknown config key: " + key));
}

Result<void> Config::validate() const {
  auto level = util::Logging::parseLevel(logging.level);
  if (!level.has_value()) {
    return std::unexpected(level.error());
  }

  if (logging.max_size_mb == 0 || logging.max_files == 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "logging.max_size_mb and logging.max_files must be positive"));
  }

  return {};
}

Result<std::filesystem::path> Config::resolveVaultPath(const std::string& override_path) const {
  if (!override_path.empty()) {
    return std::filesystem::path(override_path);
  }

  if (const char* env_value = std::getenv(kVaultPathEnv); env_value && *env_value) {
    return std::filesystem::path(env_value);
  }

  auto configured = resolveEnvVar(vault_path);
  if (!configured.empty()) {
    return std::filesystem::path(configured);
  }

  return std::unexpected(makeError(ErrorCode::kVaultNotConfigured,
                                   std::string("Vault path not configured. Set ") + kVaultPathEnv +
                                       ", pass --vault, or set vault_path in " +
                                       defaultConfigPath().string()));
}

std::filesystem::path Config::defaultConfigPath() {
  return util::Xdg::configFile();
}

std::string Config::resolveEnvVar(const std::string& value) const {
  if (value.substr(0, 4) == "env:") {
    std::string var_name = value.substr(4);
    const char* env_value = std::getenv(var_name.c_str());
    return env_value ? std::string(env_value) : "";
  }
  return value;
}

std::vector<std::string> Config::splitPath(const std::string& path) const {
  std::vector<std::string> parts;
  std::istringstream stream(path);
  std::string part;

  while (std::getline(stream, part, '.')) {
    if (!part.empty()) {
      parts.push_back(part);
    }
  }

  return parts;
}

}  // namespace mdvault::config
