#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "mdvault/common.hpp"

namespace mdvault::config {

// Environment variable naming the vault root; overrides the config file
inline constexpr const char* kVaultPathEnv = "MDVAULT_VAULT_PATH";

// Configuration for mdvault, stored as TOML
class Config {
 public:
  // Defaults only; nothing is read from disk
  Config();

  // Vault location. May be an "env:VAR" reference.
  std::string vault_path;

  // Logging configuration
  struct LoggingConfig {
    std::string level = "info";
    std::string file;            // empty = XDG data home
    size_t max_size_mb = 5;
    size_t max_files = 3;
  };
  LoggingConfig logging;

  // Tag policy
  struct TagsConfig {
    bool enforce_existing = true;  // new tags must already be used in the vault
  };
  TagsConfig tags;

  // Load configuration from file
  Result<void> load(const std::filesystem::path& config_path);

  // Save configuration to file (default: the path it was loaded from)
  Result<void> save(const std::filesystem::path& config_path = {}) const;

  // Get configuration value by dotted key (e.g. "logging.level")
  Result<std::string> get(const std::string& key) const;

  // Set configuration value by dotted key
  Result<void> set(const std::string& key, const std::string& value);

  // Validate configuration
  Result<void> validate() const;

  // Vault root from, in order: override (e.g. --vault), MDVAULT_VAULT_PATH,
  // vault_path. kVaultNotConfigured if none is set.
  Result<std::filesystem::path> resolveVaultPath(const std::string& override_path = "") const;

  // Get default config file path
  static std::filesystem::path defaultConfigPath();

 private:
  std::filesystem::path config_path_;

  // Expand "env:VAR" references
  std::string resolveEnvVar(const std::string& value) const;

  std::vector<std::string> splitPath(const std::string& path) const;
};

}  // namespace mdvault::config
