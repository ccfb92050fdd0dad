#include "mdvault/cli/commands/config_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "mdvault/cli/output.hpp"
#include "mdvault/util/filesystem.hpp"

namespace mdvault::cli {

ConfigCommand::ConfigCommand(Application& app) : app_(app) {
}

void ConfigCommand::setupCommand(CLI::App* cmd) {
  // Get subcommand
  get_cmd_ = cmd->add_subcommand("get", "Get configuration value");
  get_cmd_->add_option("key", key_, "Configuration key (e.g. logging.level)")->required();

  // Set subcommand
  set_cmd_ = cmd->add_subcommand("set", "Set configuration value");
  set_cmd_->add_option("key", key_, "Configuration key")->required();
  set_cmd_->add_option("value", value_, "Configuration value")->required();

  cmd->require_subcommand(1);
}

Result<int> ConfigCommand::execute(const GlobalOptions& options) {
  if (get_cmd_->parsed()) {
    return executeGet(options);
  }
  if (set_cmd_->parsed()) {
    return executeSet(options);
  }
  return makeErrorResult<int>(ErrorCode::kInvalidArgument, "Unknown config subcommand");
}

Result<int> ConfigCommand::executeGet(const GlobalOptions& options) {
  auto value = app_.config().get(key_);
  if (!value.has_value()) {
    return std::unexpected(value.error());
  }

  if (options.json) {
    printJson({{"key", key_}, {"value", *value}});
  } else {
    std::cout << *value << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executeSet(const GlobalOptions& options) {
  auto& config = app_.config();
  auto set_result = config.set(key_, value_);
  if (!set_result.has_value()) {
    return std::unexpected(set_result.error());
  }

  std::filesystem::path config_path = options.config_file.empty()
      ? config::Config::defaultConfigPath()
      : std::filesystem::path(options.config_file);
  if (config_path.has_parent_path()) {
    auto dir_result = util::FileSystem::createDirectories(config_path.parent_path());
    if (!dir_result.has_value()) {
      return std::unexpected(dir_result.error());
    }
  }

  auto save_result = config.save(config_path);
  if (!save_result.has_value()) {
    return std::unexpected(save_result.error());
  }

  if (options.json) {
    printJson({{"key", key_}, {"value", value_}, {"path", config_path.string()}});
  } else if (!options.quiet) {
    std::cout << "Set " << key_ << " = " << value_ << "\n";
  }
  return 0;
}

} // namespace mdvault::cli
