#include "mdvault/cli/application.hpp"

#include <iostream>
#include <filesystem>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "mdvault/cli/output.hpp"
#include "mdvault/util/logging.hpp"

// Command includes
#include "mdvault/cli/commands/list_command.hpp"
#include "mdvault/cli/commands/new_command.hpp"
#include "mdvault/cli/commands/show_command.hpp"
#include "mdvault/cli/commands/append_command.hpp"
#include "mdvault/cli/commands/edit_command.hpp"
#include "mdvault/cli/commands/remove_command.hpp"
#include "mdvault/cli/commands/move_command.hpp"

// Query commands
#include "mdvault/cli/commands/search_command.hpp"
#include "mdvault/cli/commands/links_command.hpp"
#include "mdvault/cli/commands/broken_command.hpp"
#include "mdvault/cli/commands/headings_command.hpp"
#include "mdvault/cli/commands/validate_command.hpp"

// Structural edits
#include "mdvault/cli/commands/section_command.hpp"
#include "mdvault/cli/commands/replace_command.hpp"
#include "mdvault/cli/commands/insert_command.hpp"

// Metadata management
#include "mdvault/cli/commands/meta_command.hpp"
#include "mdvault/cli/commands/tag_command.hpp"

// Configuration management
#include "mdvault/cli/commands/config_command.hpp"

namespace mdvault::cli {

Application::Application()
    : app_("mdvault", "Markdown vault note index and structural editor")
    , config_loaded_(false) {

  app_.set_version_flag("--version", mdvault::getVersion().toString());
  app_.set_help_all_flag("--help-all", "Expand all help");
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

Result<void> Application::initialize() {
  auto loaded = loadConfig(false);
  if (!loaded.has_value()) {
    return loaded;
  }
  return openVault();
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose output");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Suppress normal output");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
  app_.add_option("--vault", global_options_.vault_path,
                  "Vault directory (overrides MDVAULT_VAULT_PATH and the config file)");
}

void Application::setupCommands() {
  // Notes
  registerCommand(std::make_unique<ListCommand>(*this));
  registerCommand(std::make_unique<NewCommand>(*this));
  registerCommand(std::make_unique<ShowCommand>(*this));
  registerCommand(std::make_unique<AppendCommand>(*this));
  registerCommand(std::make_unique<EditCommand>(*this));
  registerCommand(std::make_unique<RemoveCommand>(*this));
  registerCommand(std::make_unique<MoveCommand>(*this));

  // Queries
  registerCommand(std::make_unique<SearchCommand>(*this));
  registerCommand(std::make_unique<LinksCommand>(*this));
  registerCommand(std::make_unique<BrokenCommand>(*this));
  registerCommand(std::make_unique<HeadingsCommand>(*this));
  registerCommand(std::make_unique<ValidateCommand>(*this));

  // Structural edits
  registerCommand(std::make_unique<SectionCommand>(*this));
  registerCommand(std::make_unique<ReplaceCommand>(*this));
  registerCommand(std::make_unique<InsertCommand>(*this));

  // Metadata
  registerCommand(std::make_unique<MetaCommand>(*this));
  registerCommand(std::make_unique<TagCommand>(*this));

  // Configuration
  registerCommand(std::make_unique<ConfigCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Examples:
  mdvault new "Project Plan" --content "## Goals"
  mdvault section read "Project Plan" Goals
  mdvault mv "Project Plan" "Roadmap" --dry-run
  mdvault search vc --mode tag --json
  mdvault links Roadmap --direction in

The vault is taken from --vault, MDVAULT_VAULT_PATH, or vault_path in the
config file, in that order.)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  // Create CLI11 subcommand
  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());

  // Let the command setup its specific options
  cmd_ptr->setupCommand(sub);

  // Set callback to execute the command
  sub->callback([this, cmd_ptr]() {
    auto init_result = cmd_ptr->needsVault() ? initialize() : loadConfig(true);
    if (!init_result.has_value()) {
      printError(global_options_, init_result.error());
      throw CLI::RuntimeError(1);
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      spdlog::debug("Command '{}' failed: {}", cmd_ptr->name(), result.error().message());
      printError(global_options_, result.error());
      throw CLI::RuntimeError(1);
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  // Store the command
  commands_.push_back(std::move(command));
}

Result<void> Application::loadConfig(bool allow_missing) {
  if (config_loaded_) {
    return {};
  }

  // An explicit --config must exist unless the command can create it
  bool explicit_missing = !global_options_.config_file.empty() &&
                          !std::filesystem::exists(global_options_.config_file);
  if (explicit_missing && allow_missing) {
    spdlog::debug("Config file {} does not exist, using defaults", global_options_.config_file);
  } else if (!global_options_.config_file.empty()) {
    auto loaded = config_.load(global_options_.config_file);
    if (!loaded.has_value()) {
      return loaded;
    }
  } else {
    auto default_path = config::Config::defaultConfigPath();
    if (std::filesystem::exists(default_path)) {
      auto loaded = config_.load(default_path);
      if (!loaded.has_value()) {
        return loaded;
      }
    }
  }

  util::LogSettings settings;
  settings.level = config_.logging.level;
  settings.file = config_.logging.file;
  settings.max_size_mb = config_.logging.max_size_mb;
  settings.max_files = config_.logging.max_files;
  settings.console_verbose = global_options_.verbose > 0;
  settings.console_quiet = global_options_.quiet;
  util::Logging::initialize(settings);

  config_loaded_ = true;
  return {};
}

Result<void> Application::openVault() {
  if (operations_) {
    return {};
  }

  auto vault_path = config_.resolveVaultPath(global_options_.vault_path);
  if (!vault_path.has_value()) {
    return std::unexpected(vault_path.error());
  }

  auto opened = index::VaultIndex::open(*vault_path);
  if (!opened.has_value()) {
    return std::unexpected(opened.error());
  }

  index_.emplace(std::move(*opened));
  operations_ = std::make_unique<store::Operations>(*index_);
  spdlog::debug("Opened vault {}", vault_path->string());
  return {};
}

// Getters for services (to be used by commands)
const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

config::Config& Application::config() {
  return config_;
}

store::Operations& Application::operations() {
  if (!operations_) {
    throw std::runtime_error("Vault not opened");
  }
  return *operations_;
}

} // namespace mdvault::cli
