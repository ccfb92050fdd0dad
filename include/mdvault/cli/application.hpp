#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "mdvault/common.hpp"
#include "mdvault/config/config.hpp"
#include "mdvault/index/vault_index.hpp"
#include "mdvault/store/operations.hpp"

namespace mdvault::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;           // --json: Output in JSON format
  int verbose = 0;             // --verbose: Verbose output level
  bool quiet = false;          // --quiet: Suppress normal output
  std::string config_file;     // --config: Path to config file
  std::string vault_path;      // --vault: Override vault directory
};

/**
 * @brief Base class for all CLI commands
 */
class Command {
public:
  virtual ~Command() = default;

  /**
   * @brief Execute the command with the given arguments
   * @param options Global CLI options
   * @return Result with exit code (0 = success)
   */
  virtual Result<int> execute(const GlobalOptions& options) = 0;

  /**
   * @brief Get the command name
   */
  virtual std::string name() const = 0;

  /**
   * @brief Get the command description
   */
  virtual std::string description() const = 0;

  /**
   * @brief Setup command-specific CLI options (optional override)
   */
  virtual void setupCommand(CLI::App* cmd) { (void)cmd; }

  /**
   * @brief Whether the command operates on a vault
   */
  virtual bool needsVault() const { return true; }
};

/**
 * @brief Main CLI application
 */
class Application {
public:
  Application();
  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  /**
   * @brief Load configuration and open the vault without running a command
   */
  Result<void> initialize();

  // Service accessors for commands
  const GlobalOptions& globalOptions() const;
  config::Config& config();
  store::Operations& operations();

private:
  // Setup methods
  void setupGlobalOptions();
  void setupCommands();
  void setupHelp();

  // Command registration
  void registerCommand(std::unique_ptr<Command> command);

  // Initialization
  Result<void> loadConfig(bool allow_missing);
  Result<void> openVault();

  // CLI framework
  CLI::App app_;
  GlobalOptions global_options_;

  // Services
  config::Config config_;
  std::optional<index::VaultIndex> index_;
  std::unique_ptr<store::Operations> operations_;
  bool config_loaded_;

  // Registered commands
  std::vector<std::unique_ptr<Command>> commands_;
};

} // namespace mdvault::cli
