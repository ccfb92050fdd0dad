#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "mdvault/cli/application.hpp"

namespace mdvault::cli {

class ConfigCommand : public Command {
public:
  explicit ConfigCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "config"; }
  std::string description() const override { return "Configuration management"; }
  void setupCommand(CLI::App* cmd) override;
  bool needsVault() const override { return false; }

private:
  Application& app_;

  // Subcommands
  CLI::App* get_cmd_ = nullptr;
  CLI::App* set_cmd_ = nullptr;

  std::string key_;
  std::string value_;

  Result<int> executeGet(const GlobalOptions& options);
  Result<int> executeSet(const GlobalOptions& options);
};

} // namespace mdvault::cli
