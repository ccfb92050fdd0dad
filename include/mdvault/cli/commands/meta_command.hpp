#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "mdvault/cli/application.hpp"

namespace mdvault::cli {

class MetaCommand : public Command {
public:
  explicit MetaCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "meta"; }
  std::string description() const override { return "Front matter management"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  // Subcommands
  CLI::App* get_cmd_ = nullptr;
  CLI::App* set_cmd_ = nullptr;

  std::string note_name_;
  std::string key_;
  std::string value_;
  bool allow_new_tags_ = false;

  Result<int> executeGet(const GlobalOptions& options);
  Result<int> executeSet(const GlobalOptions& options);
};

} // namespace mdvault::cli
