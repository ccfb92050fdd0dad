#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "mdvault/cli/application.hpp"

namespace mdvault::cli {

class TagCommand : public Command {
public:
  explicit TagCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "tag"; }
  std::string description() const override { return "Add or remove tags"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  // Subcommands
  CLI::App* add_cmd_ = nullptr;
  CLI::App* rm_cmd_ = nullptr;

  std::string note_name_;
  std::string tag_;
  bool allow_new_ = false;
};

} // namespace mdvault::cli
