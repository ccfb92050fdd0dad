#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "mdvault/cli/application.hpp"

namespace mdvault::cli {

class MoveCommand : public Command {
public:
  explicit MoveCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "mv"; }
  std::string description() const override { return "Rename notes and rewrite links to them"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  // Alternating old and new names
  std::vector<std::string> names_;
  bool dry_run_ = false;
};

} // namespace mdvault::cli
