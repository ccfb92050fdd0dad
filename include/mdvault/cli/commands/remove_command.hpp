#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "mdvault/cli/application.hpp"

namespace mdvault::cli {

class RemoveCommand : public Command {
public:
  explicit RemoveCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "rm"; }
  std::string description() const override { return "Move notes to the trash and mark links to them"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  std::vector<std::string> note_names_;
  bool dry_run_ = false;
};

} // namespace mdvault::cli
