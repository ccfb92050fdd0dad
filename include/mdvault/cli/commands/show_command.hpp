#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "mdvault/cli/application.hpp"

namespace mdvault::cli {

class ShowCommand : public Command {
public:
  explicit ShowCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "show"; }
  std::string description() const override { return "Print a note"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  std::string note_name_;
  bool metadata_only_ = false;
};

} // namespace mdvault::cli
