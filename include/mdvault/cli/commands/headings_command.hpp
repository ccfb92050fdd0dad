#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "mdvault/cli/application.hpp"

namespace mdvault::cli {

class HeadingsCommand : public Command {
public:
  explicit HeadingsCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "headings"; }
  std::string description() const override { return "List the headings of a note"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  std::string note_name_;
};

} // namespace mdvault::cli
