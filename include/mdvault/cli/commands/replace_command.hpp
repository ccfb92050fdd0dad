#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "mdvault/cli/application.hpp"

namespace mdvault::cli {

class ReplaceCommand : public Command {
public:
  explicit ReplaceCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "replace"; }
  std::string description() const override { return "Replace text in a note"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  std::string note_name_;
  std::string old_text_;
  std::string new_text_;
  bool replace_all_ = false;
};

} // namespace mdvault::cli
