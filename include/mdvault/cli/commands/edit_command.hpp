#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "mdvault/cli/application.hpp"

namespace mdvault::cli {

class EditCommand : public Command {
public:
  explicit EditCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "edit"; }
  std::string description() const override { return "Replace the body of a note, keeping its front matter"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  std::string note_name_;
  std::string content_;
  bool from_stdin_ = false;
};

} // namespace mdvault::cli
