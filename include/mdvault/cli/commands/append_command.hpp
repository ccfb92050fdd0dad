#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "mdvault/cli/application.hpp"

namespace mdvault::cli {

class AppendCommand : public Command {
public:
  explicit AppendCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "append"; }
  std::string description() const override { return "Append text to the end of a note"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  std::string note_name_;
  std::string text_;
  bool from_stdin_ = false;
};

} // namespace mdvault::cli
