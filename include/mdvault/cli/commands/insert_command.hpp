#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "mdvault/cli/application.hpp"

namespace mdvault::cli {

class InsertCommand : public Command {
public:
  explicit InsertCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "insert"; }
  std::string description() const override { return "Insert a line before or after a matching line"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  std::string note_name_;
  std::string text_;
  bool from_stdin_ = false;
  std::string before_;
  std::string after_;
  CLI::Option* before_opt_ = nullptr;
  CLI::Option* after_opt_ = nullptr;
};

} // namespace mdvault::cli
