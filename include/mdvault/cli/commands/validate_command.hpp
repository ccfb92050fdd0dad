#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "mdvault/cli/application.hpp"

namespace mdvault::cli {

class ValidateCommand : public Command {
public:
  explicit ValidateCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "validate"; }
  std::string description() const override { return "Check notes for style and link problems"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  std::vector<std::string> note_names_;

  Result<store::Warnings> validateNote(const std::string& name);
};

} // namespace mdvault::cli
