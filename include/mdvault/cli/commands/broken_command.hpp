#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "mdvault/cli/application.hpp"

namespace mdvault::cli {

class BrokenCommand : public Command {
public:
  explicit BrokenCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "broken"; }
  std::string description() const override { return "List links to missing notes"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
};

} // namespace mdvault::cli
