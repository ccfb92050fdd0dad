#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "mdvault/cli/application.hpp"

namespace mdvault::cli {

class LinksCommand : public Command {
public:
  explicit LinksCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "links"; }
  std::string description() const override { return "Show links from and to a note"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  std::string note_name_;
  std::string direction_ = "both";
};

} // namespace mdvault::cli
