#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "mdvault/cli/application.hpp"

namespace mdvault::cli {

class SearchCommand : public Command {
public:
  explicit SearchCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "search"; }
  std::string description() const override { return "Search notes by name, content or tag"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  std::string query_;
  std::string mode_ = "content";
  std::string tag_logic_;
};

} // namespace mdvault::cli
