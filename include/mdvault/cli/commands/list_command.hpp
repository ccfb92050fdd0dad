#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "mdvault/cli/application.hpp"

namespace mdvault::cli {

class ListCommand : public Command {
public:
  explicit ListCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "ls"; }
  std::string description() const override { return "List note names"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  // Paging
  size_t limit_ = 100;
  size_t offset_ = 0;
};

} // namespace mdvault::cli
