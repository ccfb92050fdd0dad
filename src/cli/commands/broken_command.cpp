#include "mdvault/cli/commands/broken_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "mdvault/cli/output.hpp"

namespace mdvault::cli {

BrokenCommand::BrokenCommand(Application& app) : app_(app) {
}

void BrokenCommand::setupCommand(CLI::App* cmd) {
  (void)cmd;
}

Result<int> BrokenCommand::execute(const GlobalOptions& options) {
  auto broken = app_.operations().findBrokenLinks();
  if (!broken.has_value()) {
    return std::unexpected(broken.error());
  }

  if (options.json) {
    auto items = nlohmann::json::array();
    for (const auto& link : *broken) {
      items.push_back({{"source", link.source}, {"target", link.target}});
    }
    printJson({{"broken_links", items}, {"count", broken->size()}});
    return 0;
  }

  if (broken->empty()) {
    if (!options.quiet) {
      std::cout << "No broken links\n";
    }
    return 0;
  }
  for (const auto& link : *broken) {
    std::cout << link.source << " -> [[" << link.target << "]]\n";
  }
  return 0;
}

} // namespace mdvault::cli
