#include "mdvault/cli/commands/search_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "mdvault/cli/output.hpp"

namespace mdvault::cli {

SearchCommand::SearchCommand(Application& app) : app_(app) {
}

void SearchCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("query", query_, "Search query (comma-separated tags in tag mode)")->required();
  cmd->add_option("--mode,-m", mode_, "name, name_partial, content or tag")->default_val("content");
  cmd->add_option("--tag-logic", tag_logic_, "and / or (tag mode only, default or)");
}

Result<int> SearchCommand::execute(const GlobalOptions& options) {
  auto mode = store::parseSearchMode(mode_);
  if (!mode.has_value()) {
    return std::unexpected(mode.error());
  }

  auto& ops = app_.operations();
  Result<std::vector<std::string>> matches;
  if (*mode == store::SearchMode::kTag && !tag_logic_.empty()) {
    auto logic = store::parseTagLogic(tag_logic_);
    if (!logic.has_value()) {
      return std::unexpected(logic.error());
    }
    matches = ops.searchTags(query_, *logic);
  } else {
    matches = ops.search(query_, *mode);
  }
  if (!matches.has_value()) {
    return std::unexpected(matches.error());
  }

  if (options.json) {
    printJson({{"query", query_}, {"mode", mode_}, {"results", *matches}});
    return 0;
  }

  for (const auto& name : *matches) {
    std::cout << name << "\n";
  }
  return 0;
}

} // namespace mdvault::cli
