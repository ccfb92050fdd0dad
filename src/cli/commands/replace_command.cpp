#include "mdvault/cli/commands/replace_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "mdvault/cli/output.hpp"

namespace mdvault::cli {

ReplaceCommand::ReplaceCommand(Application& app) : app_(app) {
}

void ReplaceCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("name", note_name_, "Note name")->required();
  cmd->add_option("old", old_text_, "Text to find")->required();
  cmd->add_option("new", new_text_, "Replacement text")->required();
  cmd->add_flag("--all,-a", replace_all_, "Replace every occurrence, not just the first");
}

Result<int> ReplaceCommand::execute(const GlobalOptions& options) {
  auto result = app_.operations().replace(note_name_, old_text_, new_text_, replace_all_);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  if (options.json) {
    printJson({{"name", result->name}, {"replacements", result->replacements}});
  } else if (!options.quiet) {
    std::cout << "Replaced " << result->replacements << " occurrence"
              << (result->replacements == 1 ? "" : "s") << " in " << result->name << "\n";
  }
  return 0;
}

} // namespace mdvault::cli
