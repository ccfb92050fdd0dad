#include "mdvault/cli/commands/edit_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "mdvault/cli/output.hpp"

namespace mdvault::cli {

EditCommand::EditCommand(Application& app) : app_(app) {
}

void EditCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("name", note_name_, "Note name")->required();
  cmd->add_option("--content,-c", content_, "New body");
  cmd->add_flag("--stdin", from_stdin_, "Read the new body from stdin");
}

Result<int> EditCommand::execute(const GlobalOptions& options) {
  auto content = inputText(content_, from_stdin_);
  if (!content.has_value()) {
    return std::unexpected(content.error());
  }

  auto result = app_.operations().update(note_name_, *content);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  if (options.json) {
    printJson({{"name", result->name}, {"warnings", warningsToJson(result->warnings)}});
  } else {
    printWarnings(options, result->warnings);
    if (!options.quiet) {
      std::cout << "Updated " << result->name << "\n";
    }
  }
  return 0;
}

} // namespace mdvault::cli
