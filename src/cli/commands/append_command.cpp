#include "mdvault/cli/commands/append_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "mdvault/cli/output.hpp"

namespace mdvault::cli {

AppendCommand::AppendCommand(Application& app) : app_(app) {
}

void AppendCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("name", note_name_, "Note name")->required();
  cmd->add_option("text", text_, "Text to append");
  cmd->add_flag("--stdin", from_stdin_, "Read the text from stdin");
}

Result<int> AppendCommand::execute(const GlobalOptions& options) {
  auto text = inputText(text_, from_stdin_);
  if (!text.has_value()) {
    return std::unexpected(text.error());
  }

  auto result = app_.operations().append(note_name_, *text);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  if (options.json) {
    printJson({{"name", result->name}, {"warnings", warningsToJson(result->warnings)}});
  } else {
    printWarnings(options, result->warnings);
    if (!options.quiet) {
      std::cout << "Appended to " << result->name << "\n";
    }
  }
  return 0;
}

} // namespace mdvault::cli
