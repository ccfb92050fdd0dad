#include "mdvault/cli/commands/insert_command.hpp"

#include <iostream>
#include <optional>
#include <nlohmann/json.hpp>

#include "mdvault/cli/output.hpp"

namespace mdvault::cli {

InsertCommand::InsertCommand(Application& app) : app_(app) {
}

void InsertCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("name", note_name_, "Note name")->required();
  cmd->add_option("text", text_, "Text to insert");
  cmd->add_flag("--stdin", from_stdin_, "Read the text from stdin");
  before_opt_ = cmd->add_option("--before", before_, "Insert before the first line equal to this (trimmed)");
  after_opt_ = cmd->add_option("--after", after_, "Insert after the first line equal to this (trimmed)");
}

Result<int> InsertCommand::execute(const GlobalOptions& options) {
  auto text = inputText(text_, from_stdin_);
  if (!text.has_value()) {
    return std::unexpected(text.error());
  }

  std::optional<std::string> before;
  std::optional<std::string> after;
  if (before_opt_->count() > 0) before = before_;
  if (after_opt_->count() > 0) after = after_;

  auto result = app_.operations().insert(note_name_, *text, before, after);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  auto position = std::string(store::insertPositionToString(result->position));
  if (options.json) {
    printJson({{"name", result->name}, {"position", position}, {"pattern", result->pattern}});
  } else if (!options.quiet) {
    std::cout << "Inserted " << position << " '" << result->pattern << "' in " << result->name << "\n";
  }
  return 0;
}

} // namespace mdvault::cli
