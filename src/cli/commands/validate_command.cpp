#include "mdvault/cli/commands/validate_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "mdvault/cli/output.hpp"

namespace mdvault::cli {

ValidateCommand::ValidateCommand(Application& app) : app_(app) {
}

void ValidateCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("names", note_names_, "Notes to check (default: every note)");
}

Result<store::Warnings> ValidateCommand::validateNote(const std::string& name) {
  auto& ops = app_.operations();
  auto content = ops.read(name);
  if (!content.has_value()) {
    return std::unexpected(content.error());
  }

  auto warnings = ops.validator().validate(*content);
  auto link_warnings = ops.validateWikilinks(*content);
  if (!link_warnings.has_value()) {
    return std::unexpected(link_warnings.error());
  }
  warnings.insert(warnings.end(), link_warnings->begin(), link_warnings->end());
  return warnings;
}

Result<int> ValidateCommand::execute(const GlobalOptions& options) {
  auto names = note_names_;
  if (names.empty()) {
    auto notes = app_.operations().vaultIndex().listNotes();
    if (!notes.has_value()) {
      return std::unexpected(notes.error());
    }
    for (const auto& note : *notes) {
      names.push_back(note.name());
    }
  }

  int exit_code = 0;
  size_t total = 0;
  auto json_items = nlohmann::json::array();
  for (const auto& name : names) {
    auto warnings = validateNote(name);
    if (!warnings.has_value()) {
      exit_code = 1;
      if (options.json) {
        auto entry = errorToJson(warnings.error());
        entry["name"] = name;
        json_items.push_back(entry);
      } else {
        std::cout << name << ": " << warnings.error().message() << "\n";
      }
      continue;
    }

    total += warnings->size();
    if (options.json) {
      json_items.push_back({{"name", name}, {"warnings", warningsToJson(*warnings)}});
      continue;
    }
    for (const auto& warning : *warnings) {
      std::cout << name << ":" << warning.line << ": [" << validation::warningRuleToString(warning.rule)
                << "] " << warning.message << "\n";
    }
  }

  if (options.json) {
    printJson({{"notes", json_items}, {"warning_count", total}});
  } else if (!options.quiet) {
    std::cout << names.size() << " notes checked, " << total << " warnings\n";
  }
  return exit_code;
}

} // namespace mdvault::cli
