#include "mdvault/cli/commands/remove_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "mdvault/cli/output.hpp"

namespace mdvault::cli {

RemoveCommand::RemoveCommand(Application& app) : app_(app) {
}

void RemoveCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("names", note_names_, "Note names")->required();
  cmd->add_flag("--dry-run", dry_run_, "Report what would change without writing");
}

Result<int> RemoveCommand::execute(const GlobalOptions& options) {
  auto results = app_.operations().batchRemove(note_names_, dry_run_);

  int exit_code = 0;
  auto json_items = nlohmann::json::array();
  for (const auto& item : results) {
    if (!item.result.has_value()) {
      exit_code = 1;
      if (options.json) {
        auto entry = errorToJson(item.result.error());
        entry["name"] = item.name;
        json_items.push_back(entry);
      } else {
        std::cerr << "Error: " << item.result.error().message() << "\n";
      }
      continue;
    }

    const auto& removed = *item.result;
    if (options.json) {
      json_items.push_back({{"name", removed.name},
                            {"trash_path", removed.trash_path.string()},
                            {"files_updated", removed.files_updated}});
    } else if (!options.quiet) {
      std::cout << (dry_run_ ? "Would delete " : "Deleted ") << removed.name
                << " -> " << removed.trash_path.string() << "\n";
      for (const auto& source : removed.files_updated) {
        std::cout << "  updated " << source << "\n";
      }
    }
  }

  if (options.json) {
    printJson({{"dry_run", dry_run_}, {"results", json_items}});
  }
  return exit_code;
}

} // namespace mdvault::cli
