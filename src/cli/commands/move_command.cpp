#include "mdvault/cli/commands/move_command.hpp"

#include <iostream>
#include <utility>
#include <nlohmann/json.hpp>

#include "mdvault/cli/output.hpp"

namespace mdvault::cli {

MoveCommand::MoveCommand(Application& app) : app_(app) {
}

void MoveCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("names", names_, "Pairs of old and new note names")->required();
  cmd->add_flag("--dry-run", dry_run_, "Report what would change without writing");
}

Result<int> MoveCommand::execute(const GlobalOptions& options) {
  if (names_.size() % 2 != 0) {
    return makeErrorResult<int>(ErrorCode::kInvalidArgument,
                                "Expected pairs of names: OLD NEW [OLD NEW ...]");
  }

  std::vector<std::pair<std::string, std::string>> renames;
  for (size_t i = 0; i < names_.size(); i += 2) {
    renames.emplace_back(names_[i], names_[i + 1]);
  }

  auto results = app_.operations().batchRename(renames, dry_run_);

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

    const auto& renamed = *item.result;
    if (options.json) {
      json_items.push_back({{"old_name", renamed.old_name},
                            {"new_name", renamed.new_name},
                            {"files_updated", renamed.files_updated}});
    } else if (!options.quiet) {
      std::cout << (dry_run_ ? "Would rename " : "Renamed ") << renamed.old_name
                << " -> " << renamed.new_name << "\n";
      for (const auto& source : renamed.files_updated) {
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
