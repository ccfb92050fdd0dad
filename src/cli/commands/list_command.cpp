#include "mdvault/cli/commands/list_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "mdvault/cli/output.hpp"

namespace mdvault::cli {

ListCommand::ListCommand(Application& app) : app_(app) {
}

void ListCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("--limit", limit_, "Maximum number of names")->default_val(100);
  cmd->add_option("--offset", offset_, "Number of names to skip")->default_val(0);
}

Result<int> ListCommand::execute(const GlobalOptions& options) {
  auto list = app_.operations().listNames(limit_, offset_);
  if (!list.has_value()) {
    return std::unexpected(list.error());
  }

  if (options.json) {
    printJson({{"notes", list->names},
               {"total", list->total},
               {"limit", list->limit},
               {"offset", list->offset}});
    return 0;
  }

  for (const auto& name : list->names) {
    std::cout << name << "\n";
  }
  if (!options.quiet && list->offset + list->names.size() < list->total) {
    std::cerr << "(" << list->names.size() << " of " << list->total
              << " notes shown, use --offset for more)\n";
  }
  return 0;
}

} // namespace mdvault::cli
