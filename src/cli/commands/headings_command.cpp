#include "mdvault/cli/commands/headings_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "mdvault/cli/output.hpp"

namespace mdvault::cli {

HeadingsCommand::HeadingsCommand(Application& app) : app_(app) {
}

void HeadingsCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("name", note_name_, "Note name")->required();
}

Result<int> HeadingsCommand::execute(const GlobalOptions& options) {
  auto headings = app_.operations().getHeadings(note_name_);
  if (!headings.has_value()) {
    return std::unexpected(headings.error());
  }

  if (options.json) {
    auto items = nlohmann::json::array();
    for (const auto& heading : *headings) {
      items.push_back({{"level", heading.level}, {"text", heading.text}, {"line", heading.line}});
    }
    printJson({{"name", note_name_}, {"headings", items}});
    return 0;
  }

  // Outline view, two spaces per level below the first
  for (const auto& heading : *headings) {
    std::cout << std::string(static_cast<size_t>(heading.level - 1) * 2, ' ')
              << std::string(static_cast<size_t>(heading.level), '#') << " " << heading.text
              << "  (line " << heading.line << ")\n";
  }
  return 0;
}

} // namespace mdvault::cli
