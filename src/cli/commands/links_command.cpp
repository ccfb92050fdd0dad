#include "mdvault/cli/commands/links_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "mdvault/cli/output.hpp"

namespace mdvault::cli {

LinksCommand::LinksCommand(Application& app) : app_(app) {
}

void LinksCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("name", note_name_, "Note name")->required();
  cmd->add_option("--direction,-d", direction_, "in, out or both")->default_val("both");
}

Result<int> LinksCommand::execute(const GlobalOptions& options) {
  auto direction = store::parseLinkDirection(direction_);
  if (!direction.has_value()) {
    return std::unexpected(direction.error());
  }

  auto links = app_.operations().links(note_name_, *direction);
  if (!links.has_value()) {
    return std::unexpected(links.error());
  }

  if (options.json) {
    nlohmann::json output = {{"name", links->name}};
    if (links->outgoing) {
      output["outgoing"] = *links->outgoing;
    }
    if (links->incoming) {
      output["incoming"] = *links->incoming;
    }
    printJson(output);
    return 0;
  }

  if (links->outgoing) {
    std::cout << "Outgoing (" << links->outgoing->size() << "):\n";
    for (const auto& target : *links->outgoing) {
      std::cout << "  -> " << target << "\n";
    }
  }
  if (links->incoming) {
    std::cout << "Incoming (" << links->incoming->size() << "):\n";
    for (const auto& source : *links->incoming) {
      std::cout << "  <- " << source << "\n";
    }
  }
  return 0;
}

} // namespace mdvault::cli
