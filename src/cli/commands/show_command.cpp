#include "mdvault/cli/commands/show_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "mdvault/cli/output.hpp"

namespace mdvault::cli {

ShowCommand::ShowCommand(Application& app) : app_(app) {
}

void ShowCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("name", note_name_, "Note name")->required();
  cmd->add_flag("--meta,-m", metadata_only_, "Show front matter and links instead of the text");
}

Result<int> ShowCommand::execute(const GlobalOptions& options) {
  auto& ops = app_.operations();

  if (metadata_only_) {
    auto meta = ops.metadata(note_name_);
    if (!meta.has_value()) {
      return std::unexpected(meta.error());
    }
    if (options.json) {
      printJson({{"name", meta->name},
                 {"frontmatter", frontMatterToJson(meta->front_matter)},
                 {"outgoing", meta->outgoing},
                 {"incoming", meta->incoming}});
      return 0;
    }
    std::cout << "Name: " << meta->name << "\n";
    if (!meta->front_matter.empty()) {
      std::cout << meta->front_matter.toYaml();
    }
    std::cout << "Outgoing: " << meta->outgoing.size() << "\n";
    for (const auto& target : meta->outgoing) {
      std::cout << "  -> " << target << "\n";
    }
    std::cout << "Incoming: " << meta->incoming.size() << "\n";
    for (const auto& source : meta->incoming) {
      std::cout << "  <- " << source << "\n";
    }
    return 0;
  }

  auto content = ops.read(note_name_);
  if (!content.has_value()) {
    return std::unexpected(content.error());
  }

  if (options.json) {
    printJson({{"name", note_name_}, {"content", *content}});
  } else {
    std::cout << *content;
    if (!content->empty() && content->back() != '\n') {
      std::cout << "\n";
    }
  }
  return 0;
}

} // namespace mdvault::cli
