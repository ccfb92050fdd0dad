#include "mdvault/cli/commands/new_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "mdvault/cli/output.hpp"

namespace mdvault::cli {

NewCommand::NewCommand(Application& app) : app_(app) {
}

void NewCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("name", note_name_, "Note name (file stem)")->required();
  cmd->add_option("--content,-c", content_, "Note body");
  cmd->add_flag("--stdin", from_stdin_, "Read the body from stdin");
  cmd->add_option("--frontmatter", frontmatter_json_, "Front matter as a JSON object");
  cmd->add_option("--tags,-t", tags_, "Tags to set in the front matter");
  cmd->add_flag("--allow-new-tags", allow_new_tags_, "Allow tags not yet used in the vault");
}

Result<core::FrontMatter> NewCommand::buildFrontMatter() const {
  core::FrontMatter front_matter;

  if (!frontmatter_json_.empty()) {
    auto parsed = nlohmann::json::parse(frontmatter_json_, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
      return makeErrorResult<core::FrontMatter>(ErrorCode::kInvalidArgument,
                                                "--frontmatter must be a JSON object");
    }
    for (const auto& [key, value] : parsed.items()) {
      front_matter.set(key, jsonToYaml(value));
    }
  }

  if (!tags_.empty()) {
    front_matter.setTags(tags_);
  }
  return front_matter;
}

Result<int> NewCommand::execute(const GlobalOptions& options) {
  auto content = inputText(content_, from_stdin_);
  if (!content.has_value()) {
    return std::unexpected(content.error());
  }

  auto front_matter = buildFrontMatter();
  if (!front_matter.has_value()) {
    return std::unexpected(front_matter.error());
  }

  auto& ops = app_.operations();
  auto tags = front_matter->tags();
  if (!tags.empty()) {
    bool enforce = app_.config().tags.enforce_existing && !allow_new_tags_;
    auto allowed = ops.checkTags(note_name_, tags, *front_matter, enforce);
    if (!allowed.has_value()) {
      return std::unexpected(allowed.error());
    }
  }

  auto created = ops.create(note_name_, *content, *front_matter);
  if (!created.has_value()) {
    return std::unexpected(created.error());
  }

  if (options.json) {
    printJson({{"name", created->name},
               {"path", created->path.string()},
               {"warnings", warningsToJson(created->warnings)}});
  } else {
    printWarnings(options, created->warnings);
    if (!options.quiet) {
      std::cout << "Created " << created->path.string() << "\n";
    }
  }
  return 0;
}

} // namespace mdvault::cli
