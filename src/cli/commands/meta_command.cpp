#include "mdvault/cli/commands/meta_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "mdvault/cli/output.hpp"

namespace mdvault::cli {

MetaCommand::MetaCommand(Application& app) : app_(app) {
}

void MetaCommand::setupCommand(CLI::App* cmd) {
  // Get subcommand
  get_cmd_ = cmd->add_subcommand("get", "Print the front matter, or one field of it");
  get_cmd_->add_option("name", note_name_, "Note name")->required();
  get_cmd_->add_option("key", key_, "Front matter key");

  // Set subcommand
  set_cmd_ = cmd->add_subcommand("set", "Set one front matter field");
  set_cmd_->add_option("name", note_name_, "Note name")->required();
  set_cmd_->add_option("key", key_, "Front matter key")->required();
  set_cmd_->add_option("value", value_,
                       "Value; JSON arrays, objects, true/false and null are decoded")->required();
  set_cmd_->add_flag("--allow-new-tags", allow_new_tags_,
                     "Allow tags not yet used in the vault when setting 'tags'");

  cmd->require_subcommand(1);
}

Result<int> MetaCommand::execute(const GlobalOptions& options) {
  if (get_cmd_->parsed()) {
    return executeGet(options);
  }
  if (set_cmd_->parsed()) {
    return executeSet(options);
  }
  return makeErrorResult<int>(ErrorCode::kInvalidArgument, "Unknown meta subcommand");
}

Result<int> MetaCommand::executeGet(const GlobalOptions& options) {
  auto front_matter = app_.operations().frontmatterGet(note_name_);
  if (!front_matter.has_value()) {
    return std::unexpected(front_matter.error());
  }

  if (key_.empty()) {
    if (options.json) {
      printJson(frontMatterToJson(*front_matter));
    } else {
      std::cout << front_matter->toYaml();
    }
    return 0;
  }

  if (!front_matter->has(key_)) {
    return makeErrorResult<int>(ErrorCode::kInvalidArgument,
                                "Key '" + key_ + "' not found in front matter of '" + note_name_ + "'");
  }

  auto value = front_matter->get(key_);
  if (options.json) {
    printJson({{"name", note_name_}, {"key", key_}, {"value", yamlToJson(value)}});
  } else if (value.IsScalar()) {
    std::cout << value.Scalar() << "\n";
  } else {
    core::FrontMatter single;
    single.set(key_, value);
    std::cout << single.toYaml();
  }
  return 0;
}

Result<int> MetaCommand::executeSet(const GlobalOptions& options) {
  bool enforce = app_.config().tags.enforce_existing && !allow_new_tags_;
  auto front_matter =
      app_.operations().frontmatterSet(note_name_, key_, parseFieldValue(value_), enforce);
  if (!front_matter.has_value()) {
    return std::unexpected(front_matter.error());
  }

  if (options.json) {
    printJson({{"name", note_name_}, {"frontmatter", frontMatterToJson(*front_matter)}});
  } else if (!options.quiet) {
    std::cout << "Set " << key_ << " on " << note_name_ << "\n";
  }
  return 0;
}

} // namespace mdvault::cli
