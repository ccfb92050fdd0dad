#include "mdvault/cli/commands/tag_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "mdvault/cli/output.hpp"

namespace mdvault::cli {

TagCommand::TagCommand(Application& app) : app_(app) {
}

void TagCommand::setupCommand(CLI::App* cmd) {
  add_cmd_ = cmd->add_subcommand("add", "Add a tag to a note");
  add_cmd_->add_option("name", note_name_, "Note name")->required();
  add_cmd_->add_option("tag", tag_, "Tag")->required();
  add_cmd_->add_flag("--allow-new", allow_new_, "Allow a tag not yet used in the vault");

  rm_cmd_ = cmd->add_subcommand("rm", "Remove a tag from a note");
  rm_cmd_->add_option("name", note_name_, "Note name")->required();
  rm_cmd_->add_option("tag", tag_, "Tag")->required();

  cmd->require_subcommand(1);
}

Result<int> TagCommand::execute(const GlobalOptions& options) {
  auto& ops = app_.operations();
  bool adding = add_cmd_->parsed();

  Result<store::TagResult> result;
  if (adding) {
    bool enforce = app_.config().tags.enforce_existing && !allow_new_;
    result = ops.addTag(note_name_, tag_, enforce);
  } else if (rm_cmd_->parsed()) {
    result = ops.removeTag(note_name_, tag_);
  } else {
    return makeErrorResult<int>(ErrorCode::kInvalidArgument, "Unknown tag subcommand");
  }
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  if (options.json) {
    printJson({{"name", result->name},
               {"tags", result->tags},
               {adding ? "added" : "removed", result->changed}});
    return 0;
  }

  if (!options.quiet) {
    if (!result->changed) {
      std::cout << result->name << (adding ? " already has tag '" : " has no tag '") << tag_ << "'\n";
    } else {
      std::cout << (adding ? "Added tag '" : "Removed tag '") << tag_ << "' "
                << (adding ? "to " : "from ") << result->name << "\n";
    }
  }
  return 0;
}

} // namespace mdvault::cli
