#include "mdvault/cli/commands/section_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "mdvault/cli/output.hpp"

namespace mdvault::cli {

SectionCommand::SectionCommand(Application& app) : app_(app) {
}

void SectionCommand::setupCommand(CLI::App* cmd) {
  read_cmd_ = cmd->add_subcommand("read", "Print the content under a heading");
  read_cmd_->add_option("name", note_name_, "Note name")->required();
  read_cmd_->add_option("section", section_, "Heading text, or the literal heading line")->required();

  append_cmd_ = cmd->add_subcommand("append", "Append text to the end of a section");
  append_cmd_->add_option("name", note_name_, "Note name")->required();
  append_cmd_->add_option("section", section_, "Heading text, or the literal heading line")->required();
  append_cmd_->add_option("text", text_, "Text to append");
  append_cmd_->add_flag("--stdin", from_stdin_, "Read the text from stdin");

  update_cmd_ = cmd->add_subcommand("update", "Replace the content of a section");
  update_cmd_->add_option("name", note_name_, "Note name")->required();
  update_cmd_->add_option("section", section_, "Heading text, or the literal heading line")->required();
  update_cmd_->add_option("content", text_, "New section content");
  update_cmd_->add_flag("--stdin", from_stdin_, "Read the content from stdin");

  delete_cmd_ = cmd->add_subcommand("delete", "Remove a heading and its content");
  delete_cmd_->add_option("name", note_name_, "Note name")->required();
  delete_cmd_->add_option("section", section_, "Heading text, or the literal heading line")->required();

  cmd->require_subcommand(1);
}

Result<int> SectionCommand::execute(const GlobalOptions& options) {
  if (read_cmd_->parsed()) {
    return executeRead(options);
  }
  if (append_cmd_->parsed() || update_cmd_->parsed()) {
    return executeWrite(options);
  }
  if (delete_cmd_->parsed()) {
    return executeDelete(options);
  }
  return makeErrorResult<int>(ErrorCode::kInvalidArgument, "Unknown section subcommand");
}

Result<int> SectionCommand::executeRead(const GlobalOptions& options) {
  auto content = app_.operations().readSection(note_name_, section_);
  if (!content.has_value()) {
    return std::unexpected(content.error());
  }

  if (options.json) {
    printJson({{"name", note_name_}, {"section", section_}, {"content", *content}});
  } else {
    std::cout << *content << "\n";
  }
  return 0;
}

Result<int> SectionCommand::executeWrite(const GlobalOptions& options) {
  auto text = inputText(text_, from_stdin_);
  if (!text.has_value()) {
    return std::unexpected(text.error());
  }

  bool appending = append_cmd_->parsed();
  auto& ops = app_.operations();
  auto result = appending ? ops.appendSection(note_name_, section_, *text)
                          : ops.updateSection(note_name_, section_, *text);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  if (options.json) {
    printJson({{"name", result->name},
               {"section", section_},
               {"warnings", warningsToJson(result->warnings)}});
  } else {
    printWarnings(options, result->warnings);
    if (!options.quiet) {
      std::cout << (appending ? "Appended to section '" : "Updated section '") << section_
                << "' in " << result->name << "\n";
    }
  }
  return 0;
}

Result<int> SectionCommand::executeDelete(const GlobalOptions& options) {
  auto result = app_.operations().deleteSection(note_name_, section_);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  if (options.json) {
    printJson({{"name", result->name},
               {"section", section_},
               {"warnings", warningsToJson(result->warnings)}});
  } else {
    printWarnings(options, result->warnings);
    if (!options.quiet) {
      std::cout << "Deleted section '" << section_ << "' from " << result->name << "\n";
    }
  }
  return 0;
}

} // namespace mdvault::cli
