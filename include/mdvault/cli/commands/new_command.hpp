#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "mdvault/cli/application.hpp"

namespace mdvault::cli {

class NewCommand : public Command {
public:
  explicit NewCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "new"; }
  std::string description() const override { return "Create a new note"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  std::string note_name_;
  std::string content_;
  bool from_stdin_ = false;
  std::string frontmatter_json_;
  std::vector<std::string> tags_;
  bool allow_new_tags_ = false;

  Result<core::FrontMatter> buildFrontMatter() const;
};

} // namespace mdvault::cli
