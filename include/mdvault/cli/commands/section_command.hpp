#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "mdvault/cli/application.hpp"

namespace mdvault::cli {

class SectionCommand : public Command {
public:
  explicit SectionCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "section"; }
  std::string description() const override { return "Read or edit a section under a heading"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  // Subcommands
  CLI::App* read_cmd_ = nullptr;
  CLI::App* append_cmd_ = nullptr;
  CLI::App* update_cmd_ = nullptr;
  CLI::App* delete_cmd_ = nullptr;

  std::string note_name_;
  std::string section_;
  std::string text_;
  bool from_stdin_ = false;

  Result<int> executeRead(const GlobalOptions& options);
  Result<int> executeWrite(const GlobalOptions& options);
  Result<int> executeDelete(const GlobalOptions& options);
};

} // namespace mdvault::cli
