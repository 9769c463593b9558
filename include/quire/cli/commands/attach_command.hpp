#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "quire/cli/application.hpp"

namespace quire::cli {

/**
 * @brief Attachment management command
 *
 * Supports subcommands:
 * - add: Copy files into a note's attachment directory
 * - paste: Store raw data (a file or stdin) as an attachment
 * - rm: Delete an attachment
 * - rename: Rename an attachment, keeping its extension
 * - path: Print the absolute path of an attachment
 */
class AttachCommand : public Command {
public:
  explicit AttachCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "attach"; }
  std::string description() const override { return "Manage note attachments"; }
  void setupCommand(CLI::App* cmd) override;

private:
  enum class SubCommand {
    Add,
    Paste,
    Remove,
    Rename,
    Path
  };

  Result<int> executeAdd(const GlobalOptions& options);
  Result<int> executePaste(const GlobalOptions& options);
  Result<int> executeRemove(const GlobalOptions& options);
  Result<int> executeRename(const GlobalOptions& options);
  Result<int> executePath(const GlobalOptions& options);

  Application& app_;
  SubCommand sub_command_ = SubCommand::Add;
  std::string note_id_;
  std::vector<std::string> files_;
  std::string relative_path_;
  std::string name_;
  std::string input_file_ = "-";
};

}  // namespace quire::cli
