#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "quire/cli/application.hpp"

namespace quire::cli {

/**
 * @brief Tag listing and batch tag edits
 *
 * Supports subcommands:
 * - list: All tags with note counts (default)
 * - add: Add a tag to notes
 * - rm: Remove a tag from notes
 */
class TagsCommand : public Command {
public:
  explicit TagsCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "tags"; }
  std::string description() const override { return "List tags or edit them on notes"; }
  void setupCommand(CLI::App* cmd) override;

private:
  enum class SubCommand {
    List,
    Add,
    Remove
  };

  Result<int> executeList(const GlobalOptions& options);
  Result<int> executeEdit(const GlobalOptions& options);

  Application& app_;
  SubCommand sub_command_ = SubCommand::List;
  std::string tag_;
  std::vector<std::string> note_ids_;
};

}  // namespace quire::cli
