#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "quire/cli/application.hpp"
#include "quire/common.hpp"
#include "quire/core/notebook.hpp"

namespace quire::cli {

/**
 * @brief Notebook management command
 *
 * Supports subcommands:
 * - list: List all notebooks
 * - create: Create a new notebook
 * - rename: Rename an existing notebook
 * - archive / unarchive: Toggle the archived flag
 * - move: File a note under a notebook, or unfile it
 */
class NotebookCommand : public Command {
public:
  explicit NotebookCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override;
  std::string description() const override;
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  // Subcommands
  enum class SubCommand {
    List,
    Create,
    Rename,
    Archive,
    Unarchive,
    Move
  };

  SubCommand sub_command_ = SubCommand::List;

  // Command-specific options
  std::string notebook_id_;
  std::string notebook_name_;
  std::string note_id_;           // For move command

  // Subcommand implementations
  Result<int> executeList(const GlobalOptions& options);
  Result<int> executeCreate(const GlobalOptions& options);
  Result<int> executeRename(const GlobalOptions& options);
  Result<int> executeArchive(const GlobalOptions& options, bool archived);
  Result<int> executeMove(const GlobalOptions& options);

  void printNotebookList(const std::vector<core::Notebook>& notebooks,
                         const GlobalOptions& options) const;
};

}  // namespace quire::cli
