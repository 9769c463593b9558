#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "quire/cli/application.hpp"
#include "quire/sync/backup_manager.hpp"

namespace quire::cli {

/**
 * @brief Backup and sync folder command
 *
 * Supports subcommands:
 * - folder: Show, set or clear the sync folder
 * - push / pull: Copy the store to / from the sync folder
 * - export / import: Copy the store to / from an explicit directory
 */
class SyncCommand : public Command {
public:
  explicit SyncCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "sync"; }
  std::string description() const override { return "Back up, restore and sync the store"; }
  void setupCommand(CLI::App* cmd) override;

private:
  enum class SubCommand {
    Folder,
    Push,
    Pull,
    Export,
    Import
  };

  Result<int> executeFolder(const GlobalOptions& options);
  Result<int> reportSummary(const Result<sync::BackupSummary>& summary,
                            const std::string& action, const GlobalOptions& options);

  Application& app_;
  SubCommand sub_command_ = SubCommand::Folder;
  std::string directory_;
  bool clear_ = false;
};

}  // namespace quire::cli
