#include "quire/cli/commands/sync_command.hpp"

#include <iostream>
#include <optional>

#include <nlohmann/json.hpp>

#include "quire/cli/output.hpp"

namespace quire::cli {

SyncCommand::SyncCommand(Application& app) : app_(app) {}

Result<int> SyncCommand::execute(const GlobalOptions& options) {
  auto& backup = app_.backupManager();
  switch (sub_command_) {
    case SubCommand::Folder:
      return executeFolder(options);
    case SubCommand::Push:
      return reportSummary(backup.push(), "Pushed", options);
    case SubCommand::Pull:
      return reportSummary(backup.pull(), "Pulled", options);
    case SubCommand::Export:
      return reportSummary(backup.exportTo(directory_), "Exported", options);
    case SubCommand::Import:
      return reportSummary(backup.importFrom(directory_), "Imported", options);
  }
  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Invalid subcommand"));
}

void SyncCommand::setupCommand(CLI::App* cmd) {
  auto* folder_cmd = cmd->add_subcommand("folder", "Show or set the sync folder");
  auto* path = folder_cmd->add_option("path", directory_, "New sync folder");
  auto* clear = folder_cmd->add_flag("--clear", clear_, "Forget the sync folder");
  path->excludes(clear);
  folder_cmd->callback([this]() { sub_command_ = SubCommand::Folder; });

  auto* push_cmd = cmd->add_subcommand("push", "Copy the store into the sync folder");
  push_cmd->callback([this]() { sub_command_ = SubCommand::Push; });

  auto* pull_cmd = cmd->add_subcommand("pull", "Replace the store with the sync folder's copy");
  pull_cmd->callback([this]() { sub_command_ = SubCommand::Pull; });

  auto* export_cmd = cmd->add_subcommand("export", "Copy the store into a directory");
  export_cmd->add_option("directory", directory_, "Target directory")->required();
  export_cmd->callback([this]() { sub_command_ = SubCommand::Export; });

  auto* import_cmd = cmd->add_subcommand("import", "Replace the store with a backup");
  import_cmd->add_option("directory", directory_, "Backup directory")->required();
  import_cmd->callback([this]() { sub_command_ = SubCommand::Import; });

  cmd->require_subcommand(1, 1);
}

Result<int> SyncCommand::executeFolder(const GlobalOptions& options) {
  auto& backup = app_.backupManager();

  if (clear_ || !directory_.empty()) {
    std::optional<std::filesystem::path> folder;
    if (!clear_) {
      folder = directory_;
    }
    auto set = backup.setSyncFolder(folder);
    if (!set.has_value()) {
      return std::unexpected(set.error());
    }
  }

  auto folder = backup.syncFolder();
  if (options.json) {
    nlohmann::json output;
    output["syncFolder"] = folder.has_value() ? nlohmann::json(*folder) : nlohmann::json(nullptr);
    printJson(output);
  } else if (folder.has_value()) {
    std::cout << *folder << std::endl;
  } else if (!options.quiet) {
    std::cout << "No sync folder set." << std::endl;
  }
  return 0;
}

Result<int> SyncCommand::reportSummary(const Result<sync::BackupSummary>& summary,
                                       const std::string& action,
                                       const GlobalOptions& options) {
  if (!summary.has_value()) {
    return std::unexpected(summary.error());
  }

  if (options.json) {
    printJson({{"notes", summary->notes}, {"pruned", summary->pruned}});
  } else if (!options.quiet) {
    std::cout << action << " " << summary->notes << " note(s)";
    if (summary->pruned > 0) {
      std::cout << ", pruned " << summary->pruned << " orphaned entr"
                << (summary->pruned == 1 ? "y" : "ies");
    }
    std::cout << std::endl;
  }
  return 0;
}

}  // namespace quire::cli
