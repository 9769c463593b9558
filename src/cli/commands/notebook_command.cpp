#include "quire/cli/commands/notebook_command.hpp"

#include <iostream>
#include <optional>

#include <nlohmann/json.hpp>

#include "quire/cli/output.hpp"
#include "quire/store/notebook_manager.hpp"

namespace quire::cli {

NotebookCommand::NotebookCommand(Application& app) : app_(app) {}

Result<int> NotebookCommand::execute(const GlobalOptions& options) {
  switch (sub_command_) {
    case SubCommand::List:
      return executeList(options);
    case SubCommand::Create:
      return executeCreate(options);
    case SubCommand::Rename:
      return executeRename(options);
    case SubCommand::Archive:
      return executeArchive(options, true);
    case SubCommand::Unarchive:
      return executeArchive(options, false);
    case SubCommand::Move:
      return executeMove(options);
  }
  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Invalid subcommand"));
}

std::string NotebookCommand::name() const {
  return "notebook";
}

std::string NotebookCommand::description() const {
  return "Manage notebooks";
}

void NotebookCommand::setupCommand(CLI::App* cmd) {
  auto* list_cmd = cmd->add_subcommand("list", "List all notebooks");
  list_cmd->callback([this]() { sub_command_ = SubCommand::List; });

  auto* create_cmd = cmd->add_subcommand("create", "Create a new notebook");
  create_cmd->add_option("name", notebook_name_, "Notebook name")->required();
  create_cmd->callback([this]() { sub_command_ = SubCommand::Create; });

  auto* rename_cmd = cmd->add_subcommand("rename", "Rename an existing notebook");
  rename_cmd->add_option("notebook_id", notebook_id_, "Notebook ID")->required();
  rename_cmd->add_option("name", notebook_name_, "New notebook name")->required();
  rename_cmd->callback([this]() { sub_command_ = SubCommand::Rename; });

  auto* archive_cmd = cmd->add_subcommand("archive", "Archive a notebook");
  archive_cmd->add_option("notebook_id", notebook_id_, "Notebook ID")->required();
  archive_cmd->callback([this]() { sub_command_ = SubCommand::Archive; });

  auto* unarchive_cmd = cmd->add_subcommand("unarchive", "Unarchive a notebook");
  unarchive_cmd->add_option("notebook_id", notebook_id_, "Notebook ID")->required();
  unarchive_cmd->callback([this]() { sub_command_ = SubCommand::Unarchive; });

  auto* move_cmd = cmd->add_subcommand("move", "File a note under a notebook");
  move_cmd->add_option("note_id", note_id_, "Note ID")->required();
  move_cmd->add_option("notebook_id", notebook_id_, "Target notebook; omit to unfile");
  move_cmd->callback([this]() { sub_command_ = SubCommand::Move; });

  // Require exactly one subcommand
  cmd->require_subcommand(1, 1);
}

Result<int> NotebookCommand::executeList(const GlobalOptions& options) {
  auto notebooks = app_.notebookManager().list();

  if (!options.json && notebooks.empty()) {
    if (!options.quiet) {
      std::cout << "No notebooks found." << std::endl;
    }
    return 0;
  }

  printNotebookList(notebooks, options);
  return 0;
}

Result<int> NotebookCommand::executeCreate(const GlobalOptions& options) {
  auto notebook = app_.notebookManager().create(notebook_name_);
  if (!notebook.has_value()) {
    return std::unexpected(notebook.error());
  }

  printNotebook(*notebook, options);
  return 0;
}

Result<int> NotebookCommand::executeRename(const GlobalOptions& options) {
  auto notebook = app_.notebookManager().rename(notebook_id_, notebook_name_);
  if (!notebook.has_value()) {
    return std::unexpected(notebook.error());
  }

  printNotebook(*notebook, options);
  return 0;
}

Result<int> NotebookCommand::executeArchive(const GlobalOptions& options, bool archived) {
  auto& manager = app_.notebookManager();
  auto notebook = archived ? manager.archive(notebook_id_) : manager.unarchive(notebook_id_);
  if (!notebook.has_value()) {
    return std::unexpected(notebook.error());
  }

  printNotebook(*notebook, options);
  return 0;
}

Result<int> NotebookCommand::executeMove(const GlobalOptions& options) {
  auto id = parseNoteId(note_id_);
  if (!id.has_value()) {
    return std::unexpected(id.error());
  }

  std::optional<std::string> target;
  if (!notebook_id_.empty()) {
    target = notebook_id_;
  }

  auto note = app_.notebookManager().moveNote(*id, target);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  printNote(*note, options);
  return 0;
}

void NotebookCommand::printNotebookList(const std::vector<core::Notebook>& notebooks,
                                        const GlobalOptions& options) const {
  if (options.json) {
    nlohmann::json output = nlohmann::json::array();
    for (const auto& notebook : notebooks) {
      output.push_back(notebook.toJson());
    }
    printJson(output);
    return;
  }

  for (const auto& notebook : notebooks) {
    printNotebook(notebook, options);
  }
}

}  // namespace quire::cli
