#include "quire/cli/commands/attach_command.hpp"

#include <filesystem>
#include <iostream>

#include <nlohmann/json.hpp>

#include "quire/cli/output.hpp"

namespace quire::cli {

AttachCommand::AttachCommand(Application& app) : app_(app) {}

Result<int> AttachCommand::execute(const GlobalOptions& options) {
  switch (sub_command_) {
    case SubCommand::Add:
      return executeAdd(options);
    case SubCommand::Paste:
      return executePaste(options);
    case SubCommand::Remove:
      return executeRemove(options);
    case SubCommand::Rename:
      return executeRename(options);
    case SubCommand::Path:
      return executePath(options);
  }
  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Invalid subcommand"));
}

void AttachCommand::setupCommand(CLI::App* cmd) {
  auto* add_cmd = cmd->add_subcommand("add", "Attach files to a note");
  add_cmd->add_option("note_id", note_id_, "Note ID")->required();
  add_cmd->add_option("files", files_, "Files to copy in, relative to the current directory")
      ->required();
  add_cmd->callback([this]() { sub_command_ = SubCommand::Add; });

  auto* paste_cmd = cmd->add_subcommand("paste", "Attach raw data under a name");
  paste_cmd->add_option("note_id", note_id_, "Note ID")->required();
  paste_cmd->add_option("name", name_, "Suggested file name")->required();
  paste_cmd->add_option("-f,--file", input_file_, "Read data from a file ('-' for stdin)")
      ->capture_default_str();
  paste_cmd->callback([this]() { sub_command_ = SubCommand::Paste; });

  auto* rm_cmd = cmd->add_subcommand("rm", "Delete an attachment");
  rm_cmd->add_option("note_id", note_id_, "Note ID")->required();
  rm_cmd->add_option("path", relative_path_, "Attachment path (images/<id>/<file>)")->required();
  rm_cmd->callback([this]() { sub_command_ = SubCommand::Remove; });

  auto* rename_cmd = cmd->add_subcommand("rename", "Rename an attachment");
  rename_cmd->add_option("note_id", note_id_, "Note ID")->required();
  rename_cmd->add_option("path", relative_path_, "Attachment path")->required();
  rename_cmd->add_option("name", name_, "New display name")->required();
  rename_cmd->callback([this]() { sub_command_ = SubCommand::Rename; });

  auto* path_cmd = cmd->add_subcommand("path", "Print the absolute path of an attachment");
  path_cmd->add_option("path", relative_path_, "Attachment path")->required();
  path_cmd->callback([this]() { sub_command_ = SubCommand::Path; });

  cmd->require_subcommand(1, 1);
}

Result<int> AttachCommand::executeAdd(const GlobalOptions& options) {
  auto id = parseNoteId(note_id_);
  if (!id.has_value()) {
    return std::unexpected(id.error());
  }

  std::vector<std::filesystem::path> sources(files_.begin(), files_.end());
  auto note = app_.store().attach(*id, sources);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  printNote(*note, options);
  return 0;
}

Result<int> AttachCommand::executePaste(const GlobalOptions& options) {
  auto id = parseNoteId(note_id_);
  if (!id.has_value()) {
    return std::unexpected(id.error());
  }

  auto data = readTextInput(input_file_);
  if (!data.has_value()) {
    return std::unexpected(data.error());
  }

  auto note = app_.store().attachFromData(*id, *data, name_);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  printNote(*note, options);
  return 0;
}

Result<int> AttachCommand::executeRemove(const GlobalOptions& options) {
  auto id = parseNoteId(note_id_);
  if (!id.has_value()) {
    return std::unexpected(id.error());
  }

  auto note = app_.store().removeAttachment(*id, relative_path_);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  printNote(*note, options);
  return 0;
}

Result<int> AttachCommand::executeRename(const GlobalOptions& options) {
  auto id = parseNoteId(note_id_);
  if (!id.has_value()) {
    return std::unexpected(id.error());
  }

  auto note = app_.store().renameAttachment(*id, relative_path_, name_);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  printNote(*note, options);
  return 0;
}

Result<int> AttachCommand::executePath(const GlobalOptions& options) {
  auto path = app_.store().resolveAttachment(relative_path_);
  if (!path.has_value()) {
    return std::unexpected(path.error());
  }

  if (options.json) {
    printJson({{"path", relative_path_}, {"absolutePath", path->string()}});
  } else {
    std::cout << path->string() << std::endl;
  }
  return 0;
}

}  // namespace quire::cli
