#include "quire/cli/commands/save_command.hpp"

#include <optional>

#include "quire/cli/output.hpp"

namespace quire::cli {

SaveCommand::SaveCommand(Application& app) : app_(app) {}

Result<int> SaveCommand::execute(const GlobalOptions& options) {
  std::optional<core::NoteId> id;
  if (!note_id_.empty()) {
    auto parsed = parseNoteId(note_id_);
    if (!parsed.has_value()) {
      return std::unexpected(parsed.error());
    }
    id = *parsed;
  }

  std::string body = body_;
  if (!file_.empty()) {
    auto content = readTextInput(file_);
    if (!content.has_value()) {
      return std::unexpected(content.error());
    }
    body = std::move(*content);
  }

  auto note = app_.store().save(id, title_, body);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  printNote(*note, options);
  return 0;
}

void SaveCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("--id", note_id_, "Existing note to update; omit to create");
  cmd->add_option("-t,--title", title_, "Note title")->required();
  auto* body = cmd->add_option("-b,--body", body_, "Note body");
  auto* file = cmd->add_option("-f,--file", file_, "Read the body from a file ('-' for stdin)");
  body->excludes(file);
  file->excludes(body);
}

}  // namespace quire::cli
