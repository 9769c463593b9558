#include "quire/cli/commands/title_command.hpp"

#include "quire/cli/output.hpp"

namespace quire::cli {

TitleCommand::TitleCommand(Application& app) : app_(app) {}

Result<int> TitleCommand::execute(const GlobalOptions& options) {
  auto id = parseNoteId(note_id_);
  if (!id.has_value()) {
    return std::unexpected(id.error());
  }

  auto note = app_.store().updateTitle(*id, title_);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  printNote(*note, options);
  return 0;
}

void TitleCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("note_id", note_id_, "Note ID")->required();
  cmd->add_option("title", title_, "New title")->required();
}

}  // namespace quire::cli
