#include "quire/cli/commands/view_command.hpp"

#include "quire/cli/output.hpp"

namespace quire::cli {

ViewCommand::ViewCommand(Application& app) : app_(app) {}

Result<int> ViewCommand::execute(const GlobalOptions& options) {
  auto id = parseNoteId(note_id_);
  if (!id.has_value()) {
    return std::unexpected(id.error());
  }

  auto note = app_.store().read(*id);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  printNote(*note, options);
  return 0;
}

void ViewCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("note_id", note_id_, "Note ID")->required();
}

}  // namespace quire::cli
