#include "quire/cli/commands/dup_command.hpp"

#include "quire/cli/output.hpp"

namespace quire::cli {

DupCommand::DupCommand(Application& app) : app_(app) {}

Result<int> DupCommand::execute(const GlobalOptions& options) {
  auto id = parseNoteId(note_id_);
  if (!id.has_value()) {
    return std::unexpected(id.error());
  }

  auto copy = app_.store().duplicate(*id);
  if (!copy.has_value()) {
    return std::unexpected(copy.error());
  }

  printNote(*copy, options);
  return 0;
}

void DupCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("note_id", note_id_, "Note to copy")->required();
}

}  // namespace quire::cli
