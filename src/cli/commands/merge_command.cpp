#include "quire/cli/commands/merge_command.hpp"

#include "quire/cli/output.hpp"

namespace quire::cli {

MergeCommand::MergeCommand(Application& app) : app_(app) {}

Result<int> MergeCommand::execute(const GlobalOptions& options) {
  auto ids = parseNoteIds(note_ids_);
  if (!ids.has_value()) {
    return std::unexpected(ids.error());
  }

  auto merged = app_.store().merge(*ids);
  if (!merged.has_value()) {
    return std::unexpected(merged.error());
  }

  printNote(*merged, options);
  return 0;
}

void MergeCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("note_ids", note_ids_, "Notes to merge; the first one is kept")
      ->required()
      ->expected(2, -1);
}

}  // namespace quire::cli
