#include "quire/cli/commands/backlinks_command.hpp"

#include <iostream>

#include "quire/cli/output.hpp"

namespace quire::cli {

BacklinksCommand::BacklinksCommand(Application& app) : app_(app) {}

Result<int> BacklinksCommand::execute(const GlobalOptions& options) {
  auto id = parseNoteId(note_id_);
  if (!id.has_value()) {
    return std::unexpected(id.error());
  }

  auto backlinks = app_.store().getBacklinks(*id);
  if (!backlinks.has_value()) {
    return std::unexpected(backlinks.error());
  }

  if (!options.json && backlinks->empty()) {
    if (!options.quiet) {
      std::cout << "No backlinks found for note: " << id->toString() << std::endl;
    }
    return 0;
  }

  printNoteList(*backlinks, options);
  return 0;
}

void BacklinksCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("note_id", note_id_, "Note ID to find backlinks for")->required();
}

}  // namespace quire::cli
