#include "quire/cli/commands/remove_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "quire/cli/output.hpp"

namespace quire::cli {

RemoveCommand::RemoveCommand(Application& app) : app_(app) {}

Result<int> RemoveCommand::execute(const GlobalOptions& options) {
  auto ids = parseNoteIds(note_ids_);
  if (!ids.has_value()) {
    return std::unexpected(ids.error());
  }

  auto result = ids->size() == 1 ? app_.store().remove(ids->front())
                                 : app_.store().removeMany(*ids);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  if (options.json) {
    printJson({{"deleted", note_ids_}});
  } else if (!options.quiet) {
    std::cout << "Deleted " << ids->size() << " note(s)" << std::endl;
  }
  return 0;
}

void RemoveCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("note_ids", note_ids_, "Note IDs")->required();
}

}  // namespace quire::cli
