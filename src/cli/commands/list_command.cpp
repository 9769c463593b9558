#include "quire/cli/commands/list_command.hpp"

#include <algorithm>

#include "quire/cli/output.hpp"

namespace quire::cli {

ListCommand::ListCommand(Application& app) : app_(app) {}

Result<int> ListCommand::execute(const GlobalOptions& options) {
  auto notes = app_.store().listNotes();
  if (!notes.has_value()) {
    return std::unexpected(notes.error());
  }

  std::erase_if(*notes, [this](const core::Metadata& metadata) {
    if (starred_ && !metadata.important()) {
      return true;
    }
    if (!notebook_.empty() && metadata.notebook() != notebook_) {
      return true;
    }
    return false;
  });

  printNoteList(*notes, options);
  return 0;
}

void ListCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("--notebook", notebook_, "Only notes filed under this notebook id");
  cmd->add_flag("--starred", starred_, "Only starred notes");
}

}  // namespace quire::cli
