#include "quire/cli/commands/star_command.hpp"

#include "quire/cli/output.hpp"

namespace quire::cli {

StarCommand::StarCommand(Application& app) : app_(app) {}

Result<int> StarCommand::execute(const GlobalOptions& options) {
  auto ids = parseNoteIds(note_ids_);
  if (!ids.has_value()) {
    return std::unexpected(ids.error());
  }

  if (!set_.empty()) {
    auto updated = app_.store().setStarred(*ids, set_ == "on");
    if (!updated.has_value()) {
      return std::unexpected(updated.error());
    }
    printNoteList(*updated, options);
    return 0;
  }

  // Without --set each note flips independently
  std::vector<core::Metadata> updated;
  for (const auto& id : *ids) {
    auto note = app_.store().toggleStar(id);
    if (!note.has_value()) {
      return std::unexpected(note.error());
    }
    updated.push_back(note->metadata());
  }
  printNoteList(updated, options);
  return 0;
}

void StarCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("note_ids", note_ids_, "Note IDs")->required();
  cmd->add_option("--set", set_, "Set instead of toggling")
      ->check(CLI::IsMember({"on", "off"}));
}

}  // namespace quire::cli
