#include "quire/cli/commands/history_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "quire/cli/output.hpp"
#include "quire/util/time.hpp"

namespace quire::cli {

HistoryCommand::HistoryCommand(Application& app) : app_(app) {}

Result<int> HistoryCommand::execute(const GlobalOptions& options) {
  if (note_id_.empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "A note ID is required"));
  }

  switch (sub_command_) {
    case SubCommand::List:
      return executeList(options);
    case SubCommand::Show:
      return executeShow(options);
    case SubCommand::Restore:
      return executeRestore(options);
  }
  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Invalid subcommand"));
}

void HistoryCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("note_id", note_id_, "Note whose versions to list");

  auto* show_cmd = cmd->add_subcommand("show", "Print one version");
  show_cmd->add_option("note_id", note_id_, "Note ID")->required();
  show_cmd->add_option("saved_at", saved_at_, "Version timestamp")->required();
  show_cmd->callback([this]() { sub_command_ = SubCommand::Show; });

  auto* restore_cmd = cmd->add_subcommand("restore", "Make a version current again");
  restore_cmd->add_option("note_id", note_id_, "Note ID")->required();
  restore_cmd->add_option("saved_at", saved_at_, "Version timestamp")->required();
  restore_cmd->callback([this]() { sub_command_ = SubCommand::Restore; });

  cmd->require_subcommand(0, 1);
}

Result<int> HistoryCommand::executeList(const GlobalOptions& options) {
  auto id = parseNoteId(note_id_);
  if (!id.has_value()) {
    return std::unexpected(id.error());
  }

  auto versions = app_.store().listVersions(*id);
  if (!versions.has_value()) {
    return std::unexpected(versions.error());
  }

  if (options.json) {
    nlohmann::json output = nlohmann::json::array();
    for (const auto& entry : *versions) {
      output.push_back({{"savedAt", util::Time::toRfc3339(entry.saved_at)},
                        {"title", entry.title},
                        {"preview", entry.preview}});
    }
    printJson(output);
    return 0;
  }

  if (versions->empty()) {
    if (!options.quiet) {
      std::cout << "No versions recorded for note: " << id->toString() << std::endl;
    }
    return 0;
  }
  for (const auto& entry : *versions) {
    std::cout << util::Time::toRfc3339(entry.saved_at) << "  " << entry.title << std::endl;
    if (!entry.preview.empty() && !options.quiet) {
      std::cout << "    " << entry.preview << std::endl;
    }
  }
  return 0;
}

Result<int> HistoryCommand::executeShow(const GlobalOptions& options) {
  auto id = parseNoteId(note_id_);
  if (!id.has_value()) {
    return std::unexpected(id.error());
  }

  auto snapshot = app_.store().getVersion(*id, saved_at_);
  if (!snapshot.has_value()) {
    return std::unexpected(snapshot.error());
  }

  if (options.json) {
    printJson(snapshot->toJson());
  } else {
    std::cout << "# " << snapshot->title << std::endl;
    std::cout << "saved: " << util::Time::toRfc3339(snapshot->saved_at) << std::endl
              << std::endl;
    std::cout << snapshot->body << std::endl;
  }
  return 0;
}

Result<int> HistoryCommand::executeRestore(const GlobalOptions& options) {
  auto id = parseNoteId(note_id_);
  if (!id.has_value()) {
    return std::unexpected(id.error());
  }

  auto note = app_.store().restoreVersion(*id, saved_at_);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  printNote(*note, options);
  return 0;
}

}  // namespace quire::cli
