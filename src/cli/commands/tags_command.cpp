#include "quire/cli/commands/tags_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "quire/cli/output.hpp"

namespace quire::cli {

TagsCommand::TagsCommand(Application& app) : app_(app) {}

Result<int> TagsCommand::execute(const GlobalOptions& options) {
  switch (sub_command_) {
    case SubCommand::List:
      return executeList(options);
    case SubCommand::Add:
    case SubCommand::Remove:
      return executeEdit(options);
  }
  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Invalid subcommand"));
}

void TagsCommand::setupCommand(CLI::App* cmd) {
  auto* list_cmd = cmd->add_subcommand("list", "List all tags with note counts");
  list_cmd->callback([this]() { sub_command_ = SubCommand::List; });

  auto* add_cmd = cmd->add_subcommand("add", "Add a tag to notes");
  add_cmd->add_option("tag", tag_, "Tag")->required();
  add_cmd->add_option("note_ids", note_ids_, "Note IDs")->required();
  add_cmd->callback([this]() { sub_command_ = SubCommand::Add; });

  auto* rm_cmd = cmd->add_subcommand("rm", "Remove a tag from notes");
  rm_cmd->add_option("tag", tag_, "Tag")->required();
  rm_cmd->add_option("note_ids", note_ids_, "Note IDs")->required();
  rm_cmd->callback([this]() { sub_command_ = SubCommand::Remove; });

  cmd->require_subcommand(0, 1);
}

Result<int> TagsCommand::executeList(const GlobalOptions& options) {
  auto tags = app_.store().listTags();
  if (!tags.has_value()) {
    return std::unexpected(tags.error());
  }

  if (options.json) {
    nlohmann::json output = nlohmann::json::array();
    for (const auto& entry : *tags) {
      output.push_back({{"tag", entry.tag}, {"count", entry.count}});
    }
    printJson(output);
    return 0;
  }

  if (tags->empty()) {
    if (!options.quiet) {
      std::cout << "No tags found." << std::endl;
    }
    return 0;
  }
  for (const auto& entry : *tags) {
    std::cout << entry.tag << " (" << entry.count << ")" << std::endl;
  }
  return 0;
}

Result<int> TagsCommand::executeEdit(const GlobalOptions& options) {
  auto ids = parseNoteIds(note_ids_);
  if (!ids.has_value()) {
    return std::unexpected(ids.error());
  }

  auto updated = sub_command_ == SubCommand::Add ? app_.store().addTag(*ids, tag_)
                                                 : app_.store().removeTag(*ids, tag_);
  if (!updated.has_value()) {
    return std::unexpected(updated.error());
  }

  printNoteList(*updated, options);
  return 0;
}

}  // namespace quire::cli
