#include "quire/cli/commands/tpl_command.hpp"

#include <iostream>
#include <optional>

#include <nlohmann/json.hpp>

#include "quire/cli/output.hpp"

namespace quire::cli {

TplCommand::TplCommand(Application& app) : app_(app) {}

Result<int> TplCommand::execute(const GlobalOptions& options) {
  switch (sub_command_) {
    case SubCommand::List:
      return executeList(options);
    case SubCommand::Save:
      return executeSave(options);
    case SubCommand::Remove:
      return executeRemove(options);
    case SubCommand::New:
      return executeNew(options);
  }
  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Invalid subcommand"));
}

void TplCommand::setupCommand(CLI::App* cmd) {
  auto* list_cmd = cmd->add_subcommand("list", "List templates");
  list_cmd->callback([this]() { sub_command_ = SubCommand::List; });

  auto* save_cmd = cmd->add_subcommand("save", "Save a custom template");
  save_cmd->add_option("name", template_name_, "Template name, also its title pattern")
      ->required();
  auto* body = save_cmd->add_option("-b,--body", body_, "Template body");
  auto* file = save_cmd->add_option("-f,--file", file_, "Read the body from a file ('-' for stdin)");
  body->excludes(file);
  file->excludes(body);
  save_cmd->callback([this]() { sub_command_ = SubCommand::Save; });

  auto* rm_cmd = cmd->add_subcommand("rm", "Delete a custom template");
  rm_cmd->add_option("template_id", template_id_, "Template ID")->required();
  rm_cmd->callback([this]() { sub_command_ = SubCommand::Remove; });

  auto* new_cmd = cmd->add_subcommand("new", "Create a note from a template");
  new_cmd->add_option("template_id", template_id_, "Template ID")->required();
  new_cmd->add_option("-t,--title", title_, "Title instead of the template's pattern");
  new_cmd->callback([this]() { sub_command_ = SubCommand::New; });

  cmd->require_subcommand(1, 1);
}

Result<int> TplCommand::executeList(const GlobalOptions& options) {
  auto templates = app_.templateManager().list();

  if (options.json) {
    nlohmann::json output = nlohmann::json::array();
    for (const auto& tmpl : templates) {
      output.push_back(tmpl.toJson());
    }
    printJson(output);
    return 0;
  }

  for (const auto& tmpl : templates) {
    std::cout << tmpl.id << "  " << tmpl.name;
    if (tmpl.is_custom) {
      std::cout << "  [custom]";
    }
    std::cout << std::endl;
  }
  return 0;
}

Result<int> TplCommand::executeSave(const GlobalOptions& options) {
  std::string body = body_;
  if (!file_.empty()) {
    auto content = readTextInput(file_);
    if (!content.has_value()) {
      return std::unexpected(content.error());
    }
    body = std::move(*content);
  }

  auto tmpl = app_.templateManager().saveCustom(template_name_, body);
  if (!tmpl.has_value()) {
    return std::unexpected(tmpl.error());
  }

  if (options.json) {
    printJson(tmpl->toJson());
  } else if (options.quiet) {
    std::cout << tmpl->id << std::endl;
  } else {
    std::cout << "Saved template " << tmpl->id << " (" << tmpl->name << ")" << std::endl;
  }
  return 0;
}

Result<int> TplCommand::executeRemove(const GlobalOptions& options) {
  auto removed = app_.templateManager().deleteCustom(template_id_);
  if (!removed.has_value()) {
    return std::unexpected(removed.error());
  }

  if (options.json) {
    printJson({{"deleted", template_id_}});
  } else if (!options.quiet) {
    std::cout << "Deleted template " << template_id_ << std::endl;
  }
  return 0;
}

Result<int> TplCommand::executeNew(const GlobalOptions& options) {
  std::optional<std::string> title;
  if (!title_.empty()) {
    title = title_;
  }

  auto note = app_.templateManager().createNote(template_id_, title);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  printNote(*note, options);
  return 0;
}

}  // namespace quire::cli
