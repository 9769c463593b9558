#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "quire/cli/application.hpp"

namespace quire::cli {

/**
 * @brief Template management command
 *
 * Supports subcommands:
 * - list: Built-in and custom templates
 * - save: Store a custom template
 * - rm: Delete a custom template
 * - new: Create a note from a template
 */
class TplCommand : public Command {
public:
  explicit TplCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "tpl"; }
  std::string description() const override { return "Manage note templates"; }
  void setupCommand(CLI::App* cmd) override;

private:
  enum class SubCommand {
    List,
    Save,
    Remove,
    New
  };

  Result<int> executeList(const GlobalOptions& options);
  Result<int> executeSave(const GlobalOptions& options);
  Result<int> executeRemove(const GlobalOptions& options);
  Result<int> executeNew(const GlobalOptions& options);

  Application& app_;
  SubCommand sub_command_ = SubCommand::List;
  std::string template_id_;
  std::string template_name_;
  std::string body_;
  std::string file_;
  std::string title_;
};

}  // namespace quire::cli
