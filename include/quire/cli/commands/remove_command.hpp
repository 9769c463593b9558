#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "quire/cli/application.hpp"

namespace quire::cli {

class RemoveCommand : public Command {
public:
  explicit RemoveCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "rm"; }
  std::string description() const override { return "Delete notes with their history and attachments"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::vector<std::string> note_ids_;
};

}  // namespace quire::cli
