#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "quire/cli/application.hpp"

namespace quire::cli {

class SaveCommand : public Command {
public:
  explicit SaveCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "save"; }
  std::string description() const override { return "Create or update a note"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string note_id_;
  std::string title_;
  std::string body_;
  std::string file_;
};

}  // namespace quire::cli
