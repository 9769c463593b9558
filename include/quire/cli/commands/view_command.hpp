#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "quire/cli/application.hpp"

namespace quire::cli {

class ViewCommand : public Command {
public:
  explicit ViewCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "view"; }
  std::string description() const override { return "Show a note"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string note_id_;
};

}  // namespace quire::cli
