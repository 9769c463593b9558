#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "quire/cli/application.hpp"

namespace quire::cli {

class DupCommand : public Command {
public:
  explicit DupCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "dup"; }
  std::string description() const override { return "Duplicate a note"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string note_id_;
};

}  // namespace quire::cli
