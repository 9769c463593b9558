#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "quire/cli/application.hpp"

namespace quire::cli {

class BacklinksCommand : public Command {
public:
  explicit BacklinksCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "backlinks"; }
  std::string description() const override { return "Show notes linking to a note"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string note_id_;
};

}  // namespace quire::cli
