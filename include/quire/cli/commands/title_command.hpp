#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "quire/cli/application.hpp"

namespace quire::cli {

class TitleCommand : public Command {
public:
  explicit TitleCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "title"; }
  std::string description() const override { return "Change a note title"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string note_id_;
  std::string title_;
};

}  // namespace quire::cli
