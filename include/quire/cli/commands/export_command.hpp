#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "quire/cli/application.hpp"

namespace quire::cli {

class ExportCommand : public Command {
public:
  explicit ExportCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "export"; }
  std::string description() const override { return "Export a note as Markdown or plain text"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string note_id_;
  std::string format_ = "md";
  std::string output_;
};

}  // namespace quire::cli
