#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "quire/cli/application.hpp"

namespace quire::cli {

class MergeCommand : public Command {
public:
  explicit MergeCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "merge"; }
  std::string description() const override { return "Merge notes into the first one given"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::vector<std::string> note_ids_;
};

}  // namespace quire::cli
