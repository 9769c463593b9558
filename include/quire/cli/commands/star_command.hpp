#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "quire/cli/application.hpp"

namespace quire::cli {

class StarCommand : public Command {
public:
  explicit StarCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "star"; }
  std::string description() const override { return "Toggle or set the star on notes"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::vector<std::string> note_ids_;
  std::string set_;
};

}  // namespace quire::cli
