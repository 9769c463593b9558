#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "quire/cli/application.hpp"

namespace quire::cli {

class ListCommand : public Command {
public:
  explicit ListCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "ls"; }
  std::string description() const override { return "List notes, most recently updated first"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string notebook_;
  bool starred_ = false;
};

}  // namespace quire::cli
