#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "quire/cli/application.hpp"

namespace quire::cli {

class SearchCommand : public Command {
public:
  explicit SearchCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "search"; }
  std::string description() const override { return "Search notes (tag:, is:, has:, date: operators)"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::vector<std::string> terms_;
};

}  // namespace quire::cli
