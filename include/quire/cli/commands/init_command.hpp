#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "quire/cli/application.hpp"

namespace quire::cli {

class InitCommand : public Command {
public:
  explicit InitCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "init"; }
  std::string description() const override { return "Create the store layout"; }

private:
  Application& app_;
};

}  // namespace quire::cli
