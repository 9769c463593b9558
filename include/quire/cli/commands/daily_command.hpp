#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "quire/cli/application.hpp"

namespace quire::cli {

class DailyCommand : public Command {
public:
  explicit DailyCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "daily"; }
  std::string description() const override { return "Open or create today's daily note"; }

private:
  Application& app_;
};

}  // namespace quire::cli
