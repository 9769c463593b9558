#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "quire/cli/application.hpp"

namespace quire::cli {

/**
 * @brief Read and write config.toml values by dotted key
 */
class ConfigCommand : public Command {
public:
  explicit ConfigCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "config"; }
  std::string description() const override { return "Show or change configuration"; }
  void setupCommand(CLI::App* cmd) override;

private:
  enum class SubCommand {
    List,
    Get,
    Set
  };

  Result<int> executeList(const GlobalOptions& options);
  Result<int> executeGet(const GlobalOptions& options);
  Result<int> executeSet(const GlobalOptions& options);

  Application& app_;
  SubCommand sub_command_ = SubCommand::List;
  std::string key_;
  std::string value_;
};

}  // namespace quire::cli
