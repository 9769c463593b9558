#include "quire/cli/commands/config_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "quire/cli/output.hpp"
#include "quire/config/config.hpp"

namespace quire::cli {

ConfigCommand::ConfigCommand(Application& app) : app_(app) {}

Result<int> ConfigCommand::execute(const GlobalOptions& options) {
  switch (sub_command_) {
    case SubCommand::List:
      return executeList(options);
    case SubCommand::Get:
      return executeGet(options);
    case SubCommand::Set:
      return executeSet(options);
  }
  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Invalid subcommand"));
}

void ConfigCommand::setupCommand(CLI::App* cmd) {
  auto* list_cmd = cmd->add_subcommand("list", "Show every setting");
  list_cmd->callback([this]() { sub_command_ = SubCommand::List; });

  auto* get_cmd = cmd->add_subcommand("get", "Show one setting");
  get_cmd->add_option("key", key_, "Dotted key, e.g. versions.preview_length")->required();
  get_cmd->callback([this]() { sub_command_ = SubCommand::Get; });

  auto* set_cmd = cmd->add_subcommand("set", "Change one setting and save the file");
  set_cmd->add_option("key", key_, "Dotted key")->required();
  set_cmd->add_option("value", value_, "New value")->required();
  set_cmd->callback([this]() { sub_command_ = SubCommand::Set; });

  cmd->require_subcommand(0, 1);
}

Result<int> ConfigCommand::executeList(const GlobalOptions& options) {
  const auto& config = app_.config();
  nlohmann::json output = nlohmann::json::object();

  for (const auto& key : config::Config::keys()) {
    auto value = config.get(key);
    if (!value.has_value()) {
      return std::unexpected(value.error());
    }
    if (options.json) {
      output[key] = *value;
    } else {
      std::cout << key << " = " << *value << std::endl;
    }
  }

  if (options.json) {
    printJson(output);
  }
  return 0;
}

Result<int> ConfigCommand::executeGet(const GlobalOptions& options) {
  auto value = app_.config().get(key_);
  if (!value.has_value()) {
    return std::unexpected(value.error());
  }

  if (options.json) {
    printJson({{"key", key_}, {"value", *value}});
  } else {
    std::cout << *value << std::endl;
  }
  return 0;
}

Result<int> ConfigCommand::executeSet(const GlobalOptions& options) {
  auto& config = app_.config();

  auto set = config.set(key_, value_);
  if (!set.has_value()) {
    return std::unexpected(set.error());
  }
  auto valid = config.validate();
  if (!valid.has_value()) {
    return std::unexpected(valid.error());
  }
  auto saved = config.save(app_.configPath());
  if (!saved.has_value()) {
    return std::unexpected(saved.error());
  }

  if (options.json) {
    printJson({{"key", key_}, {"value", value_}, {"file", app_.configPath().string()}});
  } else if (!options.quiet) {
    std::cout << key_ << " = " << value_ << std::endl;
  }
  return 0;
}

}  // namespace quire::cli
