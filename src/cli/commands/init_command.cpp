#include "quire/cli/commands/init_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "quire/cli/output.hpp"

namespace quire::cli {

InitCommand::InitCommand(Application& app) : app_(app) {}

// The layout is created when the application opens the store
Result<int> InitCommand::execute(const GlobalOptions& options) {
  const auto& root = app_.store().root();
  if (options.json) {
    printJson({{"root", root.string()}});
  } else if (!options.quiet) {
    std::cout << "Initialized store at " << root.string() << std::endl;
  }
  return 0;
}

}  // namespace quire::cli
