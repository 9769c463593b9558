#include "quire/cli/commands/daily_command.hpp"

#include "quire/cli/output.hpp"

namespace quire::cli {

DailyCommand::DailyCommand(Application& app) : app_(app) {}

Result<int> DailyCommand::execute(const GlobalOptions& options) {
  auto note = app_.store().getOrCreateDaily();
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  printNote(*note, options);
  return 0;
}

}  // namespace quire::cli
