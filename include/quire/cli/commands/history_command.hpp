#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "quire/cli/application.hpp"

namespace quire::cli {

/**
 * @brief Version history of a note
 *
 * `history ID` lists snapshots newest first; `show` prints one and
 * `restore` makes it current again (the current state is snapshotted
 * first).
 */
class HistoryCommand : public Command {
public:
  explicit HistoryCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "history"; }
  std::string description() const override { return "List, show or restore note versions"; }
  void setupCommand(CLI::App* cmd) override;

private:
  enum class SubCommand {
    List,
    Show,
    Restore
  };

  Result<int> executeList(const GlobalOptions& options);
  Result<int> executeShow(const GlobalOptions& options);
  Result<int> executeRestore(const GlobalOptions& options);

  Application& app_;
  SubCommand sub_command_ = SubCommand::List;
  std::string note_id_;
  std::string saved_at_;
};

}  // namespace quire::cli
