#include "quire/cli/commands/search_command.hpp"

#include <algorithm>
#include <cctype>

#include "quire/cli/output.hpp"

namespace quire::cli {

SearchCommand::SearchCommand(Application& app) : app_(app) {}

Result<int> SearchCommand::execute(const GlobalOptions& options) {
  // The shell has already split the query; words with spaces were quoted
  std::string query;
  for (const auto& term : terms_) {
    if (!query.empty()) {
      query += ' ';
    }
    bool has_space = std::any_of(term.begin(), term.end(),
                                 [](unsigned char c) { return std::isspace(c) != 0; });
    if (has_space) {
      query += '"' + term + '"';
    } else {
      query += term;
    }
  }

  auto results = app_.store().search(query);
  if (!results.has_value()) {
    return std::unexpected(results.error());
  }

  printNoteList(*results, options);
  return 0;
}

void SearchCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("query", terms_, "Free text and operators, e.g. tag:work is:starred")
      ->required();
}

}  // namespace quire::cli
