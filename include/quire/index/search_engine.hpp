#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "quire/common.hpp"
#include "quire/core/metadata.hpp"
#include "quire/index/query_parser.hpp"

namespace quire::index {

// Checklist counts of one body
struct TaskStats {
  size_t total = 0;
  size_t checked = 0;
};

/**
 * @brief Evaluates a SearchQuery over index records
 *
 * Bodies are loaded through the supplied loader, and only when the query
 * needs them. Results are ordered by updatedAt descending, then id.
 */
class SearchEngine {
public:
  using BodyLoader = std::function<Result<std::string>(const core::NoteId&)>;

  static Result<std::vector<core::Metadata>> evaluate(
      const SearchQuery& query, std::vector<core::Metadata> notes,
      const BodyLoader& load_body, std::chrono::system_clock::time_point now);

  // Count "- [ ]" / "* [x]" style checklist lines
  static TaskStats countTasks(std::string_view body);

private:
  static bool matchesDate(DateRange range, std::chrono::system_clock::time_point updated,
                          std::chrono::system_clock::time_point now);
};

}  // namespace quire::index
