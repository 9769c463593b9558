#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quire::index {

enum class DateRange {
  kToday,   // Today's local date
  kWeek,    // Last 7 local calendar days including today
  kMonth    // Last 30 local calendar days including today
};

// Structured form of a search string
struct SearchQuery {
  std::vector<std::string> terms;   // Free text; each must match title or body
  std::vector<std::string> tags;    // All required
  bool starred = false;
  bool completed = false;
  bool uncompleted = false;
  bool has_tasks = false;
  bool has_attachments = false;
  std::optional<DateRange> date;

  // True when evaluation has to read note bodies
  bool needsBody() const noexcept;
  bool empty() const noexcept;
};

/**
 * @brief Parser for the search operator syntax
 *
 * Supports queries like:
 * - "hello world" -> two free text terms
 * - "\"weekly sync\"" -> one phrase term
 * - "tag:meeting is:starred" -> tag and starred filters
 * - "has:tasks is:uncompleted date:week"
 *
 * Operators with an unknown name or value are kept as free text.
 */
class QueryParser {
public:
  static SearchQuery parse(std::string_view query_str);

private:
  struct Token {
    std::string value;
    bool quoted = false;
  };

  static std::vector<Token> splitTokens(std::string_view query_str);
  static bool applyOperator(const std::string& token, SearchQuery& query);
};

}  // namespace quire::index
