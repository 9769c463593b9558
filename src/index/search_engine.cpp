#include "quire/index/search_engine.hpp"

#include <algorithm>
#include <cctype>

#include "quire/util/time.hpp"

namespace quire::index {

namespace {

std::string toLower(std::string_view text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower;
}

std::string_view trimLeft(std::string_view line) {
  size_t start = 0;
  while (start < line.size() && std::isspace(static_cast<unsigned char>(line[start]))) {
    ++start;
  }
  return line.substr(start);
}

}  // namespace

TaskStats SearchEngine::countTasks(std::string_view body) {
  TaskStats stats;
  size_t pos = 0;
  while (pos <= body.size()) {
    auto end = body.find('\n', pos);
    if (end == std::string_view::npos) {
      end = body.size();
    }
    auto line = trimLeft(body.substr(pos, end - pos));

    if (line.size() >= 5 && (line[0] == '-' || line[0] == '*') && line[1] == ' ' &&
        line[2] == '[' && line[4] == ']') {
      char mark = line[3];
      if (mark == ' ') {
        ++stats.total;
      } else if (mark == 'x' || mark == 'X') {
        ++stats.total;
        ++stats.checked;
      }
    }

    if (end == body.size()) {
      break;
    }
    pos = end + 1;
  }
  return stats;
}

bool SearchEngine::matchesDate(DateRange range, std::chrono::system_clock::time_point updated,
                               std::chrono::system_clock::time_point now) {
  int days_back = 0;
  switch (range) {
    case DateRange::kToday:
      days_back = 0;
      break;
    case DateRange::kWeek:
      days_back = 6;
      break;
    case DateRange::kMonth:
      days_back = 29;
      break;
  }
  auto from = util::Time::startOfLocalDay(now, days_back);
  auto until = util::Time::startOfLocalDay(now, -1);
  return updated >= from && updated < until;
}

Result<std::vector<core::Metadata>> SearchEngine::evaluate(
    const SearchQuery& query, std::vector<core::Metadata> notes,
    const BodyLoader& load_body, std::chrono::system_clock::time_point now) {
  std::vector<std::string> terms;
  terms.reserve(query.terms.size());
  for (const auto& term : query.terms) {
    terms.push_back(toLower(term));
  }

  std::vector<core::Metadata> matches;
  for (auto& note : notes) {
    if (query.starred && !note.important()) {
      continue;
    }
    if (query.has_attachments && note.images().empty()) {
      continue;
    }
    if (query.date.has_value() && !matchesDate(*query.date, note.updated(), now)) {
      continue;
    }
    bool tags_ok = std::all_of(query.tags.begin(), query.tags.end(),
                               [&](const std::string& tag) { return note.hasTag(tag); });
    if (!tags_ok) {
      continue;
    }

    if (query.needsBody()) {
      std::string body;
      auto loaded = load_body(note.id());
      if (loaded.has_value()) {
        body = std::move(*loaded);
      } else if (loaded.error().code() != ErrorCode::kNotFound) {
        return std::unexpected(loaded.error());
      }

      auto tasks = countTasks(body);
      if (query.has_tasks && tasks.total == 0) {
        continue;
      }
      if (query.completed && (tasks.total == 0 || tasks.checked != tasks.total)) {
        continue;
      }
      if (query.uncompleted && tasks.checked == tasks.total) {
        continue;
      }

      auto title = toLower(note.title());
      auto lower_body = toLower(body);
      bool text_ok = std::all_of(terms.begin(), terms.end(), [&](const std::string& term) {
        return title.find(term) != std::string::npos ||
               lower_body.find(term) != std::string::npos;
      });
      if (!text_ok) {
        continue;
      }
    }

    matches.push_back(std::move(note));
  }

  std::sort(matches.begin(), matches.end(), [](const core::Metadata& a, const core::Metadata& b) {
    if (a.updated() != b.updated()) {
      return a.updated() > b.updated();
    }
    return a.id() < b.id();
  });
  return matches;
}

}  // namespace quire::index
