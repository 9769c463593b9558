#include "quire/index/query_parser.hpp"

#include <cctype>

#include "quire/core/link_resolver.hpp"

namespace quire::index {

bool SearchQuery::needsBody() const noexcept {
  return !terms.empty() || completed || uncompleted || has_tasks;
}

bool SearchQuery::empty() const noexcept {
  return terms.empty() && tags.empty() && !starred && !completed && !uncompleted &&
         !has_tasks && !has_attachments && !date.has_value();
}

SearchQuery QueryParser::parse(std::string_view query_str) {
  SearchQuery query;
  for (auto& token : splitTokens(query_str)) {
    if (token.value.empty()) {
      continue;
    }
    if (!token.quoted && applyOperator(token.value, query)) {
      continue;
    }
    query.terms.push_back(std::move(token.value));
  }
  return query;
}

std::vector<QueryParser::Token> QueryParser::splitTokens(std::string_view query_str) {
  std::vector<Token> tokens;
  size_t i = 0;

  while (i < query_str.size()) {
    // Skip whitespace
    while (i < query_str.size() && std::isspace(static_cast<unsigned char>(query_str[i]))) {
      ++i;
    }
    if (i >= query_str.size()) {
      break;
    }

    Token token;
    if (query_str[i] == '"') {
      // Quoted phrase; an unterminated quote runs to the end
      auto close = query_str.find('"', i + 1);
      auto end = close == std::string_view::npos ? query_str.size() : close;
      token.value = std::string(query_str.substr(i + 1, end - i - 1));
      token.quoted = true;
      i = close == std::string_view::npos ? query_str.size() : close + 1;
    } else {
      size_t start = i;
      while (i < query_str.size() && !std::isspace(static_cast<unsigned char>(query_str[i]))) {
        ++i;
      }
      token.value = std::string(query_str.substr(start, i - start));
    }
    tokens.push_back(std::move(token));
  }

  return tokens;
}

bool QueryParser::applyOperator(const std::string& token, SearchQuery& query) {
  auto colon = token.find(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == token.size()) {
    return false;
  }

  std::string field = token.substr(0, colon);
  std::string value = token.substr(colon + 1);
  for (auto& c : field) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  if (field == "tag") {
    auto tag = core::LinkResolver::normalizeTag(value);
    if (!core::LinkResolver::isValidTag(tag)) {
      return false;
    }
    query.tags.push_back(tag);
    return true;
  }

  for (auto& c : value) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  if (field == "is") {
    if (value == "starred") {
      query.starred = true;
    } else if (value == "completed") {
      query.completed = true;
    } else if (value == "uncompleted") {
      query.uncompleted = true;
    } else {
      return false;
    }
    return true;
  }

  if (field == "has") {
    if (value == "tasks") {
      query.has_tasks = true;
    } else if (value == "attachments") {
      query.has_attachments = true;
    } else {
      return false;
    }
    return true;
  }

  if (field == "date") {
    if (value == "today") {
      query.date = DateRange::kToday;
    } else if (value == "week") {
      query.date = DateRange::kWeek;
    } else if (value == "month") {
      query.date = DateRange::kMonth;
    } else {
      return false;
    }
    return true;
  }

  return false;
}

}  // namespace quire::index
