#include "quire/core/link_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace quire::core {

namespace {

bool isTagChar(unsigned char c) {
  return std::isalnum(c) || c == '_' || c == '-';
}

bool isSpace(unsigned char c) {
  return std::isspace(c) != 0;
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && isSpace(s.front())) s.remove_prefix(1);
  while (!s.empty() && isSpace(s.back())) s.remove_suffix(1);
  return s;
}

std::string toLower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

// True when candidate should win a title tie over current
bool preferOver(const Metadata& candidate, const Metadata& current) {
  if (candidate.updated() != current.updated()) {
    return candidate.updated() > current.updated();
  }
  return current.id() < candidate.id();
}

}  // namespace

bool LinkResolver::isValidTag(std::string_view tag) {
  if (tag.empty()) {
    return false;
  }
  return std::all_of(tag.begin(), tag.end(), [](unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
  });
}

std::string LinkResolver::normalizeTag(std::string_view raw) {
  auto trimmed = trim(raw);
  if (!trimmed.empty() && trimmed.front() == '#') {
    trimmed.remove_prefix(1);
  }
  return toLower(trimmed);
}

std::string LinkResolver::slugify(std::string_view title) {
  std::string slug;
  slug.reserve(title.size());
  bool pending_dash = false;

  // [a-z0-9_-] pass through; any run of anything else is one separator
  for (unsigned char c : title) {
    char kept;
    if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-') {
      kept = static_cast<char>(c);
    } else if (c >= 'A' && c <= 'Z') {
      kept = static_cast<char>(c - 'A' + 'a');
    } else {
      pending_dash = true;
      continue;
    }
    if (pending_dash && !slug.empty()) {
      slug += '-';
    }
    pending_dash = false;
    slug += kept;
  }

  if (slug.size() > kMaxSlugLength) {
    slug.resize(kMaxSlugLength);
    while (!slug.empty() && slug.back() == '-') {
      slug.pop_back();
    }
  }
  return slug;
}

std::vector<std::string> LinkResolver::extractTags(std::string_view body) {
  std::vector<std::string> tags;

  for (size_t i = 0; i < body.size(); ++i) {
    if (body[i] != '#') {
      continue;
    }
    if (i > 0 && !isSpace(body[i - 1])) {
      continue;
    }
    size_t end = i + 1;
    while (end < body.size() && isTagChar(body[end])) {
      ++end;
    }
    if (end > i + 1) {
      tags.push_back(toLower(body.substr(i + 1, end - i - 1)));
    }
    i = end - 1;
  }

  std::sort(tags.begin(), tags.end());
  tags.erase(std::unique(tags.begin(), tags.end()), tags.end());
  return tags;
}

std::vector<std::string> LinkResolver::extractLinkTitles(std::string_view body) {
  std::vector<std::string> titles;
  size_t pos = 0;

  while ((pos = body.find("[[", pos)) != std::string_view::npos) {
    size_t close = body.find("]]", pos + 2);
    if (close == std::string_view::npos) {
      break;
    }
    auto inner = body.substr(pos + 2, close - pos - 2);
    if (inner.find('\n') == std::string_view::npos && inner.find("[[") == std::string_view::npos) {
      auto title = trim(inner);
      if (!title.empty() &&
          std::find(titles.begin(), titles.end(), title) == titles.end()) {
        titles.emplace_back(title);
      }
      pos = close + 2;
    } else {
      pos += 2;
    }
  }

  return titles;
}

std::vector<std::string> LinkResolver::derivedTags(std::string_view title, std::string_view body,
                                                   bool is_daily) {
  auto tags = extractTags(body);
  auto slug = slugify(title);
  if (!slug.empty()) {
    tags.push_back(slug);
  }
  if (is_daily) {
    tags.emplace_back(kDailyTag);
  }
  std::sort(tags.begin(), tags.end());
  tags.erase(std::unique(tags.begin(), tags.end()), tags.end());
  return tags;
}

std::string LinkResolver::titleKey(std::string_view title) {
  return toLower(trim(title));
}

std::vector<NoteId> LinkResolver::resolveLinks(const std::vector<std::string>& titles,
                                               const std::vector<Metadata>& notes,
                                               const NoteId& self) {
  if (titles.empty()) {
    return {};
  }

  std::unordered_map<std::string, const Metadata*> by_title;
  for (const auto& note : notes) {
    if (note.id() == self) {
      continue;
    }
    auto key = titleKey(note.title());
    if (key.empty()) {
      continue;
    }
    auto [it, inserted] = by_title.emplace(key, &note);
    if (!inserted && preferOver(note, *it->second)) {
      it->second = &note;
    }
  }

  std::vector<NoteId> links;
  for (const auto& title : titles) {
    auto it = by_title.find(titleKey(title));
    if (it != by_title.end()) {
      links.push_back(it->second->id());
    }
  }
  return links;
}

void LinkResolver::relinkAll(std::vector<Metadata>& notes) {
  std::unordered_map<std::string, const Metadata*> by_title;
  for (const auto& note : notes) {
    auto key = titleKey(note.title());
    if (key.empty()) {
      continue;
    }
    auto [it, inserted] = by_title.emplace(key, &note);
    if (!inserted && preferOver(note, *it->second)) {
      it->second = &note;
    }
  }

  std::vector<std::vector<NoteId>> resolved(notes.size());
  for (size_t i = 0; i < notes.size(); ++i) {
    for (const auto& title : notes[i].linkTitles()) {
      auto it = by_title.find(titleKey(title));
      if (it == by_title.end()) {
        continue;
      }
      if (it->second->id() == notes[i].id()) {
        // Self match: fall back to the best other note with the same title
        auto others = resolveLinks({title}, notes, notes[i].id());
        resolved[i].insert(resolved[i].end(), others.begin(), others.end());
      } else {
        resolved[i].push_back(it->second->id());
      }
    }
  }

  for (size_t i = 0; i < notes.size(); ++i) {
    notes[i].setLinksTo(std::move(resolved[i]));
  }
}

}  // namespace quire::core
