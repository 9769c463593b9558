#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "quire/core/metadata.hpp"
#include "quire/core/note_id.hpp"

namespace quire::core {

/**
 * @brief Derives tags and [[links]] from note titles and bodies
 *
 * Tags follow the grammar [a-z0-9_-]+. Links are matched against note
 * titles case-insensitively; when several notes share a title the most
 * recently updated one wins, then the greatest id.
 */
class LinkResolver {
public:
  static constexpr const char* kDailyTag = "daily";
  static constexpr size_t kMaxSlugLength = 64;

  // True when tag is non-empty and matches [a-z0-9_-]+
  static bool isValidTag(std::string_view tag);

  // Trim, drop one leading '#', lowercase
  static std::string normalizeTag(std::string_view raw);

  // Lowercase slug of a title: [a-z0-9_-] kept, runs of anything else become one '-'
  static std::string slugify(std::string_view title);

  // #tokens at the start of the body or after whitespace, lowercased, sorted, unique
  static std::vector<std::string> extractTags(std::string_view body);

  // Trimmed inner text of every [[...]] in order of first appearance
  static std::vector<std::string> extractLinkTitles(std::string_view body);

  // Tags a save adds: body tags, the title slug and "daily" for daily notes
  static std::vector<std::string> derivedTags(std::string_view title, std::string_view body,
                                              bool is_daily);

  // Resolve link titles against the given notes, excluding self
  static std::vector<NoteId> resolveLinks(const std::vector<std::string>& titles,
                                          const std::vector<Metadata>& notes,
                                          const NoteId& self);

  // Re-resolve linksTo of every note from its stored link titles
  static void relinkAll(std::vector<Metadata>& notes);

  // Case-insensitive comparison key for titles
  static std::string titleKey(std::string_view title);

private:
  LinkResolver() = default;
};

}  // namespace quire::core
