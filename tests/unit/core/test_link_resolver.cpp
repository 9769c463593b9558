#include <gtest/gtest.h>

#include "quire/core/link_resolver.hpp"
#include "test_helpers.hpp"

using namespace quire::core;
using namespace quire::test;

TEST(LinkResolverTest, SlugIsLowercaseAndDashed) {
  EXPECT_EQ(LinkResolver::slugify("Project Alpha"), "project-alpha");
  EXPECT_EQ(LinkResolver::slugify("  Q3 Budget!! review "), "q3-budget-review");
  EXPECT_EQ(LinkResolver::slugify("Sprint_Plan v2"), "sprint_plan-v2");
  EXPECT_EQ(LinkResolver::slugify("Q3 -- Budget"), "q3----budget");
  EXPECT_EQ(LinkResolver::slugify("!!!"), "");
}

TEST(LinkResolverTest, SlugIsIdempotent) {
  auto once = LinkResolver::slugify("Project Alpha");
  EXPECT_EQ(LinkResolver::slugify(once), once);

  for (const char* slug : {"project-alpha", "snake_case", "a--b", "-lead", "trail_", "q3"}) {
    EXPECT_EQ(LinkResolver::slugify(slug), slug);
  }
}

TEST(LinkResolverTest, SlugIsCapped) {
  auto slug = LinkResolver::slugify(std::string(100, 'a'));
  EXPECT_EQ(slug.size(), LinkResolver::kMaxSlugLength);
}

TEST(LinkResolverTest, TagGrammar) {
  EXPECT_TRUE(LinkResolver::isValidTag("work"));
  EXPECT_TRUE(LinkResolver::isValidTag("q3_plan-2"));
  EXPECT_FALSE(LinkResolver::isValidTag(""));
  EXPECT_FALSE(LinkResolver::isValidTag("Work"));
  EXPECT_FALSE(LinkResolver::isValidTag("two words"));

  EXPECT_EQ(LinkResolver::normalizeTag("  #Work "), "work");
}

TEST(LinkResolverTest, ExtractsHashTagsAfterWhitespace) {
  auto tags = LinkResolver::extractTags("#Meeting notes\nissue#12 and #todo, #todo #q3-plan");
  EXPECT_EQ(tags, (std::vector<std::string>{"meeting", "q3-plan", "todo"}));
}

TEST(LinkResolverTest, ExtractsLinkTitlesInOrder) {
  auto titles = LinkResolver::extractLinkTitles("See [[ Roadmap ]] and [[Budget]], again [[Roadmap]]"
                                                " but not [[broken\nlink]] or [[]]");
  EXPECT_EQ(titles, (std::vector<std::string>{"Roadmap", "Budget"}));
}

TEST(LinkResolverTest, DerivedTagsIncludeSlugAndDaily) {
  auto tags = LinkResolver::derivedTags("2024-05-01", "# daily\n#standup", true);
  EXPECT_EQ(tags, (std::vector<std::string>{"2024-05-01", "daily", "standup"}));
}

TEST(LinkResolverTest, ResolvesCaseInsensitivelyAndSkipsSelf) {
  auto roadmap = makeMetadata("roadmap", "Roadmap", 1000);
  auto self = makeMetadata("self", "Self", 1000);
  std::vector<Metadata> notes{roadmap, self};

  auto links = LinkResolver::resolveLinks({"ROADMAP", "Self", "Missing"}, notes, self.id());
  ASSERT_EQ(links.size(), 1u);
  EXPECT_EQ(links[0], roadmap.id());
}

TEST(LinkResolverTest, DuplicateTitlesPreferMostRecentlyUpdated) {
  auto older = makeMetadata("b-older", "Plan", 1000);
  auto newer = makeMetadata("a-newer", "Plan", 2000);
  auto source = makeMetadata("source", "Source", 500);

  auto links = LinkResolver::resolveLinks({"plan"}, {older, newer, source}, source.id());
  ASSERT_EQ(links.size(), 1u);
  EXPECT_EQ(links[0], newer.id());
}

TEST(LinkResolverTest, DuplicateTitlesWithSameTimeUseGreatestId) {
  auto first = makeMetadata("aaa", "Plan", 1000);
  auto second = makeMetadata("zzz", "Plan", 1000);
  auto source = makeMetadata("source", "Source", 500);

  auto links = LinkResolver::resolveLinks({"Plan"}, {first, second, source}, source.id());
  ASSERT_EQ(links.size(), 1u);
  EXPECT_EQ(links[0], second.id());
}

TEST(LinkResolverTest, RelinkAllFollowsRenames) {
  auto target = makeMetadata("target", "Old Name", 1000);
  auto source = makeMetadata("source", "Source", 1000);
  source.setLinkTitles({"New Name"});
  std::vector<Metadata> notes{target, source};

  LinkResolver::relinkAll(notes);
  EXPECT_TRUE(notes[1].linksTo().empty());

  notes[0].setTitle("New Name");
  LinkResolver::relinkAll(notes);
  ASSERT_EQ(notes[1].linksTo().size(), 1u);
  EXPECT_EQ(notes[1].linksTo()[0], target.id());
}
