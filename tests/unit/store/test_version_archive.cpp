#include <gtest/gtest.h>

#include "quire/store/version_archive.hpp"
#include "quire/util/time.hpp"
#include "temp_directory.hpp"
#include "test_helpers.hpp"

using namespace quire::store;
using namespace quire::test;
using quire::ErrorCode;
using quire::util::Time;

namespace {

std::chrono::system_clock::time_point at(int64_t ms) {
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

}  // namespace

class VersionArchiveTest : public ::testing::Test {
 protected:
  TempDirectory dir_;
  VersionArchive archive_{dir_.path() / "versions", 10};
};

TEST_F(VersionArchiveTest, FileNamesSortChronologically) {
  EXPECT_EQ(VersionArchive::fileNameFor(at(1700000000000)), "2023-11-14T22-13-20.000Z.json");
  EXPECT_LT(VersionArchive::fileNameFor(at(1000)), VersionArchive::fileNameFor(at(2000)));
}

TEST_F(VersionArchiveTest, ListsNewestFirstWithPreview) {
  ASSERT_OK(archive_.recordSnapshot(noteId("n1"), "v1", "first body", at(1000)));
  ASSERT_OK(archive_.recordSnapshot(noteId("n1"), "v2", "a body longer than ten chars", at(2000)));

  auto entries = archive_.list(noteId("n1"));
  ASSERT_OK(entries);
  ASSERT_EQ(entries->size(), 2u);
  EXPECT_EQ((*entries)[0].title, "v2");
  EXPECT_EQ((*entries)[0].preview, "a body lon...");
  EXPECT_EQ((*entries)[1].title, "v1");
  EXPECT_EQ((*entries)[1].preview, "first body");
}

TEST_F(VersionArchiveTest, IdenticalSnapshotIsSkipped) {
  auto first = archive_.recordSnapshot(noteId("n1"), "t", "b", at(1000));
  ASSERT_OK(first);
  EXPECT_TRUE(*first);

  auto second = archive_.recordSnapshot(noteId("n1"), "t", "b", at(2000));
  ASSERT_OK(second);
  EXPECT_FALSE(*second);
  EXPECT_EQ(archive_.list(noteId("n1"))->size(), 1u);
}

TEST_F(VersionArchiveTest, KeepsOnlyTheMostRecentThirty) {
  for (int i = 0; i < 35; ++i) {
    ASSERT_OK(archive_.recordSnapshot(noteId("n1"), "t", "body " + std::to_string(i),
                                      at(1000 + i * 1000)));
  }

  auto entries = archive_.list(noteId("n1"));
  ASSERT_OK(entries);
  ASSERT_EQ(entries->size(), VersionArchive::kMaxVersions);
  EXPECT_EQ(entries->front().preview, "body 34");
  EXPECT_EQ(entries->back().preview, "body 5");
}

TEST_F(VersionArchiveTest, ClashingTimestampsAreBumped) {
  ASSERT_OK(archive_.recordSnapshot(noteId("n1"), "t", "one", at(5000)));
  ASSERT_OK(archive_.recordSnapshot(noteId("n1"), "t", "two", at(5000)));

  auto entries = archive_.list(noteId("n1"));
  ASSERT_OK(entries);
  ASSERT_EQ(entries->size(), 2u);
  EXPECT_GT((*entries)[0].saved_at, (*entries)[1].saved_at);
}

TEST_F(VersionArchiveTest, GetByTimestamp) {
  ASSERT_OK(archive_.recordSnapshot(noteId("n1"), "Title", "Body", at(1700000000000)));

  auto snapshot = archive_.get(noteId("n1"), "2023-11-14T22:13:20.000Z");
  ASSERT_OK(snapshot);
  EXPECT_EQ(snapshot->title, "Title");
  EXPECT_EQ(snapshot->body, "Body");

  EXPECT_ERROR(archive_.get(noteId("n1"), "2023-11-14T22:13:21.000Z"), ErrorCode::kNotFound);
  EXPECT_ERROR(archive_.get(noteId("n1"), "not a time"), ErrorCode::kNotFound);
}

TEST_F(VersionArchiveTest, RemoveAllDropsHistory) {
  ASSERT_OK(archive_.recordSnapshot(noteId("n1"), "t", "b", at(1000)));
  ASSERT_OK(archive_.removeAll(noteId("n1")));

  auto entries = archive_.list(noteId("n1"));
  ASSERT_OK(entries);
  EXPECT_TRUE(entries->empty());
}
