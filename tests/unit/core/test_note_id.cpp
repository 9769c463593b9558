#include <gtest/gtest.h>

#include <chrono>
#include <set>
#include <thread>
#include <unordered_set>

#include "quire/core/note_id.hpp"
#include "test_helpers.hpp"

using namespace quire::core;
using namespace quire::test;
using quire::ErrorCode;

class NoteIdTest : public ::testing::Test {};

TEST_F(NoteIdTest, GenerateValidUlid) {
  auto id = NoteId::generate();

  EXPECT_TRUE(id.isValid());
  EXPECT_EQ(id.toString().length(), 26);
}

TEST_F(NoteIdTest, GeneratedIdsAreSafeIdentifiers) {
  auto id = NoteId::generate();
  auto parsed = NoteId::fromString(id.toString());

  ASSERT_OK(parsed);
  EXPECT_EQ(*parsed, id);
}

TEST_F(NoteIdTest, FromStringAcceptsSafeIdentifiers) {
  ASSERT_OK(NoteId::fromString("01J8Y4N9W8K6W3K4T4S0S3QF4N"));
  ASSERT_OK(NoteId::fromString("meeting_notes-2024"));
  ASSERT_OK(NoteId::fromString(std::string(64, 'a')));
}

TEST_F(NoteIdTest, FromStringRejectsUnsafeIdentifiers) {
  EXPECT_ERROR(NoteId::fromString(""), ErrorCode::kInvalidPath);
  EXPECT_ERROR(NoteId::fromString(std::string(65, 'a')), ErrorCode::kInvalidPath);
  EXPECT_ERROR(NoteId::fromString("../etc"), ErrorCode::kInvalidPath);
  EXPECT_ERROR(NoteId::fromString("a/b"), ErrorCode::kInvalidPath);
  EXPECT_ERROR(NoteId::fromString("with space"), ErrorCode::kInvalidPath);
  EXPECT_ERROR(NoteId::fromString(std::string("nul\0byte", 8)), ErrorCode::kInvalidPath);
}

TEST_F(NoteIdTest, LaterIdsSortAfterEarlierOnes) {
  auto id1 = NoteId::generate();
  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  auto id2 = NoteId::generate();

  EXPECT_NE(id1, id2);
  EXPECT_LT(id1, id2);
}

TEST_F(NoteIdTest, HashSupport) {
  std::unordered_set<NoteId> ids;
  auto id1 = NoteId::generate();
  auto id2 = NoteId::generate();

  ids.insert(id1);
  ids.insert(id2);
  ids.insert(id1);

  EXPECT_EQ(ids.size(), 2);
}

TEST_F(NoteIdTest, DefaultConstructedIsInvalid) {
  NoteId id;
  EXPECT_FALSE(id.isValid());
}
