#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "quire/core/metadata.hpp"
#include "quire/core/note_id.hpp"

namespace quire::test {

// Test fixture base class for tests that need temporary directories
class TempDirTest : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  std::filesystem::path temp_dir_;
};

// Metadata record with a generated id
core::Metadata makeMetadata(const std::string& title);

// Metadata record with a fixed id and updated time in epoch milliseconds
core::Metadata makeMetadata(const std::string& id, const std::string& title, int64_t updated_ms);

// Id from a literal known to be valid
core::NoteId noteId(const std::string& text);

// Read a whole file, "" when missing
std::string readAll(const std::filesystem::path& path);

// Generate random string for testing
std::string randomString(size_t length);

// Assertion helpers
#define EXPECT_OK(result)                                                                          \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    EXPECT_TRUE(r.has_value()) << "Expected success but got error: " << r.error().message();     \
  } while (0)

#define ASSERT_OK(result)                                                                          \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    ASSERT_TRUE(r.has_value()) << "Expected success but got error: " << r.error().message();     \
  } while (0)

#define EXPECT_ERROR(result, expected_code)                                                        \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    EXPECT_FALSE(r.has_value()) << "Expected error but got success";                              \
    if (!r.has_value()) {                                                                          \
      EXPECT_EQ(r.error().code(), expected_code) << r.error().message();                          \
    }                                                                                              \
  } while (0)

}  // namespace quire::test
