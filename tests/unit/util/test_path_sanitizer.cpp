#include <gtest/gtest.h>

#include <filesystem>

#include "quire/util/path_sanitizer.hpp"
#include "temp_directory.hpp"
#include "test_helpers.hpp"

using quire::ErrorCode;
using quire::util::PathSanitizer;

TEST(PathSanitizerTest, IdentifierGrammar) {
  EXPECT_OK(PathSanitizer::validateIdentifier("abc_DEF-123"));
  EXPECT_ERROR(PathSanitizer::validateIdentifier(""), ErrorCode::kInvalidPath);
  EXPECT_ERROR(PathSanitizer::validateIdentifier(".."), ErrorCode::kInvalidPath);
  EXPECT_ERROR(PathSanitizer::validateIdentifier("a.b"), ErrorCode::kInvalidPath);
  EXPECT_ERROR(PathSanitizer::validateIdentifier(std::string(65, 'x')), ErrorCode::kInvalidPath);
}

TEST(PathSanitizerTest, FilenameRejectsSeparatorsAndNul) {
  EXPECT_ERROR(PathSanitizer::sanitizeFilename("../../etc/passwd"), ErrorCode::kInvalidPath);
  EXPECT_ERROR(PathSanitizer::sanitizeFilename("/etc/passwd"), ErrorCode::kInvalidPath);
  EXPECT_ERROR(PathSanitizer::sanitizeFilename("dir\\file.txt"), ErrorCode::kInvalidPath);
  EXPECT_ERROR(PathSanitizer::sanitizeFilename(std::string("a\0b.png", 7)),
               ErrorCode::kInvalidPath);
  EXPECT_ERROR(PathSanitizer::sanitizeFilename(".."), ErrorCode::kInvalidPath);
  EXPECT_ERROR(PathSanitizer::sanitizeFilename("."), ErrorCode::kInvalidPath);
}

TEST(PathSanitizerTest, FilenameReplacesReservedCharacters) {
  auto name = PathSanitizer::sanitizeFilename("report: q1?*.pdf");
  ASSERT_OK(name);
  EXPECT_EQ(*name, "report_ q1__.pdf");
}

TEST(PathSanitizerTest, FilenameTrimsWhitespaceAndLeadingDots) {
  auto name = PathSanitizer::sanitizeFilename("  ..hidden.txt  ");
  ASSERT_OK(name);
  EXPECT_EQ(*name, "hidden.txt");

  EXPECT_ERROR(PathSanitizer::sanitizeFilename("   "), ErrorCode::kInvalidPath);
}

TEST(PathSanitizerTest, FilenameIsCutOnUtf8Boundary) {
  // 150 two-byte characters: 300 bytes
  std::string long_name;
  for (int i = 0; i < 150; ++i) {
    long_name += "\xC3\xA9";
  }
  auto name = PathSanitizer::sanitizeFilename(long_name);
  ASSERT_OK(name);
  EXPECT_LE(name->size(), PathSanitizer::kMaxFilenameBytes);
  EXPECT_EQ(name->size() % 2, 0u);
}

TEST(PathSanitizerTest, RelativePathMustBeAnAttachmentPath) {
  auto ok = PathSanitizer::validateRelativePath("images/note1/1700000000000-a.png");
  ASSERT_OK(ok);
  EXPECT_EQ(*ok, std::filesystem::path("images/note1/1700000000000-a.png"));

  EXPECT_ERROR(PathSanitizer::validateRelativePath("../../etc/passwd"), ErrorCode::kInvalidPath);
  EXPECT_ERROR(PathSanitizer::validateRelativePath("/etc/passwd"), ErrorCode::kInvalidPath);
  EXPECT_ERROR(PathSanitizer::validateRelativePath("images/../meta/index.json"),
               ErrorCode::kInvalidPath);
  EXPECT_ERROR(PathSanitizer::validateRelativePath("notes/abc.txt"), ErrorCode::kInvalidPath);
  EXPECT_ERROR(PathSanitizer::validateRelativePath("images/note1"), ErrorCode::kInvalidPath);
  EXPECT_ERROR(PathSanitizer::validateRelativePath(std::string("images/n/a\0.png", 15)),
               ErrorCode::kInvalidPath);
}

TEST(PathSanitizerTest, ResolveWithinStaysUnderRoot) {
  quire::test::TempDirectory dir;
  dir.createFile("images/n1/file.png", "x");

  auto resolved = PathSanitizer::resolveWithin(dir.path(), "images/n1/file.png");
  ASSERT_OK(resolved);
  EXPECT_TRUE(std::filesystem::exists(*resolved));

  EXPECT_ERROR(PathSanitizer::resolveWithin(dir.path(), "../outside"), ErrorCode::kInvalidPath);
  EXPECT_ERROR(PathSanitizer::resolveWithin(dir.path(), "/etc/passwd"), ErrorCode::kInvalidPath);
}

TEST(PathSanitizerTest, ResolveWithinRejectsSymlinkEscape) {
  quire::test::TempDirectory root;
  quire::test::TempDirectory outside;
  outside.createFile("secret.txt", "s");
  std::filesystem::create_directories(root.path() / "images");
  std::filesystem::create_directory_symlink(outside.path(), root.path() / "images" / "n1");

  EXPECT_ERROR(PathSanitizer::resolveWithin(root.path(), "images/n1/secret.txt"),
               ErrorCode::kInvalidPath);
}
