#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "quire/common.hpp"

namespace quire::util {

/**
 * @brief Gate for every user-supplied name that ends up on disk
 *
 * All rejections are reported as ErrorCode::kInvalidPath.
 */
class PathSanitizer {
public:
  static constexpr size_t kMaxIdentifierLength = 64;
  static constexpr size_t kMaxFilenameBytes = 200;

  /**
   * @brief Validate a note/notebook/template identifier
   * @param id Candidate identifier, must match [A-Za-z0-9_-]{1,64}
   * @return The identifier unchanged on success
   */
  static Result<std::string> validateIdentifier(std::string_view id);

  /**
   * @brief Turn a display filename into a single safe path segment
   *
   * Separators, NUL and the "." / ".." names are rejected outright. Reserved
   * characters and control characters are replaced with '_', surrounding
   * whitespace and leading dots are trimmed and the result is cut to
   * kMaxFilenameBytes on a UTF-8 boundary.
   */
  static Result<std::string> sanitizeFilename(std::string_view raw);

  /**
   * @brief Validate a stored attachment path of the form images/<noteId>/<file>
   * @return The normalized relative path
   */
  static Result<std::filesystem::path> validateRelativePath(std::string_view relative);

  /**
   * @brief Join root and a relative path, refusing anything that escapes root
   *
   * Symlinked components are resolved before the containment check.
   */
  static Result<std::filesystem::path> resolveWithin(const std::filesystem::path& root,
                                                     const std::filesystem::path& relative);

  // True when a relative path has no absolute root, NUL, "." or ".." component
  static bool isPlainRelative(const std::filesystem::path& relative);

private:
  PathSanitizer() = default;
};

}  // namespace quire::util
