#include "quire/util/path_sanitizer.hpp"

#include <algorithm>
#include <vector>

namespace quire::util {

namespace {

bool isReserved(unsigned char c) {
  switch (c) {
    case ':': case '*': case '?': case '"':
    case '<': case '>': case '|':
      return true;
    default:
      return c < 0x20 || c == 0x7f;
  }
}

bool isSpace(unsigned char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

// Cut to at most max_bytes without splitting a UTF-8 sequence
std::string truncateUtf8(const std::string& s, size_t max_bytes) {
  if (s.size() <= max_bytes) {
    return s;
  }
  size_t end = max_bytes;
  while (end > 0 && (static_cast<unsigned char>(s[end]) & 0xC0) == 0x80) {
    --end;
  }
  return s.substr(0, end);
}

Error invalidPath(const std::string& message) {
  return makeError(ErrorCode::kInvalidPath, message);
}

}  // namespace

Result<std::string> PathSanitizer::validateIdentifier(std::string_view id) {
  if (id.empty()) {
    return std::unexpected(invalidPath("Identifier is empty"));
  }
  if (id.size() > kMaxIdentifierLength) {
    return std::unexpected(invalidPath("Identifier too long"));
  }
  for (char c : id) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
              (c >= '0' && c <= '9') || c == '-' || c == '_';
    if (!ok) {
      return std::unexpected(invalidPath("Identifier contains unsafe characters"));
    }
  }
  return std::string(id);
}

Result<std::string> PathSanitizer::sanitizeFilename(std::string_view raw) {
  if (raw.find('\0') != std::string_view::npos) {
    return std::unexpected(invalidPath("Filename contains a NUL byte"));
  }
  if (raw.find('/') != std::string_view::npos || raw.find('\\') != std::string_view::npos) {
    return std::unexpected(invalidPath("Filename contains a path separator: " + std::string(raw)));
  }
  if (raw == "." || raw == "..") {
    return std::unexpected(invalidPath("Filename refers to a directory: " + std::string(raw)));
  }

  std::string out;
  out.reserve(raw.size());
  for (char c : raw) {
    out += isReserved(static_cast<unsigned char>(c)) ? '_' : c;
  }

  size_t begin = 0;
  while (begin < out.size() && (isSpace(out[begin]) || out[begin] == '.')) {
    ++begin;
  }
  size_t end = out.size();
  while (end > begin && isSpace(out[end - 1])) {
    --end;
  }
  out = truncateUtf8(out.substr(begin, end - begin), kMaxFilenameBytes);

  if (out.empty()) {
    return std::unexpected(invalidPath("Filename is empty after sanitizing"));
  }
  return out;
}

bool PathSanitizer::isPlainRelative(const std::filesystem::path& relative) {
  const auto& native = relative.native();
  if (native.empty() || native.find('\0') != std::string::npos) {
    return false;
  }
  if (relative.is_absolute() || relative.has_root_path()) {
    return false;
  }
  for (const auto& part : relative) {
    if (part.empty() || part == "." || part == "..") {
      return false;
    }
  }
  return true;
}

Result<std::filesystem::path> PathSanitizer::validateRelativePath(std::string_view relative) {
  if (relative.find('\0') != std::string_view::npos) {
    return std::unexpected(invalidPath("Path contains a NUL byte"));
  }
  if (relative.find('\\') != std::string_view::npos) {
    return std::unexpected(invalidPath("Path contains a backslash: " + std::string(relative)));
  }

  std::filesystem::path path{std::string(relative)};
  if (!isPlainRelative(path)) {
    return std::unexpected(invalidPath("Path escapes the store: " + std::string(relative)));
  }

  std::vector<std::string> parts;
  for (const auto& part : path) {
    parts.push_back(part.string());
  }
  if (parts.size() != 3 || parts[0] != "images") {
    return std::unexpected(invalidPath("Not an attachment path: " + std::string(relative)));
  }

  auto id = validateIdentifier(parts[1]);
  if (!id.has_value()) {
    return std::unexpected(id.error());
  }
  auto name = sanitizeFilename(parts[2]);
  if (!name.has_value() || *name != parts[2]) {
    return std::unexpected(invalidPath("Unsafe attachment file name: " + parts[2]));
  }

  return std::filesystem::path("images") / parts[1] / parts[2];
}

Result<std::filesystem::path> PathSanitizer::resolveWithin(const std::filesystem::path& root,
                                                           const std::filesystem::path& relative) {
  if (!isPlainRelative(relative)) {
    return std::unexpected(invalidPath("Path escapes the store: " + relative.string()));
  }

  std::error_code ec;
  auto canonical_root = std::filesystem::weakly_canonical(root, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kIoFailure,
                                     "Cannot resolve store root: " + ec.message()));
  }
  auto candidate = std::filesystem::weakly_canonical(canonical_root / relative, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kIoFailure,
                                     "Cannot resolve path: " + ec.message()));
  }

  if (!canonical_root.has_filename()) {
    canonical_root = canonical_root.parent_path();
  }
  auto inside = candidate.lexically_relative(canonical_root);
  if (inside.empty() || inside == "." || *inside.begin() == "..") {
    return std::unexpected(invalidPath("Path resolves outside the store: " + relative.string()));
  }

  return candidate;
}

}  // namespace quire::util
