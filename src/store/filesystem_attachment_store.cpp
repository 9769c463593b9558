#include "quire/store/filesystem_attachment_store.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include <spdlog/spdlog.h>

#include "quire/util/filesystem.hpp"
#include "quire/util/path_sanitizer.hpp"
#include "quire/util/time.hpp"

namespace quire::store {

namespace {

constexpr size_t kMaxStemBytes = 150;
constexpr size_t kMaxExtensionBytes = 16;

struct NameParts {
  std::string stem;
  std::string extension;   // Lowercase, without the dot; may be empty
};

std::string truncateUtf8(std::string s, size_t max_bytes) {
  if (s.size() <= max_bytes) {
    return s;
  }
  size_t end = max_bytes;
  while (end > 0 && (static_cast<unsigned char>(s[end]) & 0xC0) == 0x80) {
    --end;
  }
  s.resize(end);
  return s;
}

NameParts splitName(const std::string& sanitized) {
  NameParts parts;
  auto dot = sanitized.rfind('.');
  if (dot != std::string::npos && dot > 0 && dot + 1 < sanitized.size()) {
    parts.stem = sanitized.substr(0, dot);
    parts.extension = sanitized.substr(dot + 1);
    std::transform(parts.extension.begin(), parts.extension.end(), parts.extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    parts.extension = truncateUtf8(parts.extension, kMaxExtensionBytes);
  } else {
    parts.stem = sanitized;
  }
  while (!parts.stem.empty() && (parts.stem.back() == ' ' || parts.stem.back() == '.')) {
    parts.stem.pop_back();
  }
  parts.stem = truncateUtf8(parts.stem, kMaxStemBytes);
  return parts;
}

// Split "<millis>-<rest>" into its prefix and rest; prefix is empty when absent
std::pair<std::string, std::string> splitPrefix(const std::string& file_name) {
  auto dash = file_name.find('-');
  if (dash == std::string::npos || dash == 0) {
    return {"", file_name};
  }
  bool digits = std::all_of(file_name.begin(), file_name.begin() + static_cast<long>(dash),
                            [](unsigned char c) { return std::isdigit(c) != 0; });
  if (!digits) {
    return {"", file_name};
  }
  return {file_name.substr(0, dash), file_name.substr(dash + 1)};
}

std::string joinName(const std::string& stem, const std::string& extension) {
  return extension.empty() ? stem : stem + "." + extension;
}

}  // namespace

FilesystemAttachmentStore::FilesystemAttachmentStore(std::filesystem::path root,
                                                     std::uintmax_t max_bytes)
    : root_(std::move(root)), max_bytes_(max_bytes) {}

Result<std::filesystem::path> FilesystemAttachmentStore::noteDirectory(
    const core::NoteId& note_id) const {
  auto id = util::PathSanitizer::validateIdentifier(note_id.toString());
  if (!id.has_value()) {
    return std::unexpected(id.error());
  }
  return root_ / "images" / *id;
}

Result<void> FilesystemAttachmentStore::validateSource(const std::filesystem::path& source) const {
  const auto& native = source.native();
  if (native.empty() || native.find('\0') != std::string::npos) {
    return std::unexpected(makeError(ErrorCode::kInvalidPath, "Invalid source path"));
  }
  if (source.is_absolute() || source.has_root_path()) {
    return std::unexpected(makeError(ErrorCode::kInvalidPath,
                                     "Source path must be relative: " + source.string()));
  }
  for (const auto& part : source) {
    if (part == "..") {
      return std::unexpected(makeError(ErrorCode::kInvalidPath,
                                       "Source path contains '..': " + source.string()));
    }
  }

  std::error_code ec;
  auto status = std::filesystem::status(source, ec);
  if (ec || !std::filesystem::exists(status)) {
    return std::unexpected(makeError(ErrorCode::kNotFound,
                                     "Source file not found: " + source.string()));
  }
  if (!std::filesystem::is_regular_file(status)) {
    return std::unexpected(makeError(ErrorCode::kValidationFailure,
                                     "Source is not a regular file: " + source.string()));
  }

  auto size = util::FileSystem::fileSize(source);
  if (!size.has_value()) {
    return std::unexpected(size.error());
  }
  if (*size > max_bytes_) {
    return std::unexpected(makeError(ErrorCode::kValidationFailure,
                                     "Attachment exceeds " + std::to_string(max_bytes_) +
                                     " bytes: " + source.string()));
  }

  auto name = util::PathSanitizer::sanitizeFilename(source.filename().string());
  if (!name.has_value()) {
    return std::unexpected(name.error());
  }
  return {};
}

Result<FilesystemAttachmentStore::StoredName> FilesystemAttachmentStore::allocateName(
    const core::NoteId& note_id, const std::string& stem, const std::string& extension) {
  auto dir = noteDirectory(note_id);
  if (!dir.has_value()) {
    return std::unexpected(dir.error());
  }
  auto created = util::FileSystem::createDirectories(*dir);
  if (!created.has_value()) {
    return std::unexpected(created.error());
  }

  std::lock_guard lock(name_mutex_);
  auto millis = util::Time::epochMillis(util::Time::now());

  std::error_code ec;
  for (;; ++millis) {
    std::string file_name = joinName(std::to_string(millis) + "-" + stem, extension);
    auto absolute = *dir / file_name;
    if (std::filesystem::exists(absolute, ec)) {
      continue;
    }
    // Placeholder reserves the name until the content lands
    std::ofstream placeholder(absolute, std::ios::binary);
    if (!placeholder) {
      return std::unexpected(makeError(ErrorCode::kIoFailure,
                                       "Cannot create attachment file: " + absolute.string()));
    }
    return StoredName{file_name, "images/" + note_id.toString() + "/" + file_name, absolute};
  }
}

Result<core::ImageRef> FilesystemAttachmentStore::importFile(const core::NoteId& note_id,
                                                             const std::filesystem::path& source) {
  auto valid = validateSource(source);
  if (!valid.has_value()) {
    return std::unexpected(valid.error());
  }

  auto display = util::PathSanitizer::sanitizeFilename(source.filename().string());
  if (!display.has_value()) {
    return std::unexpected(display.error());
  }
  auto parts = splitName(*display);
  if (parts.stem.empty()) {
    parts.stem = "file";
  }

  auto stored = allocateName(note_id, parts.stem, parts.extension);
  if (!stored.has_value()) {
    return std::unexpected(stored.error());
  }

  auto copied = util::FileSystem::copyFile(source, stored->absolute);
  if (!copied.has_value()) {
    std::error_code ec;
    std::filesystem::remove(stored->absolute, ec);
    return std::unexpected(copied.error());
  }

  core::ImageRef ref;
  ref.name = *display;
  ref.path = stored->relative_path;
  ref.added = util::Time::now();
  auto size = util::FileSystem::fileSize(stored->absolute);
  if (size.has_value()) {
    ref.size = *size;
  }

  spdlog::debug("Imported {} as {}", source.string(), ref.path);
  return ref;
}

Result<core::ImageRef> FilesystemAttachmentStore::importData(const core::NoteId& note_id,
                                                             const std::string& data,
                                                             const std::string& suggested_name) {
  if (data.empty()) {
    return std::unexpected(makeError(ErrorCode::kValidationFailure, "Attachment data is empty"));
  }
  if (data.size() > max_bytes_) {
    return std::unexpected(makeError(ErrorCode::kValidationFailure,
                                     "Attachment exceeds " + std::to_string(max_bytes_) + " bytes"));
  }

  std::string requested = suggested_name.empty() ? std::string("paste.png") : suggested_name;
  auto display = util::PathSanitizer::sanitizeFilename(requested);
  if (!display.has_value()) {
    return std::unexpected(display.error());
  }
  auto parts = splitName(*display);
  if (parts.stem.empty()) {
    parts.stem = "paste";
  }
  if (parts.extension.empty()) {
    parts.extension = "png";
  }

  auto stored = allocateName(note_id, parts.stem, parts.extension);
  if (!stored.has_value()) {
    return std::unexpected(stored.error());
  }

  auto written = util::FileSystem::writeFileAtomic(stored->absolute, data);
  if (!written.has_value()) {
    std::error_code ec;
    std::filesystem::remove(stored->absolute, ec);
    return std::unexpected(written.error());
  }

  core::ImageRef ref;
  ref.name = *display;
  ref.path = stored->relative_path;
  ref.added = util::Time::now();
  ref.size = data.size();
  return ref;
}

Result<void> FilesystemAttachmentStore::removeFile(const core::NoteId& note_id,
                                                   const std::string& relative_path) {
  auto relative = util::PathSanitizer::validateRelativePath(relative_path);
  if (!relative.has_value()) {
    return std::unexpected(relative.error());
  }
  if (*std::next(relative->begin()) != note_id.toString()) {
    return std::unexpected(makeError(ErrorCode::kInvalidPath,
                                     "Attachment belongs to another note: " + relative_path));
  }

  auto absolute = util::PathSanitizer::resolveWithin(root_, *relative);
  if (!absolute.has_value()) {
    return std::unexpected(absolute.error());
  }
  return util::FileSystem::removeFile(*absolute);
}

Result<core::ImageRef> FilesystemAttachmentStore::renameFile(const core::NoteId& note_id,
                                                             const core::ImageRef& current,
                                                             const std::string& new_name) {
  auto relative = util::PathSanitizer::validateRelativePath(current.path);
  if (!relative.has_value()) {
    return std::unexpected(relative.error());
  }
  if (*std::next(relative->begin()) != note_id.toString()) {
    return std::unexpected(makeError(ErrorCode::kInvalidPath,
                                     "Attachment belongs to another note: " + current.path));
  }

  auto display = util::PathSanitizer::sanitizeFilename(new_name);
  if (!display.has_value()) {
    return std::unexpected(display.error());
  }

  auto old_file = relative->filename().string();
  auto [prefix, old_rest] = splitPrefix(old_file);
  auto old_parts = splitName(old_rest);
  auto new_parts = splitName(*display);
  if (new_parts.stem.empty()) {
    return std::unexpected(makeError(ErrorCode::kValidationFailure, "Attachment name is empty"));
  }
  if (new_parts.extension.empty()) {
    new_parts.extension = old_parts.extension;
  }

  std::string new_file = joinName(prefix.empty() ? new_parts.stem : prefix + "-" + new_parts.stem,
                                  new_parts.extension);

  auto source = util::PathSanitizer::resolveWithin(root_, *relative);
  if (!source.has_value()) {
    return std::unexpected(source.error());
  }
  auto target_relative = relative->parent_path() / new_file;
  auto target = util::PathSanitizer::resolveWithin(root_, target_relative);
  if (!target.has_value()) {
    return std::unexpected(target.error());
  }

  core::ImageRef renamed = current;
  renamed.name = joinName(new_parts.stem, new_parts.extension);
  renamed.path = target_relative.generic_string();

  if (new_file == old_file) {
    return renamed;
  }

  std::error_code ec;
  if (!std::filesystem::exists(*source, ec)) {
    return std::unexpected(makeError(ErrorCode::kNotFound,
                                     "Attachment file missing: " + current.path));
  }
  if (std::filesystem::exists(*target, ec)) {
    return std::unexpected(makeError(ErrorCode::kValidationFailure,
                                     "An attachment named " + new_file + " already exists"));
  }

  auto moved = util::FileSystem::moveFile(*source, *target);
  if (!moved.has_value()) {
    return std::unexpected(moved.error());
  }

  spdlog::debug("Renamed attachment {} to {}", current.path, renamed.path);
  return renamed;
}

Result<void> FilesystemAttachmentStore::undoRename(const core::ImageRef& renamed,
                                                   const core::ImageRef& original) {
  auto from = resolve(renamed.path);
  if (!from.has_value()) {
    return std::unexpected(from.error());
  }
  auto to = resolve(original.path);
  if (!to.has_value()) {
    return std::unexpected(to.error());
  }
  return util::FileSystem::moveFile(*from, *to);
}

Result<std::filesystem::path> FilesystemAttachmentStore::resolve(
    const std::string& relative_path) const {
  auto relative = util::PathSanitizer::validateRelativePath(relative_path);
  if (!relative.has_value()) {
    return std::unexpected(relative.error());
  }
  return util::PathSanitizer::resolveWithin(root_, *relative);
}

Result<std::vector<core::ImageRef>> FilesystemAttachmentStore::copyAll(
    const core::NoteId& from, const core::NoteId& to, const std::vector<core::ImageRef>& refs) {
  std::vector<core::ImageRef> copies;
  auto rollback = [&]() {
    for (const auto& copy : copies) {
      auto removed = removeFile(to, copy.path);
      if (!removed.has_value()) {
        spdlog::error("Rollback of {} failed: {}", copy.path, removed.error().message());
      }
    }
  };

  for (const auto& ref : refs) {
    auto source = resolve(ref.path);
    if (!source.has_value()) {
      rollback();
      return std::unexpected(source.error());
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(*source, ec)) {
      spdlog::warn("Skipping missing attachment {} of note {}", ref.path, from.toString());
      continue;
    }

    auto [prefix, rest] = splitPrefix(source->filename().string());
    auto parts = splitName(rest);
    if (parts.stem.empty()) {
      parts.stem = "file";
    }
    auto stored = allocateName(to, parts.stem, parts.extension);
    if (!stored.has_value()) {
      rollback();
      return std::unexpected(stored.error());
    }
    auto copied = util::FileSystem::copyFile(*source, stored->absolute);
    if (!copied.has_value()) {
      std::filesystem::remove(stored->absolute, ec);
      rollback();
      return std::unexpected(copied.error());
    }

    core::ImageRef copy = ref;
    copy.path = stored->relative_path;
    copy.added = util::Time::now();
    copies.push_back(std::move(copy));
  }

  return copies;
}

Result<void> FilesystemAttachmentStore::removeAll(const core::NoteId& note_id) {
  auto dir = noteDirectory(note_id);
  if (!dir.has_value()) {
    return std::unexpected(dir.error());
  }
  return util::FileSystem::removeAll(*dir);
}

}  // namespace quire::store
