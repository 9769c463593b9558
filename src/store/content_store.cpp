#include "quire/store/content_store.hpp"

#include <spdlog/spdlog.h>

#include "quire/util/filesystem.hpp"
#include "quire/util/path_sanitizer.hpp"

namespace quire::store {

ContentStore::ContentStore(std::filesystem::path notes_dir)
    : notes_dir_(std::move(notes_dir)) {}

Result<std::filesystem::path> ContentStore::pathFor(const core::NoteId& id) const {
  auto name = util::PathSanitizer::validateIdentifier(id.toString());
  if (!name.has_value()) {
    return std::unexpected(name.error());
  }
  return notes_dir_ / (*name + ".txt");
}

Result<std::string> ContentStore::read(const core::NoteId& id) const {
  auto path = pathFor(id);
  if (!path.has_value()) {
    return std::unexpected(path.error());
  }

  auto content = util::FileSystem::readFile(*path);
  if (!content.has_value() && content.error().code() == ErrorCode::kNotFound) {
    return std::unexpected(makeError(ErrorCode::kNotFound,
                                     "No content for note " + id.toString()));
  }
  return content;
}

Result<void> ContentStore::write(const core::NoteId& id, const std::string& body) {
  auto path = pathFor(id);
  if (!path.has_value()) {
    return std::unexpected(path.error());
  }

  auto result = util::FileSystem::writeFileAtomic(*path, body);
  if (result.has_value()) {
    spdlog::debug("Wrote {} bytes to {}", body.size(), path->filename().string());
  }
  return result;
}

Result<void> ContentStore::remove(const core::NoteId& id) {
  auto path = pathFor(id);
  if (!path.has_value()) {
    return std::unexpected(path.error());
  }
  return util::FileSystem::removeFile(*path);
}

bool ContentStore::exists(const core::NoteId& id) const {
  auto path = pathFor(id);
  std::error_code ec;
  return path.has_value() && std::filesystem::is_regular_file(*path, ec);
}

}  // namespace quire::store
