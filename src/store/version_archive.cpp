#include "quire/store/version_archive.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "quire/util/filesystem.hpp"
#include "quire/util/path_sanitizer.hpp"
#include "quire/util/time.hpp"

namespace quire::store {

nlohmann::json VersionSnapshot::toJson() const {
  nlohmann::json json;
  json["savedAt"] = util::Time::toRfc3339(saved_at);
  json["title"] = title;
  json["body"] = body;
  return json;
}

Result<VersionSnapshot> VersionSnapshot::fromJson(const nlohmann::json& json) {
  try {
    VersionSnapshot snapshot;
    auto saved_at = util::Time::fromRfc3339(json.at("savedAt").get<std::string>());
    if (!saved_at.has_value()) {
      return std::unexpected(saved_at.error());
    }
    snapshot.saved_at = *saved_at;
    snapshot.title = json.value("title", std::string{});
    snapshot.body = json.value("body", std::string{});
    return snapshot;
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid version file: " + std::string(e.what())));
  }
}

namespace {

Result<VersionSnapshot> readSnapshot(const std::filesystem::path& path) {
  auto content = util::FileSystem::readFile(path);
  if (!content.has_value()) {
    return std::unexpected(content.error());
  }
  try {
    return VersionSnapshot::fromJson(nlohmann::json::parse(*content));
  } catch (const nlohmann::json::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Cannot parse " + path.filename().string() + ": " + e.what()));
  }
}

}  // namespace

VersionArchive::VersionArchive(std::filesystem::path versions_dir, size_t preview_length)
    : versions_dir_(std::move(versions_dir)), preview_length_(preview_length) {}

std::string VersionArchive::fileNameFor(std::chrono::system_clock::time_point saved_at) {
  auto name = util::Time::toRfc3339(saved_at);
  std::replace(name.begin(), name.end(), ':', '-');
  return name + ".json";
}

Result<std::filesystem::path> VersionArchive::directoryFor(const core::NoteId& id) const {
  auto name = util::PathSanitizer::validateIdentifier(id.toString());
  if (!name.has_value()) {
    return std::unexpected(name.error());
  }
  return versions_dir_ / *name;
}

Result<std::vector<std::filesystem::path>> VersionArchive::sortedFiles(const core::NoteId& id) const {
  auto dir = directoryFor(id);
  if (!dir.has_value()) {
    return std::unexpected(dir.error());
  }
  auto files = util::FileSystem::listDirectory(*dir, ".json");
  if (!files.has_value()) {
    return files;
  }
  std::sort(files->begin(), files->end());
  return files;
}

std::string VersionArchive::makePreview(const std::string& body) const {
  size_t chars = 0;
  size_t i = 0;
  while (i < body.size() && chars < preview_length_) {
    auto c = static_cast<unsigned char>(body[i]);
    size_t len = c < 0x80 ? 1 : (c >> 5) == 0x6 ? 2 : (c >> 4) == 0xE ? 3 : (c >> 3) == 0x1E ? 4 : 1;
    i += len;
    ++chars;
  }
  if (i >= body.size()) {
    return body;
  }
  return body.substr(0, i) + "...";
}

Result<bool> VersionArchive::recordSnapshot(const core::NoteId& id, const std::string& title,
                                            const std::string& body,
                                            std::chrono::system_clock::time_point saved_at) {
  auto dir = directoryFor(id);
  if (!dir.has_value()) {
    return std::unexpected(dir.error());
  }
  auto files = sortedFiles(id);
  if (!files.has_value()) {
    return std::unexpected(files.error());
  }

  saved_at = std::chrono::time_point_cast<std::chrono::milliseconds>(saved_at);

  if (!files->empty()) {
    auto newest = readSnapshot(files->back());
    if (newest.has_value()) {
      if (newest->title == title && newest->body == body) {
        return false;
      }
      saved_at = std::max(saved_at, newest->saved_at + std::chrono::milliseconds(1));
    } else {
      spdlog::warn("Unreadable version file {}: {}", files->back().string(),
                   newest.error().message());
    }
  }

  auto target = *dir / fileNameFor(saved_at);
  std::error_code ec;
  while (std::filesystem::exists(target, ec)) {
    saved_at += std::chrono::milliseconds(1);
    target = *dir / fileNameFor(saved_at);
  }

  while (files->size() >= kMaxVersions) {
    auto removed = util::FileSystem::removeFile(files->front());
    if (!removed.has_value()) {
      return std::unexpected(removed.error());
    }
    files->erase(files->begin());
  }

  VersionSnapshot snapshot{saved_at, title, body};
  auto written = util::FileSystem::writeFileAtomic(target, snapshot.toJson().dump(2));
  if (!written.has_value()) {
    return std::unexpected(written.error());
  }

  spdlog::debug("Recorded version {} for note {}", util::Time::toRfc3339(saved_at), id.toString());
  return true;
}

Result<std::vector<VersionEntry>> VersionArchive::list(const core::NoteId& id) const {
  auto files = sortedFiles(id);
  if (!files.has_value()) {
    return std::unexpected(files.error());
  }

  std::vector<VersionEntry> entries;
  entries.reserve(files->size());
  for (auto it = files->rbegin(); it != files->rend(); ++it) {
    auto snapshot = readSnapshot(*it);
    if (!snapshot.has_value()) {
      spdlog::warn("Skipping unreadable version file {}: {}", it->string(),
                   snapshot.error().message());
      continue;
    }
    entries.push_back(VersionEntry{snapshot->saved_at, snapshot->title, makePreview(snapshot->body)});
  }
  return entries;
}

Result<VersionSnapshot> VersionArchive::get(const core::NoteId& id,
                                            const std::string& saved_at) const {
  auto dir = directoryFor(id);
  if (!dir.has_value()) {
    return std::unexpected(dir.error());
  }

  auto parsed = util::Time::fromRfc3339(saved_at);
  if (!parsed.has_value()) {
    return std::unexpected(makeError(ErrorCode::kNotFound,
                                     "No version " + saved_at + " for note " + id.toString()));
  }

  auto snapshot = readSnapshot(*dir / fileNameFor(*parsed));
  if (!snapshot.has_value()) {
    if (snapshot.error().code() == ErrorCode::kNotFound) {
      return std::unexpected(makeError(ErrorCode::kNotFound,
                                       "No version " + saved_at + " for note " + id.toString()));
    }
    return std::unexpected(snapshot.error());
  }
  return snapshot;
}

Result<void> VersionArchive::removeAll(const core::NoteId& id) {
  auto dir = directoryFor(id);
  if (!dir.has_value()) {
    return std::unexpected(dir.error());
  }
  return util::FileSystem::removeAll(*dir);
}

}  // namespace quire::store
