#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "quire/common.hpp"
#include "quire/core/note_id.hpp"

namespace quire::store {

// Full copy of a note's title and body at one point in time
struct VersionSnapshot {
  std::chrono::system_clock::time_point saved_at;
  std::string title;
  std::string body;

  nlohmann::json toJson() const;
  static Result<VersionSnapshot> fromJson(const nlohmann::json& json);
};

// Listing entry; preview is the start of the body
struct VersionEntry {
  std::chrono::system_clock::time_point saved_at;
  std::string title;
  std::string preview;
};

/**
 * @brief Bounded per-note history under versions/<noteId>/
 *
 * Each snapshot is one JSON file named after its savedAt timestamp (':'
 * replaced by '-'), so lexical order of file names is chronological.
 */
class VersionArchive {
 public:
  static constexpr size_t kMaxVersions = 30;

  VersionArchive(std::filesystem::path versions_dir, size_t preview_length = 150);

  // Append a snapshot unless it equals the newest one. Oldest entries are
  // evicted first so the count never exceeds kMaxVersions. Returns whether
  // a snapshot was written.
  Result<bool> recordSnapshot(const core::NoteId& id, const std::string& title,
                              const std::string& body,
                              std::chrono::system_clock::time_point saved_at);

  // Newest first
  Result<std::vector<VersionEntry>> list(const core::NoteId& id) const;

  // kNotFound when no snapshot has this savedAt
  Result<VersionSnapshot> get(const core::NoteId& id, const std::string& saved_at) const;

  // Drop a note's whole history
  Result<void> removeAll(const core::NoteId& id);

  static std::string fileNameFor(std::chrono::system_clock::time_point saved_at);

 private:
  Result<std::filesystem::path> directoryFor(const core::NoteId& id) const;
  Result<std::vector<std::filesystem::path>> sortedFiles(const core::NoteId& id) const;
  std::string makePreview(const std::string& body) const;

  std::filesystem::path versions_dir_;
  size_t preview_length_;
};

}  // namespace quire::store
