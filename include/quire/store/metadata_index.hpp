#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "quire/common.hpp"
#include "quire/core/metadata.hpp"
#include "quire/core/notebook.hpp"

namespace quire::store {

// Everything persisted in meta/index.json
struct IndexData {
  static constexpr int kFormatVersion = 1;

  int version = kFormatVersion;
  std::vector<core::Metadata> notes;
  std::vector<core::Notebook> notebooks;
  std::vector<core::NoteTemplate> templates;   // Custom templates only
  std::optional<std::string> sync_folder;

  core::Metadata* findNote(const core::NoteId& id);
  const core::Metadata* findNote(const core::NoteId& id) const;
  core::Notebook* findNotebook(const std::string& id);
  const core::Notebook* findNotebook(const std::string& id) const;

  nlohmann::json toJson() const;
  static Result<IndexData> fromJson(const nlohmann::json& json);
};

/**
 * @brief Authoritative in-memory copy of meta/index.json
 *
 * Every mutation is a read-modify-write under one exclusive lock: the
 * closure works on a copy, the copy is written to a temp file and renamed
 * over the index, and only then replaces the in-memory state. Readers take
 * the shared lock and get copies.
 */
class MetadataIndex {
 public:
  explicit MetadataIndex(std::filesystem::path index_file);

  // Parse the index file. A missing file gives empty data; unparseable
  // content gives kIndexCorrupt and leaves the in-memory state empty.
  Result<void> load();

  // Parse an index file without touching this instance
  static Result<IndexData> readFile(const std::filesystem::path& path);

  IndexData snapshot() const;
  std::vector<core::Metadata> listNotes() const;
  std::vector<core::Notebook> listNotebooks() const;
  std::optional<std::string> syncFolder() const;
  Result<core::Metadata> get(const core::NoteId& id) const;

  // Insert or replace a note record
  Result<void> upsert(const core::Metadata& record);

  // Remove a note record; kNotFound when absent
  Result<void> remove(const core::NoteId& id);

  // Atomically apply fn to a copy of the data and persist it. fn returns a
  // Result; on error nothing is written and the in-memory state is kept.
  template <typename Fn>
  auto update(Fn&& fn) -> decltype(fn(std::declval<IndexData&>())) {
    std::unique_lock lock(mutex_);
    IndexData working = data_;
    auto result = fn(working);
    if (!result.has_value()) {
      return result;
    }
    auto persisted = persist(working);
    if (!persisted.has_value()) {
      return std::unexpected(persisted.error());
    }
    data_ = std::move(working);
    return result;
  }

  // Replace all data (used by backup import)
  Result<void> replace(IndexData data);

  const std::filesystem::path& path() const noexcept { return index_file_; }

 private:
  Result<void> persist(const IndexData& data) const;

  std::filesystem::path index_file_;
  mutable std::shared_mutex mutex_;
  IndexData data_;
};

}  // namespace quire::store
