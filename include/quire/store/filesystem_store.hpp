#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "quire/store/content_store.hpp"
#include "quire/store/filesystem_attachment_store.hpp"
#include "quire/store/metadata_index.hpp"
#include "quire/store/note_store.hpp"
#include "quire/store/version_archive.hpp"

namespace quire::store {

struct StoreOptions {
  size_t preview_length = 150;
  std::uintmax_t max_attachment_bytes = FilesystemAttachmentStore::kDefaultMaxBytes;
};

/**
 * @brief Note store rooted at one directory
 *
 * Layout:
 *   notes/<id>.txt
 *   versions/<id>/<savedAt>.json
 *   meta/index.json
 *   images/<id>/<millis>-<name>.<ext>
 *
 * Normal operations hold the store lock shared; backup and import hold it
 * exclusively. A per-note mutex serializes the content write and index
 * update of one note; operations touching several notes lock them in id
 * order.
 */
class FilesystemStore : public NoteStore {
 public:
  explicit FilesystemStore(std::filesystem::path root, StoreOptions options = {});
  ~FilesystemStore() override = default;

  FilesystemStore(const FilesystemStore&) = delete;
  FilesystemStore& operator=(const FilesystemStore&) = delete;

  // NoteStore interface implementation
  Result<void> init() override;

  Result<std::vector<core::Metadata>> listNotes() const override;
  Result<core::Note> read(const core::NoteId& id) const override;
  Result<core::Note> save(const std::optional<core::NoteId>& id, const std::string& title,
                          const std::string& body) override;
  Result<core::Note> updateTitle(const core::NoteId& id, const std::string& title) override;
  Result<core::Note> toggleStar(const core::NoteId& id) override;
  Result<std::vector<core::Metadata>> setStarred(const std::vector<core::NoteId>& ids,
                                                 bool starred) override;
  Result<void> remove(const core::NoteId& id) override;
  Result<void> removeMany(const std::vector<core::NoteId>& ids) override;
  Result<core::Note> duplicate(const core::NoteId& id) override;
  Result<core::Note> merge(const std::vector<core::NoteId>& ids) override;
  Result<core::Note> getOrCreateDaily() override;

  Result<std::vector<TagCount>> listTags() const override;
  Result<std::vector<core::Metadata>> addTag(const std::vector<core::NoteId>& ids,
                                             const std::string& tag) override;
  Result<std::vector<core::Metadata>> removeTag(const std::vector<core::NoteId>& ids,
                                                const std::string& tag) override;

  Result<std::vector<core::Metadata>> getBacklinks(const core::NoteId& id) const override;
  Result<std::vector<core::Metadata>> search(const std::string& query) const override;

  Result<std::vector<VersionEntry>> listVersions(const core::NoteId& id) const override;
  Result<VersionSnapshot> getVersion(const core::NoteId& id,
                                     const std::string& saved_at) const override;
  Result<core::Note> restoreVersion(const core::NoteId& id, const std::string& saved_at) override;

  Result<core::Note> attach(const core::NoteId& id,
                            const std::vector<std::filesystem::path>& sources) override;
  Result<core::Note> attachFromData(const core::NoteId& id, const std::string& data,
                                    const std::string& suggested_name) override;
  Result<core::Note> removeAttachment(const core::NoteId& id,
                                      const std::string& relative_path) override;
  Result<core::Note> renameAttachment(const core::NoteId& id, const std::string& relative_path,
                                      const std::string& new_name) override;
  Result<std::filesystem::path> resolveAttachment(const std::string& relative_path) const override;

  // FilesystemStore specific methods
  const std::filesystem::path& root() const noexcept { return root_; }
  MetadataIndex& index() noexcept { return index_; }
  const MetadataIndex& index() const noexcept { return index_; }

  // Recovery notices raised while opening the store (e.g. a corrupt index)
  const std::vector<std::string>& warnings() const noexcept { return warnings_; }

  // Store-wide locks for callers outside the note operations
  std::shared_lock<std::shared_mutex> lockShared() const;
  std::unique_lock<std::shared_mutex> lockExclusive();

  // Re-read meta/index.json; caller holds the exclusive lock
  Result<void> reload();

  // Per-note lock slots currently allocated
  size_t noteLockCount() const;

  // Top-level directories copied by backups
  static const std::vector<std::string>& dataDirectories();

 private:
  // The lock keeps its mutex alive after the table slot is dropped
  struct NoteLock {
    std::shared_ptr<std::mutex> mutex;
    std::unique_lock<std::mutex> lock;
  };
  using NoteLocks = std::vector<NoteLock>;

  // Save without taking the store lock; a missing body keeps the stored one
  Result<core::Note> saveUnlocked(const std::optional<core::NoteId>& id,
                                  const std::string& title,
                                  const std::optional<std::string>& body);
  Result<core::Note> assemble(const core::Metadata& metadata) const;
  Result<std::string> readBody(const core::NoteId& id) const;
  Result<void> ensureLayout();
  Result<void> loadIndex();
  // Delete a note's files and its lock slot; caller holds the note lock
  void purgeFiles(const core::NoteId& id);
  void releaseNoteMutex(const core::NoteId& id);

  std::shared_ptr<std::mutex> noteMutex(const core::NoteId& id);
  NoteLocks lockNotes(std::vector<core::NoteId> ids);

  std::filesystem::path root_;
  StoreOptions options_;
  MetadataIndex index_;
  ContentStore content_;
  VersionArchive versions_;
  FilesystemAttachmentStore attachments_;
  std::vector<std::string> warnings_;

  mutable std::shared_mutex store_mutex_;
  mutable std::mutex note_table_mutex_;
  std::unordered_map<core::NoteId, std::shared_ptr<std::mutex>> note_mutexes_;
};

}  // namespace quire::store
