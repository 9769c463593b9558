#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "quire/common.hpp"
#include "quire/core/metadata.hpp"
#include "quire/core/note.hpp"
#include "quire/core/note_id.hpp"
#include "quire/store/version_archive.hpp"

namespace quire::store {

// Tag with the number of notes carrying it
struct TagCount {
  std::string tag;
  size_t count = 0;
};

// Abstract interface for note storage. Every mutating call returns the
// fresh record.
class NoteStore {
 public:
  virtual ~NoteStore() = default;

  // Create the on-disk layout and load the index
  virtual Result<void> init() = 0;

  // Notes
  virtual Result<std::vector<core::Metadata>> listNotes() const = 0;
  virtual Result<core::Note> read(const core::NoteId& id) const = 0;
  virtual Result<core::Note> save(const std::optional<core::NoteId>& id,
                                  const std::string& title, const std::string& body) = 0;
  virtual Result<core::Note> updateTitle(const core::NoteId& id, const std::string& title) = 0;
  virtual Result<core::Note> toggleStar(const core::NoteId& id) = 0;
  virtual Result<std::vector<core::Metadata>> setStarred(const std::vector<core::NoteId>& ids,
                                                         bool starred) = 0;
  virtual Result<void> remove(const core::NoteId& id) = 0;
  virtual Result<void> removeMany(const std::vector<core::NoteId>& ids) = 0;
  virtual Result<core::Note> duplicate(const core::NoteId& id) = 0;
  virtual Result<core::Note> merge(const std::vector<core::NoteId>& ids) = 0;
  virtual Result<core::Note> getOrCreateDaily() = 0;

  // Tags
  virtual Result<std::vector<TagCount>> listTags() const = 0;
  virtual Result<std::vector<core::Metadata>> addTag(const std::vector<core::NoteId>& ids,
                                                     const std::string& tag) = 0;
  virtual Result<std::vector<core::Metadata>> removeTag(const std::vector<core::NoteId>& ids,
                                                        const std::string& tag) = 0;

  // Graph and search
  virtual Result<std::vector<core::Metadata>> getBacklinks(const core::NoteId& id) const = 0;
  virtual Result<std::vector<core::Metadata>> search(const std::string& query) const = 0;

  // History
  virtual Result<std::vector<VersionEntry>> listVersions(const core::NoteId& id) const = 0;
  virtual Result<VersionSnapshot> getVersion(const core::NoteId& id,
                                             const std::string& saved_at) const = 0;
  virtual Result<core::Note> restoreVersion(const core::NoteId& id,
                                            const std::string& saved_at) = 0;

  // Attachments
  virtual Result<core::Note> attach(const core::NoteId& id,
                                    const std::vector<std::filesystem::path>& sources) = 0;
  virtual Result<core::Note> attachFromData(const core::NoteId& id, const std::string& data,
                                            const std::string& suggested_name) = 0;
  virtual Result<core::Note> removeAttachment(const core::NoteId& id,
                                              const std::string& relative_path) = 0;
  virtual Result<core::Note> renameAttachment(const core::NoteId& id,
                                              const std::string& relative_path,
                                              const std::string& new_name) = 0;
  virtual Result<std::filesystem::path> resolveAttachment(const std::string& relative_path) const = 0;
};

}  // namespace quire::store
