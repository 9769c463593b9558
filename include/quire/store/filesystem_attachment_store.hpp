#pragma once

#include <filesystem>
#include <mutex>

#include "quire/store/attachment_store.hpp"

namespace quire::store {

// Attachments under <root>/images/<noteId>/<epochMillis>-<name>.<ext>
class FilesystemAttachmentStore : public AttachmentStore {
 public:
  static constexpr std::uintmax_t kDefaultMaxBytes = 50ull * 1024 * 1024;

  explicit FilesystemAttachmentStore(std::filesystem::path root,
                                     std::uintmax_t max_bytes = kDefaultMaxBytes);

  Result<void> validateSource(const std::filesystem::path& source) const override;
  Result<core::ImageRef> importFile(const core::NoteId& note_id,
                                    const std::filesystem::path& source) override;
  Result<core::ImageRef> importData(const core::NoteId& note_id,
                                    const std::string& data,
                                    const std::string& suggested_name) override;
  Result<void> removeFile(const core::NoteId& note_id,
                          const std::string& relative_path) override;
  Result<core::ImageRef> renameFile(const core::NoteId& note_id,
                                    const core::ImageRef& current,
                                    const std::string& new_name) override;
  Result<void> undoRename(const core::ImageRef& renamed,
                          const core::ImageRef& original) override;
  Result<std::filesystem::path> resolve(const std::string& relative_path) const override;
  Result<std::vector<core::ImageRef>> copyAll(const core::NoteId& from,
                                              const core::NoteId& to,
                                              const std::vector<core::ImageRef>& refs) override;
  Result<void> removeAll(const core::NoteId& note_id) override;

 private:
  struct StoredName {
    std::string file_name;     // <millis>-<stem>[.<ext>]
    std::string relative_path; // images/<noteId>/<file_name>
    std::filesystem::path absolute;
  };

  // Reserve a collision-free name in the note's directory
  Result<StoredName> allocateName(const core::NoteId& note_id, const std::string& stem,
                                  const std::string& extension);

  Result<std::filesystem::path> noteDirectory(const core::NoteId& note_id) const;

  std::filesystem::path root_;
  std::uintmax_t max_bytes_;
  std::mutex name_mutex_;
};

}  // namespace quire::store
