#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "quire/common.hpp"
#include "quire/core/metadata.hpp"
#include "quire/core/note_id.hpp"

namespace quire::store {

// File-level attachment storage. Metadata (the ImageRef list on a note) is
// owned by the note store, which combines these operations with index updates.
class AttachmentStore {
 public:
  virtual ~AttachmentStore() = default;

  // Check that a source file can be imported: a relative path (against the
  // working directory) without "..", existing, regular and within the size cap
  virtual Result<void> validateSource(const std::filesystem::path& source) const = 0;

  // Copy a file into the note's attachment directory
  virtual Result<core::ImageRef> importFile(const core::NoteId& note_id,
                                            const std::filesystem::path& source) = 0;

  // Store raw bytes (clipboard paste) under a sanitized suggested name
  virtual Result<core::ImageRef> importData(const core::NoteId& note_id,
                                            const std::string& data,
                                            const std::string& suggested_name) = 0;

  // Delete a stored file; a missing file is not an error
  virtual Result<void> removeFile(const core::NoteId& note_id,
                                  const std::string& relative_path) = 0;

  // Rename a stored file, returning the ref with its new name and path
  virtual Result<core::ImageRef> renameFile(const core::NoteId& note_id,
                                            const core::ImageRef& current,
                                            const std::string& new_name) = 0;

  // Move a renamed file back to its previous path
  virtual Result<void> undoRename(const core::ImageRef& renamed,
                                  const core::ImageRef& original) = 0;

  // Absolute path of a stored relative path, re-validated
  virtual Result<std::filesystem::path> resolve(const std::string& relative_path) const = 0;

  // Copy refs of one note into another note's directory
  virtual Result<std::vector<core::ImageRef>> copyAll(const core::NoteId& from,
                                                      const core::NoteId& to,
                                                      const std::vector<core::ImageRef>& refs) = 0;

  // Remove a note's attachment directory
  virtual Result<void> removeAll(const core::NoteId& note_id) = 0;
};

}  // namespace quire::store
