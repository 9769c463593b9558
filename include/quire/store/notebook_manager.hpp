#pragma once

#include <optional>
#include <string>
#include <vector>

#include "quire/common.hpp"
#include "quire/core/note.hpp"
#include "quire/core/notebook.hpp"

namespace quire::store {

class FilesystemStore;

/**
 * @brief Manager for notebook records kept in the metadata index
 *
 * Notebooks are never physically removed; archiving hides them from the
 * top of listings. Names are trimmed, must be non-empty and may repeat.
 */
class NotebookManager {
public:
  /**
   * @brief Constructor
   * @param store Store whose index holds the notebooks
   */
  explicit NotebookManager(FilesystemStore& store);

  /**
   * @brief Create a new notebook
   * @param name Display name, trimmed
   * @return The created notebook, or kValidationFailure for an empty name
   */
  Result<core::Notebook> create(const std::string& name);

  Result<core::Notebook> rename(const std::string& notebook_id, const std::string& name);

  // Archive flag only; notes stay filed under the notebook
  Result<core::Notebook> archive(const std::string& notebook_id);
  Result<core::Notebook> unarchive(const std::string& notebook_id);

  // Non-archived first, then by createdAt
  std::vector<core::Notebook> list() const;

  /**
   * @brief File a note under a notebook
   * @param note_id Note to move
   * @param notebook_id Target notebook; nullopt unfiles the note
   * @return The note with its new notebookId
   */
  Result<core::Note> moveNote(const core::NoteId& note_id,
                              const std::optional<std::string>& notebook_id);

private:
  Result<core::Notebook> setArchived(const std::string& notebook_id, bool archived);

  FilesystemStore& store_;
};

}  // namespace quire::store
