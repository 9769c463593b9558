#pragma once

#include <filesystem>
#include <string>

#include "quire/common.hpp"
#include "quire/core/note_id.hpp"

namespace quire::store {

// One plain-text body file per note under notes/
class ContentStore {
 public:
  explicit ContentStore(std::filesystem::path notes_dir);

  // Body of a note; kNotFound when the file is missing
  Result<std::string> read(const core::NoteId& id) const;

  // Atomically replace the body
  Result<void> write(const core::NoteId& id, const std::string& body);

  // Remove the body file; missing files are not an error
  Result<void> remove(const core::NoteId& id);

  bool exists(const core::NoteId& id) const;

  // notes/<id>.txt, validated
  Result<std::filesystem::path> pathFor(const core::NoteId& id) const;

  const std::filesystem::path& directory() const noexcept { return notes_dir_; }

 private:
  std::filesystem::path notes_dir_;
};

}  // namespace quire::store
