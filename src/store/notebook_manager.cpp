#include "quire/store/notebook_manager.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "quire/store/filesystem_store.hpp"
#include "quire/util/path_sanitizer.hpp"
#include "quire/util/time.hpp"

namespace quire::store {

namespace {

std::string trim(const std::string& text) {
  auto start = text.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return {};
  }
  auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(start, end - start + 1);
}

Result<std::string> validName(const std::string& name) {
  auto trimmed = trim(name);
  if (trimmed.empty()) {
    return std::unexpected(makeError(ErrorCode::kValidationFailure,
                                     "Notebook name cannot be empty"));
  }
  return trimmed;
}

Error notebookNotFound(const std::string& id) {
  return makeError(ErrorCode::kNotFound, "Notebook not found: " + id);
}

}  // namespace

NotebookManager::NotebookManager(FilesystemStore& store) : store_(store) {}

Result<core::Notebook> NotebookManager::create(const std::string& name) {
  auto valid = validName(name);
  if (!valid.has_value()) {
    return std::unexpected(valid.error());
  }

  core::Notebook notebook;
  notebook.id = core::NoteId::generate().toString();
  notebook.name = *valid;
  notebook.created = util::Time::now();

  auto lock = store_.lockShared();
  auto created = store_.index().update([&](IndexData& data) -> Result<core::Notebook> {
    data.notebooks.push_back(notebook);
    return notebook;
  });
  if (created.has_value()) {
    spdlog::debug("Created notebook {} ({})", created->name, created->id);
  }
  return created;
}

Result<core::Notebook> NotebookManager::rename(const std::string& notebook_id,
                                               const std::string& name) {
  auto id = util::PathSanitizer::validateIdentifier(notebook_id);
  if (!id.has_value()) {
    return std::unexpected(id.error());
  }
  auto valid = validName(name);
  if (!valid.has_value()) {
    return std::unexpected(valid.error());
  }

  auto lock = store_.lockShared();
  return store_.index().update([&](IndexData& data) -> Result<core::Notebook> {
    auto* notebook = data.findNotebook(*id);
    if (notebook == nullptr) {
      return std::unexpected(notebookNotFound(*id));
    }
    notebook->name = *valid;
    return *notebook;
  });
}

Result<core::Notebook> NotebookManager::archive(const std::string& notebook_id) {
  return setArchived(notebook_id, true);
}

Result<core::Notebook> NotebookManager::unarchive(const std::string& notebook_id) {
  return setArchived(notebook_id, false);
}

Result<core::Notebook> NotebookManager::setArchived(const std::string& notebook_id,
                                                    bool archived) {
  auto id = util::PathSanitizer::validateIdentifier(notebook_id);
  if (!id.has_value()) {
    return std::unexpected(id.error());
  }

  auto lock = store_.lockShared();
  return store_.index().update([&](IndexData& data) -> Result<core::Notebook> {
    auto* notebook = data.findNotebook(*id);
    if (notebook == nullptr) {
      return std::unexpected(notebookNotFound(*id));
    }
    notebook->archived = archived;
    return *notebook;
  });
}

std::vector<core::Notebook> NotebookManager::list() const {
  auto lock = store_.lockShared();
  auto notebooks = store_.index().listNotebooks();
  std::stable_sort(notebooks.begin(), notebooks.end(),
                   [](const core::Notebook& a, const core::Notebook& b) {
                     if (a.archived != b.archived) {
                       return !a.archived;
                     }
                     return a.created < b.created;
                   });
  return notebooks;
}

Result<core::Note> NotebookManager::moveNote(const core::NoteId& note_id,
                                             const std::optional<std::string>& notebook_id) {
  if (notebook_id.has_value()) {
    auto id = util::PathSanitizer::validateIdentifier(*notebook_id);
    if (!id.has_value()) {
      return std::unexpected(id.error());
    }
  }

  {
    auto lock = store_.lockShared();
    auto moved = store_.index().update([&](IndexData& data) -> Result<core::Metadata> {
      if (notebook_id.has_value() && data.findNotebook(*notebook_id) == nullptr) {
        return std::unexpected(notebookNotFound(*notebook_id));
      }
      auto* note = data.findNote(note_id);
      if (note == nullptr) {
        return std::unexpected(makeError(ErrorCode::kNotFound,
                                         "Note not found: " + note_id.toString()));
      }
      note->setNotebook(notebook_id);
      return *note;
    });
    if (!moved.has_value()) {
      return std::unexpected(moved.error());
    }
  }

  return store_.read(note_id);
}

}  // namespace quire::store
