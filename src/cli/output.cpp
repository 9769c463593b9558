#include "quire/cli/output.hpp"

#include <iostream>
#include <sstream>


#include "quire/util/filesystem.hpp"
#include "quire/util/time.hpp"

namespace quire::cli {

void printJson(const nlohmann::json& json) {
  std::cout << json.dump(2) << std::endl;
}

nlohmann::json notesJson(const std::vector<core::Metadata>& notes) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto& metadata : notes) {
    array.push_back(metadata.toJson());
  }
  return array;
}

void printNoteList(const std::vector<core::Metadata>& notes, const GlobalOptions& options) {
  if (options.json) {
    printJson(notesJson(notes));
    return;
  }
  if (notes.empty()) {
    if (!options.quiet) {
      std::cout << "No notes found." << std::endl;
    }
    return;
  }

  for (const auto& metadata : notes) {
    std::cout << metadata.id().toString() << ' ' << (metadata.important() ? '*' : ' ') << ' '
              << util::Time::localDate(metadata.updated()) << "  "
              << (metadata.title().empty() ? "(untitled)" : metadata.title());
    for (const auto& tag : metadata.tags()) {
      std::cout << " #" << tag;
    }
    std::cout << std::endl;
  }
}

void printNote(const core::Note& note, const GlobalOptions& options) {
  if (options.json) {
    printJson(note.toJson());
    return;
  }
  if (options.quiet) {
    std::cout << note.id().toString() << std::endl;
    return;
  }

  const auto& metadata = note.metadata();
  std::cout << "# " << metadata.title() << std::endl;
  std::cout << "id: " << metadata.id().toString();
  if (metadata.important()) {
    std::cout << "  (starred)";
  }
  std::cout << std::endl;
  std::cout << "updated: " << util::Time::toRfc3339(metadata.updated()) << std::endl;
  if (!metadata.tags().empty()) {
    std::cout << "tags:";
    for (const auto& tag : metadata.tags()) {
      std::cout << ' ' << tag;
    }
    std::cout << std::endl;
  }
  if (metadata.notebook().has_value()) {
    std::cout << "notebook: " << *metadata.notebook() << std::endl;
  }
  for (const auto& image : metadata.images()) {
    std::cout << "attachment: " << image.path << " (" << image.name << ")" << std::endl;
  }
  std::cout << std::endl << note.content();
  if (!note.content().empty() && note.content().back() != '\n') {
    std::cout << std::endl;
  }
}

void printNotebook(const core::Notebook& notebook, const GlobalOptions& options) {
  if (options.json) {
    printJson(notebook.toJson());
    return;
  }
  std::cout << notebook.id << "  " << notebook.name;
  if (notebook.archived) {
    std::cout << "  [archived]";
  }
  std::cout << std::endl;
}

Result<core::NoteId> parseNoteId(const std::string& text) {
  return core::NoteId::fromString(text);
}

Result<std::vector<core::NoteId>> parseNoteIds(const std::vector<std::string>& texts) {
  std::vector<core::NoteId> ids;
  ids.reserve(texts.size());
  for (const auto& text : texts) {
    auto id = core::NoteId::fromString(text);
    if (!id.has_value()) {
      return std::unexpected(id.error());
    }
    ids.push_back(*id);
  }
  return ids;
}

Result<std::string> readTextInput(const std::string& path) {
  if (path == "-") {
    std::ostringstream buffer;
    buffer << std::cin.rdbuf();
    if (std::cin.bad()) {
      return makeErrorResult<std::string>(ErrorCode::kIoFailure, "Failed to read stdin");
    }
    return buffer.str();
  }
  return util::FileSystem::readFile(path);
}

}  // namespace quire::cli
