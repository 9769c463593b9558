#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "quire/cli/application.hpp"
#include "quire/common.hpp"
#include "quire/core/note.hpp"
#include "quire/core/notebook.hpp"

namespace quire::cli {

// Print a JSON document on stdout
void printJson(const nlohmann::json& json);

nlohmann::json notesJson(const std::vector<core::Metadata>& notes);

// One line per note: id, star, date, title and tags
void printNoteList(const std::vector<core::Metadata>& notes, const GlobalOptions& options);

// Full note (JSON record, or title, tags and body)
void printNote(const core::Note& note, const GlobalOptions& options);

void printNotebook(const core::Notebook& notebook, const GlobalOptions& options);

Result<core::NoteId> parseNoteId(const std::string& text);
Result<std::vector<core::NoteId>> parseNoteIds(const std::vector<std::string>& texts);

// File contents, or stdin when path is "-"
Result<std::string> readTextInput(const std::string& path);

}  // namespace quire::cli
