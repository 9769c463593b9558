#include "quire/store/metadata_index.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "quire/util/filesystem.hpp"

namespace quire::store {

core::Metadata* IndexData::findNote(const core::NoteId& id) {
  auto it = std::find_if(notes.begin(), notes.end(),
                         [&](const core::Metadata& m) { return m.id() == id; });
  return it == notes.end() ? nullptr : &*it;
}

const core::Metadata* IndexData::findNote(const core::NoteId& id) const {
  auto it = std::find_if(notes.begin(), notes.end(),
                         [&](const core::Metadata& m) { return m.id() == id; });
  return it == notes.end() ? nullptr : &*it;
}

core::Notebook* IndexData::findNotebook(const std::string& id) {
  auto it = std::find_if(notebooks.begin(), notebooks.end(),
                         [&](const core::Notebook& n) { return n.id == id; });
  return it == notebooks.end() ? nullptr : &*it;
}

const core::Notebook* IndexData::findNotebook(const std::string& id) const {
  auto it = std::find_if(notebooks.begin(), notebooks.end(),
                         [&](const core::Notebook& n) { return n.id == id; });
  return it == notebooks.end() ? nullptr : &*it;
}

nlohmann::json IndexData::toJson() const {
  nlohmann::json json;
  json["version"] = version;

  json["notes"] = nlohmann::json::array();
  for (const auto& note : notes) {
    json["notes"].push_back(note.toJson());
  }

  json["notebooks"] = nlohmann::json::array();
  for (const auto& notebook : notebooks) {
    json["notebooks"].push_back(notebook.toJson());
  }

  json["templates"] = nlohmann::json::array();
  for (const auto& tpl : templates) {
    json["templates"].push_back(tpl.toJson());
  }

  json["syncFolder"] = sync_folder.has_value() ? nlohmann::json(*sync_folder)
                                               : nlohmann::json(nullptr);
  return json;
}

Result<IndexData> IndexData::fromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    return std::unexpected(makeError(ErrorCode::kIndexCorrupt, "Index root is not an object"));
  }

  IndexData data;
  data.version = json.value("version", kFormatVersion);
  if (data.version > kFormatVersion) {
    return std::unexpected(makeError(ErrorCode::kIndexCorrupt,
                                     "Unsupported index version " + std::to_string(data.version)));
  }

  auto array_at = [&](const char* key) -> const nlohmann::json* {
    if (!json.contains(key) || json[key].is_null()) {
      return nullptr;
    }
    return &json[key];
  };

  if (const auto* notes = array_at("notes")) {
    if (!notes->is_array()) {
      return std::unexpected(makeError(ErrorCode::kIndexCorrupt, "\"notes\" is not an array"));
    }
    for (const auto& entry : *notes) {
      auto note = core::Metadata::fromJson(entry);
      if (!note.has_value()) {
        return std::unexpected(makeError(ErrorCode::kIndexCorrupt, note.error().message()));
      }
      if (data.findNote(note->id()) != nullptr) {
        return std::unexpected(makeError(ErrorCode::kIndexCorrupt,
                                         "Duplicate note id " + note->id().toString()));
      }
      data.notes.push_back(std::move(*note));
    }
  }

  if (const auto* notebooks = array_at("notebooks")) {
    if (!notebooks->is_array()) {
      return std::unexpected(makeError(ErrorCode::kIndexCorrupt, "\"notebooks\" is not an array"));
    }
    for (const auto& entry : *notebooks) {
      auto notebook = core::Notebook::fromJson(entry);
      if (!notebook.has_value()) {
        return std::unexpected(makeError(ErrorCode::kIndexCorrupt, notebook.error().message()));
      }
      data.notebooks.push_back(std::move(*notebook));
    }
  }

  if (const auto* templates = array_at("templates")) {
    if (!templates->is_array()) {
      return std::unexpected(makeError(ErrorCode::kIndexCorrupt, "\"templates\" is not an array"));
    }
    for (const auto& entry : *templates) {
      auto tpl = core::NoteTemplate::fromJson(entry);
      if (!tpl.has_value()) {
        return std::unexpected(makeError(ErrorCode::kIndexCorrupt, tpl.error().message()));
      }
      tpl->is_custom = true;
      data.templates.push_back(std::move(*tpl));
    }
  }

  if (json.contains("syncFolder") && json["syncFolder"].is_string()) {
    data.sync_folder = json["syncFolder"].get<std::string>();
  }

  return data;
}

MetadataIndex::MetadataIndex(std::filesystem::path index_file)
    : index_file_(std::move(index_file)) {}

Result<IndexData> MetadataIndex::readFile(const std::filesystem::path& path) {
  auto content = util::FileSystem::readFile(path);
  if (!content.has_value()) {
    return std::unexpected(content.error());
  }

  nlohmann::json json;
  try {
    json = nlohmann::json::parse(*content);
  } catch (const nlohmann::json::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kIndexCorrupt,
                                     "Cannot parse " + path.string() + ": " + e.what()));
  }

  return IndexData::fromJson(json);
}

Result<void> MetadataIndex::load() {
  std::unique_lock lock(mutex_);
  data_ = IndexData{};

  std::error_code ec;
  if (!std::filesystem::exists(index_file_, ec)) {
    spdlog::debug("No index at {}, starting empty", index_file_.string());
    return {};
  }

  auto data = readFile(index_file_);
  if (!data.has_value()) {
    return std::unexpected(data.error());
  }

  data_ = std::move(*data);
  spdlog::debug("Loaded index with {} notes, {} notebooks", data_.notes.size(),
                data_.notebooks.size());
  return {};
}

IndexData MetadataIndex::snapshot() const {
  std::shared_lock lock(mutex_);
  return data_;
}

std::vector<core::Metadata> MetadataIndex::listNotes() const {
  std::shared_lock lock(mutex_);
  return data_.notes;
}

std::vector<core::Notebook> MetadataIndex::listNotebooks() const {
  std::shared_lock lock(mutex_);
  return data_.notebooks;
}

std::optional<std::string> MetadataIndex::syncFolder() const {
  std::shared_lock lock(mutex_);
  return data_.sync_folder;
}

Result<core::Metadata> MetadataIndex::get(const core::NoteId& id) const {
  std::shared_lock lock(mutex_);
  const auto* note = data_.findNote(id);
  if (note == nullptr) {
    return std::unexpected(makeError(ErrorCode::kNotFound, "Note not found: " + id.toString()));
  }
  return *note;
}

Result<void> MetadataIndex::upsert(const core::Metadata& record) {
  return update([&](IndexData& data) -> Result<void> {
    if (auto* existing = data.findNote(record.id())) {
      *existing = record;
    } else {
      data.notes.push_back(record);
    }
    return {};
  });
}

Result<void> MetadataIndex::remove(const core::NoteId& id) {
  return update([&](IndexData& data) -> Result<void> {
    auto it = std::find_if(data.notes.begin(), data.notes.end(),
                           [&](const core::Metadata& m) { return m.id() == id; });
    if (it == data.notes.end()) {
      return std::unexpected(makeError(ErrorCode::kNotFound, "Note not found: " + id.toString()));
    }
    data.notes.erase(it);
    return {};
  });
}

Result<void> MetadataIndex::replace(IndexData data) {
  std::unique_lock lock(mutex_);
  auto persisted = persist(data);
  if (!persisted.has_value()) {
    return persisted;
  }
  data_ = std::move(data);
  return {};
}

Result<void> MetadataIndex::persist(const IndexData& data) const {
  std::string serialized;
  try {
    serialized = data.toJson().dump(2);
  } catch (const nlohmann::json::type_error& e) {
    // Invalid UTF-8 in a title or body fragment
    return std::unexpected(makeError(ErrorCode::kValidationFailure,
                                     "Cannot serialize index: " + std::string(e.what())));
  }
  return util::FileSystem::writeFileAtomic(index_file_, serialized);
}

}  // namespace quire::store
