#include "quire/core/notebook.hpp"

#include "quire/util/path_sanitizer.hpp"
#include "quire/util/time.hpp"

namespace quire::core {

nlohmann::json Notebook::toJson() const {
  nlohmann::json json;
  json["id"] = id;
  json["name"] = name;
  json["archived"] = archived;
  json["createdAt"] = util::Time::toRfc3339(created);
  return json;
}

Result<Notebook> Notebook::fromJson(const nlohmann::json& json) {
  try {
    Notebook notebook;
    notebook.id = json.at("id").get<std::string>();
    if (!util::PathSanitizer::validateIdentifier(notebook.id).has_value()) {
      return std::unexpected(makeError(ErrorCode::kParseError,
                                       "Invalid notebook id: " + notebook.id));
    }
    notebook.name = json.value("name", std::string{});
    notebook.archived = json.value("archived", false);

    auto created = util::Time::fromRfc3339(json.value("createdAt", std::string{}));
    if (!created.has_value()) {
      return std::unexpected(created.error());
    }
    notebook.created = *created;
    return notebook;
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid notebook record: " + std::string(e.what())));
  }
}

nlohmann::json NoteTemplate::toJson() const {
  nlohmann::json json;
  json["id"] = id;
  json["name"] = name;
  json["body"] = body;
  json["defaultTitlePattern"] = default_title_pattern.has_value()
      ? nlohmann::json(*default_title_pattern) : nlohmann::json(nullptr);
  json["isCustom"] = is_custom;
  return json;
}

Result<NoteTemplate> NoteTemplate::fromJson(const nlohmann::json& json) {
  try {
    NoteTemplate tpl;
    tpl.id = json.at("id").get<std::string>();
    tpl.name = json.value("name", std::string{});
    tpl.body = json.value("body", std::string{});
    if (json.contains("defaultTitlePattern") && json["defaultTitlePattern"].is_string()) {
      tpl.default_title_pattern = json["defaultTitlePattern"].get<std::string>();
    }
    tpl.is_custom = json.value("isCustom", true);
    return tpl;
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid template record: " + std::string(e.what())));
  }
}

}  // namespace quire::core
