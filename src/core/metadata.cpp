#include "quire/core/metadata.hpp"

#include <algorithm>

#include "quire/core/link_resolver.hpp"
#include "quire/util/time.hpp"

namespace quire::core {

namespace {

std::string timeToJson(std::chrono::system_clock::time_point time) {
  return util::Time::toRfc3339(time);
}

Result<std::chrono::system_clock::time_point> timeFromJson(const nlohmann::json& json,
                                                           const char* key) {
  if (!json.contains(key) || !json[key].is_string()) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     std::string("Missing timestamp field: ") + key));
  }
  return util::Time::fromRfc3339(json[key].get<std::string>());
}

}  // namespace

Metadata::Metadata() : id_(NoteId::generate()), title_("") {
  auto now = util::Time::now();
  created_ = now;
  updated_ = now;
}

Metadata::Metadata(NoteId id, std::string title)
    : id_(std::move(id)), title_(std::move(title)) {
  auto now = util::Time::now();
  created_ = now;
  updated_ = now;
}

std::string Metadata::filename() const {
  return id_.toString() + ".txt";
}

void Metadata::setTitle(const std::string& title) {
  title_ = title;
  touch();
}

void Metadata::setCreated(std::chrono::system_clock::time_point time) {
  created_ = time;
}

void Metadata::setUpdated(std::chrono::system_clock::time_point time) {
  updated_ = time;
}

void Metadata::setImportant(bool important) {
  important_ = important;
  touch();
}

void Metadata::setImages(std::vector<ImageRef> images) {
  images_ = std::move(images);
  touch();
}

void Metadata::setTags(const std::vector<std::string>& tags) {
  tags_ = tags;
  // Remove duplicates and sort
  std::sort(tags_.begin(), tags_.end());
  tags_.erase(std::unique(tags_.begin(), tags_.end()), tags_.end());
  touch();
}

void Metadata::setLinksTo(std::vector<NoteId> links) {
  links_to_ = std::move(links);
  std::sort(links_to_.begin(), links_to_.end());
  links_to_.erase(std::unique(links_to_.begin(), links_to_.end()), links_to_.end());
}

void Metadata::setLinkTitles(std::vector<std::string> titles) {
  link_titles_ = std::move(titles);
}

void Metadata::setDaily(bool is_daily) {
  is_daily_ = is_daily;
}

void Metadata::setNotebook(std::optional<std::string> notebook) {
  notebook_ = std::move(notebook);
  touch();
}

void Metadata::addTag(const std::string& tag) {
  if (!hasTag(tag)) {
    tags_.push_back(tag);
    std::sort(tags_.begin(), tags_.end());
    touch();
  }
}

void Metadata::removeTag(const std::string& tag) {
  auto it = std::find(tags_.begin(), tags_.end(), tag);
  if (it != tags_.end()) {
    tags_.erase(it);
    touch();
  }
}

bool Metadata::hasTag(const std::string& tag) const noexcept {
  return std::find(tags_.begin(), tags_.end(), tag) != tags_.end();
}

void Metadata::addImage(ImageRef image) {
  images_.push_back(std::move(image));
  touch();
}

bool Metadata::removeImage(const std::string& path) {
  auto it = std::find_if(images_.begin(), images_.end(),
                         [&](const ImageRef& ref) { return ref.path == path; });
  if (it == images_.end()) {
    return false;
  }
  images_.erase(it);
  touch();
  return true;
}

ImageRef* Metadata::findImage(const std::string& path) {
  auto it = std::find_if(images_.begin(), images_.end(),
                         [&](const ImageRef& ref) { return ref.path == path; });
  return it == images_.end() ? nullptr : &*it;
}

bool Metadata::hasLinkTo(const NoteId& target) const noexcept {
  return std::find(links_to_.begin(), links_to_.end(), target) != links_to_.end();
}

void Metadata::touch() {
  updated_ = std::max(updated_, util::Time::now());
}

Result<void> Metadata::validate() const {
  if (!id_.isValid()) {
    return std::unexpected(makeError(ErrorCode::kValidationFailure, "Invalid note ID"));
  }

  if (updated_ < created_) {
    return std::unexpected(makeError(ErrorCode::kValidationFailure,
                                     "Updated time cannot be before created time"));
  }

  for (const auto& tag : tags_) {
    if (!LinkResolver::isValidTag(tag)) {
      return std::unexpected(makeError(ErrorCode::kValidationFailure, "Invalid tag: " + tag));
    }
  }

  return {};
}

nlohmann::json Metadata::toJson() const {
  nlohmann::json json;
  json["id"] = id_.toString();
  json["title"] = title_;
  json["createdAt"] = timeToJson(created_);
  json["updatedAt"] = timeToJson(updated_);
  json["important"] = important_;
  json["filename"] = filename();

  nlohmann::json images = nlohmann::json::array();
  for (const auto& image : images_) {
    nlohmann::json entry;
    entry["name"] = image.name;
    entry["path"] = image.path;
    entry["addedAt"] = timeToJson(image.added);
    if (image.size.has_value()) {
      entry["size"] = *image.size;
    }
    images.push_back(std::move(entry));
  }
  json["images"] = std::move(images);

  json["tags"] = tags_;

  nlohmann::json links = nlohmann::json::array();
  for (const auto& link : links_to_) {
    links.push_back(link.toString());
  }
  json["linksTo"] = std::move(links);
  json["linkTitles"] = link_titles_;
  json["isDaily"] = is_daily_;
  json["notebookId"] = notebook_.has_value() ? nlohmann::json(*notebook_) : nlohmann::json(nullptr);

  return json;
}

Result<Metadata> Metadata::fromJson(const nlohmann::json& json) {
  try {
    if (!json.is_object()) {
      return std::unexpected(makeError(ErrorCode::kParseError, "Note record is not an object"));
    }

    auto id = NoteId::fromString(json.at("id").get<std::string>());
    if (!id.has_value()) {
      return std::unexpected(id.error());
    }

    Metadata metadata(*id, json.value("title", std::string{}));

    auto created = timeFromJson(json, "createdAt");
    if (!created.has_value()) {
      return std::unexpected(created.error());
    }
    auto updated = timeFromJson(json, "updatedAt");
    if (!updated.has_value()) {
      return std::unexpected(updated.error());
    }
    metadata.created_ = *created;
    metadata.updated_ = std::max(*created, *updated);
    metadata.important_ = json.value("important", false);
    metadata.is_daily_ = json.value("isDaily", false);

    if (json.contains("images") && json["images"].is_array()) {
      for (const auto& entry : json["images"]) {
        ImageRef image;
        image.name = entry.value("name", std::string{});
        image.path = entry.at("path").get<std::string>();
        auto added = timeFromJson(entry, "addedAt");
        image.added = added.has_value() ? *added : metadata.created_;
        if (entry.contains("size") && entry["size"].is_number_unsigned()) {
          image.size = entry["size"].get<std::uintmax_t>();
        }
        metadata.images_.push_back(std::move(image));
      }
    }

    if (json.contains("tags") && json["tags"].is_array()) {
      for (const auto& tag : json["tags"]) {
        auto normalized = LinkResolver::normalizeTag(tag.get<std::string>());
        if (LinkResolver::isValidTag(normalized) && !metadata.hasTag(normalized)) {
          metadata.tags_.push_back(normalized);
        }
      }
      std::sort(metadata.tags_.begin(), metadata.tags_.end());
    }

    if (json.contains("linksTo") && json["linksTo"].is_array()) {
      for (const auto& link : json["linksTo"]) {
        auto link_id = NoteId::fromString(link.get<std::string>());
        if (link_id.has_value()) {
          metadata.links_to_.push_back(*link_id);
        }
      }
    }

    if (json.contains("linkTitles") && json["linkTitles"].is_array()) {
      metadata.link_titles_ = json["linkTitles"].get<std::vector<std::string>>();
    }

    if (json.contains("notebookId") && json["notebookId"].is_string()) {
      metadata.notebook_ = json["notebookId"].get<std::string>();
    }

    return metadata;
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid note record: " + std::string(e.what())));
  }
}

}  // namespace quire::core
