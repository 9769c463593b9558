#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "quire/common.hpp"
#include "quire/core/note_id.hpp"

namespace quire::core {

// Attachment reference stored on a note
struct ImageRef {
  std::string name;                     // Display name
  std::string path;                     // images/<noteId>/<file>
  std::chrono::system_clock::time_point added;
  std::optional<std::uintmax_t> size;

  bool operator==(const ImageRef& other) const = default;
};

// Note metadata record as kept in meta/index.json
class Metadata {
 public:
  // Default constructor (creates empty metadata)
  Metadata();

  // Constructor with required fields; created/updated set to now
  Metadata(NoteId id, std::string title);

  // Getters
  const NoteId& id() const noexcept { return id_; }
  const std::string& title() const noexcept { return title_; }
  const std::chrono::system_clock::time_point& created() const noexcept { return created_; }
  const std::chrono::system_clock::time_point& updated() const noexcept { return updated_; }
  bool important() const noexcept { return important_; }
  const std::vector<ImageRef>& images() const noexcept { return images_; }
  const std::vector<std::string>& tags() const noexcept { return tags_; }
  const std::vector<NoteId>& linksTo() const noexcept { return links_to_; }
  const std::vector<std::string>& linkTitles() const noexcept { return link_titles_; }
  bool isDaily() const noexcept { return is_daily_; }
  const std::optional<std::string>& notebook() const noexcept { return notebook_; }

  // Content file name, a pure function of the id
  std::string filename() const;

  // Setters
  void setTitle(const std::string& title);
  void setCreated(std::chrono::system_clock::time_point time);
  void setUpdated(std::chrono::system_clock::time_point time);
  void setImportant(bool important);
  void setImages(std::vector<ImageRef> images);
  void setTags(const std::vector<std::string>& tags);
  void setLinksTo(std::vector<NoteId> links);
  void setLinkTitles(std::vector<std::string> titles);
  void setDaily(bool is_daily);
  void setNotebook(std::optional<std::string> notebook);

  // Tag operations; tags stay sorted and unique
  void addTag(const std::string& tag);
  void removeTag(const std::string& tag);
  bool hasTag(const std::string& tag) const noexcept;

  // Attachment operations
  void addImage(ImageRef image);
  bool removeImage(const std::string& path);
  ImageRef* findImage(const std::string& path);

  bool hasLinkTo(const NoteId& target) const noexcept;

  // Advance updated to now, never moving it backwards
  void touch();

  // Validation
  Result<void> validate() const;

  // JSON serialization (camelCase keys)
  nlohmann::json toJson() const;
  static Result<Metadata> fromJson(const nlohmann::json& json);

 private:
  NoteId id_;
  std::string title_;
  std::chrono::system_clock::time_point created_;
  std::chrono::system_clock::time_point updated_;
  bool important_ = false;
  std::vector<ImageRef> images_;
  std::vector<std::string> tags_;
  std::vector<NoteId> links_to_;
  std::vector<std::string> link_titles_;
  bool is_daily_ = false;
  std::optional<std::string> notebook_;
};

}  // namespace quire::core
