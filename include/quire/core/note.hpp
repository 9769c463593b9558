#pragma once

#include <string>

#include "quire/common.hpp"
#include "quire/core/metadata.hpp"
#include "quire/core/note_id.hpp"

namespace quire::core {

// Note class representing a complete note with metadata and body
class Note {
 public:
  // Constructor with metadata and content
  Note(Metadata metadata, std::string content);

  // Getters
  const Metadata& metadata() const noexcept { return metadata_; }
  Metadata& metadata() noexcept { return metadata_; }
  const std::string& content() const noexcept { return content_; }
  const NoteId& id() const noexcept { return metadata_.id(); }
  const std::string& title() const noexcept { return metadata_.title(); }

  // Setters
  void setContent(const std::string& content);

  // JSON form used by the command line (metadata plus "body")
  nlohmann::json toJson() const;

 private:
  Metadata metadata_;
  std::string content_;
};

}  // namespace quire::core
