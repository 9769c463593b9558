#include "quire/core/note.hpp"

namespace quire::core {

Note::Note(Metadata metadata, std::string content)
    : metadata_(std::move(metadata)), content_(std::move(content)) {}

void Note::setContent(const std::string& content) {
  content_ = content;
  metadata_.touch();
}

nlohmann::json Note::toJson() const {
  auto json = metadata_.toJson();
  json["body"] = content_;
  return json;
}

}  // namespace quire::core
