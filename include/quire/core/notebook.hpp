#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "quire/common.hpp"

namespace quire::core {

// User-defined grouping container; names need not be unique
struct Notebook {
  std::string id;
  std::string name;
  bool archived = false;
  std::chrono::system_clock::time_point created;

  nlohmann::json toJson() const;
  static Result<Notebook> fromJson(const nlohmann::json& json);
};

// Note template; built-ins are compiled in, custom ones live in the index
struct NoteTemplate {
  std::string id;
  std::string name;
  std::string body;                   // May contain {{date}} and {{title}}
  std::optional<std::string> default_title_pattern;
  bool is_custom = false;

  nlohmann::json toJson() const;
  static Result<NoteTemplate> fromJson(const nlohmann::json& json);
};

}  // namespace quire::core
