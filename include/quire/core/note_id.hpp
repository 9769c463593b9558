#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "quire/common.hpp"

namespace quire::core {

// Opaque note identifier. Generated ids are ULIDs (26 chars, Crockford
// base32, sortable by creation time); ids supplied by callers only need to
// be safe path segments ([A-Za-z0-9_-]{1,64}).
class NoteId {
 public:
  // Create new ULID with current timestamp
  static NoteId generate();

  // Create ULID with specific timestamp
  static NoteId generate(std::chrono::system_clock::time_point timestamp);

  // Parse id from string; kInvalidPath when unsafe
  static Result<NoteId> fromString(std::string_view str);

  // Default constructor creates invalid ID
  NoteId() = default;

  // Get string representation
  const std::string& toString() const { return id_; }

  // Comparison operators
  bool operator==(const NoteId& other) const noexcept;
  bool operator!=(const NoteId& other) const noexcept;
  bool operator<(const NoteId& other) const noexcept;

  // Check if ID is valid
  bool isValid() const noexcept;

  // Hash support for containers
  struct Hash {
    std::size_t operator()(const NoteId& id) const noexcept;
  };

 private:
  explicit NoteId(std::string id);

  std::string id_;
};

}  // namespace quire::core

// Hash specialization for std::unordered_map
namespace std {
template <>
struct hash<quire::core::NoteId> : quire::core::NoteId::Hash {};
}  // namespace std
