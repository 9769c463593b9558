#include "quire/core/note_id.hpp"

#include <random>

#include "quire/util/path_sanitizer.hpp"

namespace quire::core {

namespace {

// Base32 encoding for ULID (Crockford's Base32)
constexpr char kBase32[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
constexpr size_t kBase32Size = 32;
constexpr size_t kTimestampLength = 10;
constexpr size_t kRandomnessLength = 16;

// Convert milliseconds to base32 timestamp
std::string encodeTimestamp(uint64_t milliseconds) {
  std::string result(kTimestampLength, '0');

  for (int i = kTimestampLength - 1; i >= 0; --i) {
    result[i] = kBase32[milliseconds % kBase32Size];
    milliseconds /= kBase32Size;
  }

  return result;
}

// Generate random suffix
std::string generateRandomness() {
  static thread_local std::random_device rd;
  static thread_local std::mt19937_64 gen(rd());
  static thread_local std::uniform_int_distribution<> dis(0, kBase32Size - 1);

  std::string result;
  result.reserve(kRandomnessLength);

  for (size_t i = 0; i < kRandomnessLength; ++i) {
    result += kBase32[dis(gen)];
  }

  return result;
}

}  // namespace

NoteId NoteId::generate() {
  return generate(std::chrono::system_clock::now());
}

NoteId NoteId::generate(std::chrono::system_clock::time_point timestamp) {
  auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
      timestamp.time_since_epoch()).count();

  std::string ulid = encodeTimestamp(static_cast<uint64_t>(milliseconds));
  ulid += generateRandomness();

  return NoteId(std::move(ulid));
}

Result<NoteId> NoteId::fromString(std::string_view str) {
  auto validated = util::PathSanitizer::validateIdentifier(str);
  if (!validated.has_value()) {
    return std::unexpected(makeError(ErrorCode::kInvalidPath,
                                     "Invalid note id: " + std::string(str)));
  }

  return NoteId(std::move(*validated));
}

bool NoteId::operator==(const NoteId& other) const noexcept {
  return id_ == other.id_;
}

bool NoteId::operator!=(const NoteId& other) const noexcept {
  return !(*this == other);
}

bool NoteId::operator<(const NoteId& other) const noexcept {
  return id_ < other.id_;
}

bool NoteId::isValid() const noexcept {
  return !id_.empty();
}

std::size_t NoteId::Hash::operator()(const NoteId& id) const noexcept {
  return std::hash<std::string>{}(id.id_);
}

NoteId::NoteId(std::string id) : id_(std::move(id)) {}

}  // namespace quire::core
