#include "quire/common.hpp"

#include <sstream>

namespace quire {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kInvalidPath:
      return "Invalid path";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kIndexCorrupt:
      return "Index corrupt";
    case ErrorCode::kIoFailure:
      return "I/O failure";
    case ErrorCode::kValidationFailure:
      return "Validation failure";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kInvalidState:
      return "Invalid state";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  if (!build.empty()) {
    oss << "+" << build;
  }
  return oss.str();
}

Version getVersion() {
#ifdef QUIRE_VERSION_BUILD
  return Version{QUIRE_VERSION_MAJOR, QUIRE_VERSION_MINOR, QUIRE_VERSION_PATCH, QUIRE_VERSION_BUILD};
#else
  return Version{0, 1, 0, ""};
#endif
}

}  // namespace quire
