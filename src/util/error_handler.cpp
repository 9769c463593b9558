#include "quire/util/error_handler.hpp"

#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace quire::util {

ErrorHandler& ErrorHandler::instance() {
  static ErrorHandler instance;
  return instance;
}

void ErrorHandler::log(const Error& error, ErrorSeverity severity) const {
  switch (severity) {
    case ErrorSeverity::kInfo:
      spdlog::info("[{}] {}", errorCodeToString(error.code()), error.message());
      break;
    case ErrorSeverity::kWarning:
      spdlog::warn("[{}] {}", errorCodeToString(error.code()), error.message());
      break;
    case ErrorSeverity::kError:
      spdlog::error("[{}] {}", errorCodeToString(error.code()), error.message());
      break;
    case ErrorSeverity::kCritical:
      spdlog::critical("[{}] {}", errorCodeToString(error.code()), error.message());
      break;
  }
}

std::string ErrorHandler::formatUserError(const Error& error, bool json_format, bool color) const {
  if (json_format) {
    nlohmann::json error_json;
    error_json["error"] = true;
    error_json["code"] = std::string(errorCodeToString(error.code()));
    error_json["message"] = error.message();
    return error_json.dump();
  }

  std::ostringstream oss;

  const char* color_code = "";
  const char* severity_text = "Error";
  const char* reset_code = color ? "\033[0m" : "";

  switch (severityFor(error.code())) {
    case ErrorSeverity::kInfo:
      color_code = "\033[36m"; // Cyan
      severity_text = "Info";
      break;
    case ErrorSeverity::kWarning:
      color_code = "\033[33m"; // Yellow
      severity_text = "Warning";
      break;
    case ErrorSeverity::kError:
      color_code = "\033[31m"; // Red
      severity_text = "Error";
      break;
    case ErrorSeverity::kCritical:
      color_code = "\033[35m"; // Magenta
      severity_text = "Critical";
      break;
  }
  if (!color) {
    color_code = "";
  }

  oss << color_code << severity_text << reset_code << ": " << error.message();
  return oss.str();
}

int ErrorHandler::exitCodeFor(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return 0;
    case ErrorCode::kNotFound:
      return 2;
    case ErrorCode::kInvalidPath:
    case ErrorCode::kValidationFailure:
    case ErrorCode::kInvalidArgument:
      return 3;
    case ErrorCode::kIndexCorrupt:
      return 4;
    case ErrorCode::kIoFailure:
      return 5;
    default:
      return 1;
  }
}

ErrorSeverity ErrorHandler::severityFor(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return ErrorSeverity::kInfo;
    case ErrorCode::kNotFound:
    case ErrorCode::kValidationFailure:
    case ErrorCode::kInvalidArgument:
      return ErrorSeverity::kWarning;
    case ErrorCode::kIndexCorrupt:
    case ErrorCode::kIoFailure:
      return ErrorSeverity::kCritical;
    default:
      return ErrorSeverity::kError;
  }
}

}  // namespace quire::util
