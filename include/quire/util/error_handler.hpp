#pragma once

#include <filesystem>
#include <string>

#include "quire/common.hpp"

namespace quire::util {

// Error severity levels
enum class ErrorSeverity {
  kInfo,     // Informational messages
  kWarning,  // Recoverable issues
  kError,    // Serious errors that prevent operation
  kCritical  // Critical errors that may cause data loss
};

// Formats and logs errors surfaced to the command line
class ErrorHandler {
public:
  static ErrorHandler& instance();

  // Log error through the default spdlog logger
  void log(const Error& error, ErrorSeverity severity = ErrorSeverity::kError) const;

  // Format error for user display
  std::string formatUserError(const Error& error, bool json_format = false,
                              bool color = true) const;

  // Process exit code for an error kind
  static int exitCodeFor(ErrorCode code);

  // Severity an error kind is reported with
  static ErrorSeverity severityFor(ErrorCode code);

private:
  ErrorHandler() = default;
};

struct LogOptions {
  std::string level = "info";        // Level for the file sink
  std::filesystem::path file;        // Empty disables the file sink
  bool verbose = false;              // Lower the console sink to debug
  size_t max_file_bytes = 5 * 1024 * 1024;
  size_t max_files = 3;
};

// Install the default "quire" logger (rotating file sink + stderr sink)
void setupLogging(const LogOptions& options);

}  // namespace quire::util
