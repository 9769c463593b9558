#include "quire/util/error_handler.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>
#include <vector>

namespace quire::util {

void setupLogging(const LogOptions& options) {
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_sink->set_level(options.verbose ? spdlog::level::debug : spdlog::level::warn);
  console_sink->set_pattern("%^[%l]%$ %v");

  std::vector<spdlog::sink_ptr> sinks = {console_sink};
  std::string file_error;

  if (!options.file.empty()) {
    try {
      std::error_code ec;
      std::filesystem::create_directories(options.file.parent_path(), ec);

      // Rotating file sink for the persistent log
      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        options.file.string(), options.max_file_bytes, options.max_files);
      file_sink->set_level(spdlog::level::from_str(options.level));
      file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
      sinks.push_back(file_sink);
    } catch (const spdlog::spdlog_ex& e) {
      // Console-only logging when the log file cannot be opened
      file_error = e.what();
    }
  }

  auto logger = std::make_shared<spdlog::logger>("quire", sinks.begin(), sinks.end());
  logger->set_level(spdlog::level::debug);
  logger->flush_on(spdlog::level::warn);

  spdlog::set_default_logger(logger);

  if (!file_error.empty()) {
    spdlog::warn("Failed to setup file logging: {}", file_error);
  }
}

}  // namespace quire::util
