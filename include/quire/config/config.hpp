#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "quire/common.hpp"

namespace quire::config {

// Configuration for the quire application (config.toml)
class Config {
 public:
  // Defaults only; nothing is read from disk
  Config();

  // Store root; QUIRE_ROOT overrides it when set
  std::filesystem::path root;

  // Logging
  std::string log_level = "info";
  std::filesystem::path log_file;

  // [versions]
  size_t preview_length = 150;

  // [attachments]
  std::uintmax_t max_attachment_bytes = 50ull * 1024 * 1024;

  // Load configuration from file
  Result<void> load(const std::filesystem::path& config_path);

  // Save configuration to file (the loaded path when empty)
  Result<void> save(const std::filesystem::path& config_path = {}) const;

  // Get configuration value by dotted key, e.g. "versions.preview_length"
  Result<std::string> get(const std::string& key) const;

  // Set configuration value by dotted key
  Result<void> set(const std::string& key, const std::string& value);

  // Validate configuration
  Result<void> validate() const;

  // Root after applying the QUIRE_ROOT environment override
  std::filesystem::path effectiveRoot() const;

  // Every key get/set understand
  static const std::vector<std::string>& keys();

  // Get default config file path
  static std::filesystem::path defaultConfigPath();

 private:
  std::filesystem::path config_path_;

  static Result<std::uint64_t> parseCount(const std::string& key, const std::string& value);
};

}  // namespace quire::config
