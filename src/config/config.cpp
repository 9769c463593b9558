#include "quire/config/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

#include <toml++/toml.hpp>

#include "quire/util/filesystem.hpp"
#include "quire/util/xdg.hpp"

namespace quire::config {

namespace {

const std::vector<std::string> kLogLevels = {"trace", "debug", "info", "warn",
                                             "error", "critical", "off"};

}  // namespace

Config::Config()
    : root(util::Xdg::dataHome()),
      log_file(util::Xdg::logDir() / "quire.log") {}

const std::vector<std::string>& Config::keys() {
  static const std::vector<std::string> kKeys = {
      "root", "log_level", "log_file", "versions.preview_length", "attachments.max_bytes"};
  return kKeys;
}

std::filesystem::path Config::defaultConfigPath() {
  return util::Xdg::configFile();
}

std::filesystem::path Config::effectiveRoot() const {
  const char* env_root = std::getenv("QUIRE_ROOT");
  if (env_root != nullptr && *env_root != '\0') {
    return env_root;
  }
  return root;
}

Result<void> Config::load(const std::filesystem::path& config_path) {
  config_path_ = config_path;

  std::error_code ec;
  if (!std::filesystem::exists(config_path, ec)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    if (auto value = config_data["root"].value<std::string>()) {
      root = *value;
    }
    if (auto value = config_data["log_level"].value<std::string>()) {
      log_level = *value;
    }
    if (auto value = config_data["log_file"].value<std::string>()) {
      log_file = *value;
    }

    if (auto value = config_data["versions"]["preview_length"].value<int64_t>()) {
      if (*value <= 0) {
        return std::unexpected(makeError(ErrorCode::kConfigError,
                                         "versions.preview_length must be positive"));
      }
      preview_length = static_cast<size_t>(*value);
    }
    if (auto value = config_data["attachments"]["max_bytes"].value<int64_t>()) {
      if (*value <= 0) {
        return std::unexpected(makeError(ErrorCode::kConfigError,
                                         "attachments.max_bytes must be positive"));
      }
      max_attachment_bytes = static_cast<std::uintmax_t>(*value);
    }

    return {};

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what())));
  }
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;
  if (save_path.empty()) {
    save_path = defaultConfigPath();
  }

  toml::table config_data;
  config_data.insert_or_assign("root", root.string());
  config_data.insert_or_assign("log_level", log_level);
  config_data.insert_or_assign("log_file", log_file.string());

  auto versions_table = toml::table{};
  versions_table.insert_or_assign("preview_length", static_cast<int64_t>(preview_length));
  config_data.insert_or_assign("versions", versions_table);

  auto attachments_table = toml::table{};
  attachments_table.insert_or_assign("max_bytes", static_cast<int64_t>(max_attachment_bytes));
  config_data.insert_or_assign("attachments", attachments_table);

  std::stringstream ss;
  ss << config_data << "\n";
  auto write_result = util::FileSystem::writeFileAtomic(save_path, ss.str());
  if (!write_result.has_value()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Cannot write config file: " + write_result.error().message()));
  }
  return {};
}

Result<std::string> Config::get(const std::string& key) const {
  if (key == "root") return root.string();
  if (key == "log_level") return log_level;
  if (key == "log_file") return log_file.string();
  if (key == "versions.preview_length") return std::to_string(preview_length);
  if (key == "attachments.max_bytes") return std::to_string(max_attachment_bytes);

  return std::unexpected(makeError(ErrorCode::kConfigError, "Unknown config key: " + key));
}

Result<std::uint64_t> Config::parseCount(const std::string& key, const std::string& value) {
  if (value.empty() || !std::all_of(value.begin(), value.end(),
                                    [](unsigned char c) { return std::isdigit(c) != 0; })) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     key + " expects a positive integer, got '" + value + "'"));
  }
  try {
    auto parsed = std::stoull(value);
    if (parsed == 0) {
      return std::unexpected(makeError(ErrorCode::kConfigError, key + " must be positive"));
    }
    return parsed;
  } catch (const std::out_of_range&) {
    return std::unexpected(makeError(ErrorCode::kConfigError, key + " is out of range"));
  }
}

Result<void> Config::set(const std::string& key, const std::string& value) {
  if (key == "root") { root = value; return {}; }
  if (key == "log_level") { log_level = value; return {}; }
  if (key == "log_file") { log_file = value; return {}; }

  if (key == "versions.preview_length" || key == "attachments.max_bytes") {
    auto parsed = parseCount(key, value);
    if (!parsed.has_value()) {
      return std::unexpected(parsed.error());
    }
    if (key == "versions.preview_length") {
      preview_length = static_cast<size_t>(*parsed);
    } else {
      max_attachment_bytes = static_cast<std::uintmax_t>(*parsed);
    }
    return {};
  }

  return std::unexpected(makeError(ErrorCode::kConfigError, "Unknown config key: " + key));
}

Result<void> Config::validate() const {
  if (root.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Store root is not set"));
  }
  if (std::find(kLogLevels.begin(), kLogLevels.end(), log_level) == kLogLevels.end()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid log_level: " + log_level));
  }
  if (preview_length == 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "versions.preview_length must be positive"));
  }
  if (max_attachment_bytes == 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "attachments.max_bytes must be positive"));
  }
  return {};
}

}  // namespace quire::config
