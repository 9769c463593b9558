#include "quire/util/xdg.hpp"

#include <cstdlib>

namespace quire::util {

std::filesystem::path Xdg::dataHome() {
  std::string xdg_data_home = getEnvVar("XDG_DATA_HOME", "");
  if (!xdg_data_home.empty()) {
    return std::filesystem::path(xdg_data_home) / "quire";
  }

  std::string home = getEnvVar("HOME", "");
  if (home.empty()) {
    return std::filesystem::current_path() / ".quire_data";
  }

  return std::filesystem::path(home) / ".local" / "share" / "quire";
}

std::filesystem::path Xdg::configHome() {
  std::string xdg_config_home = getEnvVar("XDG_CONFIG_HOME", "");
  if (!xdg_config_home.empty()) {
    return std::filesystem::path(xdg_config_home) / "quire";
  }

  std::string home = getEnvVar("HOME", "");
  if (home.empty()) {
    return std::filesystem::current_path() / ".quire_config";
  }

  return std::filesystem::path(home) / ".config" / "quire";
}

std::filesystem::path Xdg::configFile() {
  return configHome() / "config.toml";
}

std::filesystem::path Xdg::storeRoot() {
  std::string root = getEnvVar("QUIRE_ROOT", "");
  if (!root.empty()) {
    return root;
  }
  return dataHome();
}

std::filesystem::path Xdg::logDir() {
  return dataHome() / "logs";
}

std::string Xdg::getEnvVar(const std::string& name, const std::string& default_value) {
  const char* value = std::getenv(name.c_str());
  return value ? std::string(value) : default_value;
}

}  // namespace quire::util
