#pragma once

#include <filesystem>
#include <string>

namespace quire::util {

// XDG Base Directory Specification utilities
class Xdg {
 public:
  // Get XDG data home directory (~/.local/share/quire)
  static std::filesystem::path dataHome();

  // Get XDG config home directory (~/.config/quire)
  static std::filesystem::path configHome();

  // Get config file path
  static std::filesystem::path configFile();

  // Default store root (data home, or $QUIRE_ROOT when set)
  static std::filesystem::path storeRoot();

  // Directory for rotating log files
  static std::filesystem::path logDir();

 private:
  // Get environment variable with default
  static std::string getEnvVar(const std::string& name, const std::string& default_value);
};

}  // namespace quire::util
