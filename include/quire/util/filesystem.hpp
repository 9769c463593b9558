#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "quire/common.hpp"

namespace quire::util {

// Atomic filesystem operations with safety guarantees
class AtomicFileWriter {
 public:
  explicit AtomicFileWriter(const std::filesystem::path& target_path);
  ~AtomicFileWriter();

  // Non-copyable, movable
  AtomicFileWriter(const AtomicFileWriter&) = delete;
  AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;
  AtomicFileWriter(AtomicFileWriter&&) = default;
  AtomicFileWriter& operator=(AtomicFileWriter&&) = default;

  // Write content to temporary file (flushed and fsynced)
  Result<void> write(const std::string& content);

  // Commit the changes (rename temp to target, fsync parent)
  Result<void> commit();

  // Cancel the operation (removes temp file)
  void cancel();

 private:
  std::filesystem::path target_path_;
  std::filesystem::path temp_path_;
  bool committed_;
  bool cancelled_;

  void cleanup();
};

// Filesystem utilities
class FileSystem {
 public:
  // Atomic write with fsync and rename
  static Result<void> writeFileAtomic(const std::filesystem::path& path,
                                      const std::string& content);

  // Read file; kNotFound when absent
  static Result<std::string> readFile(const std::filesystem::path& path);

  // Create directory with proper permissions
  static Result<void> createDirectories(const std::filesystem::path& path,
                                        std::filesystem::perms perms = std::filesystem::perms::owner_all);

  // Rename within one filesystem
  static Result<void> moveFile(const std::filesystem::path& from,
                               const std::filesystem::path& to);

  // Copy file, overwriting the target
  static Result<void> copyFile(const std::filesystem::path& from,
                               const std::filesystem::path& to);

  // Recursive copy; existing files in the target are overwritten
  static Result<void> copyDirectory(const std::filesystem::path& from,
                                    const std::filesystem::path& to);

  // Get file size safely
  static Result<std::uintmax_t> fileSize(const std::filesystem::path& path);

  // Remove file; a missing file is not an error
  static Result<void> removeFile(const std::filesystem::path& path);

  // Remove directory tree; a missing tree is not an error
  static Result<void> removeAll(const std::filesystem::path& path);

  // List regular files in a directory with optional extension filter.
  // A missing directory yields an empty list.
  static Result<std::vector<std::filesystem::path>> listDirectory(
      const std::filesystem::path& path,
      const std::string& extension_filter = "");

  // List immediate subdirectories
  static Result<std::vector<std::filesystem::path>> listSubdirectories(
      const std::filesystem::path& path);

  // Sync directory (ensure metadata is written)
  static Result<void> syncDirectory(const std::filesystem::path& path);
};

}  // namespace quire::util
