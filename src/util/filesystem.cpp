#include "quire/util/filesystem.hpp"

#include <fstream>
#include <random>

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

namespace quire::util {

namespace {

void fsyncPath(const std::filesystem::path& path) {
  int fd = open(path.c_str(), O_RDONLY);
  if (fd >= 0) {
    fsync(fd);
    close(fd);
  }
}

}  // namespace

// AtomicFileWriter implementation
AtomicFileWriter::AtomicFileWriter(const std::filesystem::path& target_path)
    : target_path_(target_path), committed_(false), cancelled_(false) {
  // Generate unique temporary filename
  static thread_local std::mt19937 gen(std::random_device{}());
  std::uniform_int_distribution<> dis(100000, 999999);

  temp_path_ = target_path_;
  temp_path_ += ".tmp." + std::to_string(dis(gen));
}

AtomicFileWriter::~AtomicFileWriter() {
  if (!committed_ && !cancelled_) {
    cleanup();
  }
}

Result<void> AtomicFileWriter::write(const std::string& content) {
  if (committed_ || cancelled_) {
    return std::unexpected(makeError(ErrorCode::kInvalidState, "Writer already used"));
  }

  auto parent = target_path_.parent_path();
  if (!parent.empty() && !std::filesystem::exists(parent)) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return std::unexpected(makeError(ErrorCode::kIoFailure,
                                       "Cannot create parent directory: " + ec.message()));
    }
  }

  std::ofstream file(temp_path_, std::ios::binary | std::ios::trunc);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kIoFailure,
                                     "Cannot create temporary file: " + temp_path_.string()));
  }

  file.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!file) {
    cleanup();
    return std::unexpected(makeError(ErrorCode::kIoFailure,
                                     "Failed to write to temporary file"));
  }

  file.close();
  if (!file) {
    cleanup();
    return std::unexpected(makeError(ErrorCode::kIoFailure,
                                     "Failed to close temporary file"));
  }

  return {};
}

Result<void> AtomicFileWriter::commit() {
  if (committed_) {
    return std::unexpected(makeError(ErrorCode::kInvalidState, "Already committed"));
  }
  if (cancelled_) {
    return std::unexpected(makeError(ErrorCode::kInvalidState, "Operation cancelled"));
  }

  fsyncPath(temp_path_);

  // Atomic rename
  std::error_code ec;
  std::filesystem::rename(temp_path_, target_path_, ec);
  if (ec) {
    cleanup();
    return std::unexpected(makeError(ErrorCode::kIoFailure,
                                     "Atomic rename failed: " + ec.message()));
  }

  // Sync parent directory so the rename is persistent
  auto parent = target_path_.parent_path();
  if (!parent.empty()) {
    fsyncPath(parent);
  }

  committed_ = true;
  return {};
}

void AtomicFileWriter::cancel() {
  if (!committed_) {
    cancelled_ = true;
    cleanup();
  }
}

void AtomicFileWriter::cleanup() {
  std::error_code ec;
  std::filesystem::remove(temp_path_, ec);
}

// FileSystem implementation
Result<void> FileSystem::writeFileAtomic(const std::filesystem::path& path,
                                         const std::string& content) {
  AtomicFileWriter writer(path);

  auto write_result = writer.write(content);
  if (!write_result.has_value()) {
    return write_result;
  }

  return writer.commit();
}

Result<std::string> FileSystem::readFile(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return std::unexpected(makeError(ErrorCode::kNotFound,
                                     "File not found: " + path.string()));
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kIoFailure,
                                     "Cannot open file: " + path.string()));
  }

  file.seekg(0, std::ios::end);
  auto size = file.tellg();
  if (size < 0) {
    return std::unexpected(makeError(ErrorCode::kIoFailure, "Cannot get file size"));
  }

  file.seekg(0, std::ios::beg);

  std::string content(static_cast<size_t>(size), '\0');
  file.read(content.data(), size);

  if (!file) {
    return std::unexpected(makeError(ErrorCode::kIoFailure, "Read failed: " + path.string()));
  }

  return content;
}

Result<void> FileSystem::createDirectories(const std::filesystem::path& path,
                                           std::filesystem::perms perms) {
  std::error_code ec;

  if (!std::filesystem::create_directories(path, ec) && ec) {
    return std::unexpected(makeError(ErrorCode::kIoFailure,
                                     "Cannot create directories: " + ec.message()));
  }

  std::filesystem::permissions(path, perms, std::filesystem::perm_options::add, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kIoFailure,
                                     "Cannot set directory permissions: " + ec.message()));
  }

  return {};
}

Result<void> FileSystem::moveFile(const std::filesystem::path& from,
                                  const std::filesystem::path& to) {
  std::error_code ec;
  std::filesystem::rename(from, to, ec);

  if (ec) {
    return std::unexpected(makeError(ErrorCode::kIoFailure,
                                     "Move failed: " + ec.message()));
  }

  return {};
}

Result<void> FileSystem::copyFile(const std::filesystem::path& from,
                                  const std::filesystem::path& to) {
  std::error_code ec;
  std::filesystem::copy_file(from, to,
                             std::filesystem::copy_options::overwrite_existing, ec);

  if (ec) {
    return std::unexpected(makeError(ErrorCode::kIoFailure,
                                     "Copy failed: " + ec.message()));
  }

  return {};
}

Result<void> FileSystem::copyDirectory(const std::filesystem::path& from,
                                       const std::filesystem::path& to) {
  std::error_code ec;
  if (!std::filesystem::is_directory(from, ec)) {
    return {};
  }

  auto mkdir_result = createDirectories(to);
  if (!mkdir_result.has_value()) {
    return mkdir_result;
  }

  std::filesystem::copy(from, to,
                        std::filesystem::copy_options::recursive |
                        std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kIoFailure,
                                     "Copy of " + from.string() + " failed: " + ec.message()));
  }

  return {};
}

Result<std::uintmax_t> FileSystem::fileSize(const std::filesystem::path& path) {
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);

  if (ec) {
    return std::unexpected(makeError(ErrorCode::kIoFailure,
                                     "Cannot get file size: " + ec.message()));
  }

  return size;
}

Result<void> FileSystem::removeFile(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);

  if (ec) {
    return std::unexpected(makeError(ErrorCode::kIoFailure,
                                     "Cannot remove file: " + ec.message()));
  }

  return {};
}

Result<void> FileSystem::removeAll(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove_all(path, ec);

  if (ec) {
    return std::unexpected(makeError(ErrorCode::kIoFailure,
                                     "Cannot remove " + path.string() + ": " + ec.message()));
  }

  return {};
}

Result<std::vector<std::filesystem::path>> FileSystem::listDirectory(
    const std::filesystem::path& path, const std::string& extension_filter) {
  std::vector<std::filesystem::path> results;
  std::error_code ec;

  if (!std::filesystem::is_directory(path, ec)) {
    return results;
  }

  for (const auto& entry : std::filesystem::directory_iterator(path, ec)) {
    std::error_code entry_ec;
    if (entry.is_regular_file(entry_ec) && !entry_ec) {
      if (extension_filter.empty() || entry.path().extension() == extension_filter) {
        results.push_back(entry.path());
      }
    }
  }
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kIoFailure,
                                     "Cannot list directory: " + ec.message()));
  }

  return results;
}

Result<std::vector<std::filesystem::path>> FileSystem::listSubdirectories(
    const std::filesystem::path& path) {
  std::vector<std::filesystem::path> results;
  std::error_code ec;

  if (!std::filesystem::is_directory(path, ec)) {
    return results;
  }

  for (const auto& entry : std::filesystem::directory_iterator(path, ec)) {
    std::error_code entry_ec;
    if (entry.is_directory(entry_ec) && !entry_ec) {
      results.push_back(entry.path());
    }
  }
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kIoFailure,
                                     "Cannot list directory: " + ec.message()));
  }

  return results;
}

Result<void> FileSystem::syncDirectory(const std::filesystem::path& path) {
  int fd = open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    return std::unexpected(makeError(ErrorCode::kIoFailure,
                                     "Cannot open directory for sync"));
  }

  int rc = fsync(fd);
  close(fd);
  if (rc < 0) {
    return std::unexpected(makeError(ErrorCode::kIoFailure, "Sync failed"));
  }

  return {};
}

}  // namespace quire::util
