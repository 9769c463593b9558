#include "quire/sync/backup_manager.hpp"

#include <set>
#include <string_view>

#include <spdlog/spdlog.h>

#include "quire/store/filesystem_store.hpp"
#include "quire/util/filesystem.hpp"
#include "quire/util/time.hpp"

namespace quire::sync {

BackupManager::BackupManager(store::FilesystemStore& store) : store_(store) {}

bool BackupManager::isInsideStore(const std::filesystem::path& path) const {
  std::error_code ec;
  auto root = std::filesystem::weakly_canonical(store_.root(), ec);
  if (ec) {
    root = store_.root().lexically_normal();
  }
  auto candidate = std::filesystem::weakly_canonical(path, ec);
  if (ec) {
    candidate = std::filesystem::absolute(path).lexically_normal();
  }

  auto relative = candidate.lexically_relative(root);
  if (relative.empty()) {
    return false;
  }
  auto first = *relative.begin();
  return first != "..";
}

Result<BackupSummary> BackupManager::exportTo(const std::filesystem::path& target) {
  if (target.empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "No backup directory given"));
  }
  if (isInsideStore(target)) {
    return std::unexpected(makeError(ErrorCode::kValidationFailure,
                                     "Backup directory must be outside the store: " +
                                     target.string()));
  }

  auto lock = store_.lockExclusive();

  auto created = util::FileSystem::createDirectories(target);
  if (!created.has_value()) {
    return std::unexpected(created.error());
  }

  const auto& dirs = store::FilesystemStore::dataDirectories();
  auto staging = stagingPath(target, "export");
  auto staged = stage(store_.root(), staging, dirs);
  if (!staged.has_value()) {
    discardStaging(staging);
    return std::unexpected(staged.error());
  }
  auto swapped = swapIn(staging, target, dirs);
  if (!swapped.has_value()) {
    discardStaging(staging);
    return std::unexpected(swapped.error());
  }
  discardStaging(staging);

  BackupSummary summary;
  summary.notes = store_.index().listNotes().size();
  spdlog::info("Exported {} notes to {}", summary.notes, target.string());
  return summary;
}

Result<BackupSummary> BackupManager::importFrom(const std::filesystem::path& source) {
  std::error_code ec;
  if (source.empty() || !std::filesystem::is_directory(source, ec)) {
    return std::unexpected(makeError(ErrorCode::kNotFound,
                                     "Backup directory not found: " + source.string()));
  }
  if (isInsideStore(source)) {
    return std::unexpected(makeError(ErrorCode::kValidationFailure,
                                     "Cannot import from inside the store: " + source.string()));
  }

  auto index_file = source / "meta" / "index.json";
  if (!std::filesystem::is_regular_file(index_file, ec)) {
    return std::unexpected(makeError(ErrorCode::kNotFound,
                                     "No meta/index.json in " + source.string()));
  }
  auto imported = store::MetadataIndex::readFile(index_file);
  if (!imported.has_value()) {
    return std::unexpected(imported.error());
  }

  auto lock = store_.lockExclusive();

  // Content first; the live index is untouched until everything is in place
  static const std::vector<std::string> kContentDirectories = {"notes", "versions", "images"};
  auto staging = stagingPath(store_.root(), "import");
  auto staged = stage(source, staging, kContentDirectories);
  if (!staged.has_value()) {
    discardStaging(staging);
    return std::unexpected(staged.error());
  }
  auto swapped = swapIn(staging, store_.root(), kContentDirectories);
  if (!swapped.has_value()) {
    discardStaging(staging);
    return std::unexpected(swapped.error());
  }

  imported->sync_folder = store_.index().syncFolder();
  auto replaced = store_.index().replace(*imported);
  if (!replaced.has_value()) {
    swapBack(staging, store_.root(), kContentDirectories);
    discardStaging(staging);
    return std::unexpected(replaced.error());
  }
  auto reloaded = store_.reload();
  if (!reloaded.has_value()) {
    discardStaging(staging);
    return std::unexpected(reloaded.error());
  }

  std::set<std::string> known;
  for (const auto& note : imported->notes) {
    known.insert(note.id().toString());
  }

  BackupSummary summary;
  summary.notes = imported->notes.size();
  // Local notes the backup does not know, then strays the backup carried itself
  summary.pruned = pruneOrphans(staging / "previous", known) + pruneOrphans(store_.root(), known);
  discardStaging(staging);
  spdlog::info("Imported {} notes from {} ({} orphans pruned)", summary.notes, source.string(),
               summary.pruned);
  return summary;
}

std::filesystem::path BackupManager::stagingPath(const std::filesystem::path& parent,
                                                 std::string_view purpose) {
  auto millis = util::Time::epochMillis(util::Time::now());
  return parent / ("." + std::string(purpose) + "-" + std::to_string(millis));
}

Result<void> BackupManager::stage(const std::filesystem::path& from,
                                  const std::filesystem::path& staging,
                                  const std::vector<std::string>& dirs) {
  for (const auto& dir : dirs) {
    auto created = util::FileSystem::createDirectories(staging / dir);
    if (!created.has_value()) {
      return created;
    }
    auto copied = util::FileSystem::copyDirectory(from / dir, staging / dir);
    if (!copied.has_value()) {
      return copied;
    }
  }
  return {};
}

Result<void> BackupManager::swapIn(const std::filesystem::path& staging,
                                   const std::filesystem::path& dest,
                                   const std::vector<std::string>& dirs) {
  auto created = util::FileSystem::createDirectories(staging / "previous");
  if (!created.has_value()) {
    return created;
  }

  std::vector<std::string> done;
  for (const auto& dir : dirs) {
    auto live = dest / dir;
    auto previous = staging / "previous" / dir;

    std::error_code ec;
    if (std::filesystem::exists(live, ec)) {
      auto moved = util::FileSystem::moveFile(live, previous);
      if (!moved.has_value()) {
        swapBack(staging, dest, done);
        return moved;
      }
    }

    auto placed = util::FileSystem::moveFile(staging / dir, live);
    if (!placed.has_value()) {
      if (std::filesystem::exists(previous, ec)) {
        auto restored = util::FileSystem::moveFile(previous, live);
        if (!restored.has_value()) {
          spdlog::error("Could not restore {}: {}", live.string(), restored.error().message());
        }
      }
      swapBack(staging, dest, done);
      return placed;
    }
    done.push_back(dir);
  }
  return {};
}

void BackupManager::swapBack(const std::filesystem::path& staging,
                             const std::filesystem::path& dest,
                             const std::vector<std::string>& dirs) {
  for (auto it = dirs.rbegin(); it != dirs.rend(); ++it) {
    auto live = dest / *it;
    auto previous = staging / "previous" / *it;

    auto removed = util::FileSystem::removeAll(live);
    if (!removed.has_value()) {
      spdlog::error("Rollback of {} failed: {}", live.string(), removed.error().message());
      continue;
    }
    std::error_code ec;
    if (!std::filesystem::exists(previous, ec)) {
      continue;
    }
    auto restored = util::FileSystem::moveFile(previous, live);
    if (!restored.has_value()) {
      spdlog::error("Rollback of {} failed: {}", live.string(), restored.error().message());
    }
  }
}

void BackupManager::discardStaging(const std::filesystem::path& staging) {
  auto removed = util::FileSystem::removeAll(staging);
  if (!removed.has_value()) {
    spdlog::warn("Could not remove staging directory {}: {}", staging.string(),
                 removed.error().message());
  }
}

size_t BackupManager::pruneOrphans(const std::filesystem::path& base,
                                   const std::set<std::string>& known) {
  size_t pruned = 0;
  auto prune = [&](const std::filesystem::path& path, bool directory) {
    auto removed = directory ? util::FileSystem::removeAll(path) : util::FileSystem::removeFile(path);
    if (!removed.has_value()) {
      spdlog::warn("Could not prune {}: {}", path.string(), removed.error().message());
      return;
    }
    spdlog::warn("Pruned {}/{}, no note in the imported index",
                 path.parent_path().filename().string(), path.filename().string());
    ++pruned;
  };

  std::error_code ec;
  if (std::filesystem::is_directory(base / "notes", ec)) {
    auto notes = util::FileSystem::listDirectory(base / "notes", ".txt");
    if (notes.has_value()) {
      for (const auto& file : *notes) {
        if (!known.contains(file.stem().string())) {
          prune(file, false);
        }
      }
    } else {
      spdlog::warn("Cannot scan notes for orphans: {}", notes.error().message());
    }
  }

  for (const auto* dir : {"versions", "images"}) {
    if (!std::filesystem::is_directory(base / dir, ec)) {
      continue;
    }
    auto entries = util::FileSystem::listSubdirectories(base / dir);
    if (!entries.has_value()) {
      spdlog::warn("Cannot scan {} for orphans: {}", dir, entries.error().message());
      continue;
    }
    for (const auto& entry : *entries) {
      if (!known.contains(entry.filename().string())) {
        prune(entry, true);
      }
    }
  }

  return pruned;
}

std::optional<std::string> BackupManager::syncFolder() const {
  return store_.index().syncFolder();
}

Result<void> BackupManager::setSyncFolder(const std::optional<std::filesystem::path>& folder) {
  std::optional<std::string> value;
  if (folder.has_value()) {
    if (folder->empty()) {
      return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Sync folder path is empty"));
    }
    if (isInsideStore(*folder)) {
      return std::unexpected(makeError(ErrorCode::kValidationFailure,
                                       "Sync folder must be outside the store: " +
                                       folder->string()));
    }
    std::error_code ec;
    auto absolute = std::filesystem::absolute(*folder, ec);
    value = (ec ? *folder : absolute).lexically_normal().string();
  }

  auto lock = store_.lockShared();
  return store_.index().update([&](store::IndexData& data) -> Result<void> {
    data.sync_folder = value;
    return {};
  });
}

Result<std::filesystem::path> BackupManager::requireSyncFolder() const {
  auto folder = syncFolder();
  if (!folder.has_value() || folder->empty()) {
    return std::unexpected(makeError(ErrorCode::kValidationFailure,
                                     "No sync folder configured; set one with 'sync folder PATH'"));
  }
  return std::filesystem::path(*folder);
}

Result<BackupSummary> BackupManager::push() {
  auto folder = requireSyncFolder();
  if (!folder.has_value()) {
    return std::unexpected(folder.error());
  }
  return exportTo(*folder);
}

Result<BackupSummary> BackupManager::pull() {
  auto folder = requireSyncFolder();
  if (!folder.has_value()) {
    return std::unexpected(folder.error());
  }
  return importFrom(*folder);
}

}  // namespace quire::sync
