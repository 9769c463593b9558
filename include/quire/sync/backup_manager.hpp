#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "quire/common.hpp"
#include "quire/store/metadata_index.hpp"

namespace quire::store {
class FilesystemStore;
}

namespace quire::sync {

struct BackupSummary {
  size_t notes = 0;    // Notes in the copied index
  size_t pruned = 0;   // Local entries removed after an import
};

/**
 * @brief Whole-store copies to and from a directory
 *
 * Both directions run under the store's exclusive lock and replace each
 * data directory wholesale: the copy is staged in a hidden directory beside
 * the destination, then renamed into place. An import swaps the index last,
 * so a failure part way leaves the live store as it was.
 */
class BackupManager {
public:
  explicit BackupManager(store::FilesystemStore& store);

  // Replace notes/, versions/, meta/ and images/ under target with the store's
  Result<BackupSummary> exportTo(const std::filesystem::path& target);

  // Replace the store's contents with a backup, keeping the local sync folder
  Result<BackupSummary> importFrom(const std::filesystem::path& source);

  std::optional<std::string> syncFolder() const;

  // nullopt clears the folder
  Result<void> setSyncFolder(const std::optional<std::filesystem::path>& folder);

  // Export to / import from the sync folder
  Result<BackupSummary> push();
  Result<BackupSummary> pull();

private:
  Result<std::filesystem::path> requireSyncFolder() const;
  bool isInsideStore(const std::filesystem::path& path) const;

  static std::filesystem::path stagingPath(const std::filesystem::path& parent,
                                           std::string_view purpose);
  // Copy from/<dir> into staging/<dir>; a missing source directory stages empty
  static Result<void> stage(const std::filesystem::path& from,
                            const std::filesystem::path& staging,
                            const std::vector<std::string>& dirs);
  // Rename staging/<dir> over dest/<dir>, parking the old one in staging/previous/
  static Result<void> swapIn(const std::filesystem::path& staging,
                             const std::filesystem::path& dest,
                             const std::vector<std::string>& dirs);
  static void swapBack(const std::filesystem::path& staging, const std::filesystem::path& dest,
                       const std::vector<std::string>& dirs);
  static void discardStaging(const std::filesystem::path& staging);
  // Remove entries under base/{notes,versions,images} whose note id is not known
  static size_t pruneOrphans(const std::filesystem::path& base,
                             const std::set<std::string>& known);

  store::FilesystemStore& store_;
};

}  // namespace quire::sync
