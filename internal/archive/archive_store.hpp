#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace deploy::archive {

/*
  Per-destination "previous version" keeper.

  Before a destination file is overwritten its bytes are copied to
    <dir of destination>/<archive_dir>/<filename>.<tag>
  with tag = YYYYMMDDHHMMSSffffff.NNNN. Tags are fixed width and strictly
  increasing per file, so the greatest tag is the most recent generation.

  Restore consumes exactly one generation. Restoring a destination with no
  archived generation deletes it (it was created by the deployment). A
  second restore of the same deployment is therefore NOT idempotent.
*/
class ArchiveStore {
 public:
  explicit ArchiveStore(std::string archive_dir_name = ".archive");

  // Archives the current content of destination. nullopt if it does not exist.
  std::optional<std::filesystem::path> Archive(const std::filesystem::path& destination);

  // Throws util::DeploymentIOError if the filesystem refuses the restore.
  void Restore(const std::filesystem::path& destination);

  // Archived generations of destination, oldest first.
  std::vector<std::filesystem::path> Generations(const std::filesystem::path& destination) const;

  std::filesystem::path ArchiveDir(const std::filesystem::path& destination) const;

  static bool IsTag(const std::string& tag);

 private:
  std::string NextTag(const std::filesystem::path& destination) const;

  std::string archive_dir_name_;
};

} // namespace deploy::archive
