#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/model/deployment.hpp"

namespace deploy::checksum {
class ChecksumService;
}

namespace deploy::backup {

// A file chosen for a backup: where it is read from and where it lands
// inside the backup tree.
struct SelectedFile {
  std::filesystem::path source;
  std::filesystem::path relative;
};

struct BackupResult {
  std::string           id;
  std::filesystem::path path;
  std::string           timestamp;
  uint64_t              size_bytes = 0;
  uint64_t              file_count = 0;
  std::string           checksum;
};

/*
  Whole-project snapshots.

  Artifact layout:
    <location>/<name>.tar.gz   (compression on; entries under <name>/)
    <location>/<name>/         (compression off)
  where name = <project>_<YYYYMMDD_HHMMSS>_<TYPE>_<id8>. The tree holds the
  copied files plus metadata.json; the stored checksum is the tree
  checksum of everything except metadata.json.
*/
class BackupManager {
 public:
  static constexpr const char* kMetadataFile = "metadata.json";

  BackupManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<checksum::ChecksumService> checksums,
                deploy::runtime::config::BackupConfig config);

  // files, when given, replaces the type's selection policy. Paths may be
  // absolute or relative to project_path.
  BackupResult CreateBackup(const std::filesystem::path& project_path, deploy::model::BackupType type, const std::string& user_id,
                            const std::optional<std::string>&                        description = std::nullopt,
                            const std::optional<std::vector<std::filesystem::path>>& files       = std::nullopt);

  // Throws util::NotFound for an unknown id. False if the artifact is
  // missing, unreadable or its content no longer matches the checksum.
  bool VerifyBackup(const std::string& id);

  // Throws util::VerificationError if the backup does not verify.
  bool RestoreFromBackup(const std::string& id, const std::optional<std::filesystem::path>& restore_path = std::nullopt);

  void DeleteBackup(const std::string& id);

  std::optional<std::string> GetFileFromBackup(const std::string& id, const std::string& relative_path);

  std::optional<db::model::BackupRecord> GetBackup(const std::string& id);

  // Newest first.
  std::vector<db::model::BackupRecord> ListBackups(const std::optional<std::string>& project_path = std::nullopt, std::size_t limit = 10);

  // Files selected for a backup of project_path, ordered by relative path
  // for policy walks and in list order for an explicit list. Explicit
  // entries outside project_path land under their file name.
  std::vector<SelectedFile> SelectFiles(const std::filesystem::path& project_path, deploy::model::BackupType type,
                                                 const std::optional<std::vector<std::filesystem::path>>& files) const;

  static bool MatchesConfigPattern(const std::string& filename);

 private:
  db::model::BackupRecord LoadRecord(const std::string& id);

  std::shared_ptr<db::Repository>            repository_;
  std::shared_ptr<checksum::ChecksumService> checksums_;
  deploy::runtime::config::BackupConfig      config_;
};

} // namespace deploy::backup
