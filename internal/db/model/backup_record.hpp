#pragma once

#include <cstdint>
#include <string>

#include "internal/model/deployment.hpp"

namespace deploy::db::model {

struct BackupRecord {
  std::string id;
  std::string timestamp;
  std::string project_path;

  // artifact location: <name>.tar.gz file or <name> directory
  std::string backup_path;

  deploy::model::BackupType type = deploy::model::BackupType::kFull;

  uint64_t    size_bytes = 0;
  uint64_t    file_count = 0;
  std::string user_id;
  bool        verified = false;

  // tree checksum of the backed-up files
  std::string checksum;
};

}
