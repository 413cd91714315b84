#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/deployment.hpp"

namespace deploy::db::model {

/*
  One file participating in a transaction.

  seq is the registration order within the transaction; it drives both
  deployment order and rollback candidate order.
*/

struct FileRecord {
  std::string id;
  std::string transaction_id;
  std::string original_name;
  std::string source_path;
  std::string destination_path;

  deploy::model::FileStatus status = deploy::model::FileStatus::kPending;

  std::optional<deploy::model::ValidationStatus> validation_status;

  // checksum of the source at registration time
  std::optional<std::string> checksum;

  uint64_t seq = 0;
};

}
