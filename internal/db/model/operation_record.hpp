#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/deployment.hpp"

namespace deploy::db::model {

/*
  Append-only ledger entry.

  The only permitted mutation is IN_PROGRESS -> COMPLETED | FAILED.
*/

struct OperationRecord {
  std::string                id;
  std::string                transaction_id;
  std::optional<std::string> file_id;

  deploy::model::OperationType type = deploy::model::OperationType::kDeploy;

  std::optional<std::string> source_path;
  std::optional<std::string> destination_path;
  std::string                timestamp;

  deploy::model::OperationStatus status = deploy::model::OperationStatus::kInProgress;

  std::optional<std::string> error_message;

  // append order within the transaction
  uint64_t seq = 0;
};

}
