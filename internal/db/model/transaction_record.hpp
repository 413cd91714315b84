#pragma once

#include <optional>
#include <string>

#include "internal/model/state_machine.hpp"

namespace deploy::db::model {

/*
  Persistent deployment transaction row.

  IMPORTANT:
  - Never deleted; a terminal transaction is history.
  - status only moves along deploy::model::CanTransition edges.
*/

struct TransactionRecord {
  std::string id;
  std::string timestamp;  // ISO-8601 UTC, creation time
  std::string user_id;

  deploy::model::TransactionStatus status =
      deploy::model::TransactionStatus::kInitialized;

  // Set once a pre-deployment backup exists
  std::optional<std::string> backup_id;

  std::string                project_path;
  std::optional<std::string> description;
};

}
