#pragma once

#include <cstdint>

namespace deploy::model {

enum class TransactionStatus : std::uint8_t {
  kInitialized = 0,
  kValidated   = 1,
  kInProgress  = 2,
  kCompleted   = 3,
  kFailed      = 4,
  kRolledBack  = 5,
};

/*
  INITIALIZED -> VALIDATED -> IN_PROGRESS -> {COMPLETED, FAILED}
  {COMPLETED, FAILED} -> ROLLED_BACK

  Re-asserting the current state is allowed (a failed validation leaves
  the transaction INITIALIZED).
*/
constexpr bool CanTransition(TransactionStatus from, TransactionStatus to) {
  if (from == to) {
    return true;
  }

  switch (from) {
    case TransactionStatus::kInitialized:
      return to == TransactionStatus::kValidated;
    case TransactionStatus::kValidated:
      return to == TransactionStatus::kInProgress;
    case TransactionStatus::kInProgress:
      return to == TransactionStatus::kCompleted || to == TransactionStatus::kFailed;
    case TransactionStatus::kCompleted:
    case TransactionStatus::kFailed:
      return to == TransactionStatus::kRolledBack;
    case TransactionStatus::kRolledBack:
      return false;
  }
  return false;
}

constexpr bool AcceptsFiles(TransactionStatus status) {
  return status == TransactionStatus::kInitialized || status == TransactionStatus::kValidated;
}

constexpr bool IsRollbackable(TransactionStatus status) {
  return status == TransactionStatus::kCompleted || status == TransactionStatus::kFailed;
}

}  // namespace deploy::model
