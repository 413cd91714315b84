#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/state_machine.hpp"

namespace deploy::model {

enum class FileStatus : std::uint8_t {
  kPending  = 0,
  kDeployed = 1,
  kFailed   = 2,
};

enum class ValidationStatus : std::uint8_t {
  kPass    = 0,
  kFail    = 1,
  kWarning = 2,
};

enum class OperationType : std::uint8_t {
  kDeploy   = 0,
  kRollback = 1,
};

enum class OperationStatus : std::uint8_t {
  kInProgress = 0,
  kCompleted  = 1,
  kFailed     = 2,
};

enum class BackupType : std::uint8_t {
  kFull    = 0,
  kPartial = 1,
  kConfig  = 2,
};

// Canonical upper-case names, as persisted in the record store.
std::string_view ToString(TransactionStatus status);
std::string_view ToString(FileStatus status);
std::string_view ToString(ValidationStatus status);
std::string_view ToString(OperationType type);
std::string_view ToString(OperationStatus status);
std::string_view ToString(BackupType type);

// Throw util::InvalidArgument on unknown names.
TransactionStatus ParseTransactionStatus(std::string_view name);
FileStatus        ParseFileStatus(std::string_view name);
ValidationStatus  ParseValidationStatus(std::string_view name);
OperationType     ParseOperationType(std::string_view name);
OperationStatus   ParseOperationStatus(std::string_view name);
BackupType        ParseBackupType(std::string_view name);

}  // namespace deploy::model
