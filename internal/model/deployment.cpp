#include "internal/model/deployment.hpp"

#include <array>
#include <utility>

#include "internal/util/errors.hpp"

namespace deploy::model {

namespace {

template <typename Enum, std::size_t N>
Enum ParseName(const std::array<std::pair<std::string_view, Enum>, N>& table, std::string_view name, const char* what) {
  for (const auto& [text, value] : table) {
    if (text == name) {
      return value;
    }
  }
  throw util::InvalidArgument(std::string("unknown ") + what + ": " + std::string(name));
}

constexpr std::array<std::pair<std::string_view, TransactionStatus>, 6> kTransactionStatuses{{
    {"INITIALIZED", TransactionStatus::kInitialized},
    {"VALIDATED", TransactionStatus::kValidated},
    {"IN_PROGRESS", TransactionStatus::kInProgress},
    {"COMPLETED", TransactionStatus::kCompleted},
    {"FAILED", TransactionStatus::kFailed},
    {"ROLLED_BACK", TransactionStatus::kRolledBack},
}};

constexpr std::array<std::pair<std::string_view, FileStatus>, 3> kFileStatuses{{
    {"PENDING", FileStatus::kPending},
    {"DEPLOYED", FileStatus::kDeployed},
    {"FAILED", FileStatus::kFailed},
}};

constexpr std::array<std::pair<std::string_view, ValidationStatus>, 3> kValidationStatuses{{
    {"PASS", ValidationStatus::kPass},
    {"FAIL", ValidationStatus::kFail},
    {"WARNING", ValidationStatus::kWarning},
}};

constexpr std::array<std::pair<std::string_view, OperationType>, 2> kOperationTypes{{
    {"DEPLOY", OperationType::kDeploy},
    {"ROLLBACK", OperationType::kRollback},
}};

constexpr std::array<std::pair<std::string_view, OperationStatus>, 3> kOperationStatuses{{
    {"IN_PROGRESS", OperationStatus::kInProgress},
    {"COMPLETED", OperationStatus::kCompleted},
    {"FAILED", OperationStatus::kFailed},
}};

constexpr std::array<std::pair<std::string_view, BackupType>, 3> kBackupTypes{{
    {"FULL", BackupType::kFull},
    {"PARTIAL", BackupType::kPartial},
    {"CONFIG", BackupType::kConfig},
}};

template <typename Enum, std::size_t N>
std::string_view NameOf(const std::array<std::pair<std::string_view, Enum>, N>& table, Enum value) {
  for (const auto& [text, entry] : table) {
    if (entry == value) {
      return text;
    }
  }
  return "UNKNOWN";
}

} // namespace

std::string_view ToString(TransactionStatus status) {
  return NameOf(kTransactionStatuses, status);
}

std::string_view ToString(FileStatus status) {
  return NameOf(kFileStatuses, status);
}

std::string_view ToString(ValidationStatus status) {
  return NameOf(kValidationStatuses, status);
}

std::string_view ToString(OperationType type) {
  return NameOf(kOperationTypes, type);
}

std::string_view ToString(OperationStatus status) {
  return NameOf(kOperationStatuses, status);
}

std::string_view ToString(BackupType type) {
  return NameOf(kBackupTypes, type);
}

TransactionStatus ParseTransactionStatus(std::string_view name) {
  return ParseName(kTransactionStatuses, name, "transaction status");
}

FileStatus ParseFileStatus(std::string_view name) {
  return ParseName(kFileStatuses, name, "file status");
}

ValidationStatus ParseValidationStatus(std::string_view name) {
  return ParseName(kValidationStatuses, name, "validation status");
}

OperationType ParseOperationType(std::string_view name) {
  return ParseName(kOperationTypes, name, "operation type");
}

OperationStatus ParseOperationStatus(std::string_view name) {
  return ParseName(kOperationStatuses, name, "operation status");
}

BackupType ParseBackupType(std::string_view name) {
  return ParseName(kBackupTypes, name, "backup type");
}

} // namespace deploy::model
