#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/core/ports.hpp"
#include "internal/db/model/backup_record.hpp"
#include "internal/db/model/file_record.hpp"
#include "internal/db/model/operation_record.hpp"
#include "internal/db/model/transaction_record.hpp"
#include "internal/db/model/validation_result_record.hpp"

namespace deploy::backup {
class BackupManager;
}
namespace deploy::checksum {
class ChecksumService;
}

namespace deploy::core {

class TransactionLedger;

enum class DeploymentStatus {
  kCompleted,
  kFailed,
  kValidationFailed,
};

std::string_view ToString(DeploymentStatus status);

struct FileValidationDetail {
  std::string                                    file_id;
  std::string                                    source_path;
  std::optional<deploy::model::ValidationStatus> status;
  std::vector<db::model::ValidationResultRecord> results;
};

struct DeploymentResult {
  std::string                       transaction_id;
  DeploymentStatus                  status = DeploymentStatus::kFailed;
  std::optional<std::string>        backup_id;
  std::vector<FileValidationDetail> validation_details;
  std::optional<std::string>        error_message;
};

struct DeploymentSummary {
  db::model::TransactionRecord transaction;
  std::size_t                  file_count    = 0;
  std::size_t                  success_count = 0;
};

struct FileDeploymentStatus {
  db::model::FileRecord                   file;
  std::vector<db::model::OperationRecord> operations;
};

struct DeploymentStatusReport {
  db::model::TransactionRecord           transaction;
  std::vector<FileDeploymentStatus>      files;
  std::optional<db::model::BackupRecord> backup;
};

struct DeploymentOptions {
  bool                      auto_backup = true;
  deploy::model::BackupType backup_type = deploy::model::BackupType::kFull;
  // recorded when DeployFiles is called with an empty user id
  std::string default_user = "admin";
};

/*
  Runs one deployment end to end:

    create transaction -> register files (source checksum) -> validate
      -> pre-deployment backup (policy) -> execute

  Validation failure is a result (kValidationFailed) and leaves the
  transaction INITIALIZED with nothing written. Any failure after that is
  reported as kFailed; the ledger has already rolled back what it could.
*/
class DeploymentEngine {
 public:
  DeploymentEngine(std::shared_ptr<TransactionLedger> ledger, std::shared_ptr<backup::BackupManager> backups,
                   std::shared_ptr<checksum::ChecksumService> checksums, std::shared_ptr<Validator> validator,
                   std::shared_ptr<FileDeployer> deployer, std::shared_ptr<FileRestorer> restorer, DeploymentOptions options = {});

  // Throws util::InvalidArgument, before any state is created, when the
  // lists are empty or differ in length.
  DeploymentResult DeployFiles(const std::vector<std::filesystem::path>& sources, const std::vector<std::filesystem::path>& destinations,
                               const std::filesystem::path& project_path, const std::string& user_id,
                               const std::optional<std::string>& description = std::nullopt);

  // One-shot: each call consumes one archived generation per file.
  bool RollbackDeployment(const std::string& transaction_id);

  DeploymentStatusReport GetDeploymentStatus(const std::string& transaction_id);

  // Newest first.
  std::vector<DeploymentSummary> ListDeployments(const std::optional<std::string>& project_path = std::nullopt,
                                                 const std::optional<std::string>& user_id = std::nullopt, std::size_t limit = 10);

 private:
  std::vector<FileValidationDetail> CollectValidationDetails(const std::string& transaction_id);

  std::shared_ptr<TransactionLedger>         ledger_;
  std::shared_ptr<backup::BackupManager>     backups_;
  std::shared_ptr<checksum::ChecksumService> checksums_;
  std::shared_ptr<Validator>                 validator_;
  std::shared_ptr<FileDeployer>              deployer_;
  std::shared_ptr<FileRestorer>              restorer_;
  DeploymentOptions                          options_;
};

} // namespace deploy::core
