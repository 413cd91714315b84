#include "deployment_engine.hpp"

#include <algorithm>
#include <exception>
#include <map>

#include "internal/backup/backup_manager.hpp"
#include "internal/checksum/checksum_service.hpp"
#include "internal/core/transaction_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace deploy::core {

namespace fs = std::filesystem;

using deploy::model::OperationStatus;
using deploy::model::ValidationStatus;
using observability::IntField;
using observability::StringField;

std::string_view ToString(DeploymentStatus status) {
  switch (status) {
    case DeploymentStatus::kCompleted:
      return "COMPLETED";
    case DeploymentStatus::kFailed:
      return "FAILED";
    case DeploymentStatus::kValidationFailed:
      return "VALIDATION_FAILED";
  }
  return "UNKNOWN";
}

DeploymentEngine::DeploymentEngine(std::shared_ptr<TransactionLedger> ledger, std::shared_ptr<backup::BackupManager> backups,
                                   std::shared_ptr<checksum::ChecksumService> checksums, std::shared_ptr<Validator> validator,
                                   std::shared_ptr<FileDeployer> deployer, std::shared_ptr<FileRestorer> restorer, DeploymentOptions options)
    : ledger_(std::move(ledger)),
      backups_(std::move(backups)),
      checksums_(std::move(checksums)),
      validator_(std::move(validator)),
      deployer_(std::move(deployer)),
      restorer_(std::move(restorer)),
      options_(options) {
}

DeploymentResult DeploymentEngine::DeployFiles(const std::vector<fs::path>& sources, const std::vector<fs::path>& destinations,
                                               const fs::path& project_path, const std::string& user_id,
                                               const std::optional<std::string>& description) {
  if (sources.empty() || destinations.empty()) {
    throw util::InvalidArgument("no files to deploy");
  }
  if (sources.size() != destinations.size()) {
    throw util::InvalidArgument("got " + std::to_string(sources.size()) + " sources but " + std::to_string(destinations.size()) +
                                " destinations");
  }

  const auto& user = user_id.empty() ? options_.default_user : user_id;

  DeploymentResult result;
  result.transaction_id = ledger_->CreateTransaction(user, project_path.string(), description);

  try {
    for (std::size_t i = 0; i < sources.size(); ++i) {
      // an unreadable source is left for the validator to reject
      std::optional<std::string> checksum;
      std::error_code            ec;
      if (fs::is_regular_file(sources[i], ec)) {
        checksum = checksums_->FileChecksum(sources[i]);
      }
      ledger_->AddFile(result.transaction_id, sources[i], destinations[i], checksum);
    }

    if (!ledger_->Validate(result.transaction_id, *validator_)) {
      result.status             = DeploymentStatus::kValidationFailed;
      result.validation_details = CollectValidationDetails(result.transaction_id);
      result.error_message      = "validation failed";
      DEPLOY_LOG_WARN("deployment rejected by validation", {StringField("transaction_id", result.transaction_id)});
      return result;
    }

    if (options_.auto_backup) {
      std::error_code ec;
      if (fs::is_directory(project_path, ec)) {
        auto backup      = backups_->CreateBackup(project_path, options_.backup_type, user,
                                                  "Pre-deployment backup for transaction " + result.transaction_id);
        result.backup_id = backup.id;
      } else {
        DEPLOY_LOG_WARN("project path missing; deploying without backup",
                        {StringField("transaction_id", result.transaction_id), StringField("project_path", project_path.string())});
      }
    }

    ledger_->Execute(result.transaction_id, result.backup_id, *deployer_, *restorer_);
  } catch (const std::exception& ex) {
    DEPLOY_LOG_ERROR("deployment failed", {StringField("transaction_id", result.transaction_id), StringField("error", ex.what())});
    try {
      ledger_->Close(result.transaction_id);
    } catch (const std::exception& close_ex) {
      DEPLOY_LOG_ERROR("closing failed transaction failed",
                       {StringField("transaction_id", result.transaction_id), StringField("error", close_ex.what())});
    }

    result.status        = DeploymentStatus::kFailed;
    result.error_message = ex.what();
    return result;
  }

  result.status = DeploymentStatus::kCompleted;
  DEPLOY_LOG_INFO("deployment completed", {StringField("transaction_id", result.transaction_id), IntField("files", static_cast<int64_t>(sources.size())),
                                           StringField("backup_id", result.backup_id.value_or(""))});
  return result;
}

std::vector<FileValidationDetail> DeploymentEngine::CollectValidationDetails(const std::string& transaction_id) {
  std::vector<FileValidationDetail> details;
  for (const auto& file : ledger_->GetFiles(transaction_id)) {
    FileValidationDetail detail;
    detail.file_id     = file.id;
    detail.source_path = file.source_path;
    detail.status      = file.validation_status;
    detail.results     = ledger_->GetValidationResults(file.id);
    details.push_back(std::move(detail));
  }
  return details;
}

bool DeploymentEngine::RollbackDeployment(const std::string& transaction_id) {
  const bool ok = ledger_->Rollback(transaction_id, *restorer_);
  if (ok) {
    DEPLOY_LOG_INFO("deployment rolled back", {StringField("transaction_id", transaction_id)});
  } else {
    DEPLOY_LOG_ERROR("deployment rollback incomplete", {StringField("transaction_id", transaction_id)});
  }
  return ok;
}

DeploymentStatusReport DeploymentEngine::GetDeploymentStatus(const std::string& transaction_id) {
  DeploymentStatusReport report;
  report.transaction = ledger_->GetTransaction(transaction_id);

  std::map<std::string, std::vector<db::model::OperationRecord>> ops_by_file;
  for (auto& op : ledger_->GetOperations(transaction_id)) {
    if (op.file_id) ops_by_file[*op.file_id].push_back(std::move(op));
  }

  for (auto& file : ledger_->GetFiles(transaction_id)) {
    FileDeploymentStatus status;
    if (auto it = ops_by_file.find(file.id); it != ops_by_file.end()) {
      status.operations = std::move(it->second);
    }
    status.file = std::move(file);
    report.files.push_back(std::move(status));
  }

  if (report.transaction.backup_id) {
    report.backup = backups_->GetBackup(*report.transaction.backup_id);
  }
  return report;
}

std::vector<DeploymentSummary> DeploymentEngine::ListDeployments(const std::optional<std::string>& project_path,
                                                                 const std::optional<std::string>& user_id, std::size_t limit) {
  db::TransactionFilter filter;
  filter.project_path = project_path;
  filter.user_id      = user_id;
  filter.limit        = limit;

  std::vector<DeploymentSummary> out;
  for (auto& transaction : ledger_->ListTransactions(filter)) {
    DeploymentSummary summary;
    summary.file_count = ledger_->GetFiles(transaction.id).size();

    const auto ops        = ledger_->GetOperations(transaction.id);
    summary.success_count = static_cast<std::size_t>(
        std::count_if(ops.begin(), ops.end(), [](const auto& op) { return op.status == OperationStatus::kCompleted; }));

    summary.transaction = std::move(transaction);
    out.push_back(std::move(summary));
  }
  return out;
}

} // namespace deploy::core
