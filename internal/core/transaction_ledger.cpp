#include "transaction_ledger.hpp"

#include <algorithm>
#include <exception>

#include "internal/checksum/checksum_service.hpp"
#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace deploy::core {

using deploy::model::FileStatus;
using deploy::model::OperationStatus;
using deploy::model::OperationType;
using deploy::model::TransactionStatus;
using deploy::model::ValidationStatus;
using observability::IntField;
using observability::StringField;

namespace {

std::string Describe(TransactionStatus status) {
  return std::string(deploy::model::ToString(status));
}

db::model::ValidationResultRecord ToResultRecord(const std::string& file_id, const ValidationIssue& issue, ValidationStatus status,
                                                 const std::string& timestamp) {
  db::model::ValidationResultRecord record;
  record.file_id     = file_id;
  record.rule        = issue.rule;
  record.status      = status;
  record.line_number = issue.line;
  record.message     = issue.message;
  record.timestamp   = timestamp;
  return record;
}

} // namespace

TransactionLedger::TransactionLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<checksum::ChecksumService> checksums)
    : repository_(std::move(repository)), checksums_(std::move(checksums)) {
}

db::model::TransactionRecord TransactionLedger::Require(db::Transaction& tx, const std::string& transaction_id) {
  auto record = repository_->GetTransaction(tx, transaction_id);
  if (!record) {
    throw util::NotFound("transaction " + transaction_id);
  }
  return *record;
}

std::string TransactionLedger::CreateTransaction(const std::string& user_id, const std::string& project_path,
                                                 const std::optional<std::string>& description) {
  db::model::TransactionRecord record;
  record.id           = util::NewId();
  record.timestamp    = util::ToIso8601(util::Now());
  record.user_id      = user_id;
  record.status       = TransactionStatus::kInitialized;
  record.project_path = project_path;
  record.description  = description;

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->InsertTransaction(*tx, record), "insert transaction");
  tx->Commit();

  DEPLOY_LOG_INFO("transaction created",
                  {StringField("transaction_id", record.id), StringField("user_id", user_id), StringField("project_path", project_path)});
  return record.id;
}

std::string TransactionLedger::AddFile(const std::string& transaction_id, const std::filesystem::path& source,
                                       const std::filesystem::path& destination, const std::optional<std::string>& checksum) {
  auto tx     = repository_->Begin();
  auto record = Require(*tx, transaction_id);

  if (!deploy::model::AcceptsFiles(record.status)) {
    throw util::InvalidState("cannot add files to transaction " + transaction_id + " in state " + Describe(record.status));
  }
  if (record.status == TransactionStatus::kValidated) {
    DEPLOY_LOG_WARN("file added after validation; it will be deployed unvalidated",
                    {StringField("transaction_id", transaction_id), StringField("source", source.string())});
  }

  db::model::FileRecord file;
  file.id               = util::NewId();
  file.transaction_id   = transaction_id;
  file.original_name    = source.filename().string();
  file.source_path      = source.string();
  file.destination_path = destination.string();
  file.status           = FileStatus::kPending;
  file.checksum         = checksum;

  db::ThrowIfDbError(repository_->InsertFile(*tx, file), "insert file");
  tx->Commit();

  DEPLOY_LOG_DEBUG("file registered", {StringField("transaction_id", transaction_id), StringField("file_id", file.id),
                                       StringField("source", file.source_path), StringField("destination", file.destination_path)});
  return file.id;
}

bool TransactionLedger::Validate(const std::string& transaction_id, Validator& validator) {
  std::vector<db::model::FileRecord> files;
  {
    auto tx     = repository_->Begin();
    auto record = Require(*tx, transaction_id);
    if (record.status != TransactionStatus::kInitialized) {
      throw util::InvalidState("cannot validate transaction " + transaction_id + " in state " + Describe(record.status));
    }
    files = repository_->ListFiles(*tx, transaction_id);
    tx->Commit();
  }

  if (files.empty()) {
    throw util::NoFiles("transaction " + transaction_id + " has no files");
  }

  std::vector<ValidationReport> reports;
  reports.reserve(files.size());
  for (const auto& file : files) {
    reports.push_back(validator.Validate(file.source_path));
  }

  const auto timestamp = util::ToIso8601(util::Now());
  bool       all_valid = true;

  // verdicts, diagnostics and the status change land together
  auto tx     = repository_->Begin();
  auto record = Require(*tx, transaction_id);
  if (record.status != TransactionStatus::kInitialized) {
    throw util::InvalidState("transaction " + transaction_id + " changed state during validation");
  }

  for (std::size_t i = 0; i < files.size(); ++i) {
    const auto& file   = files[i];
    const auto& report = reports[i];

    db::ThrowIfDbError(repository_->UpdateFileValidation(*tx, file.id, report.status), "update file validation");
    for (const auto& issue : report.errors) {
      db::ThrowIfDbError(repository_->InsertValidationResult(*tx, ToResultRecord(file.id, issue, ValidationStatus::kFail, timestamp)),
                         "insert validation result");
    }
    for (const auto& issue : report.warnings) {
      db::ThrowIfDbError(repository_->InsertValidationResult(*tx, ToResultRecord(file.id, issue, ValidationStatus::kWarning, timestamp)),
                         "insert validation result");
    }

    if (report.status == ValidationStatus::kFail) {
      all_valid = false;
      DEPLOY_LOG_WARN("file failed validation", {StringField("transaction_id", transaction_id), StringField("file_id", file.id),
                                                 StringField("source", file.source_path),
                                                 IntField("errors", static_cast<int64_t>(report.errors.size()))});
    }
  }

  if (all_valid) {
    db::ThrowIfDbError(repository_->UpdateTransactionStatus(*tx, transaction_id, TransactionStatus::kValidated), "update transaction status");
  }
  tx->Commit();

  DEPLOY_LOG_INFO("transaction validated", {StringField("transaction_id", transaction_id), observability::BoolField("valid", all_valid)});
  return all_valid;
}

void TransactionLedger::SetStatus(const std::string& transaction_id, TransactionStatus to) {
  auto tx     = repository_->Begin();
  auto record = Require(*tx, transaction_id);

  if (!deploy::model::CanTransition(record.status, to)) {
    throw util::InvalidState("transaction " + transaction_id + ": " + Describe(record.status) + " -> " + Describe(to) + " is not allowed");
  }

  db::ThrowIfDbError(repository_->UpdateTransactionStatus(*tx, transaction_id, to), "update transaction status");
  tx->Commit();

  DEPLOY_LOG_INFO("transaction status changed",
                  {StringField("transaction_id", transaction_id), StringField("from", Describe(record.status)), StringField("to", Describe(to))});
}

db::model::OperationRecord TransactionLedger::BeginOperation(const std::string& transaction_id, const std::optional<std::string>& file_id,
                                                             OperationType type, const std::optional<std::string>& source,
                                                             const std::optional<std::string>& destination) {
  db::model::OperationRecord op;
  op.id               = util::NewId();
  op.transaction_id   = transaction_id;
  op.file_id          = file_id;
  op.type             = type;
  op.source_path      = source;
  op.destination_path = destination;
  op.timestamp        = util::ToIso8601(util::Now());
  op.status           = OperationStatus::kInProgress;

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->InsertOperation(*tx, op), "insert operation");
  tx->Commit();
  return op;
}

void TransactionLedger::FinishOperation(const db::model::OperationRecord& op, OperationStatus status,
                                        const std::optional<std::string>& error_message) {
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->CompleteOperation(*tx, op.id, status, error_message), "complete operation");
  tx->Commit();
}

void TransactionLedger::Execute(const std::string& transaction_id, const std::optional<std::string>& backup_id, FileDeployer& deployer,
                                FileRestorer& restorer) {
  std::vector<db::model::FileRecord> files;
  {
    auto tx     = repository_->Begin();
    auto record = Require(*tx, transaction_id);
    if (record.status != TransactionStatus::kValidated) {
      throw util::InvalidState("cannot execute transaction " + transaction_id + " in state " + Describe(record.status));
    }

    db::ThrowIfDbError(repository_->UpdateTransactionStatus(*tx, transaction_id, TransactionStatus::kInProgress), "update transaction status");
    if (backup_id) {
      db::ThrowIfDbError(repository_->SetTransactionBackup(*tx, transaction_id, *backup_id), "attach backup");
    }
    files = repository_->ListFiles(*tx, transaction_id);
    tx->Commit();
  }

  DEPLOY_LOG_INFO("transaction executing", {StringField("transaction_id", transaction_id), StringField("backup_id", backup_id.value_or("")),
                                            IntField("files", static_cast<int64_t>(files.size()))});

  std::vector<db::model::OperationRecord> completed;
  for (const auto& file : files) {
    if (file.validation_status == ValidationStatus::kFail) {
      continue;
    }

    auto op = BeginOperation(transaction_id, file.id, OperationType::kDeploy, file.source_path, file.destination_path);

    // set once the deployer has replaced the destination
    bool written = false;
    try {
      if (!deployer.Deploy(file.source_path, file.destination_path)) {
        throw util::DeploymentIOError("deployment of " + file.source_path + " to " + file.destination_path + " failed");
      }
      written = true;
      // the source may have changed since registration
      if (checksums_ && file.checksum && !checksums_->Verify(file.destination_path, *file.checksum)) {
        throw util::ChecksumMismatch("checksum mismatch: " + file.destination_path + " does not match " + file.source_path +
                                     " as registered");
      }
    } catch (const std::exception& ex) {
      DEPLOY_LOG_ERROR("file deployment failed", {StringField("transaction_id", transaction_id), StringField("file_id", file.id),
                                                  StringField("destination", file.destination_path), StringField("error", ex.what())});

      FinishOperation(op, OperationStatus::kFailed, std::string(ex.what()));
      {
        auto tx = repository_->Begin();
        db::ThrowIfDbError(repository_->UpdateFileStatus(*tx, file.id, FileStatus::kFailed), "update file status");
        tx->Commit();
      }

      // a destination rejected after the copy holds unverified content
      if (written && !RollbackOperations(transaction_id, {op}, restorer)) {
        DEPLOY_LOG_ERROR("failed file could not be restored; manual intervention required",
                         {StringField("transaction_id", transaction_id), StringField("destination", file.destination_path)});
      }

      std::reverse(completed.begin(), completed.end());
      if (!RollbackOperations(transaction_id, completed, restorer)) {
        DEPLOY_LOG_ERROR("automatic rollback incomplete; manual intervention required", {StringField("transaction_id", transaction_id)});
      }

      SetStatus(transaction_id, TransactionStatus::kFailed);
      throw;
    }

    {
      auto tx = repository_->Begin();
      db::ThrowIfDbError(repository_->UpdateFileStatus(*tx, file.id, FileStatus::kDeployed), "update file status");
      db::ThrowIfDbError(repository_->CompleteOperation(*tx, op.id, OperationStatus::kCompleted, std::nullopt), "complete operation");
      tx->Commit();
    }
    op.status = OperationStatus::kCompleted;
    completed.push_back(op);
  }

  SetStatus(transaction_id, TransactionStatus::kCompleted);
}

bool TransactionLedger::RollbackOperations(const std::string& transaction_id, const std::vector<db::model::OperationRecord>& candidates,
                                           FileRestorer& restorer) {
  for (const auto& deploy_op : candidates) {
    const auto destination = deploy_op.destination_path.value_or("");

    auto op = BeginOperation(transaction_id, deploy_op.file_id, OperationType::kRollback, std::nullopt, deploy_op.destination_path);

    std::string error;
    bool        restored = false;
    try {
      restored = restorer.Restore(destination);
      if (!restored) error = "restore of " + destination + " failed";
    } catch (const std::exception& ex) {
      error = ex.what();
    }

    if (!restored) {
      FinishOperation(op, OperationStatus::kFailed, error);
      DEPLOY_LOG_ERROR("file rollback failed",
                       {StringField("transaction_id", transaction_id), StringField("destination", destination), StringField("error", error)});
      return false;
    }

    FinishOperation(op, OperationStatus::kCompleted);
    DEPLOY_LOG_INFO("file rolled back", {StringField("transaction_id", transaction_id), StringField("destination", destination)});
  }
  return true;
}

bool TransactionLedger::Rollback(const std::string& transaction_id, FileRestorer& restorer) {
  std::vector<db::model::OperationRecord> ops;
  {
    auto tx     = repository_->Begin();
    auto record = Require(*tx, transaction_id);
    if (!deploy::model::IsRollbackable(record.status)) {
      throw util::InvalidState("cannot roll back transaction " + transaction_id + " in state " + Describe(record.status));
    }
    ops = repository_->ListOperations(*tx, transaction_id);
    tx->Commit();
  }

  // ops arrive in seq order; walk backwards so a later compensation hides
  // the deploy it undid
  std::vector<db::model::OperationRecord> candidates;
  std::vector<std::string>                compensated;
  for (auto it = ops.rbegin(); it != ops.rend(); ++it) {
    if (it->status != OperationStatus::kCompleted || !it->file_id) continue;

    const auto& file_id = *it->file_id;
    const bool  undone  = std::find(compensated.begin(), compensated.end(), file_id) != compensated.end();

    if (it->type == OperationType::kRollback) {
      if (!undone) compensated.push_back(file_id);
      continue;
    }
    if (undone) {
      // one compensation covers one deploy
      std::erase(compensated, file_id);
      continue;
    }
    candidates.push_back(*it);
  }

  DEPLOY_LOG_INFO("rolling back transaction",
                  {StringField("transaction_id", transaction_id), IntField("candidates", static_cast<int64_t>(candidates.size()))});

  if (!RollbackOperations(transaction_id, candidates, restorer)) {
    return false;
  }

  SetStatus(transaction_id, TransactionStatus::kRolledBack);
  return true;
}

void TransactionLedger::Close(const std::string& transaction_id) {
  auto tx     = repository_->Begin();
  auto record = Require(*tx, transaction_id);
  if (record.status != TransactionStatus::kInProgress) {
    return;
  }

  db::ThrowIfDbError(repository_->UpdateTransactionStatus(*tx, transaction_id, TransactionStatus::kFailed), "update transaction status");
  tx->Commit();

  DEPLOY_LOG_WARN("interrupted transaction closed as failed", {StringField("transaction_id", transaction_id)});
}

TransactionStatus TransactionLedger::GetStatus(const std::string& transaction_id) {
  return GetTransaction(transaction_id).status;
}

db::model::TransactionRecord TransactionLedger::GetTransaction(const std::string& transaction_id) {
  auto tx     = repository_->Begin();
  auto record = Require(*tx, transaction_id);
  tx->Commit();
  return record;
}

std::vector<db::model::FileRecord> TransactionLedger::GetFiles(const std::string& transaction_id) {
  auto tx = repository_->Begin();
  Require(*tx, transaction_id);
  auto files = repository_->ListFiles(*tx, transaction_id);
  tx->Commit();
  return files;
}

std::vector<db::model::OperationRecord> TransactionLedger::GetOperations(const std::string& transaction_id) {
  auto tx = repository_->Begin();
  Require(*tx, transaction_id);
  auto ops = repository_->ListOperations(*tx, transaction_id);
  tx->Commit();
  return ops;
}

std::vector<db::model::ValidationResultRecord> TransactionLedger::GetValidationResults(const std::string& file_id) {
  auto tx      = repository_->Begin();
  auto results = repository_->ListValidationResults(*tx, file_id);
  tx->Commit();
  return results;
}

std::vector<db::model::TransactionRecord> TransactionLedger::ListTransactions(const db::TransactionFilter& filter) {
  auto tx           = repository_->Begin();
  auto transactions = repository_->ListTransactions(*tx, filter);
  tx->Commit();
  return transactions;
}

} // namespace deploy::core
