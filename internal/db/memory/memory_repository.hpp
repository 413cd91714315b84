#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace deploy::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertTransaction(Transaction&, const model::TransactionRecord&) override;
  std::optional<model::TransactionRecord> GetTransaction(Transaction&, const std::string&) override;
  Result UpdateTransactionStatus(Transaction&, const std::string&, deploy::model::TransactionStatus) override;
  Result SetTransactionBackup(Transaction&, const std::string&, const std::string&) override;
  std::vector<model::TransactionRecord> ListTransactions(Transaction&, const TransactionFilter&) override;

  Result InsertFile(Transaction&, model::FileRecord&) override;
  std::optional<model::FileRecord> GetFile(Transaction&, const std::string&) override;
  std::vector<model::FileRecord> ListFiles(Transaction&, const std::string&) override;
  Result UpdateFileStatus(Transaction&, const std::string&, deploy::model::FileStatus) override;
  Result UpdateFileValidation(Transaction&, const std::string&, deploy::model::ValidationStatus) override;
  Result InsertValidationResult(Transaction&, const model::ValidationResultRecord&) override;
  std::vector<model::ValidationResultRecord> ListValidationResults(Transaction&, const std::string&) override;

  Result InsertOperation(Transaction&, model::OperationRecord&) override;
  Result CompleteOperation(Transaction&, const std::string&, deploy::model::OperationStatus,
                           const std::optional<std::string>&) override;
  std::vector<model::OperationRecord> ListOperations(Transaction&, const std::string&) override;

  Result InsertBackup(Transaction&, const model::BackupRecord&) override;
  std::optional<model::BackupRecord> GetBackup(Transaction&, const std::string&) override;
  Result MarkBackupVerified(Transaction&, const std::string&) override;
  Result DeleteBackup(Transaction&, const std::string&) override;
  std::vector<model::BackupRecord> ListBackups(Transaction&, const BackupFilter&) override;

private:
  friend class MemoryTransaction;

  // All collections keep insertion order.
  struct State {
    std::vector<model::TransactionRecord>      transactions;
    std::vector<model::FileRecord>             files;
    std::vector<model::ValidationResultRecord> validation_results;
    std::vector<model::OperationRecord>        operations;
    std::vector<model::BackupRecord>           backups;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
