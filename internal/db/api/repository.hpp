#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/backup_record.hpp"
#include "internal/db/model/file_record.hpp"
#include "internal/db/model/operation_record.hpp"
#include "internal/db/model/transaction_record.hpp"
#include "internal/db/model/validation_result_record.hpp"

namespace deploy::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - files and operations are returned in seq order
  - operations are append-only: CompleteOperation only accepts an
    IN_PROGRESS row and answers Conflict otherwise

  The DB is the source of truth for:
    deployment transaction state
    the operation ledger used to decide what to roll back
    backup records
*/

struct TransactionFilter {
  std::optional<std::string> project_path;
  std::optional<std::string> user_id;
  std::size_t                limit = 10;
};

struct BackupFilter {
  std::optional<std::string> project_path;
  std::size_t                limit = 10;
};

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Deployment transactions
  // ---------------------------------------------------------------------

  virtual Result InsertTransaction(Transaction&, const model::TransactionRecord&) = 0;

  virtual std::optional<model::TransactionRecord> GetTransaction(Transaction&, const std::string& id) = 0;

  virtual Result UpdateTransactionStatus(Transaction&, const std::string& id, deploy::model::TransactionStatus status) = 0;

  virtual Result SetTransactionBackup(Transaction&, const std::string& id, const std::string& backup_id) = 0;

  // Newest first.
  virtual std::vector<model::TransactionRecord> ListTransactions(Transaction&, const TransactionFilter& filter) = 0;

  // ---------------------------------------------------------------------
  // Files
  // ---------------------------------------------------------------------

  // Assigns record.seq.
  virtual Result InsertFile(Transaction&, model::FileRecord& record) = 0;

  virtual std::optional<model::FileRecord> GetFile(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::FileRecord> ListFiles(Transaction&, const std::string& transaction_id) = 0;

  virtual Result UpdateFileStatus(Transaction&, const std::string& id, deploy::model::FileStatus status) = 0;

  virtual Result UpdateFileValidation(Transaction&, const std::string& id, deploy::model::ValidationStatus status) = 0;

  virtual Result InsertValidationResult(Transaction&, const model::ValidationResultRecord&) = 0;

  virtual std::vector<model::ValidationResultRecord> ListValidationResults(Transaction&, const std::string& file_id) = 0;

  // ---------------------------------------------------------------------
  // Operation ledger
  // ---------------------------------------------------------------------

  // Assigns record.seq.
  virtual Result InsertOperation(Transaction&, model::OperationRecord& record) = 0;

  virtual Result CompleteOperation(Transaction&, const std::string& id, deploy::model::OperationStatus status,
                                   const std::optional<std::string>& error_message) = 0;

  virtual std::vector<model::OperationRecord> ListOperations(Transaction&, const std::string& transaction_id) = 0;

  // ---------------------------------------------------------------------
  // Backups
  // ---------------------------------------------------------------------

  virtual Result InsertBackup(Transaction&, const model::BackupRecord&) = 0;

  virtual std::optional<model::BackupRecord> GetBackup(Transaction&, const std::string& id) = 0;

  virtual Result MarkBackupVerified(Transaction&, const std::string& id) = 0;

  virtual Result DeleteBackup(Transaction&, const std::string& id) = 0;

  // Newest first.
  virtual std::vector<model::BackupRecord> ListBackups(Transaction&, const BackupFilter& filter) = 0;
};

} // namespace deploy::db
