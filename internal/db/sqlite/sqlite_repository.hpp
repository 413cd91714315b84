#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace deploy::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
