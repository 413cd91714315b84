#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/ports.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/state_machine.hpp"

namespace deploy::checksum {
class ChecksumService;
}

namespace deploy::core {

/*
  Owns deployment transactions, their files and the operation ledger.

  Every mutation goes through here and runs in its own store transaction,
  so an interrupted deployment leaves a consistent, inspectable trail:

    - a DEPLOY / ROLLBACK operation is committed IN_PROGRESS before its I/O
    - its outcome is committed once the I/O returns

  Rollback candidates are COMPLETED DEPLOY operations without a later
  COMPLETED ROLLBACK for the same file. Compensation is appended as new
  ROLLBACK operations; DEPLOY rows are never rewritten.
*/
class TransactionLedger {
 public:
  // With checksums, Execute also requires every deployed destination to
  // match the checksum recorded when its file was registered.
  explicit TransactionLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<checksum::ChecksumService> checksums = nullptr);

  std::string CreateTransaction(const std::string& user_id, const std::string& project_path,
                                const std::optional<std::string>& description = std::nullopt);

  // Only while INITIALIZED or VALIDATED. Registering after VALIDATED keeps
  // the status; the late file is deployed without a verdict.
  std::string AddFile(const std::string& transaction_id, const std::filesystem::path& source, const std::filesystem::path& destination,
                      const std::optional<std::string>& checksum = std::nullopt);

  // Returns true (and moves to VALIDATED) iff no file FAILs.
  // Throws util::NoFiles if nothing is registered.
  bool Validate(const std::string& transaction_id, Validator& validator);

  // VALIDATED -> IN_PROGRESS -> COMPLETED, or FAILED after rolling back
  // this call's completed files; the deploy error is rethrown.
  void Execute(const std::string& transaction_id, const std::optional<std::string>& backup_id, FileDeployer& deployer,
               FileRestorer& restorer);

  // COMPLETED | FAILED -> ROLLED_BACK. Returns false, status unchanged, at
  // the first file that cannot be restored.
  bool Rollback(const std::string& transaction_id, FileRestorer& restorer);

  // Marks an interrupted (IN_PROGRESS) transaction FAILED; otherwise no-op.
  void Close(const std::string& transaction_id);

  deploy::model::TransactionStatus GetStatus(const std::string& transaction_id);

  db::model::TransactionRecord                   GetTransaction(const std::string& transaction_id);
  std::vector<db::model::FileRecord>             GetFiles(const std::string& transaction_id);
  std::vector<db::model::OperationRecord>        GetOperations(const std::string& transaction_id);
  std::vector<db::model::ValidationResultRecord> GetValidationResults(const std::string& file_id);
  std::vector<db::model::TransactionRecord>      ListTransactions(const db::TransactionFilter& filter);

 private:
  db::model::TransactionRecord Require(db::Transaction& tx, const std::string& transaction_id);

  void SetStatus(const std::string& transaction_id, deploy::model::TransactionStatus to);

  // commits an IN_PROGRESS ledger row
  db::model::OperationRecord BeginOperation(const std::string& transaction_id, const std::optional<std::string>& file_id,
                                            deploy::model::OperationType type, const std::optional<std::string>& source,
                                            const std::optional<std::string>& destination);

  void FinishOperation(const db::model::OperationRecord& op, deploy::model::OperationStatus status,
                       const std::optional<std::string>& error_message = std::nullopt);

  // candidates newest first
  bool RollbackOperations(const std::string& transaction_id, const std::vector<db::model::OperationRecord>& candidates, FileRestorer& restorer);

  std::shared_ptr<db::Repository>            repository_;
  std::shared_ptr<checksum::ChecksumService> checksums_;
};

} // namespace deploy::core
