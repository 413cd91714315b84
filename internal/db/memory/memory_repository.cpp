#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace deploy::db::memory {

using deploy::model::OperationStatus;

namespace {

template <typename Record>
Record* FindById(std::vector<Record>& rows, const std::string& id) {
  auto it = std::find_if(rows.begin(), rows.end(), [&](const Record& r) { return r.id == id; });
  return it == rows.end() ? nullptr : &*it;
}

template <typename Record>
uint64_t NextSeq(const std::vector<Record>& rows, const std::string& transaction_id) {
  uint64_t max_seq = 0;
  for (const auto& r : rows) {
    if (r.transaction_id == transaction_id) max_seq = std::max(max_seq, r.seq);
  }
  return max_seq + 1;
}

// Newest first: timestamp descending, later insertion wins ties.
template <typename Record>
std::vector<Record> NewestFirst(std::vector<Record> rows) {
  std::reverse(rows.begin(), rows.end());
  std::stable_sort(rows.begin(), rows.end(), [](const Record& a, const Record& b) { return a.timestamp > b.timestamp; });
  return rows;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Deployment transactions
// ------------------------------------------------------------------

Result MemoryRepository::InsertTransaction(Transaction& t, const model::TransactionRecord& r) {
  auto& s = TX(t).Mutable();
  if (FindById(s.transactions, r.id)) return Result::Err(ErrorCode::AlreadyExists, "transaction " + r.id);
  s.transactions.push_back(r);
  return Result::Ok();
}

std::optional<model::TransactionRecord> MemoryRepository::GetTransaction(Transaction& t, const std::string& id) {
  auto* r = FindById(TX(t).Mutable().transactions, id);
  if (!r) return std::nullopt;
  return *r;
}

Result MemoryRepository::UpdateTransactionStatus(Transaction& t, const std::string& id, deploy::model::TransactionStatus status) {
  auto* r = FindById(TX(t).Mutable().transactions, id);
  if (!r) return Result::Err(ErrorCode::NotFound, "transaction " + id);
  r->status = status;
  return Result::Ok();
}

Result MemoryRepository::SetTransactionBackup(Transaction& t, const std::string& id, const std::string& backup_id) {
  auto* r = FindById(TX(t).Mutable().transactions, id);
  if (!r) return Result::Err(ErrorCode::NotFound, "transaction " + id);
  r->backup_id = backup_id;
  return Result::Ok();
}

std::vector<model::TransactionRecord> MemoryRepository::ListTransactions(Transaction& t, const TransactionFilter& filter) {
  std::vector<model::TransactionRecord> out;
  for (const auto& r : TX(t).View().transactions) {
    if (filter.project_path && r.project_path != *filter.project_path) continue;
    if (filter.user_id && r.user_id != *filter.user_id) continue;
    out.push_back(r);
  }
  out = NewestFirst(std::move(out));
  if (out.size() > filter.limit) out.resize(filter.limit);
  return out;
}

// ------------------------------------------------------------------
// Files
// ------------------------------------------------------------------

Result MemoryRepository::InsertFile(Transaction& t, model::FileRecord& r) {
  auto& s = TX(t).Mutable();
  if (!FindById(s.transactions, r.transaction_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown transaction " + r.transaction_id);
  }
  if (FindById(s.files, r.id)) return Result::Err(ErrorCode::AlreadyExists, "file " + r.id);
  r.seq = NextSeq(s.files, r.transaction_id);
  s.files.push_back(r);
  return Result::Ok();
}

std::optional<model::FileRecord> MemoryRepository::GetFile(Transaction& t, const std::string& id) {
  auto* r = FindById(TX(t).Mutable().files, id);
  if (!r) return std::nullopt;
  return *r;
}

std::vector<model::FileRecord> MemoryRepository::ListFiles(Transaction& t, const std::string& transaction_id) {
  std::vector<model::FileRecord> out;
  for (const auto& r : TX(t).View().files)
    if (r.transaction_id == transaction_id) out.push_back(r);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.seq < b.seq; });
  return out;
}

Result MemoryRepository::UpdateFileStatus(Transaction& t, const std::string& id, deploy::model::FileStatus status) {
  auto* r = FindById(TX(t).Mutable().files, id);
  if (!r) return Result::Err(ErrorCode::NotFound, "file " + id);
  r->status = status;
  return Result::Ok();
}

Result MemoryRepository::UpdateFileValidation(Transaction& t, const std::string& id, deploy::model::ValidationStatus status) {
  auto* r = FindById(TX(t).Mutable().files, id);
  if (!r) return Result::Err(ErrorCode::NotFound, "file " + id);
  r->validation_status = status;
  return Result::Ok();
}

Result MemoryRepository::InsertValidationResult(Transaction& t, const model::ValidationResultRecord& r) {
  auto& s = TX(t).Mutable();
  if (!FindById(s.files, r.file_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown file " + r.file_id);
  s.validation_results.push_back(r);
  return Result::Ok();
}

std::vector<model::ValidationResultRecord> MemoryRepository::ListValidationResults(Transaction& t, const std::string& file_id) {
  std::vector<model::ValidationResultRecord> out;
  for (const auto& r : TX(t).View().validation_results)
    if (r.file_id == file_id) out.push_back(r);
  return out;
}

// ------------------------------------------------------------------
// Operation ledger
// ------------------------------------------------------------------

Result MemoryRepository::InsertOperation(Transaction& t, model::OperationRecord& r) {
  auto& s = TX(t).Mutable();
  if (!FindById(s.transactions, r.transaction_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown transaction " + r.transaction_id);
  }
  if (FindById(s.operations, r.id)) return Result::Err(ErrorCode::AlreadyExists, "operation " + r.id);
  r.seq = NextSeq(s.operations, r.transaction_id);
  s.operations.push_back(r);
  return Result::Ok();
}

Result MemoryRepository::CompleteOperation(Transaction& t, const std::string& id, OperationStatus status,
                                           const std::optional<std::string>& error_message) {
  if (status == OperationStatus::kInProgress) {
    return Result::Err(ErrorCode::Conflict, "operation can only complete or fail");
  }
  auto* r = FindById(TX(t).Mutable().operations, id);
  if (!r) return Result::Err(ErrorCode::NotFound, "operation " + id);
  if (r->status != OperationStatus::kInProgress) {
    return Result::Err(ErrorCode::Conflict, "operation " + id + " is already terminal");
  }
  r->status        = status;
  r->error_message = error_message;
  return Result::Ok();
}

std::vector<model::OperationRecord> MemoryRepository::ListOperations(Transaction& t, const std::string& transaction_id) {
  std::vector<model::OperationRecord> out;
  for (const auto& r : TX(t).View().operations)
    if (r.transaction_id == transaction_id) out.push_back(r);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.seq < b.seq; });
  return out;
}

// ------------------------------------------------------------------
// Backups
// ------------------------------------------------------------------

Result MemoryRepository::InsertBackup(Transaction& t, const model::BackupRecord& r) {
  auto& s = TX(t).Mutable();
  if (FindById(s.backups, r.id)) return Result::Err(ErrorCode::AlreadyExists, "backup " + r.id);
  s.backups.push_back(r);
  return Result::Ok();
}

std::optional<model::BackupRecord> MemoryRepository::GetBackup(Transaction& t, const std::string& id) {
  auto* r = FindById(TX(t).Mutable().backups, id);
  if (!r) return std::nullopt;
  return *r;
}

Result MemoryRepository::MarkBackupVerified(Transaction& t, const std::string& id) {
  auto* r = FindById(TX(t).Mutable().backups, id);
  if (!r) return Result::Err(ErrorCode::NotFound, "backup " + id);
  r->verified = true;
  return Result::Ok();
}

Result MemoryRepository::DeleteBackup(Transaction& t, const std::string& id) {
  auto& rows = TX(t).Mutable().backups;
  if (std::erase_if(rows, [&](const model::BackupRecord& r) { return r.id == id; }) == 0) {
    return Result::Err(ErrorCode::NotFound, "backup " + id);
  }
  return Result::Ok();
}

std::vector<model::BackupRecord> MemoryRepository::ListBackups(Transaction& t, const BackupFilter& filter) {
  std::vector<model::BackupRecord> out;
  for (const auto& r : TX(t).View().backups) {
    if (filter.project_path && r.project_path != *filter.project_path) continue;
    out.push_back(r);
  }
  out = NewestFirst(std::move(out));
  if (out.size() > filter.limit) out.resize(filter.limit);
  return out;
}

} // namespace deploy::db::memory
