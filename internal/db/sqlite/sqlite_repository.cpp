#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace deploy::db::sqlite {

using deploy::db::ErrorCode;
using deploy::db::Result;

namespace dm = deploy::model;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindText(sqlite3_stmt* st, int idx, std::string_view s) {
    sqlite3_bind_text(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) {
        BindText(st, idx, *s);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColText(st, col);
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

// Reads have no Result channel; a broken statement is a store failure.
static sqlite3_stmt* PrepareRead(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw util::StoreError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return st;
}

static void CheckReadDone(sqlite3* db, sqlite3_stmt* st, int rc) {
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        std::string msg = sqlite3_errmsg(db);
        sqlite3_finalize(st);
        throw util::StoreError("sqlite step: " + msg);
    }
}

static model::TransactionRecord ReadTransaction(sqlite3_stmt* st) {
    model::TransactionRecord r;
    r.id           = ColText(st, 0);
    r.timestamp    = ColText(st, 1);
    r.user_id      = ColText(st, 2);
    r.status       = dm::ParseTransactionStatus(ColText(st, 3));
    r.backup_id    = ColOptText(st, 4);
    r.project_path = ColText(st, 5);
    r.description  = ColOptText(st, 6);
    return r;
}

static model::FileRecord ReadFile(sqlite3_stmt* st) {
    model::FileRecord r;
    r.id               = ColText(st, 0);
    r.transaction_id   = ColText(st, 1);
    r.original_name    = ColText(st, 2);
    r.source_path      = ColText(st, 3);
    r.destination_path = ColText(st, 4);
    r.status           = dm::ParseFileStatus(ColText(st, 5));
    if (auto v = ColOptText(st, 6)) r.validation_status = dm::ParseValidationStatus(*v);
    r.checksum = ColOptText(st, 7);
    r.seq      = ColU64(st, 8);
    return r;
}

static model::OperationRecord ReadOperation(sqlite3_stmt* st) {
    model::OperationRecord r;
    r.id               = ColText(st, 0);
    r.transaction_id   = ColText(st, 1);
    r.file_id          = ColOptText(st, 2);
    r.type             = dm::ParseOperationType(ColText(st, 3));
    r.source_path      = ColOptText(st, 4);
    r.destination_path = ColOptText(st, 5);
    r.timestamp        = ColText(st, 6);
    r.status           = dm::ParseOperationStatus(ColText(st, 7));
    r.error_message    = ColOptText(st, 8);
    r.seq              = ColU64(st, 9);
    return r;
}

static model::BackupRecord ReadBackup(sqlite3_stmt* st) {
    model::BackupRecord r;
    r.id           = ColText(st, 0);
    r.timestamp    = ColText(st, 1);
    r.project_path = ColText(st, 2);
    r.backup_path  = ColText(st, 3);
    r.type         = dm::ParseBackupType(ColText(st, 4));
    r.size_bytes   = ColU64(st, 5);
    r.file_count   = ColU64(st, 6);
    r.user_id      = ColText(st, 7);
    r.verified     = sqlite3_column_int(st, 8) != 0;
    r.checksum     = ColText(st, 9);
    return r;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// Runs a single-row UPDATE/DELETE keyed by id; zero changed rows is NotFound.
static Result StepKeyed(sqlite3* db, sqlite3_stmt* st, Result (*translate)(sqlite3*, int)) {
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) return translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

static uint64_t NextSeq(sqlite3* db, const char* sql, const std::string& transaction_id) {
    sqlite3_stmt* st = PrepareRead(db, sql);
    BindText(st, 1, transaction_id);
    int rc = sqlite3_step(st);
    CheckReadDone(db, st, rc);
    uint64_t seq = rc == SQLITE_ROW ? ColU64(st, 0) : 1;
    sqlite3_finalize(st);
    return seq;
}

// ------------------------------------------------------------------
// Deployment transactions
// ------------------------------------------------------------------

Result SqliteRepository::InsertTransaction(Transaction& t, const model::TransactionRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_TRANSACTION, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindText(st, 2, r.timestamp);
    BindText(st, 3, r.user_id);
    BindText(st, 4, dm::ToString(r.status));
    BindOptText(st, 5, r.backup_id);
    BindText(st, 6, r.project_path);
    BindOptText(st, 7, r.description);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<model::TransactionRecord>
SqliteRepository::GetTransaction(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareRead(db, sql::SELECT_TRANSACTION);
    BindText(st, 1, id);

    int rc = sqlite3_step(st);
    CheckReadDone(db, st, rc);

    std::optional<model::TransactionRecord> out;
    if (rc == SQLITE_ROW) out = ReadTransaction(st);

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::UpdateTransactionStatus(Transaction& t, const std::string& id, dm::TransactionStatus status) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPDATE_TRANSACTION_STATUS, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, dm::ToString(status));
    BindText(st, 2, id);

    return StepKeyed(db, st, &SqliteRepository::Translate);
}

Result SqliteRepository::SetTransactionBackup(Transaction& t, const std::string& id, const std::string& backup_id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPDATE_TRANSACTION_BACKUP, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, backup_id);
    BindText(st, 2, id);

    return StepKeyed(db, st, &SqliteRepository::Translate);
}

std::vector<model::TransactionRecord>
SqliteRepository::ListTransactions(Transaction& t, const TransactionFilter& filter) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareRead(db, sql::LIST_TRANSACTIONS);
    BindOptText(st, 1, filter.project_path);
    BindOptText(st, 2, filter.user_id);
    BindU64(st, 3, filter.limit);

    std::vector<model::TransactionRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadTransaction(st));
    }
    CheckReadDone(db, st, rc);

    sqlite3_finalize(st);
    return out;
}

// ------------------------------------------------------------------
// Files
// ------------------------------------------------------------------

Result SqliteRepository::InsertFile(Transaction& t, model::FileRecord& r) {
    auto* db = TX(t).Handle();

    const uint64_t seq = NextSeq(db, sql::NEXT_FILE_SEQ, r.transaction_id);

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_FILE, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindText(st, 2, r.transaction_id);
    BindText(st, 3, r.original_name);
    BindText(st, 4, r.source_path);
    BindText(st, 5, r.destination_path);
    BindText(st, 6, dm::ToString(r.status));
    if (r.validation_status) {
        BindText(st, 7, dm::ToString(*r.validation_status));
    } else {
        sqlite3_bind_null(st, 7);
    }
    BindOptText(st, 8, r.checksum);
    BindU64(st, 9, seq);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    Result res = Translate(db, rc);
    if (res) r.seq = seq;
    return res;
}

std::optional<model::FileRecord> SqliteRepository::GetFile(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareRead(db, sql::SELECT_FILE);
    BindText(st, 1, id);

    int rc = sqlite3_step(st);
    CheckReadDone(db, st, rc);

    std::optional<model::FileRecord> out;
    if (rc == SQLITE_ROW) out = ReadFile(st);

    sqlite3_finalize(st);
    return out;
}

std::vector<model::FileRecord> SqliteRepository::ListFiles(Transaction& t, const std::string& transaction_id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareRead(db, sql::LIST_FILES);
    BindText(st, 1, transaction_id);

    std::vector<model::FileRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadFile(st));
    }
    CheckReadDone(db, st, rc);

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::UpdateFileStatus(Transaction& t, const std::string& id, dm::FileStatus status) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPDATE_FILE_STATUS, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, dm::ToString(status));
    BindText(st, 2, id);

    return StepKeyed(db, st, &SqliteRepository::Translate);
}

Result SqliteRepository::UpdateFileValidation(Transaction& t, const std::string& id, dm::ValidationStatus status) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPDATE_FILE_VALIDATION, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, dm::ToString(status));
    BindText(st, 2, id);

    return StepKeyed(db, st, &SqliteRepository::Translate);
}

Result SqliteRepository::InsertValidationResult(Transaction& t, const model::ValidationResultRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_VALIDATION_RESULT, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.file_id);
    BindText(st, 2, r.rule);
    BindText(st, 3, dm::ToString(r.status));
    sqlite3_bind_int64(st, 4, static_cast<sqlite3_int64>(r.line_number));
    BindText(st, 5, r.message);
    BindText(st, 6, r.timestamp);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::vector<model::ValidationResultRecord>
SqliteRepository::ListValidationResults(Transaction& t, const std::string& file_id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareRead(db, sql::LIST_VALIDATION_RESULTS);
    BindText(st, 1, file_id);

    std::vector<model::ValidationResultRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        model::ValidationResultRecord r;
        r.file_id     = ColText(st, 0);
        r.rule        = ColText(st, 1);
        r.status      = dm::ParseValidationStatus(ColText(st, 2));
        r.line_number = sqlite3_column_int64(st, 3);
        r.message     = ColText(st, 4);
        r.timestamp   = ColText(st, 5);
        out.push_back(std::move(r));
    }
    CheckReadDone(db, st, rc);

    sqlite3_finalize(st);
    return out;
}

// ------------------------------------------------------------------
// Operation ledger
// ------------------------------------------------------------------

Result SqliteRepository::InsertOperation(Transaction& t, model::OperationRecord& r) {
    auto* db = TX(t).Handle();

    const uint64_t seq = NextSeq(db, sql::NEXT_OPERATION_SEQ, r.transaction_id);

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_OPERATION, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindText(st, 2, r.transaction_id);
    BindOptText(st, 3, r.file_id);
    BindText(st, 4, dm::ToString(r.type));
    BindOptText(st, 5, r.source_path);
    BindOptText(st, 6, r.destination_path);
    BindText(st, 7, r.timestamp);
    BindText(st, 8, dm::ToString(r.status));
    BindOptText(st, 9, r.error_message);
    BindU64(st, 10, seq);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    Result res = Translate(db, rc);
    if (res) r.seq = seq;
    return res;
}

Result SqliteRepository::CompleteOperation(Transaction& t, const std::string& id, dm::OperationStatus status,
                                           const std::optional<std::string>& error_message) {
    auto* db = TX(t).Handle();

    if (status == dm::OperationStatus::kInProgress)
        return Result::Err(ErrorCode::Conflict, "operation can only complete or fail");

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::COMPLETE_OPERATION, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, dm::ToString(status));
    BindOptText(st, 2, error_message);
    BindText(st, 3, id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) > 0) return Result::Ok();

    // distinguish a missing row from one that is already terminal
    sqlite3_stmt* ex = PrepareRead(db, sql::OPERATION_EXISTS);
    BindText(ex, 1, id);
    rc = sqlite3_step(ex);
    CheckReadDone(db, ex, rc);
    sqlite3_finalize(ex);

    if (rc == SQLITE_ROW) return Result::Err(ErrorCode::Conflict, "operation " + id + " is not in progress");
    return Result::Err(ErrorCode::NotFound, "operation " + id);
}

std::vector<model::OperationRecord>
SqliteRepository::ListOperations(Transaction& t, const std::string& transaction_id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareRead(db, sql::LIST_OPERATIONS);
    BindText(st, 1, transaction_id);

    std::vector<model::OperationRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadOperation(st));
    }
    CheckReadDone(db, st, rc);

    sqlite3_finalize(st);
    return out;
}

// ------------------------------------------------------------------
// Backups
// ------------------------------------------------------------------

Result SqliteRepository::InsertBackup(Transaction& t, const model::BackupRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_BACKUP, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindText(st, 2, r.timestamp);
    BindText(st, 3, r.project_path);
    BindText(st, 4, r.backup_path);
    BindText(st, 5, dm::ToString(r.type));
    BindU64(st, 6, r.size_bytes);
    BindU64(st, 7, r.file_count);
    BindText(st, 8, r.user_id);
    sqlite3_bind_int(st, 9, r.verified ? 1 : 0);
    BindText(st, 10, r.checksum);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<model::BackupRecord> SqliteRepository::GetBackup(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareRead(db, sql::SELECT_BACKUP);
    BindText(st, 1, id);

    int rc = sqlite3_step(st);
    CheckReadDone(db, st, rc);

    std::optional<model::BackupRecord> out;
    if (rc == SQLITE_ROW) out = ReadBackup(st);

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::MarkBackupVerified(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::MARK_BACKUP_VERIFIED, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, id);

    return StepKeyed(db, st, &SqliteRepository::Translate);
}

Result SqliteRepository::DeleteBackup(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_BACKUP, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, id);

    return StepKeyed(db, st, &SqliteRepository::Translate);
}

std::vector<model::BackupRecord> SqliteRepository::ListBackups(Transaction& t, const BackupFilter& filter) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareRead(db, sql::LIST_BACKUPS);
    BindOptText(st, 1, filter.project_path);
    BindU64(st, 2, filter.limit);

    std::vector<model::BackupRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadBackup(st));
    }
    CheckReadDone(db, st, rc);

    sqlite3_finalize(st);
    return out;
}

} // namespace deploy::db::sqlite
