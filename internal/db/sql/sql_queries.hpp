#pragma once

namespace deploy::db::sql {

/*
  Canonical SQL used by the sqlite backend.

  Enum columns are stored as their canonical upper-case names so the
  ledger stays readable with any SQL shell.
*/

// schema (idempotent)

static constexpr const char* SCHEMA[] = {
    "CREATE TABLE IF NOT EXISTS transactions ("
    " id TEXT PRIMARY KEY,"
    " timestamp TEXT NOT NULL,"
    " user_id TEXT NOT NULL,"
    " status TEXT NOT NULL,"
    " backup_id TEXT,"
    " project_path TEXT NOT NULL,"
    " description TEXT);",

    "CREATE TABLE IF NOT EXISTS files ("
    " id TEXT PRIMARY KEY,"
    " transaction_id TEXT NOT NULL REFERENCES transactions(id),"
    " original_name TEXT NOT NULL,"
    " source_path TEXT NOT NULL,"
    " destination_path TEXT NOT NULL,"
    " status TEXT NOT NULL,"
    " validation_status TEXT,"
    " checksum TEXT,"
    " seq INTEGER NOT NULL,"
    " UNIQUE(transaction_id, seq));",

    "CREATE TABLE IF NOT EXISTS operations ("
    " id TEXT PRIMARY KEY,"
    " transaction_id TEXT NOT NULL REFERENCES transactions(id),"
    " file_id TEXT REFERENCES files(id),"
    " operation_type TEXT NOT NULL,"
    " source_path TEXT,"
    " destination_path TEXT,"
    " timestamp TEXT NOT NULL,"
    " status TEXT NOT NULL,"
    " error_message TEXT,"
    " seq INTEGER NOT NULL,"
    " UNIQUE(transaction_id, seq));",

    "CREATE TABLE IF NOT EXISTS backups ("
    " id TEXT PRIMARY KEY,"
    " timestamp TEXT NOT NULL,"
    " project_path TEXT NOT NULL,"
    " backup_path TEXT NOT NULL,"
    " backup_type TEXT NOT NULL,"
    " size INTEGER NOT NULL,"
    " file_count INTEGER NOT NULL,"
    " user_id TEXT NOT NULL,"
    " verified INTEGER NOT NULL DEFAULT 0,"
    " checksum TEXT);",

    "CREATE TABLE IF NOT EXISTS validation_results ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " file_id TEXT NOT NULL REFERENCES files(id),"
    " rule TEXT,"
    " status TEXT NOT NULL,"
    " line_number INTEGER,"
    " message TEXT,"
    " timestamp TEXT NOT NULL);",

    "CREATE INDEX IF NOT EXISTS idx_files_transaction ON files(transaction_id, seq);",
    "CREATE INDEX IF NOT EXISTS idx_operations_transaction ON operations(transaction_id, seq);",
};

// transactions

static constexpr const char* INSERT_TRANSACTION =
    "INSERT INTO transactions(id,timestamp,user_id,status,backup_id,project_path,description)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* SELECT_TRANSACTION =
    "SELECT id,timestamp,user_id,status,backup_id,project_path,description"
    " FROM transactions WHERE id=?;";

static constexpr const char* UPDATE_TRANSACTION_STATUS =
    "UPDATE transactions SET status=? WHERE id=?;";

static constexpr const char* UPDATE_TRANSACTION_BACKUP =
    "UPDATE transactions SET backup_id=? WHERE id=?;";

// filters are bound as (?1 IS NULL OR col=?1) so one statement serves all
static constexpr const char* LIST_TRANSACTIONS =
    "SELECT id,timestamp,user_id,status,backup_id,project_path,description"
    " FROM transactions"
    " WHERE (?1 IS NULL OR project_path=?1) AND (?2 IS NULL OR user_id=?2)"
    " ORDER BY timestamp DESC, rowid DESC LIMIT ?3;";

// files

static constexpr const char* NEXT_FILE_SEQ =
    "SELECT COALESCE(MAX(seq),0)+1 FROM files WHERE transaction_id=?;";

static constexpr const char* INSERT_FILE =
    "INSERT INTO files(id,transaction_id,original_name,source_path,destination_path,status,validation_status,checksum,seq)"
    " VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_FILE =
    "SELECT id,transaction_id,original_name,source_path,destination_path,status,validation_status,checksum,seq"
    " FROM files WHERE id=?;";

static constexpr const char* LIST_FILES =
    "SELECT id,transaction_id,original_name,source_path,destination_path,status,validation_status,checksum,seq"
    " FROM files WHERE transaction_id=? ORDER BY seq;";

static constexpr const char* UPDATE_FILE_STATUS =
    "UPDATE files SET status=? WHERE id=?;";

static constexpr const char* UPDATE_FILE_VALIDATION =
    "UPDATE files SET validation_status=? WHERE id=?;";

static constexpr const char* INSERT_VALIDATION_RESULT =
    "INSERT INTO validation_results(file_id,rule,status,line_number,message,timestamp)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* LIST_VALIDATION_RESULTS =
    "SELECT file_id,rule,status,line_number,message,timestamp"
    " FROM validation_results WHERE file_id=? ORDER BY id;";

// operations

static constexpr const char* NEXT_OPERATION_SEQ =
    "SELECT COALESCE(MAX(seq),0)+1 FROM operations WHERE transaction_id=?;";

static constexpr const char* INSERT_OPERATION =
    "INSERT INTO operations(id,transaction_id,file_id,operation_type,source_path,destination_path,timestamp,status,error_message,seq)"
    " VALUES(?,?,?,?,?,?,?,?,?,?);";

// only an IN_PROGRESS row may become terminal
static constexpr const char* COMPLETE_OPERATION =
    "UPDATE operations SET status=?,error_message=? WHERE id=? AND status='IN_PROGRESS';";

static constexpr const char* OPERATION_EXISTS =
    "SELECT 1 FROM operations WHERE id=?;";

static constexpr const char* LIST_OPERATIONS =
    "SELECT id,transaction_id,file_id,operation_type,source_path,destination_path,timestamp,status,error_message,seq"
    " FROM operations WHERE transaction_id=? ORDER BY seq;";

// backups

static constexpr const char* INSERT_BACKUP =
    "INSERT INTO backups(id,timestamp,project_path,backup_path,backup_type,size,file_count,user_id,verified,checksum)"
    " VALUES(?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_BACKUP =
    "SELECT id,timestamp,project_path,backup_path,backup_type,size,file_count,user_id,verified,checksum"
    " FROM backups WHERE id=?;";

static constexpr const char* MARK_BACKUP_VERIFIED =
    "UPDATE backups SET verified=1 WHERE id=?;";

static constexpr const char* DELETE_BACKUP =
    "DELETE FROM backups WHERE id=?;";

static constexpr const char* LIST_BACKUPS =
    "SELECT id,timestamp,project_path,backup_path,backup_type,size,file_count,user_id,verified,checksum"
    " FROM backups WHERE (?1 IS NULL OR project_path=?1)"
    " ORDER BY timestamp DESC, rowid DESC LIMIT ?2;";

}
