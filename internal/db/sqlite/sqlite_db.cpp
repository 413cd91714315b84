#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace deploy::db::sqlite {

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StoreError("open record store " + path_ + ": " + msg);
  }

  try {
    Configure();
  } catch (const util::StoreError&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw util::StoreError(path_ + ": " + msg);
  }
}

void SqliteDB::Configure() {
  // Translate tells duplicate keys from other constraint failures
  if (sqlite3_extended_result_codes(db_, 1) != SQLITE_OK) {
    throw util::StoreError(path_ + ": extended_result_codes: " + sqlite3_errmsg(db_));
  }

  // the ledger is a crash trail: every committed unit must survive
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=FULL;");

  // files and operations reference their transaction
  Exec("PRAGMA foreign_keys=ON;");

  // a second process waits for BEGIN IMMEDIATE instead of failing
  if (sqlite3_busy_timeout(db_, 5000) != SQLITE_OK) {
    throw util::StoreError(path_ + ": busy_timeout: " + sqlite3_errmsg(db_));
  }

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace deploy::db::sqlite
