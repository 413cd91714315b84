#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace deploy::db::sqlite {

/*
  Store transaction over one connection.

  BEGIN IMMEDIATE takes the write lock up front, so two ledger writers
  serialize at Begin() rather than failing at COMMIT. A failed COMMIT
  leaves the transaction open; the destructor rolls it back.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  bool committed_ = false;
  bool finished_  = false;
};

}
