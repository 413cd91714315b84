#pragma once

#include <sqlite3.h>

#include <string>

namespace deploy::db::sqlite {

/*
  Thin RAII wrapper around the record store's sqlite3*.

  Failures to open, configure or run a statement raise util::StoreError.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // schema, pragmas and transaction control
  void Exec(const std::string& sql);

 private:
  // durability and integrity settings for the ledger
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace deploy::db::sqlite
