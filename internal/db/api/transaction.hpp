#pragma once

namespace deploy::db {

/*
  Abstract store transaction (not to be confused with a deployment
  transaction, which is a row in the `transactions` table).

  Each ledger step (register a file, open an operation, record its
  outcome) is one store transaction, so a crash leaves the ledger at a
  step boundary.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  SQLite: BEGIN IMMEDIATE
  Memory: snapshot copy-on-write
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // Throws util::StoreError; the transaction is then still uncommitted.
  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

}
