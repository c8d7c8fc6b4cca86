#pragma once

namespace glucolumin::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Write transactions touching the same visit are serialized; read-only
    ones never block writers and see each visit as last committed

  SQLite: BEGIN IMMEDIATE / BEGIN DEFERRED on one connection
  Memory: per-visit copy-on-write and per-visit writer locks
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;

  virtual bool IsReadOnly() const = 0;
};

}
