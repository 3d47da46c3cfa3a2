#pragma once

namespace courier::db {

/*
  Unit of work against a bundle repository.

  A store Put (admission, eviction of lower ranked bundles, the queue rows
  that go with them) runs inside one transaction, so a crash or a refused
  insert never leaves a half-evicted store behind.

  Every backend guarantees:
    - nothing is visible to other transactions before Commit()
    - a transaction destroyed without Commit() rolls back
    - Commit() or Rollback() ends the transaction; further use throws
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace courier::db
