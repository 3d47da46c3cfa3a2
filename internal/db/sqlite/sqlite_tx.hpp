#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace courier::db::sqlite {

/*
  BEGIN IMMEDIATE on construction: the write lock is taken up front, so two
  concurrent Puts queue on busy_timeout instead of failing at COMMIT.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return state_ == State::kCommitted; }

private:
  enum class State { kOpen, kCommitted, kRolledBack };

  void RequireOpen(const char* op) const;

  std::shared_ptr<SqliteDB> db_;
  State                     state_ = State::kOpen;
};

} // namespace courier::db::sqlite
