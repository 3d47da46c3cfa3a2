#include "sqlite_tx.hpp"

#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace courier::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (state_ != State::kOpen) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    COURIER_LOG_WARN("sqlite rollback on abandoned transaction failed",
                     {observability::StringField("db", db_->Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::RequireOpen(const char* op) const {
  if (state_ != State::kOpen) {
    throw util::InvalidState(std::string("sqlite ") + op + " on a finished transaction");
  }
}

void SqliteTransaction::Commit() {
  RequireOpen("commit");
  db_->Exec("COMMIT;");
  state_ = State::kCommitted;
}

void SqliteTransaction::Rollback() {
  RequireOpen("rollback");
  state_ = State::kRolledBack;
  db_->Exec("ROLLBACK;");
}

} // namespace courier::db::sqlite
