#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace courier::db::sqlite {
namespace {

constexpr int kBusyTimeoutMs = 5000;

bool IsCorruption(int rc) {
  const int primary = rc & 0xff;
  return primary == SQLITE_CORRUPT || primary == SQLITE_NOTADB;
}

// Statement handle released on scope exit.
struct Statement {
  sqlite3_stmt* stmt = nullptr;
  ~Statement() {
    sqlite3_finalize(stmt);
  }
};

} // namespace

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    const std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite open " + path_ + ": " + msg);
  }

  // duplicate keys must be told apart from other constraint failures
  sqlite3_extended_result_codes(db_, 1);

  try {
    Configure(wal_mode);
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Check(int rc, const std::string& what) const {
  if (rc == SQLITE_OK || rc == SQLITE_ROW || rc == SQLITE_DONE) {
    return;
  }
  const std::string msg = what + ": " + sqlite3_errmsg(db_);
  if (IsCorruption(rc)) {
    throw util::Corruption(msg);
  }
  throw std::runtime_error(msg);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) {
    return;
  }
  const std::string msg = err ? err : sqlite3_errstr(rc);
  sqlite3_free(err);
  if (IsCorruption(rc)) {
    throw util::Corruption(msg);
  }
  throw std::runtime_error(msg);
}

int64_t SqliteDB::QueryInt(const std::string& sql) {
  Statement s;
  Check(sqlite3_prepare_v2(db_, sql.c_str(), -1, &s.stmt, nullptr), "prepare");
  const int rc = sqlite3_step(s.stmt);
  Check(rc, "step");
  return rc == SQLITE_ROW ? sqlite3_column_int64(s.stmt, 0) : 0;
}

void SqliteDB::VerifyIntegrity() {
  Statement s;
  Check(sqlite3_prepare_v2(db_, "PRAGMA quick_check;", -1, &s.stmt, nullptr), "quick_check");
  const int rc = sqlite3_step(s.stmt);
  Check(rc, "quick_check");

  const auto* text   = rc == SQLITE_ROW ? reinterpret_cast<const char*>(sqlite3_column_text(s.stmt, 0)) : nullptr;
  const std::string result = text ? text : "";
  if (result != "ok") {
    COURIER_LOG_ERROR("sqlite integrity check failed", {observability::StringField("db", path_), observability::StringField("result", result)});
    throw util::Corruption("sqlite integrity check failed for " + path_ + ": " + result);
  }
}

void SqliteDB::Configure(bool wal_mode) {
  // readers of the delivery feed do not block the propagation writer
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }
  Exec("PRAGMA synchronous=FULL;");
  // queue_state and deliveries cascade from bundles
  Exec("PRAGMA foreign_keys=ON;");
  Exec("PRAGMA temp_store=MEMORY;");
  Check(sqlite3_busy_timeout(db_, kBusyTimeoutMs), "busy_timeout");
}

} // namespace courier::db::sqlite
