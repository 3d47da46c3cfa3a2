#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <memory>

#include "internal/util/errors.hpp"

namespace courier::db::sqlite {

using courier::db::ErrorCode;
using courier::db::Result;
using courier::model::Audience;
using courier::model::CustodyState;
using courier::model::Priority;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

constexpr const char* kBundleColumns =
    "id,topic,destination,priority,audience,custody_state,custody_requested,custody_ack,"
    "created_at_ms,expires_at_ms,hop_count,hop_limit,size_bytes,stored_at_ms";

// Reads run inside the store's transaction; a failed prepare or step there
// means the database itself is unusable.
StmtPtr Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  int           rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr);
  if ((rc & 0xff) == SQLITE_CORRUPT || (rc & 0xff) == SQLITE_NOTADB) {
    throw util::Corruption(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return StmtPtr(st, &sqlite3_finalize);
}

// Steps a read statement; true on row, false on done.
bool StepRow(sqlite3* db, sqlite3_stmt* st) {
  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  if ((rc & 0xff) == SQLITE_CORRUPT || (rc & 0xff) == SQLITE_NOTADB) {
    throw util::Corruption(std::string("sqlite read: ") + sqlite3_errmsg(db));
  }
  throw std::runtime_error(std::string("sqlite read: ") + sqlite3_errmsg(db));
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::vector<uint8_t>& b) {
  // zero-length blobs must still bind as a blob, not NULL
  sqlite3_bind_blob(st, idx, b.empty() ? "" : static_cast<const void*>(b.data()), static_cast<int>(b.size()),
                    SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st, col))) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

std::vector<uint8_t> ColBlob(sqlite3_stmt* st, int col) {
  const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(st, col));
  int         size = sqlite3_column_bytes(st, col);
  if (!data || size <= 0) return {};
  return std::vector<uint8_t>(data, data + size);
}

// Column order follows kBundleColumns, optionally followed by wire.
model::BundleRecord ReadBundle(sqlite3_stmt* st, bool with_wire) {
  model::BundleRecord r;
  r.id                = ColText(st, 0);
  r.topic             = ColText(st, 1);
  r.destination       = ColText(st, 2);
  r.priority          = static_cast<Priority>(ColI32(st, 3));
  r.audience          = static_cast<Audience>(ColI32(st, 4));
  r.custody_state     = static_cast<CustodyState>(ColI32(st, 5));
  r.custody_requested = ColI32(st, 6) != 0;
  r.custody_ack       = ColI32(st, 7) != 0;
  r.created_at_ms     = ColU64(st, 8);
  r.expires_at_ms     = ColU64(st, 9);
  r.hop_count         = static_cast<uint16_t>(ColI32(st, 10));
  r.hop_limit         = static_cast<uint16_t>(ColI32(st, 11));
  r.size_bytes        = ColU64(st, 12);
  r.stored_at_ms      = ColU64(st, 13);
  if (with_wire) r.wire = ColBlob(st, 14);
  return r;
}

model::QueueRecord ReadQueue(sqlite3_stmt* st) {
  model::QueueRecord r;
  r.bundle_id       = ColText(st, 0);
  r.neighbor_id     = ColText(st, 1);
  r.attempts        = static_cast<uint32_t>(ColU64(st, 2));
  r.last_attempt_ms = ColU64(st, 3);
  r.next_attempt_ms = ColU64(st, 4);
  r.status          = static_cast<model::QueueStatus>(ColI32(st, 5));
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::kBusy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::kAlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::kConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::kIOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::kCorruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::kInternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Bundles
// ------------------------------------------------------------------

Result SqliteRepository::InsertBundle(Transaction& t, const model::BundleRecord& r) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("INSERT INTO bundles(") + kBundleColumns + ",wire) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::kInternalError, sqlite3_errmsg(db));
  }
  StmtPtr st(raw, &sqlite3_finalize);

  BindText(raw, 1, r.id);
  BindText(raw, 2, r.topic);
  BindText(raw, 3, r.destination);
  BindI32(raw, 4, static_cast<int>(r.priority));
  BindI32(raw, 5, static_cast<int>(r.audience));
  BindI32(raw, 6, static_cast<int>(r.custody_state));
  BindI32(raw, 7, r.custody_requested ? 1 : 0);
  BindI32(raw, 8, r.custody_ack ? 1 : 0);
  BindU64(raw, 9, r.created_at_ms);
  BindU64(raw, 10, r.expires_at_ms);
  BindI32(raw, 11, r.hop_count);
  BindI32(raw, 12, r.hop_limit);
  BindU64(raw, 13, r.size_bytes);
  BindU64(raw, 14, r.stored_at_ms);
  BindBlob(raw, 15, r.wire);

  return Translate(db, sqlite3_step(raw));
}

std::optional<model::BundleRecord> SqliteRepository::GetBundle(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kBundleColumns + ",wire FROM bundles WHERE id=?;");
  BindText(st.get(), 1, id);
  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadBundle(st.get(), true);
}

std::vector<model::BundleRecord> SqliteRepository::ListBundles(Transaction& t, const BundleQuery& q) {
  auto* db = TX(t).Handle();

  std::string sql = std::string("SELECT ") + kBundleColumns + (q.include_wire ? ",wire" : "") + " FROM bundles WHERE 1=1";
  if (q.topic) sql += " AND topic=?";
  if (q.destination) sql += " AND destination=?";
  if (q.live_at_ms) sql += " AND expires_at_ms>=?";
  if (q.forwardable_only) sql += " AND hop_count<hop_limit";
  if (q.exclude_acknowledged) sql += " AND custody_state<>" + std::to_string(static_cast<int>(CustodyState::kAcknowledged));
  if (q.after) sql += " AND (priority, expires_at_ms, MAX(hop_limit-hop_count,0), id) > (?,?,?,?)";
  sql += " ORDER BY priority, expires_at_ms, MAX(hop_limit-hop_count,0), id";
  if (q.limit > 0) sql += " LIMIT " + std::to_string(q.limit);
  sql += ";";

  auto st  = Prepare(db, sql);
  int  idx = 1;
  if (q.topic) BindText(st.get(), idx++, *q.topic);
  if (q.destination) BindText(st.get(), idx++, *q.destination);
  if (q.live_at_ms) BindU64(st.get(), idx++, *q.live_at_ms);
  if (q.after) {
    BindI32(st.get(), idx++, static_cast<int>(q.after->priority));
    BindU64(st.get(), idx++, q.after->expires_at_ms);
    BindI32(st.get(), idx++, q.after->hops_remaining);
    BindText(st.get(), idx++, q.after->id);
  }

  std::vector<model::BundleRecord> rows;
  while (StepRow(db, st.get())) {
    rows.push_back(ReadBundle(st.get(), q.include_wire));
  }
  return rows;
}

Result SqliteRepository::UpdateCustody(Transaction& t, const std::string& id, CustodyState state) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, "UPDATE bundles SET custody_state=? WHERE id=?;", -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::kInternalError, sqlite3_errmsg(db));
  }
  StmtPtr st(raw, &sqlite3_finalize);

  BindI32(raw, 1, static_cast<int>(state));
  BindText(raw, 2, id);

  int rc = sqlite3_step(raw);
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::kNotFound);
  return Translate(db, rc);
}

Result SqliteRepository::DeleteBundle(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, "DELETE FROM bundles WHERE id=?;", -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::kInternalError, sqlite3_errmsg(db));
  }
  StmtPtr st(raw, &sqlite3_finalize);
  BindText(raw, 1, id);

  int rc = sqlite3_step(raw);
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::kNotFound);
  return Translate(db, rc);
}

std::vector<model::BundleRecord> SqliteRepository::ListExpiredBundles(Transaction& t, uint64_t now_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kBundleColumns + " FROM bundles WHERE expires_at_ms<? ORDER BY id;");
  BindU64(st.get(), 1, now_ms);

  std::vector<model::BundleRecord> rows;
  while (StepRow(db, st.get())) {
    rows.push_back(ReadBundle(st.get(), false));
  }
  return rows;
}

Result SqliteRepository::DeleteExpiredBundles(Transaction& t, uint64_t now_ms, uint64_t& removed) {
  auto* db = TX(t).Handle();
  removed  = 0;

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, "DELETE FROM bundles WHERE expires_at_ms<?;", -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::kInternalError, sqlite3_errmsg(db));
  }
  StmtPtr st(raw, &sqlite3_finalize);
  BindU64(raw, 1, now_ms);

  int rc = sqlite3_step(raw);
  if (rc == SQLITE_DONE) removed = static_cast<uint64_t>(sqlite3_changes(db));
  return Translate(db, rc);
}

BundleTotals SqliteRepository::Totals(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT COUNT(*), COALESCE(SUM(size_bytes),0), COALESCE(SUM(custody_state=" +
                             std::to_string(static_cast<int>(CustodyState::kHeld)) + "),0) FROM bundles;");
  BundleTotals totals;
  if (StepRow(db, st.get())) {
    totals.count        = ColU64(st.get(), 0);
    totals.bytes        = ColU64(st.get(), 1);
    totals.custody_held = ColU64(st.get(), 2);
  }
  return totals;
}

// ------------------------------------------------------------------
// Queue state
// ------------------------------------------------------------------

Result SqliteRepository::UpsertQueueEntry(Transaction& t, const model::QueueRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO queue_state(bundle_id,neighbor_id,attempts,last_attempt_ms,next_attempt_ms,status) VALUES(?,?,?,?,?,?) "
      "ON CONFLICT(bundle_id,neighbor_id) DO UPDATE SET attempts=excluded.attempts,last_attempt_ms=excluded.last_attempt_ms,"
      "next_attempt_ms=excluded.next_attempt_ms,status=excluded.status;";

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::kInternalError, sqlite3_errmsg(db));
  }
  StmtPtr st(raw, &sqlite3_finalize);

  BindText(raw, 1, r.bundle_id);
  BindText(raw, 2, r.neighbor_id);
  BindU64(raw, 3, r.attempts);
  BindU64(raw, 4, r.last_attempt_ms);
  BindU64(raw, 5, r.next_attempt_ms);
  BindI32(raw, 6, static_cast<int>(r.status));

  return Translate(db, sqlite3_step(raw));
}

std::optional<model::QueueRecord> SqliteRepository::GetQueueEntry(Transaction& t, const std::string& bundle_id,
                                                                  const std::string& neighbor_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "SELECT bundle_id,neighbor_id,attempts,last_attempt_ms,next_attempt_ms,status FROM queue_state "
                      "WHERE bundle_id=? AND neighbor_id=?;");
  BindText(st.get(), 1, bundle_id);
  BindText(st.get(), 2, neighbor_id);
  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadQueue(st.get());
}

std::vector<model::QueueRecord> SqliteRepository::ListQueueEntries(Transaction& t, const std::string& neighbor_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "SELECT bundle_id,neighbor_id,attempts,last_attempt_ms,next_attempt_ms,status FROM queue_state "
                      "WHERE neighbor_id=? ORDER BY bundle_id;");
  BindText(st.get(), 1, neighbor_id);

  std::vector<model::QueueRecord> rows;
  while (StepRow(db, st.get())) {
    rows.push_back(ReadQueue(st.get()));
  }
  return rows;
}

// ------------------------------------------------------------------
// Ephemeral records
// ------------------------------------------------------------------

Result SqliteRepository::InsertEphemeral(Transaction& t, const model::EphemeralRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql = "INSERT INTO ephemeral_records(parent_id,record_id,kind,body,created_at_ms,purge_at_ms) VALUES(?,?,?,?,?,?);";

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::kInternalError, sqlite3_errmsg(db));
  }
  StmtPtr st(raw, &sqlite3_finalize);

  BindText(raw, 1, r.parent_id);
  BindText(raw, 2, r.record_id);
  BindText(raw, 3, r.kind);
  BindBlob(raw, 4, r.body);
  BindU64(raw, 5, r.created_at_ms);
  BindU64(raw, 6, r.purge_at_ms);

  return Translate(db, sqlite3_step(raw));
}

std::vector<model::EphemeralRecord> SqliteRepository::ListEphemeral(Transaction& t, const std::string& parent_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "SELECT parent_id,record_id,kind,body,created_at_ms,purge_at_ms FROM ephemeral_records "
                      "WHERE parent_id=? ORDER BY record_id;");
  BindText(st.get(), 1, parent_id);

  std::vector<model::EphemeralRecord> rows;
  while (StepRow(db, st.get())) {
    model::EphemeralRecord r;
    r.parent_id     = ColText(st.get(), 0);
    r.record_id     = ColText(st.get(), 1);
    r.kind          = ColText(st.get(), 2);
    r.body          = ColBlob(st.get(), 3);
    r.created_at_ms = ColU64(st.get(), 4);
    r.purge_at_ms   = ColU64(st.get(), 5);
    rows.push_back(std::move(r));
  }
  return rows;
}

uint64_t SqliteRepository::CountEphemeral(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT COUNT(*) FROM ephemeral_records;");
  return StepRow(db, st.get()) ? ColU64(st.get(), 0) : 0;
}

Result SqliteRepository::DeletePurgedEphemeral(Transaction& t, uint64_t now_ms, uint64_t& removed) {
  auto* db = TX(t).Handle();
  removed  = 0;

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, "DELETE FROM ephemeral_records WHERE purge_at_ms<?;", -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::kInternalError, sqlite3_errmsg(db));
  }
  StmtPtr st(raw, &sqlite3_finalize);
  BindU64(raw, 1, now_ms);

  int rc = sqlite3_step(raw);
  if (rc == SQLITE_DONE) removed = static_cast<uint64_t>(sqlite3_changes(db));
  return Translate(db, rc);
}

// ------------------------------------------------------------------
// Deliveries
// ------------------------------------------------------------------

Result SqliteRepository::AppendDelivery(Transaction& t, model::DeliveryRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, "INSERT INTO deliveries(bundle_id,topic,delivered_at_ms) VALUES(?,?,?);", -1, &raw, nullptr) !=
      SQLITE_OK) {
    return Result::Err(ErrorCode::kInternalError, sqlite3_errmsg(db));
  }
  StmtPtr st(raw, &sqlite3_finalize);

  BindText(raw, 1, r.bundle_id);
  BindText(raw, 2, r.topic);
  BindU64(raw, 3, r.delivered_at_ms);

  int rc = sqlite3_step(raw);
  if (rc == SQLITE_DONE) r.seq = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Translate(db, rc);
}

std::vector<model::DeliveryRecord> SqliteRepository::ReadDeliveries(Transaction& t, const std::string& topic,
                                                                    uint64_t after_seq, std::size_t limit) {
  auto* db = TX(t).Handle();

  std::string sql = "SELECT seq,bundle_id,topic,delivered_at_ms FROM deliveries WHERE seq>?";
  if (!topic.empty()) sql += " AND topic=?";
  sql += " ORDER BY seq";
  if (limit > 0) sql += " LIMIT " + std::to_string(limit);
  sql += ";";

  auto st = Prepare(db, sql);
  BindU64(st.get(), 1, after_seq);
  if (!topic.empty()) BindText(st.get(), 2, topic);

  std::vector<model::DeliveryRecord> rows;
  while (StepRow(db, st.get())) {
    model::DeliveryRecord r;
    r.seq             = ColU64(st.get(), 0);
    r.bundle_id       = ColText(st.get(), 1);
    r.topic           = ColText(st.get(), 2);
    r.delivered_at_ms = ColU64(st.get(), 3);
    rows.push_back(std::move(r));
  }
  return rows;
}

// ------------------------------------------------------------------
// Wipe
// ------------------------------------------------------------------

Result SqliteRepository::PurgeAll(Transaction& t) {
  auto* db = TX(t).Handle();
  for (const char* sql : {"DELETE FROM deliveries;", "DELETE FROM queue_state;", "DELETE FROM ephemeral_records;",
                          "DELETE FROM bundles;"}) {
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) return Translate(db, rc);
  }
  return Result::Ok();
}

} // namespace courier::db::sqlite
