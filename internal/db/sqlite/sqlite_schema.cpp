#include "sqlite_schema.hpp"

#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace courier::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS bundles (id TEXT PRIMARY KEY, topic TEXT NOT NULL, destination TEXT NOT NULL, priority INTEGER NOT NULL, audience INTEGER NOT NULL, custody_state INTEGER NOT NULL DEFAULT 0, custody_requested INTEGER NOT NULL, custody_ack INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, expires_at_ms INTEGER NOT NULL, hop_count INTEGER NOT NULL, hop_limit INTEGER NOT NULL, size_bytes INTEGER NOT NULL, stored_at_ms INTEGER NOT NULL, wire BLOB NOT NULL);",
      "CREATE INDEX IF NOT EXISTS bundles_expires_at ON bundles(expires_at_ms);",
      "CREATE INDEX IF NOT EXISTS bundles_topic ON bundles(topic);",
      "CREATE INDEX IF NOT EXISTS bundles_pending ON bundles(priority, expires_at_ms);",
      "CREATE TABLE IF NOT EXISTS queue_state (bundle_id TEXT NOT NULL REFERENCES bundles(id) ON DELETE CASCADE, neighbor_id TEXT NOT NULL, attempts INTEGER NOT NULL, last_attempt_ms INTEGER NOT NULL, next_attempt_ms INTEGER NOT NULL, status INTEGER NOT NULL, PRIMARY KEY (bundle_id, neighbor_id));",
      "CREATE INDEX IF NOT EXISTS queue_state_neighbor ON queue_state(neighbor_id);",
      "CREATE TABLE IF NOT EXISTS ephemeral_records (parent_id TEXT NOT NULL, record_id TEXT NOT NULL, kind TEXT NOT NULL, body BLOB NOT NULL, created_at_ms INTEGER NOT NULL, purge_at_ms INTEGER NOT NULL, PRIMARY KEY (parent_id, record_id));",
      "CREATE INDEX IF NOT EXISTS ephemeral_records_purge_at ON ephemeral_records(purge_at_ms);",
      "CREATE TRIGGER IF NOT EXISTS ephemeral_records_immutable BEFORE UPDATE ON ephemeral_records BEGIN SELECT RAISE(ABORT, 'ephemeral records are immutable'); END;",
      "CREATE TABLE IF NOT EXISTS deliveries (seq INTEGER PRIMARY KEY AUTOINCREMENT, bundle_id TEXT NOT NULL REFERENCES bundles(id) ON DELETE CASCADE, topic TEXT NOT NULL, delivered_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS deliveries_topic_seq ON deliveries(topic, seq);",
      "CREATE INDEX IF NOT EXISTS deliveries_bundle ON deliveries(bundle_id);",
      "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);"};

  db.Exec("BEGIN IMMEDIATE;");
  try {
    for (const auto& sql : kBootstrapSql) {
      db.Exec(sql);
    }
    db.Exec("INSERT OR IGNORE INTO schema_migrations(version, applied_at_ms) VALUES(" + std::to_string(kSchemaVersion) +
            ", " + std::to_string(util::NowMillis()) + ");");
    db.Exec("COMMIT;");
  } catch (const std::exception&) {
    db.Exec("ROLLBACK;");
    throw;
  }

  const auto newest = db.QueryInt("SELECT MAX(version) FROM schema_migrations;");
  if (newest > kSchemaVersion) {
    throw util::InvalidState(db.Path() + " has schema version " + std::to_string(newest) + ", this build understands " +
                             std::to_string(kSchemaVersion));
  }

  // fail early if an older incompatible layout is present
  db.Exec("SELECT id,topic,destination,priority,audience,custody_state,custody_requested,custody_ack,created_at_ms,expires_at_ms,hop_count,hop_limit,size_bytes,stored_at_ms,wire FROM bundles LIMIT 1;");
  db.Exec("SELECT bundle_id,neighbor_id,attempts,last_attempt_ms,next_attempt_ms,status FROM queue_state LIMIT 1;");
  db.Exec("SELECT parent_id,record_id,kind,body,created_at_ms,purge_at_ms FROM ephemeral_records LIMIT 1;");
  db.Exec("SELECT seq,bundle_id,topic,delivered_at_ms FROM deliveries LIMIT 1;");
}

} // namespace courier::db::sqlite
