#include <cassert>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using courier::db::BundleOrderKey;
using courier::db::BundleQuery;
using courier::db::ErrorCode;
using courier::db::Repository;
using courier::db::memory::MemoryRepository;
using courier::db::model::BundleRecord;
using courier::db::model::DeliveryRecord;
using courier::db::model::EphemeralRecord;
using courier::db::model::QueueRecord;
using courier::db::model::QueueStatus;
using courier::model::CustodyState;
using courier::model::Priority;

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

BundleRecord Row(const std::string& id, Priority priority, uint64_t expires_at_ms, uint16_t hop_count = 0, uint16_t hop_limit = 10,
                 const std::string& topic = "alerts") {
  BundleRecord r;
  r.id            = id;
  r.topic         = topic;
  r.destination   = "topic://mesh/" + topic;
  r.priority      = priority;
  r.created_at_ms = 1000;
  r.expires_at_ms = expires_at_ms;
  r.hop_count     = hop_count;
  r.hop_limit     = hop_limit;
  r.size_bytes    = 100;
  r.stored_at_ms  = 1000;
  r.wire          = {0xca, 0xfe};
  return r;
}

std::vector<std::string> Ids(const std::vector<BundleRecord>& rows) {
  std::vector<std::string> ids;
  for (const auto& r : rows) ids.push_back(r.id);
  return ids;
}

void VerifyInsertGetAndDuplicate(Repository& repo) {
  auto tx = repo.Begin();

  auto row              = Row("b-insert", Priority::kExpedited, 50'000);
  row.audience          = courier::model::Audience::kTrusted;
  row.custody_requested = true;
  row.custody_state     = CustodyState::kHeld;
  assert(repo.InsertBundle(*tx, row));

  auto copy      = row;
  copy.hop_count = 5;
  const auto dup = repo.InsertBundle(*tx, copy);
  assert(!dup);
  assert(dup.code == ErrorCode::kAlreadyExists);

  const auto read = repo.GetBundle(*tx, "b-insert");
  assert(read.has_value());
  assert(read->hop_count == 0);
  assert(read->priority == Priority::kExpedited);
  assert(read->audience == courier::model::Audience::kTrusted);
  assert(read->custody_requested);
  assert(read->custody_state == CustodyState::kHeld);
  assert(read->wire == row.wire);

  assert(repo.UpdateCustody(*tx, "b-insert", CustodyState::kAcknowledged));
  assert(repo.GetBundle(*tx, "b-insert")->custody_state == CustodyState::kAcknowledged);

  assert(repo.DeleteBundle(*tx, "b-insert"));
  assert(!repo.GetBundle(*tx, "b-insert").has_value());
  tx->Commit();
}

void VerifyPendingOrderAndFilters(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.InsertBundle(*tx, Row("o-bulk", Priority::kBulk, 10'000)));
  assert(repo.InsertBundle(*tx, Row("o-normal-late", Priority::kNormal, 90'000)));
  assert(repo.InsertBundle(*tx, Row("o-normal-early", Priority::kNormal, 20'000, 0, 10)));
  assert(repo.InsertBundle(*tx, Row("o-normal-early-fewer", Priority::kNormal, 20'000, 8, 10)));
  assert(repo.InsertBundle(*tx, Row("o-emergency", Priority::kEmergency, 90'000)));
  assert(repo.InsertBundle(*tx, Row("o-spent", Priority::kEmergency, 90'000, 10, 10)));
  assert(repo.InsertBundle(*tx, Row("o-other", Priority::kNormal, 90'000, 0, 10, "other")));
  tx->Commit();

  auto read = repo.Begin();

  BundleQuery all;
  all.topic = "alerts";
  assert((Ids(repo.ListBundles(*read, all)) == std::vector<std::string>{"o-spent", "o-emergency", "o-normal-early-fewer", "o-normal-early",
                                                                        "o-normal-late", "o-bulk"}));

  BundleQuery pending;
  pending.topic            = "alerts";
  pending.forwardable_only = true;
  pending.live_at_ms       = 15'000;
  assert((Ids(repo.ListBundles(*read, pending)) ==
          std::vector<std::string>{"o-emergency", "o-normal-early-fewer", "o-normal-early", "o-normal-late"}));

  // keyset continuation
  const auto first_page = [&] {
    auto q  = pending;
    q.limit = 2;
    return repo.ListBundles(*read, q);
  }();
  assert(first_page.size() == 2);

  auto next  = pending;
  next.after = courier::db::OrderKeyOf(first_page.back());
  assert((Ids(repo.ListBundles(*read, next)) == std::vector<std::string>{"o-normal-early", "o-normal-late"}));

  BundleQuery by_destination;
  by_destination.destination  = "topic://mesh/other";
  by_destination.include_wire = false;
  const auto other            = repo.ListBundles(*read, by_destination);
  assert(other.size() == 1);
  assert(other[0].wire.empty());

  const auto totals = repo.Totals(*read);
  assert(totals.count == 7);
  assert(totals.bytes == 700);
  read->Commit();

  auto cleanup = repo.Begin();
  for (const auto& id : {"o-bulk", "o-normal-late", "o-normal-early", "o-normal-early-fewer", "o-emergency", "o-spent", "o-other"}) {
    assert(repo.DeleteBundle(*cleanup, id));
  }
  cleanup->Commit();
}

void VerifyAcknowledgedFilter(Repository& repo) {
  auto tx  = repo.Begin();
  auto row = Row("a-acked", Priority::kNormal, 90'000);
  assert(repo.InsertBundle(*tx, row));
  assert(repo.UpdateCustody(*tx, "a-acked", CustodyState::kAcknowledged));

  BundleQuery q;
  q.exclude_acknowledged = true;
  assert(repo.ListBundles(*tx, q).empty());
  q.exclude_acknowledged = false;
  assert(repo.ListBundles(*tx, q).size() == 1);

  assert(repo.DeleteBundle(*tx, "a-acked"));
  tx->Commit();
}

void VerifyQueueStateCascades(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.InsertBundle(*tx, Row("q-bundle", Priority::kNormal, 90'000)));

  QueueRecord entry{.bundle_id = "q-bundle", .neighbor_id = "peer-a", .attempts = 1, .last_attempt_ms = 10, .next_attempt_ms = 2010};
  assert(repo.UpsertQueueEntry(*tx, entry));
  entry.attempts = 2;
  entry.status   = QueueStatus::kTransferred;
  assert(repo.UpsertQueueEntry(*tx, entry));
  assert(repo.UpsertQueueEntry(*tx, QueueRecord{.bundle_id = "q-bundle", .neighbor_id = "peer-b"}));

  const auto read = repo.GetQueueEntry(*tx, "q-bundle", "peer-a");
  assert(read.has_value());
  assert(read->attempts == 2);
  assert(read->status == QueueStatus::kTransferred);
  assert(repo.ListQueueEntries(*tx, "peer-b").size() == 1);

  // queue state for an unknown bundle is refused
  assert(!repo.UpsertQueueEntry(*tx, QueueRecord{.bundle_id = "missing", .neighbor_id = "peer-a"}));

  DeliveryRecord delivery{.bundle_id = "q-bundle", .topic = "alerts", .delivered_at_ms = 20};
  assert(repo.AppendDelivery(*tx, delivery));

  assert(repo.DeleteBundle(*tx, "q-bundle"));
  assert(!repo.GetQueueEntry(*tx, "q-bundle", "peer-a").has_value());
  assert(repo.ListQueueEntries(*tx, "peer-b").empty());
  assert(repo.ReadDeliveries(*tx, "", 0, 0).empty());
  tx->Commit();
}

void VerifyExpiredSweep(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.InsertBundle(*tx, Row("e-old", Priority::kNormal, 1000)));
  assert(repo.InsertBundle(*tx, Row("e-edge", Priority::kNormal, 2000)));
  assert(repo.InsertBundle(*tx, Row("e-young", Priority::kNormal, 9000)));
  assert(repo.UpsertQueueEntry(*tx, QueueRecord{.bundle_id = "e-old", .neighbor_id = "peer"}));
  tx->Commit();

  auto sweep   = repo.Begin();
  const auto expired = repo.ListExpiredBundles(*sweep, 2000);
  assert((Ids(expired) == std::vector<std::string>{"e-old"}));
  assert(expired[0].wire.empty());

  uint64_t removed = 0;
  assert(repo.DeleteExpiredBundles(*sweep, 2000, removed));
  assert(removed == 1);
  assert(!repo.GetQueueEntry(*sweep, "e-old", "peer").has_value());
  assert(repo.GetBundle(*sweep, "e-edge").has_value());
  sweep->Commit();

  auto cleanup = repo.Begin();
  assert(repo.DeleteExpiredBundles(*cleanup, 10'000, removed));
  assert(removed == 2);
  cleanup->Commit();
}

void VerifyEphemeralRecords(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.InsertBundle(*tx, Row("p-parent", Priority::kNormal, 90'000)));

  EphemeralRecord position{.parent_id = "p-parent", .record_id = "pos", .kind = "location", .body = {1, 2}, .created_at_ms = 10, .purge_at_ms = 100};
  EphemeralRecord note{.parent_id = "p-parent", .record_id = "note", .kind = "annotation", .body = {3}, .created_at_ms = 10, .purge_at_ms = 500};
  assert(repo.InsertEphemeral(*tx, position));
  assert(repo.InsertEphemeral(*tx, note));

  const auto dup = repo.InsertEphemeral(*tx, position);
  assert(!dup);
  assert(dup.code == ErrorCode::kAlreadyExists);

  auto listed = repo.ListEphemeral(*tx, "p-parent");
  assert(listed.size() == 2);
  assert(repo.CountEphemeral(*tx) == 2);

  uint64_t removed = 0;
  assert(repo.DeletePurgedEphemeral(*tx, 100, removed));
  assert(removed == 0);
  assert(repo.DeletePurgedEphemeral(*tx, 101, removed));
  assert(removed == 1);

  listed = repo.ListEphemeral(*tx, "p-parent");
  assert(listed.size() == 1);
  assert(listed[0].record_id == "note");
  assert(listed[0].body == std::vector<uint8_t>{3});

  assert(repo.DeletePurgedEphemeral(*tx, 1000, removed));
  assert(repo.DeleteBundle(*tx, "p-parent"));
  tx->Commit();
}

void VerifyDeliverySequence(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.InsertBundle(*tx, Row("d-a", Priority::kNormal, 90'000, 0, 10, "a")));
  assert(repo.InsertBundle(*tx, Row("d-b", Priority::kNormal, 90'000, 0, 10, "b")));

  DeliveryRecord first{.bundle_id = "d-a", .topic = "a", .delivered_at_ms = 1};
  DeliveryRecord second{.bundle_id = "d-b", .topic = "b", .delivered_at_ms = 2};
  DeliveryRecord third{.bundle_id = "d-a", .topic = "a", .delivered_at_ms = 3};
  assert(repo.AppendDelivery(*tx, first));
  assert(repo.AppendDelivery(*tx, second));
  assert(repo.AppendDelivery(*tx, third));
  assert(first.seq < second.seq && second.seq < third.seq);

  DeliveryRecord orphan{.bundle_id = "missing", .topic = "a"};
  assert(!repo.AppendDelivery(*tx, orphan));
  tx->Commit();

  auto read = repo.Begin();
  assert(repo.ReadDeliveries(*read, "", 0, 0).size() == 3);
  const auto topic_a = repo.ReadDeliveries(*read, "a", 0, 0);
  assert(topic_a.size() == 2);
  assert(topic_a[1].seq == third.seq);

  const auto after = repo.ReadDeliveries(*read, "", first.seq, 1);
  assert(after.size() == 1);
  assert(after[0].bundle_id == "d-b");
  read->Commit();

  auto cleanup = repo.Begin();
  assert(repo.DeleteBundle(*cleanup, "d-a"));
  assert(repo.DeleteBundle(*cleanup, "d-b"));
  cleanup->Commit();
}

void VerifyRollbackBehavior(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertBundle(*tx, Row("r-rolled-back", Priority::kNormal, 90'000)));
    tx->Rollback();
  }
  {
    // dropped without commit
    auto tx = repo.Begin();
    assert(repo.InsertBundle(*tx, Row("r-dropped", Priority::kNormal, 90'000)));
  }

  auto tx = repo.Begin();
  assert(!repo.GetBundle(*tx, "r-rolled-back").has_value());
  assert(!repo.GetBundle(*tx, "r-dropped").has_value());
  tx->Commit();
}

void VerifyPurgeAll(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.InsertBundle(*tx, Row("w-1", Priority::kNormal, 90'000)));
  assert(repo.InsertBundle(*tx, Row("w-2", Priority::kNormal, 90'000)));
  assert(repo.UpsertQueueEntry(*tx, QueueRecord{.bundle_id = "w-1", .neighbor_id = "peer"}));
  assert(repo.InsertEphemeral(*tx, EphemeralRecord{.parent_id = "w-1", .record_id = "n", .kind = "note", .purge_at_ms = 10}));
  DeliveryRecord delivery{.bundle_id = "w-2", .topic = "alerts", .delivered_at_ms = 1};
  assert(repo.AppendDelivery(*tx, delivery));
  tx->Commit();

  auto wipe = repo.Begin();
  assert(repo.PurgeAll(*wipe));
  wipe->Commit();

  auto read = repo.Begin();
  assert(repo.Totals(*read).count == 0);
  assert(repo.CountEphemeral(*read) == 0);
  assert(repo.ListQueueEntries(*read, "peer").empty());
  assert(repo.ReadDeliveries(*read, "", 0, 0).empty());
  read->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx  = repo->Begin();
    auto row = Row("durable", Priority::kEmergency, 90'000, 2, 9);
    row.custody_state = CustodyState::kHeld;
    assert(repo->InsertBundle(*tx, row));
    assert(repo->UpsertQueueEntry(*tx, QueueRecord{.bundle_id = "durable", .neighbor_id = "peer", .attempts = 3}));
    DeliveryRecord delivery{.bundle_id = "durable", .topic = "alerts", .delivered_at_ms = 5};
    assert(repo->AppendDelivery(*tx, delivery));
    tx->Commit();
  }

  backend.restart(repo);

  auto       tx   = repo->Begin();
  const auto read = repo->GetBundle(*tx, "durable");
  assert(read.has_value());
  assert(read->priority == Priority::kEmergency);
  assert(read->hop_count == 2);
  assert(read->hop_limit == 9);
  assert(read->custody_state == CustodyState::kHeld);
  assert(read->wire == (std::vector<uint8_t>{0xca, 0xfe}));
  assert(repo->GetQueueEntry(*tx, "durable", "peer")->attempts == 3);
  assert(repo->ReadDeliveries(*tx, "alerts", 0, 0).size() == 1);

  // sequence numbers keep increasing across restarts
  DeliveryRecord later{.bundle_id = "durable", .topic = "alerts", .delivered_at_ms = 6};
  assert(repo->AppendDelivery(*tx, later));
  assert(later.seq > repo->ReadDeliveries(*tx, "alerts", 0, 1).front().seq);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory() {
  const auto db_path =
      (std::filesystem::temp_directory_path() / ("courier_integration_sqlite_" + std::to_string(courier::util::NowMillis()) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<courier::db::sqlite::SqliteDB>(db_path);
    courier::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<courier::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyInsertGetAndDuplicate(*repo);
    VerifyPendingOrderAndFilters(*repo);
    VerifyAcknowledgedFilter(*repo);
    VerifyQueueStateCascades(*repo);
    VerifyExpiredSweep(*repo);
    VerifyEphemeralRecords(*repo);
    VerifyDeliverySequence(*repo);
    VerifyRollbackBehavior(*repo);
    VerifyPurgeAll(*repo);
  }

  VerifyRestartDurability(backend);

  backend.cleanup();
}

void VerifySqliteSchemaGuards() {
  const auto db_path =
      (std::filesystem::temp_directory_path() / ("courier_schema_guard_" + std::to_string(courier::util::NowMillis()) + ".db")).string();
  {
    courier::db::sqlite::SqliteDB db(db_path);
    db.VerifyIntegrity();
    courier::db::sqlite::BootstrapSchema(db);
    // bootstrap is idempotent
    courier::db::sqlite::BootstrapSchema(db);
    assert(db.QueryInt("SELECT MAX(version) FROM schema_migrations;") == courier::db::sqlite::kSchemaVersion);
    assert(db.QueryInt("PRAGMA foreign_keys;") == 1);

    // a file from a newer build is refused
    db.Exec("INSERT INTO schema_migrations(version, applied_at_ms) VALUES(99, 0);");
    bool threw = false;
    try {
      courier::db::sqlite::BootstrapSchema(db);
    } catch (const courier::util::InvalidState&) {
      threw = true;
    }
    assert(threw);
  }
  std::filesystem::remove(db_path);
  std::filesystem::remove(db_path + "-wal");
  std::filesystem::remove(db_path + "-shm");
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }
  VerifySqliteSchemaGuards();

  std::cout << "courier_integration_repository_parity: pass\n";
  return 0;
}
