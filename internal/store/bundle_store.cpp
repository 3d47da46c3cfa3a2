#include "internal/store/bundle_store.hpp"

#include <algorithm>
#include <limits>
#include <tuple>
#include <unordered_map>

#include "internal/codec/bundle_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/store/bundle_validator.hpp"
#include "internal/util/errors.hpp"

namespace courier::store {

using courier::db::model::BundleRecord;
using courier::db::model::QueueRecord;
using courier::db::model::QueueStatus;
using courier::model::CustodyState;
using observability::BundleEvent;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.Describe(context);
  switch (result.code) {
    case db::ErrorCode::kAlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::kNotFound:
      throw util::NotFound(message);
    case db::ErrorCode::kConflict:
    case db::ErrorCode::kBusy:
      throw util::InvalidState(message);
    case db::ErrorCode::kCorruption:
      throw util::Corruption(message);
    default:
      throw std::runtime_error(message);
  }
}

BundleRecord ToRecord(const model::Bundle& bundle, std::vector<uint8_t> wire, uint64_t now_ms, CustodyState custody) {
  // sqlite stores signed 64-bit integers
  constexpr uint64_t kMaxStoredMs = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

  BundleRecord r;
  r.id                = model::IdToHex(bundle.id);
  r.topic             = bundle.topic;
  r.destination       = bundle.destination;
  r.priority          = bundle.priority;
  r.audience          = bundle.audience;
  r.custody_state     = custody;
  r.custody_requested = bundle.custody_requested;
  r.custody_ack       = bundle.custody_ack;
  r.created_at_ms     = std::min(bundle.created_at_ms, kMaxStoredMs);
  r.expires_at_ms     = std::min(bundle.ExpiresAtMs(), kMaxStoredMs);
  r.hop_count         = bundle.hop_count;
  r.hop_limit         = bundle.hop_limit;
  r.size_bytes        = wire.size();
  r.stored_at_ms      = now_ms;
  r.wire              = std::move(wire);
  return r;
}

// Acknowledged copies go first, then lowest priority (bulk), then soonest
// expiry.
bool EvictBefore(const BundleRecord& a, const BundleRecord& b) {
  const bool a_acked = a.custody_state == CustodyState::kAcknowledged;
  const bool b_acked = b.custody_state == CustodyState::kAcknowledged;
  if (a_acked != b_acked) return a_acked;
  return std::make_tuple(-static_cast<int>(a.priority), a.expires_at_ms, a.id) <
         std::make_tuple(-static_cast<int>(b.priority), b.expires_at_ms, b.id);
}

bool Outranks(const BundleRecord& candidate, const BundleRecord& incoming) {
  return candidate.priority < incoming.priority;
}

} // namespace

BundleStore::BundleStore(std::shared_ptr<db::Repository> repository, StoreOptions options,
                         std::shared_ptr<observability::BundleCounters> counters)
    : repository_(std::move(repository)), options_(options), counters_(std::move(counters)) {
  if (!repository_) {
    throw std::invalid_argument("bundle store requires a repository");
  }
  if (options_.capacity_bytes == 0) {
    options_.capacity_bytes = kDefaultCapacityBytes;
  }
  if (options_.hard_capacity_bytes == 0) {
    options_.hard_capacity_bytes = options_.capacity_bytes + options_.capacity_bytes / 4;
  }
  options_.hard_capacity_bytes = std::max(options_.hard_capacity_bytes, options_.capacity_bytes);
}

void BundleStore::Count(BundleEvent event, const BundleRecord& record) {
  if (counters_) {
    counters_->Record(event, record.priority, record.topic);
  }
}

// ---------------------------------------------------------------------------
// Put
// ---------------------------------------------------------------------------

PutOutcome BundleStore::Put(const model::Bundle& bundle, uint64_t now_ms, const PutOptions& options) {
  observability::SpanScope span("store.put");

  if (auto reason = BundleValidator::Validate(bundle, now_ms, options.local_destination)) {
    span.SetBundle(model::IdToHex(bundle.id));
    span.SetAttribute("courier.rejected", ToString(*reason));
    return PutOutcome::Rejected(*reason);
  }

  const auto custody = options.hold_custody && bundle.custody_requested ? CustodyState::kHeld : CustodyState::kNone;
  auto       record  = ToRecord(bundle, codec::Encode(bundle), now_ms, custody);

  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();

  if (repository_->GetBundle(*tx, record.id)) {
    return PutOutcome::Duplicate();
  }

  if (record.size_bytes > options_.hard_capacity_bytes) {
    return PutOutcome::Rejected(RejectReason::kStorageFull);
  }

  // Plan evictions before touching anything; a rejected insert deletes nothing.
  const auto totals    = repository_->Totals(*tx);
  uint64_t   projected = totals.bytes + record.size_bytes;

  std::vector<BundleRecord> evict;
  std::vector<BundleRecord> lost;

  if (projected > options_.capacity_bytes) {
    db::BundleQuery all;
    all.include_wire = false;
    auto rows        = repository_->ListBundles(*tx, all);
    std::sort(rows.begin(), rows.end(), EvictBefore);

    std::vector<BundleRecord> held;
    for (auto& row : rows) {
      if (projected <= options_.capacity_bytes) break;
      const bool acked = row.custody_state == CustodyState::kAcknowledged;
      if (!acked && Outranks(row, record)) continue;
      if (row.custody_state == CustodyState::kHeld) {
        held.push_back(std::move(row));
        continue;
      }
      projected -= std::min(projected, row.size_bytes);
      evict.push_back(std::move(row));
    }

    // Custody-held copies only go when the hard limit leaves no choice.
    for (auto& row : held) {
      if (projected <= options_.hard_capacity_bytes) break;
      projected -= std::min(projected, row.size_bytes);
      lost.push_back(std::move(row));
    }
  }

  if (projected > options_.hard_capacity_bytes) {
    if (counters_) counters_->Record(BundleEvent::kRejected, record.priority, record.topic);
    COURIER_LOG_WARN("bundle rejected, store full",
                     {observability::IdField("bundle_id", record.id), observability::StringField("priority", model::ToString(record.priority)),
                      observability::IntField("size_bytes", static_cast<int64_t>(record.size_bytes))});
    return PutOutcome::Rejected(RejectReason::kStorageFull);
  }

  for (const auto& victim : evict) {
    ThrowIfDbError(repository_->DeleteBundle(*tx, victim.id), "evict bundle");
  }
  for (const auto& victim : lost) {
    ThrowIfDbError(repository_->DeleteBundle(*tx, victim.id), "evict custody bundle");
  }
  ThrowIfDbError(repository_->InsertBundle(*tx, record), "insert bundle");
  tx->Commit();

  for (const auto& victim : evict) {
    Count(BundleEvent::kEvicted, victim);
    COURIER_LOG_DEBUG("bundle evicted", {observability::IdField("bundle_id", victim.id), observability::StringField("priority", model::ToString(victim.priority))});
  }
  for (const auto& victim : lost) {
    Count(BundleEvent::kLost, victim);
    COURIER_LOG_ERROR("custody bundle evicted under hard capacity",
                      {observability::IdField("bundle_id", victim.id), observability::StringField("topic", victim.topic),
                       observability::StringField("priority", model::ToString(victim.priority))});
  }

  observability::Metrics::Instance().SetStoreOccupancyBytes(projected);
  return PutOutcome::Inserted(evict.size() + lost.size());
}

// ---------------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------------

std::optional<model::Bundle> BundleStore::Find(const model::BundleId& id) {
  std::optional<BundleRecord> record;
  {
    std::lock_guard lock(mutex_);
    auto            tx = repository_->Begin();
    record             = repository_->GetBundle(*tx, model::IdToHex(id));
  }
  if (!record) return std::nullopt;
  return codec::Decode(record->wire);
}

model::Bundle BundleStore::Get(const model::BundleId& id) {
  auto bundle = Find(id);
  if (!bundle) {
    throw util::NotFound("bundle not found: " + model::IdToHex(id));
  }
  return *bundle;
}

std::optional<BundleRecord> BundleStore::Describe(const model::BundleId& id) {
  std::lock_guard lock(mutex_);
  auto            tx     = repository_->Begin();
  auto            record = repository_->GetBundle(*tx, model::IdToHex(id));
  if (record) record->wire.clear();
  return record;
}

bool BundleStore::Contains(const model::BundleId& id) {
  return Describe(id).has_value();
}

PendingCursor BundleStore::ListPending(PendingFilter filter, uint64_t now_ms, std::size_t page_size) {
  return PendingCursor(*this, std::move(filter), now_ms, page_size);
}

std::vector<BundleRecord> BundleStore::FetchPendingPage(const PendingFilter& filter, uint64_t now_ms,
                                                        const std::optional<db::BundleOrderKey>& after, std::size_t limit) {
  db::BundleQuery q;
  q.topic                = filter.topic;
  q.destination          = filter.destination;
  q.live_at_ms           = now_ms;
  q.forwardable_only     = true;
  q.exclude_acknowledged = true;
  q.after                = after;
  q.limit                = limit;

  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  return repository_->ListBundles(*tx, q);
}

// ---------------------------------------------------------------------------
// Custody
// ---------------------------------------------------------------------------

void BundleStore::AcceptCustody(const model::BundleId& id) {
  std::lock_guard lock(mutex_);
  auto            tx     = repository_->Begin();
  auto            record = repository_->GetBundle(*tx, model::IdToHex(id));
  if (!record) {
    throw util::NotFound("bundle not found: " + model::IdToHex(id));
  }
  if (record->custody_state != CustodyState::kNone) {
    return;
  }
  ThrowIfDbError(repository_->UpdateCustody(*tx, record->id, CustodyState::kHeld), "accept custody");
  tx->Commit();
}

bool BundleStore::AcknowledgeDelivery(const model::BundleId& id) {
  std::lock_guard lock(mutex_);
  auto            tx     = repository_->Begin();
  auto            record = repository_->GetBundle(*tx, model::IdToHex(id));
  if (!record) {
    return false;
  }
  if (record->custody_state == CustodyState::kAcknowledged) {
    return true;
  }
  ThrowIfDbError(repository_->UpdateCustody(*tx, record->id, CustodyState::kAcknowledged), "acknowledge delivery");
  tx->Commit();
  COURIER_LOG_DEBUG("custody released", {observability::IdField("bundle_id", record->id)});
  return true;
}

// ---------------------------------------------------------------------------
// Queue state
// ---------------------------------------------------------------------------

std::chrono::milliseconds BundleStore::BackoffFor(uint32_t attempts) const {
  if (attempts == 0) {
    return std::chrono::milliseconds(0);
  }
  const uint32_t shift = std::min<uint32_t>(attempts - 1, 30);
  const auto     base  = static_cast<uint64_t>(options_.retry_base.count());
  const auto     cap   = static_cast<uint64_t>(options_.retry_max.count());
  if (base > (cap >> shift)) {
    return options_.retry_max;
  }
  return std::chrono::milliseconds(static_cast<int64_t>(std::min(base << shift, cap)));
}

void BundleStore::UpdateQueue(const model::BundleId& id, const std::string& neighbor_id, uint64_t now_ms,
                              const std::function<void(QueueRecord&)>& update) {
  const auto hex = model::IdToHex(id);

  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  if (!repository_->GetBundle(*tx, hex)) {
    // evicted or reaped while the exchange was in flight
    return;
  }

  auto record = repository_->GetQueueEntry(*tx, hex, neighbor_id).value_or(QueueRecord{hex, neighbor_id});
  record.last_attempt_ms = now_ms;
  update(record);
  ThrowIfDbError(repository_->UpsertQueueEntry(*tx, record), "update queue state");
  tx->Commit();
}

void BundleStore::RecordOffer(const model::BundleId& id, const std::string& neighbor_id, uint64_t now_ms) {
  UpdateQueue(id, neighbor_id, now_ms, [](QueueRecord& r) { ++r.attempts; });
}

void BundleStore::RecordTransfer(const model::BundleId& id, const std::string& neighbor_id, uint64_t now_ms, bool custody_accepted) {
  UpdateQueue(id, neighbor_id, now_ms, [custody_accepted](QueueRecord& r) {
    if (r.status != QueueStatus::kCustodyAccepted) {
      r.status = custody_accepted ? QueueStatus::kCustodyAccepted : QueueStatus::kTransferred;
    }
    r.next_attempt_ms = 0;
  });
}

void BundleStore::RecordFailure(const model::BundleId& id, const std::string& neighbor_id, uint64_t now_ms) {
  UpdateQueue(id, neighbor_id, now_ms, [this, now_ms](QueueRecord& r) {
    if (r.status != QueueStatus::kPending) return;
    r.attempts        = std::max<uint32_t>(r.attempts, 1);
    r.next_attempt_ms = now_ms + static_cast<uint64_t>(BackoffFor(r.attempts).count());
  });
}

std::optional<QueueRecord> BundleStore::QueueState(const model::BundleId& id, const std::string& neighbor_id) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  return repository_->GetQueueEntry(*tx, model::IdToHex(id), neighbor_id);
}

std::vector<scheduler::QueueEntry> BundleStore::QueueEntries(const std::string& neighbor_id, uint64_t now_ms) {
  db::BundleQuery q;
  q.live_at_ms           = now_ms;
  q.forwardable_only     = true;
  q.exclude_acknowledged = true;
  q.include_wire         = false;

  std::vector<BundleRecord> rows;
  std::vector<QueueRecord>  queue;
  {
    std::lock_guard lock(mutex_);
    auto            tx = repository_->Begin();
    rows               = repository_->ListBundles(*tx, q);
    queue              = repository_->ListQueueEntries(*tx, neighbor_id);
  }

  std::unordered_map<std::string, QueueRecord> by_id;
  for (auto& entry : queue) {
    by_id.emplace(entry.bundle_id, std::move(entry));
  }

  std::vector<scheduler::QueueEntry> entries;
  entries.reserve(rows.size());
  for (const auto& row : rows) {
    scheduler::QueueEntry entry;
    if (auto it = by_id.find(row.id); it != by_id.end()) {
      if (it->second.status != QueueStatus::kPending) continue;
      if (it->second.next_attempt_ms > now_ms) continue;
      entry.attempts        = it->second.attempts;
      entry.next_attempt_ms = it->second.next_attempt_ms;
    }
    entry.id             = row.id;
    entry.priority       = row.priority;
    entry.expires_at_ms  = row.expires_at_ms;
    entry.hops_remaining = row.HopsRemaining();
    entry.audience       = row.audience;
    entry.topic          = row.topic;
    entry.destination    = row.destination;
    entries.push_back(std::move(entry));
  }
  return entries;
}

// ---------------------------------------------------------------------------
// Maintenance
// ---------------------------------------------------------------------------

ReapResult BundleStore::Reap(uint64_t now_ms) {
  ReapResult                result;
  std::vector<BundleRecord> expired;
  {
    std::lock_guard lock(mutex_);
    auto            tx = repository_->Begin();
    expired            = repository_->ListExpiredBundles(*tx, now_ms);
    ThrowIfDbError(repository_->DeleteExpiredBundles(*tx, now_ms, result.bundles_removed), "reap bundles");
    ThrowIfDbError(repository_->DeletePurgedEphemeral(*tx, now_ms, result.ephemeral_removed), "reap ephemeral records");
    tx->Commit();
  }

  for (const auto& record : expired) {
    Count(BundleEvent::kExpired, record);
  }
  return result;
}

uint64_t BundleStore::Revalidate() {
  constexpr std::size_t kPage = 256;

  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();

  std::vector<BundleRecord> bad;
  db::BundleQuery           q;
  q.limit = kPage;
  while (true) {
    auto rows = repository_->ListBundles(*tx, q);
    for (auto& row : rows) {
      bool ok = false;
      try {
        auto bundle = codec::Decode(row.wire);
        ok          = model::IdToHex(bundle.id) == row.id && BundleValidator::VerifyIntegrity(bundle);
      } catch (const util::DecodeError& e) {
        COURIER_LOG_DEBUG("stored bundle failed to decode", {observability::IdField("bundle_id", row.id), observability::StringField("error", e.what())});
      }
      if (!ok) {
        row.wire.clear();
        bad.push_back(std::move(row));
      }
    }
    if (rows.size() < kPage) break;
    q.after = db::OrderKeyOf(rows.back());
  }

  if (bad.empty()) {
    return 0;
  }

  for (const auto& record : bad) {
    ThrowIfDbError(repository_->DeleteBundle(*tx, record.id), "drop tampered bundle");
  }
  tx->Commit();

  for (const auto& record : bad) {
    Count(BundleEvent::kQuarantined, record);
    COURIER_LOG_WARN("stored bundle failed verification, dropped", {observability::IdField("bundle_id", record.id), observability::StringField("topic", record.topic)});
  }
  return bad.size();
}

// ---------------------------------------------------------------------------
// Ephemeral records and deliveries
// ---------------------------------------------------------------------------

void BundleStore::AttachEphemeral(const db::model::EphemeralRecord& record) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertEphemeral(*tx, record), "attach ephemeral record");
  tx->Commit();
}

std::vector<db::model::EphemeralRecord> BundleStore::ListEphemeral(const std::string& parent_id) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  return repository_->ListEphemeral(*tx, parent_id);
}

uint64_t BundleStore::RecordDelivery(const model::BundleId& id, const std::string& topic, uint64_t now_ms) {
  db::model::DeliveryRecord record;
  record.bundle_id       = model::IdToHex(id);
  record.topic           = topic;
  record.delivered_at_ms = now_ms;

  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  ThrowIfDbError(repository_->AppendDelivery(*tx, record), "record delivery");
  tx->Commit();
  return record.seq;
}

std::vector<db::model::DeliveryRecord> BundleStore::ReadDeliveries(const std::string& topic, uint64_t after_seq, std::size_t limit) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  return repository_->ReadDeliveries(*tx, topic, after_seq, limit);
}

StoreStats BundleStore::Stats() {
  std::lock_guard lock(mutex_);
  auto            tx     = repository_->Begin();
  const auto      totals = repository_->Totals(*tx);

  StoreStats stats;
  stats.bundles             = totals.count;
  stats.bytes               = totals.bytes;
  stats.custody_held        = totals.custody_held;
  stats.capacity_bytes      = options_.capacity_bytes;
  stats.hard_capacity_bytes = options_.hard_capacity_bytes;
  stats.ephemeral_records   = repository_->CountEphemeral(*tx);
  return stats;
}

uint64_t BundleStore::PurgeAll() {
  std::lock_guard lock(mutex_);
  auto            tx      = repository_->Begin();
  const auto      removed = repository_->Totals(*tx).count;
  ThrowIfDbError(repository_->PurgeAll(*tx), "purge store");
  tx->Commit();
  observability::Metrics::Instance().SetStoreOccupancyBytes(0);
  return removed;
}

} // namespace courier::store
