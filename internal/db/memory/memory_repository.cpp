#include "memory_repository.hpp"

#include <algorithm>
#include <iterator>

#include "memory_tx.hpp"

namespace courier::db::memory {

using courier::model::CustodyState;

namespace {

bool Matches(const model::BundleRecord& r, const BundleQuery& q) {
  if (q.topic && r.topic != *q.topic) return false;
  if (q.destination && r.destination != *q.destination) return false;
  if (q.live_at_ms && r.expires_at_ms < *q.live_at_ms) return false;
  if (q.forwardable_only && r.hop_count >= r.hop_limit) return false;
  if (q.exclude_acknowledged && r.custody_state == CustodyState::kAcknowledged) return false;
  if (q.after && !(*q.after < OrderKeyOf(r))) return false;
  return true;
}

void SortPending(std::vector<model::BundleRecord>& rows) {
  std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) { return OrderKeyOf(a) < OrderKeyOf(b); });
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

void MemoryRepository::CascadeDelete(State& s, const std::string& bundle_id) {
  std::erase_if(s.queue, [&](const auto& kv) { return kv.first.first == bundle_id; });
  std::erase_if(s.deliveries, [&](const auto& d) { return d.bundle_id == bundle_id; });
}

// ---------------------------------------------------------------------------
// Bundles
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertBundle(Transaction& t, const model::BundleRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.bundles.contains(r.id)) return Result::Err(ErrorCode::kAlreadyExists);
  s.bundles[r.id] = r;
  return Result::Ok();
}

std::optional<model::BundleRecord> MemoryRepository::GetBundle(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.bundles.find(id);
  if (it == s.bundles.end()) return std::nullopt;
  return it->second;
}

std::vector<model::BundleRecord> MemoryRepository::ListBundles(Transaction& t, const BundleQuery& q) {
  const auto&                      s = TX(t).View();
  std::vector<model::BundleRecord> rows;
  for (const auto& [_, record] : s.bundles) {
    if (Matches(record, q)) rows.push_back(record);
  }
  SortPending(rows);
  if (q.limit > 0 && rows.size() > q.limit) rows.resize(q.limit);
  if (!q.include_wire) {
    for (auto& r : rows) r.wire.clear();
  }
  return rows;
}

Result MemoryRepository::UpdateCustody(Transaction& t, const std::string& id, CustodyState state) {
  auto& s  = TX(t).Mutable();
  auto  it = s.bundles.find(id);
  if (it == s.bundles.end()) return Result::Err(ErrorCode::kNotFound);
  it->second.custody_state = state;
  return Result::Ok();
}

Result MemoryRepository::DeleteBundle(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.bundles.erase(id) == 0) return Result::Err(ErrorCode::kNotFound);
  CascadeDelete(s, id);
  return Result::Ok();
}

std::vector<model::BundleRecord> MemoryRepository::ListExpiredBundles(Transaction& t, uint64_t now_ms) {
  const auto&                      s = TX(t).View();
  std::vector<model::BundleRecord> rows;
  for (const auto& [_, record] : s.bundles) {
    if (record.expires_at_ms < now_ms) {
      rows.push_back(record);
      rows.back().wire.clear();
    }
  }
  std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
  return rows;
}

Result MemoryRepository::DeleteExpiredBundles(Transaction& t, uint64_t now_ms, uint64_t& removed) {
  auto& s = TX(t).Mutable();
  removed = 0;
  for (auto it = s.bundles.begin(); it != s.bundles.end();) {
    if (it->second.expires_at_ms < now_ms) {
      CascadeDelete(s, it->first);
      it = s.bundles.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return Result::Ok();
}

BundleTotals MemoryRepository::Totals(Transaction& t) {
  const auto&  s = TX(t).View();
  BundleTotals totals;
  for (const auto& [_, record] : s.bundles) {
    ++totals.count;
    totals.bytes += record.size_bytes;
    if (record.custody_state == CustodyState::kHeld) ++totals.custody_held;
  }
  return totals;
}

// ---------------------------------------------------------------------------
// Queue state
// ---------------------------------------------------------------------------

Result MemoryRepository::UpsertQueueEntry(Transaction& t, const model::QueueRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.bundles.contains(r.bundle_id)) return Result::Err(ErrorCode::kConstraintViolation, "unknown bundle");
  s.queue[{r.bundle_id, r.neighbor_id}] = r;
  return Result::Ok();
}

std::optional<model::QueueRecord> MemoryRepository::GetQueueEntry(Transaction& t, const std::string& bundle_id,
                                                                  const std::string& neighbor_id) {
  const auto& s  = TX(t).View();
  auto        it = s.queue.find({bundle_id, neighbor_id});
  if (it == s.queue.end()) return std::nullopt;
  return it->second;
}

std::vector<model::QueueRecord> MemoryRepository::ListQueueEntries(Transaction& t, const std::string& neighbor_id) {
  const auto&                     s = TX(t).View();
  std::vector<model::QueueRecord> rows;
  for (const auto& [key, record] : s.queue) {
    if (key.second == neighbor_id) rows.push_back(record);
  }
  return rows;
}

// ---------------------------------------------------------------------------
// Ephemeral records
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertEphemeral(Transaction& t, const model::EphemeralRecord& r) {
  auto&   s = TX(t).Mutable();
  PairKey key{r.parent_id, r.record_id};
  if (s.ephemeral.contains(key)) return Result::Err(ErrorCode::kAlreadyExists);
  s.ephemeral.emplace(std::move(key), r);
  return Result::Ok();
}

std::vector<model::EphemeralRecord> MemoryRepository::ListEphemeral(Transaction& t, const std::string& parent_id) {
  const auto&                         s = TX(t).View();
  std::vector<model::EphemeralRecord> rows;
  for (auto it = s.ephemeral.lower_bound({parent_id, std::string{}}); it != s.ephemeral.end() && it->first.first == parent_id; ++it) {
    rows.push_back(it->second);
  }
  return rows;
}

uint64_t MemoryRepository::CountEphemeral(Transaction& t) {
  return TX(t).View().ephemeral.size();
}

Result MemoryRepository::DeletePurgedEphemeral(Transaction& t, uint64_t now_ms, uint64_t& removed) {
  auto& s = TX(t).Mutable();
  removed = std::erase_if(s.ephemeral, [&](const auto& kv) { return kv.second.purge_at_ms < now_ms; });
  return Result::Ok();
}

// ---------------------------------------------------------------------------
// Deliveries
// ---------------------------------------------------------------------------

Result MemoryRepository::AppendDelivery(Transaction& t, model::DeliveryRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.bundles.contains(r.bundle_id)) return Result::Err(ErrorCode::kConstraintViolation, "unknown bundle");
  r.seq = s.next_delivery_seq++;
  s.deliveries.push_back(r);
  return Result::Ok();
}

std::vector<model::DeliveryRecord> MemoryRepository::ReadDeliveries(Transaction& t, const std::string& topic,
                                                                    uint64_t after_seq, std::size_t limit) {
  const auto&                        s = TX(t).View();
  std::vector<model::DeliveryRecord> rows;
  // deliveries are appended in seq order
  for (const auto& d : s.deliveries) {
    if (d.seq <= after_seq) continue;
    if (!topic.empty() && d.topic != topic) continue;
    rows.push_back(d);
    if (limit > 0 && rows.size() >= limit) break;
  }
  return rows;
}

// ---------------------------------------------------------------------------
// Wipe
// ---------------------------------------------------------------------------

Result MemoryRepository::PurgeAll(Transaction& t) {
  auto& s = TX(t).Mutable();
  s.bundles.clear();
  s.queue.clear();
  s.ephemeral.clear();
  s.deliveries.clear();
  return Result::Ok();
}

} // namespace courier::db::memory
