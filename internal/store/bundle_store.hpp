#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/bundle.hpp"
#include "internal/observability/bundle_counters.hpp"
#include "internal/scheduler/priority_scheduler.hpp"
#include "internal/store/pending_cursor.hpp"
#include "internal/store/put_outcome.hpp"

namespace courier::store {

inline constexpr uint64_t kDefaultCapacityBytes = 64ull * 1024 * 1024;

struct StoreOptions {
  uint64_t capacity_bytes      = kDefaultCapacityBytes;
  uint64_t hard_capacity_bytes = 0; // 0 = capacity * 1.25

  std::chrono::milliseconds retry_base{std::chrono::seconds(2)};
  std::chrono::milliseconds retry_max{std::chrono::minutes(10)};
};

struct PutOptions {
  // This node is a destination: a bundle at its hop limit is still kept.
  bool local_destination = false;
  // Store with custody held when the bundle requests custody.
  bool hold_custody = false;
};

struct StoreStats {
  uint64_t bundles             = 0;
  uint64_t bytes               = 0;
  uint64_t capacity_bytes      = 0;
  uint64_t hard_capacity_bytes = 0;
  uint64_t custody_held        = 0;
  uint64_t ephemeral_records   = 0;
};

struct ReapResult {
  uint64_t bundles_removed   = 0;
  uint64_t ephemeral_removed = 0;
};

/*
  BundleStore

  Content-addressed bundle persistence over a db::Repository.

  - Duplicate policy: first copy wins. Put() of an id already stored returns
    DuplicateIgnored and never touches the stored row.
  - Every repository access is serialized by one mutex, and each mutation
    runs in one transaction, so size accounting, the eviction decision and
    the deletes happen atomically with respect to concurrent inserts.
  - Repository corruption is raised as util::Corruption.
*/
class BundleStore {
 public:
  BundleStore(std::shared_ptr<db::Repository> repository, StoreOptions options,
              std::shared_ptr<observability::BundleCounters> counters = nullptr);

  PutOutcome Put(const model::Bundle& bundle, uint64_t now_ms, const PutOptions& options = {});

  // Throws util::NotFound.
  model::Bundle                          Get(const model::BundleId& id);
  std::optional<model::Bundle>           Find(const model::BundleId& id);
  std::optional<db::model::BundleRecord> Describe(const model::BundleId& id);
  bool                                   Contains(const model::BundleId& id);

  PendingCursor ListPending(PendingFilter filter, uint64_t now_ms, std::size_t page_size = 64);

  // -------------------------------------------------------------------------
  // Custody
  // -------------------------------------------------------------------------

  void AcceptCustody(const model::BundleId& id);

  // Destination confirmed delivery: releases custody and stops forwarding.
  // Returns false if the bundle is not held here.
  bool AcknowledgeDelivery(const model::BundleId& id);

  // -------------------------------------------------------------------------
  // Per-neighbor queue state
  // -------------------------------------------------------------------------

  void RecordOffer(const model::BundleId& id, const std::string& neighbor_id, uint64_t now_ms);
  void RecordTransfer(const model::BundleId& id, const std::string& neighbor_id, uint64_t now_ms, bool custody_accepted);
  void RecordFailure(const model::BundleId& id, const std::string& neighbor_id, uint64_t now_ms);

  std::optional<db::model::QueueRecord> QueueState(const model::BundleId& id, const std::string& neighbor_id);

  // Bundles that may be offered to the neighbor now: live, forwardable, not
  // acknowledged, not already transferred to it and outside its backoff
  // window. Unordered; see scheduler::PriorityScheduler.
  std::vector<scheduler::QueueEntry> QueueEntries(const std::string& neighbor_id, uint64_t now_ms);

  std::chrono::milliseconds BackoffFor(uint32_t attempts) const;

  // -------------------------------------------------------------------------
  // Maintenance
  // -------------------------------------------------------------------------

  // Deletes expired bundles (with their queue state and deliveries) and
  // ephemeral records past purge_at.
  ReapResult Reap(uint64_t now_ms);

  // Re-decodes and re-verifies every stored bundle; removes failures.
  uint64_t Revalidate();

  // -------------------------------------------------------------------------
  // Ephemeral records and deliveries
  // -------------------------------------------------------------------------

  // Throws util::AlreadyExists for a repeated (parent_id, record_id).
  void AttachEphemeral(const db::model::EphemeralRecord& record);
  std::vector<db::model::EphemeralRecord> ListEphemeral(const std::string& parent_id);

  uint64_t RecordDelivery(const model::BundleId& id, const std::string& topic, uint64_t now_ms);
  std::vector<db::model::DeliveryRecord> ReadDeliveries(const std::string& topic, uint64_t after_seq, std::size_t limit);

  StoreStats Stats();

  // Emergency wipe. Returns the number of bundles removed.
  uint64_t PurgeAll();

  const StoreOptions& Options() const {
    return options_;
  }

 private:
  friend class PendingCursor;

  std::vector<db::model::BundleRecord> FetchPendingPage(const PendingFilter& filter, uint64_t now_ms,
                                                        const std::optional<db::BundleOrderKey>& after, std::size_t limit);

  void UpdateQueue(const model::BundleId& id, const std::string& neighbor_id, uint64_t now_ms,
                   const std::function<void(db::model::QueueRecord&)>& update);

  void Count(observability::BundleEvent event, const db::model::BundleRecord& record);

  std::shared_ptr<db::Repository>                repository_;
  StoreOptions                                   options_;
  std::shared_ptr<observability::BundleCounters> counters_;

  std::mutex mutex_;
};

} // namespace courier::store
