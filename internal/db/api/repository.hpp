#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/bundle_record.hpp"
#include "internal/db/model/delivery_record.hpp"
#include "internal/db/model/ephemeral_record.hpp"
#include "internal/db/model/queue_record.hpp"

namespace courier::db {

// Keyset position in pending order: priority, expiry, hops remaining, id.
struct BundleOrderKey {
  courier::model::Priority priority       = courier::model::Priority::kEmergency;
  uint64_t                 expires_at_ms  = 0;
  uint16_t                 hops_remaining = 0;
  std::string              id;

  bool operator<(const BundleOrderKey& o) const {
    return std::tie(priority, expires_at_ms, hops_remaining, id) <
           std::tie(o.priority, o.expires_at_ms, o.hops_remaining, o.id);
  }
};

inline BundleOrderKey OrderKeyOf(const model::BundleRecord& r) {
  return {r.priority, r.expires_at_ms, r.HopsRemaining(), r.id};
}

struct BundleQuery {
  std::optional<std::string> topic;
  std::optional<std::string> destination;

  // Keep rows with expires_at_ms >= value.
  std::optional<uint64_t> live_at_ms;

  bool forwardable_only     = false; // hop_count < hop_limit
  bool exclude_acknowledged = false;
  bool include_wire         = true;

  // Strictly after this key in pending order.
  std::optional<BundleOrderKey> after;

  // 0 = unlimited
  std::size_t limit = 0;
};

struct BundleTotals {
  uint64_t count        = 0;
  uint64_t bytes        = 0;
  uint64_t custody_held = 0;
};

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Inserting an existing bundle id returns AlreadyExists and leaves the
    stored row untouched
  - Deleting a bundle removes its queue state and deliveries
  - Ephemeral records are never updated

  Listings come back in pending order (priority, expires_at,
  hops remaining, id) for both backends.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Bundles
  // ---------------------------------------------------------------------

  virtual Result InsertBundle(Transaction&, const model::BundleRecord&) = 0;

  virtual std::optional<model::BundleRecord> GetBundle(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::BundleRecord> ListBundles(Transaction&, const BundleQuery& query) = 0;

  virtual Result UpdateCustody(Transaction&, const std::string& id, courier::model::CustodyState state) = 0;

  virtual Result DeleteBundle(Transaction&, const std::string& id) = 0;

  // Rows with expires_at_ms < now_ms, without wire bytes.
  virtual std::vector<model::BundleRecord> ListExpiredBundles(Transaction&, uint64_t now_ms) = 0;

  virtual Result DeleteExpiredBundles(Transaction&, uint64_t now_ms, uint64_t& removed) = 0;

  virtual BundleTotals Totals(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Queue state
  // ---------------------------------------------------------------------

  virtual Result UpsertQueueEntry(Transaction&, const model::QueueRecord&) = 0;

  virtual std::optional<model::QueueRecord> GetQueueEntry(Transaction&, const std::string& bundle_id, const std::string& neighbor_id) = 0;

  virtual std::vector<model::QueueRecord> ListQueueEntries(Transaction&, const std::string& neighbor_id) = 0;

  // ---------------------------------------------------------------------
  // Ephemeral records
  // ---------------------------------------------------------------------

  virtual Result InsertEphemeral(Transaction&, const model::EphemeralRecord&) = 0;

  virtual std::vector<model::EphemeralRecord> ListEphemeral(Transaction&, const std::string& parent_id) = 0;

  virtual uint64_t CountEphemeral(Transaction&) = 0;

  // Removes rows with purge_at_ms < now_ms.
  virtual Result DeletePurgedEphemeral(Transaction&, uint64_t now_ms, uint64_t& removed) = 0;

  // ---------------------------------------------------------------------
  // Deliveries
  // ---------------------------------------------------------------------

  // Assigns record.seq.
  virtual Result AppendDelivery(Transaction&, model::DeliveryRecord& record) = 0;

  virtual std::vector<model::DeliveryRecord> ReadDeliveries(Transaction&, const std::string& topic, uint64_t after_seq, std::size_t limit) = 0;

  // ---------------------------------------------------------------------
  // Wipe
  // ---------------------------------------------------------------------

  virtual Result PurgeAll(Transaction&) = 0;
};

} // namespace courier::db
