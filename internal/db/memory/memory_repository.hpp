#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace courier::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertBundle(Transaction&, const model::BundleRecord&) override;
  std::optional<model::BundleRecord> GetBundle(Transaction&, const std::string& id) override;
  std::vector<model::BundleRecord> ListBundles(Transaction&, const BundleQuery& query) override;
  Result UpdateCustody(Transaction&, const std::string& id, courier::model::CustodyState state) override;
  Result DeleteBundle(Transaction&, const std::string& id) override;
  std::vector<model::BundleRecord> ListExpiredBundles(Transaction&, uint64_t now_ms) override;
  Result DeleteExpiredBundles(Transaction&, uint64_t now_ms, uint64_t& removed) override;
  BundleTotals Totals(Transaction&) override;

  Result UpsertQueueEntry(Transaction&, const model::QueueRecord&) override;
  std::optional<model::QueueRecord> GetQueueEntry(Transaction&, const std::string& bundle_id,
                                                  const std::string& neighbor_id) override;
  std::vector<model::QueueRecord> ListQueueEntries(Transaction&, const std::string& neighbor_id) override;

  Result InsertEphemeral(Transaction&, const model::EphemeralRecord&) override;
  std::vector<model::EphemeralRecord> ListEphemeral(Transaction&, const std::string& parent_id) override;
  uint64_t CountEphemeral(Transaction&) override;
  Result DeletePurgedEphemeral(Transaction&, uint64_t now_ms, uint64_t& removed) override;

  Result AppendDelivery(Transaction&, model::DeliveryRecord& record) override;
  std::vector<model::DeliveryRecord> ReadDeliveries(Transaction&, const std::string& topic, uint64_t after_seq,
                                                    std::size_t limit) override;

  Result PurgeAll(Transaction&) override;

private:
  friend class MemoryTransaction;

  using PairKey = std::pair<std::string, std::string>;

  struct State {
    std::unordered_map<std::string, model::BundleRecord> bundles;
    std::map<PairKey, model::QueueRecord>                queue;     // (bundle, neighbor)
    std::map<PairKey, model::EphemeralRecord>            ephemeral; // (parent, record)
    std::vector<model::DeliveryRecord>                   deliveries;
    uint64_t                                             next_delivery_seq = 1;
  };

  static void CascadeDelete(State& s, const std::string& bundle_id);

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace courier::db::memory
