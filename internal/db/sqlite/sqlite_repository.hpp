#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace courier::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  static SqliteTransaction& TX(Transaction&);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace courier::db::sqlite
