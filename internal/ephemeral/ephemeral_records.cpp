#include "internal/ephemeral/ephemeral_records.hpp"

#include <algorithm>

#include "internal/store/bundle_store.hpp"
#include "internal/util/errors.hpp"

namespace courier::ephemeral {

EphemeralRecords::EphemeralRecords(std::shared_ptr<store::BundleStore> store) : store_(std::move(store)) {
}

void EphemeralRecords::Attach(const std::string& parent_id, const std::string& record_id, const std::string& kind,
                              std::vector<uint8_t> body, uint64_t purge_at_ms, uint64_t now_ms) {
  if (parent_id.empty() || record_id.empty()) {
    throw util::InvalidArgument("ephemeral record requires parent_id and record_id");
  }
  if (purge_at_ms <= now_ms) {
    throw util::InvalidArgument("ephemeral record purge_at must be in the future");
  }

  db::model::EphemeralRecord record;
  record.parent_id     = parent_id;
  record.record_id     = record_id;
  record.kind          = kind;
  record.body          = std::move(body);
  record.created_at_ms = now_ms;
  record.purge_at_ms   = purge_at_ms;
  store_->AttachEphemeral(record);
}

std::vector<db::model::EphemeralRecord> EphemeralRecords::List(const std::string& parent_id, uint64_t now_ms) const {
  auto records = store_->ListEphemeral(parent_id);
  std::erase_if(records, [now_ms](const auto& r) { return r.purge_at_ms < now_ms; });
  return records;
}

} // namespace courier::ephemeral
