#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/model/ephemeral_record.hpp"

namespace courier::store {
class BundleStore;
}

namespace courier::ephemeral {

/*
  Attach-only access to time-boxed auxiliary records.

  No update or delete here: purge_at is fixed when a
  record is attached, and only the expiry reaper removes records once it has
  passed.
*/
class EphemeralRecords {
 public:
  explicit EphemeralRecords(std::shared_ptr<store::BundleStore> store);

  // Throws util::InvalidArgument when purge_at_ms is not in the future and
  // util::AlreadyExists for a repeated (parent_id, record_id).
  void Attach(const std::string& parent_id, const std::string& record_id, const std::string& kind, std::vector<uint8_t> body,
              uint64_t purge_at_ms, uint64_t now_ms);

  // Records past purge_at are hidden even before the reaper has run.
  std::vector<db::model::EphemeralRecord> List(const std::string& parent_id, uint64_t now_ms) const;

 private:
  std::shared_ptr<store::BundleStore> store_;
};

} // namespace courier::ephemeral
