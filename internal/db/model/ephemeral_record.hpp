#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace courier::db::model {

/*
  Time-boxed auxiliary record attached to a parent entity.

  Insert-only. purge_at_ms is fixed at insert and the row is removed by the
  reaper once it has passed; no other path deletes or updates it.
*/
struct EphemeralRecord {
  std::string parent_id;
  std::string record_id;
  std::string kind;

  std::vector<uint8_t> body;

  uint64_t created_at_ms = 0;
  uint64_t purge_at_ms   = 0;
};

} // namespace courier::db::model
