#include <cassert>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>

#include "internal/codec/bundle_codec.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/bundle_counters.hpp"
#include "internal/store/bundle_store.hpp"
#include "tests/support/test_bundles.hpp"

namespace {

using courier::model::Priority;
using courier::observability::BundleEvent;
using courier::store::BundleStore;
using courier::store::PutOptions;
using courier::store::RejectReason;
using courier::testing::BundleSpec;

constexpr uint64_t kNow = 1'010'000;

const PutOptions kHold{.local_destination = false, .hold_custody = true};

struct Fixture {
  courier::crypto::SigningKeyPair                         key = courier::crypto::GenerateSigningKeyPair();
  std::shared_ptr<courier::observability::BundleCounters> counters = std::make_shared<courier::observability::BundleCounters>();
  std::shared_ptr<BundleStore>                            store;
  uint64_t                                                unit = 0; // wire size of one test bundle
  int                                                     next = 0;

  // Capacities are given in bundles.
  Fixture(uint64_t capacity, uint64_t hard) {
    unit = courier::codec::Encode(Make(Priority::kNormal)).size();
    courier::store::StoreOptions options;
    options.capacity_bytes      = capacity * unit;
    options.hard_capacity_bytes = hard * unit;
    store = std::make_shared<BundleStore>(std::make_shared<courier::db::memory::MemoryRepository>(), options, counters);
  }

  // Same wire size for every bundle; the payload counter keeps ids distinct.
  courier::model::Bundle Make(Priority priority, bool custody = false, uint64_t ttl_ms = 60'000) {
    char payload[16];
    std::snprintf(payload, sizeof(payload), "payload-%06d", next++);
    return courier::testing::MakeBundle(key, BundleSpec{.destination       = "topic://mesh/load",
                                                        .priority          = priority,
                                                        .custody_requested = custody,
                                                        .ttl_ms            = ttl_ms,
                                                        .payload           = payload});
  }
};

void TestLowestPriorityThenSoonestExpiryIsEvicted() {
  Fixture f(3, 4);
  const auto normal_late  = f.Make(Priority::kNormal, false, 50'000);
  const auto bulk         = f.Make(Priority::kBulk, false, 50'000);
  const auto normal_early = f.Make(Priority::kNormal, false, 20'000);
  assert(f.store->Put(normal_late, kNow).IsInserted());
  assert(f.store->Put(bulk, kNow).IsInserted());
  assert(f.store->Put(normal_early, kNow).IsInserted());

  const auto first = f.store->Put(f.Make(Priority::kExpedited), kNow);
  assert(first.IsInserted() && first.evicted == 1);
  assert(!f.store->Contains(bulk.id));

  const auto second = f.store->Put(f.Make(Priority::kExpedited), kNow);
  assert(second.IsInserted() && second.evicted == 1);
  assert(!f.store->Contains(normal_early.id));
  assert(f.store->Contains(normal_late.id));

  assert(f.counters->Count(BundleEvent::kEvicted) == 2);
  assert(f.store->Stats().bytes <= 3 * f.unit);
}

void TestCustodyHeldCopiesSurviveSoftCapacity() {
  Fixture f(2, 3);
  const auto held_a = f.Make(Priority::kBulk, true);
  const auto held_b = f.Make(Priority::kBulk, true);
  assert(f.store->Put(held_a, kNow, kHold).IsInserted());
  assert(f.store->Put(held_b, kNow, kHold).IsInserted());

  // over the soft limit, but only custody copies could make room
  const auto normal = f.Make(Priority::kNormal);
  const auto put    = f.store->Put(normal, kNow);
  assert(put.IsInserted() && put.evicted == 0);
  assert(f.store->Stats().bundles == 3);

  // the uncustodied copy goes before either custody copy
  const auto urgent = f.Make(Priority::kEmergency);
  assert(f.store->Put(urgent, kNow).IsInserted());
  assert(!f.store->Contains(normal.id));
  assert(f.store->Contains(held_a.id));
  assert(f.store->Contains(held_b.id));
  assert(f.counters->Count(BundleEvent::kLost) == 0);
}

void TestHardCapacityEvictsCustodyAsLastResort() {
  Fixture f(2, 2);
  const auto held_a = f.Make(Priority::kBulk, true, 20'000);
  const auto held_b = f.Make(Priority::kBulk, true, 50'000);
  assert(f.store->Put(held_a, kNow, kHold).IsInserted());
  assert(f.store->Put(held_b, kNow, kHold).IsInserted());

  const auto put = f.store->Put(f.Make(Priority::kEmergency), kNow);
  assert(put.IsInserted() && put.evicted == 1);
  assert(!f.store->Contains(held_a.id));
  assert(f.store->Contains(held_b.id));
  assert(f.counters->Count(BundleEvent::kLost) == 1);
}

void TestLowerPriorityNeverDisplacesHigher() {
  Fixture f(2, 2);
  const auto a = f.Make(Priority::kEmergency);
  const auto b = f.Make(Priority::kEmergency);
  assert(f.store->Put(a, kNow).IsInserted());
  assert(f.store->Put(b, kNow).IsInserted());

  const auto put = f.store->Put(f.Make(Priority::kBulk), kNow);
  assert(put.IsRejected() && put.reason == RejectReason::kStorageFull);
  assert(f.store->Contains(a.id) && f.store->Contains(b.id));
  assert(f.store->Stats().bundles == 2);
}

void TestAcknowledgedCopiesGoFirst() {
  Fixture f(2, 2);
  const auto acked  = f.Make(Priority::kEmergency, true);
  const auto normal = f.Make(Priority::kNormal);
  assert(f.store->Put(acked, kNow, kHold).IsInserted());
  assert(f.store->Put(normal, kNow).IsInserted());
  assert(f.store->AcknowledgeDelivery(acked.id));

  const auto put = f.store->Put(f.Make(Priority::kBulk), kNow);
  assert(put.IsInserted() && put.evicted == 1);
  assert(!f.store->Contains(acked.id));
  assert(f.store->Contains(normal.id));
}

void TestBundleLargerThanHardCapacityIsRejected() {
  Fixture f(1, 1);
  auto big = courier::testing::MakeBundle(f.key, BundleSpec{.payload = std::string(4 * f.unit, 'x')});

  const auto put = f.store->Put(big, kNow);
  assert(put.IsRejected() && put.reason == RejectReason::kStorageFull);
  assert(f.store->Stats().bundles == 0);
}

} // namespace

int main() {
  TestLowestPriorityThenSoonestExpiryIsEvicted();
  TestCustodyHeldCopiesSurviveSoftCapacity();
  TestHardCapacityEvictsCustodyAsLastResort();
  TestLowerPriorityNeverDisplacesHigher();
  TestAcknowledgedCopiesGoFirst();
  TestBundleLargerThanHardCapacityIsRejected();

  std::cout << "courier_unit_store_eviction: pass\n";
  return 0;
}
