#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/store/bundle_store.hpp"

namespace courier::reaper {

struct SweepResult {
  uint64_t bundles_removed     = 0;
  uint64_t ephemeral_removed   = 0;
  uint64_t quarantined         = 0;
};

/*
  Removes expired bundles and ephemeral records past purge_at.

  Runs on a fixed interval on its own thread, and Sweep() is also called
  before every propagation round. The interval pass additionally
  re-verifies every stored bundle. This is the only component that deletes
  ephemeral records.
*/
class ExpiryReaper {
 public:
  ExpiryReaper(std::shared_ptr<store::BundleStore> store, std::chrono::milliseconds interval, bool revalidate = true);
  ~ExpiryReaper();

  ExpiryReaper(const ExpiryReaper&)            = delete;
  ExpiryReaper& operator=(const ExpiryReaper&) = delete;

  void Start();
  void Stop();

  // Expiry only.
  SweepResult Sweep(uint64_t now_ms);

  // Expiry plus revalidation; what the interval thread runs.
  SweepResult FullSweep(uint64_t now_ms);

  // Set when a sweep hit store corruption; the node treats it as fatal.
  bool Failed() const {
    return failed_.load();
  }

 private:
  void Loop();

  std::shared_ptr<store::BundleStore> store_;
  std::chrono::milliseconds           interval_;
  bool                                revalidate_;

  std::mutex              wake_mutex_;
  std::condition_variable wake_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::atomic<bool>       failed_{false};
};

} // namespace courier::reaper
