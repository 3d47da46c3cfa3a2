#include "internal/reaper/expiry_reaper.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace courier::reaper {

ExpiryReaper::ExpiryReaper(std::shared_ptr<store::BundleStore> store, std::chrono::milliseconds interval, bool revalidate)
    : store_(std::move(store)), interval_(interval), revalidate_(revalidate) {
}

ExpiryReaper::~ExpiryReaper() {
  Stop();
}

void ExpiryReaper::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&ExpiryReaper::Loop, this);
}

void ExpiryReaper::Stop() {
  {
    std::lock_guard lock(wake_mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) thread_.join();
}

SweepResult ExpiryReaper::Sweep(uint64_t now_ms) {
  observability::SpanScope span("reaper.sweep");

  const auto  reaped = store_->Reap(now_ms);
  SweepResult result;
  result.bundles_removed   = reaped.bundles_removed;
  result.ephemeral_removed = reaped.ephemeral_removed;
  span.SetAttribute("courier.bundles_removed", static_cast<int64_t>(result.bundles_removed));

  if (result.bundles_removed > 0 || result.ephemeral_removed > 0) {
    COURIER_LOG_INFO("reaper sweep", {observability::IntField("bundles_removed", static_cast<int64_t>(result.bundles_removed)),
                                      observability::IntField("ephemeral_removed", static_cast<int64_t>(result.ephemeral_removed))});
  }
  return result;
}

SweepResult ExpiryReaper::FullSweep(uint64_t now_ms) {
  auto result = Sweep(now_ms);
  if (revalidate_) {
    result.quarantined = store_->Revalidate();
  }
  return result;
}

void ExpiryReaper::Loop() {
  while (running_) {
    try {
      FullSweep(util::NowMillis());
    } catch (const util::Corruption& e) {
      failed_ = true;
      COURIER_LOG_ERROR("store corruption detected by reaper", {observability::StringField("error", e.what())});
      return;
    } catch (const std::exception& e) {
      COURIER_LOG_WARN("reaper sweep failed", {observability::StringField("error", e.what())});
    }

    std::unique_lock lock(wake_mutex_);
    wake_.wait_for(lock, interval_, [this] { return !running_; });
  }
}

} // namespace courier::reaper
