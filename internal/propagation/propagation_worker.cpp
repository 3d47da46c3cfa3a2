#include "internal/propagation/propagation_worker.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace courier::propagation {

namespace {

constexpr std::chrono::milliseconds kPollInterval{50};

} // namespace

PropagationWorker::PropagationWorker(ExchangeHost& host, std::shared_ptr<NeighborLink> link, SessionOptions options)
    : link_(std::move(link)), session_(host, *link_, options) {
}

PropagationWorker::~PropagationWorker() {
  Stop(std::chrono::milliseconds(0));
}

void PropagationWorker::Start() {
  if (running_.exchange(true)) return;
  stop_requested_ = false;
  thread_         = std::thread(&PropagationWorker::Run, this);
}

void PropagationWorker::Stop(std::chrono::milliseconds grace) {
  if (!thread_.joinable()) return;

  stop_deadline_ms_ = static_cast<int64_t>(util::NowMillis()) + grace.count();
  stop_requested_   = true;
  thread_.join();
}

SessionCounters PropagationWorker::Counters() const {
  std::lock_guard lock(counters_mutex_);
  return counters_;
}

void PropagationWorker::Run() {
  try {
    session_.Start(util::NowMillis());
    state_ = session_.State();

    while (session_.State() != SessionState::kDisconnected) {
      if (stop_requested_) {
        const auto state = session_.State();
        if (state == SessionState::kIdle || static_cast<int64_t>(util::NowMillis()) >= stop_deadline_ms_) {
          break;
        }
      }

      auto frame = link_->Receive(kPollInterval);
      const auto now = util::NowMillis();
      if (frame) {
        session_.OnFrame(*frame, now);
      } else if (!link_->IsOpen()) {
        session_.OnDisconnected(now);
        break;
      }

      if (!stop_requested_) session_.Tick(now);
      state_ = session_.State();

      std::lock_guard lock(counters_mutex_);
      counters_ = session_.Counters();
    }
  } catch (const util::Corruption& e) {
    failed_ = true;
    COURIER_LOG_ERROR("propagation worker stopped on store corruption",
                      {observability::StringField("link", link_->Describe()), observability::StringField("error", e.what())});
  } catch (const std::exception& e) {
    COURIER_LOG_WARN("propagation worker failed",
                     {observability::StringField("link", link_->Describe()), observability::StringField("error", e.what())});
  }

  try {
    session_.OnDisconnected(util::NowMillis());
  } catch (const util::Corruption& e) {
    failed_ = true;
    COURIER_LOG_ERROR("propagation worker stopped on store corruption",
                      {observability::StringField("link", link_->Describe()), observability::StringField("error", e.what())});
  } catch (const std::exception& e) {
    COURIER_LOG_WARN("propagation worker failed to record disconnect",
                     {observability::StringField("link", link_->Describe()), observability::StringField("error", e.what())});
  }
  link_->Close();

  {
    std::lock_guard lock(counters_mutex_);
    counters_ = session_.Counters();
  }
  state_   = session_.State();
  running_ = false;
}

} // namespace courier::propagation
