#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/propagation/neighbor_session.hpp"

namespace courier::propagation {

/*
  One background thread per neighbor connection.

  The thread owns the NeighborSession: it polls the link, feeds frames to
  the session and ticks its timers. Stop() asks the session to wind down;
  an exchange in flight gets up to `grace` to finish before the link is
  closed. Whatever is still unreceipted stays queued for the next contact.
*/
class PropagationWorker {
 public:
  PropagationWorker(ExchangeHost& host, std::shared_ptr<NeighborLink> link, SessionOptions options);
  ~PropagationWorker();

  PropagationWorker(const PropagationWorker&)            = delete;
  PropagationWorker& operator=(const PropagationWorker&) = delete;

  void Start();
  void Stop(std::chrono::milliseconds grace);

  SessionState State() const {
    return state_.load();
  }

  bool Running() const {
    return running_.load();
  }

  // Set when the session hit store corruption; fatal to the node.
  bool Failed() const {
    return failed_.load();
  }

  // Valid once the thread has exited.
  SessionCounters Counters() const;

  std::string Describe() const {
    return link_->Describe();
  }

 private:
  void Run();

  std::shared_ptr<NeighborLink> link_;
  NeighborSession               session_;

  std::thread                  thread_;
  std::atomic<bool>            running_{false};
  std::atomic<bool>            stop_requested_{false};
  std::atomic<bool>            failed_{false};
  std::atomic<SessionState>    state_{SessionState::kDiscovered};
  std::atomic<int64_t>         stop_deadline_ms_{0};

  mutable std::mutex counters_mutex_;
  SessionCounters    counters_;
};

} // namespace courier::propagation
