#pragma once

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>

#include "internal/propagation/neighbor_link.hpp"

namespace courier::propagation {

/*
  In-process link pair for tests and local simulation. Frames sent on one
  end are received on the other in order. Closing either end closes both.
*/
class LoopbackLink final : public NeighborLink {
 public:
  static std::pair<std::shared_ptr<LoopbackLink>, std::shared_ptr<LoopbackLink>> CreatePair(std::string a_name = "a",
                                                                                            std::string b_name = "b");

  bool Send(std::vector<uint8_t> frame) override;
  std::optional<std::vector<uint8_t>> Receive(std::chrono::milliseconds timeout) override;
  void Close() override;
  bool IsOpen() const override;
  std::string Describe() const override;

  // Frames waiting to be received on this end.
  std::size_t Pending() const;

 private:
  struct Channel {
    mutable std::mutex                          mutex;
    std::condition_variable                     cv;
    std::deque<std::vector<uint8_t>>            queues[2];
    bool                                        closed = false;
  };

  LoopbackLink(std::shared_ptr<Channel> channel, int side, std::string name);

  std::shared_ptr<Channel> channel_;
  int                      side_;
  std::string              name_;
};

} // namespace courier::propagation
