#include "internal/propagation/loopback_link.hpp"

namespace courier::propagation {

LoopbackLink::LoopbackLink(std::shared_ptr<Channel> channel, int side, std::string name)
    : channel_(std::move(channel)), side_(side), name_(std::move(name)) {
}

std::pair<std::shared_ptr<LoopbackLink>, std::shared_ptr<LoopbackLink>> LoopbackLink::CreatePair(std::string a_name, std::string b_name) {
  auto channel = std::make_shared<Channel>();
  std::shared_ptr<LoopbackLink> a(new LoopbackLink(channel, 0, "loopback:" + a_name));
  std::shared_ptr<LoopbackLink> b(new LoopbackLink(channel, 1, "loopback:" + b_name));
  return {std::move(a), std::move(b)};
}

bool LoopbackLink::Send(std::vector<uint8_t> frame) {
  {
    std::lock_guard lock(channel_->mutex);
    if (channel_->closed) return false;
    // side 0 reads queues[0]; what side 0 sends lands in queues[1]
    channel_->queues[1 - side_].push_back(std::move(frame));
  }
  channel_->cv.notify_all();
  return true;
}

std::optional<std::vector<uint8_t>> LoopbackLink::Receive(std::chrono::milliseconds timeout) {
  std::unique_lock lock(channel_->mutex);
  auto&            inbox = channel_->queues[side_];
  channel_->cv.wait_for(lock, timeout, [&] { return !inbox.empty() || channel_->closed; });
  if (inbox.empty()) return std::nullopt;
  auto frame = std::move(inbox.front());
  inbox.pop_front();
  return frame;
}

void LoopbackLink::Close() {
  {
    std::lock_guard lock(channel_->mutex);
    channel_->closed = true;
  }
  channel_->cv.notify_all();
}

bool LoopbackLink::IsOpen() const {
  std::lock_guard lock(channel_->mutex);
  return !channel_->closed;
}

std::string LoopbackLink::Describe() const {
  return name_;
}

std::size_t LoopbackLink::Pending() const {
  std::lock_guard lock(channel_->mutex);
  return channel_->queues[side_].size();
}

} // namespace courier::propagation
