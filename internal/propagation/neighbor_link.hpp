#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace courier::propagation {

/*
  Byte transport to one discovered neighbor. Each Send/Receive carries one
  whole frame; framing on the physical link is the implementation's
  concern.

  Implementations must allow Send and Close from one thread while another
  blocks in Receive.
*/
class NeighborLink {
 public:
  virtual ~NeighborLink() = default;

  // False once the link is closed.
  virtual bool Send(std::vector<uint8_t> frame) = 0;

  // nullopt on timeout or when the link is closed.
  virtual std::optional<std::vector<uint8_t>> Receive(std::chrono::milliseconds timeout) = 0;

  virtual void Close() = 0;

  virtual bool IsOpen() const = 0;

  virtual std::string Describe() const = 0;
};

} // namespace courier::propagation
