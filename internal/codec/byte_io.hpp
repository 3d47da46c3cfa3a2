#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace courier::codec {

/*
  Big-endian writer/reader pair used by every wire encoding in the node.

  ByteReader throws util::DecodeError on any short read or oversized length
  prefix, so callers that decode into locals and return at the end never
  expose a partially populated value.
*/

class ByteWriter {
 public:
  void PutU8(uint8_t v);
  void PutU16(uint16_t v);
  void PutU32(uint32_t v);
  void PutU64(uint64_t v);
  void PutRaw(std::span<const uint8_t> bytes);

  // u16 length prefix
  void PutString(std::string_view s);
  // u32 length prefix
  void PutBlob(std::span<const uint8_t> bytes);

  template <std::size_t N>
  void PutFixed(const std::array<uint8_t, N>& bytes) {
    PutRaw(bytes);
  }

  const std::vector<uint8_t>& Bytes() const {
    return out_;
  }

  std::vector<uint8_t> Take() {
    return std::move(out_);
  }

 private:
  std::vector<uint8_t> out_;
};

class ByteReader {
 public:
  explicit ByteReader(std::span<const uint8_t> in) : in_(in) {
  }

  uint8_t  ReadU8();
  uint16_t ReadU16();
  uint32_t ReadU32();
  uint64_t ReadU64();

  std::string          ReadString(std::size_t max_len);
  std::vector<uint8_t> ReadBlob(std::size_t max_len);

  template <std::size_t N>
  std::array<uint8_t, N> ReadFixed() {
    auto                   raw = Take(N);
    std::array<uint8_t, N> out{};
    std::copy(raw.begin(), raw.end(), out.begin());
    return out;
  }

  std::size_t Remaining() const {
    return in_.size() - pos_;
  }

  // Throws if any bytes are left over.
  void ExpectEnd() const;

 private:
  std::span<const uint8_t> Take(std::size_t n);

  std::span<const uint8_t> in_;
  std::size_t              pos_ = 0;
};

} // namespace courier::codec
