#include "byte_io.hpp"

#include <algorithm>
#include <limits>

#include "internal/util/errors.hpp"

namespace courier::codec {

void ByteWriter::PutU8(uint8_t v) {
  out_.push_back(v);
}

void ByteWriter::PutU16(uint16_t v) {
  out_.push_back(static_cast<uint8_t>((v >> 8) & 0xFFu));
  out_.push_back(static_cast<uint8_t>(v & 0xFFu));
}

void ByteWriter::PutU32(uint32_t v) {
  for (int shift = 24; shift >= 0; shift -= 8) {
    out_.push_back(static_cast<uint8_t>((v >> shift) & 0xFFu));
  }
}

void ByteWriter::PutU64(uint64_t v) {
  for (int shift = 56; shift >= 0; shift -= 8) {
    out_.push_back(static_cast<uint8_t>((v >> shift) & 0xFFu));
  }
}

void ByteWriter::PutRaw(std::span<const uint8_t> bytes) {
  out_.insert(out_.end(), bytes.begin(), bytes.end());
}

void ByteWriter::PutString(std::string_view s) {
  if (s.size() > std::numeric_limits<uint16_t>::max()) {
    throw util::InvalidArgument("string field too long for wire encoding");
  }
  PutU16(static_cast<uint16_t>(s.size()));
  out_.insert(out_.end(), s.begin(), s.end());
}

void ByteWriter::PutBlob(std::span<const uint8_t> bytes) {
  if (bytes.size() > std::numeric_limits<uint32_t>::max()) {
    throw util::InvalidArgument("blob too long for wire encoding");
  }
  PutU32(static_cast<uint32_t>(bytes.size()));
  PutRaw(bytes);
}

std::span<const uint8_t> ByteReader::Take(std::size_t n) {
  if (n > Remaining()) {
    throw util::DecodeError("truncated input");
  }
  auto out = in_.subspan(pos_, n);
  pos_ += n;
  return out;
}

uint8_t ByteReader::ReadU8() {
  return Take(1)[0];
}

uint16_t ByteReader::ReadU16() {
  auto b = Take(2);
  return static_cast<uint16_t>((static_cast<uint16_t>(b[0]) << 8) | b[1]);
}

uint32_t ByteReader::ReadU32() {
  auto     b = Take(4);
  uint32_t v = 0;
  for (auto byte : b) {
    v = (v << 8) | byte;
  }
  return v;
}

uint64_t ByteReader::ReadU64() {
  auto     b = Take(8);
  uint64_t v = 0;
  for (auto byte : b) {
    v = (v << 8) | byte;
  }
  return v;
}

std::string ByteReader::ReadString(std::size_t max_len) {
  const auto len = ReadU16();
  if (len > max_len) {
    throw util::DecodeError("string field exceeds limit");
  }
  auto raw = Take(len);
  return std::string(raw.begin(), raw.end());
}

std::vector<uint8_t> ByteReader::ReadBlob(std::size_t max_len) {
  const auto len = ReadU32();
  if (len > max_len) {
    throw util::DecodeError("blob exceeds limit");
  }
  auto raw = Take(len);
  return std::vector<uint8_t>(raw.begin(), raw.end());
}

void ByteReader::ExpectEnd() const {
  if (Remaining() != 0) {
    throw util::DecodeError("trailing bytes after frame");
  }
}

} // namespace courier::codec
