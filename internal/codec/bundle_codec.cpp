#include "bundle_codec.hpp"

#include <string>

#include "byte_io.hpp"
#include "internal/crypto/digest.hpp"
#include "internal/model/destination.hpp"
#include "internal/util/errors.hpp"

namespace courier::codec {

namespace {

constexpr std::string_view kIdDomain = "courier-bundle-v1";

void PutImmutable(ByteWriter& w, const model::Bundle& b) {
  w.PutU8(b.version);
  w.PutFixed(b.source);
  w.PutFixed(b.source_box_key);
  w.PutString(b.destination);
  w.PutString(b.topic);
  w.PutU8(static_cast<uint8_t>(b.priority));
  w.PutU8(static_cast<uint8_t>(b.audience));
  w.PutU8(b.Flags());
  w.PutU64(b.created_at_ms);
  w.PutU64(b.ttl_ms);
  w.PutU16(b.hop_limit);
}

model::Priority DecodePriority(uint8_t raw) {
  if (raw > static_cast<uint8_t>(model::Priority::kBulk)) {
    throw util::DecodeError("unknown priority");
  }
  return static_cast<model::Priority>(raw);
}

model::Audience DecodeAudience(uint8_t raw) {
  if (raw > static_cast<uint8_t>(model::Audience::kDestinationOnly)) {
    throw util::DecodeError("unknown audience");
  }
  return static_cast<model::Audience>(raw);
}

} // namespace

std::vector<uint8_t> Encode(const model::Bundle& b) {
  if (b.payload.size() > kMaxPayloadBytes) {
    throw util::InvalidArgument("payload exceeds wire limit");
  }

  ByteWriter w;
  w.PutU8(b.version);
  w.PutFixed(b.id);
  w.PutFixed(b.source);
  w.PutFixed(b.source_box_key);
  w.PutString(b.destination);
  w.PutString(b.topic);
  w.PutU8(static_cast<uint8_t>(b.priority));
  w.PutU8(static_cast<uint8_t>(b.audience));
  w.PutU8(b.Flags());
  w.PutU64(b.created_at_ms);
  w.PutU64(b.ttl_ms);
  w.PutU16(b.hop_limit);
  w.PutU16(b.hop_count);
  w.PutFixed(b.signature);
  w.PutBlob(b.payload);
  return w.Take();
}

model::Bundle Decode(std::span<const uint8_t> bytes) {
  ByteReader r(bytes);

  model::Bundle b;
  b.version = r.ReadU8();
  if (b.version != model::kBundleVersion) {
    throw util::DecodeError("unsupported bundle version " + std::to_string(b.version));
  }

  b.id             = r.ReadFixed<model::kBundleIdSize>();
  b.source         = r.ReadFixed<model::kSigningKeySize>();
  b.source_box_key = r.ReadFixed<model::kBoxKeySize>();
  b.destination    = r.ReadString(kMaxDestinationLength);
  b.topic          = r.ReadString(kMaxTopicLength);
  b.priority       = DecodePriority(r.ReadU8());
  b.audience       = DecodeAudience(r.ReadU8());

  const auto flags = r.ReadU8();
  if ((flags & ~model::kKnownFlags) != 0) {
    throw util::DecodeError("unknown flag bits");
  }
  b.custody_requested = (flags & model::kFlagCustodyRequested) != 0;
  b.custody_ack       = (flags & model::kFlagCustodyAck) != 0;

  b.created_at_ms = r.ReadU64();
  b.ttl_ms        = r.ReadU64();
  b.hop_limit     = r.ReadU16();
  b.hop_count     = r.ReadU16();
  b.signature     = r.ReadFixed<model::kSignatureSize>();
  b.payload       = r.ReadBlob(kMaxPayloadBytes);
  r.ExpectEnd();

  auto destination = model::Destination::Parse(b.destination);
  if (!destination) {
    throw util::DecodeError("malformed destination");
  }
  if (destination->topic != b.topic) {
    throw util::DecodeError("topic does not match destination");
  }
  if (b.hop_limit == 0 || b.hop_count > b.hop_limit) {
    throw util::DecodeError("hop counters out of range");
  }
  if (b.ttl_ms == 0) {
    throw util::DecodeError("zero ttl");
  }

  return b;
}

std::vector<uint8_t> IdPreimage(const model::Bundle& b) {
  ByteWriter w;
  w.PutRaw(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(kIdDomain.data()), kIdDomain.size()));
  PutImmutable(w, b);
  w.PutBlob(b.payload);
  return w.Take();
}

model::BundleId ComputeId(const model::Bundle& b) {
  return crypto::Sha256(IdPreimage(b));
}

} // namespace courier::codec
