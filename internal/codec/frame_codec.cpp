#include "frame_codec.hpp"

#include "bundle_codec.hpp"
#include "byte_io.hpp"
#include "internal/util/errors.hpp"

namespace courier::codec {

namespace {

constexpr std::string_view kHelloDomain = "courier-hello-v1";

void PutIds(ByteWriter& w, const std::vector<model::BundleId>& ids) {
  w.PutU32(static_cast<uint32_t>(ids.size()));
  for (const auto& id : ids) {
    w.PutFixed(id);
  }
}

std::vector<model::BundleId> ReadIds(ByteReader& r) {
  const auto count = r.ReadU32();
  if (count > r.Remaining() / model::kBundleIdSize) {
    throw util::DecodeError("id list longer than frame");
  }
  std::vector<model::BundleId> ids;
  ids.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    ids.push_back(r.ReadFixed<model::kBundleIdSize>());
  }
  return ids;
}

void PutHelloBody(ByteWriter& w, const HelloFrame& hello) {
  w.PutU8(hello.protocol_version);
  w.PutFixed(hello.signing_key);
  w.PutFixed(hello.box_key);
  w.PutU8(hello.relay_all ? 1 : 0);
  w.PutU16(static_cast<uint16_t>(hello.subscriptions.size()));
  for (const auto& topic : hello.subscriptions) {
    w.PutString(topic);
  }
}

} // namespace

std::vector<uint8_t> HelloPreimage(const HelloFrame& hello) {
  ByteWriter w;
  w.PutRaw(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(kHelloDomain.data()), kHelloDomain.size()));
  PutHelloBody(w, hello);
  return w.Take();
}

std::vector<uint8_t> EncodeFrame(const Frame& frame) {
  ByteWriter w;

  if (const auto* hello = std::get_if<HelloFrame>(&frame)) {
    if (hello->subscriptions.size() > kMaxHelloSubscriptions) {
      throw util::InvalidArgument("too many subscriptions for HELLO");
    }
    w.PutU8(static_cast<uint8_t>(FrameType::kHello));
    PutHelloBody(w, *hello);
    w.PutFixed(hello->signature);
  } else if (const auto* manifest = std::get_if<ManifestFrame>(&frame)) {
    w.PutU8(static_cast<uint8_t>(FrameType::kManifest));
    PutIds(w, manifest->ids);
  } else if (const auto* request = std::get_if<RequestFrame>(&frame)) {
    w.PutU8(static_cast<uint8_t>(FrameType::kRequest));
    PutIds(w, request->ids);
  } else if (const auto* bundle = std::get_if<BundleFrame>(&frame)) {
    w.PutU8(static_cast<uint8_t>(FrameType::kBundle));
    w.PutBlob(bundle->wire);
  } else if (const auto* receipt = std::get_if<ReceiptFrame>(&frame)) {
    w.PutU8(static_cast<uint8_t>(FrameType::kReceipt));
    w.PutFixed(receipt->id);
    w.PutU8(static_cast<uint8_t>(receipt->status));
  } else {
    w.PutU8(static_cast<uint8_t>(FrameType::kEnd));
  }

  return w.Take();
}

Frame DecodeFrame(std::span<const uint8_t> bytes, std::size_t max_frame_bytes) {
  if (bytes.size() > max_frame_bytes) {
    throw util::DecodeError("frame exceeds size limit");
  }

  ByteReader r(bytes);
  const auto type = r.ReadU8();

  switch (static_cast<FrameType>(type)) {
    case FrameType::kHello: {
      HelloFrame hello;
      hello.protocol_version = r.ReadU8();
      if (hello.protocol_version != kProtocolVersion) {
        throw util::DecodeError("unsupported protocol version");
      }
      hello.signing_key = r.ReadFixed<model::kSigningKeySize>();
      hello.box_key     = r.ReadFixed<model::kBoxKeySize>();

      const auto relay_all = r.ReadU8();
      if (relay_all > 1) {
        throw util::DecodeError("bad relay flag");
      }
      hello.relay_all = relay_all == 1;

      const auto count = r.ReadU16();
      if (count > kMaxHelloSubscriptions) {
        throw util::DecodeError("too many subscriptions");
      }
      for (uint16_t i = 0; i < count; ++i) {
        hello.subscriptions.push_back(r.ReadString(kMaxTopicLength));
      }
      hello.signature = r.ReadFixed<model::kSignatureSize>();
      r.ExpectEnd();
      return hello;
    }
    case FrameType::kManifest: {
      ManifestFrame manifest;
      manifest.ids = ReadIds(r);
      r.ExpectEnd();
      return manifest;
    }
    case FrameType::kRequest: {
      RequestFrame request;
      request.ids = ReadIds(r);
      r.ExpectEnd();
      return request;
    }
    case FrameType::kBundle: {
      BundleFrame bundle;
      bundle.wire = r.ReadBlob(max_frame_bytes);
      r.ExpectEnd();
      return bundle;
    }
    case FrameType::kReceipt: {
      ReceiptFrame receipt;
      receipt.id        = r.ReadFixed<model::kBundleIdSize>();
      const auto status = r.ReadU8();
      if (status > static_cast<uint8_t>(ReceiptStatus::kRejected)) {
        throw util::DecodeError("unknown receipt status");
      }
      receipt.status = static_cast<ReceiptStatus>(status);
      r.ExpectEnd();
      return receipt;
    }
    case FrameType::kEnd:
      r.ExpectEnd();
      return EndFrame{};
  }

  throw util::DecodeError("unknown frame type");
}

std::optional<uint8_t> PeekHelloVersion(std::span<const uint8_t> bytes) {
  if (bytes.size() < 2 || bytes[0] != static_cast<uint8_t>(FrameType::kHello)) {
    return std::nullopt;
  }
  return bytes[1];
}

} // namespace courier::codec
