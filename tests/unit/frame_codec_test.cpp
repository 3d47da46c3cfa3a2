#include "internal/codec/frame_codec.hpp"

#include <cassert>
#include <iostream>
#include <variant>
#include <vector>

#include "internal/crypto/signer.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace courier::codec;

courier::model::BundleId IdOf(uint8_t fill) {
  courier::model::BundleId id{};
  id.fill(fill);
  return id;
}

bool DecodeThrows(const std::vector<uint8_t>& bytes, std::size_t max = kDefaultMaxFrameBytes) {
  try {
    (void)DecodeFrame(bytes, max);
  } catch (const courier::util::DecodeError&) {
    return true;
  }
  return false;
}

void TestSignedHelloVerifiesAfterDecode() {
  const auto key = courier::crypto::GenerateSigningKeyPair();

  HelloFrame hello;
  hello.signing_key = key.public_key;
  hello.box_key.fill(0x11);
  hello.relay_all     = false;
  hello.subscriptions = {"alerts", "weather"};
  hello.signature     = courier::crypto::Sign(HelloPreimage(hello), key.secret);

  const auto bytes = EncodeFrame(hello);
  assert(PeekHelloVersion(bytes) == kProtocolVersion);

  const auto decoded = std::get<HelloFrame>(DecodeFrame(bytes));
  assert(decoded.subscriptions == hello.subscriptions);
  assert(!decoded.relay_all);
  assert(courier::crypto::Verify(HelloPreimage(decoded), decoded.signature, decoded.signing_key));

  auto altered = decoded;
  altered.subscriptions.push_back("everything");
  assert(!courier::crypto::Verify(HelloPreimage(altered), altered.signature, altered.signing_key));
}

void TestHelloFromOtherVersionIsDetected() {
  HelloFrame hello;
  hello.protocol_version = kProtocolVersion + 1;
  const auto bytes       = EncodeFrame(hello);

  assert(PeekHelloVersion(bytes) == kProtocolVersion + 1);
  assert(DecodeThrows(bytes));
  assert(!PeekHelloVersion(EncodeFrame(EndFrame{})).has_value());
}

void TestIdListFramesKeepOrder() {
  const std::vector<courier::model::BundleId> ids = {IdOf(3), IdOf(1), IdOf(2)};

  const auto manifest = std::get<ManifestFrame>(DecodeFrame(EncodeFrame(ManifestFrame{ids})));
  assert(manifest.ids == ids);

  const auto request = std::get<RequestFrame>(DecodeFrame(EncodeFrame(RequestFrame{{}})));
  assert(request.ids.empty());
}

void TestReceiptAndEnd() {
  const auto receipt = std::get<ReceiptFrame>(DecodeFrame(EncodeFrame(ReceiptFrame{IdOf(7), ReceiptStatus::kCustodyAccepted})));
  assert(receipt.id == IdOf(7));
  assert(receipt.status == ReceiptStatus::kCustodyAccepted);

  assert(std::holds_alternative<EndFrame>(DecodeFrame(EncodeFrame(EndFrame{}))));

  auto bad_status  = EncodeFrame(ReceiptFrame{IdOf(7), ReceiptStatus::kStored});
  bad_status.back() = 9;
  assert(DecodeThrows(bad_status));
}

void TestMalformedFramesAreRejected() {
  assert(DecodeThrows({}));
  assert(DecodeThrows({0x7f}));

  // count claims more ids than the frame holds
  std::vector<uint8_t> lying = {static_cast<uint8_t>(FrameType::kManifest), 0x00, 0x00, 0x01, 0x00};
  assert(DecodeThrows(lying));

  auto trailing = EncodeFrame(EndFrame{});
  trailing.push_back(0);
  assert(DecodeThrows(trailing));
}

void TestFrameSizeLimit() {
  BundleFrame bundle;
  bundle.wire.assign(600, 0xab);
  const auto bytes = EncodeFrame(bundle);

  assert(DecodeThrows(bytes, 512));
  const auto decoded = std::get<BundleFrame>(DecodeFrame(bytes, 1024));
  assert(decoded.wire.size() == 600);
}

} // namespace

int main() {
  TestSignedHelloVerifiesAfterDecode();
  TestHelloFromOtherVersionIsDetected();
  TestIdListFramesKeepOrder();
  TestReceiptAndEnd();
  TestMalformedFramesAreRejected();
  TestFrameSizeLimit();

  std::cout << "courier_unit_frame_codec: pass\n";
  return 0;
}
