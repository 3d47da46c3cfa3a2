#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "internal/crypto/box.hpp"
#include "internal/crypto/identity.hpp"
#include "internal/crypto/key_directory.hpp"
#include "internal/crypto/secret_box.hpp"
#include "internal/crypto/secret_key.hpp"
#include "internal/crypto/signer.hpp"
#include "internal/model/bundle.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace crypto = courier::crypto;

// fast scrypt for tests
constexpr crypto::ScryptParams kTestParams{.log2_n = 10, .r = 8, .p = 1};

std::vector<uint8_t> Bytes(const std::string& s) {
  return {s.begin(), s.end()};
}

std::filesystem::path TempPath(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "courier_crypto_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / name;
  std::filesystem::remove(path);
  return path;
}

void TestSignAndVerify() {
  const auto key   = crypto::GenerateSigningKeyPair();
  const auto msg   = Bytes("bundle pre-image");
  const auto sig   = crypto::Sign(msg, key.secret);
  const auto other = crypto::GenerateSigningKeyPair();

  assert(crypto::Verify(msg, sig, key.public_key));
  assert(!crypto::Verify(msg, sig, other.public_key));
  assert(!crypto::Verify(Bytes("bundle pre-imagE"), sig, key.public_key));

  const auto raw     = key.secret.Bytes();
  auto       rebuilt = crypto::SigningKeyPairFromSecret(crypto::SecretKey(std::vector<uint8_t>(raw.begin(), raw.end())));
  assert(rebuilt.public_key == key.public_key);
}

void TestBoxOnlyOpensForTheRecipient() {
  const auto alice = crypto::GenerateBoxKeyPair();
  const auto bob   = crypto::GenerateBoxKeyPair();
  const auto eve   = crypto::GenerateBoxKeyPair();
  const auto msg   = Bytes("meet at the north gate");

  const auto sealed = crypto::EncryptFor(msg, bob.public_key, alice.secret);
  assert(crypto::DecryptFrom(sealed, alice.public_key, bob.secret) == msg);

  bool threw = false;
  try {
    (void)crypto::DecryptFrom(sealed, alice.public_key, eve.secret);
  } catch (const courier::util::AuthenticationError&) {
    threw = true;
  }
  assert(threw);

  // wrong claimed sender
  threw = false;
  try {
    (void)crypto::DecryptFrom(sealed, eve.public_key, bob.secret);
  } catch (const courier::util::AuthenticationError&) {
    threw = true;
  }
  assert(threw);

  auto tampered = sealed;
  tampered[tampered.size() / 2] ^= 0x80;
  threw = false;
  try {
    (void)crypto::DecryptFrom(tampered, alice.public_key, bob.secret);
  } catch (const courier::util::AuthenticationError&) {
    threw = true;
  }
  assert(threw);
}

void TestSecretBoxRoundTripAndWrongPassphrase() {
  const auto secret = Bytes("0123456789abcdef0123456789abcdef");
  const auto sealed = crypto::SealSecret(secret, "correct horse", kTestParams);

  auto       opened = crypto::OpenSecret(sealed, "correct horse");
  const auto bytes  = opened.Bytes();
  assert(std::vector<uint8_t>(bytes.begin(), bytes.end()) == secret);

  bool threw = false;
  try {
    (void)crypto::OpenSecret(sealed, "battery staple");
  } catch (const courier::util::AuthenticationError&) {
    threw = true;
  }
  assert(threw);

  auto bad_magic = sealed;
  bad_magic[0]   = 'X';
  threw          = false;
  try {
    (void)crypto::OpenSecret(bad_magic, "correct horse");
  } catch (const courier::util::DecodeError&) {
    threw = true;
  }
  assert(threw);
}

void TestSecureEraseClearsKey() {
  auto key = crypto::SecretKey::Random(32);
  assert(key.Size() == 32);
  key.SecureErase();
  assert(key.Erased());
  assert(key.Empty());

  std::vector<uint8_t> buffer(64, 0xaa);
  crypto::OverwriteMemory(buffer);
  for (auto b : buffer) {
    assert(b == 0);
  }
}

void TestSecureEraseFileRemovesFile() {
  const auto path = TempPath("erase_me.bin");
  crypto::WriteSealedFile(path, Bytes("sensitive"));
  assert(std::filesystem::exists(path));

  crypto::SecureEraseFile(path);
  assert(!std::filesystem::exists(path));

  // missing file is a no-op
  crypto::SecureEraseFile(path);
}

void TestIdentityPersistsAndWipes() {
  const auto path = TempPath("identity.sealed");

  auto created = crypto::NodeIdentity::LoadOrCreate(path, "pass", kTestParams);
  assert(std::filesystem::exists(path));

  auto loaded = crypto::NodeIdentity::LoadOrCreate(path, "pass", kTestParams);
  assert(loaded->NodeId() == created->NodeId());
  assert(loaded->BoxKey() == created->BoxKey());
  assert(loaded->NodeId() == courier::model::NodeIdOf(loaded->SigningKey()));

  const auto msg = Bytes("hello");
  assert(crypto::Verify(msg, loaded->Sign(msg), created->SigningKey()));

  loaded->Wipe();
  assert(!loaded->Available());
  assert(!std::filesystem::exists(path));

  bool threw = false;
  try {
    (void)loaded->Sign(msg);
  } catch (const courier::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  // public half stays readable
  assert(loaded->NodeId() == created->NodeId());
}

void TestIdentitiesExchangeBoxes() {
  auto alice = crypto::NodeIdentity::Generate();
  auto bob   = crypto::NodeIdentity::Generate();

  const auto msg    = Bytes("for bob only");
  const auto sealed = alice->EncryptFor(msg, bob->BoxKey());
  assert(bob->DecryptFrom(sealed, alice->BoxKey()) == msg);
}

void TestGroupKeyBindsAad() {
  auto group = crypto::GroupKey::Generate();
  const auto aad    = Bytes("trusted://mesh/ops");
  const auto sealed = group->Seal(aad, Bytes("status green"));
  assert(group->Open(aad, sealed) == Bytes("status green"));

  bool threw = false;
  try {
    (void)group->Open(Bytes("trusted://mesh/other"), sealed);
  } catch (const courier::util::AuthenticationError&) {
    threw = true;
  }
  assert(threw);

  const auto path = TempPath("group.sealed");
  group->Save(path, "pass", kTestParams);
  auto reloaded = crypto::GroupKey::Load(path, "pass");
  assert(reloaded->Open(aad, sealed) == Bytes("status green"));

  reloaded->Wipe();
  assert(!reloaded->Available());
  assert(!std::filesystem::exists(path));
}

void TestKeyDirectory() {
  crypto::KeyDirectory keys;
  courier::model::BoxPublicKey key{};
  key.fill(3);

  assert(!keys.Lookup("peer").has_value());
  keys.Learn("peer", key);
  assert(keys.Lookup("peer") == key);
  assert(keys.Size() == 1);
  keys.Clear();
  assert(keys.Size() == 0);
}

} // namespace

int main() {
  TestSignAndVerify();
  TestBoxOnlyOpensForTheRecipient();
  TestSecretBoxRoundTripAndWrongPassphrase();
  TestSecureEraseClearsKey();
  TestSecureEraseFileRemovesFile();
  TestIdentityPersistsAndWipes();
  TestIdentitiesExchangeBoxes();
  TestGroupKeyBindsAad();
  TestKeyDirectory();

  std::cout << "courier_unit_crypto: pass\n";
  return 0;
}
