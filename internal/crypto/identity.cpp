#include "identity.hpp"

#include <fstream>
#include <iterator>

#include "aead.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace courier::crypto {

NodeIdentity::NodeIdentity(SigningKeyPair signing, BoxKeyPair box)
    : signing_public_(signing.public_key), box_public_(box.public_key), signing_(std::move(signing)), box_(std::move(box)) {
}

std::shared_ptr<NodeIdentity> NodeIdentity::Generate() {
  return std::make_shared<NodeIdentity>(GenerateSigningKeyPair(), GenerateBoxKeyPair());
}

std::shared_ptr<NodeIdentity> NodeIdentity::LoadOrCreate(const std::filesystem::path& path, std::string_view passphrase, const ScryptParams& params) {
  if (passphrase.empty()) {
    throw util::InvalidArgument("identity passphrase must not be empty");
  }

  if (!std::filesystem::exists(path)) {
    auto identity = Generate();
    identity->Save(path, passphrase, params);
    return identity;
  }

  auto opened = OpenSecret(ReadSealedFile(path), passphrase);
  if (opened.Size() != 64) {
    throw util::DecodeError("identity file: unexpected key length");
  }

  const auto bytes = opened.Bytes();
  SecretKey  signing_secret(std::vector<uint8_t>(bytes.begin(), bytes.begin() + 32));
  SecretKey  box_secret(std::vector<uint8_t>(bytes.begin() + 32, bytes.end()));
  opened.SecureErase();

  auto identity             = std::make_shared<NodeIdentity>(SigningKeyPairFromSecret(std::move(signing_secret)), BoxKeyPairFromSecret(std::move(box_secret)));
  identity->persisted_path_ = path;
  return identity;
}

void NodeIdentity::Save(const std::filesystem::path& path, std::string_view passphrase, const ScryptParams& params) {
  std::lock_guard lock(mutex_);
  if (wiped_) {
    throw util::InvalidState("identity has been wiped");
  }

  std::vector<uint8_t> plain;
  plain.reserve(64);
  const auto signing_bytes = signing_.secret.Bytes();
  const auto box_bytes     = box_.secret.Bytes();
  plain.insert(plain.end(), signing_bytes.begin(), signing_bytes.end());
  plain.insert(plain.end(), box_bytes.begin(), box_bytes.end());
  SecretKey combined(std::move(plain));

  WriteSealedFile(path, SealSecret(combined.Bytes(), passphrase, params));
  persisted_path_ = path;
}

std::string NodeIdentity::NodeId() const {
  return util::ToHex(signing_public_);
}

bool NodeIdentity::Available() const {
  std::lock_guard lock(mutex_);
  return !wiped_;
}

model::Signature NodeIdentity::Sign(std::span<const uint8_t> message) const {
  std::lock_guard lock(mutex_);
  if (wiped_) {
    throw util::InvalidState("identity has been wiped");
  }
  return crypto::Sign(message, signing_.secret);
}

std::vector<uint8_t> NodeIdentity::EncryptFor(std::span<const uint8_t> plaintext, const model::BoxPublicKey& recipient) const {
  std::lock_guard lock(mutex_);
  if (wiped_) {
    throw util::InvalidState("identity has been wiped");
  }
  return crypto::EncryptFor(plaintext, recipient, box_.secret);
}

std::vector<uint8_t> NodeIdentity::DecryptFrom(std::span<const uint8_t> ciphertext, const model::BoxPublicKey& sender) const {
  std::lock_guard lock(mutex_);
  if (wiped_) {
    throw util::InvalidState("identity has been wiped");
  }
  return crypto::DecryptFrom(ciphertext, sender, box_.secret);
}

void NodeIdentity::Wipe() {
  std::lock_guard lock(mutex_);
  SecureErase(signing_.secret);
  SecureErase(box_.secret);
  wiped_ = true;
  if (persisted_path_) {
    SecureEraseFile(*persisted_path_);
    persisted_path_.reset();
  }
}

// ------------------------------------------------------------
// GroupKey
// ------------------------------------------------------------

GroupKey::GroupKey(SecretKey key, std::optional<std::filesystem::path> persisted_path) : key_(std::move(key)), persisted_path_(std::move(persisted_path)) {
  if (key_.Size() != kAeadKeySize) {
    throw util::InvalidArgument("group key must be 32 bytes");
  }
}

std::shared_ptr<GroupKey> GroupKey::Generate() {
  return std::make_shared<GroupKey>(SecretKey::Random(kAeadKeySize));
}

std::shared_ptr<GroupKey> GroupKey::Load(const std::filesystem::path& path, std::string_view passphrase) {
  return std::make_shared<GroupKey>(OpenSecret(ReadSealedFile(path), passphrase), path);
}

void GroupKey::Save(const std::filesystem::path& path, std::string_view passphrase, const ScryptParams& params) {
  std::lock_guard lock(mutex_);
  if (key_.Erased()) {
    throw util::InvalidState("group key has been wiped");
  }
  WriteSealedFile(path, SealSecret(key_.Bytes(), passphrase, params));
  persisted_path_ = path;
}

bool GroupKey::Available() const {
  std::lock_guard lock(mutex_);
  return !key_.Erased();
}

std::vector<uint8_t> GroupKey::Seal(std::span<const uint8_t> aad, std::span<const uint8_t> plaintext) const {
  std::lock_guard lock(mutex_);
  if (key_.Erased()) {
    throw util::InvalidState("group key has been wiped");
  }
  return ChaChaSeal(key_.Bytes(), aad, plaintext);
}

std::vector<uint8_t> GroupKey::Open(std::span<const uint8_t> aad, std::span<const uint8_t> sealed) const {
  std::lock_guard lock(mutex_);
  if (key_.Erased()) {
    throw util::InvalidState("group key has been wiped");
  }
  return ChaChaOpen(key_.Bytes(), aad, sealed);
}

void GroupKey::Wipe() {
  std::lock_guard lock(mutex_);
  SecureErase(key_);
  if (persisted_path_) {
    SecureEraseFile(*persisted_path_);
    persisted_path_.reset();
  }
}

// ------------------------------------------------------------
// Sealed files
// ------------------------------------------------------------

void WriteSealedFile(const std::filesystem::path& path, std::span<const uint8_t> sealed) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }

  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw util::InvalidState("cannot write " + tmp.string());
    }
    out.write(reinterpret_cast<const char*>(sealed.data()), static_cast<std::streamsize>(sealed.size()));
    out.flush();
    if (!out) {
      throw util::InvalidState("short write to " + tmp.string());
    }
  }
  std::filesystem::permissions(tmp, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write, std::filesystem::perm_options::replace);
  std::filesystem::rename(tmp, path);
}

std::vector<uint8_t> ReadSealedFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::NotFound("cannot read " + path.string());
  }
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace courier::crypto
