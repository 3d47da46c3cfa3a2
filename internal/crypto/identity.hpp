#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "internal/crypto/box.hpp"
#include "internal/crypto/secret_box.hpp"
#include "internal/crypto/signer.hpp"

namespace courier::crypto {

/*
  NodeIdentity

  The node's Ed25519 signing pair and X25519 box pair. Persisted sealed with
  the local secret box. After Wipe() every operation that needs a private
  key throws util::InvalidState; public keys remain readable.
*/
class NodeIdentity {
 public:
  NodeIdentity(SigningKeyPair signing, BoxKeyPair box);

  static std::shared_ptr<NodeIdentity> Generate();

  // Opens the sealed identity at path, or generates and persists a new one.
  static std::shared_ptr<NodeIdentity> LoadOrCreate(const std::filesystem::path& path, std::string_view passphrase, const ScryptParams& params = {});

  void Save(const std::filesystem::path& path, std::string_view passphrase, const ScryptParams& params = {});

  const model::SigningPublicKey& SigningKey() const {
    return signing_public_;
  }

  const model::BoxPublicKey& BoxKey() const {
    return box_public_;
  }

  std::string NodeId() const;

  bool Available() const;

  model::Signature Sign(std::span<const uint8_t> message) const;

  std::vector<uint8_t> EncryptFor(std::span<const uint8_t> plaintext, const model::BoxPublicKey& recipient) const;
  std::vector<uint8_t> DecryptFrom(std::span<const uint8_t> ciphertext, const model::BoxPublicKey& sender) const;

  // Emergency wipe: secure-erase both private keys and the persisted file.
  void Wipe();

 private:
  const model::SigningPublicKey signing_public_;
  const model::BoxPublicKey     box_public_;

  mutable std::mutex                   mutex_;
  SigningKeyPair                       signing_;
  BoxKeyPair                           box_;
  std::optional<std::filesystem::path> persisted_path_;
  bool                                 wiped_ = false;
};

/*
  Symmetric key shared by the trusted audience. Loaded from a sealed file;
  distribution between members happens out of band.
*/
class GroupKey {
 public:
  explicit GroupKey(SecretKey key, std::optional<std::filesystem::path> persisted_path = std::nullopt);

  static std::shared_ptr<GroupKey> Generate();
  static std::shared_ptr<GroupKey> Load(const std::filesystem::path& path, std::string_view passphrase);

  void Save(const std::filesystem::path& path, std::string_view passphrase, const ScryptParams& params = {});

  bool Available() const;

  // ChaCha20-Poly1305 under the group key: nonce || ciphertext || tag.
  std::vector<uint8_t> Seal(std::span<const uint8_t> aad, std::span<const uint8_t> plaintext) const;
  std::vector<uint8_t> Open(std::span<const uint8_t> aad, std::span<const uint8_t> sealed) const;

  void Wipe();

 private:
  mutable std::mutex                   mutex_;
  SecretKey                            key_;
  std::optional<std::filesystem::path> persisted_path_;
};

// Atomic write (temp file + rename) with owner-only permissions.
void WriteSealedFile(const std::filesystem::path& path, std::span<const uint8_t> sealed);
std::vector<uint8_t> ReadSealedFile(const std::filesystem::path& path);

} // namespace courier::crypto
