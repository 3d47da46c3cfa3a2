#include "box.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/kdf.h>

#include <string_view>

#include "aead.hpp"
#include "internal/util/errors.hpp"
#include "openssl_handles.hpp"

namespace courier::crypto {

namespace {

constexpr std::string_view kBoxInfo = "courier-box-v1";

EvpPkeyPtr PrivateKey(const SecretKey& secret) {
  if (secret.Size() != 32) {
    throw util::InvalidState("box key unavailable");
  }
  EvpPkeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr, secret.Bytes().data(), secret.Size()));
  if (!key) ThrowOpenSslError("EVP_PKEY_new_raw_private_key(x25519)");
  return key;
}

model::BoxPublicKey RawPublic(EVP_PKEY* key) {
  model::BoxPublicKey out{};
  std::size_t         len = out.size();
  if (EVP_PKEY_get_raw_public_key(key, out.data(), &len) != 1 || len != out.size()) ThrowOpenSslError("EVP_PKEY_get_raw_public_key");
  return out;
}

// Returns an erasable 32-byte ChaCha20-Poly1305 key bound to both parties.
SecretKey DeriveBoxKey(const SecretKey& own_secret, const model::BoxPublicKey& peer_public, const std::vector<uint8_t>& salt) {
  auto       own = PrivateKey(own_secret);
  EvpPkeyPtr peer(EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr, peer_public.data(), peer_public.size()));
  if (!peer) {
    ERR_clear_error();
    throw util::AuthenticationError("box: invalid peer key");
  }

  EvpPkeyCtxPtr dh(EVP_PKEY_CTX_new(own.get(), nullptr));
  if (!dh) ThrowOpenSslError("EVP_PKEY_CTX_new");
  if (EVP_PKEY_derive_init(dh.get()) != 1) ThrowOpenSslError("EVP_PKEY_derive_init");
  if (EVP_PKEY_derive_set_peer(dh.get(), peer.get()) != 1) {
    ERR_clear_error();
    throw util::AuthenticationError("box: peer key rejected");
  }

  std::vector<uint8_t> shared(32);
  std::size_t          shared_len = shared.size();
  if (EVP_PKEY_derive(dh.get(), shared.data(), &shared_len) != 1 || shared_len != shared.size()) {
    ERR_clear_error();
    throw util::AuthenticationError("box: key agreement failed");
  }
  SecretKey shared_secret(std::move(shared));

  EvpPkeyCtxPtr kdf(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
  if (!kdf) ThrowOpenSslError("EVP_PKEY_CTX_new_id(hkdf)");
  if (EVP_PKEY_derive_init(kdf.get()) != 1) ThrowOpenSslError("hkdf init");
  if (EVP_PKEY_CTX_set_hkdf_md(kdf.get(), EVP_sha256()) != 1) ThrowOpenSslError("hkdf md");
  if (EVP_PKEY_CTX_set1_hkdf_salt(kdf.get(), salt.data(), static_cast<int>(salt.size())) != 1) ThrowOpenSslError("hkdf salt");
  if (EVP_PKEY_CTX_set1_hkdf_key(kdf.get(), shared_secret.Bytes().data(), static_cast<int>(shared_secret.Size())) != 1) ThrowOpenSslError("hkdf key");
  if (EVP_PKEY_CTX_add1_hkdf_info(kdf.get(), reinterpret_cast<const unsigned char*>(kBoxInfo.data()), static_cast<int>(kBoxInfo.size())) != 1) {
    ThrowOpenSslError("hkdf info");
  }

  std::vector<uint8_t> key(kAeadKeySize);
  std::size_t          key_len = key.size();
  if (EVP_PKEY_derive(kdf.get(), key.data(), &key_len) != 1 || key_len != key.size()) ThrowOpenSslError("hkdf derive");
  return SecretKey(std::move(key));
}

std::vector<uint8_t> Transcript(const model::BoxPublicKey& sender, const model::BoxPublicKey& recipient) {
  std::vector<uint8_t> out;
  out.reserve(sender.size() + recipient.size());
  out.insert(out.end(), sender.begin(), sender.end());
  out.insert(out.end(), recipient.begin(), recipient.end());
  return out;
}

} // namespace

BoxKeyPair GenerateBoxKeyPair() {
  EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_X25519, nullptr));
  if (!ctx) ThrowOpenSslError("EVP_PKEY_CTX_new_id(x25519)");
  if (EVP_PKEY_keygen_init(ctx.get()) != 1) ThrowOpenSslError("EVP_PKEY_keygen_init");

  EVP_PKEY* raw = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) ThrowOpenSslError("EVP_PKEY_keygen");
  EvpPkeyPtr key(raw);

  std::vector<uint8_t> secret(32);
  std::size_t          len = secret.size();
  if (EVP_PKEY_get_raw_private_key(key.get(), secret.data(), &len) != 1 || len != secret.size()) ThrowOpenSslError("EVP_PKEY_get_raw_private_key");

  BoxKeyPair pair;
  pair.public_key = RawPublic(key.get());
  pair.secret     = SecretKey(std::move(secret));
  return pair;
}

BoxKeyPair BoxKeyPairFromSecret(SecretKey secret) {
  auto       key = PrivateKey(secret);
  BoxKeyPair pair;
  pair.public_key = RawPublic(key.get());
  pair.secret     = std::move(secret);
  return pair;
}

std::vector<uint8_t> EncryptFor(std::span<const uint8_t> plaintext, const model::BoxPublicKey& recipient_public, const SecretKey& sender_secret) {
  const auto sender_public = RawPublic(PrivateKey(sender_secret).get());
  const auto transcript    = Transcript(sender_public, recipient_public);
  auto       key           = DeriveBoxKey(sender_secret, recipient_public, transcript);
  return ChaChaSeal(key.Bytes(), transcript, plaintext);
}

std::vector<uint8_t> DecryptFrom(std::span<const uint8_t> ciphertext, const model::BoxPublicKey& sender_public, const SecretKey& recipient_secret) {
  const auto recipient_public = RawPublic(PrivateKey(recipient_secret).get());
  const auto transcript       = Transcript(sender_public, recipient_public);
  auto       key              = DeriveBoxKey(recipient_secret, sender_public, transcript);
  return ChaChaOpen(key.Bytes(), transcript, ciphertext);
}

} // namespace courier::crypto
