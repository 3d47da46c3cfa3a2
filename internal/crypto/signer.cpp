#include "signer.hpp"

#include <openssl/err.h>

#include "internal/util/errors.hpp"
#include "openssl_handles.hpp"

namespace courier::crypto {

namespace {

EvpPkeyPtr PrivateKey(const SecretKey& secret) {
  if (secret.Size() != 32) {
    throw util::InvalidState("signing key unavailable");
  }
  EvpPkeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, secret.Bytes().data(), secret.Size()));
  if (!key) ThrowOpenSslError("EVP_PKEY_new_raw_private_key(ed25519)");
  return key;
}

model::SigningPublicKey RawPublic(EVP_PKEY* key) {
  model::SigningPublicKey out{};
  std::size_t             len = out.size();
  if (EVP_PKEY_get_raw_public_key(key, out.data(), &len) != 1 || len != out.size()) ThrowOpenSslError("EVP_PKEY_get_raw_public_key");
  return out;
}

} // namespace

SigningKeyPair GenerateSigningKeyPair() {
  EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
  if (!ctx) ThrowOpenSslError("EVP_PKEY_CTX_new_id(ed25519)");
  if (EVP_PKEY_keygen_init(ctx.get()) != 1) ThrowOpenSslError("EVP_PKEY_keygen_init");

  EVP_PKEY* raw = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) ThrowOpenSslError("EVP_PKEY_keygen");
  EvpPkeyPtr key(raw);

  std::vector<uint8_t> secret(32);
  std::size_t          len = secret.size();
  if (EVP_PKEY_get_raw_private_key(key.get(), secret.data(), &len) != 1 || len != secret.size()) ThrowOpenSslError("EVP_PKEY_get_raw_private_key");

  SigningKeyPair pair;
  pair.public_key = RawPublic(key.get());
  pair.secret     = SecretKey(std::move(secret));
  return pair;
}

SigningKeyPair SigningKeyPairFromSecret(SecretKey secret) {
  auto           key = PrivateKey(secret);
  SigningKeyPair pair;
  pair.public_key = RawPublic(key.get());
  pair.secret     = std::move(secret);
  return pair;
}

model::Signature Sign(std::span<const uint8_t> message, const SecretKey& signing_key) {
  auto key = PrivateKey(signing_key);

  EvpMdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) ThrowOpenSslError("EVP_MD_CTX_new");
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) ThrowOpenSslError("EVP_DigestSignInit");

  model::Signature out{};
  std::size_t      len = out.size();
  if (EVP_DigestSign(ctx.get(), out.data(), &len, message.data(), message.size()) != 1 || len != out.size()) ThrowOpenSslError("EVP_DigestSign");
  return out;
}

bool Verify(std::span<const uint8_t> message, const model::Signature& signature, const model::SigningPublicKey& public_key) {
  EvpPkeyPtr key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(), public_key.size()));
  if (!key) {
    ERR_clear_error();
    return false;
  }

  EvpMdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) ThrowOpenSslError("EVP_MD_CTX_new");
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) ThrowOpenSslError("EVP_DigestVerifyInit");

  const int rc = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), message.data(), message.size());
  if (rc != 1) {
    ERR_clear_error();
    return false;
  }
  return true;
}

} // namespace courier::crypto
