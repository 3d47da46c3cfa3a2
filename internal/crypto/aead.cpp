#include "aead.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>

#include "digest.hpp"
#include "internal/util/errors.hpp"
#include "openssl_handles.hpp"

namespace courier::crypto {

std::vector<uint8_t> AeadSeal(const EVP_CIPHER* cipher, std::span<const uint8_t> key, std::span<const uint8_t> nonce, std::span<const uint8_t> aad,
                              std::span<const uint8_t> plaintext) {
  if (key.size() != kAeadKeySize || nonce.size() != kAeadNonceSize) {
    throw util::CryptoError("aead: bad key or nonce size");
  }

  EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) ThrowOpenSslError("EVP_CIPHER_CTX_new");

  if (EVP_EncryptInit_ex(ctx.get(), cipher, nullptr, nullptr, nullptr) != 1) ThrowOpenSslError("EVP_EncryptInit_ex");
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1) ThrowOpenSslError("set ivlen");
  if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) ThrowOpenSslError("EVP_EncryptInit_ex key");

  int len = 0;
  if (!aad.empty() && EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) ThrowOpenSslError("aad");

  std::vector<uint8_t> out(plaintext.size() + kAeadTagSize);
  int                  written = 0;
  if (!plaintext.empty()) {
    if (EVP_EncryptUpdate(ctx.get(), out.data(), &len, plaintext.data(), static_cast<int>(plaintext.size())) != 1) ThrowOpenSslError("EVP_EncryptUpdate");
    written = len;
  }
  if (EVP_EncryptFinal_ex(ctx.get(), out.data() + written, &len) != 1) ThrowOpenSslError("EVP_EncryptFinal_ex");
  written += len;

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(kAeadTagSize), out.data() + written) != 1) ThrowOpenSslError("get tag");
  out.resize(static_cast<std::size_t>(written) + kAeadTagSize);
  return out;
}

std::vector<uint8_t> AeadOpen(const EVP_CIPHER* cipher, std::span<const uint8_t> key, std::span<const uint8_t> nonce, std::span<const uint8_t> aad,
                              std::span<const uint8_t> ciphertext_and_tag) {
  if (key.size() != kAeadKeySize || nonce.size() != kAeadNonceSize) {
    throw util::CryptoError("aead: bad key or nonce size");
  }
  if (ciphertext_and_tag.size() < kAeadTagSize) {
    throw util::AuthenticationError("aead: ciphertext too short");
  }

  const auto ciphertext = ciphertext_and_tag.first(ciphertext_and_tag.size() - kAeadTagSize);
  auto       tag        = std::vector<uint8_t>(ciphertext_and_tag.end() - kAeadTagSize, ciphertext_and_tag.end());

  EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) ThrowOpenSslError("EVP_CIPHER_CTX_new");

  if (EVP_DecryptInit_ex(ctx.get(), cipher, nullptr, nullptr, nullptr) != 1) ThrowOpenSslError("EVP_DecryptInit_ex");
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1) ThrowOpenSslError("set ivlen");
  if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) ThrowOpenSslError("EVP_DecryptInit_ex key");

  int len = 0;
  if (!aad.empty() && EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) ThrowOpenSslError("aad");

  std::vector<uint8_t> out(ciphertext.size() + kAeadTagSize);
  int                  written = 0;
  if (!ciphertext.empty()) {
    if (EVP_DecryptUpdate(ctx.get(), out.data(), &len, ciphertext.data(), static_cast<int>(ciphertext.size())) != 1) ThrowOpenSslError("EVP_DecryptUpdate");
    written = len;
  }

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(kAeadTagSize), tag.data()) != 1) ThrowOpenSslError("set tag");
  if (EVP_DecryptFinal_ex(ctx.get(), out.data() + written, &len) != 1) {
    ERR_clear_error();
    OPENSSL_cleanse(out.data(), out.size());
    throw util::AuthenticationError("aead: authentication failed");
  }
  written += len;
  out.resize(static_cast<std::size_t>(written));
  return out;
}

std::vector<uint8_t> ChaChaSeal(std::span<const uint8_t> key, std::span<const uint8_t> aad, std::span<const uint8_t> plaintext) {
  std::vector<uint8_t> nonce(kAeadNonceSize);
  RandomFill(nonce);

  auto sealed = AeadSeal(EVP_chacha20_poly1305(), key, nonce, aad, plaintext);

  std::vector<uint8_t> out;
  out.reserve(nonce.size() + sealed.size());
  out.insert(out.end(), nonce.begin(), nonce.end());
  out.insert(out.end(), sealed.begin(), sealed.end());
  return out;
}

std::vector<uint8_t> ChaChaOpen(std::span<const uint8_t> key, std::span<const uint8_t> aad, std::span<const uint8_t> sealed) {
  if (sealed.size() < kAeadNonceSize + kAeadTagSize) {
    throw util::AuthenticationError("aead: sealed payload too short");
  }
  return AeadOpen(EVP_chacha20_poly1305(), key, sealed.first(kAeadNonceSize), aad, sealed.subspan(kAeadNonceSize));
}

} // namespace courier::crypto
