#include "digest.hpp"

#include <openssl/rand.h>

#include "openssl_handles.hpp"

namespace courier::crypto {

Sha256Digest Sha256(std::span<const uint8_t> data) {
  EvpMdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) ThrowOpenSslError("EVP_MD_CTX_new");

  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) ThrowOpenSslError("EVP_DigestInit_ex");
  if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) ThrowOpenSslError("EVP_DigestUpdate");

  Sha256Digest out{};
  unsigned int out_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1 || out_len != out.size()) ThrowOpenSslError("EVP_DigestFinal_ex");
  return out;
}

void RandomFill(std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }
  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    ThrowOpenSslError("RAND_bytes");
  }
}

} // namespace courier::crypto
