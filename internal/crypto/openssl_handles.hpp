#pragma once

#include <openssl/evp.h>

#include <memory>

namespace courier::crypto {

/*
  unique_ptr owners for OpenSSL handles.
*/

struct EvpPkeyDeleter {
  void operator()(EVP_PKEY* key) const {
    EVP_PKEY_free(key);
  }
};

struct EvpPkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* ctx) const {
    EVP_PKEY_CTX_free(ctx);
  }
};

struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

struct EvpCipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const {
    EVP_CIPHER_CTX_free(ctx);
  }
};

using EvpPkeyPtr      = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using EvpPkeyCtxPtr   = std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter>;
using EvpMdCtxPtr     = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;
using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EvpCipherCtxDeleter>;

// Throws util::CryptoError carrying the OpenSSL error queue text.
[[noreturn]] void ThrowOpenSslError(const char* what);

} // namespace courier::crypto
