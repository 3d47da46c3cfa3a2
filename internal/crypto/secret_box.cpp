#include "secret_box.hpp"

#include <openssl/evp.h>
#include <openssl/kdf.h>

#include <algorithm>
#include <array>

#include "aead.hpp"
#include "digest.hpp"
#include "internal/util/errors.hpp"
#include "openssl_handles.hpp"

namespace courier::crypto {

namespace {

constexpr std::array<uint8_t, 4> kMagic = {'C', 'S', 'B', '1'};
constexpr std::size_t            kSaltSize   = 16;
constexpr std::size_t            kHeaderSize = kMagic.size() + 1 + 4 + 4 + kSaltSize;
constexpr uint8_t                kMaxLog2N   = 20;
constexpr uint64_t               kMaxMemory  = 256ull * 1024 * 1024;

void PutU32(std::vector<uint8_t>& out, uint32_t v) {
  out.push_back(static_cast<uint8_t>(v >> 24));
  out.push_back(static_cast<uint8_t>(v >> 16));
  out.push_back(static_cast<uint8_t>(v >> 8));
  out.push_back(static_cast<uint8_t>(v));
}

uint32_t GetU32(std::span<const uint8_t> in) {
  return (static_cast<uint32_t>(in[0]) << 24) | (static_cast<uint32_t>(in[1]) << 16) | (static_cast<uint32_t>(in[2]) << 8) | in[3];
}

SecretKey DeriveKey(std::string_view passphrase, std::span<const uint8_t> salt, const ScryptParams& params) {
  if (params.log2_n == 0 || params.log2_n > kMaxLog2N || params.r == 0 || params.p == 0) {
    throw util::InvalidArgument("secret box: scrypt parameters out of range");
  }

  std::vector<uint8_t> key(kAeadKeySize);
  if (EVP_PBE_scrypt(passphrase.data(), passphrase.size(), salt.data(), salt.size(), uint64_t{1} << params.log2_n, params.r, params.p, kMaxMemory,
                     key.data(), key.size()) != 1) {
    ThrowOpenSslError("EVP_PBE_scrypt");
  }
  return SecretKey(std::move(key));
}

} // namespace

std::vector<uint8_t> SealSecret(std::span<const uint8_t> plaintext, std::string_view passphrase, const ScryptParams& params) {
  std::vector<uint8_t> header(kMagic.begin(), kMagic.end());
  header.push_back(params.log2_n);
  PutU32(header, params.r);
  PutU32(header, params.p);

  std::array<uint8_t, kSaltSize> salt{};
  RandomFill(salt);
  header.insert(header.end(), salt.begin(), salt.end());

  std::array<uint8_t, kAeadNonceSize> nonce{};
  RandomFill(nonce);

  auto key    = DeriveKey(passphrase, salt, params);
  auto sealed = AeadSeal(EVP_aes_256_gcm(), key.Bytes(), nonce, header, plaintext);

  std::vector<uint8_t> out = header;
  out.insert(out.end(), nonce.begin(), nonce.end());
  out.insert(out.end(), sealed.begin(), sealed.end());
  return out;
}

SecretKey OpenSecret(std::span<const uint8_t> sealed, std::string_view passphrase) {
  if (sealed.size() < kHeaderSize + kAeadNonceSize + kAeadTagSize) {
    throw util::DecodeError("secret box: truncated");
  }
  if (!std::equal(kMagic.begin(), kMagic.end(), sealed.begin())) {
    throw util::DecodeError("secret box: bad magic");
  }

  ScryptParams params;
  params.log2_n = sealed[4];
  params.r      = GetU32(sealed.subspan(5, 4));
  params.p      = GetU32(sealed.subspan(9, 4));
  if (params.log2_n == 0 || params.log2_n > kMaxLog2N || params.r == 0 || params.p == 0) {
    throw util::DecodeError("secret box: scrypt parameters out of range");
  }

  const auto header = sealed.first(kHeaderSize);
  const auto salt   = header.subspan(kHeaderSize - kSaltSize);
  const auto nonce  = sealed.subspan(kHeaderSize, kAeadNonceSize);
  const auto body   = sealed.subspan(kHeaderSize + kAeadNonceSize);

  auto key = DeriveKey(passphrase, salt, params);
  return SecretKey(AeadOpen(EVP_aes_256_gcm(), key.Bytes(), nonce, header, body));
}

} // namespace courier::crypto
