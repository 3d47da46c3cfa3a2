#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace courier::crypto {

/*
  Owned secret key material.

  Move-only. The backing buffer is allocated once and never reallocated, so
  no stray copies are left on the heap. Destruction and SecureErase() both
  overwrite the buffer before it is released.
*/
class SecretKey {
 public:
  SecretKey() = default;
  explicit SecretKey(std::vector<uint8_t> bytes);
  ~SecretKey();

  SecretKey(const SecretKey&)            = delete;
  SecretKey& operator=(const SecretKey&) = delete;

  SecretKey(SecretKey&& other) noexcept;
  SecretKey& operator=(SecretKey&& other) noexcept;

  static SecretKey Random(std::size_t size);

  // Empty once erased.
  std::span<const uint8_t> Bytes() const {
    return bytes_;
  }

  std::size_t Size() const {
    return bytes_.size();
  }

  bool Empty() const {
    return bytes_.empty();
  }

  bool Erased() const {
    return erased_;
  }

  void SecureErase();

 private:
  std::vector<uint8_t> bytes_;
  bool                 erased_ = false;
};

// Zero, random, zero passes over the buffer.
void OverwriteMemory(std::span<uint8_t> buffer);

void SecureErase(SecretKey& key);

// Overwrites the file contents with zero/random/zero passes (fsync after
// each), unlinks it and fsyncs the parent directory. Missing files are a no-op.
void SecureEraseFile(const std::filesystem::path& path);

} // namespace courier::crypto
