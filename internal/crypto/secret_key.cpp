#include "secret_key.hpp"

#include <fcntl.h>
#include <openssl/crypto.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <string>
#include <system_error>

#include "digest.hpp"

namespace courier::crypto {

namespace {

class FileDescriptor {
 public:
  explicit FileDescriptor(int fd) : fd_(fd) {
  }
  ~FileDescriptor() {
    if (fd_ >= 0) ::close(fd_);
  }

  FileDescriptor(const FileDescriptor&)            = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  int Get() const {
    return fd_;
  }

 private:
  int fd_;
};

[[noreturn]] void ThrowErrno(const std::string& what) {
  throw std::system_error(errno, std::generic_category(), what);
}

void FsyncOrThrow(int fd, const std::string& what) {
  if (::fsync(fd) != 0) ThrowErrno(what);
}

void WritePass(int fd, std::size_t size, bool random, const std::filesystem::path& path) {
  if (::lseek(fd, 0, SEEK_SET) < 0) ThrowErrno("lseek " + path.string());

  std::vector<uint8_t> block(4096, 0);
  std::size_t          remaining = size;
  while (remaining > 0) {
    const std::size_t chunk = std::min(remaining, block.size());
    if (random) {
      RandomFill(std::span<uint8_t>(block.data(), chunk));
    }
    std::size_t offset = 0;
    while (offset < chunk) {
      const auto written = ::write(fd, block.data() + offset, chunk - offset);
      if (written < 0) {
        if (errno == EINTR) continue;
        ThrowErrno("write " + path.string());
      }
      offset += static_cast<std::size_t>(written);
    }
    remaining -= chunk;
  }
  FsyncOrThrow(fd, "fsync " + path.string());
}

} // namespace

SecretKey::SecretKey(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {
}

SecretKey::~SecretKey() {
  if (!bytes_.empty()) {
    OPENSSL_cleanse(bytes_.data(), bytes_.size());
  }
}

SecretKey::SecretKey(SecretKey&& other) noexcept : bytes_(std::move(other.bytes_)), erased_(other.erased_) {
  other.bytes_.clear();
}

SecretKey& SecretKey::operator=(SecretKey&& other) noexcept {
  if (this != &other) {
    if (!bytes_.empty()) {
      OPENSSL_cleanse(bytes_.data(), bytes_.size());
    }
    bytes_  = std::move(other.bytes_);
    erased_ = other.erased_;
    other.bytes_.clear();
  }
  return *this;
}

SecretKey SecretKey::Random(std::size_t size) {
  std::vector<uint8_t> bytes(size);
  RandomFill(bytes);
  return SecretKey(std::move(bytes));
}

void SecretKey::SecureErase() {
  OverwriteMemory(bytes_);
  // swap with an empty vector so the (already overwritten) block is freed
  std::vector<uint8_t>().swap(bytes_);
  erased_ = true;
}

void OverwriteMemory(std::span<uint8_t> buffer) {
  if (buffer.empty()) {
    return;
  }
  OPENSSL_cleanse(buffer.data(), buffer.size());
  RandomFill(buffer);
  OPENSSL_cleanse(buffer.data(), buffer.size());
}

void SecureErase(SecretKey& key) {
  key.SecureErase();
}

void SecureEraseFile(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return;
  }

  {
    FileDescriptor fd(::open(path.c_str(), O_WRONLY | O_CLOEXEC));
    if (fd.Get() < 0) ThrowErrno("open " + path.string());

    struct stat st {};
    if (::fstat(fd.Get(), &st) != 0) ThrowErrno("fstat " + path.string());
    const auto size = static_cast<std::size_t>(st.st_size);

    WritePass(fd.Get(), size, false, path);
    WritePass(fd.Get(), size, true, path);
    WritePass(fd.Get(), size, false, path);
  }

  if (::unlink(path.c_str()) != 0) ThrowErrno("unlink " + path.string());

  auto parent = path.parent_path();
  if (parent.empty()) {
    parent = ".";
  }
  FileDescriptor dir(::open(parent.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
  if (dir.Get() < 0) ThrowErrno("open " + parent.string());
  FsyncOrThrow(dir.Get(), "fsync " + parent.string());
}

} // namespace courier::crypto
