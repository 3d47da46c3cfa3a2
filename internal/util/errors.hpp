#pragma once

#include <stdexcept>
#include <string>

namespace courier::util {

/*
  Central error types.

  These get translated later to gRPC status codes. Per-bundle propagation
  failures never surface as exceptions; they are reported as tagged outcomes
  by the store and the node.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed wire bytes. Never partially decoded.
class DecodeError : public std::runtime_error {
 public:
  explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Failure inside the crypto backend itself (not a verification result).
class CryptoError : public std::runtime_error {
 public:
  explicit CryptoError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Ciphertext or sealed secret failed authentication.
class AuthenticationError : public std::runtime_error {
 public:
  explicit AuthenticationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Store corruption. The only error that is fatal to the node process.
class Corruption : public std::runtime_error {
 public:
  explicit Corruption(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace courier::util
