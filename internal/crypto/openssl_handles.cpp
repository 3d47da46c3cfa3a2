#include "openssl_handles.hpp"

#include <openssl/err.h>

#include <string>

#include "internal/util/errors.hpp"

namespace courier::crypto {

void ThrowOpenSslError(const char* what) {
  std::string   message = what;
  unsigned long code    = ERR_get_error();
  if (code != 0) {
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    message += ": ";
    message += buf;
  }
  ERR_clear_error();
  throw util::CryptoError(message);
}

} // namespace courier::crypto
