#pragma once

#include <string>
#include <string_view>

namespace courier::db {

/*
  Backend-neutral outcome of a repository write.

  Sqlite result codes stop at the repository; the store maps these onto
  the util:: exception family.
*/
enum class ErrorCode {
  kOk = 0,
  kNotFound,
  kAlreadyExists,
  kConflict,
  kBusy,
  kConstraintViolation,
  kIOError,
  kCorruption,
  kInternalError,
};

inline std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk: return "ok";
    case ErrorCode::kNotFound: return "not found";
    case ErrorCode::kAlreadyExists: return "already exists";
    case ErrorCode::kConflict: return "conflict";
    case ErrorCode::kBusy: return "busy";
    case ErrorCode::kConstraintViolation: return "constraint violation";
    case ErrorCode::kIOError: return "io error";
    case ErrorCode::kCorruption: return "corruption";
    case ErrorCode::kInternalError: return "internal error";
  }
  return "unknown";
}

struct Result {
  ErrorCode   code = ErrorCode::kOk;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  // "<context>: <code>[: <backend message>]"
  std::string Describe(std::string_view context) const {
    std::string out(context);
    out += ": ";
    out += ToString(code);
    if (!message.empty()) {
      out += ": " + message;
    }
    return out;
  }

  explicit operator bool() const {
    return code == ErrorCode::kOk;
  }
};

} // namespace courier::db
