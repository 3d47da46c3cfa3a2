#include "grpc_error.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace courier::grpc {
namespace {

template <typename... Errors>
bool IsAny(const std::exception& e) {
  return (... || (dynamic_cast<const Errors*>(&e) != nullptr));
}

::grpc::StatusCode CodeFor(const std::exception& e) {
  using namespace courier::util;

  if (IsAny<InvalidArgument, DecodeError>(e)) return ::grpc::StatusCode::INVALID_ARGUMENT;
  if (IsAny<ResourceExhausted>(e)) return ::grpc::StatusCode::RESOURCE_EXHAUSTED;
  if (IsAny<InvalidState>(e)) return ::grpc::StatusCode::FAILED_PRECONDITION;
  if (IsAny<NotFound>(e)) return ::grpc::StatusCode::NOT_FOUND;
  if (IsAny<AlreadyExists>(e)) return ::grpc::StatusCode::ALREADY_EXISTS;
  if (IsAny<AuthenticationError>(e)) return ::grpc::StatusCode::PERMISSION_DENIED;
  if (IsAny<Corruption>(e)) return ::grpc::StatusCode::DATA_LOSS;
  return ::grpc::StatusCode::INTERNAL;
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  const auto code = CodeFor(e);
  if (code == ::grpc::StatusCode::INTERNAL || code == ::grpc::StatusCode::DATA_LOSS) {
    COURIER_LOG_ERROR("admin request failed", {observability::StringField("error", e.what())});
  }
  return {code, e.what()};
}

} // namespace courier::grpc
