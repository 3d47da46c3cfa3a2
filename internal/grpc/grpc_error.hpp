#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace courier::grpc {

/*
  Maps the util:: exception family onto admin API status codes. A refused
  submission because the store is full is RESOURCE_EXHAUSTED so clients can
  retry later; a wiped node answers FAILED_PRECONDITION. Anything outside
  the family is INTERNAL and is logged.
*/
::grpc::Status ToStatus(const std::exception& e);

} // namespace courier::grpc
