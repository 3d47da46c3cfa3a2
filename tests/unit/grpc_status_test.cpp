#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "api/courier/v1.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_nodes.hpp"

namespace {

using namespace courier::v1;

struct Server {
  courier::testing::TestNode                  test_node;
  std::shared_ptr<courier::core::CourierNode> node;
  std::unique_ptr<courier::grpc::AdminServer> admin;

  explicit Server(courier::store::StoreOptions store_options = {}) {
    test_node = courier::testing::MakeNode({}, nullptr, store_options);
    node      = std::move(test_node.node);
    admin     = std::make_unique<courier::grpc::AdminServer>(
        std::make_shared<courier::service::AdminService>(courier::service::ServiceContext{.node = node, .clock = [] { return uint64_t{1'000'000}; }}));
  }
};

SubmitRequest Submission(const std::string& destination) {
  SubmitRequest req;
  req.set_destination(destination);
  req.set_payload("payload");
  return req;
}

void TestBadDestinationReturnsInvalidArgument() {
  Server                s;
  const auto            req = Submission("not-a-destination");
  SubmitResponse        resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = s.admin->Submit(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestUnknownAudienceReturnsInvalidArgument() {
  Server s;
  auto   req = Submission("topic://mesh/alerts");
  req.set_audience(static_cast<courier::types::v1::Audience>(999));

  SubmitResponse        resp;
  ::grpc::ServerContext grpc_ctx;
  const auto            status = s.admin->Submit(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestFullStoreReturnsResourceExhausted() {
  courier::store::StoreOptions options;
  options.capacity_bytes      = 16;
  options.hard_capacity_bytes = 16;
  Server s(options);

  SubmitResponse        resp;
  ::grpc::ServerContext grpc_ctx;
  const auto            req    = Submission("topic://mesh/alerts");
  const auto            status = s.admin->Submit(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
}

void TestSubmitAfterWipeReturnsFailedPrecondition() {
  Server s;

  WipeRequest           wipe;
  WipeResponse          wiped;
  ::grpc::ServerContext wipe_ctx;
  assert(s.admin->Wipe(&wipe_ctx, &wipe, &wiped).ok());
  assert(wiped.keys_erased());

  SubmitResponse        resp;
  ::grpc::ServerContext grpc_ctx;
  const auto            req    = Submission("topic://mesh/alerts");
  const auto            status = s.admin->Submit(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestHealthIsOk() {
  Server                s;
  HealthRequest         req;
  HealthResponse        resp;
  ::grpc::ServerContext grpc_ctx;
  assert(s.admin->Health(&grpc_ctx, &req, &resp).ok());
  assert(resp.node_id() == s.node->NodeId());
}

void TestErrorMapping() {
  using courier::grpc::ToStatus;
  assert(ToStatus(courier::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(courier::util::AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(courier::util::DecodeError("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(courier::util::AuthenticationError("x")).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(ToStatus(courier::util::Corruption("x")).error_code() == ::grpc::StatusCode::DATA_LOSS);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
}

} // namespace

int main() {
  TestBadDestinationReturnsInvalidArgument();
  TestUnknownAudienceReturnsInvalidArgument();
  TestFullStoreReturnsResourceExhausted();
  TestSubmitAfterWipeReturnsFailedPrecondition();
  TestHealthIsOk();
  TestErrorMapping();

  std::cout << "courier_unit_grpc_status: pass\n";
  return 0;
}
