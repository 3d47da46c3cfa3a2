#include "admin_server.hpp"

#include "grpc_error.hpp"
#include "api/courier/v1.hpp"

namespace courier::grpc {

using namespace courier::admin::v1;

namespace {

template <typename Fn>
::grpc::Status Handle(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

AdminServer::AdminServer(std::shared_ptr<courier::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Submit(::grpc::ServerContext*, const SubmitRequest* req, SubmitResponse* resp) {
  return Handle([&] { *resp = service_->Submit(*req); });
}

::grpc::Status AdminServer::ReadDeliveries(::grpc::ServerContext*, const ReadDeliveriesRequest* req, ReadDeliveriesResponse* resp) {
  return Handle([&] { *resp = service_->ReadDeliveries(*req); });
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const StatsRequest* req, StatsResponse* resp) {
  return Handle([&] { *resp = service_->Stats(*req); });
}

::grpc::Status AdminServer::Health(::grpc::ServerContext*, const HealthRequest* req, HealthResponse* resp) {
  return Handle([&] { *resp = service_->Health(*req); });
}

::grpc::Status AdminServer::Wipe(::grpc::ServerContext*, const WipeRequest* req, WipeResponse* resp) {
  return Handle([&] { *resp = service_->Wipe(*req); });
}

} // namespace courier::grpc
