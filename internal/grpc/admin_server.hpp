#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "courier/services/v1/courier_admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace courier::grpc {

class AdminServer final : public courier::services::v1::CourierAdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<courier::service::AdminService> svc);

  ::grpc::Status Submit(::grpc::ServerContext*, const courier::admin::v1::SubmitRequest*, courier::admin::v1::SubmitResponse*) override;
  ::grpc::Status ReadDeliveries(::grpc::ServerContext*, const courier::admin::v1::ReadDeliveriesRequest*,
                                courier::admin::v1::ReadDeliveriesResponse*) override;
  ::grpc::Status Stats(::grpc::ServerContext*, const courier::admin::v1::StatsRequest*, courier::admin::v1::StatsResponse*) override;
  ::grpc::Status Health(::grpc::ServerContext*, const courier::admin::v1::HealthRequest*, courier::admin::v1::HealthResponse*) override;
  ::grpc::Status Wipe(::grpc::ServerContext*, const courier::admin::v1::WipeRequest*, courier::admin::v1::WipeResponse*) override;

 private:
  std::shared_ptr<courier::service::AdminService> service_;
};

} // namespace courier::grpc
