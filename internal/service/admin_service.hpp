#pragma once

#include "api/courier/v1.hpp"
#include "service_context.hpp"

namespace courier::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  courier::admin::v1::SubmitResponse         Submit(const courier::admin::v1::SubmitRequest& req);
  courier::admin::v1::ReadDeliveriesResponse ReadDeliveries(const courier::admin::v1::ReadDeliveriesRequest& req);
  courier::admin::v1::StatsResponse          Stats(const courier::admin::v1::StatsRequest& req);
  courier::admin::v1::HealthResponse         Health(const courier::admin::v1::HealthRequest& req);
  courier::admin::v1::WipeResponse           Wipe(const courier::admin::v1::WipeRequest& req);

 private:
  uint64_t Now() const;

  ServiceContext ctx_;
};

} // namespace courier::service
