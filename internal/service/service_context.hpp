#pragma once

#include <cstdint>
#include <functional>
#include <memory>

namespace courier::core {
class CourierNode;
}

namespace courier::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<courier::core::CourierNode> node;

  // unix ms; tests pin it
  std::function<uint64_t()> clock;
};

} // namespace courier::service
