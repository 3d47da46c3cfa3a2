#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/courier_node.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/reaper/expiry_reaper.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/store/bundle_store.hpp"

namespace courier::factory {

/*
  Runtime

  Owns all long-lived objects of one node. Everything here lives for the
  lifetime of the process; nothing is a global singleton.
*/
struct Runtime {
  std::shared_ptr<db::Repository>                repository;
  std::shared_ptr<observability::BundleCounters> counters;
  std::shared_ptr<store::BundleStore>            store;
  std::shared_ptr<reaper::ExpiryReaper>          reaper;
  std::shared_ptr<core::CourierNode>             node;
  std::shared_ptr<service::AdminService>         admin_service;
};

store::StoreOptions StoreOptionsFrom(const courier::runtime::config::RuntimeConfig& config);
core::NodeOptions   NodeOptionsFrom(const courier::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the whole node from runtime config. This is the composition
  root: the only place that knows concrete repository types. The node is
  returned stopped.
*/
Runtime Build(const courier::runtime::config::RuntimeConfig& config);

} // namespace courier::factory
