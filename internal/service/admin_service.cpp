#include "admin_service.hpp"

#include <algorithm>
#include <chrono>
#include <limits>

#include "internal/core/courier_node.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace courier::service {

using namespace courier::v1;

namespace {

constexpr uint32_t kDefaultReadLimit = 100;
constexpr uint32_t kMaxReadLimit     = 1000;

model::Priority FromProto(courier::types::v1::Priority priority) {
  switch (priority) {
    case PRIORITY_EMERGENCY:
      return model::Priority::kEmergency;
    case PRIORITY_EXPEDITED:
      return model::Priority::kExpedited;
    case PRIORITY_BULK:
      return model::Priority::kBulk;
    case PRIORITY_NORMAL:
    case PRIORITY_UNSPECIFIED:
      return model::Priority::kNormal;
    default:
      throw util::InvalidArgument("unknown priority");
  }
}

courier::types::v1::Priority ToProto(model::Priority priority) {
  switch (priority) {
    case model::Priority::kEmergency:
      return PRIORITY_EMERGENCY;
    case model::Priority::kExpedited:
      return PRIORITY_EXPEDITED;
    case model::Priority::kNormal:
      return PRIORITY_NORMAL;
    case model::Priority::kBulk:
      return PRIORITY_BULK;
  }
  return PRIORITY_UNSPECIFIED;
}

model::Audience FromProto(courier::types::v1::Audience audience) {
  switch (audience) {
    case AUDIENCE_TRUSTED:
      return model::Audience::kTrusted;
    case AUDIENCE_DESTINATION_ONLY:
      return model::Audience::kDestinationOnly;
    case AUDIENCE_PUBLIC:
    case AUDIENCE_UNSPECIFIED:
      return model::Audience::kPublic;
    default:
      throw util::InvalidArgument("unknown audience");
  }
}

courier::types::v1::Audience ToProto(model::Audience audience) {
  switch (audience) {
    case model::Audience::kPublic:
      return AUDIENCE_PUBLIC;
    case model::Audience::kTrusted:
      return AUDIENCE_TRUSTED;
    case model::Audience::kDestinationOnly:
      return AUDIENCE_DESTINATION_ONLY;
  }
  return AUDIENCE_UNSPECIFIED;
}

/*
  Span, request metrics and error logging shared by every RPC.
*/
template <typename Fn>
auto Instrumented(const char* route, Fn&& fn) {
  observability::SpanScope span(route);
  const auto               started_at = std::chrono::steady_clock::now();
  const auto               elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    auto resp = fn();
    observability::Metrics::Instance().RecordAdminRequest(route, true, elapsed_ms());
    return resp;
  } catch (const std::exception& ex) {
    span.Fail(ex.what());
    COURIER_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what())});
    observability::Metrics::Instance().RecordAdminRequest(route, false, elapsed_ms());
    throw;
  }
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.node) {
    throw std::invalid_argument("admin service requires a node");
  }
  if (!ctx_.clock) {
    ctx_.clock = [] { return util::NowMillis(); };
  }
}

uint64_t AdminService::Now() const {
  return ctx_.clock();
}

SubmitResponse AdminService::Submit(const SubmitRequest& req) {
  return Instrumented("AdminService.Submit", [&] {
    core::SubmitRequest request;
    request.destination = req.destination();
    request.topic       = req.topic();
    request.plaintext.assign(req.payload().begin(), req.payload().end());
    request.priority          = FromProto(req.priority());
    request.audience          = FromProto(req.audience());
    request.ttl               = req.has_ttl() ? util::DurationOr(req.ttl(), std::chrono::milliseconds(0)) : std::chrono::milliseconds(0);
    request.custody_requested = req.custody_requested();
    if (req.hop_limit() > std::numeric_limits<uint16_t>::max()) {
      throw util::InvalidArgument("hop_limit out of range");
    }
    request.hop_limit = static_cast<uint16_t>(req.hop_limit());

    const auto id = ctx_.node->Submit(request, Now());

    SubmitResponse resp;
    resp.mutable_id()->set_value(std::string(id.begin(), id.end()));
    return resp;
  });
}

ReadDeliveriesResponse AdminService::ReadDeliveries(const ReadDeliveriesRequest& req) {
  return Instrumented("AdminService.ReadDeliveries", [&] {
    const uint32_t limit = req.max_entries() == 0 ? kDefaultReadLimit : std::min(req.max_entries(), kMaxReadLimit);

    ReadDeliveriesResponse resp;
    uint64_t               next = req.after_seq();
    for (auto& d : ctx_.node->Deliveries().Read(req.topic(), req.after_seq(), limit, Now())) {
      auto* out = resp.add_deliveries();
      out->set_seq(d.seq);
      out->mutable_id()->set_value(std::string(d.id.begin(), d.id.end()));
      out->set_topic(d.topic);
      out->set_priority(ToProto(d.priority));
      out->set_audience(ToProto(d.audience));
      *out->mutable_created_at() = util::MillisToProto(d.created_at_ms);
      out->set_source_node(d.source);
      out->set_payload(std::string(d.plaintext.begin(), d.plaintext.end()));
      next = d.seq;
    }
    resp.set_next_seq(next);
    return resp;
  });
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return Instrumented("AdminService.Stats", [&] {
    const auto stats = ctx_.node->Stats();

    StatsResponse resp;
    resp.set_bundles_stored(stats.store.bundles);
    resp.set_bytes_stored(stats.store.bytes);
    resp.set_capacity_bytes(stats.store.capacity_bytes);
    resp.set_custody_held(stats.store.custody_held);
    resp.set_ephemeral_records(stats.store.ephemeral_records);
    resp.set_active_neighbors(static_cast<uint32_t>(stats.active_neighbors));
    for (const auto& entry : stats.counters) {
      auto* out = resp.add_counters();
      out->set_event(std::string(observability::ToString(entry.event)));
      out->set_priority(ToProto(entry.priority));
      out->set_topic(entry.topic);
      out->set_count(entry.count);
    }
    return resp;
  });
}

HealthResponse AdminService::Health(const HealthRequest&) {
  return Instrumented("AdminService.Health", [&] {
    const auto health = ctx_.node->Health();

    HealthResponse resp;
    resp.set_healthy(health.serving);
    resp.set_node_id(ctx_.node->NodeId());
    resp.set_identity_available(health.identity_available);
    resp.set_trusted_group_loaded(health.trusted_group_loaded);
    resp.set_active_neighbors(static_cast<uint32_t>(health.active_neighbors));
    if (health.store_failed) {
      resp.set_status("store failed");
    } else if (!health.identity_available) {
      resp.set_status("wiped");
    } else {
      resp.set_status(health.serving ? "serving" : "stopped");
    }
    return resp;
  });
}

WipeResponse AdminService::Wipe(const WipeRequest& req) {
  return Instrumented("AdminService.Wipe", [&] {
    const auto removed = ctx_.node->Wipe(req.purge_store());

    WipeResponse resp;
    resp.set_keys_erased(!ctx_.node->Health().identity_available);
    resp.set_bundles_removed(removed);
    return resp;
  });
}

} // namespace courier::service
