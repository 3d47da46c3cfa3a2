#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "api/courier/v1.hpp"
#include "courier/services/v1/courier_admin_service.grpc.pb.h"

using namespace courier::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  courierctl <addr> submit <destination> <payload> [priority=emergency|expedited|normal|bulk]\n"
            << "                    [audience=public|trusted|destination-only] [ttl_seconds] [custody]\n"
            << "  courierctl <addr> deliveries [topic] [after_seq] [max]\n"
            << "  courierctl <addr> stats\n"
            << "  courierctl <addr> health\n"
            << "  courierctl <addr> wipe [--purge]\n";
}

static std::string ToHex(const std::string& bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(bytes.size() * 2);
  for (char c : bytes) {
    const auto b = static_cast<unsigned char>(c);
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

static std::optional<Priority> ParsePriority(const std::string& value) {
  if (value == "emergency") return PRIORITY_EMERGENCY;
  if (value == "expedited") return PRIORITY_EXPEDITED;
  if (value == "normal") return PRIORITY_NORMAL;
  if (value == "bulk") return PRIORITY_BULK;
  return std::nullopt;
}

static std::optional<Audience> ParseAudience(const std::string& value) {
  if (value == "public") return AUDIENCE_PUBLIC;
  if (value == "trusted") return AUDIENCE_TRUSTED;
  if (value == "destination-only") return AUDIENCE_DESTINATION_ONLY;
  return std::nullopt;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel    = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto admin_stub = CourierAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "submit") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    SubmitRequest req;
    req.set_destination(argv[3]);
    req.set_payload(argv[4]);

    if (argc >= 6) {
      auto priority = ParsePriority(argv[5]);
      if (!priority) {
        std::cerr << "unsupported priority: " << argv[5] << "\n";
        return 1;
      }
      req.set_priority(*priority);
    }
    if (argc >= 7) {
      auto audience = ParseAudience(argv[6]);
      if (!audience) {
        std::cerr << "unsupported audience: " << argv[6] << "\n";
        return 1;
      }
      req.set_audience(*audience);
    }
    if (argc >= 8) {
      req.mutable_ttl()->set_seconds(std::stoll(argv[7]));
    }
    if (argc >= 9 && std::string(argv[8]) == "custody") {
      req.set_custody_requested(true);
    }

    SubmitResponse resp;
    auto           status = admin_stub->Submit(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "id=" << ToHex(resp.id().value()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "deliveries") {
    ReadDeliveriesRequest req;
    if (argc >= 4) req.set_topic(argv[3]);
    if (argc >= 5) req.set_after_seq(std::stoull(argv[4]));
    if (argc >= 6) req.set_max_entries(static_cast<uint32_t>(std::stoul(argv[5])));

    ReadDeliveriesResponse resp;
    auto                   status = admin_stub->ReadDeliveries(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& d : resp.deliveries()) {
      std::cout << d.seq() << " " << d.topic() << " " << ToHex(d.id().value()).substr(0, 12) << " " << d.payload() << "\n";
    }
    std::cout << "next_seq=" << resp.next_seq() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;

    auto status = admin_stub->Stats(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "bundles=" << resp.bundles_stored() << "\n";
    std::cout << "bytes=" << resp.bytes_stored() << "/" << resp.capacity_bytes() << "\n";
    std::cout << "custody_held=" << resp.custody_held() << "\n";
    std::cout << "ephemeral_records=" << resp.ephemeral_records() << "\n";
    std::cout << "neighbors=" << resp.active_neighbors() << "\n";
    for (const auto& c : resp.counters()) {
      std::cout << c.event() << " " << Priority_Name(c.priority()) << " " << c.topic() << " " << c.count() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "health") {
    HealthRequest  req;
    HealthResponse resp;

    auto status = admin_stub->Health(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "status=" << resp.status() << "\n";
    std::cout << "node_id=" << resp.node_id() << "\n";
    std::cout << "neighbors=" << resp.active_neighbors() << "\n";
    return resp.healthy() ? 0 : 3;
  }

  // ------------------------------------------------------------

  if (cmd == "wipe") {
    WipeRequest req;
    req.set_purge_store(argc >= 4 && std::string(argv[3]) == "--purge");

    WipeResponse resp;
    auto         status = admin_stub->Wipe(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "keys_erased=" << (resp.keys_erased() ? "true" : "false") << "\n";
    std::cout << "bundles_removed=" << resp.bundles_removed() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
