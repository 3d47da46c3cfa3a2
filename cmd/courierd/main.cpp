#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/codec/bundle_codec.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/errors.hpp"

namespace {

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

void ShutdownObservability() {
  courier::observability::ShutdownLogging();
  courier::observability::ShutdownMetrics();
  courier::observability::ShutdownTracing();
}

courier::runtime::ServerOptions ServerOptionsFrom(const courier::runtime::config::RuntimeConfig& config) {
  courier::runtime::ServerOptions options;
  if (!config.server().bind_address().empty()) {
    options.bind_address = config.server().bind_address();
  }
  // payload plus envelope fields
  const auto max_payload = config.store().max_payload_bytes() > 0 ? config.store().max_payload_bytes() : courier::codec::kMaxPayloadBytes;
  options.max_receive_bytes = static_cast<int>(max_payload) + 64 * 1024;
  return options;
}

// Runs until a signal arrives or the store reports corruption. Returns the
// process exit code.
int Serve(courier::factory::Runtime& runtime, courier::runtime::Server& server) {
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  runtime.node->Start();
  server.Start();
  COURIER_LOG_INFO("courierd started", {courier::observability::IdField("node_id", runtime.node->NodeId()),
                                        courier::observability::IntField("admin_port", server.Port())});

  int exit_code = 0;
  while (g_running) {
    std::this_thread::sleep_for(std::chrono::seconds(1));
    if (runtime.node->Health().store_failed) {
      COURIER_LOG_ERROR("store failed, exiting");
      exit_code = 2;
      break;
    }
  }

  COURIER_LOG_INFO("courierd stopping");
  server.Stop();
  runtime.node->Stop();
  return exit_code;
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "usage: courierd [--config] <courier.yaml>" << std::endl;
    return 1;
  }

  int exit_code = 0;
  try {
    const auto config = courier::config::ConfigLoader::LoadFromYaml(config_path);
    courier::observability::InitializeTracing(config);
    courier::observability::InitializeMetrics(config);
    courier::observability::InitializeLogging(config);

    auto runtime = courier::factory::Build(config);

    std::vector<std::unique_ptr<grpc::Service>> services;
    services.push_back(std::make_unique<courier::grpc::AdminServer>(runtime.admin_service));
    courier::runtime::Server server(ServerOptionsFrom(config), std::move(services));

    exit_code = Serve(runtime, server);
  } catch (const courier::util::Corruption& e) {
    COURIER_LOG_ERROR("store corruption", {courier::observability::StringField("error", e.what())});
    exit_code = 2;
  } catch (const std::exception& e) {
    COURIER_LOG_ERROR("fatal", {courier::observability::StringField("error", e.what())});
    exit_code = 2;
  }

  ShutdownObservability();
  return exit_code;
}
