#include "server.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace courier::runtime {

Server::Server(ServerOptions options, std::vector<std::unique_ptr<grpc::Service>> services)
    : options_(std::move(options)), services_(std::move(services)) {
  if (options_.bind_address.empty()) {
    options_.bind_address = ServerOptions{}.bind_address;
  }
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  if (grpc_server_) {
    throw util::InvalidState("admin server already started");
  }

  grpc::ServerBuilder builder;
  builder.AddListeningPort(options_.bind_address, grpc::InsecureServerCredentials(), &port_);
  builder.SetMaxReceiveMessageSize(options_.max_receive_bytes);
  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || port_ == 0) {
    grpc_server_.reset();
    throw std::runtime_error("admin server cannot listen on " + options_.bind_address);
  }

  COURIER_LOG_INFO("admin server listening", {observability::StringField("bind_address", options_.bind_address), observability::IntField("port", port_)});
}

void Server::Stop() {
  if (!grpc_server_) {
    return;
  }
  grpc_server_->Shutdown();
  grpc_server_.reset();
  COURIER_LOG_INFO("admin server stopped", {observability::IntField("port", port_)});
}

} // namespace courier::runtime
