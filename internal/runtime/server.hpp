#pragma once

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace courier::runtime {

struct ServerOptions {
  // "host:port"; port 0 picks a free port, readable from Port() after Start()
  std::string bind_address{"127.0.0.1:50061"};

  // Largest admin request accepted. Submit carries the payload inline.
  int max_receive_bytes{4 * 1024 * 1024};
};

/*
  gRPC listener for the admin API. Owns the registered service adapters;
  the node behind them is started and stopped by the caller.
*/
class Server {
 public:
  Server(ServerOptions options, std::vector<std::unique_ptr<grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Stop();

  int Port() const {
    return port_;
  }

 private:
  ServerOptions                               options_;
  std::vector<std::unique_ptr<grpc::Service>> services_;
  std::unique_ptr<grpc::Server>               grpc_server_;
  int                                         port_ = 0;
};

} // namespace courier::runtime
