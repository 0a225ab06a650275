#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace shopfloor::runtime {

struct ServerOptions {
  std::string               bind_address = "0.0.0.0:50061";
  std::chrono::milliseconds shutdown_grace{5000};
  std::int32_t              max_receive_message_bytes = 4 * 1024 * 1024;
};

// Zero or empty fields keep the defaults above.
ServerOptions ServerOptionsFromConfig(const config::ServerConfig& config);

/*
  Hosts the scheduling gRPC services.

  Stop() drains in-flight calls for at most shutdown_grace, then cancels
  whatever is left; a schedule generation cut off that way commits nothing.
*/
class Server {
public:
  Server(ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

  const ServerOptions& Options() const {
    return options_;
  }

private:
  ServerOptions                               options_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               grpc_server_;
};

} // namespace shopfloor::runtime
