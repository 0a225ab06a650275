#include "server.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace shopfloor::runtime {

ServerOptions ServerOptionsFromConfig(const config::ServerConfig& config) {
  ServerOptions options;
  if (!config.bind_address().empty()) options.bind_address = config.bind_address();
  if (config.shutdown_grace_ms() > 0) options.shutdown_grace = std::chrono::milliseconds(config.shutdown_grace_ms());
  if (config.max_receive_message_bytes() > 0) options.max_receive_message_bytes = static_cast<std::int32_t>(config.max_receive_message_bytes());
  return options;
}

Server::Server(ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services)
    : options_(std::move(options)), services_(std::move(services)) {}

Server::~Server() {
  Stop();
}

void Server::Start() {
  if (grpc_server_) return;

  ::grpc::ServerBuilder builder;
  int                   selected_port = 0;
  builder.AddListeningPort(options_.bind_address, ::grpc::InsecureServerCredentials(), &selected_port);
  builder.SetMaxReceiveMessageSize(options_.max_receive_message_bytes);

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || selected_port == 0) {
    grpc_server_.reset();
    throw std::runtime_error("failed to bind scheduling server on " + options_.bind_address);
  }

  SHOPFLOOR_LOG_INFO("scheduling server listening", {observability::StringField("bind_address", options_.bind_address),
                                                     observability::IntField("port", selected_port),
                                                     observability::IntField("services", static_cast<std::int64_t>(services_.size()))});
}

void Server::Wait() {
  if (grpc_server_) grpc_server_->Wait();
}

void Server::Stop() {
  if (!grpc_server_) return;

  SHOPFLOOR_LOG_INFO("draining scheduling server",
                     {observability::IntField("grace_ms", static_cast<std::int64_t>(options_.shutdown_grace.count()))});
  grpc_server_->Shutdown(std::chrono::system_clock::now() + options_.shutdown_grace);
  grpc_server_.reset();
}

} // namespace shopfloor::runtime
