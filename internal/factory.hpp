#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/service/scheduling_service.hpp"
#include "internal/service/service_context.hpp"

namespace shopfloor::factory {

/*
  Application

  Owns all long-lived components used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  service::ServiceContext                         context;
  std::shared_ptr<service::SchedulingService>     scheduling_service;
  std::vector<std::unique_ptr<::grpc::Service>>   grpc_services;
};

/*
  Build

  Constructs the entire backend based on runtime config.

  This is the composition root of the application and the only place
  that knows concrete repository and calendar types.
*/
Application Build(const shopfloor::runtime::config::RuntimeConfig& config);

// Same graph over a caller-provided repository.
Application Build(const shopfloor::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository);

} // namespace shopfloor::factory
