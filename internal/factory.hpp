#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/service/service_context.hpp"

namespace rulegraph::service {
class RulesService;
class AuthoringService;
} // namespace rulegraph::service

namespace rulegraph::factory {

/*
  Application

  Owns all long-lived objects used by the server. Everything here
  lives for the lifetime of the process.
*/
struct Application {
  service::ServiceContext                        context;
  std::shared_ptr<service::RulesService>         rules;
  std::shared_ptr<service::AuthoringService>     authoring;
  std::vector<std::shared_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the entire backend from runtime config. This is the
  composition root: the only place that knows the concrete store and
  cache types.
*/
Application Build(const rulegraph::runtime::config::RuntimeConfig& config);

} // namespace rulegraph::factory
