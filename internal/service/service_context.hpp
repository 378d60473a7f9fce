#pragma once

#include <chrono>
#include <cstddef>
#include <memory>

namespace rulegraph::db { class Repository; }
namespace rulegraph::cache { class CacheService; class InvalidationCoordinator; }
namespace rulegraph::graph { class DependencyGraphService; }
namespace rulegraph::expr { class Evaluator; }
namespace rulegraph::context { class ContextBuilder; }
namespace rulegraph::effects { class EffectEngine; }

namespace rulegraph::service {

struct ServiceSettings {
  std::chrono::seconds computed_fields_ttl{300};
  std::chrono::seconds derived_variable_ttl{300};
  std::size_t          max_depth = 10;
};

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<rulegraph::db::Repository>                repository;
  std::shared_ptr<rulegraph::cache::CacheService>           cache;
  std::shared_ptr<rulegraph::graph::DependencyGraphService> graphs;
  std::shared_ptr<rulegraph::cache::InvalidationCoordinator> invalidation;
  std::shared_ptr<const rulegraph::expr::Evaluator>         evaluator;
  std::shared_ptr<rulegraph::context::ContextBuilder>       contexts;
  std::shared_ptr<rulegraph::effects::EffectEngine>         effects;
  ServiceSettings                                           settings;
};

} // namespace rulegraph::service
