#pragma once

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "internal/cache/cache_service.hpp"
#include "internal/graph/dependency_graph.hpp"
#include "internal/graph/dependency_graph_service.hpp"

namespace rulegraph::cache {

struct VariableChanged {
  std::string campaign_id;
  std::string branch_id;
  std::string scope;
  std::string scope_id;
  std::string key;
};

struct EntityChanged {
  std::string              campaign_id;
  std::string              branch_id;
  std::string              entity_type;
  std::string              entity_id;
  std::vector<std::string> changed_fields; // empty = every field
  std::string              parent_type;
  std::string              parent_id;
};

struct ConditionDefinitionChanged {
  std::string campaign_id;
  std::string branch_id;
  std::string condition_id;
  std::string entity_type; // empty = unknown
  std::string entity_id;   // empty = class level
};

struct VariableDefinitionChanged {
  std::string campaign_id;
  std::string branch_id;
  std::string scope;
  std::string scope_id;
  std::string key;
};

struct EffectDefinitionChanged {
  std::string campaign_id;
  std::string branch_id;
  std::string effect_id;
  std::string entity_type;
  std::string entity_id;
};

using InvalidationScope = std::variant<VariableChanged, EntityChanged, ConditionDefinitionChanged, VariableDefinitionChanged,
                                       EffectDefinitionChanged>;

struct InvalidationReport {
  std::set<std::string> exact_keys;
  std::set<std::string> patterns;
  std::uint64_t         keys_deleted = 0;
};

/*
  Maps a change onto the cache keys that may hold stale values.

  Value changes walk reverse dependency edges from the changed node and
  delete exactly the keys of the affected derived variables and
  conditions. Class-level conditions outside the changed entity fall
  back to a per-type pattern delete, as do parent/child cascades
  (children are not enumerable without the store).

  Definition changes are structural: the campaign graph is dropped.

  A change on kAllBranches walks one graph and deletes its keys on
  every branch by pattern.
*/
class InvalidationCoordinator {
 public:
  InvalidationCoordinator(std::shared_ptr<graph::DependencyGraphService> graphs, std::shared_ptr<CacheService> cache);

  InvalidationReport Invalidate(const InvalidationScope& scope);

 private:
  // Entity whose change triggered the walk; lets class-level conditions
  // resolve to an exact key.
  struct ScopeEntity {
    std::string type;
    std::string id;
  };

  void Collect(const graph::DependencyGraph& graph, const std::vector<graph::DependencyGraph::NodeIndex>& seeds, const std::string& branch_id,
               const ScopeEntity& entity, InvalidationReport& report) const;

  void Plan(const VariableChanged& change, InvalidationReport& report);
  void Plan(const EntityChanged& change, InvalidationReport& report);
  void Plan(const ConditionDefinitionChanged& change, InvalidationReport& report);
  void Plan(const VariableDefinitionChanged& change, InvalidationReport& report);
  void Plan(const EffectDefinitionChanged& change, InvalidationReport& report);

  void DropGraph(const std::string& campaign_id, const std::string& branch_id, InvalidationReport& report);

  // Graph for the walk; nullptr when it cannot be built.
  std::shared_ptr<const graph::DependencyGraph> GraphFor(const std::string& campaign_id, const std::string& branch_id);

  std::shared_ptr<graph::DependencyGraphService> graphs_;
  std::shared_ptr<CacheService>                  cache_;
};

} // namespace rulegraph::cache
