#pragma once

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/graph/dependency_graph.hpp"
#include "internal/graph/dependency_graph_builder.hpp"

namespace rulegraph::graph {

// A row about to be created or updated, checked before it is persisted.
using GraphCandidate = std::variant<db::model::ConditionRecord, db::model::VariableRecord, db::model::EffectRecord>;

/*
  Per campaign:branch graph cache.

  Graphs are immutable once published; readers hold a shared_ptr and
  never see a partially built graph. A rebuild replaces the pointer
  (last writer wins). A build that overlaps an invalidation of its
  campaign is returned to its caller but never published.
*/
class DependencyGraphService {
 public:
  explicit DependencyGraphService(std::shared_ptr<db::Repository> repository);

  // Builds on first use.
  std::shared_ptr<const DependencyGraph> GetGraph(const std::string& campaign_id, const std::string& branch_id);

  void InvalidateGraph(const std::string& campaign_id, const std::string& branch_id);

  // Every branch of the campaign.
  void InvalidateCampaign(const std::string& campaign_id);

  // Cached graph or nullptr; never builds.
  std::shared_ptr<const DependencyGraph> PeekGraph(const std::string& campaign_id, const std::string& branch_id) const;

  // Throws util::CircularDependency naming the first cycle.
  void ValidateNoCycles(const std::string& campaign_id, const std::string& branch_id);

  // Node keys, dependencies first. Empty when the graph has a cycle.
  std::vector<std::string> GetEvaluationOrder(const std::string& campaign_id, const std::string& branch_id);

  std::vector<std::string> GetDependenciesOf(const std::string& campaign_id, const std::string& branch_id, const std::string& node_key);
  std::vector<std::string> GetDependents(const std::string& campaign_id, const std::string& branch_id, const std::string& node_key);

  // Builds a trial graph with the candidate in place of (or in addition
  // to) its stored row. Throws util::CircularDependency when the
  // candidate sits on a cycle.
  void ValidateCandidate(const std::string& campaign_id, const GraphCandidate& candidate) const;

  GraphInputs LoadInputs(const std::string& campaign_id) const;

 private:
  static std::string CacheKey(const std::string& campaign_id, const std::string& branch_id);

  // Caller holds mutex_.
  std::uint64_t GenerationLocked(const std::string& campaign_id) const;

  std::shared_ptr<db::Repository> repository_;
  DependencyGraphBuilder          builder_;

  mutable std::shared_mutex                                               mutex_;
  std::unordered_map<std::string, std::shared_ptr<const DependencyGraph>> graphs_;
  std::unordered_map<std::string, std::uint64_t>                          generations_; // by campaign
};

// "a -> b -> c -> a"
std::string FormatCycle(const std::vector<std::string>& path);

} // namespace rulegraph::graph
