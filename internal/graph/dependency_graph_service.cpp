#include "internal/graph/dependency_graph_service.hpp"

#include <algorithm>
#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace rulegraph::graph {

std::string FormatCycle(const std::vector<std::string>& path) {
  std::string out;
  for (const auto& key : path) {
    out += key;
    out += " -> ";
  }
  if (!path.empty()) out += path.front();
  return out;
}

DependencyGraphService::DependencyGraphService(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::string DependencyGraphService::CacheKey(const std::string& campaign_id, const std::string& branch_id) {
  return campaign_id + ":" + branch_id;
}

GraphInputs DependencyGraphService::LoadInputs(const std::string& campaign_id) const {
  GraphInputs inputs;
  auto        tx    = repository_->Begin();
  inputs.conditions = repository_->ListConditionsByCampaign(*tx, campaign_id);
  inputs.variables  = repository_->ListVariablesByCampaign(*tx, campaign_id);
  inputs.effects    = repository_->ListEffectsByCampaign(*tx, campaign_id);
  tx->Commit();
  return inputs;
}

std::shared_ptr<const DependencyGraph> DependencyGraphService::PeekGraph(const std::string& campaign_id, const std::string& branch_id) const {
  std::shared_lock lock(mutex_);
  auto             it = graphs_.find(CacheKey(campaign_id, branch_id));
  return it == graphs_.end() ? nullptr : it->second;
}

std::uint64_t DependencyGraphService::GenerationLocked(const std::string& campaign_id) const {
  auto it = generations_.find(campaign_id);
  return it == generations_.end() ? 0 : it->second;
}

std::shared_ptr<const DependencyGraph> DependencyGraphService::GetGraph(const std::string& campaign_id, const std::string& branch_id) {
  const auto    key        = CacheKey(campaign_id, branch_id);
  std::uint64_t generation = 0;
  {
    std::shared_lock lock(mutex_);
    if (auto it = graphs_.find(key); it != graphs_.end()) return it->second;
    generation = GenerationLocked(campaign_id);
  }

  // Built outside the lock; a concurrent builder may publish first.
  auto built = std::make_shared<const DependencyGraph>(builder_.Build(LoadInputs(campaign_id)));

  std::unique_lock lock(mutex_);
  if (GenerationLocked(campaign_id) != generation) {
    RULEGRAPH_LOG_DEBUG("dependency graph invalidated while building; not cached",
                        {observability::StringField("campaign_id", campaign_id), observability::StringField("branch_id", branch_id)});
    return built;
  }
  graphs_[key] = built;
  RULEGRAPH_LOG_DEBUG("dependency graph cached",
                      {observability::StringField("campaign_id", campaign_id), observability::StringField("branch_id", branch_id)});
  return built;
}

void DependencyGraphService::InvalidateGraph(const std::string& campaign_id, const std::string& branch_id) {
  std::unique_lock lock(mutex_);
  ++generations_[campaign_id];
  graphs_.erase(CacheKey(campaign_id, branch_id));
}

void DependencyGraphService::InvalidateCampaign(const std::string& campaign_id) {
  const auto prefix = CacheKey(campaign_id, "");

  std::unique_lock lock(mutex_);
  ++generations_[campaign_id];
  std::erase_if(graphs_, [&](const auto& entry) { return entry.first.rfind(prefix, 0) == 0; });
}

void DependencyGraphService::ValidateNoCycles(const std::string& campaign_id, const std::string& branch_id) {
  auto graph  = GetGraph(campaign_id, branch_id);
  auto cycles = graph->DetectCycles();
  if (cycles.empty()) return;
  throw util::CircularDependency("circular dependency: " + FormatCycle(cycles.front().path), cycles.front().path);
}

std::vector<std::string> DependencyGraphService::GetEvaluationOrder(const std::string& campaign_id, const std::string& branch_id) {
  auto graph = GetGraph(campaign_id, branch_id);
  auto topo  = graph->TopologicalOrder();
  if (topo.HasCycle()) return {};

  std::vector<std::string> keys;
  keys.reserve(topo.order.size());
  for (auto idx : topo.order) keys.push_back(graph->Node(idx).key);
  return keys;
}

std::vector<std::string> DependencyGraphService::GetDependenciesOf(const std::string& campaign_id, const std::string& branch_id,
                                                                   const std::string& node_key) {
  auto graph = GetGraph(campaign_id, branch_id);
  auto idx   = graph->Find(node_key);
  if (!idx) return {};

  std::vector<std::string> keys;
  for (auto d : graph->GetDependencies(*idx)) keys.push_back(graph->Node(d).key);
  std::sort(keys.begin(), keys.end());
  return keys;
}

std::vector<std::string> DependencyGraphService::GetDependents(const std::string& campaign_id, const std::string& branch_id,
                                                               const std::string& node_key) {
  auto graph = GetGraph(campaign_id, branch_id);
  auto idx   = graph->Find(node_key);
  if (!idx) return {};

  std::vector<std::string> keys;
  for (auto d : graph->GetDependents(*idx)) keys.push_back(graph->Node(d).key);
  std::sort(keys.begin(), keys.end());
  return keys;
}

namespace {

template <typename Record>
void Replace(std::vector<Record>& rows, const Record& candidate) {
  auto it = std::find_if(rows.begin(), rows.end(), [&](const Record& r) { return r.id == candidate.id; });
  if (it == rows.end()) {
    rows.push_back(candidate);
  } else {
    *it = candidate;
  }
}

} // namespace

void DependencyGraphService::ValidateCandidate(const std::string& campaign_id, const GraphCandidate& candidate) const {
  auto        inputs = LoadInputs(campaign_id);
  std::string candidate_key;

  if (const auto* c = std::get_if<db::model::ConditionRecord>(&candidate)) {
    Replace(inputs.conditions, *c);
    candidate_key = ConditionNodeKey(c->id);
  } else if (const auto* v = std::get_if<db::model::VariableRecord>(&candidate)) {
    // Replaced by id, so a key change drops the old node.
    Replace(inputs.variables, *v);
    candidate_key = VariableNodeKey(v->scope, v->scope_id, v->key);
  } else if (const auto* e = std::get_if<db::model::EffectRecord>(&candidate)) {
    Replace(inputs.effects, *e);
    candidate_key = EffectNodeKey(e->id);
  }

  const auto trial = builder_.Build(inputs);
  for (const auto& cycle : trial.DetectCycles()) {
    if (std::find(cycle.path.begin(), cycle.path.end(), candidate_key) == cycle.path.end()) continue;
    throw util::CircularDependency("circular dependency: " + FormatCycle(cycle.path), cycle.path);
  }

  // DFS reports one cycle per back edge; catch a candidate on an unreported one.
  if (auto idx = trial.Find(candidate_key)) {
    for (auto dep : trial.GetDependencies(*idx)) {
      if (!trial.HasPath(dep, *idx)) continue;
      std::vector<std::string> path{candidate_key, trial.Node(dep).key};
      throw util::CircularDependency("circular dependency: " + FormatCycle(path), path);
    }
  }
}

} // namespace rulegraph::graph
