#include "internal/cache/invalidation_coordinator.hpp"

#include <exception>

#include "internal/cache/cache_keys.hpp"
#include "internal/graph/dependency_graph_builder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace rulegraph::cache {

using graph::DependencyGraph;
using graph::NodeKind;

InvalidationCoordinator::InvalidationCoordinator(std::shared_ptr<graph::DependencyGraphService> graphs, std::shared_ptr<CacheService> cache)
    : graphs_(std::move(graphs)), cache_(std::move(cache)) {
}

namespace {

bool AllBranches(const std::string& branch_id) {
  return branch_id == kAllBranches;
}

// Graphs depend only on store rows; any branch's graph serves a walk
// over all of them.
std::string WalkBranch(const std::string& branch_id) {
  return AllBranches(branch_id) ? std::string(kDefaultBranch) : branch_id;
}

} // namespace

std::shared_ptr<const DependencyGraph> InvalidationCoordinator::GraphFor(const std::string& campaign_id, const std::string& branch_id) {
  try {
    return graphs_->GetGraph(campaign_id, WalkBranch(branch_id));
  } catch (const std::exception& e) {
    RULEGRAPH_LOG_WARN("invalidation without dependency graph; using pattern deletes",
                       {observability::StringField("campaign_id", campaign_id), observability::StringField("error", e.what())});
    return nullptr;
  }
}

void InvalidationCoordinator::DropGraph(const std::string& campaign_id, const std::string& branch_id, InvalidationReport& report) {
  if (AllBranches(branch_id)) {
    graphs_->InvalidateCampaign(campaign_id);
  } else {
    graphs_->InvalidateGraph(campaign_id, branch_id);
  }
  report.exact_keys.insert(GraphKey(campaign_id, branch_id));
}

void InvalidationCoordinator::Collect(const DependencyGraph& graph, const std::vector<DependencyGraph::NodeIndex>& seeds,
                                      const std::string& branch_id, const ScopeEntity& entity, InvalidationReport& report) const {
  for (auto idx : graph.ReverseReachable(seeds)) {
    const auto& node = graph.Node(idx);

    if (node.kind == NodeKind::kVariable) {
      if (node.concrete && node.derived) {
        report.exact_keys.insert(DerivedVariableKey(node.owner_type, node.owner_id, node.name, branch_id));
      }
      continue;
    }

    if (node.kind != NodeKind::kCondition) continue;

    if (!node.owner_id.empty()) {
      report.exact_keys.insert(ComputedFieldsKey(node.owner_type, node.owner_id, branch_id));
    } else if (!entity.id.empty() && entity.type == node.owner_type) {
      report.exact_keys.insert(ComputedFieldsKey(node.owner_type, entity.id, branch_id));
    } else {
      report.patterns.insert(ComputedFieldsPattern(node.owner_type, branch_id));
    }
  }
}

// ------------------------------------------------------------
// Value changes
// ------------------------------------------------------------

void InvalidationCoordinator::Plan(const VariableChanged& change, InvalidationReport& report) {
  auto g = GraphFor(change.campaign_id, change.branch_id);
  if (!g) {
    report.patterns.insert(ComputedFieldsPattern("", change.branch_id));
    report.patterns.insert(std::string(kDerivedVariablePrefix) + ":*:" + change.branch_id);
    return;
  }

  std::vector<DependencyGraph::NodeIndex> seeds;
  if (auto idx = g->Find(graph::VariableNodeKey(change.scope, change.scope_id, change.key))) seeds.push_back(*idx);
  if (auto idx = g->Find(graph::VariableNodeKey(change.scope, graph::kClassId, change.key))) seeds.push_back(*idx);

  ScopeEntity entity;
  if (change.scope != graph::kWorldScope) entity = {change.scope, change.scope_id};
  Collect(*g, seeds, change.branch_id, entity, report);
}

void InvalidationCoordinator::Plan(const EntityChanged& change, InvalidationReport& report) {
  report.exact_keys.insert(ComputedFieldsKey(change.entity_type, change.entity_id, change.branch_id));

  if (change.entity_type == "settlement") {
    report.exact_keys.insert(SettlementStructuresKey(change.entity_id, change.branch_id));
    report.patterns.insert(ComputedFieldsPattern("structure", change.branch_id));
  }
  if (!change.parent_type.empty() && !change.parent_id.empty()) {
    report.exact_keys.insert(ComputedFieldsKey(change.parent_type, change.parent_id, change.branch_id));
    if (change.parent_type == "settlement") report.exact_keys.insert(SettlementStructuresKey(change.parent_id, change.branch_id));
  }

  auto g = GraphFor(change.campaign_id, change.branch_id);
  if (!g) {
    report.patterns.insert(ComputedFieldsPattern(change.entity_type, change.branch_id));
    report.patterns.insert(std::string(kDerivedVariablePrefix) + ":*:" + change.branch_id);
    return;
  }

  const auto owned = [&](const graph::GraphNode& node) {
    return node.kind == NodeKind::kVariable && node.owner_type == change.entity_type &&
           (node.owner_id == change.entity_id || node.owner_id == graph::kClassId);
  };

  std::vector<DependencyGraph::NodeIndex> seeds;
  if (change.changed_fields.empty()) {
    for (DependencyGraph::NodeIndex i = 0; i < g->NodeCount(); ++i) {
      if (owned(g->Node(i))) seeds.push_back(i);
    }
  } else {
    for (const auto& field : change.changed_fields) {
      if (auto idx = g->Find(graph::PropNodeKey(change.entity_type, change.entity_id, field))) seeds.push_back(*idx);
      if (auto idx = g->Find(graph::PropNodeKey(change.entity_type, graph::kClassId, field))) seeds.push_back(*idx);
      if (field == "variables") {
        for (DependencyGraph::NodeIndex i = 0; i < g->NodeCount(); ++i) {
          const auto& node = g->Node(i);
          if (owned(node) && node.key.rfind("var:", 0) == 0) seeds.push_back(i);
        }
      }
    }
  }

  Collect(*g, seeds, change.branch_id, {change.entity_type, change.entity_id}, report);
}

// ------------------------------------------------------------
// Structural changes
// ------------------------------------------------------------

void InvalidationCoordinator::Plan(const ConditionDefinitionChanged& change, InvalidationReport& report) {
  // Dependents recorded in the old graph (conditions reading this one's field).
  if (auto old = graphs_->PeekGraph(change.campaign_id, WalkBranch(change.branch_id))) {
    if (auto idx = old->Find(graph::ConditionNodeKey(change.condition_id))) {
      Collect(*old, {*idx}, change.branch_id, {}, report);
    }
  }
  DropGraph(change.campaign_id, change.branch_id, report);

  if (!change.entity_id.empty()) {
    report.exact_keys.insert(ComputedFieldsKey(change.entity_type, change.entity_id, change.branch_id));
  } else {
    report.patterns.insert(ComputedFieldsPattern(change.entity_type, change.branch_id));
  }
}

void InvalidationCoordinator::Plan(const VariableDefinitionChanged& change, InvalidationReport& report) {
  if (auto old = graphs_->PeekGraph(change.campaign_id, WalkBranch(change.branch_id))) {
    if (auto idx = old->Find(graph::VariableNodeKey(change.scope, change.scope_id, change.key))) {
      ScopeEntity entity;
      if (change.scope != graph::kWorldScope) entity = {change.scope, change.scope_id};
      Collect(*old, {*idx}, change.branch_id, entity, report);
    }
  }
  DropGraph(change.campaign_id, change.branch_id, report);
  report.exact_keys.insert(DerivedVariableKey(change.scope, change.scope_id, change.key, change.branch_id));

  if (change.scope == graph::kWorldScope || change.scope_id.empty()) {
    report.patterns.insert(ComputedFieldsPattern("", change.branch_id));
  } else {
    report.exact_keys.insert(ComputedFieldsKey(change.scope, change.scope_id, change.branch_id));
  }
}

void InvalidationCoordinator::Plan(const EffectDefinitionChanged& change, InvalidationReport& report) {
  DropGraph(change.campaign_id, change.branch_id, report);
  if (!change.entity_type.empty() && !change.entity_id.empty()) {
    report.exact_keys.insert(ComputedFieldsKey(change.entity_type, change.entity_id, change.branch_id));
  }
}

InvalidationReport InvalidationCoordinator::Invalidate(const InvalidationScope& scope) {
  observability::SpanScope span("rulegraph.invalidate");

  InvalidationReport report;
  std::visit([&](const auto& change) { Plan(change, report); }, scope);

  if (AllBranches(std::visit([](const auto& change) { return change.branch_id; }, scope))) {
    report.patterns.merge(report.exact_keys);
    report.exact_keys.clear();
  }

  std::uint64_t exact = 0;
  for (const auto& key : report.exact_keys) exact += cache_->Delete(key);

  std::uint64_t matched = 0;
  for (const auto& pattern : report.patterns) matched += cache_->DeletePattern(pattern);

  report.keys_deleted = exact + matched;

  observability::Metrics::Instance().RecordInvalidatedKeys("exact", exact);
  observability::Metrics::Instance().RecordInvalidatedKeys("pattern", matched);
  span.SetAttribute("rulegraph.keys_deleted", static_cast<std::int64_t>(report.keys_deleted));

  RULEGRAPH_LOG_DEBUG("cache invalidated", {observability::IntField("exact_keys", static_cast<std::int64_t>(report.exact_keys.size())),
                                            observability::IntField("patterns", static_cast<std::int64_t>(report.patterns.size())),
                                            observability::IntField("keys_deleted", static_cast<std::int64_t>(report.keys_deleted))});
  return report;
}

} // namespace rulegraph::cache
