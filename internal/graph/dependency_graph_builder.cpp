#include "internal/graph/dependency_graph_builder.hpp"

#include "internal/expr/value.hpp"
#include "internal/graph/dependency_extractor.hpp"
#include "internal/observability/logging.hpp"

namespace rulegraph::graph {

std::string VariableNodeKey(const std::string& scope, const std::string& scope_id, const std::string& key) {
  return "var:" + scope + ":" + scope_id + ":" + key;
}

std::string PropNodeKey(const std::string& entity_type, const std::string& entity_id, const std::string& field) {
  return "prop:" + entity_type + ":" + entity_id + ":" + field;
}

std::string ConditionNodeKey(const std::string& condition_id) {
  return "condition:" + condition_id;
}

std::string EffectNodeKey(const std::string& effect_id) {
  return "effect:" + effect_id;
}

namespace {

// Key the node would have at class level: "var:settlement:*:wealth".
std::string ClassNodeKey(const GraphNode& node) {
  const bool prop = node.key.rfind("prop:", 0) == 0;
  return prop ? PropNodeKey(node.owner_type, kClassId, node.name) : VariableNodeKey(node.owner_type, kClassId, node.name);
}

} // namespace

// Maps owner-relative paths onto node keys and creates virtual nodes on demand.
struct DependencyGraphBuilder::Resolver {
  DependencyGraph&                 graph;
  std::unordered_set<std::string>  concrete_vars;
  std::unordered_set<std::string>  world_keys;

  DependencyGraph::NodeIndex Variable(const std::string& scope, const std::string& scope_id, const std::string& key) {
    const auto node_key = VariableNodeKey(scope, scope_id, key);
    if (auto idx = graph.Find(node_key)) return *idx;
    GraphNode node;
    node.key        = node_key;
    node.kind       = NodeKind::kVariable;
    node.owner_type = scope;
    node.owner_id   = scope_id;
    node.name       = key;
    return graph.AddNode(std::move(node));
  }

  DependencyGraph::NodeIndex Prop(const std::string& type, const std::string& id, const std::string& field) {
    const auto node_key = PropNodeKey(type, id, field);
    if (auto idx = graph.Find(node_key)) return *idx;
    GraphNode node;
    node.key        = node_key;
    node.kind       = NodeKind::kVariable;
    node.owner_type = type;
    node.owner_id   = id;
    node.name       = field;
    return graph.AddNode(std::move(node));
  }

  // Dotted context path read by an expression owned by (type, id).
  DependencyGraph::NodeIndex ContextPath(const std::string& owner_type, const std::string& owner_id, const std::string& path) {
    const auto segs = expr::SplitPath(path);
    if (segs.size() >= 2 && segs[0] == owner_type) {
      if (segs[1] == "variables" && segs.size() >= 3) return Variable(owner_type, owner_id, segs[2]);
      return Prop(owner_type, owner_id, segs[1]);
    }

    if (!concrete_vars.contains(VariableNodeKey(owner_type, owner_id, path)) && world_keys.contains(path)) {
      return Variable(kWorldScope, "", path);
    }
    return Variable(owner_type, owner_id, path);
  }

  // JSON-pointer path inside the fields of entity (type, id).
  std::optional<DependencyGraph::NodeIndex> PatchPath(const std::string& type, const std::string& id, const std::string& pointer) {
    const auto segs = expr::SplitPointer(pointer);
    if (segs.empty()) return std::nullopt;
    if (segs[0] == "variables" && segs.size() >= 2) return Variable(type, id, segs[1]);
    return Prop(type, id, segs[0]);
  }
};

DependencyGraph DependencyGraphBuilder::Build(const GraphInputs& inputs) const {
  DependencyGraph graph;
  Resolver        resolve{graph, {}, {}};

  // Concrete variable nodes first so path resolution can see them.
  for (const auto& v : inputs.variables) {
    if (!v.is_active || v.deleted_at_ms != 0) continue;
    GraphNode node;
    node.key         = VariableNodeKey(v.scope, v.scope_id, v.key);
    node.kind        = NodeKind::kVariable;
    node.concrete    = true;
    node.derived     = v.IsDerived();
    node.owner_type  = v.scope;
    node.owner_id    = v.scope_id;
    node.name        = v.key;
    node.ref_id      = v.id;
    node.created_seq = v.created_seq;
    resolve.concrete_vars.insert(node.key);
    if (v.scope == kWorldScope) resolve.world_keys.insert(v.key);
    graph.AddNode(std::move(node));
  }

  for (const auto& v : inputs.variables) {
    if (!v.is_active || v.deleted_at_ms != 0 || !v.IsDerived()) continue;
    const auto self = *graph.Find(VariableNodeKey(v.scope, v.scope_id, v.key));
    for (const auto& path : ExtractReadsFromJson(*v.formula)) {
      graph.AddEdge(self, resolve.ContextPath(v.scope, v.scope_id, path), EdgeKind::kReads);
    }
  }

  for (const auto& c : inputs.conditions) {
    if (!c.is_active || c.deleted_at_ms != 0) continue;
    const auto owner_id = c.entity_id.empty() ? std::string(kClassId) : c.entity_id;
    const auto field    = c.field.empty() ? c.id : c.field;

    GraphNode node;
    node.key         = ConditionNodeKey(c.id);
    node.kind        = NodeKind::kCondition;
    node.concrete    = true;
    node.owner_type  = c.entity_type;
    node.owner_id    = c.entity_id;
    node.name        = field;
    node.ref_id      = c.id;
    node.priority    = c.priority;
    node.created_seq = c.created_seq;
    const auto self  = graph.AddNode(std::move(node));

    std::unordered_set<DependencyGraph::NodeIndex> reads;
    for (const auto& path : ExtractReadsFromJson(c.expression)) {
      const auto target = resolve.ContextPath(c.entity_type, owner_id, path);
      reads.insert(target);
      graph.AddEdge(self, target, EdgeKind::kReads);
    }

    const auto produced = resolve.Prop(c.entity_type, owner_id, field);
    if (!reads.contains(produced)) graph.AddEdge(self, produced, EdgeKind::kWrites);
  }

  for (const auto& e : inputs.effects) {
    if (!e.is_active || e.deleted_at_ms != 0) continue;

    GraphNode node;
    node.key         = EffectNodeKey(e.id);
    node.kind        = NodeKind::kEffect;
    node.concrete    = true;
    node.owner_type  = e.entity_type;
    node.owner_id    = e.entity_id;
    node.name        = e.source_type;
    node.ref_id      = e.id;
    node.priority    = e.priority;
    node.created_seq = e.created_seq;
    const auto self  = graph.AddNode(std::move(node));

    std::unordered_set<DependencyGraph::NodeIndex> writes;
    for (const auto& path : ExtractWrites(e.payload)) {
      if (auto target = resolve.PatchPath(e.entity_type, e.entity_id, path)) {
        writes.insert(*target);
        graph.AddEdge(self, *target, EdgeKind::kWrites);
      }
    }
    for (const auto& path : ExtractPatchReads(e.payload)) {
      auto target = resolve.PatchPath(e.entity_type, e.entity_id, path);
      if (target && !writes.contains(*target)) graph.AddEdge(self, *target, EdgeKind::kReads);
    }
  }

  // A class-level read of "<type>.<k>" stands for every entity of that
  // type, so the class node reads each concrete node with the same name.
  std::unordered_map<std::string, std::vector<DependencyGraph::NodeIndex>> concrete_by_name;
  std::vector<DependencyGraph::NodeIndex>                                  class_nodes;
  for (DependencyGraph::NodeIndex i = 0; i < graph.NodeCount(); ++i) {
    const auto& node = graph.Node(i);
    if (node.kind != NodeKind::kVariable || node.owner_type.empty()) continue;
    if (node.owner_id == kClassId) {
      class_nodes.push_back(i);
    } else {
      concrete_by_name[ClassNodeKey(node)].push_back(i);
    }
  }
  for (auto cls : class_nodes) {
    auto it = concrete_by_name.find(ClassNodeKey(graph.Node(cls)));
    if (it == concrete_by_name.end()) continue;
    for (auto concrete : it->second) graph.AddEdge(cls, concrete, EdgeKind::kReads);
  }

  RULEGRAPH_LOG_DEBUG("dependency graph built",
                      {observability::IntField("nodes", static_cast<std::int64_t>(graph.NodeCount())),
                       observability::IntField("edges", static_cast<std::int64_t>(graph.EdgeCount()))});
  return graph;
}

} // namespace rulegraph::graph
