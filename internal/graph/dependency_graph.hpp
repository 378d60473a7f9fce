#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rulegraph::graph {

enum class NodeKind : std::uint8_t {
  kVariable,
  kCondition,
  kEffect,
};

enum class EdgeKind : std::uint8_t {
  kReads,  // from depends on to
  kWrites, // from = effect / condition, to = target; target depends on from
};

/*
  Graph node. The key is stable across rebuilds:

    var:<scope>:<scopeId>:<key>    variable (scopeId "*" = class level)
    prop:<type>:<id>:<field>       entity field (id "*" = class level)
    condition:<id>
    effect:<id>

  owner_type / owner_id locate the node for cache-key mapping: the
  scope of a variable, the entity of a condition, effect or prop.
*/
struct GraphNode {
  std::string key;
  NodeKind    kind = NodeKind::kVariable;

  // Backed by a store row (conditions, effects, stored variables).
  bool concrete = false;
  // Variable node with a formula.
  bool derived = false;

  std::string owner_type;
  std::string owner_id;
  std::string name; // variable key, condition field, prop field
  std::string ref_id; // row id when concrete

  int32_t  priority    = 0;
  uint64_t created_seq = 0;
};

struct Cycle {
  std::vector<std::string> path; // keys, first node not repeated
};

/*
  Arena graph. Nodes are addressed by index; adjacency is kept in the
  "depends on" direction for both edge kinds, plus the reverse.
*/
class DependencyGraph {
 public:
  using NodeIndex = std::size_t;

  // Returns the existing index when the key is known. A concrete node
  // replaces the attributes of a virtual one.
  NodeIndex AddNode(GraphNode node);

  // Ensures a virtual node for key exists.
  NodeIndex EnsureNode(const std::string& key, NodeKind kind = NodeKind::kVariable);

  // false when the edge already exists.
  bool AddEdge(NodeIndex from, NodeIndex to, EdgeKind kind);

  std::optional<NodeIndex> Find(const std::string& key) const;
  const GraphNode&         Node(NodeIndex index) const {
    return nodes_[index];
  }
  std::size_t NodeCount() const {
    return nodes_.size();
  }
  std::size_t EdgeCount() const {
    return edge_count_;
  }

  // Nodes index depends on.
  const std::vector<NodeIndex>& GetDependencies(NodeIndex index) const {
    return depends_on_[index];
  }

  // Nodes that depend on index.
  const std::vector<NodeIndex>& GetDependents(NodeIndex index) const {
    return dependents_[index];
  }

  // Every node that transitively depends on a seed (BFS). Seeds are included.
  std::vector<NodeIndex> ReverseReachable(const std::vector<NodeIndex>& seeds) const;

  // true when `from` transitively depends on `to`.
  bool HasPath(NodeIndex from, NodeIndex to) const;

  // true when making `from` depend on `to` would close a cycle.
  bool WouldCreateCycle(NodeIndex from, NodeIndex to) const;

  std::vector<Cycle> DetectCycles() const;

  struct TopoResult {
    std::vector<NodeIndex> order;     // dependencies first
    std::vector<NodeIndex> unordered; // nodes on or behind a cycle

    bool HasCycle() const {
      return !unordered.empty();
    }
  };

  // Kahn's algorithm; ties by priority, created_seq, key.
  TopoResult TopologicalOrder() const;

  // Same, restricted to the given nodes (edges through other nodes still
  // order them).
  TopoResult TopologicalOrder(const std::vector<NodeIndex>& subset) const;

 private:
  std::vector<GraphNode>                     nodes_;
  std::unordered_map<std::string, NodeIndex> index_;
  std::vector<std::vector<NodeIndex>>        depends_on_;
  std::vector<std::vector<NodeIndex>>        dependents_;
  std::size_t                                edge_count_ = 0;
};

} // namespace rulegraph::graph
