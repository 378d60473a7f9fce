#include "internal/graph/dependency_graph.hpp"

#include <algorithm>
#include <queue>
#include <unordered_set>

namespace rulegraph::graph {

DependencyGraph::NodeIndex DependencyGraph::AddNode(GraphNode node) {
  auto it = index_.find(node.key);
  if (it != index_.end()) {
    auto& existing = nodes_[it->second];
    if (node.concrete && !existing.concrete) existing = std::move(node);
    return it->second;
  }

  const NodeIndex idx = nodes_.size();
  index_.emplace(node.key, idx);
  nodes_.push_back(std::move(node));
  depends_on_.emplace_back();
  dependents_.emplace_back();
  return idx;
}

DependencyGraph::NodeIndex DependencyGraph::EnsureNode(const std::string& key, NodeKind kind) {
  if (auto idx = Find(key)) return *idx;
  GraphNode node;
  node.key  = key;
  node.kind = kind;
  return AddNode(std::move(node));
}

bool DependencyGraph::AddEdge(NodeIndex from, NodeIndex to, EdgeKind kind) {
  NodeIndex dependent  = from;
  NodeIndex dependency = to;
  if (kind == EdgeKind::kWrites) std::swap(dependent, dependency);

  auto& deps = depends_on_[dependent];
  if (std::find(deps.begin(), deps.end(), dependency) != deps.end()) return false;

  deps.push_back(dependency);
  dependents_[dependency].push_back(dependent);
  ++edge_count_;
  return true;
}

std::optional<DependencyGraph::NodeIndex> DependencyGraph::Find(const std::string& key) const {
  auto it = index_.find(key);
  if (it == index_.end()) return std::nullopt;
  return it->second;
}

std::vector<DependencyGraph::NodeIndex> DependencyGraph::ReverseReachable(const std::vector<NodeIndex>& seeds) const {
  std::vector<NodeIndex> out;
  std::vector<bool>      seen(nodes_.size(), false);
  std::queue<NodeIndex>  q;

  for (auto s : seeds) {
    if (s < nodes_.size() && !seen[s]) {
      seen[s] = true;
      q.push(s);
    }
  }

  while (!q.empty()) {
    auto n = q.front();
    q.pop();
    out.push_back(n);
    for (auto d : dependents_[n]) {
      if (seen[d]) continue;
      seen[d] = true;
      q.push(d);
    }
  }
  return out;
}

bool DependencyGraph::HasPath(NodeIndex from, NodeIndex to) const {
  if (from == to) return true;
  std::vector<bool>     seen(nodes_.size(), false);
  std::queue<NodeIndex> q;
  q.push(from);
  seen[from] = true;

  while (!q.empty()) {
    auto n = q.front();
    q.pop();
    for (auto d : depends_on_[n]) {
      if (d == to) return true;
      if (seen[d]) continue;
      seen[d] = true;
      q.push(d);
    }
  }
  return false;
}

bool DependencyGraph::WouldCreateCycle(NodeIndex from, NodeIndex to) const {
  return HasPath(to, from);
}

// ------------------------------------------------------------
// Cycle detection
// ------------------------------------------------------------

std::vector<Cycle> DependencyGraph::DetectCycles() const {
  enum class Color : std::uint8_t { kWhite, kGray, kBlack };

  std::vector<Cycle>     cycles;
  std::vector<Color>     color(nodes_.size(), Color::kWhite);
  std::vector<NodeIndex> stack;

  // Iterative DFS; each frame remembers the next dependency to visit.
  struct Frame {
    NodeIndex   node;
    std::size_t next = 0;
  };

  for (NodeIndex root = 0; root < nodes_.size(); ++root) {
    if (color[root] != Color::kWhite) continue;

    std::vector<Frame> frames{{root}};
    color[root] = Color::kGray;
    stack.push_back(root);

    while (!frames.empty()) {
      auto& frame = frames.back();
      const auto& deps = depends_on_[frame.node];

      if (frame.next == deps.size()) {
        color[frame.node] = Color::kBlack;
        stack.pop_back();
        frames.pop_back();
        continue;
      }

      const NodeIndex next = deps[frame.next++];
      if (color[next] == Color::kWhite) {
        color[next] = Color::kGray;
        stack.push_back(next);
        frames.push_back({next});
      } else if (color[next] == Color::kGray) {
        Cycle cycle;
        auto  start = std::find(stack.begin(), stack.end(), next);
        for (auto it = start; it != stack.end(); ++it) cycle.path.push_back(nodes_[*it].key);
        cycles.push_back(std::move(cycle));
      }
    }
  }
  return cycles;
}

// ------------------------------------------------------------
// Topological order
// ------------------------------------------------------------

DependencyGraph::TopoResult DependencyGraph::TopologicalOrder() const {
  std::vector<NodeIndex> all(nodes_.size());
  for (NodeIndex i = 0; i < nodes_.size(); ++i) all[i] = i;
  return TopologicalOrder(all);
}

DependencyGraph::TopoResult DependencyGraph::TopologicalOrder(const std::vector<NodeIndex>& subset) const {
  std::vector<bool> member(nodes_.size(), false);
  for (auto n : subset) member[n] = true;

  // Pending dependency count counts reachable members, so members
  // ordered through non-member intermediates still respect each other.
  std::vector<std::vector<NodeIndex>> member_deps(nodes_.size());
  std::vector<std::size_t>            pending(nodes_.size(), 0);
  std::vector<std::vector<NodeIndex>> member_dependents(nodes_.size());
  // members whose walk leads back to themselves through non-members
  std::vector<bool> self_cycle(nodes_.size(), false);

  for (auto n : subset) {
    std::vector<bool>     seen(nodes_.size(), false);
    std::queue<NodeIndex> q;
    q.push(n);
    seen[n] = true;
    while (!q.empty()) {
      auto cur = q.front();
      q.pop();
      for (auto d : depends_on_[cur]) {
        if (d == n) self_cycle[n] = true;
        if (seen[d]) continue;
        seen[d] = true;
        if (member[d]) {
          member_deps[n].push_back(d);
          member_dependents[d].push_back(n);
          // members stop the walk; their own deps are counted separately
          continue;
        }
        q.push(d);
      }
    }
    pending[n] = member_deps[n].size();
  }

  auto later = [this](NodeIndex a, NodeIndex b) {
    const auto& x = nodes_[a];
    const auto& y = nodes_[b];
    if (x.priority != y.priority) return x.priority > y.priority;
    if (x.created_seq != y.created_seq) return x.created_seq > y.created_seq;
    return x.key > y.key;
  };
  std::priority_queue<NodeIndex, std::vector<NodeIndex>, decltype(later)> ready(later);

  for (auto n : subset) {
    if (pending[n] == 0 && !self_cycle[n]) ready.push(n);
  }

  TopoResult result;
  std::vector<bool> placed(nodes_.size(), false);
  while (!ready.empty()) {
    auto n = ready.top();
    ready.pop();
    placed[n] = true;
    result.order.push_back(n);
    for (auto d : member_dependents[n]) {
      if (--pending[d] == 0 && !self_cycle[d]) ready.push(d);
    }
  }

  for (auto n : subset) {
    if (!placed[n]) result.unordered.push_back(n);
  }
  std::sort(result.unordered.begin(), result.unordered.end(), [this](NodeIndex a, NodeIndex b) { return nodes_[a].key < nodes_[b].key; });
  return result;
}

} // namespace rulegraph::graph
