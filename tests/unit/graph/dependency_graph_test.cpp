#include <algorithm>
#include <cassert>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/expr/value.hpp"
#include "internal/graph/dependency_graph.hpp"
#include "internal/graph/dependency_graph_builder.hpp"
#include "internal/graph/dependency_graph_service.hpp"
#include "internal/util/errors.hpp"

namespace {

using rulegraph::db::model::ConditionRecord;
using rulegraph::db::model::EffectRecord;
using rulegraph::db::model::VariableRecord;
using rulegraph::expr::ParseJsonValue;
using rulegraph::graph::DependencyGraph;
using rulegraph::graph::DependencyGraphBuilder;
using rulegraph::graph::GraphInputs;
using rulegraph::graph::GraphNode;
using rulegraph::graph::NodeKind;

ConditionRecord Condition(const std::string& id, const std::string& field, const std::string& expression, int32_t priority = 0,
                          uint64_t seq = 0) {
  ConditionRecord c;
  c.id          = id;
  c.campaign_id = "c1";
  c.entity_type = "settlement";
  c.entity_id   = "s1";
  c.field       = field;
  c.expression  = ParseJsonValue(expression);
  c.priority    = priority;
  c.created_seq = seq;
  return c;
}

bool Contains(const std::vector<std::string>& keys, const std::string& key) {
  return std::find(keys.begin(), keys.end(), key) != keys.end();
}

// a reads settlement.b, b reads settlement.c, c reads settlement.a
std::vector<ConditionRecord> ThreeCycle() {
  return {Condition("A", "a", R"({"var": "settlement.b"})"), Condition("B", "b", R"({"var": "settlement.c"})"),
          Condition("C", "c", R"({"var": "settlement.a"})")};
}

void TestCycleIsReportedInEveryInsertionOrder() {
  auto conditions = ThreeCycle();
  std::sort(conditions.begin(), conditions.end(), [](const auto& x, const auto& y) { return x.id < y.id; });

  do {
    GraphInputs inputs;
    inputs.conditions = conditions;
    auto graph        = DependencyGraphBuilder{}.Build(inputs);

    auto cycles = graph.DetectCycles();
    assert(!cycles.empty());
    const auto& path = cycles.front().path;
    assert(Contains(path, "condition:A"));
    assert(Contains(path, "condition:B"));
    assert(Contains(path, "condition:C"));

    auto topo = graph.TopologicalOrder();
    assert(topo.HasCycle());
  } while (std::next_permutation(conditions.begin(), conditions.end(), [](const auto& x, const auto& y) { return x.id < y.id; }));
}

void TestAcyclicChainOrdersDependenciesFirst() {
  GraphInputs inputs;
  inputs.conditions = {Condition("top", "top", R"({"var": "settlement.mid"})"), Condition("mid", "mid", R"({"var": "settlement.base"})")};
  auto graph        = DependencyGraphBuilder{}.Build(inputs);

  assert(graph.DetectCycles().empty());
  auto top = *graph.Find("condition:top");
  auto mid = *graph.Find("condition:mid");
  assert(graph.HasPath(top, mid));
  assert(!graph.HasPath(mid, top));

  auto topo = graph.TopologicalOrder({top, mid});
  assert(!topo.HasCycle());
  assert(topo.order.size() == 2);
  assert(topo.order[0] == mid);
  assert(topo.order[1] == top);
}

void TestTopologicalTiesUsePriorityThenSequence() {
  DependencyGraph graph;
  auto            add = [&graph](const std::string& key, int32_t priority, uint64_t seq) {
    GraphNode node;
    node.key         = key;
    node.kind        = NodeKind::kCondition;
    node.concrete    = true;
    node.priority    = priority;
    node.created_seq = seq;
    return graph.AddNode(std::move(node));
  };
  auto late   = add("condition:late", 1, 1);
  auto second = add("condition:second", 0, 5);
  auto first  = add("condition:first", 0, 2);

  auto topo = graph.TopologicalOrder();
  assert(topo.order.size() == 3);
  assert(topo.order[0] == first);
  assert(topo.order[1] == second);
  assert(topo.order[2] == late);
}

void TestReverseReachableFollowsDependents() {
  VariableRecord pop;
  pop.id          = "v1";
  pop.campaign_id = "c1";
  pop.scope       = "settlement";
  pop.scope_id    = "s1";
  pop.key         = "population";
  pop.value       = rulegraph::expr::NumberValue(12000);

  VariableRecord wealth = pop;
  wealth.id             = "v2";
  wealth.key            = "wealth";
  wealth.value.reset();
  wealth.formula = ParseJsonValue(R"({"*": [{"var": "population"}, 2]})");

  GraphInputs inputs;
  inputs.variables  = {pop, wealth};
  inputs.conditions = {Condition("rich", "rich", R"({">": [{"var": "wealth"}, 100]})"),
                       Condition("big", "big", R"({">": [{"var": "settlement.level"}, 3]})")};
  auto graph        = DependencyGraphBuilder{}.Build(inputs);

  auto seed    = *graph.Find("var:settlement:s1:population");
  auto reached = graph.ReverseReachable({seed});

  std::vector<std::string> keys;
  for (auto idx : reached) keys.push_back(graph.Node(idx).key);
  assert(Contains(keys, "var:settlement:s1:population"));
  assert(Contains(keys, "var:settlement:s1:wealth"));
  assert(Contains(keys, "condition:rich"));
  assert(!Contains(keys, "condition:big"));
  assert(graph.Node(*graph.Find("var:settlement:s1:wealth")).derived);
}

void TestWorldVariablesResolveWhenNotShadowed() {
  VariableRecord tax;
  tax.id          = "w1";
  tax.campaign_id = "c1";
  tax.scope       = "world";
  tax.key         = "tax";
  tax.value       = rulegraph::expr::NumberValue(3);

  GraphInputs inputs;
  inputs.variables  = {tax};
  inputs.conditions = {Condition("taxed", "taxed", R"({">": [{"var": "tax"}, 1]})")};
  auto graph        = DependencyGraphBuilder{}.Build(inputs);

  auto world = *graph.Find("var:world::tax");
  auto cond  = *graph.Find("condition:taxed");
  assert(graph.HasPath(cond, world));
}

void TestEffectWritesPropNodes() {
  EffectRecord effect;
  effect.id          = "e1";
  effect.campaign_id = "c1";
  effect.entity_type = "settlement";
  effect.entity_id   = "s1";
  effect.source_type = "event";
  effect.payload     = ParseJsonValue(R"([{"op": "replace", "path": "/level", "value": 5}])").list_value();

  GraphInputs inputs;
  inputs.effects    = {effect};
  inputs.conditions = {Condition("big", "big", R"({">": [{"var": "settlement.level"}, 3]})")};
  auto graph        = DependencyGraphBuilder{}.Build(inputs);

  auto prop = *graph.Find("prop:settlement:s1:level");
  auto cond = *graph.Find("condition:big");
  auto eff  = *graph.Find("effect:e1");
  assert(graph.HasPath(prop, eff));
  assert(graph.HasPath(cond, eff));
}

void TestServiceRejectsCandidateClosingACycle() {
  auto repo = std::make_shared<rulegraph::db::memory::MemoryRepository>();
  {
    auto tx    = repo->Begin();
    auto conds = ThreeCycle();
    // A and B only; C would close the loop.
    assert(static_cast<bool>(repo->InsertCondition(*tx, conds[0])));
    assert(static_cast<bool>(repo->InsertCondition(*tx, conds[1])));
    tx->Commit();
  }

  rulegraph::graph::DependencyGraphService service(repo);
  assert(service.GetEvaluationOrder("c1", "main").size() > 0);

  bool threw = false;
  try {
    service.ValidateCandidate("c1", ThreeCycle()[2]);
  } catch (const rulegraph::util::CircularDependency& e) {
    threw = true;
    assert(Contains(e.path(), "condition:C"));
  }
  assert(threw);

  // A harmless candidate passes.
  service.ValidateCandidate("c1", Condition("D", "d", R"({"var": "settlement.a"})"));

  // Cached graphs are reused until invalidated.
  auto first = service.GetGraph("c1", "main");
  assert(service.PeekGraph("c1", "main") == first);
  service.InvalidateGraph("c1", "main");
  assert(service.PeekGraph("c1", "main") == nullptr);
}

void TestClassReadReachesConcreteVariables() {
  VariableRecord pop;
  pop.id          = "v1";
  pop.campaign_id = "c1";
  pop.scope       = "settlement";
  pop.scope_id    = "s1";
  pop.key         = "population";
  pop.value       = rulegraph::expr::NumberValue(12000);

  VariableRecord wealth = pop;
  wealth.id             = "v2";
  wealth.key            = "wealth";
  wealth.value.reset();
  wealth.formula = ParseJsonValue(R"({"*": [{"var": "population"}, 0.01]})");

  auto rich      = Condition("rich", "rich", R"({">": [{"var": "wealth"}, 100]})");
  rich.entity_id = "";

  GraphInputs inputs;
  inputs.variables  = {pop, wealth};
  inputs.conditions = {rich};
  auto graph        = DependencyGraphBuilder{}.Build(inputs);

  auto cls = *graph.Find("var:settlement:*:wealth");
  assert(graph.GetDependencies(cls).size() == 1);
  assert(graph.Node(graph.GetDependencies(cls).front()).key == "var:settlement:s1:wealth");

  std::vector<std::string> keys;
  for (auto idx : graph.ReverseReachable({*graph.Find("var:settlement:s1:population")})) keys.push_back(graph.Node(idx).key);
  assert(Contains(keys, "var:settlement:s1:wealth"));
  assert(Contains(keys, "var:settlement:*:wealth"));
  assert(Contains(keys, "condition:rich"));
  assert(graph.DetectCycles().empty());
}

// e1 -> x -> y -> e1 with only e1 in the subset
void TestSubsetMemberOnOutsideCycleIsUnordered() {
  DependencyGraph graph;
  auto            add = [&graph](const std::string& key) {
    GraphNode node;
    node.key  = key;
    node.kind = NodeKind::kEffect;
    return graph.AddNode(std::move(node));
  };
  auto e1    = add("effect:e1");
  auto x     = add("prop:settlement:s1:level");
  auto y     = add("effect:e2");
  auto after = add("effect:e3");
  graph.AddEdge(e1, x, rulegraph::graph::EdgeKind::kReads);
  graph.AddEdge(x, y, rulegraph::graph::EdgeKind::kReads);
  graph.AddEdge(y, e1, rulegraph::graph::EdgeKind::kReads);
  graph.AddEdge(after, e1, rulegraph::graph::EdgeKind::kReads);

  auto alone = graph.TopologicalOrder({e1});
  assert(alone.HasCycle());
  assert(alone.order.empty());
  assert(alone.unordered == std::vector<DependencyGraph::NodeIndex>{e1});

  // a member behind it cannot be ordered either
  auto behind = graph.TopologicalOrder({e1, after});
  assert(behind.order.empty());
  assert(behind.unordered.size() == 2);
}

// Forwards to a memory repository and runs a hook once, while the graph
// service is reading conditions.
class InterleavingRepository final : public rulegraph::db::Repository {
 public:
  std::shared_ptr<rulegraph::db::memory::MemoryRepository> inner = std::make_shared<rulegraph::db::memory::MemoryRepository>();
  std::function<void()>                                   during_load;

  std::unique_ptr<rulegraph::db::Transaction> Begin() override {
    return inner->Begin();
  }
  rulegraph::db::Result UpsertEntity(rulegraph::db::Transaction& tx, const rulegraph::db::model::EntityRecord& r) override {
    return inner->UpsertEntity(tx, r);
  }
  rulegraph::db::Result UpdateEntity(rulegraph::db::Transaction& tx, const rulegraph::db::model::EntityRecord& r, uint64_t v) override {
    return inner->UpdateEntity(tx, r, v);
  }
  std::optional<rulegraph::db::model::EntityRecord> GetEntity(rulegraph::db::Transaction& tx, const std::string& type,
                                                              const std::string& id) override {
    return inner->GetEntity(tx, type, id);
  }
  std::vector<rulegraph::db::model::EntityRecord> ListChildren(rulegraph::db::Transaction& tx, const std::string& parent_type,
                                                               const std::string& parent_id, const std::string& child_type) override {
    return inner->ListChildren(tx, parent_type, parent_id, child_type);
  }
  rulegraph::db::Result InsertVariable(rulegraph::db::Transaction& tx, VariableRecord& r) override {
    return inner->InsertVariable(tx, r);
  }
  rulegraph::db::Result UpdateVariable(rulegraph::db::Transaction& tx, const VariableRecord& r, uint64_t v) override {
    return inner->UpdateVariable(tx, r, v);
  }
  std::optional<VariableRecord> GetVariable(rulegraph::db::Transaction& tx, const std::string& id) override {
    return inner->GetVariable(tx, id);
  }
  std::vector<VariableRecord> ListVariablesByScope(rulegraph::db::Transaction& tx, const std::string& scope,
                                                   const std::string& scope_id) override {
    return inner->ListVariablesByScope(tx, scope, scope_id);
  }
  std::vector<VariableRecord> ListVariablesByCampaign(rulegraph::db::Transaction& tx, const std::string& campaign_id) override {
    return inner->ListVariablesByCampaign(tx, campaign_id);
  }
  rulegraph::db::Result InsertCondition(rulegraph::db::Transaction& tx, ConditionRecord& r) override {
    return inner->InsertCondition(tx, r);
  }
  rulegraph::db::Result UpdateCondition(rulegraph::db::Transaction& tx, const ConditionRecord& r, uint64_t v) override {
    return inner->UpdateCondition(tx, r, v);
  }
  std::optional<ConditionRecord> GetCondition(rulegraph::db::Transaction& tx, const std::string& id) override {
    return inner->GetCondition(tx, id);
  }
  std::vector<ConditionRecord> ListConditionsByCampaign(rulegraph::db::Transaction& tx, const std::string& campaign_id) override {
    auto rows = inner->ListConditionsByCampaign(tx, campaign_id);
    if (during_load) std::exchange(during_load, nullptr)();
    return rows;
  }
  std::vector<ConditionRecord> ListConditionsForEntity(rulegraph::db::Transaction& tx, const std::string& campaign_id,
                                                       const std::string& entity_type, const std::string& entity_id) override {
    return inner->ListConditionsForEntity(tx, campaign_id, entity_type, entity_id);
  }
  rulegraph::db::Result InsertEffect(rulegraph::db::Transaction& tx, EffectRecord& r) override {
    return inner->InsertEffect(tx, r);
  }
  rulegraph::db::Result UpdateEffect(rulegraph::db::Transaction& tx, const EffectRecord& r, uint64_t v) override {
    return inner->UpdateEffect(tx, r, v);
  }
  std::optional<EffectRecord> GetEffect(rulegraph::db::Transaction& tx, const std::string& id) override {
    return inner->GetEffect(tx, id);
  }
  std::vector<EffectRecord> ListEffectsByCampaign(rulegraph::db::Transaction& tx, const std::string& campaign_id) override {
    return inner->ListEffectsByCampaign(tx, campaign_id);
  }
  std::vector<EffectRecord> ListEffectsForEntity(rulegraph::db::Transaction& tx, const std::string& entity_type,
                                                 const std::string& entity_id) override {
    return inner->ListEffectsForEntity(tx, entity_type, entity_id);
  }
  rulegraph::db::Result InsertEffectExecution(rulegraph::db::Transaction& tx, const rulegraph::db::model::EffectExecutionRecord& r) override {
    return inner->InsertEffectExecution(tx, r);
  }
  std::vector<rulegraph::db::model::EffectExecutionRecord> ListEffectExecutions(rulegraph::db::Transaction& tx,
                                                                                const std::string& effect_id) override {
    return inner->ListEffectExecutions(tx, effect_id);
  }
};

// A condition committed and announced while a graph is being built must
// not be hidden by that build.
void TestBuildOverlappingInvalidationIsNotCached() {
  auto repo = std::make_shared<InterleavingRepository>();
  {
    auto tx   = repo->inner->Begin();
    auto base = Condition("A", "a", R"({"var": "settlement.level"})");
    assert(static_cast<bool>(repo->inner->InsertCondition(*tx, base)));
    tx->Commit();
  }

  rulegraph::graph::DependencyGraphService service(repo);
  repo->during_load = [&] {
    auto tx    = repo->inner->Begin();
    auto added = Condition("B", "b", R"({"var": "settlement.a"})");
    assert(static_cast<bool>(repo->inner->InsertCondition(*tx, added)));
    tx->Commit();
    service.InvalidateGraph("c1", "main");
  };

  auto stale = service.GetGraph("c1", "main");
  assert(stale->Find("condition:A").has_value());
  assert(!stale->Find("condition:B").has_value());
  assert(service.PeekGraph("c1", "main") == nullptr);

  auto fresh = service.GetGraph("c1", "main");
  assert(fresh->Find("condition:B").has_value());
  assert(service.PeekGraph("c1", "main") == fresh);

  // every branch of the campaign goes at once
  (void)service.GetGraph("c1", "alt");
  service.InvalidateCampaign("c1");
  assert(service.PeekGraph("c1", "main") == nullptr);
  assert(service.PeekGraph("c1", "alt") == nullptr);
}

void TestFormatCycle() {
  assert(rulegraph::graph::FormatCycle({"a", "b", "c"}) == "a -> b -> c -> a");
}

} // namespace

int main() {
  TestCycleIsReportedInEveryInsertionOrder();
  TestAcyclicChainOrdersDependenciesFirst();
  TestTopologicalTiesUsePriorityThenSequence();
  TestReverseReachableFollowsDependents();
  TestWorldVariablesResolveWhenNotShadowed();
  TestEffectWritesPropNodes();
  TestServiceRejectsCandidateClosingACycle();
  TestClassReadReachesConcreteVariables();
  TestSubsetMemberOnOutsideCycleIsUnordered();
  TestBuildOverlappingInvalidationIsNotCached();
  TestFormatCycle();

  std::cout << "dependency_graph_test: pass\n";
  return 0;
}
