#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/cache/cache_keys.hpp"
#include "internal/cache/cache_service.hpp"
#include "internal/cache/invalidation_coordinator.hpp"
#include "internal/cache/memory_cache.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/expr/value.hpp"
#include "internal/graph/dependency_graph_service.hpp"

namespace {

using rulegraph::cache::CacheService;
using rulegraph::cache::ComputedFieldsKey;
using rulegraph::cache::DerivedVariableKey;
using rulegraph::cache::InvalidationCoordinator;
using rulegraph::db::model::ConditionRecord;
using rulegraph::db::model::VariableRecord;
using rulegraph::expr::ParseJsonValue;

constexpr const char* kBranch = "main";

struct Fixture {
  std::shared_ptr<rulegraph::db::memory::MemoryRepository>     repo = std::make_shared<rulegraph::db::memory::MemoryRepository>();
  std::shared_ptr<rulegraph::cache::MemoryCache>               backend = std::make_shared<rulegraph::cache::MemoryCache>();
  std::shared_ptr<CacheService>                                cache   = std::make_shared<CacheService>(backend);
  std::shared_ptr<rulegraph::graph::DependencyGraphService>    graphs  = std::make_shared<rulegraph::graph::DependencyGraphService>(repo);
  std::shared_ptr<InvalidationCoordinator>                     coordinator = std::make_shared<InvalidationCoordinator>(graphs, cache);

  void AddVariable(const std::string& id, const std::string& scope_id, const std::string& key, const std::string& json, bool formula) {
    VariableRecord v;
    v.id          = id;
    v.campaign_id = "c1";
    v.scope       = "settlement";
    v.scope_id    = scope_id;
    v.key         = key;
    if (formula) {
      v.formula = ParseJsonValue(json);
    } else {
      v.value = ParseJsonValue(json);
    }
    auto tx = repo->Begin();
    assert(static_cast<bool>(repo->InsertVariable(*tx, v)));
    tx->Commit();
  }

  void AddCondition(const std::string& id, const std::string& entity_id, const std::string& field, const std::string& expression) {
    ConditionRecord c;
    c.id          = id;
    c.campaign_id = "c1";
    c.entity_type = "settlement";
    c.entity_id   = entity_id;
    c.field       = field;
    c.expression  = ParseJsonValue(expression);
    auto tx       = repo->Begin();
    assert(static_cast<bool>(repo->InsertCondition(*tx, c)));
    tx->Commit();
  }

  void Seed(const std::string& key) {
    cache->SetValue(key, rulegraph::expr::BoolValue(true), std::chrono::seconds(300));
  }

  bool Cached(const std::string& key) {
    return cache->GetValue(key).has_value();
  }
};

void Populate(Fixture& f) {
  f.AddVariable("pop1", "s1", "population", "12000", false);
  f.AddVariable("pop2", "s2", "population", "800", false);
  f.AddVariable("wealth1", "s1", "wealth", R"({"*": [{"var": "population"}, 2]})", true);
  f.AddCondition("prosperity1", "s1", "prosperity", R"({">": [{"var": "population"}, 10000]})");
  f.AddCondition("prosperity2", "s2", "prosperity", R"({">": [{"var": "population"}, 10000]})");
  f.AddCondition("big1", "s1", "big", R"({">": [{"var": "settlement.level"}, 3]})");

  f.Seed(ComputedFieldsKey("settlement", "s1", kBranch));
  f.Seed(ComputedFieldsKey("settlement", "s2", kBranch));
  f.Seed(ComputedFieldsKey("structure", "t1", kBranch));
  f.Seed(DerivedVariableKey("settlement", "s1", "wealth", kBranch));
  f.Seed(ComputedFieldsKey("settlement", "s1", "dev"));
}

void TestVariableChangeDeletesOnlyReachableKeys() {
  Fixture f;
  Populate(f);

  auto report = f.coordinator->Invalidate(rulegraph::cache::VariableChanged{"c1", kBranch, "settlement", "s1", "population"});

  assert(report.patterns.empty());
  assert(report.exact_keys.contains(ComputedFieldsKey("settlement", "s1", kBranch)));
  assert(report.exact_keys.contains(DerivedVariableKey("settlement", "s1", "wealth", kBranch)));
  assert(report.keys_deleted == 2);

  assert(!f.Cached(ComputedFieldsKey("settlement", "s1", kBranch)));
  assert(!f.Cached(DerivedVariableKey("settlement", "s1", "wealth", kBranch)));
  assert(f.Cached(ComputedFieldsKey("settlement", "s2", kBranch)));
  assert(f.Cached(ComputedFieldsKey("structure", "t1", kBranch)));
  assert(f.Cached(ComputedFieldsKey("settlement", "s1", "dev")));
}

void TestUnrelatedVariableDeletesNothing() {
  Fixture f;
  Populate(f);

  auto report = f.coordinator->Invalidate(rulegraph::cache::VariableChanged{"c1", kBranch, "settlement", "s1", "morale"});
  assert(report.exact_keys.empty());
  assert(report.patterns.empty());
  assert(report.keys_deleted == 0);
  assert(f.Cached(ComputedFieldsKey("settlement", "s1", kBranch)));
}

void TestClassLevelConditionResolvesToChangedEntity() {
  Fixture f;
  f.AddVariable("pop1", "s1", "population", "12000", false);
  f.AddCondition("crowded", "", "crowded", R"({">": [{"var": "population"}, 100]})");
  f.Seed(ComputedFieldsKey("settlement", "s1", kBranch));
  f.Seed(ComputedFieldsKey("settlement", "s2", kBranch));

  auto report = f.coordinator->Invalidate(rulegraph::cache::VariableChanged{"c1", kBranch, "settlement", "s1", "population"});
  assert(report.patterns.empty());
  assert(!f.Cached(ComputedFieldsKey("settlement", "s1", kBranch)));
  assert(f.Cached(ComputedFieldsKey("settlement", "s2", kBranch)));
}

void TestEntityChangeFollowsChangedFields() {
  Fixture f;
  Populate(f);
  f.Seed(rulegraph::cache::SettlementStructuresKey("s1", kBranch));

  rulegraph::cache::EntityChanged change;
  change.campaign_id    = "c1";
  change.branch_id      = kBranch;
  change.entity_type    = "settlement";
  change.entity_id      = "s1";
  change.changed_fields = {"level"};

  auto report = f.coordinator->Invalidate(change);
  assert(report.exact_keys.contains(ComputedFieldsKey("settlement", "s1", kBranch)));
  assert(report.exact_keys.contains(rulegraph::cache::SettlementStructuresKey("s1", kBranch)));
  // structures of a settlement are not enumerable without the store
  assert(report.patterns.contains(rulegraph::cache::ComputedFieldsPattern("structure", kBranch)));

  assert(!f.Cached(ComputedFieldsKey("settlement", "s1", kBranch)));
  assert(!f.Cached(ComputedFieldsKey("structure", "t1", kBranch)));
  assert(f.Cached(ComputedFieldsKey("settlement", "s2", kBranch)));
  // level feeds no derived variable
  assert(f.Cached(DerivedVariableKey("settlement", "s1", "wealth", kBranch)));
}

void TestChildChangeReachesParent() {
  Fixture f;
  f.Seed(ComputedFieldsKey("structure", "t1", kBranch));
  f.Seed(ComputedFieldsKey("settlement", "s1", kBranch));
  f.Seed(ComputedFieldsKey("settlement", "s2", kBranch));

  rulegraph::cache::EntityChanged change;
  change.campaign_id    = "c1";
  change.branch_id      = kBranch;
  change.entity_type    = "structure";
  change.entity_id      = "t1";
  change.changed_fields = {"operational"};
  change.parent_type    = "settlement";
  change.parent_id      = "s1";

  f.coordinator->Invalidate(change);
  assert(!f.Cached(ComputedFieldsKey("structure", "t1", kBranch)));
  assert(!f.Cached(ComputedFieldsKey("settlement", "s1", kBranch)));
  assert(f.Cached(ComputedFieldsKey("settlement", "s2", kBranch)));
}

void TestClassLevelDefinitionChangeUsesPattern() {
  Fixture f;
  Populate(f);
  auto before = f.graphs->GetGraph("c1", kBranch);
  assert(before != nullptr);

  auto report = f.coordinator->Invalidate(rulegraph::cache::ConditionDefinitionChanged{"c1", kBranch, "crowded", "settlement", ""});
  assert(report.patterns.contains(rulegraph::cache::ComputedFieldsPattern("settlement", kBranch)));
  assert(report.exact_keys.contains(rulegraph::cache::GraphKey("c1", kBranch)));
  assert(f.graphs->PeekGraph("c1", kBranch) == nullptr);

  assert(!f.Cached(ComputedFieldsKey("settlement", "s1", kBranch)));
  assert(!f.Cached(ComputedFieldsKey("settlement", "s2", kBranch)));
  assert(f.Cached(ComputedFieldsKey("structure", "t1", kBranch)));
  assert(f.Cached(ComputedFieldsKey("settlement", "s1", "dev")));
}

void TestVariableDefinitionChangeDropsGraphAndDependents() {
  Fixture f;
  Populate(f);
  (void)f.graphs->GetGraph("c1", kBranch);

  auto report = f.coordinator->Invalidate(rulegraph::cache::VariableDefinitionChanged{"c1", kBranch, "settlement", "s1", "wealth"});
  assert(report.exact_keys.contains(DerivedVariableKey("settlement", "s1", "wealth", kBranch)));
  assert(f.graphs->PeekGraph("c1", kBranch) == nullptr);
  assert(!f.Cached(DerivedVariableKey("settlement", "s1", "wealth", kBranch)));
  assert(!f.Cached(ComputedFieldsKey("settlement", "s1", kBranch)));
  assert(f.Cached(ComputedFieldsKey("settlement", "s2", kBranch)));
}

void TestClassConditionOverDerivedVariable() {
  Fixture f;
  f.AddVariable("pop1", "s1", "population", "12000", false);
  f.AddVariable("wealth1", "s1", "wealth", R"({"*": [{"var": "population"}, 0.01]})", true);
  f.AddCondition("rich", "", "rich", R"({">": [{"var": "wealth"}, 100]})");
  f.Seed(ComputedFieldsKey("settlement", "s1", kBranch));
  f.Seed(ComputedFieldsKey("settlement", "s2", kBranch));

  auto report = f.coordinator->Invalidate(rulegraph::cache::VariableChanged{"c1", kBranch, "settlement", "s1", "population"});
  assert(report.patterns.empty());
  assert(report.exact_keys.contains(DerivedVariableKey("settlement", "s1", "wealth", kBranch)));
  assert(report.exact_keys.contains(ComputedFieldsKey("settlement", "s1", kBranch)));
  assert(!f.Cached(ComputedFieldsKey("settlement", "s1", kBranch)));
  assert(f.Cached(ComputedFieldsKey("settlement", "s2", kBranch)));
}

void TestAllBranchesReachesEveryBranch() {
  Fixture f;
  Populate(f);
  f.Seed(ComputedFieldsKey("settlement", "s1", "alt"));
  (void)f.graphs->GetGraph("c1", kBranch);
  (void)f.graphs->GetGraph("c1", "alt");

  auto report = f.coordinator->Invalidate(
      rulegraph::cache::VariableChanged{"c1", rulegraph::cache::kAllBranches, "settlement", "s1", "population"});
  assert(report.exact_keys.empty());
  assert(report.patterns.contains("computed-fields:settlement:s1:*"));
  assert(!f.Cached(ComputedFieldsKey("settlement", "s1", kBranch)));
  assert(!f.Cached(ComputedFieldsKey("settlement", "s1", "alt")));
  assert(!f.Cached(ComputedFieldsKey("settlement", "s1", "dev")));
  assert(!f.Cached(DerivedVariableKey("settlement", "s1", "wealth", kBranch)));
  assert(f.Cached(ComputedFieldsKey("settlement", "s2", kBranch)));
  assert(f.Cached(ComputedFieldsKey("structure", "t1", kBranch)));
  // value changes keep the graphs
  assert(f.graphs->PeekGraph("c1", "alt") != nullptr);

  f.coordinator->Invalidate(
      rulegraph::cache::ConditionDefinitionChanged{"c1", rulegraph::cache::kAllBranches, "big1", "settlement", "s1"});
  assert(f.graphs->PeekGraph("c1", kBranch) == nullptr);
  assert(f.graphs->PeekGraph("c1", "alt") == nullptr);
}

} // namespace

int main() {
  TestVariableChangeDeletesOnlyReachableKeys();
  TestUnrelatedVariableDeletesNothing();
  TestClassLevelConditionResolvesToChangedEntity();
  TestEntityChangeFollowsChangedFields();
  TestChildChangeReachesParent();
  TestClassLevelDefinitionChangeUsesPattern();
  TestVariableDefinitionChangeDropsGraphAndDependents();
  TestClassConditionOverDerivedVariable();
  TestAllBranchesReachesEveryBranch();

  std::cout << "invalidation_coordinator_test: pass\n";
  return 0;
}
