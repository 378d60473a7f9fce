#include <algorithm>
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
#include "internal/effects/effect_engine.hpp"
#include "internal/expr/value.hpp"
#include "internal/graph/dependency_graph_service.hpp"
#include "internal/util/errors.hpp"

namespace {

using rulegraph::db::model::EffectRecord;
using rulegraph::db::model::EntityRecord;
using rulegraph::effects::EffectEngine;
using rulegraph::expr::ParseJsonStruct;
using rulegraph::expr::ParseJsonValue;

constexpr const char* kBranch = "main";

struct Fixture {
  std::shared_ptr<rulegraph::db::memory::MemoryRepository>  repo    = std::make_shared<rulegraph::db::memory::MemoryRepository>();
  std::shared_ptr<rulegraph::cache::MemoryCache>            backend = std::make_shared<rulegraph::cache::MemoryCache>();
  std::shared_ptr<rulegraph::cache::CacheService>           cache   = std::make_shared<rulegraph::cache::CacheService>(backend);
  std::shared_ptr<rulegraph::graph::DependencyGraphService> graphs  = std::make_shared<rulegraph::graph::DependencyGraphService>(repo);
  std::shared_ptr<rulegraph::cache::InvalidationCoordinator> coordinator =
      std::make_shared<rulegraph::cache::InvalidationCoordinator>(graphs, cache);
  EffectEngine engine{repo, graphs, coordinator, rulegraph::effects::PathWhitelist()};

  Fixture() {
    EntityRecord s;
    s.entity_type = "settlement";
    s.id          = "s1";
    s.campaign_id = "c1";
    s.fields      = ParseJsonStruct(R"({"id": "s1", "name": "Oakvale", "level": 2, "variables": {}})");
    s.version     = 1;
    auto tx       = repo->Begin();
    assert(static_cast<bool>(repo->UpsertEntity(*tx, s)));
    tx->Commit();
  }

  void AddEffect(const std::string& id, int priority, const std::string& patch,
                 rulegraph::v1::EffectTiming timing = rulegraph::v1::EFFECT_TIMING_ON_RESOLVE) {
    EffectRecord e;
    e.id          = id;
    e.campaign_id = "c1";
    e.entity_type = "settlement";
    e.entity_id   = "s1";
    e.source_type = "encounter";
    e.source_id   = "enc1";
    e.payload     = ParseJsonValue(patch).list_value();
    e.timing      = timing;
    e.priority    = priority;
    auto tx       = repo->Begin();
    assert(static_cast<bool>(repo->InsertEffect(*tx, e)));
    tx->Commit();
  }

  EntityRecord Settlement() {
    auto tx = repo->Begin();
    auto s  = repo->GetEntity(*tx, "settlement", "s1");
    tx->Commit();
    assert(s.has_value());
    return *s;
  }

  std::size_t Executions(const std::string& effect_id) {
    auto tx  = repo->Begin();
    auto out = repo->ListEffectExecutions(*tx, effect_id);
    tx->Commit();
    return out.size();
  }
};

void TestAppliesPatchAndInvalidates() {
  Fixture f;
  f.AddEffect("grow", 1, R"([{"op": "replace", "path": "/level", "value": 3}])");
  const auto key = rulegraph::cache::ComputedFieldsKey("settlement", "s1", kBranch);
  f.cache->SetValue(key, rulegraph::expr::BoolValue(true), std::chrono::seconds(300));

  auto record = f.engine.ExecuteEffect("grow", "gm", false);
  assert(record.success);
  assert(record.state == rulegraph::v1::EXECUTION_STATE_SUCCEEDED);
  assert((record.affected_fields == std::vector<std::string>{"level"}));
  assert(record.context.fields().at("level").number_value() == 2);

  auto s = f.Settlement();
  assert(s.fields.fields().at("level").number_value() == 3);
  assert(s.version == 2);
  assert(f.Executions("grow") == 1);
  assert(!f.cache->GetValue(key).has_value());
}

void TestDryRunPersistsNothing() {
  Fixture f;
  f.AddEffect("grow", 1, R"([{"op": "replace", "path": "/level", "value": 3}])");

  auto record = f.engine.ExecuteEffect("grow", "gm", true);
  assert(record.success);
  assert((record.affected_fields == std::vector<std::string>{"level"}));
  assert(f.Settlement().fields.fields().at("level").number_value() == 2);
  assert(f.Settlement().version == 1);
  assert(f.Executions("grow") == 0);
}

void TestBatchContinuesAfterFailure() {
  Fixture f;
  f.AddEffect("bad", 1, R"([{"op": "replace", "path": "/id", "value": "stolen"}])", rulegraph::v1::EFFECT_TIMING_PRE);
  f.AddEffect("good", 2, R"([{"op": "replace", "path": "/name", "value": "Oakhold"}])", rulegraph::v1::EFFECT_TIMING_PRE);
  f.AddEffect("later", 1, R"([{"op": "replace", "path": "/level", "value": 9}])", rulegraph::v1::EFFECT_TIMING_POST);

  auto result = f.engine.ExecuteEffectsForEntity("settlement", "s1", rulegraph::v1::EFFECT_TIMING_PRE, "gm", kBranch);
  assert(result.total == 2);
  assert(result.succeeded == 1);
  assert(result.failed == 1);
  assert((result.execution_order == std::vector<std::string>{"bad", "good"}));
  assert(!result.executions[0].success);
  assert(!result.executions[0].error.empty());
  assert(result.executions[0].state == rulegraph::v1::EXECUTION_STATE_FAILED);
  assert(result.executions[1].success);

  // the failure is audited too
  assert(f.Executions("bad") == 1);
  assert(f.Executions("good") == 1);
  assert(f.Executions("later") == 0);

  auto s = f.Settlement();
  assert(s.fields.fields().at("id").string_value() == "s1");
  assert(s.fields.fields().at("name").string_value() == "Oakhold");
  assert(s.fields.fields().at("level").number_value() == 2);
}

void TestWriterRunsBeforeReader() {
  Fixture f;
  // priority alone would run the reader first
  f.AddEffect("writer", 5, R"([{"op": "replace", "path": "/level", "value": 5}])");
  f.AddEffect("reader", 1, R"([{"op": "test", "path": "/level", "value": 5}, {"op": "replace", "path": "/name", "value": "Capital"}])");

  auto result = f.engine.ExecuteEffectsForEntity("settlement", "s1", rulegraph::v1::EFFECT_TIMING_UNSPECIFIED, "gm", kBranch);
  assert((result.execution_order == std::vector<std::string>{"writer", "reader"}));
  assert(result.succeeded == 2);
  assert(f.Settlement().fields.fields().at("name").string_value() == "Capital");
}

void TestWithDependenciesOrdersSubset() {
  Fixture f;
  f.AddEffect("writer", 5, R"([{"op": "replace", "path": "/level", "value": 5}])");
  f.AddEffect("reader", 1, R"([{"op": "test", "path": "/level", "value": 5}, {"op": "replace", "path": "/name", "value": "Capital"}])");

  auto result = f.engine.ExecuteEffectsWithDependencies({"reader", "writer"}, "gm", kBranch);
  assert((result.execution_order == std::vector<std::string>{"writer", "reader"}));
  assert(result.succeeded == 2);
}

void TestCyclicSubsetRunsNothing() {
  Fixture f;
  f.AddEffect("e1", 1, R"([{"op": "test", "path": "/level", "value": 2}, {"op": "replace", "path": "/name", "value": "a"}])");
  f.AddEffect("e2", 2, R"([{"op": "test", "path": "/name", "value": "Oakvale"}, {"op": "replace", "path": "/level", "value": 4}])");

  bool thrown = false;
  try {
    f.engine.ExecuteEffectsWithDependencies({"e1", "e2"}, "gm", kBranch);
  } catch (const rulegraph::util::CircularDependency& e) {
    thrown = true;
    assert(!e.path().empty());
  }
  assert(thrown);

  // e1 alone still sits on the loop through e2
  bool single = false;
  try {
    f.engine.ExecuteEffectsWithDependencies({"e1"}, "gm", kBranch);
  } catch (const rulegraph::util::CircularDependency& e) {
    single = true;
    assert(std::find(e.path().begin(), e.path().end(), "effect:e1") != e.path().end());
  }
  assert(single);
  assert(f.Executions("e1") == 0);
  assert(f.Executions("e2") == 0);
  assert(f.Settlement().version == 1);
}

void TestPreview() {
  Fixture f;
  f.AddEffect("grow", 1, R"([{"op": "replace", "path": "/level", "value": 3}])");
  f.AddEffect("steal", 1, R"([{"op": "replace", "path": "/campaignId", "value": "other"}])");
  f.AddEffect("broken", 1, R"([{"op": "test", "path": "/level", "value": 99}])");

  auto ok = f.engine.PreviewEffect("grow");
  assert(ok.valid);
  assert(ok.before.fields().at("level").number_value() == 2);
  assert(ok.after.fields().at("level").number_value() == 3);
  assert((ok.changed_fields == std::vector<std::string>{"level"}));

  auto forbidden = f.engine.PreviewEffect("steal");
  assert(!forbidden.valid);
  assert(forbidden.errors.size() == 1);
  assert(forbidden.changed_fields.empty());

  auto failed_test = f.engine.PreviewEffect("broken");
  assert(!failed_test.valid);

  // preview never writes
  assert(f.Settlement().version == 1);
  assert(f.Executions("grow") == 0);

  bool thrown = false;
  try {
    f.engine.PreviewEffect("missing");
  } catch (const rulegraph::util::NotFound&) {
    thrown = true;
  }
  assert(thrown);
}

} // namespace

int main() {
  TestAppliesPatchAndInvalidates();
  TestDryRunPersistsNothing();
  TestBatchContinuesAfterFailure();
  TestWriterRunsBeforeReader();
  TestWithDependenciesOrdersSubset();
  TestCyclicSubsetRunsNothing();
  TestPreview();

  std::cout << "effect_engine_test: pass\n";
  return 0;
}
