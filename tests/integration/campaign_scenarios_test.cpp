#include <cassert>
#include <iostream>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/expr/value.hpp"
#include "internal/factory.hpp"
#include "internal/service/authoring_service.hpp"
#include "internal/service/rules_service.hpp"

namespace {

using namespace rulegraph::v1;
using rulegraph::expr::ParseJsonStruct;
using rulegraph::expr::ParseJsonValue;

rulegraph::factory::Application MakeApp(bool cache_disabled = false) {
  rulegraph::runtime::config::RuntimeConfig config;
  config.mutable_cache()->set_disabled(cache_disabled);
  return rulegraph::factory::Build(config);
}

void SeedCampaign(rulegraph::factory::Application& app) {
  UpsertEntityRequest settlement;
  auto*               s = settlement.mutable_entity();
  s->set_entity_type("settlement");
  s->set_id("s1");
  s->set_campaign_id("c1");
  *s->mutable_fields() = ParseJsonStruct(R"({"id": "s1", "name": "Oakvale", "level": 2, "variables": {}})");
  app.authoring->UpsertEntity(settlement);

  UpsertEntityRequest mill;
  auto*               m = mill.mutable_entity();
  m->set_entity_type("structure");
  m->set_id("t1");
  m->set_campaign_id("c1");
  m->set_parent_type("settlement");
  m->set_parent_id("s1");
  *m->mutable_fields() = ParseJsonStruct(R"({"id": "t1", "type": "mill", "operational": true, "level": 1})");
  app.authoring->UpsertEntity(mill);

  StateVariable population;
  population.set_id("population-s1");
  population.set_campaign_id("c1");
  population.set_scope("settlement");
  population.set_scope_id("s1");
  population.set_key("population");
  *population.mutable_value() = ParseJsonValue("12000");
  app.authoring->CreateVariable(population);

  Condition prosperity;
  prosperity.set_id("prosperity");
  prosperity.set_campaign_id("c1");
  prosperity.set_entity_type("settlement");
  prosperity.set_entity_id("s1");
  prosperity.set_field("prosperity");
  *prosperity.mutable_expression() = ParseJsonValue(R"({">": [{"var": "population"}, 10000]})");
  app.authoring->CreateCondition(prosperity);

  Condition milling;
  milling.set_id("has-mill");
  milling.set_campaign_id("c1");
  milling.set_entity_type("settlement");
  milling.set_field("hasMill");
  *milling.mutable_expression() = ParseJsonValue(R"({"settlement.hasStructureType": ["mill"]})");
  app.authoring->CreateCondition(milling);
}

EvaluateComputedFieldsResponse Evaluate(rulegraph::factory::Application& app, const std::string& branch = "main") {
  EvaluateComputedFieldsRequest req;
  req.set_entity_type("settlement");
  req.set_entity_id("s1");
  req.set_branch_id(branch);
  return app.rules->EvaluateComputedFields(req);
}

void SetPopulation(rulegraph::factory::Application& app, const std::string& value) {
  StateVariable update;
  update.set_id("population-s1");
  update.set_is_active(true);
  *update.mutable_value() = ParseJsonValue(value);
  app.authoring->UpdateVariable(update);
}

bool SameFields(const google::protobuf::Struct& a, const google::protobuf::Struct& b) {
  google::protobuf::Value x;
  google::protobuf::Value y;
  *x.mutable_struct_value() = a;
  *y.mutable_struct_value() = b;
  return rulegraph::expr::DeepEquals(x, y);
}

// Population drops below the threshold behind the service's back; the
// cached result stays until the variable change is announced.
void TestPopulationDropFlipsProsperity() {
  auto app = MakeApp();
  SeedCampaign(app);

  auto before = Evaluate(app);
  assert(before.fields().fields().at("prosperity").bool_value());
  assert(before.fields().fields().at("hasMill").bool_value());

  {
    auto& repo = *app.context.repository;
    auto  tx   = repo.Begin();
    auto  var  = repo.GetVariable(*tx, "population-s1");
    assert(var.has_value());
    const auto current = var->version;
    var->value         = ParseJsonValue("5000");
    var->version       = current + 1;
    assert(static_cast<bool>(repo.UpdateVariable(*tx, *var, current)));
    tx->Commit();
  }

  auto stale = Evaluate(app);
  assert(stale.cache_hit());
  assert(stale.fields().fields().at("prosperity").bool_value());

  InvalidateRequest inv;
  inv.set_campaign_id("c1");
  inv.set_branch_id("main");
  auto* v = inv.mutable_variable();
  v->set_scope("settlement");
  v->set_scope_id("s1");
  v->set_key("population");
  auto report = app.rules->Invalidate(inv);
  assert(report.keys_deleted() >= 1);

  auto after = Evaluate(app);
  assert(!after.cache_hit());
  assert(!after.fields().fields().at("prosperity").bool_value());
  assert(after.fields().fields().at("hasMill").bool_value());
}

void TestWhitelistGuardsEffects() {
  auto app = MakeApp();
  SeedCampaign(app);

  Effect promote;
  promote.set_id("promote");
  promote.set_campaign_id("c1");
  promote.set_entity_type("settlement");
  promote.set_entity_id("s1");
  promote.set_source_type("encounter");
  promote.set_source_id("enc-1");
  *promote.mutable_payload() = ParseJsonValue(R"([{"op": "replace", "path": "/level", "value": 5}])").list_value();
  app.authoring->CreateEffect(promote);

  Effect hijack = promote;
  hijack.set_id("hijack");
  *hijack.mutable_payload() = ParseJsonValue(R"([{"op": "replace", "path": "/id", "value": "x"}])").list_value();
  app.authoring->CreateEffect(hijack);

  GetEntityRequest get;
  get.set_entity_type("settlement");
  get.set_entity_id("s1");
  const auto original = app.authoring->GetEntity(get);

  ExecuteEffectsWithDependenciesRequest bad;
  bad.add_effect_ids("hijack");
  bad.set_actor("gm");
  auto rejected = app.rules->ExecuteEffectsWithDependencies(bad);
  assert(rejected.failed() == 1);
  assert(!rejected.executions(0).success());
  assert(rejected.executions(0).error().find("/id") != std::string::npos);
  assert(rejected.executions(0).state() == EXECUTION_STATE_FAILED);

  auto unchanged = app.authoring->GetEntity(get);
  assert(unchanged.version() == original.version());
  assert(SameFields(unchanged.fields(), original.fields()));

  ExecuteEffectsWithDependenciesRequest good;
  good.add_effect_ids("promote");
  good.set_actor("gm");
  auto applied = app.rules->ExecuteEffectsWithDependencies(good);
  assert(applied.succeeded() == 1);
  assert(applied.executions(0).affected_fields_size() == 1);
  assert(applied.executions(0).affected_fields(0) == "level");

  auto promoted = app.authoring->GetEntity(get);
  assert(promoted.fields().fields().at("level").number_value() == 5);
  assert(promoted.fields().fields().at("id").string_value() == "s1");
  assert(promoted.version() == original.version() + 1);
}

// evaluate, invalidate, evaluate gives a fresh result equal to an
// uncached recomputation over the same data
void TestRoundTripMatchesUncachedRecompute() {
  auto cached = MakeApp();
  SeedCampaign(cached);
  auto direct = MakeApp(true);
  SeedCampaign(direct);

  auto first = Evaluate(cached);
  assert(Evaluate(cached).cache_hit());

  InvalidateRequest inv;
  inv.set_campaign_id("c1");
  auto* e = inv.mutable_entity();
  e->set_entity_type("settlement");
  e->set_entity_id("s1");
  cached.rules->Invalidate(inv);

  auto fresh = Evaluate(cached);
  assert(!fresh.cache_hit());

  auto uncached = Evaluate(direct);
  assert(!uncached.cache_hit());
  assert(!Evaluate(direct).cache_hit());

  assert(SameFields(first.fields(), fresh.fields()));
  assert(SameFields(fresh.fields(), uncached.fields()));
}

// rebuilding the only mill reaches the parent's computed fields
void TestStructureChangeReachesSettlement() {
  auto app = MakeApp();
  SeedCampaign(app);

  auto before = Evaluate(app);
  assert(before.fields().fields().at("hasMill").bool_value());
  assert(Evaluate(app).cache_hit());

  UpsertEntityRequest mill;
  auto*               m = mill.mutable_entity();
  m->set_entity_type("structure");
  m->set_id("t1");
  m->set_campaign_id("c1");
  m->set_parent_type("settlement");
  m->set_parent_id("s1");
  *m->mutable_fields() = ParseJsonStruct(R"({"id": "t1", "type": "granary", "operational": true, "level": 1})");
  app.authoring->UpsertEntity(mill);

  auto after = Evaluate(app);
  assert(!after.cache_hit());
  assert(!after.fields().fields().at("hasMill").bool_value());
}

// A class-level condition over a derived variable follows the
// variable's inputs on the entity that changed.
void TestDerivedInputReachesClassCondition() {
  auto app = MakeApp();

  UpsertEntityRequest settlement;
  auto*               s = settlement.mutable_entity();
  s->set_entity_type("settlement");
  s->set_id("s1");
  s->set_campaign_id("c1");
  *s->mutable_fields() = ParseJsonStruct(R"({"id": "s1", "level": 2})");
  app.authoring->UpsertEntity(settlement);

  StateVariable population;
  population.set_id("population-s1");
  population.set_campaign_id("c1");
  population.set_scope("settlement");
  population.set_scope_id("s1");
  population.set_key("population");
  *population.mutable_value() = ParseJsonValue("12000");
  app.authoring->CreateVariable(population);

  StateVariable wealth;
  wealth.set_id("wealth-s1");
  wealth.set_campaign_id("c1");
  wealth.set_scope("settlement");
  wealth.set_scope_id("s1");
  wealth.set_key("wealth");
  *wealth.mutable_formula() = ParseJsonValue(R"({"*": [{"var": "population"}, 0.01]})");
  app.authoring->CreateVariable(wealth);

  Condition rich;
  rich.set_id("rich");
  rich.set_campaign_id("c1");
  rich.set_entity_type("settlement");
  rich.set_field("rich");
  *rich.mutable_expression() = ParseJsonValue(R"({">": [{"var": "wealth"}, 100]})");
  app.authoring->CreateCondition(rich);

  assert(Evaluate(app).fields().fields().at("rich").bool_value());
  assert(Evaluate(app).cache_hit());

  SetPopulation(app, "5000");

  auto after = Evaluate(app);
  assert(!after.cache_hit());
  assert(!after.fields().fields().at("rich").bool_value());
}

// The store has no branches: an authoring change is visible on every
// branch that cached a result or a graph.
void TestAuthoringChangeReachesEveryBranch() {
  auto app = MakeApp();
  SeedCampaign(app);

  assert(Evaluate(app, "alt").fields().fields().at("prosperity").bool_value());
  assert(Evaluate(app, "alt").cache_hit());
  assert(Evaluate(app).fields().fields().at("prosperity").bool_value());

  GetEvaluationOrderRequest order;
  order.set_campaign_id("c1");
  order.set_branch_id("alt");
  const auto before = app.rules->GetEvaluationOrder(order);

  SetPopulation(app, "5000");

  auto alt = Evaluate(app, "alt");
  assert(!alt.cache_hit());
  assert(!alt.fields().fields().at("prosperity").bool_value());
  assert(!Evaluate(app).fields().fields().at("prosperity").bool_value());

  Condition walled;
  walled.set_id("walled");
  walled.set_campaign_id("c1");
  walled.set_entity_type("settlement");
  walled.set_entity_id("s1");
  walled.set_field("walled");
  *walled.mutable_expression() = ParseJsonValue(R"({">=": [{"var": "settlement.level"}, 2]})");
  app.authoring->CreateCondition(walled);

  const auto after = app.rules->GetEvaluationOrder(order);
  assert(after.node_keys_size() > before.node_keys_size());
  bool listed = false;
  for (const auto& key : after.node_keys()) listed = listed || key == "condition:walled";
  assert(listed);

  auto walled_alt = Evaluate(app, "alt");
  assert(!walled_alt.cache_hit());
  assert(walled_alt.fields().fields().at("walled").bool_value());
}

} // namespace

int main() {
  TestPopulationDropFlipsProsperity();
  TestWhitelistGuardsEffects();
  TestRoundTripMatchesUncachedRecompute();
  TestStructureChangeReachesSettlement();
  TestDerivedInputReachesClassCondition();
  TestAuthoringChangeReachesEveryBranch();

  std::cout << "campaign_scenarios_test: pass\n";
  return 0;
}
