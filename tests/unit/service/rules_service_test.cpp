#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>

#include "internal/expr/value.hpp"
#include "internal/factory.hpp"
#include "internal/service/authoring_service.hpp"
#include "internal/service/rules_service.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace rulegraph::v1;
using rulegraph::expr::ParseJsonStruct;
using rulegraph::expr::ParseJsonValue;

// In-memory store, default cache and evaluation settings.
rulegraph::factory::Application MakeApp() {
  return rulegraph::factory::Build(rulegraph::runtime::config::RuntimeConfig{});
}

void PutSettlement(rulegraph::factory::Application& app, const std::string& fields_json) {
  UpsertEntityRequest req;
  auto*               e = req.mutable_entity();
  e->set_entity_type("settlement");
  e->set_id("s1");
  e->set_campaign_id("c1");
  *e->mutable_fields() = ParseJsonStruct(fields_json);
  app.authoring->UpsertEntity(req);
}

StateVariable MakeVariable(const std::string& id, const std::string& key, const std::string& json, bool formula) {
  StateVariable v;
  v.set_id(id);
  v.set_campaign_id("c1");
  v.set_scope("settlement");
  v.set_scope_id("s1");
  v.set_key(key);
  if (formula) {
    *v.mutable_formula() = ParseJsonValue(json);
  } else {
    *v.mutable_value() = ParseJsonValue(json);
  }
  return v;
}

Condition MakeCondition(const std::string& id, const std::string& entity_id, const std::string& field, const std::string& expression) {
  Condition c;
  c.set_id(id);
  c.set_campaign_id("c1");
  c.set_entity_type("settlement");
  c.set_entity_id(entity_id);
  c.set_field(field);
  *c.mutable_expression() = ParseJsonValue(expression);
  return c;
}

EvaluateComputedFieldsResponse Computed(rulegraph::factory::Application& app) {
  EvaluateComputedFieldsRequest req;
  req.set_entity_type("settlement");
  req.set_entity_id("s1");
  return app.rules->EvaluateComputedFields(req);
}

void TestComputedFieldsCacheAndInvalidation() {
  auto app = MakeApp();
  PutSettlement(app, R"({"id": "s1", "name": "Oakvale", "level": 2})");
  app.authoring->CreateVariable(MakeVariable("pop", "population", "12000", false));
  app.authoring->CreateCondition(MakeCondition("prosperous", "s1", "prosperous", R"({">": [{"var": "population"}, 10000]})"));
  // class level: applies to every settlement
  app.authoring->CreateCondition(MakeCondition("large", "", "large", R"({">=": [{"var": "settlement.level"}, 3]})"));

  auto first = Computed(app);
  assert(!first.cache_hit());
  assert(first.fields().fields().at("prosperous").bool_value());
  assert(!first.fields().fields().at("large").bool_value());

  auto second = Computed(app);
  assert(second.cache_hit());
  assert(second.fields().fields().at("prosperous").bool_value());

  // entity write drops the cached result
  PutSettlement(app, R"({"id": "s1", "name": "Oakvale", "level": 3})");
  auto third = Computed(app);
  assert(!third.cache_hit());
  assert(third.fields().fields().at("large").bool_value());

  // variable write does too
  auto update = MakeVariable("pop", "population", "5000", false);
  update.set_version(1);
  update.set_is_active(true);
  app.authoring->UpdateVariable(update);
  auto fourth = Computed(app);
  assert(!fourth.cache_hit());
  assert(!fourth.fields().fields().at("prosperous").bool_value());
}

void TestExtraContextIsNeverCached() {
  auto app = MakeApp();
  PutSettlement(app, R"({"id": "s1", "level": 2})");
  app.authoring->CreateCondition(MakeCondition("stormy", "s1", "stormy", R"({"==": [{"var": "weather"}, "storm"]})"));

  EvaluateComputedFieldsRequest req;
  req.set_entity_type("settlement");
  req.set_entity_id("s1");
  *req.mutable_extra_context() = ParseJsonStruct(R"({"weather": "storm"})");
  auto with_extra = app.rules->EvaluateComputedFields(req);
  assert(with_extra.fields().fields().at("stormy").bool_value());

  auto plain = Computed(app);
  assert(!plain.cache_hit());
  assert(!plain.fields().fields().at("stormy").bool_value());
}

void TestMissingEntity() {
  auto app    = MakeApp();
  bool thrown = false;
  try {
    Computed(app);
  } catch (const rulegraph::util::EntityNotFound&) {
    thrown = true;
  }
  assert(thrown);
}

void TestEvaluateVariableWithTrace() {
  auto app = MakeApp();
  PutSettlement(app, R"({"id": "s1", "level": 2})");
  app.authoring->CreateVariable(MakeVariable("pop", "population", "12000", false));
  app.authoring->CreateVariable(MakeVariable("wealth", "wealth", R"({"*": [{"var": "population"}, 2]})", true));

  EvaluateVariableRequest stored;
  stored.set_variable_id("pop");
  auto plain = app.rules->EvaluateVariable(stored);
  assert(plain.success());
  assert(plain.value().number_value() == 12000);

  EvaluateVariableRequest req;
  req.set_variable_id("wealth");
  req.set_include_trace(true);
  auto resp = app.rules->EvaluateVariable(req);
  assert(resp.success());
  assert(resp.value().number_value() == 24000);
  assert(resp.trace_size() >= 3);
  assert(resp.trace(0).step() == 1);
  assert(resp.trace(0).description() == "Validate expression");
  assert(resp.trace(1).description().rfind("Build context", 0) == 0);
  assert(resp.trace(resp.trace_size() - 1).description() == "Evaluate expression");
  assert(resp.trace(resp.trace_size() - 1).passed());

  EvaluateVariableRequest missing;
  missing.set_variable_id("nope");
  bool thrown = false;
  try {
    app.rules->EvaluateVariable(missing);
  } catch (const rulegraph::util::NotFound&) {
    thrown = true;
  }
  assert(thrown);
}

void TestValidateCondition() {
  auto app = MakeApp();
  PutSettlement(app, R"({"id": "s1", "level": 2})");
  app.authoring->CreateCondition(MakeCondition("A", "s1", "a", R"({"var": "settlement.b"})"));
  app.authoring->CreateCondition(MakeCondition("B", "s1", "b", R"({"var": "settlement.C"})"));

  ValidateConditionRequest shape_only;
  *shape_only.mutable_expression() = ParseJsonValue(R"({"and": [true, {"var": "population"}]})");
  assert(app.rules->ValidateCondition(shape_only).valid());

  std::string nested = "1";
  for (int i = 0; i < 11; ++i) nested = R"({"!": [)" + nested + "]}";
  ValidateConditionRequest too_deep;
  *too_deep.mutable_expression() = ParseJsonValue(nested);
  auto deep                      = app.rules->ValidateCondition(too_deep);
  assert(!deep.valid());
  assert(deep.errors_size() == 1);

  // a new condition C (field defaults to its id) reading a closes a -> b -> C -> a
  ValidateConditionRequest closing;
  *closing.mutable_expression() = ParseJsonValue(R"({"var": "settlement.a"})");
  closing.set_campaign_id("c1");
  closing.set_condition_id("C");
  closing.set_entity_type("settlement");
  closing.set_entity_id("s1");
  auto cycle = app.rules->ValidateCondition(closing);
  assert(!cycle.valid());
  assert(cycle.cycle_path_size() > 0);
  auto path = std::vector<std::string>(cycle.cycle_path().begin(), cycle.cycle_path().end());
  assert(std::find(path.begin(), path.end(), "condition:A") != path.end());

  // creating it is rejected and nothing is stored
  auto c = MakeCondition("C", "s1", "C", R"({"var": "settlement.a"})");
  bool thrown = false;
  try {
    app.authoring->CreateCondition(c);
  } catch (const rulegraph::util::CircularDependency&) {
    thrown = true;
  }
  assert(thrown);

  GetEvaluationOrderRequest order_req;
  order_req.set_campaign_id("c1");
  auto order = app.rules->GetEvaluationOrder(order_req);
  assert(!order.has_cycle());
}

void TestEvaluationOrder() {
  auto app = MakeApp();
  PutSettlement(app, R"({"id": "s1", "level": 2})");
  app.authoring->CreateVariable(MakeVariable("pop", "population", "12000", false));
  app.authoring->CreateCondition(MakeCondition("prosperous", "s1", "prosperous", R"({">": [{"var": "population"}, 10000]})"));

  GetEvaluationOrderRequest req;
  req.set_campaign_id("c1");
  auto resp = app.rules->GetEvaluationOrder(req);
  assert(!resp.has_cycle());

  std::vector<std::string> keys(resp.node_keys().begin(), resp.node_keys().end());
  auto var  = std::find(keys.begin(), keys.end(), "var:settlement:s1:population");
  auto cond = std::find(keys.begin(), keys.end(), "condition:prosperous");
  assert(var != keys.end());
  assert(cond != keys.end());
  assert(var < cond);
}

void TestInvalidateRequiresScope() {
  auto              app = MakeApp();
  InvalidateRequest req;
  req.set_campaign_id("c1");
  bool thrown = false;
  try {
    app.rules->Invalidate(req);
  } catch (const rulegraph::util::InvalidArgument&) {
    thrown = true;
  }
  assert(thrown);
}

} // namespace

int main() {
  TestComputedFieldsCacheAndInvalidation();
  TestExtraContextIsNeverCached();
  TestMissingEntity();
  TestEvaluateVariableWithTrace();
  TestValidateCondition();
  TestEvaluationOrder();
  TestInvalidateRequiresScope();

  std::cout << "rules_service_test: pass\n";
  return 0;
}
