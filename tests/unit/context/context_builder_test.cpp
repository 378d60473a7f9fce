#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/context/context_builder.hpp"
#include "internal/context/domain_operators.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/expr/evaluator.hpp"
#include "internal/expr/value.hpp"
#include "internal/util/errors.hpp"

namespace {

using rulegraph::context::ContextBuilder;
using rulegraph::context::RepositoryDomainResolver;
using rulegraph::db::model::EntityRecord;
using rulegraph::db::model::VariableRecord;
using rulegraph::expr::ParseJsonStruct;
using rulegraph::expr::ParseJsonValue;

struct Fixture {
  std::shared_ptr<rulegraph::db::memory::MemoryRepository> repo = std::make_shared<rulegraph::db::memory::MemoryRepository>();
  std::shared_ptr<RepositoryDomainResolver>                resolver = std::make_shared<RepositoryDomainResolver>(repo);
  std::shared_ptr<const rulegraph::expr::Evaluator>        evaluator = std::make_shared<const rulegraph::expr::Evaluator>(10, resolver);
  ContextBuilder                                           builder{repo, evaluator};

  void PutEntity(const std::string& type, const std::string& id, const std::string& fields, const std::string& parent_type = "",
                 const std::string& parent_id = "") {
    EntityRecord e;
    e.entity_type = type;
    e.id          = id;
    e.campaign_id = "c1";
    e.parent_type = parent_type;
    e.parent_id   = parent_id;
    e.fields      = ParseJsonStruct(fields);
    e.version     = 1;
    auto tx       = repo->Begin();
    assert(static_cast<bool>(repo->UpsertEntity(*tx, e)));
    tx->Commit();
  }

  void PutVariable(const std::string& id, const std::string& scope, const std::string& scope_id, const std::string& key,
                   const std::string& json, bool formula = false) {
    VariableRecord v;
    v.id          = id;
    v.campaign_id = "c1";
    v.scope       = scope;
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

  rulegraph::expr::Value Eval(const std::string& expression, const rulegraph::expr::Struct& ctx) {
    auto result = evaluator->Evaluate(ParseJsonValue(expression), ctx);
    assert(result.code == rulegraph::expr::EvalCode::OK);
    return result.value;
  }
};

void TestEntityFieldsAndVariables() {
  Fixture f;
  f.PutEntity("settlement", "s1", R"({"level": 3, "name": "Oakvale"})");
  f.PutVariable("w1", "world", "", "tax", "2");
  f.PutVariable("w2", "world", "", "morale", "1");
  f.PutVariable("v1", "settlement", "s1", "population", "12000");
  f.PutVariable("v2", "settlement", "s1", "morale", "9");

  auto ctx = f.builder.Build("settlement", "s1");
  const auto& own = ctx.fields().at("settlement").struct_value();
  assert(own.fields().at("level").number_value() == 3);
  assert(own.fields().at("id").string_value() == "s1");
  assert(ctx.fields().at("population").number_value() == 12000);
  assert(ctx.fields().at("tax").number_value() == 2);
  // entity scope wins over world
  assert(ctx.fields().at("morale").number_value() == 9);
}

void TestDerivedVariablesResolveDependenciesFirst() {
  Fixture f;
  f.PutEntity("settlement", "s1", R"({"level": 2})");
  f.PutVariable("v1", "settlement", "s1", "population", "100");
  // declared in reverse dependency order
  f.PutVariable("v2", "settlement", "s1", "aaa_score", R"({"+": [{"var": "wealth"}, 1]})", true);
  f.PutVariable("v3", "settlement", "s1", "wealth", R"({"*": [{"var": "population"}, {"var": "settlement.level"}]})", true);

  auto ctx = f.builder.Build("settlement", "s1");
  assert(ctx.fields().at("wealth").number_value() == 200);
  assert(ctx.fields().at("aaa_score").number_value() == 201);
}

void TestDerivedCycleYieldsNull() {
  Fixture f;
  f.PutEntity("settlement", "s1", "{}");
  f.PutVariable("v1", "settlement", "s1", "a", R"({"+": [{"var": "b"}, 1]})", true);
  f.PutVariable("v2", "settlement", "s1", "b", R"({"+": [{"var": "a"}, 1]})", true);
  f.PutVariable("v3", "settlement", "s1", "c", R"({"+": [2, 1]})", true);

  auto ctx = f.builder.Build("settlement", "s1");
  assert(rulegraph::expr::IsNull(ctx.fields().at("a")));
  assert(rulegraph::expr::IsNull(ctx.fields().at("b")));
  assert(ctx.fields().at("c").number_value() == 3);
}

void TestExtraContextAppliedLast() {
  Fixture f;
  f.PutEntity("settlement", "s1", "{}");
  f.PutVariable("v1", "settlement", "s1", "population", "100");

  auto extra = ParseJsonStruct(R"({"population": 7, "weather": "rain"})");
  auto ctx   = f.builder.Build("settlement", "s1", &extra);
  assert(ctx.fields().at("population").number_value() == 7);
  assert(ctx.fields().at("weather").string_value() == "rain");
}

void TestMissingEntity() {
  Fixture f;
  f.PutVariable("w1", "world", "", "tax", "2");

  bool threw = false;
  try {
    (void)f.builder.Build("settlement", "nope");
  } catch (const rulegraph::util::EntityNotFound&) {
    threw = true;
  }
  assert(threw);

  auto partial = f.builder.BuildPartial("settlement", "nope");
  assert(partial.fields().count("settlement") == 0);
  assert(partial.fields().at("tax").number_value() == 2);
}

void TestWorldScopeHasNoEntity() {
  Fixture f;
  f.PutVariable("w1", "world", "", "tax", "2");
  auto ctx = f.builder.Build("world", "");
  assert(ctx.fields().size() == 1);
  assert(ctx.fields().at("tax").number_value() == 2);
}

void TestSettlementOperators() {
  Fixture f;
  f.PutEntity("settlement", "s1", R"({"level": 4, "kingdomId": "k1", "locationId": "l9", "variables": {"morale": 5}})");
  f.PutEntity("structure", "t1", R"({"type": "temple", "level": 2, "operational": true})", "settlement", "s1");
  f.PutEntity("structure", "t2", R"({"type": "temple", "level": 1})", "settlement", "s1");
  f.PutEntity("structure", "t3", R"({"type": "market"})", "settlement", "s1");
  f.PutEntity("structure", "t4", R"({"type": "market"})", "settlement", "s2");
  f.PutVariable("v1", "settlement", "s1", "food", "30");

  auto ctx = f.builder.Build("settlement", "s1");
  assert(f.Eval(R"({"settlement.level": []})", ctx).number_value() == 4);
  assert(f.Eval(R"({"settlement.var": ["morale"]})", ctx).number_value() == 5);
  assert(f.Eval(R"({"settlement.var": ["food"]})", ctx).number_value() == 30);
  assert(rulegraph::expr::IsNull(f.Eval(R"({"settlement.var": ["missing"]})", ctx)));
  assert(f.Eval(R"({"settlement.hasStructureType": ["temple"]})", ctx).bool_value());
  assert(!f.Eval(R"({"settlement.hasStructureType": ["barracks"]})", ctx).bool_value());
  assert(f.Eval(R"({"settlement.structureCount": []})", ctx).number_value() == 3);
  assert(f.Eval(R"({"settlement.structureCount": ["temple"]})", ctx).number_value() == 2);
  assert(f.Eval(R"({"settlement.inKingdom": ["k1"]})", ctx).bool_value());
  assert(!f.Eval(R"({"settlement.atLocation": ["l1"]})", ctx).bool_value());
}

void TestStructureOperators() {
  Fixture f;
  f.PutEntity("settlement", "s1", "{}");
  f.PutEntity("structure", "t1", R"({"type": "temple", "level": 2, "operational": true})", "settlement", "s1");

  auto ctx = f.builder.Build("structure", "t1");
  assert(f.Eval(R"({"structure.level": []})", ctx).number_value() == 2);
  assert(f.Eval(R"({"structure.type": []})", ctx).string_value() == "temple");
  assert(f.Eval(R"({"structure.isOperational": []})", ctx).bool_value());
  assert(f.Eval(R"({"structure.inSettlement": ["s1"]})", ctx).bool_value());
  assert(!f.Eval(R"({"structure.inSettlement": ["s2"]})", ctx).bool_value());
}

void TestMissingEntityResolvesNeutral() {
  Fixture f;
  auto ctx = ParseJsonStruct("{}");
  assert(f.Eval(R"({"settlement.level": ["ghost"]})", ctx).number_value() == 0);
  assert(!f.Eval(R"({"settlement.hasStructureType": ["temple", "ghost"]})", ctx).bool_value());
  assert(rulegraph::expr::IsNull(f.Eval(R"({"structure.type": ["ghost"]})", ctx)));
  // no explicit id and no context entity
  assert(f.Eval(R"({"settlement.structureCount": []})", ctx).number_value() == 0);
}

} // namespace

int main() {
  TestEntityFieldsAndVariables();
  TestDerivedVariablesResolveDependenciesFirst();
  TestDerivedCycleYieldsNull();
  TestExtraContextAppliedLast();
  TestMissingEntity();
  TestWorldScopeHasNoEntity();
  TestSettlementOperators();
  TestStructureOperators();
  TestMissingEntityResolvesNeutral();

  std::cout << "context_builder_test: pass\n";
  return 0;
}
