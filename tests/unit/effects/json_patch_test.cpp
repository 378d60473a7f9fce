#include <cassert>
#include <iostream>
#include <string>

#include "config/config.pb.h"
#include "internal/effects/json_patch.hpp"
#include "internal/effects/path_whitelist.hpp"
#include "internal/effects/state_machine.hpp"
#include "internal/expr/value.hpp"
#include "internal/util/errors.hpp"

namespace {

using rulegraph::effects::ApplyPatch;
using rulegraph::effects::ChangedFields;
using rulegraph::effects::PathWhitelist;
using rulegraph::effects::ValidatePatch;
using rulegraph::expr::ParseJsonStruct;
using rulegraph::expr::ParseJsonValue;

google::protobuf::ListValue Patch(const std::string& json) {
  return ParseJsonValue(json).list_value();
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestReplaceAddRemove() {
  auto doc   = ParseJsonStruct(R"({"level": 3, "name": "Oakvale", "variables": {"morale": 2}, "tags": ["a", "c"]})");
  auto after = ApplyPatch(doc, Patch(R"([
    {"op": "replace", "path": "/level", "value": 5},
    {"op": "add", "path": "/variables/food", "value": 10},
    {"op": "remove", "path": "/name"},
    {"op": "add", "path": "/tags/1", "value": "b"},
    {"op": "add", "path": "/tags/-", "value": "d"}
  ])"));

  assert(after.fields().at("level").number_value() == 5);
  assert(after.fields().count("name") == 0);
  assert(after.fields().at("variables").struct_value().fields().at("food").number_value() == 10);
  const auto& tags = after.fields().at("tags").list_value();
  assert(tags.values_size() == 4);
  assert(tags.values(0).string_value() == "a");
  assert(tags.values(1).string_value() == "b");
  assert(tags.values(2).string_value() == "c");
  assert(tags.values(3).string_value() == "d");

  // the input document is untouched
  assert(doc.fields().at("level").number_value() == 3);
  assert(doc.fields().count("name") == 1);
}

void TestCopyMoveAndEscapes() {
  auto doc   = ParseJsonStruct(R"({"a/b": 1, "m~n": 2, "src": {"x": 1}})");
  auto after = ApplyPatch(doc, Patch(R"([
    {"op": "copy", "from": "/a~1b", "path": "/copied"},
    {"op": "move", "from": "/m~0n", "path": "/moved"},
    {"op": "test", "path": "/src/x", "value": 1}
  ])"));
  assert(after.fields().at("copied").number_value() == 1);
  assert(after.fields().at("moved").number_value() == 2);
  assert(after.fields().count("m~n") == 0);
}

void TestFailures() {
  auto doc = ParseJsonStruct(R"({"level": 3, "src": {"x": 1}})");
  assert(Throws<rulegraph::util::EvaluationError>([&] { ApplyPatch(doc, Patch(R"([{"op": "test", "path": "/level", "value": 4}])")); }));
  assert(Throws<rulegraph::util::EvaluationError>([&] { ApplyPatch(doc, Patch(R"([{"op": "remove", "path": "/missing"}])")); }));
  assert(Throws<rulegraph::util::EvaluationError>([&] { ApplyPatch(doc, Patch(R"([{"op": "replace", "path": "/missing", "value": 1}])")); }));
  assert(Throws<rulegraph::util::EvaluationError>([&] { ApplyPatch(doc, Patch(R"([{"op": "move", "from": "/src", "path": "/src/y"}])")); }));

  auto list = ParseJsonStruct(R"({"tags": ["a", "b"]})");
  assert(Throws<rulegraph::util::EvaluationError>([&] { ApplyPatch(list, Patch(R"([{"op": "replace", "path": "/tags/99999999999999999999", "value": "x"}])")); }));
  assert(Throws<rulegraph::util::EvaluationError>([&] { ApplyPatch(list, Patch(R"([{"op": "add", "path": "/tags/4294967297", "value": "x"}])")); }));
  assert(Throws<rulegraph::util::EvaluationError>([&] { ApplyPatch(list, Patch(R"([{"op": "remove", "path": "/tags/2"}])")); }));
}

void TestValidatePatchShape() {
  ValidatePatch(Patch(R"([{"op": "replace", "path": "/level", "value": 1}, {"op": "remove", "path": "/name"}])"));

  assert(Throws<rulegraph::util::EvaluationError>([] { ValidatePatch(Patch(R"([{"op": "explode", "path": "/level"}])")); }));
  assert(Throws<rulegraph::util::EvaluationError>([] { ValidatePatch(Patch(R"([{"op": "replace", "path": "level", "value": 1}])")); }));
  assert(Throws<rulegraph::util::EvaluationError>([] { ValidatePatch(Patch(R"([{"op": "add", "path": "/level"}])")); }));
  assert(Throws<rulegraph::util::EvaluationError>([] { ValidatePatch(Patch(R"([{"op": "move", "path": "/level"}])")); }));
  assert(Throws<rulegraph::util::EvaluationError>([] { ValidatePatch(Patch(R"([42])")); }));
}

void TestChangedFields() {
  auto before  = ParseJsonStruct(R"({"level": 3, "name": "a", "variables": {"x": 1}})");
  auto after   = ParseJsonStruct(R"({"level": 4, "name": "a", "variables": {"x": 2}, "added": true})");
  auto changed = ChangedFields(before, after);
  assert((changed == std::vector<std::string>{"added", "level", "variables"}));

  auto removed = ChangedFields(after, before);
  assert((removed == std::vector<std::string>{"added", "level", "variables"}));
  assert(ChangedFields(before, before).empty());
}

void TestDefaultWhitelist() {
  PathWhitelist whitelist;
  assert(whitelist.IsAllowed("settlement", "/level"));
  assert(whitelist.IsAllowed("settlement", "/variables/morale"));
  assert(!whitelist.IsAllowed("settlement", "/id"));
  assert(!whitelist.IsAllowed("settlement", "/kingdomId"));
  assert(!whitelist.IsAllowed("settlement", "/operational"));
  assert(whitelist.IsAllowed("structure", "/operational"));
  assert(!whitelist.IsAllowed("structure", "/settlementId"));
  assert(!whitelist.IsAllowed("settlement", ""));

  assert(PathWhitelist::IsProtected("kingdom", "version"));
  assert(PathWhitelist::IsProtected("structure", "settlementId"));
  assert(!PathWhitelist::IsProtected("settlement", "level"));
}

void TestValidateNamesFirstForbiddenPath() {
  PathWhitelist whitelist;
  whitelist.Validate("settlement", Patch(R"([{"op": "replace", "path": "/level", "value": 5}])"));
  // test operations only read
  whitelist.Validate("settlement", Patch(R"([{"op": "test", "path": "/id", "value": "s1"}])"));

  std::string rejected;
  try {
    whitelist.Validate("settlement", Patch(R"([{"op": "replace", "path": "/level", "value": 5}, {"op": "replace", "path": "/id", "value": "x"}])"));
  } catch (const rulegraph::util::ForbiddenPath& e) {
    rejected = e.path();
  }
  assert(rejected == "/id");

  // moving a protected field out of place is a write to it
  assert(Throws<rulegraph::util::ForbiddenPath>(
      [&] { whitelist.Validate("settlement", Patch(R"([{"op": "move", "from": "/version", "path": "/name"}])")); }));
}

void TestConfiguredWhitelistReplacesDefaults() {
  rulegraph::runtime::config::EffectsConfig config;
  auto*                                     list = config.add_whitelists();
  list->set_entity_type("settlement");
  list->add_paths("/population");
  list->add_paths("name");
  list->add_paths("/id");

  PathWhitelist whitelist(config);
  assert(whitelist.IsAllowed("settlement", "/population"));
  assert(whitelist.IsAllowed("settlement", "/name"));
  assert(!whitelist.IsAllowed("settlement", "/level"));
  // protected fields stay protected
  assert(!whitelist.IsAllowed("settlement", "/id"));
  // other types keep the defaults
  assert(whitelist.IsAllowed("kingdom", "/level"));
}

void TestExecutionStateTransitions() {
  using namespace rulegraph::effects;
  using rulegraph::v1::EXECUTION_STATE_APPLYING;
  using rulegraph::v1::EXECUTION_STATE_FAILED;
  using rulegraph::v1::EXECUTION_STATE_PENDING;
  using rulegraph::v1::EXECUTION_STATE_SUCCEEDED;

  static_assert(CanTransition(EXECUTION_STATE_PENDING, EXECUTION_STATE_APPLYING));
  static_assert(CanTransition(EXECUTION_STATE_APPLYING, EXECUTION_STATE_SUCCEEDED));
  static_assert(CanTransition(EXECUTION_STATE_PENDING, EXECUTION_STATE_FAILED));
  static_assert(!CanTransition(EXECUTION_STATE_SUCCEEDED, EXECUTION_STATE_APPLYING));
  static_assert(!CanTransition(EXECUTION_STATE_PENDING, EXECUTION_STATE_SUCCEEDED));
  static_assert(IsTerminal(EXECUTION_STATE_FAILED));
  static_assert(!IsTerminal(EXECUTION_STATE_APPLYING));
}

} // namespace

int main() {
  TestReplaceAddRemove();
  TestCopyMoveAndEscapes();
  TestFailures();
  TestValidatePatchShape();
  TestChangedFields();
  TestDefaultWhitelist();
  TestValidateNamesFirstForbiddenPath();
  TestConfiguredWhitelistReplacesDefaults();
  TestExecutionStateTransitions();

  std::cout << "json_patch_test: pass\n";
  return 0;
}
