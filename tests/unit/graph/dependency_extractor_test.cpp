#include <cassert>
#include <iostream>
#include <string>

#include "internal/expr/expression.hpp"
#include "internal/expr/value.hpp"
#include "internal/graph/dependency_extractor.hpp"

namespace {

using rulegraph::expr::ParseJsonValue;
using rulegraph::graph::ExtractPatchReads;
using rulegraph::graph::ExtractReads;
using rulegraph::graph::ExtractReadsFromJson;
using rulegraph::graph::ExtractWrites;
using rulegraph::graph::PathSet;

google::protobuf::ListValue Patch(const std::string& json) {
  return ParseJsonValue(json).list_value();
}

void TestReadsFromVarRefs() {
  auto reads = ExtractReadsFromJson(ParseJsonValue(
      R"({"and": [{">": [{"var": "population"}, 10000]}, {"<": [{"var": ["settlement.level", 0]}, 5]}]})"));
  assert((reads == PathSet{"population", "settlement.level"}));
}

void TestDomainOperatorsReadCanonicalPaths() {
  auto reads = ExtractReadsFromJson(ParseJsonValue(
      R"({"and": [{"settlement.hasStructureType": ["temple"]}, {"settlement.var": ["morale"]}, {"structure.isOperational": []}]})"));
  assert(reads.contains("settlement.structures"));
  assert(reads.contains("settlement.variables.morale"));
  assert(reads.contains("structure.operational"));
  assert(!reads.contains("temple"));
}

void TestParsedAndJsonReadsAgree() {
  const auto json = ParseJsonValue(R"({"if": [{"settlement.inKingdom": ["k1"]}, {"var": "tax"}, {"settlement.level": []}]})");
  assert(ExtractReads(rulegraph::expr::Parse(json)) == ExtractReadsFromJson(json));
}

void TestMalformedSubtreesContributeNothing() {
  auto reads = ExtractReadsFromJson(ParseJsonValue(R"({"var": 42})"));
  assert(reads.empty());
}

void TestWritesIgnoreTestAndOrder() {
  auto a = ExtractWrites(Patch(R"([
    {"op": "test", "path": "/level", "value": 3},
    {"op": "replace", "path": "/level", "value": 4},
    {"op": "add", "path": "/variables/morale", "value": 1}
  ])"));
  auto b = ExtractWrites(Patch(R"([
    {"op": "add", "path": "/variables/morale", "value": 1},
    {"op": "replace", "path": "/level", "value": 4},
    {"op": "test", "path": "/name", "value": "x"}
  ])"));
  assert((a == PathSet{"/level", "/variables/morale"}));
  assert(a == b);

  auto only_test = ExtractWrites(Patch(R"([{"op": "test", "path": "/level", "value": 3}])"));
  assert(only_test.empty());
}

void TestPatchReads() {
  auto reads = ExtractPatchReads(Patch(R"([
    {"op": "test", "path": "/level", "value": 3},
    {"op": "move", "from": "/name", "path": "/title"},
    {"op": "copy", "from": "/variables/a", "path": "/variables/b"},
    {"op": "replace", "path": "/level", "value": 4}
  ])"));
  assert((reads == PathSet{"/level", "/name", "/variables/a"}));
}

} // namespace

int main() {
  TestReadsFromVarRefs();
  TestDomainOperatorsReadCanonicalPaths();
  TestParsedAndJsonReadsAgree();
  TestMalformedSubtreesContributeNothing();
  TestWritesIgnoreTestAndOrder();
  TestPatchReads();

  std::cout << "dependency_extractor_test: pass\n";
  return 0;
}
