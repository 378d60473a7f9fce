#pragma once

#include <string>
#include <unordered_set>
#include <vector>

#include "internal/db/model/condition_record.hpp"
#include "internal/db/model/effect_record.hpp"
#include "internal/db/model/variable_record.hpp"
#include "internal/graph/dependency_graph.hpp"

namespace rulegraph::graph {

inline constexpr const char* kWorldScope = "world";
inline constexpr const char* kClassId    = "*";

std::string VariableNodeKey(const std::string& scope, const std::string& scope_id, const std::string& key);
std::string PropNodeKey(const std::string& entity_type, const std::string& entity_id, const std::string& field);
std::string ConditionNodeKey(const std::string& condition_id);
std::string EffectNodeKey(const std::string& effect_id);

// Rows a campaign graph is built from. Inactive / deleted rows are skipped.
struct GraphInputs {
  std::vector<db::model::ConditionRecord> conditions;
  std::vector<db::model::VariableRecord>  variables;
  std::vector<db::model::EffectRecord>    effects;
};

/*
  Builds the dependency graph:

    derived variable  --READS-->  its formula dependencies
    condition         --READS-->  its expression dependencies
    condition         --WRITES--> prop:<type>:<id|*>:<field>
    effect            --WRITES--> prop / var nodes of its patch targets
    effect            --READS-->  test / from paths it does not write
*/
class DependencyGraphBuilder {
 public:
  DependencyGraph Build(const GraphInputs& inputs) const;

 private:
  struct Resolver;
};

} // namespace rulegraph::graph
