#pragma once

#include <set>
#include <string>

#include <google/protobuf/struct.pb.h>

#include "internal/expr/expression.hpp"

namespace rulegraph::graph {

/*
  Static read / write analysis.

  Reads are dotted context paths ("population", "settlement.level").
  Domain operators contribute their canonical dependency instead of a
  literal path, e.g. settlement.hasStructureType -> settlement.structures.

  Writes / patch reads are JSON-pointer paths ("/level").
*/

using PathSet = std::set<std::string>;

PathSet ExtractReads(const expr::NodePtr& node);

// Same as ExtractReads on an unparsed document. Never throws; malformed
// subtrees contribute nothing.
PathSet ExtractReadsFromJson(const google::protobuf::Value& expression);

// Exactly the `path` of every non-test operation.
PathSet ExtractWrites(const google::protobuf::ListValue& patch);

// `path` of test operations and `from` of copy / move.
PathSet ExtractPatchReads(const google::protobuf::ListValue& patch);

// Canonical dependency path of a domain operator.
std::string DomainDependency(const std::string& ns, expr::DomainProperty property, const std::string& var_name);

} // namespace rulegraph::graph
