#pragma once

#include <optional>
#include <string>

namespace rulegraph::cache {

/*
  Cache key layout: {prefix}:{entityType}:{entityId}[:extra...]:{branchId}

    computed-fields:<type>:<id>:<branch>
    derived-variable:<scope>:<scopeId>:<key>:<branch>
    structures:settlement:<id>:<branch>
    graph:<campaign>:<branch>
*/

// Branch used when a request names none.
inline constexpr const char* kDefaultBranch = "main";

// Store rows are not branched, so a store write invalidates every
// branch. Keys built with it are globs.
inline constexpr const char* kAllBranches = "*";

inline constexpr const char* kComputedFieldsPrefix  = "computed-fields";
inline constexpr const char* kDerivedVariablePrefix = "derived-variable";
inline constexpr const char* kStructuresPrefix      = "structures";
inline constexpr const char* kGraphPrefix           = "graph";

std::string ComputedFieldsKey(const std::string& entity_type, const std::string& entity_id, const std::string& branch_id);
std::string DerivedVariableKey(const std::string& scope, const std::string& scope_id, const std::string& key, const std::string& branch_id);
std::string SettlementStructuresKey(const std::string& settlement_id, const std::string& branch_id);
std::string GraphKey(const std::string& campaign_id, const std::string& branch_id);

// computed-fields:<type>:*:<branch>, or computed-fields:*:<branch> for an empty type.
std::string ComputedFieldsPattern(const std::string& entity_type, const std::string& branch_id);

struct ParsedKey {
  std::string prefix;
  std::string entity_type;
  std::string entity_id;
  std::string branch_id;
};

// nullopt when the key has fewer than four segments.
std::optional<ParsedKey> ParseKey(const std::string& key);

} // namespace rulegraph::cache
