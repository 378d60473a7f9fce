#include "internal/cache/cache_keys.hpp"

#include "internal/expr/value.hpp"

namespace rulegraph::cache {

std::string ComputedFieldsKey(const std::string& entity_type, const std::string& entity_id, const std::string& branch_id) {
  return std::string(kComputedFieldsPrefix) + ":" + entity_type + ":" + entity_id + ":" + branch_id;
}

std::string DerivedVariableKey(const std::string& scope, const std::string& scope_id, const std::string& key, const std::string& branch_id) {
  return std::string(kDerivedVariablePrefix) + ":" + scope + ":" + scope_id + ":" + key + ":" + branch_id;
}

std::string SettlementStructuresKey(const std::string& settlement_id, const std::string& branch_id) {
  return std::string(kStructuresPrefix) + ":settlement:" + settlement_id + ":" + branch_id;
}

std::string GraphKey(const std::string& campaign_id, const std::string& branch_id) {
  return std::string(kGraphPrefix) + ":" + campaign_id + ":" + branch_id;
}

std::string ComputedFieldsPattern(const std::string& entity_type, const std::string& branch_id) {
  if (entity_type.empty()) return std::string(kComputedFieldsPrefix) + ":*:" + branch_id;
  return std::string(kComputedFieldsPrefix) + ":" + entity_type + ":*:" + branch_id;
}

std::optional<ParsedKey> ParseKey(const std::string& key) {
  const auto segs = expr::SplitPath(key, ':');
  if (segs.size() < 4) return std::nullopt;
  return ParsedKey{segs.front(), segs[1], segs[2], segs.back()};
}

} // namespace rulegraph::cache
