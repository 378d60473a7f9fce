#include "internal/effects/path_whitelist.hpp"

#include "internal/expr/value.hpp"
#include "internal/util/errors.hpp"

namespace rulegraph::effects {

namespace {

const std::set<std::string> kCommonProtected = {"id", "createdAt", "updatedAt", "deletedAt", "version"};

const std::unordered_map<std::string, std::set<std::string>> kForeignKeys = {
    {"settlement", {"campaignId", "kingdomId", "locationId"}},
    {"structure", {"settlementId"}},
    {"kingdom", {"campaignId"}},
    {"encounter", {"campaignId", "eventId"}},
    {"event", {"campaignId", "encounterId"}},
};

const std::set<std::string> kDefaultAllowed   = {"level", "name", "variables"};
const std::set<std::string> kStructureAllowed = {"level", "name", "variables", "operational"};

std::string StringMember(const google::protobuf::Struct& op, const char* name) {
  auto it = op.fields().find(name);
  if (it == op.fields().end() || !expr::IsString(it->second)) return {};
  return it->second.string_value();
}

} // namespace

PathWhitelist::PathWhitelist() = default;

PathWhitelist::PathWhitelist(const rulegraph::runtime::config::EffectsConfig& config) {
  for (const auto& list : config.whitelists()) {
    auto& paths = configured_[list.entity_type()];
    for (const auto& p : list.paths()) {
      // Accept both "level" and "/level".
      paths.insert(!p.empty() && p.front() == '/' ? p.substr(1) : p);
    }
  }
}

bool PathWhitelist::IsProtected(const std::string& entity_type, const std::string& field) {
  if (kCommonProtected.contains(field)) return true;
  auto it = kForeignKeys.find(entity_type);
  return it != kForeignKeys.end() && it->second.contains(field);
}

const std::set<std::string>& PathWhitelist::AllowedFor(const std::string& entity_type) const {
  if (auto it = configured_.find(entity_type); it != configured_.end()) return it->second;
  return entity_type == "structure" ? kStructureAllowed : kDefaultAllowed;
}

bool PathWhitelist::IsAllowed(const std::string& entity_type, const std::string& pointer) const {
  const auto tokens = expr::SplitPointer(pointer);
  if (tokens.empty()) return false;
  const auto& field = tokens.front();
  return !IsProtected(entity_type, field) && AllowedFor(entity_type).contains(field);
}

void PathWhitelist::Validate(const std::string& entity_type, const google::protobuf::ListValue& patch) const {
  for (const auto& entry : patch.values()) {
    if (!expr::IsStruct(entry)) continue;
    const auto& op = entry.struct_value();

    const auto kind = StringMember(op, "op");
    if (kind == "test") continue;

    const auto path = StringMember(op, "path");
    if (!IsAllowed(entity_type, path)) {
      throw util::ForbiddenPath("path not writable on " + entity_type + ": " + path, path);
    }
    if (kind == "move") {
      const auto from = StringMember(op, "from");
      if (!IsAllowed(entity_type, from)) {
        throw util::ForbiddenPath("path not writable on " + entity_type + ": " + from, from);
      }
    }
  }
}

} // namespace rulegraph::effects
