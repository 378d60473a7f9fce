#pragma once

#include <set>
#include <string>
#include <unordered_map>

#include <google/protobuf/struct.pb.h>

#include "config/config.pb.h"

namespace rulegraph::effects {

/*
  Which top-level entity fields an effect may write.

  A path is accepted when its first segment is not protected and is
  listed for the entity type. Types without a configured list use the
  defaults: level, name, variables (plus operational for structures).
*/
class PathWhitelist {
 public:
  PathWhitelist();
  explicit PathWhitelist(const rulegraph::runtime::config::EffectsConfig& config);

  static bool IsProtected(const std::string& entity_type, const std::string& field);

  bool IsAllowed(const std::string& entity_type, const std::string& pointer) const;

  // Checks every written location (path, and the source of a move).
  // Throws util::ForbiddenPath naming the first rejected path.
  void Validate(const std::string& entity_type, const google::protobuf::ListValue& patch) const;

 private:
  const std::set<std::string>& AllowedFor(const std::string& entity_type) const;

  std::unordered_map<std::string, std::set<std::string>> configured_;
};

} // namespace rulegraph::effects
