#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace rulegraph::cache {

/*
  Key/value cache collaborator.

  Values are opaque bytes. Implementations may throw
  util::StoreUnavailable (or any std::exception); CacheService
  absorbs those.

  DeletePattern takes a glob: '*' matches any run of characters
  (':' included), '?' exactly one.
*/
class Cache {
 public:
  virtual ~Cache() = default;

  virtual std::optional<std::string> Get(const std::string& key) = 0;

  // ttl of zero means no expiry.
  virtual void Set(const std::string& key, const std::string& value, std::chrono::seconds ttl) = 0;

  // true when the key existed.
  virtual bool Delete(const std::string& key) = 0;

  // Number of keys removed.
  virtual std::uint64_t DeletePattern(const std::string& glob) = 0;
};

bool GlobMatch(const std::string& glob, const std::string& text);

} // namespace rulegraph::cache
