#pragma once

#include <chrono>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/cache/cache.hpp"

namespace rulegraph::cache {

/*
  In-process TTL cache.

  Expired entries read as misses and are dropped on the next write
  to the same key or pattern sweep.
*/
class MemoryCache final : public Cache {
 public:
  using Clock = std::chrono::steady_clock;

  std::optional<std::string> Get(const std::string& key) override;
  void          Set(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
  bool          Delete(const std::string& key) override;
  std::uint64_t DeletePattern(const std::string& glob) override;

  std::size_t Size() const;

 private:
  struct Entry {
    std::string       value;
    Clock::time_point expires_at; // max() = never
  };

  mutable std::shared_mutex              mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

} // namespace rulegraph::cache
