#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <google/protobuf/struct.pb.h>

#include "internal/cache/cache.hpp"

namespace rulegraph::cache {

struct CacheStats {
  std::uint64_t hits           = 0;
  std::uint64_t misses         = 0;
  std::uint64_t sets           = 0;
  std::uint64_t deletes        = 0;
  std::uint64_t pattern_deletes = 0;
  std::uint64_t keys_deleted   = 0;
  std::uint64_t errors         = 0;
};

/*
  Typed facade over a Cache backend.

  Backend failures never escape: a failed read is a miss, a failed
  write or delete is a no-op, and both are logged and counted.
  Struct / Value payloads are stored as serialized protobuf.
*/
class CacheService {
 public:
  explicit CacheService(std::shared_ptr<Cache> backend, bool disabled = false);

  std::optional<google::protobuf::Struct> GetStruct(const std::string& key);
  void SetStruct(const std::string& key, const google::protobuf::Struct& value, std::chrono::seconds ttl);

  std::optional<google::protobuf::Value> GetValue(const std::string& key);
  void SetValue(const std::string& key, const google::protobuf::Value& value, std::chrono::seconds ttl);

  // Returns 1 when the key was present, else 0.
  std::uint64_t Delete(const std::string& key);
  std::uint64_t DeletePattern(const std::string& glob);

  CacheStats Stats() const;
  void       ResetStats();

 private:
  std::optional<std::string> GetRaw(const std::string& key);
  void                       SetRaw(const std::string& key, const std::string& bytes, std::chrono::seconds ttl);

  std::shared_ptr<Cache> backend_;
  bool                   disabled_;

  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
  std::atomic<std::uint64_t> sets_{0};
  std::atomic<std::uint64_t> deletes_{0};
  std::atomic<std::uint64_t> pattern_deletes_{0};
  std::atomic<std::uint64_t> keys_deleted_{0};
  std::atomic<std::uint64_t> errors_{0};
};

} // namespace rulegraph::cache
