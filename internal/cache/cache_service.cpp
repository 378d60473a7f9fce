#include "internal/cache/cache_service.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace rulegraph::cache {

CacheService::CacheService(std::shared_ptr<Cache> backend, bool disabled) : backend_(std::move(backend)), disabled_(disabled || !backend_) {
}

std::optional<std::string> CacheService::GetRaw(const std::string& key) {
  if (disabled_) return std::nullopt;
  try {
    auto bytes = backend_->Get(key);
    if (bytes) {
      hits_.fetch_add(1, std::memory_order_relaxed);
    } else {
      misses_.fetch_add(1, std::memory_order_relaxed);
    }
    return bytes;
  } catch (const std::exception& e) {
    errors_.fetch_add(1, std::memory_order_relaxed);
    misses_.fetch_add(1, std::memory_order_relaxed);
    RULEGRAPH_LOG_WARN("cache get failed; treating as miss", {observability::StringField("key", key), observability::StringField("error", e.what())});
    return std::nullopt;
  }
}

void CacheService::SetRaw(const std::string& key, const std::string& bytes, std::chrono::seconds ttl) {
  if (disabled_) return;
  try {
    backend_->Set(key, bytes, ttl);
    sets_.fetch_add(1, std::memory_order_relaxed);
  } catch (const std::exception& e) {
    errors_.fetch_add(1, std::memory_order_relaxed);
    RULEGRAPH_LOG_WARN("cache set failed", {observability::StringField("key", key), observability::StringField("error", e.what())});
  }
}

std::optional<google::protobuf::Struct> CacheService::GetStruct(const std::string& key) {
  auto bytes = GetRaw(key);
  if (!bytes) return std::nullopt;
  google::protobuf::Struct out;
  if (!out.ParseFromString(*bytes)) {
    RULEGRAPH_LOG_WARN("cache entry unreadable", {observability::StringField("key", key)});
    return std::nullopt;
  }
  return out;
}

void CacheService::SetStruct(const std::string& key, const google::protobuf::Struct& value, std::chrono::seconds ttl) {
  SetRaw(key, value.SerializeAsString(), ttl);
}

std::optional<google::protobuf::Value> CacheService::GetValue(const std::string& key) {
  auto bytes = GetRaw(key);
  if (!bytes) return std::nullopt;
  google::protobuf::Value out;
  if (!out.ParseFromString(*bytes)) {
    RULEGRAPH_LOG_WARN("cache entry unreadable", {observability::StringField("key", key)});
    return std::nullopt;
  }
  return out;
}

void CacheService::SetValue(const std::string& key, const google::protobuf::Value& value, std::chrono::seconds ttl) {
  SetRaw(key, value.SerializeAsString(), ttl);
}

std::uint64_t CacheService::Delete(const std::string& key) {
  if (disabled_) return 0;
  try {
    const bool existed = backend_->Delete(key);
    deletes_.fetch_add(1, std::memory_order_relaxed);
    if (existed) keys_deleted_.fetch_add(1, std::memory_order_relaxed);
    return existed ? 1 : 0;
  } catch (const std::exception& e) {
    errors_.fetch_add(1, std::memory_order_relaxed);
    RULEGRAPH_LOG_WARN("cache delete failed", {observability::StringField("key", key), observability::StringField("error", e.what())});
    return 0;
  }
}

std::uint64_t CacheService::DeletePattern(const std::string& glob) {
  if (disabled_) return 0;
  try {
    const auto removed = backend_->DeletePattern(glob);
    pattern_deletes_.fetch_add(1, std::memory_order_relaxed);
    keys_deleted_.fetch_add(removed, std::memory_order_relaxed);
    return removed;
  } catch (const std::exception& e) {
    errors_.fetch_add(1, std::memory_order_relaxed);
    RULEGRAPH_LOG_WARN("cache pattern delete failed", {observability::StringField("pattern", glob), observability::StringField("error", e.what())});
    return 0;
  }
}

CacheStats CacheService::Stats() const {
  CacheStats s;
  s.hits            = hits_.load(std::memory_order_relaxed);
  s.misses          = misses_.load(std::memory_order_relaxed);
  s.sets            = sets_.load(std::memory_order_relaxed);
  s.deletes         = deletes_.load(std::memory_order_relaxed);
  s.pattern_deletes = pattern_deletes_.load(std::memory_order_relaxed);
  s.keys_deleted    = keys_deleted_.load(std::memory_order_relaxed);
  s.errors          = errors_.load(std::memory_order_relaxed);
  return s;
}

void CacheService::ResetStats() {
  hits_            = 0;
  misses_          = 0;
  sets_            = 0;
  deletes_         = 0;
  pattern_deletes_ = 0;
  keys_deleted_    = 0;
  errors_          = 0;
}

} // namespace rulegraph::cache
