#include "internal/cache/memory_cache.hpp"

#include <mutex>

namespace rulegraph::cache {

bool GlobMatch(const std::string& glob, const std::string& text) {
  std::size_t g = 0, t = 0;
  std::size_t star = std::string::npos, mark = 0;

  while (t < text.size()) {
    if (g < glob.size() && (glob[g] == '?' || glob[g] == text[t])) {
      ++g;
      ++t;
    } else if (g < glob.size() && glob[g] == '*') {
      star = g++;
      mark = t;
    } else if (star != std::string::npos) {
      g = star + 1;
      t = ++mark;
    } else {
      return false;
    }
  }
  while (g < glob.size() && glob[g] == '*') ++g;
  return g == glob.size();
}

// ------------------------------------------------------------
// Get
// ------------------------------------------------------------

std::optional<std::string> MemoryCache::Get(const std::string& key) {
  std::shared_lock lock(mutex_);
  auto             it = entries_.find(key);
  if (it == entries_.end() || it->second.expires_at <= Clock::now()) return std::nullopt;
  return it->second.value;
}

// ------------------------------------------------------------
// Set
// ------------------------------------------------------------

void MemoryCache::Set(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
  const auto expires = ttl.count() > 0 ? Clock::now() + ttl : Clock::time_point::max();
  std::unique_lock lock(mutex_);
  entries_[key] = Entry{value, expires};
}

// ------------------------------------------------------------
// Delete
// ------------------------------------------------------------

bool MemoryCache::Delete(const std::string& key) {
  std::unique_lock lock(mutex_);
  auto             it = entries_.find(key);
  if (it == entries_.end()) return false;
  const bool live = it->second.expires_at > Clock::now();
  entries_.erase(it);
  return live;
}

std::uint64_t MemoryCache::DeletePattern(const std::string& glob) {
  const auto       now = Clock::now();
  std::uint64_t    removed = 0;
  std::unique_lock lock(mutex_);
  for (auto it = entries_.begin(); it != entries_.end();) {
    const bool expired = it->second.expires_at <= now;
    if (expired || GlobMatch(glob, it->first)) {
      if (!expired) ++removed;
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t MemoryCache::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

} // namespace rulegraph::cache
