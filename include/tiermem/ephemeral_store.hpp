#pragma once

#include <iterator>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "tiermem/config.hpp"
#include "tiermem/store.hpp"

namespace tiermem {

// Bounded in-process cache. Entries expire `ttl_seconds` after their last
// put; when full, the least recently accessed entries are evicted.
class EphemeralStore : public Store {
 public:
  explicit EphemeralStore(const EphemeralConfig& cfg, Clock clock = now_ms)
      : max_items_(cfg.max_items == 0 ? 1 : cfg.max_items),
        ttl_ms_(ttl_seconds_to_ms(cfg.ttl_seconds)),
        clock_(std::move(clock)) {}

  std::string type_name() const override { return "EphemeralStore"; }

  bool put(const std::string& key, const json& value) override {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    try {
      sweep_expired_locked();

      const int64_t now = clock_();
      auto it = entries_.find(key);
      if (it != entries_.end()) {
        lru_.erase(it->second.lru_pos);
        entries_.erase(it);
      }
      lru_.push_back(key);
      entries_.emplace(key, Entry{value, now, now, 0, std::prev(lru_.end())});
      metrics_.inc(kMetricPuts);

      while (entries_.size() > max_items_) {
        const std::string victim = lru_.front();
        erase_locked(victim);
        metrics_.inc(kMetricEvictions);
        Logger::log(Logger::Level::kDebug, "ephemeral: evicted '" + victim + "'");
      }

      Logger::log(Logger::Level::kDebug, "ephemeral: stored '" + key + "'");
      return true;
    } catch (const std::exception& e) {
      Logger::log(Logger::Level::kError, "ephemeral: error storing '" + key + "': " + e.what());
      return false;
    }
  }

  json get(const std::string& key, const json& fallback = nullptr) override {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      metrics_.inc(kMetricMisses);
      return fallback;
    }
    if (expired(it->second)) {
      erase_locked(key);
      metrics_.inc(kMetricExpirations);
      metrics_.inc(kMetricMisses);
      return fallback;
    }

    Entry& e = it->second;
    e.access_count++;
    e.last_accessed_ms = clock_();
    lru_.splice(lru_.end(), lru_, e.lru_pos);
    metrics_.inc(kMetricHits);
    return e.value;
  }

  bool remove(const std::string& key) override {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    if (!erase_locked(key)) {
      return false;
    }
    Logger::log(Logger::Level::kDebug, "ephemeral: deleted '" + key + "'");
    return true;
  }

  bool clear() override {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    entries_.clear();
    lru_.clear();
    Logger::log(Logger::Level::kInfo, "ephemeral: cleared");
    return true;
  }

  bool exists(const std::string& key) override {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      return false;
    }
    if (expired(it->second)) {
      erase_locked(key);
      metrics_.inc(kMetricExpirations);
      return false;
    }
    return true;
  }

  // Least recently used first.
  std::vector<std::string> list_keys() override {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    sweep_expired_locked();
    return std::vector<std::string>(lru_.begin(), lru_.end());
  }

  std::size_t sweep_expired() {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    return sweep_expired_locked();
  }

  std::size_t size() const {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    return entries_.size();
  }

  std::size_t capacity() const { return max_items_; }

 private:
  struct Entry {
    json value;
    int64_t created_at_ms{0};
    int64_t last_accessed_ms{0};
    uint64_t access_count{0};
    std::list<std::string>::iterator lru_pos;
  };

  bool expired(const Entry& e) const { return clock_() - e.created_at_ms > ttl_ms_; }

  bool erase_locked(const std::string& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      return false;
    }
    lru_.erase(it->second.lru_pos);
    entries_.erase(it);
    return true;
  }

  std::size_t sweep_expired_locked() {
    std::vector<std::string> dead;
    for (const auto& kv : entries_) {
      if (expired(kv.second)) {
        dead.push_back(kv.first);
      }
    }
    for (const auto& key : dead) {
      erase_locked(key);
    }
    if (!dead.empty()) {
      metrics_.inc(kMetricExpirations, dead.size());
      Logger::log(Logger::Level::kDebug, "ephemeral: expired " + std::to_string(dead.size()) + " entries");
    }
    return dead.size();
  }

  const std::size_t max_items_;
  const int64_t ttl_ms_;
  Clock clock_;

  mutable std::recursive_mutex mu_;
  std::unordered_map<std::string, Entry> entries_;
  std::list<std::string> lru_;
};

}  // namespace tiermem
