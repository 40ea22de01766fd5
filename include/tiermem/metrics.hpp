#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include "tiermem/common.hpp"

namespace tiermem {

inline constexpr const char* kMetricPuts = "puts";
inline constexpr const char* kMetricHits = "hits";
inline constexpr const char* kMetricMisses = "misses";
inline constexpr const char* kMetricEvictions = "evictions";
inline constexpr const char* kMetricExpirations = "expirations";
inline constexpr const char* kMetricPersistFailures = "persistFailures";
inline constexpr const char* kMetricMalformedKeys = "malformedKeys";
inline constexpr const char* kMetricRejectedRelationships = "rejectedRelationships";
inline constexpr const char* kMetricRejectedValues = "rejectedValues";

class Metrics {
 public:
  void inc(const std::string& key, uint64_t delta = 1) {
    std::lock_guard<std::mutex> lock(mu_);
    counters_[key] += delta;
  }

  uint64_t get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = counters_.find(key);
    return it == counters_.end() ? 0 : it->second;
  }

  json to_json() const {
    std::lock_guard<std::mutex> lock(mu_);
    json j = json::object();
    for (const auto& kv : counters_) {
      j[kv.first] = kv.second;
    }
    return j;
  }

 private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, uint64_t> counters_;
};

}  // namespace tiermem
