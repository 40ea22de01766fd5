#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "tiermem/config.hpp"
#include "tiermem/store.hpp"

namespace tiermem {

struct EntryMeta {
  int64_t created_at_ms{0};
  int64_t last_accessed_ms{0};
  uint64_t access_count{0};
  uint64_t seq{0};
};

// Durable key/value map. Every mutation rewrites the backing JSON file;
// when full, the entry created first is evicted.
class PersistentStore : public Store {
 public:
  explicit PersistentStore(const PersistentConfig& cfg, Clock clock = now_ms)
      : max_items_(cfg.max_items == 0 ? 1 : cfg.max_items),
        path_(resolve_store_path(cfg.persistence_file)),
        clock_(std::move(clock)) {
    load();
  }

  std::string type_name() const override { return "PersistentStore"; }

  bool put(const std::string& key, const json& value) override {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    std::string error;
    if (!json_encodable(json(key), &error) || !json_encodable(value, &error)) {
      metrics_.inc(kMetricRejectedValues);
      Logger::log(Logger::Level::kError, "persistent: rejecting '" + key + "': " + error);
      return false;
    }
    try {
      if (entries_.find(key) == entries_.end()) {
        while (entries_.size() >= max_items_ && evict_oldest_locked()) {
        }
      }

      const int64_t now = clock_();
      entries_[key] = Entry{value, EntryMeta{now, now, 0, next_seq_++}};
      metrics_.inc(kMetricPuts);
      Logger::log(Logger::Level::kDebug, "persistent: stored '" + key + "'");
      return save_locked();
    } catch (const std::exception& e) {
      Logger::log(Logger::Level::kError, "persistent: error storing '" + key + "': " + e.what());
      return false;
    }
  }

  // Access bookkeeping is not persisted until the next mutation.
  json get(const std::string& key, const json& fallback = nullptr) override {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      metrics_.inc(kMetricMisses);
      return fallback;
    }
    it->second.meta.access_count++;
    it->second.meta.last_accessed_ms = clock_();
    metrics_.inc(kMetricHits);
    return it->second.value;
  }

  bool remove(const std::string& key) override {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    if (entries_.erase(key) == 0) {
      return false;
    }
    Logger::log(Logger::Level::kDebug, "persistent: deleted '" + key + "'");
    return save_locked();
  }

  bool clear() override {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    entries_.clear();
    Logger::log(Logger::Level::kInfo, "persistent: cleared");
    return save_locked();
  }

  bool exists(const std::string& key) override {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    return entries_.find(key) != entries_.end();
  }

  std::vector<std::string> list_keys() override {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    std::vector<std::string> keys;
    keys.reserve(entries_.size());
    for (const auto& kv : entries_) {
      keys.push_back(kv.first);
    }
    return keys;
  }

  std::optional<EntryMeta> metadata(const std::string& key) const {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    return it->second.meta;
  }

  bool flush() {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    return save_locked();
  }

  std::size_t size() const {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    return entries_.size();
  }

  const fs::path& path() const { return path_; }

 private:
  struct Entry {
    json value;
    EntryMeta meta;
  };

  bool evict_oldest_locked() {
    auto oldest = entries_.end();
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
      if (oldest == entries_.end() || it->second.meta.created_at_ms < oldest->second.meta.created_at_ms ||
          (it->second.meta.created_at_ms == oldest->second.meta.created_at_ms &&
           it->second.meta.seq < oldest->second.meta.seq)) {
        oldest = it;
      }
    }
    if (oldest == entries_.end()) {
      return false;
    }
    Logger::log(Logger::Level::kDebug, "persistent: evicted '" + oldest->first + "'");
    entries_.erase(oldest);
    metrics_.inc(kMetricEvictions);
    return true;
  }

  bool save_locked() {
    std::string error;
    try {
      json root;
      root["version"] = 1;
      root["memory"] = json::object();
      root["metadata"] = json::object();
      for (const auto& kv : entries_) {
        const EntryMeta& m = kv.second.meta;
        root["memory"][kv.first] = kv.second.value;
        root["metadata"][kv.first] = {{"createdAtMs", m.created_at_ms},
                                      {"lastAccessedMs", m.last_accessed_ms},
                                      {"accessCount", m.access_count},
                                      {"seq", m.seq}};
      }
      root["last_saved"] = iso8601_from_ms(clock_());

      if (write_text_file_atomic(path_, root.dump(2), &error)) {
        return true;
      }
    } catch (const std::exception& e) {
      error = e.what();
    }
    metrics_.inc(kMetricPersistFailures);
    Logger::log(Logger::Level::kError, "persistent: cannot save " + path_.string() + ": " + error);
    return false;
  }

  void load() {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    entries_.clear();

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
      return;
    }
    const std::string raw = read_text_file(path_);
    if (trim(raw).empty()) {
      return;
    }

    try {
      const json root = json::parse(raw);
      if (!root.contains("memory") || !root["memory"].is_object()) {
        Logger::log(Logger::Level::kWarn, "persistent: no memory section in " + path_.string());
        return;
      }

      const json empty = json::object();
      const json& meta = root.contains("metadata") && root["metadata"].is_object() ? root["metadata"] : empty;
      const int64_t now = clock_();

      for (auto it = root["memory"].begin(); it != root["memory"].end(); ++it) {
        Entry e{it.value(), EntryMeta{now, now, 0, 0}};
        auto m = meta.find(it.key());
        if (m != meta.end() && m->is_object()) {
          e.meta.created_at_ms = m->value("createdAtMs", now);
          e.meta.last_accessed_ms = m->value("lastAccessedMs", e.meta.created_at_ms);
          e.meta.access_count = m->value("accessCount", uint64_t{0});
          e.meta.seq = m->value("seq", uint64_t{0});
        }
        next_seq_ = (std::max)(next_seq_, e.meta.seq + 1);
        entries_.emplace(it.key(), std::move(e));
      }

      while (entries_.size() > max_items_ && evict_oldest_locked()) {
      }
      Logger::log(Logger::Level::kInfo,
                  "persistent: loaded " + std::to_string(entries_.size()) + " entries from " + path_.string());
    } catch (const std::exception& e) {
      entries_.clear();
      next_seq_ = 0;
      Logger::log(Logger::Level::kWarn, "persistent: ignoring unreadable " + path_.string() + ": " + e.what());
    }
  }

  const std::size_t max_items_;
  const fs::path path_;
  Clock clock_;

  mutable std::recursive_mutex mu_;
  std::unordered_map<std::string, Entry> entries_;
  uint64_t next_seq_{0};
};

}  // namespace tiermem
