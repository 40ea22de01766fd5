#pragma once

#include <optional>
#include <string>
#include <vector>

#include "tiermem/config.hpp"
#include "tiermem/ephemeral_store.hpp"
#include "tiermem/persistent_store.hpp"
#include "tiermem/relational_store.hpp"
#include "tiermem/session_store.hpp"
#include "tiermem/store.hpp"
#include "tiermem/sweeper.hpp"

namespace tiermem {

// Owns one store per tier and routes calls to them. Tier names that do not
// resolve are logged and answered with false / the fallback value.
class MemoryManager {
 public:
  explicit MemoryManager(const MemoryConfig& cfg, Clock clock = now_ms)
      : ephemeral_(cfg.ephemeral, clock),
        persistent_(cfg.persistent, clock),
        session_(cfg.session, clock),
        relational_(cfg.relational, clock),
        sweeper_([this]() { return sweep_expired(); }, cfg.sweep_interval_seconds) {
    Logger::log(Logger::Level::kInfo, "memory manager ready");
  }

  ~MemoryManager() { sweeper_.stop(); }

  MemoryManager(const MemoryManager&) = delete;
  MemoryManager& operator=(const MemoryManager&) = delete;

  Store& tier(Tier t) {
    switch (t) {
      case Tier::kEphemeral:
        return ephemeral_;
      case Tier::kPersistent:
        return persistent_;
      case Tier::kSession:
        return session_;
      case Tier::kRelational:
      default:
        return relational_;
    }
  }

  bool store(const std::string& key, const json& value, Tier t = Tier::kEphemeral) { return tier(t).put(key, value); }

  bool store(const std::string& key, const json& value, const std::string& tier_name) {
    auto t = resolve(tier_name);
    return t ? store(key, value, *t) : false;
  }

  json retrieve(const std::string& key, const json& fallback = nullptr, Tier t = Tier::kEphemeral) {
    return tier(t).get(key, fallback);
  }

  json retrieve(const std::string& key, const json& fallback, const std::string& tier_name) {
    auto t = resolve(tier_name);
    return t ? retrieve(key, fallback, *t) : fallback;
  }

  bool remove(const std::string& key, Tier t = Tier::kEphemeral) { return tier(t).remove(key); }

  bool remove(const std::string& key, const std::string& tier_name) {
    auto t = resolve(tier_name);
    return t ? remove(key, *t) : false;
  }

  bool exists(const std::string& key, Tier t = Tier::kEphemeral) { return tier(t).exists(key); }

  bool exists(const std::string& key, const std::string& tier_name) {
    auto t = resolve(tier_name);
    return t ? exists(key, *t) : false;
  }

  std::vector<std::string> list_keys(Tier t) { return tier(t).list_keys(); }

  std::vector<std::string> list_keys(const std::string& tier_name) {
    auto t = resolve(tier_name);
    return t ? list_keys(*t) : std::vector<std::string>{};
  }

  bool clear(Tier t) { return tier(t).clear(); }

  // "all" clears every tier.
  bool clear(const std::string& tier_name = "all") {
    if (to_lower(trim(tier_name)) == "all") {
      return clear_all();
    }
    auto t = resolve(tier_name);
    return t ? clear(*t) : false;
  }

  // Every tier is attempted even after a failure.
  bool clear_all() {
    bool ok = true;
    for (Tier t : kAllTiers) {
      if (!tier(t).clear()) {
        Logger::log(Logger::Level::kError, std::string("failed to clear tier ") + tier_name(t));
        ok = false;
      }
    }
    return ok;
  }

  json get_stats() {
    json stats = json::object();
    for (Tier t : kAllTiers) {
      Store& s = tier(t);
      json j = s.metrics().to_json();
      j["keys"] = s.list_keys().size();
      j["type"] = s.type_name();
      stats[tier_name(t)] = std::move(j);
    }
    stats["relational"]["edges"] = relational_.edge_count();
    stats["session"]["sessions"] = session_.session_count();
    return stats;
  }

  bool add_relationship(const std::string& from, const std::string& to, const std::string& type,
                        double weight = 1.0) {
    return relational_.add_relationship(from, to, type, weight);
  }

  std::vector<RelatedNode> get_related(const std::string& key,
                                       const std::optional<std::string>& type = std::nullopt) const {
    return relational_.get_related(key, type);
  }

  std::vector<SessionEvent> get_session_events(const std::string& session_id) {
    return session_.get_session_events(session_id);
  }

  bool delete_session(const std::string& session_id) { return session_.delete_session(session_id); }

  std::size_t sweep_expired() { return ephemeral_.sweep_expired() + session_.sweep_expired(); }

  bool start_background_sweep() {
    const bool started = sweeper_.start();
    if (started) {
      Logger::log(Logger::Level::kInfo, "background expiry sweep started");
    }
    return started;
  }

  void stop_background_sweep() { sweeper_.stop(); }

  EphemeralStore& ephemeral() { return ephemeral_; }
  PersistentStore& persistent() { return persistent_; }
  SessionStore& session() { return session_; }
  RelationalStore& relational() { return relational_; }

 private:
  static std::optional<Tier> resolve(const std::string& name) {
    auto t = parse_tier(name);
    if (!t) {
      Logger::log(Logger::Level::kError, "Unknown memory tier: " + name);
    }
    return t;
  }

  EphemeralStore ephemeral_;
  PersistentStore persistent_;
  SessionStore session_;
  RelationalStore relational_;
  ExpirySweeper sweeper_;
};

}  // namespace tiermem
