#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "tiermem/config.hpp"
#include "tiermem/store.hpp"

namespace tiermem {

struct SessionEvent {
  std::string event_id;
  int64_t timestamp_ms{0};
  json data;
};

struct SessionInfo {
  std::string session_id;
  int64_t created_at_ms{0};
  int64_t last_accessed_ms{0};
  std::size_t event_count{0};
};

struct SessionKey {
  std::string session_id;
  std::string event_id;
};

// Splits "<session>:<event>" at the first ':'.
inline std::optional<SessionKey> parse_session_key(const std::string& key) {
  const auto pos = key.find(':');
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  return SessionKey{key.substr(0, pos), key.substr(pos + 1)};
}

// Ordered events grouped by session. Event ids may repeat within a session;
// get and remove act on the first match.
class SessionStore : public Store {
 public:
  explicit SessionStore(const SessionConfig& cfg, Clock clock = now_ms)
      : max_sessions_(cfg.max_sessions == 0 ? 1 : cfg.max_sessions),
        ttl_ms_(ttl_hours_to_ms(cfg.session_ttl_hours)),
        clock_(std::move(clock)) {}

  std::string type_name() const override { return "SessionStore"; }

  bool put(const std::string& key, const json& value) override {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    const auto k = parse_key(key);
    if (!k) {
      return false;
    }

    try {
      drop_if_expired_locked(k->session_id);

      const int64_t now = clock_();
      auto it = sessions_.find(k->session_id);
      if (it == sessions_.end()) {
        Session s;
        s.id = k->session_id;
        s.created_at_ms = now;
        s.seq = next_seq_++;
        it = sessions_.emplace(k->session_id, std::move(s)).first;
        Logger::log(Logger::Level::kDebug, "session: created '" + k->session_id + "'");
      }

      Session& s = it->second;
      s.events.push_back(SessionEvent{k->event_id, now, value});
      s.last_accessed_ms = now;
      metrics_.inc(kMetricPuts);

      if (sessions_.size() > max_sessions_) {
        evict_oldest_locked();
      }

      Logger::log(Logger::Level::kDebug, "session: stored event '" + k->event_id + "' in '" + k->session_id + "'");
      return true;
    } catch (const std::exception& e) {
      Logger::log(Logger::Level::kError, "session: error storing '" + key + "': " + e.what());
      return false;
    }
  }

  json get(const std::string& key, const json& fallback = nullptr) override {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    const auto k = parse_key(key);
    if (!k) {
      return fallback;
    }
    Session* s = live_session_locked(k->session_id);
    if (!s) {
      metrics_.inc(kMetricMisses);
      return fallback;
    }
    for (const auto& ev : s->events) {
      if (ev.event_id == k->event_id) {
        s->last_accessed_ms = clock_();
        metrics_.inc(kMetricHits);
        return ev.data;
      }
    }
    metrics_.inc(kMetricMisses);
    return fallback;
  }

  // Removes the first event with a matching id; an emptied session is dropped.
  bool remove(const std::string& key) override {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    const auto k = parse_key(key);
    if (!k) {
      return false;
    }
    Session* s = live_session_locked(k->session_id);
    if (!s) {
      return false;
    }
    auto ev = std::find_if(s->events.begin(), s->events.end(),
                           [&](const SessionEvent& e) { return e.event_id == k->event_id; });
    if (ev == s->events.end()) {
      return false;
    }
    s->events.erase(ev);
    if (s->events.empty()) {
      sessions_.erase(k->session_id);
      Logger::log(Logger::Level::kDebug, "session: '" + k->session_id + "' emptied and removed");
    }
    return true;
  }

  bool clear() override {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    sessions_.clear();
    Logger::log(Logger::Level::kInfo, "session: cleared");
    return true;
  }

  bool exists(const std::string& key) override {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    const auto k = parse_key(key);
    if (!k) {
      return false;
    }
    const Session* s = live_session_locked(k->session_id);
    if (!s) {
      return false;
    }
    return std::any_of(s->events.begin(), s->events.end(),
                       [&](const SessionEvent& e) { return e.event_id == k->event_id; });
  }

  // Composite keys of all live events, sessions oldest first.
  std::vector<std::string> list_keys() override {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    sweep_expired_locked();
    std::vector<std::string> keys;
    for (const Session* s : sessions_by_age_locked()) {
      for (const auto& ev : s->events) {
        keys.push_back(s->id + ":" + ev.event_id);
      }
    }
    return keys;
  }

  std::vector<SessionEvent> get_session_events(const std::string& session_id) {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    const Session* s = live_session_locked(session_id);
    if (!s) {
      return {};
    }
    return s->events;
  }

  bool delete_session(const std::string& session_id) {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    if (sessions_.erase(session_id) == 0) {
      return false;
    }
    Logger::log(Logger::Level::kDebug, "session: deleted '" + session_id + "'");
    return true;
  }

  std::vector<SessionInfo> list_sessions() {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    sweep_expired_locked();
    std::vector<SessionInfo> out;
    for (const Session* s : sessions_by_age_locked()) {
      out.push_back(SessionInfo{s->id, s->created_at_ms, s->last_accessed_ms, s->events.size()});
    }
    return out;
  }

  std::size_t sweep_expired() {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    return sweep_expired_locked();
  }

  std::size_t session_count() const {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    return sessions_.size();
  }

 private:
  struct Session {
    std::string id;
    int64_t created_at_ms{0};
    int64_t last_accessed_ms{0};
    uint64_t seq{0};
    std::vector<SessionEvent> events;
  };

  std::optional<SessionKey> parse_key(const std::string& key) {
    auto k = parse_session_key(key);
    if (!k) {
      metrics_.inc(kMetricMalformedKeys);
      Logger::log(Logger::Level::kDebug, "session: malformed key '" + key + "'");
    }
    return k;
  }

  bool expired(const Session& s) const { return clock_() - s.created_at_ms > ttl_ms_; }

  bool drop_if_expired_locked(const std::string& session_id) {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end() || !expired(it->second)) {
      return false;
    }
    sessions_.erase(it);
    metrics_.inc(kMetricExpirations);
    Logger::log(Logger::Level::kDebug, "session: '" + session_id + "' expired");
    return true;
  }

  Session* live_session_locked(const std::string& session_id) {
    drop_if_expired_locked(session_id);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : &it->second;
  }

  std::size_t sweep_expired_locked() {
    std::vector<std::string> dead;
    for (const auto& kv : sessions_) {
      if (expired(kv.second)) {
        dead.push_back(kv.first);
      }
    }
    for (const auto& id : dead) {
      sessions_.erase(id);
    }
    if (!dead.empty()) {
      metrics_.inc(kMetricExpirations, dead.size());
      Logger::log(Logger::Level::kDebug, "session: expired " + std::to_string(dead.size()) + " sessions");
    }
    return dead.size();
  }

  void evict_oldest_locked() {
    auto oldest = sessions_.end();
    for (auto it = sessions_.begin(); it != sessions_.end(); ++it) {
      if (oldest == sessions_.end() || it->second.created_at_ms < oldest->second.created_at_ms ||
          (it->second.created_at_ms == oldest->second.created_at_ms && it->second.seq < oldest->second.seq)) {
        oldest = it;
      }
    }
    if (oldest == sessions_.end()) {
      return;
    }
    Logger::log(Logger::Level::kDebug, "session: evicted '" + oldest->first + "'");
    sessions_.erase(oldest);
    metrics_.inc(kMetricEvictions);
  }

  std::vector<const Session*> sessions_by_age_locked() const {
    std::vector<const Session*> out;
    out.reserve(sessions_.size());
    for (const auto& kv : sessions_) {
      out.push_back(&kv.second);
    }
    std::sort(out.begin(), out.end(), [](const Session* a, const Session* b) {
      if (a->created_at_ms != b->created_at_ms) {
        return a->created_at_ms < b->created_at_ms;
      }
      return a->seq < b->seq;
    });
    return out;
  }

  const std::size_t max_sessions_;
  const int64_t ttl_ms_;
  Clock clock_;

  mutable std::recursive_mutex mu_;
  std::unordered_map<std::string, Session> sessions_;
  uint64_t next_seq_{0};
};

}  // namespace tiermem
