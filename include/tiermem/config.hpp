#pragma once

#include <initializer_list>
#include <limits>
#include <string>

#include "tiermem/common.hpp"

namespace tiermem {

struct EphemeralConfig {
  std::size_t max_items{1000};
  int64_t ttl_seconds{3600};
};

struct PersistentConfig {
  std::size_t max_items{10000};
  std::string persistence_file{"data/memory/long_term.json"};
};

struct SessionConfig {
  std::size_t max_sessions{100};
  double session_ttl_hours{24.0};
};

struct RelationalConfig {
  std::size_t max_items{5000};
  std::string knowledge_graph_file{"data/memory/semantic_graph.json"};
};

struct MemoryConfig {
  EphemeralConfig ephemeral{};
  PersistentConfig persistent{};
  SessionConfig session{};
  RelationalConfig relational{};
  int sweep_interval_seconds{0};
};

struct LoggingConfig {
  std::string level{"info"};
  bool json{false};
};

struct Config {
  MemoryConfig memory{};
  LoggingConfig logging{};
};

// Longest TTLs whose millisecond value still fits in int64_t.
inline constexpr int64_t kMaxTtlSeconds = std::numeric_limits<int64_t>::max() / 1000;
inline constexpr int64_t kMaxSessionTtlWholeHours = std::numeric_limits<int64_t>::max() / 3600000;

inline int64_t ttl_seconds_to_ms(int64_t seconds) {
  if (seconds <= 0) {
    return 0;
  }
  return (std::min)(seconds, kMaxTtlSeconds) * 1000;
}

inline int64_t ttl_hours_to_ms(double hours) {
  if (!(hours > 0.0)) {
    return 0;
  }
  if (hours >= static_cast<double>(kMaxSessionTtlWholeHours)) {
    return kMaxSessionTtlWholeHours * 3600000;
  }
  return static_cast<int64_t>(hours * 3600.0 * 1000.0);
}

inline std::string resolve_env_ref(const std::string& value) {
  if (value.empty()) {
    return "";
  }

  // Supports "$ENV_NAME" and "${ENV_NAME}".
  if (value[0] != '$') {
    return value;
  }

  std::string env_name = value.substr(1);
  if (!env_name.empty() && env_name.front() == '{' && env_name.back() == '}') {
    env_name = env_name.substr(1, env_name.size() - 2);
  }
  if (env_name.empty()) {
    return value;
  }

  const char* v = std::getenv(env_name.c_str());
  return (v && *v) ? std::string(v) : "";
}

inline fs::path resolve_store_path(const std::string& configured) {
  return expand_user_path(resolve_env_ref(configured));
}

inline fs::path get_data_dir() {
  return expand_user_path("~/.tiermem");
}

inline fs::path get_config_path() {
  return get_data_dir() / "config.json";
}

inline json default_config_json() {
  return json{{"memory",
               {
                   {"ephemeral", {{"max_items", 1000}, {"ttl_seconds", 3600}}},
                   {"persistent", {{"max_items", 10000}, {"persistence_file", "data/memory/long_term.json"}}},
                   {"session", {{"max_sessions", 100}, {"session_ttl_hours", 24}}},
                   {"relational",
                    {{"max_items", 5000}, {"knowledge_graph_file", "data/memory/semantic_graph.json"}}},
                   {"sweep_interval_seconds", 0},
               }},
              {"logging", {{"level", "info"}, {"json", false}}}};
}

namespace detail {

// First object-valued member among `names`, so the older tier names keep working.
inline const json* find_section(const json& parent, std::initializer_list<const char*> names) {
  for (const char* name : names) {
    auto it = parent.find(name);
    if (it != parent.end() && it->is_object()) {
      return &*it;
    }
  }
  return nullptr;
}

inline std::size_t read_capacity(const json& section, const char* key, std::size_t fallback) {
  auto it = section.find(key);
  if (it == section.end() || !it->is_number()) {
    return fallback;
  }
  const double v = it->get<double>();
  if (v < 1.0) {
    return 1;
  }
  if (v >= static_cast<double>(std::numeric_limits<std::size_t>::max())) {
    return std::numeric_limits<std::size_t>::max();
  }
  return static_cast<std::size_t>(v);
}

inline double read_clamped(const json& section, const char* key, double fallback, double lo, double hi) {
  auto it = section.find(key);
  if (it == section.end() || !it->is_number()) {
    return fallback;
  }
  return (std::min)((std::max)(it->get<double>(), lo), hi);
}

}  // namespace detail

inline MemoryConfig parse_memory_config(const json& mem) {
  MemoryConfig cfg{};
  if (!mem.is_object()) {
    return cfg;
  }

  if (const json* s = detail::find_section(mem, {"ephemeral", "short_term"})) {
    cfg.ephemeral.max_items = detail::read_capacity(*s, "max_items", cfg.ephemeral.max_items);
    const double ttl = detail::read_clamped(*s, "ttl_seconds", static_cast<double>(cfg.ephemeral.ttl_seconds), 0.0,
                                            static_cast<double>(kMaxTtlSeconds));
    cfg.ephemeral.ttl_seconds = (std::min)(static_cast<int64_t>(ttl), kMaxTtlSeconds);
  }

  if (const json* s = detail::find_section(mem, {"persistent", "long_term"})) {
    cfg.persistent.max_items = detail::read_capacity(*s, "max_items", cfg.persistent.max_items);
    cfg.persistent.persistence_file = s->value("persistence_file", cfg.persistent.persistence_file);
  }

  if (const json* s = detail::find_section(mem, {"session", "episodic"})) {
    cfg.session.max_sessions = detail::read_capacity(*s, "max_sessions", cfg.session.max_sessions);
    cfg.session.session_ttl_hours = detail::read_clamped(*s, "session_ttl_hours", cfg.session.session_ttl_hours, 0.0,
                                                         static_cast<double>(kMaxSessionTtlWholeHours));
  }

  if (const json* s = detail::find_section(mem, {"relational", "semantic"})) {
    cfg.relational.max_items = detail::read_capacity(*s, "max_nodes", cfg.relational.max_items);
    cfg.relational.max_items = detail::read_capacity(*s, "max_items", cfg.relational.max_items);
    cfg.relational.knowledge_graph_file = s->value("knowledge_graph_file", cfg.relational.knowledge_graph_file);
  }

  cfg.sweep_interval_seconds = static_cast<int>(
      detail::read_clamped(mem, "sweep_interval_seconds", cfg.sweep_interval_seconds, 0.0,
                           static_cast<double>(std::numeric_limits<int>::max())));
  return cfg;
}

inline Config load_config(const fs::path& path = get_config_path()) {
  Config cfg{};
  const std::string raw = read_text_file(path);
  if (raw.empty()) {
    return cfg;
  }

  try {
    const json root = json::parse(raw);

    if (root.contains("memory")) {
      cfg.memory = parse_memory_config(root["memory"]);
    }

    if (root.contains("logging") && root["logging"].is_object()) {
      const auto& lg = root["logging"];
      cfg.logging.level = lg.value("level", cfg.logging.level);
      cfg.logging.json = lg.value("json", cfg.logging.json);
    }
  } catch (const std::exception& e) {
    Logger::log(Logger::Level::kWarn, std::string("Failed to parse config: ") + e.what());
  }

  return cfg;
}

inline void apply_logging_config(const LoggingConfig& cfg) {
  if (auto level = Logger::parse_level(cfg.level)) {
    Logger::set_min_level(*level);
  } else {
    Logger::log(Logger::Level::kWarn, "Unknown log level: " + cfg.level);
  }
  if (cfg.json) {
    Logger::set_json(true);
  }
}

inline bool save_default_config(const fs::path& path = get_config_path()) {
  return write_text_file(path, default_config_json().dump(2));
}

}  // namespace tiermem
