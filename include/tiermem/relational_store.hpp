#pragma once

#include <cmath>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "tiermem/config.hpp"
#include "tiermem/store.hpp"

namespace tiermem {

struct Edge {
  std::string to;
  std::string type;
  double weight{1.0};
  int64_t created_at_ms{0};
};

struct RelatedNode {
  std::string node;
  std::string type;
  double weight{1.0};
};

struct NodeInfo {
  std::string key;
  json value;
  int64_t created_at_ms{0};
  int64_t last_accessed_ms{0};
  uint64_t access_count{0};
  uint64_t connections{0};
  std::size_t outgoing{0};
};

// Knowledge graph of nodes joined by typed, weighted, directed edges.
//
// Each edge bumps the connection counter of both of its endpoints; the
// counter drives eviction (least connected node first) and drops again when
// the edge goes away. Deleting a node removes every edge that touches it.
// The whole graph is rewritten to disk after each mutation.
class RelationalStore : public Store {
 public:
  explicit RelationalStore(const RelationalConfig& cfg, Clock clock = now_ms)
      : max_nodes_(cfg.max_items == 0 ? 1 : cfg.max_items),
        path_(resolve_store_path(cfg.knowledge_graph_file)),
        clock_(std::move(clock)) {
    load();
  }

  std::string type_name() const override { return "RelationalStore"; }

  bool put(const std::string& key, const json& value) override {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    std::string error;
    if (!json_encodable(json(key), &error) || !json_encodable(value, &error)) {
      metrics_.inc(kMetricRejectedValues);
      Logger::log(Logger::Level::kError, "relational: rejecting '" + key + "': " + error);
      return false;
    }
    try {
      const int64_t now = clock_();
      auto it = nodes_.find(key);
      if (it != nodes_.end()) {
        it->second.value = value;
        it->second.last_accessed_ms = now;
      } else {
        while (nodes_.size() >= max_nodes_ && evict_least_connected_locked()) {
        }
        Node n;
        n.value = value;
        n.created_at_ms = now;
        n.last_accessed_ms = now;
        n.seq = next_seq_++;
        nodes_.emplace(key, std::move(n));
      }
      metrics_.inc(kMetricPuts);
      Logger::log(Logger::Level::kDebug, "relational: stored '" + key + "'");
      return save_locked();
    } catch (const std::exception& e) {
      Logger::log(Logger::Level::kError, "relational: error storing '" + key + "': " + e.what());
      return false;
    }
  }

  json get(const std::string& key, const json& fallback = nullptr) override {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    auto it = nodes_.find(key);
    if (it == nodes_.end()) {
      metrics_.inc(kMetricMisses);
      return fallback;
    }
    it->second.access_count++;
    it->second.last_accessed_ms = clock_();
    metrics_.inc(kMetricHits);
    return it->second.value;
  }

  bool remove(const std::string& key) override {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    if (!erase_node_locked(key)) {
      return false;
    }
    Logger::log(Logger::Level::kDebug, "relational: deleted '" + key + "'");
    return save_locked();
  }

  bool clear() override {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    nodes_.clear();
    Logger::log(Logger::Level::kInfo, "relational: cleared");
    return save_locked();
  }

  bool exists(const std::string& key) override {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    return nodes_.find(key) != nodes_.end();
  }

  std::vector<std::string> list_keys() override {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    std::vector<std::string> keys;
    keys.reserve(nodes_.size());
    for (const auto& kv : nodes_) {
      keys.push_back(kv.first);
    }
    return keys;
  }

  bool add_relationship(const std::string& from, const std::string& to, const std::string& type,
                        double weight = 1.0) {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    auto src = nodes_.find(from);
    auto dst = nodes_.find(to);
    if (src == nodes_.end() || dst == nodes_.end()) {
      metrics_.inc(kMetricRejectedRelationships);
      Logger::log(Logger::Level::kDebug, "relational: cannot link '" + from + "' -> '" + to + "': missing node");
      return false;
    }
    // JSON has no infinity or NaN.
    if (!std::isfinite(weight) || !json_encodable(json(type))) {
      metrics_.inc(kMetricRejectedRelationships);
      Logger::log(Logger::Level::kError, "relational: cannot link '" + from + "' -> '" + to + "': bad weight or type");
      return false;
    }

    src->second.outgoing.push_back(Edge{to, type, weight, clock_()});
    src->second.connections++;
    dst->second.connections++;
    Logger::log(Logger::Level::kDebug, "relational: added '" + type + "' from '" + from + "' to '" + to + "'");
    return save_locked();
  }

  // Removes outgoing edges from `from` to `to`, optionally only of one type.
  // Returns the number removed, or 0 when the new graph could not be saved.
  std::size_t remove_relationship(const std::string& from, const std::string& to,
                                  const std::optional<std::string>& type = std::nullopt) {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    auto src = nodes_.find(from);
    if (src == nodes_.end()) {
      return 0;
    }
    auto& out = src->second.outgoing;
    const auto old_size = out.size();
    out.erase(std::remove_if(out.begin(), out.end(),
                             [&](const Edge& e) { return e.to == to && (!type || e.type == *type); }),
              out.end());
    const std::size_t removed = old_size - out.size();
    if (removed == 0) {
      return 0;
    }
    drop_connections_locked(from, removed);
    drop_connections_locked(to, removed);
    return save_locked() ? removed : 0;
  }

  std::vector<RelatedNode> get_related(const std::string& key,
                                       const std::optional<std::string>& type = std::nullopt) const {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    std::vector<RelatedNode> out;
    auto it = nodes_.find(key);
    if (it == nodes_.end()) {
      return out;
    }
    for (const auto& e : it->second.outgoing) {
      if (!type || e.type == *type) {
        out.push_back(RelatedNode{e.to, e.type, e.weight});
      }
    }
    return out;
  }

  std::optional<NodeInfo> node(const std::string& key) const {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    auto it = nodes_.find(key);
    if (it == nodes_.end()) {
      return std::nullopt;
    }
    const Node& n = it->second;
    return NodeInfo{key, n.value, n.created_at_ms, n.last_accessed_ms, n.access_count, n.connections,
                    n.outgoing.size()};
  }

  bool flush() {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    return save_locked();
  }

  std::size_t size() const {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    return nodes_.size();
  }

  std::size_t edge_count() const {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    std::size_t n = 0;
    for (const auto& kv : nodes_) {
      n += kv.second.outgoing.size();
    }
    return n;
  }

  const fs::path& path() const { return path_; }

 private:
  struct Node {
    json value;
    int64_t created_at_ms{0};
    int64_t last_accessed_ms{0};
    uint64_t access_count{0};
    uint64_t connections{0};
    uint64_t seq{0};
    std::vector<Edge> outgoing;
  };

  void drop_connections_locked(const std::string& key, std::size_t n) {
    auto it = nodes_.find(key);
    if (it == nodes_.end()) {
      return;
    }
    it->second.connections = it->second.connections > n ? it->second.connections - n : 0;
  }

  bool erase_node_locked(const std::string& key) {
    auto victim = nodes_.find(key);
    if (victim == nodes_.end()) {
      return false;
    }

    for (const auto& e : victim->second.outgoing) {
      if (e.to != key) {
        drop_connections_locked(e.to, 1);
      }
    }
    nodes_.erase(victim);

    for (auto& kv : nodes_) {
      auto& out = kv.second.outgoing;
      const auto old_size = out.size();
      out.erase(std::remove_if(out.begin(), out.end(), [&](const Edge& e) { return e.to == key; }), out.end());
      if (out.size() != old_size) {
        drop_connections_locked(kv.first, old_size - out.size());
      }
    }
    return true;
  }

  bool evict_least_connected_locked() {
    auto victim = nodes_.end();
    for (auto it = nodes_.begin(); it != nodes_.end(); ++it) {
      if (victim == nodes_.end() || it->second.connections < victim->second.connections ||
          (it->second.connections == victim->second.connections && it->second.seq < victim->second.seq)) {
        victim = it;
      }
    }
    if (victim == nodes_.end()) {
      return false;
    }
    const std::string key = victim->first;
    erase_node_locked(key);
    metrics_.inc(kMetricEvictions);
    Logger::log(Logger::Level::kDebug, "relational: evicted '" + key + "'");
    return true;
  }

  bool save_locked() {
    std::string error;
    try {
      json root;
      root["version"] = 1;
      root["nodes"] = json::object();
      root["edges"] = json::object();
      for (const auto& kv : nodes_) {
        const Node& n = kv.second;
        root["nodes"][kv.first] = {{"value", n.value},
                                   {"createdAtMs", n.created_at_ms},
                                   {"lastAccessedMs", n.last_accessed_ms},
                                   {"accessCount", n.access_count},
                                   {"connections", n.connections},
                                   {"seq", n.seq}};
        json edges = json::array();
        for (const auto& e : n.outgoing) {
          edges.push_back({{"to", e.to}, {"type", e.type}, {"weight", e.weight}, {"createdAtMs", e.created_at_ms}});
        }
        root["edges"][kv.first] = std::move(edges);
      }
      root["last_saved"] = iso8601_from_ms(clock_());

      if (write_text_file_atomic(path_, root.dump(2), &error)) {
        return true;
      }
    } catch (const std::exception& e) {
      error = e.what();
    }
    metrics_.inc(kMetricPersistFailures);
    Logger::log(Logger::Level::kError, "relational: cannot save " + path_.string() + ": " + error);
    return false;
  }

  static std::optional<Edge> edge_from_json(const json& e, int64_t now) {
    if (!e.is_object()) {
      return std::nullopt;
    }
    auto to = e.find("to");
    if (to == e.end() || !to->is_string()) {
      return std::nullopt;
    }
    Edge edge{to->get<std::string>(), "", 1.0, now};
    if (auto type = e.find("type"); type != e.end()) {
      if (!type->is_string()) {
        return std::nullopt;
      }
      edge.type = type->get<std::string>();
    }
    if (auto weight = e.find("weight"); weight != e.end()) {
      if (!weight->is_number()) {
        return std::nullopt;
      }
      edge.weight = weight->get<double>();
    }
    if (auto created = e.find("createdAtMs"); created != e.end() && created->is_number_integer()) {
      edge.created_at_ms = created->get<int64_t>();
    }
    return edge;
  }

  void load() {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    nodes_.clear();

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
      if (!root.contains("nodes") || !root["nodes"].is_object()) {
        Logger::log(Logger::Level::kWarn, "relational: no nodes section in " + path_.string());
        return;
      }

      const int64_t now = clock_();
      for (auto it = root["nodes"].begin(); it != root["nodes"].end(); ++it) {
        const json& x = it.value();
        Node n;
        if (x.is_object() && x.contains("value")) {
          n.value = x["value"];
          n.created_at_ms = x.value("createdAtMs", now);
          n.last_accessed_ms = x.value("lastAccessedMs", n.created_at_ms);
          n.access_count = x.value("accessCount", uint64_t{0});
          n.seq = x.value("seq", uint64_t{0});
        } else {
          n.value = x;
          n.created_at_ms = now;
          n.last_accessed_ms = now;
        }
        next_seq_ = (std::max)(next_seq_, n.seq + 1);
        nodes_.emplace(it.key(), std::move(n));
      }

      std::size_t dropped = 0;
      if (root.contains("edges") && root["edges"].is_object()) {
        for (auto it = root["edges"].begin(); it != root["edges"].end(); ++it) {
          auto src = nodes_.find(it.key());
          if (!it.value().is_array()) {
            continue;
          }
          for (const auto& e : it.value()) {
            std::optional<Edge> edge = edge_from_json(e, now);
            if (!edge || src == nodes_.end() || nodes_.find(edge->to) == nodes_.end()) {
              dropped++;
              continue;
            }
            src->second.outgoing.push_back(std::move(*edge));
          }
        }
      }
      if (dropped > 0) {
        Logger::log(Logger::Level::kWarn,
                    "relational: dropped " + std::to_string(dropped) + " dangling or malformed edges from " +
                        path_.string());
      }

      // Counters are rebuilt from the surviving edges rather than trusted from disk.
      for (auto& kv : nodes_) {
        for (const auto& e : kv.second.outgoing) {
          kv.second.connections++;
          nodes_[e.to].connections++;
        }
      }

      while (nodes_.size() > max_nodes_ && evict_least_connected_locked()) {
      }
      Logger::log(Logger::Level::kInfo,
                  "relational: loaded " + std::to_string(nodes_.size()) + " nodes from " + path_.string());
    } catch (const std::exception& e) {
      nodes_.clear();
      next_seq_ = 0;
      Logger::log(Logger::Level::kWarn, "relational: ignoring unreadable " + path_.string() + ": " + e.what());
    }
  }

  const std::size_t max_nodes_;
  const fs::path path_;
  Clock clock_;

  mutable std::recursive_mutex mu_;
  std::unordered_map<std::string, Node> nodes_;
  uint64_t next_seq_{0};
};

}  // namespace tiermem
