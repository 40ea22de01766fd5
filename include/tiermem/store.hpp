#pragma once

#include <optional>
#include <string>
#include <vector>

#include "tiermem/common.hpp"
#include "tiermem/metrics.hpp"

namespace tiermem {

enum class Tier { kEphemeral, kPersistent, kSession, kRelational };

inline constexpr Tier kAllTiers[] = {Tier::kEphemeral, Tier::kPersistent, Tier::kSession, Tier::kRelational};

inline const char* tier_name(Tier tier) {
  switch (tier) {
    case Tier::kEphemeral:
      return "ephemeral";
    case Tier::kPersistent:
      return "persistent";
    case Tier::kSession:
      return "session";
    case Tier::kRelational:
    default:
      return "relational";
  }
}

// Accepts the canonical tier names and the older short_term / long_term /
// episodic / semantic spellings.
inline std::optional<Tier> parse_tier(const std::string& name) {
  const std::string n = to_lower(trim(name));
  if (n == "ephemeral" || n == "short_term") {
    return Tier::kEphemeral;
  }
  if (n == "persistent" || n == "long_term") {
    return Tier::kPersistent;
  }
  if (n == "session" || n == "episodic") {
    return Tier::kSession;
  }
  if (n == "relational" || n == "semantic") {
    return Tier::kRelational;
  }
  return std::nullopt;
}

// Common contract of every memory tier. Implementations never throw: a
// false or default return is the only failure signal.
class Store {
 public:
  virtual ~Store() = default;

  virtual std::string type_name() const = 0;

  virtual bool put(const std::string& key, const json& value) = 0;
  virtual json get(const std::string& key, const json& fallback = nullptr) = 0;
  virtual bool remove(const std::string& key) = 0;
  virtual bool clear() = 0;
  virtual bool exists(const std::string& key) = 0;
  virtual std::vector<std::string> list_keys() = 0;

  const Metrics& metrics() const { return metrics_; }

 protected:
  Metrics metrics_;
};

}  // namespace tiermem
