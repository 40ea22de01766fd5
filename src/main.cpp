#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "tiermem/config.hpp"
#include "tiermem/memory_manager.hpp"

namespace {

using namespace tiermem;

void print_usage() {
  std::cout
      << "tiermem - multi-tier key/value memory engine\n\n"
      << "Usage:\n"
      << "  tiermem [--config PATH] init\n"
      << "  tiermem [--config PATH] stats [--json]\n"
      << "  tiermem [--config PATH] put --tier TIER --key KEY --value VALUE\n"
      << "  tiermem [--config PATH] get --tier TIER --key KEY [--default VALUE]\n"
      << "  tiermem [--config PATH] delete --tier TIER --key KEY\n"
      << "  tiermem [--config PATH] keys --tier TIER\n"
      << "  tiermem [--config PATH] clear [--tier TIER|all]\n"
      << "  tiermem [--config PATH] link --from KEY --to KEY --type TYPE [--weight W]\n"
      << "  tiermem [--config PATH] unlink --from KEY --to KEY [--type TYPE]\n"
      << "  tiermem [--config PATH] related --key KEY [--type TYPE]\n"
      << "  tiermem --version\n\n"
      << "Tiers: ephemeral, persistent, session, relational. Only persistent and\n"
      << "relational outlive a single invocation.\n";
}

bool has_flag(const std::vector<std::string>& args, const std::string& flag) {
  return std::find(args.begin(), args.end(), flag) != args.end();
}

std::string get_flag_value(const std::vector<std::string>& args, const std::string& flag,
                           const std::string& fallback = "") {
  for (std::size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == flag) {
      return args[i + 1];
    }
  }
  return fallback;
}

json parse_value(const std::string& raw) {
  if (json::accept(raw)) {
    return json::parse(raw);
  }
  return json(raw);
}

void print_value(const json& v) {
  if (v.is_string()) {
    std::cout << v.get<std::string>() << "\n";
  } else {
    std::cout << v.dump(2) << "\n";
  }
}

int run_init(const fs::path& config_path) {
  if (fs::exists(config_path)) {
    std::cout << "Config already exists: " << config_path.string() << "\n";
    return 0;
  }
  if (!save_default_config(config_path)) {
    std::cerr << "Failed to write config: " << config_path.string() << "\n";
    return 1;
  }
  std::cout << "Created config: " << config_path.string() << "\n";
  return 0;
}

int run_stats(MemoryManager& mm, const std::vector<std::string>& args) {
  const json stats = mm.get_stats();
  if (has_flag(args, "--json")) {
    std::cout << stats.dump(2) << "\n";
    return 0;
  }
  for (Tier t : kAllTiers) {
    const json& s = stats[tier_name(t)];
    std::cout << tier_name(t) << " (" << s.value("type", "") << "): " << s.value("keys", 0) << " keys\n";
  }
  std::cout << "persistence file: " << mm.persistent().path().string() << "\n";
  std::cout << "knowledge graph file: " << mm.relational().path().string() << "\n";
  return 0;
}

int run_put(MemoryManager& mm, const std::vector<std::string>& args) {
  const std::string tier = get_flag_value(args, "--tier", "persistent");
  const std::string key = get_flag_value(args, "--key");
  if (key.empty() || !has_flag(args, "--value")) {
    std::cerr << "Usage: tiermem put --tier TIER --key KEY --value VALUE\n";
    return 1;
  }
  const bool ok = mm.store(key, parse_value(get_flag_value(args, "--value")), tier);
  std::cout << (ok ? "Stored\n" : "Failed\n");
  return ok ? 0 : 1;
}

int run_get(MemoryManager& mm, const std::vector<std::string>& args) {
  const std::string tier = get_flag_value(args, "--tier", "persistent");
  const std::string key = get_flag_value(args, "--key");
  if (key.empty()) {
    std::cerr << "Usage: tiermem get --tier TIER --key KEY [--default VALUE]\n";
    return 1;
  }
  const json fallback = has_flag(args, "--default") ? parse_value(get_flag_value(args, "--default")) : json();
  const json v = mm.retrieve(key, fallback, tier);
  if (v.is_null() && fallback.is_null()) {
    std::cout << "Not found\n";
    return 1;
  }
  print_value(v);
  return 0;
}

int run_delete(MemoryManager& mm, const std::vector<std::string>& args) {
  const std::string tier = get_flag_value(args, "--tier", "persistent");
  const std::string key = get_flag_value(args, "--key");
  if (key.empty()) {
    std::cerr << "Usage: tiermem delete --tier TIER --key KEY\n";
    return 1;
  }
  const bool ok = mm.remove(key, tier);
  std::cout << (ok ? "Deleted\n" : "Not found\n");
  return ok ? 0 : 1;
}

int run_keys(MemoryManager& mm, const std::vector<std::string>& args) {
  const std::string tier = get_flag_value(args, "--tier", "persistent");
  if (!parse_tier(tier)) {
    std::cerr << "Unknown tier: " << tier << "\n";
    return 1;
  }
  auto keys = mm.list_keys(tier);
  std::sort(keys.begin(), keys.end());
  for (const auto& k : keys) {
    std::cout << k << "\n";
  }
  return 0;
}

int run_clear(MemoryManager& mm, const std::vector<std::string>& args) {
  const std::string tier = get_flag_value(args, "--tier", "all");
  const bool ok = mm.clear(tier);
  std::cout << (ok ? "Cleared\n" : "Failed\n");
  return ok ? 0 : 1;
}

int run_link(MemoryManager& mm, const std::vector<std::string>& args) {
  const std::string from = get_flag_value(args, "--from");
  const std::string to = get_flag_value(args, "--to");
  const std::string type = get_flag_value(args, "--type");
  if (from.empty() || to.empty() || type.empty()) {
    std::cerr << "Usage: tiermem link --from KEY --to KEY --type TYPE [--weight W]\n";
    return 1;
  }
  double weight = 1.0;
  try {
    weight = std::stod(get_flag_value(args, "--weight", "1.0"));
  } catch (const std::exception&) {
    std::cerr << "Invalid --weight\n";
    return 1;
  }
  const bool ok = mm.add_relationship(from, to, type, weight);
  std::cout << (ok ? "Linked\n" : "Failed (both nodes must exist)\n");
  return ok ? 0 : 1;
}

int run_unlink(MemoryManager& mm, const std::vector<std::string>& args) {
  const std::string from = get_flag_value(args, "--from");
  const std::string to = get_flag_value(args, "--to");
  if (from.empty() || to.empty()) {
    std::cerr << "Usage: tiermem unlink --from KEY --to KEY [--type TYPE]\n";
    return 1;
  }
  std::optional<std::string> type;
  if (has_flag(args, "--type")) {
    type = get_flag_value(args, "--type");
  }
  const std::size_t removed = mm.relational().remove_relationship(from, to, type);
  std::cout << "Removed " << removed << " edge(s)\n";
  return removed > 0 ? 0 : 1;
}

int run_related(MemoryManager& mm, const std::vector<std::string>& args) {
  const std::string key = get_flag_value(args, "--key");
  if (key.empty()) {
    std::cerr << "Usage: tiermem related --key KEY [--type TYPE]\n";
    return 1;
  }
  std::optional<std::string> type;
  if (has_flag(args, "--type")) {
    type = get_flag_value(args, "--type");
  }
  const auto related = mm.get_related(key, type);
  if (related.empty()) {
    std::cout << "No related nodes.\n";
    return 0;
  }
  for (const auto& r : related) {
    std::cout << r.node << "  " << r.type << "  " << r.weight << "\n";
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  {
    const char* v = std::getenv("TIERMEM_LOG_JSON");
    if (v && *v && std::string(v) != "0") {
      Logger::set_json(true);
    }
  }

  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(argc));
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  fs::path config_path = get_config_path();
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = expand_user_path(args[1]);
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.empty()) {
    print_usage();
    return 0;
  }

  const std::string command = args[0];
  const std::vector<std::string> sub(args.begin() + 1, args.end());

  if (command == "--version" || command == "-v") {
    std::cout << "tiermem v0.1.0\n";
    return 0;
  }
  if (command == "--help" || command == "-h" || command == "help") {
    print_usage();
    return 0;
  }
  if (command == "init") {
    return run_init(config_path);
  }

  const Config cfg = load_config(config_path);
  apply_logging_config(cfg.logging);
  MemoryManager mm(cfg.memory);

  if (command == "stats") {
    return run_stats(mm, sub);
  }
  if (command == "put") {
    return run_put(mm, sub);
  }
  if (command == "get") {
    return run_get(mm, sub);
  }
  if (command == "delete") {
    return run_delete(mm, sub);
  }
  if (command == "keys") {
    return run_keys(mm, sub);
  }
  if (command == "clear") {
    return run_clear(mm, sub);
  }
  if (command == "link") {
    return run_link(mm, sub);
  }
  if (command == "unlink") {
    return run_unlink(mm, sub);
  }
  if (command == "related") {
    return run_related(mm, sub);
  }

  print_usage();
  return 1;
}
