#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace tiermem {

using json = nlohmann::json;
namespace fs = std::filesystem;

// Milliseconds since the Unix epoch.
using Clock = std::function<int64_t()>;

inline std::string trim(const std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

inline std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

inline std::string home_dir() {
#ifdef _WIN32
  const char* p = std::getenv("USERPROFILE");
  if (p && *p) {
    return std::string(p);
  }
  const char* drive = std::getenv("HOMEDRIVE");
  const char* path = std::getenv("HOMEPATH");
  if (drive && *drive && path && *path) {
    return std::string(drive) + std::string(path);
  }
#else
  const char* p = std::getenv("HOME");
#endif
  return p ? std::string(p) : std::string(".");
}

inline fs::path expand_user_path(const std::string& p) {
  if (!p.empty() && p[0] == '~') {
    std::string suffix = p.substr(1);
    while (!suffix.empty() && (suffix.front() == '/' || suffix.front() == '\\')) {
      suffix.erase(suffix.begin());
    }
    return fs::path(home_dir()) / suffix;
  }
  return fs::path(p);
}

inline std::string read_text_file(const fs::path& p) {
  std::ifstream in(p, std::ios::in | std::ios::binary);
  if (!in) {
    return "";
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

inline bool write_text_file(const fs::path& p, const std::string& content) {
  std::error_code ec;
  if (p.has_parent_path()) {
    fs::create_directories(p.parent_path(), ec);
  }
  std::ofstream out(p, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out) {
    return false;
  }
  out << content;
  return true;
}

inline std::string random_id(std::size_t n = 8) {
  static constexpr char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<std::size_t> d(0, sizeof(alphabet) - 2);

  std::string out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(alphabet[d(rng)]);
  }
  return out;
}

// Writes to a sibling temp file and renames it over `p`, so a reader sees
// either the old content or the new content, never a partial file.
inline bool write_text_file_atomic(const fs::path& p, const std::string& content, std::string* error = nullptr) {
  auto fail = [&](const std::string& msg) {
    if (error) {
      *error = msg;
    }
    return false;
  };

  std::error_code ec;
  if (p.has_parent_path()) {
    fs::create_directories(p.parent_path(), ec);
    if (ec) {
      return fail("cannot create directory " + p.parent_path().string() + ": " + ec.message());
    }
  }

  fs::path tmp = p;
  tmp += ".tmp-" + random_id(8);
  {
    std::ofstream out(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) {
      return fail("cannot open " + tmp.string());
    }
    out << content;
    out.flush();
    if (!out) {
      out.close();
      fs::remove(tmp, ec);
      return fail("short write to " + tmp.string());
    }
  }

  fs::rename(tmp, p, ec);
  if (ec) {
    const std::string msg = "cannot rename " + tmp.string() + ": " + ec.message();
    std::error_code ignored;
    fs::remove(tmp, ignored);
    return fail(msg);
  }
  return true;
}

// False when `j` has no JSON text form, which happens for strings that are
// not valid UTF-8.
inline bool json_encodable(const json& j, std::string* error = nullptr) {
  try {
    (void)j.dump();
    return true;
  } catch (const json::type_error& e) {
    if (error) {
      *error = e.what();
    }
    return false;
  }
}

inline int64_t now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

inline std::string iso8601_from_ms(int64_t ms) {
  const std::time_t t = static_cast<std::time_t>(ms / 1000);
  std::tm tm{};
#ifdef _WIN32
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  return ss.str();
}

inline std::string now_iso8601() { return iso8601_from_ms(now_ms()); }

class Logger {
 public:
  enum class Level { kInfo, kWarn, kError, kDebug };

  static void set_json(bool enabled) { json_mode().store(enabled); }
  static void set_min_level(Level level) { min_level().store(level_rank(level)); }

  static std::optional<Level> parse_level(const std::string& name) {
    const std::string n = to_lower(trim(name));
    if (n == "debug") {
      return Level::kDebug;
    }
    if (n == "info") {
      return Level::kInfo;
    }
    if (n == "warn" || n == "warning") {
      return Level::kWarn;
    }
    if (n == "error") {
      return Level::kError;
    }
    return std::nullopt;
  }

  static bool enabled(Level level) { return level_rank(level) >= min_level().load(); }

  static void log(Level level, const std::string& msg) {
    if (!enabled(level)) {
      return;
    }
    static std::mutex mu;
    std::lock_guard<std::mutex> lock(mu);
    if (json_mode().load()) {
      json j;
      j["time"] = now_iso8601();
      j["level"] = level_name(level);
      j["msg"] = msg;
      std::cerr << j.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    } else {
      std::cerr << "[" << level_name(level) << "] " << msg << "\n";
    }
  }

 private:
  static int level_rank(Level level) {
    switch (level) {
      case Level::kDebug:
        return 0;
      case Level::kInfo:
        return 1;
      case Level::kWarn:
        return 2;
      case Level::kError:
      default:
        return 3;
    }
  }

  static std::atomic<bool>& json_mode() {
    static std::atomic<bool> v{false};
    return v;
  }

  static std::atomic<int>& min_level() {
    static std::atomic<int> v{1};
    return v;
  }

  static const char* level_name(Level level) {
    switch (level) {
      case Level::kInfo:
        return "INFO";
      case Level::kWarn:
        return "WARN";
      case Level::kError:
        return "ERROR";
      case Level::kDebug:
      default:
        return "DEBUG";
    }
  }
};

}  // namespace tiermem
