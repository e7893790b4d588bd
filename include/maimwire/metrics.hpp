#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

#include "maimwire/common.hpp"

namespace maimwire {

namespace counter {
inline constexpr const char* kFramesOut = "frames.out";
inline constexpr const char* kFramesIn = "frames.in";
inline constexpr const char* kFramesMalformed = "frames.malformed";
inline constexpr const char* kOutboxDropped = "outbox.dropped";
inline constexpr const char* kClientReconnects = "client.reconnects";
inline constexpr const char* kServerAccepted = "server.accepted";
inline constexpr const char* kServerRejected = "server.rejected";
inline constexpr const char* kUnknownPlatform = "router.unknown_platform";
inline constexpr const char* kHandlerErrors = "handler.errors";
}  // namespace counter

// Process-wide counters; the CLI snapshots them to disk.
class Metrics {
 public:
  void inc(const std::string& key, uint64_t delta = 1) {
    std::lock_guard<std::mutex> lock(mu_);
    counters_[key] += delta;
  }

  uint64_t get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = counters_.find(key);
    return it == counters_.end() ? 0 : it->second;
  }

  json to_json() const {
    std::lock_guard<std::mutex> lock(mu_);
    json j = json::object();
    for (const auto& [key, value] : counters_) {
      j[key] = value;
    }
    j["updatedAt"] = now_iso8601();
    j["version"] = kVersion;
    return j;
  }

 private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, uint64_t> counters_;
};

inline Metrics& metrics() {
  static Metrics m;
  return m;
}

inline fs::path default_metrics_path() {
  return expand_user_path("~/.maimwire") / "state" / "metrics.json";
}

inline void write_metrics_snapshot(const fs::path& path = default_metrics_path()) {
  write_text_file(path, metrics().to_json().dump(2));
}

}  // namespace maimwire
