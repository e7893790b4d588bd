#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "maimwire/common.hpp"

namespace maimwire {

struct ConnectionOptions {
  int heartbeat_interval_ms{0};  // 0 disables pings
  int heartbeat_timeout_ms{10000};
  int drain_timeout_ms{2000};
  int write_timeout_ms{10000};
  int poll_interval_ms{20};
  int handshake_timeout_ms{5000};
  std::size_t outbox_capacity{1024};
};

struct BackoffConfig {
  int initial_ms{500};
  int max_ms{30000};
  double multiplier{2.0};
};

struct TargetConfig {
  std::string url;
  std::string token;

  bool operator==(const TargetConfig&) const = default;
};

struct RouteConfig {
  std::map<std::string, TargetConfig> route_config;
};

struct ServerConfig {
  std::string host{"0.0.0.0"};
  int port{18000};
  std::string path{"/ws"};
  std::vector<std::string> tokens;
};

struct LogConfig {
  std::string level{"info"};
  bool json{false};
};

struct Config {
  LogConfig log{};
  ServerConfig server{};
  RouteConfig routes{};
  ConnectionOptions connection{};
  BackoffConfig backoff{};
};

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

inline fs::path get_data_dir() {
  return expand_user_path("~/.maimwire");
}

inline fs::path get_config_path() {
  return get_data_dir() / "config.json";
}

// Accepts both {"qq": {...}} and the wrapped {"route_config": {"qq": {...}}} form.
inline RouteConfig route_config_from_json(const json& j) {
  RouteConfig out;
  if (!j.is_object()) {
    return out;
  }
  const json& table = (j.contains("route_config") && j["route_config"].is_object()) ? j["route_config"] : j;
  for (auto it = table.begin(); it != table.end(); ++it) {
    if (!it.value().is_object()) {
      continue;
    }
    TargetConfig target;
    target.url = resolve_env_ref(it.value().value("url", ""));
    if (it.value().contains("token") && it.value()["token"].is_string()) {
      target.token = resolve_env_ref(it.value()["token"].get<std::string>());
    }
    if (trim(target.url).empty()) {
      Logger::log(Logger::Level::kWarn, "Route for platform " + it.key() + " has no url; skipped");
      continue;
    }
    out.route_config[it.key()] = target;
  }
  return out;
}

inline json route_config_to_json(const RouteConfig& cfg) {
  json table = json::object();
  for (const auto& [platform, target] : cfg.route_config) {
    table[platform] = {{"url", target.url}, {"token", target.token}};
  }
  return json{{"route_config", table}};
}

inline json default_config_json() {
  return json{
      {"log", {{"level", "info"}, {"json", false}}},
      {"server", {{"host", "0.0.0.0"}, {"port", 18000}, {"path", "/ws"}, {"token", ""}}},
      {"routes", {{"qq", {{"url", "ws://127.0.0.1:18000/ws"}, {"token", ""}}}}},
      {"connection",
       {
           {"heartbeatIntervalMs", 0},
           {"heartbeatTimeoutMs", 10000},
           {"drainTimeoutMs", 2000},
           {"writeTimeoutMs", 10000},
           {"pollIntervalMs", 20},
           {"handshakeTimeoutMs", 5000},
           {"outboxCapacity", 1024},
       }},
      {"backoff", {{"initialMs", 500}, {"maxMs", 30000}, {"multiplier", 2.0}}}};
}

inline Config load_config(const fs::path& path = get_config_path()) {
  Config cfg{};
  const std::string raw = read_text_file(path);
  if (raw.empty()) {
    return cfg;
  }

  try {
    const json root = json::parse(raw);

    if (root.contains("log") && root["log"].is_object()) {
      const auto& log = root["log"];
      cfg.log.level = log.value("level", cfg.log.level);
      cfg.log.json = log.value("json", cfg.log.json);
    }

    if (root.contains("server") && root["server"].is_object()) {
      const auto& s = root["server"];
      cfg.server.host = s.value("host", cfg.server.host);
      cfg.server.port = s.value("port", cfg.server.port);
      cfg.server.path = s.value("path", cfg.server.path);
      const std::string token = resolve_env_ref(s.value("token", ""));
      if (!token.empty()) {
        cfg.server.tokens.push_back(token);
      }
      if (s.contains("tokens") && s["tokens"].is_array()) {
        for (const auto& item : s["tokens"]) {
          if (!item.is_string()) {
            continue;
          }
          const std::string t = resolve_env_ref(item.get<std::string>());
          if (!t.empty()) {
            cfg.server.tokens.push_back(t);
          }
        }
      }
    }

    if (root.contains("routes")) {
      cfg.routes = route_config_from_json(root["routes"]);
    }

    if (root.contains("connection") && root["connection"].is_object()) {
      const auto& c = root["connection"];
      cfg.connection.heartbeat_interval_ms = c.value("heartbeatIntervalMs", cfg.connection.heartbeat_interval_ms);
      cfg.connection.heartbeat_timeout_ms = c.value("heartbeatTimeoutMs", cfg.connection.heartbeat_timeout_ms);
      cfg.connection.drain_timeout_ms = c.value("drainTimeoutMs", cfg.connection.drain_timeout_ms);
      cfg.connection.write_timeout_ms = c.value("writeTimeoutMs", cfg.connection.write_timeout_ms);
      cfg.connection.poll_interval_ms = c.value("pollIntervalMs", cfg.connection.poll_interval_ms);
      cfg.connection.handshake_timeout_ms = c.value("handshakeTimeoutMs", cfg.connection.handshake_timeout_ms);
      cfg.connection.outbox_capacity = c.value("outboxCapacity", cfg.connection.outbox_capacity);
    }

    if (root.contains("backoff") && root["backoff"].is_object()) {
      const auto& b = root["backoff"];
      cfg.backoff.initial_ms = b.value("initialMs", cfg.backoff.initial_ms);
      cfg.backoff.max_ms = b.value("maxMs", cfg.backoff.max_ms);
      cfg.backoff.multiplier = b.value("multiplier", cfg.backoff.multiplier);
    }
  } catch (const std::exception& e) {
    Logger::log(Logger::Level::kWarn, std::string("Failed to parse config: ") + e.what());
  }

  return cfg;
}

inline bool save_default_config(const fs::path& path = get_config_path()) {
  return write_text_file(path, default_config_json().dump(2));
}

}  // namespace maimwire
