#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "maimwire/client.hpp"
#include "maimwire/config.hpp"
#include "maimwire/message.hpp"
#include "maimwire/metrics.hpp"
#include "maimwire/router.hpp"
#include "maimwire/server.hpp"

namespace {

using namespace maimwire;

std::mutex g_print_mu;

void print_usage() {
  std::cout
      << "maimwire - WebSocket message transport for chat-platform adapters\n\n"
      << "Usage:\n"
      << "  maimwire serve [--config PATH] [--host HOST] [--port PORT] [--token TOKEN] [--relay]\n"
      << "  maimwire route [--config PATH]\n"
      << "  maimwire send --url URL --platform PLATFORM --text TEXT [--user USER_ID] [--token TOKEN]\n"
      << "  maimwire config init [--config PATH] [--force]\n"
      << "  maimwire metrics [--json]\n"
      << "  maimwire --version\n";
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

int get_int_flag_value(const std::vector<std::string>& args, const std::string& flag, int fallback, int min_value,
                       int max_value) {
  const std::string raw = trim(get_flag_value(args, flag, std::to_string(fallback)));
  try {
    const int v = std::stoi(raw);
    return std::clamp(v, min_value, max_value);
  } catch (const std::exception&) {
    return fallback;
  }
}

fs::path config_path_from(const std::vector<std::string>& args) {
  const std::string p = trim(get_flag_value(args, "--config"));
  return p.empty() ? get_config_path() : expand_user_path(p);
}

void apply_log_config(const LogConfig& log) {
  Logger::set_min_level(Logger::parse_level(log.level));
  if (log.json) {
    Logger::set_json(true);
  }
  const char* level = std::getenv("MAIMWIRE_LOG_LEVEL");
  if (level && *level) {
    Logger::set_min_level(Logger::parse_level(level));
  }
}

void print_inbound(const Message& msg, const std::string& via) {
  std::string who = to_string(msg.info.user_info.user_id);
  if (msg.info.user_info.nickname) {
    who = *msg.info.user_info.nickname + "(" + who + ")";
  }
  std::string where;
  if (msg.info.group_info) {
    where = " in " + to_string(msg.info.group_info->group_id);
  }
  std::lock_guard<std::mutex> lock(g_print_mu);
  std::cout << "[" << msg.info.platform << "] " << who << where << " via " << via << ": " << plain_text(msg.content)
            << "\n"
            << std::flush;
}

// Flushes the counters every few seconds while a long-running command is up.
class MetricsFlusher {
 public:
  MetricsFlusher()
      : worker_([this]() {
          while (running_.load()) {
            write_metrics_snapshot();
            for (int i = 0; running_.load() && i < 50; ++i) {
              std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
          }
        }) {}

  ~MetricsFlusher() {
    running_.store(false);
    if (worker_.joinable()) {
      worker_.join();
    }
    write_metrics_snapshot();
  }

 private:
  std::atomic<bool> running_{true};
  std::thread worker_;
};

int run_serve(const std::vector<std::string>& args) {
  Config cfg = load_config(config_path_from(args));
  apply_log_config(cfg.log);

  cfg.server.host = trim(get_flag_value(args, "--host", cfg.server.host));
  cfg.server.port = get_int_flag_value(args, "--port", cfg.server.port, 0, 65535);
  const std::string token = resolve_env_ref(trim(get_flag_value(args, "--token")));
  if (!token.empty()) {
    cfg.server.tokens.push_back(token);
  }
  const bool relay = has_flag(args, "--relay");

  ServerEndpoint server(cfg.server, cfg.connection);
  server.register_handler([](const Message& msg, const std::string& connection_id) { print_inbound(msg, connection_id); });
  if (relay) {
    server.register_handler([&server](const Message& msg, const std::string&) { server.send_message(msg); });
  }

  try {
    server.start();
  } catch (const TransportError& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  MetricsFlusher flusher;
  std::cout << "maimwire server on ws://" << cfg.server.host << ":" << server.port() << cfg.server.path
            << (relay ? " (relaying by platform)" : "") << ". Press Enter to stop.\n";
  std::string ignored;
  std::getline(std::cin, ignored);

  server.stop();
  return 0;
}

int run_route(const std::vector<std::string>& args) {
  const Config cfg = load_config(config_path_from(args));
  apply_log_config(cfg.log);
  if (cfg.routes.route_config.empty()) {
    std::cerr << "No routes configured. Run `maimwire config init` and edit the routes section.\n";
    return 1;
  }

  Router router(cfg.routes, cfg.connection, cfg.backoff);
  router.register_handler([](const Message& msg) { print_inbound(msg, "router"); });
  router.start();

  MetricsFlusher flusher;
  std::cout << "Routing platforms:";
  for (const auto& p : router.platforms()) {
    std::cout << " " << p;
  }
  std::cout << "\nSend one JSON message per line; an empty line stops.\n";

  std::string line;
  while (std::getline(std::cin, line)) {
    if (trim(line).empty()) {
      break;
    }
    try {
      const Message msg = decode(line);
      if (!router.send(msg)) {
        std::cerr << "Message for " << msg.info.platform << " was not queued\n";
      }
    } catch (const MalformedMessage& e) {
      std::cerr << e.what() << "\n";
    } catch (const UnknownPlatform& e) {
      std::cerr << e.what() << "\n";
    }
  }

  router.stop();
  return 0;
}

int run_send(const std::vector<std::string>& args) {
  const std::string url = trim(get_flag_value(args, "--url"));
  const std::string platform = trim(get_flag_value(args, "--platform"));
  const std::string text = get_flag_value(args, "--text");
  if (url.empty() || platform.empty() || trim(text).empty()) {
    std::cerr << "Usage: maimwire send --url URL --platform PLATFORM --text TEXT [--user USER_ID] [--token TOKEN]\n";
    return 1;
  }

  const Config cfg = load_config(config_path_from(args));
  apply_log_config(cfg.log);

  TargetConfig target;
  target.url = url;
  target.token = resolve_env_ref(trim(get_flag_value(args, "--token")));
  const std::string user = trim(get_flag_value(args, "--user", "maimwire"));

  Message msg = make_message(platform, user, Seg::text(text));
  msg.info.message_id = random_id(12);
  msg.info.format_info = FormatInfo{collect_kinds(msg.content), {"text"}};

  ClientEndpoint client(platform, target, cfg.connection, cfg.backoff);
  client.start();
  client.send(msg);

  const auto wait = std::chrono::milliseconds(cfg.connection.handshake_timeout_ms);
  const bool opened = client.connection().wait_for_state(ConnectionState::kOpen, wait);
  if (opened) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(cfg.connection.drain_timeout_ms);
    while (client.connection().pending() > 0 && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }
  const bool delivered = opened && client.connection().pending() == 0;
  client.stop();
  write_metrics_snapshot();

  if (!delivered) {
    std::cerr << "Could not deliver to " << url << "\n";
    return 1;
  }
  std::cout << "Sent to " << url << "\n";
  return 0;
}

int run_config(const std::vector<std::string>& args) {
  if (args.size() < 2 || args[1] != "init") {
    std::cerr << "Usage: maimwire config init [--config PATH] [--force]\n";
    return 1;
  }
  const fs::path path = config_path_from(args);
  if (fs::exists(path) && !has_flag(args, "--force")) {
    std::cout << "Config already exists at " << path.string() << " (use --force to overwrite)\n";
    return 0;
  }
  if (!save_default_config(path)) {
    std::cerr << "Failed to write " << path.string() << "\n";
    return 1;
  }
  std::cout << "Wrote " << path.string() << "\n";
  return 0;
}

int run_metrics(const std::vector<std::string>& args) {
  const bool json_out = has_flag(args, "--json");
  const std::string raw = read_text_file(default_metrics_path());
  if (json_out) {
    std::cout << (trim(raw).empty() ? "{}" : raw) << "\n";
    return 0;
  }
  if (trim(raw).empty()) {
    std::cout << "(no metrics snapshot yet)\n";
    return 0;
  }
  try {
    const json snapshot = json::parse(raw);
    for (auto it = snapshot.begin(); it != snapshot.end(); ++it) {
      std::cout << it.key() << ": " << (it.value().is_string() ? it.value().get<std::string>() : it.value().dump())
                << "\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "Unreadable metrics snapshot: " << e.what() << "\n";
    return 1;
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  {
    const char* v = std::getenv("MAIMWIRE_LOG_JSON");
    if (v && *v && std::string(v) != "0") {
      Logger::set_json(true);
    }
  }

  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  if (args.size() <= 1) {
    print_usage();
    return 0;
  }

  const std::string command = args[1];

  if (command == "--version" || command == "-v") {
    std::cout << "maimwire v" << kVersion << "\n";
    return 0;
  }

  if (command == "serve") {
    std::vector<std::string> sub(args.begin() + 2, args.end());
    return run_serve(sub);
  }
  if (command == "route") {
    std::vector<std::string> sub(args.begin() + 2, args.end());
    return run_route(sub);
  }
  if (command == "send") {
    std::vector<std::string> sub(args.begin() + 2, args.end());
    return run_send(sub);
  }
  if (command == "config") {
    std::vector<std::string> sub(args.begin() + 1, args.end());
    return run_config(sub);
  }
  if (command == "metrics") {
    std::vector<std::string> sub(args.begin() + 2, args.end());
    return run_metrics(sub);
  }

  print_usage();
  return 1;
}
