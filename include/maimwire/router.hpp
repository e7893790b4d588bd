#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "maimwire/client.hpp"
#include "maimwire/common.hpp"
#include "maimwire/config.hpp"
#include "maimwire/errors.hpp"
#include "maimwire/message.hpp"
#include "maimwire/metrics.hpp"

namespace maimwire {

// Platform name -> dialing endpoint. Outbound messages are routed by info.platform; inbound
// messages from every endpoint fan out to the registered handlers.
class Router {
 public:
  using Handler = std::function<void(const Message&)>;
  using ClientFactory =
      std::function<std::unique_ptr<ClientEndpoint>(const std::string& platform, const TargetConfig& target)>;

  explicit Router(RouteConfig config, ConnectionOptions options = {}, BackoffConfig backoff = {},
                  ClientFactory factory = {})
      : config_(std::move(config)), options_(options), backoff_(backoff), factory_(std::move(factory)) {
    if (!factory_) {
      factory_ = [this](const std::string& platform, const TargetConfig& target) {
        return std::make_unique<ClientEndpoint>(platform, target, options_, backoff_);
      };
    }
  }

  ~Router() { stop(); }

  Router(const Router&) = delete;
  Router& operator=(const Router&) = delete;

  void start() {
    if (running_.exchange(true)) {
      return;
    }
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& [platform, target] : config_.route_config) {
      clients_[platform] = make_client(platform, target);
    }
    Logger::log(Logger::Level::kInfo, "Router started with " + std::to_string(clients_.size()) + " platform(s)");
  }

  // Idempotent. A stopped router may be started again with fresh endpoints.
  // Safe to call from a message handler.
  void stop() {
    if (!running_.exchange(false)) {
      reap_retired();
      return;
    }
    std::map<std::string, std::shared_ptr<ClientEndpoint>> clients;
    {
      std::lock_guard<std::mutex> lock(mu_);
      clients.swap(clients_);
    }
    for (auto& [platform, client] : clients) {
      retire(std::move(client));
    }
    reap_retired();
    Logger::log(Logger::Level::kInfo, "Router stopped");
  }

  bool running() const { return running_.load(); }

  // Throws UnknownPlatform when info.platform has no route. Returns false when the router is
  // not started or the endpoint refused the message.
  bool send(const Message& msg) {
    std::shared_ptr<ClientEndpoint> client;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (!config_.route_config.contains(msg.info.platform)) {
        metrics().inc(counter::kUnknownPlatform);
        throw UnknownPlatform(msg.info.platform);
      }
      const auto it = clients_.find(msg.info.platform);
      if (it != clients_.end()) {
        client = it->second;
      }
    }
    if (!client) {
      Logger::log(Logger::Level::kWarn, "Router not started; message for " + msg.info.platform + " not sent");
      return false;
    }
    return client->send(msg);
  }

  void register_handler(Handler handler) {
    std::lock_guard<std::mutex> lock(handlers_mu_);
    handlers_.push_back(std::move(handler));
  }

  // Adds or replaces a route; a running router dials it immediately.
  void add_platform(const std::string& platform, const TargetConfig& target) {
    std::shared_ptr<ClientEndpoint> old;
    {
      std::lock_guard<std::mutex> lock(mu_);
      config_.route_config[platform] = target;
      if (running_.load()) {
        auto& slot = clients_[platform];
        old = std::move(slot);
        slot = make_client(platform, target);
      }
    }
    if (old) {
      retire(std::move(old));
      reap_retired();
    }
    Logger::log(Logger::Level::kInfo, "Route added: " + platform + " -> " + target.url);
  }

  void remove_platform(const std::string& platform) {
    std::shared_ptr<ClientEndpoint> old;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (config_.route_config.erase(platform) == 0) {
        return;
      }
      const auto it = clients_.find(platform);
      if (it != clients_.end()) {
        old = std::move(it->second);
        clients_.erase(it);
      }
    }
    if (old) {
      retire(std::move(old));
      reap_retired();
    }
    Logger::log(Logger::Level::kInfo, "Route removed: " + platform);
  }

  // Applies a new route table, touching only platforms that were added, removed or changed.
  void update_config(const RouteConfig& next) {
    const RouteConfig current = config();
    for (const auto& [platform, target] : current.route_config) {
      if (!next.route_config.contains(platform)) {
        remove_platform(platform);
      }
    }
    for (const auto& [platform, target] : next.route_config) {
      const auto it = current.route_config.find(platform);
      if (it == current.route_config.end() || !(it->second == target)) {
        add_platform(platform, target);
      }
    }
  }

  std::optional<std::string> target_url(const Message& msg) const {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = config_.route_config.find(msg.info.platform);
    if (it == config_.route_config.end()) {
      return std::nullopt;
    }
    return it->second.url;
  }

  std::vector<std::string> platforms() const {
    std::vector<std::string> out;
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& [platform, target] : config_.route_config) {
      out.push_back(platform);
    }
    return out;
  }

  bool connected(const std::string& platform) const {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = clients_.find(platform);
    return it != clients_.end() && it->second->connected();
  }

  RouteConfig config() const {
    std::lock_guard<std::mutex> lock(mu_);
    return config_;
  }

 private:
  std::shared_ptr<ClientEndpoint> make_client(const std::string& platform, const TargetConfig& target) {
    std::shared_ptr<ClientEndpoint> client = factory_(platform, target);
    client->set_message_handler([this](const Message& msg) { dispatch(msg); });
    client->start();
    return client;
  }

  // Stops an endpoint without destroying it; the last reference must not be dropped on the
  // endpoint's own supervisor thread.
  void retire(std::shared_ptr<ClientEndpoint> client) {
    client->stop();
    std::lock_guard<std::mutex> lock(mu_);
    retired_.push_back(std::move(client));
  }

  // Releases retired endpoints, except one whose supervisor is the calling thread.
  void reap_retired() {
    std::vector<std::shared_ptr<ClientEndpoint>> done;
    {
      std::lock_guard<std::mutex> lock(mu_);
      std::vector<std::shared_ptr<ClientEndpoint>> keep;
      for (auto& client : retired_) {
        (client->on_worker_thread() ? keep : done).push_back(std::move(client));
      }
      retired_.swap(keep);
    }
    for (auto& client : done) {
      client->stop();
    }
  }

  void dispatch(const Message& msg) {
    std::vector<Handler> handlers;
    {
      std::lock_guard<std::mutex> lock(handlers_mu_);
      handlers = handlers_;
    }
    for (const auto& h : handlers) {
      try {
        h(msg);
      } catch (const std::exception& e) {
        metrics().inc(counter::kHandlerErrors);
        Logger::log(Logger::Level::kError, "Router handler failed for " + msg.info.platform + ": " + e.what());
      }
    }
  }

  RouteConfig config_;
  ConnectionOptions options_;
  BackoffConfig backoff_;
  ClientFactory factory_;

  std::atomic<bool> running_{false};
  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<ClientEndpoint>> clients_;
  std::vector<std::shared_ptr<ClientEndpoint>> retired_;

  std::mutex handlers_mu_;
  std::vector<Handler> handlers_;
};

}  // namespace maimwire
