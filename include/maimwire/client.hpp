#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include "maimwire/backoff.hpp"
#include "maimwire/common.hpp"
#include "maimwire/config.hpp"
#include "maimwire/connection.hpp"
#include "maimwire/curl_transport.hpp"
#include "maimwire/errors.hpp"
#include "maimwire/message.hpp"
#include "maimwire/metrics.hpp"

namespace maimwire {

// One dialing connection to a fixed target, redialed with exponential backoff until stop().
class ClientEndpoint {
 public:
  using MessageHandler = Connection::MessageHandler;
  using RetryObserver = std::function<void(int attempt, std::chrono::milliseconds delay)>;

  ClientEndpoint(std::string platform, TargetConfig target, ConnectionOptions options = {},
                 BackoffConfig backoff = {}, TransportFactory factory = {})
      : platform_(std::move(platform)),
        target_(std::move(target)),
        options_(options),
        backoff_(backoff),
        factory_(std::move(factory)),
        conn_("client-" + platform_, ConnectionRole::kClient, options) {
    if (!factory_) {
      factory_ = [this]() -> std::unique_ptr<Transport> {
        return std::make_unique<CurlTransport>(target_.url, target_.token, platform_, options_.handshake_timeout_ms);
      };
    }
  }

  ~ClientEndpoint() { stop(); }

  ClientEndpoint(const ClientEndpoint&) = delete;
  ClientEndpoint& operator=(const ClientEndpoint&) = delete;

  void start() {
    if (stopped_.load() || running_.exchange(true)) {
      return;
    }
    worker_ = std::thread([this]() { supervise(); });
    Logger::log(Logger::Level::kInfo, "Client for " + platform_ + " started (" + target_.url + ")");
  }

  // Terminal: a stopped endpoint cannot be started again. When called from this endpoint's
  // own message handler the supervisor is left to unwind; a later stop() or the destructor
  // on another thread joins it.
  void stop() {
    stopped_.store(true);
    if (running_.exchange(false)) {
      conn_.close();
      {
        std::lock_guard<std::mutex> lock(wait_mu_);
      }
      wait_cv_.notify_all();
      Logger::log(Logger::Level::kInfo, "Client for " + platform_ + " stopped");
    }
    if (worker_.joinable() && !on_worker_thread()) {
      worker_.join();
    }
  }

  bool on_worker_thread() const { return worker_.get_id() == std::this_thread::get_id(); }

  // Never blocks. Messages queued while the socket is down go out after the next dial.
  bool send(const Message& msg) {
    if (!running_.load()) {
      return false;
    }
    try {
      conn_.send(msg);
      return true;
    } catch (const ConnectionClosed& e) {
      Logger::log(Logger::Level::kWarn, std::string("Client send refused: ") + e.what());
      return false;
    }
  }

  void set_message_handler(MessageHandler handler) { conn_.set_message_handler(std::move(handler)); }

  void set_retry_observer(RetryObserver observer) {
    std::lock_guard<std::mutex> lock(wait_mu_);
    retry_observer_ = std::move(observer);
  }

  ConnectionState state() const { return conn_.state(); }
  bool connected() const { return conn_.state() == ConnectionState::kOpen; }
  bool running() const { return running_.load(); }

  const std::string& platform() const { return platform_; }
  const TargetConfig& target() const { return target_; }
  Connection& connection() { return conn_; }

 private:
  void supervise() {
    ExponentialBackoff backoff(backoff_);
    while (running_.load()) {
      std::unique_ptr<Transport> transport;
      try {
        transport = factory_();
      } catch (const std::exception& e) {
        Logger::log(Logger::Level::kError, "Client for " + platform_ + " could not create transport: " + e.what());
      }

      Connection::SessionEnd end = Connection::SessionEnd::kDialFailed;
      if (transport) {
        end = conn_.run_session(*transport);
      }
      if (end == Connection::SessionEnd::kStopped || !running_.load()) {
        break;
      }
      if (end == Connection::SessionEnd::kLost) {
        backoff.reset();
      }

      const auto delay = backoff.next();
      metrics().inc(counter::kClientReconnects);
      Logger::log(Logger::Level::kInfo, "Client for " + platform_ + " retrying in " +
                                            std::to_string(delay.count()) + "ms (attempt " +
                                            std::to_string(backoff.attempts()) + ")");

      std::unique_lock<std::mutex> lock(wait_mu_);
      if (retry_observer_) {
        try {
          retry_observer_(backoff.attempts(), delay);
        } catch (const std::exception& e) {
          Logger::log(Logger::Level::kError, std::string("Retry observer failed: ") + e.what());
        }
      }
      wait_cv_.wait_for(lock, delay, [this]() { return !running_.load(); });
    }
    conn_.finish();
  }

  std::string platform_;
  TargetConfig target_;
  ConnectionOptions options_;
  BackoffConfig backoff_;
  TransportFactory factory_;
  Connection conn_;

  std::atomic<bool> running_{false};
  std::atomic<bool> stopped_{false};
  std::thread worker_;

  std::mutex wait_mu_;
  std::condition_variable wait_cv_;
  RetryObserver retry_observer_;
};

}  // namespace maimwire
