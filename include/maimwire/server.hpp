#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio.hpp>

#include "maimwire/beast_transport.hpp"
#include "maimwire/common.hpp"
#include "maimwire/config.hpp"
#include "maimwire/connection.hpp"
#include "maimwire/errors.hpp"
#include "maimwire/message.hpp"
#include "maimwire/metrics.hpp"

namespace maimwire {

// Accepts WebSocket peers on one path. Every accepted socket gets its own Connection and
// session thread; only connections in OPEN are visible to the send paths.
class ServerEndpoint {
 public:
  using Handler = std::function<void(const Message&, const std::string& connection_id)>;

  explicit ServerEndpoint(ServerConfig config, ConnectionOptions options = {})
      : config_(std::move(config)), options_(options) {
    for (const auto& t : config_.tokens) {
      const std::string token = trim(t);
      if (!token.empty()) {
        tokens_.insert(token);
      }
    }
    auth_enabled_ = !tokens_.empty();
  }

  ~ServerEndpoint() { stop(); }

  ServerEndpoint(const ServerEndpoint&) = delete;
  ServerEndpoint& operator=(const ServerEndpoint&) = delete;

  // Binds and starts the accept thread. Throws TransportError when the address is unusable.
  void start() {
    if (running_.exchange(true)) {
      return;
    }
    try {
      tcp::resolver resolver(ioc_);
      const auto results = resolver.resolve(config_.host, std::to_string(config_.port));
      if (results.empty()) {
        throw TransportError("cannot resolve " + config_.host);
      }
      const tcp::endpoint endpoint = results.begin()->endpoint();
      acceptor_.open(endpoint.protocol());
      acceptor_.set_option(net::socket_base::reuse_address(true));
      acceptor_.bind(endpoint);
      acceptor_.listen(net::socket_base::max_listen_connections);
      port_.store(acceptor_.local_endpoint().port());
    } catch (const boost::system::system_error& e) {
      running_.store(false);
      beast::error_code ignored;
      acceptor_.close(ignored);
      throw TransportError("cannot listen on " + config_.host + ":" + std::to_string(config_.port) + ": " +
                           e.what());
    } catch (const TransportError&) {
      running_.store(false);
      throw;
    }

    accept_thread_ = std::thread([this]() { accept_loop(); });
    Logger::log(Logger::Level::kInfo, "Server listening on ws://" + config_.host + ":" + std::to_string(port()) +
                                          config_.path + (auth_enabled_ ? " (token required)" : ""));
  }

  // Idempotent. Closes every connection, draining each within the drain timeout. When called
  // from a handler, the calling session is closed but kept until a later stop() or the
  // destructor joins it from another thread.
  void stop() {
    const bool was_listening = running_.exchange(false);
    if (was_listening) {
      if (accept_thread_.joinable()) {
        accept_thread_.join();
      }
      beast::error_code ignored;
      acceptor_.close(ignored);
    }

    std::vector<std::unique_ptr<Session>> sessions;
    {
      std::lock_guard<std::mutex> lock(sessions_mu_);
      sessions.swap(sessions_);
    }
    for (auto& s : sessions) {
      s->conn->close();
    }
    for (auto& s : sessions) {
      if (s->on_worker_thread()) {
        std::lock_guard<std::mutex> lock(sessions_mu_);
        sessions_.push_back(std::move(s));
      } else if (s->worker.joinable()) {
        s->worker.join();
      }
    }
    {
      std::lock_guard<std::mutex> lock(live_mu_);
      live_.clear();
    }
    if (was_listening || !sessions.empty()) {
      Logger::log(Logger::Level::kInfo, "Server stopped");
    }
  }

  bool running() const { return running_.load(); }
  int port() const { return port_.load(); }

  void register_handler(Handler handler) {
    std::lock_guard<std::mutex> lock(handlers_mu_);
    handlers_.push_back(std::move(handler));
  }

  // Returns the number of connections that queued the message.
  std::size_t broadcast(const Message& msg) {
    std::size_t delivered = 0;
    for (const auto& [id, entry] : live_snapshot()) {
      try {
        entry.conn->send(msg);
        ++delivered;
      } catch (const std::exception& e) {
        Logger::log(Logger::Level::kWarn, "Broadcast skipped " + id + ": " + e.what());
      }
    }
    return delivered;
  }

  void send_to(const std::string& connection_id, const Message& msg) {
    std::shared_ptr<Connection> conn;
    {
      std::lock_guard<std::mutex> lock(live_mu_);
      const auto it = live_.find(connection_id);
      if (it != live_.end()) {
        conn = it->second.conn;
      }
    }
    if (!conn) {
      throw NoSuchConnection(connection_id);
    }
    try {
      conn->send(msg);
    } catch (const ConnectionClosed&) {
      throw NoSuchConnection(connection_id);
    }
  }

  // Sends to every live connection that announced `platform` at handshake.
  bool send_to_platform(const std::string& platform, const Message& msg) {
    bool any = false;
    for (const auto& [id, entry] : live_snapshot()) {
      if (entry.platform != platform) {
        continue;
      }
      try {
        entry.conn->send(msg);
        any = true;
      } catch (const std::exception& e) {
        Logger::log(Logger::Level::kWarn, "Send to " + id + " skipped: " + e.what());
      }
    }
    if (!any) {
      Logger::log(Logger::Level::kWarn, "No live connection for platform " + platform);
    }
    return any;
  }

  bool send_message(const Message& msg) { return send_to_platform(msg.info.platform, msg); }

  void add_valid_token(const std::string& token) {
    const std::string t = trim(token);
    if (t.empty()) {
      return;
    }
    std::lock_guard<std::mutex> lock(tokens_mu_);
    tokens_.insert(t);
  }

  void remove_valid_token(const std::string& token) {
    std::lock_guard<std::mutex> lock(tokens_mu_);
    tokens_.erase(trim(token));
  }

  bool verify_token(const std::string& token) const {
    if (!auth_enabled_) {
      return true;
    }
    std::lock_guard<std::mutex> lock(tokens_mu_);
    return !token.empty() && tokens_.contains(token);
  }

  std::vector<std::string> connection_ids() const {
    std::vector<std::string> out;
    std::lock_guard<std::mutex> lock(live_mu_);
    out.reserve(live_.size());
    for (const auto& [id, entry] : live_) {
      out.push_back(id);
    }
    return out;
  }

  std::size_t connection_count() const {
    std::lock_guard<std::mutex> lock(live_mu_);
    return live_.size();
  }

  // Runs a session over an already accepted transport and returns the connection id. The id
  // becomes visible to send paths once the handshake completes.
  std::string adopt(std::unique_ptr<Transport> transport) {
    reap_finished();

    auto session = std::make_unique<Session>();
    const std::string id = "conn-" + random_id(10);
    session->conn = std::make_shared<Connection>(id, ConnectionRole::kServer, options_);
    session->transport = std::move(transport);

    Transport* raw = session->transport.get();
    std::weak_ptr<Connection> weak = session->conn;
    session->conn->set_message_handler([this, id](const Message& msg) { dispatch(msg, id); });
    session->conn->set_state_listener([this, id, raw, weak](ConnectionState s) {
      if (s == ConnectionState::kOpen) {
        auto conn = weak.lock();
        if (!conn) {
          return;
        }
        const std::string platform = raw->peer_platform().empty() ? "default" : raw->peer_platform();
        {
          std::lock_guard<std::mutex> lock(live_mu_);
          live_[id] = LiveEntry{conn, platform};
        }
        metrics().inc(counter::kServerAccepted);
        Logger::log(Logger::Level::kInfo, "Accepted " + id + " (platform " + platform + ")");
      } else if (s == ConnectionState::kClosing || s == ConnectionState::kDisconnected) {
        std::lock_guard<std::mutex> lock(live_mu_);
        live_.erase(id);
      }
    });

    Session* s = session.get();
    std::lock_guard<std::mutex> lock(sessions_mu_);
    s->worker = std::thread([s]() {
      if (s->conn->run_session(*s->transport) == Connection::SessionEnd::kRejected) {
        metrics().inc(counter::kServerRejected);
      }
      s->transport->close();
      s->done.store(true);
    });
    sessions_.push_back(std::move(session));
    return id;
  }

 private:
  struct Session {
    std::shared_ptr<Connection> conn;
    std::unique_ptr<Transport> transport;
    std::thread worker;
    std::atomic<bool> done{false};

    bool on_worker_thread() const { return worker.get_id() == std::this_thread::get_id(); }
  };

  struct LiveEntry {
    std::shared_ptr<Connection> conn;
    std::string platform;
  };

  std::map<std::string, LiveEntry> live_snapshot() const {
    std::lock_guard<std::mutex> lock(live_mu_);
    return live_;
  }

  void dispatch(const Message& msg, const std::string& connection_id) {
    std::vector<Handler> handlers;
    {
      std::lock_guard<std::mutex> lock(handlers_mu_);
      handlers = handlers_;
    }
    for (const auto& h : handlers) {
      try {
        h(msg, connection_id);
      } catch (const std::exception& e) {
        metrics().inc(counter::kHandlerErrors);
        Logger::log(Logger::Level::kError, "Server handler failed for " + connection_id + ": " + e.what());
      }
    }
  }

  void reap_finished() {
    std::vector<std::unique_ptr<Session>> finished;
    {
      std::lock_guard<std::mutex> lock(sessions_mu_);
      for (auto it = sessions_.begin(); it != sessions_.end();) {
        if ((*it)->done.load() && !(*it)->on_worker_thread()) {
          finished.push_back(std::move(*it));
          it = sessions_.erase(it);
        } else {
          ++it;
        }
      }
    }
    for (auto& s : finished) {
      if (s->worker.joinable()) {
        s->worker.join();
      }
    }
  }

  void accept_loop() {
    const auto validator = [this](const std::string& token) { return verify_token(token); };
    while (running_.load()) {
      auto transport =
          std::make_unique<BeastServerTransport>(config_.path, validator, options_.handshake_timeout_ms);

      bool done = false;
      beast::error_code ec;
      acceptor_.async_accept(transport->socket(), [&](beast::error_code accept_ec) {
        ec = accept_ec;
        done = true;
      });
      while (!done && running_.load()) {
        ioc_.restart();
        ioc_.run_for(std::chrono::milliseconds(100));
      }
      if (!done) {
        beast::error_code ignored;
        acceptor_.cancel(ignored);
        ioc_.restart();
        ioc_.run();
        break;
      }
      if (ec) {
        Logger::log(Logger::Level::kWarn, "Accept failed: " + ec.message());
        continue;
      }
      adopt(std::move(transport));
    }
  }

  ServerConfig config_;
  ConnectionOptions options_;
  bool auth_enabled_{false};

  net::io_context ioc_;
  tcp::acceptor acceptor_{ioc_};
  std::atomic<bool> running_{false};
  std::atomic<int> port_{0};
  std::thread accept_thread_;

  mutable std::mutex tokens_mu_;
  std::set<std::string> tokens_;

  std::mutex handlers_mu_;
  std::vector<Handler> handlers_;

  mutable std::mutex live_mu_;
  std::map<std::string, LiveEntry> live_;

  std::mutex sessions_mu_;
  std::vector<std::unique_ptr<Session>> sessions_;
};

}  // namespace maimwire
