#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <utility>

#include "maimwire/common.hpp"
#include "maimwire/config.hpp"
#include "maimwire/errors.hpp"
#include "maimwire/message.hpp"
#include "maimwire/metrics.hpp"
#include "maimwire/outbox.hpp"
#include "maimwire/transport.hpp"

namespace maimwire {

enum class ConnectionState { kDisconnected, kConnecting, kOpen, kClosing, kReconnecting };

// Dialing connections reconnect after errors; accepted ones terminate and leave redialing
// to the peer.
enum class ConnectionRole { kClient, kServer };

inline const char* to_string(ConnectionState s) {
  switch (s) {
    case ConnectionState::kDisconnected:
      return "DISCONNECTED";
    case ConnectionState::kConnecting:
      return "CONNECTING";
    case ConnectionState::kOpen:
      return "OPEN";
    case ConnectionState::kClosing:
      return "CLOSING";
    case ConnectionState::kReconnecting:
    default:
      return "RECONNECTING";
  }
}

inline bool transition_allowed(ConnectionState from, ConnectionState to, ConnectionRole role) {
  using S = ConnectionState;
  const bool client = role == ConnectionRole::kClient;
  switch (from) {
    case S::kDisconnected:
      return to == S::kConnecting;
    case S::kConnecting:
      if (to == S::kOpen || to == S::kClosing) {
        return true;
      }
      return client ? to == S::kReconnecting : to == S::kDisconnected;
    case S::kOpen:
      return to == S::kClosing || (client && to == S::kReconnecting);
    case S::kClosing:
      return to == S::kDisconnected;
    case S::kReconnecting:
      return client && (to == S::kConnecting || to == S::kClosing);
  }
  return false;
}

class Connection {
 public:
  using MessageHandler = std::function<void(const Message&)>;
  using StateListener = std::function<void(ConnectionState)>;

  enum class SessionEnd { kStopped, kDialFailed, kRejected, kLost };

  Connection(std::string id, ConnectionRole role, ConnectionOptions options = {})
      : id_(std::move(id)), role_(role), options_(options), outbox_(id_, options.outbox_capacity) {}

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  const std::string& id() const { return id_; }
  ConnectionRole role() const { return role_; }

  ConnectionState state() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return state_;
  }

  bool wait_for_state(ConnectionState target, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_mu_);
    return state_cv_.wait_for(lock, timeout, [&]() { return state_ == target; });
  }

  void set_message_handler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(cb_mu_);
    handler_ = std::move(handler);
  }

  void set_state_listener(StateListener listener) {
    std::lock_guard<std::mutex> lock(cb_mu_);
    listener_ = std::move(listener);
  }

  // Queues a copy for the session thread. Throws ConnectionClosed once close() was called.
  void send(const Message& msg) {
    if (outbox_.push(msg)) {
      metrics().inc(counter::kOutboxDropped);
      Logger::log(Logger::Level::kWarn, "Connection " + id_ + " outbox full; dropped oldest message");
    }
  }

  // Non-blocking and idempotent; the session thread drains and closes the socket.
  void close() {
    outbox_.close();
    stop_requested_.store(true);
  }

  bool closing() const { return stop_requested_.load(); }
  std::size_t pending() const { return outbox_.size(); }

  // Runs one socket lifetime on the calling thread: open, then alternate the send step and
  // the receive step until close() or a transport error.
  SessionEnd run_session(Transport& transport) {
    if (stop_requested_.load()) {
      return SessionEnd::kStopped;
    }
    set_state(ConnectionState::kConnecting);

    try {
      transport.open();
    } catch (const AuthenticationFailed& e) {
      Logger::log(Logger::Level::kWarn, "Connection " + id_ + " (" + transport.describe() + ") rejected: " + e.what());
      transport.close();
      end_after_failure();
      return SessionEnd::kRejected;
    } catch (const std::exception& e) {
      Logger::log(Logger::Level::kWarn, "Connection " + id_ + " (" + transport.describe() + ") failed to open: " + e.what());
      transport.close();
      end_after_failure();
      return SessionEnd::kDialFailed;
    }

    if (stop_requested_.load()) {
      set_state(ConnectionState::kClosing);
      transport.close();
      set_state(ConnectionState::kDisconnected);
      return SessionEnd::kStopped;
    }

    set_state(ConnectionState::kOpen);
    Logger::log(Logger::Level::kInfo, "Connection " + id_ + " open (" + transport.describe() + ")");

    const auto tick = std::chrono::milliseconds((std::max)(1, options_.poll_interval_ms));
    const auto ping_every = std::chrono::milliseconds(options_.heartbeat_interval_ms);
    const auto pong_within = std::chrono::milliseconds(options_.heartbeat_timeout_ms);
    auto last_ping = std::chrono::steady_clock::now();
    bool awaiting_pong = false;

    try {
      while (!stop_requested_.load()) {
        flush_outbox(transport);

        if (auto frame = transport.poll(tick)) {
          switch (frame->kind) {
            case Frame::Kind::kText:
              deliver(frame->text);
              break;
            case Frame::Kind::kPong:
              awaiting_pong = false;
              break;
            case Frame::Kind::kClose:
              throw TransportError("closed by peer");
          }
        }

        if (options_.heartbeat_interval_ms > 0) {
          const auto now = std::chrono::steady_clock::now();
          if (awaiting_pong) {
            if (now - last_ping > pong_within) {
              throw TransportError("no pong within " + std::to_string(options_.heartbeat_timeout_ms) + "ms");
            }
          } else if (now - last_ping >= ping_every) {
            transport.ping();
            awaiting_pong = true;
            last_ping = now;
          }
        }
      }
    } catch (const std::exception& e) {
      Logger::log(Logger::Level::kWarn, "Connection " + id_ + " lost: " + e.what());
      transport.close();
      end_after_failure();
      return SessionEnd::kLost;
    }

    set_state(ConnectionState::kClosing);
    drain(transport);
    transport.close();
    set_state(ConnectionState::kDisconnected);
    Logger::log(Logger::Level::kInfo, "Connection " + id_ + " closed");
    return SessionEnd::kStopped;
  }

  // Terminal transition for a client stopped between sessions.
  void finish() {
    outbox_.close();
    const ConnectionState s = state();
    if (s == ConnectionState::kReconnecting || s == ConnectionState::kConnecting) {
      set_state(ConnectionState::kClosing);
    }
    if (state() == ConnectionState::kClosing) {
      set_state(ConnectionState::kDisconnected);
    }
  }

 private:
  void set_state(ConnectionState next) {
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      if (state_ == next) {
        return;
      }
      if (!transition_allowed(state_, next, role_)) {
        Logger::log(Logger::Level::kError, "Connection " + id_ + " refused transition " +
                                               to_string(state_) + " -> " + to_string(next));
        return;
      }
      state_ = next;
    }
    state_cv_.notify_all();
    Logger::log(Logger::Level::kDebug, "Connection " + id_ + " -> " + to_string(next));

    StateListener listener;
    {
      std::lock_guard<std::mutex> lock(cb_mu_);
      listener = listener_;
    }
    if (listener) {
      try {
        listener(next);
      } catch (const std::exception& e) {
        Logger::log(Logger::Level::kError, "Connection " + id_ + " state listener failed: " + e.what());
      }
    }
  }

  void end_after_failure() {
    if (role_ == ConnectionRole::kClient) {
      set_state(ConnectionState::kReconnecting);
      return;
    }
    outbox_.close();
    if (state() == ConnectionState::kOpen) {
      set_state(ConnectionState::kClosing);
    }
    set_state(ConnectionState::kDisconnected);
  }

  void write_one(Transport& transport, Message msg, std::chrono::milliseconds timeout) {
    const std::string text = encode(msg);
    try {
      transport.send_text(text, timeout);
    } catch (const std::exception&) {
      if (role_ == ConnectionRole::kClient && !outbox_.push_front(std::move(msg))) {
        metrics().inc(counter::kOutboxDropped);
        Logger::log(Logger::Level::kWarn,
                    "Connection " + id_ + " outbox full, dropped the message whose write failed");
      }
      throw;
    }
    metrics().inc(counter::kFramesOut);
  }

  void flush_outbox(Transport& transport) {
    // Bounded so a busy producer cannot starve the receive step.
    // Stops as soon as close() is requested; drain() owns whatever is left.
    const auto timeout = std::chrono::milliseconds(options_.write_timeout_ms);
    for (std::size_t budget = outbox_.size(); budget > 0 && !stop_requested_.load(); --budget) {
      auto msg = outbox_.try_pop();
      if (!msg) {
        break;
      }
      write_one(transport, std::move(*msg), timeout);
    }
  }

  void drain(Transport& transport) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.drain_timeout_ms);
    try {
      for (auto now = std::chrono::steady_clock::now(); now < deadline; now = std::chrono::steady_clock::now()) {
        auto msg = outbox_.try_pop();
        if (!msg) {
          break;
        }
        // Each write gets only the time left before the deadline.
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        write_one(transport, std::move(*msg), (std::max)(left, std::chrono::milliseconds(1)));
      }
    } catch (const std::exception& e) {
      Logger::log(Logger::Level::kWarn, "Connection " + id_ + " drain aborted: " + e.what());
    }
    const std::size_t left = outbox_.clear();
    if (left > 0) {
      Logger::log(Logger::Level::kWarn,
                  "Connection " + id_ + " closed with " + std::to_string(left) + " unsent message(s)");
    }
  }

  void deliver(const std::string& text) {
    metrics().inc(counter::kFramesIn);
    Message msg;
    try {
      msg = decode(text);
    } catch (const MalformedMessage& e) {
      metrics().inc(counter::kFramesMalformed);
      Logger::log(Logger::Level::kWarn, "Connection " + id_ + " dropped frame: " + e.what());
      return;
    }

    MessageHandler handler;
    {
      std::lock_guard<std::mutex> lock(cb_mu_);
      handler = handler_;
    }
    if (!handler) {
      return;
    }
    try {
      handler(msg);
    } catch (const std::exception& e) {
      metrics().inc(counter::kHandlerErrors);
      Logger::log(Logger::Level::kError, "Connection " + id_ + " inbound handler failed: " + e.what());
    }
  }

  std::string id_;
  ConnectionRole role_;
  ConnectionOptions options_;
  Outbox<Message> outbox_;

  std::atomic<bool> stop_requested_{false};

  mutable std::mutex state_mu_;
  mutable std::condition_variable state_cv_;
  ConnectionState state_{ConnectionState::kDisconnected};

  std::mutex cb_mu_;
  MessageHandler handler_;
  StateListener listener_;
};

}  // namespace maimwire
