#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "maimwire/errors.hpp"
#include "maimwire/transport.hpp"

namespace maimwire::testing {

// Both ends of an in-memory socket. Tests script the remote side through it and inspect
// what the connection wrote.
struct FakeWire {
  std::mutex mu;
  std::condition_variable cv;

  std::deque<Frame> inbound;
  std::vector<std::string> sent;
  std::string platform{"default"};

  int fail_opens{0};
  bool always_fail_open{false};
  bool reject_auth{false};
  bool fail_send{false};
  int fail_sends{0};
  int send_delay_ms{0};
  bool fail_next_poll{false};
  bool auto_pong{true};

  int open_calls{0};
  int close_calls{0};
  int ping_calls{0};

  void push_text(const std::string& text) {
    {
      std::lock_guard<std::mutex> lock(mu);
      inbound.push_back(Frame{Frame::Kind::kText, text});
    }
    cv.notify_all();
  }

  void break_socket() {
    {
      std::lock_guard<std::mutex> lock(mu);
      fail_next_poll = true;
    }
    cv.notify_all();
  }

  bool wait_sent(std::size_t n, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu);
    return cv.wait_for(lock, timeout, [&]() { return sent.size() >= n; });
  }

  std::vector<std::string> sent_copy() {
    std::lock_guard<std::mutex> lock(mu);
    return sent;
  }

  int opens() {
    std::lock_guard<std::mutex> lock(mu);
    return open_calls;
  }

  int closes() {
    std::lock_guard<std::mutex> lock(mu);
    return close_calls;
  }
};

class FakeTransport : public Transport {
 public:
  explicit FakeTransport(std::shared_ptr<FakeWire> wire) : wire_(std::move(wire)) {}

  void open() override {
    std::lock_guard<std::mutex> lock(wire_->mu);
    ++wire_->open_calls;
    if (wire_->reject_auth) {
      throw AuthenticationFailed("fake peer presented a bad token");
    }
    if (wire_->always_fail_open || wire_->fail_opens > 0) {
      if (wire_->fail_opens > 0) {
        --wire_->fail_opens;
      }
      throw TransportError("fake dial refused");
    }
  }

  void send_text(const std::string& text, std::chrono::milliseconds timeout) override {
    int delay_ms = 0;
    {
      std::lock_guard<std::mutex> lock(wire_->mu);
      if (wire_->fail_send || wire_->fail_sends > 0) {
        if (wire_->fail_sends > 0) {
          --wire_->fail_sends;
        }
        throw TransportError("fake write failed");
      }
      delay_ms = wire_->send_delay_ms;
    }
    if (delay_ms > 0) {
      // A slow peer: the write blocks until it completes or the timeout expires.
      if (std::chrono::milliseconds(delay_ms) > timeout) {
        std::this_thread::sleep_for(timeout);
        throw TransportError("fake write timed out");
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    }
    {
      std::lock_guard<std::mutex> lock(wire_->mu);
      wire_->sent.push_back(text);
    }
    wire_->cv.notify_all();
  }

  std::optional<Frame> poll(std::chrono::milliseconds timeout) override {
    std::unique_lock<std::mutex> lock(wire_->mu);
    wire_->cv.wait_for(lock, timeout, [&]() { return !wire_->inbound.empty() || wire_->fail_next_poll; });
    if (wire_->fail_next_poll) {
      wire_->fail_next_poll = false;
      throw TransportError("fake socket reset");
    }
    if (wire_->inbound.empty()) {
      return std::nullopt;
    }
    Frame f = std::move(wire_->inbound.front());
    wire_->inbound.pop_front();
    return f;
  }

  void ping() override {
    std::lock_guard<std::mutex> lock(wire_->mu);
    ++wire_->ping_calls;
    if (wire_->auto_pong) {
      wire_->inbound.push_back(Frame{Frame::Kind::kPong, ""});
    }
  }

  void close() override {
    {
      std::lock_guard<std::mutex> lock(wire_->mu);
      ++wire_->close_calls;
    }
    wire_->cv.notify_all();
  }

  std::string describe() const override { return "fake"; }

  std::string peer_platform() const override {
    std::lock_guard<std::mutex> lock(wire_->mu);
    return wire_->platform;
  }

 private:
  std::shared_ptr<FakeWire> wire_;
};

inline TransportFactory fake_factory(std::shared_ptr<FakeWire> wire) {
  return [wire]() -> std::unique_ptr<Transport> { return std::make_unique<FakeTransport>(wire); };
}

}  // namespace maimwire::testing
