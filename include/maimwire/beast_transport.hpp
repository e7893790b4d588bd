#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "maimwire/common.hpp"
#include "maimwire/errors.hpp"
#include "maimwire/transport.hpp"

namespace maimwire {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

// Token presented at handshake: the Authorization header (bare or "Bearer <token>"), else
// a `token` query parameter on the request target.
inline std::string extract_token(const http::request<http::string_body>& req) {
  const auto auth = req[http::field::authorization];
  std::string token = trim(std::string(auth.data(), auth.size()));
  if (starts_with(to_lower(token), "bearer ")) {
    token = trim(token.substr(7));
  }
  if (!token.empty()) {
    return token;
  }

  const auto target = req.target();
  const std::string t(target.data(), target.size());
  const auto q = t.find('?');
  if (q == std::string::npos) {
    return "";
  }
  std::string query = t.substr(q + 1);
  std::size_t pos = 0;
  while (pos <= query.size()) {
    const auto amp = query.find('&', pos);
    const std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    if (starts_with(pair, "token=")) {
      return pair.substr(6);
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return "";
}

inline std::string target_path(const http::request<http::string_body>& req) {
  const auto target = req.target();
  const std::string t(target.data(), target.size());
  return t.substr(0, t.find('?'));
}

// Accepting side of a connection. Owns a private io_context that only the session thread
// runs, so every async operation on the stream completes on that thread.
class BeastServerTransport : public Transport {
 public:
  using TokenValidator = std::function<bool(const std::string&)>;

  BeastServerTransport(std::string path, TokenValidator validator, int handshake_timeout_ms = 5000)
      : path_(std::move(path)), validator_(std::move(validator)), handshake_timeout_ms_(handshake_timeout_ms) {}

  ~BeastServerTransport() override { close(); }

  tcp::socket& socket() { return beast::get_lowest_layer(ws_).socket(); }

  void open() override {
    remote_ = remote_endpoint();
    const auto budget = std::chrono::milliseconds(handshake_timeout_ms_);

    op_done_ = false;
    http::async_read(ws_.next_layer(), buffer_, request_, [this](beast::error_code ec, std::size_t) {
      op_ec_ = ec;
      op_done_ = true;
    });
    if (!run_until([this]() { return op_done_; }, budget)) {
      throw TransportError("handshake from " + remote_ + " timed out");
    }
    if (op_ec_) {
      throw TransportError("handshake read from " + remote_ + " failed: " + op_ec_.message());
    }

    if (!websocket::is_upgrade(request_)) {
      reject(http::status::bad_request, "Expected a WebSocket upgrade");
      throw TransportError(remote_ + " sent a plain HTTP request");
    }
    if (target_path(request_) != path_) {
      reject(http::status::not_found, "Unknown path");
      throw TransportError(remote_ + " requested " + target_path(request_));
    }
    if (validator_ && !validator_(extract_token(request_))) {
      reject(http::status::unauthorized, "Invalid or missing token");
      throw AuthenticationFailed(remote_ + " presented an invalid or missing token");
    }

    const auto platform = request_["platform"];
    platform_ = trim(std::string(platform.data(), platform.size()));
    if (platform_.empty()) {
      platform_ = "default";
    }

    ws_.set_option(websocket::stream_base::decorator(
        [](websocket::response_type& res) { res.set(http::field::server, std::string("maimwire/") + kVersion); }));
    op_done_ = false;
    ws_.async_accept(request_, [this](beast::error_code ec) {
      op_ec_ = ec;
      op_done_ = true;
    });
    if (!run_until([this]() { return op_done_; }, budget)) {
      throw TransportError("websocket accept from " + remote_ + " timed out");
    }
    if (op_ec_) {
      throw TransportError("websocket accept from " + remote_ + " failed: " + op_ec_.message());
    }

    ws_.text(true);
    ws_.control_callback([this](websocket::frame_type kind, beast::string_view) {
      if (kind == websocket::frame_type::pong) {
        pong_seen_ = true;
        ioc_.stop();
      }
    });
    buffer_.consume(buffer_.size());
    open_ = true;
  }

  void send_text(const std::string& text, std::chrono::milliseconds timeout) override {
    require_open();
    write_done_ = false;
    ws_.async_write(net::buffer(text), [this](beast::error_code ec, std::size_t) {
      write_ec_ = ec;
      write_done_ = true;
    });
    if (!run_until([this]() { return write_done_; }, timeout)) {
      // The write is still pending; only a socket close can cancel it.
      open_ = false;
      throw TransportError("write to " + remote_ + " timed out");
    }
    if (write_ec_) {
      throw TransportError("write to " + remote_ + " failed: " + write_ec_.message());
    }
  }

  std::optional<Frame> poll(std::chrono::milliseconds timeout) override {
    require_open();
    if (!read_pending_) {
      start_read();
    }
    if (!read_done_ && !pong_seen_) {
      ioc_.restart();
      ioc_.run_for(timeout);
    }

    if (read_done_) {
      read_done_ = false;
      read_pending_ = false;
      if (read_ec_ == websocket::error::closed) {
        return Frame{Frame::Kind::kClose, ""};
      }
      if (read_ec_) {
        throw TransportError("read from " + remote_ + " failed: " + read_ec_.message());
      }
      std::string text = beast::buffers_to_string(buffer_.data());
      buffer_.consume(buffer_.size());
      if (!read_text_) {
        Logger::log(Logger::Level::kDebug, "Ignoring binary frame from " + remote_);
        return std::nullopt;
      }
      return Frame{Frame::Kind::kText, std::move(text)};
    }
    if (pong_seen_) {
      pong_seen_ = false;
      return Frame{Frame::Kind::kPong, ""};
    }
    return std::nullopt;
  }

  void ping() override {
    require_open();
    write_done_ = false;
    ws_.async_ping({}, [this](beast::error_code ec) {
      write_ec_ = ec;
      write_done_ = true;
    });
    if (!run_until([this]() { return write_done_; }, std::chrono::milliseconds(kPingTimeoutMs))) {
      open_ = false;
      throw TransportError("ping to " + remote_ + " timed out");
    }
    if (write_ec_) {
      throw TransportError("ping to " + remote_ + " failed: " + write_ec_.message());
    }
  }

  void close() override {
    if (open_) {
      open_ = false;
      write_done_ = false;
      ws_.async_close(websocket::close_code::normal, [this](beast::error_code ec) {
        write_ec_ = ec;
        write_done_ = true;
      });
      run_until([this]() { return write_done_; }, std::chrono::milliseconds(kCloseTimeoutMs));
    }
    beast::error_code ec;
    socket().shutdown(tcp::socket::shutdown_both, ec);
    socket().close(ec);
    // Let cancelled handlers run while the members they touch are still alive.
    ioc_.restart();
    ioc_.poll();
  }

  std::string describe() const override { return remote_.empty() ? "unaccepted" : remote_; }
  std::string peer_platform() const override { return platform_; }

 private:
  static constexpr int kPingTimeoutMs = 10000;
  static constexpr int kCloseTimeoutMs = 1000;

  std::string remote_endpoint() {
    beast::error_code ec;
    const auto ep = socket().remote_endpoint(ec);
    if (ec) {
      return "unknown peer";
    }
    return ep.address().to_string() + ":" + std::to_string(ep.port());
  }

  void require_open() const {
    if (!open_) {
      throw TransportError("connection from " + describe() + " is not open");
    }
  }

  void start_read() {
    read_pending_ = true;
    read_done_ = false;
    ws_.async_read(buffer_, [this](beast::error_code ec, std::size_t) {
      read_ec_ = ec;
      read_text_ = ws_.got_text();
      read_done_ = true;
    });
  }

  template <typename Pred>
  bool run_until(Pred done, std::chrono::milliseconds budget) {
    const auto deadline = std::chrono::steady_clock::now() + budget;
    while (!done()) {
      const auto now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        return false;
      }
      ioc_.restart();
      ioc_.run_one_for(deadline - now);
    }
    return true;
  }

  void reject(http::status status, const std::string& reason) {
    http::response<http::string_body> res{status, request_.version()};
    res.set(http::field::server, std::string("maimwire/") + kVersion);
    res.set(http::field::content_type, "text/plain");
    res.keep_alive(false);
    res.body() = reason;
    res.prepare_payload();

    op_done_ = false;
    http::async_write(ws_.next_layer(), res, [this](beast::error_code ec, std::size_t) {
      op_ec_ = ec;
      op_done_ = true;
    });
    run_until([this]() { return op_done_; }, std::chrono::milliseconds(kCloseTimeoutMs));
    beast::error_code ec;
    socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  std::string path_;
  TokenValidator validator_;
  int handshake_timeout_ms_;

  net::io_context ioc_;
  websocket::stream<beast::tcp_stream> ws_{ioc_};
  beast::flat_buffer buffer_;
  http::request<http::string_body> request_;

  std::string remote_;
  std::string platform_;
  bool open_{false};

  bool op_done_{false};
  beast::error_code op_ec_;
  bool write_done_{false};
  beast::error_code write_ec_;
  bool read_pending_{false};
  bool read_done_{false};
  bool read_text_{true};
  beast::error_code read_ec_;
  bool pong_seen_{false};
};

}  // namespace maimwire
