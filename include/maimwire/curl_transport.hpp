#pragma once

#include <cerrno>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <poll.h>

#include <curl/curl.h>
#include <curl/websockets.h>

#include "maimwire/common.hpp"
#include "maimwire/errors.hpp"
#include "maimwire/transport.hpp"

namespace maimwire {

namespace detail {

// curl_ws_recv's frame out-parameter gained a const qualifier in later libcurl releases.
template <typename F>
struct ws_recv_frame;

template <typename R, typename A0, typename A1, typename A2, typename A3, typename Meta>
struct ws_recv_frame<R (*)(A0, A1, A2, A3, Meta**)> {
  using type = Meta;
};

using ws_frame_t = ws_recv_frame<decltype(&curl_ws_recv)>::type;

}  // namespace detail

// Dialing side of a connection: a libcurl handle in WebSocket CONNECT_ONLY mode.
class CurlTransport : public Transport {
 public:
  CurlTransport(std::string url, std::string token, std::string platform, int connect_timeout_ms = 5000)
      : url_(trim(url)),
        token_(trim(token)),
        platform_(trim(platform)),
        connect_timeout_ms_(connect_timeout_ms) {}

  ~CurlTransport() override { close(); }

  void open() override {
    ensure_global_init();
    close();
    curl_ = curl_easy_init();
    if (!curl_) {
      throw TransportError("curl init failed");
    }

    if (!token_.empty()) {
      headers_ = curl_slist_append(headers_, ("Authorization: " + token_).c_str());
    }
    if (!platform_.empty()) {
      headers_ = curl_slist_append(headers_, ("platform: " + platform_).c_str());
    }

    curl_easy_setopt(curl_, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl_, CURLOPT_CONNECT_ONLY, 2L);  // websocket mode
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, "maimwire/0.2");
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout_ms_));
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(connect_timeout_ms_) * 2);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, &discard_write);
    if (headers_) {
      curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
    }

    const CURLcode rc = curl_easy_perform(curl_);
    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code == 401 || http_code == 403) {
      close();
      throw AuthenticationFailed(url_ + " answered HTTP " + std::to_string(http_code));
    }
    if (rc != CURLE_OK) {
      const std::string reason = rc == CURLE_UNSUPPORTED_PROTOCOL
                                     ? "libcurl lacks WebSocket protocol support"
                                     : std::string(curl_easy_strerror(rc));
      close();
      throw TransportError(url_ + ": " + reason);
    }
    if (http_code != 101) {
      close();
      throw TransportError(url_ + " did not switch protocols (HTTP " + std::to_string(http_code) + ")");
    }

    curl_socket_t sock = CURL_SOCKET_BAD;
    curl_easy_getinfo(curl_, CURLINFO_ACTIVESOCKET, &sock);
    socket_ = sock;
    accumulator_.clear();
  }

  void send_text(const std::string& text, std::chrono::milliseconds timeout) override {
    send_frame(text, CURLWS_TEXT, timeout);
  }

  std::optional<Frame> poll(std::chrono::milliseconds timeout) override {
    require_open();
    // libcurl may already hold buffered bytes that the socket no longer reports.
    if (auto frame = read_available()) {
      return frame;
    }
    if (socket_ != CURL_SOCKET_BAD) {
      pollfd pfd{};
      pfd.fd = socket_;
      pfd.events = POLLIN;
      const int n = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
      if (n < 0 && errno != EINTR) {
        throw TransportError("poll failed on " + url_);
      }
      if (n > 0 && (pfd.revents & (POLLERR | POLLNVAL)) != 0) {
        throw TransportError("socket error on " + url_);
      }
    } else {
      std::this_thread::sleep_for(timeout);
    }
    return read_available();
  }

  void ping() override { send_frame(std::string(), CURLWS_PING, std::chrono::milliseconds(kPingTimeoutMs)); }

  void close() override {
    if (curl_) {
      curl_easy_cleanup(curl_);
      curl_ = nullptr;
    }
    if (headers_) {
      curl_slist_free_all(headers_);
      headers_ = nullptr;
    }
    socket_ = CURL_SOCKET_BAD;
  }

  std::string describe() const override { return url_; }

 private:
  static void ensure_global_init() {
    static std::once_flag flag;
    std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  }

  static size_t discard_write(char* ptr, size_t size, size_t nmemb, void* userdata) {
    (void)ptr;
    (void)userdata;
    return size * nmemb;
  }

  void require_open() const {
    if (!curl_) {
      throw TransportError(url_ + " is not connected");
    }
  }

  void send_frame(const std::string& payload, unsigned int flags, std::chrono::milliseconds timeout) {
    require_open();
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::size_t offset = 0;
    do {
      size_t sent = 0;
      const CURLcode rc = curl_ws_send(curl_, payload.data() + offset, payload.size() - offset, &sent, 0, flags);
      if (rc == CURLE_AGAIN || (rc == CURLE_OK && sent == 0 && offset < payload.size())) {
        if (std::chrono::steady_clock::now() > deadline) {
          throw TransportError("write to " + url_ + " timed out");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        continue;
      }
      if (rc != CURLE_OK) {
        throw TransportError("send to " + url_ + " failed: " + std::string(curl_easy_strerror(rc)));
      }
      offset += sent;
    } while (offset < payload.size());
  }

  std::optional<Frame> read_available() {
    char buffer[8192];
    for (;;) {
      std::size_t nrecv = 0;
      detail::ws_frame_t* meta = nullptr;
      const CURLcode rc = curl_ws_recv(curl_, buffer, sizeof(buffer), &nrecv, &meta);

      if (rc == CURLE_AGAIN) {
        return std::nullopt;
      }
      if (rc == CURLE_GOT_NOTHING) {
        return Frame{Frame::Kind::kClose, ""};
      }
      if (rc != CURLE_OK) {
        throw TransportError("recv from " + url_ + " failed: " + std::string(curl_easy_strerror(rc)));
      }
      if (!meta) {
        continue;
      }
      if ((meta->flags & CURLWS_CLOSE) != 0) {
        return Frame{Frame::Kind::kClose, ""};
      }
      if ((meta->flags & CURLWS_PONG) != 0) {
        return Frame{Frame::Kind::kPong, ""};
      }
      if ((meta->flags & CURLWS_PING) != 0 || (meta->flags & CURLWS_BINARY) != 0) {
        continue;
      }
      if ((meta->flags & CURLWS_TEXT) == 0 && (meta->flags & CURLWS_CONT) == 0) {
        continue;
      }

      if (nrecv > 0) {
        accumulator_.append(buffer, nrecv);
      }
      if (meta->bytesleft == 0 && (meta->flags & CURLWS_CONT) == 0) {
        Frame frame{Frame::Kind::kText, std::move(accumulator_)};
        accumulator_.clear();
        return frame;
      }
    }
  }

  static constexpr int kPingTimeoutMs = 10000;

  std::string url_;
  std::string token_;
  std::string platform_;
  int connect_timeout_ms_;

  CURL* curl_{nullptr};
  curl_slist* headers_{nullptr};
  curl_socket_t socket_{CURL_SOCKET_BAD};
  std::string accumulator_;
};

}  // namespace maimwire
