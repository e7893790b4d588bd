#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace maimwire {

struct Frame {
  enum class Kind { kText, kPong, kClose };

  Kind kind{Kind::kText};
  std::string text;
};

// One WebSocket session's socket. A Connection drives it from a single thread, so
// implementations need no internal locking.
class Transport {
 public:
  virtual ~Transport() = default;

  // Dials (client side) or completes the upgrade handshake (server side).
  // Throws TransportError, or AuthenticationFailed when the token check fails.
  virtual void open() = 0;

  // Writes one text frame, giving up after `timeout`. Throws TransportError.
  virtual void send_text(const std::string& text, std::chrono::milliseconds timeout) = 0;

  // Waits up to `timeout` for the next frame. Throws TransportError.
  virtual std::optional<Frame> poll(std::chrono::milliseconds timeout) = 0;

  virtual void ping() = 0;

  // Best effort; never throws.
  virtual void close() = 0;

  virtual std::string describe() const = 0;

  // The `platform` header announced by the peer during the handshake, if any.
  virtual std::string peer_platform() const { return ""; }
};

using TransportFactory = std::function<std::unique_ptr<Transport>()>;

}  // namespace maimwire
