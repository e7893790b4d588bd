#pragma once

#include <stdexcept>
#include <string>

namespace maimwire {

class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// A wire record that does not describe a valid Message. The frame is dropped; the
// connection that carried it stays open.
class MalformedMessage : public Error {
 public:
  explicit MalformedMessage(const std::string& what) : Error("malformed message: " + what) {}
};

class ConnectionClosed : public Error {
 public:
  explicit ConnectionClosed(const std::string& connection_id)
      : Error("connection " + connection_id + " is closed") {}
};

class UnknownPlatform : public Error {
 public:
  explicit UnknownPlatform(const std::string& platform)
      : Error("no route configured for platform '" + platform + "'"), platform_(platform) {}

  const std::string& platform() const { return platform_; }

 private:
  std::string platform_;
};

class AuthenticationFailed : public Error {
 public:
  explicit AuthenticationFailed(const std::string& what) : Error("authentication failed: " + what) {}
};

class NoSuchConnection : public Error {
 public:
  explicit NoSuchConnection(const std::string& connection_id)
      : Error("no live connection with id " + connection_id) {}
};

// Socket-level failure. Client connections reconnect, server connections are dropped.
class TransportError : public Error {
 public:
  explicit TransportError(const std::string& what) : Error("transport error: " + what) {}
};

}  // namespace maimwire
