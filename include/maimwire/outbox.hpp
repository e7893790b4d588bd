#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "maimwire/errors.hpp"

namespace maimwire {

// Bounded FIFO shared by a connection's producers and its session thread. When full the
// oldest entry is dropped so a long disconnect cannot grow memory without limit.
template <typename T>
class Outbox {
 public:
  Outbox(std::string owner, std::size_t capacity)
      : owner_(std::move(owner)), capacity_(capacity == 0 ? 1 : capacity) {}

  // Returns true when an older entry was evicted to make room.
  bool push(T value) {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) {
      throw ConnectionClosed(owner_);
    }
    bool dropped = false;
    if (items_.size() >= capacity_) {
      items_.pop_front();
      dropped = true;
    }
    items_.push_back(std::move(value));
    return dropped;
  }

  // Puts back an entry whose write failed so it goes out first next time. Returns false,
  // leaving the queue untouched, when it is full.
  bool push_front(T value) {
    std::lock_guard<std::mutex> lock(mu_);
    if (items_.size() >= capacity_) {
      return false;
    }
    items_.push_front(std::move(value));
    return true;
  }

  std::optional<T> try_pop() {
    std::lock_guard<std::mutex> lock(mu_);
    if (items_.empty()) {
      return std::nullopt;
    }
    T out = std::move(items_.front());
    items_.pop_front();
    return out;
  }

  void close() {
    std::lock_guard<std::mutex> lock(mu_);
    closed_ = true;
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return items_.size();
  }

  std::size_t capacity() const { return capacity_; }

  std::size_t clear() {
    std::lock_guard<std::mutex> lock(mu_);
    const std::size_t n = items_.size();
    items_.clear();
    return n;
  }

 private:
  std::string owner_;
  std::size_t capacity_;
  mutable std::mutex mu_;
  std::deque<T> items_;
  bool closed_{false};
};

}  // namespace maimwire
