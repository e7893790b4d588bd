#pragma once

#include <algorithm>
#include <chrono>

#include "maimwire/config.hpp"

namespace maimwire {

// Capped exponential retry delays: initial, initial*m, initial*m^2, ... up to max.
class ExponentialBackoff {
 public:
  explicit ExponentialBackoff(const BackoffConfig& cfg)
      : initial_ms_((std::max)(1, cfg.initial_ms)),
        max_ms_((std::max)(initial_ms_, cfg.max_ms)),
        multiplier_((std::max)(1.0, cfg.multiplier)),
        next_ms_(initial_ms_) {}

  std::chrono::milliseconds next() {
    const double current = next_ms_;
    next_ms_ = (std::min)(current * multiplier_, static_cast<double>(max_ms_));
    ++attempts_;
    return std::chrono::milliseconds(static_cast<long long>(current));
  }

  void reset() {
    next_ms_ = initial_ms_;
    attempts_ = 0;
  }

  int attempts() const { return attempts_; }

 private:
  int initial_ms_;
  int max_ms_;
  double multiplier_;
  double next_ms_;
  int attempts_{0};
};

}  // namespace maimwire
