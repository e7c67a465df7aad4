#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace vtob::core::broker {

// Multiplicative reconnect interval: base, base*factor, ... capped at max.
// Not synchronized.
class Backoff {
public:
  Backoff(std::int64_t base_ms, std::int64_t max_ms, double factor)
      : base_ms_(std::max<std::int64_t>(1, base_ms)),
        max_ms_(std::max(max_ms, base_ms_)),
        factor_(factor > 1.0 ? factor : 1.0),
        current_ms_(base_ms_) {}

  std::int64_t Current() const { return current_ms_; }
  std::int64_t Base() const { return base_ms_; }
  std::int64_t Max() const { return max_ms_; }

  void Reset() { current_ms_ = base_ms_; }

  // Grows by at least 1 ms until the cap is reached.
  std::int64_t Grow() {
    const auto scaled = static_cast<std::int64_t>(std::llround(static_cast<double>(current_ms_) * factor_));
    current_ms_ = std::min(max_ms_, std::max(current_ms_ + 1, scaled));
    return current_ms_;
  }

  // unit in [0, 1) maps onto [lo, hi) times the current interval.
  std::int64_t Jittered(double unit, double lo = 0.5, double hi = 1.5) const {
    const double f = lo + (hi - lo) * std::clamp(unit, 0.0, 1.0);
    return static_cast<std::int64_t>(static_cast<double>(current_ms_) * f);
  }

private:
  std::int64_t base_ms_;
  std::int64_t max_ms_;
  double factor_;
  std::int64_t current_ms_;
};

}  // namespace vtob::core::broker
