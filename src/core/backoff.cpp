#include "backoff.h"
#include <algorithm>
#include <cmath>

std::chrono::milliseconds BackoffPolicy::next() {
  const double cap = static_cast<double>(cfg_.max_delay_ms);
  const double raw = static_cast<double>(cfg_.initial_delay_ms) * std::pow(cfg_.multiplier, attempt_);
  ++attempt_;
  const double ms = std::isfinite(raw) ? std::min(raw, cap) : cap;
  return std::chrono::milliseconds(static_cast<long long>(ms));
}
