#pragma once
#include <chrono>
#include "config/config.h"

// Capped exponential reconnect delays: initial, initial*m, initial*m^2, ... <= max.
class BackoffPolicy {
public:
  explicit BackoffPolicy(const BackoffConfig& cfg) : cfg_(cfg) {}

  std::chrono::milliseconds next();
  void reset() { attempt_ = 0; }
  int attempts() const { return attempt_; }

private:
  BackoffConfig cfg_;
  int attempt_{0};
};
