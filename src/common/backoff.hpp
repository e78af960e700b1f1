#pragma once
#include <chrono>
#include <cstdint>
#include <random>

#include "constants.hpp"

struct BackoffPolicy {
  std::chrono::milliseconds initial{Constants::BACKOFF_INITIAL_MILISECONDS};
  std::chrono::milliseconds max{Constants::BACKOFF_MAX_MILISECONDS};
  double multiplier = Constants::BACKOFF_MULTIPLIER;
  // upper bound of the random extra delay, as a fraction of the base delay
  double jitter_ratio = Constants::BACKOFF_JITTER_RATIO;
};

// Exponential reconnect delays. next_delay() is non-decreasing until it
// reaches policy.max and stays there until reset().
struct Backoff {
private:
  BackoffPolicy policy;
  std::chrono::milliseconds current;
  uint32_t _attempts = 0;
  std::mt19937 rng;

public:
  explicit Backoff(const BackoffPolicy &policy,
                   uint32_t seed = std::random_device{}());

  std::chrono::milliseconds next_delay();
  std::chrono::milliseconds jitter(std::chrono::milliseconds delay);
  void reset();

  uint32_t attempts() const { return _attempts; }
};
