#include "backoff.hpp"

#include <algorithm>

using namespace std::chrono;

Backoff::Backoff(const BackoffPolicy &policy, uint32_t seed)
    : policy(policy), rng(seed) {
  this->policy.multiplier = std::max(1.0, policy.multiplier);
  this->policy.jitter_ratio = std::clamp(policy.jitter_ratio, 0.0, 1.0);
  reset();
}

void Backoff::reset() {
  current = std::max(milliseconds(1), std::min(policy.initial, policy.max));
  _attempts = 0;
}

milliseconds Backoff::next_delay() {
  milliseconds delay = current;
  _attempts++;

  double grown = (double)current.count() * policy.multiplier;
  if (grown >= (double)policy.max.count()) {
    current = policy.max;
  } else {
    current = milliseconds((milliseconds::rep)grown);
  }
  return delay;
}

milliseconds Backoff::jitter(milliseconds delay) {
  if (policy.jitter_ratio <= 0.0 || delay.count() <= 0) {
    return delay;
  }
  std::uniform_real_distribution<double> extra(0.0, policy.jitter_ratio);
  return delay + milliseconds((milliseconds::rep)(delay.count() * extra(rng)));
}
