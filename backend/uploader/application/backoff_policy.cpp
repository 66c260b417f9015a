#include "backoff_policy.hpp"
#include <stdexcept>
#include <thread>

namespace uploader {

void sleepFor(std::chrono::milliseconds delay) {
  std::this_thread::sleep_for(delay);
}

BackoffPolicy::BackoffPolicy(std::chrono::milliseconds initial,
                             std::chrono::milliseconds ceiling,
                             std::chrono::milliseconds max_jitter,
                             std::uint32_t seed)
  : initial_(initial), ceiling_(ceiling), max_jitter_(max_jitter), rng_(seed) {
  if (initial_.count() <= 0 || initial_ > ceiling_) {
    throw std::invalid_argument("backoff: initial delay must be positive and not above the ceiling");
  }
  if (max_jitter_.count() < 0) {
    throw std::invalid_argument("backoff: jitter must not be negative");
  }
}

std::chrono::milliseconds BackoffPolicy::baseDelay(int attempt) const {
  auto delay = initial_;
  for (int i = 0; i < attempt && delay < ceiling_; ++i) {
    delay *= 2;
  }
  return delay < ceiling_ ? delay : ceiling_;
}

std::chrono::milliseconds BackoffPolicy::delay(int attempt) {
  auto base = baseDelay(attempt);
  if (attempt == 0 || max_jitter_.count() == 0) {
    return base;
  }
  std::uniform_int_distribution<std::chrono::milliseconds::rep> jitter(0, max_jitter_.count());
  return base + std::chrono::milliseconds(jitter(rng_));
}

} // namespace uploader
