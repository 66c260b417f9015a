#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <random>

namespace uploader {

// Blocks the calling thread; injectable so tests do not sleep.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

void sleepFor(std::chrono::milliseconds delay);

// Exponential backoff with a ceiling. Attempt n (0-based) waits
// min(initial * 2^n, ceiling); attempts after the first add a uniform
// jitter in [0, max_jitter]. Not thread-safe: one instance per worker.
class BackoffPolicy {
public:
  BackoffPolicy(std::chrono::milliseconds initial,
                std::chrono::milliseconds ceiling,
                std::chrono::milliseconds max_jitter,
                std::uint32_t seed = std::random_device{}());

  std::chrono::milliseconds baseDelay(int attempt) const;
  std::chrono::milliseconds delay(int attempt);

  // Upper bound of any value returned by delay()
  std::chrono::milliseconds maxDelay() const { return ceiling_ + max_jitter_; }

private:
  std::chrono::milliseconds initial_;
  std::chrono::milliseconds ceiling_;
  std::chrono::milliseconds max_jitter_;
  std::mt19937 rng_;
};

} // namespace uploader
