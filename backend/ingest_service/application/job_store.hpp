#pragma once

// project
#include "domain/job.hpp"

// std
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <expected>
#include <mutex>
#include <optional>

namespace ingest_service {

// Bounded FIFO of admitted jobs plus the admission counter.
//
// occupancy counts jobs from tryAdmit() until the matching release(), so it
// covers both queued jobs and jobs a worker is still processing. Callers must
// pair every successful tryAdmit() with exactly one release().
class JobStore {
public:
  explicit JobStore(size_t capacity);

  JobStore(const JobStore&) = delete;
  JobStore& operator=(const JobStore&) = delete;

  // Reserves one unit of capacity; no side effects on failure.
  bool tryAdmit();

  // Hands the job back if the store is shut down.
  std::expected<void, Job> enqueue(Job job);

  // Blocks until a job is available. Returns nullopt once the store is
  // shut down and the queue has drained.
  std::optional<Job> dequeue();
  std::optional<Job> tryDequeue();

  void release();
  void shutdown();

  // Waits until occupancy drops to zero.
  bool waitUntilIdle(std::chrono::milliseconds timeout);

  size_t occupancy() const { return occupancy_.load(std::memory_order_acquire); }
  size_t capacity() const { return capacity_; }
  size_t queued() const;

private:
  const size_t capacity_;
  std::atomic<size_t> occupancy_{0};

  mutable std::mutex mtx_;
  std::condition_variable job_available_;
  std::condition_variable idle_;
  std::deque<Job> jobs_;
  bool stop_{false};
};

} // namespace ingest_service
