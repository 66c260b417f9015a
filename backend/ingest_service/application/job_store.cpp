#include "job_store.hpp"
#include <stdexcept>

namespace ingest_service {

JobStore::JobStore(size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument("JobStore capacity must be positive");
  }
}

bool JobStore::tryAdmit() {
  size_t current = occupancy_.load(std::memory_order_acquire);
  do {
    if (current >= capacity_) {
      return false;
    }
  } while (!occupancy_.compare_exchange_weak(current, current + 1,
                                             std::memory_order_acq_rel,
                                             std::memory_order_acquire));
  return true;
}

std::expected<void, Job> JobStore::enqueue(Job job) {
  {
    std::lock_guard<std::mutex> lock{mtx_};
    if (stop_) {
      return std::unexpected(std::move(job));
    }
    jobs_.push_back(std::move(job));
  }
  job_available_.notify_one();
  return {};
}

std::optional<Job> JobStore::dequeue() {
  std::unique_lock<std::mutex> lock{mtx_};
  job_available_.wait(lock, [this]() { return stop_ || !jobs_.empty(); });
  if (jobs_.empty()) {
    return std::nullopt;
  }
  Job job = std::move(jobs_.front());
  jobs_.pop_front();
  return job;
}

std::optional<Job> JobStore::tryDequeue() {
  std::lock_guard<std::mutex> lock{mtx_};
  if (jobs_.empty()) {
    return std::nullopt;
  }
  Job job = std::move(jobs_.front());
  jobs_.pop_front();
  return job;
}

void JobStore::release() {
  size_t current = occupancy_.load(std::memory_order_acquire);
  do {
    if (current == 0) {
      throw std::logic_error("JobStore::release() without a matching admission");
    }
  } while (!occupancy_.compare_exchange_weak(current, current - 1,
                                             std::memory_order_acq_rel,
                                             std::memory_order_acquire));
  if (current == 1) {
    // Lock so a waiter cannot miss the notification between its check and wait.
    std::lock_guard<std::mutex> lock{mtx_};
    idle_.notify_all();
  }
}

void JobStore::shutdown() {
  {
    std::lock_guard<std::mutex> lock{mtx_};
    stop_ = true;
  }
  job_available_.notify_all();
}

bool JobStore::waitUntilIdle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock{mtx_};
  return idle_.wait_for(lock, timeout, [this]() {
    return occupancy_.load(std::memory_order_acquire) == 0;
  });
}

size_t JobStore::queued() const {
  std::lock_guard<std::mutex> lock{mtx_};
  return jobs_.size();
}

} // namespace ingest_service
