#pragma once

#include "application/job_store.hpp"
#include "application/video_processor.hpp"

#include <atomic>
#include <cstddef>
#include <string>
#include <thread>
#include <vector>

namespace ingest_service {

// W long-lived threads, each looping dequeue -> process -> release until the
// job store is shut down and drained.
class WorkerPool {
public:
  WorkerPool(JobStore& store, VideoProcessor& processor, unsigned int size);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void start();
  // Shuts the store down and joins the workers once the queue is drained.
  void stop();

  unsigned int size() const { return size_; }
  size_t processed() const { return processed_.load(std::memory_order_relaxed); }

private:
  void loop(unsigned int worker_id);
  void handle(const std::string& tag, Job job);

  JobStore& store_;
  VideoProcessor& processor_;
  const unsigned int size_;
  std::vector<std::jthread> threads_;
  std::atomic<size_t> processed_{0};
};

} // namespace ingest_service
