#include "worker_pool.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

namespace ingest_service {

WorkerPool::WorkerPool(JobStore& store, VideoProcessor& processor, unsigned int size)
  : store_(store), processor_(processor), size_(size) {
  if (size_ == 0) {
    throw std::invalid_argument("WorkerPool needs at least one worker");
  }
}

WorkerPool::~WorkerPool() {
  stop();
}

void WorkerPool::start() {
  if (!threads_.empty()) {
    return;
  }
  threads_.reserve(size_);
  for (unsigned int i = 0; i < size_; i++) {
    threads_.emplace_back([this, i]() { loop(i); });
  }
  std::cout << "[workers] Started " << size_ << " transcode workers" << std::endl;
}

void WorkerPool::stop() {
  store_.shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();
}

void WorkerPool::loop(unsigned int worker_id) {
  const std::string tag = "[worker-" + std::to_string(worker_id) + "] ";

  while (auto job = store_.dequeue()) {
    try {
      handle(tag, std::move(*job));
    } catch (const std::exception& e) {
      std::cerr << tag << "Job failed: " << e.what() << std::endl;
    }
    job.reset();

    processed_.fetch_add(1, std::memory_order_relaxed);
    store_.release();
  }
}

void WorkerPool::handle(const std::string& tag, Job job) {
  const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - job.admitted_at);
  std::cout << tag << "Processing " << job.display_name << " (job " << job.id
            << ", queued " << waited.count() << "ms)" << std::endl;

  // process() consumes the job, so its name reservation is gone before release().
  auto report = processor_.process(std::move(job));

  switch (report.outcome) {
    case ProcessOutcome::Transcoded:
      std::cout << tag << "Done: " << report.published->filename().string() << std::endl;
      break;
    case ProcessOutcome::Fallback:
      std::cout << tag << "Done without transcoding (" << report.message << "): "
                << report.published->filename().string() << std::endl;
      break;
    case ProcessOutcome::Dropped:
      std::cerr << tag << "Dropped: " << report.message << std::endl;
      break;
  }
}

} // namespace ingest_service
