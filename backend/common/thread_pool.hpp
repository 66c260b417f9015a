#pragma once

#include <vector>
#include <thread>
#include <future>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <functional>
#include <memory>
#include <stdexcept>
#include <type_traits>

namespace common {

// Fixed-size task executor. Tasks already committed are still run after
// shutdown() is requested; the destructor waits for them.
class ThreadPool {
public:
  explicit ThreadPool(unsigned int size) : _poolSize(size < 1 ? 1 : size) {
    _threads.reserve(_poolSize);
    for (size_t i = 0; i < _poolSize; i++) {
      _threads.emplace_back([this]() { loop(); });
    }
  }

  ~ThreadPool() {
    shutdown();
  }

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  template <typename Func, typename... Args>
  auto commit(Func&& func, Args&&... args) -> std::future<std::invoke_result_t<Func, Args...>> {
    using ReturnType = std::invoke_result_t<Func, Args...>;

    if (_stop.load(std::memory_order_acquire)) {
      throw std::runtime_error("ThreadPool is stopped");
    }

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
      std::bind(std::forward<Func>(func), std::forward<Args>(args)...)
    );

    auto ret = task->get_future();
    {
      std::lock_guard<std::mutex> lock{_mtx};
      _tasks.emplace([task]() { (*task)(); });
    }
    _cv.notify_one();
    return ret;
  }

  void shutdown() {
    _stop.store(true, std::memory_order_release);
    _cv.notify_all();
    for (auto& thread : _threads) {
      if (thread.joinable()) {
        thread.join();
      }
    }
  }

  size_t size() const { return _poolSize; }

private:
  using Task = std::function<void()>;

  void loop() {
    while (true) {
      Task task;
      {
        std::unique_lock<std::mutex> lock{_mtx};
        _cv.wait(lock, [this]() -> bool {
          return _stop.load(std::memory_order_acquire) || !_tasks.empty();
        });

        if (_stop.load(std::memory_order_acquire) && _tasks.empty()) {
          break;
        }

        task = std::move(_tasks.front());
        _tasks.pop();
      }
      task();
    }
  }

  std::mutex _mtx;
  std::condition_variable _cv;

  std::queue<Task> _tasks;
  std::vector<std::jthread> _threads;

  std::atomic_bool _stop{false};
  size_t _poolSize{0};
};

} // namespace common
