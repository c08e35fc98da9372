#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

#include "common/macros.h"

namespace Common {

  /// Fixed-width worker pool. At most `width` tasks run at once; the rest
  /// wait in FIFO order. The destructor drains queued tasks before joining.
  class ThreadPool {
  public:
    static constexpr size_t MAX_THREADS = 64;

    explicit ThreadPool(size_t width)
      : num_workers_(width == 0 ? 1 : (width > MAX_THREADS ? MAX_THREADS : width)),
        workers_(), tasks_(), queue_mutex_(), condition_(), stopped_{false} {
      workers_.reserve(num_workers_);
      for (size_t i = 0; i < num_workers_; ++i) {
        workers_.emplace_back([this] { workerLoop(); });
      }
    }

    DELETE_COPY_AND_MOVE(ThreadPool);

    ~ThreadPool() {
      {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stopped_.store(true, std::memory_order_release);
      }
      condition_.notify_all();

      for (auto& worker : workers_) {
        if (worker.joinable()) {
          worker.join();
        }
      }
    }

    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>> {
      using R = std::invoke_result_t<F, Args...>;

      auto task = std::make_shared<std::packaged_task<R()>>(
        [f = std::forward<F>(f), ...args = std::forward<Args>(args)]() mutable {
          return std::invoke(std::move(f), std::move(args)...);
        });
      std::future<R> result = task->get_future();

      {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stopped_.load(std::memory_order_acquire)) {
          throw std::runtime_error("enqueue on stopped ThreadPool");
        }
        tasks_.emplace_back([task] { (*task)(); });
      }
      condition_.notify_one();
      return result;
    }

    [[nodiscard]] auto width() const noexcept -> size_t { return num_workers_; }

  private:
    void workerLoop() {
      while (true) {
        std::function<void()> task;
        {
          std::unique_lock<std::mutex> lock(queue_mutex_);
          condition_.wait(lock, [this] {
            return stopped_.load(std::memory_order_acquire) || !tasks_.empty();
          });

          if (stopped_.load(std::memory_order_acquire) && tasks_.empty()) {
            break;
          }

          task = std::move(tasks_.front());
          tasks_.pop_front();
        }
        task();
      }
    }

    size_t num_workers_;
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stopped_;
  };

} // namespace Common
