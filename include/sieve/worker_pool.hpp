#pragma once

// sieve/worker_pool.hpp - Fixed-size thread pool for sandbox executions.
//
// The pool size is fixed at construction and independent of how many
// perturbations a problem has. Tasks run in submission order; a task that
// throws is the submitter's responsibility (the coordinator wraps every task
// so nothing escapes into a worker thread).

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace sieve {

class WorkerPool {
 public:
  // threads == 0 is clamped to 1.
  explicit WorkerPool(std::size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Returns false once shutdown() has begun; the task is not queued.
  bool submit(std::function<void()> task);

  // Stops accepting work, lets queued tasks drain, joins every thread.
  // Idempotent.
  void shutdown();

  std::size_t size() const { return threads_.size(); }
  std::uint64_t completed() const { return completed_.load(std::memory_order_relaxed); }

 private:
  void worker_loop();

  std::vector<std::thread> threads_;
  std::deque<std::function<void()>> queue_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool stopping_{false};
  std::atomic<std::uint64_t> completed_{0};
  std::once_flag joined_;
};

}  // namespace sieve
