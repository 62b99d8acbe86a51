#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace quizsync {

// FIFO task queue drained by a fixed set of workers. With one worker it is a
// serialized executor: tasks run one at a time in enqueue order.
class ThreadPool {
 public:
  explicit ThreadPool(std::size_t workers);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  // Returns false once shutdown has begun; the task is then discarded.
  bool enqueue(std::function<void()> task);

  // Drains queued tasks, then joins the workers. Idempotent.
  void shutdown();

  bool is_worker_thread() const;

 private:
  void worker_loop();

  std::mutex mtx_;
  std::condition_variable cv_;
  std::queue<std::function<void()>> tasks_;
  bool stopping_{false};
  std::vector<std::thread> threads_;
};

}  // namespace quizsync
