#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

#include "work_queue.hpp"

namespace ure::ingest {

/*
  Fixed pool of threads draining a WorkQueue.

  The handler runs once per task. Exceptions it throws are logged and
  counted; they never stop the pool.
*/
class IngestWorkerPool {
 public:
  using Handler = std::function<void(const IngestTask&)>;

  IngestWorkerPool(std::shared_ptr<WorkQueue> queue, Handler handler, std::size_t threads);
  ~IngestWorkerPool();

  IngestWorkerPool(const IngestWorkerPool&)            = delete;
  IngestWorkerPool& operator=(const IngestWorkerPool&) = delete;

  void Start();

  // Shuts the queue down, lets workers drain it and joins them.
  void Stop();

  std::size_t Failures() const {
    return failures_.load();
  }

 private:
  void Run();

  std::shared_ptr<WorkQueue> queue_;
  Handler                    handler_;
  std::size_t                thread_count_;

  std::vector<std::thread> threads_;
  std::atomic<std::size_t> failures_{0};
};

} // namespace ure::ingest
