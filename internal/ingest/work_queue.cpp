#include "work_queue.hpp"

#include <stdexcept>

namespace ure::ingest {

void WorkQueue::Enqueue(IngestTask task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      throw std::logic_error("enqueue on a shut down work queue");
    }
    queue_.push(std::move(task));
  }
  cv_.notify_one();
}

std::optional<IngestTask> WorkQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  IngestTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void WorkQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t WorkQueue::Abort() {
  std::size_t dropped = 0;
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    dropped   = queue_.size();
    queue_    = std::queue<IngestTask>();
  }
  cv_.notify_all();
  return dropped;
}

} // namespace ure::ingest
