#include "ingest_worker.hpp"

#include "internal/observability/logging.hpp"

namespace ure::ingest {

IngestWorkerPool::IngestWorkerPool(std::shared_ptr<WorkQueue> queue, Handler handler, std::size_t threads)
    : queue_(std::move(queue)), handler_(std::move(handler)), thread_count_(threads == 0 ? 1 : threads) {
}

IngestWorkerPool::~IngestWorkerPool() {
  Stop();
}

void IngestWorkerPool::Start() {
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&IngestWorkerPool::Run, this);
  }
}

void IngestWorkerPool::Stop() {
  queue_->Shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void IngestWorkerPool::Run() {
  while (true) {
    auto task = queue_->Dequeue();
    if (!task) break;

    try {
      handler_(*task);
    } catch (const std::exception& e) {
      ++failures_;
      URE_LOG_ERROR("ingest task failed",
                    {observability::StringField("path", task->abs_path), observability::StringField("error", e.what())});
    }
  }
}

} // namespace ure::ingest
