#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace ure::ingest {

// One unit of ingestion work: a discovered unit under a registered container.
struct IngestTask {
  std::string path_id;
  std::string source_kind;
  std::string abs_path;
  std::string rel_path;
  // Exec the unit's work is recorded under, when orchestrated.
  std::string parent_exec_id;
};

/*
  Thread-safe blocking queue for ingest workers.
*/
class WorkQueue {
 public:
  void Enqueue(IngestTask task);

  // Blocks until a task is available. nullopt once shut down and drained.
  std::optional<IngestTask> Dequeue();

  // Wakes all waiters; queued tasks are still handed out.
  void Shutdown();

  // Shuts down and discards queued tasks. Returns how many were dropped.
  std::size_t Abort();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<IngestTask>  queue_;
  bool                    shutdown_ = false;
};

} // namespace ure::ingest
