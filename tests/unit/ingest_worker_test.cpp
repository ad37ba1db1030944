#include "internal/ingest/ingest_worker.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/ingest/work_queue.hpp"

namespace {

using ure::ingest::IngestTask;
using ure::ingest::IngestWorkerPool;
using ure::ingest::WorkQueue;

IngestTask Task(const std::string& rel) {
  return IngestTask{"path-1", "fs", "/docs/" + rel, rel, "exec-1"};
}

void TestAbortDropsQueuedTasks() {
  WorkQueue queue;
  queue.Enqueue(Task("a.md"));
  queue.Enqueue(Task("b.md"));
  queue.Enqueue(Task("c.md"));

  const auto first = queue.Dequeue();
  assert(first.has_value());
  assert(first->rel_path == "a.md");

  assert(queue.Abort() == 2);
  assert(!queue.Dequeue().has_value());
  assert(queue.Abort() == 0);

  bool rejected = false;
  try {
    queue.Enqueue(Task("d.md"));
  } catch (const std::logic_error&) {
    rejected = true;
  }
  assert(rejected);
}

void TestShutdownStillDrains() {
  auto queue = std::make_shared<WorkQueue>();
  for (int i = 0; i < 10; ++i) {
    queue->Enqueue(Task(std::to_string(i) + ".md"));
  }

  std::atomic<int> handled{0};
  IngestWorkerPool pool(queue, [&](const IngestTask&) { ++handled; }, 3);
  pool.Start();
  pool.Stop();

  assert(handled == 10);
  assert(pool.Failures() == 0);
}

void TestHandlerFailuresAreCounted() {
  auto queue = std::make_shared<WorkQueue>();
  for (int i = 0; i < 6; ++i) {
    queue->Enqueue(Task(std::to_string(i) + ".md"));
  }

  std::atomic<int> handled{0};
  IngestWorkerPool pool(
      queue,
      [&](const IngestTask& task) {
        ++handled;
        if (task.rel_path == "1.md" || task.rel_path == "4.md") {
          throw std::runtime_error("store unavailable");
        }
      },
      2);
  pool.Start();
  pool.Stop();

  assert(handled == 6);
  assert(pool.Failures() == 2);
}

} // namespace

int main() {
  TestAbortDropsQueuedTasks();
  TestShutdownStillDrains();
  TestHandlerFailuresAreCounted();

  std::cout << "ure_unit_ingest_worker: pass\n";
  return 0;
}
