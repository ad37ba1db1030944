#include "internal/orchestration/executor.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/device_registry.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"

namespace {

constexpr int kThreads  = 8;
constexpr int kChildren = 16;

std::shared_ptr<ure::db::Repository> MakeSqlite(const std::string& name) {
  const auto path = std::filesystem::temp_directory_path() / ("ure_" + name + ".db");
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");

  auto db = std::make_shared<ure::db::sqlite::SqliteDB>(path.string());
  db->Migrate();
  return std::make_shared<ure::db::sqlite::SqliteRepository>(std::move(db));
}

// Two executors share the store so order allocation cannot rely on
// per-instance state.
void VerifySiblingOrdersAreUnique(const std::shared_ptr<ure::db::Repository>& repository) {
  ure::core::DeviceRegistry devices(repository);
  ure::core::DeviceSpec     spec;
  spec.name         = "D1";
  const auto device = devices.Ensure(spec);

  ure::orchestration::OrchestrationExecutor first(repository);
  ure::orchestration::OrchestrationExecutor second(repository);

  const auto session = first.BeginSession(device, "ingest", "0.1.0");

  ure::orchestration::ExecRequest root_request;
  root_request.session_id = session;
  root_request.exec_code  = "root";
  auto root               = first.Exec(root_request);

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]() {
      auto& executor = t % 2 == 0 ? first : second;
      for (int i = 0; i < kChildren; ++i) {
        ure::orchestration::ExecRequest request;
        request.session_id     = session;
        request.parent_exec_id = root.Id();
        request.exec_code      = "child-" + std::to_string(t) + "-" + std::to_string(i);
        auto child             = executor.Exec(request);

        ure::orchestration::LogRequest log;
        log.session_id = session;
        log.exec_id    = child.Id();
        log.content    = request.exec_code;
        executor.Log(log);

        child.Finish(0);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  root.Finish(0);
  first.EndSession(session);

  const auto report = second.Report(session);
  assert(report.exec_tree.size() == 1);

  const auto& children = report.exec_tree[0].children;
  assert(children.size() == static_cast<std::size_t>(kThreads * kChildren));
  for (std::size_t i = 0; i < children.size(); ++i) {
    assert(children[i].record.sibling_order == static_cast<int64_t>(i));
  }

  std::set<int64_t> log_orders;
  for (const auto& log : report.logs) {
    log_orders.insert(log.sibling_order);
  }
  assert(log_orders.size() == report.logs.size());
  assert(report.logs.size() == static_cast<std::size_t>(kThreads * kChildren));
  assert(report.failed_execs == 0);
}

} // namespace

int main() {
  VerifySiblingOrdersAreUnique(std::make_shared<ure::db::memory::MemoryRepository>());
  VerifySiblingOrdersAreUnique(MakeSqlite("executor_concurrency"));

  std::cout << "ure_unit_executor_concurrency: pass\n";
  return 0;
}
