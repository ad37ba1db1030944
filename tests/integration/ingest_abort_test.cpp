#include <sqlite3.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/ingest/fs_adapter.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

namespace fs = std::filesystem;

using ure::pipeline::IngestPipeline;

void WriteFile(const fs::path& path, const std::string& body) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path);
  out << body;
}

fs::path MakeTree(const std::string& name, int files) {
  const auto root = fs::temp_directory_path() / ("ure_" + name + "_" + std::to_string(ure::util::NowMs()));
  fs::remove_all(root);
  for (int i = 0; i < files; ++i) {
    WriteFile(root / ("doc" + std::to_string(i) + ".md"), "# doc " + std::to_string(i) + "\n");
  }
  return root;
}

std::string FreshDatabase(const std::string& name) {
  const auto path = fs::temp_directory_path() / ("ure_" + name + ".db");
  fs::remove(path);
  fs::remove(path.string() + "-wal");
  fs::remove(path.string() + "-shm");
  return path.string();
}

std::string ConfigFor(const std::string& db_path, const fs::path& root) {
  return "database:\n"
         "  sqlite:\n"
         "    path: \"" + db_path + "\"\n"
         "device:\n"
         "  name: D1\n"
         "ingest:\n"
         "  workers: 1\n"
         "  roots:\n"
         "    - path: \"" + root.string() + "\"\n";
}

void RunSql(const std::string& path, const std::string& sql) {
  sqlite3*  db     = nullptr;
  const int opened = sqlite3_open(path.c_str(), &db);
  assert(opened == SQLITE_OK);
  sqlite3_busy_timeout(db, 5000);
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr);
  sqlite3_close(db);
  assert(rc == SQLITE_OK);
}

std::string OnlySessionId(const std::string& path) {
  sqlite3*  db     = nullptr;
  const int opened = sqlite3_open(path.c_str(), &db);
  assert(opened == SQLITE_OK);

  std::vector<std::string> ids;
  sqlite3_stmt*            st = nullptr;
  const int prepared = sqlite3_prepare_v2(db, "SELECT orchestration_session_id FROM orchestration_session;", -1, &st,
                                          nullptr);
  assert(prepared == SQLITE_OK);
  while (sqlite3_step(st) == SQLITE_ROW) {
    ids.emplace_back(reinterpret_cast<const char*>(sqlite3_column_text(st, 0)));
  }
  sqlite3_finalize(st);
  sqlite3_close(db);

  assert(ids.size() == 1);
  return ids[0];
}

// Inserts into `table` stop compiling once the trigger's target is gone.
void BreakInserts(const std::string& path, const std::string& table) {
  RunSql(path, "CREATE TABLE ure_fault (x INTEGER);"
               "CREATE TRIGGER ure_insert_fault BEFORE INSERT ON " + table +
                   " BEGIN INSERT INTO ure_fault VALUES (1); END;"
               "DROP TABLE ure_fault;");
}

// Filesystem source that breaks exec inserts right after discovery, so
// container execs exist and every unit exec fails to start.
class ExecInsertFaultAdapter final : public ure::ingest::SourceAdapter {
 public:
  explicit ExecInsertFaultAdapter(std::string db_path) : db_path_(std::move(db_path)) {
  }

  std::string Kind() const override {
    return "fs";
  }

  std::vector<ure::ingest::DiscoveredUnit> Discover(const std::string& locator) override {
    auto units = inner_.Discover(locator);
    BreakInserts(db_path_, "orchestration_session_exec");
    return units;
  }

  ure::ingest::CandidateOutcome ProduceCandidate(const std::string& session_id, const std::string& unit_id) override {
    return inner_.ProduceCandidate(session_id, unit_id);
  }

 private:
  std::string                    db_path_;
  ure::ingest::FilesystemAdapter inner_;
};

bool HasState(const ure::orchestration::SessionReport& report, const std::string& to_state) {
  for (const auto& state : report.states) {
    if (state.owner_id == report.session.orchestration_session_id && state.to_state == to_state) {
      return true;
    }
  }
  return false;
}

const ure::db::model::IssueRecord* FindIssue(const ure::orchestration::SessionReport& report, const std::string& type) {
  for (const auto& issue : report.issues) {
    if (issue.issue_type == type) {
      return &issue;
    }
  }
  return nullptr;
}

void TestStoreFailureDuringAdmissionAbortsRun() {
  const auto db_path = FreshDatabase("abort_admission");
  const auto root    = MakeTree("abort_admission", 4);
  const auto config  = ure::config::ConfigLoader::LoadFromYamlString(ConfigFor(db_path, root));

  auto       runtime = ure::factory::BuildRuntime(config);
  const auto device  = runtime.devices->Ensure(ure::factory::BuildDeviceSpec(config));
  const auto rules   = ure::factory::BuildRuleSet(config, *runtime.repository);
  const auto options = ure::factory::BuildPipelineOptions(config);

  BreakInserts(db_path, "uniform_resource");

  bool aborted = false;
  try {
    runtime.pipeline->Run(device, options, rules);
  } catch (const ure::util::StoreFailure&) {
    aborted = true;
  }
  assert(aborted);

  const auto report = runtime.executor->Report(OnlySessionId(db_path));
  assert(report.session.orch_finished_at_ms.has_value());
  assert(HasState(report, "FAILED"));

  // The first unit hit the failure; the other three never started.
  assert(report.exec_tree.size() == 1);
  const auto& container = report.exec_tree[0];
  assert(container.record.exec_status == IngestPipeline::kFatalStatus);
  assert(container.children.size() == 1);
  assert(container.children[0].record.exec_status == IngestPipeline::kFatalStatus);

  const auto* issue = FindIssue(report, "ingest.aborted");
  assert(issue != nullptr);
  assert(issue->issue_message.find("3 unit(s) skipped") != std::string::npos);

  const auto resources = runtime.store->ListLive(device.DeviceId());
  assert(resources.empty());

  auto       tx       = runtime.repository->Begin();
  const auto sessions = runtime.repository->ListIngestSessions(*tx, device.DeviceId());
  tx->Commit();
  assert(sessions.size() == 1);
  assert(sessions[0].ingest_finished_at_ms.has_value());
  assert(runtime.sessions->Entries(sessions[0].ingest_session_id).size() == 1);

  fs::remove_all(root);
}

void TestUnitExecFailureAbortsRun() {
  const auto db_path = FreshDatabase("abort_exec");
  const auto root    = MakeTree("abort_exec", 3);
  const auto config  = ure::config::ConfigLoader::LoadFromYamlString(ConfigFor(db_path, root));

  auto       runtime = ure::factory::BuildRuntime(config);
  const auto device  = runtime.devices->Ensure(ure::factory::BuildDeviceSpec(config));
  const auto rules   = ure::factory::BuildRuleSet(config, *runtime.repository);
  const auto options = ure::factory::BuildPipelineOptions(config);
  runtime.adapters->Register(std::make_shared<ExecInsertFaultAdapter>(db_path));

  bool aborted = false;
  try {
    runtime.pipeline->Run(device, options, rules);
  } catch (const ure::util::StoreFailure&) {
    aborted = true;
  }
  assert(aborted);

  const auto report = runtime.executor->Report(OnlySessionId(db_path));
  assert(HasState(report, "FAILED"));
  assert(report.failed_execs == 1);

  assert(report.exec_tree.size() == 1);
  assert(report.exec_tree[0].record.exec_status == IngestPipeline::kFatalStatus);
  assert(report.exec_tree[0].children.empty());

  const auto* issue = FindIssue(report, "ingest.aborted");
  assert(issue != nullptr);
  assert(issue->issue_message.find("2 unit(s) skipped") != std::string::npos);
  assert(issue->invalid_value.has_value());

  auto       tx       = runtime.repository->Begin();
  const auto sessions = runtime.repository->ListIngestSessions(*tx, device.DeviceId());
  tx->Commit();
  assert(sessions.size() == 1);
  assert(runtime.sessions->Entries(sessions[0].ingest_session_id).empty());

  fs::remove_all(root);
}

} // namespace

int main() {
  TestStoreFailureDuringAdmissionAbortsRun();
  TestUnitExecFailureAbortsRun();

  std::cout << "ure_integration_ingest_abort: pass\n";
  return 0;
}
