#include "internal/orchestration/executor.hpp"

#include <sqlite3.h>

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/device_registry.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace {

using ure::orchestration::ExecHandle;
using ure::orchestration::ExecRequest;
using ure::orchestration::OrchestrationExecutor;

std::string FreshSqlitePath(const std::string& name) {
  const auto path = std::filesystem::temp_directory_path() / ("ure_" + name + ".db");
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");
  return path.string();
}

std::shared_ptr<ure::db::Repository> OpenSqlite(const std::string& path) {
  auto db = std::make_shared<ure::db::sqlite::SqliteDB>(path);
  db->Migrate();
  return std::make_shared<ure::db::sqlite::SqliteRepository>(std::move(db));
}

// Schema changes through a second connection, outside the repository.
void RunSql(const std::string& path, const std::string& sql) {
  sqlite3*  db     = nullptr;
  const int opened = sqlite3_open(path.c_str(), &db);
  assert(opened == SQLITE_OK);
  sqlite3_busy_timeout(db, 5000);
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr);
  sqlite3_close(db);
  assert(rc == SQLITE_OK);
}

// Every later UPDATE of an exec row fails to compile: the trigger body
// names a table that no longer exists.
void BreakExecUpdates(const std::string& path) {
  RunSql(path,
         "CREATE TABLE ure_fault (x INTEGER);"
         "CREATE TRIGGER ure_exec_update_fault BEFORE UPDATE ON orchestration_session_exec"
         " BEGIN INSERT INTO ure_fault VALUES (1); END;"
         "DROP TABLE ure_fault;");
}

void RepairExecUpdates(const std::string& path) {
  RunSql(path, "DROP TRIGGER ure_exec_update_fault;");
}

struct Fixture {
  explicit Fixture(std::shared_ptr<ure::db::Repository> repo = std::make_shared<ure::db::memory::MemoryRepository>())
      : repository(std::move(repo)) {
  }

  std::shared_ptr<ure::db::Repository> repository;
  ure::core::DeviceRegistry            devices{repository};
  OrchestrationExecutor                executor{repository};
  ure::core::DeviceIdentity            device = Device(devices);

  static ure::core::DeviceIdentity Device(ure::core::DeviceRegistry& registry) {
    ure::core::DeviceSpec spec;
    spec.name = "D1";
    return registry.Ensure(spec);
  }

  std::optional<ure::db::model::SessionStateRecord> State(const std::string& owner, const std::string& from,
                                                          const std::string& to) {
    auto tx    = repository->Begin();
    auto state = repository->FindSessionState(*tx, owner, from, to);
    tx->Commit();
    return state;
  }

  ExecHandle Step(const std::string& session, const std::string& code,
                  const std::optional<std::string>& parent = std::nullopt) {
    ExecRequest request;
    request.session_id     = session;
    request.exec_code      = code;
    request.parent_exec_id = parent;
    return executor.Exec(request);
  }
};

template <typename Exception, typename Fn>
void ExpectThrows(Fn&& fn) {
  bool thrown = false;
  try {
    fn();
  } catch (const Exception&) {
    thrown = true;
  }
  assert(thrown);
}

void TestSessionLifecycleCompletes() {
  Fixture f;

  const auto session = f.executor.BeginSession(f.device, "ingest", "0.1.0", std::string(R"({"roots":["/docs"]})"));
  assert(f.State(session, "NONE", "RUNNING").has_value());
  assert(f.executor.ResumeSession(session).orchestration_session_id == session);

  auto root = f.Step(session, "root");
  assert(root.Finish(0) == 0);

  f.executor.EndSession(session);
  const auto completed = f.State(session, "RUNNING", "COMPLETED");
  assert(completed.has_value());
  assert(completed->transition_result == std::string("success"));
  assert(!f.State(session, "RUNNING", "FAILED").has_value());

  const auto report = f.executor.Report(session);
  assert(report.session.orch_finished_at_ms.has_value());
  assert(report.failed_execs == 0);
  assert(report.session.diagnostics_md.has_value());
  const auto diagnostics = ure::util::ParseJsonObject(report.session.diagnostics_json);
  assert(diagnostics.has_value());
  assert(diagnostics->fields().at("execs").number_value() == 1);

  ExpectThrows<ure::util::AlreadyClosedError>([&]() { f.executor.EndSession(session); });
  ExpectThrows<ure::util::AlreadyClosedError>([&]() { f.executor.ResumeSession(session); });
  ExpectThrows<ure::util::NotFound>([&]() { f.executor.ResumeSession("no-such-session"); });
}

void TestSessionWithFailedExecEndsFailed() {
  Fixture f;
  const auto session = f.executor.BeginSession(f.device, "ingest", "0.1.0");

  auto exec = f.Step(session, "broken");
  assert(exec.Fail(4, "exploded") == 4);

  f.executor.EndSession(session);
  const auto failed = f.State(session, "RUNNING", "FAILED");
  assert(failed.has_value());
  assert(failed->transition_result == std::string("1 exec(s) failed"));
}

void TestExplicitSessionIds() {
  Fixture f;

  ure::orchestration::SessionRequest request;
  request.device_id  = f.device.DeviceId();
  request.session_id = "S1";
  assert(f.executor.BeginSession(request) == "S1");
  ExpectThrows<ure::util::AlreadyExists>([&]() { f.executor.BeginSession(request); });

  f.executor.EndSession("S1");
  ExpectThrows<ure::util::AlreadyClosedError>([&]() { f.executor.BeginSession(request); });

  request.session_id = "S2";
  request.device_id  = "unknown-device";
  ExpectThrows<ure::util::DeviceUnknownError>([&]() { f.executor.BeginSession(request); });

  request.device_id = f.device.DeviceId();
  request.args      = std::string("{not json");
  ExpectThrows<ure::util::ValidationError>([&]() { f.executor.BeginSession(request); });
}

void TestParentMustBelongToSameSession() {
  Fixture f;
  const auto first  = f.executor.BeginSession(f.device, "ingest", "0.1.0");
  const auto second = f.executor.BeginSession(f.device, "ingest", "0.1.0");

  auto parent = f.Step(first, "parent");
  ExpectThrows<ure::util::ReferentialError>([&]() { f.Step(second, "child", parent.Id()); });
  ExpectThrows<ure::util::ReferentialError>([&]() { f.Step(first, "child", std::string("missing")); });
  ExpectThrows<ure::util::ReferentialError>([&]() { f.Step("missing-session", "child"); });

  const auto entry_of_second = f.executor.BeginEntry(second, "ingest");
  ExpectThrows<ure::util::ReferentialError>([&]() {
    ExecRequest request;
    request.session_id = first;
    request.entry_id   = entry_of_second;
    request.exec_code  = "wrong-entry";
    f.executor.Exec(request);
  });

  parent.Finish(0);
}

void TestChildFailurePropagatesUnlessOverridden() {
  Fixture f;
  const auto session = f.executor.BeginSession(f.device, "ingest", "0.1.0");

  auto parent = f.Step(session, "parent");
  auto ok     = f.Step(session, "ok", parent.Id());
  auto bad    = f.Step(session, "bad", parent.Id());
  ok.Finish(0);
  bad.Fail(2, "unreadable");
  assert(parent.Finish(0) == 2);

  auto tolerant = f.Step(session, "tolerant");
  auto child    = f.Step(session, "child", tolerant.Id());
  child.Fail(1, "invalid");
  assert(tolerant.Finish(0, std::string("partial"), std::string("text"), true) == 0);

  ExpectThrows<ure::util::AlreadyClosedError>([&]() { parent.Finish(0); });
  const auto tree = f.executor.ExecTree(session);
  assert(tree.size() == 2);
  assert(tree[0].record.exec_code == "parent");
  assert(tree[0].record.exec_status == 2);
  assert(tree[0].record.narrative_md.has_value());
  assert(tree[0].children.size() == 2);
  assert(tree[0].children[0].record.sibling_order == 0);
  assert(tree[0].children[1].record.sibling_order == 1);
  assert(tree[1].record.exec_status == 0);
  assert(tree[1].record.output_text == std::string("partial"));

  // Rejected Fail leaves the handle open; it is abandoned on unwind.
  ExpectThrows<ure::util::ValidationError>([&]() {
    auto another = f.Step(session, "another");
    another.Fail(0, "zero is success");
  });
  assert(f.executor.ExecTree(session)[2].record.exec_status == ExecHandle::kAbandonedStatus);
}

void VerifyLateChildFailureRaisesFinishedAncestors(std::shared_ptr<ure::db::Repository> repository) {
  Fixture f(std::move(repository));
  const auto session = f.executor.BeginSession(f.device, "ingest", "0.1.0");

  auto root = f.Step(session, "root");
  auto mid  = f.Step(session, "mid", root.Id());
  auto leaf = f.Step(session, "leaf", mid.Id());
  assert(mid.Finish(0) == 0);
  assert(root.Finish(0) == 0);
  assert(leaf.Fail(7, "late") == 7);

  auto tolerant = f.Step(session, "tolerant");
  auto ignored  = f.Step(session, "ignored", tolerant.Id());
  assert(tolerant.Finish(0, std::nullopt, std::nullopt, true) == 0);
  ignored.Fail(3, "tolerated");

  auto failed = f.Step(session, "failed");
  auto first  = f.Step(session, "first", failed.Id());
  auto second = f.Step(session, "second", failed.Id());
  assert(failed.Fail(5, "own failure") == 5);
  first.Fail(9, "after parent");
  second.Finish(0);

  const auto tree = f.executor.ExecTree(session);
  assert(tree.size() == 3);
  assert(tree[0].record.exec_status == 7);
  assert(tree[0].record.narrative_md.has_value());
  assert(tree[0].children[0].record.exec_status == 7);
  assert(tree[0].children[0].children[0].record.exec_status == 7);
  assert(tree[1].record.exec_status == 0);
  assert(tree[1].record.override_children);
  assert(tree[1].children[0].record.exec_status == 3);
  assert(tree[2].record.exec_status == 5);
  assert(tree[2].record.exec_error_text == std::string("own failure"));

  f.executor.EndSession(session);
  assert(f.State(session, "RUNNING", "FAILED").has_value());
}

void TestLogParentMustBelongToSameSession() {
  Fixture f;
  const auto first  = f.executor.BeginSession(f.device, "ingest", "0.1.0");
  const auto second = f.executor.BeginSession(f.device, "ingest", "0.1.0");

  ure::orchestration::LogRequest log;
  log.session_id   = first;
  log.content      = "container";
  const auto owner = f.executor.Log(log);

  ure::orchestration::LogRequest stray;
  stray.session_id    = second;
  stray.parent_log_id = owner;
  stray.content       = "misplaced child";
  ExpectThrows<ure::util::ReferentialError>([&]() { f.executor.Log(stray); });

  stray.parent_log_id = std::string("missing-log");
  ExpectThrows<ure::util::ReferentialError>([&]() { f.executor.Log(stray); });

  assert(f.executor.Report(second).logs.empty());
}

void TestFinishSurvivesStoreFailure() {
  const auto path = FreshSqlitePath("executor_finish_failure");
  Fixture    f(OpenSqlite(path));
  const auto session = f.executor.BeginSession(f.device, "ingest", "0.1.0");

  auto retried = f.Step(session, "retried");
  BreakExecUpdates(path);
  ExpectThrows<std::exception>([&]() { retried.Finish(0); });
  assert(!retried.Finished());
  RepairExecUpdates(path);
  assert(retried.Finish(0) == 0);
  assert(retried.Finished());

  {
    auto dropped = f.Step(session, "dropped");
    BreakExecUpdates(path);
    ExpectThrows<std::exception>([&]() { dropped.Fail(4, "store down"); });
    assert(!dropped.Finished());
    RepairExecUpdates(path);
  }

  const auto tree = f.executor.ExecTree(session);
  assert(tree.size() == 2);
  assert(tree[0].record.exec_status == 0);
  assert(tree[0].record.finished_at_ms.has_value());
  assert(tree[1].record.exec_status == ExecHandle::kAbandonedStatus);
  assert(tree[1].record.finished_at_ms.has_value());
}

void TestAbandonedHandleIsRecordedAsFailure() {
  Fixture f;
  const auto session = f.executor.BeginSession(f.device, "ingest", "0.1.0");

  std::string id;
  {
    auto exec = f.Step(session, "dropped");
    id        = exec.Id();
    auto moved = std::move(exec);
    assert(!moved.Finished());
  }

  const auto tree = f.executor.ExecTree(session);
  assert(tree.size() == 1);
  assert(tree[0].record.orchestration_session_exec_id == id);
  assert(tree[0].record.exec_status == ExecHandle::kAbandonedStatus);
  assert(tree[0].record.finished_at_ms.has_value());
}

void TestTransitionOverwriteKeepsOneRow() {
  Fixture f;

  ure::orchestration::SessionRequest request;
  request.device_id  = f.device.DeviceId();
  request.session_id = "S1";
  f.executor.BeginSession(request);

  ure::orchestration::TransitionRequest transition;
  transition.session_id = "S1";
  transition.from_state = "OPEN";
  transition.to_state   = "RUNNING";
  transition.result     = "r1";
  f.executor.RecordTransition(transition);
  transition.result = "r2";
  f.executor.RecordTransition(transition);

  const auto state = f.State("S1", "OPEN", "RUNNING");
  assert(state.has_value());
  assert(state->transition_result == std::string("r2"));
  assert(state->transition_count == 2);

  std::size_t matching = 0;
  for (const auto& row : f.executor.Report("S1").states) {
    if (row.from_state == "OPEN" && row.to_state == "RUNNING") {
      ++matching;
    }
  }
  assert(matching == 1);

  transition.from_state = "";
  ExpectThrows<ure::util::ValidationError>([&]() { f.executor.RecordTransition(transition); });
}

void TestIssuesAreAppendOnlyAndNeverThrow() {
  Fixture f;
  const auto session = f.executor.BeginSession(f.device, "ingest", "0.1.0");
  const auto entry   = f.executor.BeginEntry(session, "ingest", std::string("uniform_resource"));

  ure::orchestration::IssueRequest issue;
  issue.session_id    = session;
  issue.entry_id      = entry;
  issue.issue_type    = "unit.invalid";
  issue.message       = "bad front-matter";
  issue.row           = 3;
  issue.invalid_value = "---";

  const auto first = f.executor.RecordIssue(issue);
  issue.message     = "bad front-matter again";
  const auto second = f.executor.RecordIssue(issue);
  assert(first.has_value());
  assert(second.has_value());
  assert(*first != *second);

  const auto relation = f.executor.RelateIssues(*first, *second, "duplicate-of");
  assert(!relation.empty());

  issue.session_id = "missing-session";
  assert(!f.executor.RecordIssue(issue).has_value());

  issue.session_id  = session;
  issue.elaboration = std::string("{broken");
  assert(!f.executor.RecordIssue(issue).has_value());

  const auto issues = f.executor.Report(session).issues;
  assert(issues.size() == 2);
  assert(issues[0].issue_message == "bad front-matter");
  assert(issues[1].issue_message == "bad front-matter again");
  assert(issues[0].issue_row == std::optional<int64_t>(3));
}

void TestLogsOrderAndReplay() {
  Fixture f;
  const auto session = f.executor.BeginSession(f.device, "ingest", "0.1.0");
  auto       exec    = f.Step(session, "root");

  ure::orchestration::LogRequest log;
  log.session_id   = session;
  log.exec_id      = exec.Id();
  log.category     = "container";
  log.content      = "fs:/docs";
  const auto top   = f.executor.Log(log);

  log.parent_log_id = top;
  log.category      = "unit";
  log.content       = "a.md ADMITTED";
  f.executor.Log(log);
  log.content = "b.md ADMITTED";
  f.executor.Log(log);

  ure::orchestration::LogRequest foreign;
  foreign.session_id = f.executor.BeginSession(f.device, "ingest", "0.1.0");
  foreign.exec_id    = exec.Id();
  foreign.content    = "misplaced";
  ExpectThrows<ure::util::ReferentialError>([&]() { f.executor.Log(foreign); });

  exec.Finish(0);

  const auto report = f.executor.Report(session);
  const auto lines  = ure::orchestration::ReplayLog(report.logs);
  const std::vector<std::string> expected{"[container] fs:/docs", "  [unit] a.md ADMITTED", "  [unit] b.md ADMITTED"};
  assert(lines == expected);
}

void TestLateRecordsAfterEndAreKept() {
  Fixture f;
  const auto session = f.executor.BeginSession(f.device, "ingest", "0.1.0");
  f.executor.EndSession(session);

  auto late = f.Step(session, "late");
  late.Finish(0);

  ure::orchestration::IssueRequest issue;
  issue.session_id = session;
  issue.issue_type = "late";
  issue.message    = "arrived after end";
  assert(f.executor.RecordIssue(issue).has_value());

  ure::orchestration::LogRequest log;
  log.session_id = session;
  log.content    = "late log";
  f.executor.Log(log);

  const auto report = f.executor.Report(session);
  assert(report.exec_tree.size() == 1);
  assert(report.issues.size() == 1);
  assert(report.logs.size() == 1);
}

void TestJournalRoutesIngestEvents() {
  Fixture f;
  const auto session = f.executor.BeginSession(f.device, "ingest", "0.1.0");
  const auto entry   = f.executor.BeginEntry(session, "ingest");

  auto journal = f.executor.JournalFor(session, entry);
  journal->RecordTransition("path-entry-1", "NONE", "ADMITTED", std::string("new"), std::nullopt);
  journal->RecordIssue("unit.unreadable", "permission denied", std::string("/docs/x.md"), std::nullopt);

  const auto state = f.State("path-entry-1", "NONE", "ADMITTED");
  assert(state.has_value());
  assert(state->session_entry_id == entry);
  assert(state->session_id == session);

  const auto issues = f.executor.Report(session).issues;
  assert(issues.size() == 1);
  assert(issues[0].session_entry_id == entry);

  // Unknown sessions are logged and dropped.
  auto orphan = f.executor.JournalFor("missing-session", std::nullopt);
  orphan->RecordTransition("owner", "NONE", "ADMITTED", std::nullopt, std::nullopt);
  orphan->RecordIssue("x", "y", std::nullopt, std::nullopt);
}

} // namespace

int main() {
  TestSessionLifecycleCompletes();
  TestSessionWithFailedExecEndsFailed();
  TestExplicitSessionIds();
  TestParentMustBelongToSameSession();
  TestChildFailurePropagatesUnlessOverridden();
  VerifyLateChildFailureRaisesFinishedAncestors(std::make_shared<ure::db::memory::MemoryRepository>());
  VerifyLateChildFailureRaisesFinishedAncestors(OpenSqlite(FreshSqlitePath("executor_late_child")));
  TestLogParentMustBelongToSameSession();
  TestFinishSurvivesStoreFailure();
  TestAbandonedHandleIsRecordedAsFailure();
  TestTransitionOverwriteKeepsOneRow();
  TestIssuesAreAppendOnlyAndNeverThrow();
  TestLogsOrderAndReplay();
  TestLateRecordsAfterEndAreKept();
  TestJournalRoutesIngestEvents();

  std::cout << "ure_unit_executor: pass\n";
  return 0;
}
