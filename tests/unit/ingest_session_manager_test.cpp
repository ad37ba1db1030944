#include "internal/ingest/ingest_session_manager.hpp"

#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/core/device_registry.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/ingest/fs_adapter.hpp"
#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using ure::ingest::DiscoveredUnit;
using ure::ingest::IngestSessionManager;
using ure::ingest::PathRuleSet;
using ure::model::EntryState;

struct Transition {
  std::string owner;
  std::string from;
  std::string to;
};

class RecordingJournal final : public ure::ingest::SessionJournal {
 public:
  void RecordTransition(const std::string& owner_id, std::string_view from, std::string_view to,
                        const std::optional<std::string>&, const std::optional<std::string>&) override {
    std::lock_guard<std::mutex> lock(mutex_);
    transitions.push_back(Transition{owner_id, std::string(from), std::string(to)});
  }

  void RecordIssue(const std::string& issue_type, const std::string&, const std::optional<std::string>&,
                   const std::optional<std::string>&) override {
    std::lock_guard<std::mutex> lock(mutex_);
    issues.push_back(issue_type);
  }

  bool Saw(const std::string& owner, const std::string& from, const std::string& to) const {
    return std::any_of(transitions.begin(), transitions.end(), [&](const Transition& t) {
      return t.owner == owner && t.from == from && t.to == to;
    });
  }

  std::vector<Transition>  transitions;
  std::vector<std::string> issues;

 private:
  std::mutex mutex_;
};

class FailingAdapter final : public ure::ingest::SourceAdapter {
 public:
  std::string Kind() const override {
    return "failing";
  }

  std::vector<DiscoveredUnit> Discover(const std::string&) override {
    return {};
  }

  ure::ingest::CandidateOutcome ProduceCandidate(const std::string&, const std::string& unit_id) override {
    return ure::ingest::CandidateOutcome::Fail("io", "device unplugged while reading " + unit_id);
  }
};

struct Fixture {
  std::shared_ptr<ure::db::Repository>      repository = std::make_shared<ure::db::memory::MemoryRepository>();
  std::shared_ptr<ure::core::ResourceStore> store      = std::make_shared<ure::core::ResourceStore>(repository);
  IngestSessionManager                      sessions{repository, store};
  std::string                               device_id;
  fs::path                                  root;

  explicit Fixture(const std::string& name) {
    ure::core::DeviceRegistry devices(repository);
    ure::core::DeviceSpec     spec;
    spec.name = "D1";
    device_id = devices.Ensure(spec).DeviceId();

    root = fs::temp_directory_path() / ("ure_ingest_session_" + name);
    fs::remove_all(root);
    fs::create_directories(root / "sub");
    Write("a.md", "# a");
    Write("sub/b.md", "# b");
    Write("c.tmp", "scratch");
  }

  ~Fixture() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  void Write(const std::string& rel, const std::string& content) const {
    std::ofstream out(root / rel, std::ios::binary);
    out << content;
  }

  std::string Open(std::shared_ptr<RecordingJournal> journal = nullptr) {
    ure::ingest::OpenRequest request;
    request.device_id = device_id;
    return sessions.Open(request, std::move(journal));
  }

  DiscoveredUnit Unit(const std::string& rel) const {
    return DiscoveredUnit{(root / rel).string(), rel};
  }
};

void TestOpenValidatesOwnersAndPayloads() {
  Fixture f("open");

  ure::ingest::OpenRequest unknown;
  unknown.device_id = "no-such-device";
  bool device_unknown = false;
  try {
    (void)f.sessions.Open(unknown);
  } catch (const ure::util::DeviceUnknownError&) {
    device_unknown = true;
  }
  assert(device_unknown);

  ure::ingest::OpenRequest bad_agent;
  bad_agent.device_id  = f.device_id;
  bad_agent.agent_json = "{agent";
  bool invalid = false;
  try {
    (void)f.sessions.Open(bad_agent);
  } catch (const ure::util::ValidationError&) {
    invalid = true;
  }
  assert(invalid);
}

void TestExplicitSessionIdsCannotBeReopened() {
  Fixture f("reopen");

  ure::ingest::OpenRequest request;
  request.device_id  = f.device_id;
  request.session_id = "ingest-fixed";
  assert(f.sessions.Open(request) == "ingest-fixed");

  bool running = false;
  try {
    (void)f.sessions.Open(request);
  } catch (const ure::util::AlreadyExists&) {
    running = true;
  }
  assert(running);

  f.sessions.Close("ingest-fixed");
  assert(f.sessions.IsClosed("ingest-fixed"));

  bool closed = false;
  try {
    (void)f.sessions.Open(request);
  } catch (const ure::util::AlreadyClosedError&) {
    closed = true;
  }
  assert(closed);

  bool twice = false;
  try {
    f.sessions.Close("ingest-fixed");
  } catch (const ure::util::AlreadyClosedError&) {
    twice = true;
  }
  assert(twice);
}

void TestUnitLifecycleIsJournaled() {
  Fixture    f("lifecycle");
  auto       journal = std::make_shared<RecordingJournal>();
  const auto session = f.Open(journal);
  const auto path_id = f.sessions.RegisterPath(session, f.root.string());

  PathRuleSet                    rules("docs");
  ure::ingest::FilesystemAdapter adapter;

  const auto outcome = f.sessions.IngestUnit(path_id, f.Unit("a.md"), rules, adapter);
  assert(outcome.state == EntryState::kAdmitted);
  assert(outcome.is_new_entry);
  assert(outcome.resource_id.has_value());
  assert(!outcome.duplicate);

  assert(journal->Saw(session, "NONE", "OPEN"));
  assert(journal->Saw(outcome.entry_id, "DISCOVERING", "MATCHING"));
  assert(journal->Saw(outcome.entry_id, "MATCHING", "RESOLVING"));
  assert(journal->Saw(outcome.entry_id, "RESOLVING", "ADMITTED"));

  // The same unit in the same session is not recorded again.
  const auto again = f.sessions.IngestUnit(path_id, f.Unit("a.md"), rules, adapter);
  assert(!again.is_new_entry);
  assert(again.entry_id == outcome.entry_id);
  assert(again.state == EntryState::kAdmitted);

  f.sessions.Close(session);
  assert(journal->Saw(session, "OPEN", "CLOSED"));
}

void TestContainerGlobsAndStrictRulesReject() {
  Fixture    f("reject");
  auto       journal = std::make_shared<RecordingJournal>();
  const auto session = f.Open(journal);
  const auto path_id = f.sessions.RegisterPath(session, f.root.string(), {}, {"*.tmp"});

  PathRuleSet strict("docs", true);
  strict.AddMatchRule(ure::ingest::MatchRule{"/sub/", "", std::string("nested"), 1, std::nullopt, {}, {}});
  ure::ingest::FilesystemAdapter adapter;

  const auto excluded = f.sessions.IngestUnit(path_id, f.Unit("c.tmp"), strict, adapter);
  assert(excluded.state == EntryState::kRejected);

  const auto unmatched = f.sessions.IngestUnit(path_id, f.Unit("a.md"), strict, adapter);
  assert(unmatched.state == EntryState::kUnmatched);

  const auto nested = f.sessions.IngestUnit(path_id, f.Unit("sub/b.md"), strict, adapter);
  assert(nested.state == EntryState::kAdmitted);

  assert(std::count(journal->issues.begin(), journal->issues.end(), "ingest.rejected") == 1);
  assert(std::count(journal->issues.begin(), journal->issues.end(), "ingest.unmatched") == 1);
  assert(journal->Saw(excluded.entry_id, "MATCHING", "REJECTED"));

  const auto summary = f.sessions.Summary(session);
  assert(summary.admitted == 1);
  assert(summary.rejected == 2);
  assert(summary.Total() == 3);
}

void TestAdapterFailuresBecomeIssues() {
  Fixture    f("adapter_failure");
  auto       journal = std::make_shared<RecordingJournal>();
  const auto session = f.Open(journal);
  const auto path_id = f.sessions.RegisterPath(session, f.root.string());

  PathRuleSet    rules("docs");
  FailingAdapter adapter;

  const auto outcome = f.sessions.IngestUnit(path_id, f.Unit("a.md"), rules, adapter);
  assert(outcome.state == EntryState::kErrored);
  assert(!outcome.resource_id.has_value());
  assert(journal->Saw(outcome.entry_id, "RESOLVING", "ERRORED"));
  assert(std::find(journal->issues.begin(), journal->issues.end(), "adapter.io") != journal->issues.end());

  const auto summary = f.sessions.Summary(session);
  assert(summary.errored == 1);
  assert(summary.admitted == 0);
}

void TestSecondSessionReportsDuplicates() {
  Fixture                        f("duplicates");
  PathRuleSet                    rules("docs");
  ure::ingest::FilesystemAdapter adapter;

  for (int run = 0; run < 2; ++run) {
    const auto session = f.Open();
    const auto path_id = f.sessions.RegisterPath(session, f.root.string(), {"**/*.md"});
    for (const auto& unit : adapter.Discover(f.root.string())) {
      (void)f.sessions.IngestUnit(path_id, unit, rules, adapter);
    }
    f.sessions.Close(session);

    const auto summary = f.sessions.Summary(session);
    assert(summary.rejected == 1);
    if (run == 0) {
      assert(summary.admitted == 2 && summary.duplicate == 0);
    } else {
      assert(summary.admitted == 0 && summary.duplicate == 2);
    }
  }
  assert(f.store->ListLive(f.device_id).size() == 2);
}

void TestAdmissionIntoClosedSessionIsAllowed() {
  Fixture    f("late");
  const auto session = f.Open();
  const auto path_id = f.sessions.RegisterPath(session, f.root.string());
  f.sessions.Close(session);

  PathRuleSet                    rules("docs");
  ure::ingest::FilesystemAdapter adapter;
  const auto outcome = f.sessions.IngestUnit(path_id, f.Unit("a.md"), rules, adapter);
  assert(outcome.state == EntryState::kAdmitted);
}

void TestCloseReleasesJournal() {
  Fixture    f("journal_release");
  auto       journal = std::make_shared<RecordingJournal>();
  const auto session = f.Open(journal);
  const auto path_id = f.sessions.RegisterPath(session, f.root.string());

  std::weak_ptr<RecordingJournal> watched = journal;
  f.sessions.Close(session);
  assert(journal->Saw(session, "OPEN", "CLOSED"));

  const auto seen = journal->transitions.size();
  PathRuleSet                    rules("docs");
  ure::ingest::FilesystemAdapter adapter;
  const auto late = f.sessions.IngestUnit(path_id, f.Unit("a.md"), rules, adapter);
  assert(late.state == EntryState::kAdmitted);
  assert(journal->transitions.size() == seen);

  journal.reset();
  assert(watched.expired());
}

void TestLargeFilesKeepDigestOnly() {
  Fixture f("large_file");

  std::string body;
  for (int i = 0; body.size() < 200 * 1024; ++i) {
    body += "line " + std::to_string(i) + "\n";
  }
  f.Write("large.txt", body);

  ure::ingest::FilesystemAdapter capped(true, 1024);
  const auto large = capped.ProduceCandidate("s", (f.root / "large.txt").string());
  assert(large);
  assert(!large.Value().content.has_value());
  assert(large.Value().content_digest == ure::util::Sha256Hex(body));
  assert(large.Value().size_bytes == body.size());

  const auto small = capped.ProduceCandidate("s", (f.root / "a.md").string());
  assert(small);
  assert(small.Value().content == std::string("# a"));
  assert(small.Value().size_bytes == 3);

  ure::ingest::FilesystemAdapter digest_only(false);
  const auto hashed = digest_only.ProduceCandidate("s", (f.root / "a.md").string());
  assert(hashed);
  assert(!hashed.Value().content.has_value());
  assert(hashed.Value().content_digest == ure::util::Sha256Hex("# a"));
  assert(hashed.Value().size_bytes == 3);
}

void TestTasksCountTowardsSummary() {
  Fixture    f("tasks");
  const auto session = f.Open();

  ure::ingest::TaskRequest task;
  task.session_id          = session;
  task.captured_executable = "{\"argv\":[\"pandoc\",\"--version\"]}";
  task.status              = "ADMITTED";
  assert(!f.sessions.RecordTask(task).empty());

  task.captured_executable = "not json";
  bool threw               = false;
  try {
    (void)f.sessions.RecordTask(task);
  } catch (const ure::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  assert(f.sessions.Summary(session).admitted == 1);
}

} // namespace

int main() {
  TestOpenValidatesOwnersAndPayloads();
  TestExplicitSessionIdsCannotBeReopened();
  TestUnitLifecycleIsJournaled();
  TestContainerGlobsAndStrictRulesReject();
  TestAdapterFailuresBecomeIssues();
  TestSecondSessionReportsDuplicates();
  TestAdmissionIntoClosedSessionIsAllowed();
  TestTasksCountTowardsSummary();
  TestCloseReleasesJournal();
  TestLargeFilesKeepDigestOnly();

  std::cout << "ure_unit_ingest_session_manager: pass\n";
  return 0;
}
