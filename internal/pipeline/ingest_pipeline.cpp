#include "ingest_pipeline.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <utility>

#include "internal/ingest/ingest_worker.hpp"
#include "internal/ingest/work_queue.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace ure::pipeline {

using observability::IntField;
using observability::StringField;

namespace {

struct Container {
  std::string path_id;
  std::string log_id;
};

std::string RunArgs(const PipelineOptions& options) {
  std::vector<std::string> locators;
  for (const auto& root : options.roots) {
    locators.push_back(root.locator);
  }
  return "{\"roots\":" + util::ToJsonArray(locators) + ",\"workers\":" + std::to_string(options.workers) + "}";
}

} // namespace

IngestPipeline::IngestPipeline(std::shared_ptr<ingest::IngestSessionManager>         sessions,
                               std::shared_ptr<orchestration::OrchestrationExecutor> executor,
                               std::shared_ptr<ingest::AdapterRegistry>              adapters)
    : sessions_(std::move(sessions)), executor_(std::move(executor)), adapters_(std::move(adapters)) {
}

PipelineReport IngestPipeline::Run(const core::DeviceIdentity& device, const PipelineOptions& options,
                                   const ingest::PathRuleSet& rules) {
  observability::SpanScope span("pipeline.run");

  orchestration::SessionRequest session_request;
  session_request.device_id  = device.DeviceId();
  session_request.nature     = options.nature;
  session_request.version    = options.version;
  session_request.args       = RunArgs(options);
  session_request.created_by = options.created_by;

  PipelineReport report;
  report.orchestration_session_id = executor_->BeginSession(session_request);
  const auto& session_id          = report.orchestration_session_id;
  const auto  entry_id            = executor_->BeginEntry(session_id, "ingest");

  ingest::OpenRequest open;
  open.device_id  = device.DeviceId();
  open.agent_json = "{\"agent\":" + util::JsonString(options.created_by) + "}";
  open.created_by = options.created_by;
  report.ingest_session_id = sessions_->Open(open, executor_->JournalFor(session_id, entry_id));
  const auto& ingest_id    = report.ingest_session_id;

  auto                                   queue = std::make_shared<ingest::WorkQueue>();
  std::vector<orchestration::ExecHandle> container_execs;
  std::map<std::string, Container>       containers;

  for (const auto& root : options.roots) {
    orchestration::ExecRequest request;
    request.session_id     = session_id;
    request.entry_id       = entry_id;
    request.exec_nature    = "container";
    request.exec_code      = root.locator;
    request.namespace_name = rules.Namespace();
    auto exec              = executor_->Exec(request);

    orchestration::LogRequest log;
    log.session_id = session_id;
    log.exec_id    = exec.Id();
    log.category   = "container";
    log.content    = root.source_kind + ":" + root.locator;
    const auto log_id = executor_->Log(log);

    ingest::SourceRegistration source;
    source.source_kind   = root.source_kind;
    source.locator       = root.locator;
    source.include_globs = root.include_globs;
    source.exclude_globs = root.exclude_globs;
    const auto path_id   = sessions_->RegisterSource(ingest_id, source);

    const auto units = adapters_->Get(root.source_kind)->Discover(root.locator);
    if (units.empty()) {
      orchestration::IssueRequest issue;
      issue.session_id    = session_id;
      issue.entry_id      = entry_id;
      issue.issue_type    = "container.empty";
      issue.message       = "no units discovered under " + root.locator;
      issue.invalid_value = root.locator;
      issue.remediation   = "check that the root exists and is readable";
      executor_->RecordIssue(issue);
    }
    for (const auto& unit : units) {
      queue->Enqueue(ingest::IngestTask{path_id, root.source_kind, unit.abs_path, unit.rel_path, exec.Id()});
    }

    URE_LOG_INFO("container registered", {StringField("locator", root.locator),
                                          IntField("units", static_cast<int64_t>(units.size()))});
    containers[exec.Id()] = Container{path_id, log_id};
    container_execs.push_back(std::move(exec));
  }

  std::mutex                 fatal_mutex;
  std::optional<std::string> fatal_error;
  std::atomic<bool>          aborted{false};
  std::atomic<std::size_t>   skipped{0};

  // First fatal error wins and drops every unit still queued.
  auto abort_run = [&](const std::string& error) {
    {
      std::lock_guard<std::mutex> lock(fatal_mutex);
      if (fatal_error) {
        return;
      }
      fatal_error = error;
    }
    aborted = true;
    skipped += queue->Abort();
    URE_LOG_ERROR("ingest run aborting", {StringField("session_id", session_id), StringField("error", error)});
  };

  auto run_unit = [&](const ingest::IngestTask& task) {
    orchestration::ExecRequest request;
    request.session_id     = session_id;
    request.entry_id       = entry_id;
    request.parent_exec_id = task.parent_exec_id;
    request.exec_nature    = "unit";
    request.exec_code      = task.rel_path;
    request.input_text     = task.abs_path;
    request.namespace_name = rules.Namespace();
    auto exec              = executor_->Exec(request);

    orchestration::LogRequest log;
    log.session_id    = session_id;
    log.exec_id       = exec.Id();
    log.parent_log_id = containers.at(task.parent_exec_id).log_id;
    log.category      = "unit";

    try {
      auto       adapter = adapters_->Get(task.source_kind);
      const auto outcome =
          sessions_->IngestUnit(task.path_id, ingest::DiscoveredUnit{task.abs_path, task.rel_path}, rules, *adapter);
      const std::string state(model::ToString(outcome.state));

      log.content = task.rel_path + " " + state + (outcome.duplicate ? " (duplicate)" : "");
      executor_->Log(log);

      if (outcome.state == model::EntryState::kErrored) {
        exec.Fail(kAdapterFailureStatus, "adapter could not produce " + task.abs_path);
      } else {
        exec.Finish(0, outcome.resource_id, state);
      }
    } catch (const util::ValidationError& e) {
      log.content = task.rel_path + " invalid: " + e.what();
      executor_->Log(log);
      exec.Fail(kInvalidUnitStatus, e.what());
    } catch (const util::ReferentialError& e) {
      log.content = task.rel_path + " invalid: " + e.what();
      executor_->Log(log);
      exec.Fail(kInvalidUnitStatus, e.what());
    } catch (const std::exception& e) {
      abort_run(e.what());
      exec.Fail(kFatalStatus, e.what());
      throw;
    }
  };

  auto handler = [&](const ingest::IngestTask& task) {
    if (aborted) {
      ++skipped;
      return;
    }
    try {
      run_unit(task);
    } catch (const std::exception& e) {
      abort_run(e.what());
      throw;
    }
  };

  ingest::IngestWorkerPool pool(queue, handler, options.workers == 0 ? 1 : options.workers);
  pool.Start();
  pool.Stop();

  if (!fatal_error && pool.Failures() > 0) {
    fatal_error = std::to_string(pool.Failures()) + " ingest task(s) failed";
  }

  if (fatal_error) {
    orchestration::IssueRequest issue;
    issue.session_id    = session_id;
    issue.entry_id      = entry_id;
    issue.issue_type    = "ingest.aborted";
    issue.message       = "ingest aborted, " + std::to_string(skipped.load()) + " unit(s) skipped";
    issue.invalid_value = *fatal_error;
    issue.remediation   = "repair the store and rerun the ingest";
    executor_->RecordIssue(issue);
  }

  for (auto& exec : container_execs) {
    if (fatal_error) {
      exec.Fail(kFatalStatus, "ingest aborted: " + *fatal_error);
    } else {
      exec.Finish(0, containers.at(exec.Id()).path_id, "ingest_fs_path");
    }
  }

  sessions_->Close(ingest_id, options.created_by);
  report.summary = sessions_->Summary(ingest_id);

  executor_->EndSession(session_id);
  const auto final_report = executor_->Report(session_id);
  report.failed_execs     = final_report.failed_execs;
  report.issues           = final_report.issues.size();
  report.final_state      = report.failed_execs == 0 ? "COMPLETED" : "FAILED";
  span.SetAttribute("session_id", session_id);
  span.SetAttribute("admitted", static_cast<std::int64_t>(report.summary.admitted));

  URE_LOG_INFO("ingest run finished",
               {StringField("session_id", session_id), StringField("state", report.final_state),
                IntField("admitted", static_cast<int64_t>(report.summary.admitted)),
                IntField("duplicate", static_cast<int64_t>(report.summary.duplicate)),
                IntField("rejected", static_cast<int64_t>(report.summary.rejected)),
                IntField("errored", static_cast<int64_t>(report.summary.errored))});

  if (fatal_error) {
    span.RecordException(*fatal_error);
    URE_LOG_ERROR("ingest run aborted", {StringField("session_id", session_id), StringField("error", *fatal_error)});
    throw util::StoreFailure(*fatal_error);
  }
  return report;
}

} // namespace ure::pipeline
