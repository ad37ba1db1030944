#include "executor.hpp"

#include <google/protobuf/struct.pb.h>

#include "internal/core/db_errors.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace ure::orchestration {

using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kCreatedBy = "orchestration-executor";

// Routes ingest lifecycle events into one orchestration session/entry.
class ExecutorJournal final : public ingest::SessionJournal {
 public:
  ExecutorJournal(OrchestrationExecutor* executor, std::string session_id, std::optional<std::string> entry_id)
      : executor_(executor), session_id_(std::move(session_id)), entry_id_(std::move(entry_id)) {
  }

  void RecordTransition(const std::string& owner_id, std::string_view from, std::string_view to,
                        const std::optional<std::string>& result,
                        const std::optional<std::string>& reason) override {
    TransitionRequest request;
    request.session_id = session_id_;
    request.entry_id   = entry_id_;
    request.owner_id   = owner_id;
    request.from_state = std::string(from);
    request.to_state   = std::string(to);
    request.result     = result;
    request.reason     = reason;
    try {
      executor_->RecordTransition(request);
    } catch (const std::exception& e) {
      URE_LOG_ERROR("journal transition dropped", {StringField("session_id", session_id_),
                                                   StringField("owner_id", owner_id), StringField("error", e.what())});
    }
  }

  void RecordIssue(const std::string& issue_type, const std::string& message,
                   const std::optional<std::string>& invalid_value,
                   const std::optional<std::string>& remediation) override {
    IssueRequest request;
    request.session_id    = session_id_;
    request.entry_id      = entry_id_;
    request.issue_type    = issue_type;
    request.message       = message;
    request.invalid_value = invalid_value;
    request.remediation   = remediation;
    executor_->RecordIssue(request);
  }

 private:
  OrchestrationExecutor*     executor_;
  std::string                session_id_;
  std::optional<std::string> entry_id_;
};

db::model::OrchestrationSessionRecord RequireSession(db::Repository& repository, db::Transaction& tx,
                                                     const std::string& session_id) {
  auto session = repository.GetOrchestrationSession(tx, session_id);
  if (!session) {
    throw util::ReferentialError("unknown orchestration session: " + session_id);
  }
  return *session;
}

void RequireEntryOf(db::Repository& repository, db::Transaction& tx, const std::string& session_id,
                    const std::optional<std::string>& entry_id) {
  if (!entry_id) {
    return;
  }
  auto entry = repository.GetSessionEntry(tx, *entry_id);
  if (!entry || entry->session_id != session_id) {
    throw util::ReferentialError("session entry " + *entry_id + " does not belong to session " + session_id);
  }
}

std::string ChildFailureNarrative(int status) {
  return "failed because a child exec failed with status " + std::to_string(status);
}

std::size_t CountFailed(const std::vector<db::model::ExecRecord>& execs) {
  std::size_t failed = 0;
  for (const auto& exec : execs) {
    if (exec.exec_status != 0) {
      ++failed;
    }
  }
  return failed;
}

} // namespace

// ------------------------------------------------------------
// ExecHandle
// ------------------------------------------------------------

ExecHandle::ExecHandle(OrchestrationExecutor* executor, std::string exec_id, std::string session_id, std::string nature,
                       uint64_t started_at_ms)
    : executor_(executor),
      exec_id_(std::move(exec_id)),
      session_id_(std::move(session_id)),
      nature_(std::move(nature)),
      started_at_ms_(started_at_ms),
      finished_(false) {
}

ExecHandle::ExecHandle(ExecHandle&& other) noexcept
    : executor_(other.executor_),
      exec_id_(std::move(other.exec_id_)),
      session_id_(std::move(other.session_id_)),
      nature_(std::move(other.nature_)),
      started_at_ms_(other.started_at_ms_),
      finished_(other.finished_) {
  other.finished_ = true;
}

ExecHandle& ExecHandle::operator=(ExecHandle&& other) noexcept {
  if (this != &other) {
    executor_       = other.executor_;
    exec_id_        = std::move(other.exec_id_);
    session_id_     = std::move(other.session_id_);
    nature_         = std::move(other.nature_);
    started_at_ms_  = other.started_at_ms_;
    finished_       = other.finished_;
    other.finished_ = true;
  }
  return *this;
}

ExecHandle::~ExecHandle() {
  if (finished_) {
    return;
  }
  try {
    Fail(kAbandonedStatus, "exec abandoned before completion");
  } catch (const std::exception& e) {
    URE_LOG_ERROR("failed to record abandoned exec", {StringField("exec_id", exec_id_), StringField("error", e.what())});
  }
}

int ExecHandle::Finish(int status, const std::optional<std::string>& output,
                       const std::optional<std::string>& output_nature, bool override_children) {
  if (finished_) {
    throw util::AlreadyClosedError("exec already finished: " + exec_id_);
  }
  int stored = 0;
  try {
    stored = executor_->FinishExec(exec_id_, status, output, output_nature, std::nullopt, override_children);
  } catch (const util::AlreadyClosedError&) {
    finished_ = true;
    throw;
  }
  finished_ = true;
  executor_->ObserveExec(nature_, started_at_ms_, stored);
  return stored;
}

int ExecHandle::Fail(int status, const std::string& error_text) {
  if (finished_) {
    throw util::AlreadyClosedError("exec already finished: " + exec_id_);
  }
  if (status == 0) {
    throw util::ValidationError("failed exec needs a non-zero status");
  }
  int stored = 0;
  try {
    stored = executor_->FinishExec(exec_id_, status, std::nullopt, std::nullopt, error_text, true);
  } catch (const util::AlreadyClosedError&) {
    finished_ = true;
    throw;
  }
  finished_ = true;
  executor_->ObserveExec(nature_, started_at_ms_, stored);
  return stored;
}

// ------------------------------------------------------------
// Sessions
// ------------------------------------------------------------

OrchestrationExecutor::OrchestrationExecutor(std::shared_ptr<db::Repository> repository)
    : repository_(std::move(repository)) {
}

std::string OrchestrationExecutor::BeginSession(const SessionRequest& request) {
  observability::SpanScope span("orchestration.begin");

  if (request.nature.empty()) {
    throw util::ValidationError("orchestration nature must not be empty");
  }
  util::RequireJsonOrNull("args_json", request.args);
  util::RequireJsonOrNull("elaboration", request.elaboration);

  auto tx = repository_->Begin();
  if (!repository_->GetDevice(*tx, request.device_id, db::Visibility::kLive)) {
    throw util::DeviceUnknownError("unknown device: " + request.device_id);
  }

  db::model::OrchestrationSessionRecord session;
  session.orchestration_session_id = request.session_id.empty() ? util::NewId() : request.session_id;
  if (auto existing = repository_->GetOrchestrationSession(*tx, session.orchestration_session_id)) {
    if (existing->orch_finished_at_ms) {
      throw util::AlreadyClosedError("orchestration session already finished: " + session.orchestration_session_id);
    }
    throw util::AlreadyExists("orchestration session already running: " + session.orchestration_session_id);
  }

  const auto now = util::NowMs();

  db::model::OrchestrationNatureRecord nature;
  nature.orchestration_nature_id    = util::NewId();
  nature.nature                     = request.nature;
  nature.housekeeping.created_at_ms = now;
  nature.housekeeping.created_by    = request.created_by;
  core::ThrowIfDbError(repository_->UpsertNature(*tx, nature), "register nature " + request.nature);

  session.device_id                  = request.device_id;
  session.orchestration_nature_id    = nature.orchestration_nature_id;
  session.version                    = request.version;
  session.orch_started_at_ms         = now;
  session.args_json                  = request.args;
  session.elaboration                = request.elaboration;
  session.housekeeping.created_at_ms = now;
  session.housekeeping.created_by    = request.created_by;
  core::ThrowIfDbError(repository_->InsertOrchestrationSession(*tx, session), "begin orchestration session");

  db::model::SessionStateRecord state;
  state.orchestration_session_state_id = util::NewId();
  state.session_id                     = session.orchestration_session_id;
  state.owner_id                       = session.orchestration_session_id;
  state.from_state                     = model::session_state::kNone;
  state.to_state                       = model::session_state::kRunning;
  state.transitioned_at_ms             = now;
  state.housekeeping.created_at_ms     = now;
  state.housekeeping.created_by        = request.created_by;
  core::ThrowIfDbError(repository_->UpsertSessionState(*tx, state), "record session start");
  tx->Commit();

  URE_LOG_INFO("orchestration session started",
               {StringField("session_id", session.orchestration_session_id), StringField("nature", request.nature),
                StringField("device_id", request.device_id)});
  return session.orchestration_session_id;
}

std::string OrchestrationExecutor::BeginSession(const core::DeviceIdentity& device, const std::string& nature,
                                                const std::string& version, const util::JsonText& args) {
  SessionRequest request;
  request.device_id = device.DeviceId();
  request.nature    = nature;
  request.version   = version;
  request.args      = args;
  return BeginSession(request);
}

db::model::OrchestrationSessionRecord OrchestrationExecutor::ResumeSession(const std::string& session_id) {
  auto tx      = repository_->Begin();
  auto session = repository_->GetOrchestrationSession(*tx, session_id);
  tx->Commit();
  if (!session) {
    throw util::NotFound("unknown orchestration session: " + session_id);
  }
  if (session->orch_finished_at_ms) {
    throw util::AlreadyClosedError("orchestration session already finished: " + session_id);
  }
  return *session;
}

std::string OrchestrationExecutor::BeginEntry(const std::string& session_id, const std::string& ingest_src,
                                              const std::optional<std::string>& ingest_table_name,
                                              const util::JsonText&             elaboration) {
  if (ingest_src.empty()) {
    throw util::ValidationError("session entry source must not be empty");
  }
  util::RequireJsonOrNull("elaboration", elaboration);

  auto tx = repository_->Begin();
  RequireSession(*repository_, *tx, session_id);

  db::model::OrchestrationSessionEntryRecord entry;
  entry.orchestration_session_entry_id = util::NewId();
  entry.session_id                     = session_id;
  entry.ingest_src                     = ingest_src;
  entry.ingest_table_name              = ingest_table_name;
  entry.elaboration                    = elaboration;
  entry.housekeeping.created_at_ms     = util::NowMs();
  entry.housekeeping.created_by        = kCreatedBy;
  core::ThrowIfDbError(repository_->InsertSessionEntry(*tx, entry), "begin session entry " + ingest_src);
  tx->Commit();
  return entry.orchestration_session_entry_id;
}

void OrchestrationExecutor::EndSession(const std::string& session_id, const util::JsonText& diagnostics_json,
                                       const std::optional<std::string>& diagnostics_md) {
  observability::SpanScope span("orchestration.end");
  util::RequireJsonOrNull("diagnostics_json", diagnostics_json);

  auto tx = repository_->Begin();
  RequireSession(*repository_, *tx, session_id);

  const auto execs  = repository_->ListExecs(*tx, session_id);
  const auto issues = repository_->ListIssues(*tx, session_id);
  const auto failed = CountFailed(execs);

  util::JsonText json = diagnostics_json;
  if (!json) {
    google::protobuf::Struct summary;
    auto&                    fields = *summary.mutable_fields();
    fields["execs"].set_number_value(static_cast<double>(execs.size()));
    fields["failed_execs"].set_number_value(static_cast<double>(failed));
    fields["issues"].set_number_value(static_cast<double>(issues.size()));
    json = util::ToJson(summary);
  }
  auto markdown = diagnostics_md;
  if (!markdown) {
    markdown = RenderExecTreeMarkdown(BuildExecTree(execs));
  }

  const auto now    = util::NowMs();
  auto       result = repository_->FinishOrchestrationSession(*tx, session_id, now, json, markdown);
  if (result.code == db::ErrorCode::Conflict) {
    throw util::AlreadyClosedError("orchestration session already finished: " + session_id);
  }
  core::ThrowIfDbError(result, "end orchestration session " + session_id);

  db::model::SessionStateRecord state;
  state.orchestration_session_state_id = util::NewId();
  state.session_id                     = session_id;
  state.owner_id                       = session_id;
  state.from_state                     = model::session_state::kRunning;
  state.to_state          = failed == 0 ? model::session_state::kCompleted : model::session_state::kFailed;
  state.transition_result = failed == 0 ? "success" : std::to_string(failed) + " exec(s) failed";
  state.transitioned_at_ms         = now;
  state.housekeeping.created_at_ms = now;
  state.housekeeping.created_by    = kCreatedBy;
  core::ThrowIfDbError(repository_->UpsertSessionState(*tx, state), "record session end");
  tx->Commit();

  URE_LOG_INFO("orchestration session finished",
               {StringField("session_id", session_id), StringField("state", state.to_state),
                IntField("execs", static_cast<int64_t>(execs.size())), IntField("failed", static_cast<int64_t>(failed)),
                IntField("issues", static_cast<int64_t>(issues.size()))});
}

// ------------------------------------------------------------
// Execs
// ------------------------------------------------------------

ExecHandle OrchestrationExecutor::Exec(const ExecRequest& request) {
  if (request.exec_nature.empty()) {
    throw util::ValidationError("exec nature must not be empty");
  }
  util::RequireJsonOrNull("elaboration", request.elaboration);

  auto tx = repository_->Begin();
  RequireSession(*repository_, *tx, request.session_id);
  RequireEntryOf(*repository_, *tx, request.session_id, request.entry_id);
  if (request.parent_exec_id) {
    auto parent = repository_->GetExec(*tx, *request.parent_exec_id);
    if (!parent) {
      throw util::ReferentialError("unknown parent exec: " + *request.parent_exec_id);
    }
    if (parent->session_id != request.session_id) {
      throw util::ReferentialError("parent exec " + *request.parent_exec_id + " belongs to another session");
    }
  }

  db::model::ExecRecord exec;
  exec.orchestration_session_exec_id = util::NewId();
  exec.exec_nature                   = request.exec_nature;
  exec.session_id                    = request.session_id;
  exec.session_entry_id              = request.entry_id;
  exec.parent_exec_id                = request.parent_exec_id;
  exec.namespace_name                = request.namespace_name;
  exec.exec_identity                 = request.exec_identity;
  exec.exec_code                     = request.exec_code;
  exec.input_text                    = request.input_text;
  exec.elaboration                   = request.elaboration;
  exec.sibling_order = repository_->MaxExecSiblingOrder(*tx, request.session_id, request.parent_exec_id) + 1;
  exec.started_at_ms                 = util::NowMs();
  exec.housekeeping.created_at_ms    = exec.started_at_ms;
  exec.housekeeping.created_by       = kCreatedBy;
  core::ThrowIfDbError(repository_->InsertExec(*tx, exec), "start exec " + request.exec_nature);
  tx->Commit();

  URE_LOG_DEBUG("exec started", {StringField("exec_id", exec.orchestration_session_exec_id),
                                 StringField("nature", exec.exec_nature), IntField("order", exec.sibling_order)});
  return ExecHandle(this, exec.orchestration_session_exec_id, exec.session_id, exec.exec_nature, exec.started_at_ms);
}

int OrchestrationExecutor::FinishExec(const std::string& exec_id, int status, const std::optional<std::string>& output,
                                      const std::optional<std::string>& output_nature,
                                      const std::optional<std::string>& error_text, bool override_children) {
  auto tx   = repository_->Begin();
  auto exec = repository_->GetExec(*tx, exec_id);
  if (!exec) {
    throw util::NotFound("unknown exec: " + exec_id);
  }
  if (exec->finished_at_ms) {
    throw util::AlreadyClosedError("exec already finished: " + exec_id);
  }

  int stored = status;
  if (stored == 0 && !override_children) {
    for (const auto& sibling : repository_->ListExecs(*tx, exec->session_id)) {
      if (sibling.parent_exec_id == exec_id && sibling.exec_status != 0) {
        stored = sibling.exec_status;
        break;
      }
    }
  }

  exec->exec_status       = stored;
  exec->output_text       = output;
  exec->output_nature     = output_nature;
  exec->exec_error_text   = error_text;
  exec->finished_at_ms    = util::NowMs();
  exec->override_children = stored == 0 && override_children;
  if (stored != 0 && !error_text) {
    exec->narrative_md = ChildFailureNarrative(stored);
  }
  core::ThrowIfDbError(repository_->UpdateExec(*tx, *exec), "finish exec " + exec_id);

  // Children may finish after their parent: raise ancestors that already
  // finished clean and did not opt out.
  auto parent_id = exec->parent_exec_id;
  while (stored != 0 && parent_id) {
    auto parent = repository_->GetExec(*tx, *parent_id);
    if (!parent || !parent->finished_at_ms || parent->exec_status != 0 || parent->override_children) {
      break;
    }
    parent->exec_status  = stored;
    parent->narrative_md = ChildFailureNarrative(stored);
    core::ThrowIfDbError(repository_->UpdateExec(*tx, *parent), "propagate failure to exec " + *parent_id);
    URE_LOG_WARN("exec failed after a late child", {StringField("exec_id", *parent_id), IntField("status", stored)});
    parent_id = parent->parent_exec_id;
  }
  tx->Commit();

  if (stored != 0) {
    URE_LOG_WARN("exec failed", {StringField("exec_id", exec_id), StringField("nature", exec->exec_nature),
                                 IntField("status", stored)});
  }
  return stored;
}

void OrchestrationExecutor::ObserveExec(const std::string& nature, uint64_t started_at_ms, int status) {
  const auto now = util::NowMs();
  const auto ms  = now > started_at_ms ? static_cast<double>(now - started_at_ms) : 0.0;
  observability::Metrics::Instance().ObserveExecDurationMs(nature, ms, status == 0);
}

std::vector<ExecNode> OrchestrationExecutor::ExecTree(const std::string& session_id) const {
  auto tx    = repository_->Begin();
  auto execs = repository_->ListExecs(*tx, session_id);
  tx->Commit();
  return BuildExecTree(execs);
}

// ------------------------------------------------------------
// Issues, transitions, logs
// ------------------------------------------------------------

std::optional<std::string> OrchestrationExecutor::RecordIssue(const IssueRequest& request) noexcept {
  try {
    util::RequireJsonOrNull("elaboration", request.elaboration);

    auto tx = repository_->Begin();
    RequireSession(*repository_, *tx, request.session_id);
    RequireEntryOf(*repository_, *tx, request.session_id, request.entry_id);

    db::model::IssueRecord issue;
    issue.orchestration_session_issue_id = util::NewId();
    issue.session_id                     = request.session_id;
    issue.session_entry_id               = request.entry_id;
    issue.issue_type                     = request.issue_type;
    issue.issue_message                  = request.message;
    issue.issue_row                      = request.row;
    issue.issue_column                   = request.column;
    issue.invalid_value                  = request.invalid_value;
    issue.remediation                    = request.remediation;
    issue.elaboration                    = request.elaboration;
    issue.housekeeping.created_at_ms     = util::NowMs();
    issue.housekeeping.created_by        = kCreatedBy;
    core::ThrowIfDbError(repository_->InsertIssue(*tx, issue), "record issue " + request.issue_type);
    tx->Commit();

    URE_LOG_WARN("issue recorded", {StringField("session_id", request.session_id),
                                    StringField("type", request.issue_type), StringField("message", request.message)});
    return issue.orchestration_session_issue_id;
  } catch (const std::exception& e) {
    URE_LOG_ERROR("issue could not be recorded",
                  {StringField("session_id", request.session_id), StringField("type", request.issue_type),
                   StringField("message", request.message), StringField("error", e.what())});
    return std::nullopt;
  }
}

std::string OrchestrationExecutor::RelateIssues(const std::string& issue_id_prime, const std::string& issue_id_rel,
                                                const std::string& relationship_nature) {
  if (relationship_nature.empty()) {
    throw util::ValidationError("issue relationship nature must not be empty");
  }

  db::model::IssueRelationRecord relation;
  relation.issue_relation_id          = util::NewId();
  relation.issue_id_prime             = issue_id_prime;
  relation.issue_id_rel               = issue_id_rel;
  relation.relationship_nature        = relationship_nature;
  relation.housekeeping.created_at_ms = util::NowMs();
  relation.housekeeping.created_by    = kCreatedBy;

  auto tx = repository_->Begin();
  core::ThrowIfDbError(repository_->InsertIssueRelation(*tx, relation), "relate issue " + issue_id_prime);
  tx->Commit();
  return relation.issue_relation_id;
}

void OrchestrationExecutor::RecordTransition(const TransitionRequest& request) {
  if (request.from_state.empty() || request.to_state.empty()) {
    throw util::ValidationError("transition states must not be empty");
  }
  util::RequireJsonOrNull("elaboration", request.elaboration);

  auto tx = repository_->Begin();
  RequireSession(*repository_, *tx, request.session_id);
  RequireEntryOf(*repository_, *tx, request.session_id, request.entry_id);

  db::model::SessionStateRecord state;
  state.orchestration_session_state_id = util::NewId();
  state.session_id                     = request.session_id;
  state.session_entry_id               = request.entry_id;
  state.owner_id                       = request.owner_id;
  if (state.owner_id.empty()) {
    state.owner_id = request.entry_id.value_or(request.session_id);
  }
  state.from_state                 = request.from_state;
  state.to_state                   = request.to_state;
  state.transition_result          = request.result;
  state.transition_reason          = request.reason;
  state.transitioned_at_ms         = util::NowMs();
  state.elaboration                = request.elaboration;
  state.housekeeping.created_at_ms = state.transitioned_at_ms;
  state.housekeeping.created_by    = kCreatedBy;
  core::ThrowIfDbError(repository_->UpsertSessionState(*tx, state),
                       "record transition " + request.from_state + " -> " + request.to_state);
  tx->Commit();
}

std::string OrchestrationExecutor::Log(const LogRequest& request) {
  util::RequireJsonOrNull("elaboration", request.elaboration);

  auto tx = repository_->Begin();
  RequireSession(*repository_, *tx, request.session_id);
  if (request.exec_id) {
    auto exec = repository_->GetExec(*tx, *request.exec_id);
    if (!exec || exec->session_id != request.session_id) {
      throw util::ReferentialError("exec " + *request.exec_id + " does not belong to session " + request.session_id);
    }
  }
  if (request.parent_log_id) {
    auto parent = repository_->GetLog(*tx, *request.parent_log_id);
    if (!parent || parent->session_id != request.session_id) {
      throw util::ReferentialError("log " + *request.parent_log_id + " does not belong to session " +
                                   request.session_id);
    }
  }

  db::model::LogRecord log;
  log.orchestration_session_log_id = util::NewId();
  log.session_id                   = request.session_id;
  log.exec_id                      = request.exec_id;
  log.parent_log_id                = request.parent_log_id;
  log.category                     = request.category;
  log.content                      = request.content;
  log.sibling_order                = request.order.has_value()
                                         ? *request.order
                                         : repository_->MaxLogSiblingOrder(*tx, request.session_id, request.parent_log_id) + 1;
  log.elaboration                  = request.elaboration;
  log.housekeeping.created_at_ms   = util::NowMs();
  log.housekeeping.created_by      = kCreatedBy;
  core::ThrowIfDbError(repository_->InsertLog(*tx, log), "append log");
  tx->Commit();
  return log.orchestration_session_log_id;
}

// ------------------------------------------------------------
// Reporting
// ------------------------------------------------------------

SessionReport OrchestrationExecutor::Report(const std::string& session_id) const {
  auto tx      = repository_->Begin();
  auto session = repository_->GetOrchestrationSession(*tx, session_id);
  if (!session) {
    throw util::NotFound("unknown orchestration session: " + session_id);
  }

  SessionReport report;
  report.session      = *session;
  const auto execs    = repository_->ListExecs(*tx, session_id);
  report.failed_execs = CountFailed(execs);
  report.exec_tree    = BuildExecTree(execs);
  report.issues       = repository_->ListIssues(*tx, session_id);
  report.states       = repository_->ListSessionStates(*tx, session_id);
  report.logs         = repository_->ListLogs(*tx, session_id);
  tx->Commit();
  return report;
}

std::shared_ptr<ingest::SessionJournal> OrchestrationExecutor::JournalFor(const std::string&                session_id,
                                                                          const std::optional<std::string>& entry_id) {
  return std::make_shared<ExecutorJournal>(this, session_id, entry_id);
}

} // namespace ure::orchestration
