#include "ingest_session_manager.hpp"

#include <filesystem>

#include <google/protobuf/struct.pb.h>

#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace ure::ingest {

using model::EntryState;
using observability::StringField;

namespace {

constexpr const char* kUpdatedBy = "ingest-session-manager";

std::string Str(EntryState state) {
  return std::string(model::ToString(state));
}

std::string Diagnostics(std::initializer_list<std::pair<const char*, std::string>> strings,
                        std::initializer_list<std::pair<const char*, bool>>        flags = {}) {
  google::protobuf::Struct object;
  auto&                    fields = *object.mutable_fields();
  for (const auto& [key, value] : strings) {
    fields[key].set_string_value(value);
  }
  for (const auto& [key, value] : flags) {
    fields[key].set_bool_value(value);
  }
  return util::ToJson(object);
}

bool IsDuplicateEntry(const db::model::FsPathEntryRecord& entry) {
  auto diagnostics = util::ParseJsonObject(entry.ur_diagnostics);
  if (!diagnostics) {
    return false;
  }
  auto it = diagnostics->fields().find("duplicate");
  return it != diagnostics->fields().end() && it->second.bool_value();
}

} // namespace

IngestSessionManager::IngestSessionManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<core::ResourceStore> store)
    : repository_(std::move(repository)), store_(std::move(store)) {
}

// ------------------------------------------------------------
// Session lifecycle
// ------------------------------------------------------------

std::string IngestSessionManager::Open(const OpenRequest& request, std::shared_ptr<SessionJournal> journal) {
  observability::SpanScope span("ingest.open");

  if (!util::IsValidJson(request.agent_json)) {
    throw util::ValidationError("session_agent: structured payload is not valid JSON");
  }
  util::RequireJsonOrNull("behavior_json", request.behavior_json);
  util::RequireJsonOrNull("elaboration", request.elaboration);

  auto tx = repository_->Begin();
  if (!repository_->GetDevice(*tx, request.device_id, db::Visibility::kLive)) {
    throw util::DeviceUnknownError("unknown device: " + request.device_id);
  }
  if (request.behavior_id && !repository_->GetBehavior(*tx, *request.behavior_id)) {
    throw util::ReferentialError("unknown behavior: " + *request.behavior_id);
  }

  db::model::IngestSessionRecord record;
  record.ingest_session_id = request.session_id.empty() ? util::NewId() : request.session_id;
  if (auto existing = repository_->GetIngestSession(*tx, record.ingest_session_id, db::Visibility::kIncludeDeleted)) {
    if (existing->ingest_finished_at_ms) {
      throw util::AlreadyClosedError("ingest session already closed: " + record.ingest_session_id);
    }
    throw util::AlreadyExists("ingest session already open: " + record.ingest_session_id);
  }

  record.device_id                  = request.device_id;
  record.behavior_id                = request.behavior_id;
  record.behavior_json              = request.behavior_json;
  record.ingest_started_at_ms       = util::NowMs();
  record.session_agent              = request.agent_json;
  record.elaboration                = request.elaboration;
  record.housekeeping.created_at_ms = record.ingest_started_at_ms;
  record.housekeeping.created_by    = request.created_by;

  core::ThrowIfDbError(repository_->InsertIngestSession(*tx, record), "open ingest session");
  tx->Commit();

  if (journal) {
    std::lock_guard<std::mutex> lock(journals_mutex_);
    journals_[record.ingest_session_id] = journal;
  }
  if (journal) {
    journal->RecordTransition(record.ingest_session_id, model::session_state::kNone, model::session_state::kOpen,
                              std::nullopt, std::nullopt);
  }

  URE_LOG_INFO("ingest session opened",
               {StringField("session_id", record.ingest_session_id), StringField("device_id", record.device_id)});
  return record.ingest_session_id;
}

std::string IngestSessionManager::Open(const core::DeviceIdentity& device, const std::string& agent_json,
                                       std::shared_ptr<SessionJournal> journal) {
  OpenRequest request;
  request.device_id  = device.DeviceId();
  request.agent_json = agent_json;
  return Open(request, std::move(journal));
}

void IngestSessionManager::Close(const std::string& session_id, const std::string& closed_by) {
  observability::SpanScope span("ingest.close");

  auto tx     = repository_->Begin();
  auto result = repository_->FinishIngestSession(*tx, session_id, util::NowMs(), closed_by);
  if (result.code == db::ErrorCode::Conflict) {
    throw util::AlreadyClosedError("ingest session already closed: " + session_id);
  }
  core::ThrowIfDbError(result, "close ingest session " + session_id);
  tx->Commit();

  std::shared_ptr<SessionJournal> journal;
  {
    std::lock_guard<std::mutex> lock(journals_mutex_);
    auto                        it = journals_.find(session_id);
    if (it != journals_.end()) {
      journal = std::move(it->second);
      journals_.erase(it);
    }
  }
  if (journal) {
    journal->RecordTransition(session_id, model::session_state::kOpen, model::session_state::kClosed, std::nullopt,
                              std::nullopt);
  }

  const auto summary = Summary(session_id);
  URE_LOG_INFO("ingest session closed",
               {StringField("session_id", session_id), observability::IntField("admitted", summary.admitted),
                observability::IntField("duplicate", summary.duplicate),
                observability::IntField("rejected", summary.rejected), observability::IntField("errored", summary.errored)});
}

bool IngestSessionManager::IsClosed(const std::string& session_id) const {
  auto session = Get(session_id);
  return session && session->ingest_finished_at_ms.has_value();
}

std::optional<db::model::IngestSessionRecord> IngestSessionManager::Get(const std::string& session_id) const {
  auto tx     = repository_->Begin();
  auto record = repository_->GetIngestSession(*tx, session_id, db::Visibility::kIncludeDeleted);
  tx->Commit();
  return record;
}

// ------------------------------------------------------------
// Containers
// ------------------------------------------------------------

std::string IngestSessionManager::RegisterPath(const std::string& session_id, const std::string& root_path,
                                               const std::vector<std::string>& include_globs,
                                               const std::vector<std::string>& exclude_globs) {
  SourceRegistration source;
  source.source_kind   = "fs";
  source.locator       = root_path;
  source.include_globs = include_globs;
  source.exclude_globs = exclude_globs;
  return RegisterSource(session_id, source);
}

std::string IngestSessionManager::RegisterSource(const std::string& session_id, const SourceRegistration& source) {
  if (source.locator.empty()) {
    throw util::ValidationError("source locator must not be empty");
  }
  util::RequireJsonOrNull("elaboration", source.elaboration);

  auto tx = repository_->Begin();
  if (!repository_->GetIngestSession(*tx, session_id, db::Visibility::kIncludeDeleted)) {
    throw util::ReferentialError("unknown ingest session: " + session_id);
  }

  db::model::FsPathRecord record;
  record.ingest_fs_path_id          = util::NewId();
  record.ingest_session_id          = session_id;
  record.source_kind                = source.source_kind;
  record.root_path                  = source.locator;
  record.include_glob_patterns      = source.include_globs;
  record.exclude_glob_patterns      = source.exclude_globs;
  record.elaboration                = source.elaboration;
  record.housekeeping.created_at_ms = util::NowMs();

  core::ThrowIfDbError(repository_->InsertFsPath(*tx, record), "register " + source.locator);
  tx->Commit();
  return record.ingest_fs_path_id;
}

// ------------------------------------------------------------
// Entries
// ------------------------------------------------------------

MatchResult IngestSessionManager::Match(const std::string& path_id, const std::string& abs_path, const std::string& rel_path,
                                        const PathRuleSet& rules) const {
  auto tx   = repository_->Begin();
  auto path = repository_->GetFsPath(*tx, path_id);
  tx->Commit();
  if (!path) {
    throw util::ReferentialError("unknown ingest path: " + path_id);
  }

  if (!PassesGlobs(path->include_glob_patterns, path->exclude_glob_patterns, rel_path)) {
    MatchResult rejected;
    rejected.rule          = "container-glob";
    rejected.canonical_uri = abs_path;
    return rejected;
  }
  return rules.Evaluate(abs_path);
}

EntryOutcome IngestSessionManager::RecordEntry(const std::string& path_id, const std::string& abs_path,
                                               const std::string& rel_path, const MatchResult& match) {
  auto tx   = repository_->Begin();
  auto path = repository_->GetFsPath(*tx, path_id);
  if (!path) {
    throw util::ReferentialError("unknown ingest path: " + path_id);
  }

  const std::filesystem::path rel(rel_path);

  db::model::FsPathEntryRecord entry;
  entry.ingest_fs_path_entry_id    = util::NewId();
  entry.ingest_session_id          = path->ingest_session_id;
  entry.ingest_fs_path_id          = path_id;
  entry.file_path_abs              = abs_path;
  entry.file_path_rel_parent       = rel.parent_path().generic_string();
  entry.file_path_rel              = rel_path;
  entry.file_basename              = rel.filename().string();
  entry.ur_status                  = Str(EntryState::kDiscovering);
  entry.housekeeping.created_at_ms = util::NowMs();
  if (auto extn = rel.extension().string(); extn.size() > 1) {
    entry.file_extn = extn.substr(1);
  }

  auto outcome = repository_->InsertFsPathEntryIfAbsent(*tx, entry);
  core::ThrowIfDbError(outcome.result, "record entry " + abs_path);
  tx->Commit();

  if (!outcome.inserted) {
    auto existing = LoadEntry(outcome.id);
    return EntryOutcome{existing.ingest_fs_path_entry_id,
                        model::ParseEntryState(existing.ur_status.value_or("")).value_or(EntryState::kErrored), false,
                        existing.uniform_resource_id, IsDuplicateEntry(existing)};
  }

  const auto& session_id = entry.ingest_session_id;
  Transition(session_id, entry.ingest_fs_path_entry_id, EntryState::kDiscovering, EntryState::kMatching, std::nullopt);

  if (match.matched) {
    SaveEntry(entry, EntryState::kMatching);
    return EntryOutcome{entry.ingest_fs_path_entry_id, EntryState::kMatching, true, std::nullopt, false};
  }

  const auto terminal = match.by_default ? EntryState::kUnmatched : EntryState::kRejected;
  const auto reason   = match.by_default ? std::string("no match rule applies") : "excluded by " + match.rule;

  entry.ur_diagnostics = Diagnostics({{"reason", reason}});
  Transition(session_id, entry.ingest_fs_path_entry_id, EntryState::kMatching, terminal, reason);
  SaveEntry(entry, terminal);
  Issue(session_id, match.by_default ? "ingest.unmatched" : "ingest.rejected", reason, abs_path);
  observability::Metrics::Instance().RecordAdmission("rejected");

  return EntryOutcome{entry.ingest_fs_path_entry_id, terminal, true, std::nullopt, false};
}

EntryOutcome IngestSessionManager::Resolve(const std::string& entry_id, SourceAdapter& adapter, const MatchResult& match) {
  auto       entry      = LoadEntry(entry_id);
  const auto session_id = entry.ingest_session_id;
  const auto state      = model::ParseEntryState(entry.ur_status.value_or("")).value_or(EntryState::kErrored);

  if (model::IsTerminal(state)) {
    return EntryOutcome{entry_id, state, false, entry.uniform_resource_id, IsDuplicateEntry(entry)};
  }
  if (state == EntryState::kDiscovering) {
    throw util::ValidationError("entry has not been matched: " + entry_id);
  }
  if (state == EntryState::kMatching) {
    Transition(session_id, entry_id, EntryState::kMatching, EntryState::kResolving, std::nullopt);
    SaveEntry(entry, EntryState::kResolving);
  }

  auto fail = [&](const std::string& type, const std::string& message, const std::string& detail) {
    entry.ur_diagnostics = Diagnostics({{"error", type}, {"message", message}});
    Transition(session_id, entry_id, EntryState::kResolving, EntryState::kErrored, message);
    SaveEntry(entry, EntryState::kErrored);
    Issue(session_id, type, message, detail);
    observability::Metrics::Instance().RecordAdmission("errored");
  };

  CandidateOutcome produced = CandidateOutcome::Fail("adapter", "no candidate");
  try {
    produced = adapter.ProduceCandidate(session_id, entry.file_path_abs);
  } catch (const std::exception& e) {
    produced = CandidateOutcome::Fail("adapter", e.what());
  }

  if (!produced) {
    URE_LOG_WARN("source adapter failed", {StringField("path", entry.file_path_abs),
                                           StringField("code", produced.Error().code),
                                           StringField("error", produced.Error().message)});
    fail("adapter." + produced.Error().code, produced.Error().message, entry.file_path_abs);
    return EntryOutcome{entry_id, EntryState::kErrored, false, std::nullopt, false};
  }

  const auto& candidate = produced.Value();
  auto        session   = Get(session_id);
  if (!session) {
    throw util::ReferentialError("unknown ingest session: " + session_id);
  }

  core::AdmitRequest request;
  request.device_id           = session->device_id;
  request.ingest_session_id   = session_id;
  request.ingest_fs_path_id   = entry.ingest_fs_path_id;
  request.uri                 = match.canonical_uri.empty() || match.canonical_uri == entry.file_path_abs
                                    ? candidate.uri
                                    : match.canonical_uri;
  request.content             = candidate.content;
  request.content_digest      = candidate.content_digest;
  request.size_bytes          = candidate.size_bytes;
  request.nature              = match.nature ? match.nature : candidate.nature;
  request.last_modified_at_ms = candidate.last_modified_at_ms;
  request.elaboration         = candidate.metadata_json;
  request.created_by          = kUpdatedBy;

  core::Admission admission;
  try {
    admission = store_->Admit(request);
  } catch (const util::ValidationError& e) {
    fail("ingest.validation", e.what(), entry.file_path_abs);
    throw;
  } catch (const util::ReferentialError& e) {
    fail("ingest.referential", e.what(), entry.file_path_abs);
    throw;
  }

  entry.uniform_resource_id = admission.id;
  entry.ur_diagnostics =
      Diagnostics({{"content_digest", admission.content_digest}, {"uri", request.uri}}, {{"duplicate", !admission.is_new}});
  Transition(session_id, entry_id, EntryState::kResolving, EntryState::kAdmitted, std::nullopt);
  SaveEntry(entry, EntryState::kAdmitted);

  return EntryOutcome{entry_id, EntryState::kAdmitted, false, admission.id, !admission.is_new};
}

EntryOutcome IngestSessionManager::IngestUnit(const std::string& path_id, const DiscoveredUnit& unit,
                                              const PathRuleSet& rules, SourceAdapter& adapter) {
  const auto match    = Match(path_id, unit.abs_path, unit.rel_path, rules);
  auto       recorded = RecordEntry(path_id, unit.abs_path, unit.rel_path, match);
  if (recorded.state != EntryState::kMatching && recorded.state != EntryState::kResolving) {
    return recorded;
  }

  auto resolved         = Resolve(recorded.entry_id, adapter, match);
  resolved.is_new_entry = recorded.is_new_entry;
  return resolved;
}

std::vector<db::model::FsPathEntryRecord> IngestSessionManager::Entries(const std::string& session_id) const {
  auto tx      = repository_->Begin();
  auto entries = repository_->ListFsPathEntries(*tx, session_id);
  tx->Commit();
  return entries;
}

// ------------------------------------------------------------
// Tasks
// ------------------------------------------------------------

std::string IngestSessionManager::RecordTask(const TaskRequest& request) {
  if (!util::IsValidJson(request.captured_executable)) {
    throw util::ValidationError("captured_executable: structured payload is not valid JSON");
  }
  util::RequireJsonOrNull("ur_diagnostics", request.diagnostics);
  util::RequireJsonOrNull("ur_transformations", request.transformations);
  util::RequireJsonOrNull("elaboration", request.elaboration);

  db::model::IngestTaskRecord record;
  record.ingest_session_task_id     = util::NewId();
  record.ingest_session_id          = request.session_id;
  record.uniform_resource_id        = request.uniform_resource_id;
  record.captured_executable        = request.captured_executable;
  record.ur_status                  = request.status;
  record.ur_diagnostics             = request.diagnostics;
  record.ur_transformations         = request.transformations;
  record.elaboration                = request.elaboration;
  record.housekeeping.created_at_ms = util::NowMs();
  record.housekeeping.created_by    = kUpdatedBy;

  auto tx = repository_->Begin();
  core::ThrowIfDbError(repository_->InsertTask(*tx, record), "record task");
  tx->Commit();
  return record.ingest_session_task_id;
}

// ------------------------------------------------------------
// Summary
// ------------------------------------------------------------

SessionSummary IngestSessionManager::Summary(const std::string& session_id) const {
  auto tx      = repository_->Begin();
  auto entries = repository_->ListFsPathEntries(*tx, session_id);
  auto tasks   = repository_->ListTasks(*tx, session_id);
  tx->Commit();

  SessionSummary summary;
  for (const auto& entry : entries) {
    const auto state = model::ParseEntryState(entry.ur_status.value_or(""));
    if (!state) {
      continue;
    }
    switch (*state) {
      case EntryState::kAdmitted:
        IsDuplicateEntry(entry) ? ++summary.duplicate : ++summary.admitted;
        break;
      case EntryState::kRejected:
      case EntryState::kUnmatched:
        ++summary.rejected;
        break;
      case EntryState::kErrored:
        ++summary.errored;
        break;
      default:
        break;
    }
  }
  for (const auto& task : tasks) {
    const auto state = model::ParseEntryState(task.ur_status.value_or(""));
    if (state == EntryState::kAdmitted) {
      ++summary.admitted;
    } else if (state == EntryState::kRejected || state == EntryState::kUnmatched) {
      ++summary.rejected;
    } else if (state == EntryState::kErrored) {
      ++summary.errored;
    }
  }
  return summary;
}

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------

std::shared_ptr<SessionJournal> IngestSessionManager::JournalFor(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(journals_mutex_);
  auto                        it = journals_.find(session_id);
  return it == journals_.end() ? nullptr : it->second;
}

void IngestSessionManager::Transition(const std::string& session_id, const std::string& owner_id, EntryState from,
                                      EntryState to, const std::optional<std::string>& reason) const {
  if (!model::CanTransition(from, to)) {
    throw std::logic_error("illegal entry transition " + Str(from) + " -> " + Str(to));
  }
  if (auto journal = JournalFor(session_id)) {
    journal->RecordTransition(owner_id, model::ToString(from), model::ToString(to), Str(to), reason);
  }
}

void IngestSessionManager::Issue(const std::string& session_id, const std::string& type, const std::string& message,
                                 const std::optional<std::string>& invalid_value) const {
  if (auto journal = JournalFor(session_id)) {
    journal->RecordIssue(type, message, invalid_value, std::nullopt);
  }
}

void IngestSessionManager::SaveEntry(db::model::FsPathEntryRecord& entry, EntryState state) {
  entry.ur_status                  = Str(state);
  entry.housekeeping.updated_at_ms = util::NowMs();
  entry.housekeeping.updated_by    = kUpdatedBy;

  auto tx = repository_->Begin();
  core::ThrowIfDbError(repository_->UpdateFsPathEntry(*tx, entry), "update entry " + entry.file_path_abs);
  tx->Commit();
}

db::model::FsPathEntryRecord IngestSessionManager::LoadEntry(const std::string& entry_id) const {
  auto tx    = repository_->Begin();
  auto entry = repository_->GetFsPathEntry(*tx, entry_id);
  tx->Commit();
  if (!entry) {
    throw util::NotFound("unknown ingest entry: " + entry_id);
  }
  return *entry;
}

} // namespace ure::ingest
