#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "exec_tree.hpp"
#include "internal/core/device_identity.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ingest/session_journal.hpp"
#include "internal/util/json.hpp"

namespace ure::orchestration {

struct SessionRequest {
  std::string    device_id;
  std::string    nature  = "ingest";
  std::string    version = "0.1.0";
  util::JsonText args;
  util::JsonText elaboration;
  // Caller-chosen id; generated when empty.
  std::string    session_id;
  std::string    created_by = "UNKNOWN";
};

struct ExecRequest {
  std::string                session_id;
  std::optional<std::string> entry_id;
  std::optional<std::string> parent_exec_id;
  std::string                exec_nature = "step";
  std::string                exec_code;
  std::optional<std::string> input_text;
  std::optional<std::string> namespace_name;
  std::optional<std::string> exec_identity;
  util::JsonText             elaboration;
};

struct IssueRequest {
  std::string                session_id;
  std::optional<std::string> entry_id;
  std::string                issue_type;
  std::string                message;
  std::optional<int64_t>     row;
  std::optional<std::string> column;
  std::optional<std::string> invalid_value;
  std::optional<std::string> remediation;
  util::JsonText             elaboration;
};

struct TransitionRequest {
  std::string                session_id;
  std::optional<std::string> entry_id;
  // Defaults to entry_id, then session_id.
  std::string                owner_id;
  std::string                from_state;
  std::string                to_state;
  std::optional<std::string> result;
  std::optional<std::string> reason;
  util::JsonText             elaboration;
};

struct LogRequest {
  std::string                session_id;
  std::optional<std::string> exec_id;
  std::optional<std::string> parent_log_id;
  std::optional<std::string> category;
  std::string                content;
  // Next free sibling slot when unset.
  std::optional<int64_t>     order;
  util::JsonText             elaboration;
};

struct SessionReport {
  db::model::OrchestrationSessionRecord      session;
  std::vector<ExecNode>                      exec_tree;
  std::vector<db::model::IssueRecord>        issues;
  std::vector<db::model::SessionStateRecord> states;
  std::vector<db::model::LogRecord>          logs;
  std::size_t                                failed_execs = 0;
};

class OrchestrationExecutor;

/*
  One running exec node. Finish it exactly once; a handle destroyed
  unfinished records the exec as abandoned (status kAbandonedStatus).
*/
class ExecHandle {
 public:
  static constexpr int kAbandonedStatus = 125;

  ExecHandle(const ExecHandle&)            = delete;
  ExecHandle& operator=(const ExecHandle&) = delete;
  ExecHandle(ExecHandle&& other) noexcept;
  ExecHandle& operator=(ExecHandle&& other) noexcept;
  ~ExecHandle();

  const std::string& Id() const {
    return exec_id_;
  }
  const std::string& SessionId() const {
    return session_id_;
  }
  bool Finished() const {
    return finished_;
  }

  // Records success (status 0) or a caller-defined failure category. A zero
  // status is raised to the first failed child's status unless
  // override_children is set; a child failing later raises it the same
  // way. Returns the status stored now.
  int Finish(int status, const std::optional<std::string>& output = std::nullopt,
             const std::optional<std::string>& output_nature = std::nullopt, bool override_children = false);

  int Fail(int status, const std::string& error_text);

 private:
  friend class OrchestrationExecutor;

  ExecHandle(OrchestrationExecutor* executor, std::string exec_id, std::string session_id, std::string nature,
             uint64_t started_at_ms);

  OrchestrationExecutor* executor_ = nullptr;
  std::string            exec_id_;
  std::string            session_id_;
  std::string            nature_;
  uint64_t               started_at_ms_ = 0;
  bool                   finished_      = true;
};

/*
  Records orchestration runs as auditable state.

  Sessions group entries (named stages); execs form a call tree within one
  session; issues and logs are append-only. Records written after a
  session ended are kept and linked to it. Sibling order is monotonic per
  parent across threads and across executor instances sharing a store:
  the next slot is read and claimed inside one serialized transaction.
*/
class OrchestrationExecutor {
 public:
  explicit OrchestrationExecutor(std::shared_ptr<db::Repository> repository);

  // Throws DeviceUnknownError, ValidationError, AlreadyClosedError for a
  // finished session id, AlreadyExists for a running one.
  std::string BeginSession(const SessionRequest& request);

  std::string BeginSession(const core::DeviceIdentity& device, const std::string& nature, const std::string& version,
                           const util::JsonText& args = std::nullopt);

  // Throws NotFound for an unknown id, AlreadyClosedError when finished.
  db::model::OrchestrationSessionRecord ResumeSession(const std::string& session_id);

  std::string BeginEntry(const std::string& session_id, const std::string& ingest_src,
                         const std::optional<std::string>& ingest_table_name = std::nullopt,
                         const util::JsonText&             elaboration       = std::nullopt);

  // Throws ReferentialError when the parent is missing or belongs to
  // another session, ValidationError on malformed payloads.
  ExecHandle Exec(const ExecRequest& request);

  // Never throws; returns nullopt when the issue could not be stored.
  std::optional<std::string> RecordIssue(const IssueRequest& request) noexcept;

  std::string RelateIssues(const std::string& issue_id_prime, const std::string& issue_id_rel,
                           const std::string& relationship_nature);

  // Insert or overwrite (owner, from, to).
  void RecordTransition(const TransitionRequest& request);

  // Throws ReferentialError when the exec or parent log belongs to another
  // session.
  std::string Log(const LogRequest& request);

  // Finishes the session; RUNNING -> COMPLETED, or FAILED when any exec
  // failed. Throws AlreadyClosedError on a second call.
  void EndSession(const std::string& session_id, const util::JsonText& diagnostics_json = std::nullopt,
                  const std::optional<std::string>& diagnostics_md = std::nullopt);

  SessionReport Report(const std::string& session_id) const;

  std::vector<ExecNode> ExecTree(const std::string& session_id) const;

  // Journal that records ingest transitions and issues into this session.
  std::shared_ptr<ingest::SessionJournal> JournalFor(const std::string& session_id,
                                                     const std::optional<std::string>& entry_id);

 private:
  friend class ExecHandle;

  int  FinishExec(const std::string& exec_id, int status, const std::optional<std::string>& output,
                  const std::optional<std::string>& output_nature, const std::optional<std::string>& error_text,
                  bool override_children);
  void ObserveExec(const std::string& nature, uint64_t started_at_ms, int status);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace ure::orchestration
