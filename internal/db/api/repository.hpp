#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/device_record.hpp"
#include "internal/db/model/exec_record.hpp"
#include "internal/db/model/ingest_session_record.hpp"
#include "internal/db/model/issue_record.hpp"
#include "internal/db/model/lineage_record.hpp"
#include "internal/db/model/log_record.hpp"
#include "internal/db/model/orchestration_record.hpp"
#include "internal/db/model/path_rule_record.hpp"
#include "internal/db/model/session_state_record.hpp"
#include "internal/db/model/uniform_resource_record.hpp"

namespace ure::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes take a Transaction
  - Reads inside a transaction see its writes
  - Compare-and-insert (the *IfAbsent calls) is atomic on the unique key
  - Structured columns are rejected with ConstraintViolation unless they
    parse as JSON or are null
  - Missing parents are rejected with ForeignKeyViolation

  The DB is the source of truth for:
    devices and sessions
    uniform resources and transforms
    lineage edges
    orchestration state, execs, issues and logs
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Devices / behaviors
  // ---------------------------------------------------------------------

  virtual Result InsertDevice(Transaction&, const model::DeviceRecord&) = 0;

  virtual std::optional<model::DeviceRecord> GetDevice(Transaction&, const std::string& device_id, Visibility) = 0;

  virtual std::optional<model::DeviceRecord> FindDevice(Transaction&, const std::string& name, const std::string& state,
                                                        const std::string& boundary, Visibility) = 0;

  virtual std::vector<model::DeviceRecord> ListDevices(Transaction&, Visibility) = 0;

  // On (device_id, behavior_name) conflict the payload is replaced and
  // record.behavior_id is set to the existing id.
  virtual Result UpsertBehavior(Transaction&, model::BehaviorRecord&) = 0;

  virtual std::optional<model::BehaviorRecord> GetBehavior(Transaction&, const std::string& behavior_id) = 0;

  // Soft delete. NotFound when no row; a second delete keeps the first stamp.
  virtual Result MarkDeleted(Transaction&, EntityKind kind, const std::string& id, const std::string& deleted_by,
                             uint64_t deleted_at_ms) = 0;

  // ---------------------------------------------------------------------
  // Ingest sessions
  // ---------------------------------------------------------------------

  virtual Result InsertIngestSession(Transaction&, const model::IngestSessionRecord&) = 0;

  virtual std::optional<model::IngestSessionRecord> GetIngestSession(Transaction&, const std::string& session_id,
                                                                     Visibility) = 0;

  virtual std::vector<model::IngestSessionRecord> ListIngestSessions(Transaction&, const std::string& device_id) = 0;

  // Compare-and-set on ingest_finished_at_ms. Conflict if already finished.
  virtual Result FinishIngestSession(Transaction&, const std::string& session_id, uint64_t finished_at_ms,
                                     const std::string& updated_by) = 0;

  virtual Result InsertFsPath(Transaction&, const model::FsPathRecord&) = 0;

  virtual std::optional<model::FsPathRecord> GetFsPath(Transaction&, const std::string& fs_path_id) = 0;

  virtual std::vector<model::FsPathRecord> ListFsPaths(Transaction&, const std::string& session_id) = 0;

  virtual InsertOutcome InsertFsPathEntryIfAbsent(Transaction&, const model::FsPathEntryRecord&) = 0;

  // Replaces resource/status/diagnostics/transformations of an existing entry.
  virtual Result UpdateFsPathEntry(Transaction&, const model::FsPathEntryRecord&) = 0;

  virtual std::optional<model::FsPathEntryRecord> GetFsPathEntry(Transaction&, const std::string& entry_id) = 0;

  virtual std::vector<model::FsPathEntryRecord> ListFsPathEntries(Transaction&, const std::string& session_id) = 0;

  virtual Result InsertTask(Transaction&, const model::IngestTaskRecord&) = 0;

  virtual Result UpdateTask(Transaction&, const model::IngestTaskRecord&) = 0;

  virtual std::vector<model::IngestTaskRecord> ListTasks(Transaction&, const std::string& session_id) = 0;

  // ---------------------------------------------------------------------
  // Uniform resources
  // ---------------------------------------------------------------------

  // Key: (device_id, content_digest, uri, size_bytes). Soft-deleted rows
  // still hold their key.
  virtual InsertOutcome InsertUniformResourceIfAbsent(Transaction&, const model::UniformResourceRecord&) = 0;

  virtual std::optional<model::UniformResourceRecord> GetUniformResource(Transaction&, const std::string& resource_id,
                                                                         Visibility) = 0;

  virtual std::optional<model::UniformResourceRecord> FindUniformResource(Transaction&, const std::string& device_id,
                                                                          const std::string& content_digest,
                                                                          const std::string& uri, uint64_t size_bytes,
                                                                          Visibility) = 0;

  virtual std::vector<model::UniformResourceRecord> ListUniformResources(Transaction&, const std::string& device_id,
                                                                         Visibility) = 0;

  // Raw row count for a key, deleted rows included.
  virtual uint64_t CountUniformResources(Transaction&, const std::string& device_id, const std::string& content_digest,
                                         const std::string& uri, uint64_t size_bytes) = 0;

  // Key: (uniform_resource_id, content_digest, nature, size_bytes).
  virtual InsertOutcome InsertTransformIfAbsent(Transaction&, const model::UniformResourceTransformRecord&) = 0;

  virtual std::vector<model::UniformResourceTransformRecord> ListTransforms(Transaction&,
                                                                            const std::string& resource_id,
                                                                            Visibility) = 0;

  // ---------------------------------------------------------------------
  // Lineage
  // ---------------------------------------------------------------------

  // inserted == false when the name is already present.
  virtual InsertOutcome InsertGraphIfAbsent(Transaction&, const model::GraphRecord&) = 0;

  virtual std::vector<model::GraphRecord> ListGraphs(Transaction&) = 0;

  virtual InsertOutcome InsertEdgeIfAbsent(Transaction&, const model::EdgeRecord&) = 0;

  // Distinct resource ids linked from (graph_name, node_id), optionally
  // restricted to one nature. Keyset page ordered by id, strictly after `after`.
  virtual std::vector<std::string> ListNeighborIds(Transaction&, const std::string& graph_name,
                                                   const std::string& node_id,
                                                   const std::optional<std::string>& nature,
                                                   const std::string& after, std::size_t limit) = 0;

  virtual std::vector<model::EdgeRecord> ListEdgesTo(Transaction&, const std::string& resource_id) = 0;

  // ---------------------------------------------------------------------
  // Path rules
  // ---------------------------------------------------------------------

  // On (namespace, regex) conflict the attributes are replaced; declaration
  // order is the first insertion.
  virtual Result UpsertPathMatchRule(Transaction&, const model::PathMatchRuleRecord&) = 0;

  // Declaration order.
  virtual std::vector<model::PathMatchRuleRecord> ListPathMatchRules(Transaction&,
                                                                     const std::string& namespace_name) = 0;

  virtual Result UpsertPathRewriteRule(Transaction&, const model::PathRewriteRuleRecord&) = 0;

  virtual std::vector<model::PathRewriteRuleRecord> ListPathRewriteRules(Transaction&,
                                                                         const std::string& namespace_name) = 0;

  // ---------------------------------------------------------------------
  // Orchestration
  // ---------------------------------------------------------------------

  // On nature conflict record.orchestration_nature_id is set to the existing id.
  virtual Result UpsertNature(Transaction&, model::OrchestrationNatureRecord&) = 0;

  virtual std::optional<model::OrchestrationNatureRecord> GetNature(Transaction&, const std::string& nature_id) = 0;

  virtual Result InsertOrchestrationSession(Transaction&, const model::OrchestrationSessionRecord&) = 0;

  virtual std::optional<model::OrchestrationSessionRecord> GetOrchestrationSession(Transaction&,
                                                                                   const std::string& session_id) = 0;

  // Compare-and-set on orch_finished_at_ms. Conflict if already finished.
  virtual Result FinishOrchestrationSession(Transaction&, const std::string& session_id, uint64_t finished_at_ms,
                                            const util::JsonText& diagnostics_json,
                                            const std::optional<std::string>& diagnostics_md) = 0;

  virtual Result InsertSessionEntry(Transaction&, const model::OrchestrationSessionEntryRecord&) = 0;

  virtual std::optional<model::OrchestrationSessionEntryRecord> GetSessionEntry(Transaction&,
                                                                               const std::string& entry_id) = 0;

  virtual std::vector<model::OrchestrationSessionEntryRecord> ListSessionEntries(Transaction&,
                                                                                const std::string& session_id) = 0;

  // Insert, or on (owner_id, from_state, to_state) overwrite result, reason
  // and timestamp and increment transition_count.
  virtual Result UpsertSessionState(Transaction&, const model::SessionStateRecord&) = 0;

  virtual std::optional<model::SessionStateRecord> FindSessionState(Transaction&, const std::string& owner_id,
                                                                    const std::string& from_state,
                                                                    const std::string& to_state) = 0;

  virtual std::vector<model::SessionStateRecord> ListSessionStates(Transaction&, const std::string& session_id) = 0;

  virtual Result InsertExec(Transaction&, const model::ExecRecord&) = 0;

  // Completion fields only: status, output, error, narrative, finished_at,
  // override_children.
  virtual Result UpdateExec(Transaction&, const model::ExecRecord&) = 0;

  virtual std::optional<model::ExecRecord> GetExec(Transaction&, const std::string& exec_id) = 0;

  // Ordered by sibling_order within each parent.
  virtual std::vector<model::ExecRecord> ListExecs(Transaction&, const std::string& session_id) = 0;

  // Highest sibling_order under `parent` (nullopt = roots), -1 if none.
  virtual int64_t MaxExecSiblingOrder(Transaction&, const std::string& session_id,
                                      const std::optional<std::string>& parent_exec_id) = 0;

  virtual Result InsertIssue(Transaction&, const model::IssueRecord&) = 0;

  // Insertion order.
  virtual std::vector<model::IssueRecord> ListIssues(Transaction&, const std::string& session_id) = 0;

  virtual Result InsertIssueRelation(Transaction&, const model::IssueRelationRecord&) = 0;

  virtual std::vector<model::IssueRelationRecord> ListIssueRelations(Transaction&, const std::string& issue_id) = 0;

  virtual Result InsertLog(Transaction&, const model::LogRecord&) = 0;

  virtual std::optional<model::LogRecord> GetLog(Transaction&, const std::string& log_id) = 0;

  virtual std::vector<model::LogRecord> ListLogs(Transaction&, const std::string& session_id) = 0;

  virtual int64_t MaxLogSiblingOrder(Transaction&, const std::string& session_id,
                                     const std::optional<std::string>& parent_log_id) = 0;
};

} // namespace ure::db
