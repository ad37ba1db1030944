#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace ure::db::memory {

class MemoryTransaction;

/*
  In-memory backend.

  Enforces the same unique keys, foreign keys and JSON checks as the SQLite
  schema so the two stay interchangeable in tests.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertDevice(Transaction&, const model::DeviceRecord&) override;
  std::optional<model::DeviceRecord> GetDevice(Transaction&, const std::string&, Visibility) override;
  std::optional<model::DeviceRecord> FindDevice(Transaction&, const std::string& name, const std::string& state,
                                                const std::string& boundary, Visibility) override;
  std::vector<model::DeviceRecord> ListDevices(Transaction&, Visibility) override;
  Result UpsertBehavior(Transaction&, model::BehaviorRecord&) override;
  std::optional<model::BehaviorRecord> GetBehavior(Transaction&, const std::string&) override;
  Result MarkDeleted(Transaction&, EntityKind, const std::string& id, const std::string& deleted_by,
                     uint64_t deleted_at_ms) override;

  Result InsertIngestSession(Transaction&, const model::IngestSessionRecord&) override;
  std::optional<model::IngestSessionRecord> GetIngestSession(Transaction&, const std::string&, Visibility) override;
  std::vector<model::IngestSessionRecord> ListIngestSessions(Transaction&, const std::string& device_id) override;
  Result FinishIngestSession(Transaction&, const std::string&, uint64_t, const std::string&) override;
  Result InsertFsPath(Transaction&, const model::FsPathRecord&) override;
  std::optional<model::FsPathRecord> GetFsPath(Transaction&, const std::string&) override;
  std::vector<model::FsPathRecord> ListFsPaths(Transaction&, const std::string&) override;
  InsertOutcome InsertFsPathEntryIfAbsent(Transaction&, const model::FsPathEntryRecord&) override;
  Result UpdateFsPathEntry(Transaction&, const model::FsPathEntryRecord&) override;
  std::optional<model::FsPathEntryRecord> GetFsPathEntry(Transaction&, const std::string&) override;
  std::vector<model::FsPathEntryRecord> ListFsPathEntries(Transaction&, const std::string&) override;
  Result InsertTask(Transaction&, const model::IngestTaskRecord&) override;
  Result UpdateTask(Transaction&, const model::IngestTaskRecord&) override;
  std::vector<model::IngestTaskRecord> ListTasks(Transaction&, const std::string&) override;

  InsertOutcome InsertUniformResourceIfAbsent(Transaction&, const model::UniformResourceRecord&) override;
  std::optional<model::UniformResourceRecord> GetUniformResource(Transaction&, const std::string&, Visibility) override;
  std::optional<model::UniformResourceRecord> FindUniformResource(Transaction&, const std::string& device_id,
                                                                  const std::string& content_digest,
                                                                  const std::string& uri, uint64_t size_bytes,
                                                                  Visibility) override;
  std::vector<model::UniformResourceRecord> ListUniformResources(Transaction&, const std::string&, Visibility) override;
  uint64_t CountUniformResources(Transaction&, const std::string& device_id, const std::string& content_digest,
                                 const std::string& uri, uint64_t size_bytes) override;
  InsertOutcome InsertTransformIfAbsent(Transaction&, const model::UniformResourceTransformRecord&) override;
  std::vector<model::UniformResourceTransformRecord> ListTransforms(Transaction&, const std::string&,
                                                                    Visibility) override;

  InsertOutcome InsertGraphIfAbsent(Transaction&, const model::GraphRecord&) override;
  std::vector<model::GraphRecord> ListGraphs(Transaction&) override;
  InsertOutcome InsertEdgeIfAbsent(Transaction&, const model::EdgeRecord&) override;
  std::vector<std::string> ListNeighborIds(Transaction&, const std::string& graph_name, const std::string& node_id,
                                           const std::optional<std::string>& nature, const std::string& after,
                                           std::size_t limit) override;
  std::vector<model::EdgeRecord> ListEdgesTo(Transaction&, const std::string&) override;

  Result UpsertPathMatchRule(Transaction&, const model::PathMatchRuleRecord&) override;
  std::vector<model::PathMatchRuleRecord> ListPathMatchRules(Transaction&, const std::string&) override;
  Result UpsertPathRewriteRule(Transaction&, const model::PathRewriteRuleRecord&) override;
  std::vector<model::PathRewriteRuleRecord> ListPathRewriteRules(Transaction&, const std::string&) override;

  Result UpsertNature(Transaction&, model::OrchestrationNatureRecord&) override;
  std::optional<model::OrchestrationNatureRecord> GetNature(Transaction&, const std::string&) override;
  Result InsertOrchestrationSession(Transaction&, const model::OrchestrationSessionRecord&) override;
  std::optional<model::OrchestrationSessionRecord> GetOrchestrationSession(Transaction&, const std::string&) override;
  Result FinishOrchestrationSession(Transaction&, const std::string&, uint64_t, const util::JsonText&,
                                    const std::optional<std::string>&) override;
  Result InsertSessionEntry(Transaction&, const model::OrchestrationSessionEntryRecord&) override;
  std::optional<model::OrchestrationSessionEntryRecord> GetSessionEntry(Transaction&, const std::string&) override;
  std::vector<model::OrchestrationSessionEntryRecord> ListSessionEntries(Transaction&, const std::string&) override;
  Result UpsertSessionState(Transaction&, const model::SessionStateRecord&) override;
  std::optional<model::SessionStateRecord> FindSessionState(Transaction&, const std::string&, const std::string&,
                                                            const std::string&) override;
  std::vector<model::SessionStateRecord> ListSessionStates(Transaction&, const std::string&) override;
  Result InsertExec(Transaction&, const model::ExecRecord&) override;
  Result UpdateExec(Transaction&, const model::ExecRecord&) override;
  std::optional<model::ExecRecord> GetExec(Transaction&, const std::string&) override;
  std::vector<model::ExecRecord> ListExecs(Transaction&, const std::string&) override;
  int64_t MaxExecSiblingOrder(Transaction&, const std::string&, const std::optional<std::string>&) override;
  Result InsertIssue(Transaction&, const model::IssueRecord&) override;
  std::vector<model::IssueRecord> ListIssues(Transaction&, const std::string&) override;
  Result InsertIssueRelation(Transaction&, const model::IssueRelationRecord&) override;
  std::vector<model::IssueRelationRecord> ListIssueRelations(Transaction&, const std::string&) override;
  Result InsertLog(Transaction&, const model::LogRecord&) override;
  std::optional<model::LogRecord> GetLog(Transaction&, const std::string&) override;
  std::vector<model::LogRecord> ListLogs(Transaction&, const std::string&) override;
  int64_t MaxLogSiblingOrder(Transaction&, const std::string&, const std::optional<std::string>&) override;

private:
  friend class MemoryTransaction;

  // Vectors keep insertion order; the maps index into them.
  struct State {
    std::vector<model::DeviceRecord>                   devices;
    std::vector<model::BehaviorRecord>                 behaviors;
    std::vector<model::IngestSessionRecord>            ingest_sessions;
    std::vector<model::FsPathRecord>                   fs_paths;
    std::vector<model::FsPathEntryRecord>              fs_path_entries;
    std::vector<model::IngestTaskRecord>               tasks;
    std::vector<model::UniformResourceRecord>          resources;
    std::unordered_map<std::string, std::size_t>       resource_by_id;
    std::unordered_map<std::string, std::size_t>       resource_by_key;
    std::vector<model::UniformResourceTransformRecord> transforms;
    std::vector<model::GraphRecord>                    graphs;
    std::vector<model::EdgeRecord>                     edges;
    std::vector<model::PathMatchRuleRecord>            match_rules;
    std::vector<model::PathRewriteRuleRecord>          rewrite_rules;
    std::vector<model::OrchestrationNatureRecord>      natures;
    std::vector<model::OrchestrationSessionRecord>     orch_sessions;
    std::vector<model::OrchestrationSessionEntryRecord> session_entries;
    std::vector<model::SessionStateRecord>             session_states;
    std::vector<model::ExecRecord>                     execs;
    std::unordered_map<std::string, std::size_t>       exec_by_id;
    std::vector<model::IssueRecord>                    issues;
    std::vector<model::IssueRelationRecord>            issue_relations;
    std::vector<model::LogRecord>                      logs;
  };

  // Held by a MemoryTransaction from Begin() to Commit()/Rollback().
  std::mutex writer_mutex_;
  State      committed_;
};

} // namespace ure::db::memory
