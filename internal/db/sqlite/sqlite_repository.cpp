#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/json.hpp"
#include "sqlite_statement.hpp"

namespace ure::db::sqlite {

using ure::db::ErrorCode;
using ure::db::Result;
using sql::Nullable;

namespace {

std::string Placeholders(const std::string& columns) {
  std::string out = "?";
  for (char c : columns)
    if (c == ',') out += ",?";
  return out;
}

std::string InsertSql(const char* table, const char* columns, const char* suffix = "") {
  return std::string("INSERT INTO ") + table + "(" + columns + ") VALUES(" + Placeholders(columns) + ")" + suffix +
         ";";
}

std::string SelectSql(const char* table, const char* columns, const std::string& tail) {
  return std::string("SELECT ") + columns + " FROM " + table + " " + tail + ";";
}

const char* LiveFilter(Visibility v) {
  return v == Visibility::kLive ? " AND deleted_at IS NULL" : "";
}

void AppendHousekeeping(sql::Params& p, const model::Housekeeping& h) {
  p.emplace_back(h.created_at_ms);
  p.emplace_back(h.created_by);
  p.push_back(Nullable(h.updated_at_ms));
  p.push_back(Nullable(h.updated_by));
  p.push_back(Nullable(h.deleted_at_ms));
  p.push_back(Nullable(h.deleted_by));
  p.push_back(Nullable(h.activity_log));
}

model::Housekeeping ReadHousekeeping(const sql::Row& r, int col) {
  model::Housekeeping h;
  h.created_at_ms = r.GetU64(col);
  h.created_by    = r.GetText(col + 1);
  h.updated_at_ms = r.OptU64(col + 2);
  h.updated_by    = r.OptText(col + 3);
  h.deleted_at_ms = r.OptU64(col + 4);
  h.deleted_by    = r.OptText(col + 5);
  h.activity_log  = r.OptText(col + 6);
  return h;
}

model::DeviceRecord ReadDevice(const sql::Row& r) {
  model::DeviceRecord d;
  d.device_id     = r.GetText(0);
  d.name          = r.GetText(1);
  d.state         = r.GetText(2);
  d.boundary      = r.GetText(3);
  d.segmentation  = r.OptText(4);
  d.state_sysinfo = r.OptText(5);
  d.elaboration   = r.OptText(6);
  d.housekeeping  = ReadHousekeeping(r, 7);
  return d;
}

model::BehaviorRecord ReadBehavior(const sql::Row& r) {
  model::BehaviorRecord b;
  b.behavior_id         = r.GetText(0);
  b.device_id           = r.GetText(1);
  b.behavior_name       = r.GetText(2);
  b.behavior_conf_json  = r.GetText(3);
  b.assurance_schema_id = r.OptText(4);
  b.governance          = r.OptText(5);
  b.housekeeping        = ReadHousekeeping(r, 6);
  return b;
}

model::IngestSessionRecord ReadIngestSession(const sql::Row& r) {
  model::IngestSessionRecord s;
  s.ingest_session_id     = r.GetText(0);
  s.device_id             = r.GetText(1);
  s.behavior_id           = r.OptText(2);
  s.behavior_json         = r.OptText(3);
  s.ingest_started_at_ms  = r.GetU64(4);
  s.ingest_finished_at_ms = r.OptU64(5);
  s.session_agent         = r.GetText(6);
  s.elaboration           = r.OptText(7);
  s.housekeeping          = ReadHousekeeping(r, 8);
  return s;
}

model::FsPathRecord ReadFsPath(const sql::Row& r) {
  model::FsPathRecord p;
  p.ingest_fs_path_id     = r.GetText(0);
  p.ingest_session_id     = r.GetText(1);
  p.source_kind           = r.GetText(2);
  p.root_path             = r.GetText(3);
  p.include_glob_patterns = util::FromJsonArray(r.OptText(4));
  p.exclude_glob_patterns = util::FromJsonArray(r.OptText(5));
  p.elaboration           = r.OptText(6);
  p.housekeeping          = ReadHousekeeping(r, 7);
  return p;
}

model::FsPathEntryRecord ReadFsPathEntry(const sql::Row& r) {
  model::FsPathEntryRecord e;
  e.ingest_fs_path_entry_id = r.GetText(0);
  e.ingest_session_id       = r.GetText(1);
  e.ingest_fs_path_id       = r.GetText(2);
  e.uniform_resource_id     = r.OptText(3);
  e.file_path_abs           = r.GetText(4);
  e.file_path_rel_parent    = r.GetText(5);
  e.file_path_rel           = r.GetText(6);
  e.file_basename           = r.GetText(7);
  e.file_extn               = r.OptText(8);
  e.captured_executable     = r.OptText(9);
  e.ur_status               = r.OptText(10);
  e.ur_diagnostics          = r.OptText(11);
  e.ur_transformations      = r.OptText(12);
  e.elaboration             = r.OptText(13);
  e.housekeeping            = ReadHousekeeping(r, 14);
  return e;
}

model::IngestTaskRecord ReadTask(const sql::Row& r) {
  model::IngestTaskRecord t;
  t.ingest_session_task_id = r.GetText(0);
  t.ingest_session_id      = r.GetText(1);
  t.uniform_resource_id    = r.OptText(2);
  t.captured_executable    = r.GetText(3);
  t.ur_status              = r.OptText(4);
  t.ur_diagnostics         = r.OptText(5);
  t.ur_transformations     = r.OptText(6);
  t.elaboration            = r.OptText(7);
  t.housekeeping           = ReadHousekeeping(r, 8);
  return t;
}

model::UniformResourceRecord ReadResource(const sql::Row& r) {
  model::UniformResourceRecord u;
  u.uniform_resource_id   = r.GetText(0);
  u.device_id             = r.GetText(1);
  u.ingest_session_id     = r.GetText(2);
  u.ingest_fs_path_id     = r.OptText(3);
  u.uri                   = r.GetText(4);
  u.content_digest        = r.GetText(5);
  u.content               = r.OptBlob(6);
  u.nature                = r.OptText(7);
  u.size_bytes            = r.GetU64(8);
  u.last_modified_at_ms   = r.OptU64(9);
  u.content_fm_body_attrs = r.OptText(10);
  u.frontmatter           = r.OptText(11);
  u.elaboration           = r.OptText(12);
  u.housekeeping          = ReadHousekeeping(r, 13);
  return u;
}

model::UniformResourceTransformRecord ReadTransform(const sql::Row& r) {
  model::UniformResourceTransformRecord x;
  x.uniform_resource_transform_id = r.GetText(0);
  x.uniform_resource_id           = r.GetText(1);
  x.uri                           = r.GetText(2);
  x.content_digest                = r.GetText(3);
  x.content                       = r.OptBlob(4);
  x.nature                        = r.GetText(5);
  x.size_bytes                    = r.GetU64(6);
  x.elaboration                   = r.OptText(7);
  x.housekeeping                  = ReadHousekeeping(r, 8);
  return x;
}

model::GraphRecord ReadGraph(const sql::Row& r) {
  model::GraphRecord g;
  g.name         = r.GetText(0);
  g.elaboration  = r.OptText(1);
  g.housekeeping = ReadHousekeeping(r, 2);
  return g;
}

model::EdgeRecord ReadEdge(const sql::Row& r) {
  model::EdgeRecord e;
  e.graph_name          = r.GetText(0);
  e.nature              = r.GetText(1);
  e.node_id             = r.GetText(2);
  e.uniform_resource_id = r.GetText(3);
  e.elaboration         = r.OptText(4);
  e.housekeeping        = ReadHousekeeping(r, 5);
  return e;
}

model::PathMatchRuleRecord ReadMatchRule(const sql::Row& r) {
  model::PathMatchRuleRecord m;
  m.rule_id               = r.GetText(0);
  m.namespace_name        = r.GetText(1);
  m.regex                 = r.GetText(2);
  m.flags                 = r.GetText(3);
  m.nature                = r.OptText(4);
  m.priority              = r.GetInt64(5);
  m.description           = r.OptText(6);
  m.include_glob_patterns = util::FromJsonArray(r.OptText(7));
  m.exclude_glob_patterns = util::FromJsonArray(r.OptText(8));
  m.elaboration           = r.OptText(9);
  m.housekeeping          = ReadHousekeeping(r, 10);
  return m;
}

model::PathRewriteRuleRecord ReadRewriteRule(const sql::Row& r) {
  model::PathRewriteRuleRecord w;
  w.rule_id        = r.GetText(0);
  w.namespace_name = r.GetText(1);
  w.regex          = r.GetText(2);
  w.replace        = r.GetText(3);
  w.priority       = r.GetInt64(4);
  w.description    = r.OptText(5);
  w.elaboration    = r.OptText(6);
  w.housekeeping   = ReadHousekeeping(r, 7);
  return w;
}

model::OrchestrationNatureRecord ReadNature(const sql::Row& r) {
  model::OrchestrationNatureRecord n;
  n.orchestration_nature_id = r.GetText(0);
  n.nature                  = r.GetText(1);
  n.elaboration             = r.OptText(2);
  n.housekeeping            = ReadHousekeeping(r, 3);
  return n;
}

model::OrchestrationSessionRecord ReadOrchSession(const sql::Row& r) {
  model::OrchestrationSessionRecord s;
  s.orchestration_session_id = r.GetText(0);
  s.device_id                = r.GetText(1);
  s.orchestration_nature_id  = r.GetText(2);
  s.version                  = r.GetText(3);
  s.orch_started_at_ms       = r.GetU64(4);
  s.orch_finished_at_ms      = r.OptU64(5);
  s.elaboration              = r.OptText(6);
  s.args_json                = r.OptText(7);
  s.diagnostics_json         = r.OptText(8);
  s.diagnostics_md           = r.OptText(9);
  s.housekeeping             = ReadHousekeeping(r, 10);
  return s;
}

model::OrchestrationSessionEntryRecord ReadSessionEntry(const sql::Row& r) {
  model::OrchestrationSessionEntryRecord e;
  e.orchestration_session_entry_id = r.GetText(0);
  e.session_id                     = r.GetText(1);
  e.ingest_src                     = r.GetText(2);
  e.ingest_table_name              = r.OptText(3);
  e.elaboration                    = r.OptText(4);
  e.housekeeping                   = ReadHousekeeping(r, 5);
  return e;
}

model::SessionStateRecord ReadSessionState(const sql::Row& r) {
  model::SessionStateRecord s;
  s.orchestration_session_state_id = r.GetText(0);
  s.session_id                     = r.GetText(1);
  s.session_entry_id               = r.OptText(2);
  s.owner_id                       = r.GetText(3);
  s.from_state                     = r.GetText(4);
  s.to_state                       = r.GetText(5);
  s.transition_result              = r.OptText(6);
  s.transition_reason              = r.OptText(7);
  s.transitioned_at_ms             = r.GetU64(8);
  s.transition_count               = r.GetU64(9);
  s.elaboration                    = r.OptText(10);
  s.housekeeping                   = ReadHousekeeping(r, 11);
  return s;
}

model::ExecRecord ReadExec(const sql::Row& r) {
  model::ExecRecord e;
  e.orchestration_session_exec_id = r.GetText(0);
  e.exec_nature                   = r.GetText(1);
  e.session_id                    = r.GetText(2);
  e.session_entry_id              = r.OptText(3);
  e.parent_exec_id                = r.OptText(4);
  e.namespace_name                = r.OptText(5);
  e.exec_identity                 = r.OptText(6);
  e.exec_code                     = r.GetText(7);
  e.exec_status                   = r.GetInt(8);
  e.input_text                    = r.OptText(9);
  e.exec_error_text               = r.OptText(10);
  e.output_text                   = r.OptText(11);
  e.output_nature                 = r.OptText(12);
  e.narrative_md                  = r.OptText(13);
  e.elaboration                   = r.OptText(14);
  e.sibling_order                 = r.GetInt64(15);
  e.started_at_ms                 = r.GetU64(16);
  e.finished_at_ms                = r.OptU64(17);
  e.housekeeping                  = ReadHousekeeping(r, 18);
  e.override_children             = r.GetInt(18 + sql::HOUSEKEEPING_COLUMN_COUNT) != 0;
  return e;
}

model::IssueRecord ReadIssue(const sql::Row& r) {
  model::IssueRecord i;
  i.orchestration_session_issue_id = r.GetText(0);
  i.session_id                     = r.GetText(1);
  i.session_entry_id               = r.OptText(2);
  i.issue_type                     = r.GetText(3);
  i.issue_message                  = r.GetText(4);
  i.issue_row                      = r.OptInt64(5);
  i.issue_column                   = r.OptText(6);
  i.invalid_value                  = r.OptText(7);
  i.remediation                    = r.OptText(8);
  i.elaboration                    = r.OptText(9);
  i.housekeeping                   = ReadHousekeeping(r, 10);
  return i;
}

model::IssueRelationRecord ReadIssueRelation(const sql::Row& r) {
  model::IssueRelationRecord x;
  x.issue_relation_id   = r.GetText(0);
  x.issue_id_prime      = r.GetText(1);
  x.issue_id_rel        = r.GetText(2);
  x.relationship_nature = r.GetText(3);
  x.elaboration         = r.OptText(4);
  x.housekeeping        = ReadHousekeeping(r, 5);
  return x;
}

model::LogRecord ReadLog(const sql::Row& r) {
  model::LogRecord l;
  l.orchestration_session_log_id = r.GetText(0);
  l.session_id                   = r.GetText(1);
  l.exec_id                      = r.OptText(2);
  l.parent_log_id                = r.OptText(3);
  l.category                     = r.OptText(4);
  l.content                      = r.GetText(5);
  l.sibling_order                = r.GetInt64(6);
  l.elaboration                  = r.OptText(7);
  l.housekeeping                 = ReadHousekeeping(r, 8);
  return l;
}

std::string ReadFirstText(const sql::Row& r) {
  return r.GetText(0);
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (sqlite3_extended_errcode(db)) {
    case SQLITE_CONSTRAINT_FOREIGNKEY:
      return Result::Err(ErrorCode::ForeignKeyViolation, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT_UNIQUE:
    case SQLITE_CONSTRAINT_PRIMARYKEY:
      return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
    default:
      break;
  }

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteRepository::Execute(Transaction& t, const std::string& sql, const sql::Params& params) {
  int changes = 0;
  return Execute(t, sql, params, changes);
}

Result SqliteRepository::Execute(Transaction& t, const std::string& sql, const sql::Params& params, int& changes) {
  auto* db = TX(t).Handle();

  SqliteStatement st(db, sql);
  st.Bind(params);

  const int rc = st.Step();
  changes      = sqlite3_changes(db);
  return Translate(db, rc);
}

template <typename T, typename Mapper>
std::vector<T> SqliteRepository::Query(Transaction& t, const std::string& sql, const sql::Params& params,
                                       Mapper map) {
  auto* db = TX(t).Handle();

  SqliteStatement st(db, sql);
  st.Bind(params);

  std::vector<T> out;
  int            rc;
  while ((rc = st.Step()) == SQLITE_ROW) {
    out.push_back(map(st.Row()));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite query: ") + sqlite3_errmsg(db));
  }
  return out;
}

template <typename T, typename Mapper>
std::optional<T> SqliteRepository::QueryOne(Transaction& t, const std::string& sql, const sql::Params& params,
                                            Mapper map) {
  auto rows = Query<T>(t, sql, params, map);
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

int64_t SqliteRepository::QueryInt(Transaction& t, const std::string& sql, const sql::Params& params) {
  auto v = QueryOne<int64_t>(t, sql, params, [](const sql::Row& r) { return r.GetInt64(0); });
  return v.value_or(0);
}

// ------------------------------------------------------------------
// Devices / behaviors
// ------------------------------------------------------------------

Result SqliteRepository::InsertDevice(Transaction& t, const model::DeviceRecord& r) {
  sql::Params p{r.device_id, r.name, r.state, r.boundary, Nullable(r.segmentation), Nullable(r.state_sysinfo),
                Nullable(r.elaboration)};
  AppendHousekeeping(p, r.housekeeping);
  return Execute(t, InsertSql("device", sql::DEVICE_COLUMNS), p);
}

std::optional<model::DeviceRecord> SqliteRepository::GetDevice(Transaction& t, const std::string& id, Visibility v) {
  return QueryOne<model::DeviceRecord>(
      t, SelectSql("device", sql::DEVICE_COLUMNS, std::string("WHERE device_id=?") + LiveFilter(v)), {id},
      ReadDevice);
}

std::optional<model::DeviceRecord> SqliteRepository::FindDevice(Transaction& t, const std::string& name,
                                                                const std::string& state, const std::string& boundary,
                                                                Visibility v) {
  return QueryOne<model::DeviceRecord>(
      t,
      SelectSql("device", sql::DEVICE_COLUMNS,
                std::string("WHERE name=? AND state=? AND boundary=?") + LiveFilter(v)),
      {name, state, boundary}, ReadDevice);
}

std::vector<model::DeviceRecord> SqliteRepository::ListDevices(Transaction& t, Visibility v) {
  return Query<model::DeviceRecord>(
      t, SelectSql("device", sql::DEVICE_COLUMNS, std::string("WHERE 1=1") + LiveFilter(v) + " ORDER BY rowid"), {},
      ReadDevice);
}

Result SqliteRepository::UpsertBehavior(Transaction& t, model::BehaviorRecord& r) {
  sql::Params p{r.behavior_id,        r.device_id, r.behavior_name, r.behavior_conf_json, Nullable(r.assurance_schema_id),
                Nullable(r.governance)};
  AppendHousekeeping(p, r.housekeeping);

  auto res = Execute(t, InsertSql("behavior", sql::BEHAVIOR_COLUMNS, sql::ON_CONFLICT_BEHAVIOR_KEY), p);
  if (!res) return res;

  auto id = QueryOne<std::string>(t, "SELECT behavior_id FROM behavior WHERE device_id=? AND behavior_name=?;",
                                  {r.device_id, r.behavior_name}, ReadFirstText);
  if (id) r.behavior_id = *id;
  return Result::Ok();
}

std::optional<model::BehaviorRecord> SqliteRepository::GetBehavior(Transaction& t, const std::string& id) {
  return QueryOne<model::BehaviorRecord>(t, SelectSql("behavior", sql::BEHAVIOR_COLUMNS, "WHERE behavior_id=?"), {id},
                                         ReadBehavior);
}

Result SqliteRepository::MarkDeleted(Transaction& t, EntityKind kind, const std::string& id,
                                     const std::string& deleted_by, uint64_t deleted_at_ms) {
  const char* table  = nullptr;
  const char* id_col = nullptr;
  switch (kind) {
    case EntityKind::kDevice:
      table  = "device";
      id_col = "device_id";
      break;
    case EntityKind::kBehavior:
      table  = "behavior";
      id_col = "behavior_id";
      break;
    case EntityKind::kIngestSession:
      table  = "ur_ingest_session";
      id_col = "ingest_session_id";
      break;
    case EntityKind::kUniformResource:
      table  = "uniform_resource";
      id_col = "uniform_resource_id";
      break;
    case EntityKind::kUniformResourceTransform:
      table  = "uniform_resource_transform";
      id_col = "uniform_resource_transform_id";
      break;
  }
  if (!table) return Result::Err(ErrorCode::Unsupported, "unknown entity kind");

  int  changes = 0;
  auto res     = Execute(t,
                         std::string("UPDATE ") + table + " SET deleted_at=?, deleted_by=? WHERE " + id_col +
                             "=? AND deleted_at IS NULL;",
                         {deleted_at_ms, deleted_by, id}, changes);
  if (!res || changes > 0) return res;

  const auto present = QueryInt(t, std::string("SELECT COUNT(*) FROM ") + table + " WHERE " + id_col + "=?;", {id});
  return present > 0 ? Result::Ok() : Result::Err(ErrorCode::NotFound, ToString(kind));
}

// ------------------------------------------------------------------
// Ingest sessions
// ------------------------------------------------------------------

Result SqliteRepository::InsertIngestSession(Transaction& t, const model::IngestSessionRecord& r) {
  sql::Params p{r.ingest_session_id,
                r.device_id,
                Nullable(r.behavior_id),
                Nullable(r.behavior_json),
                r.ingest_started_at_ms,
                Nullable(r.ingest_finished_at_ms),
                r.session_agent,
                Nullable(r.elaboration)};
  AppendHousekeeping(p, r.housekeeping);
  return Execute(t, InsertSql("ur_ingest_session", sql::INGEST_SESSION_COLUMNS), p);
}

std::optional<model::IngestSessionRecord> SqliteRepository::GetIngestSession(Transaction& t, const std::string& id,
                                                                             Visibility v) {
  return QueryOne<model::IngestSessionRecord>(
      t,
      SelectSql("ur_ingest_session", sql::INGEST_SESSION_COLUMNS,
                std::string("WHERE ingest_session_id=?") + LiveFilter(v)),
      {id}, ReadIngestSession);
}

std::vector<model::IngestSessionRecord> SqliteRepository::ListIngestSessions(Transaction& t,
                                                                             const std::string& device_id) {
  return Query<model::IngestSessionRecord>(
      t, SelectSql("ur_ingest_session", sql::INGEST_SESSION_COLUMNS, "WHERE device_id=? ORDER BY rowid"),
      {device_id}, ReadIngestSession);
}

Result SqliteRepository::FinishIngestSession(Transaction& t, const std::string& id, uint64_t finished_at_ms,
                                             const std::string& updated_by) {
  int  changes = 0;
  auto res     = Execute(t, sql::FINISH_INGEST_SESSION, {finished_at_ms, updated_by, id}, changes);
  if (!res || changes > 0) return res;

  const auto present = QueryInt(t, "SELECT COUNT(*) FROM ur_ingest_session WHERE ingest_session_id=?;", {id});
  if (present == 0) return Result::Err(ErrorCode::NotFound, "ur_ingest_session");
  return Result::Err(ErrorCode::Conflict, "ingest session already finished");
}

Result SqliteRepository::InsertFsPath(Transaction& t, const model::FsPathRecord& r) {
  sql::Params p{r.ingest_fs_path_id,
                r.ingest_session_id,
                r.source_kind,
                r.root_path,
                util::ToJsonArray(r.include_glob_patterns),
                util::ToJsonArray(r.exclude_glob_patterns),
                Nullable(r.elaboration)};
  AppendHousekeeping(p, r.housekeeping);
  return Execute(t, InsertSql("ur_ingest_session_fs_path", sql::FS_PATH_COLUMNS), p);
}

std::optional<model::FsPathRecord> SqliteRepository::GetFsPath(Transaction& t, const std::string& id) {
  return QueryOne<model::FsPathRecord>(
      t, SelectSql("ur_ingest_session_fs_path", sql::FS_PATH_COLUMNS, "WHERE ingest_fs_path_id=?"), {id},
      ReadFsPath);
}

std::vector<model::FsPathRecord> SqliteRepository::ListFsPaths(Transaction& t, const std::string& session_id) {
  return Query<model::FsPathRecord>(
      t, SelectSql("ur_ingest_session_fs_path", sql::FS_PATH_COLUMNS, "WHERE ingest_session_id=? ORDER BY rowid"),
      {session_id}, ReadFsPath);
}

InsertOutcome SqliteRepository::InsertFsPathEntryIfAbsent(Transaction& t, const model::FsPathEntryRecord& r) {
  sql::Params p{r.ingest_fs_path_entry_id,
                r.ingest_session_id,
                r.ingest_fs_path_id,
                Nullable(r.uniform_resource_id),
                r.file_path_abs,
                r.file_path_rel_parent,
                r.file_path_rel,
                r.file_basename,
                Nullable(r.file_extn),
                Nullable(r.captured_executable),
                Nullable(r.ur_status),
                Nullable(r.ur_diagnostics),
                Nullable(r.ur_transformations),
                Nullable(r.elaboration)};
  AppendHousekeeping(p, r.housekeeping);

  int  changes = 0;
  auto res     = Execute(
      t, InsertSql("ur_ingest_session_fs_path_entry", sql::FS_PATH_ENTRY_COLUMNS, sql::ON_CONFLICT_FS_PATH_ENTRY_KEY), p,
      changes);
  if (!res) return {res, {}, false};
  if (changes > 0) return {Result::Ok(), r.ingest_fs_path_entry_id, true};

  auto id = QueryOne<std::string>(t,
                                  "SELECT ingest_fs_path_entry_id FROM ur_ingest_session_fs_path_entry"
                                  " WHERE ingest_session_id=? AND ingest_fs_path_id=? AND file_path_abs=?;",
                                  {r.ingest_session_id, r.ingest_fs_path_id, r.file_path_abs}, ReadFirstText);
  return {Result::Ok(), id.value_or(std::string{}), false};
}

Result SqliteRepository::UpdateFsPathEntry(Transaction& t, const model::FsPathEntryRecord& r) {
  int  changes = 0;
  auto res     = Execute(t, sql::UPDATE_FS_PATH_ENTRY,
                         {Nullable(r.uniform_resource_id), Nullable(r.ur_status), Nullable(r.ur_diagnostics),
                          Nullable(r.ur_transformations), Nullable(r.elaboration),
                          Nullable(r.housekeeping.updated_at_ms), Nullable(r.housekeeping.updated_by),
                          r.ingest_fs_path_entry_id},
                         changes);
  if (!res) return res;
  return changes > 0 ? Result::Ok() : Result::Err(ErrorCode::NotFound, "ur_ingest_session_fs_path_entry");
}

std::optional<model::FsPathEntryRecord> SqliteRepository::GetFsPathEntry(Transaction& t, const std::string& id) {
  return QueryOne<model::FsPathEntryRecord>(
      t, SelectSql("ur_ingest_session_fs_path_entry", sql::FS_PATH_ENTRY_COLUMNS, "WHERE ingest_fs_path_entry_id=?"),
      {id}, ReadFsPathEntry);
}

std::vector<model::FsPathEntryRecord> SqliteRepository::ListFsPathEntries(Transaction& t,
                                                                          const std::string& session_id) {
  return Query<model::FsPathEntryRecord>(t,
                                         SelectSql("ur_ingest_session_fs_path_entry", sql::FS_PATH_ENTRY_COLUMNS,
                                                   "WHERE ingest_session_id=? ORDER BY rowid"),
                                         {session_id}, ReadFsPathEntry);
}

Result SqliteRepository::InsertTask(Transaction& t, const model::IngestTaskRecord& r) {
  sql::Params p{r.ingest_session_task_id,
                r.ingest_session_id,
                Nullable(r.uniform_resource_id),
                r.captured_executable,
                Nullable(r.ur_status),
                Nullable(r.ur_diagnostics),
                Nullable(r.ur_transformations),
                Nullable(r.elaboration)};
  AppendHousekeeping(p, r.housekeeping);
  return Execute(t, InsertSql("ur_ingest_session_task", sql::TASK_COLUMNS), p);
}

Result SqliteRepository::UpdateTask(Transaction& t, const model::IngestTaskRecord& r) {
  int  changes = 0;
  auto res     = Execute(t, sql::UPDATE_TASK,
                         {Nullable(r.uniform_resource_id), Nullable(r.ur_status), Nullable(r.ur_diagnostics),
                          Nullable(r.ur_transformations), Nullable(r.elaboration),
                          Nullable(r.housekeeping.updated_at_ms), Nullable(r.housekeeping.updated_by),
                          r.ingest_session_task_id},
                         changes);
  if (!res) return res;
  return changes > 0 ? Result::Ok() : Result::Err(ErrorCode::NotFound, "ur_ingest_session_task");
}

std::vector<model::IngestTaskRecord> SqliteRepository::ListTasks(Transaction& t, const std::string& session_id) {
  return Query<model::IngestTaskRecord>(
      t, SelectSql("ur_ingest_session_task", sql::TASK_COLUMNS, "WHERE ingest_session_id=? ORDER BY rowid"),
      {session_id}, ReadTask);
}

// ------------------------------------------------------------------
// Uniform resources
// ------------------------------------------------------------------

InsertOutcome SqliteRepository::InsertUniformResourceIfAbsent(Transaction& t, const model::UniformResourceRecord& r) {
  sql::Params p{r.uniform_resource_id,
                r.device_id,
                r.ingest_session_id,
                Nullable(r.ingest_fs_path_id),
                r.uri,
                r.content_digest,
                sql::NullableBlob(r.content),
                Nullable(r.nature),
                r.size_bytes,
                Nullable(r.last_modified_at_ms),
                Nullable(r.content_fm_body_attrs),
                Nullable(r.frontmatter),
                Nullable(r.elaboration)};
  AppendHousekeeping(p, r.housekeeping);

  int  changes = 0;
  auto res     = Execute(t, InsertSql("uniform_resource", sql::UNIFORM_RESOURCE_COLUMNS, sql::ON_CONFLICT_RESOURCE_KEY),
                         p, changes);
  if (!res) return {res, {}, false};
  if (changes > 0) return {Result::Ok(), r.uniform_resource_id, true};

  auto id = QueryOne<std::string>(t,
                                  "SELECT uniform_resource_id FROM uniform_resource"
                                  " WHERE device_id=? AND content_digest=? AND uri=? AND size_bytes=?;",
                                  {r.device_id, r.content_digest, r.uri, r.size_bytes}, ReadFirstText);
  return {Result::Ok(), id.value_or(std::string{}), false};
}

std::optional<model::UniformResourceRecord> SqliteRepository::GetUniformResource(Transaction& t, const std::string& id,
                                                                                 Visibility v) {
  return QueryOne<model::UniformResourceRecord>(
      t,
      SelectSql("uniform_resource", sql::UNIFORM_RESOURCE_COLUMNS,
                std::string("WHERE uniform_resource_id=?") + LiveFilter(v)),
      {id}, ReadResource);
}

std::optional<model::UniformResourceRecord> SqliteRepository::FindUniformResource(
    Transaction& t, const std::string& device_id, const std::string& content_digest, const std::string& uri,
    uint64_t size_bytes, Visibility v) {
  return QueryOne<model::UniformResourceRecord>(
      t,
      SelectSql("uniform_resource", sql::UNIFORM_RESOURCE_COLUMNS,
                std::string("WHERE device_id=? AND content_digest=? AND uri=? AND size_bytes=?") + LiveFilter(v)),
      {device_id, content_digest, uri, size_bytes}, ReadResource);
}

std::vector<model::UniformResourceRecord> SqliteRepository::ListUniformResources(Transaction& t,
                                                                                 const std::string& device_id,
                                                                                 Visibility v) {
  return Query<model::UniformResourceRecord>(
      t,
      SelectSql("uniform_resource", sql::UNIFORM_RESOURCE_COLUMNS,
                std::string("WHERE device_id=?") + LiveFilter(v) + " ORDER BY rowid"),
      {device_id}, ReadResource);
}

uint64_t SqliteRepository::CountUniformResources(Transaction& t, const std::string& device_id,
                                                 const std::string& content_digest, const std::string& uri,
                                                 uint64_t size_bytes) {
  return static_cast<uint64_t>(
      QueryInt(t, sql::COUNT_UNIFORM_RESOURCE_KEY, {device_id, content_digest, uri, size_bytes}));
}

InsertOutcome SqliteRepository::InsertTransformIfAbsent(Transaction& t,
                                                        const model::UniformResourceTransformRecord& r) {
  sql::Params p{r.uniform_resource_transform_id,
                r.uniform_resource_id,
                r.uri,
                r.content_digest,
                sql::NullableBlob(r.content),
                r.nature,
                r.size_bytes,
                Nullable(r.elaboration)};
  AppendHousekeeping(p, r.housekeeping);

  int  changes = 0;
  auto res = Execute(t, InsertSql("uniform_resource_transform", sql::TRANSFORM_COLUMNS, sql::ON_CONFLICT_TRANSFORM_KEY),
                     p, changes);
  if (!res) return {res, {}, false};
  if (changes > 0) return {Result::Ok(), r.uniform_resource_transform_id, true};

  auto id = QueryOne<std::string>(t,
                                  "SELECT uniform_resource_transform_id FROM uniform_resource_transform"
                                  " WHERE uniform_resource_id=? AND content_digest=? AND nature=? AND size_bytes=?;",
                                  {r.uniform_resource_id, r.content_digest, r.nature, r.size_bytes}, ReadFirstText);
  return {Result::Ok(), id.value_or(std::string{}), false};
}

std::vector<model::UniformResourceTransformRecord> SqliteRepository::ListTransforms(Transaction& t,
                                                                                    const std::string& resource_id,
                                                                                    Visibility v) {
  return Query<model::UniformResourceTransformRecord>(
      t,
      SelectSql("uniform_resource_transform", sql::TRANSFORM_COLUMNS,
                std::string("WHERE uniform_resource_id=?") + LiveFilter(v) + " ORDER BY rowid"),
      {resource_id}, ReadTransform);
}

// ------------------------------------------------------------------
// Lineage
// ------------------------------------------------------------------

InsertOutcome SqliteRepository::InsertGraphIfAbsent(Transaction& t, const model::GraphRecord& r) {
  sql::Params p{r.name, Nullable(r.elaboration)};
  AppendHousekeeping(p, r.housekeeping);

  int  changes = 0;
  auto res = Execute(t, InsertSql("resource_graph", sql::GRAPH_COLUMNS, sql::ON_CONFLICT_GRAPH_KEY), p, changes);
  if (!res) return {res, {}, false};
  return {Result::Ok(), r.name, changes > 0};
}

std::vector<model::GraphRecord> SqliteRepository::ListGraphs(Transaction& t) {
  return Query<model::GraphRecord>(t, SelectSql("resource_graph", sql::GRAPH_COLUMNS, "ORDER BY rowid"), {},
                                   ReadGraph);
}

InsertOutcome SqliteRepository::InsertEdgeIfAbsent(Transaction& t, const model::EdgeRecord& r) {
  sql::Params p{r.graph_name, r.nature, r.node_id, r.uniform_resource_id, Nullable(r.elaboration)};
  AppendHousekeeping(p, r.housekeeping);

  int  changes = 0;
  auto res = Execute(t, InsertSql("resource_edge", sql::EDGE_COLUMNS, sql::ON_CONFLICT_EDGE_KEY), p, changes);
  if (!res) return {res, {}, false};
  return {Result::Ok(), r.uniform_resource_id, changes > 0};
}

std::vector<std::string> SqliteRepository::ListNeighborIds(Transaction& t, const std::string& graph_name,
                                                           const std::string& node_id,
                                                           const std::optional<std::string>& nature,
                                                           const std::string& after, std::size_t limit) {
  return Query<std::string>(t, sql::SELECT_NEIGHBOR_IDS,
                            {graph_name, node_id, Nullable(nature), after, static_cast<int64_t>(limit)},
                            ReadFirstText);
}

std::vector<model::EdgeRecord> SqliteRepository::ListEdgesTo(Transaction& t, const std::string& resource_id) {
  return Query<model::EdgeRecord>(
      t,
      SelectSql("resource_edge", sql::EDGE_COLUMNS,
                "WHERE uniform_resource_id=? ORDER BY graph_name, nature, node_id"),
      {resource_id}, ReadEdge);
}

// ------------------------------------------------------------------
// Path rules
// ------------------------------------------------------------------

Result SqliteRepository::UpsertPathMatchRule(Transaction& t, const model::PathMatchRuleRecord& r) {
  sql::Params p{r.rule_id,
                r.namespace_name,
                r.regex,
                r.flags,
                Nullable(r.nature),
                r.priority,
                Nullable(r.description),
                util::ToJsonArray(r.include_glob_patterns),
                util::ToJsonArray(r.exclude_glob_patterns),
                Nullable(r.elaboration)};
  AppendHousekeeping(p, r.housekeeping);
  return Execute(t, InsertSql("ur_ingest_path_match_rule", sql::MATCH_RULE_COLUMNS, sql::ON_CONFLICT_MATCH_RULE_KEY),
                 p);
}

std::vector<model::PathMatchRuleRecord> SqliteRepository::ListPathMatchRules(Transaction& t,
                                                                             const std::string& namespace_name) {
  return Query<model::PathMatchRuleRecord>(
      t, SelectSql("ur_ingest_path_match_rule", sql::MATCH_RULE_COLUMNS, "WHERE namespace=? ORDER BY rowid"),
      {namespace_name}, ReadMatchRule);
}

Result SqliteRepository::UpsertPathRewriteRule(Transaction& t, const model::PathRewriteRuleRecord& r) {
  sql::Params p{r.rule_id, r.namespace_name, r.regex, r.replace, r.priority, Nullable(r.description),
                Nullable(r.elaboration)};
  AppendHousekeeping(p, r.housekeeping);
  return Execute(
      t, InsertSql("ur_ingest_path_rewrite_rule", sql::REWRITE_RULE_COLUMNS, sql::ON_CONFLICT_REWRITE_RULE_KEY), p);
}

std::vector<model::PathRewriteRuleRecord> SqliteRepository::ListPathRewriteRules(Transaction& t,
                                                                                 const std::string& namespace_name) {
  return Query<model::PathRewriteRuleRecord>(
      t, SelectSql("ur_ingest_path_rewrite_rule", sql::REWRITE_RULE_COLUMNS, "WHERE namespace=? ORDER BY rowid"),
      {namespace_name}, ReadRewriteRule);
}

// ------------------------------------------------------------------
// Orchestration
// ------------------------------------------------------------------

Result SqliteRepository::UpsertNature(Transaction& t, model::OrchestrationNatureRecord& r) {
  sql::Params p{r.orchestration_nature_id, r.nature, Nullable(r.elaboration)};
  AppendHousekeeping(p, r.housekeeping);

  auto res = Execute(t, InsertSql("orchestration_nature", sql::NATURE_COLUMNS, sql::ON_CONFLICT_NATURE_KEY), p);
  if (!res) return res;

  auto id = QueryOne<std::string>(t, "SELECT orchestration_nature_id FROM orchestration_nature WHERE nature=?;",
                                  {r.nature}, ReadFirstText);
  if (id) r.orchestration_nature_id = *id;
  return Result::Ok();
}

std::optional<model::OrchestrationNatureRecord> SqliteRepository::GetNature(Transaction& t, const std::string& id) {
  return QueryOne<model::OrchestrationNatureRecord>(
      t, SelectSql("orchestration_nature", sql::NATURE_COLUMNS, "WHERE orchestration_nature_id=?"), {id},
      ReadNature);
}

Result SqliteRepository::InsertOrchestrationSession(Transaction& t, const model::OrchestrationSessionRecord& r) {
  sql::Params p{r.orchestration_session_id,
                r.device_id,
                r.orchestration_nature_id,
                r.version,
                r.orch_started_at_ms,
                Nullable(r.orch_finished_at_ms),
                Nullable(r.elaboration),
                Nullable(r.args_json),
                Nullable(r.diagnostics_json),
                Nullable(r.diagnostics_md)};
  AppendHousekeeping(p, r.housekeeping);
  return Execute(t, InsertSql("orchestration_session", sql::ORCH_SESSION_COLUMNS), p);
}

std::optional<model::OrchestrationSessionRecord> SqliteRepository::GetOrchestrationSession(Transaction& t,
                                                                                           const std::string& id) {
  return QueryOne<model::OrchestrationSessionRecord>(
      t, SelectSql("orchestration_session", sql::ORCH_SESSION_COLUMNS, "WHERE orchestration_session_id=?"), {id},
      ReadOrchSession);
}

Result SqliteRepository::FinishOrchestrationSession(Transaction& t, const std::string& id, uint64_t finished_at_ms,
                                                    const util::JsonText&              diagnostics_json,
                                                    const std::optional<std::string>& diagnostics_md) {
  int  changes = 0;
  auto res     = Execute(t, sql::FINISH_ORCH_SESSION,
                         {finished_at_ms, Nullable(diagnostics_json), Nullable(diagnostics_md), id}, changes);
  if (!res || changes > 0) return res;

  const auto present =
      QueryInt(t, "SELECT COUNT(*) FROM orchestration_session WHERE orchestration_session_id=?;", {id});
  if (present == 0) return Result::Err(ErrorCode::NotFound, "orchestration_session");
  return Result::Err(ErrorCode::Conflict, "orchestration session already finished");
}

Result SqliteRepository::InsertSessionEntry(Transaction& t, const model::OrchestrationSessionEntryRecord& r) {
  sql::Params p{r.orchestration_session_entry_id, r.session_id, r.ingest_src, Nullable(r.ingest_table_name),
                Nullable(r.elaboration)};
  AppendHousekeeping(p, r.housekeeping);
  return Execute(t, InsertSql("orchestration_session_entry", sql::SESSION_ENTRY_COLUMNS), p);
}

std::optional<model::OrchestrationSessionEntryRecord> SqliteRepository::GetSessionEntry(Transaction& t,
                                                                                       const std::string& id) {
  return QueryOne<model::OrchestrationSessionEntryRecord>(
      t,
      SelectSql("orchestration_session_entry", sql::SESSION_ENTRY_COLUMNS, "WHERE orchestration_session_entry_id=?"),
      {id}, ReadSessionEntry);
}

std::vector<model::OrchestrationSessionEntryRecord> SqliteRepository::ListSessionEntries(
    Transaction& t, const std::string& session_id) {
  return Query<model::OrchestrationSessionEntryRecord>(
      t, SelectSql("orchestration_session_entry", sql::SESSION_ENTRY_COLUMNS, "WHERE session_id=? ORDER BY rowid"),
      {session_id}, ReadSessionEntry);
}

Result SqliteRepository::UpsertSessionState(Transaction& t, const model::SessionStateRecord& r) {
  sql::Params p{r.orchestration_session_state_id,
                r.session_id,
                Nullable(r.session_entry_id),
                r.owner_id,
                r.from_state,
                r.to_state,
                Nullable(r.transition_result),
                Nullable(r.transition_reason),
                r.transitioned_at_ms,
                uint64_t{1},
                Nullable(r.elaboration)};
  AppendHousekeeping(p, r.housekeeping);
  return Execute(
      t, InsertSql("orchestration_session_state", sql::SESSION_STATE_COLUMNS, sql::ON_CONFLICT_SESSION_STATE_KEY), p);
}

std::optional<model::SessionStateRecord> SqliteRepository::FindSessionState(Transaction& t,
                                                                            const std::string& owner_id,
                                                                            const std::string& from_state,
                                                                            const std::string& to_state) {
  return QueryOne<model::SessionStateRecord>(
      t,
      SelectSql("orchestration_session_state", sql::SESSION_STATE_COLUMNS,
                "WHERE owner_id=? AND from_state=? AND to_state=?"),
      {owner_id, from_state, to_state}, ReadSessionState);
}

std::vector<model::SessionStateRecord> SqliteRepository::ListSessionStates(Transaction& t,
                                                                           const std::string& session_id) {
  return Query<model::SessionStateRecord>(
      t, SelectSql("orchestration_session_state", sql::SESSION_STATE_COLUMNS, "WHERE session_id=? ORDER BY rowid"),
      {session_id}, ReadSessionState);
}

Result SqliteRepository::InsertExec(Transaction& t, const model::ExecRecord& r) {
  sql::Params p{r.orchestration_session_exec_id,
                r.exec_nature,
                r.session_id,
                Nullable(r.session_entry_id),
                Nullable(r.parent_exec_id),
                Nullable(r.namespace_name),
                Nullable(r.exec_identity),
                r.exec_code,
                static_cast<int32_t>(r.exec_status),
                Nullable(r.input_text),
                Nullable(r.exec_error_text),
                Nullable(r.output_text),
                Nullable(r.output_nature),
                Nullable(r.narrative_md),
                Nullable(r.elaboration),
                r.sibling_order,
                r.started_at_ms,
                Nullable(r.finished_at_ms)};
  AppendHousekeeping(p, r.housekeeping);
  p.emplace_back(static_cast<int32_t>(r.override_children ? 1 : 0));
  return Execute(t, InsertSql("orchestration_session_exec", sql::EXEC_COLUMNS), p);
}

Result SqliteRepository::UpdateExec(Transaction& t, const model::ExecRecord& r) {
  int  changes = 0;
  auto res     = Execute(t, sql::UPDATE_EXEC,
                         {static_cast<int32_t>(r.exec_status), Nullable(r.output_text), Nullable(r.output_nature),
                          Nullable(r.exec_error_text), Nullable(r.narrative_md), Nullable(r.elaboration),
                          Nullable(r.finished_at_ms), Nullable(r.finished_at_ms),
                          static_cast<int32_t>(r.override_children ? 1 : 0), r.orchestration_session_exec_id},
                         changes);
  if (!res) return res;
  return changes > 0 ? Result::Ok() : Result::Err(ErrorCode::NotFound, "orchestration_session_exec");
}

std::optional<model::ExecRecord> SqliteRepository::GetExec(Transaction& t, const std::string& id) {
  return QueryOne<model::ExecRecord>(
      t, SelectSql("orchestration_session_exec", sql::EXEC_COLUMNS, "WHERE orchestration_session_exec_id=?"), {id},
      ReadExec);
}

std::vector<model::ExecRecord> SqliteRepository::ListExecs(Transaction& t, const std::string& session_id) {
  return Query<model::ExecRecord>(
      t,
      SelectSql("orchestration_session_exec", sql::EXEC_COLUMNS, "WHERE session_id=? ORDER BY sibling_order, rowid"),
      {session_id}, ReadExec);
}

int64_t SqliteRepository::MaxExecSiblingOrder(Transaction& t, const std::string& session_id,
                                              const std::optional<std::string>& parent_exec_id) {
  return QueryInt(t, sql::SELECT_MAX_EXEC_SIBLING_ORDER, {session_id, Nullable(parent_exec_id)});
}

Result SqliteRepository::InsertIssue(Transaction& t, const model::IssueRecord& r) {
  sql::Params p{r.orchestration_session_issue_id,
                r.session_id,
                Nullable(r.session_entry_id),
                r.issue_type,
                r.issue_message,
                Nullable(r.issue_row),
                Nullable(r.issue_column),
                Nullable(r.invalid_value),
                Nullable(r.remediation),
                Nullable(r.elaboration)};
  AppendHousekeeping(p, r.housekeeping);
  return Execute(t, InsertSql("orchestration_session_issue", sql::ISSUE_COLUMNS), p);
}

std::vector<model::IssueRecord> SqliteRepository::ListIssues(Transaction& t, const std::string& session_id) {
  return Query<model::IssueRecord>(
      t, SelectSql("orchestration_session_issue", sql::ISSUE_COLUMNS, "WHERE session_id=? ORDER BY rowid"),
      {session_id}, ReadIssue);
}

Result SqliteRepository::InsertIssueRelation(Transaction& t, const model::IssueRelationRecord& r) {
  sql::Params p{r.issue_relation_id, r.issue_id_prime, r.issue_id_rel, r.relationship_nature,
                Nullable(r.elaboration)};
  AppendHousekeeping(p, r.housekeeping);
  return Execute(t, InsertSql("orchestration_session_issue_relation", sql::ISSUE_RELATION_COLUMNS), p);
}

std::vector<model::IssueRelationRecord> SqliteRepository::ListIssueRelations(Transaction& t,
                                                                             const std::string& issue_id) {
  return Query<model::IssueRelationRecord>(t,
                                           SelectSql("orchestration_session_issue_relation",
                                                     sql::ISSUE_RELATION_COLUMNS, "WHERE issue_id_prime=? ORDER BY rowid"),
                                           {issue_id}, ReadIssueRelation);
}

Result SqliteRepository::InsertLog(Transaction& t, const model::LogRecord& r) {
  sql::Params p{r.orchestration_session_log_id,
                r.session_id,
                Nullable(r.exec_id),
                Nullable(r.parent_log_id),
                Nullable(r.category),
                r.content,
                r.sibling_order,
                Nullable(r.elaboration)};
  AppendHousekeeping(p, r.housekeeping);
  return Execute(t, InsertSql("orchestration_session_log", sql::LOG_COLUMNS), p);
}

std::optional<model::LogRecord> SqliteRepository::GetLog(Transaction& t, const std::string& id) {
  return QueryOne<model::LogRecord>(
      t, SelectSql("orchestration_session_log", sql::LOG_COLUMNS, "WHERE orchestration_session_log_id=?"), {id},
      ReadLog);
}

std::vector<model::LogRecord> SqliteRepository::ListLogs(Transaction& t, const std::string& session_id) {
  return Query<model::LogRecord>(
      t, SelectSql("orchestration_session_log", sql::LOG_COLUMNS, "WHERE session_id=? ORDER BY sibling_order, rowid"),
      {session_id}, ReadLog);
}

int64_t SqliteRepository::MaxLogSiblingOrder(Transaction& t, const std::string& session_id,
                                             const std::optional<std::string>& parent_log_id) {
  return QueryInt(t, sql::SELECT_MAX_LOG_SIBLING_ORDER, {session_id, Nullable(parent_log_id)});
}

} // namespace ure::db::sqlite
