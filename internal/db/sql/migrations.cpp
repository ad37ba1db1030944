#include "internal/db/sql/migrations.hpp"

#include <stdexcept>

#include "internal/util/time.hpp"

namespace ure::db::sql {

namespace {

// Housekeeping envelope shared by every table.
const std::string kHousekeeping =
    "created_at INTEGER NOT NULL,"
    " created_by TEXT NOT NULL DEFAULT 'UNKNOWN',"
    " updated_at INTEGER,"
    " updated_by TEXT,"
    " deleted_at INTEGER,"
    " deleted_by TEXT,"
    " activity_log TEXT";

std::string Json(const std::string& column) {
  return column + " TEXT CHECK(json_valid(" + column + ") OR " + column + " IS NULL)";
}

std::string RequiredJson(const std::string& column) {
  return column + " TEXT NOT NULL CHECK(json_valid(" + column + "))";
}

std::string V1() {
  std::string s;

  s += "CREATE TABLE IF NOT EXISTS device ("
       " device_id TEXT PRIMARY KEY,"
       " name TEXT NOT NULL,"
       " state TEXT NOT NULL,"
       " boundary TEXT NOT NULL, " +
       Json("segmentation") + ", " + Json("state_sysinfo") + ", " + Json("elaboration") + ", " + kHousekeeping +
       ", UNIQUE(name, state, boundary));";

  s += "CREATE TABLE IF NOT EXISTS behavior ("
       " behavior_id TEXT PRIMARY KEY,"
       " device_id TEXT NOT NULL REFERENCES device(device_id),"
       " behavior_name TEXT NOT NULL, " +
       RequiredJson("behavior_conf_json") + ", assurance_schema_id TEXT, " + Json("governance") + ", " +
       kHousekeeping + ", UNIQUE(device_id, behavior_name));";

  s += "CREATE TABLE IF NOT EXISTS ur_ingest_session ("
       " ingest_session_id TEXT PRIMARY KEY,"
       " device_id TEXT NOT NULL REFERENCES device(device_id),"
       " behavior_id TEXT REFERENCES behavior(behavior_id), " +
       Json("behavior_json") +
       ", ingest_started_at INTEGER NOT NULL,"
       " ingest_finished_at INTEGER, " +
       RequiredJson("session_agent") + ", " + Json("elaboration") + ", " + kHousekeeping + ");";

  s += "CREATE TABLE IF NOT EXISTS ur_ingest_session_fs_path ("
       " ingest_fs_path_id TEXT PRIMARY KEY,"
       " ingest_session_id TEXT NOT NULL REFERENCES ur_ingest_session(ingest_session_id),"
       " source_kind TEXT NOT NULL DEFAULT 'fs',"
       " root_path TEXT NOT NULL, " +
       Json("include_glob_patterns") + ", " + Json("exclude_glob_patterns") + ", " + Json("elaboration") + ", " +
       kHousekeeping + ", UNIQUE(ingest_session_id, root_path));";

  s += "CREATE TABLE IF NOT EXISTS uniform_resource ("
       " uniform_resource_id TEXT PRIMARY KEY,"
       " device_id TEXT NOT NULL REFERENCES device(device_id),"
       " ingest_session_id TEXT NOT NULL REFERENCES ur_ingest_session(ingest_session_id),"
       " ingest_fs_path_id TEXT REFERENCES ur_ingest_session_fs_path(ingest_fs_path_id),"
       " uri TEXT NOT NULL,"
       " content_digest TEXT NOT NULL,"
       " content BLOB,"
       " nature TEXT,"
       " size_bytes INTEGER NOT NULL,"
       " last_modified_at INTEGER, " +
       Json("content_fm_body_attrs") + ", " + Json("frontmatter") + ", " + Json("elaboration") + ", " +
       kHousekeeping + ", UNIQUE(device_id, content_digest, uri, size_bytes));";

  s += "CREATE TABLE IF NOT EXISTS uniform_resource_transform ("
       " uniform_resource_transform_id TEXT PRIMARY KEY,"
       " uniform_resource_id TEXT NOT NULL REFERENCES uniform_resource(uniform_resource_id),"
       " uri TEXT NOT NULL,"
       " content_digest TEXT NOT NULL,"
       " content BLOB,"
       " nature TEXT NOT NULL,"
       " size_bytes INTEGER NOT NULL, " +
       Json("elaboration") + ", " + kHousekeeping +
       ", UNIQUE(uniform_resource_id, content_digest, nature, size_bytes));";

  s += "CREATE TABLE IF NOT EXISTS ur_ingest_session_fs_path_entry ("
       " ingest_fs_path_entry_id TEXT PRIMARY KEY,"
       " ingest_session_id TEXT NOT NULL REFERENCES ur_ingest_session(ingest_session_id),"
       " ingest_fs_path_id TEXT NOT NULL REFERENCES ur_ingest_session_fs_path(ingest_fs_path_id),"
       " uniform_resource_id TEXT REFERENCES uniform_resource(uniform_resource_id),"
       " file_path_abs TEXT NOT NULL,"
       " file_path_rel_parent TEXT NOT NULL,"
       " file_path_rel TEXT NOT NULL,"
       " file_basename TEXT NOT NULL,"
       " file_extn TEXT, " +
       Json("captured_executable") + ", ur_status TEXT, " + Json("ur_diagnostics") + ", " +
       Json("ur_transformations") + ", " + Json("elaboration") + ", " + kHousekeeping +
       ", UNIQUE(ingest_session_id, ingest_fs_path_id, file_path_abs));";

  s += "CREATE TABLE IF NOT EXISTS ur_ingest_session_task ("
       " ingest_session_task_id TEXT PRIMARY KEY,"
       " ingest_session_id TEXT NOT NULL REFERENCES ur_ingest_session(ingest_session_id),"
       " uniform_resource_id TEXT REFERENCES uniform_resource(uniform_resource_id), " +
       RequiredJson("captured_executable") + ", ur_status TEXT, " + Json("ur_diagnostics") + ", " +
       Json("ur_transformations") + ", " + Json("elaboration") + ", " + kHousekeeping + ");";

  s += "CREATE TABLE IF NOT EXISTS resource_graph ("
       " name TEXT PRIMARY KEY, " +
       Json("elaboration") + ", " + kHousekeeping + ");";

  s += "CREATE TABLE IF NOT EXISTS resource_edge ("
       " graph_name TEXT NOT NULL REFERENCES resource_graph(name),"
       " nature TEXT NOT NULL,"
       " node_id TEXT NOT NULL,"
       " uniform_resource_id TEXT NOT NULL REFERENCES uniform_resource(uniform_resource_id), " +
       Json("elaboration") + ", " + kHousekeeping + ", UNIQUE(graph_name, nature, node_id, uniform_resource_id));";

  s += "CREATE TABLE IF NOT EXISTS ur_ingest_path_match_rule ("
       " rule_id TEXT PRIMARY KEY,"
       " namespace TEXT NOT NULL,"
       " regex TEXT NOT NULL,"
       " flags TEXT NOT NULL,"
       " nature TEXT,"
       " priority INTEGER NOT NULL DEFAULT 0,"
       " description TEXT, " +
       Json("include_globs") + ", " + Json("exclude_globs") + ", " + Json("elaboration") + ", " + kHousekeeping +
       ", UNIQUE(namespace, regex));";

  s += "CREATE TABLE IF NOT EXISTS ur_ingest_path_rewrite_rule ("
       " rule_id TEXT PRIMARY KEY,"
       " namespace TEXT NOT NULL,"
       " regex TEXT NOT NULL,"
       " replacement TEXT NOT NULL,"
       " priority INTEGER NOT NULL DEFAULT 0,"
       " description TEXT, " +
       Json("elaboration") + ", " + kHousekeeping + ", UNIQUE(namespace, regex, replacement));";

  s += "CREATE TABLE IF NOT EXISTS orchestration_nature ("
       " orchestration_nature_id TEXT PRIMARY KEY,"
       " nature TEXT NOT NULL UNIQUE, " +
       Json("elaboration") + ", " + kHousekeeping + ");";

  s += "CREATE TABLE IF NOT EXISTS orchestration_session ("
       " orchestration_session_id TEXT PRIMARY KEY,"
       " device_id TEXT NOT NULL REFERENCES device(device_id),"
       " orchestration_nature_id TEXT NOT NULL REFERENCES orchestration_nature(orchestration_nature_id),"
       " version TEXT NOT NULL,"
       " orch_started_at INTEGER NOT NULL,"
       " orch_finished_at INTEGER, " +
       Json("elaboration") + ", " + Json("args_json") + ", " + Json("diagnostics_json") + ", diagnostics_md TEXT, " +
       kHousekeeping + ");";

  s += "CREATE TABLE IF NOT EXISTS orchestration_session_entry ("
       " orchestration_session_entry_id TEXT PRIMARY KEY,"
       " session_id TEXT NOT NULL REFERENCES orchestration_session(orchestration_session_id),"
       " ingest_src TEXT NOT NULL,"
       " ingest_table_name TEXT, " +
       Json("elaboration") + ", " + kHousekeeping + ");";

  s += "CREATE TABLE IF NOT EXISTS orchestration_session_state ("
       " orchestration_session_state_id TEXT PRIMARY KEY,"
       " session_id TEXT NOT NULL REFERENCES orchestration_session(orchestration_session_id),"
       " session_entry_id TEXT REFERENCES orchestration_session_entry(orchestration_session_entry_id),"
       " owner_id TEXT NOT NULL,"
       " from_state TEXT NOT NULL,"
       " to_state TEXT NOT NULL,"
       " transition_result TEXT,"
       " transition_reason TEXT,"
       " transitioned_at INTEGER NOT NULL,"
       " transition_count INTEGER NOT NULL DEFAULT 1, " +
       Json("elaboration") + ", " + kHousekeeping + ", UNIQUE(owner_id, from_state, to_state));";

  s += "CREATE TABLE IF NOT EXISTS orchestration_session_exec ("
       " orchestration_session_exec_id TEXT PRIMARY KEY,"
       " exec_nature TEXT NOT NULL,"
       " session_id TEXT NOT NULL REFERENCES orchestration_session(orchestration_session_id),"
       " session_entry_id TEXT REFERENCES orchestration_session_entry(orchestration_session_entry_id),"
       " parent_exec_id TEXT REFERENCES orchestration_session_exec(orchestration_session_exec_id),"
       " namespace TEXT,"
       " exec_identity TEXT,"
       " exec_code TEXT NOT NULL,"
       " exec_status INTEGER NOT NULL DEFAULT 0,"
       " input_text TEXT,"
       " exec_error_text TEXT,"
       " output_text TEXT,"
       " output_nature TEXT,"
       " narrative_md TEXT, " +
       Json("elaboration") +
       ", sibling_order INTEGER NOT NULL,"
       " started_at INTEGER NOT NULL,"
       " finished_at INTEGER, " +
       kHousekeeping + ");";

  s += "CREATE TABLE IF NOT EXISTS orchestration_session_issue ("
       " orchestration_session_issue_id TEXT PRIMARY KEY,"
       " session_id TEXT NOT NULL REFERENCES orchestration_session(orchestration_session_id),"
       " session_entry_id TEXT REFERENCES orchestration_session_entry(orchestration_session_entry_id),"
       " issue_type TEXT NOT NULL,"
       " issue_message TEXT NOT NULL,"
       " issue_row INTEGER,"
       " issue_column TEXT,"
       " invalid_value TEXT,"
       " remediation TEXT, " +
       Json("elaboration") + ", " + kHousekeeping + ");";

  s += "CREATE TABLE IF NOT EXISTS orchestration_session_issue_relation ("
       " issue_relation_id TEXT PRIMARY KEY,"
       " issue_id_prime TEXT NOT NULL REFERENCES orchestration_session_issue(orchestration_session_issue_id),"
       " issue_id_rel TEXT NOT NULL,"
       " relationship_nature TEXT NOT NULL, " +
       Json("elaboration") + ", " + kHousekeeping + ");";

  s += "CREATE TABLE IF NOT EXISTS orchestration_session_log ("
       " orchestration_session_log_id TEXT PRIMARY KEY,"
       " session_id TEXT NOT NULL REFERENCES orchestration_session(orchestration_session_id),"
       " exec_id TEXT REFERENCES orchestration_session_exec(orchestration_session_exec_id),"
       " parent_log_id TEXT REFERENCES orchestration_session_log(orchestration_session_log_id),"
       " category TEXT,"
       " content TEXT NOT NULL,"
       " sibling_order INTEGER NOT NULL, " +
       Json("elaboration") + ", " + kHousekeeping + ");";

  return s;
}

// Lookup paths used by neighbor paging, session listings and tree rebuilds.
std::string V2() {
  return "CREATE INDEX IF NOT EXISTS idx_resource_edge_node"
         " ON resource_edge(graph_name, node_id, uniform_resource_id);"
         "CREATE INDEX IF NOT EXISTS idx_resource_edge_resource ON resource_edge(uniform_resource_id);"
         "CREATE INDEX IF NOT EXISTS idx_uniform_resource_device ON uniform_resource(device_id);"
         "CREATE INDEX IF NOT EXISTS idx_fs_path_entry_session ON ur_ingest_session_fs_path_entry(ingest_session_id);"
         "CREATE INDEX IF NOT EXISTS idx_exec_session ON orchestration_session_exec(session_id, parent_exec_id);"
         "CREATE INDEX IF NOT EXISTS idx_issue_session ON orchestration_session_issue(session_id);"
         "CREATE INDEX IF NOT EXISTS idx_log_session ON orchestration_session_log(session_id, parent_log_id);"
         "CREATE INDEX IF NOT EXISTS idx_state_session ON orchestration_session_state(session_id);";
}

// Finished parents remember whether they tolerate failed children.
std::string V3() {
  return "ALTER TABLE orchestration_session_exec ADD COLUMN override_children INTEGER NOT NULL DEFAULT 0;";
}

} // namespace

int RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  executor.ExecuteSQL(
      "CREATE TABLE IF NOT EXISTS ure_schema_migrations ("
      " version INTEGER PRIMARY KEY,"
      " applied_at_ms INTEGER NOT NULL);");

  const int64_t current = executor.CurrentVersion();
  int           applied = 0;

  for (size_t i = 0; i < ordered_sql.size(); ++i) {
    const auto version = static_cast<int64_t>(i) + 1;
    if (version <= current) continue;

    executor.ExecuteSQL("BEGIN IMMEDIATE;");
    try {
      executor.ExecuteSQL(ordered_sql[i]);
      executor.ExecuteSQL("INSERT INTO ure_schema_migrations(version, applied_at_ms) VALUES(" +
                          std::to_string(version) + ", " + std::to_string(util::NowMs()) + ");");
      executor.ExecuteSQL("COMMIT;");
    } catch (const std::exception& e) {
      executor.ExecuteSQL("ROLLBACK;");
      throw std::runtime_error("migration " + std::to_string(version) + " failed: " + e.what());
    }
    ++applied;
  }
  return applied;
}

const std::vector<std::string>& SchemaMigrations() {
  static const std::vector<std::string> migrations{V1(), V2(), V3()};
  return migrations;
}

} // namespace ure::db::sql
