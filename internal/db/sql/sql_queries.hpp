#pragma once

namespace ure::db::sql {

/*
  Canonical column lists and statements.

  IMPORTANT:
  Mappers read columns positionally, so every SELECT uses these lists in
  this order and the housekeeping envelope always comes last.
*/

#define URE_SQL_HOUSEKEEPING_COLUMNS \
  "created_at,created_by,updated_at,updated_by,deleted_at,deleted_by,activity_log"

static constexpr int HOUSEKEEPING_COLUMN_COUNT = 7;

static constexpr const char* DEVICE_COLUMNS =
    "device_id,name,state,boundary,segmentation,state_sysinfo,elaboration," URE_SQL_HOUSEKEEPING_COLUMNS;

static constexpr const char* BEHAVIOR_COLUMNS =
    "behavior_id,device_id,behavior_name,behavior_conf_json,assurance_schema_id,governance,"
    URE_SQL_HOUSEKEEPING_COLUMNS;

static constexpr const char* INGEST_SESSION_COLUMNS =
    "ingest_session_id,device_id,behavior_id,behavior_json,ingest_started_at,ingest_finished_at,"
    "session_agent,elaboration," URE_SQL_HOUSEKEEPING_COLUMNS;

static constexpr const char* FS_PATH_COLUMNS =
    "ingest_fs_path_id,ingest_session_id,source_kind,root_path,include_glob_patterns,exclude_glob_patterns,"
    "elaboration," URE_SQL_HOUSEKEEPING_COLUMNS;

static constexpr const char* FS_PATH_ENTRY_COLUMNS =
    "ingest_fs_path_entry_id,ingest_session_id,ingest_fs_path_id,uniform_resource_id,file_path_abs,"
    "file_path_rel_parent,file_path_rel,file_basename,file_extn,captured_executable,ur_status,ur_diagnostics,"
    "ur_transformations,elaboration," URE_SQL_HOUSEKEEPING_COLUMNS;

static constexpr const char* TASK_COLUMNS =
    "ingest_session_task_id,ingest_session_id,uniform_resource_id,captured_executable,ur_status,ur_diagnostics,"
    "ur_transformations,elaboration," URE_SQL_HOUSEKEEPING_COLUMNS;

static constexpr const char* UNIFORM_RESOURCE_COLUMNS =
    "uniform_resource_id,device_id,ingest_session_id,ingest_fs_path_id,uri,content_digest,content,nature,"
    "size_bytes,last_modified_at,content_fm_body_attrs,frontmatter,elaboration," URE_SQL_HOUSEKEEPING_COLUMNS;

static constexpr const char* TRANSFORM_COLUMNS =
    "uniform_resource_transform_id,uniform_resource_id,uri,content_digest,content,nature,size_bytes,elaboration,"
    URE_SQL_HOUSEKEEPING_COLUMNS;

static constexpr const char* GRAPH_COLUMNS = "name,elaboration," URE_SQL_HOUSEKEEPING_COLUMNS;

static constexpr const char* EDGE_COLUMNS =
    "graph_name,nature,node_id,uniform_resource_id,elaboration," URE_SQL_HOUSEKEEPING_COLUMNS;

static constexpr const char* MATCH_RULE_COLUMNS =
    "rule_id,namespace,regex,flags,nature,priority,description,include_globs,exclude_globs,elaboration,"
    URE_SQL_HOUSEKEEPING_COLUMNS;

static constexpr const char* REWRITE_RULE_COLUMNS =
    "rule_id,namespace,regex,replacement,priority,description,elaboration," URE_SQL_HOUSEKEEPING_COLUMNS;

static constexpr const char* NATURE_COLUMNS =
    "orchestration_nature_id,nature,elaboration," URE_SQL_HOUSEKEEPING_COLUMNS;

static constexpr const char* ORCH_SESSION_COLUMNS =
    "orchestration_session_id,device_id,orchestration_nature_id,version,orch_started_at,orch_finished_at,"
    "elaboration,args_json,diagnostics_json,diagnostics_md," URE_SQL_HOUSEKEEPING_COLUMNS;

static constexpr const char* SESSION_ENTRY_COLUMNS =
    "orchestration_session_entry_id,session_id,ingest_src,ingest_table_name,elaboration,"
    URE_SQL_HOUSEKEEPING_COLUMNS;

static constexpr const char* SESSION_STATE_COLUMNS =
    "orchestration_session_state_id,session_id,session_entry_id,owner_id,from_state,to_state,transition_result,"
    "transition_reason,transitioned_at,transition_count,elaboration," URE_SQL_HOUSEKEEPING_COLUMNS;

static constexpr const char* EXEC_COLUMNS =
    "orchestration_session_exec_id,exec_nature,session_id,session_entry_id,parent_exec_id,namespace,"
    "exec_identity,exec_code,exec_status,input_text,exec_error_text,output_text,output_nature,narrative_md,"
    "elaboration,sibling_order,started_at,finished_at," URE_SQL_HOUSEKEEPING_COLUMNS ",override_children";

static constexpr const char* ISSUE_COLUMNS =
    "orchestration_session_issue_id,session_id,session_entry_id,issue_type,issue_message,issue_row,issue_column,"
    "invalid_value,remediation,elaboration," URE_SQL_HOUSEKEEPING_COLUMNS;

static constexpr const char* ISSUE_RELATION_COLUMNS =
    "issue_relation_id,issue_id_prime,issue_id_rel,relationship_nature,elaboration," URE_SQL_HOUSEKEEPING_COLUMNS;

static constexpr const char* LOG_COLUMNS =
    "orchestration_session_log_id,session_id,exec_id,parent_log_id,category,content,sibling_order,elaboration,"
    URE_SQL_HOUSEKEEPING_COLUMNS;

// compare-and-insert / overwrite clauses

static constexpr const char* ON_CONFLICT_RESOURCE_KEY =
    " ON CONFLICT(device_id,content_digest,uri,size_bytes) DO NOTHING";

static constexpr const char* ON_CONFLICT_TRANSFORM_KEY =
    " ON CONFLICT(uniform_resource_id,content_digest,nature,size_bytes) DO NOTHING";

static constexpr const char* ON_CONFLICT_FS_PATH_ENTRY_KEY =
    " ON CONFLICT(ingest_session_id,ingest_fs_path_id,file_path_abs) DO NOTHING";

static constexpr const char* ON_CONFLICT_GRAPH_KEY = " ON CONFLICT(name) DO NOTHING";

static constexpr const char* ON_CONFLICT_EDGE_KEY =
    " ON CONFLICT(graph_name,nature,node_id,uniform_resource_id) DO NOTHING";

static constexpr const char* ON_CONFLICT_NATURE_KEY = " ON CONFLICT(nature) DO NOTHING";

static constexpr const char* ON_CONFLICT_BEHAVIOR_KEY =
    " ON CONFLICT(device_id,behavior_name) DO UPDATE SET"
    " behavior_conf_json=excluded.behavior_conf_json,"
    " assurance_schema_id=excluded.assurance_schema_id,"
    " governance=excluded.governance,"
    " updated_at=excluded.created_at,"
    " updated_by=excluded.created_by";

static constexpr const char* ON_CONFLICT_MATCH_RULE_KEY =
    " ON CONFLICT(namespace,regex) DO UPDATE SET"
    " flags=excluded.flags,"
    " nature=excluded.nature,"
    " priority=excluded.priority,"
    " description=excluded.description,"
    " include_globs=excluded.include_globs,"
    " exclude_globs=excluded.exclude_globs,"
    " elaboration=excluded.elaboration,"
    " updated_at=excluded.created_at,"
    " updated_by=excluded.created_by";

static constexpr const char* ON_CONFLICT_REWRITE_RULE_KEY =
    " ON CONFLICT(namespace,regex,replacement) DO UPDATE SET"
    " priority=excluded.priority,"
    " description=excluded.description,"
    " elaboration=excluded.elaboration,"
    " updated_at=excluded.created_at,"
    " updated_by=excluded.created_by";

// Last writer wins; the counter records how often the transition was seen.
static constexpr const char* ON_CONFLICT_SESSION_STATE_KEY =
    " ON CONFLICT(owner_id,from_state,to_state) DO UPDATE SET"
    " transition_result=excluded.transition_result,"
    " transition_reason=excluded.transition_reason,"
    " transitioned_at=excluded.transitioned_at,"
    " elaboration=excluded.elaboration,"
    " transition_count=orchestration_session_state.transition_count+1,"
    " updated_at=excluded.transitioned_at,"
    " updated_by=excluded.created_by";

// updates

static constexpr const char* FINISH_INGEST_SESSION =
    "UPDATE ur_ingest_session SET ingest_finished_at=?1, updated_at=?1, updated_by=?2"
    " WHERE ingest_session_id=?3 AND ingest_finished_at IS NULL;";

static constexpr const char* FINISH_ORCH_SESSION =
    "UPDATE orchestration_session SET orch_finished_at=?1, updated_at=?1, diagnostics_json=?2, diagnostics_md=?3"
    " WHERE orchestration_session_id=?4 AND orch_finished_at IS NULL;";

static constexpr const char* UPDATE_FS_PATH_ENTRY =
    "UPDATE ur_ingest_session_fs_path_entry SET uniform_resource_id=?, ur_status=?, ur_diagnostics=?,"
    " ur_transformations=?, elaboration=?, updated_at=?, updated_by=?"
    " WHERE ingest_fs_path_entry_id=?;";

static constexpr const char* UPDATE_TASK =
    "UPDATE ur_ingest_session_task SET uniform_resource_id=?, ur_status=?, ur_diagnostics=?,"
    " ur_transformations=?, elaboration=?, updated_at=?, updated_by=?"
    " WHERE ingest_session_task_id=?;";

static constexpr const char* UPDATE_EXEC =
    "UPDATE orchestration_session_exec SET exec_status=?, output_text=?, output_nature=?, exec_error_text=?,"
    " narrative_md=?, elaboration=?, finished_at=?, updated_at=?, override_children=?"
    " WHERE orchestration_session_exec_id=?;";

// paging

static constexpr const char* SELECT_NEIGHBOR_IDS =
    "SELECT DISTINCT uniform_resource_id FROM resource_edge"
    " WHERE graph_name=?1 AND node_id=?2 AND (?3 IS NULL OR nature=?3) AND uniform_resource_id>?4"
    " ORDER BY uniform_resource_id LIMIT ?5;";

static constexpr const char* SELECT_MAX_EXEC_SIBLING_ORDER =
    "SELECT COALESCE(MAX(sibling_order), -1) FROM orchestration_session_exec"
    " WHERE session_id=?1 AND parent_exec_id IS ?2;";

static constexpr const char* SELECT_MAX_LOG_SIBLING_ORDER =
    "SELECT COALESCE(MAX(sibling_order), -1) FROM orchestration_session_log"
    " WHERE session_id=?1 AND parent_log_id IS ?2;";

static constexpr const char* COUNT_UNIFORM_RESOURCE_KEY =
    "SELECT COUNT(*) FROM uniform_resource"
    " WHERE device_id=? AND content_digest=? AND uri=? AND size_bytes=?;";

static constexpr const char* SELECT_SCHEMA_VERSION =
    "SELECT COALESCE(MAX(version), 0) FROM ure_schema_migrations;";

}
