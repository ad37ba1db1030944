#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/housekeeping.hpp"
#include "internal/util/json.hpp"

namespace ure::db::model {

/*
  One ingestion run scoped to a device.

  ingest_finished_at_ms is set exactly once, at close.
*/
struct IngestSessionRecord {
  std::string ingest_session_id;
  std::string device_id;

  std::optional<std::string> behavior_id;
  util::JsonText             behavior_json;

  uint64_t                ingest_started_at_ms = 0;
  std::optional<uint64_t> ingest_finished_at_ms;

  // JSON describing the originating agent
  std::string    session_agent;
  util::JsonText elaboration;

  Housekeeping housekeeping;
};

/*
  Source-scoped container inside an ingest session.

  source_kind "fs" is a filesystem root; other kinds ("imap", "plm",
  "osquery", "snmp", ...) carry an adapter-specific locator in root_path.
*/
struct FsPathRecord {
  std::string ingest_fs_path_id;
  std::string ingest_session_id;
  std::string source_kind = "fs";
  std::string root_path;

  std::vector<std::string> include_glob_patterns;
  std::vector<std::string> exclude_glob_patterns;

  util::JsonText elaboration;

  Housekeeping housekeeping;
};

/*
  What was attempted for one discovered unit.

  (ingest_session_id, ingest_fs_path_id, file_path_abs) is unique.
  uniform_resource_id stays empty for rejected/errored units.
*/
struct FsPathEntryRecord {
  std::string ingest_fs_path_entry_id;
  std::string ingest_session_id;
  std::string ingest_fs_path_id;

  std::optional<std::string> uniform_resource_id;

  std::string                file_path_abs;
  std::string                file_path_rel_parent;
  std::string                file_path_rel;
  std::string                file_basename;
  std::optional<std::string> file_extn;

  util::JsonText             captured_executable;
  std::optional<std::string> ur_status;
  util::JsonText             ur_diagnostics;
  util::JsonText             ur_transformations;
  util::JsonText             elaboration;

  Housekeeping housekeeping;
};

/*
  Non-path unit of work, e.g. a captured executable run.
*/
struct IngestTaskRecord {
  std::string ingest_session_task_id;
  std::string ingest_session_id;

  std::optional<std::string> uniform_resource_id;

  // JSON, required
  std::string captured_executable;

  std::optional<std::string> ur_status;
  util::JsonText             ur_diagnostics;
  util::JsonText             ur_transformations;
  util::JsonText             elaboration;

  Housekeeping housekeeping;
};

} // namespace ure::db::model
