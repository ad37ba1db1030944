#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/model/housekeeping.hpp"
#include "internal/util/json.hpp"

namespace ure::db::model {

// Taxonomy of pipeline kinds; nature text is unique.
struct OrchestrationNatureRecord {
  std::string    orchestration_nature_id;
  std::string    nature;
  util::JsonText elaboration;

  Housekeeping housekeeping;
};

struct OrchestrationSessionRecord {
  std::string orchestration_session_id;
  std::string device_id;
  std::string orchestration_nature_id;
  std::string version;

  uint64_t                orch_started_at_ms = 0;
  std::optional<uint64_t> orch_finished_at_ms;

  util::JsonText             elaboration;
  util::JsonText             args_json;
  util::JsonText             diagnostics_json;
  std::optional<std::string> diagnostics_md;

  Housekeeping housekeeping;
};

// Named stage within a session ("ingest", "transform", "publish", ...).
struct OrchestrationSessionEntryRecord {
  std::string orchestration_session_entry_id;
  std::string session_id;
  std::string ingest_src;

  std::optional<std::string> ingest_table_name;
  util::JsonText             elaboration;

  Housekeeping housekeeping;
};

} // namespace ure::db::model
