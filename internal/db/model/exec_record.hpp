#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/model/housekeeping.hpp"
#include "internal/util/json.hpp"

namespace ure::db::model {

/*
  One node of the exec call tree.

  parent_exec_id, when set, names an exec of the same session.
  exec_status: 0 success, anything else a caller-defined failure category.
*/

struct ExecRecord {
  std::string orchestration_session_exec_id;
  std::string exec_nature;
  std::string session_id;

  std::optional<std::string> session_entry_id;
  std::optional<std::string> parent_exec_id;

  std::optional<std::string> namespace_name;
  std::optional<std::string> exec_identity;
  std::string                exec_code;
  int                        exec_status = 0;

  std::optional<std::string> input_text;
  std::optional<std::string> exec_error_text;
  std::optional<std::string> output_text;
  std::optional<std::string> output_nature;
  std::optional<std::string> narrative_md;

  util::JsonText elaboration;

  int64_t                 sibling_order = 0;
  uint64_t                started_at_ms = 0;
  std::optional<uint64_t> finished_at_ms;

  // Set when the exec finished with status 0 regardless of its children.
  bool override_children = false;

  Housekeeping housekeeping;
};

} // namespace ure::db::model
