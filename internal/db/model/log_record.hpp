#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/model/housekeeping.hpp"
#include "internal/util/json.hpp"

namespace ure::db::model {

/*
  Hierarchical log entry. Siblings replay in sibling_order, not wall-clock
  order.
*/
struct LogRecord {
  std::string orchestration_session_log_id;
  std::string session_id;

  std::optional<std::string> exec_id;
  std::optional<std::string> parent_log_id;
  std::optional<std::string> category;

  std::string content;
  int64_t     sibling_order = 0;

  util::JsonText elaboration;

  Housekeeping housekeeping;
};

} // namespace ure::db::model
