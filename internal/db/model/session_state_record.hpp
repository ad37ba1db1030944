#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/model/housekeeping.hpp"
#include "internal/util/json.hpp"

namespace ure::db::model {

/*
  Last observed transition for (owner_id, from_state, to_state).

  owner_id is the session entry id when the transition belongs to an entry
  (or an ingest path entry), otherwise the session id. Re-recording the same
  key overwrites result/reason/transitioned_at and bumps transition_count.
*/

struct SessionStateRecord {
  std::string orchestration_session_state_id;
  std::string session_id;

  std::optional<std::string> session_entry_id;

  std::string owner_id;
  std::string from_state;
  std::string to_state;

  std::optional<std::string> transition_result;
  std::optional<std::string> transition_reason;

  uint64_t transitioned_at_ms = 0;
  uint64_t transition_count   = 1;

  util::JsonText elaboration;

  Housekeeping housekeeping;
};

} // namespace ure::db::model
