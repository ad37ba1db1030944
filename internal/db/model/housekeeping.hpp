#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ure::db::model {

/*
  Housekeeping envelope carried by every persisted entity.

  Soft delete sets deleted_at_ms/deleted_by; rows are never physically
  removed. activity_log is free-form text appended by the writer.
*/

struct Housekeeping {
  uint64_t    created_at_ms = 0;
  std::string created_by    = "UNKNOWN";

  std::optional<uint64_t>    updated_at_ms;
  std::optional<std::string> updated_by;

  std::optional<uint64_t>    deleted_at_ms;
  std::optional<std::string> deleted_by;

  std::optional<std::string> activity_log;

  bool IsLive() const {
    return !deleted_at_ms.has_value();
  }
};

} // namespace ure::db::model
