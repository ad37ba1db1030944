#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/model/housekeeping.hpp"
#include "internal/util/json.hpp"

namespace ure::db::model {

// Append-only problem report.
struct IssueRecord {
  std::string orchestration_session_issue_id;
  std::string session_id;

  std::optional<std::string> session_entry_id;

  std::string issue_type;
  std::string issue_message;

  std::optional<int64_t>     issue_row;
  std::optional<std::string> issue_column;
  std::optional<std::string> invalid_value;
  std::optional<std::string> remediation;

  util::JsonText elaboration;

  Housekeeping housekeeping;
};

// Typed link from an issue to another issue or external identifier.
struct IssueRelationRecord {
  std::string issue_relation_id;
  std::string issue_id_prime;
  std::string issue_id_rel;
  std::string relationship_nature;

  util::JsonText elaboration;

  Housekeeping housekeeping;
};

} // namespace ure::db::model
