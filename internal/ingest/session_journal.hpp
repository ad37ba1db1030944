#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace ure::ingest {

/*
  Where an ingest session reports lifecycle transitions and issues.

  The orchestration executor supplies the implementation bound to its
  session and entry. Implementations must not throw.
*/
class SessionJournal {
 public:
  virtual ~SessionJournal() = default;

  virtual void RecordTransition(const std::string& owner_id, std::string_view from, std::string_view to,
                                const std::optional<std::string>& result, const std::optional<std::string>& reason) = 0;

  virtual void RecordIssue(const std::string& issue_type, const std::string& message,
                           const std::optional<std::string>& invalid_value,
                           const std::optional<std::string>& remediation) = 0;
};

} // namespace ure::ingest
