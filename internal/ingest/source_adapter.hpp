#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/util/json.hpp"

namespace ure::ingest {

struct Candidate {
  std::string                uri;
  std::optional<std::string> content;
  // Required when content is omitted.
  std::optional<std::string> content_digest;
  uint64_t                   size_bytes = 0;
  std::optional<std::string> nature;
  std::optional<uint64_t>    last_modified_at_ms;
  util::JsonText             metadata_json;
};

struct AdapterError {
  // Short machine-readable category, e.g. "io", "permission", "not_found".
  std::string code;
  std::string message;
};

/*
  Result of a boundary call into a source adapter.

  Adapter failures travel as values; the session manager turns them into
  issues instead of letting exceptions cross the boundary.
*/
class CandidateOutcome {
 public:
  static CandidateOutcome Ok(Candidate candidate) {
    CandidateOutcome out;
    out.candidate_ = std::move(candidate);
    return out;
  }

  static CandidateOutcome Fail(std::string code, std::string message) {
    CandidateOutcome out;
    out.error_ = AdapterError{std::move(code), std::move(message)};
    return out;
  }

  explicit operator bool() const {
    return candidate_.has_value();
  }

  const Candidate& Value() const {
    return *candidate_;
  }

  const AdapterError& Error() const {
    return *error_;
  }

 private:
  std::optional<Candidate>    candidate_;
  std::optional<AdapterError> error_;
};

// One addressable unit under a container root.
struct DiscoveredUnit {
  std::string abs_path;
  std::string rel_path;
};

/*
  Capability interface for a source kind (filesystem, mailbox,
  issue tracker, endpoint or network telemetry).

  Implementations are blocking and must not throw across ProduceCandidate.
*/
class SourceAdapter {
 public:
  virtual ~SourceAdapter() = default;

  // Matches FsPathRecord::source_kind.
  virtual std::string Kind() const = 0;

  // Units reachable from `locator`, in a stable order.
  virtual std::vector<DiscoveredUnit> Discover(const std::string& locator) = 0;

  virtual CandidateOutcome ProduceCandidate(const std::string& session_id, const std::string& unit_id) = 0;
};

} // namespace ure::ingest
