#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace ure::model {

/*
  Per-entry ingestion lifecycle:

    DISCOVERING -> MATCHING -> RESOLVING -> ADMITTED | REJECTED | ERRORED

  MATCHING may end the entry early (REJECTED, or UNMATCHED under a strict
  namespace). The terminal state is what the entry's ur_status holds.
*/
enum class EntryState : std::uint8_t {
  kDiscovering = 0,
  kMatching    = 1,
  kResolving   = 2,
  kAdmitted    = 3,
  kRejected    = 4,
  kUnmatched   = 5,
  kErrored     = 6,
};

constexpr bool IsTerminal(EntryState state) {
  return state == EntryState::kAdmitted || state == EntryState::kRejected || state == EntryState::kUnmatched ||
         state == EntryState::kErrored;
}

constexpr bool CanTransition(EntryState from, EntryState to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == EntryState::kErrored) {
    return true;
  }

  switch (from) {
    case EntryState::kDiscovering:
      return to == EntryState::kMatching;
    case EntryState::kMatching:
      return to == EntryState::kResolving || to == EntryState::kRejected || to == EntryState::kUnmatched;
    case EntryState::kResolving:
      return to == EntryState::kAdmitted || to == EntryState::kRejected;
    default:
      return false;
  }
}

constexpr std::string_view ToString(EntryState state) {
  switch (state) {
    case EntryState::kDiscovering:
      return "DISCOVERING";
    case EntryState::kMatching:
      return "MATCHING";
    case EntryState::kResolving:
      return "RESOLVING";
    case EntryState::kAdmitted:
      return "ADMITTED";
    case EntryState::kRejected:
      return "REJECTED";
    case EntryState::kUnmatched:
      return "UNMATCHED";
    case EntryState::kErrored:
      return "ERRORED";
  }
  return "ERRORED";
}

std::optional<EntryState> ParseEntryState(std::string_view text);

/*
  Session-level lifecycle recorded by the orchestration layer:

    NONE -> RUNNING -> COMPLETED | FAILED

  and for ingest sessions OPEN -> CLOSED.
*/
namespace session_state {
inline constexpr std::string_view kNone      = "NONE";
inline constexpr std::string_view kOpen      = "OPEN";
inline constexpr std::string_view kRunning   = "RUNNING";
inline constexpr std::string_view kCompleted = "COMPLETED";
inline constexpr std::string_view kFailed    = "FAILED";
inline constexpr std::string_view kClosed    = "CLOSED";
} // namespace session_state

} // namespace ure::model
