#include "state_machine.hpp"

namespace ure::model {

std::optional<EntryState> ParseEntryState(std::string_view text) {
  for (auto state : {EntryState::kDiscovering, EntryState::kMatching, EntryState::kResolving, EntryState::kAdmitted,
                     EntryState::kRejected, EntryState::kUnmatched, EntryState::kErrored}) {
    if (ToString(state) == text) {
      return state;
    }
  }
  return std::nullopt;
}

} // namespace ure::model
