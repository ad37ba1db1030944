#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/device_identity.hpp"
#include "internal/core/resource_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/json.hpp"
#include "path_rules.hpp"
#include "session_journal.hpp"
#include "source_adapter.hpp"

namespace ure::ingest {

struct OpenRequest {
  std::string                device_id;
  // Originating agent, JSON.
  std::string                agent_json = "{}";
  std::optional<std::string> behavior_id;
  util::JsonText             behavior_json;
  util::JsonText             elaboration;
  // Caller-chosen id; generated when empty.
  std::string                session_id;
  std::string                created_by = "UNKNOWN";
};

struct SourceRegistration {
  std::string              source_kind = "fs";
  // Root directory, or an account/project/node locator for other kinds.
  std::string              locator;
  std::vector<std::string> include_globs;
  std::vector<std::string> exclude_globs;
  util::JsonText           elaboration;
};

struct EntryOutcome {
  std::string                entry_id;
  model::EntryState          state = model::EntryState::kDiscovering;
  bool                       is_new_entry = false;
  std::optional<std::string> resource_id;
  bool                       duplicate = false;
};

struct TaskRequest {
  std::string                session_id;
  // Captured executable, JSON. Required.
  std::string                captured_executable;
  std::optional<std::string> uniform_resource_id;
  std::optional<std::string> status;
  util::JsonText             diagnostics;
  util::JsonText             transformations;
  util::JsonText             elaboration;
};

struct SessionSummary {
  uint64_t admitted  = 0;
  uint64_t duplicate = 0;
  uint64_t rejected  = 0;
  uint64_t errored   = 0;

  uint64_t Total() const {
    return admitted + duplicate + rejected + errored;
  }
};

/*
  Ingestion session lifecycle.

    OPEN -> per entry: DISCOVERING -> MATCHING -> RESOLVING
                       -> ADMITTED | REJECTED | UNMATCHED | ERRORED
         -> CLOSED

  Every entry transition goes to the session's journal (when one was given
  at Open) and the current state is kept in the entry's ur_status. Admission
  into a closed session is allowed but no longer journaled, since Close
  releases the journal. Closing twice is not allowed.
*/
class IngestSessionManager {
 public:
  IngestSessionManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<core::ResourceStore> store);

  // Throws DeviceUnknownError, ValidationError, AlreadyClosedError when the
  // requested id names a finished session, AlreadyExists for a live one.
  std::string Open(const OpenRequest& request, std::shared_ptr<SessionJournal> journal = nullptr);

  std::string Open(const core::DeviceIdentity& device, const std::string& agent_json,
                   std::shared_ptr<SessionJournal> journal = nullptr);

  // Filesystem root. Throws AlreadyExists for a root already registered in
  // the session, ReferentialError for an unknown session.
  std::string RegisterPath(const std::string& session_id, const std::string& root_path,
                           const std::vector<std::string>& include_globs = {},
                           const std::vector<std::string>& exclude_globs = {});

  std::string RegisterSource(const std::string& session_id, const SourceRegistration& source);

  // Container globs (on rel_path) and then the rule set (on abs_path).
  MatchResult Match(const std::string& path_id, const std::string& abs_path, const std::string& rel_path,
                    const PathRuleSet& rules) const;

  // Creates the entry (idempotent on (session, path, abs_path)) and moves it
  // to MATCHING, or to its terminal state when `match` rejects it.
  EntryOutcome RecordEntry(const std::string& path_id, const std::string& abs_path, const std::string& rel_path,
                           const MatchResult& match);

  // Asks `adapter` for the candidate and admits it. Adapter failures end the
  // entry in ERRORED and become issues. Store validation and referential
  // errors also end it in ERRORED and are rethrown.
  EntryOutcome Resolve(const std::string& entry_id, SourceAdapter& adapter, const MatchResult& match);

  // Match, RecordEntry and, when still pending, Resolve.
  EntryOutcome IngestUnit(const std::string& path_id, const DiscoveredUnit& unit, const PathRuleSet& rules,
                          SourceAdapter& adapter);

  std::string RecordTask(const TaskRequest& request);

  // Throws AlreadyClosedError on a second call, NotFound for an unknown id.
  void Close(const std::string& session_id, const std::string& closed_by = "UNKNOWN");

  bool IsClosed(const std::string& session_id) const;

  SessionSummary Summary(const std::string& session_id) const;

  std::optional<db::model::IngestSessionRecord> Get(const std::string& session_id) const;

  std::vector<db::model::FsPathEntryRecord> Entries(const std::string& session_id) const;

 private:
  std::shared_ptr<SessionJournal> JournalFor(const std::string& session_id) const;

  void Transition(const std::string& session_id, const std::string& owner_id, model::EntryState from, model::EntryState to,
                  const std::optional<std::string>& reason) const;

  void Issue(const std::string& session_id, const std::string& type, const std::string& message,
             const std::optional<std::string>& invalid_value) const;

  // Persists status/resource/diagnostics on the entry.
  void SaveEntry(db::model::FsPathEntryRecord& entry, model::EntryState state);

  db::model::FsPathEntryRecord LoadEntry(const std::string& entry_id) const;

  std::shared_ptr<db::Repository>      repository_;
  std::shared_ptr<core::ResourceStore> store_;

  mutable std::mutex                                     journals_mutex_;
  std::map<std::string, std::shared_ptr<SessionJournal>> journals_;
};

} // namespace ure::ingest
