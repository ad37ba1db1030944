#include "memory_repository.hpp"

#include <algorithm>
#include <initializer_list>
#include <set>
#include <tuple>

#include "internal/util/json.hpp"
#include "memory_tx.hpp"

namespace ure::db::memory {

namespace {

template <typename T, typename Pred>
T* FindMut(std::vector<T>& rows, Pred pred) {
  auto it = std::find_if(rows.begin(), rows.end(), pred);
  return it == rows.end() ? nullptr : &*it;
}

template <typename T, typename Pred>
const T* Find(const std::vector<T>& rows, Pred pred) {
  auto it = std::find_if(rows.begin(), rows.end(), pred);
  return it == rows.end() ? nullptr : &*it;
}

template <typename T, typename Pred>
std::vector<T> Select(const std::vector<T>& rows, Pred pred) {
  std::vector<T> out;
  for (const auto& r : rows)
    if (pred(r)) out.push_back(r);
  return out;
}

bool Visible(const model::Housekeeping& h, Visibility v) {
  return v == Visibility::kIncludeDeleted || h.IsLive();
}

// Mirrors CHECK(json_valid(col) OR col IS NULL).
bool JsonColumnsValid(std::initializer_list<const util::JsonText*> columns) {
  for (const auto* c : columns) {
    if (c->has_value() && !util::IsValidJson(**c)) return false;
  }
  return true;
}

Result JsonViolation(const char* table) {
  return Result::Err(ErrorCode::ConstraintViolation, std::string("json_valid check failed on ") + table);
}

Result MissingParent(const char* table, const char* column) {
  return Result::Err(ErrorCode::ForeignKeyViolation, std::string(table) + "." + column + " references a missing row");
}

std::string ResourceKey(const std::string& device_id, const std::string& digest, const std::string& uri,
                        uint64_t size_bytes) {
  return device_id + '\x1f' + digest + '\x1f' + uri + '\x1f' + std::to_string(size_bytes);
}

template <typename T>
void SortBySiblingOrder(std::vector<T>& rows) {
  std::stable_sort(rows.begin(), rows.end(),
                   [](const T& a, const T& b) { return a.sibling_order < b.sibling_order; });
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Devices / behaviors
// ------------------------------------------------------------------

Result MemoryRepository::InsertDevice(Transaction& t, const model::DeviceRecord& r) {
  auto& s = TX(t).Mutable();
  if (!JsonColumnsValid({&r.segmentation, &r.state_sysinfo, &r.elaboration})) return JsonViolation("device");

  const bool taken = Find(s.devices, [&](const auto& d) {
    return d.device_id == r.device_id || (d.name == r.name && d.state == r.state && d.boundary == r.boundary);
  });
  if (taken) return Result::Err(ErrorCode::AlreadyExists, "device");

  s.devices.push_back(r);
  return Result::Ok();
}

std::optional<model::DeviceRecord> MemoryRepository::GetDevice(Transaction& t, const std::string& id, Visibility v) {
  const auto* d = Find(TX(t).View().devices, [&](const auto& d) { return d.device_id == id; });
  if (!d || !Visible(d->housekeeping, v)) return std::nullopt;
  return *d;
}

std::optional<model::DeviceRecord> MemoryRepository::FindDevice(Transaction& t, const std::string& name,
                                                                const std::string& state, const std::string& boundary,
                                                                Visibility v) {
  const auto* d = Find(TX(t).View().devices, [&](const auto& d) {
    return d.name == name && d.state == state && d.boundary == boundary;
  });
  if (!d || !Visible(d->housekeeping, v)) return std::nullopt;
  return *d;
}

std::vector<model::DeviceRecord> MemoryRepository::ListDevices(Transaction& t, Visibility v) {
  return Select(TX(t).View().devices, [&](const auto& d) { return Visible(d.housekeeping, v); });
}

Result MemoryRepository::UpsertBehavior(Transaction& t, model::BehaviorRecord& r) {
  auto& s = TX(t).Mutable();
  if (!util::IsValidJson(r.behavior_conf_json) || !JsonColumnsValid({&r.governance})) return JsonViolation("behavior");
  if (!Find(s.devices, [&](const auto& d) { return d.device_id == r.device_id; })) {
    return MissingParent("behavior", "device_id");
  }

  auto* existing = FindMut(s.behaviors, [&](const auto& b) {
    return b.device_id == r.device_id && b.behavior_name == r.behavior_name;
  });
  if (existing) {
    existing->behavior_conf_json         = r.behavior_conf_json;
    existing->assurance_schema_id        = r.assurance_schema_id;
    existing->governance                 = r.governance;
    existing->housekeeping.updated_at_ms = r.housekeeping.created_at_ms;
    existing->housekeeping.updated_by    = r.housekeeping.created_by;
    r.behavior_id                        = existing->behavior_id;
    return Result::Ok();
  }

  s.behaviors.push_back(r);
  return Result::Ok();
}

std::optional<model::BehaviorRecord> MemoryRepository::GetBehavior(Transaction& t, const std::string& id) {
  const auto* b = Find(TX(t).View().behaviors, [&](const auto& b) { return b.behavior_id == id; });
  if (!b) return std::nullopt;
  return *b;
}

Result MemoryRepository::MarkDeleted(Transaction& t, EntityKind kind, const std::string& id,
                                     const std::string& deleted_by, uint64_t deleted_at_ms) {
  auto& s = TX(t).Mutable();

  model::Housekeeping* h = nullptr;
  switch (kind) {
    case EntityKind::kDevice:
      if (auto* r = FindMut(s.devices, [&](const auto& d) { return d.device_id == id; })) h = &r->housekeeping;
      break;
    case EntityKind::kBehavior:
      if (auto* r = FindMut(s.behaviors, [&](const auto& b) { return b.behavior_id == id; })) h = &r->housekeeping;
      break;
    case EntityKind::kIngestSession:
      if (auto* r = FindMut(s.ingest_sessions, [&](const auto& x) { return x.ingest_session_id == id; })) {
        h = &r->housekeeping;
      }
      break;
    case EntityKind::kUniformResource: {
      auto it = s.resource_by_id.find(id);
      if (it != s.resource_by_id.end()) h = &s.resources[it->second].housekeeping;
      break;
    }
    case EntityKind::kUniformResourceTransform:
      if (auto* r = FindMut(s.transforms, [&](const auto& x) { return x.uniform_resource_transform_id == id; })) {
        h = &r->housekeeping;
      }
      break;
  }

  if (!h) return Result::Err(ErrorCode::NotFound, ToString(kind));
  if (h->deleted_at_ms) return Result::Ok();

  h->deleted_at_ms = deleted_at_ms;
  h->deleted_by    = deleted_by;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Ingest sessions
// ------------------------------------------------------------------

Result MemoryRepository::InsertIngestSession(Transaction& t, const model::IngestSessionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!util::IsValidJson(r.session_agent) || !JsonColumnsValid({&r.behavior_json, &r.elaboration})) {
    return JsonViolation("ur_ingest_session");
  }
  if (!Find(s.devices, [&](const auto& d) { return d.device_id == r.device_id; })) {
    return MissingParent("ur_ingest_session", "device_id");
  }
  if (r.behavior_id && !Find(s.behaviors, [&](const auto& b) { return b.behavior_id == *r.behavior_id; })) {
    return MissingParent("ur_ingest_session", "behavior_id");
  }
  if (Find(s.ingest_sessions, [&](const auto& x) { return x.ingest_session_id == r.ingest_session_id; })) {
    return Result::Err(ErrorCode::AlreadyExists, "ur_ingest_session");
  }

  s.ingest_sessions.push_back(r);
  return Result::Ok();
}

std::optional<model::IngestSessionRecord> MemoryRepository::GetIngestSession(Transaction& t, const std::string& id,
                                                                             Visibility v) {
  const auto* r = Find(TX(t).View().ingest_sessions, [&](const auto& x) { return x.ingest_session_id == id; });
  if (!r || !Visible(r->housekeeping, v)) return std::nullopt;
  return *r;
}

std::vector<model::IngestSessionRecord> MemoryRepository::ListIngestSessions(Transaction& t,
                                                                             const std::string& device_id) {
  return Select(TX(t).View().ingest_sessions, [&](const auto& x) { return x.device_id == device_id; });
}

Result MemoryRepository::FinishIngestSession(Transaction& t, const std::string& id, uint64_t finished_at_ms,
                                             const std::string& updated_by) {
  auto* r = FindMut(TX(t).Mutable().ingest_sessions, [&](const auto& x) { return x.ingest_session_id == id; });
  if (!r) return Result::Err(ErrorCode::NotFound, "ur_ingest_session");
  if (r->ingest_finished_at_ms) return Result::Err(ErrorCode::Conflict, "ingest session already finished");

  r->ingest_finished_at_ms      = finished_at_ms;
  r->housekeeping.updated_at_ms = finished_at_ms;
  r->housekeeping.updated_by    = updated_by;
  return Result::Ok();
}

Result MemoryRepository::InsertFsPath(Transaction& t, const model::FsPathRecord& r) {
  auto& s = TX(t).Mutable();
  if (!JsonColumnsValid({&r.elaboration})) return JsonViolation("ur_ingest_session_fs_path");
  if (!Find(s.ingest_sessions, [&](const auto& x) { return x.ingest_session_id == r.ingest_session_id; })) {
    return MissingParent("ur_ingest_session_fs_path", "ingest_session_id");
  }
  const bool taken = Find(s.fs_paths, [&](const auto& p) {
    return p.ingest_fs_path_id == r.ingest_fs_path_id ||
           (p.ingest_session_id == r.ingest_session_id && p.root_path == r.root_path);
  });
  if (taken) return Result::Err(ErrorCode::AlreadyExists, "ur_ingest_session_fs_path");

  s.fs_paths.push_back(r);
  return Result::Ok();
}

std::optional<model::FsPathRecord> MemoryRepository::GetFsPath(Transaction& t, const std::string& id) {
  const auto* r = Find(TX(t).View().fs_paths, [&](const auto& p) { return p.ingest_fs_path_id == id; });
  if (!r) return std::nullopt;
  return *r;
}

std::vector<model::FsPathRecord> MemoryRepository::ListFsPaths(Transaction& t, const std::string& session_id) {
  return Select(TX(t).View().fs_paths, [&](const auto& p) { return p.ingest_session_id == session_id; });
}

InsertOutcome MemoryRepository::InsertFsPathEntryIfAbsent(Transaction& t, const model::FsPathEntryRecord& r) {
  auto& s = TX(t).Mutable();
  if (!JsonColumnsValid({&r.captured_executable, &r.ur_diagnostics, &r.ur_transformations, &r.elaboration})) {
    return {JsonViolation("ur_ingest_session_fs_path_entry"), {}, false};
  }
  if (!Find(s.ingest_sessions, [&](const auto& x) { return x.ingest_session_id == r.ingest_session_id; })) {
    return {MissingParent("ur_ingest_session_fs_path_entry", "ingest_session_id"), {}, false};
  }
  if (!Find(s.fs_paths, [&](const auto& p) { return p.ingest_fs_path_id == r.ingest_fs_path_id; })) {
    return {MissingParent("ur_ingest_session_fs_path_entry", "ingest_fs_path_id"), {}, false};
  }
  if (r.uniform_resource_id && !s.resource_by_id.contains(*r.uniform_resource_id)) {
    return {MissingParent("ur_ingest_session_fs_path_entry", "uniform_resource_id"), {}, false};
  }

  const auto* existing = Find(s.fs_path_entries, [&](const auto& e) {
    return e.ingest_session_id == r.ingest_session_id && e.ingest_fs_path_id == r.ingest_fs_path_id &&
           e.file_path_abs == r.file_path_abs;
  });
  if (existing) return {Result::Ok(), existing->ingest_fs_path_entry_id, false};

  s.fs_path_entries.push_back(r);
  return {Result::Ok(), r.ingest_fs_path_entry_id, true};
}

Result MemoryRepository::UpdateFsPathEntry(Transaction& t, const model::FsPathEntryRecord& r) {
  auto& s = TX(t).Mutable();
  if (!JsonColumnsValid({&r.ur_diagnostics, &r.ur_transformations, &r.elaboration})) {
    return JsonViolation("ur_ingest_session_fs_path_entry");
  }
  if (r.uniform_resource_id && !s.resource_by_id.contains(*r.uniform_resource_id)) {
    return MissingParent("ur_ingest_session_fs_path_entry", "uniform_resource_id");
  }

  auto* e = FindMut(s.fs_path_entries,
                    [&](const auto& e) { return e.ingest_fs_path_entry_id == r.ingest_fs_path_entry_id; });
  if (!e) return Result::Err(ErrorCode::NotFound, "ur_ingest_session_fs_path_entry");

  e->uniform_resource_id  = r.uniform_resource_id;
  e->ur_status            = r.ur_status;
  e->ur_diagnostics       = r.ur_diagnostics;
  e->ur_transformations   = r.ur_transformations;
  e->elaboration          = r.elaboration;
  e->housekeeping.updated_at_ms = r.housekeeping.updated_at_ms;
  e->housekeeping.updated_by    = r.housekeeping.updated_by;
  return Result::Ok();
}

std::optional<model::FsPathEntryRecord> MemoryRepository::GetFsPathEntry(Transaction& t, const std::string& id) {
  const auto* e = Find(TX(t).View().fs_path_entries, [&](const auto& e) { return e.ingest_fs_path_entry_id == id; });
  if (!e) return std::nullopt;
  return *e;
}

std::vector<model::FsPathEntryRecord> MemoryRepository::ListFsPathEntries(Transaction& t,
                                                                          const std::string& session_id) {
  return Select(TX(t).View().fs_path_entries, [&](const auto& e) { return e.ingest_session_id == session_id; });
}

Result MemoryRepository::InsertTask(Transaction& t, const model::IngestTaskRecord& r) {
  auto& s = TX(t).Mutable();
  if (!util::IsValidJson(r.captured_executable) ||
      !JsonColumnsValid({&r.ur_diagnostics, &r.ur_transformations, &r.elaboration})) {
    return JsonViolation("ur_ingest_session_task");
  }
  if (!Find(s.ingest_sessions, [&](const auto& x) { return x.ingest_session_id == r.ingest_session_id; })) {
    return MissingParent("ur_ingest_session_task", "ingest_session_id");
  }
  if (r.uniform_resource_id && !s.resource_by_id.contains(*r.uniform_resource_id)) {
    return MissingParent("ur_ingest_session_task", "uniform_resource_id");
  }
  if (Find(s.tasks, [&](const auto& x) { return x.ingest_session_task_id == r.ingest_session_task_id; })) {
    return Result::Err(ErrorCode::AlreadyExists, "ur_ingest_session_task");
  }

  s.tasks.push_back(r);
  return Result::Ok();
}

Result MemoryRepository::UpdateTask(Transaction& t, const model::IngestTaskRecord& r) {
  auto& s = TX(t).Mutable();
  if (!JsonColumnsValid({&r.ur_diagnostics, &r.ur_transformations, &r.elaboration})) {
    return JsonViolation("ur_ingest_session_task");
  }
  if (r.uniform_resource_id && !s.resource_by_id.contains(*r.uniform_resource_id)) {
    return MissingParent("ur_ingest_session_task", "uniform_resource_id");
  }

  auto* task = FindMut(s.tasks, [&](const auto& x) { return x.ingest_session_task_id == r.ingest_session_task_id; });
  if (!task) return Result::Err(ErrorCode::NotFound, "ur_ingest_session_task");

  task->uniform_resource_id        = r.uniform_resource_id;
  task->ur_status                  = r.ur_status;
  task->ur_diagnostics             = r.ur_diagnostics;
  task->ur_transformations         = r.ur_transformations;
  task->elaboration                = r.elaboration;
  task->housekeeping.updated_at_ms = r.housekeeping.updated_at_ms;
  task->housekeeping.updated_by    = r.housekeeping.updated_by;
  return Result::Ok();
}

std::vector<model::IngestTaskRecord> MemoryRepository::ListTasks(Transaction& t, const std::string& session_id) {
  return Select(TX(t).View().tasks, [&](const auto& x) { return x.ingest_session_id == session_id; });
}

// ------------------------------------------------------------------
// Uniform resources
// ------------------------------------------------------------------

InsertOutcome MemoryRepository::InsertUniformResourceIfAbsent(Transaction& t, const model::UniformResourceRecord& r) {
  auto& s = TX(t).Mutable();
  if (!JsonColumnsValid({&r.content_fm_body_attrs, &r.frontmatter, &r.elaboration})) {
    return {JsonViolation("uniform_resource"), {}, false};
  }
  if (!Find(s.devices, [&](const auto& d) { return d.device_id == r.device_id; })) {
    return {MissingParent("uniform_resource", "device_id"), {}, false};
  }
  if (!Find(s.ingest_sessions, [&](const auto& x) { return x.ingest_session_id == r.ingest_session_id; })) {
    return {MissingParent("uniform_resource", "ingest_session_id"), {}, false};
  }
  if (r.ingest_fs_path_id &&
      !Find(s.fs_paths, [&](const auto& p) { return p.ingest_fs_path_id == *r.ingest_fs_path_id; })) {
    return {MissingParent("uniform_resource", "ingest_fs_path_id"), {}, false};
  }

  const auto key = ResourceKey(r.device_id, r.content_digest, r.uri, r.size_bytes);
  if (auto it = s.resource_by_key.find(key); it != s.resource_by_key.end()) {
    return {Result::Ok(), s.resources[it->second].uniform_resource_id, false};
  }
  if (s.resource_by_id.contains(r.uniform_resource_id)) {
    return {Result::Err(ErrorCode::AlreadyExists, "uniform_resource"), {}, false};
  }

  s.resources.push_back(r);
  s.resource_by_id[r.uniform_resource_id] = s.resources.size() - 1;
  s.resource_by_key[key]                  = s.resources.size() - 1;
  return {Result::Ok(), r.uniform_resource_id, true};
}

std::optional<model::UniformResourceRecord> MemoryRepository::GetUniformResource(Transaction& t, const std::string& id,
                                                                                 Visibility v) {
  const auto& s  = TX(t).View();
  auto        it = s.resource_by_id.find(id);
  if (it == s.resource_by_id.end()) return std::nullopt;
  const auto& r = s.resources[it->second];
  if (!Visible(r.housekeeping, v)) return std::nullopt;
  return r;
}

std::optional<model::UniformResourceRecord> MemoryRepository::FindUniformResource(
    Transaction& t, const std::string& device_id, const std::string& content_digest, const std::string& uri,
    uint64_t size_bytes, Visibility v) {
  const auto& s  = TX(t).View();
  auto        it = s.resource_by_key.find(ResourceKey(device_id, content_digest, uri, size_bytes));
  if (it == s.resource_by_key.end()) return std::nullopt;
  const auto& r = s.resources[it->second];
  if (!Visible(r.housekeeping, v)) return std::nullopt;
  return r;
}

std::vector<model::UniformResourceRecord> MemoryRepository::ListUniformResources(Transaction& t,
                                                                                 const std::string& device_id,
                                                                                 Visibility v) {
  return Select(TX(t).View().resources,
                [&](const auto& r) { return r.device_id == device_id && Visible(r.housekeeping, v); });
}

uint64_t MemoryRepository::CountUniformResources(Transaction& t, const std::string& device_id,
                                                 const std::string& content_digest, const std::string& uri,
                                                 uint64_t size_bytes) {
  const auto& rows = TX(t).View().resources;
  return static_cast<uint64_t>(std::count_if(rows.begin(), rows.end(), [&](const auto& r) {
    return r.device_id == device_id && r.content_digest == content_digest && r.uri == uri &&
           r.size_bytes == size_bytes;
  }));
}

InsertOutcome MemoryRepository::InsertTransformIfAbsent(Transaction& t,
                                                        const model::UniformResourceTransformRecord& r) {
  auto& s = TX(t).Mutable();
  if (!JsonColumnsValid({&r.elaboration})) return {JsonViolation("uniform_resource_transform"), {}, false};
  if (!s.resource_by_id.contains(r.uniform_resource_id)) {
    return {MissingParent("uniform_resource_transform", "uniform_resource_id"), {}, false};
  }

  const auto* existing = Find(s.transforms, [&](const auto& x) {
    return x.uniform_resource_id == r.uniform_resource_id && x.content_digest == r.content_digest &&
           x.nature == r.nature && x.size_bytes == r.size_bytes;
  });
  if (existing) return {Result::Ok(), existing->uniform_resource_transform_id, false};

  s.transforms.push_back(r);
  return {Result::Ok(), r.uniform_resource_transform_id, true};
}

std::vector<model::UniformResourceTransformRecord> MemoryRepository::ListTransforms(Transaction& t,
                                                                                    const std::string& resource_id,
                                                                                    Visibility v) {
  return Select(TX(t).View().transforms, [&](const auto& x) {
    return x.uniform_resource_id == resource_id && Visible(x.housekeeping, v);
  });
}

// ------------------------------------------------------------------
// Lineage
// ------------------------------------------------------------------

InsertOutcome MemoryRepository::InsertGraphIfAbsent(Transaction& t, const model::GraphRecord& r) {
  auto& s = TX(t).Mutable();
  if (!JsonColumnsValid({&r.elaboration})) return {JsonViolation("resource_graph"), {}, false};
  if (Find(s.graphs, [&](const auto& g) { return g.name == r.name; })) return {Result::Ok(), r.name, false};

  s.graphs.push_back(r);
  return {Result::Ok(), r.name, true};
}

std::vector<model::GraphRecord> MemoryRepository::ListGraphs(Transaction& t) {
  return TX(t).View().graphs;
}

InsertOutcome MemoryRepository::InsertEdgeIfAbsent(Transaction& t, const model::EdgeRecord& r) {
  auto& s = TX(t).Mutable();
  if (!JsonColumnsValid({&r.elaboration})) return {JsonViolation("resource_edge"), {}, false};
  if (!Find(s.graphs, [&](const auto& g) { return g.name == r.graph_name; })) {
    return {MissingParent("resource_edge", "graph_name"), {}, false};
  }
  if (!s.resource_by_id.contains(r.uniform_resource_id)) {
    return {MissingParent("resource_edge", "uniform_resource_id"), {}, false};
  }

  const bool present = Find(s.edges, [&](const auto& e) {
    return e.graph_name == r.graph_name && e.nature == r.nature && e.node_id == r.node_id &&
           e.uniform_resource_id == r.uniform_resource_id;
  });
  if (present) return {Result::Ok(), r.uniform_resource_id, false};

  s.edges.push_back(r);
  return {Result::Ok(), r.uniform_resource_id, true};
}

std::vector<std::string> MemoryRepository::ListNeighborIds(Transaction& t, const std::string& graph_name,
                                                           const std::string& node_id,
                                                           const std::optional<std::string>& nature,
                                                           const std::string& after, std::size_t limit) {
  std::set<std::string> ids;
  for (const auto& e : TX(t).View().edges) {
    if (e.graph_name != graph_name || e.node_id != node_id) continue;
    if (nature && e.nature != *nature) continue;
    if (e.uniform_resource_id <= after) continue;
    ids.insert(e.uniform_resource_id);
  }

  std::vector<std::string> out;
  for (const auto& id : ids) {
    if (out.size() >= limit) break;
    out.push_back(id);
  }
  return out;
}

std::vector<model::EdgeRecord> MemoryRepository::ListEdgesTo(Transaction& t, const std::string& resource_id) {
  auto out = Select(TX(t).View().edges, [&](const auto& e) { return e.uniform_resource_id == resource_id; });
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return std::tie(a.graph_name, a.nature, a.node_id) < std::tie(b.graph_name, b.nature, b.node_id);
  });
  return out;
}

// ------------------------------------------------------------------
// Path rules
// ------------------------------------------------------------------

Result MemoryRepository::UpsertPathMatchRule(Transaction& t, const model::PathMatchRuleRecord& r) {
  auto& s = TX(t).Mutable();
  if (!JsonColumnsValid({&r.elaboration})) return JsonViolation("ur_ingest_path_match_rule");

  auto* existing = FindMut(s.match_rules, [&](const auto& x) {
    return x.namespace_name == r.namespace_name && x.regex == r.regex;
  });
  if (existing) {
    const auto rule_id  = existing->rule_id;
    const auto created  = existing->housekeeping;
    *existing           = r;
    existing->rule_id   = rule_id;
    existing->housekeeping               = created;
    existing->housekeeping.updated_at_ms = r.housekeeping.created_at_ms;
    existing->housekeeping.updated_by    = r.housekeeping.created_by;
    return Result::Ok();
  }

  s.match_rules.push_back(r);
  return Result::Ok();
}

std::vector<model::PathMatchRuleRecord> MemoryRepository::ListPathMatchRules(Transaction& t,
                                                                             const std::string& namespace_name) {
  return Select(TX(t).View().match_rules, [&](const auto& x) { return x.namespace_name == namespace_name; });
}

Result MemoryRepository::UpsertPathRewriteRule(Transaction& t, const model::PathRewriteRuleRecord& r) {
  auto& s = TX(t).Mutable();
  if (!JsonColumnsValid({&r.elaboration})) return JsonViolation("ur_ingest_path_rewrite_rule");

  auto* existing = FindMut(s.rewrite_rules, [&](const auto& x) {
    return x.namespace_name == r.namespace_name && x.regex == r.regex && x.replace == r.replace;
  });
  if (existing) {
    existing->priority                   = r.priority;
    existing->description                = r.description;
    existing->elaboration                = r.elaboration;
    existing->housekeeping.updated_at_ms = r.housekeeping.created_at_ms;
    existing->housekeeping.updated_by    = r.housekeeping.created_by;
    return Result::Ok();
  }

  s.rewrite_rules.push_back(r);
  return Result::Ok();
}

std::vector<model::PathRewriteRuleRecord> MemoryRepository::ListPathRewriteRules(Transaction& t,
                                                                                 const std::string& namespace_name) {
  return Select(TX(t).View().rewrite_rules, [&](const auto& x) { return x.namespace_name == namespace_name; });
}

// ------------------------------------------------------------------
// Orchestration
// ------------------------------------------------------------------

Result MemoryRepository::UpsertNature(Transaction& t, model::OrchestrationNatureRecord& r) {
  auto& s = TX(t).Mutable();
  if (!JsonColumnsValid({&r.elaboration})) return JsonViolation("orchestration_nature");

  if (const auto* existing = Find(s.natures, [&](const auto& n) { return n.nature == r.nature; })) {
    r.orchestration_nature_id = existing->orchestration_nature_id;
    return Result::Ok();
  }

  s.natures.push_back(r);
  return Result::Ok();
}

std::optional<model::OrchestrationNatureRecord> MemoryRepository::GetNature(Transaction& t, const std::string& id) {
  const auto* n = Find(TX(t).View().natures, [&](const auto& n) { return n.orchestration_nature_id == id; });
  if (!n) return std::nullopt;
  return *n;
}

Result MemoryRepository::InsertOrchestrationSession(Transaction& t, const model::OrchestrationSessionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!JsonColumnsValid({&r.elaboration, &r.args_json, &r.diagnostics_json})) {
    return JsonViolation("orchestration_session");
  }
  if (!Find(s.devices, [&](const auto& d) { return d.device_id == r.device_id; })) {
    return MissingParent("orchestration_session", "device_id");
  }
  if (!Find(s.natures, [&](const auto& n) { return n.orchestration_nature_id == r.orchestration_nature_id; })) {
    return MissingParent("orchestration_session", "orchestration_nature_id");
  }
  if (Find(s.orch_sessions,
           [&](const auto& x) { return x.orchestration_session_id == r.orchestration_session_id; })) {
    return Result::Err(ErrorCode::AlreadyExists, "orchestration_session");
  }

  s.orch_sessions.push_back(r);
  return Result::Ok();
}

std::optional<model::OrchestrationSessionRecord> MemoryRepository::GetOrchestrationSession(Transaction& t,
                                                                                           const std::string& id) {
  const auto* r = Find(TX(t).View().orch_sessions, [&](const auto& x) { return x.orchestration_session_id == id; });
  if (!r) return std::nullopt;
  return *r;
}

Result MemoryRepository::FinishOrchestrationSession(Transaction& t, const std::string& id, uint64_t finished_at_ms,
                                                    const util::JsonText&              diagnostics_json,
                                                    const std::optional<std::string>& diagnostics_md) {
  if (!JsonColumnsValid({&diagnostics_json})) return JsonViolation("orchestration_session");

  auto* r = FindMut(TX(t).Mutable().orch_sessions, [&](const auto& x) { return x.orchestration_session_id == id; });
  if (!r) return Result::Err(ErrorCode::NotFound, "orchestration_session");
  if (r->orch_finished_at_ms) return Result::Err(ErrorCode::Conflict, "orchestration session already finished");

  r->orch_finished_at_ms        = finished_at_ms;
  r->diagnostics_json           = diagnostics_json;
  r->diagnostics_md             = diagnostics_md;
  r->housekeeping.updated_at_ms = finished_at_ms;
  return Result::Ok();
}

Result MemoryRepository::InsertSessionEntry(Transaction& t, const model::OrchestrationSessionEntryRecord& r) {
  auto& s = TX(t).Mutable();
  if (!JsonColumnsValid({&r.elaboration})) return JsonViolation("orchestration_session_entry");
  if (!Find(s.orch_sessions, [&](const auto& x) { return x.orchestration_session_id == r.session_id; })) {
    return MissingParent("orchestration_session_entry", "session_id");
  }
  if (Find(s.session_entries, [&](const auto& x) {
        return x.orchestration_session_entry_id == r.orchestration_session_entry_id;
      })) {
    return Result::Err(ErrorCode::AlreadyExists, "orchestration_session_entry");
  }

  s.session_entries.push_back(r);
  return Result::Ok();
}

std::optional<model::OrchestrationSessionEntryRecord> MemoryRepository::GetSessionEntry(Transaction& t,
                                                                                       const std::string& id) {
  const auto* r =
      Find(TX(t).View().session_entries, [&](const auto& x) { return x.orchestration_session_entry_id == id; });
  if (!r) return std::nullopt;
  return *r;
}

std::vector<model::OrchestrationSessionEntryRecord> MemoryRepository::ListSessionEntries(
    Transaction& t, const std::string& session_id) {
  return Select(TX(t).View().session_entries, [&](const auto& x) { return x.session_id == session_id; });
}

Result MemoryRepository::UpsertSessionState(Transaction& t, const model::SessionStateRecord& r) {
  auto& s = TX(t).Mutable();
  if (!JsonColumnsValid({&r.elaboration})) return JsonViolation("orchestration_session_state");
  if (!Find(s.orch_sessions, [&](const auto& x) { return x.orchestration_session_id == r.session_id; })) {
    return MissingParent("orchestration_session_state", "session_id");
  }
  if (r.session_entry_id && !Find(s.session_entries, [&](const auto& x) {
        return x.orchestration_session_entry_id == *r.session_entry_id;
      })) {
    return MissingParent("orchestration_session_state", "session_entry_id");
  }

  auto* existing = FindMut(s.session_states, [&](const auto& x) {
    return x.owner_id == r.owner_id && x.from_state == r.from_state && x.to_state == r.to_state;
  });
  if (existing) {
    existing->transition_result          = r.transition_result;
    existing->transition_reason          = r.transition_reason;
    existing->transitioned_at_ms         = r.transitioned_at_ms;
    existing->elaboration                = r.elaboration;
    existing->transition_count          += 1;
    existing->housekeeping.updated_at_ms = r.transitioned_at_ms;
    existing->housekeeping.updated_by    = r.housekeeping.created_by;
    return Result::Ok();
  }

  auto row             = r;
  row.transition_count = 1;
  s.session_states.push_back(std::move(row));
  return Result::Ok();
}

std::optional<model::SessionStateRecord> MemoryRepository::FindSessionState(Transaction& t,
                                                                            const std::string& owner_id,
                                                                            const std::string& from_state,
                                                                            const std::string& to_state) {
  const auto* r = Find(TX(t).View().session_states, [&](const auto& x) {
    return x.owner_id == owner_id && x.from_state == from_state && x.to_state == to_state;
  });
  if (!r) return std::nullopt;
  return *r;
}

std::vector<model::SessionStateRecord> MemoryRepository::ListSessionStates(Transaction& t,
                                                                           const std::string& session_id) {
  return Select(TX(t).View().session_states, [&](const auto& x) { return x.session_id == session_id; });
}

Result MemoryRepository::InsertExec(Transaction& t, const model::ExecRecord& r) {
  auto& s = TX(t).Mutable();
  if (!JsonColumnsValid({&r.elaboration})) return JsonViolation("orchestration_session_exec");
  if (!Find(s.orch_sessions, [&](const auto& x) { return x.orchestration_session_id == r.session_id; })) {
    return MissingParent("orchestration_session_exec", "session_id");
  }
  if (r.session_entry_id && !Find(s.session_entries, [&](const auto& x) {
        return x.orchestration_session_entry_id == *r.session_entry_id;
      })) {
    return MissingParent("orchestration_session_exec", "session_entry_id");
  }
  if (r.parent_exec_id && !s.exec_by_id.contains(*r.parent_exec_id)) {
    return MissingParent("orchestration_session_exec", "parent_exec_id");
  }
  if (s.exec_by_id.contains(r.orchestration_session_exec_id)) {
    return Result::Err(ErrorCode::AlreadyExists, "orchestration_session_exec");
  }

  s.execs.push_back(r);
  s.exec_by_id[r.orchestration_session_exec_id] = s.execs.size() - 1;
  return Result::Ok();
}

Result MemoryRepository::UpdateExec(Transaction& t, const model::ExecRecord& r) {
  auto& s = TX(t).Mutable();
  if (!JsonColumnsValid({&r.elaboration})) return JsonViolation("orchestration_session_exec");

  auto it = s.exec_by_id.find(r.orchestration_session_exec_id);
  if (it == s.exec_by_id.end()) return Result::Err(ErrorCode::NotFound, "orchestration_session_exec");

  auto& e           = s.execs[it->second];
  e.exec_status     = r.exec_status;
  e.output_text     = r.output_text;
  e.output_nature   = r.output_nature;
  e.exec_error_text = r.exec_error_text;
  e.narrative_md    = r.narrative_md;
  e.elaboration     = r.elaboration;
  e.finished_at_ms  = r.finished_at_ms;
  e.override_children          = r.override_children;
  e.housekeeping.updated_at_ms = r.finished_at_ms;
  return Result::Ok();
}

std::optional<model::ExecRecord> MemoryRepository::GetExec(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.exec_by_id.find(id);
  if (it == s.exec_by_id.end()) return std::nullopt;
  return s.execs[it->second];
}

std::vector<model::ExecRecord> MemoryRepository::ListExecs(Transaction& t, const std::string& session_id) {
  auto out = Select(TX(t).View().execs, [&](const auto& e) { return e.session_id == session_id; });
  SortBySiblingOrder(out);
  return out;
}

int64_t MemoryRepository::MaxExecSiblingOrder(Transaction& t, const std::string& session_id,
                                              const std::optional<std::string>& parent_exec_id) {
  int64_t max = -1;
  for (const auto& e : TX(t).View().execs) {
    if (e.session_id == session_id && e.parent_exec_id == parent_exec_id) max = std::max(max, e.sibling_order);
  }
  return max;
}

Result MemoryRepository::InsertIssue(Transaction& t, const model::IssueRecord& r) {
  auto& s = TX(t).Mutable();
  if (!JsonColumnsValid({&r.elaboration})) return JsonViolation("orchestration_session_issue");
  if (!Find(s.orch_sessions, [&](const auto& x) { return x.orchestration_session_id == r.session_id; })) {
    return MissingParent("orchestration_session_issue", "session_id");
  }
  if (r.session_entry_id && !Find(s.session_entries, [&](const auto& x) {
        return x.orchestration_session_entry_id == *r.session_entry_id;
      })) {
    return MissingParent("orchestration_session_issue", "session_entry_id");
  }
  if (Find(s.issues,
           [&](const auto& x) { return x.orchestration_session_issue_id == r.orchestration_session_issue_id; })) {
    return Result::Err(ErrorCode::AlreadyExists, "orchestration_session_issue");
  }

  s.issues.push_back(r);
  return Result::Ok();
}

std::vector<model::IssueRecord> MemoryRepository::ListIssues(Transaction& t, const std::string& session_id) {
  return Select(TX(t).View().issues, [&](const auto& x) { return x.session_id == session_id; });
}

Result MemoryRepository::InsertIssueRelation(Transaction& t, const model::IssueRelationRecord& r) {
  auto& s = TX(t).Mutable();
  if (!JsonColumnsValid({&r.elaboration})) return JsonViolation("orchestration_session_issue_relation");
  if (!Find(s.issues, [&](const auto& x) { return x.orchestration_session_issue_id == r.issue_id_prime; })) {
    return MissingParent("orchestration_session_issue_relation", "issue_id_prime");
  }

  s.issue_relations.push_back(r);
  return Result::Ok();
}

std::vector<model::IssueRelationRecord> MemoryRepository::ListIssueRelations(Transaction& t,
                                                                             const std::string& issue_id) {
  return Select(TX(t).View().issue_relations, [&](const auto& x) { return x.issue_id_prime == issue_id; });
}

Result MemoryRepository::InsertLog(Transaction& t, const model::LogRecord& r) {
  auto& s = TX(t).Mutable();
  if (!JsonColumnsValid({&r.elaboration})) return JsonViolation("orchestration_session_log");
  if (!Find(s.orch_sessions, [&](const auto& x) { return x.orchestration_session_id == r.session_id; })) {
    return MissingParent("orchestration_session_log", "session_id");
  }
  if (r.exec_id && !s.exec_by_id.contains(*r.exec_id)) {
    return MissingParent("orchestration_session_log", "exec_id");
  }
  if (r.parent_log_id &&
      !Find(s.logs, [&](const auto& x) { return x.orchestration_session_log_id == *r.parent_log_id; })) {
    return MissingParent("orchestration_session_log", "parent_log_id");
  }

  s.logs.push_back(r);
  return Result::Ok();
}

std::optional<model::LogRecord> MemoryRepository::GetLog(Transaction& t, const std::string& id) {
  const auto* l = Find(TX(t).View().logs, [&](const auto& x) { return x.orchestration_session_log_id == id; });
  if (!l) return std::nullopt;
  return *l;
}

std::vector<model::LogRecord> MemoryRepository::ListLogs(Transaction& t, const std::string& session_id) {
  auto out = Select(TX(t).View().logs, [&](const auto& x) { return x.session_id == session_id; });
  SortBySiblingOrder(out);
  return out;
}

int64_t MemoryRepository::MaxLogSiblingOrder(Transaction& t, const std::string& session_id,
                                             const std::optional<std::string>& parent_log_id) {
  int64_t max = -1;
  for (const auto& l : TX(t).View().logs) {
    if (l.session_id == session_id && l.parent_log_id == parent_log_id) max = std::max(max, l.sibling_order);
  }
  return max;
}

} // namespace ure::db::memory
