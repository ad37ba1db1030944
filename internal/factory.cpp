#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/ingest/fs_adapter.hpp"
#include "internal/observability/logging.hpp"

namespace ure::factory {

using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kDefaultNamespace = "default";
constexpr const char* kCreatedBy        = "ure-engine";

template <typename Repeated>
std::vector<std::string> ToVector(const Repeated& values) {
  return std::vector<std::string>(values.begin(), values.end());
}

std::optional<std::string> NonEmpty(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const ure::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("database.sqlite.path must be set");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    const int applied = sqlite_db->Migrate();
    URE_LOG_INFO("sqlite store ready",
                 {StringField("path", database.sqlite().path()), IntField("migrations_applied", applied)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  URE_LOG_INFO("in-memory store ready");
  return std::make_shared<db::memory::MemoryRepository>();
}

core::DeviceSpec BuildDeviceSpec(const ure::runtime::config::RuntimeConfig& config) {
  const auto& device = config.device();
  if (device.name().empty()) {
    throw std::runtime_error("device.name must be set");
  }

  core::DeviceSpec spec;
  spec.device_id  = device.device_id();
  spec.name       = device.name();
  spec.created_by = kCreatedBy;
  if (!device.state().empty()) {
    spec.state = device.state();
  }
  if (!device.boundary().empty()) {
    spec.boundary = device.boundary();
  }
  return spec;
}

ingest::PathRuleSet BuildRuleSet(const ure::runtime::config::RuntimeConfig& config, db::Repository& repository) {
  const auto& ingest_config  = config.ingest();
  const auto  namespace_name = ingest_config.namespace_().empty() ? std::string(kDefaultNamespace) : ingest_config.namespace_();

  ingest::PathRuleSet rules(namespace_name, ingest_config.strict());

  for (const auto& rule : ingest_config.match_rules()) {
    ingest::MatchRule match;
    match.regex         = rule.regex();
    match.flags         = rule.flags();
    match.nature        = NonEmpty(rule.nature());
    match.priority      = rule.priority();
    match.description   = NonEmpty(rule.description());
    match.include_globs = ToVector(rule.include_globs());
    match.exclude_globs = ToVector(rule.exclude_globs());
    rules.AddMatchRule(match);
  }
  for (const auto& rule : ingest_config.rewrite_rules()) {
    ingest::RewriteRule rewrite;
    rewrite.regex       = rule.regex();
    rewrite.replace     = rule.replace();
    rewrite.priority    = rule.priority();
    rewrite.description = NonEmpty(rule.description());
    rules.AddRewriteRule(rewrite);
  }

  rules.Persist(repository, kCreatedBy);
  return rules;
}

pipeline::PipelineOptions BuildPipelineOptions(const ure::runtime::config::RuntimeConfig& config) {
  pipeline::PipelineOptions options;
  options.created_by = kCreatedBy;

  const auto& ingest_config = config.ingest();
  if (ingest_config.workers() > 0) {
    options.workers = ingest_config.workers();
  }
  for (const auto& root : ingest_config.roots()) {
    if (root.path().empty()) {
      throw std::runtime_error("ingest.roots[].path must be set");
    }
    pipeline::RootSpec spec;
    spec.locator       = root.path();
    spec.include_globs = ToVector(root.include_globs());
    spec.exclude_globs = ToVector(root.exclude_globs());
    options.roots.push_back(std::move(spec));
  }

  const auto& orchestration = config.orchestration();
  if (!orchestration.nature().empty()) {
    options.nature = orchestration.nature();
  }
  if (!orchestration.version().empty()) {
    options.version = orchestration.version();
  }
  return options;
}

/*
    Build full application dependency graph
*/
Runtime BuildRuntime(const ure::runtime::config::RuntimeConfig& config) {
  Runtime runtime;

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  runtime.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  runtime.devices = std::make_shared<core::DeviceRegistry>(runtime.repository);
  runtime.store   = std::make_shared<core::ResourceStore>(runtime.repository);
  runtime.lineage = std::make_shared<lineage::LineageGraph>(runtime.repository);
  runtime.lineage->Hydrate();

  const auto& graph = config.ingest().lineage_graph();
  if (!graph.empty()) {
    runtime.store->AddAdmissionListener(runtime.lineage->Indexer(graph));
  }

  // ------------------------------------------------------------------
  // Ingestion and orchestration
  // ------------------------------------------------------------------
  runtime.adapters = std::make_shared<ingest::AdapterRegistry>();
  runtime.adapters->Register(std::make_shared<ingest::FilesystemAdapter>(config.ingest().capture_content()));

  runtime.sessions = std::make_shared<ingest::IngestSessionManager>(runtime.repository, runtime.store);
  runtime.executor = std::make_shared<orchestration::OrchestrationExecutor>(runtime.repository);
  runtime.pipeline = std::make_shared<pipeline::IngestPipeline>(runtime.sessions, runtime.executor, runtime.adapters);

  return runtime;
}

} // namespace ure::factory
