#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/device_registry.hpp"
#include "internal/core/resource_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ingest/adapter_registry.hpp"
#include "internal/ingest/ingest_session_manager.hpp"
#include "internal/ingest/path_rules.hpp"
#include "internal/lineage/lineage_graph.hpp"
#include "internal/orchestration/executor.hpp"
#include "internal/pipeline/ingest_pipeline.hpp"

namespace ure::factory {

/*
  Runtime

  Owns all long-lived services used by the engine.
  Everything here lives for the lifetime of the process.
*/
struct Runtime {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<core::DeviceRegistry>                 devices;
  std::shared_ptr<core::ResourceStore>                  store;
  std::shared_ptr<lineage::LineageGraph>                lineage;
  std::shared_ptr<ingest::AdapterRegistry>              adapters;
  std::shared_ptr<ingest::IngestSessionManager>         sessions;
  std::shared_ptr<orchestration::OrchestrationExecutor> executor;
  std::shared_ptr<pipeline::IngestPipeline>             pipeline;
};

/*
  BuildRuntime

  Constructs the engine based on runtime config. When ingest.lineage_graph
  is set, every new admission is linked into that graph.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Runtime BuildRuntime(const ure::runtime::config::RuntimeConfig& config);

// memory {} (or no database section) or sqlite { path }; sqlite is migrated.
std::shared_ptr<db::Repository> BuildRepository(const ure::runtime::config::RuntimeConfig& config);

core::DeviceSpec BuildDeviceSpec(const ure::runtime::config::RuntimeConfig& config);

// Rules from config; they are persisted under the namespace before returning.
ingest::PathRuleSet BuildRuleSet(const ure::runtime::config::RuntimeConfig& config, db::Repository& repository);

pipeline::PipelineOptions BuildPipelineOptions(const ure::runtime::config::RuntimeConfig& config);

} // namespace ure::factory
