#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/device_identity.hpp"
#include "internal/ingest/adapter_registry.hpp"
#include "internal/ingest/ingest_session_manager.hpp"
#include "internal/ingest/path_rules.hpp"
#include "internal/orchestration/executor.hpp"

namespace ure::pipeline {

struct RootSpec {
  std::string              locator;
  std::string              source_kind = "fs";
  std::vector<std::string> include_globs;
  std::vector<std::string> exclude_globs;
};

struct PipelineOptions {
  std::vector<RootSpec> roots;
  std::size_t           workers    = 4;
  std::string           nature     = "ingest";
  std::string           version    = "0.1.0";
  std::string           created_by = "ure-engine";
};

struct PipelineReport {
  std::string            orchestration_session_id;
  std::string            ingest_session_id;
  ingest::SessionSummary summary;
  std::size_t            failed_execs = 0;
  std::size_t            issues       = 0;
  std::string            final_state;
};

/*
  One ingest run inside one orchestration session.

    session (NONE -> RUNNING)
      entry "ingest"
        exec container  (one per root)
          exec unit     (one per discovered unit, run by the worker pool)
    session (RUNNING -> COMPLETED | FAILED)

  Logs mirror the exec tree. Adapter failures and rejected units become
  issues. A fatal store error drops the units still queued and fails the
  container execs; both sessions still end and the error is rethrown as
  StoreFailure.
*/
class IngestPipeline {
 public:
  // Exec status categories for unit execs.
  static constexpr int kInvalidUnitStatus    = 1;
  static constexpr int kAdapterFailureStatus = 2;
  static constexpr int kFatalStatus          = 3;

  IngestPipeline(std::shared_ptr<ingest::IngestSessionManager>     sessions,
                 std::shared_ptr<orchestration::OrchestrationExecutor> executor,
                 std::shared_ptr<ingest::AdapterRegistry>           adapters);

  PipelineReport Run(const core::DeviceIdentity& device, const PipelineOptions& options,
                     const ingest::PathRuleSet& rules);

 private:
  std::shared_ptr<ingest::IngestSessionManager>         sessions_;
  std::shared_ptr<orchestration::OrchestrationExecutor> executor_;
  std::shared_ptr<ingest::AdapterRegistry>              adapters_;
};

} // namespace ure::pipeline
