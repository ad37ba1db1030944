#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace {

void Shutdown() {
  ure::observability::ShutdownLogging();
  ure::observability::ShutdownMetrics();
  ure::observability::ShutdownTracing();
}

void PrintReport(const ure::pipeline::PipelineReport& report) {
  const auto& summary = report.summary;
  std::cout << "orchestration session: " << report.orchestration_session_id << " (" << report.final_state << ")\n"
            << "ingest session:        " << report.ingest_session_id << "\n"
            << "admitted:  " << summary.admitted << "\n"
            << "duplicate: " << summary.duplicate << "\n"
            << "rejected:  " << summary.rejected << "\n"
            << "errored:   " << summary.errored << "\n"
            << "issues:    " << report.issues << "\n"
            << "failed execs: " << report.failed_execs << std::endl;
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: ure-engine <config.yaml> OR ure-engine --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = ure::config::ConfigLoader::LoadFromYaml(config_path);

    ure::observability::InitializeTracing(config);
    ure::observability::InitializeMetrics(config);
    ure::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build engine (dependency graph)
    // ------------------------------------------------------------
    auto runtime = ure::factory::BuildRuntime(config);
    auto device  = runtime.devices->Ensure(ure::factory::BuildDeviceSpec(config));
    auto rules   = ure::factory::BuildRuleSet(config, *runtime.repository);
    auto options = ure::factory::BuildPipelineOptions(config);

    URE_LOG_INFO("ure-engine started", {ure::observability::StringField("device_id", device.DeviceId()),
                                        ure::observability::StringField("namespace", rules.Namespace())});

    // ------------------------------------------------------------
    // Run ingestion
    // ------------------------------------------------------------
    const auto report = runtime.pipeline->Run(device, options, rules);
    PrintReport(report);

    Shutdown();
  } catch (const std::exception& e) {
    URE_LOG_ERROR("Fatal error", {ure::observability::StringField("error", e.what())});
    Shutdown();
    return 2;
  }

  return 0;
}
