#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "ure_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullDocumentLoads() {
  const auto yaml_path = WriteYaml("full",
                                   R"(database:
  sqlite:
    path: "/var/lib/ure/resources.db"
    wal_mode: true
logging:
  level: debug
  pattern: "[%l] %v"
observability:
  tracing_enabled: false
  metrics_enabled: false
  otlp_endpoint: "localhost:4317"
  transport: OTLP_TRANSPORT_HTTP
device:
  name: workstation-1
  boundary: lab
ingest:
  namespace: docs
  strict: true
  workers: 3
  lineage_graph: filesystem
  capture_content: true
  roots:
    - path: /srv/docs
      include_globs: ["**/*.md"]
      exclude_globs: ["**/drafts/**"]
  match_rules:
    - regex: "\\.md$"
      nature: md
      priority: 1
    - regex: "\\.TXT$"
      flags: i
      nature: text
      priority: 2
  rewrite_rules:
    - regex: "^/srv/"
      replace: "/mnt/"
orchestration:
  nature: ingest-docs
  version: "1.0"
)");

  auto config = ure::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/ure/resources.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.logging().level() == "debug");
  assert(config.observability().transport() == ure::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(config.device().name() == "workstation-1");
  assert(config.ingest().namespace_() == "docs");
  assert(config.ingest().strict());
  assert(config.ingest().workers() == 3);
  assert(config.ingest().roots_size() == 1);
  assert(config.ingest().roots(0).include_globs(0) == "**/*.md");
  assert(config.ingest().match_rules_size() == 2);
  assert(config.ingest().match_rules(0).regex() == "\\.md$");
  assert(config.ingest().match_rules(1).flags() == "i");
  assert(config.ingest().rewrite_rules(0).replace() == "/mnt/");
  // Quoted scalars keep their text.
  assert(config.orchestration().version() == "1.0");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\ure\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = ure::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\ure\\\"quoted\"\\db.sqlite");
}

void TestScalarEscapingForNewlineAndUnicode() {
  auto config = ure::config::ConfigLoader::LoadFromYamlString(R"(device:
  name: "line1\nline2☃"
)");
  assert(config.device().name() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory: {}
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ure::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ure::config::ConfigLoader::LoadFromYaml("/nonexistent/ure/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestRunnerOptionsFromConfig() {
  auto config = ure::config::ConfigLoader::LoadFromYamlString(R"(device:
  name: host-a
ingest:
  workers: 2
  roots:
    - path: /data/a
    - path: /data/b
      exclude_globs: ["*.tmp"]
)");

  const auto spec = ure::factory::BuildDeviceSpec(config);
  assert(spec.name == "host-a");
  assert(spec.state == "SINGLETON");
  assert(spec.boundary == "UNKNOWN");

  const auto options = ure::factory::BuildPipelineOptions(config);
  assert(options.workers == 2);
  assert(options.roots.size() == 2);
  assert(options.roots[1].locator == "/data/b");
  assert(options.roots[1].exclude_globs.size() == 1);
  assert(options.nature == "ingest");

  auto unnamed = ure::config::ConfigLoader::LoadFromYamlString("database:\n  memory: {}\n");
  bool threw   = false;
  try {
    (void)ure::factory::BuildDeviceSpec(unnamed);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "a device name is required to run");
}

} // namespace

int main() {
  TestFullDocumentLoads();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestRunnerOptionsFromConfig();

  std::cout << "ure_unit_config_loader: pass\n";
  return 0;
}
