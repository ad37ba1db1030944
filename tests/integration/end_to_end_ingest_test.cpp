#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/util/time.hpp"

namespace {

namespace fs = std::filesystem;

void WriteFile(const fs::path& path, const std::string& body) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path);
  out << body;
}

fs::path MakeTree() {
  const auto root = fs::temp_directory_path() / ("ure_e2e_" + std::to_string(ure::util::NowMs()));
  fs::remove_all(root);
  WriteFile(root / "a.md", "---\ntitle: A\n---\n# A\n");
  WriteFile(root / "sub" / "b.md", "# B\n");
  WriteFile(root / "notes.txt", "plain notes\n");
  return root;
}

std::string ConfigFor(const fs::path& root) {
  return "database:\n"
         "  memory: {}\n"
         "device:\n"
         "  name: D1\n"
         "ingest:\n"
         "  namespace: e2e\n"
         "  workers: 2\n"
         "  lineage_graph: filesystem\n"
         "  capture_content: true\n"
         "  roots:\n"
         "    - path: \"" + root.string() + "\"\n"
         "  match_rules:\n"
         "    - regex: \"\\\\.md$\"\n"
         "      nature: md\n"
         "    - regex: \"\\\\.txt$\"\n"
         "      nature: text\n"
         "orchestration:\n"
         "  nature: ingest\n"
         "  version: \"0.1.0\"\n";
}

void VerifyRunShape(ure::factory::Runtime& runtime, const ure::pipeline::PipelineReport& report) {
  assert(report.final_state == "COMPLETED");
  assert(report.failed_execs == 0);

  const auto session = runtime.executor->Report(report.orchestration_session_id);
  assert(session.session.orch_finished_at_ms.has_value());

  // One container exec for the single root, one unit exec per file.
  assert(session.exec_tree.size() == 1);
  const auto& container = session.exec_tree[0];
  assert(container.record.exec_status == 0);
  assert(container.children.size() == 3);
  for (std::size_t i = 0; i < container.children.size(); ++i) {
    assert(container.children[i].record.parent_exec_id == container.record.orchestration_session_exec_id);
    assert(container.children[i].record.exec_status == 0);
  }

  bool completed = false;
  for (const auto& state : session.states) {
    if (state.owner_id == report.orchestration_session_id && state.to_state == "COMPLETED") {
      completed = true;
    }
  }
  assert(completed);

  // Container log plus one line per unit.
  assert(ure::orchestration::ReplayLog(session.logs).size() == 4);
}

} // namespace

int main() {
  const auto root   = MakeTree();
  const auto config = ure::config::ConfigLoader::LoadFromYamlString(ConfigFor(root));

  auto       runtime = ure::factory::BuildRuntime(config);
  const auto device  = runtime.devices->Ensure(ure::factory::BuildDeviceSpec(config));
  const auto rules   = ure::factory::BuildRuleSet(config, *runtime.repository);
  const auto options = ure::factory::BuildPipelineOptions(config);

  const auto first = runtime.pipeline->Run(device, options, rules);
  assert(first.summary.admitted == 3);
  assert(first.summary.duplicate == 0);
  VerifyRunShape(runtime, first);

  const auto resources = runtime.store->ListLive(device.DeviceId());
  assert(resources.size() == 3);

  const auto second = runtime.pipeline->Run(device, options, rules);
  assert(second.summary.admitted == 0);
  assert(second.summary.duplicate == 3);
  assert(second.orchestration_session_id != first.orchestration_session_id);
  assert(second.ingest_session_id != first.ingest_session_id);
  VerifyRunShape(runtime, second);

  // Nothing new was stored; every resource still belongs to the first run.
  const auto after = runtime.store->ListLive(device.DeviceId());
  assert(after.size() == 3);
  for (const auto& resource : after) {
    assert(resource.ingest_session_id == first.ingest_session_id);
    const auto edges = runtime.lineage->Nodes(resource.uniform_resource_id);
    assert(edges.size() == 1);
    assert(edges[0].graph_name == "filesystem");
    assert(edges[0].node_id == resource.uri);
  }

  fs::remove_all(root);

  std::cout << "ure_integration_end_to_end_ingest: pass\n";
  return 0;
}
