#include "internal/lineage/lineage_graph.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/device_registry.hpp"
#include "internal/core/resource_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/ingest/ingest_session_manager.hpp"
#include "internal/util/errors.hpp"

namespace {

using ure::lineage::LineageGraph;

struct Fixture {
  std::shared_ptr<ure::db::Repository> repository = std::make_shared<ure::db::memory::MemoryRepository>();
  std::shared_ptr<ure::core::ResourceStore> store = std::make_shared<ure::core::ResourceStore>(repository);
  std::string                               device_id;
  std::string                               session_id;

  Fixture() {
    ure::core::DeviceRegistry devices(repository);
    ure::core::DeviceSpec     spec;
    spec.name = "lineage-host";
    device_id = devices.Ensure(spec).DeviceId();

    ure::ingest::IngestSessionManager sessions(repository, store);
    ure::ingest::OpenRequest          open;
    open.device_id = device_id;
    session_id     = sessions.Open(open);
  }

  std::string Admit(const std::string& uri) {
    ure::core::AdmitRequest request;
    request.device_id         = device_id;
    request.ingest_session_id = session_id;
    request.uri               = uri;
    request.content           = "content of " + uri;
    request.size_bytes        = request.content->size();
    return store->Admit(request).id;
  }
};

std::vector<std::string> Sorted(std::vector<std::string> values) {
  std::sort(values.begin(), values.end());
  return values;
}

void TestLinkRequiresRegisteredGraphAndExistingResource() {
  Fixture      f;
  LineageGraph graph(f.repository);
  const auto   resource = f.Admit("file:///a.md");

  bool unknown_graph = false;
  try {
    (void)graph.Link("unregistered", "contains", "dir:/", resource);
  } catch (const ure::util::UnknownGraphError&) {
    unknown_graph = true;
  }
  assert(unknown_graph);

  graph.Register("filesystem");
  assert(graph.IsRegistered("filesystem"));

  bool missing_resource = false;
  try {
    (void)graph.Link("filesystem", "contains", "dir:/", "no-such-resource");
  } catch (const ure::util::ReferentialError&) {
    missing_resource = true;
  }
  assert(missing_resource);

  assert(graph.Link("filesystem", "contains", "dir:/", resource));
  assert(!graph.Link("filesystem", "contains", "dir:/", resource));
  assert(graph.Link("filesystem", "mentions", "dir:/", resource));
}

void TestNeighborsPageLazilyAndFilterByNature() {
  Fixture      f;
  LineageGraph graph(f.repository);
  graph.Register("filesystem");

  std::vector<std::string> contained;
  for (int i = 0; i < 5; ++i) {
    const auto id = f.Admit("file:///dir/" + std::to_string(i) + ".md");
    contained.push_back(id);
    graph.Link("filesystem", "contains", "dir:/dir", id);
  }
  const auto mentioned = f.Admit("file:///elsewhere.md");
  graph.Link("filesystem", "mentions", "dir:/dir", mentioned);

  const auto contains = graph.Neighbors("filesystem", "dir:/dir", std::string("contains"), 2);
  assert(contains.ToVector() == Sorted(contained));

  // Each begin() restarts from the first page.
  std::size_t visited = 0;
  for (const auto& id : contains) {
    assert(!id.empty());
    ++visited;
  }
  assert(visited == contained.size());

  auto everything = contained;
  everything.push_back(mentioned);
  assert(graph.Neighbors("filesystem", "dir:/dir", std::nullopt, 4).ToVector() == Sorted(everything));

  assert(graph.Neighbors("filesystem", "dir:/missing").ToVector().empty());
  assert(graph.Neighbors("other", "dir:/dir").ToVector().empty());
}

void TestNodesListEdgesReferencingResource() {
  Fixture      f;
  LineageGraph graph(f.repository);
  graph.Register("filesystem");
  graph.Register("topics");

  const auto resource = f.Admit("file:///doc.md");
  graph.Link("topics", "tagged", "topic:rust", resource);
  graph.Link("filesystem", "contains", "dir:/", resource);

  const auto edges = graph.Nodes(resource);
  assert(edges.size() == 2);
  assert(edges[0].graph_name == "filesystem");
  assert(edges[1].graph_name == "topics");
  assert(edges[1].node_id == "topic:rust");
}

void TestGraphsPersistWithTheirFirstEdge() {
  Fixture f;
  {
    LineageGraph graph(f.repository);
    graph.Register("linked");
    graph.Register("empty");
    graph.Link("linked", "contains", "dir:/", f.Admit("file:///x.md"));
  }

  LineageGraph reloaded(f.repository);
  reloaded.Hydrate();
  assert(reloaded.IsRegistered("linked"));
  assert(!reloaded.IsRegistered("empty"));
}

void TestIndexerLinksNewAdmissionsByUri() {
  Fixture      f;
  LineageGraph graph(f.repository);
  f.store->AddAdmissionListener(graph.Indexer("admissions"));

  const auto first  = f.Admit("file:///indexed.md");
  const auto second = f.Admit("file:///indexed.md");
  assert(first == second);

  assert(graph.IsRegistered("admissions"));
  const auto linked = graph.Neighbors("admissions", "file:///indexed.md", std::string("admitted")).ToVector();
  assert(linked.size() == 1);
  assert(linked[0] == first);
}

} // namespace

int main() {
  TestLinkRequiresRegisteredGraphAndExistingResource();
  TestNeighborsPageLazilyAndFilterByNature();
  TestNodesListEdgesReferencingResource();
  TestGraphsPersistWithTheirFirstEdge();
  TestIndexerLinksNewAdmissionsByUri();

  std::cout << "ure_unit_lineage_graph: pass\n";
  return 0;
}
