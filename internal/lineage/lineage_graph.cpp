#include "lineage_graph.hpp"

#include <mutex>

#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ure::lineage {

// ------------------------------------------------------------
// NeighborSequence
// ------------------------------------------------------------

NeighborSequence::NeighborSequence(std::shared_ptr<db::Repository> repository, std::string graph_name, std::string node_id,
                                   std::optional<std::string> nature, std::size_t page_size)
    : repository_(std::move(repository)),
      graph_name_(std::move(graph_name)),
      node_id_(std::move(node_id)),
      nature_(std::move(nature)),
      page_size_(page_size == 0 ? LineageGraph::kDefaultPageSize : page_size) {
}

NeighborSequence::iterator::iterator(const NeighborSequence* owner) : owner_(owner), done_(false) {
  Fetch("");
}

void NeighborSequence::iterator::Fetch(const std::string& after) {
  auto tx = owner_->repository_->Begin();
  page_   = owner_->repository_->ListNeighborIds(*tx, owner_->graph_name_, owner_->node_id_, owner_->nature_, after,
                                                 owner_->page_size_);
  tx->Commit();

  pos_ = 0;
  if (page_.empty()) {
    done_ = true;
  }
}

NeighborSequence::iterator& NeighborSequence::iterator::operator++() {
  if (done_) {
    return *this;
  }

  ++pos_;
  if (pos_ < page_.size()) {
    return *this;
  }

  // A short page is the last one.
  if (page_.size() < owner_->page_size_) {
    done_ = true;
    page_.clear();
    pos_ = 0;
    return *this;
  }
  Fetch(page_.back());
  return *this;
}

std::vector<std::string> NeighborSequence::ToVector() const {
  std::vector<std::string> out;
  for (const auto& id : *this) {
    out.push_back(id);
  }
  return out;
}

// ------------------------------------------------------------
// LineageGraph
// ------------------------------------------------------------

LineageGraph::LineageGraph(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void LineageGraph::Register(const std::string& graph_name, const util::JsonText& elaboration) {
  if (graph_name.empty()) {
    throw util::ValidationError("graph name must not be empty");
  }
  util::RequireJsonOrNull("elaboration", elaboration);

  std::unique_lock lock(mutex_);
  graphs_.emplace(graph_name, elaboration);
}

bool LineageGraph::IsRegistered(const std::string& graph_name) const {
  std::shared_lock lock(mutex_);
  return graphs_.count(graph_name) > 0;
}

void LineageGraph::Hydrate() {
  auto tx     = repository_->Begin();
  auto graphs = repository_->ListGraphs(*tx);
  tx->Commit();

  std::unique_lock lock(mutex_);
  for (const auto& graph : graphs) {
    graphs_.emplace(graph.name, graph.elaboration);
  }
}

bool LineageGraph::Link(const std::string& graph_name, const std::string& nature, const std::string& node_id,
                        const std::string& resource_id) {
  util::JsonText elaboration;
  {
    std::shared_lock lock(mutex_);
    auto             it = graphs_.find(graph_name);
    if (it == graphs_.end()) {
      throw util::UnknownGraphError("unknown graph: " + graph_name);
    }
    elaboration = it->second;
  }

  const auto now = util::NowMs();
  auto       tx  = repository_->Begin();

  if (!repository_->GetUniformResource(*tx, resource_id, db::Visibility::kIncludeDeleted)) {
    throw util::ReferentialError("unknown uniform resource: " + resource_id);
  }

  db::model::GraphRecord graph;
  graph.name                       = graph_name;
  graph.elaboration                = elaboration;
  graph.housekeeping.created_at_ms = now;
  core::ThrowIfDbError(repository_->InsertGraphIfAbsent(*tx, graph).result, "persist graph " + graph_name);

  db::model::EdgeRecord edge;
  edge.graph_name                 = graph_name;
  edge.nature                     = nature;
  edge.node_id                    = node_id;
  edge.uniform_resource_id        = resource_id;
  edge.housekeeping.created_at_ms = now;

  auto outcome = repository_->InsertEdgeIfAbsent(*tx, edge);
  core::ThrowIfDbError(outcome.result, "link " + node_id + " in " + graph_name);
  tx->Commit();
  return outcome.inserted;
}

NeighborSequence LineageGraph::Neighbors(const std::string& graph_name, const std::string& node_id,
                                         const std::optional<std::string>& nature, std::size_t page_size) const {
  return NeighborSequence(repository_, graph_name, node_id, nature, page_size);
}

std::vector<db::model::EdgeRecord> LineageGraph::Nodes(const std::string& resource_id) const {
  auto tx    = repository_->Begin();
  auto edges = repository_->ListEdgesTo(*tx, resource_id);
  tx->Commit();
  return edges;
}

core::ResourceStore::AdmissionListener LineageGraph::Indexer(const std::string& graph_name, const std::string& nature) {
  Register(graph_name);
  return [this, graph_name, nature](const db::model::UniformResourceRecord& record) {
    Link(graph_name, nature, record.uri, record.uniform_resource_id);
  };
}

} // namespace ure::lineage
