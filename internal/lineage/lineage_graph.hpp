#pragma once

#include <cstddef>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/core/resource_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/json.hpp"

namespace ure::lineage {

/*
  Lazy, finite sequence of resource ids linked from one (graph, node).

  Pages are fetched from the repository on demand, ordered by resource id.
  Every begin() restarts from the first page, so the sequence can be walked
  more than once; each walk sees the edges committed at fetch time.
*/
class NeighborSequence {
 public:
  class iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = std::string;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const std::string*;
    using reference         = const std::string&;

    iterator() = default;

    reference operator*() const {
      return page_[pos_];
    }
    pointer operator->() const {
      return &page_[pos_];
    }

    iterator& operator++();

    bool operator==(const iterator& other) const {
      return done_ == other.done_ && (done_ || (pos_ == other.pos_ && page_ == other.page_));
    }
    bool operator!=(const iterator& other) const {
      return !(*this == other);
    }

   private:
    friend class NeighborSequence;

    explicit iterator(const NeighborSequence* owner);

    void Fetch(const std::string& after);

    const NeighborSequence*  owner_ = nullptr;
    std::vector<std::string> page_;
    std::size_t              pos_  = 0;
    bool                     done_ = true;
  };

  NeighborSequence(std::shared_ptr<db::Repository> repository, std::string graph_name, std::string node_id,
                   std::optional<std::string> nature, std::size_t page_size);

  iterator begin() const {
    return iterator(this);
  }
  iterator end() const {
    return iterator();
  }

  // Drains the whole sequence.
  std::vector<std::string> ToVector() const;

 private:
  std::shared_ptr<db::Repository> repository_;
  std::string                     graph_name_;
  std::string                     node_id_;
  std::optional<std::string>      nature_;
  std::size_t                     page_size_;
};

/*
  Named graphs of typed edges (graph, nature, node_id) -> uniform resource.

  Graph names are registered in memory; the graph row is written lazily
  with the first edge. Linking is insert-or-ignore on the edge key.
*/
class LineageGraph {
 public:
  static constexpr std::size_t kDefaultPageSize = 100;

  explicit LineageGraph(std::shared_ptr<db::Repository> repository);

  // Re-registering a name keeps the first elaboration.
  void Register(const std::string& graph_name, const util::JsonText& elaboration = std::nullopt);

  bool IsRegistered(const std::string& graph_name) const;

  // Registers every graph already persisted.
  void Hydrate();

  // Returns true when the edge is new. Throws UnknownGraphError for an
  // unregistered graph, ReferentialError for a missing resource.
  bool Link(const std::string& graph_name, const std::string& nature, const std::string& node_id,
            const std::string& resource_id);

  NeighborSequence Neighbors(const std::string& graph_name, const std::string& node_id,
                             const std::optional<std::string>& nature = std::nullopt,
                             std::size_t                       page_size = kDefaultPageSize) const;

  // Edges that reference `resource_id`, ordered by graph, nature, node.
  std::vector<db::model::EdgeRecord> Nodes(const std::string& resource_id) const;

  // Listener linking each newly admitted resource into `graph_name` with
  // node id = resource uri.
  core::ResourceStore::AdmissionListener Indexer(const std::string& graph_name, const std::string& nature = "admitted");

 private:
  std::shared_ptr<db::Repository> repository_;

  mutable std::shared_mutex                  mutex_;
  std::map<std::string, util::JsonText>      graphs_;
};

} // namespace ure::lineage
