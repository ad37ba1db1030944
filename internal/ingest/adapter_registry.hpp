#pragma once

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "source_adapter.hpp"

namespace ure::ingest {

// Source adapters keyed by Kind(), chosen when a container is registered.
class AdapterRegistry {
 public:
  // Replaces any adapter of the same kind.
  void Register(std::shared_ptr<SourceAdapter> adapter);

  // Throws NotFound for an unregistered kind.
  std::shared_ptr<SourceAdapter> Get(const std::string& kind) const;

  bool Has(const std::string& kind) const;

  std::vector<std::string> Kinds() const;

 private:
  mutable std::shared_mutex                             mutex_;
  std::map<std::string, std::shared_ptr<SourceAdapter>> adapters_;
};

} // namespace ure::ingest
