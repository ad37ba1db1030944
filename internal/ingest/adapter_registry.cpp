#include "adapter_registry.hpp"

#include <mutex>

#include "internal/util/errors.hpp"

namespace ure::ingest {

void AdapterRegistry::Register(std::shared_ptr<SourceAdapter> adapter) {
  if (!adapter) {
    throw std::invalid_argument("adapter must not be null");
  }
  const auto kind = adapter->Kind();

  std::unique_lock lock(mutex_);
  adapters_[kind] = std::move(adapter);
}

std::shared_ptr<SourceAdapter> AdapterRegistry::Get(const std::string& kind) const {
  std::shared_lock lock(mutex_);
  auto             it = adapters_.find(kind);
  if (it == adapters_.end()) {
    throw util::NotFound("no source adapter for kind: " + kind);
  }
  return it->second;
}

bool AdapterRegistry::Has(const std::string& kind) const {
  std::shared_lock lock(mutex_);
  return adapters_.count(kind) > 0;
}

std::vector<std::string> AdapterRegistry::Kinds() const {
  std::shared_lock         lock(mutex_);
  std::vector<std::string> kinds;
  for (const auto& [kind, adapter] : adapters_) {
    kinds.push_back(kind);
  }
  return kinds;
}

} // namespace ure::ingest
