#pragma once

#include <cstddef>
#include <cstdint>

namespace ure::db {

// Live reads filter on an unset deletion timestamp; raw-history reads do not.
enum class Visibility {
  kLive,
  kIncludeDeleted,
};

// Entities that support soft deletion through the housekeeping envelope.
enum class EntityKind {
  kDevice,
  kBehavior,
  kIngestSession,
  kUniformResource,
  kUniformResourceTransform,
};

struct Pagination {
  std::size_t limit  = 100;
  std::size_t offset = 0;
};

const char* ToString(EntityKind kind);

} // namespace ure::db
