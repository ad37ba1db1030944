#pragma once

#include <string>

#include "internal/db/model/housekeeping.hpp"
#include "internal/util/json.hpp"

namespace ure::db::model {

struct GraphRecord {
  std::string    name;
  util::JsonText elaboration;

  Housekeeping housekeeping;
};

/*
  Typed edge from an opaque node id to a resource.

  (graph_name, nature, node_id, uniform_resource_id) is unique.
*/
struct EdgeRecord {
  std::string graph_name;
  std::string nature;
  std::string node_id;
  std::string uniform_resource_id;

  util::JsonText elaboration;

  Housekeeping housekeeping;
};

} // namespace ure::db::model
