#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/model/housekeeping.hpp"
#include "internal/util/json.hpp"

namespace ure::db::model {

/*
  Canonical content-addressed record.

  IMPORTANT:
  - (device_id, content_digest, uri, size_bytes) is unique; dedup is
    device-scoped.
  - ingest_session_id is the session that first admitted the bytes. Later
    sessions that observe the same key reference this row, they never own it.
*/

struct UniformResourceRecord {
  std::string uniform_resource_id;
  std::string device_id;
  std::string ingest_session_id;

  std::optional<std::string> ingest_fs_path_id;

  std::string uri;
  std::string content_digest;

  // raw bytes; may be absent when only a reference is kept
  std::optional<std::string> content;
  std::optional<std::string> nature;
  uint64_t                   size_bytes = 0;

  std::optional<uint64_t> last_modified_at_ms;

  util::JsonText content_fm_body_attrs;
  util::JsonText frontmatter;
  util::JsonText elaboration;

  Housekeeping housekeeping;
};

/*
  Derived artifact of a resource.

  (uniform_resource_id, content_digest, nature, size_bytes) is unique.
*/
struct UniformResourceTransformRecord {
  std::string uniform_resource_transform_id;
  std::string uniform_resource_id;

  std::string uri;
  std::string content_digest;

  std::optional<std::string> content;
  std::string                nature;
  uint64_t                   size_bytes = 0;

  util::JsonText elaboration;

  Housekeeping housekeeping;
};

} // namespace ure::db::model
