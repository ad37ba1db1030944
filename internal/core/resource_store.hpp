#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/json.hpp"

namespace ure::core {

struct AdmitRequest {
  std::string                device_id;
  std::string                ingest_session_id;
  std::optional<std::string> ingest_fs_path_id;
  std::string                uri;

  // Raw bytes. May be omitted when the caller supplies content_digest.
  std::optional<std::string> content;
  std::optional<std::string> content_digest;
  uint64_t                   size_bytes = 0;

  std::optional<std::string> nature;
  std::optional<uint64_t>    last_modified_at_ms;
  util::JsonText             frontmatter;
  util::JsonText             content_fm_body_attrs;
  util::JsonText             elaboration;
  std::string                created_by = "UNKNOWN";
};

struct TransformRequest {
  std::string                uniform_resource_id;
  // Defaults to the source resource's uri.
  std::optional<std::string> uri;
  std::optional<std::string> content;
  std::optional<std::string> content_digest;
  std::string                nature;
  uint64_t                   size_bytes = 0;
  util::JsonText             elaboration;
  std::string                created_by = "UNKNOWN";
};

struct Admission {
  std::string id;
  std::string content_digest;
  bool        is_new = false;
};

/*
  Content-addressed resource store.

  Dedup authority for uniform resources and their transforms:

    resource key  = (device_id, content_digest, uri, size_bytes)
    transform key = (uniform_resource_id, content_digest, nature, size_bytes)

  A key that already holds a row, live or soft-deleted, yields that row's id
  with is_new == false and no write. Only a new row notifies admission
  listeners, after its transaction commits.
*/
class ResourceStore {
 public:
  using AdmissionListener = std::function<void(const db::model::UniformResourceRecord&)>;

  explicit ResourceStore(std::shared_ptr<db::Repository> repository);

  // Throws ValidationError, ReferentialError (missing device or session).
  Admission Admit(const AdmitRequest& request);

  // Throws ValidationError, ReferentialError (missing resource).
  Admission AdmitTransform(const TransformRequest& request);

  void AddAdmissionListener(AdmissionListener listener);

  std::optional<db::model::UniformResourceRecord> Get(const std::string& resource_id,
                                                      db::Visibility visibility = db::Visibility::kLive) const;

  std::optional<db::model::UniformResourceRecord> FindByKey(const std::string& device_id, const std::string& content_digest,
                                                            const std::string& uri, uint64_t size_bytes,
                                                            db::Visibility visibility = db::Visibility::kLive) const;

  std::vector<db::model::UniformResourceRecord> ListLive(const std::string& device_id) const;

  // Physical rows for a key, deleted included. Never more than one.
  uint64_t CountByKey(const std::string& device_id, const std::string& content_digest, const std::string& uri,
                      uint64_t size_bytes) const;

  std::vector<db::model::UniformResourceTransformRecord> ListTransforms(const std::string& resource_id) const;

  void SoftDelete(const std::string& resource_id, const std::string& deleted_by);

 private:
  static std::string ResolveDigest(const std::optional<std::string>& content, const std::optional<std::string>& digest);

  void Notify(const db::model::UniformResourceRecord& record);

  std::shared_ptr<db::Repository> repository_;

  std::mutex                     listeners_mutex_;
  std::vector<AdmissionListener> listeners_;
};

} // namespace ure::core
