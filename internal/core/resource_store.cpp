#include "resource_store.hpp"

#include "db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace ure::core {

using observability::StringField;

ResourceStore::ResourceStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::string ResourceStore::ResolveDigest(const std::optional<std::string>& content, const std::optional<std::string>& digest) {
  if (digest) {
    if (!util::IsSha256Hex(*digest)) {
      throw util::ValidationError("content_digest must be lowercase sha-256 hex");
    }
    return *digest;
  }
  if (!content) {
    throw util::ValidationError("either content or content_digest is required");
  }
  return util::Sha256Hex(*content);
}

Admission ResourceStore::Admit(const AdmitRequest& request) {
  observability::SpanScope span("resource_store.admit");
  span.SetAttribute("uri", request.uri);

  if (request.uri.empty()) {
    throw util::ValidationError("uri must not be empty");
  }
  util::RequireJsonOrNull("frontmatter", request.frontmatter);
  util::RequireJsonOrNull("content_fm_body_attrs", request.content_fm_body_attrs);
  util::RequireJsonOrNull("elaboration", request.elaboration);
  const auto digest = ResolveDigest(request.content, request.content_digest);

  auto tx = repository_->Begin();

  if (!repository_->GetDevice(*tx, request.device_id, db::Visibility::kLive)) {
    throw util::DeviceUnknownError("unknown device: " + request.device_id);
  }
  if (!repository_->GetIngestSession(*tx, request.ingest_session_id, db::Visibility::kIncludeDeleted)) {
    throw util::ReferentialError("unknown ingest session: " + request.ingest_session_id);
  }

  db::model::UniformResourceRecord record;
  record.uniform_resource_id        = util::NewId();
  record.device_id                  = request.device_id;
  record.ingest_session_id          = request.ingest_session_id;
  record.ingest_fs_path_id          = request.ingest_fs_path_id;
  record.uri                        = request.uri;
  record.content_digest             = digest;
  record.content                    = request.content;
  record.nature                     = request.nature;
  record.size_bytes                 = request.size_bytes;
  record.last_modified_at_ms        = request.last_modified_at_ms;
  record.content_fm_body_attrs      = request.content_fm_body_attrs;
  record.frontmatter                = request.frontmatter;
  record.elaboration                = request.elaboration;
  record.housekeeping.created_at_ms = util::NowMs();
  record.housekeeping.created_by    = request.created_by;

  auto outcome = repository_->InsertUniformResourceIfAbsent(*tx, record);
  ThrowIfDbError(outcome.result, "admit " + request.uri);
  tx->Commit();

  Admission admission{outcome.id, digest, outcome.inserted};
  observability::Metrics::Instance().RecordAdmission(admission.is_new ? "new" : "duplicate");
  URE_LOG_DEBUG("resource admitted", {StringField("uri", request.uri), StringField("resource_id", admission.id),
                                      observability::BoolField("new", admission.is_new)});

  if (admission.is_new) {
    Notify(record);
  }
  return admission;
}

Admission ResourceStore::AdmitTransform(const TransformRequest& request) {
  observability::SpanScope span("resource_store.admit_transform");

  if (request.nature.empty()) {
    throw util::ValidationError("transform nature must not be empty");
  }
  util::RequireJsonOrNull("elaboration", request.elaboration);
  const auto digest = ResolveDigest(request.content, request.content_digest);

  auto tx     = repository_->Begin();
  auto source = repository_->GetUniformResource(*tx, request.uniform_resource_id, db::Visibility::kIncludeDeleted);
  if (!source) {
    throw util::ReferentialError("unknown uniform resource: " + request.uniform_resource_id);
  }

  db::model::UniformResourceTransformRecord record;
  record.uniform_resource_transform_id = util::NewId();
  record.uniform_resource_id           = request.uniform_resource_id;
  record.uri                           = request.uri.value_or(source->uri);
  record.content_digest                = digest;
  record.content                       = request.content;
  record.nature                        = request.nature;
  record.size_bytes                    = request.size_bytes;
  record.elaboration                   = request.elaboration;
  record.housekeeping.created_at_ms    = util::NowMs();
  record.housekeeping.created_by       = request.created_by;

  auto outcome = repository_->InsertTransformIfAbsent(*tx, record);
  ThrowIfDbError(outcome.result, "admit transform of " + request.uniform_resource_id);
  tx->Commit();

  return Admission{outcome.id, digest, outcome.inserted};
}

void ResourceStore::AddAdmissionListener(AdmissionListener listener) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  listeners_.push_back(std::move(listener));
}

void ResourceStore::Notify(const db::model::UniformResourceRecord& record) {
  std::vector<AdmissionListener> listeners;
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners = listeners_;
  }

  for (const auto& listener : listeners) {
    try {
      listener(record);
    } catch (const std::exception& e) {
      URE_LOG_ERROR("admission listener failed",
                    {StringField("resource_id", record.uniform_resource_id), StringField("error", e.what())});
    }
  }
}

std::optional<db::model::UniformResourceRecord> ResourceStore::Get(const std::string& resource_id,
                                                                   db::Visibility visibility) const {
  auto tx     = repository_->Begin();
  auto record = repository_->GetUniformResource(*tx, resource_id, visibility);
  tx->Commit();
  return record;
}

std::optional<db::model::UniformResourceRecord> ResourceStore::FindByKey(const std::string& device_id,
                                                                         const std::string& content_digest,
                                                                         const std::string& uri, uint64_t size_bytes,
                                                                         db::Visibility visibility) const {
  auto tx     = repository_->Begin();
  auto record = repository_->FindUniformResource(*tx, device_id, content_digest, uri, size_bytes, visibility);
  tx->Commit();
  return record;
}

std::vector<db::model::UniformResourceRecord> ResourceStore::ListLive(const std::string& device_id) const {
  auto tx      = repository_->Begin();
  auto records = repository_->ListUniformResources(*tx, device_id, db::Visibility::kLive);
  tx->Commit();
  return records;
}

uint64_t ResourceStore::CountByKey(const std::string& device_id, const std::string& content_digest,
                                   const std::string& uri, uint64_t size_bytes) const {
  auto tx    = repository_->Begin();
  auto count = repository_->CountUniformResources(*tx, device_id, content_digest, uri, size_bytes);
  tx->Commit();
  return count;
}

std::vector<db::model::UniformResourceTransformRecord> ResourceStore::ListTransforms(const std::string& resource_id) const {
  auto tx      = repository_->Begin();
  auto records = repository_->ListTransforms(*tx, resource_id, db::Visibility::kLive);
  tx->Commit();
  return records;
}

void ResourceStore::SoftDelete(const std::string& resource_id, const std::string& deleted_by) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->MarkDeleted(*tx, db::EntityKind::kUniformResource, resource_id, deleted_by, util::NowMs()),
                 "delete resource " + resource_id);
  tx->Commit();
}

} // namespace ure::core
