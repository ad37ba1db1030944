#include "device_registry.hpp"

#include "db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace ure::core {

namespace {

DeviceIdentity ToIdentity(const db::model::DeviceRecord& record) {
  return DeviceIdentity(record.device_id, record.name, record.state, record.boundary);
}

} // namespace

DeviceRegistry::DeviceRegistry(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

DeviceIdentity DeviceRegistry::Ensure(const DeviceSpec& spec) {
  if (spec.name.empty()) {
    throw util::ValidationError("device name must not be empty");
  }
  util::RequireJsonOrNull("segmentation", spec.segmentation);
  util::RequireJsonOrNull("state_sysinfo", spec.state_sysinfo);
  util::RequireJsonOrNull("elaboration", spec.elaboration);

  auto tx = repository_->Begin();
  if (auto existing = repository_->FindDevice(*tx, spec.name, spec.state, spec.boundary, db::Visibility::kLive)) {
    tx->Commit();
    return ToIdentity(*existing);
  }

  db::model::DeviceRecord record;
  record.device_id                  = spec.device_id.empty() ? util::NewId() : spec.device_id;
  record.name                       = spec.name;
  record.state                      = spec.state;
  record.boundary                   = spec.boundary;
  record.segmentation               = spec.segmentation;
  record.state_sysinfo              = spec.state_sysinfo;
  record.elaboration                = spec.elaboration;
  record.housekeeping.created_at_ms = util::NowMs();
  record.housekeeping.created_by    = spec.created_by;

  ThrowIfDbError(repository_->InsertDevice(*tx, record), "insert device");
  tx->Commit();

  URE_LOG_INFO("device registered", {observability::StringField("device_id", record.device_id),
                                     observability::StringField("name", record.name)});
  return ToIdentity(record);
}

std::optional<DeviceIdentity> DeviceRegistry::Find(const std::string& device_id) const {
  auto tx     = repository_->Begin();
  auto record = repository_->GetDevice(*tx, device_id, db::Visibility::kLive);
  tx->Commit();
  if (!record) {
    return std::nullopt;
  }
  return ToIdentity(*record);
}

std::optional<db::model::DeviceRecord> DeviceRegistry::FindRaw(const std::string& device_id) const {
  auto tx     = repository_->Begin();
  auto record = repository_->GetDevice(*tx, device_id, db::Visibility::kIncludeDeleted);
  tx->Commit();
  return record;
}

std::vector<DeviceIdentity> DeviceRegistry::ListLive() const {
  auto tx      = repository_->Begin();
  auto records = repository_->ListDevices(*tx, db::Visibility::kLive);
  tx->Commit();

  std::vector<DeviceIdentity> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(ToIdentity(record));
  }
  return out;
}

void DeviceRegistry::Retire(const std::string& device_id, const std::string& deleted_by) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->MarkDeleted(*tx, db::EntityKind::kDevice, device_id, deleted_by, util::NowMs()),
                 "retire device " + device_id);
  tx->Commit();
}

DeviceIdentity DeviceRegistry::Require(const std::string& device_id) const {
  auto device = Find(device_id);
  if (!device) {
    throw util::DeviceUnknownError("unknown device: " + device_id);
  }
  return *device;
}

} // namespace ure::core
