#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "device_identity.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/json.hpp"

namespace ure::core {

struct DeviceSpec {
  // Empty means "generate".
  std::string    device_id;
  std::string    name;
  std::string    state    = "SINGLETON";
  std::string    boundary = "UNKNOWN";
  util::JsonText segmentation;
  util::JsonText state_sysinfo;
  util::JsonText elaboration;
  std::string    created_by = "UNKNOWN";
};

/*
  Device lifecycle.

  Devices are created on first contact and only ever soft-deleted.
  (name, state, boundary) identifies a device; Ensure is idempotent on it.
*/
class DeviceRegistry {
 public:
  explicit DeviceRegistry(std::shared_ptr<db::Repository> repository);

  // Returns the live device matching (name, state, boundary), creating it
  // when absent. Throws ValidationError on malformed structured fields.
  DeviceIdentity Ensure(const DeviceSpec& spec);

  // Live lookup. nullopt for unknown or soft-deleted devices.
  std::optional<DeviceIdentity> Find(const std::string& device_id) const;

  // Includes soft-deleted devices.
  std::optional<db::model::DeviceRecord> FindRaw(const std::string& device_id) const;

  std::vector<DeviceIdentity> ListLive() const;

  // Soft delete. Throws NotFound for an unknown id.
  void Retire(const std::string& device_id, const std::string& deleted_by);

  // Throws DeviceUnknownError when the device is missing or soft-deleted.
  DeviceIdentity Require(const std::string& device_id) const;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace ure::core
