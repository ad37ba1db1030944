#include "internal/core/device_registry.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using ure::core::DeviceRegistry;
using ure::core::DeviceSpec;

DeviceSpec Spec(const std::string& name, const std::string& boundary = "lab") {
  DeviceSpec spec;
  spec.name       = name;
  spec.boundary   = boundary;
  spec.created_by = "device-registry-test";
  return spec;
}

void TestEnsureIsIdempotentOnIdentity() {
  DeviceRegistry registry(std::make_shared<ure::db::memory::MemoryRepository>());

  const auto first  = registry.Ensure(Spec("D1"));
  const auto second = registry.Ensure(Spec("D1"));
  assert(first == second);
  assert(first.Name() == "D1");
  assert(first.State() == "SINGLETON");
  assert(first.Boundary() == "lab");

  const auto other = registry.Ensure(Spec("D1", "cloud"));
  assert(!(other == first));
  assert(registry.ListLive().size() == 2);
}

void TestExplicitDeviceIdIsKept() {
  DeviceRegistry registry(std::make_shared<ure::db::memory::MemoryRepository>());

  auto spec      = Spec("pinned");
  spec.device_id = "device-fixed-id";
  assert(registry.Ensure(spec).DeviceId() == "device-fixed-id");
  assert(registry.Require("device-fixed-id").Name() == "pinned");
}

void TestSoftDeleteHidesFromLiveReadsOnly() {
  DeviceRegistry registry(std::make_shared<ure::db::memory::MemoryRepository>());

  const auto device = registry.Ensure(Spec("retiring"));
  registry.Retire(device.DeviceId(), "operator");

  assert(!registry.Find(device.DeviceId()).has_value());
  assert(registry.ListLive().empty());

  auto raw = registry.FindRaw(device.DeviceId());
  assert(raw.has_value());
  assert(raw->housekeeping.deleted_at_ms.has_value());
  assert(raw->housekeeping.deleted_by == std::string("operator"));

  bool unknown = false;
  try {
    (void)registry.Require(device.DeviceId());
  } catch (const ure::util::DeviceUnknownError&) {
    unknown = true;
  }
  assert(unknown);

  // A retired identity keeps its key.
  bool exists = false;
  try {
    (void)registry.Ensure(Spec("retiring"));
  } catch (const ure::util::AlreadyExists&) {
    exists = true;
  }
  assert(exists);
}

void TestRetireUnknownDeviceFails() {
  DeviceRegistry registry(std::make_shared<ure::db::memory::MemoryRepository>());

  bool threw = false;
  try {
    registry.Retire("missing", "operator");
  } catch (const ure::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestMalformedStructuredFieldsAreRejected() {
  DeviceRegistry registry(std::make_shared<ure::db::memory::MemoryRepository>());

  auto spec          = Spec("bad-json");
  spec.state_sysinfo = std::string("{not json");

  bool threw = false;
  try {
    (void)registry.Ensure(spec);
  } catch (const ure::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(registry.ListLive().empty());
}

} // namespace

int main() {
  TestEnsureIsIdempotentOnIdentity();
  TestExplicitDeviceIdIsKept();
  TestSoftDeleteHidesFromLiveReadsOnly();
  TestRetireUnknownDeviceFails();
  TestMalformedStructuredFieldsAreRejected();

  std::cout << "ure_unit_device_registry: pass\n";
  return 0;
}
