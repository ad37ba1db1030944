#pragma once

#include <string>
#include <utility>

namespace ure::core {

/*
  Immutable identity of the device an ingest or orchestration run acts on.

  Obtained from DeviceRegistry and passed by const reference into the
  session manager, executor and pipeline.
*/
class DeviceIdentity {
 public:
  DeviceIdentity(std::string device_id, std::string name, std::string state, std::string boundary)
      : device_id_(std::move(device_id)), name_(std::move(name)), state_(std::move(state)), boundary_(std::move(boundary)) {
  }

  const std::string& DeviceId() const {
    return device_id_;
  }
  const std::string& Name() const {
    return name_;
  }
  const std::string& State() const {
    return state_;
  }
  const std::string& Boundary() const {
    return boundary_;
  }

  bool operator==(const DeviceIdentity& other) const {
    return device_id_ == other.device_id_;
  }

 private:
  std::string device_id_;
  std::string name_;
  std::string state_;
  std::string boundary_;
};

} // namespace ure::core
