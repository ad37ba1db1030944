#pragma once

#include <string>

#include "internal/db/model/housekeeping.hpp"
#include "internal/util/json.hpp"

namespace ure::db::model {

/*
  A host or source of ingestion.

  (name, state, boundary) is unique. Never physically deleted.
*/

struct DeviceRecord {
  std::string device_id;
  std::string name;
  std::string state;
  std::string boundary;

  util::JsonText segmentation;
  util::JsonText state_sysinfo;
  util::JsonText elaboration;

  Housekeeping housekeeping;
};

/*
  Named ingestion configuration for a device; (device_id, behavior_name)
  is unique.
*/
struct BehaviorRecord {
  std::string behavior_id;
  std::string device_id;
  std::string behavior_name;
  std::string behavior_conf_json;

  std::optional<std::string> assurance_schema_id;
  util::JsonText             governance;

  Housekeeping housekeeping;
};

} // namespace ure::db::model
