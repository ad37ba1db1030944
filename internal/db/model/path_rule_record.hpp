#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/housekeeping.hpp"
#include "internal/util/json.hpp"

namespace ure::db::model {

// (namespace_name, regex) is unique.
struct PathMatchRuleRecord {
  std::string rule_id;
  std::string namespace_name;
  std::string regex;
  std::string flags;

  std::optional<std::string> nature;
  int64_t                    priority = 0;
  std::optional<std::string> description;

  std::vector<std::string> include_glob_patterns;
  std::vector<std::string> exclude_glob_patterns;

  util::JsonText elaboration;

  Housekeeping housekeeping;
};

// (namespace_name, regex, replace) is unique.
struct PathRewriteRuleRecord {
  std::string rule_id;
  std::string namespace_name;
  std::string regex;
  std::string replace;

  int64_t                    priority = 0;
  std::optional<std::string> description;

  util::JsonText elaboration;

  Housekeeping housekeeping;
};

} // namespace ure::db::model
