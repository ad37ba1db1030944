#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ure::db::sql {

/*
  Parameter abstraction.

  SQLite binds ?1 ?2 ?3 by ordinal, so statements are parameterized as an
  ordered list. Raw resource bytes go through Blob so they keep embedded
  NULs.
*/

struct Blob {
  std::string bytes;
};

using Param = std::variant<
    std::nullptr_t,
    int32_t,
    int64_t,
    uint64_t,
    std::string,
    Blob
>;

using Params = std::vector<Param>;

inline Param Nullable(const std::optional<std::string>& v) {
  if (!v) return nullptr;
  return *v;
}

inline Param Nullable(const std::optional<uint64_t>& v) {
  if (!v) return nullptr;
  return *v;
}

inline Param Nullable(const std::optional<int64_t>& v) {
  if (!v) return nullptr;
  return *v;
}

inline Param NullableBlob(const std::optional<std::string>& v) {
  if (!v) return nullptr;
  return Blob{*v};
}

}
