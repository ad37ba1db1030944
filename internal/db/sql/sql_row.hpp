#pragma once

#include <string>
#include <cstdint>
#include <optional>

namespace ure::db::sql {

/*
  Generic row reader.

  Backends wrap their result row (sqlite -> sqlite3_stmt) so driver types
  do not leak into repository mapping code.
*/

class Row {
public:
  virtual ~Row() = default;

  virtual std::string GetText(int col) const = 0;
  virtual std::string GetBlob(int col) const = 0;
  virtual int GetInt(int col) const = 0;
  virtual int64_t GetInt64(int col) const = 0;
  virtual bool IsNull(int col) const = 0;

  uint64_t GetU64(int col) const {
    return static_cast<uint64_t>(GetInt64(col));
  }

  std::optional<std::string> OptText(int col) const {
    if (IsNull(col)) return std::nullopt;
    return GetText(col);
  }

  std::optional<std::string> OptBlob(int col) const {
    if (IsNull(col)) return std::nullopt;
    return GetBlob(col);
  }

  std::optional<uint64_t> OptU64(int col) const {
    if (IsNull(col)) return std::nullopt;
    return GetU64(col);
  }

  std::optional<int64_t> OptInt64(int col) const {
    if (IsNull(col)) return std::nullopt;
    return GetInt64(col);
  }
};

}
