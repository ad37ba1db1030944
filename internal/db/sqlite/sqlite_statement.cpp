#include "sqlite_statement.hpp"

#include <stdexcept>
#include <type_traits>

namespace ure::db::sqlite {

std::string SqliteRow::GetText(int col) const {
  const unsigned char* t = sqlite3_column_text(st_, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::string SqliteRow::GetBlob(int col) const {
  const void* data = sqlite3_column_blob(st_, col);
  const int   size = sqlite3_column_bytes(st_, col);
  if (!data || size <= 0) return {};
  return std::string(static_cast<const char*>(data), static_cast<size_t>(size));
}

int SqliteRow::GetInt(int col) const {
  return sqlite3_column_int(st_, col);
}

int64_t SqliteRow::GetInt64(int col) const {
  return sqlite3_column_int64(st_, col);
}

bool SqliteRow::IsNull(int col) const {
  return sqlite3_column_type(st_, col) == SQLITE_NULL;
}

SqliteStatement::SqliteStatement(sqlite3* db, const std::string& sql) : db_(db) {
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db_));
  }
  row_ = SqliteRow(st_);
}

SqliteStatement::~SqliteStatement() {
  if (st_) sqlite3_finalize(st_);
}

void SqliteStatement::Bind(const sql::Params& params) {
  for (size_t i = 0; i < params.size(); ++i) {
    const int idx = static_cast<int>(i) + 1;
    const int rc  = std::visit(
        [&](const auto& v) -> int {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return sqlite3_bind_null(st_, idx);
          } else if constexpr (std::is_same_v<T, int32_t>) {
            return sqlite3_bind_int(st_, idx, v);
          } else if constexpr (std::is_same_v<T, int64_t>) {
            return sqlite3_bind_int64(st_, idx, static_cast<sqlite3_int64>(v));
          } else if constexpr (std::is_same_v<T, uint64_t>) {
            return sqlite3_bind_int64(st_, idx, static_cast<sqlite3_int64>(v));
          } else if constexpr (std::is_same_v<T, std::string>) {
            return sqlite3_bind_text(st_, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
          } else {
            return sqlite3_bind_blob(st_, idx, v.bytes.data(), static_cast<int>(v.bytes.size()), SQLITE_TRANSIENT);
          }
        },
        params[i]);
    if (rc != SQLITE_OK) {
      throw std::runtime_error(std::string("sqlite bind: ") + sqlite3_errmsg(db_));
    }
  }
}

} // namespace ure::db::sqlite
