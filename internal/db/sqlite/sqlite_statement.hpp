#pragma once

#include <sqlite3.h>

#include <string>

#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace ure::db::sqlite {

class SqliteRow final : public sql::Row {
public:
  explicit SqliteRow(sqlite3_stmt* st) : st_(st) {}

  std::string GetText(int col) const override;
  std::string GetBlob(int col) const override;
  int GetInt(int col) const override;
  int64_t GetInt64(int col) const override;
  bool IsNull(int col) const override;

private:
  sqlite3_stmt* st_;
};

/*
  RAII prepared statement. Finalized on destruction.
*/
class SqliteStatement {
public:
  SqliteStatement(sqlite3* db, const std::string& sql);
  ~SqliteStatement();

  SqliteStatement(const SqliteStatement&)            = delete;
  SqliteStatement& operator=(const SqliteStatement&) = delete;

  void Bind(const sql::Params& params);

  // SQLITE_ROW, SQLITE_DONE or an error code.
  int Step() { return sqlite3_step(st_); }

  const sql::Row& Row() const { return row_; }

private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
  SqliteRow     row_{nullptr};
};

}
