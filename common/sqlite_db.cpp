/* File: sqlite_db.cpp
Copyright (C) Basealt LLC,  2024
Author: Oleg Proskurin, <proskurinov@basealt.ru>

This program is free software; you can redistribute it and/or
modify it under the terms of the GNU Lesser General Public
License as published by the Free Software Foundation; either
version 3 of the License, or (at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
Lesser General Public License for more details.

You should have received a copy of the GNU Lesser General Public License
along with this program; if not, write to the Free Software Foundation,
Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.
*/

#include "sqlite_db.hpp"

#include <limits>
#include <utility>

#include "logger_utils.hpp"

namespace pdfseal::storage {

namespace {

constexpr int kBusyTimeoutMs = 10000;

std::string ErrMsg(sqlite3 *db) {
  return db == nullptr ? "sqlite3 handle is null" : sqlite3_errmsg(db);
}

}  // namespace

// ---------------------------------------------------
// Statement

Statement::Statement(sqlite3 *db, const std::string &sql) : db_(db) {
  const std::string func_name = "[Statement::Statement] ";
  if (db_ == nullptr) {
    throw StorageError(func_name + "database is not open");
  }
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
    throw StorageError(func_name + "failed to prepare statement: " +
                       ErrMsg(db_));
  }
}

Statement::Statement(Statement &&other) noexcept
  : db_(other.db_), stmt_(other.stmt_) {
  other.stmt_ = nullptr;
}

Statement &Statement::operator=(Statement &&other) noexcept {
  if (this != &other) {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
    }
    db_ = other.db_;
    stmt_ = other.stmt_;
    other.stmt_ = nullptr;
  }
  return *this;
}

Statement::~Statement() {
  if (stmt_ != nullptr) {
    sqlite3_finalize(stmt_);
  }
}

void Statement::CheckBind(int res_code, int index) const {
  if (res_code != SQLITE_OK) {
    throw StorageError("[Statement::Bind] bind failed for parameter " +
                       std::to_string(index) + ": " + ErrMsg(db_));
  }
}

Statement &Statement::Bind(int index, int64_t val) {
  CheckBind(sqlite3_bind_int64(stmt_, index, val), index);
  return *this;
}

Statement &Statement::Bind(int index, const std::string &val) {
  CheckBind(sqlite3_bind_text(stmt_, index, val.c_str(),
                              static_cast<int>(val.size()), SQLITE_TRANSIENT),
            index);
  return *this;
}

Statement &Statement::Bind(int index, const BytesVector &val) {
  if (val.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
    throw StorageError("[Statement::Bind] blob is too big");
  }
  CheckBind(sqlite3_bind_blob(stmt_, index, val.data(),
                              static_cast<int>(val.size()), SQLITE_TRANSIENT),
            index);
  return *this;
}

Statement &Statement::Bind(int index, const std::optional<std::string> &val) {
  return val.has_value() ? Bind(index, val.value()) : BindNull(index);
}

Statement &Statement::Bind(int index, const std::optional<int64_t> &val) {
  return val.has_value() ? Bind(index, val.value()) : BindNull(index);
}

Statement &Statement::BindNull(int index) {
  CheckBind(sqlite3_bind_null(stmt_, index), index);
  return *this;
}

bool Statement::Step() {
  const int res = sqlite3_step(stmt_);
  if (res == SQLITE_ROW) {
    return true;
  }
  if (res == SQLITE_DONE) {
    return false;
  }
  throw StorageError("[Statement::Step] " + ErrMsg(db_));
}

void Statement::Exec() {
  while (Step()) {
  }
}

bool Statement::IsNull(int col) const noexcept {
  return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

int64_t Statement::GetInt64(int col) const noexcept {
  return sqlite3_column_int64(stmt_, col);
}

std::string Statement::GetText(int col) const {
  const auto *text =
    reinterpret_cast<const char *>(sqlite3_column_text(stmt_, col));  // NOLINT
  if (text == nullptr) {
    return {};
  }
  return {text, static_cast<size_t>(sqlite3_column_bytes(stmt_, col))};
}

BytesVector Statement::GetBlob(int col) const {
  const auto *blob =
    static_cast<const unsigned char *>(sqlite3_column_blob(stmt_, col));
  const int size = sqlite3_column_bytes(stmt_, col);
  if (blob == nullptr || size <= 0) {
    return {};
  }
  return {blob, blob + size};
}

std::optional<std::string> Statement::GetOptionalText(int col) const {
  if (IsNull(col)) {
    return std::nullopt;
  }
  return GetText(col);
}

std::optional<int64_t> Statement::GetOptionalInt64(int col) const noexcept {
  if (IsNull(col)) {
    return std::nullopt;
  }
  return GetInt64(col);
}

// ---------------------------------------------------
// SqliteDb

SqliteDb::SqliteDb(const std::string &path) : path_(path) {
  const std::string func_name = "[SqliteDb::SqliteDb] ";
  const int flags =
    SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    const std::string msg = ErrMsg(db_);
    sqlite3_close(db_);
    db_ = nullptr;
    throw StorageError(func_name + "can't open database " + path + ": " + msg);
  }
  sqlite3_busy_timeout(db_, kBusyTimeoutMs);
  try {
    Exec("PRAGMA foreign_keys = ON;");
    if (path != ":memory:") {
      Exec("PRAGMA journal_mode = WAL;");
    }
    Exec("PRAGMA synchronous = FULL;");
  } catch (const StorageError &) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
  auto logger = logger::InitLog();
  if (logger) {
    logger->debug("[SqliteDb] opened {}", path);
  }
}

SqliteDb::~SqliteDb() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

void SqliteDb::Exec(const std::string &sql) {
  const std::lock_guard<std::recursive_mutex> lock(mutex_);
  char *err_msg = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg) !=
      SQLITE_OK) {
    std::string msg = err_msg != nullptr ? err_msg : ErrMsg(db_);
    sqlite3_free(err_msg);
    throw StorageError("[SqliteDb::Exec] " + msg);
  }
}

Statement SqliteDb::Prepare(const std::string &sql) {
  return Statement(db_, sql);
}

int64_t SqliteDb::LastInsertId() const noexcept {
  return sqlite3_last_insert_rowid(db_);
}

// ---------------------------------------------------
// Transaction

Transaction::Transaction(SqliteDb &db) : db_(db), lock_(db.Mutex()) {
  db_.Exec("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
  if (committed_) {
    return;
  }
  try {
    db_.Exec("ROLLBACK;");
  } catch (const StorageError &ex) {
    auto logger = logger::InitLog();
    if (logger) {
      logger->error("[Transaction] rollback failed {}", ex.what());
    }
  }
}

void Transaction::Commit() {
  db_.Exec("COMMIT;");
  committed_ = true;
}

}  // namespace pdfseal::storage
