/* File: sqlite_db.hpp
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

#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace pdfseal::storage {

using BytesVector = std::vector<unsigned char>;

class StorageError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Prepared statement wrapper
 * @details owns sqlite3_stmt, finalizes it on destruction
 */
class Statement {
 public:
  /// @throws StorageError
  Statement(sqlite3 *db, const std::string &sql);
  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;
  Statement(Statement &&other) noexcept;
  Statement &operator=(Statement &&other) noexcept;
  ~Statement();

  Statement &Bind(int index, int64_t val);
  Statement &Bind(int index, const std::string &val);
  Statement &Bind(int index, const char *val) {
    return Bind(index, std::string(val));
  }
  Statement &Bind(int index, const BytesVector &val);
  Statement &Bind(int index, const std::optional<std::string> &val);
  Statement &Bind(int index, const std::optional<int64_t> &val);
  Statement &BindNull(int index);

  /**
   * @brief Execute one step
   * @return true if a row is available
   * @throws StorageError
   */
  bool Step();

  /// @brief step until SQLITE_DONE
  void Exec();

  [[nodiscard]] bool IsNull(int col) const noexcept;
  [[nodiscard]] int64_t GetInt64(int col) const noexcept;
  [[nodiscard]] std::string GetText(int col) const;
  [[nodiscard]] BytesVector GetBlob(int col) const;
  [[nodiscard]] std::optional<std::string> GetOptionalText(int col) const;
  [[nodiscard]] std::optional<int64_t> GetOptionalInt64(int col) const noexcept;

 private:
  void CheckBind(int res_code, int index) const;

  sqlite3 *db_ = nullptr;
  sqlite3_stmt *stmt_ = nullptr;
};

/**
 * @brief SQLite connection
 * @details WAL journal, busy timeout and foreign keys are enabled on open.
 * All statements on a shared connection are serialized with Mutex().
 */
class SqliteDb {
 public:
  /**
   * @brief Open or create a database
   * @param path file path or ":memory:"
   * @throws StorageError
   */
  explicit SqliteDb(const std::string &path);
  SqliteDb(const SqliteDb &) = delete;
  SqliteDb(SqliteDb &&) = delete;
  SqliteDb &operator=(const SqliteDb &) = delete;
  SqliteDb &operator=(SqliteDb &&) = delete;
  ~SqliteDb();

  /// @throws StorageError
  void Exec(const std::string &sql);

  /// @throws StorageError
  [[nodiscard]] Statement Prepare(const std::string &sql);

  [[nodiscard]] int64_t LastInsertId() const noexcept;

  [[nodiscard]] std::recursive_mutex &Mutex() noexcept { return mutex_; }

  [[nodiscard]] const std::string &Path() const noexcept { return path_; }

 private:
  sqlite3 *db_ = nullptr;
  std::string path_;
  std::recursive_mutex mutex_;
};

using SharedDb = std::shared_ptr<SqliteDb>;

/**
 * @brief BEGIN IMMEDIATE ... COMMIT guard
 * @details holds the connection mutex, rolls back if not committed
 */
class Transaction {
 public:
  explicit Transaction(SqliteDb &db);
  Transaction(const Transaction &) = delete;
  Transaction(Transaction &&) = delete;
  Transaction &operator=(const Transaction &) = delete;
  Transaction &operator=(Transaction &&) = delete;
  ~Transaction();

  /// @throws StorageError
  void Commit();

 private:
  SqliteDb &db_;
  std::unique_lock<std::recursive_mutex> lock_;
  bool committed_ = false;
};

}  // namespace pdfseal::storage
