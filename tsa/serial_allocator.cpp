/* File: serial_allocator.cpp
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

#include "serial_allocator.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

#include "utils.hpp"

namespace pdfseal::tsa {

SerialAllocator::SerialAllocator(storage::SharedDb db) : db_(std::move(db)) {
  if (!db_) {
    throw std::invalid_argument("[SerialAllocator] database is null");
  }
  const std::lock_guard<std::recursive_mutex> lock(db_->Mutex());
  db_->Exec(
    "CREATE TABLE IF NOT EXISTS tsa_serial ("
    "id INTEGER PRIMARY KEY AUTOINCREMENT, "
    "issued_at INTEGER NOT NULL)");
}

uint64_t SerialAllocator::Next() {
  storage::Transaction txn(*db_);
  auto stmt =
    db_->Prepare("INSERT INTO tsa_serial (issued_at) VALUES (?) RETURNING id");
  stmt.Bind(1, TimePointToMicros(std::chrono::system_clock::now()));
  if (!stmt.Step()) {
    throw storage::StorageError("[SerialAllocator::Next] no serial returned");
  }
  const int64_t serial = stmt.GetInt64(0);
  // RETURNING rows must be stepped to completion before commit
  stmt.Exec();
  txn.Commit();
  return static_cast<uint64_t>(serial);
}

}  // namespace pdfseal::tsa
