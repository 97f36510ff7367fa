/* File: serial_allocator.hpp
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

#include <cstdint>

#include "sqlite_db.hpp"

namespace pdfseal::tsa {

/**
 * @brief Durable source of timestamp serial numbers
 * @details Serials are strictly increasing across restarts. A serial is
 * committed before it is used, so a failed request leaves a gap.
 */
class SerialAllocator {
 public:
  /// @throws storage::StorageError
  explicit SerialAllocator(storage::SharedDb db);

  /**
   * @brief Allocate the next serial
   * @throws storage::StorageError
   */
  [[nodiscard]] uint64_t Next();

 private:
  storage::SharedDb db_;
};

}  // namespace pdfseal::tsa
