/* File: proof_store.hpp
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

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "proof_record.hpp"
#include "sqlite_db.hpp"

namespace pdfseal::journal {

/**
 * @brief SQLite persistence of proof records
 * @details Table proof_record, insert only, one record per request.
 * All methods throw storage::StorageError.
 */
class ProofStore {
 public:
  explicit ProofStore(storage::SharedDb db);

  /// @return int64_t the row id
  int64_t Insert(const ProofRecord &record);

  /// @brief ordered by signature_timestamp then id
  [[nodiscard]] std::vector<ProofRecord> ListForDocument(
    const std::string &document_id) const;

  [[nodiscard]] size_t CountForDocument(const std::string &document_id) const;

  [[nodiscard]] std::optional<ProofRecord> FindByRequest(
    int64_t request_id) const;

  [[nodiscard]] const storage::SharedDb &Db() const noexcept { return db_; }

 private:
  storage::SharedDb db_;
};

}  // namespace pdfseal::journal
